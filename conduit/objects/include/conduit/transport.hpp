#pragma once

#include <functional>

#include "conduit/event.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Pulls the next event from the transport, suspending until one is available.
using ReceiveFn = std::function<Task<Event>()>;

// Pushes an event to the transport.
using SendFn = std::function<Task<void>(Event)>;

}  // namespace conduit
