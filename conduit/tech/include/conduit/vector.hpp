#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export

namespace conduit {

template <class T>
using vector = amc::vector<T>;

}  // namespace conduit
