#pragma once

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Scope types a stage intercepts when none are given: request / response and message exchange connections.
inline constexpr ScopeTypeBmp kDefaultInterests = ScopeType::Http | ScopeType::WebSocket;

// Interests of the stages producing request / response events. Message exchange connections pass through them.
inline constexpr ScopeTypeBmp kHttpInterests = static_cast<ScopeTypeBmp>(ScopeType::Http);

// A link of the handler chain. It owns exactly one inner handler and intercepts the connections whose type is in
// its interest set, forwarding all others untouched to the inner handler.
class Stage : public ConnectionHandler {
 public:
  // A null 'inner' is replaced by a NotFoundHandler.
  explicit Stage(ConnectionHandlerPtr inner = nullptr, ScopeTypeBmp interests = kDefaultInterests);

  Task<HandlerResult> handle(Connection& connection) final;

  [[nodiscard]] ConnectionHandler& inner() const noexcept { return *_inner; }

  [[nodiscard]] const ConnectionHandlerPtr& innerPtr() const noexcept { return _inner; }

  [[nodiscard]] ScopeTypeBmp interests() const noexcept { return _interests; }

  [[nodiscard]] bool intercepts(ScopeType type) const noexcept { return IsScopeTypeSet(_interests, type); }

  // First handler of type T, starting from this stage and walking down through inner handlers.
  template <class T>
  [[nodiscard]] T* find() noexcept {
    ConnectionHandler* pHandler = this;
    while (pHandler != nullptr) {
      if (auto* pFound = dynamic_cast<T*>(pHandler)) {
        return pFound;
      }
      auto* pStage = dynamic_cast<Stage*>(pHandler);
      pHandler = pStage == nullptr ? nullptr : &pStage->inner();
    }
    return nullptr;
  }

 protected:
  // The stage logic, only called for connections whose type is in the interest set.
  virtual Task<HandlerResult> process(Connection& connection) = 0;

 private:
  ConnectionHandlerPtr _inner;
  ScopeTypeBmp _interests;
};

}  // namespace conduit
