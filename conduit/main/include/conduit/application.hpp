#pragma once

#include <initializer_list>
#include <string_view>
#include <utility>

#include "conduit/application-config.hpp"
#include "conduit/connection-handler.hpp"
#include "conduit/connection-scope.hpp"
#include "conduit/connection.hpp"
#include "conduit/lifespan-stage.hpp"
#include "conduit/response.hpp"
#include "conduit/router.hpp"
#include "conduit/task.hpp"
#include "conduit/transport.hpp"

namespace conduit {

class RouterStage;

// Entry point called by the transport for every connection. It assembles the handler chain in its canonical order:
//   lifespan -> request binding -> response (send) -> user stages -> response (prepare) -> router -> default handler
class Application : public ConnectionHandler {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  explicit Application(ApplicationConfig config = {});

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  Task<HandlerResult> handle(Connection& connection) override { return _chain->handle(connection); }

  // Serves one connection delivered by the transport.
  Task<void> operator()(ConnectionScopePtr scope, ReceiveFn receive, SendFn send);

  [[nodiscard]] Router& router() noexcept;

  [[nodiscard]] LifespanStage& lifespan() noexcept { return *_pLifespanStage; }

  // Outermost handler of the chain.
  [[nodiscard]] ConnectionHandler& chain() const noexcept { return *_chain; }

  void route(std::string_view pattern, std::initializer_list<std::string_view> methods, RouteHandler handler) {
    router().route(pattern, methods, std::move(handler));
  }

  void route(std::string_view pattern, std::string_view method, RouteHandler handler) {
    router().route(pattern, method, std::move(handler));
  }

  void route(std::string_view pattern, RouteHandler handler) { router().route(pattern, std::move(handler)); }

  template <class F>
  void onStartup(F&& fn) {
    _pLifespanStage->onStartup(std::forward<F>(fn));
  }

  template <class F>
  void onShutdown(F&& fn) {
    _pLifespanStage->onShutdown(std::forward<F>(fn));
  }

 private:
  ConnectionHandlerPtr _chain;
  RouterStage* _pRouterStage{nullptr};
  LifespanStage* _pLifespanStage{nullptr};
};

}  // namespace conduit
