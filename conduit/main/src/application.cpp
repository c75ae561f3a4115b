#include "conduit/application.hpp"

#include <memory>
#include <span>
#include <utility>

#include "conduit/application-config.hpp"
#include "conduit/compose.hpp"
#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/lifespan-config.hpp"
#include "conduit/lifespan-stage.hpp"
#include "conduit/log.hpp"
#include "conduit/request-stage.hpp"
#include "conduit/response-stage-config.hpp"
#include "conduit/response-stage.hpp"
#include "conduit/router-stage.hpp"
#include "conduit/router.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

Application::Application(ApplicationConfig config) {
  config.validate();

  auto routerStage = std::make_shared<RouterStage>(std::move(config.defaultHandler), config.router);
  _pRouterStage = routerStage.get();

  const auto sendConfig = ResponseStageConfig{}.withConvertHttpErrors(config.convertHttpErrors);
  auto prepareConfig = sendConfig;
  prepareConfig.withPrepareResponseOnly();

  vector<StageFactory> factories;
  factories.reserve(config.stages.size() + 4U);
  factories.push_back(MakeStageFactory<LifespanStage>(std::move(config.lifespan)));
  factories.push_back(MakeStageFactory<RequestStage>());
  factories.push_back(MakeStageFactory<ResponseStage>(sendConfig));
  for (StageFactory& factory : config.stages) {
    factories.push_back(std::move(factory));
  }
  factories.push_back(MakeStageFactory<ResponseStage>(prepareConfig));

  _chain = Compose(std::move(routerStage), std::span<const StageFactory>(factories.data(), factories.size()));
  _pLifespanStage = static_cast<Stage&>(*_chain).find<LifespanStage>();

  log::debug("Application assembled with {} user stage(s)", config.stages.size());
}

Task<void> Application::operator()(ConnectionScopePtr scope, ReceiveFn receive, SendFn send) {
  Connection connection(std::move(scope), std::move(receive), std::move(send));
  [[maybe_unused]] HandlerResult result = co_await handle(connection);
}

Router& Application::router() noexcept { return _pRouterStage->router(); }

}  // namespace conduit
