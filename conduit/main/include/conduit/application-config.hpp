#pragma once

#include <utility>

#include "conduit/compose.hpp"
#include "conduit/connection-handler.hpp"
#include "conduit/lifespan-config.hpp"
#include "conduit/router-config.hpp"
#include "conduit/vector.hpp"

namespace conduit {

struct ApplicationConfig {
  RouterConfig router;

  LifespanConfig lifespan;

  // User stages, inserted between the response sending stage and the response preparing stage.
  // The first factory builds the outermost user stage.
  vector<StageFactory> stages;

  // Handler run when no route matches. nullptr renders the 404 page.
  ConnectionHandlerPtr defaultHandler;

  // Converts HttpError escaping handlers into text responses.
  // Default: true
  bool convertHttpErrors{true};

  ApplicationConfig& withRouterConfig(RouterConfig routerConfig) {
    router = routerConfig;
    return *this;
  }

  ApplicationConfig& withLifespanConfig(LifespanConfig lifespanConfig) {
    lifespan = std::move(lifespanConfig);
    return *this;
  }

  ApplicationConfig& withStage(StageFactory factory) {
    stages.push_back(std::move(factory));
    return *this;
  }

  ApplicationConfig& withDefaultHandler(ConnectionHandlerPtr handler) {
    defaultHandler = std::move(handler);
    return *this;
  }

  ApplicationConfig& withConvertHttpErrors(bool convert = true) {
    convertHttpErrors = convert;
    return *this;
  }

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;
};

}  // namespace conduit
