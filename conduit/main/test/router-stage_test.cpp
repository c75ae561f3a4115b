#include "conduit/router-stage.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <variant>

#include "conduit/connection-handler.hpp"
#include "conduit/connection-scope.hpp"
#include "conduit/connection.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/request.hpp"
#include "conduit/response.hpp"
#include "conduit/router-config.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/task.hpp"

namespace conduit {

class RouterStageTest : public ::testing::Test {
 protected:
  RouterStageTest()
      : stage(MakeHandler([this](Connection& connection) -> Task<HandlerResult> {
          ++defaultCalls;
          defaultSawEmptyParams = connection.request().pathParams().empty();
          co_return std::string("default");
        })) {
    stage.router().route("/users/{id}", "GET", [](Request& request) -> Task<HandlerResult> {
      co_return std::string("user ") + request.pathParams().at("id");
    });
  }

  HandlerResult run(std::string_view method, std::string_view path, std::string_view rootPath = {}) {
    Connection connection(ConnectionScopeBuilder().withMethod(method).withPath(path).withRootPath(rootPath).build(), {},
                          {});
    return stage.handle(connection).runSynchronously();
  }

  int defaultCalls{0};
  bool defaultSawEmptyParams{false};
  RouterStage stage;
};

TEST_F(RouterStageTest, DispatchesWithPathParameters) {
  HandlerResult result = run("GET", "/users/42");
  EXPECT_EQ(std::get<std::string>(result), "user 42");
  EXPECT_EQ(defaultCalls, 0);
}

TEST_F(RouterStageTest, UnknownPathFallsBackToDefault) {
  HandlerResult result = run("GET", "/unknown");
  EXPECT_EQ(std::get<std::string>(result), "default");
  EXPECT_EQ(defaultCalls, 1);
  EXPECT_TRUE(defaultSawEmptyParams);
}

TEST_F(RouterStageTest, UnregisteredMethodFallsBackToDefault) {
  HandlerResult result = run("DELETE", "/users/42");
  EXPECT_EQ(std::get<std::string>(result), "default");
  EXPECT_EQ(defaultCalls, 1);
  EXPECT_TRUE(defaultSawEmptyParams);
}

TEST_F(RouterStageTest, RootPathIsPartOfTheRoutedPath) {
  stage.router().route("/api/ping", "GET", [](Request&) -> Task<HandlerResult> { co_return std::string("pong"); });

  EXPECT_EQ(std::get<std::string>(run("GET", "/ping", "/api")), "pong");
  EXPECT_EQ(std::get<std::string>(run("GET", "/ping")), "default");
}

TEST_F(RouterStageTest, ParametersAreBoundToTheConnectionRequest) {
  Connection connection(ConnectionScopeBuilder().withPath("/users/7").build(), {}, {});
  stage.handle(connection).runSynchronously();

  ASSERT_TRUE(connection.hasRequest());
  EXPECT_EQ(connection.request().pathParams().at("id"), "7");
}

TEST_F(RouterStageTest, HandlerSurvivesReplacingItsOwnRoute) {
  const std::string suffix(64, 'x');
  stage.router().route("/swap", "GET", [this, suffix](Request&) -> Task<HandlerResult> {
    stage.router().route("/swap", "GET", [](Request&) -> Task<HandlerResult> { co_return std::string("new"); });
    co_return std::string("old ") + suffix;
  });

  EXPECT_EQ(std::get<std::string>(run("GET", "/swap")), "old " + std::string(64, 'x'));
  EXPECT_EQ(std::get<std::string>(run("GET", "/swap")), "new");
}

TEST(RouterStageDefaultTest, MissRendersNotFoundPage) {
  RouterStage stage;
  EXPECT_EQ(stage.router().config().trailingSlashPolicy, RouterConfig::TrailingSlashPolicy::Strict);

  Connection connection(ConnectionScopeBuilder().withPath("/nothing").build(), {}, {});
  HandlerResult result = stage.handle(connection).runSynchronously();

  const auto& response = std::get<Response>(result);
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), "Not Found");
}

TEST(RouterStageDefaultTest, WebSocketConnectionsGoToInner) {
  RouterStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> { co_return std::string("inner"); }));
  stage.router().route("/ws", "GET", [](Request&) -> Task<HandlerResult> { co_return std::string("routed"); });

  Connection connection(ConnectionScopeBuilder(ScopeType::WebSocket).withPath("/ws").build(), {}, {});
  HandlerResult result = stage.handle(connection).runSynchronously();

  EXPECT_EQ(std::get<std::string>(result), "inner");
  EXPECT_FALSE(connection.hasRequest());
}

TEST(RouterStageDefaultTest, ConfigIsForwardedToRouter) {
  RouterStage stage(nullptr, RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Normalize));
  stage.router().route("/p", "GET", [](Request&) -> Task<HandlerResult> { co_return std::string("p"); });

  Connection connection(ConnectionScopeBuilder().withPath("/p/").build(), {}, {});
  HandlerResult result = stage.handle(connection).runSynchronously();
  EXPECT_EQ(std::get<std::string>(result), "p");
}

}  // namespace conduit
