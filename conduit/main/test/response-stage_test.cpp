#include "conduit/response-stage.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "conduit/connection-handler.hpp"
#include "conduit/connection-scope.hpp"
#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/event.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/json.hpp"
#include "conduit/response-stage-config.hpp"
#include "conduit/response.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/scripted-transport.hpp"
#include "conduit/task.hpp"

namespace conduit {

class ResponseStageTest : public ::testing::Test {
 protected:
  HandlerResult run(ResponseStage& stage) {
    Connection connection(ConnectionScopeBuilder().withPath("/response").build(), transport.receiveFn(),
                          transport.sendFn());
    return stage.handle(connection).runSynchronously();
  }

  test::ScriptedTransport transport;
};

TEST_F(ResponseStageTest, SendModeForwardsEveryEvent) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> { co_return std::string("hello"); }));

  HandlerResult result = run(stage);

  EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
  ASSERT_EQ(transport.sent().size(), 2U);
  EXPECT_EQ(transport.sent()[0].type, EventType::HttpResponseStart);
  EXPECT_EQ(transport.sentStatus(), http::StatusCodeOK);
  EXPECT_EQ(transport.sentHeader("content-type"), "text/plain; charset=utf-8");
  EXPECT_EQ(transport.sentHeader("content-length"), "5");
  EXPECT_EQ(transport.sentBody(), "hello");
}

TEST_F(ResponseStageTest, JsonValueIsSentAsJson) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> {
    JsonValue value(JsonValue::object_t{});
    value["answer"] = 42.0;
    co_return value;
  }));

  run(stage);

  EXPECT_EQ(transport.sentStatus(), http::StatusCodeOK);
  EXPECT_EQ(transport.sentHeader("content-type"), "application/json");
  EXPECT_EQ(transport.sentBody(), R"({"answer":42})");
}

TEST_F(ResponseStageTest, PrepareModeReturnsNormalizedResponse) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> { co_return std::string("later"); }),
                      ResponseStageConfig{}.withPrepareResponseOnly());
  EXPECT_TRUE(stage.config().prepareResponseOnly);

  HandlerResult result = run(stage);

  EXPECT_TRUE(transport.sent().empty());
  auto* pSendable = std::get_if<std::unique_ptr<SendableResponse>>(&result);
  ASSERT_NE(pSendable, nullptr);
  ASSERT_NE(*pSendable, nullptr);

  const std::optional<Event> start = (*pSendable)->nextMessage().runSynchronously();
  ASSERT_TRUE(start.has_value());
  EXPECT_EQ(start->type, EventType::HttpResponseStart);
  const std::optional<Event> body = (*pSendable)->nextMessage().runSynchronously();
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->body, "later");
  EXPECT_FALSE((*pSendable)->nextMessage().runSynchronously().has_value());
}

TEST_F(ResponseStageTest, EmptyResultSendsNothing) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> { co_return HandlerResult{}; }));

  HandlerResult result = run(stage);

  EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
  EXPECT_TRUE(transport.sent().empty());
}

TEST_F(ResponseStageTest, PreparedResponseIsSentByOuterStage) {
  auto prepare = std::make_shared<ResponseStage>(
      MakeHandler([](Connection&) -> Task<HandlerResult> {
        co_return Response::Text("created", http::StatusCodeCreated).header("x-request-id", "abc");
      }),
      ResponseStageConfig{}.withPrepareResponseOnly());
  ResponseStage send(prepare);

  run(send);

  EXPECT_EQ(transport.sentStatus(), http::StatusCodeCreated);
  EXPECT_EQ(transport.sentHeader("x-request-id"), "abc");
  EXPECT_EQ(transport.sentBody(), "created");
}

TEST_F(ResponseStageTest, HttpErrorBecomesTextResponse) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> {
    throw DecodeError(DecodeTarget::Json);
    co_return HandlerResult{};
  }));

  run(stage);

  EXPECT_EQ(transport.sentStatus(), http::StatusCodeBadRequest);
  EXPECT_EQ(transport.sentBody(), "Invalid JSON");
}

TEST_F(ResponseStageTest, HttpErrorIsRethrownWhenConversionIsDisabled) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> {
                        throw HttpError(http::StatusCodeForbidden, "Forbidden");
                        co_return HandlerResult{};
                      }),
                      ResponseStageConfig{}.withConvertHttpErrors(false));

  EXPECT_THROW(run(stage), HttpError);
  EXPECT_TRUE(transport.sent().empty());
}

TEST_F(ResponseStageTest, OtherExceptionsPropagate) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> {
    throw std::runtime_error("bug");
    co_return HandlerResult{};
  }));

  EXPECT_THROW(run(stage), std::runtime_error);
  EXPECT_TRUE(transport.sent().empty());
}

TEST_F(ResponseStageTest, WebSocketConnectionsPassThrough) {
  ResponseStage stage(MakeHandler([](Connection&) -> Task<HandlerResult> { co_return std::string("inner"); }));
  EXPECT_FALSE(stage.intercepts(ScopeType::WebSocket));

  Connection connection(ConnectionScopeBuilder(ScopeType::WebSocket).withPath("/ws").build(), transport.receiveFn(),
                        transport.sendFn());
  HandlerResult result = stage.handle(connection).runSynchronously();

  EXPECT_EQ(std::get<std::string>(result), "inner");
  EXPECT_TRUE(transport.sent().empty());
}

TEST_F(ResponseStageTest, DefaultInnerRendersNotFound) {
  ResponseStage stage;

  run(stage);

  EXPECT_EQ(transport.sentStatus(), http::StatusCodeNotFound);
  EXPECT_EQ(transport.sentHeader("content-type"), "text/html; charset=utf-8");
  EXPECT_EQ(transport.sentBody(), "Not Found");
}

}  // namespace conduit
