#include "mcp/Dispatcher.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace presence_mcp;
using json = nlohmann::json;

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ToolRegistry::Builder builder;
        builder.add({"lookup", "Looks up a brand", {
            {"brand_name", ParamType::String, "Brand"},
            {"topics", ParamType::StringArray, "Topics", true, 3},
            {"verbose", ParamType::Boolean, "Verbose output", false}
        }}, [this](const json& args) {
            handler_calls++;
            AuditResult result;
            result.tool = "lookup";
            result.title = "Lookup";
            result.brand = args["brand_name"].get<std::string>();
            result.score = static_cast<int>(args["topics"].size());
            result.rating = "n/a";
            return result;
        });
        registry = std::make_unique<ToolRegistry>(builder.build());
    }

    static json call(int id, const json& arguments) {
        return {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", "tools/call"},
            {"params", {{"name", "lookup"}, {"arguments", arguments}}}
        };
    }

    static json request(int id, const std::string& method, const json& params = json::object()) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    }

    std::unique_ptr<ToolRegistry> registry;
    int handler_calls = 0;
};

TEST_F(DispatcherTest, InitializeTransitionsToReady) {
    Dispatcher dispatcher(*registry);
    EXPECT_EQ(dispatcher.state(), SessionState::Uninitialized);

    auto response = dispatcher.dispatch(request(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test-host"}, {"version", "0.1"}}}
    }));

    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->is_error());
    EXPECT_EQ(response->id(), 1);
    EXPECT_EQ(response->result()["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(response->result()["capabilities"].contains("tools"));
    EXPECT_EQ(response->result()["serverInfo"]["name"], "ai-presence-mcp");
    EXPECT_EQ(response->result()["availableTools"], json::array({"lookup"}));
    EXPECT_EQ(dispatcher.state(), SessionState::Ready);
}

TEST_F(DispatcherTest, NegotiatesSupportedProtocolVersion) {
    Dispatcher dispatcher(*registry);
    auto response = dispatcher.dispatch(request(1, "initialize", {{"protocolVersion", "2025-03-26"}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->result()["protocolVersion"], "2025-03-26");
}

TEST_F(DispatcherTest, FallsBackToDefaultProtocolVersion) {
    Dispatcher dispatcher(*registry);
    auto response = dispatcher.dispatch(request(1, "initialize", {{"protocolVersion", "1999-01-01"}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->result()["protocolVersion"], "2024-11-05");
}

TEST_F(DispatcherTest, ToolsListWorksBeforeHandshake) {
    Dispatcher dispatcher(*registry, [] {
        DispatcherOptions options;
        options.handshake_policy = HandshakePolicy::Strict;
        return options;
    }());

    auto response = dispatcher.dispatch(request(5, "tools/list"));
    ASSERT_TRUE(response.has_value());
    ASSERT_FALSE(response->is_error());

    const auto& tools = response->result()["tools"];
    ASSERT_EQ(tools.size(), 1);
    EXPECT_EQ(tools[0]["name"], "lookup");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], json::array({"brand_name", "topics"}));
    EXPECT_EQ(dispatcher.state(), SessionState::Uninitialized);
}

TEST_F(DispatcherTest, PermissivePolicyServesCallsBeforeHandshake) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(call(3, {{"brand_name", "Acme"}, {"topics", json::array({"a", "b"})}}));
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->is_error());
    EXPECT_EQ(response->id(), 3);
    EXPECT_EQ(response->result()["structuredContent"]["score"], 2);
    EXPECT_EQ(handler_calls, 1);
}

TEST_F(DispatcherTest, StrictPolicyRejectsCallsBeforeHandshake) {
    DispatcherOptions options;
    options.handshake_policy = HandshakePolicy::Strict;
    Dispatcher dispatcher(*registry, options);

    auto rejected = dispatcher.dispatch(call(1, {{"brand_name", "Acme"}, {"topics", json::array()}}));
    ASSERT_TRUE(rejected.has_value());
    ASSERT_TRUE(rejected->is_error());
    EXPECT_EQ(rejected->error().code, ErrorCode::NotInitialized);
    EXPECT_EQ(rejected->id(), 1);
    EXPECT_EQ(handler_calls, 0);

    dispatcher.dispatch(request(2, "initialize"));

    auto accepted = dispatcher.dispatch(call(3, {{"brand_name", "Acme"}, {"topics", json::array()}}));
    ASSERT_TRUE(accepted.has_value());
    EXPECT_FALSE(accepted->is_error());
    EXPECT_EQ(handler_calls, 1);
}

TEST_F(DispatcherTest, MissingRequiredParameterNamesField) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(call(9, {{"brand_name", "Acme"}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->id(), 9);
    EXPECT_EQ(response->error().code, ErrorCode::InvalidParams);
    EXPECT_EQ(response->error().data["field"], "topics");
    EXPECT_NE(response->error().message.find("topics"), std::string::npos);
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, MistypedParameterNamesField) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(call(1, {{"brand_name", 42}, {"topics", json::array()}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error().code, ErrorCode::InvalidParams);
    EXPECT_EQ(response->error().data["field"], "brand_name");
}

TEST_F(DispatcherTest, UnknownParameterIsRejected) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(call(1, {{"brand_name", "Acme"}, {"topics", json::array()}, {"colour", "red"}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error().data["field"], "colour");
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, ToolCallWithoutNameIsInvalidParams) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(request(1, "tools/call", {{"arguments", json::object()}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error().code, ErrorCode::InvalidParams);
    EXPECT_EQ(response->error().data["field"], "name");
}

TEST_F(DispatcherTest, ArgumentsMustBeObject) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(request(1, "tools/call", {{"name", "lookup"}, {"arguments", "nope"}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error().code, ErrorCode::InvalidParams);
    EXPECT_EQ(response->error().data["field"], "arguments");
}

TEST_F(DispatcherTest, UnknownToolNeverInvokesHandler) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(request(4, "tools/call", {{"name", "missing"}}));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->is_error());
    EXPECT_EQ(response->error().code, ErrorCode::UnknownTool);
    EXPECT_EQ(response->id(), 4);
    EXPECT_EQ(handler_calls, 0);
}

TEST_F(DispatcherTest, StringIdsAreEchoed) {
    Dispatcher dispatcher(*registry);

    json message = {{"jsonrpc", "2.0"}, {"id", "req-abc"}, {"method", "ping"}};
    auto response = dispatcher.dispatch(message);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->id(), "req-abc");
    EXPECT_EQ(response->to_json()["id"], "req-abc");
}

TEST_F(DispatcherTest, NotificationsProduceNoResponse) {
    Dispatcher dispatcher(*registry);

    EXPECT_FALSE(dispatcher.dispatch({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    EXPECT_FALSE(dispatcher.dispatch({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}}).has_value());
    EXPECT_FALSE(dispatcher.dispatch({{"jsonrpc", "2.0"}, {"method", "tools/list"}}).has_value());
}

TEST_F(DispatcherTest, MalformedEnvelopeIsInvalidRequest) {
    Dispatcher dispatcher(*registry);

    auto missing_version = dispatcher.dispatch({{"id", 8}, {"method", "ping"}});
    ASSERT_TRUE(missing_version.has_value());
    EXPECT_EQ(missing_version->error().code, ErrorCode::InvalidRequest);
    EXPECT_EQ(missing_version->id(), 8);

    auto not_object = dispatcher.dispatch(json::array({1, 2, 3}));
    ASSERT_TRUE(not_object.has_value());
    EXPECT_EQ(not_object->error().code, ErrorCode::InvalidRequest);
    EXPECT_TRUE(not_object->id().is_null());

    auto bad_id = dispatcher.dispatch({{"jsonrpc", "2.0"}, {"id", {{"nested", true}}}, {"method", "ping"}});
    ASSERT_TRUE(bad_id.has_value());
    EXPECT_EQ(bad_id->error().code, ErrorCode::InvalidRequest);
    EXPECT_TRUE(bad_id->id().is_null());

    auto no_method = dispatcher.dispatch({{"jsonrpc", "2.0"}, {"id", 3}});
    ASSERT_TRUE(no_method.has_value());
    EXPECT_EQ(no_method->error().code, ErrorCode::InvalidRequest);
    EXPECT_EQ(no_method->id(), 3);
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    Dispatcher dispatcher(*registry);

    auto response = dispatcher.dispatch(request(12, "resources/list"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->error().code, ErrorCode::MethodNotFound);
    EXPECT_EQ(response->id(), 12);
    EXPECT_EQ(response->error().data["method"], "resources/list");
}

TEST_F(DispatcherTest, RejectFrameOnlyAnswersWhenIdRecovered) {
    Dispatcher dispatcher(*registry);

    EXPECT_FALSE(dispatcher.reject_frame(nullptr, "parse error").has_value());

    auto response = dispatcher.reject_frame(17, "parse error");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->id(), 17);
    EXPECT_EQ(response->error().code, ErrorCode::ParseError);
}

TEST_F(DispatcherTest, IdenticalCallsGiveIdenticalResults) {
    Dispatcher dispatcher(*registry);
    json arguments = {{"brand_name", "Acme"}, {"topics", json::array({"x"})}};

    auto first = dispatcher.dispatch(call(1, arguments));
    auto second = dispatcher.dispatch(call(2, arguments));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->result(), second->result());
}

TEST_F(DispatcherTest, DrainAndTerminate) {
    Dispatcher dispatcher(*registry);
    dispatcher.begin_drain();
    EXPECT_EQ(dispatcher.state(), SessionState::Draining);
    dispatcher.terminate();
    EXPECT_EQ(dispatcher.state(), SessionState::Terminated);
    EXPECT_EQ(to_string(SessionState::Terminated), "terminated");
}
