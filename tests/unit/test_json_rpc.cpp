#include <gtest/gtest.h>
#include "mcpcore/json_rpc.hpp"
#include "mcpcore/error.hpp"
#include <nlohmann/json.hpp>

using namespace mcpcore;

// ---- Requests and notifications ----

TEST(JsonRpcRequest, WireShape) {
    JsonRpcRequest call{RequestId{int64_t{1}}, "tools/call",
                        nlohmann::json{{"name", "echo"}, {"arguments", {{"message", "hi"}}}}};
    nlohmann::json j = call;
    EXPECT_EQ(j, (nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}},
    }));
    EXPECT_EQ(j.get<JsonRpcRequest>(), call);
}

TEST(JsonRpcRequest, ParamsOmittedWhenAbsent) {
    nlohmann::json j = JsonRpcRequest{RequestId{std::string("ping-1")}, "ping", std::nullopt};
    EXPECT_EQ(j["id"], "ping-1");
    EXPECT_FALSE(j.contains("params"));
}

TEST(JsonRpcNotification, HasNoId) {
    nlohmann::json j = JsonRpcNotification{"notifications/cancelled", nlohmann::json{{"requestId", 4}}};
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["params"]["requestId"], 4);
    EXPECT_FALSE(j.contains("id"));
}

// ---- Responses ----

TEST(JsonRpcResponse, SuccessCarriesOnlyResult) {
    auto resp = make_result(RequestId{int64_t{42}},
                            nlohmann::json{{"content", {{{"type", "text"}, {"text", "Echo: hi"}}}}});
    EXPECT_FALSE(resp.is_error());

    nlohmann::json j = resp;
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["content"][0]["text"], "Echo: hi");
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, FailureCarriesOnlyError) {
    auto resp = make_error(RequestId{std::string("r1")}, error::NotFound, "Tool not found: nonexistent");
    EXPECT_TRUE(resp.is_error());
    EXPECT_FALSE(resp.result.has_value());

    nlohmann::json j = resp;
    EXPECT_EQ(j["error"], (nlohmann::json{{"code", -32601}, {"message", "Tool not found: nonexistent"}}));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, ValidationProblemsTravelInData) {
    auto resp = make_error(RequestId{int64_t{3}},
                           JsonRpcError{error::InvalidParams, "Invalid arguments",
                                        nlohmann::json{{"errors", {"missing required field 'message'"}}}});
    nlohmann::json j = resp;
    EXPECT_EQ(j["error"]["data"]["errors"][0], "missing required field 'message'");
    EXPECT_EQ(j.get<JsonRpcResponse>(), resp);
}

TEST(JsonRpcResponse, UnsetResultSerializesAsEmptyObject) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    nlohmann::json j = resp;
    EXPECT_EQ(j["result"], nlohmann::json::object());
}

TEST(JsonRpcMessage, SerializesActiveAlternative) {
    JsonRpcMessage msg = JsonRpcNotification{"notifications/initialized", std::nullopt};
    nlohmann::json j;
    to_json(j, msg);
    EXPECT_EQ(j, (nlohmann::json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
}

// ---- Identifiers ----

TEST(RequestId, IntegerAndStringForms) {
    nlohmann::json as_int;
    nlohmann::json as_str;
    to_json(as_int, RequestId{int64_t{123}});
    to_json(as_str, RequestId{std::string("123")});
    EXPECT_TRUE(as_int.is_number_integer());
    EXPECT_TRUE(as_str.is_string());

    RequestId back;
    from_json(as_str, back);
    EXPECT_EQ(back, RequestId{std::string("123")});
    from_json(as_int, back);
    EXPECT_EQ(back, RequestId{int64_t{123}});
}

TEST(RequestId, RejectsOtherJsonTypes) {
    RequestId id;
    for (const auto& bad : {nlohmann::json(nullptr), nlohmann::json(1.5), nlohmann::json(true),
                            nlohmann::json::array({1}), nlohmann::json::object()}) {
        EXPECT_THROW(from_json(bad, id), std::invalid_argument) << bad.dump();
    }
}

TEST(RequestId, LogFormQuotesStrings) {
    EXPECT_EQ(to_string(RequestId{int64_t{-7}}), "-7");
    EXPECT_EQ(to_string(RequestId{std::string("7")}), "\"7\"");
}

TEST(JsonRpcError, EqualityIncludesData) {
    JsonRpcError plain{error::RequestCancelled, "Request cancelled", std::nullopt};
    JsonRpcError with_data{error::RequestCancelled, "Request cancelled", nlohmann::json{{"k", 1}}};
    EXPECT_EQ(plain, plain);
    EXPECT_FALSE(plain == with_data);

    nlohmann::json j = with_data;
    EXPECT_EQ(j.get<JsonRpcError>(), with_data);
}
