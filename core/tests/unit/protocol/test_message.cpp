#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "ngdef/protocol/capabilities.hpp"
#include "ngdef/protocol/message.hpp"

using ngdef::decode_message;
using ngdef::encode_message;
using ngdef::ErrorKind;
using ngdef::Notification;
using ngdef::Request;
using ngdef::RequestId;
using ngdef::Response;
using json = nlohmann::json;

TEST(ProtocolMessage, IdSelectsRequest)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","id":"q-1","method":"m","params":[1,2]})");
  ASSERT_TRUE(r.success) << r.error.describe();
  const auto * req = std::get_if<Request>(&*r.message);
  ASSERT_NE(req, nullptr);
  EXPECT_TRUE(req->id.is_string());
  EXPECT_EQ(req->id.as_string(), "q-1");
  EXPECT_TRUE(req->params.is_array());
}

TEST(ProtocolMessage, NoIdSelectsNotification)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","method":"exit"})");
  ASSERT_TRUE(r.success);
  const auto * n = std::get_if<Notification>(&*r.message);
  ASSERT_NE(n, nullptr);
  EXPECT_EQ(n->method, "exit");
  EXPECT_TRUE(n->params.is_null());
}

TEST(ProtocolMessage, InvalidJsonKeepsRawBody)
{
  const std::string body = "{not json";
  const auto r = decode_message(body);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::Decode);
  EXPECT_EQ(r.error.code(), ngdef::k_parse_error);
  ASSERT_TRUE(r.error.raw_body.has_value());
  EXPECT_EQ(*r.error.raw_body, body);
  EXPECT_FALSE(r.error.id.has_value());
  EXPECT_FALSE(r.error.cause.empty());
}

TEST(ProtocolMessage, NonObjectIsDecodeError)
{
  for (const char * body : {"[]", "42", "\"x\"", "null"}) {
    const auto r = decode_message(body);
    ASSERT_FALSE(r.success) << body;
    EXPECT_EQ(r.error.kind, ErrorKind::Decode) << body;
  }
}

TEST(ProtocolMessage, ResponsesAreRejectedWithoutAddressee)
{
  for (const char * body :
       {R"({"jsonrpc":"2.0","id":4,"result":null})",
        R"({"jsonrpc":"2.0","id":"r","error":{"code":-1,"message":"no"}})"}) {
    const auto r = decode_message(body);
    ASSERT_FALSE(r.success) << body;
    EXPECT_EQ(r.error.kind, ErrorKind::Decode) << body;
    // Replying to a response would itself be a protocol violation.
    EXPECT_FALSE(r.error.id.has_value()) << body;
  }
}

TEST(ProtocolMessage, IdWithoutMethodIsInvalidRequest)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","id":4})");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::InvalidRequest);
  ASSERT_TRUE(r.error.id.has_value());
  EXPECT_EQ(*r.error.id, RequestId(4));
}

TEST(ProtocolMessage, EnvelopeErrorWithIdIsInvalidRequest)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","id":9,"method":17})");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::InvalidRequest);
  EXPECT_EQ(r.error.code(), ngdef::k_invalid_request);
  ASSERT_TRUE(r.error.id.has_value());
  EXPECT_EQ(*r.error.id, RequestId(9));
}

TEST(ProtocolMessage, EnvelopeErrorWithoutIdIsDecodeError)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","method":"x","params":3})");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.kind, ErrorKind::Decode);
  EXPECT_FALSE(r.error.id.has_value());
}

TEST(ProtocolMessage, MissingJsonRpcVersionIsAccepted)
{
  const auto r = decode_message(
    R"({"id":1,"method":"initialize","params":{"capabilities":{"workspace":{}}}})");
  ASSERT_TRUE(r.success) << r.error.describe();
  const auto & req = std::get<Request>(*r.message);
  EXPECT_EQ(req.id, RequestId(1));
  EXPECT_EQ(req.method, "initialize");
}

TEST(ProtocolMessage, WrongJsonRpcVersionIsRejected)
{
  EXPECT_FALSE(decode_message(R"({"jsonrpc":"1.0","id":1,"method":"x"})").success);
  EXPECT_FALSE(decode_message(R"({"jsonrpc":2,"id":1,"method":"x"})").success);
  EXPECT_FALSE(decode_message(R"({"jsonrpc":null,"method":"x"})").success);
}

TEST(ProtocolMessage, RejectsUnusableIds)
{
  for (const char * body :
       {R"({"jsonrpc":"2.0","id":1.5,"method":"x"})",
        R"({"jsonrpc":"2.0","id":null,"method":"x"})",
        R"({"jsonrpc":"2.0","id":4294967296,"method":"x"})",
        R"({"jsonrpc":"2.0","id":{},"method":"x"})"}) {
    const auto r = decode_message(body);
    ASSERT_FALSE(r.success) << body;
    EXPECT_EQ(r.error.kind, ErrorKind::Decode) << body;
    EXPECT_FALSE(r.error.id.has_value()) << body;
  }
}

TEST(ProtocolMessage, AcceptsNegativeIntegerId)
{
  const auto r = decode_message(R"({"jsonrpc":"2.0","id":-3,"method":"x"})");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(std::get<Request>(*r.message).id.as_integer(), -3);
}

TEST(ProtocolMessage, EncodesErrorResponse)
{
  const auto j = encode_message(Response::failure(
    RequestId(std::string("r")), ngdef::Error::method_not_found("foo/bar")));
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], "r");
  EXPECT_FALSE(j.contains("result"));
  EXPECT_EQ(j["error"]["code"], ngdef::k_method_not_found);
  EXPECT_NE(j["error"]["message"].get<std::string>().find("foo/bar"), std::string::npos);
}

TEST(ProtocolMessage, EncodesNullResult)
{
  const auto j = encode_message(Response::success(RequestId(2), nullptr));
  ASSERT_TRUE(j.contains("result"));
  EXPECT_TRUE(j["result"].is_null());
  EXPECT_FALSE(j.contains("error"));
}

TEST(ProtocolCapabilities, InitializeResultIsFixed)
{
  const json result = ngdef::initialize_result();
  EXPECT_EQ(result["capabilities"]["definitionProvider"], true);
  EXPECT_EQ(result["serverInfo"]["name"], ngdef::k_server_name);
  EXPECT_EQ(result["serverInfo"]["version"], ngdef::k_server_version);
}

TEST(ProtocolCapabilities, InitializeParamsShape)
{
  EXPECT_TRUE(ngdef::is_valid_initialize_params(json{{"capabilities", {{"workspace", json::object()}}}}));
  EXPECT_TRUE(ngdef::is_valid_initialize_params(
    json{{"capabilities", {{"workspace", json::object()}, {"textDocument", json::object()}}}}));
  EXPECT_FALSE(ngdef::is_valid_initialize_params(json::object()));
  EXPECT_FALSE(ngdef::is_valid_initialize_params(json{{"capabilities", 1}}));
  EXPECT_TRUE(ngdef::is_valid_initialize_params(json{{"capabilities", json::object()}}));
  EXPECT_TRUE(ngdef::is_valid_initialize_params(
    json{{"capabilities", {{"workspace", nullptr}, {"textDocument", 3}}}}));
  EXPECT_FALSE(ngdef::is_valid_initialize_params(nullptr));
  EXPECT_FALSE(ngdef::is_valid_initialize_params(json{{"capabilities", nullptr}}));
}
