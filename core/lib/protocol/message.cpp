// ngdef/protocol/message.cpp - JSON-RPC message decoding / encoding
#include "ngdef/protocol/message.hpp"

#include <string>
#include <utility>

namespace ngdef
{

using json = nlohmann::json;

namespace
{

// Variant visitor helper
template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

MessageResult envelope_error(
  std::string message, std::string_view body, const std::optional<RequestId> & id)
{
  Error err = Error::decode(std::move(message), std::string(body));
  if (id) {
    err.kind = ErrorKind::InvalidRequest;
    err.id = id;
  }
  return MessageResult::fail(std::move(err));
}

}  // namespace

Response Response::success(RequestId id, json result)
{
  Response r;
  r.id = std::move(id);
  r.result = std::move(result);
  return r;
}

Response Response::failure(RequestId id, const Error & error)
{
  Response r;
  r.id = std::move(id);
  r.error = ResponseError{error.code(), error.message};
  return r;
}

MessageResult decode_message(std::string_view body)
{
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error & e) {
    return MessageResult::fail(Error::decode("body is not valid JSON", std::string(body), e.what()));
  }

  if (!root.is_object()) {
    return MessageResult::fail(Error::decode("message is not a JSON object", std::string(body)));
  }

  // Recover the id first so that envelope errors can be answered.
  std::optional<RequestId> id;
  const bool has_id = root.contains("id");
  if (has_id) {
    id = RequestId::from_json(root["id"]);
    if (!id) {
      return MessageResult::fail(
        Error::decode("id must be a string or a 32-bit integer", std::string(body)));
    }
  }

  // An absent version is tolerated; a wrong one is not.
  const auto ver = root.find("jsonrpc");
  if (ver != root.end() && (!ver->is_string() || ver->get<std::string>() != k_jsonrpc_version)) {
    return envelope_error("jsonrpc must be \"2.0\"", body, id);
  }

  const auto method_it = root.find("method");
  if (method_it == root.end()) {
    // A response from the client is never answered, even if it carries an id.
    if (root.contains("result") || root.contains("error")) {
      return MessageResult::fail(
        Error::decode("unexpected response message", std::string(body)));
    }
    return envelope_error("message is neither a request nor a notification", body, id);
  }
  if (!method_it->is_string()) {
    return envelope_error("method must be a string", body, id);
  }

  json params;  // null
  const auto params_it = root.find("params");
  if (params_it != root.end()) {
    if (!params_it->is_object() && !params_it->is_array() && !params_it->is_null()) {
      return envelope_error("params must be an object or an array", body, id);
    }
    params = *params_it;
  }

  std::string method = method_it->get<std::string>();
  if (has_id) {
    return MessageResult::ok(Request{std::move(*id), std::move(method), std::move(params)});
  }
  return MessageResult::ok(Notification{std::move(method), std::move(params)});
}

json encode_message(const Message & msg)
{
  json j;
  j["jsonrpc"] = k_jsonrpc_version;
  std::visit(
    Overloaded{
      [&](const Request & r) {
        j["id"] = r.id.to_json();
        j["method"] = r.method;
        if (!r.params.is_null()) {
          j["params"] = r.params;
        }
      },
      [&](const Notification & n) {
        j["method"] = n.method;
        if (!n.params.is_null()) {
          j["params"] = n.params;
        }
      },
      [&](const Response & r) {
        j["id"] = r.id.to_json();
        if (r.error) {
          j["error"] = json{{"code", r.error->code}, {"message", r.error->message}};
        } else {
          j["result"] = r.result;
        }
      },
    },
    msg);
  return j;
}

std::string_view method_of(const Message & msg) noexcept
{
  if (const auto * r = std::get_if<Request>(&msg)) {
    return r->method;
  }
  if (const auto * n = std::get_if<Notification>(&msg)) {
    return n->method;
  }
  return {};
}

}  // namespace ngdef
