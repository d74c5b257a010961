#pragma once
// MCP Protocol: JSON-RPC 2.0 helpers and error codes
//
// Request parsing, id classification and response builders for the
// council stdio server. A message whose id is absent, null, boolean,
// array or object is a notification and never receives a response.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace council::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

// A parsed JSON-RPC message. `id` is only set for true requests.
struct Request {
    std::string jsonrpc;
    std::optional<json> id;
    std::string method;
    std::optional<json> params;

    bool is_notification() const { return !id.has_value(); }
};

// Only a bare string or number identifies a request.
inline bool is_request_id(const json& id) {
    return id.is_string() || id.is_number();
}

// Parse one input line into the request shape. Returns nullopt (and sets
// error_msg) when the line is not JSON or lacks string jsonrpc/method.
// `discarded_id` is set when an id was present but unusable.
inline std::optional<Request> parse_request(const std::string& line,
                                            std::string& error_msg,
                                            bool& discarded_id) {
    discarded_id = false;

    json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        error_msg = "Failed to parse JSON-RPC request: invalid JSON";
        return std::nullopt;
    }
    if (!message.is_object()) {
        error_msg = "Failed to parse JSON-RPC request: expected an object";
        return std::nullopt;
    }

    auto jsonrpc = message.find("jsonrpc");
    if (jsonrpc == message.end() || !jsonrpc->is_string()) {
        error_msg = "Failed to parse JSON-RPC request: missing field `jsonrpc`";
        return std::nullopt;
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        error_msg = "Failed to parse JSON-RPC request: missing field `method`";
        return std::nullopt;
    }

    Request request;
    request.jsonrpc = jsonrpc->get<std::string>();
    request.method = method->get<std::string>();

    auto id = message.find("id");
    if (id != message.end()) {
        if (is_request_id(*id)) {
            request.id = *id;
        } else {
            discarded_id = !id->is_null();
        }
    }

    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        request.params = *params;
    }

    return request;
}

// Build a JSON-RPC 2.0 success response
inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

// Build a JSON-RPC 2.0 error response
inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// Build a tool call response (MCP content format). The payload travels
// as compact JSON text inside the single text content block.
inline json make_tool_response(const json& payload, bool is_error = false) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", payload.dump(-1, ' ', false, json::error_handler_t::replace)}
    });

    return {
        {"content", content},
        {"isError", is_error}
    };
}

// Serialize one protocol line. Invalid UTF-8 from tool output is replaced
// rather than allowed to abort serialization.
inline std::string serialize(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace council::mcp
