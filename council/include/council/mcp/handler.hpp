#pragma once
// MCP Handler: JSON-RPC dispatch for the council tools
//
// Routes initialize, tools/list and tools/call. Every failure inside a
// handler becomes INTERNAL_ERROR; unknown methods and tools become
// METHOD_NOT_FOUND. Notifications run their handler but never produce a
// response, failures included.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/deliberation.hpp"
#include "../version.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace council::mcp {

using json = nlohmann::json;

// Failure carrying its JSON-RPC error code
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    int code() const { return code_; }
private:
    int code_;
};

class Handler {
public:
    explicit Handler(StageRunner* stages) : stages_(stages) {
        register_all_tools();
    }

    // Response for one request; nullopt for notifications
    std::optional<json> handle(const Request& request) {
        const json id = request.id.value_or(json());
        try {
            json result = dispatch(request);
            if (request.is_notification()) return std::nullopt;
            return make_result(id, result);
        } catch (const RpcError& e) {
            if (request.is_notification()) {
                if (e.code() != error::METHOD_NOT_FOUND) {
                    std::cerr << "[council_mcp] Notification " << request.method
                              << " failed: " << e.what() << "\n";
                }
                return std::nullopt;
            }
            return make_error(id, e.code(), e.what());
        } catch (const std::exception& e) {
            if (request.is_notification()) {
                std::cerr << "[council_mcp] Notification " << request.method
                          << " failed: " << e.what() << "\n";
                return std::nullopt;
            }
            return make_error(id, error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what());
        }
    }

    // Get list of available tools (for tools/list)
    const std::vector<ToolSchema>& tools() const { return schemas_; }

private:
    StageRunner* stages_;
    std::vector<ToolSchema> schemas_;
    std::unordered_map<std::string, Tool> tools_;

    void register_all_tools() {
        tools::deliberation::register_schemas(schemas_);
        tools::deliberation::register_handlers(stages_, tools_, schemas_);
    }

    json dispatch(const Request& request) {
        if (request.method == "initialize") {
            return handle_initialize();
        } else if (request.method == "tools/list") {
            return handle_tools_list();
        } else if (request.method == "tools/call") {
            return handle_tools_call(request.params);
        }
        throw RpcError(error::METHOD_NOT_FOUND, "Method not found: " + request.method);
    }

    json handle_initialize() const {
        return {
            {"protocolVersion", COUNCIL_MCP_PROTOCOL_VERSION},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"serverInfo", {
                {"name", COUNCIL_SERVER_NAME},
                {"version", COUNCIL_VERSION}
            }}
        };
    }

    json handle_tools_list() const {
        json tools_array = json::array();
        for (const auto& tool : schemas_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return {{"tools", tools_array}};
    }

    json handle_tools_call(const std::optional<json>& params) {
        if (!params) {
            throw RpcError(error::INTERNAL_ERROR, "Missing params");
        }
        if (!params->is_object() || !params->contains("name") || !params->at("name").is_string()) {
            throw RpcError(error::INTERNAL_ERROR, "Missing tool name");
        }

        std::string name = params->at("name").get<std::string>();
        json arguments = params->value("arguments", json::object());

        auto it = tools_.find(name);
        if (it == tools_.end()) {
            throw RpcError(error::METHOD_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            return make_tool_response(it->second.handler(arguments));
        } catch (const std::exception& e) {
            throw RpcError(error::INTERNAL_ERROR, it->second.failure_prefix + e.what());
        }
    }
};

} // namespace council::mcp
