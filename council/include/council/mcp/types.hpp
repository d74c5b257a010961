#pragma once
// MCP Types: Tool schema and handler types
//
// Defines the data structures used for MCP tool registration.
// Handlers return the JSON payload of a successful call and report
// failure by throwing.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace council::mcp {

using json = nlohmann::json;

// Tool schema definition for MCP tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool handler function type
using ToolHandler = std::function<json(const json&)>;

// Registered tool: schema, handler and the prefix used when its
// failures are reported ("Peer review failed: ...").
struct Tool {
    ToolSchema schema;
    ToolHandler handler;
    std::string failure_prefix;
};

} // namespace council::mcp
