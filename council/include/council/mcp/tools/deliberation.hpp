#pragma once
// MCP Council Tools: council.peer_review, council.finalize
//
// Argument decoding and result encoding around StageRunner. Handlers
// throw on failure; the dispatcher turns that into a JSON-RPC error.

#include "../types.hpp"
#include "../../stages.hpp"
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace council::mcp::tools::deliberation {

using json = nlohmann::json;

constexpr const char* PEER_REVIEW = "council.peer_review";
constexpr const char* FINALIZE = "council.finalize";

inline json engine_property() {
    return {
        {"type", "string"},
        {"description", "LLM model/engine (examples: sonnet, gemini, gpt, grok)"},
        {"default", DEFAULT_ENGINE}
    };
}

inline json title_property() {
    return {{"type", "string"}, {"description", "Conversation title/directory name"}};
}

// Register council tool schemas
inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        PEER_REVIEW,
        "Stage2: Read Stage1 JSON files and generate peer review using local LLM CLI",
        {
            {"type", "object"},
            {"properties", {
                {"title", title_property()},
                {"engine", engine_property()},
                {"self_model", {
                    {"type", "string"},
                    {"description", "Model name to exclude from peer review (its own response)"}
                }}
            }},
            {"required", {"title"}}
        }
    });

    tools.push_back({
        FINALIZE,
        "Stage3: Read Stage1 and Stage2 JSON files and generate final answer using local LLM CLI",
        {
            {"type", "object"},
            {"properties", {
                {"title", title_property()},
                {"engine", engine_property()}
            }},
            {"required", {"title"}}
        }
    });
}

// Optional string argument; non-string values count as absent
inline std::optional<std::string> string_arg(const json& params, const char* key) {
    if (!params.is_object()) return std::nullopt;
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

inline std::string required_title(const json& params) {
    auto title = string_arg(params, "title");
    if (!title) {
        throw std::runtime_error("Missing required parameter: title");
    }
    return *title;
}

inline PeerReviewOptions parse_peer_review(const json& params) {
    PeerReviewOptions options;
    options.title = required_title(params);
    options.engine = string_arg(params, "engine").value_or(DEFAULT_ENGINE);
    options.self_model = string_arg(params, "self_model");
    return options;
}

inline FinalizeOptions parse_finalize(const json& params) {
    FinalizeOptions options;
    options.title = required_title(params);
    options.engine = string_arg(params, "engine").value_or(DEFAULT_ENGINE);
    return options;
}

inline json result_payload(const PeerReviewResult& result) {
    return {
        {"success", true},
        {"review_markdown_file", result.review_file.string()},
        {"summary", result.summary},
        {"review_preview", result.preview},
        {"markdown", result.markdown}
    };
}

inline json result_payload(const FinalizeResult& result) {
    return {
        {"success", true},
        {"final_markdown_file", result.final_file.string()},
        {"summary", result.summary},
        {"final_answer_preview", result.preview},
        {"markdown", result.markdown}
    };
}

// Register council tool handlers
inline void register_handlers(StageRunner* stages, std::unordered_map<std::string, Tool>& tools,
                              const std::vector<ToolSchema>& schemas) {
    for (const auto& schema : schemas) {
        if (schema.name == PEER_REVIEW) {
            tools[schema.name] = {schema, [stages](const json& p) {
                return result_payload(stages->peer_review(parse_peer_review(p)));
            }, "Peer review failed: "};
        } else if (schema.name == FINALIZE) {
            tools[schema.name] = {schema, [stages](const json& p) {
                return result_payload(stages->finalize(parse_finalize(p)));
            }, "Finalize failed: "};
        }
    }
}

} // namespace council::mcp::tools::deliberation
