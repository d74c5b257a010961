#pragma once
// Artifacts: stage-1 answers and stage-2 reviews read from a workspace
//
// Both stages accept JSON or plain markdown/text files. JSON files
// contribute their fields; anything that fails to parse is taken
// verbatim. Missing metadata is derived from the filename.

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace council {

namespace fs = std::filesystem;
using json = nlohmann::json;

// One model's answer to the user's question (stage 1)
struct Stage1Answer {
    std::string file;       // filename within the workspace
    std::string model;
    std::string response;
    json raw;               // parsed JSON, or the file text as a JSON string
};

// One engine's ranking of the stage-1 answers (stage 2)
struct Stage2Review {
    std::string file;
    std::string engine;
    std::string review;
    json raw;
};

constexpr const char* UNKNOWN_QUERY = "Unknown query";

// Text of a JSON value: field `response`, else field `content`, else the
// value itself when it is a string, else the pretty-printed JSON.
std::string extract_content(const json& value);

bool is_stage1_file(const std::string& filename);
bool is_stage1_json_file(const std::string& filename);
bool is_stage2_file(const std::string& filename);

std::string model_from_filename(const fs::path& path);
std::string engine_from_filename(const fs::path& path);

Stage1Answer read_stage1_answer(const fs::path& path);
Stage2Review read_stage2_review(const fs::path& path);

// All stage-1 answers in filename order. Throws when there are none.
std::vector<Stage1Answer> load_stage1_answers(const fs::path& workspace);

// All stage-2 reviews in filename order; may be empty.
std::vector<Stage2Review> load_stage2_reviews(const fs::path& workspace);

// The user's question: first of query.txt, user_query.txt, question.txt,
// input.txt (trimmed), else `query`/`user_query` from the first stage-1
// JSON file, else UNKNOWN_QUERY. Never throws.
std::string extract_user_query(const fs::path& workspace);

} // namespace council
