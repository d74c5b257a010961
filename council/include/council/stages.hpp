#pragma once
// Stages: peer review (stage 2) and finalize (stage 3)
//
// Each stage reads the workspace artifacts, builds a prompt, runs one
// LLM call and writes a single canonical markdown artifact. Failures are
// thrown as std::runtime_error with the stage context prefixed.

#include <council/llm_runner.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace council {

namespace fs = std::filesystem;

constexpr const char* DEFAULT_ENGINE = "claude";
constexpr size_t REVIEW_PREVIEW_LEN = 200;
constexpr size_t FINAL_PREVIEW_LEN = 300;

struct PeerReviewOptions {
    std::string title;
    std::string engine = DEFAULT_ENGINE;
    std::optional<std::string> self_model;
};

struct PeerReviewResult {
    fs::path review_file;
    std::string engine;
    size_t answer_count = 0;
    std::string summary;
    std::string preview;
    std::string markdown;
};

struct FinalizeOptions {
    std::string title;
    std::string engine = DEFAULT_ENGINE;
};

struct FinalizeResult {
    fs::path final_file;
    std::string engine;
    size_t stage1_count = 0;
    size_t stage2_count = 0;
    std::string summary;
    std::string preview;
    std::string markdown;
};

// Trimmed engine, DEFAULT_ENGINE when blank
std::string normalize_engine(const std::string& engine);

// Characters outside [A-Za-z0-9_-] become '-'. The substituted string is
// used as-is; DEFAULT_ENGINE only when nothing but '-' remains.
std::string engine_file_token(const std::string& engine);

// First max_len bytes (backed off to a UTF-8 boundary) plus "..."
std::string preview_text(const std::string& text, size_t max_len);

std::string build_review_markdown(const std::string& title, const std::string& engine,
                                  const std::string& user_query, size_t answer_count,
                                  const std::string& responses_text,
                                  const std::string& review_output);

std::string build_final_markdown(const std::string& title, const std::string& engine,
                                 const std::string& user_query, size_t stage1_count,
                                 size_t stage2_count, const std::string& final_output);

class StageRunner {
public:
    // `start_dir` is where `.council` discovery begins
    StageRunner(fs::path start_dir, LlmRunner& runner)
        : start_dir_(std::move(start_dir)), runner_(runner) {}

    PeerReviewResult peer_review(const PeerReviewOptions& options);
    FinalizeResult finalize(const FinalizeOptions& options);

    const fs::path& start_dir() const { return start_dir_; }

private:
    fs::path start_dir_;
    LlmRunner& runner_;
};

} // namespace council
