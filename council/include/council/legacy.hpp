#pragma once
// Legacy migration: rename old peer-review artifacts to the canonical
// `peer-review-by-<engine>.md` form
//
// Principles:
// 1. Rename-if-absent: an existing canonical file is never overwritten
// 2. Idempotent: a second run finds nothing to do
// 3. Best-effort: failures are logged and never propagated

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace council {
namespace legacy {

namespace fs = std::filesystem;

constexpr const char* LEGACY_REVIEW_FILE = "peer-review.md";
constexpr const char* REVIEW_PREFIX = "peer-review-";
constexpr const char* CANONICAL_REVIEW_PREFIX = "peer-review-by-";
constexpr const char* REVIEW_SUFFIX = ".md";

struct Migration {
    fs::path from;
    fs::path to;
};

std::string canonical_review_name(const std::string& engine_token);

// Engine token of a `peer-review-<engine>.md` file, or "" when the name
// is canonical, bare, or not a review at all.
std::string legacy_engine_token(const std::string& filename);

// Move `from` to `to` unless `to` already exists. Falls back to copying
// the content when rename fails. Returns true when `to` was created.
bool move_if_absent(const fs::path& from, const fs::path& to);

// Migrate a bare `peer-review.md` to `engine_token`'s canonical name, then
// every `peer-review-<engine>.md` to `peer-review-by-<engine>.md`.
std::vector<Migration> migrate_reviews(const fs::path& workspace,
                                       const std::string& engine_token);

} // namespace legacy
} // namespace council
