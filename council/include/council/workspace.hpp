#pragma once
// Workspace: locate and access the on-disk council workspace
//
// A workspace is `.council/<title>/`. The `.council` root is searched
// for in the start directory and then in its ancestors; the title
// directory itself must already exist.

#include <filesystem>
#include <string>
#include <vector>

namespace council {

namespace fs = std::filesystem;

constexpr const char* COUNCIL_DIR_NAME = ".council";
constexpr int MAX_PARENT_LEVELS = 5;

// Find the `.council` root for `start`. Falls back to `start/.council`
// when no ancestor has one; that path does not exist and the failure
// surfaces in resolve_workspace().
fs::path find_council_dir(const fs::path& start);

// Resolve `.council/<title>`. Throws std::runtime_error naming the
// attempted path and the start directory when it does not exist.
fs::path resolve_workspace(const fs::path& start, const std::string& title);

// Regular files directly under `dir`, sorted by filename so that
// artifact order (and label assignment) does not depend on the platform.
std::vector<fs::path> list_files(const fs::path& dir);

std::string read_file(const fs::path& path);
void write_file(const fs::path& path, const std::string& content);

} // namespace council
