#include <council/legacy.hpp>
#include <council/strings.hpp>
#include <council/workspace.hpp>
#include <iostream>
#include <system_error>

namespace council {
namespace legacy {

std::string canonical_review_name(const std::string& engine_token) {
    return std::string(CANONICAL_REVIEW_PREFIX) + engine_token + REVIEW_SUFFIX;
}

std::string legacy_engine_token(const std::string& filename) {
    if (!str_starts_with(filename, REVIEW_PREFIX) ||
        !str_ends_with(filename, REVIEW_SUFFIX) ||
        str_contains(filename, CANONICAL_REVIEW_PREFIX)) {
        return "";
    }

    const size_t prefix_len = std::string(REVIEW_PREFIX).size();
    const size_t suffix_len = std::string(REVIEW_SUFFIX).size();
    if (filename.size() <= prefix_len + suffix_len) return "";
    return filename.substr(prefix_len, filename.size() - prefix_len - suffix_len);
}

bool move_if_absent(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(to, ec) || !fs::exists(from, ec)) {
        return false;
    }

    fs::rename(from, to, ec);
    if (!ec) return true;

    // Rename can fail across devices or on odd filesystems; keep the content
    std::cerr << "[council] Rename " << from.string() << " -> " << to.string()
              << " failed (" << ec.message() << "), copying instead\n";
    try {
        write_file(to, read_file(from));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[council] Legacy migration skipped: " << e.what() << "\n";
        return false;
    }
}

std::vector<Migration> migrate_reviews(const fs::path& workspace,
                                       const std::string& engine_token) {
    std::vector<Migration> done;

    fs::path bare = workspace / LEGACY_REVIEW_FILE;
    fs::path target = workspace / canonical_review_name(engine_token);
    if (move_if_absent(bare, target)) {
        done.push_back({bare, target});
    }

    std::vector<fs::path> files;
    try {
        files = list_files(workspace);
    } catch (const std::exception& e) {
        std::cerr << "[council] Legacy migration scan failed: " << e.what() << "\n";
        return done;
    }

    for (const auto& path : files) {
        std::string token = legacy_engine_token(path.filename().string());
        if (token.empty()) continue;

        fs::path canonical = workspace / canonical_review_name(token);
        if (move_if_absent(path, canonical)) {
            done.push_back({path, canonical});
        }
    }

    for (const auto& m : done) {
        std::cerr << "[council] Migrated " << m.from.filename().string()
                  << " -> " << m.to.filename().string() << "\n";
    }
    return done;
}

} // namespace legacy
} // namespace council
