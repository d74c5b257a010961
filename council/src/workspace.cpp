#include <council/workspace.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace council {

fs::path find_council_dir(const fs::path& start) {
    std::error_code ec;

    fs::path in_start = start / COUNCIL_DIR_NAME;
    if (fs::exists(in_start, ec)) {
        return in_start;
    }

    // Walk up the ancestors
    fs::path dir = start;
    for (int level = 0; level < MAX_PARENT_LEVELS; ++level) {
        fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) break;
        dir = parent;

        fs::path candidate = dir / COUNCIL_DIR_NAME;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }

    return in_start;
}

fs::path resolve_workspace(const fs::path& start, const std::string& title) {
    fs::path base_dir = find_council_dir(start) / title;

    std::error_code ec;
    if (!fs::exists(base_dir, ec)) {
        throw std::runtime_error("Directory not found: " + base_dir.string() +
                                 " (searched from: " + start.string() + ")");
    }
    return base_dir;
}

std::vector<fs::path> list_files(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to read directory: " + dir.string() +
                                 ": " + ec.message());
    }

    std::vector<fs::path> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("Failed to read directory: " + dir.string() +
                                     ": " + ec.message());
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw std::runtime_error("Failed to read directory: " + dir.string() +
                                 ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

std::string read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Failed to read file: " + path.string() + " (not a regular file)");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    std::ostringstream ss;
    // An empty file extracts nothing and is not an error
    if (!(ss << in.rdbuf()) && in.peek() != std::ifstream::traits_type::eof()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return ss.str();
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open file for writing: " + path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
        throw std::runtime_error("Write failed: " + path.string());
    }
}

} // namespace council
