#include <council/artifacts.hpp>
#include <council/strings.hpp>
#include <council/workspace.hpp>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace council {

namespace {

const char* const QUERY_FILES[] = {
    "query.txt",
    "user_query.txt",
    "question.txt",
    "input.txt",
};

// String field of a JSON object, or nullptr
const json* string_field(const json& value, const char* key) {
    if (!value.is_object()) return nullptr;
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) return nullptr;
    return &*it;
}

json parse_or_discard(const std::string& text) {
    return json::parse(text, nullptr, false);
}

} // namespace

std::string extract_content(const json& value) {
    if (const json* text = string_field(value, "response")) {
        return text->get<std::string>();
    }
    if (const json* text = string_field(value, "content")) {
        return text->get<std::string>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

bool is_stage1_file(const std::string& filename) {
    return str_contains(filename, "-answer.md") || str_ends_with(filename, "answer.md") ||
           is_stage1_json_file(filename);
}

bool is_stage1_json_file(const std::string& filename) {
    return str_contains(filename, "-answer.json") || str_ends_with(filename, "answer.json");
}

bool is_stage2_file(const std::string& filename) {
    return str_contains(filename, "peer-review");
}

std::string model_from_filename(const fs::path& path) {
    return replace_all(path.stem().string(), "-answer", "");
}

std::string engine_from_filename(const fs::path& path) {
    return replace_all(path.stem().string(), "peer-review-by-", "");
}

Stage1Answer read_stage1_answer(const fs::path& path) {
    std::string content = read_file(path);

    Stage1Answer answer;
    answer.file = path.filename().string();

    json data = parse_or_discard(content);
    if (!data.is_discarded()) {
        const json* model = string_field(data, "model");
        answer.model = model ? model->get<std::string>() : model_from_filename(path);
        answer.response = extract_content(data);
        answer.raw = std::move(data);
        return answer;
    }

    // Markdown or plain text
    answer.model = model_from_filename(path);
    answer.response = content;
    answer.raw = content;
    return answer;
}

Stage2Review read_stage2_review(const fs::path& path) {
    std::string content = read_file(path);

    Stage2Review review;
    review.file = path.filename().string();

    json data = parse_or_discard(content);
    if (!data.is_discarded()) {
        const json* engine = string_field(data, "engine");
        review.engine = engine ? engine->get<std::string>() : engine_from_filename(path);
        const json* text = string_field(data, "review");
        review.review = text ? text->get<std::string>() : extract_content(data);
        review.raw = std::move(data);
        return review;
    }

    review.engine = engine_from_filename(path);
    review.review = content;
    review.raw = content;
    return review;
}

std::vector<Stage1Answer> load_stage1_answers(const fs::path& workspace) {
    std::vector<Stage1Answer> answers;
    for (const auto& path : list_files(workspace)) {
        if (!is_stage1_file(path.filename().string())) continue;
        try {
            answers.push_back(read_stage1_answer(path));
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to parse answer file: " + path.string() +
                                     ": " + e.what());
        }
    }

    if (answers.empty()) {
        throw std::runtime_error("No Stage1 answer files found in " + workspace.string());
    }
    return answers;
}

std::vector<Stage2Review> load_stage2_reviews(const fs::path& workspace) {
    std::vector<Stage2Review> reviews;
    for (const auto& path : list_files(workspace)) {
        if (!is_stage2_file(path.filename().string())) continue;
        try {
            reviews.push_back(read_stage2_review(path));
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to parse review file: " + path.string() +
                                     ": " + e.what());
        }
    }
    return reviews;
}

std::string extract_user_query(const fs::path& workspace) {
    std::error_code ec;

    for (const char* name : QUERY_FILES) {
        fs::path path = workspace / name;
        if (!fs::exists(path, ec)) continue;
        try {
            return trim(read_file(path));
        } catch (const std::exception& e) {
            std::cerr << "[council] Could not read " << path.string() << ": " << e.what() << "\n";
            continue;
        }
    }

    try {
        for (const auto& path : list_files(workspace)) {
            if (!is_stage1_json_file(path.filename().string())) continue;

            json data = parse_or_discard(read_file(path));
            if (data.is_object()) {
                // First present key wins, even when it is not a string
                auto it = data.find("query");
                if (it == data.end()) it = data.find("user_query");
                if (it != data.end() && it->is_string()) {
                    return it->get<std::string>();
                }
            }
            break;  // only the first JSON answer is consulted
        }
    } catch (const std::exception& e) {
        std::cerr << "[council] Could not scan answers for query: " << e.what() << "\n";
    }

    return UNKNOWN_QUERY;
}

} // namespace council
