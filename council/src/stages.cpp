#include <council/stages.hpp>
#include <council/artifacts.hpp>
#include <council/legacy.hpp>
#include <council/prompts.hpp>
#include <council/strings.hpp>
#include <council/workspace.hpp>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace council {

std::string normalize_engine(const std::string& engine) {
    std::string trimmed = trim(engine);
    return trimmed.empty() ? DEFAULT_ENGINE : trimmed;
}

std::string engine_file_token(const std::string& engine) {
    std::string sanitized = engine;
    for (char& c : sanitized) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || c == '-' || c == '_') || uc >= 0x80) {
            c = '-';
        }
    }
    if (trim_char(sanitized, '-').empty()) {
        return DEFAULT_ENGINE;
    }
    return sanitized;
}

std::string preview_text(const std::string& text, size_t max_len) {
    if (text.size() <= max_len) {
        return text;
    }
    size_t cut = max_len;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

std::string build_review_markdown(const std::string& title, const std::string& engine,
                                  const std::string& user_query, size_t answer_count,
                                  const std::string& responses_text,
                                  const std::string& review_output) {
    std::ostringstream ss;
    ss << "# Peer Review\n"
       << "- title: " << title << "\n"
       << "- engine: " << engine << "\n"
       << "- answers reviewed: " << answer_count << "\n\n"
       << "## User Question\n" << user_query << "\n\n"
       << "## Responses\n" << responses_text << "\n\n"
       << "## Review\n" << review_output;
    return ss.str();
}

std::string build_final_markdown(const std::string& title, const std::string& engine,
                                 const std::string& user_query, size_t stage1_count,
                                 size_t stage2_count, const std::string& final_output) {
    std::ostringstream ss;
    ss << "# Final Answer\n"
       << "- title: " << title << "\n"
       << "- engine: " << engine << "\n"
       << "- stage1 responses: " << stage1_count << "\n"
       << "- stage2 reviews: " << stage2_count << "\n\n"
       << "## User Question\n" << user_query << "\n\n"
       << "## Final Answer\n" << final_output;
    return ss.str();
}

PeerReviewResult StageRunner::peer_review(const PeerReviewOptions& options) {
    const std::string engine = normalize_engine(options.engine);
    const std::string token = engine_file_token(engine);

    fs::path base_dir = resolve_workspace(start_dir_, options.title);

    std::vector<Stage1Answer> answers;
    for (auto& answer : load_stage1_answers(base_dir)) {
        if (options.self_model && iequals(answer.model, *options.self_model)) {
            std::cerr << "[council] Skipping self_model '" << *options.self_model
                      << "' from peer review\n";
            continue;
        }
        answers.push_back(std::move(answer));
    }
    if (answers.empty()) {
        throw std::runtime_error("No Stage1 answers available after applying self_model exclusion");
    }

    std::vector<LabeledResponse> labeled = label_responses(answers);
    std::string user_query = extract_user_query(base_dir);
    std::string prompt = build_ranking_prompt(user_query, labeled);

    std::string review_output;
    try {
        review_output = runner_.run(engine, prompt);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to run LLM CLI for peer review: ") + e.what());
    }

    legacy::migrate_reviews(base_dir, token);

    PeerReviewResult result;
    result.engine = engine;
    result.answer_count = answers.size();
    result.review_file = base_dir / legacy::canonical_review_name(token);
    result.markdown = build_review_markdown(options.title, engine, user_query, answers.size(),
                                            format_labeled_responses(labeled), review_output);

    try {
        write_file(result.review_file, result.markdown);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to write review markdown file: ") + e.what() +
                                 " (searched from: " + start_dir_.string() + ")");
    }
    std::cerr << "[council] Saved peer review to: " << result.review_file.string() << "\n";

    result.summary = "Peer review completed for " + std::to_string(answers.size()) +
                     " answers using " + engine;
    result.preview = preview_text(review_output, REVIEW_PREVIEW_LEN);
    return result;
}

FinalizeResult StageRunner::finalize(const FinalizeOptions& options) {
    const std::string& engine = options.engine;

    fs::path base_dir = resolve_workspace(start_dir_, options.title);

    std::vector<Stage1Answer> answers = load_stage1_answers(base_dir);
    std::vector<Stage2Review> reviews = load_stage2_reviews(base_dir);
    if (reviews.empty()) {
        throw std::runtime_error("No Stage2 review files found. Please run peer_review first.");
    }

    std::string user_query = extract_user_query(base_dir);
    std::string prompt = build_chairman_prompt(user_query, answers, reviews);

    std::string final_output;
    try {
        final_output = runner_.run(engine, prompt);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to run LLM CLI for finalization: ") + e.what());
    }

    FinalizeResult result;
    result.engine = engine;
    result.stage1_count = answers.size();
    result.stage2_count = reviews.size();
    result.final_file = base_dir / ("final-answer-by-" + engine + ".md");
    result.markdown = build_final_markdown(options.title, engine, user_query,
                                           answers.size(), reviews.size(), final_output);

    try {
        write_file(result.final_file, result.markdown);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to write final markdown file: ") + e.what() +
                                 " (searched from: " + start_dir_.string() + ")");
    }
    std::cerr << "[council] Saved final answer to: " << result.final_file.string() << "\n";

    result.summary = "Final answer generated using " + engine + " based on " +
                     std::to_string(answers.size()) + " responses and " +
                     std::to_string(reviews.size()) + " reviews";
    result.preview = preview_text(final_output, FINAL_PREVIEW_LEN);
    return result;
}

} // namespace council
