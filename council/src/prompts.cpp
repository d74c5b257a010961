#include <council/prompts.hpp>
#include <sstream>

namespace council {

namespace {

const char* const RANKING_INSTRUCTIONS = R"(Your task:
1. First, evaluate each response individually. For each response, explain what it does well and what it does poorly.
2. Then, at the very end of your response, provide a final ranking.

IMPORTANT: Your final ranking MUST be formatted EXACTLY as follows:
- Start with the line "FINAL RANKING:" (all caps, with colon)
- Then list the responses from best to worst as a numbered list
- Each line should be: number, period, space, then ONLY the response label (e.g., "1. Response A")
- Do not add any other text or explanations in the ranking section

Example of the correct format for your ENTIRE response:

Response A provides good detail on X but misses Y...
Response B is accurate but lacks depth on Z...
Response C offers the most comprehensive answer...

FINAL RANKING:
1. Response C
2. Response A
3. Response B

Now provide your evaluation and ranking:)";

const char* const CHAIRMAN_INSTRUCTIONS = R"(Your task as Chairman is to synthesize all of this information into a single, comprehensive, accurate answer to the user's original question. Consider:
- The individual responses and their insights
- The peer rankings and what they reveal about response quality
- Any patterns of agreement or disagreement

Provide a clear, well-reasoned final answer that represents the council's collective wisdom:)";

} // namespace

std::string response_label(size_t index) {
    std::string letters;
    size_t n = index + 1;
    while (n > 0) {
        --n;
        letters.insert(letters.begin(), static_cast<char>('A' + n % 26));
        n /= 26;
    }
    return "Response " + letters;
}

std::vector<LabeledResponse> label_responses(const std::vector<Stage1Answer>& answers) {
    std::vector<LabeledResponse> labeled;
    labeled.reserve(answers.size());
    for (size_t i = 0; i < answers.size(); ++i) {
        labeled.push_back({response_label(i), answers[i].model, answers[i].response});
    }
    return labeled;
}

std::string format_labeled_responses(const std::vector<LabeledResponse>& responses) {
    std::ostringstream ss;
    for (size_t i = 0; i < responses.size(); ++i) {
        if (i > 0) ss << "\n\n";
        ss << responses[i].label << ":\n" << responses[i].content;
    }
    return ss.str();
}

std::string build_ranking_prompt(const std::string& user_query,
                                 const std::vector<LabeledResponse>& responses) {
    std::ostringstream ss;
    ss << "You are evaluating different responses to the following question:\n\n"
       << "Question: " << user_query << "\n\n"
       << "Here are the responses from different models (anonymized):\n\n"
       << format_labeled_responses(responses) << "\n\n"
       << RANKING_INSTRUCTIONS;
    return ss.str();
}

std::string build_chairman_prompt(const std::string& user_query,
                                  const std::vector<Stage1Answer>& answers,
                                  const std::vector<Stage2Review>& reviews) {
    std::ostringstream ss;
    ss << "You are the Chairman of an LLM Council. Multiple AI models have provided "
          "responses to a user's question, and then ranked each other's responses.\n\n"
       << "Original Question: " << user_query << "\n\n"
       << "STAGE 1 - Individual Responses:\n";

    for (size_t i = 0; i < answers.size(); ++i) {
        if (i > 0) ss << "\n\n";
        const std::string& model = answers[i].model.empty()
            ? "Model " + std::to_string(i + 1) : answers[i].model;
        ss << "Model: " << model << "\nResponse: " << answers[i].response;
    }

    ss << "\n\nSTAGE 2 - Peer Rankings:\n";
    for (size_t i = 0; i < reviews.size(); ++i) {
        if (i > 0) ss << "\n\n";
        const std::string& engine = reviews[i].engine.empty()
            ? "Reviewer " + std::to_string(i + 1) : reviews[i].engine;
        const std::string& review = reviews[i].review.empty()
            ? std::string("No review content") : reviews[i].review;
        ss << "Model: " << engine << "\nRanking: " << review;
    }

    ss << "\n\n" << CHAIRMAN_INSTRUCTIONS;
    return ss.str();
}

} // namespace council
