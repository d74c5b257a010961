#pragma once
// Prompts: ranking (stage 2) and chairman (stage 3) prompt templates

#include <council/artifacts.hpp>
#include <string>
#include <vector>

namespace council {

// A stage-1 answer under its anonymized label
struct LabeledResponse {
    std::string label;      // "Response A", "Response B", ...
    std::string model;
    std::string content;
};

// "Response A" for 0, ..., "Response Z" for 25, "Response AA" for 26
std::string response_label(size_t index);

// Labels are consecutive from "Response A" in the order given
std::vector<LabeledResponse> label_responses(const std::vector<Stage1Answer>& answers);

// "Response A:\n<content>" blocks joined by blank lines
std::string format_labeled_responses(const std::vector<LabeledResponse>& responses);

std::string build_ranking_prompt(const std::string& user_query,
                                 const std::vector<LabeledResponse>& responses);

std::string build_chairman_prompt(const std::string& user_query,
                                  const std::vector<Stage1Answer>& answers,
                                  const std::vector<Stage2Review>& reviews);

} // namespace council
