#pragma once
// LLM Runner: invoke a named LLM command-line tool
//
// The stages only see LlmRunner: one call, engine name and prompt in,
// captured text out. Any failure is thrown as std::runtime_error.
//
// CliRunner resolves the engine to a command line (explicit override,
// then COUNCIL_CMD_<ENGINE>, then a built-in table), feeds the prompt on
// stdin and captures stdout. No timeout, no retry. The process must
// ignore SIGPIPE (council_mcp does) since an engine may exit before
// reading the whole prompt.

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace council {

class LlmRunner {
public:
    virtual ~LlmRunner() = default;
    virtual std::string run(const std::string& engine, const std::string& prompt) = 0;
};

class CliRunner : public LlmRunner {
public:
    using CommandTable = std::unordered_map<std::string, std::vector<std::string>>;

    static constexpr size_t MAX_STDERR_EXCERPT = 2000;

    CliRunner() = default;
    explicit CliRunner(CommandTable overrides) : overrides_(std::move(overrides)) {}

    std::string run(const std::string& engine, const std::string& prompt) override;

    // argv used for `engine`
    std::vector<std::string> command_for(const std::string& engine) const;

    // COUNCIL_CMD_<ENGINE>: upper-cased, non-alphanumerics mapped to '_'
    static std::string env_var_for(const std::string& engine);

private:
    CommandTable overrides_;
};

// Split a command string on whitespace (no quoting)
std::vector<std::string> split_command(const std::string& command);

} // namespace council
