#include <council/artifacts.hpp>
#include <council/legacy.hpp>
#include <council/llm_runner.hpp>
#include <council/mcp/server.hpp>
#include <council/prompts.hpp>
#include <council/stages.hpp>
#include <council/workspace.hpp>
#include <iostream>
#include <sstream>
#include <cassert>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace council;

// Temporary directory removed on scope exit
struct TempDir {
    fs::path path;

    TempDir() {
        static int counter = 0;
        path = fs::temp_directory_path() /
               ("council_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Scripted LLM: records the call, returns `output` or throws `failure`
struct ScriptedRunner : LlmRunner {
    std::string output = "FINAL RANKING:\n1. Response A\n2. Response B";
    std::string failure;
    std::string last_engine;
    std::string last_prompt;
    int calls = 0;

    std::string run(const std::string& engine, const std::string& prompt) override {
        ++calls;
        last_engine = engine;
        last_prompt = prompt;
        if (!failure.empty()) throw std::runtime_error(failure);
        return output;
    }
};

void put(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string get(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// The capital-of-France workspace
fs::path make_capital_workspace(const fs::path& root) {
    fs::path ws = root / ".council" / "capital";
    put(ws / "claude-answer.md", "Paris is the capital");
    put(ws / "gpt-answer.md", "Paris, France, is the capital");
    put(ws / "query.txt", "What is the capital of France?\n");
    return ws;
}

// Feed lines through a server and collect the output lines
std::vector<std::string> serve(StageRunner& stages, const std::string& input) {
    mcp::MCPServer server(&stages);
    std::istringstream in(input);
    std::ostringstream out;
    server.run(in, out);

    std::vector<std::string> lines;
    std::istringstream result(out.str());
    std::string line;
    while (std::getline(result, line)) lines.push_back(line);
    return lines;
}

void expect_throw_containing(const std::function<void()>& fn, const std::string& needle) {
    try {
        fn();
    } catch (const std::exception& e) {
        assert(contains(e.what(), needle));
        return;
    }
    assert(false && "expected exception");
}

// ═══════════════════════════════════════════════════════════════════
// Protocol
// ═══════════════════════════════════════════════════════════════════

void test_request_classification() {
    std::cout << "Testing request id classification..." << std::endl;

    std::string err;
    bool discarded = false;

    auto r = mcp::parse_request(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", err, discarded);
    assert(r && !r->is_notification() && !discarded);
    assert(*r->id == 1);

    r = mcp::parse_request(R"({"jsonrpc":"2.0","id":"abc","method":"x"})", err, discarded);
    assert(r && !r->is_notification());

    r = mcp::parse_request(R"({"jsonrpc":"2.0","method":"x"})", err, discarded);
    assert(r && r->is_notification() && !discarded);

    r = mcp::parse_request(R"({"jsonrpc":"2.0","id":null,"method":"x"})", err, discarded);
    assert(r && r->is_notification() && !discarded);

    for (const char* id : {"true", "[1]", "{\"a\":1}"}) {
        std::string line = std::string(R"({"jsonrpc":"2.0","method":"x","id":)") + id + "}";
        r = mcp::parse_request(line, err, discarded);
        assert(r && r->is_notification() && discarded);
    }

    assert(!mcp::parse_request("not json", err, discarded));
    assert(!mcp::parse_request("[1,2]", err, discarded));
    assert(!mcp::parse_request(R"({"id":1,"method":"x"})", err, discarded));
    assert(!mcp::parse_request(R"({"jsonrpc":"2.0","id":1})", err, discarded));
    assert(contains(err, "method"));

    r = mcp::parse_request(R"({"jsonrpc":"2.0","id":2,"method":"x","params":null})", err, discarded);
    assert(r && !r->params);

    std::cout << "  PASS" << std::endl;
}

void test_server_static_methods() {
    std::cout << "Testing initialize and tools/list..." << std::endl;

    TempDir tmp;
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    auto lines = serve(stages,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "\n"
        "   \n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    assert(lines.size() == 2);

    json init = json::parse(lines[0]);
    assert(init["jsonrpc"] == "2.0");
    assert(init["id"] == 1);
    assert(init["result"]["protocolVersion"] == "2024-11-05");
    assert(init["result"]["serverInfo"]["name"] == "mcp-council");
    assert(init["result"]["capabilities"].contains("tools"));
    assert(!init.contains("error"));

    json list = json::parse(lines[1]);
    const json& tools = list["result"]["tools"];
    assert(tools.size() == 2);
    assert(tools[0]["name"] == "council.peer_review");
    assert(tools[1]["name"] == "council.finalize");
    for (const auto& tool : tools) {
        assert(tool["inputSchema"]["required"] == json::array({"title"}));
        assert(tool["inputSchema"]["properties"]["engine"]["default"] == "claude");
    }
    assert(tools[0]["inputSchema"]["properties"].contains("self_model"));
    assert(!tools[1]["inputSchema"]["properties"].contains("self_model"));

    std::cout << "  PASS" << std::endl;
}

void test_server_errors() {
    std::cout << "Testing JSON-RPC error mapping..." << std::endl;

    TempDir tmp;
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    auto lines = serve(stages,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"resources/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"council.nope\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"tools/call\",\"params\":{\"arguments\":{}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"tools/call\",\"params\":{\"name\":\"council.peer_review\",\"arguments\":{}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":\"tools/call\",\"params\":{\"name\":\"council.finalize\",\"arguments\":{\"title\":\"missing\"}}}\n"
        "this is not json\n");
    assert(lines.size() == 6);

    json r1 = json::parse(lines[0]);
    assert(r1["id"] == 1 && r1["error"]["code"] == -32601);
    assert(contains(r1["error"]["message"].get<std::string>(), "resources/list"));
    assert(!r1.contains("result"));

    json r2 = json::parse(lines[1]);
    assert(r2["id"] == 2 && r2["error"]["code"] == -32601);
    assert(contains(r2["error"]["message"].get<std::string>(), "council.nope"));

    json r3 = json::parse(lines[2]);
    assert(r3["error"]["code"] == -32603);
    assert(contains(r3["error"]["message"].get<std::string>(), "Missing params"));

    json r4 = json::parse(lines[3]);
    assert(r4["error"]["code"] == -32603);
    assert(contains(r4["error"]["message"].get<std::string>(), "Missing tool name"));

    json r5 = json::parse(lines[4]);
    assert(r5["error"]["code"] == -32603);
    assert(r5["error"]["message"] == "Peer review failed: Missing required parameter: title");
    assert(!r5["error"].contains("data"));

    json r6 = json::parse(lines[5]);
    assert(r6["id"] == 6 && r6["error"]["code"] == -32603);
    assert(contains(r6["error"]["message"].get<std::string>(), "Finalize failed: Directory not found"));
    assert(contains(r6["error"]["message"].get<std::string>(), "missing"));

    assert(runner.calls == 0);

    std::cout << "  PASS" << std::endl;
}

void test_notifications_are_silent() {
    std::cout << "Testing notifications never produce output..." << std::endl;

    TempDir tmp;
    make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    const char* ids[] = {"", ",\"id\":null", ",\"id\":true", ",\"id\":[1]", ",\"id\":{\"x\":1}"};
    for (const char* id : ids) {
        std::string base = std::string("{\"jsonrpc\":\"2.0\"") + id;
        std::string input =
            base + ",\"method\":\"initialize\"}\n" +
            base + ",\"method\":\"notifications/initialized\"}\n" +
            base + ",\"method\":\"tools/call\"}\n" +
            base + ",\"method\":\"tools/call\",\"params\":{\"name\":\"nope\"}}\n" +
            base + ",\"method\":\"tools/call\",\"params\":{\"name\":\"council.finalize\",\"arguments\":{\"title\":\"capital\"}}}\n";
        assert(serve(stages, input).empty());
    }

    // A notification still runs its tool, it only stays silent
    std::string call = "{\"jsonrpc\":\"2.0\",\"method\":\"tools/call\",\"params\":"
                       "{\"name\":\"council.peer_review\",\"arguments\":{\"title\":\"capital\"}}}\n";
    assert(serve(stages, call).empty());
    assert(runner.calls == 1);
    assert(fs::exists(tmp.path / ".council" / "capital" / "peer-review-by-claude.md"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Workspace and artifacts
// ═══════════════════════════════════════════════════════════════════

void test_council_dir_discovery() {
    std::cout << "Testing .council discovery..." << std::endl;

    TempDir tmp;
    fs::path deep = tmp.path / "a" / "b" / "c";
    fs::create_directories(deep);

    // Nothing anywhere: falls back to start/.council
    assert(find_council_dir(deep) == deep / ".council");

    fs::create_directories(tmp.path / "a" / ".council" / "t");
    assert(find_council_dir(deep) == tmp.path / "a" / ".council");
    assert(resolve_workspace(deep, "t") == tmp.path / "a" / ".council" / "t");

    // The start directory wins over ancestors
    fs::create_directories(deep / ".council");
    assert(find_council_dir(deep) == deep / ".council");

    expect_throw_containing([&] { resolve_workspace(deep, "t"); }, "Directory not found");
    try {
        resolve_workspace(deep, "t");
    } catch (const std::exception& e) {
        assert(contains(e.what(), (deep / ".council" / "t").string()));
        assert(contains(e.what(), "searched from: " + deep.string()));
    }

    std::cout << "  PASS" << std::endl;
}

void test_content_extraction() {
    std::cout << "Testing content extraction order..." << std::endl;

    assert(extract_content(json{{"response", "r"}, {"content", "c"}}) == "r");
    assert(extract_content(json{{"content", "c"}}) == "c");
    assert(extract_content(json{{"response", 5}, {"content", "c"}}) == "c");
    assert(extract_content(json("plain")) == "plain");

    json other = {{"answer", "x"}};
    assert(extract_content(other) == other.dump(2));
    assert(extract_content(json(42)) == "42");

    std::cout << "  PASS" << std::endl;
}

void test_stage1_reader() {
    std::cout << "Testing Stage1 reader..." << std::endl;

    TempDir tmp;
    fs::path ws = tmp.path;

    assert(is_stage1_file("claude-answer.md"));
    assert(is_stage1_file("gpt-answer.json"));
    assert(is_stage1_file("answer.md"));
    assert(!is_stage1_file("final-answer-by-claude.md"));
    assert(!is_stage1_file("peer-review-by-claude.md"));
    assert(!is_stage1_file("query.txt"));

    put(ws / "claude-answer.md", "# Heading\nParis.");
    put(ws / "gpt-answer.json", R"({"model":"gpt-4o","response":"Paris, France","query":"Q?"})");
    put(ws / "gemini-answer.json", R"x({"content":"Paris (content)"})x");
    put(ws / "notes.txt", "ignored");

    auto answers = load_stage1_answers(ws);
    assert(answers.size() == 3);

    // Sorted by filename
    assert(answers[0].file == "claude-answer.md");
    assert(answers[0].model == "claude");
    assert(answers[0].response == "# Heading\nParis.");
    assert(answers[0].raw == json("# Heading\nParis."));

    assert(answers[1].file == "gemini-answer.json");
    assert(answers[1].model == "gemini");
    assert(answers[1].response == "Paris (content)");

    assert(answers[2].model == "gpt-4o");
    assert(answers[2].response == "Paris, France");
    assert(answers[2].raw["query"] == "Q?");

    TempDir empty;
    put(empty.path / "readme.md", "nothing here");
    expect_throw_containing([&] { load_stage1_answers(empty.path); },
                            "No Stage1 answer files found");

    std::cout << "  PASS" << std::endl;
}

void test_stage1_round_trip() {
    std::cout << "Testing Stage1 write/read round trip..." << std::endl;

    TempDir tmp;
    struct Case { std::string model; std::string response; };
    std::vector<Case> cases = {
        {"claude", "Paris"},
        {"GPT-4o", "Multi\nline \"quoted\" answer"},
        {"gemini", ""},
        {"grok", "unicode: \xC3\xA9\xE2\x82\xAC"},
    };

    for (const auto& c : cases) {
        fs::path path = tmp.path / (c.model + "-answer.json");
        put(path, json{{"model", c.model}, {"response", c.response}}.dump());
        Stage1Answer answer = read_stage1_answer(path);
        assert(answer.model == c.model);
        assert(answer.response == c.response);
    }

    std::cout << "  PASS" << std::endl;
}

void test_stage2_reader() {
    std::cout << "Testing Stage2 reader..." << std::endl;

    TempDir tmp;
    fs::path ws = tmp.path;
    put(ws / "claude-answer.md", "A");
    put(ws / "peer-review-by-gemini.md", "FINAL RANKING:\n1. Response A");
    put(ws / "peer-review-by-gpt.json", R"({"engine":"gpt-5","review":"ranked"})");
    put(ws / "peer-review-legacy.json", R"({"content":"from content"})");

    auto reviews = load_stage2_reviews(ws);
    assert(reviews.size() == 3);

    assert(reviews[0].engine == "gemini");
    assert(reviews[0].review == "FINAL RANKING:\n1. Response A");

    assert(reviews[1].engine == "gpt-5");
    assert(reviews[1].review == "ranked");

    assert(reviews[2].engine == "peer-review-legacy");
    assert(reviews[2].review == "from content");

    TempDir none;
    put(none.path / "claude-answer.md", "A");
    assert(load_stage2_reviews(none.path).empty());

    std::cout << "  PASS" << std::endl;
}

void test_user_query_extraction() {
    std::cout << "Testing user query extraction..." << std::endl;

    TempDir tmp;
    fs::path ws = tmp.path;

    assert(extract_user_query(ws) == "Unknown query");

    put(ws / "a-answer.json", R"({"user_query":"From JSON"})");
    assert(extract_user_query(ws) == "From JSON");

    put(ws / "input.txt", "  from input  \n");
    assert(extract_user_query(ws) == "from input");

    put(ws / "question.txt", "from question");
    assert(extract_user_query(ws) == "from question");

    put(ws / "query.txt", "from query\n");
    assert(extract_user_query(ws) == "from query");

    // A query file that cannot be read falls through to the next candidate
    TempDir odd;
    fs::create_directories(odd.path / "query.txt");
    put(odd.path / "user_query.txt", "real question\n");
    put(odd.path / "question.txt", "later question");
    assert(extract_user_query(odd.path) == "real question");

    expect_throw_containing([&] { read_file(odd.path / "query.txt"); }, "Failed to read file");

    // Missing directory still yields the sentinel
    assert(extract_user_query(ws / "does-not-exist") == "Unknown query");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Labels, prompts, migration
// ═══════════════════════════════════════════════════════════════════

void test_labels() {
    std::cout << "Testing response labels..." << std::endl;

    assert(response_label(0) == "Response A");
    assert(response_label(1) == "Response B");
    assert(response_label(25) == "Response Z");
    assert(response_label(26) == "Response AA");

    std::vector<Stage1Answer> answers(4);
    for (size_t i = 0; i < answers.size(); ++i) {
        answers[i].model = "m" + std::to_string(i);
        answers[i].response = "r" + std::to_string(i);
    }
    auto labeled = label_responses(answers);
    assert(labeled.size() == 4);
    assert(labeled[3].label == "Response D");
    assert(labeled[3].content == "r3");

    assert(format_labeled_responses(labeled).find("Response A:\nr0\n\nResponse B:\nr1") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_prompts() {
    std::cout << "Testing prompt templates..." << std::endl;

    std::vector<LabeledResponse> labeled = {
        {"Response A", "claude", "Paris"},
        {"Response B", "gpt", "Lyon"},
    };
    std::string ranking = build_ranking_prompt("Capital?", labeled);
    assert(contains(ranking, "Question: Capital?"));
    assert(contains(ranking, "Response A:\nParis\n\nResponse B:\nLyon"));
    assert(contains(ranking, "FINAL RANKING:"));
    assert(!contains(ranking, "claude"));

    std::vector<Stage1Answer> answers(2);
    answers[0].model = "claude"; answers[0].response = "Paris";
    answers[1].model = "gpt"; answers[1].response = "Lyon";
    std::vector<Stage2Review> reviews(2);
    reviews[0].engine = "gemini"; reviews[0].review = "A > B";
    reviews[1].engine = ""; reviews[1].review = "";

    std::string chairman = build_chairman_prompt("Capital?", answers, reviews);
    assert(contains(chairman, "Original Question: Capital?"));
    assert(contains(chairman, "Model: claude\nResponse: Paris\n\nModel: gpt\nResponse: Lyon"));
    assert(contains(chairman, "Model: gemini\nRanking: A > B"));
    assert(contains(chairman, "Model: Reviewer 2\nRanking: No review content"));
    assert(contains(chairman, "collective wisdom"));

    std::cout << "  PASS" << std::endl;
}

void test_legacy_migration() {
    std::cout << "Testing legacy review migration..." << std::endl;

    assert(legacy::legacy_engine_token("peer-review-gemini.md") == "gemini");
    assert(legacy::legacy_engine_token("peer-review-by-gemini.md") == "");
    assert(legacy::legacy_engine_token("peer-review-.md") == "");
    assert(legacy::legacy_engine_token("peer-review.md") == "");
    assert(legacy::legacy_engine_token("peer-review-gemini.json") == "");

    TempDir tmp;
    fs::path ws = tmp.path;
    put(ws / "peer-review-gemini.md", "gemini legacy");
    put(ws / "peer-review.md", "bare legacy");
    put(ws / "peer-review-gpt.md", "gpt legacy");
    put(ws / "peer-review-by-gpt.md", "gpt canonical");

    auto done = legacy::migrate_reviews(ws, "claude");
    assert(done.size() == 2);

    assert(get(ws / "peer-review-by-gemini.md") == "gemini legacy");
    assert(!fs::exists(ws / "peer-review-gemini.md"));
    assert(get(ws / "peer-review-by-claude.md") == "bare legacy");
    assert(!fs::exists(ws / "peer-review.md"));

    // Existing canonical file is never overwritten
    assert(get(ws / "peer-review-by-gpt.md") == "gpt canonical");
    assert(get(ws / "peer-review-gpt.md") == "gpt legacy");

    // Idempotent
    assert(legacy::migrate_reviews(ws, "claude").empty());

    assert(!legacy::move_if_absent(ws / "missing.md", ws / "target.md"));
    assert(!fs::exists(ws / "target.md"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Stages
// ═══════════════════════════════════════════════════════════════════

void test_engine_normalization() {
    std::cout << "Testing engine normalization..." << std::endl;

    assert(normalize_engine("  gemini ") == "gemini");
    assert(normalize_engine("   ") == "claude");
    assert(normalize_engine("") == "claude");

    assert(engine_file_token("gpt-4o_mini") == "gpt-4o_mini");
    assert(engine_file_token("gpt 4/o") == "gpt-4-o");
    // Untrimmed substitution is what names the file
    assert(engine_file_token("@gemini!") == "-gemini-");
    assert(engine_file_token("@@@") == "claude");
    assert(engine_file_token("---") == "claude");

    assert(preview_text("short", 200) == "short");
    assert(preview_text(std::string(250, 'x'), 200) == std::string(200, 'x') + "...");
    // 199 ASCII bytes + a 2-byte character straddling the limit
    std::string utf = std::string(199, 'x') + "\xC3\xA9" + "tail";
    assert(preview_text(utf, 200) == std::string(199, 'x') + "...");

    std::cout << "  PASS" << std::endl;
}

void test_peer_review_capital_example() {
    std::cout << "Testing peer review over tools/call..." << std::endl;

    TempDir tmp;
    fs::path ws = make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    runner.output = "Both correct.\n\nFINAL RANKING:\n1. Response B\n2. Response A";
    StageRunner stages(tmp.path, runner);

    auto lines = serve(stages,
        "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/call\",\"params\":"
        "{\"name\":\"council.peer_review\",\"arguments\":{\"title\":\"capital\",\"engine\":\"claude\"}}}\n");
    assert(lines.size() == 1);

    json response = json::parse(lines[0]);
    assert(response["id"] == 7);
    assert(!response.contains("error"));
    assert(response["result"]["isError"] == false);
    json payload = json::parse(response["result"]["content"][0]["text"].get<std::string>());
    assert(payload["success"] == true);

    fs::path review = ws / "peer-review-by-claude.md";
    assert(payload["review_markdown_file"].get<std::string>() == review.string());
    assert(payload["summary"] == "Peer review completed for 2 answers using claude");
    assert(payload["review_preview"].get<std::string>() == runner.output);

    std::string markdown = get(review);
    assert(markdown == payload["markdown"].get<std::string>());
    assert(markdown.find("# Peer Review\n- title: capital\n- engine: claude\n- answers reviewed: 2\n") == 0);
    assert(contains(markdown, "## User Question\nWhat is the capital of France?"));
    assert(contains(markdown, "Response A:\nParis is the capital"));
    assert(contains(markdown, "Response B:\nParis, France, is the capital"));
    assert(contains(markdown, "## Review\n" + runner.output));

    assert(runner.last_engine == "claude");
    assert(contains(runner.last_prompt, "Question: What is the capital of France?"));
    assert(contains(runner.last_prompt, "Response A:\nParis is the capital"));
    assert(contains(runner.last_prompt, "Response B:\nParis, France, is the capital"));

    std::cout << "  PASS" << std::endl;
}

void test_peer_review_self_model_and_rerun() {
    std::cout << "Testing self_model exclusion and rerun..." << std::endl;

    TempDir tmp;
    fs::path ws = tmp.path / ".council" / "t";
    put(ws / "a-answer.md", "answer a");
    put(ws / "b-answer.json", R"({"model":"Claude","response":"answer b"})");
    put(ws / "c-answer.md", "answer c");
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    PeerReviewOptions options;
    options.title = "t";
    options.engine = " gemini ";
    options.self_model = "claude";

    PeerReviewResult first = stages.peer_review(options);
    assert(first.answer_count == 2);
    assert(first.engine == "gemini");
    assert(contains(runner.last_prompt, "Response A:\nanswer a\n\nResponse B:\nanswer c"));
    assert(!contains(runner.last_prompt, "Response C:\n"));
    assert(!contains(runner.last_prompt, "answer b"));

    PeerReviewResult second = stages.peer_review(options);
    assert(first.review_file == second.review_file);
    assert(first.review_file == ws / "peer-review-by-gemini.md");

    size_t reviews = 0;
    for (const auto& path : list_files(ws)) {
        if (is_stage2_file(path.filename().string())) ++reviews;
    }
    assert(reviews == 1);

    // Excluding the only answer leaves nothing to review
    TempDir solo;
    put(solo.path / ".council" / "s" / "claude-answer.md", "only");
    StageRunner solo_stages(solo.path, runner);
    PeerReviewOptions solo_options;
    solo_options.title = "s";
    solo_options.self_model = "CLAUDE";
    expect_throw_containing([&] { solo_stages.peer_review(solo_options); },
                            "after applying self_model exclusion");

    std::cout << "  PASS" << std::endl;
}

void test_peer_review_migrates_and_sanitizes() {
    std::cout << "Testing peer review migration and engine token..." << std::endl;

    TempDir tmp;
    fs::path ws = make_capital_workspace(tmp.path);
    put(ws / "peer-review-gemini.md", "old gemini review");
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    PeerReviewOptions options;
    options.title = "capital";
    options.engine = "gpt 5";
    PeerReviewResult result = stages.peer_review(options);

    assert(result.review_file == ws / "peer-review-by-gpt-5.md");
    assert(runner.last_engine == "gpt 5");
    assert(contains(result.markdown, "- engine: gpt 5\n"));
    assert(get(ws / "peer-review-by-gemini.md") == "old gemini review");
    assert(!fs::exists(ws / "peer-review-gemini.md"));

    std::cout << "  PASS" << std::endl;
}

void test_peer_review_failures() {
    std::cout << "Testing peer review failures..." << std::endl;

    TempDir tmp;
    fs::path ws = make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    runner.failure = "claude exited with status 2";
    StageRunner stages(tmp.path, runner);

    PeerReviewOptions options;
    options.title = "capital";
    expect_throw_containing([&] { stages.peer_review(options); },
                            "Failed to run LLM CLI for peer review: claude exited with status 2");
    assert(!fs::exists(ws / "peer-review-by-claude.md"));

    TempDir empty;
    fs::create_directories(empty.path / ".council" / "e");
    StageRunner empty_stages(empty.path, runner);
    PeerReviewOptions empty_options;
    empty_options.title = "e";
    expect_throw_containing([&] { empty_stages.peer_review(empty_options); },
                            "No Stage1 answer files found");

    std::cout << "  PASS" << std::endl;
}

void test_finalize() {
    std::cout << "Testing finalize..." << std::endl;

    TempDir tmp;
    fs::path ws = make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    StageRunner stages(tmp.path, runner);

    FinalizeOptions options;
    options.title = "capital";

    // Stage2 must exist first
    expect_throw_containing([&] { stages.finalize(options); }, "Stage2");
    assert(runner.calls == 0);
    assert(!fs::exists(ws / "final-answer-by-claude.md"));

    put(ws / "peer-review-by-gemini.md", "FINAL RANKING:\n1. Response A\n2. Response B");
    runner.output = std::string(400, 'P');
    FinalizeResult result = stages.finalize(options);

    assert(result.final_file == ws / "final-answer-by-claude.md");
    assert(result.stage1_count == 2);
    assert(result.stage2_count == 1);
    assert(result.summary == "Final answer generated using claude based on 2 responses and 1 reviews");
    assert(result.preview == std::string(300, 'P') + "...");

    std::string markdown = get(result.final_file);
    assert(markdown == result.markdown);
    assert(markdown.find("# Final Answer\n- title: capital\n- engine: claude\n"
                         "- stage1 responses: 2\n- stage2 reviews: 1\n\n"
                         "## User Question\nWhat is the capital of France?\n\n"
                         "## Final Answer\n") == 0);

    assert(contains(runner.last_prompt, "Model: claude\nResponse: Paris is the capital"));
    assert(contains(runner.last_prompt, "Model: gpt\nResponse: Paris, France, is the capital"));
    assert(contains(runner.last_prompt, "Model: gemini\nRanking: FINAL RANKING:"));

    runner.failure = "boom";
    options.engine = "grok";
    expect_throw_containing([&] { stages.finalize(options); },
                            "Failed to run LLM CLI for finalization: boom");
    assert(!fs::exists(ws / "final-answer-by-grok.md"));

    std::cout << "  PASS" << std::endl;
}

void test_full_pipeline_over_protocol() {
    std::cout << "Testing peer review then finalize over stdio..." << std::endl;

    TempDir tmp;
    fs::path ws = make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    runner.output = "Paris.";
    StageRunner stages(tmp.path, runner);

    auto lines = serve(stages,
        "{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"method\":\"tools/call\",\"params\":"
        "{\"name\":\"council.finalize\",\"arguments\":{\"title\":\"capital\"}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"b\",\"method\":\"tools/call\",\"params\":"
        "{\"name\":\"council.peer_review\",\"arguments\":{\"title\":\"capital\",\"engine\":\"gemini\"}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"c\",\"method\":\"tools/call\",\"params\":"
        "{\"name\":\"council.finalize\",\"arguments\":{\"title\":\"capital\",\"engine\":\"claude\"}}}\n");
    assert(lines.size() == 3);

    json first = json::parse(lines[0]);
    assert(first["id"] == "a");
    assert(first["error"]["code"] == -32603);
    assert(contains(first["error"]["message"].get<std::string>(), "Stage2"));

    json second = json::parse(lines[1]);
    assert(second["id"] == "b" && second.contains("result"));

    json third = json::parse(lines[2]);
    json payload = json::parse(third["result"]["content"][0]["text"].get<std::string>());
    assert(payload["success"] == true);
    assert(payload["final_markdown_file"].get<std::string>() == (ws / "final-answer-by-claude.md").string());
    assert(payload["final_answer_preview"] == "Paris.");
    assert(fs::exists(ws / "final-answer-by-claude.md"));

    std::cout << "  PASS" << std::endl;
}

void test_invalid_utf8_output() {
    std::cout << "Testing invalid UTF-8 in LLM output..." << std::endl;

    TempDir tmp;
    make_capital_workspace(tmp.path);
    ScriptedRunner runner;
    runner.output = "bad \xFF\xFE bytes";
    StageRunner stages(tmp.path, runner);

    auto lines = serve(stages,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":"
        "{\"name\":\"council.peer_review\",\"arguments\":{\"title\":\"capital\"}}}\n");
    assert(lines.size() == 1);
    json response = json::parse(lines[0]);
    assert(response.contains("result"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// CLI runner
// ═══════════════════════════════════════════════════════════════════

void test_cli_runner() {
    std::cout << "Testing CLI runner..." << std::endl;

    assert(CliRunner::env_var_for("gpt-4o") == "COUNCIL_CMD_GPT_4O");
    assert(split_command("  gemini  --yolo ") == std::vector<std::string>({"gemini", "--yolo"}));

    CliRunner defaults;
    assert(defaults.command_for("claude") == std::vector<std::string>({"claude", "-p"}));
    assert(defaults.command_for("sonnet") ==
           std::vector<std::string>({"claude", "--model", "sonnet", "-p"}));
    assert(defaults.command_for("codex") == std::vector<std::string>({"codex", "exec", "-"}));

    setenv("COUNCIL_CMD_ECHOER", "cat", 1);
    assert(defaults.command_for("echoer") == std::vector<std::string>({"cat"}));
    unsetenv("COUNCIL_CMD_ECHOER");

    CliRunner::CommandTable commands = {
        {"echo", {"cat"}},
        {"fail", {"sh", "-c", "echo oops >&2; exit 3"}},
        {"missing", {"/nonexistent/council-engine"}},
        {"early", {"true"}},
    };
    CliRunner runner(commands);

    assert(runner.run("echo", "hello council\n\n") == "hello council");

    // Large prompt must not deadlock on the pipes
    std::string big(1 << 20, 'z');
    assert(runner.run("echo", big) == big);

    expect_throw_containing([&] { runner.run("fail", "x"); }, "exited with status 3: oops");
    expect_throw_containing([&] { runner.run("missing", "x"); }, "exited with status 127");

    // Engine that ignores stdin
    assert(runner.run("early", big).empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    // Same as council_mcp: engine CLIs may exit before reading the whole prompt
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "=== Council C++ Tests ===" << std::endl;
    std::cout << std::endl;

    test_request_classification();
    test_server_static_methods();
    test_server_errors();
    test_notifications_are_silent();

    test_council_dir_discovery();
    test_content_extraction();
    test_stage1_reader();
    test_stage1_round_trip();
    test_stage2_reader();
    test_user_query_extraction();

    test_labels();
    test_prompts();
    test_legacy_migration();

    test_engine_normalization();
    test_peer_review_capital_example();
    test_peer_review_self_model_and_rerun();
    test_peer_review_migrates_and_sanitizes();
    test_peer_review_failures();
    test_finalize();
    test_full_pipeline_over_protocol();
    test_invalid_utf8_output();

    std::cout << std::endl;
    std::cout << "=== CLI Runner Tests ===" << std::endl;
    test_cli_runner();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
