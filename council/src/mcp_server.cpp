// Council MCP Server
// Model Context Protocol server driving the council deliberation stages
//
// Reads JSON-RPC requests from stdin, one per line, and answers on stdout.
// Diagnostics go to stderr.
//
// Usage:
//   council_mcp [options]
//
// Options:
//   --dir PATH     Directory where .council discovery starts (default: cwd)
//   --version      Print version and exit
//   --help         Show this help message
//
// Environment:
//   COUNCIL_DIR            Same as --dir (the flag wins)
//   COUNCIL_CMD_<ENGINE>   Command line used for ENGINE, e.g.
//                          COUNCIL_CMD_GEMINI="gemini --yolo"

#include <council/llm_runner.hpp>
#include <council/mcp/server.hpp>
#include <council/stages.hpp>
#include <council/version.hpp>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --dir PATH     Directory where .council discovery starts (default: cwd)\n"
              << "  --version      Print version and exit\n"
              << "  --help         Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  COUNCIL_DIR            Same as --dir\n"
              << "  COUNCIL_CMD_<ENGINE>   Command line for ENGINE (e.g. COUNCIL_CMD_GEMINI=\"gemini\")\n";
}

int main(int argc, char* argv[]) {
    std::string start_dir;

    // Honor COUNCIL_DIR env var
    if (const char* env_dir = std::getenv("COUNCIL_DIR")) {
        start_dir = env_dir;
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            start_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << COUNCIL_SERVER_NAME << " " << COUNCIL_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::error_code ec;
    std::filesystem::path start = start_dir.empty()
        ? std::filesystem::current_path(ec)
        : std::filesystem::path(start_dir);
    if (ec) {
        std::cerr << "[council_mcp] Error: cannot determine current directory: "
                  << ec.message() << "\n";
        return 1;
    }

    // Engine CLIs may exit before reading the whole prompt
    std::signal(SIGPIPE, SIG_IGN);

    council::CliRunner runner;
    council::StageRunner stages(start, runner);
    council::mcp::MCPServer server(&stages);

    std::cerr << "[council_mcp] " << COUNCIL_SERVER_NAME << " " << COUNCIL_VERSION
              << " listening on stdin (council root search from " << start.string() << ")\n";

    server.run(std::cin, std::cout);

    std::cerr << "[council_mcp] Shutdown complete\n";
    return 0;
}
