#pragma once
// MCP Server: JSON-RPC 2.0 over line-delimited stdio
//
// Reads one line at a time until end of stream and handles it fully
// before reading the next. Blank lines are skipped; lines that are not a
// JSON-RPC request are logged and dropped without a response.

#include "handler.hpp"
#include "../strings.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace council::mcp {

class MCPServer {
public:
    explicit MCPServer(StageRunner* stages) : handler_(stages) {}

    void run(std::istream& in, std::ostream& out) {
        std::string line;
        while (std::getline(in, line)) {
            handle_line(line, out);
        }
    }

    // Returns true when a response line was written
    bool handle_line(const std::string& raw, std::ostream& out) {
        std::string line = trim(raw);
        if (line.empty()) return false;

        std::string error_msg;
        bool discarded_id = false;
        auto request = parse_request(line, error_msg, discarded_id);
        if (!request) {
            std::cerr << "[council_mcp] Error handling request (ignored): " << error_msg << "\n";
            return false;
        }
        if (discarded_id) {
            std::cerr << "[council_mcp] Invalid JSON-RPC id (ignored, treated as notification)\n";
        }

        auto response = handler_.handle(*request);
        if (!response) return false;

        out << serialize(*response) << "\n";
        out.flush();
        return true;
    }

    Handler& handler() { return handler_; }

private:
    Handler handler_;
};

} // namespace council::mcp
