#pragma once

#define COUNCIL_VERSION "0.1.0"
#define COUNCIL_SERVER_NAME "mcp-council"
#define COUNCIL_MCP_PROTOCOL_VERSION "2024-11-05"
