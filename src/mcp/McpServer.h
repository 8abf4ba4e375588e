#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

class ToolRegistry;

/**
 * @brief Line-delimited JSON-RPC 2.0 server over a stream pair (stdin/stdout).
 *
 * Handles initialize, tools/list and tools/call. notifications/* get no reply,
 * unparseable lines are skipped, anything else is answered with -32601.
 * Only protocol messages are written to the output stream.
 */
class McpServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";
    static constexpr const char* kServerName = "cortex-act";

    McpServer(ToolRegistry& tools, const std::string& version);

    // Blocks until the input stream ends.
    void run(std::istream& in, std::ostream& out);

    // nullopt when the message needs no response
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& msg);
    std::optional<std::string> handleLine(const std::string& line);

private:
    ToolRegistry& tools;
    std::string version;

    nlohmann::json initialize(const nlohmann::json& id) const;
    nlohmann::json listTools(const nlohmann::json& id) const;
    nlohmann::json callTool(const nlohmann::json& id, const nlohmann::json& params);
};
