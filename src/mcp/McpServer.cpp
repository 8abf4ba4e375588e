#include "mcp/McpServer.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include <istream>
#include <ostream>

McpServer::McpServer(ToolRegistry& tools, const std::string& version)
    : tools(tools), version(version) {}

nlohmann::json McpServer::initialize(const nlohmann::json& id) const {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", version}}}
        }}
    };
}

nlohmann::json McpServer::listTools(const nlohmann::json& id) const {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", {{"tools", tools.listToolSchemas()}}}
    };
}

nlohmann::json McpServer::callTool(const nlohmann::json& id, const nlohmann::json& params) {
    std::string name = (params.contains("name") && params["name"].is_string()) ? params["name"].get<std::string>() : "";
    nlohmann::json args = (params.contains("arguments") && params["arguments"].is_object())
                              ? params["arguments"]
                              : nlohmann::json::object();

    Logger::getInstance().debug("tools/call " + name + " " + args.dump());
    nlohmann::json outcome = tools.executeTool(name, args);

    nlohmann::json result;
    if (outcome.contains("error")) {
        std::string message = outcome["error"].is_string() ? outcome["error"].get<std::string>() : outcome["error"].dump();
        Logger::getInstance().warn(message);
        result["content"] = nlohmann::json::array({{{"type", "text"}, {"text", message}}});
        result["isError"] = true;
    } else {
        result["content"] = outcome.value("content", nlohmann::json::array());
        result["isError"] = false;
    }
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

std::optional<nlohmann::json> McpServer::handleMessage(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        return std::nullopt;
    }
    std::string method = (msg.contains("method") && msg["method"].is_string()) ? msg["method"].get<std::string>() : "";
    nlohmann::json id = msg.contains("id") ? msg["id"] : nlohmann::json(nullptr);
    nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    if (method.rfind("notifications/", 0) == 0) {
        return std::nullopt;
    }
    if (method == "initialize") {
        return initialize(id);
    }
    if (method == "tools/list") {
        return listTools(id);
    }
    if (method == "tools/call") {
        return callTool(id, params);
    }
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", -32601}, {"message", "Method not found: " + method}}}
    };
}

std::optional<std::string> McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().debug(std::string("Skipping unparseable line: ") + e.what());
        return std::nullopt;
    }
    auto response = handleMessage(msg);
    if (!response) {
        return std::nullopt;
    }
    return response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void McpServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info(std::string(kServerName) + " " + version + " listening on stdio");
    std::string line;
    while (std::getline(in, line)) {
        auto reply = handleLine(line);
        if (reply) {
            out << *reply << "\n";
            out.flush();
        }
    }
    Logger::getInstance().info("stdin closed, shutting down");
}
