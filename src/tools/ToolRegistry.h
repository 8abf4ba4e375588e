#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Owns every tool and dispatches calls by name.
 *
 * Tools are listed in registration order.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /** Replaces an existing tool of the same name */
    void registerTool(std::unique_ptr<ITool> tool);

    /** nullptr when no tool has that name */
    ITool* getTool(const std::string& name);

    /**
     * @brief MCP tools/list entries.
     *
     * [
     *   {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * Unknown names yield {"error": "Tool not found: xxx"}; an exception
     * escaping a tool becomes {"error": "Tool execution failed: ..."}.
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
};
