#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Interface every MCP tool implements.
 *
 * Tools are thin adapters: validate JSON arguments, call one engine, and map
 * the outcome to a result object. They never let an exception escape.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /** Unique name advertised in tools/list */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    /** JSON Schema of the arguments object */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Runs the tool.
     *
     * Success:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     *
     * Failure:
     * {
     *   "error": "<tool> failed: ..."
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;

protected:
    static nlohmann::json textResult(const std::string& text) {
        return {{"content", {{{"type", "text"}, {"text", text}}}}};
    }

    static nlohmann::json errorResult(const std::string& message) {
        return {{"error", message}};
    }
};
