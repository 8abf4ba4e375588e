#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Structure-aware patchers for non-code files.
 *
 * Every patcher reads the whole file, edits it in memory and commits through
 * AtomicFile::write. Failures throw CortexError and leave the file untouched.
 * Each returns a one-line confirmation.
 */
namespace FilePatchers {
    enum class Action { Set, Delete };

    /** KEY=value lines. Set replaces the first matching line or appends; Delete drops every match. */
    std::string patchEnv(const std::string& file, Action action, const std::string& key, const std::string& value);

    /**
     * Replaces the body under the heading `#`*level + " " + section, up to the
     * next heading of the same or higher level. Delete leaves the body empty.
     */
    std::string patchDocs(const std::string& file, Action action, const std::string& section,
                          const std::string& content, int headingLevel);

    /** JSON only. dotPath "a.b.c"; every key before the last must already exist. */
    std::string patchJsonConfig(const std::string& file, Action action, const std::string& dotPath,
                                const nlohmann::json& value);

    /** Same dot-path rules as patchJsonConfig; JSON values become YAML scalars, sequences and maps. */
    std::string patchYamlConfig(const std::string& file, Action action, const std::string& dotPath,
                                const nlohmann::json& value);

    /** Same dot-path rules; JSON null is written as the string "null" since TOML has no null. */
    std::string patchTomlConfig(const std::string& file, Action action, const std::string& dotPath,
                                const nlohmann::json& value);

    /** Dispatches on extension: .json, .yaml/.yml, .toml. Anything else is rejected. */
    std::string patchConfig(const std::string& file, Action action, const std::string& dotPath,
                            const nlohmann::json& value);
}
