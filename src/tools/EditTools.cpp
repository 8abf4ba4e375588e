#include "EditTools.h"
#include "core/Errors.h"
#include "core/RepairClient.h"
#include "edit/AstEditor.h"
#include "edit/FilePatchers.h"

EditAstTool::EditAstTool(const AstEditor& editor, OracleFactory oracleFor)
    : editor(editor), oracleFor(std::move(oracleFor)) {}

std::string EditAstTool::getDescription() const {
    return "Replace or delete a named symbol (function/class/struct/...) in a source file. "
           "Targets by name ('login' or 'function:login'), not line number. All edits apply or none do. "
           "If the result no longer parses, a repair model is asked once to fix it before anything is written.";
}

nlohmann::json EditAstTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"file", {{"type", "string"}, {"description", "Absolute path to the source file."}}},
            {"edits", {
                {"type", "array"},
                {"description", "Edits to apply; bottom-up order is enforced automatically."},
                {"items", {
                    {"type", "object"},
                    {"properties", {
                        {"target", {{"type", "string"}, {"description", "Symbol name or 'kind:name'."}}},
                        {"action", {{"type", "string"}, {"enum", {"replace", "delete"}},
                                    {"description", "replace: swap the entire symbol. delete: remove it."}}},
                        {"code", {{"type", "string"}, {"description", "Full replacement source (replace only)."}}}
                    }},
                    {"required", {"target", "action"}}
                }}
            }},
            {"repair_endpoint", {{"type", "string"},
                                 {"description", "Repair model endpoint override (chat-completions URL)."}}},
            {"llm_url", {{"type", "string"}, {"description", "Alias of repair_endpoint."}}}
        }},
        {"required", {"file", "edits"}}
    };
}

nlohmann::json EditAstTool::execute(const nlohmann::json& args) {
    if (!args.contains("file") || !args["file"].is_string()) {
        return errorResult("'file' required");
    }
    if (!args.contains("edits") || !args["edits"].is_array()) {
        return errorResult("'edits' array required");
    }
    std::string file = args["file"].get<std::string>();

    std::vector<Edit> edits;
    for (const auto& item : args["edits"]) {
        if (!item.is_object()) {
            return errorResult("Each edit must be an object");
        }
        Edit edit;
        edit.target = item.value("target", "");
        if (edit.target.empty()) {
            return errorResult("Each edit must have a 'target'");
        }
        std::string actionLabel = item.value("action", "replace");
        auto action = editActionFromLabel(actionLabel);
        if (!action) {
            return errorResult("edit_ast failed: unknown action '" + actionLabel + "' (use replace | delete)");
        }
        edit.action = *action;
        edit.code = item.value("code", "");
        edits.push_back(std::move(edit));
    }

    std::string endpoint = args.value("repair_endpoint", "");
    if (endpoint.empty()) {
        endpoint = args.value("llm_url", "");
    }

    try {
        std::shared_ptr<IRepairOracle> oracle = oracleFor ? oracleFor(endpoint) : nullptr;
        EditResult result = editor.apply(file, edits, oracle.get());
        nlohmann::json body = {
            {"status", "ok"},
            {"message", result.message},
            {"preview", result.preview}
        };
        return textResult(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const CortexError& e) {
        return errorResult(std::string("edit_ast failed: ") + e.what());
    }
}

std::string PatchFileTool::getDescription() const {
    return "Surgically patch a JSON, YAML or TOML config (dot-path), a Markdown document (section heading) or a .env file (key) "
           "without rewriting the whole file. type=config: target='dependencies.serde'. "
           "type=docs: target='Installation'. type=env: target='API_KEY'.";
}

nlohmann::json PatchFileTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"file", {{"type", "string"}, {"description", "Absolute path to the target file."}}},
            {"type", {{"type", "string"}, {"enum", {"config", "docs", "env"}}, {"description", "File type to patch."}}},
            {"action", {{"type", "string"}, {"enum", {"set", "delete"}},
                        {"description", "set: upsert value. delete: remove key or section body."}}},
            {"target", {{"type", "string"},
                        {"description", "Dot-path for config, heading text for docs, key name for env."}}},
            {"value", {{"description", "New value (required for set)."}}},
            {"heading_level", {{"type", "integer"}, {"description", "Heading level for docs (1-6)."}, {"default", 2}}}
        }},
        {"required", {"file", "type", "action", "target"}}
    };
}

nlohmann::json PatchFileTool::execute(const nlohmann::json& args) {
    if (!args.contains("file") || !args["file"].is_string()) {
        return errorResult("'file' required");
    }
    if (!args.contains("type") || !args["type"].is_string()) {
        return errorResult("'type' required (config|docs|env)");
    }
    if (!args.contains("target") || !args["target"].is_string()) {
        return errorResult("'target' required");
    }

    std::string file = args["file"].get<std::string>();
    std::string type = args["type"].get<std::string>();
    std::string target = args["target"].get<std::string>();
    std::string actionLabel = args.value("action", "set");

    FilePatchers::Action action;
    if (actionLabel == "set") {
        action = FilePatchers::Action::Set;
    } else if (actionLabel == "delete") {
        action = FilePatchers::Action::Delete;
    } else {
        return errorResult("patch_file failed: unknown action '" + actionLabel + "' (use set | delete)");
    }

    bool hasValue = args.contains("value") && !args["value"].is_null();
    if (action == FilePatchers::Action::Set && !hasValue) {
        return errorResult("'value' required for 'set' action");
    }

    try {
        if (type == "env") {
            std::string value;
            if (hasValue) {
                value = args["value"].is_string() ? args["value"].get<std::string>() : args["value"].dump();
            }
            return textResult(FilePatchers::patchEnv(file, action, target, value));
        }
        if (type == "config") {
            nlohmann::json value = hasValue ? args["value"] : nlohmann::json();
            return textResult(FilePatchers::patchConfig(file, action, target, value));
        }
        if (type == "docs") {
            std::string content;
            if (action == FilePatchers::Action::Set) {
                if (!args["value"].is_string()) {
                    return errorResult("'value' string required for docs 'set' action");
                }
                content = args["value"].get<std::string>();
            }
            int level = args.value("heading_level", 2);
            return textResult(FilePatchers::patchDocs(file, action, target, content, level));
        }
    } catch (const CortexError& e) {
        return errorResult("patch_file(" + type + ") failed: " + e.what());
    }
    return errorResult("Unknown patch type: '" + type + "'. Use: config | docs | env");
}
