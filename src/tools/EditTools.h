#pragma once
#include "ITool.h"
#include <functional>
#include <memory>

class AstEditor;
class IRepairOracle;

/**
 * @brief edit_ast: replace or delete named symbols in one source file.
 *
 * The oracle factory receives the per-call endpoint override ("" when the
 * caller gave none) and may return nullptr when repair is disabled.
 */
class EditAstTool : public ITool {
public:
    using OracleFactory = std::function<std::shared_ptr<IRepairOracle>(const std::string& endpointOverride)>;

    EditAstTool(const AstEditor& editor, OracleFactory oracleFor);

    std::string getName() const override { return "edit_ast"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const AstEditor& editor;
    OracleFactory oracleFor;
};

/**
 * @brief patch_file: .env keys, Markdown sections, JSON config dot-paths.
 */
class PatchFileTool : public ITool {
public:
    PatchFileTool() = default;

    std::string getName() const override { return "patch_file"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};
