#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "core/ConfigManager.h"
#include "core/RepairClient.h"
#include "analysis/SymbolManager.h"
#include "analysis/SyntaxValidator.h"
#include "analysis/providers/RegexSymbolProvider.h"
#include "analysis/providers/TreeSitterSymbolProvider.h"
#include "edit/AstEditor.h"
#include "jobs/JobManager.h"
#include "mcp/McpServer.h"
#include "tools/ToolRegistry.h"
#include "tools/EditTools.h"
#include "tools/JobTools.h"
#include "utils/Logger.h"

#ifndef CORTEX_ACT_VERSION
#define CORTEX_ACT_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace {

// argv[1], else <data_dir>/config.json when present, else built-in defaults
Config loadConfig(int argc, char* argv[]) {
    if (argc > 1) {
        return Config::load(argv[1]);
    }
    fs::path implicit = fs::u8path(Config::defaultDataDir()) / "config.json";
    std::error_code ec;
    if (fs::exists(implicit, ec)) {
        return Config::load(implicit.u8string());
    }
    return Config::defaults();
}

void registerConfiguredGrammars(TreeSitterSymbolProvider& provider, const Config& cfg) {
    for (const auto& lang : cfg.symbols.treeSitterLanguages) {
        TreeSitterSymbolProvider::NodeKindTable kinds;
        for (const auto& [nodeType, label] : lang.nodeKinds) {
            auto kind = symbolKindFromLabel(label);
            if (!kind) {
                Logger::getInstance().warn("Grammar " + lang.name + ": unknown symbol kind '" + label +
                                           "' for node type " + nodeType);
                continue;
            }
            kinds[nodeType] = *kind;
        }
        if (provider.registerLanguageFromLibrary(lang.name, lang.extensions, lang.libraryPath, lang.symbol, kinds)) {
            Logger::getInstance().info("Loaded tree-sitter grammar " + lang.name + " from " + lang.libraryPath);
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // A vanished client must not kill the process mid-write
    std::signal(SIGPIPE, SIG_IGN);

    Config cfg;
    try {
        cfg = loadConfig(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[cortex-act] " << e.what() << std::endl;
        return 1;
    }

    std::error_code ec;
    fs::create_directories(fs::u8path(cfg.dataDir), ec);
    Logger& logger = Logger::getInstance();
    if (ec) {
        logger.warn("Cannot create data dir " + cfg.dataDir + ": " + ec.message());
    } else {
        logger.setLogFile((fs::u8path(cfg.dataDir) / "cortex-act.log").u8string());
    }
    logger.setDebugEnabled(cfg.enableDebug);

    // Symbols: parser-backed first, heuristic for everything else
    auto treeSitter = std::make_unique<TreeSitterSymbolProvider>();
    registerConfiguredGrammars(*treeSitter, cfg);
    const TreeSitterSymbolProvider* grammars = treeSitter.get();

    SymbolManager symbols;
    symbols.setFallbackOnEmpty(cfg.symbols.fallbackOnEmpty);
    symbols.registerProvider(std::move(treeSitter));
    symbols.registerProvider(std::make_unique<RegexSymbolProvider>());

    SyntaxValidator validator(grammars);
    AstEditor editor(symbols, validator);

    std::shared_ptr<IRepairOracle> defaultOracle;
    if (cfg.repair.enabled) {
        try {
            defaultOracle = std::make_shared<LLMRepairClient>(cfg.repair.endpoint, cfg.repair.timeoutSecs,
                                                              cfg.repair.apiKey, cfg.repair.model);
        } catch (const std::exception& e) {
            logger.warn(std::string("Auto-heal disabled: ") + e.what());
        }
    }
    const Config::Repair repairCfg = cfg.repair;
    auto oracleFor = [defaultOracle, repairCfg](const std::string& endpointOverride) -> std::shared_ptr<IRepairOracle> {
        if (endpointOverride.empty()) {
            return defaultOracle;
        }
        return std::make_shared<LLMRepairClient>(endpointOverride, repairCfg.timeoutSecs,
                                                 repairCfg.apiKey, repairCfg.model);
    };

    JobManager::Options jobOptions;
    jobOptions.dataDir = cfg.dataDir;
    jobOptions.retentionSecs = cfg.jobs.retentionSecs;
    jobOptions.pollIntervalMs = cfg.jobs.pollIntervalMs;
    JobManager jobs(jobOptions);

    ToolRegistry tools;
    tools.registerTool(std::make_unique<EditAstTool>(editor, oracleFor));
    tools.registerTool(std::make_unique<PatchFileTool>());
    tools.registerTool(std::make_unique<RunAsyncTool>(jobs, cfg.jobs.defaultTimeoutSecs));
    tools.registerTool(std::make_unique<CheckJobTool>(jobs));
    tools.registerTool(std::make_unique<KillJobTool>(jobs));
    logger.debug("Registered " + std::to_string(tools.getToolCount()) + " tools");

    std::ios::sync_with_stdio(false);
    McpServer server(tools, CORTEX_ACT_VERSION);
    server.run(std::cin, std::cout);
    return 0;
}
