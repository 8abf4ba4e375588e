#include "analysis/SymbolManager.h"
#include "utils/Logger.h"
#include <filesystem>

namespace fs = std::filesystem;

const char* symbolKindLabel(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Struct: return "struct";
        case SymbolKind::Class: return "class";
        case SymbolKind::Enum: return "enum";
        case SymbolKind::Impl: return "impl";
        case SymbolKind::Trait: return "trait";
        case SymbolKind::Interface: return "interface";
        case SymbolKind::Module: return "mod";
    }
    return "unknown";
}

std::optional<SymbolKind> symbolKindFromLabel(const std::string& label) {
    if (label == "function") return SymbolKind::Function;
    if (label == "struct") return SymbolKind::Struct;
    if (label == "class") return SymbolKind::Class;
    if (label == "enum") return SymbolKind::Enum;
    if (label == "impl") return SymbolKind::Impl;
    if (label == "trait") return SymbolKind::Trait;
    if (label == "interface") return SymbolKind::Interface;
    if (label == "mod" || label == "module") return SymbolKind::Module;
    return std::nullopt;
}

std::string Symbol::qualifiedName() const {
    return std::string(symbolKindLabel(kind)) + ":" + name;
}

void SymbolManager::registerProvider(std::unique_ptr<ISymbolProvider> provider) {
    if (!provider) return;
    providers.push_back(std::move(provider));
}

std::vector<Symbol> SymbolManager::extractSymbols(const std::string& filePath, const std::string& content) const {
    std::string ext = fs::u8path(filePath).extension().u8string();

    const ISymbolProvider* chosen = nullptr;
    for (const auto& provider : providers) {
        if (provider->supportsExtension(ext)) {
            chosen = provider.get();
            break;
        }
    }
    if (!chosen) {
        Logger::getInstance().debug("No symbol provider for extension '" + ext + "'");
        return {};
    }

    std::vector<Symbol> symbols = chosen->extractSymbols(content, filePath);
    if (!symbols.empty() || !fallbackOnEmpty) {
        return symbols;
    }

    // Primary provider found nothing; let the next capable provider try.
    bool passedChosen = false;
    for (const auto& provider : providers) {
        if (provider.get() == chosen) {
            passedChosen = true;
            continue;
        }
        if (passedChosen && provider->supportsExtension(ext)) {
            Logger::getInstance().debug("Symbol fallback for " + filePath);
            return provider->extractSymbols(content, filePath);
        }
    }
    return symbols;
}
