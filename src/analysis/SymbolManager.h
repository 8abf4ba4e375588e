#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>

enum class SymbolKind {
    Function,
    Struct,
    Class,
    Enum,
    Impl,
    Trait,
    Interface,
    Module
};

/** Label used in edit targets ("function:login", "mod:net") */
const char* symbolKindLabel(SymbolKind kind);

/** Accepts every label produced by symbolKindLabel, plus "module" */
std::optional<SymbolKind> symbolKindFromLabel(const std::string& label);

struct Symbol {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    size_t startByte = 0;
    size_t endByte = 0;
    std::string source; // "tree_sitter", "regex"

    /** "kind:name" */
    std::string qualifiedName() const;
};

class ISymbolProvider {
public:
    virtual ~ISymbolProvider() = default;
    virtual std::vector<Symbol> extractSymbols(const std::string& content, const std::string& relPath) const = 0;
    virtual bool supportsExtension(const std::string& ext) const = 0;
};

/**
 * @brief Picks a symbol provider by file extension.
 *
 * Providers are consulted in registration order; the first one that supports
 * the extension extracts. Register the parser-backed provider before the
 * heuristic one.
 */
class SymbolManager {
public:
    using Symbol = ::Symbol;

    SymbolManager() = default;

    void registerProvider(std::unique_ptr<ISymbolProvider> provider);
    void setFallbackOnEmpty(bool enabled) { fallbackOnEmpty = enabled; }

    // Extraction order, not sorted. Empty when no provider applies.
    std::vector<Symbol> extractSymbols(const std::string& filePath, const std::string& content) const;

    size_t getProviderCount() const { return providers.size(); }

private:
    std::vector<std::unique_ptr<ISymbolProvider>> providers;
    bool fallbackOnEmpty = false;
};
