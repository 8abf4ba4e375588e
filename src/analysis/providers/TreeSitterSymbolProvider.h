#pragma once
#include "analysis/SymbolManager.h"
#include <string>
#include <vector>
#include <map>
#include <tree_sitter/api.h>

/**
 * @brief Parser-backed symbol provider.
 *
 * Rust is registered at construction. Further grammars can be registered at
 * runtime from shared libraries, each with its own node-type -> kind table.
 */
class TreeSitterSymbolProvider : public ISymbolProvider {
public:
    using NodeKindTable = std::map<std::string, SymbolKind>;

    TreeSitterSymbolProvider();
    ~TreeSitterSymbolProvider();
    TreeSitterSymbolProvider(const TreeSitterSymbolProvider&) = delete;
    TreeSitterSymbolProvider& operator=(const TreeSitterSymbolProvider&) = delete;

    std::vector<Symbol> extractSymbols(const std::string& content, const std::string& relPath) const override;
    bool supportsExtension(const std::string& ext) const override;

    void registerLanguage(const std::string& name,
                          const std::vector<std::string>& extensions,
                          const TSLanguage* language,
                          const NodeKindTable& nodeKinds);
    bool registerLanguageFromLibrary(const std::string& name,
                                     const std::vector<std::string>& extensions,
                                     const std::string& libraryPath,
                                     const std::string& symbolName,
                                     const NodeKindTable& nodeKinds);

    // nullptr when the path has no registered grammar
    const TSLanguage* languageForPath(const std::string& relPath) const;

    static const NodeKindTable& rustNodeKinds();

private:
    struct Language {
        std::string name;
        std::vector<std::string> extensions;
        const TSLanguage* language = nullptr;
        NodeKindTable nodeKinds;
    };

    std::vector<Language> languages;
    std::vector<void*> handles;

    const Language* findLanguage(const std::string& relPath) const;
    void collectSymbols(TSNode node,
                        const Language& lang,
                        const std::string& content,
                        std::vector<Symbol>& out) const;
};
