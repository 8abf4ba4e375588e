#pragma once
#include "analysis/SymbolManager.h"
#include <regex>

/**
 * @brief Heuristic declaration matcher for grammars without a parser.
 *
 * Patterns are tried in a fixed priority order; the first pattern that records
 * a name owns it. Block ends come from BlockExtent.
 */
class RegexSymbolProvider : public ISymbolProvider {
public:
    std::vector<Symbol> extractSymbols(const std::string& content, const std::string& relPath) const override;
    bool supportsExtension(const std::string& ext) const override;

    static bool isReservedWord(const std::string& word);
};
