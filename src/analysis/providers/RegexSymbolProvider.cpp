#include "analysis/providers/RegexSymbolProvider.h"
#include "analysis/BlockExtent.h"
#include <unordered_set>
#include <utility>

namespace {

struct DeclarationPattern {
    std::regex re;
    SymbolKind kind;
};

// Priority order matters: an earlier pattern claims a name first.
const std::vector<DeclarationPattern>& declarationPatterns() {
    static const std::vector<DeclarationPattern> patterns = {
        // Rust / general
        {std::regex(R"raw(^(?:pub\s+)?(?:async\s+)?fn\s+(\w+))raw"), SymbolKind::Function},
        {std::regex(R"raw(^(?:pub\s+)?struct\s+(\w+))raw"), SymbolKind::Struct},
        {std::regex(R"raw(^(?:pub\s+)?enum\s+(\w+))raw"), SymbolKind::Enum},
        // TS / JS
        {std::regex(R"raw(^(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s+(\w+))raw"), SymbolKind::Function},
        {std::regex(R"raw(^(?:export\s+)?(?:default\s+)?class\s+(\w+))raw"), SymbolKind::Class},
        {std::regex(R"raw(^(?:export\s+)?interface\s+(\w+))raw"), SymbolKind::Interface},
        // Python
        {std::regex(R"raw(^(?:async\s+)?def\s+(\w+))raw"), SymbolKind::Function},
        {std::regex(R"raw(^class\s+(\w+))raw"), SymbolKind::Class},
        // Go
        {std::regex(R"raw(^func\s+(?:\([^)]+\)\s+)?(\w+))raw"), SymbolKind::Function},
        {std::regex(R"raw(^type\s+(\w+)\s+struct)raw"), SymbolKind::Struct},
        // PHP
        {std::regex(R"raw(^(?:public\s+|private\s+|protected\s+)?(?:static\s+)?function\s+(\w+))raw"), SymbolKind::Function},
        {std::regex(R"raw(^(?:abstract\s+|final\s+)?class\s+(\w+))raw"), SymbolKind::Class},
        // C# / Java / C++ signature
        {std::regex(R"raw(^(?:public\s+|private\s+|protected\s+|internal\s+)?(?:static\s+|async\s+|virtual\s+|override\s+)?(?:[\w<>,\[\]]+\s+)(\w+)\s*\()raw"), SymbolKind::Function},
    };
    return patterns;
}

// Every pattern is anchored at the line start, so only a prefix needs scanning.
// std::regex recurses per character and overflows the stack on long minified lines.
constexpr size_t kMaxScannedLineChars = 1024;

// (byte offset of line start, line text without the newline)
std::vector<std::pair<size_t, std::string>> splitLines(const std::string& content) {
    std::vector<std::pair<size_t, std::string>> lines;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        size_t end = (eol == std::string::npos) ? content.size() : eol;
        lines.emplace_back(pos, content.substr(pos, end - pos));
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return lines;
}

} // namespace

bool RegexSymbolProvider::isReservedWord(const std::string& word) {
    static const std::unordered_set<std::string> reserved = {
        "if", "for", "while", "return", "new", "this", "var", "let", "const"
    };
    return reserved.count(word) > 0;
}

std::vector<Symbol> RegexSymbolProvider::extractSymbols(const std::string& content, const std::string& relPath) const {
    (void)relPath;
    std::vector<Symbol> symbols;
    std::unordered_set<std::string> seen;
    auto lines = splitLines(content);

    for (const auto& pattern : declarationPatterns()) {
        for (const auto& [lineStart, text] : lines) {
            const std::string head = text.size() > kMaxScannedLineChars ? text.substr(0, kMaxScannedLineChars) : text;
            std::smatch match;
            if (!std::regex_search(head, match, pattern.re)) continue;

            std::string name = match[1].str();
            if (name.empty() || isReservedWord(name)) continue;
            if (seen.count(name)) continue;

            size_t extent = BlockExtent::resolve(content, lineStart);
            if (extent == 0) continue;

            seen.insert(name);
            symbols.push_back({name, pattern.kind, lineStart, lineStart + extent, "regex"});
        }
    }

    return symbols;
}

bool RegexSymbolProvider::supportsExtension(const std::string& ext) const {
    // Grammar-agnostic: anything without a parser lands here
    (void)ext;
    return true;
}
