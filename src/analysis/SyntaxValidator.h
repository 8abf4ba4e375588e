#pragma once
#include <cstdint>
#include <string>
#include <vector>

class TreeSitterSymbolProvider;

struct ValidationError {
    std::string message;   // "Missing ';' at 3:10" / "Unexpected 'fn' at 5:1"
    uint32_t line = 0;     // 1-based
    uint32_t column = 0;   // 1-based
};

/**
 * @brief Re-parses a buffer and reports every ERROR and MISSING node.
 *
 * Only files with a registered tree-sitter grammar can be validated; callers
 * accept heuristic-only buffers as-is.
 */
class SyntaxValidator {
public:
    explicit SyntaxValidator(const TreeSitterSymbolProvider* grammars);

    bool canValidate(const std::string& filePath) const;

    // Empty when the buffer parses cleanly or no grammar applies.
    std::vector<ValidationError> validate(const std::string& filePath, const std::string& source) const;

    static std::string snippet(const std::string& source, uint32_t startByte, uint32_t endByte, size_t maxChars = 40);

private:
    const TreeSitterSymbolProvider* grammars;
};
