#pragma once
#include <optional>
#include <string>
#include <vector>
#include "analysis/SymbolManager.h"

class SyntaxValidator;
class IRepairOracle;

enum class EditAction {
    Replace,
    Delete
};

std::optional<EditAction> editActionFromLabel(const std::string& label);

struct Edit {
    std::string target;   // "kind:name" or bare "name"
    EditAction action = EditAction::Replace;
    std::string code;     // ignored for Delete
};

struct EditResult {
    std::string message;  // "Applied N edit(s) to <file>"
    std::string content;  // full committed buffer
    std::string preview;  // first 500 characters of content
};

/**
 * @brief Symbol-addressed, all-or-nothing batch editing of one source file.
 *
 * Targets are resolved against a single extraction of the unmodified file,
 * spliced back-to-front so earlier offsets stay valid, re-parsed, and only
 * then written. Any failure leaves the file untouched.
 */
class AstEditor {
public:
    struct SpliceOp {
        size_t start = 0;
        size_t end = 0;
        std::string text;
        bool separate = true;  // apply the newline separator rules after text
    };

    AstEditor(const SymbolManager& symbols, const SyntaxValidator& validator);

    /**
     * @param oracle may be nullptr; then a buffer that fails validation is rejected outright
     * @throws CortexError NotFound, PermissionDenied, InvalidEdit, ValidationFailed, IoError
     */
    EditResult apply(const std::string& filePath, const std::vector<Edit>& edits, IRepairOracle* oracle) const;

    // Resolves, sorts and splices without touching the disk.
    std::string applyToBuffer(const std::string& filePath, const std::string& source, const std::vector<Edit>& edits) const;

    static void checkWritePermission(const std::string& filePath);

    // Sorts by start descending, rejects overlaps, splices.
    static std::string spliceBottomUp(const std::string& source, std::vector<SpliceOp> ops);

    static std::string separatorFor(const std::string& replacement, const std::string& suffix);

    static std::string preview(const std::string& content, size_t maxChars = 500);

private:
    const SymbolManager& symbols;
    const SyntaxValidator& validator;

    const Symbol* resolveTarget(const std::vector<Symbol>& found, const std::string& target) const;
    std::string healOrThrow(const std::string& filePath, const std::string& buffer, IRepairOracle* oracle) const;
};
