#include "edit/AstEditor.h"
#include "analysis/SyntaxValidator.h"
#include "core/Errors.h"
#include "core/RepairClient.h"
#include "utils/AtomicFile.h"
#include "utils/Logger.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

std::optional<EditAction> editActionFromLabel(const std::string& label) {
    if (label == "replace") return EditAction::Replace;
    if (label == "delete") return EditAction::Delete;
    return std::nullopt;
}

AstEditor::AstEditor(const SymbolManager& symbols, const SyntaxValidator& validator)
    : symbols(symbols), validator(validator) {}

void AstEditor::checkWritePermission(const std::string& filePath) {
    struct stat st;
    if (::stat(filePath.c_str(), &st) != 0) {
        throw CortexError(ErrorKind::IoError, "Cannot stat " + filePath + ": file may not exist");
    }
    if ((st.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0) {
        throw CortexError(ErrorKind::PermissionDenied, "Permission denied: " + filePath + " is read-only");
    }
    std::ofstream writable(fs::u8path(filePath), std::ios::binary | std::ios::app);
    if (!writable.is_open()) {
        throw CortexError(ErrorKind::PermissionDenied, "Write permission denied on " + filePath);
    }
}

std::string AstEditor::separatorFor(const std::string& replacement, const std::string& suffix) {
    if (suffix.empty() || suffix.front() == '\n') {
        return "";
    }
    if (replacement.empty() || replacement.back() != '\n') {
        return "\n";
    }
    bool endsWithBlankLine = replacement.size() >= 2 && replacement[replacement.size() - 2] == '\n';
    return endsWithBlankLine ? "" : "\n";
}

std::string AstEditor::spliceBottomUp(const std::string& source, std::vector<SpliceOp> ops) {
    std::sort(ops.begin(), ops.end(), [](const SpliceOp& a, const SpliceOp& b) {
        return a.start > b.start;
    });

    for (size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].start > ops[i].end || ops[i].end > source.size()) {
            throw CortexError(ErrorKind::InvalidEdit, "Edit range out of bounds");
        }
        // ops[i - 1] starts later; it must begin at or after this range ends
        if (i > 0 && ops[i].end > ops[i - 1].start) {
            throw CortexError(ErrorKind::InvalidEdit,
                              "Overlapping edit ranges at bytes " + std::to_string(ops[i].start) + "-" +
                              std::to_string(ops[i].end) + " and " + std::to_string(ops[i - 1].start) + "-" +
                              std::to_string(ops[i - 1].end));
        }
    }

    std::string buffer = source;
    for (const auto& op : ops) {
        std::string suffix = buffer.substr(op.end);
        std::string separator = op.separate ? separatorFor(op.text, suffix) : "";
        buffer = buffer.substr(0, op.start) + op.text + separator + suffix;
    }
    return buffer;
}

const Symbol* AstEditor::resolveTarget(const std::vector<Symbol>& found, const std::string& target) const {
    std::string qualified = target;
    size_t colon = target.find(':');
    if (colon != std::string::npos) {
        auto kind = symbolKindFromLabel(target.substr(0, colon));
        if (kind) {
            qualified = std::string(symbolKindLabel(*kind)) + ":" + target.substr(colon + 1);
        }
    }

    for (const auto& sym : found) {
        if (sym.qualifiedName() == qualified) return &sym;
    }
    for (const auto& sym : found) {
        if (sym.name == target) return &sym;
    }
    return nullptr;
}

std::string AstEditor::applyToBuffer(const std::string& filePath, const std::string& source,
                                     const std::vector<Edit>& edits) const {
    std::vector<Symbol> found = symbols.extractSymbols(filePath, source);

    std::vector<SpliceOp> ops;
    ops.reserve(edits.size());
    for (const auto& edit : edits) {
        const Symbol* sym = resolveTarget(found, edit.target);
        if (!sym) {
            throw CortexError(ErrorKind::NotFound,
                              "AST target not found in source: '" + edit.target +
                              "'. Re-read the file to discover current symbol names.");
        }
        SpliceOp op;
        op.start = sym->startByte;
        op.end = sym->endByte;
        if (edit.action == EditAction::Delete) {
            op.separate = false;
        } else {
            op.text = edit.code;
        }
        ops.push_back(std::move(op));
    }
    return spliceBottomUp(source, std::move(ops));
}

std::string AstEditor::healOrThrow(const std::string& filePath, const std::string& buffer, IRepairOracle* oracle) const {
    std::vector<ValidationError> errors = validator.validate(filePath, buffer);
    if (errors.empty()) {
        return buffer;
    }

    Logger::getInstance().warn("AST validation failed for " + filePath + " (" +
                               std::to_string(errors.size()) + " errors)");
    if (!oracle) {
        throw CortexError(ErrorKind::ValidationFailed,
                          "Edit produced invalid syntax (" + errors.front().message +
                          ") and no repair oracle is configured. Edit aborted, file unchanged.");
    }

    std::string healed;
    try {
        healed = oracle->heal({filePath, buffer, errors});
    } catch (const CortexError& e) {
        throw CortexError(ErrorKind::ValidationFailed,
                          std::string("Auto-heal failed (") + errorKindName(e.kind()) + ": " + e.what() +
                          "). Edit aborted, file unchanged.");
    }

    if (!buffer.empty() && buffer.back() == '\n' && (healed.empty() || healed.back() != '\n')) {
        healed += '\n';
    }

    std::vector<ValidationError> remaining = validator.validate(filePath, healed);
    if (!remaining.empty()) {
        throw CortexError(ErrorKind::ValidationFailed,
                          "Auto-heal produced code still containing syntax errors (" + remaining.front().message +
                          "). Edit aborted, file unchanged.");
    }
    Logger::getInstance().success("Auto-heal repaired " + filePath);
    return healed;
}

std::string AstEditor::preview(const std::string& content, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < content.size()) {
        unsigned char c = static_cast<unsigned char>(content[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) break;
            ++chars;
        }
        ++i;
    }
    return content.substr(0, i);
}

EditResult AstEditor::apply(const std::string& filePath, const std::vector<Edit>& edits, IRepairOracle* oracle) const {
    if (edits.empty()) {
        throw CortexError(ErrorKind::InvalidEdit, "No edits given");
    }

    checkWritePermission(filePath);
    std::string source = AtomicFile::read(filePath);

    std::string buffer = applyToBuffer(filePath, source, edits);
    buffer = healOrThrow(filePath, buffer, oracle);

    AtomicFile::write(filePath, buffer);
    Logger::getInstance().action("Applied " + std::to_string(edits.size()) + " edit(s) to " + filePath);

    EditResult result;
    result.message = "Applied " + std::to_string(edits.size()) + " edit(s) to " + filePath;
    result.preview = preview(buffer);
    result.content = std::move(buffer);
    return result;
}
