#include "analysis/SyntaxValidator.h"
#include "analysis/providers/TreeSitterSymbolProvider.h"
#include <tree_sitter/api.h>
#include <cstring>
#include <memory>

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

void collectErrors(TSNode node, const std::string& source, std::vector<ValidationError>& out) {
    TSPoint point = ts_node_start_point(node);
    uint32_t line = point.row + 1;
    uint32_t column = point.column + 1;
    std::string location = std::to_string(line) + ":" + std::to_string(column);

    if (ts_node_is_missing(node)) {
        out.push_back({"Missing '" + std::string(ts_node_type(node)) + "' at " + location, line, column});
    } else if (std::strcmp(ts_node_type(node), "ERROR") == 0) {
        std::string text = SyntaxValidator::snippet(source, ts_node_start_byte(node), ts_node_end_byte(node));
        out.push_back({"Unexpected '" + text + "' at " + location, line, column});
    }

    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        // Clean subtrees hold no error or missing nodes
        if (ts_node_has_error(child) || ts_node_is_missing(child)) {
            collectErrors(child, source, out);
        }
    }
}

} // namespace

SyntaxValidator::SyntaxValidator(const TreeSitterSymbolProvider* grammars)
    : grammars(grammars) {}

bool SyntaxValidator::canValidate(const std::string& filePath) const {
    return grammars && grammars->languageForPath(filePath) != nullptr;
}

std::vector<ValidationError> SyntaxValidator::validate(const std::string& filePath, const std::string& source) const {
    std::vector<ValidationError> errors;
    const TSLanguage* language = grammars ? grammars->languageForPath(filePath) : nullptr;
    if (!language) {
        return errors;
    }

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(ts_parser_new(), ts_parser_delete);
    if (!parser || !ts_parser_set_language(parser.get(), language)) {
        errors.push_back({"Parser unavailable for " + filePath, 1, 1});
        return errors;
    }
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser.get(), nullptr, source.c_str(), static_cast<uint32_t>(source.size())),
        ts_tree_delete);
    if (!tree) {
        errors.push_back({"Parse failed for " + filePath, 1, 1});
        return errors;
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (!ts_node_has_error(root)) {
        return errors;
    }
    collectErrors(root, source, errors);
    if (errors.empty()) {
        errors.push_back({"Syntax error detected at 1:1", 1, 1});
    }
    return errors;
}

std::string SyntaxValidator::snippet(const std::string& source, uint32_t startByte, uint32_t endByte, size_t maxChars) {
    if (startByte >= endByte || startByte >= source.size()) {
        return "<unknown>";
    }
    if (endByte > source.size()) endByte = static_cast<uint32_t>(source.size());

    // Count UTF-8 code points, not bytes, so multi-byte characters stay whole
    size_t chars = 0;
    size_t i = startByte;
    while (i < endByte) {
        unsigned char c = static_cast<unsigned char>(source[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == maxChars) break;
            ++chars;
        }
        ++i;
    }
    return trim(source.substr(startByte, i - startByte));
}
