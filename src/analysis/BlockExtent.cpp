#include "analysis/BlockExtent.h"

namespace {

constexpr size_t kBraceLookaheadLines = 3;

bool isBlank(const std::string& source, size_t from, size_t to) {
    for (size_t i = from; i < to; ++i) {
        char c = source[i];
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

size_t braceBlockEnd(const std::string& source, size_t start) {
    bool inLiteral = false;
    char quote = 0;
    int depth = 0;
    bool opened = false;

    for (size_t i = start; i < source.size(); ++i) {
        char c = source[i];
        char prev = (i > start) ? source[i - 1] : '\0';

        if (c == '"' || c == '\'') {
            if (prev == '\\') continue;
            if (!inLiteral) {
                inLiteral = true;
                quote = c;
            } else if (c == quote) {
                inLiteral = false;
            }
            continue;
        }
        if (inLiteral) continue;

        if (c == '{') {
            ++depth;
            opened = true;
        } else if (c == '}' && depth > 0) {
            --depth;
            if (opened && depth == 0) {
                return i + 1 - start;
            }
        }
    }
    return source.size() - start;
}

size_t indentBlockEnd(const std::string& source, size_t start) {
    size_t firstEol = source.find('\n', start);
    size_t firstLineEnd = (firstEol == std::string::npos) ? source.size() : firstEol;
    size_t base = BlockExtent::indentWidth(source.substr(start, firstLineEnd - start));

    size_t end = (firstEol == std::string::npos) ? source.size() : firstEol + 1;
    size_t pos = end;
    while (pos < source.size()) {
        size_t eol = source.find('\n', pos);
        size_t textEnd = (eol == std::string::npos) ? source.size() : eol;
        size_t next = (eol == std::string::npos) ? source.size() : eol + 1;

        if (isBlank(source, pos, textEnd)) {
            pos = next;
            continue;
        }
        if (BlockExtent::indentWidth(source.substr(pos, textEnd - pos)) <= base) {
            break;
        }
        end = next;
        pos = next;
    }
    return end - start;
}

} // namespace

namespace BlockExtent {

size_t indentWidth(const std::string& line) {
    size_t width = 0;
    while (width < line.size() && (line[width] == ' ' || line[width] == '\t')) {
        ++width;
    }
    return width;
}

size_t resolve(const std::string& source, size_t start) {
    if (start >= source.size()) return 0;

    size_t brace = source.find('{', start);
    if (brace != std::string::npos) {
        size_t newlines = 0;
        for (size_t i = start; i < brace; ++i) {
            if (source[i] == '\n') ++newlines;
        }
        if (newlines < kBraceLookaheadLines) {
            return braceBlockEnd(source, start);
        }
    }
    return indentBlockEnd(source, start);
}

} // namespace BlockExtent
