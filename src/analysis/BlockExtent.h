#pragma once
#include <string>

/**
 * @brief Heuristic block boundaries for grammars without a parser.
 *
 * Brace-delimited when the first '{' sits within the first three lines of the
 * declaration, indentation-delimited otherwise.
 */
namespace BlockExtent {
    /**
     * @brief End of the block that starts at `start`.
     * @return Offset relative to `start`, in [1, source.size() - start] for a
     *         non-empty slice. Unbalanced braces yield the slice length.
     */
    size_t resolve(const std::string& source, size_t start);

    /** Leading spaces and tabs, one column each */
    size_t indentWidth(const std::string& line);
}
