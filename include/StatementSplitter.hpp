#pragma once

#include <string>
#include <vector>

namespace pgframe {

/**
 * @class StatementSplitter
 * @brief Cuts a SQL string into statements on ';'.
 *
 * Splitting is purely lexical: a ';' inside a string literal, a comment or a
 * function body also ends a statement. Callers must not rely on
 * multi-statement mode for SQL that contains such semicolons.
 */
class StatementSplitter {
public:
    static constexpr char SEPARATOR = ';';

    /// Trimmed, non-empty statements in their original order.
    static std::vector<std::string> split(const std::string& sql);

    static std::string trim(const std::string& str);
};

}  // namespace pgframe
