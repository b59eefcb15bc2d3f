#include "StatementSplitter.hpp"

namespace pgframe {

std::string StatementSplitter::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n\f\v");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> StatementSplitter::split(const std::string& sql) {
    std::vector<std::string> statements;

    size_t start = 0;
    while (start <= sql.size()) {
        size_t end = sql.find(SEPARATOR, start);
        if (end == std::string::npos) {
            end = sql.size();
        }

        std::string statement = trim(sql.substr(start, end - start));
        if (!statement.empty()) {
            statements.push_back(std::move(statement));
        }

        start = end + 1;
    }

    return statements;
}

}  // namespace pgframe
