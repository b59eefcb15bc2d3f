#include "Identifier.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <set>

namespace pgframe {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::mutex& keywordMutex() {
    static std::mutex mutex;
    return mutex;
}

std::set<std::string>& reservedKeywords() {
    static std::set<std::string> keywords = {
        "select", "from", "where", "insert", "update", "delete", "create", "drop", "alter"
    };
    return keywords;
}

}  // namespace

std::string QualifiedName::escaped() const {
    return Identifier::escapeIdentifier(schema) + "." + Identifier::escapeIdentifier(table);
}

std::string QualifiedName::str() const {
    return schema + "." + table;
}

std::string Identifier::stripQuotes(const std::string& part) {
    if (part.size() >= 2 && part.front() == '"' && part.back() == '"') {
        return part.substr(1, part.size() - 2);
    }
    return part;
}

QualifiedName Identifier::parseQualifiedName(const std::string& raw,
                                             const std::string& defaultSchema) {
    auto dots = std::count(raw.begin(), raw.end(), '.');

    QualifiedName name;
    if (dots == 0) {
        name.schema = defaultSchema;
        name.table = stripQuotes(raw);
    } else if (dots == 1) {
        auto pos = raw.find('.');
        name.schema = stripQuotes(raw.substr(0, pos));
        name.table = stripQuotes(raw.substr(pos + 1));
    } else {
        throw InvalidIdentifier("Invalid table name '" + raw +
                                "': expected 'table' or 'schema.table'");
    }

    if (name.schema.empty() || name.table.empty()) {
        throw InvalidIdentifier("Invalid table name '" + raw + "': empty schema or table");
    }

    return name;
}

bool Identifier::isSimpleIdentifier(const std::string& name) {
    if (name.empty()) return false;

    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_') || first >= 0x80) return false;

    return std::all_of(name.begin() + 1, name.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return c < 0x80 && (std::isalnum(c) || c == '_');
    });
}

bool Identifier::isReservedKeyword(const std::string& name) {
    std::lock_guard<std::mutex> lock(keywordMutex());
    return reservedKeywords().count(toLower(name)) > 0;
}

void Identifier::addReservedKeyword(const std::string& keyword) {
    std::lock_guard<std::mutex> lock(keywordMutex());
    reservedKeywords().insert(toLower(keyword));
}

std::string Identifier::escapeIdentifier(const std::string& name) {
    if (isSimpleIdentifier(name) && !isReservedKeyword(name)) {
        return name;
    }

    // PostgreSQL uses double quotes for identifiers
    std::string result = "\"";
    for (char c : name) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

std::string Identifier::catalogName(const std::string& name) {
    if (isSimpleIdentifier(name) && !isReservedKeyword(name)) {
        return toLower(name);
    }
    return name;
}

}  // namespace pgframe
