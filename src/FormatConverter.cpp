#include "FormatConverter.hpp"
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>

namespace pgframe {

namespace {

bool parseInteger(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) return false;
    out = static_cast<int64_t>(value);
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) return false;
    out = value;
    return true;
}

bool parseBoolean(const std::string& text, bool& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") {
        out = true;
        return true;
    }
    if (lower == "false") {
        out = false;
        return true;
    }
    return false;
}

}  // namespace

std::string FormatConverter::toCSV(const Table& table, const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        const auto& columns = table.columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i].name, options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (size_t row = 0; row < table.numRows(); ++row) {
        for (size_t col = 0; col < table.numColumns(); ++col) {
            if (col > 0) out << options.delimiter;

            const Cell& cell = table.at(row, col);
            if (!isNull(cell)) {
                out << escapeCSVField(cellToString(cell), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

json FormatConverter::cellToJSON(const Cell& cell) {
    if (auto v = std::get_if<int64_t>(&cell)) return *v;
    if (auto v = std::get_if<double>(&cell)) {
        // JSON has no NaN or Infinity
        if (!std::isfinite(*v)) return cellToString(cell);
        return *v;
    }
    if (auto v = std::get_if<bool>(&cell)) return *v;
    if (auto v = std::get_if<std::string>(&cell)) return *v;
    return nullptr;
}

std::string FormatConverter::toJSON(const Table& table, const JSONOptions& options) {
    json arr = json::array();

    for (size_t row = 0; row < table.numRows(); ++row) {
        json obj = json::object();

        for (const auto& column : table.columns()) {
            obj[column.name] = cellToJSON(column.cells[row]);
        }

        arr.push_back(std::move(obj));
    }

    return options.pretty ? arr.dump(options.indent) : arr.dump();
}

ColumnKind FormatConverter::detectKind(const std::vector<std::string>& fields) {
    bool allInteger = true;
    bool allDouble = true;
    bool allBoolean = true;
    bool any = false;

    for (const auto& field : fields) {
        if (field.empty()) continue;
        any = true;

        int64_t i;
        double d;
        bool b;
        if (allInteger && !parseInteger(field, i)) allInteger = false;
        if (allDouble && !parseDouble(field, d)) allDouble = false;
        if (allBoolean && !parseBoolean(field, b)) allBoolean = false;

        if (!allInteger && !allDouble && !allBoolean) break;
    }

    if (!any) return ColumnKind::Text;
    if (allInteger) return ColumnKind::Integer;
    if (allDouble) return ColumnKind::Float;
    if (allBoolean) return ColumnKind::Boolean;
    return ColumnKind::Text;
}

Cell FormatConverter::parseField(const std::string& field, ColumnKind kind) {
    if (field.empty()) return std::monostate{};

    switch (kind) {
        case ColumnKind::Integer: {
            int64_t value = 0;
            if (parseInteger(field, value)) return value;
            break;
        }
        case ColumnKind::Float: {
            double value = 0;
            if (parseDouble(field, value)) return value;
            break;
        }
        case ColumnKind::Boolean: {
            bool value = false;
            if (parseBoolean(field, value)) return value;
            break;
        }
        default:
            break;
    }
    return field;
}

std::vector<std::string> FormatConverter::splitRecords(const std::string& data,
                                                       const CSVOptions& options) {
    std::vector<std::string> records;
    std::istringstream stream(data);
    std::string line;
    std::string pending;
    bool inQuotes = false;

    while (std::getline(stream, line)) {
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        for (char c : line) {
            if (c == options.quote) inQuotes = !inQuotes;
        }

        if (!pending.empty() || inQuotes) {
            pending += pending.empty() ? line : "\n" + line;
            if (inQuotes) continue;
            line = std::move(pending);
            pending.clear();
        }

        records.push_back(std::move(line));
    }

    if (!pending.empty()) {
        throw std::runtime_error("CSV parse error: unterminated quoted field");
    }

    return records;
}

Table FormatConverter::parseCSV(const std::string& data, const CSVOptions& options) {
    if (data.empty()) {
        return Table();
    }

    auto records = splitRecords(data, options);
    auto start = std::find_if(records.begin(), records.end(),
                              [](const std::string& r) { return !r.empty(); });
    records.erase(records.begin(), start);
    if (records.empty()) {
        return Table();
    }

    std::vector<std::string> headers;
    size_t first = 0;

    if (options.includeHeader) {
        headers = splitCSVLine(records.front(), options);
        first = 1;
    } else {
        // No headers - use column indices
        size_t width = splitCSVLine(records.front(), options).size();
        for (size_t i = 0; i < width; ++i) {
            headers.push_back("col" + std::to_string(i));
        }
    }

    std::vector<std::vector<std::string>> fields(headers.size());
    for (size_t r = first; r < records.size(); ++r) {
        // A blank line is a NULL row when there is one column, padding otherwise
        if (records[r].empty() && headers.size() > 1) continue;
        auto values = splitCSVLine(records[r], options);
        if (values.size() != headers.size()) {
            throw std::runtime_error("CSV parse error: record " + std::to_string(r + 1) +
                                     " has " + std::to_string(values.size()) +
                                     " fields, expected " + std::to_string(headers.size()));
        }
        for (size_t c = 0; c < values.size(); ++c) {
            fields[c].push_back(std::move(values[c]));
        }
    }

    Table table;
    for (size_t c = 0; c < headers.size(); ++c) {
        ColumnKind kind = detectKind(fields[c]);

        Column column(headers[c], kind);
        column.cells.reserve(fields[c].size());
        for (const auto& field : fields[c]) {
            column.cells.push_back(parseField(field, kind));
        }
        table.addColumn(std::move(column));
    }

    return table;
}

Cell FormatConverter::jsonToCell(const json& value) {
    if (value.is_null()) return std::monostate{};
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) return value.get<double>();
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

Table FormatConverter::parseJSON(const std::string& data) {
    if (data.empty()) {
        return Table();
    }

    json rows_array;
    try {
        json parsed = json::parse(data);

        if (parsed.is_array()) {
            rows_array = std::move(parsed);
        } else if (parsed.is_object() && parsed.contains("rows")) {
            rows_array = parsed["rows"];
        } else if (parsed.is_object()) {
            // Single object - treat as one row
            rows_array = json::array({parsed});
        } else {
            return Table();
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("JSON parse error: " + std::string(e.what()));
    }

    std::vector<std::string> names;
    std::map<std::string, std::vector<json>> values;

    size_t rowCount = 0;
    for (const auto& item : rows_array) {
        if (!item.is_object()) continue;

        for (auto& [key, value] : item.items()) {
            auto& cells = values[key];
            if (cells.empty() && std::find(names.begin(), names.end(), key) == names.end()) {
                names.push_back(key);
            }
            cells.resize(rowCount, nullptr);
            cells.push_back(value);
        }
        ++rowCount;
    }

    Table table;
    for (const auto& name : names) {
        auto& cells = values[name];
        cells.resize(rowCount, nullptr);

        bool allInteger = true;
        bool allNumber = true;
        bool allBoolean = true;
        bool allString = true;
        for (const auto& v : cells) {
            if (v.is_null()) continue;
            allInteger = allInteger && v.is_number_integer();
            allNumber = allNumber && v.is_number();
            allBoolean = allBoolean && v.is_boolean();
            allString = allString && v.is_string();
        }

        ColumnKind kind = ColumnKind::Text;
        if (allInteger) kind = ColumnKind::Integer;
        else if (allNumber) kind = ColumnKind::Float;
        else if (allBoolean) kind = ColumnKind::Boolean;

        Column column(name, kind);
        for (const auto& v : cells) {
            if (v.is_null()) {
                column.cells.emplace_back(std::monostate{});
            } else if (kind == ColumnKind::Float) {
                column.cells.emplace_back(v.get<double>());
            } else if (kind == ColumnKind::Text && !allString) {
                column.cells.emplace_back(v.is_string() ? v.get<std::string>() : v.dump());
            } else {
                column.cells.push_back(jsonToCell(v));
            }
        }
        table.addColumn(std::move(column));
    }

    return table;
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

std::vector<std::string> FormatConverter::splitCSVLine(const std::string& line,
                                                       const CSVOptions& options) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    size_t i = 0;

    while (i < line.size()) {
        char c = line[i];

        if (in_quotes) {
            if (c == options.quote) {
                // Check for escaped quote
                if (i + 1 < line.size() && line[i + 1] == options.quote) {
                    current += options.quote;
                    i += 2;
                    continue;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else {
            if (c == options.quote) {
                in_quotes = true;
            } else if (c == options.delimiter) {
                fields.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }

        ++i;
    }

    fields.push_back(current);
    return fields;
}

}  // namespace pgframe
