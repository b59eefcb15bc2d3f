#pragma once

#include "Table.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pgframe {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
};

// Conversion between Table and CSV/JSON text for the command-line tool
class FormatConverter {
public:
    // NULL cells are written as empty fields
    static std::string toCSV(const Table& table, const CSVOptions& options = CSVOptions{});

    // Array of row objects. Numbers and booleans keep their JSON type;
    // NULL becomes null
    static std::string toJSON(const Table& table, const JSONOptions& options = JSONOptions{});

    // Parse CSV into a Table. Empty fields are NULL. Each column becomes
    // Integer, Float or Boolean when every non-empty field parses as one,
    // Text otherwise. Without a header, columns are named col0, col1, ...
    // A blank line is a NULL row when there is a single column and is
    // skipped otherwise.
    static Table parseCSV(const std::string& data, const CSVOptions& options = CSVOptions{});

    // Parse an array of flat objects (or {"rows": [...]}) into a Table.
    // Columns appear in first-seen order; missing keys are NULL.
    static Table parseJSON(const std::string& data);

    // CSV utility functions
    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
    static std::vector<std::string> splitCSVLine(const std::string& line,
                                                 const CSVOptions& options = CSVOptions{});

    // Detect the kind of a column of raw text fields
    static ColumnKind detectKind(const std::vector<std::string>& fields);

private:
    static json cellToJSON(const Cell& cell);
    static Cell jsonToCell(const json& value);
    static Cell parseField(const std::string& field, ColumnKind kind);

    // Split data into records, keeping newlines inside quoted fields
    static std::vector<std::string> splitRecords(const std::string& data,
                                                 const CSVOptions& options);
};

}  // namespace pgframe
