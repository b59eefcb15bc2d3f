#include "TypeInference.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace pgframe {

ColumnTypes TypeInference::inferTypes(const Table& table) {
    ColumnTypes types;
    types.reserve(table.numColumns());
    for (const auto& column : table.columns()) {
        types.emplace_back(column.name, inferColumnType(column));
    }
    return types;
}

std::string TypeInference::inferColumnType(const Column& column) {
    // No observed value to decide from: textual default
    if (column.allNull()) {
        return VARCHAR_255;
    }

    switch (column.kind) {
        case ColumnKind::Integer:
            return fitsInInt32(column) ? INTEGER : BIGINT;
        case ColumnKind::Float:
            return DOUBLE_PRECISION;
        case ColumnKind::Boolean:
            return BOOLEAN;
        case ColumnKind::Timestamp:
            return TIMESTAMP;
        case ColumnKind::TimestampTz:
            return TIMESTAMPTZ;
        case ColumnKind::Categorical:
            return TEXT;
        case ColumnKind::Text:
            return maxTextLength(column) <= VARCHAR_LIMIT ? VARCHAR_255 : TEXT;
        case ColumnKind::Other:
            break;
    }
    return TEXT;
}

bool TypeInference::fitsInInt32(const Column& column) {
    constexpr int64_t lo = std::numeric_limits<int32_t>::min();
    constexpr int64_t hi = std::numeric_limits<int32_t>::max();

    for (const auto& cell : column.cells) {
        if (auto v = std::get_if<int64_t>(&cell)) {
            if (*v < lo || *v > hi) return false;
        }
    }
    return true;
}

size_t TypeInference::maxTextLength(const Column& column) {
    size_t longest = 0;
    for (const auto& cell : column.cells) {
        if (auto v = std::get_if<std::string>(&cell)) {
            longest = std::max(longest, utf8Length(*v));
        } else if (!isNull(cell)) {
            longest = std::max(longest, utf8Length(cellToString(cell)));
        }
    }
    return longest;
}

size_t TypeInference::utf8Length(const std::string& str) {
    // Count every byte that is not a continuation byte (10xxxxxx)
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace pgframe
