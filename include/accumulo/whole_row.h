#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "accumulo/structs.h"

namespace accumulo {

struct WholeRowColumn {
    std::string cf;
    std::string cq;
    std::string visibility;
    std::int64_t timestamp = 0;
    std::string value;

    bool operator==(const WholeRowColumn&) const = default;
};

/**
 * @brief Decodes the value packed by a server-side WholeRowIterator
 *
 * Layout (big-endian): int32 column count, then per column the family,
 * qualifier and visibility as int32 length + bytes, an int64 timestamp and
 * the value as int32 length + bytes.
 *
 * @throws std::invalid_argument on truncated or malformed input
 */
std::vector<WholeRowColumn> decode_whole_row(std::string_view encoded);

struct WholeRow {
    std::string row;
    std::vector<WholeRowColumn> columns;

    static WholeRow from_key_value(const KeyValue& kv);
};

}  // namespace accumulo
