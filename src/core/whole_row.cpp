#include "accumulo/whole_row.h"

#include <algorithm>
#include <stdexcept>

namespace accumulo {

namespace {

class BigEndianReader {
public:
    explicit BigEndianReader(std::string_view data) : data_(data) {}

    std::uint64_t read_uint(std::size_t width) {
        require(width);
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            value = (value << 8) | static_cast<unsigned char>(data_[pos_ + i]);
        }
        pos_ += width;
        return value;
    }

    std::int32_t read_int32() {
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(read_uint(4)));
    }

    std::int64_t read_int64() {
        return static_cast<std::int64_t>(read_uint(8));
    }

    std::string read_bytes() {
        const std::int32_t length = read_int32();
        if (length < 0) {
            throw std::invalid_argument("whole row: negative field length");
        }
        require(static_cast<std::size_t>(length));
        std::string out(data_.substr(pos_, static_cast<std::size_t>(length)));
        pos_ += static_cast<std::size_t>(length);
        return out;
    }

private:
    void require(std::size_t count) const {
        if (data_.size() - pos_ < count) {
            throw std::invalid_argument("whole row: truncated input at offset " + std::to_string(pos_));
        }
    }

    std::string_view data_;
    std::size_t pos_ = 0;
};

}  // namespace

std::vector<WholeRowColumn> decode_whole_row(std::string_view encoded) {
    BigEndianReader reader(encoded);
    const std::int32_t count = reader.read_int32();
    if (count < 0) {
        throw std::invalid_argument("whole row: negative column count");
    }

    std::vector<WholeRowColumn> columns;
    // Smallest encoded column: four length prefixes and a timestamp.
    columns.reserve(std::min<std::size_t>(static_cast<std::size_t>(count), encoded.size() / 24));
    for (std::int32_t i = 0; i < count; ++i) {
        WholeRowColumn column;
        column.cf = reader.read_bytes();
        column.cq = reader.read_bytes();
        column.visibility = reader.read_bytes();
        column.timestamp = reader.read_int64();
        column.value = reader.read_bytes();
        columns.push_back(std::move(column));
    }
    return columns;
}

WholeRow WholeRow::from_key_value(const KeyValue& kv) {
    return WholeRow{kv.row(), decode_whole_row(kv.value())};
}

}  // namespace accumulo
