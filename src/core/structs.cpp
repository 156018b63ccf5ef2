#include "accumulo/structs.h"

namespace accumulo {

namespace {

Range bounded(Key start, Key end, bool end_inclusive) {
    Range range;
    range.start_key = std::move(start);
    range.end_key = std::move(end);
    range.end_inclusive = end_inclusive;
    return range;
}

Range successor_range(const std::string& row,
                      const std::optional<std::string>& cf,
                      const std::optional<std::string>& cq,
                      char suffix,
                      bool end_inclusive) {
    if (cq) {
        return bounded(Key{row, cf, cq}, Key{row, cf, *cq + suffix}, end_inclusive);
    }
    if (cf) {
        return bounded(Key{row, cf}, Key{row, *cf + suffix}, end_inclusive);
    }
    return bounded(Key{row}, Key{row + suffix}, end_inclusive);
}

}  // namespace

Range Range::exact(const std::string& row,
                   const std::optional<std::string>& cf,
                   const std::optional<std::string>& cq) {
    return successor_range(row, cf, cq, '\x00', false);
}

Range Range::prefix(const std::string& row,
                    const std::optional<std::string>& cf,
                    const std::optional<std::string>& cq) {
    return successor_range(row, cf, cq, '\xff', true);
}

const std::string& KeyValue::empty() noexcept {
    static const std::string value;
    return value;
}

const char* to_string(TimeType type) noexcept {
    switch (type) {
        case TimeType::Logical: return "LOGICAL";
        case TimeType::Millis: return "MILLIS";
    }
    return "UNKNOWN";
}

const char* to_string(Durability durability) noexcept {
    switch (durability) {
        case Durability::Default: return "DEFAULT";
        case Durability::None: return "NONE";
        case Durability::Log: return "LOG";
        case Durability::Flush: return "FLUSH";
        case Durability::Sync: return "SYNC";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    os << key.row;
    if (key.cf) os << ' ' << *key.cf;
    if (key.cq) os << ':' << *key.cq;
    if (key.visibility) os << " [" << *key.visibility << ']';
    if (key.timestamp) os << ' ' << *key.timestamp;
    return os;
}

std::ostream& operator<<(std::ostream& os, const KeyValue& kv) {
    return os << kv.key() << " -> " << kv.value();
}

}  // namespace accumulo
