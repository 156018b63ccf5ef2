#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace accumulo {

// Row ids, column parts and values are arbitrary bytes held in std::string.

struct Key {
    std::string row;
    std::optional<std::string> cf;
    std::optional<std::string> cq;
    std::optional<std::string> visibility;
    std::optional<std::int64_t> timestamp;

    bool operator==(const Key&) const = default;
};

struct Range {
    std::optional<Key> start_key;
    bool start_inclusive = true;
    std::optional<Key> end_key;
    bool end_inclusive = false;

    bool operator==(const Range&) const = default;

    /**
     * @brief Range covering exactly one row, row+family, or row+family+qualifier
     *
     * The end key is the most specific component with "\x00" appended, exclusive.
     */
    static Range exact(const std::string& row,
                       const std::optional<std::string>& cf = std::nullopt,
                       const std::optional<std::string>& cq = std::nullopt);

    /**
     * @brief Range covering every key starting with the given components
     *
     * The end key is the most specific component with "\xff" appended, inclusive.
     */
    static Range prefix(const std::string& row,
                        const std::optional<std::string>& cf = std::nullopt,
                        const std::optional<std::string>& cq = std::nullopt);
};

struct ScanColumn {
    std::string cf;
    std::optional<std::string> cq;
};

struct IteratorSetting {
    int priority = 0;
    std::string name;
    std::string iterator_class;
    std::map<std::string, std::string> properties;
};

using AuthorizationSet = std::set<std::string>;

struct ScanOptions {
    // nullopt => scan with the user's own authorizations
    std::optional<AuthorizationSet> authorizations;
    std::vector<ScanColumn> columns;
    std::vector<IteratorSetting> iterators;
    std::optional<Range> range;
    std::optional<std::int32_t> buffer_size;
};

struct BatchScanOptions {
    std::optional<AuthorizationSet> authorizations;
    std::vector<ScanColumn> columns;
    std::vector<IteratorSetting> iterators;
    std::vector<Range> ranges;
    std::optional<std::int32_t> threads;
};

enum class Durability { Default, None, Log, Flush, Sync };

// Forwarded to the proxy, which owns buffering and flush timing.
struct WriterOptions {
    std::optional<std::int64_t> max_memory;
    std::optional<std::int64_t> latency_ms;
    std::optional<std::int64_t> timeout_ms;
    std::optional<std::int32_t> threads;
    Durability durability = Durability::Default;
};

struct Mutation {
    std::string row;
    std::string cf;
    std::string cq;
    std::string visibility;
    std::optional<std::int64_t> timestamp;
    std::string value;
    bool delete_cell = false;
};

enum class TimeType { Logical, Millis };

class KeyValue {
public:
    KeyValue() = default;
    KeyValue(Key key, std::string value)
        : key_(std::move(key)), value_(std::move(value)) {}

    const Key& key() const noexcept { return key_; }
    const std::string& row() const noexcept { return key_.row; }
    const std::string& cf() const noexcept { return key_.cf ? *key_.cf : empty(); }
    const std::string& cq() const noexcept { return key_.cq ? *key_.cq : empty(); }
    const std::string& visibility() const noexcept { return key_.visibility ? *key_.visibility : empty(); }
    std::int64_t timestamp() const noexcept { return key_.timestamp.value_or(0); }
    const std::string& value() const noexcept { return value_; }

    bool operator==(const KeyValue&) const = default;

private:
    static const std::string& empty() noexcept;

    Key key_;
    std::string value_;
};

const char* to_string(TimeType type) noexcept;
const char* to_string(Durability durability) noexcept;

std::ostream& operator<<(std::ostream& os, const Key& key);
std::ostream& operator<<(std::ostream& os, const KeyValue& kv);

}  // namespace accumulo
