#include "accumulo/marshal.h"

#include <unordered_map>

namespace accumulo::marshal {

namespace {

// Fields shared by ScanOptions and BatchScanOptions.
template <class Options, class Wire>
void fill_common(const Options& options, Wire* wire) {
    if (options.authorizations) {
        auto* auths = wire->mutable_authorizations();
        for (const auto& auth : *options.authorizations) {
            auths->add_values(auth);
        }
    }
    for (const auto& column : options.columns) {
        *wire->add_columns() = to_wire(column);
    }
    for (const auto& setting : options.iterators) {
        *wire->add_iterators() = to_wire(setting);
    }
}

}  // namespace

proxy::Key to_wire(const Key& key) {
    proxy::Key wire;
    wire.set_row(key.row);
    if (key.cf) wire.set_col_family(*key.cf);
    if (key.cq) wire.set_col_qualifier(*key.cq);
    if (key.visibility) wire.set_col_visibility(*key.visibility);
    if (key.timestamp) wire.set_timestamp(*key.timestamp);
    return wire;
}

proxy::Range to_wire(const Range& range) {
    proxy::Range wire;
    if (range.start_key) *wire.mutable_start() = to_wire(*range.start_key);
    wire.set_start_inclusive(range.start_inclusive);
    if (range.end_key) *wire.mutable_stop() = to_wire(*range.end_key);
    wire.set_stop_inclusive(range.end_inclusive);
    return wire;
}

proxy::ScanColumn to_wire(const ScanColumn& column) {
    proxy::ScanColumn wire;
    wire.set_col_family(column.cf);
    if (column.cq) wire.set_col_qualifier(*column.cq);
    return wire;
}

proxy::IteratorSetting to_wire(const IteratorSetting& setting) {
    proxy::IteratorSetting wire;
    wire.set_priority(setting.priority);
    wire.set_name(setting.name);
    wire.set_iterator_class(setting.iterator_class);
    for (const auto& [name, value] : setting.properties) {
        (*wire.mutable_properties())[name] = value;
    }
    return wire;
}

proxy::ScanOptions to_wire(const ScanOptions& options) {
    proxy::ScanOptions wire;
    fill_common(options, &wire);
    if (options.range) *wire.mutable_range() = to_wire(*options.range);
    if (options.buffer_size) wire.set_buffer_size(*options.buffer_size);
    return wire;
}

proxy::BatchScanOptions to_wire(const BatchScanOptions& options) {
    proxy::BatchScanOptions wire;
    fill_common(options, &wire);
    for (const auto& range : options.ranges) {
        *wire.add_ranges() = to_wire(range);
    }
    if (options.threads) wire.set_threads(*options.threads);
    return wire;
}

proxy::WriterOptions to_wire(const WriterOptions& options) {
    proxy::WriterOptions wire;
    if (options.max_memory) wire.set_max_memory(*options.max_memory);
    if (options.latency_ms) wire.set_latency_ms(*options.latency_ms);
    if (options.timeout_ms) wire.set_timeout_ms(*options.timeout_ms);
    if (options.threads) wire.set_threads(*options.threads);
    wire.set_durability(to_wire(options.durability));
    return wire;
}

proxy::TimeType to_wire(TimeType type) {
    return type == TimeType::Logical ? proxy::LOGICAL : proxy::MILLIS;
}

proxy::Durability to_wire(Durability durability) {
    switch (durability) {
        case Durability::None: return proxy::DURABILITY_NONE;
        case Durability::Log: return proxy::DURABILITY_LOG;
        case Durability::Flush: return proxy::DURABILITY_FLUSH;
        case Durability::Sync: return proxy::DURABILITY_SYNC;
        case Durability::Default: break;
    }
    return proxy::DURABILITY_DEFAULT;
}

proxy::ColumnUpdate to_wire(const Mutation& mutation) {
    proxy::ColumnUpdate wire;
    wire.set_col_family(mutation.cf);
    wire.set_col_qualifier(mutation.cq);
    wire.set_col_visibility(mutation.visibility);
    if (mutation.timestamp) wire.set_timestamp(*mutation.timestamp);
    wire.set_value(mutation.value);
    wire.set_delete_cell(mutation.delete_cell);
    return wire;
}

std::vector<proxy::RowUpdates> index_mutations(const std::vector<Mutation>& mutations) {
    std::vector<proxy::RowUpdates> rows;
    std::unordered_map<std::string, std::size_t> position;
    for (const auto& mutation : mutations) {
        auto [it, inserted] = position.try_emplace(mutation.row, rows.size());
        if (inserted) {
            rows.emplace_back().set_row(mutation.row);
        }
        *rows[it->second].add_updates() = to_wire(mutation);
    }
    return rows;
}

Key from_wire(const proxy::Key& key) {
    Key out;
    out.row = key.row();
    if (key.has_col_family()) out.cf = key.col_family();
    if (key.has_col_qualifier()) out.cq = key.col_qualifier();
    if (key.has_col_visibility()) out.visibility = key.col_visibility();
    if (key.has_timestamp()) out.timestamp = key.timestamp();
    return out;
}

KeyValue from_wire(const proxy::KeyValue& kv) {
    return KeyValue{from_wire(kv.key()), kv.value()};
}

std::vector<std::string> to_wire(const AuthorizationSet& auths) {
    return {auths.begin(), auths.end()};
}

AuthorizationSet authorizations_from_wire(const std::vector<std::string>& auths) {
    return {auths.begin(), auths.end()};
}

}  // namespace accumulo::marshal
