#pragma once

#include <string>
#include <vector>

#include "accumulo/structs.h"
#include "accumulo_proxy.pb.h"

// Conversion between domain values and their wire representation.
namespace accumulo::marshal {

proxy::Key to_wire(const Key& key);
proxy::Range to_wire(const Range& range);
proxy::ScanColumn to_wire(const ScanColumn& column);
proxy::IteratorSetting to_wire(const IteratorSetting& setting);
proxy::ScanOptions to_wire(const ScanOptions& options);
proxy::BatchScanOptions to_wire(const BatchScanOptions& options);
proxy::WriterOptions to_wire(const WriterOptions& options);
proxy::TimeType to_wire(TimeType type);
proxy::Durability to_wire(Durability durability);
proxy::ColumnUpdate to_wire(const Mutation& mutation);

/**
 * @brief Groups mutations by row
 *
 * Rows appear in order of first appearance, column updates within a row in
 * insertion order. One RowUpdates entry per distinct row.
 */
std::vector<proxy::RowUpdates> index_mutations(const std::vector<Mutation>& mutations);

Key from_wire(const proxy::Key& key);
KeyValue from_wire(const proxy::KeyValue& kv);

std::vector<std::string> to_wire(const AuthorizationSet& auths);
AuthorizationSet authorizations_from_wire(const std::vector<std::string>& auths);

}  // namespace accumulo::marshal
