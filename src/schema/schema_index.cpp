#include "schema/schema_index.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sqlcli {

namespace {

[[nodiscard]] std::vector<std::string> distinct_table_names(const std::vector<SchemaRow> &rows) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;

    for (const auto &row : rows) {
        if (seen.insert(row.table).second) {
            names.push_back(row.table);
        }
    }

    return names;
}

} // namespace

SchemaIndex::SchemaIndex() : snapshot_(std::make_shared<const SchemaSnapshot>()) {}

std::shared_ptr<const SchemaSnapshot> SchemaIndex::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

void SchemaIndex::publish(std::vector<SchemaRow> rows) {
    auto table_names = distinct_table_names(rows);
    auto next = std::make_shared<const SchemaSnapshot>(
        SchemaSnapshot{.rows = std::move(rows), .table_names = std::move(table_names)});

    std::lock_guard lock(mutex_);
    if (published_) {
        throw std::logic_error("schema index already published");
    }

    snapshot_ = std::move(next);
    published_ = true;
}

bool SchemaIndex::published() const {
    std::lock_guard lock(mutex_);
    return published_;
}

} // namespace sqlcli
