#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "schema/schema_row.hpp"

namespace sqlcli {

struct SchemaSnapshot {
    std::vector<SchemaRow> rows;
    // Distinct table names in order of first appearance.
    std::vector<std::string> table_names;

    [[nodiscard]] bool empty() const noexcept { return rows.empty(); }
};

// Populated at most once. Readers hold an immutable snapshot and never see a partial row set.
class SchemaIndex {
  public:
    SchemaIndex();

    SchemaIndex(const SchemaIndex &) = delete;
    SchemaIndex &operator=(const SchemaIndex &) = delete;

    [[nodiscard]] std::shared_ptr<const SchemaSnapshot> snapshot() const;

    // Throws std::logic_error if the index was already published.
    void publish(std::vector<SchemaRow> rows);

    [[nodiscard]] bool published() const;

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SchemaSnapshot> snapshot_;
    bool published_{false};
};

} // namespace sqlcli
