#pragma once

#include <string>

#include "query/query_executor.hpp"

namespace sqlcli {

struct SchemaRow {
    std::string table;
    std::string column;
    std::string declared_type;

    // Throws std::invalid_argument unless the row has exactly three fields.
    [[nodiscard]] static SchemaRow from_result_row(const ResultRow &row);

    bool operator==(const SchemaRow &) const = default;
};

} // namespace sqlcli
