#include "schema/schema_row.hpp"

#include <format>
#include <stdexcept>

namespace sqlcli {

SchemaRow SchemaRow::from_result_row(const ResultRow &row) {
    if (row.size() != 3) {
        throw std::invalid_argument(
            std::format("schema row must have 3 fields (table, column, type), got {}", row.size()));
    }

    return SchemaRow{.table = row[0], .column = row[1], .declared_type = row[2]};
}

} // namespace sqlcli
