#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sqlcli {

using ResultRow = std::vector<std::string>;
using ResultSet = std::vector<ResultRow>;

// Domain-level execution failure: lost connectivity, missing privileges, unknown relation.
struct QueryError {
    std::string message;
};

class QueryExecutor {
  public:
    virtual ~QueryExecutor() = default;

    // Infrastructure faults are thrown, never returned as QueryError.
    [[nodiscard]] virtual std::expected<ResultSet, QueryError> execute(std::string_view statement) = 0;
};

} // namespace sqlcli
