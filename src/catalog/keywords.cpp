#include "catalog/keywords.hpp"

#include <array>

namespace sqlcli {

namespace {

constexpr std::array kKeywords = std::to_array<std::string_view>({
    "ADD",       "ALL",       "ALTER",     "AND",        "ANY",       "ARRAY",     "AS",        "ASC",
    "BETWEEN",   "BY",        "CASE",      "CAST",       "COLUMN",    "COPY",      "CREATE",    "CROSS",
    "DATABASE",  "DEFAULT",   "DELETE",    "DESC",       "DESCRIBE",  "DISTINCT",  "DROP",      "ELSE",
    "END",       "ENGINE",    "EXCEPT",    "EXISTS",     "EXPLAIN",   "EXTERNAL",  "FALSE",     "FETCH",
    "FIRST",     "FROM",      "FULL",      "GROUP",      "HAVING",    "IF",        "ILIKE",     "IN",
    "INDEX",     "INNER",     "INSERT",    "INTERSECT",  "INTERVAL",  "INTO",      "IS",        "JOIN",
    "LAST",      "LEFT",      "LIKE",      "LIMIT",      "NATURAL",   "NOT",       "NULL",      "NULLS",
    "OFFSET",    "ON",        "OR",        "ORDER",      "OUTER",     "OVER",      "PARTITION", "PRIMARY",
    "REPLACE",   "RIGHT",     "ROWS",      "SELECT",     "SET",       "SHOW",      "TABLE",     "TABLES",
    "THEN",      "TO",        "TRUE",      "TRUNCATE",   "UNION",     "UNNEST",    "UPDATE",    "USE",
    "USING",     "VALUES",    "VIEW",      "WHEN",       "WHERE",     "WITH",
});

constexpr std::array kFunctions = std::to_array<std::string_view>({
    "ABS",           "ARRAY_AGG",     "ARRAY_CONCAT",  "ARRAY_COUNT",   "ARRAY_DISTINCT", "ARRAY_SORT",
    "AVG",           "CEIL",          "COALESCE",      "CONCAT",        "COUNT",          "CURRENT_DATE",
    "CURRENT_TIMESTAMP", "DATE_ADD",  "DATE_DIFF",     "DATE_TRUNC",    "EXTRACT",        "FLOOR",
    "GREATEST",      "IFNULL",        "LEAST",         "LENGTH",        "LOWER",          "LPAD",
    "LTRIM",         "MAX",           "MIN",           "NOW",           "NULLIF",         "RANDOM",
    "REGEXP_LIKE",   "ROUND",         "RPAD",          "RTRIM",         "SPLIT_PART",     "SQRT",
    "STRPOS",        "SUBSTRING",     "SUM",           "TO_DATE",       "TO_TIMESTAMP",   "TRIM",
    "TRY_CAST",      "UPPER",
});

} // namespace

std::span<const std::string_view> sql_keywords() noexcept { return kKeywords; }

std::span<const std::string_view> sql_functions() noexcept { return kFunctions; }

} // namespace sqlcli
