#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "schema/schema_index.hpp"
#include "schema/schema_row.hpp"

using sqlcli::SchemaIndex;
using sqlcli::SchemaRow;

namespace {

std::vector<SchemaRow> sample_rows() {
    return {
        SchemaRow{.table = "users", .column = "id", .declared_type = "int"},
        SchemaRow{.table = "orders", .column = "id", .declared_type = "bigint"},
        SchemaRow{.table = "users", .column = "name", .declared_type = "text"},
        SchemaRow{.table = "users", .column = "name", .declared_type = "text"},
    };
}

void test_index_starts_empty() {
    SchemaIndex index;
    const auto snapshot = index.snapshot();

    assert(snapshot != nullptr);
    assert(snapshot->empty());
    assert(snapshot->table_names.empty());
    assert(!index.published());
}

void test_publish_keeps_rows_and_derives_tables() {
    SchemaIndex index;
    index.publish(sample_rows());

    const auto snapshot = index.snapshot();
    assert(index.published());
    assert(snapshot->rows == sample_rows());
    assert(snapshot->table_names == std::vector<std::string>({"users", "orders"}));
}

void test_earlier_snapshot_is_not_mutated() {
    SchemaIndex index;
    const auto before = index.snapshot();

    index.publish(sample_rows());

    assert(before->empty());
    assert(index.snapshot()->rows.size() == 4);
}

void test_second_publish_is_rejected() {
    SchemaIndex index;
    index.publish(sample_rows());

    bool threw = false;
    try {
        index.publish({});
    } catch (const std::logic_error &) {
        threw = true;
    }

    assert(threw);
    assert(index.snapshot()->rows.size() == 4);
}

void test_schema_row_from_result_row() {
    const auto row = SchemaRow::from_result_row({"users", "id", "int"});
    assert(row.table == "users");
    assert(row.column == "id");
    assert(row.declared_type == "int");

    bool threw = false;
    try {
        static_cast<void>(SchemaRow::from_result_row({"users", "id"}));
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    test_index_starts_empty();
    test_publish_keeps_rows_and_derives_tables();
    test_earlier_snapshot_is_not_mutated();
    test_second_publish_is_rejected();
    test_schema_row_from_result_row();

    return 0;
}
