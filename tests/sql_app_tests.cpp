#include <cassert>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/sql_app.hpp"
#include "fake_executors.hpp"

using sqlcli::LineAction;
using sqlcli::SqlApp;
using sqlcli::testing::FailingExecutor;
using sqlcli::testing::StaticExecutor;

namespace {

constexpr const char *kHistoryFile = "/tmp/sqlcli_app_tests_history";

void test_single_line_statement_prints_rows() {
    auto executor = std::make_unique<StaticExecutor>(sqlcli::ResultSet{{"1", "alice"}, {"2", "bob"}});
    auto *raw = executor.get();
    SqlApp app(std::move(executor), kHistoryFile);
    app.completer().schema_loader().wait();

    std::ostringstream out;
    std::ostringstream err;
    assert(app.handle_line("SELECT id, name FROM users;", out, err) == LineAction::Continue);

    assert(out.str() == "1 | alice\n2 | bob\n(2 rows)\n");
    assert(err.str().empty());
    assert(raw->statements().back() == "SELECT id, name FROM users;");
}

void test_multi_line_statement_is_buffered() {
    auto executor = std::make_unique<StaticExecutor>(sqlcli::ResultSet{{"42"}});
    auto *raw = executor.get();
    SqlApp app(std::move(executor), kHistoryFile);
    app.completer().schema_loader().wait();

    std::ostringstream out;
    std::ostringstream err;

    assert(app.handle_line("SELECT count(*)", out, err) == LineAction::Continue);
    assert(app.pending_statement() == "SELECT count(*)");
    assert(out.str().empty());

    // Quit words inside a statement are statement text.
    assert(app.handle_line("  exit", out, err) == LineAction::Continue);
    assert(app.handle_line("FROM users;  ", out, err) == LineAction::Continue);

    assert(app.pending_statement().empty());
    assert(raw->statements().back() == "SELECT count(*)\n  exit\nFROM users;");
    assert(out.str() == "42\n(1 row)\n");
}

void test_query_error_goes_to_err() {
    SqlApp app(std::make_unique<FailingExecutor>("relation \"nope\" does not exist"), kHistoryFile);
    app.completer().schema_loader().wait();

    std::ostringstream out;
    std::ostringstream err;
    assert(app.handle_line("SELECT * FROM nope;", out, err) == LineAction::Continue);

    assert(out.str().empty());
    assert(err.str() == "error: relation \"nope\" does not exist\n");
}

void test_quit_commands_and_blank_lines() {
    SqlApp app(std::make_unique<StaticExecutor>(sqlcli::ResultSet{}), kHistoryFile);
    app.completer().schema_loader().wait();

    std::ostringstream out;
    std::ostringstream err;

    assert(app.handle_line("   ", out, err) == LineAction::Continue);
    assert(app.pending_statement().empty());

    const std::vector<std::string> quit_lines{"quit", "exit;", " .quit ", ".exit"};
    for (const auto &line : quit_lines) {
        assert(app.handle_line(line, out, err) == LineAction::Quit);
    }

    assert(out.str().empty());
    assert(err.str().empty());
}

void test_null_executor_is_rejected() {
    bool threw = false;
    try {
        SqlApp app(nullptr, kHistoryFile);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    test_single_line_statement_prints_rows();
    test_multi_line_statement_is_buffered();
    test_query_error_goes_to_err();
    test_quit_commands_and_blank_lines();
    test_null_executor_is_rejected();

    return 0;
}
