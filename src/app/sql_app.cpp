#include "app/sql_app.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <readline/readline.h>

namespace sqlcli {

namespace {

constexpr const char *kPrompt = "sql> ";
constexpr const char *kContinuationPrompt = "...> ";

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] bool is_quit_command(std::string_view input) noexcept {
    if (input.ends_with(';')) {
        input.remove_suffix(1);
    }

    constexpr std::array<std::string_view, 4> kQuitCommands{"quit", "exit", ".quit", ".exit"};
    return std::ranges::find(kQuitCommands, trim(input)) != kQuitCommands.end();
}

[[nodiscard]] QueryExecutor &checked(const std::unique_ptr<QueryExecutor> &executor) {
    if (executor == nullptr) {
        throw std::invalid_argument("query executor must not be null");
    }

    return *executor;
}

void print_rows(const ResultSet &rows, std::ostream &out) {
    for (const auto &row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i > 0) {
                out << " | ";
            }
            out << row[i];
        }
        out << '\n';
    }

    out << '(' << rows.size() << (rows.size() == 1 ? " row)" : " rows)") << std::endl;
}

} // namespace

SqlApp::SqlApp(std::unique_ptr<QueryExecutor> executor, std::string history_file)
    : executor_(std::move(executor)),
      completer_(checked(executor_)),
      readline_completion_(completer_),
      history_manager_(std::move(history_file)) {}

int SqlApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    readline_completion_.install();
    history_manager_.initialize();

    while (true) {
        char *line = readline(pending_.empty() ? kPrompt : kContinuationPrompt);
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        history_manager_.record_input(input);

        const auto action = handle_line(input, std::cout, std::cerr);
        completer_.schema_loader().rethrow_if_faulted();

        if (action == LineAction::Quit) {
            break;
        }
    }

    history_manager_.save();
    return 0;
}

LineAction SqlApp::handle_line(std::string_view line, std::ostream &out, std::ostream &err) {
    const auto trimmed = trim(line);

    if (pending_.empty()) {
        if (trimmed.empty()) {
            return LineAction::Continue;
        }

        if (is_quit_command(trimmed)) {
            return LineAction::Quit;
        }
    }

    if (!pending_.empty()) {
        pending_.push_back('\n');
    }
    pending_ += line;

    if (!trimmed.ends_with(';')) {
        readline_completion_.set_pending_text(pending_);
        return LineAction::Continue;
    }

    const std::string statement = std::move(pending_);
    pending_.clear();
    readline_completion_.set_pending_text({});

    execute_statement(trim(statement), out, err);
    return LineAction::Continue;
}

void SqlApp::execute_statement(std::string_view statement, std::ostream &out, std::ostream &err) {
    const auto result = executor_->execute(statement);
    if (!result.has_value()) {
        err << "error: " << result.error().message << std::endl;
        return;
    }

    print_rows(*result, out);
}

} // namespace sqlcli
