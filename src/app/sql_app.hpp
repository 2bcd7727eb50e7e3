#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "completion/completer.hpp"
#include "history/history_manager.hpp"
#include "line_editing/completion.hpp"
#include "query/query_executor.hpp"

namespace sqlcli {

enum class LineAction {
    Continue,
    Quit,
};

class SqlApp {
  public:
    SqlApp(std::unique_ptr<QueryExecutor> executor, std::string history_file);

    int run();

    // Feeds one input line; executes the buffered statement once it ends with ';'.
    LineAction handle_line(std::string_view line, std::ostream &out, std::ostream &err);

    [[nodiscard]] const std::string &pending_statement() const noexcept { return pending_; }
    [[nodiscard]] const Completer &completer() const noexcept { return completer_; }

  private:
    std::unique_ptr<QueryExecutor> executor_;
    Completer completer_;
    ReadlineCompletion readline_completion_;
    HistoryManager history_manager_;
    std::string pending_;

    void execute_statement(std::string_view statement, std::ostream &out, std::ostream &err);
};

} // namespace sqlcli
