#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

#include "query/query_executor.hpp"

namespace sqlcli {

struct ProcessOutput {
    std::string out;
    std::string err;
    int exit_code{0};
};

// Runs statements through an external client: argv + [statement], stdout parsed as separated rows.
class CommandQueryExecutor final : public QueryExecutor {
  public:
    CommandQueryExecutor(std::vector<std::string> argv, char field_separator);

    [[nodiscard]] std::expected<ResultSet, QueryError> execute(std::string_view statement) override;

    [[nodiscard]] static ResultSet parse_rows(std::string_view output, char field_separator);

  private:
    std::vector<std::string> argv_;
    char field_separator_;

    [[nodiscard]] ProcessOutput run(std::string_view statement) const;
    [[noreturn]] static void exec_in_child(char *const argv[], int in_fd, int out_fd, int err_fd) noexcept;

    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace sqlcli
