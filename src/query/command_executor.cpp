#include "query/command_executor.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sqlcli {

namespace {

// Exit status used by the child when exec fails, as shells do for unknown commands.
constexpr int kExecFailedStatus = 127;

[[noreturn]] void throw_errno(const char *what) { throw std::system_error(errno, std::generic_category(), what); }

class Pipe {
  public:
    Pipe() {
        if (::pipe2(fds_.data(), O_CLOEXEC) == -1) {
            throw_errno("pipe failed");
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept { close_fd(fds_[0]); }
    void close_write() noexcept { close_fd(fds_[1]); }

  private:
    std::array<int, 2> fds_{-1, -1};

    static void close_fd(int &fd) noexcept {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
};

// Read end for the child's stdin so a client never competes with readline for the terminal.
class NullInput {
  public:
    NullInput() : fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
        if (fd_ == -1) {
            throw_errno("open /dev/null failed");
        }
    }

    ~NullInput() { ::close(fd_); }

    NullInput(const NullInput &) = delete;
    NullInput &operator=(const NullInput &) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_; }

  private:
    int fd_;
};

void write_all(int fd, std::string_view text) noexcept {
    while (!text.empty()) {
        const ssize_t n = ::write(fd, text.data(), text.size());
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        text.remove_prefix(static_cast<std::size_t>(n));
    }
}

void drain(Pipe &out_pipe, Pipe &err_pipe, std::string &out, std::string &err) {
    std::array<pollfd, 2> fds{
        pollfd{.fd = out_pipe.read_end(), .events = POLLIN, .revents = 0},
        pollfd{.fd = err_pipe.read_end(), .events = POLLIN, .revents = 0},
    };
    std::array<std::string *, 2> sinks{&out, &err};
    std::array<char, 4096> buffer{};

    int open_streams = 2;
    while (open_streams > 0) {
        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("poll failed");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1 || fds[i].revents == 0) {
                continue;
            }

            const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }

            if (n == -1 && errno == EINTR) {
                continue;
            }

            if (n == -1) {
                throw_errno("read failed");
            }

            fds[i].fd = -1;
            --open_streams;
        }
    }
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

CommandQueryExecutor::CommandQueryExecutor(std::vector<std::string> argv, char field_separator)
    : argv_(std::move(argv)), field_separator_(field_separator) {
    if (argv_.empty()) {
        throw std::invalid_argument("query command must not be empty");
    }
}

std::expected<ResultSet, QueryError> CommandQueryExecutor::execute(std::string_view statement) {
    const auto output = run(statement);

    if (output.exit_code != 0) {
        const auto message = trim(output.err);
        if (!message.empty()) {
            return std::unexpected(QueryError{std::string(message)});
        }

        return std::unexpected(QueryError{std::format("{} exited with status {}", argv_.front(), output.exit_code)});
    }

    return parse_rows(output.out, field_separator_);
}

ResultSet CommandQueryExecutor::parse_rows(std::string_view output, char field_separator) {
    ResultSet rows;

    while (!output.empty()) {
        const auto newline = output.find('\n');
        auto line = output.substr(0, newline);
        output = newline == std::string_view::npos ? std::string_view{} : output.substr(newline + 1);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (line.empty()) {
            continue;
        }

        ResultRow row;
        std::size_t start = 0;
        for (;;) {
            const auto separator = line.find(field_separator, start);
            row.emplace_back(line.substr(start, separator - start));
            if (separator == std::string_view::npos) {
                break;
            }
            start = separator + 1;
        }

        rows.push_back(std::move(row));
    }

    return rows;
}

ProcessOutput CommandQueryExecutor::run(std::string_view statement) const {
    const std::string statement_arg(statement);

    std::vector<char *> argv;
    argv.reserve(argv_.size() + 2);
    for (const auto &arg : argv_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(const_cast<char *>(statement_arg.c_str()));
    argv.push_back(nullptr);

    NullInput null_input;
    Pipe out_pipe;
    Pipe err_pipe;

    const pid_t pid = ::fork();
    if (pid == -1) {
        throw_errno("fork failed");
    }

    if (pid == 0) {
        exec_in_child(argv.data(), null_input.fd(), out_pipe.write_end(), err_pipe.write_end());
    }

    out_pipe.close_write();
    err_pipe.close_write();

    ProcessOutput output;
    drain(out_pipe, err_pipe, output.out, output.err);
    output.exit_code = wait_for_process(pid);

    if (output.exit_code == kExecFailedStatus && output.err.empty()) {
        output.err = std::format("{}: command not found", argv_.front());
    }

    return output;
}

void CommandQueryExecutor::exec_in_child(char *const argv[], int in_fd, int out_fd, int err_fd) noexcept {
    // The parent may be multithreaded: only async-signal-safe calls until exec.
    // All descriptors are close-on-exec; dup2 clears the flag on the standard ones.
    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    ::execvp(argv[0], argv);

    write_all(STDERR_FILENO, argv[0]);
    write_all(STDERR_FILENO, ": cannot execute\n");
    ::_exit(kExecFailedStatus);
}

int CommandQueryExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (::waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw_errno("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int CommandQueryExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace sqlcli
