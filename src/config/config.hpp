#pragma once

#include <expected>
#include <string>
#include <vector>

namespace sqlcli {

struct ConfigError {
    std::string message;
};

struct Config {
    std::vector<std::string> query_command;
    char field_separator{','};
    std::string history_file;
};

// Reads SQLCLI_QUERY_COMMAND, SQLCLI_FIELD_SEPARATOR and SQLCLI_HISTFILE from the environment.
[[nodiscard]] std::expected<Config, ConfigError> load_config();

} // namespace sqlcli
