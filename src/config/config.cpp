#include "config/config.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

#include "core/tokenizer.hpp"

namespace sqlcli {

namespace {

[[nodiscard]] std::optional<std::string_view> env(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string_view(value);
}

[[nodiscard]] std::expected<char, ConfigError> parse_separator(std::string_view value) {
    if (value == "\\t") {
        return '\t';
    }

    if (value.size() != 1) {
        return std::unexpected(
            ConfigError{std::format("SQLCLI_FIELD_SEPARATOR must be a single character, got '{}'", value)});
    }

    return value.front();
}

[[nodiscard]] std::string default_history_file() {
    const auto home = env("HOME");
    return std::string(home.value_or("")) + "/.sqlcli_history";
}

} // namespace

std::expected<Config, ConfigError> load_config() {
    const auto command_line = env("SQLCLI_QUERY_COMMAND");
    if (!command_line.has_value()) {
        return std::unexpected(ConfigError{"SQLCLI_QUERY_COMMAND is not set"});
    }

    auto arguments = Tokenizer().split_arguments(*command_line);
    if (!arguments.has_value()) {
        return std::unexpected(ConfigError{std::format("SQLCLI_QUERY_COMMAND: {}", arguments.error().message)});
    }

    if (arguments->empty()) {
        return std::unexpected(ConfigError{"SQLCLI_QUERY_COMMAND is empty"});
    }

    Config config;
    config.query_command = std::move(*arguments);

    if (const auto separator = env("SQLCLI_FIELD_SEPARATOR"); separator.has_value()) {
        const auto parsed = parse_separator(*separator);
        if (!parsed.has_value()) {
            return std::unexpected(parsed.error());
        }
        config.field_separator = *parsed;
    }

    const auto history_file = env("SQLCLI_HISTFILE");
    config.history_file = history_file.has_value() ? std::string(*history_file) : default_history_file();

    return config;
}

} // namespace sqlcli
