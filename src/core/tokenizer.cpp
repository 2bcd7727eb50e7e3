#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace sqlcli {

std::string_view Tokenizer::extract_last_word(std::string_view text_before_cursor) noexcept {
    const auto last_delimiter = text_before_cursor.find_last_of(kWordDelimiters);
    if (last_delimiter == std::string_view::npos) {
        return text_before_cursor;
    }

    return text_before_cursor.substr(last_delimiter + 1);
}

std::expected<std::vector<std::string>, TokenizeError> Tokenizer::split_arguments(std::string_view input) const {
    std::vector<std::string> arguments;
    std::string argument;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    bool in_argument = false;

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && current != '\\' && current != '"') {
                argument.push_back('\\');
            }
            argument.push_back(current);
            escaped = false;
            continue;
        }

        if (current == '\\' && !single_quoted) {
            escaped = true;
            in_argument = true;
            continue;
        }

        if (current == '\'' && !double_quoted) {
            single_quoted = !single_quoted;
            in_argument = true;
            continue;
        }

        if (current == '"' && !single_quoted) {
            double_quoted = !double_quoted;
            in_argument = true;
            continue;
        }

        if (!single_quoted && !double_quoted && std::isspace(static_cast<unsigned char>(current))) {
            if (in_argument) {
                arguments.push_back(std::move(argument));
                argument.clear();
                in_argument = false;
            }
            continue;
        }

        argument.push_back(current);
        in_argument = true;
    }

    if (single_quoted || double_quoted) {
        return std::unexpected(TokenizeError{"unterminated quote"});
    }

    if (escaped) {
        return std::unexpected(TokenizeError{"trailing backslash"});
    }

    if (in_argument) {
        arguments.push_back(std::move(argument));
    }

    return arguments;
}

} // namespace sqlcli
