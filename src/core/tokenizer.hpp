#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sqlcli {

struct TokenizeError {
    std::string message;
};

class Tokenizer {
  public:
    // Characters that end the word being completed.
    static constexpr std::string_view kWordDelimiters = " ,\n);(.";

    [[nodiscard]] static std::string_view extract_last_word(std::string_view text_before_cursor) noexcept;

    // Shell-style argument splitting for configured command lines.
    [[nodiscard]] std::expected<std::vector<std::string>, TokenizeError> split_arguments(std::string_view input) const;
};

} // namespace sqlcli
