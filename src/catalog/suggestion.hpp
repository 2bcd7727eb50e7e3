#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sqlcli {

enum class SuggestionKind {
    Keyword,
    Function,
    Table,
    Column,
};

[[nodiscard]] constexpr std::string_view to_string(SuggestionKind kind) noexcept {
    switch (kind) {
    case SuggestionKind::Keyword:
        return "KEYWORD";
    case SuggestionKind::Function:
        return "FUNCTION";
    case SuggestionKind::Table:
        return "TABLE";
    case SuggestionKind::Column:
        return "COLUMN";
    }

    return "UNKNOWN";
}

struct Suggestion {
    std::string label;
    SuggestionKind kind;
    std::optional<std::string> detail;

    // Text shown next to the label: the detail when present, the kind name otherwise.
    [[nodiscard]] std::string meta() const { return detail.value_or(std::string(to_string(kind))); }
};

} // namespace sqlcli
