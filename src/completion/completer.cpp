#include "completion/completer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

#include "core/tokenizer.hpp"

namespace sqlcli {

namespace {

[[nodiscard]] char to_upper(char c) noexcept {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

[[nodiscard]] bool starts_with_ignore_case(std::string_view text, std::string_view prefix) noexcept {
    if (prefix.size() > text.size()) {
        return false;
    }

    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char lhs, char rhs) {
        return to_upper(lhs) == to_upper(rhs);
    });
}

void append_escaped(std::string &out, std::string_view text) {
    for (const char c : text) {
        switch (c) {
        case '<':
            out += "&#60;";
            break;
        case '>':
            out += "&#62;";
            break;
        case '&':
            out += "&#38;";
            break;
        default:
            out.push_back(c);
        }
    }
}

} // namespace

std::string render_display(std::string_view label, std::size_t highlighted) {
    const auto split = std::min(highlighted, label.size());

    std::string display = "<b><style color='red'>";
    append_escaped(display, label.substr(0, split));
    display += "</style></b>";
    append_escaped(display, label.substr(split));

    return display;
}

Completer::Completer(QueryExecutor &executor) : Completer(executor, StaticCatalog()) {}

Completer::Completer(QueryExecutor &executor, StaticCatalog catalog)
    : catalog_(std::move(catalog)), schema_index_(), schema_loader_(executor, schema_index_) {}

std::vector<RenderedCompletion> Completer::complete(std::string_view full_text, std::size_t cursor) const {
    std::vector<RenderedCompletion> completions;

    const auto before_cursor = full_text.substr(0, std::min(cursor, full_text.size()));
    const auto word = Tokenizer::extract_last_word(before_cursor);
    if (word.empty()) {
        return completions;
    }

    const int insertion_offset = -static_cast<int>(word.size());

    for (auto &suggestion : candidates(full_text)) {
        if (!starts_with_ignore_case(suggestion.label, word)) {
            continue;
        }

        auto display = render_display(suggestion.label, word.size());
        auto meta = suggestion.meta();
        completions.push_back(RenderedCompletion{
            .label = std::move(suggestion.label),
            .insertion_offset = insertion_offset,
            .display = std::move(display),
            .meta = std::move(meta),
            .kind = suggestion.kind,
        });
    }

    return completions;
}

std::vector<Suggestion> Completer::candidates(std::string_view full_text) const {
    const auto schema = schema_index_.snapshot();
    std::vector<Suggestion> universe = catalog_.suggestions();

    for (const auto &table : schema->table_names) {
        universe.push_back(Suggestion{.label = table, .kind = SuggestionKind::Table, .detail = {}});
    }

    for (const auto &row : schema->rows) {
        if (full_text.find(row.table) == std::string_view::npos) {
            continue;
        }

        universe.push_back(Suggestion{
            .label = row.column,
            .kind = SuggestionKind::Column,
            .detail = std::format("COLUMN ({}, {})", row.declared_type, row.table),
        });
    }

    return universe;
}

} // namespace sqlcli
