#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "catalog/static_catalog.hpp"
#include "catalog/suggestion.hpp"
#include "schema/schema_index.hpp"
#include "schema/schema_loader.hpp"

namespace sqlcli {

class QueryExecutor;

struct RenderedCompletion {
    std::string label;
    // Negative: number of characters before the cursor the label replaces.
    int insertion_offset;
    std::string display;
    std::string meta;
    SuggestionKind kind;
};

// Markup form of a label with its first `highlighted` characters emphasised.
[[nodiscard]] std::string render_display(std::string_view label, std::size_t highlighted);

class Completer {
  public:
    // Starts the background schema load; does not wait for it.
    explicit Completer(QueryExecutor &executor);
    Completer(QueryExecutor &executor, StaticCatalog catalog);

    Completer(const Completer &) = delete;
    Completer &operator=(const Completer &) = delete;

    [[nodiscard]] std::vector<RenderedCompletion> complete(std::string_view full_text, std::size_t cursor) const;

    [[nodiscard]] const SchemaIndex &schema_index() const noexcept { return schema_index_; }
    [[nodiscard]] const SchemaLoader &schema_loader() const noexcept { return schema_loader_; }

  private:
    StaticCatalog catalog_;
    SchemaIndex schema_index_;
    // Declared last so the loader thread is joined before the index goes away.
    SchemaLoader schema_loader_;

    [[nodiscard]] std::vector<Suggestion> candidates(std::string_view full_text) const;
};

} // namespace sqlcli
