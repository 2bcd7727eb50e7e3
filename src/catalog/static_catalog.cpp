#include "catalog/static_catalog.hpp"

#include <string>

#include "catalog/keywords.hpp"

namespace sqlcli {

StaticCatalog::StaticCatalog() : StaticCatalog(sql_keywords(), sql_functions()) {}

StaticCatalog::StaticCatalog(std::span<const std::string_view> keywords, std::span<const std::string_view> functions) {
    suggestions_.reserve(keywords.size() + functions.size());

    for (const auto keyword : keywords) {
        suggestions_.push_back(Suggestion{.label = std::string(keyword), .kind = SuggestionKind::Keyword, .detail = {}});
    }

    for (const auto function : functions) {
        suggestions_.push_back(
            Suggestion{.label = std::string(function), .kind = SuggestionKind::Function, .detail = {}});
    }
}

const std::vector<Suggestion> &StaticCatalog::suggestions() const noexcept { return suggestions_; }

} // namespace sqlcli
