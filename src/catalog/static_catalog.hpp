#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "catalog/suggestion.hpp"

namespace sqlcli {

class StaticCatalog {
  public:
    StaticCatalog();
    StaticCatalog(std::span<const std::string_view> keywords, std::span<const std::string_view> functions);

    [[nodiscard]] const std::vector<Suggestion> &suggestions() const noexcept;

  private:
    std::vector<Suggestion> suggestions_;
};

} // namespace sqlcli
