#pragma once

#include <span>
#include <string_view>

namespace sqlcli {

[[nodiscard]] std::span<const std::string_view> sql_keywords() noexcept;
[[nodiscard]] std::span<const std::string_view> sql_functions() noexcept;

} // namespace sqlcli
