#pragma once

#include <optional>
#include <string_view>

namespace quotecast::util {

// Whole-string base-10 int; nullopt on empty input, stray characters or overflow.
std::optional<int> ParseInt(std::string_view text);

} // namespace quotecast::util
