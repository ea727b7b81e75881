#include "parse.hpp"

#include <charconv>

namespace quotecast::util {

std::optional<int> ParseInt(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace quotecast::util
