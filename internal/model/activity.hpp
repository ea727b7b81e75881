#pragma once

#include <string_view>

namespace quotecast::model {

// Recorded for every successful delivery; other kinds come from the host.
inline constexpr std::string_view kActivityQuoteDelivery = "quote_delivery";

struct StreakSummary {
  int current     = 0;
  int longest     = 0;
  int unique_days = 0;
};

} // namespace quotecast::model
