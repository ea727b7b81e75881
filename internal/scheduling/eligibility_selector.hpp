#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "internal/model/delivery.hpp"
#include "internal/model/quote.hpp"
#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace quotecast::scheduling {

// exclude_recent_days clamped to [0, kMaxExcludeRecentDays].
std::chrono::days RecencyWindow(const model::Schedule& schedule);

/*
  QuoteSelector

  candidates = catalog
               filtered by is_favorite   (favorites_only)
               filtered by category hit  (non-empty categories)
  excluded   = last_delivered_quote_id
               + quotes this schedule delivered since now - exclude_recent_days
               (nothing at all when exclude_recent_days is 0)
  eligible   = candidates - excluded

  Exclusion is schedule-scoped: history rows of other schedules are ignored.
  An empty eligible set is a normal outcome, not an error.
*/
class QuoteSelector {
 public:
  QuoteSelector();
  explicit QuoteSelector(uint64_t seed);

  static std::vector<model::Quote> Candidates(const model::Schedule& schedule, const std::vector<model::Quote>& catalog);

  static std::set<std::string> ExcludedQuoteIds(const model::Schedule& schedule, const std::vector<model::DeliveryRecord>& history,
                                                util::TimePoint now);

  static std::vector<model::Quote> EligibleQuotes(const model::Schedule& schedule, const std::vector<model::Quote>& catalog,
                                                  const std::vector<model::DeliveryRecord>& history, util::TimePoint now);

  // Uniform choice among EligibleQuotes(); nullopt when none is eligible.
  std::optional<model::Quote> SelectNext(const model::Schedule& schedule, const std::vector<model::Quote>& catalog,
                                         const std::vector<model::DeliveryRecord>& history, util::TimePoint now);

 private:
  std::mutex      mutex_;
  std::mt19937_64 rng_;
};

} // namespace quotecast::scheduling
