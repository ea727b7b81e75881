#include "eligibility_selector.hpp"

#include <algorithm>
#include <chrono>

namespace quotecast::scheduling {

std::chrono::days RecencyWindow(const model::Schedule& schedule) {
  return std::chrono::days{std::clamp(schedule.exclude_recent_days, 0, model::kMaxExcludeRecentDays)};
}

QuoteSelector::QuoteSelector() : rng_(std::random_device{}()) {
}

QuoteSelector::QuoteSelector(uint64_t seed) : rng_(seed) {
}

std::vector<model::Quote> QuoteSelector::Candidates(const model::Schedule& schedule, const std::vector<model::Quote>& catalog) {
  std::vector<model::Quote> out;
  for (const auto& quote : catalog) {
    if (schedule.favorites_only && !quote.is_favorite) {
      continue;
    }
    if (!schedule.categories.empty()) {
      const bool hit = std::any_of(quote.categories.begin(), quote.categories.end(),
                                   [&](const std::string& c) { return schedule.categories.contains(c); });
      if (!hit) {
        continue;
      }
    }
    out.push_back(quote);
  }
  return out;
}

std::set<std::string> QuoteSelector::ExcludedQuoteIds(const model::Schedule& schedule, const std::vector<model::DeliveryRecord>& history,
                                                      util::TimePoint now) {
  std::set<std::string> excluded;
  if (schedule.exclude_recent_days <= 0) {
    return excluded;
  }

  if (schedule.last_delivered_quote_id) {
    excluded.insert(*schedule.last_delivered_quote_id);
  }

  const auto window_start = now - RecencyWindow(schedule);
  for (const auto& record : history) {
    if (record.schedule_id == schedule.id && record.delivered_at >= window_start) {
      excluded.insert(record.quote_id);
    }
  }
  return excluded;
}

std::vector<model::Quote> QuoteSelector::EligibleQuotes(const model::Schedule& schedule, const std::vector<model::Quote>& catalog,
                                                        const std::vector<model::DeliveryRecord>& history, util::TimePoint now) {
  const auto excluded = ExcludedQuoteIds(schedule, history, now);

  auto candidates = Candidates(schedule, catalog);
  std::erase_if(candidates, [&](const model::Quote& q) { return excluded.contains(q.id); });
  return candidates;
}

std::optional<model::Quote> QuoteSelector::SelectNext(const model::Schedule& schedule, const std::vector<model::Quote>& catalog,
                                                      const std::vector<model::DeliveryRecord>& history, util::TimePoint now) {
  auto eligible = EligibleQuotes(schedule, catalog, history, now);
  if (eligible.empty()) {
    return std::nullopt;
  }

  std::uniform_int_distribution<std::size_t> pick(0, eligible.size() - 1);

  std::size_t index = 0;
  {
    std::lock_guard lock(mutex_);
    index = pick(rng_);
  }
  return std::move(eligible[index]);
}

} // namespace quotecast::scheduling
