#include "engagement_service.hpp"

#include <algorithm>

#include "internal/analytics/streak_calculator.hpp"
#include "internal/db/mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace quotecast::analytics {

EngagementService::EngagementService(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache,
                                     util::TimeZone zone)
    : repository_(std::move(repository)), cache_(std::move(cache)), zone_(zone) {
}

void EngagementService::RecordActivity(const std::string& kind, util::TimePoint at) {
  if (kind.empty() || kind == kAllKinds || std::any_of(kind.begin(), kind.end(), [](unsigned char c) { return c < 0x20; })) {
    throw util::InvalidArgument("invalid activity kind '" + kind + "'");
  }

  db::model::ActivityRecord record{.id = 0, .kind = kind, .occurred_at_ms = util::ToUnixMillis(at)};

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertActivity(*tx, record), "record activity " + kind);
  tx->Commit();

  InvalidateSummaries();
  QUOTECAST_LOG_DEBUG("activity recorded", {observability::StringField("kind", kind), observability::IntField("id", static_cast<int64_t>(record.id))});
}

std::vector<util::TimePoint> EngagementService::Timestamps(const std::optional<std::string>& kind) {
  auto tx  = repository_->Begin();
  auto out = Timestamps(*tx, kind);
  tx->Commit();
  return out;
}

std::vector<util::TimePoint> EngagementService::Timestamps(db::Transaction& tx, const std::optional<std::string>& kind) {
  auto rows = repository_->ListActivity(tx, kind);

  std::vector<util::TimePoint> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(util::FromUnixMillis(row.occurred_at_ms));
  }
  return out;
}

model::StreakSummary EngagementService::Summary(const std::optional<std::string>& kind, util::TimePoint now) {
  const auto key = CacheKey(kind, now);
  if (auto cached = cache_->Get<cache::CacheType::kStreak>(key)) {
    return *cached;
  }

  // RecordActivity clears the partition after its commit, so the Put has to
  // happen before this transaction ends.
  auto tx      = repository_->Begin();
  auto summary = Summarize(Timestamps(*tx, kind), zone_, now);
  cache_->Put<cache::CacheType::kStreak>(key, summary);
  tx->Commit();
  return summary;
}

void EngagementService::InvalidateSummaries() {
  cache_->Clear(cache::CacheType::kStreak);
}

std::string EngagementService::CacheKey(const std::optional<std::string>& kind, util::TimePoint now) const {
  return kind.value_or(kAllKinds) + "@" + util::FormatDate(zone_.LocalDate(now));
}

} // namespace quotecast::analytics
