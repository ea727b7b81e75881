#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/entity_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/activity.hpp"
#include "internal/util/time.hpp"

namespace quotecast::analytics {

/*
  EngagementService

  Activity log + streak summaries. Summaries are cached in the kStreak
  partition under "<kind>@<local date of now>" ("*" = every kind); any new
  activity clears the partition since it can change every cached day.
*/
class EngagementService {
 public:
  static constexpr const char* kAllKinds = "*";

  EngagementService(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache, util::TimeZone zone);

  // Throws util::InvalidArgument on an empty or reserved kind.
  void RecordActivity(const std::string& kind, util::TimePoint at);

  // kind = nullopt summarizes every kind together.
  model::StreakSummary Summary(const std::optional<std::string>& kind, util::TimePoint now);

  std::vector<util::TimePoint> Timestamps(const std::optional<std::string>& kind);

  // Called after writes that bypass RecordActivity (deliveries).
  void InvalidateSummaries();

  const util::TimeZone& zone() const {
    return zone_;
  }

 private:
  std::vector<util::TimePoint> Timestamps(db::Transaction& tx, const std::optional<std::string>& kind);

  std::string CacheKey(const std::optional<std::string>& kind, util::TimePoint now) const;

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<cache::EntityCache> cache_;
  util::TimeZone                      zone_;
};

} // namespace quotecast::analytics
