#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace quotecast::model {

struct DeliveryRecord {
  std::string     quote_id;
  std::string     schedule_id;
  util::TimePoint delivered_at{};
};

} // namespace quotecast::model
