#pragma once

#include <cstdint>
#include <string>

namespace quotecast::db::model {

struct DeliveryRecord {
  uint64_t    id = 0;  // assigned by the backend
  std::string quote_id;
  std::string schedule_id;
  int64_t     delivered_at_ms = 0;
};

} // namespace quotecast::db::model
