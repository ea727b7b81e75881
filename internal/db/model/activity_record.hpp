#pragma once

#include <cstdint>
#include <string>

namespace quotecast::db::model {

struct ActivityRecord {
  uint64_t    id = 0;  // assigned by the backend
  std::string kind;
  int64_t     occurred_at_ms = 0;
};

} // namespace quotecast::db::model
