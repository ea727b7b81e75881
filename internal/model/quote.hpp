#pragma once

#include <set>
#include <string>

namespace quotecast::model {

// Owned by the content subsystem; read-only for scheduling.
struct Quote {
  std::string           id;
  std::string           text;
  std::string           author;
  std::set<std::string> categories;
  bool                  is_favorite = false;
};

} // namespace quotecast::model
