#pragma once

#include <string>
#include <vector>

namespace quotecast::db::model {

struct QuoteRecord {
  std::string              id;
  std::string              text;
  std::string              author;
  std::vector<std::string> categories;
  bool                     is_favorite = false;
};

} // namespace quotecast::db::model
