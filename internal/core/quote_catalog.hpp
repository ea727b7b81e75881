#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/entity_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/quote.hpp"

namespace quotecast::core {

/*
  QuoteCatalog

  Caching facade over the quotes table. Single-quote reads go through the
  kQuote cache partition; every write invalidates the touched id.

  Throws util::InvalidArgument / util::PersistenceFailure; ScheduleStore
  turns these into Status.
*/
class QuoteCatalog {
 public:
  QuoteCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache);

  std::optional<model::Quote> Get(const std::string& id);
  std::vector<model::Quote>   List(bool favorites_only = false);

  // Assigns a fresh id when quote.id is empty; returns the stored quote.
  model::Quote Upsert(model::Quote quote);

  // Missing ids are not an error.
  void Delete(const std::string& id);

  // Within an existing transaction; bypasses the cache.
  std::vector<model::Quote> List(db::Transaction& tx, bool favorites_only);

 private:
  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<cache::EntityCache> cache_;
};

} // namespace quotecast::core
