#include "quote_catalog.hpp"

#include <algorithm>

#include "internal/db/mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace quotecast::core {

namespace {

void ValidateQuote(const model::Quote& quote) {
  if (quote.text.empty()) {
    throw util::InvalidArgument("quote text must not be empty");
  }
  for (const auto& category : quote.categories) {
    if (category.empty() || std::any_of(category.begin(), category.end(), [](unsigned char c) { return c < 0x20; })) {
      throw util::InvalidArgument("invalid quote category '" + category + "'");
    }
  }
}

} // namespace

QuoteCatalog::QuoteCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::EntityCache> cache)
    : repository_(std::move(repository)), cache_(std::move(cache)) {
}

std::optional<model::Quote> QuoteCatalog::Get(const std::string& id) {
  if (auto cached = cache_->Get<cache::CacheType::kQuote>(id)) {
    return cached;
  }

  auto tx  = repository_->Begin();
  auto row = repository_->GetQuote(*tx, id);
  if (!row) {
    tx->Commit();
    return std::nullopt;
  }

  auto quote = db::FromRecord(*row);
  cache_->Put<cache::CacheType::kQuote>(id, quote);
  tx->Commit();
  return quote;
}

std::vector<model::Quote> QuoteCatalog::List(bool favorites_only) {
  auto tx  = repository_->Begin();
  auto out = List(*tx, favorites_only);
  tx->Commit();
  return out;
}

std::vector<model::Quote> QuoteCatalog::List(db::Transaction& tx, bool favorites_only) {
  std::vector<model::Quote> out;
  for (const auto& row : repository_->ListQuotes(tx, favorites_only)) {
    out.push_back(db::FromRecord(row));
  }
  return out;
}

model::Quote QuoteCatalog::Upsert(model::Quote quote) {
  ValidateQuote(quote);
  if (quote.id.empty()) {
    quote.id = util::NewId();
  }

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertQuote(*tx, db::ToRecord(quote)), "upsert quote " + quote.id);
  tx->Commit();

  cache_->Remove<cache::CacheType::kQuote>(quote.id);
  return quote;
}

void QuoteCatalog::Delete(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteQuote(*tx, id), "delete quote " + id);
  tx->Commit();

  cache_->Remove<cache::CacheType::kQuote>(id);
}

} // namespace quotecast::core
