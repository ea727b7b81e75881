#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace quotecast::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Schedules
// ------------------------------------------------------------

Result MemoryRepository::InsertSchedule(Transaction& t, const model::ScheduleRecord& r) {
  if (TX(t).View().schedules.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "schedule " + r.id);

  if (r.is_default) {
    for (const auto& [_, existing] : TX(t).View().schedules) {
      if (existing.is_default) return Result::Err(ErrorCode::ConstraintViolation, "a default schedule already exists");
    }
  }

  TX(t).Mutable().schedules[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertDefaultScheduleIfAbsent(Transaction& t, const model::ScheduleRecord& r) {
  for (const auto& [_, existing] : TX(t).View().schedules) {
    if (existing.is_default) return Result::Err(ErrorCode::AlreadyExists, "default schedule " + existing.id);
  }

  auto record       = r;
  record.is_default = true;
  TX(t).Mutable().schedules[record.id] = record;
  return Result::Ok();
}

std::optional<model::ScheduleRecord> MemoryRepository::GetSchedule(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.schedules.find(id);
  if (it == s.schedules.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ScheduleRecord> MemoryRepository::GetDefaultSchedule(Transaction& t) {
  for (const auto& [_, record] : TX(t).View().schedules) {
    if (record.is_default) return record;
  }
  return std::nullopt;
}

std::vector<model::ScheduleRecord> MemoryRepository::ListSchedules(Transaction& t, bool enabled_only) {
  std::vector<model::ScheduleRecord> out;
  for (const auto& [_, record] : TX(t).View().schedules) {
    if (enabled_only && !record.is_enabled) continue;
    out.push_back(record);
  }

  std::sort(out.begin(), out.end(), [](const model::ScheduleRecord& a, const model::ScheduleRecord& b) {
    const auto a_minutes = a.scheduled_hour * 60 + a.scheduled_minute;
    const auto b_minutes = b.scheduled_hour * 60 + b.scheduled_minute;
    if (a_minutes != b_minutes) return a_minutes < b_minutes;
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.schedules.find(r.id);
  if (it == view.schedules.end()) return Result::Err(ErrorCode::NotFound, "schedule " + r.id);

  if (r.is_default && !it->second.is_default) {
    for (const auto& [id, existing] : view.schedules) {
      if (id != r.id && existing.is_default) return Result::Err(ErrorCode::ConstraintViolation, "a default schedule already exists");
    }
  }

  auto& stored = TX(t).Mutable().schedules[r.id];

  const auto last_quote    = stored.last_delivered_quote_id;
  const auto last_delivery = stored.last_delivery_at_ms;
  const auto created_at    = stored.created_at_ms;

  stored                         = r;
  stored.last_delivered_quote_id = last_quote;
  stored.last_delivery_at_ms     = last_delivery;
  stored.created_at_ms           = created_at;
  return Result::Ok();
}

Result MemoryRepository::UpdateLastDelivery(Transaction& t, const std::string& schedule_id, const std::string& quote_id,
                                            int64_t delivered_at_ms, std::optional<int64_t> expected_previous_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.schedules.find(schedule_id);
  if (it == view.schedules.end()) return Result::Err(ErrorCode::NotFound, "schedule " + schedule_id);
  if (it->second.last_delivery_at_ms != expected_previous_ms) {
    return Result::Err(ErrorCode::Conflict, "last delivery of schedule " + schedule_id + " changed concurrently");
  }

  auto& stored                   = TX(t).Mutable().schedules[schedule_id];
  stored.last_delivered_quote_id = quote_id;
  stored.last_delivery_at_ms     = delivered_at_ms;
  stored.updated_at_ms           = std::max(stored.updated_at_ms, delivered_at_ms);
  return Result::Ok();
}

Result MemoryRepository::DeleteSchedule(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.schedules.erase(id);
  std::erase_if(s.deliveries, [&](const model::DeliveryRecord& r) { return r.schedule_id == id; });
  return Result::Ok();
}

// ------------------------------------------------------------
// Delivery history
// ------------------------------------------------------------

Result MemoryRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.schedules.contains(r.schedule_id)) return Result::Err(ErrorCode::NotFound, "schedule " + r.schedule_id);

  r.id = s.next_delivery_id++;
  s.deliveries.push_back(r);
  return Result::Ok();
}

std::vector<model::DeliveryRecord> MemoryRepository::ListDeliveriesSince(Transaction& t, const std::string& schedule_id, int64_t since_ms) {
  std::vector<model::DeliveryRecord> out;
  for (const auto& r : TX(t).View().deliveries) {
    if (r.schedule_id == schedule_id && r.delivered_at_ms >= since_ms) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const model::DeliveryRecord& a, const model::DeliveryRecord& b) { return a.delivered_at_ms < b.delivered_at_ms; });
  return out;
}

Result MemoryRepository::DeleteDeliveriesOlderThan(Transaction& t, int64_t cutoff_ms) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.deliveries, [&](const model::DeliveryRecord& r) { return r.delivered_at_ms < cutoff_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------
// Quotes
// ------------------------------------------------------------

Result MemoryRepository::UpsertQuote(Transaction& t, const model::QuoteRecord& r) {
  TX(t).Mutable().quotes[r.id] = r;
  return Result::Ok();
}

std::optional<model::QuoteRecord> MemoryRepository::GetQuote(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.quotes.find(id);
  if (it == s.quotes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QuoteRecord> MemoryRepository::ListQuotes(Transaction& t, bool favorites_only) {
  std::vector<model::QuoteRecord> out;
  for (const auto& [_, record] : TX(t).View().quotes) {
    if (favorites_only && !record.is_favorite) continue;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteQuote(Transaction& t, const std::string& id) {
  TX(t).Mutable().quotes.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Activity
// ------------------------------------------------------------

Result MemoryRepository::InsertActivity(Transaction& t, model::ActivityRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_activity_id++;
  s.activity.push_back(r);
  return Result::Ok();
}

std::vector<model::ActivityRecord> MemoryRepository::ListActivity(Transaction& t, const std::optional<std::string>& kind) {
  std::vector<model::ActivityRecord> out;
  for (const auto& r : TX(t).View().activity) {
    if (kind && r.kind != *kind) continue;
    out.push_back(r);
  }
  return out;
}

} // namespace quotecast::db::memory
