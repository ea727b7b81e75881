#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <charconv>

#include "internal/util/errors.hpp"

namespace quotecast::db::sqlite {

using quotecast::db::ErrorCode;
using quotecast::db::Result;

namespace {

// Category names never contain control characters, so US (0x1f) is a safe separator.
constexpr char kListSeparator = '\x1f';

constexpr const char* kScheduleColumns =
    "id,is_enabled,scheduled_hour,scheduled_minute,delivery_method,favorites_only,categories,exclude_recent_days,active_days,"
    "last_delivered_quote_id,last_delivery_at_ms,is_default,created_at_ms,updated_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) {
        BindI64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string JoinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out.push_back(kListSeparator);
        out += item;
    }
    return out;
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;

    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(kListSeparator, start);
        if (pos == std::string::npos) {
            out.push_back(text.substr(start));
            return out;
        }
        out.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string JoinDays(const std::vector<int32_t>& days) {
    std::string out;
    for (auto d : days) {
        if (!out.empty()) out.push_back(',');
        out += std::to_string(d);
    }
    return out;
}

std::vector<int32_t> SplitDays(const std::string& text) {
    std::vector<int32_t> out;
    const char*          p   = text.data();
    const char*          end = text.data() + text.size();
    while (p < end) {
        int32_t value = 0;
        auto [next, ec] = std::from_chars(p, end, value);
        if (ec != std::errc()) {
            throw util::PersistenceFailure("corrupt active_days column: '" + text + "'");
        }
        out.push_back(value);
        p = next;
        if (p < end && *p == ',') ++p;
    }
    return out;
}

// Reads never return Result, so a broken statement surfaces as an exception.
sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw util::PersistenceFailure(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

void ThrowIfNotDone(sqlite3* db, int rc) {
    if (rc != SQLITE_DONE) {
        throw util::PersistenceFailure(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

model::ScheduleRecord ReadSchedule(sqlite3_stmt* st) {
    model::ScheduleRecord r;
    r.id                  = ColText(st, 0);
    r.is_enabled          = ColI32(st, 1) != 0;
    r.scheduled_hour      = ColI32(st, 2);
    r.scheduled_minute    = ColI32(st, 3);
    r.delivery_method     = ColI32(st, 4);
    r.favorites_only      = ColI32(st, 5) != 0;
    r.categories          = SplitList(ColText(st, 6));
    r.exclude_recent_days = ColI32(st, 7);
    r.active_days         = SplitDays(ColText(st, 8));
    if (!ColNull(st, 9)) r.last_delivered_quote_id = ColText(st, 9);
    if (!ColNull(st, 10)) r.last_delivery_at_ms = ColI64(st, 10);
    r.is_default    = ColI32(st, 11) != 0;
    r.created_at_ms = ColI64(st, 12);
    r.updated_at_ms = ColI64(st, 13);
    return r;
}

model::QuoteRecord ReadQuote(sqlite3_stmt* st) {
    model::QuoteRecord r;
    r.id          = ColText(st, 0);
    r.text        = ColText(st, 1);
    r.author      = ColText(st, 2);
    r.categories  = SplitList(ColText(st, 3));
    r.is_favorite = ColI32(st, 4) != 0;
    return r;
}

std::vector<model::ScheduleRecord> QuerySchedules(sqlite3* db, const std::string& sql,
                                                  const std::optional<std::string>& id) {
    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    if (id) BindText(st, 1, *id);

    std::vector<model::ScheduleRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadSchedule(st));
    }
    sqlite3_finalize(st);
    ThrowIfNotDone(db, rc);
    return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            switch (sqlite3_extended_errcode(db)) {
                case SQLITE_CONSTRAINT_PRIMARYKEY:
                    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
                case SQLITE_CONSTRAINT_FOREIGNKEY:
                    return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
                default:
                    return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
            }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result SqliteRepository::InsertSchedule(Transaction& t, const model::ScheduleRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO schedules(") + kScheduleColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindI32(st, 2, r.is_enabled ? 1 : 0);
    BindI32(st, 3, r.scheduled_hour);
    BindI32(st, 4, r.scheduled_minute);
    BindI32(st, 5, r.delivery_method);
    BindI32(st, 6, r.favorites_only ? 1 : 0);
    BindText(st, 7, JoinList(r.categories));
    BindI32(st, 8, r.exclude_recent_days);
    BindText(st, 9, JoinDays(r.active_days));
    BindOptText(st, 10, r.last_delivered_quote_id);
    BindOptI64(st, 11, r.last_delivery_at_ms);
    BindI32(st, 12, r.is_default ? 1 : 0);
    BindI64(st, 13, r.created_at_ms);
    BindI64(st, 14, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::InsertDefaultScheduleIfAbsent(Transaction& t, const model::ScheduleRecord& r) {
    // BEGIN IMMEDIATE already holds the write lock, so check-then-insert cannot interleave
    if (auto existing = GetDefaultSchedule(t)) {
        return Result::Err(ErrorCode::AlreadyExists, "default schedule " + existing->id);
    }

    auto record       = r;
    record.is_default = true;
    return InsertSchedule(t, record);
}

std::optional<model::ScheduleRecord> SqliteRepository::GetSchedule(Transaction& t, const std::string& id) {
    auto rows = QuerySchedules(TX(t).Handle(), std::string("SELECT ") + kScheduleColumns + " FROM schedules WHERE id=?;", id);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::optional<model::ScheduleRecord> SqliteRepository::GetDefaultSchedule(Transaction& t) {
    auto rows = QuerySchedules(TX(t).Handle(), std::string("SELECT ") + kScheduleColumns + " FROM schedules WHERE is_default=1 LIMIT 1;",
                               std::nullopt);
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<model::ScheduleRecord> SqliteRepository::ListSchedules(Transaction& t, bool enabled_only) {
    std::string sql = std::string("SELECT ") + kScheduleColumns + " FROM schedules";
    if (enabled_only) sql += " WHERE is_enabled=1";
    sql += " ORDER BY scheduled_hour * 60 + scheduled_minute ASC, created_at_ms ASC, id ASC;";
    return QuerySchedules(TX(t).Handle(), sql, std::nullopt);
}

Result SqliteRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE schedules SET is_enabled=?,scheduled_hour=?,scheduled_minute=?,delivery_method=?,favorites_only=?,categories=?,"
        "exclude_recent_days=?,active_days=?,is_default=?,updated_at_ms=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st, 1, r.is_enabled ? 1 : 0);
    BindI32(st, 2, r.scheduled_hour);
    BindI32(st, 3, r.scheduled_minute);
    BindI32(st, 4, r.delivery_method);
    BindI32(st, 5, r.favorites_only ? 1 : 0);
    BindText(st, 6, JoinList(r.categories));
    BindI32(st, 7, r.exclude_recent_days);
    BindText(st, 8, JoinDays(r.active_days));
    BindI32(st, 9, r.is_default ? 1 : 0);
    BindI64(st, 10, r.updated_at_ms);
    BindText(st, 11, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "schedule " + r.id);
    return Result::Ok();
}

Result SqliteRepository::UpdateLastDelivery(Transaction& t, const std::string& schedule_id, const std::string& quote_id,
                                            int64_t delivered_at_ms, std::optional<int64_t> expected_previous_ms) {
    auto* db = TX(t).Handle();

    // "IS ?" matches NULL against an unbound (NULL) expectation
    const char* sql =
        "UPDATE schedules SET last_delivered_quote_id=?,last_delivery_at_ms=?,updated_at_ms=MAX(updated_at_ms,?) "
        "WHERE id=? AND last_delivery_at_ms IS ?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, quote_id);
    BindI64(st, 2, delivered_at_ms);
    BindI64(st, 3, delivered_at_ms);
    BindText(st, 4, schedule_id);
    BindOptI64(st, 5, expected_previous_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
        if (!GetSchedule(t, schedule_id)) return Result::Err(ErrorCode::NotFound, "schedule " + schedule_id);
        return Result::Err(ErrorCode::Conflict, "last delivery of schedule " + schedule_id + " changed concurrently");
    }
    return Result::Ok();
}

Result SqliteRepository::DeleteSchedule(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    // delivery_records rows go with it through ON DELETE CASCADE
    const char*   sql = "DELETE FROM schedules WHERE id=?;";
    sqlite3_stmt* st  = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Delivery history
// ------------------------------------------------------------------

Result SqliteRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT INTO delivery_records(quote_id,schedule_id,delivered_at_ms) VALUES(?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.quote_id);
    BindText(st, 2, r.schedule_id);
    BindI64(st, 3, r.delivered_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::DeliveryRecord> SqliteRepository::ListDeliveriesSince(Transaction& t, const std::string& schedule_id, int64_t since_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db,
                                      "SELECT id,quote_id,schedule_id,delivered_at_ms FROM delivery_records "
                                      "WHERE schedule_id=? AND delivered_at_ms>=? ORDER BY delivered_at_ms ASC, id ASC;");
    BindText(st, 1, schedule_id);
    BindI64(st, 2, since_ms);

    std::vector<model::DeliveryRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::DeliveryRecord r;
        r.id              = static_cast<uint64_t>(ColI64(st, 0));
        r.quote_id        = ColText(st, 1);
        r.schedule_id     = ColText(st, 2);
        r.delivered_at_ms = ColI64(st, 3);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);
    ThrowIfNotDone(db, rc);
    return out;
}

Result SqliteRepository::DeleteDeliveriesOlderThan(Transaction& t, int64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    const char*   sql = "DELETE FROM delivery_records WHERE delivered_at_ms<?;";
    sqlite3_stmt* st  = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, cutoff_ms);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Quotes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertQuote(Transaction& t, const model::QuoteRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO quotes(id,text,author,categories,is_favorite) VALUES(?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET text=excluded.text, author=excluded.author, categories=excluded.categories, "
        "is_favorite=excluded.is_favorite;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.text);
    BindText(st, 3, r.author);
    BindText(st, 4, JoinList(r.categories));
    BindI32(st, 5, r.is_favorite ? 1 : 0);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::QuoteRecord> SqliteRepository::GetQuote(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT id,text,author,categories,is_favorite FROM quotes WHERE id=?;");
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        ThrowIfNotDone(db, rc);
        return std::nullopt;
    }

    auto r = ReadQuote(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::QuoteRecord> SqliteRepository::ListQuotes(Transaction& t, bool favorites_only) {
    auto* db = TX(t).Handle();

    std::string sql = "SELECT id,text,author,categories,is_favorite FROM quotes";
    if (favorites_only) sql += " WHERE is_favorite=1";
    sql += " ORDER BY id ASC;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);

    std::vector<model::QuoteRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadQuote(st));
    }
    sqlite3_finalize(st);
    ThrowIfNotDone(db, rc);
    return out;
}

Result SqliteRepository::DeleteQuote(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const char*   sql = "DELETE FROM quotes WHERE id=?;";
    sqlite3_stmt* st  = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Activity events
// ------------------------------------------------------------------

Result SqliteRepository::InsertActivity(Transaction& t, model::ActivityRecord& r) {
    auto* db = TX(t).Handle();

    const char*   sql = "INSERT INTO activity_events(kind,occurred_at_ms) VALUES(?,?);";
    sqlite3_stmt* st  = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.kind);
    BindI64(st, 2, r.occurred_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::ActivityRecord> SqliteRepository::ListActivity(Transaction& t, const std::optional<std::string>& kind) {
    auto* db = TX(t).Handle();

    std::string sql = "SELECT id,kind,occurred_at_ms FROM activity_events";
    if (kind) sql += " WHERE kind=?";
    sql += " ORDER BY id ASC;";

    sqlite3_stmt* st = PrepareOrThrow(db, sql);
    if (kind) BindText(st, 1, *kind);

    std::vector<model::ActivityRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::ActivityRecord r;
        r.id             = static_cast<uint64_t>(ColI64(st, 0));
        r.kind           = ColText(st, 1);
        r.occurred_at_ms = ColI64(st, 2);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);
    ThrowIfNotDone(db, rc);
    return out;
}

} // namespace quotecast::db::sqlite
