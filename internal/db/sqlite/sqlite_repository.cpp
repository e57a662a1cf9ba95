#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace gemfeed::db::sqlite {

using gemfeed::db::ErrorCode;
using gemfeed::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Reads fail loudly: a lost row must not look like an absent one.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

model::FeedRecord ReadFeed(sqlite3_stmt* st) {
    model::FeedRecord r;
    r.id = ColI64(st, 0);
    r.url = ColText(st, 1);
    r.name = ColText(st, 2);
    return r;
}

model::FeedEntryRecord ReadFeedEntry(sqlite3_stmt* st) {
    model::FeedEntryRecord r;
    r.id = ColI64(st, 0);
    r.feed_id = ColI64(st, 1);
    r.title = ColText(st, 2);
    r.published_at = ColText(st, 3);
    r.url = ColText(st, 4);
    return r;
}

model::UserRecord ReadUser(sqlite3_stmt* st) {
    model::UserRecord r;
    r.id = ColI64(st, 0);
    r.username = ColText(st, 1);
    return r;
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

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Feeds
// ------------------------------------------------------------------

Result SqliteRepository::InsertFeed(Transaction& t, model::FeedRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::INSERT_FEED);

    BindText(st.get(), 1, r.url);
    BindText(st.get(), 2, r.name);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::FeedRecord> SqliteRepository::GetFeed(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FEED);
    BindI64(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadFeed(st.get());
}

std::optional<model::FeedRecord> SqliteRepository::GetFeedByUrl(Transaction& t, const std::string& url) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FEED_BY_URL);
    BindText(st.get(), 1, url);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadFeed(st.get());
}

std::vector<model::FeedRecord> SqliteRepository::ListFeeds(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FEEDS);

    std::vector<model::FeedRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadFeed(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteFeed(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::DELETE_FEED);
    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "feed " + std::to_string(id));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Feed entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertFeedEntry(Transaction& t, model::FeedEntryRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::INSERT_FEED_ENTRY);

    BindI64(st.get(), 1, r.feed_id);
    BindText(st.get(), 2, r.title);
    BindText(st.get(), 3, r.published_at);
    BindText(st.get(), 4, r.url);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) > 0) {
        r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
        return Result::Ok();
    }

    // ON CONFLICT DO NOTHING swallowed the row: report the survivor.
    auto existing = Prepare(db, sql::SELECT_FEED_ENTRY_BY_KEY);
    BindI64(existing.get(), 1, r.feed_id);
    BindText(existing.get(), 2, r.published_at);
    BindText(existing.get(), 3, r.url);
    if (StepRow(db, existing.get())) {
        r.id = ColI64(existing.get(), 0);
    }
    return Result::Err(ErrorCode::AlreadyExists, "duplicate feed entry");
}

std::optional<model::FeedEntryRecord> SqliteRepository::GetFeedEntry(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_FEED_ENTRY);
    BindI64(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadFeedEntry(st.get());
}

std::vector<model::FeedEntryRecord> SqliteRepository::ListFeedEntries(
    Transaction& t, int64_t feed_id, const std::optional<std::string>& published_after) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, published_after.has_value() ? sql::SELECT_FEED_ENTRIES_SINCE : sql::SELECT_FEED_ENTRIES);

    BindI64(st.get(), 1, feed_id);
    if (published_after.has_value()) {
        BindText(st.get(), 2, *published_after);
    }

    std::vector<model::FeedEntryRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadFeedEntry(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteFeedEntry(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::DELETE_FEED_ENTRY);
    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "feed entry " + std::to_string(id));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Users
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, model::UserRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::INSERT_USER);
    BindText(st.get(), 1, r.username);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::UserRecord> SqliteRepository::GetUser(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_USER);
    BindI64(st.get(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadUser(st.get());
}

std::optional<model::UserRecord> SqliteRepository::GetUserByName(Transaction& t, const std::string& username) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_USER_BY_NAME);
    BindText(st.get(), 1, username);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadUser(st.get());
}

std::vector<model::UserRecord> SqliteRepository::ListUsers(Transaction& t) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_USERS);

    std::vector<model::UserRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadUser(st.get()));
    }
    return out;
}

Result SqliteRepository::DeleteUser(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::DELETE_USER);
    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "user " + std::to_string(id));
    return Result::Ok();
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::INSERT_SUBSCRIPTION);
    BindI64(st.get(), 1, r.user_id);
    BindI64(st.get(), 2, r.feed_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "already subscribed");
    return Result::Ok();
}

Result SqliteRepository::DeleteSubscription(Transaction& t, const model::SubscriptionRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::DELETE_SUBSCRIPTION);
    BindI64(st.get(), 1, r.user_id);
    BindI64(st.get(), 2, r.feed_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "not subscribed");
    return Result::Ok();
}

std::vector<model::FeedRecord> SqliteRepository::ListSubscribedFeeds(Transaction& t, int64_t user_id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_SUBSCRIBED_FEEDS);
    BindI64(st.get(), 1, user_id);

    std::vector<model::FeedRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadFeed(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Views
// ------------------------------------------------------------------

Result SqliteRepository::InsertView(Transaction& t, const model::ViewRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::INSERT_VIEW);
    BindI64(st.get(), 1, r.user_id);
    BindI64(st.get(), 2, r.feed_entry_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "already viewed");
    return Result::Ok();
}

bool SqliteRepository::HasView(Transaction& t, const model::ViewRecord& r) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_VIEW);
    BindI64(st.get(), 1, r.user_id);
    BindI64(st.get(), 2, r.feed_entry_id);

    return StepRow(db, st.get());
}

std::vector<model::FeedEntryRecord> SqliteRepository::ListUnviewedEntries(Transaction& t, int64_t user_id) {
    auto* db = TX(t).Handle();
    auto st = Prepare(db, sql::SELECT_UNVIEWED_ENTRIES);
    BindI64(st.get(), 1, user_id);
    BindI64(st.get(), 2, user_id);

    std::vector<model::FeedEntryRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadFeedEntry(st.get()));
    }
    return out;
}

}
