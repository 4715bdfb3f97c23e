/**
 * @file sqlite_message_store.cpp
 * @brief Implementation of the SQLite-backed message store
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/sqlite_message_store.hpp"
#include "rtcomm/errors.hpp"
#include "rtcomm/utilities.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace rtcomm {

namespace {

std::string sqlite_error(sqlite3* db) {
    return db ? std::string(sqlite3_errmsg(db)) : std::string("no database");
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

SqliteMessageStore::SqliteMessageStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        std::string reason = sqlite_error(db);
        if (db) {
            sqlite3_close(db);
        }
        throw RtcError(ErrorCode::StoreFailure,
                       "Failed to open message store database " + database_path_ + ": " + reason);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw RtcError(ErrorCode::StoreFailure, "Failed to initialize message store schema");
    }

    utilities::log_debug("Message store opened: " + database_path_);
}

SqliteMessageStore::~SqliteMessageStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool SqliteMessageStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    const char* create_records_table = R"(
        CREATE TABLE IF NOT EXISTS records (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            collection TEXT NOT NULL,
            id TEXT NOT NULL,
            body TEXT NOT NULL,
            UNIQUE (collection, id)
        );
        CREATE INDEX IF NOT EXISTS idx_records_collection ON records(collection);
    )";

    int rc = sqlite3_exec(db, create_records_table, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error("Message store schema error: " + std::string(error_msg));
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

std::vector<json> SqliteMessageStore::load_collection(const std::string& collection) const {
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT body FROM records WHERE collection = ? ORDER BY seq ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RtcError(ErrorCode::StoreFailure, "Failed to prepare select: " + sqlite_error(db));
    }

    sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<json> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* body = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        try {
            records.push_back(json::parse(body ? body : "{}"));
        } catch (const json::exception& e) {
            utilities::log_warn("Skipping unreadable record in " + collection + ": " + e.what());
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw RtcError(ErrorCode::StoreFailure, "Failed to read " + collection + ": " + sqlite_error(db));
    }

    return records;
}

// ============================================================================
// CRUD
// ============================================================================

std::vector<json> SqliteMessageStore::create(const std::string& collection, const json& record) {
    if (!record.is_object()) {
        throw RtcError(ErrorCode::InvalidArgument, "Store records must be JSON objects");
    }

    json stored = record;
    if (!stored.contains("id") || !stored["id"].is_string() || stored["id"].get<std::string>().empty()) {
        stored["id"] = collection + ":" + utilities::generate_uuid();
    }
    std::string id = stored["id"].get<std::string>();

    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3* db = static_cast<sqlite3*>(db_connection_);

        const char* sql = "INSERT INTO records (collection, id, body) VALUES (?, ?, ?)";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw RtcError(ErrorCode::StoreFailure, "Failed to prepare insert: " + sqlite_error(db));
        }

        std::string body = stored.dump();
        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, body.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw RtcError(ErrorCode::StoreFailure,
                           "Failed to insert " + id + ": " + sqlite_error(db));
        }
    }

    notify(LiveAction::CREATE, collection, stored);
    return {stored};
}

std::vector<json> SqliteMessageStore::query(const Query& query) {
    std::vector<json> rows;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        for (auto& record : load_collection(query.collection)) {
            if (query.matches(record)) {
                rows.push_back(std::move(record));
            }
        }
    }

    if (query.order_by) {
        const std::string& field = *query.order_by;
        bool descending = query.descending;
        std::stable_sort(rows.begin(), rows.end(), [&field, descending](const json& a, const json& b) {
            json va = a.value(field, json());
            json vb = b.value(field, json());
            return descending ? vb < va : va < vb;
        });
    }

    if (query.limit && rows.size() > *query.limit) {
        rows.resize(*query.limit);
    }

    return rows;
}

std::optional<json> SqliteMessageStore::update_if(
    const std::string& collection,
    const std::string& id,
    const Query& guard,
    const std::function<void(json&)>& mutate
) {
    json updated;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3* db = static_cast<sqlite3*>(db_connection_);

        const char* select_sql = "SELECT body FROM records WHERE collection = ? AND id = ?";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw RtcError(ErrorCode::StoreFailure, "Failed to prepare select: " + sqlite_error(db));
        }
        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<std::string> body;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            body = text ? text : "{}";
        }
        sqlite3_finalize(stmt);

        if (!body) {
            return std::nullopt;
        }

        json current = json::parse(*body);
        if (!guard.matches(current)) {
            return std::nullopt;
        }

        updated = current;
        mutate(updated);
        updated["id"] = id;

        const char* update_sql = "UPDATE records SET body = ? WHERE collection = ? AND id = ?";
        if (sqlite3_prepare_v2(db, update_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw RtcError(ErrorCode::StoreFailure, "Failed to prepare update: " + sqlite_error(db));
        }
        std::string new_body = updated.dump();
        sqlite3_bind_text(stmt, 1, new_body.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, collection.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw RtcError(ErrorCode::StoreFailure, "Failed to update " + id + ": " + sqlite_error(db));
        }
    }

    notify(LiveAction::UPDATE, collection, updated);
    return updated;
}

size_t SqliteMessageStore::remove(const Query& query) {
    std::vector<json> removed;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3* db = static_cast<sqlite3*>(db_connection_);

        for (auto& record : load_collection(query.collection)) {
            if (query.matches(record)) {
                removed.push_back(std::move(record));
            }
        }

        if (removed.empty()) {
            return 0;
        }

        if (sqlite3_exec(db, "BEGIN TRANSACTION", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw RtcError(ErrorCode::StoreFailure, "Failed to begin delete: " + sqlite_error(db));
        }

        const char* sql = "DELETE FROM records WHERE collection = ? AND id = ?";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw RtcError(ErrorCode::StoreFailure, "Failed to prepare delete: " + sqlite_error(db));
        }

        for (const auto& record : removed) {
            std::string id = record.value("id", "");
            sqlite3_bind_text(stmt, 1, query.collection.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                sqlite3_finalize(stmt);
                sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
                throw RtcError(ErrorCode::StoreFailure, "Failed to delete " + id + ": " + sqlite_error(db));
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw RtcError(ErrorCode::StoreFailure, "Failed to commit delete: " + sqlite_error(db));
        }
    }

    for (const auto& record : removed) {
        notify(LiveAction::DELETE, query.collection, record);
    }
    return removed.size();
}

// ============================================================================
// Live Queries
// ============================================================================

std::string SqliteMessageStore::live(const Query& query, LiveCallback callback) {
    if (!callback) {
        throw RtcError(ErrorCode::InvalidArgument, "Live query requires a callback");
    }

    std::string subscription_id = "live:" + std::to_string(next_subscription_.fetch_add(1));

    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_[subscription_id] = Subscription{query, std::move(callback)};
    return subscription_id;
}

bool SqliteMessageStore::kill(const std::string& subscription_id) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.erase(subscription_id) > 0;
}

void SqliteMessageStore::notify(LiveAction action, const std::string& collection, const json& record) {
    std::vector<LiveCallback> targets;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.query.collection == collection && subscription.query.matches(record)) {
                targets.push_back(subscription.callback);
            }
        }
    }

    for (const auto& callback : targets) {
        try {
            callback(action, record);
        } catch (const std::exception& e) {
            utilities::log_error("Live query callback failed: " + std::string(e.what()));
        }
    }
}

// ============================================================================
// Introspection
// ============================================================================

size_t SqliteMessageStore::get_subscription_count() const {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    return subscriptions_.size();
}

size_t SqliteMessageStore::get_record_count(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = "SELECT COUNT(*) FROM records WHERE collection = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace rtcomm
