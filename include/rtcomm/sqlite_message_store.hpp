/**
 * @file sqlite_message_store.hpp
 * @brief SQLite-backed implementation of the document store contract
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * In-process message store:
 * - JSON records persisted per collection in SQLite
 * - Live queries re-evaluated after every write
 * - Guarded updates serialized under the database mutex
 * - Thread-safe operations
 */

#pragma once

#include "rtcomm/message_store.hpp"

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>

namespace rtcomm {

/**
 * @brief SqliteMessageStore - local MessageStore with live queries
 *
 * Several routers (one per user) may share one instance, which is how
 * peers in the same process exchange signals. The default ":memory:"
 * database lives as long as the object.
 */
class SqliteMessageStore : public MessageStore {
public:
    /**
     * @brief Open (or create) the store
     * @param database_path Path to SQLite database file, or ":memory:"
     * @throws RtcError(StoreFailure) if the database cannot be opened
     */
    explicit SqliteMessageStore(const std::string& database_path = ":memory:");

    /**
     * @brief Destructor - closes database
     */
    ~SqliteMessageStore() override;

    // Disable copy and move
    SqliteMessageStore(const SqliteMessageStore&) = delete;
    SqliteMessageStore& operator=(const SqliteMessageStore&) = delete;
    SqliteMessageStore(SqliteMessageStore&&) = delete;
    SqliteMessageStore& operator=(SqliteMessageStore&&) = delete;

    std::vector<nlohmann::json> create(
        const std::string& collection,
        const nlohmann::json& record
    ) override;

    std::vector<nlohmann::json> query(const Query& query) override;

    std::optional<nlohmann::json> update_if(
        const std::string& collection,
        const std::string& id,
        const Query& guard,
        const std::function<void(nlohmann::json&)>& mutate
    ) override;

    size_t remove(const Query& query) override;

    std::string live(const Query& query, LiveCallback callback) override;

    bool kill(const std::string& subscription_id) override;

    // ========================================================================
    // Introspection
    // ========================================================================

    /**
     * @brief Number of open live queries
     */
    size_t get_subscription_count() const;

    /**
     * @brief Number of records in a collection
     */
    size_t get_record_count(const std::string& collection) const;

private:
    struct Subscription {
        Query query;
        LiveCallback callback;
    };

    /// Path to SQLite database
    std::string database_path_;

    /// SQLite database connection (opaque pointer)
    void* db_connection_;

    /// Mutex for thread-safe database access
    mutable std::mutex db_mutex_;

    /// Live queries (subscription id -> subscription)
    std::map<std::string, Subscription> subscriptions_;

    /// Mutex for subscriptions_
    mutable std::mutex subscriptions_mutex_;

    /// Subscription id counter
    std::atomic<uint64_t> next_subscription_{1};

    bool initialize_database();

    /**
     * @brief Load all records of a collection in insertion order
     * @note Caller holds db_mutex_
     */
    std::vector<nlohmann::json> load_collection(const std::string& collection) const;

    /**
     * @brief Deliver a change to every matching live query
     * @note Called without holding any store mutex
     */
    void notify(LiveAction action, const std::string& collection, const nlohmann::json& record);
};

} // namespace rtcomm
