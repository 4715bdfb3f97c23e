/**
 * @file message_store.hpp
 * @brief Document store contract consumed by the signaling router
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Narrow CRUD + live-query contract:
 * - create / query / update_if / remove on JSON records
 * - live(query, callback) pushes CREATE/UPDATE/DELETE notifications
 * - kill(subscription_id) stops a live query
 *
 * Filters are OR-of-AND groups over top-level record fields.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <cstdint>

namespace rtcomm {

/**
 * @brief Comparison applied to one record field
 */
enum class ConditionOp {
    EQ,             ///< field == value
    NE,             ///< field != value (missing fields compare unequal)
    LT,             ///< field < value (numbers)
    GT,             ///< field > value (numbers)
    IN,             ///< field is one of value[] (value is an array)
    CONTAINS,       ///< field is an array containing value
    NOT_CONTAINS    ///< field is missing or an array not containing value
};

/**
 * @brief Single field predicate
 */
struct Condition {
    std::string field;              ///< Top-level field name
    ConditionOp op;                 ///< Comparison
    nlohmann::json value;           ///< Operand

    /**
     * @brief Evaluate against a record
     */
    bool matches(const nlohmann::json& record) const;
};

/**
 * @brief Record filter with ordering and limit
 */
struct Query {
    std::string collection;                         ///< Collection (table) name
    std::vector<std::vector<Condition>> any_of;     ///< OR of AND-groups; empty matches all
    std::optional<std::string> order_by;            ///< Sort field
    bool descending = false;                        ///< Sort direction
    std::optional<size_t> limit;                    ///< Maximum rows

    /**
     * @brief Start a query on a collection
     */
    static Query on(const std::string& collection);

    /**
     * @brief Add an AND-group (alternatives are OR'ed)
     */
    Query& where(std::vector<Condition> group);

    Query& order(const std::string& field, bool desc = false);
    Query& take(size_t count);

    /**
     * @brief Evaluate filter (ignores collection, order and limit)
     */
    bool matches(const nlohmann::json& record) const;
};

/**
 * @brief Kind of change reported by a live query
 */
enum class LiveAction {
    CREATE,
    UPDATE,
    DELETE
};

/**
 * @brief Live query notification callback
 * @param action Kind of change
 * @param record Record after the change (before, for DELETE)
 */
using LiveCallback = std::function<void(LiveAction action, const nlohmann::json& record)>;

/**
 * @brief Document store adapter
 *
 * Implementations are thread-safe. Methods throw RtcError(StoreFailure)
 * when the backend fails. Callbacks run on the writer's thread and must
 * not block.
 */
class MessageStore {
public:
    virtual ~MessageStore() = default;

    /**
     * @brief Insert a record (an "id" is assigned when absent)
     * @param collection Collection name
     * @param record JSON object
     * @return Created records
     */
    virtual std::vector<nlohmann::json> create(
        const std::string& collection,
        const nlohmann::json& record
    ) = 0;

    /**
     * @brief Select records
     * @param query Filter, ordering and limit
     * @return Matching records
     */
    virtual std::vector<nlohmann::json> query(const Query& query) = 0;

    /**
     * @brief Atomically mutate one record if it matches a guard
     * @param collection Collection name
     * @param id Record id
     * @param guard Filter the current record must satisfy
     * @param mutate Mutation applied to the record
     * @return Updated record, or std::nullopt if missing or guard failed
     */
    virtual std::optional<nlohmann::json> update_if(
        const std::string& collection,
        const std::string& id,
        const Query& guard,
        const std::function<void(nlohmann::json&)>& mutate
    ) = 0;

    /**
     * @brief Delete matching records
     * @param query Filter (limit and order ignored)
     * @return Number of records deleted
     */
    virtual size_t remove(const Query& query) = 0;

    /**
     * @brief Open a live query
     * @param query Filter evaluated on every change
     * @param callback Notification target
     * @return Subscription id
     */
    virtual std::string live(const Query& query, LiveCallback callback) = 0;

    /**
     * @brief Close a live query
     * @param subscription_id Id returned by live()
     * @return true if a subscription was removed
     */
    virtual bool kill(const std::string& subscription_id) = 0;
};

} // namespace rtcomm
