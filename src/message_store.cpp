/**
 * @file message_store.cpp
 * @brief Filter evaluation for the document store contract
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/message_store.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace rtcomm {

namespace {

bool array_contains(const json& array, const json& value) {
    if (!array.is_array()) {
        return false;
    }
    return std::find(array.begin(), array.end(), value) != array.end();
}

} // namespace

// ============================================================================
// Condition
// ============================================================================

bool Condition::matches(const json& record) const {
    auto it = record.find(field);
    bool present = it != record.end() && !it->is_null();

    switch (op) {
        case ConditionOp::EQ:
            if (!present) {
                return value.is_null();
            }
            return *it == value;

        case ConditionOp::NE:
            if (!present) {
                return !value.is_null();
            }
            return *it != value;

        case ConditionOp::LT:
            return present && it->is_number() && value.is_number() && *it < value;

        case ConditionOp::GT:
            return present && it->is_number() && value.is_number() && *it > value;

        case ConditionOp::IN:
            return present && array_contains(value, *it);

        case ConditionOp::CONTAINS:
            return present && array_contains(*it, value);

        case ConditionOp::NOT_CONTAINS:
            return !present || !array_contains(*it, value);
    }
    return false;
}

// ============================================================================
// Query
// ============================================================================

Query Query::on(const std::string& collection) {
    Query query;
    query.collection = collection;
    return query;
}

Query& Query::where(std::vector<Condition> group) {
    any_of.push_back(std::move(group));
    return *this;
}

Query& Query::order(const std::string& field, bool desc) {
    order_by = field;
    descending = desc;
    return *this;
}

Query& Query::take(size_t count) {
    limit = count;
    return *this;
}

bool Query::matches(const json& record) const {
    if (any_of.empty()) {
        return true;
    }

    return std::any_of(any_of.begin(), any_of.end(), [&record](const auto& group) {
        return std::all_of(group.begin(), group.end(), [&record](const Condition& condition) {
            return condition.matches(record);
        });
    });
}

} // namespace rtcomm
