/**
 * @file signaling_router.cpp
 * @brief Implementation of store-backed call signaling
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Thread-safe signal routing with a dedicated dispatcher
 */

#include "rtcomm/signaling_router.hpp"
#include "rtcomm/utilities.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

using json = nlohmann::json;

namespace rtcomm {

namespace {

template <typename T, typename = void>
struct has_call_id : std::false_type {};

template <typename T>
struct has_call_id<T, std::void_t<decltype(std::declval<T>().call_id)>> : std::true_type {};

std::optional<std::string> payload_call_id(const SignalPayload& payload) {
    return std::visit([](const auto& data) -> std::optional<std::string> {
        using T = std::decay_t<decltype(data)>;
        if constexpr (has_call_id<T>::value) {
            if (!data.call_id.empty()) {
                return data.call_id;
            }
        }
        return std::nullopt;
    }, payload);
}

template <typename T>
void call_if_set(const SignalHandler<T>& handler, const SignalMessage& message, const T& data) {
    if (handler) {
        handler(message, data);
    }
}

template <typename F>
void merge_listener(F& target, const F& source) {
    if (source) {
        target = source;
    }
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SignalingRouter::SignalingRouter(ClientGetter client_getter, RtcConfig config)
    : client_getter_(std::move(client_getter))
    , config_(std::move(config))
    , io_context_()
    , work_guard_(asio::make_work_guard(io_context_))
    , cleanup_timer_(io_context_)
    , channel_(std::make_shared<EventChannel>())
{
    channel_->forward = [this](const json& record) {
        asio::post(io_context_, [this, record]() {
            dispatch(record);
        });
    };

    dispatcher_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            utilities::log_error("Signal dispatcher stopped: " + std::string(e.what()));
        }
    });
}

SignalingRouter::~SignalingRouter() {
    try {
        destroy();
    } catch (const std::exception& e) {
        utilities::log_critical("Signaling router destroyed from its own dispatcher: " + std::string(e.what()));
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

void SignalingRouter::initialize(const std::string& user_id) {
    if (destroyed_) {
        throw RtcError(ErrorCode::NotConnected, "Signaling router has been destroyed");
    }
    if (user_id.empty()) {
        throw RtcError(ErrorCode::MissingUserId, "Cannot initialize signaling without a user id");
    }
    if (!validate_identifier(user_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid user id: " + user_id);
    }

    auto client = require_client();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (connected_ && user_id_ == user_id) {
        utilities::log_debug("Signaling already initialized for " + user_id);
        return;
    }

    close_subscriptions_locked();
    user_id_ = user_id;
    open_subscriptions_locked(client);

    utilities::log_info("Signaling initialized for " + user_id_ + " (" +
                        std::to_string(group_ids_.size()) + " groups)");
    schedule_cleanup();
}

void SignalingRouter::reconnect() {
    if (destroyed_) {
        throw RtcError(ErrorCode::NotConnected, "Signaling router has been destroyed");
    }

    auto client = require_client();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (user_id_.empty()) {
        throw RtcError(ErrorCode::MissingUserId, "Cannot reconnect before initialize");
    }

    close_subscriptions_locked();
    open_subscriptions_locked(client);
    utilities::log_info("Signaling reconnected for " + user_id_);
}

void SignalingRouter::destroy() {
    // The dispatcher cannot join itself
    if (std::this_thread::get_id() == dispatcher_thread_.get_id()) {
        throw RtcError(ErrorCode::InvalidState, "destroy() called from a signal handler");
    }

    if (destroyed_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        channel_->open = false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        close_subscriptions_locked();
    }

    asio::post(io_context_, [this]() {
        cleanup_timer_.cancel();
    });
    work_guard_.reset();

    if (dispatcher_thread_.joinable()) {
        dispatcher_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_ = SignalingEventListeners{};
    }

    utilities::log_info("Signaling router destroyed");
}

bool SignalingRouter::is_connected() const {
    return connected_;
}

RouterStatus SignalingRouter::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    RouterStatus status;
    status.connected = connected_;
    status.user_id = user_id_;
    status.active_listeners = subscription_ids_.size();
    status.groups = group_ids_;
    status.signals_dispatched = signals_dispatched_;
    status.signals_dropped = signals_dropped_;
    return status;
}

void SignalingRouter::set_event_listeners(const SignalingEventListeners& listeners) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);

    merge_listener(listeners_.on_signal_received, listeners.on_signal_received);
    merge_listener(listeners_.on_offer_received, listeners.on_offer_received);
    merge_listener(listeners_.on_answer_received, listeners.on_answer_received);
    merge_listener(listeners_.on_ice_candidate_received, listeners.on_ice_candidate_received);
    merge_listener(listeners_.on_call_request, listeners.on_call_request);
    merge_listener(listeners_.on_call_accept, listeners.on_call_accept);
    merge_listener(listeners_.on_call_reject, listeners.on_call_reject);
    merge_listener(listeners_.on_call_end, listeners.on_call_end);
    merge_listener(listeners_.on_conference_invite, listeners.on_conference_invite);
    merge_listener(listeners_.on_group_call_request, listeners.on_group_call_request);
    merge_listener(listeners_.on_group_call_join, listeners.on_group_call_join);
    merge_listener(listeners_.on_group_call_leave, listeners.on_group_call_leave);
    merge_listener(listeners_.on_error, listeners.on_error);
}

// ============================================================================
// Subscriptions
// ============================================================================

std::shared_ptr<MessageStore> SignalingRouter::require_client() const {
    std::shared_ptr<MessageStore> client = client_getter_ ? client_getter_() : nullptr;
    if (!client) {
        throw RtcError(ErrorCode::NoClient, "Message store client is not available");
    }
    return client;
}

std::vector<std::string> SignalingRouter::resolve_groups(
    const std::shared_ptr<MessageStore>& client,
    const std::string& user_id
) const {
    auto rows = client->query(Query::on(GROUP_MEMBER_COLLECTION)
        .where({{"user_id", ConditionOp::EQ, user_id}}));

    std::vector<std::string> groups;
    for (const auto& row : rows) {
        if (row.contains("group_id") && row["group_id"].is_string()) {
            std::string group = row["group_id"].get<std::string>();
            if (std::find(groups.begin(), groups.end(), group) == groups.end()) {
                groups.push_back(group);
            }
        }
    }
    return groups;
}

void SignalingRouter::open_subscriptions_locked(const std::shared_ptr<MessageStore>& client) {
    group_ids_ = resolve_groups(client, user_id_);

    std::weak_ptr<EventChannel> weak_channel = channel_;
    auto forward = [weak_channel](LiveAction action, const json& record) {
        if (action != LiveAction::CREATE) {
            return;
        }
        auto channel = weak_channel.lock();
        if (!channel) {
            return;
        }
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->open) {
            channel->forward(record);
        }
    };

    Query direct = Query::on(SIGNAL_COLLECTION).where({
        {"to_user", ConditionOp::EQ, user_id_},
        {"processed", ConditionOp::EQ, false}
    });

    Query group = Query::on(SIGNAL_COLLECTION).where({
        {"group_id", ConditionOp::IN, group_ids_},
        {"processed_by", ConditionOp::NOT_CONTAINS, user_id_}
    });

    try {
        subscription_ids_.push_back(client->live(direct, forward));
        subscription_ids_.push_back(client->live(group, forward));
    } catch (const RtcError&) {
        for (const auto& id : subscription_ids_) {
            client->kill(id);
        }
        subscription_ids_.clear();
        throw;
    } catch (const std::exception& e) {
        for (const auto& id : subscription_ids_) {
            client->kill(id);
        }
        subscription_ids_.clear();
        throw RtcError(ErrorCode::StoreFailure, "Failed to open signal subscriptions: " + std::string(e.what()));
    }

    subscribed_client_ = client;
    connected_ = true;
}

void SignalingRouter::close_subscriptions_locked() {
    if (subscribed_client_) {
        for (const auto& id : subscription_ids_) {
            try {
                subscribed_client_->kill(id);
            } catch (const std::exception& e) {
                utilities::log_warn("Failed to kill subscription " + id + ": " + e.what());
            }
        }
    }
    subscription_ids_.clear();
    subscribed_client_.reset();
    connected_ = false;
}

// ============================================================================
// Dispatch
// ============================================================================

void SignalingRouter::dispatch(const json& record) {
    auto message = SignalMessage::from_record(record);
    if (!message) {
        signals_dropped_++;
        utilities::log_warn("Dropping unknown or malformed signal: " + record.value("signal_type", std::string("?")));
        return;
    }

    std::string user_id;
    std::shared_ptr<MessageStore> client;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        user_id = user_id_;
        client = subscribed_client_;
    }
    if (!client) {
        signals_dropped_++;
        return;
    }

    // Group signals also reach the sender's own group subscription
    if (message->from_user == user_id) {
        signals_dropped_++;
        return;
    }

    if (message->expires_at && *message->expires_at < utilities::current_time_ms()) {
        signals_dropped_++;
        utilities::log_debug("Dropping expired signal " + message->id);
        return;
    }

    try {
        if (!mark_processed(client, *message, user_id)) {
            signals_dropped_++;
            utilities::log_debug("Signal already consumed: " + message->id);
            return;
        }
    } catch (const RtcError& e) {
        signals_dropped_++;
        report_error(e.code(), "Failed to mark signal " + message->id + " processed: " + e.what());
        return;
    } catch (const std::exception& e) {
        signals_dropped_++;
        report_error(ErrorCode::StoreFailure, "Failed to mark signal " + message->id + " processed: " + e.what());
        return;
    }

    message->processed = true;
    signals_dispatched_++;

    try {
        invoke_handlers(*message);
    } catch (const RtcError& e) {
        report_error(e.code(), "Handler for " + SignalHelpers::signal_type_to_string(message->type()) +
                               " failed: " + e.what());
    } catch (const std::exception& e) {
        report_error(ErrorCode::InvalidState, "Handler for " + SignalHelpers::signal_type_to_string(message->type()) +
                                              " failed: " + e.what());
    }
}

bool SignalingRouter::mark_processed(
    const std::shared_ptr<MessageStore>& client,
    const SignalMessage& message,
    const std::string& user_id
) {
    // Compare-and-set: the guard fails for every delivery after the first
    Query guard = Query::on(SIGNAL_COLLECTION);
    if (message.to_user) {
        guard.where({{"processed", ConditionOp::EQ, false}});
    } else {
        guard.where({{"processed_by", ConditionOp::NOT_CONTAINS, user_id}});
    }

    auto updated = client->update_if(SIGNAL_COLLECTION, message.id, guard, [&user_id](json& record) {
        record["processed"] = true;
        if (!record.contains("processed_by") || !record["processed_by"].is_array()) {
            record["processed_by"] = json::array();
        }
        record["processed_by"].push_back(user_id);
    });

    return updated.has_value();
}

void SignalingRouter::invoke_handlers(const SignalMessage& message) {
    SignalingEventListeners listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    if (listeners.on_signal_received) {
        listeners.on_signal_received(message);
    }

    std::visit([&listeners, &message](const auto& data) {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, OfferData>) {
            call_if_set(listeners.on_offer_received, message, data);
        } else if constexpr (std::is_same_v<T, AnswerData>) {
            call_if_set(listeners.on_answer_received, message, data);
        } else if constexpr (std::is_same_v<T, IceCandidateData>) {
            call_if_set(listeners.on_ice_candidate_received, message, data);
        } else if constexpr (std::is_same_v<T, CallRequestData>) {
            call_if_set(listeners.on_call_request, message, data);
        } else if constexpr (std::is_same_v<T, CallAcceptData>) {
            call_if_set(listeners.on_call_accept, message, data);
        } else if constexpr (std::is_same_v<T, CallRejectData>) {
            call_if_set(listeners.on_call_reject, message, data);
        } else if constexpr (std::is_same_v<T, CallEndData>) {
            call_if_set(listeners.on_call_end, message, data);
        } else if constexpr (std::is_same_v<T, ConferenceInviteData>) {
            call_if_set(listeners.on_conference_invite, message, data);
        } else if constexpr (std::is_same_v<T, GroupCallRequestData>) {
            call_if_set(listeners.on_group_call_request, message, data);
        } else if constexpr (std::is_same_v<T, GroupCallJoinData>) {
            call_if_set(listeners.on_group_call_join, message, data);
        } else if constexpr (std::is_same_v<T, GroupCallLeaveData>) {
            call_if_set(listeners.on_group_call_leave, message, data);
        }
    }, message.payload);
}

void SignalingRouter::report_error(ErrorCode code, const std::string& message) {
    utilities::log_error(message);

    ErrorCallback on_error;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        on_error = listeners_.on_error;
    }
    if (!on_error) {
        return;
    }

    try {
        on_error(code, message);
    } catch (const std::exception& e) {
        utilities::log_error("Error listener threw: " + std::string(e.what()));
    }
}

// ============================================================================
// Sending
// ============================================================================

std::string SignalingRouter::write_signal(SignalMessage message) {
    auto client = require_client();

    if (destroyed_ || !connected_) {
        throw RtcError(ErrorCode::NotConnected, "Signaling is not connected");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        message.from_user = user_id_;
    }

    uint64_t now = utilities::current_time_ms();
    message.created_at = now;
    message.expires_at = now + static_cast<uint64_t>(config_.signal_expiry.count());
    message.processed = false;
    message.processed_by.clear();
    if (!message.call_id) {
        message.call_id = payload_call_id(message.payload);
    }

    std::string type_name = SignalHelpers::signal_type_to_string(message.type());

    try {
        auto created = client->create(SIGNAL_COLLECTION, message.to_record());
        if (created.empty()) {
            throw RtcError(ErrorCode::StoreFailure, "Store returned no record for " + type_name);
        }
        std::string id = created.front().value("id", "");
        utilities::log_debug("Sent " + type_name + " signal " + id);
        return id;

    } catch (const RtcError& e) {
        report_error(e.code(), "Failed to send " + type_name + ": " + e.what());
        throw;
    } catch (const std::exception& e) {
        report_error(ErrorCode::StoreFailure, "Failed to send " + type_name + ": " + e.what());
        throw RtcError(ErrorCode::StoreFailure, e.what());
    }
}

std::string SignalingRouter::send_private_signal(
    const SignalPayload& payload,
    const std::string& target_user_id,
    const std::optional<std::string>& call_id
) {
    if (!validate_identifier(target_user_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid target user id: " + target_user_id);
    }

    SignalMessage message;
    message.payload = payload;
    message.to_user = target_user_id;
    message.call_id = call_id;
    return write_signal(std::move(message));
}

std::string SignalingRouter::send_group_signal(
    const SignalPayload& payload,
    const std::string& group_id,
    const std::optional<std::string>& call_id
) {
    if (!validate_identifier(group_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid group id: " + group_id);
    }

    SignalMessage message;
    message.payload = payload;
    message.group_id = group_id;
    message.call_id = call_id;
    return write_signal(std::move(message));
}

std::string SignalingRouter::send_offer(
    const std::string& target_user_id,
    const std::string& sdp,
    const MediaConstraints& constraints,
    const std::string& call_id
) {
    return send_private_signal(OfferData{sdp, constraints}, target_user_id, call_id);
}

std::string SignalingRouter::send_answer(
    const std::string& target_user_id,
    const std::string& sdp,
    const std::string& call_id
) {
    return send_private_signal(AnswerData{sdp}, target_user_id, call_id);
}

std::string SignalingRouter::send_ice_candidate(
    const std::string& target_user_id,
    const IceCandidateData& candidate,
    const std::string& call_id
) {
    return send_private_signal(candidate, target_user_id, call_id);
}

std::string SignalingRouter::send_call_request(const std::string& target_user_id, const CallRequestData& request) {
    return send_private_signal(request, target_user_id);
}

std::string SignalingRouter::send_call_accept(const std::string& target_user_id, const std::string& call_id) {
    CallAcceptData accept;
    accept.call_id = call_id;
    accept.accepted = true;
    return send_private_signal(accept, target_user_id);
}

std::string SignalingRouter::send_call_reject(
    const std::string& target_user_id,
    const std::string& call_id,
    const std::optional<std::string>& reason
) {
    CallRejectData reject;
    reject.call_id = call_id;
    reject.accepted = false;
    reject.reason = reason;
    return send_private_signal(reject, target_user_id);
}

std::string SignalingRouter::send_call_end(
    const std::string& target_user_id,
    const std::string& call_id,
    const std::optional<std::string>& reason
) {
    return send_private_signal(CallEndData{call_id, reason}, target_user_id);
}

std::string SignalingRouter::send_conference_invite(const std::string& target_user_id, const ConferenceInviteData& invite) {
    return send_private_signal(invite, target_user_id);
}

std::string SignalingRouter::send_group_call_request(const std::string& group_id, const GroupCallRequestData& request) {
    return send_group_signal(request, group_id);
}

std::string SignalingRouter::send_group_call_join(const std::string& group_id, const GroupCallJoinData& join) {
    return send_group_signal(join, group_id);
}

std::string SignalingRouter::send_group_call_leave(const std::string& group_id, const GroupCallLeaveData& leave) {
    return send_group_signal(leave, group_id);
}

// ============================================================================
// Maintenance
// ============================================================================

std::vector<SignalMessage> SignalingRouter::get_signal_history(
    const std::optional<std::string>& target_user_id,
    const std::optional<std::string>& group_id,
    size_t limit
) {
    auto client = require_client();

    std::string user_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        user_id = user_id_;
    }
    if (user_id.empty() || destroyed_) {
        throw RtcError(ErrorCode::NotConnected, "Signaling is not initialized");
    }

    Query query = Query::on(SIGNAL_COLLECTION);
    if (target_user_id) {
        query.where({{"from_user", ConditionOp::EQ, user_id}, {"to_user", ConditionOp::EQ, *target_user_id}});
        query.where({{"from_user", ConditionOp::EQ, *target_user_id}, {"to_user", ConditionOp::EQ, user_id}});
    } else if (group_id) {
        query.where({{"group_id", ConditionOp::EQ, *group_id}});
    } else {
        query.where({{"to_user", ConditionOp::EQ, user_id}});
        query.where({{"from_user", ConditionOp::EQ, user_id}});
    }
    query.order("created_at", true).take(limit);

    std::vector<SignalMessage> history;
    try {
        for (const auto& row : client->query(query)) {
            if (auto message = SignalMessage::from_record(row)) {
                history.push_back(std::move(*message));
            }
        }
    } catch (const RtcError& e) {
        report_error(e.code(), "Failed to read signal history: " + std::string(e.what()));
        throw;
    }

    return history;
}

size_t SignalingRouter::cleanup_expired_signals() {
    auto client = require_client();

    uint64_t now = utilities::current_time_ms();
    uint64_t retention_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.signal_retention).count());
    uint64_t cutoff = now > retention_ms ? now - retention_ms : 0;

    Query stale = Query::on(SIGNAL_COLLECTION);
    stale.where({{"expires_at", ConditionOp::LT, now}});
    stale.where({{"created_at", ConditionOp::LT, cutoff}});

    size_t removed = client->remove(stale);
    if (removed > 0) {
        utilities::log_info("Removed " + std::to_string(removed) + " expired signals");
    }
    return removed;
}

void SignalingRouter::schedule_cleanup() {
    asio::post(io_context_, [this]() {
        cleanup_timer_.expires_after(config_.signal_cleanup_interval);
        cleanup_timer_.async_wait([this](const asio::error_code& error) {
            if (error || destroyed_) {
                return;
            }
            try {
                cleanup_expired_signals();
            } catch (const std::exception& e) {
                utilities::log_warn("Periodic signal cleanup failed: " + std::string(e.what()));
            }
            schedule_cleanup();
        });
    });
}

} // namespace rtcomm
