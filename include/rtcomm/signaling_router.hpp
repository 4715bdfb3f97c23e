/**
 * @file signaling_router.hpp
 * @brief Call-negotiation signaling over a subscribable message store
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides signal delivery between peers with:
 * - Private (user) and group addressing
 * - Two live subscriptions per user (direct and group)
 * - Mark-processed-before-dispatch de-duplication
 * - Typed handler dispatch over the payload variant
 * - Dedicated dispatcher thread (asio) with deterministic shutdown
 * - Periodic sweep of expired signals
 */

#pragma once

#include "rtcomm/errors.hpp"
#include "rtcomm/message_store.hpp"
#include "rtcomm/rtc_config.hpp"
#include "rtcomm/signal_types.hpp"

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rtcomm {

// ============================================================================
// Callback Types
// ============================================================================

/**
 * @brief Typed signal handler
 * @param message Full signal record
 * @param data Payload of the handler's signal type
 */
template <typename T>
using SignalHandler = std::function<void(const SignalMessage& message, const T& data)>;

/**
 * @brief Error callback
 * @param code Error category
 * @param message Human-readable description
 */
using ErrorCallback = std::function<void(ErrorCode code, const std::string& message)>;

/**
 * @brief Listener set for the router (empty members are not called)
 */
struct SignalingEventListeners {
    std::function<void(const SignalMessage&)> on_signal_received;   ///< Every dispatched signal
    SignalHandler<OfferData> on_offer_received;
    SignalHandler<AnswerData> on_answer_received;
    SignalHandler<IceCandidateData> on_ice_candidate_received;
    SignalHandler<CallRequestData> on_call_request;
    SignalHandler<CallAcceptData> on_call_accept;
    SignalHandler<CallRejectData> on_call_reject;
    SignalHandler<CallEndData> on_call_end;
    SignalHandler<ConferenceInviteData> on_conference_invite;
    SignalHandler<GroupCallRequestData> on_group_call_request;
    SignalHandler<GroupCallJoinData> on_group_call_join;
    SignalHandler<GroupCallLeaveData> on_group_call_leave;
    ErrorCallback on_error;                                         ///< Per-message and store failures
};

/**
 * @brief Router status snapshot
 */
struct RouterStatus {
    bool connected = false;             ///< Subscriptions open
    std::string user_id;                ///< Local user (empty before initialize)
    size_t active_listeners = 0;        ///< Open live subscriptions
    std::vector<std::string> groups;    ///< Groups covered by the group subscription
    uint64_t signals_dispatched = 0;    ///< Signals delivered to handlers
    uint64_t signals_dropped = 0;       ///< Malformed, expired, own or duplicate signals
};

// ============================================================================
// SignalingRouter Class
// ============================================================================

/**
 * @brief SignalingRouter - maps call intents to store writes and store
 *        notifications to typed signal events
 *
 * Live-query callbacks only forward records into the router's own
 * dispatcher (an asio::io_context with one worker thread). The dispatcher
 * marks each record processed before any handler runs, so a record is
 * handed to handlers at most once per recipient even when notifications
 * are duplicated or a handler throws.
 *
 * Thread-safe for concurrent access
 */
class SignalingRouter {
public:
    /// Provides the store adapter; may return nullptr when unavailable
    using ClientGetter = std::function<std::shared_ptr<MessageStore>()>;

    /// Collection holding signal records
    static constexpr const char* SIGNAL_COLLECTION = "signal";

    /// Collection holding {group_id, user_id} membership records
    static constexpr const char* GROUP_MEMBER_COLLECTION = "group_member";

    /**
     * @brief Construct router
     * @param client_getter Store adapter provider
     * @param config Runtime configuration (expiry, retention, sweep interval)
     */
    explicit SignalingRouter(ClientGetter client_getter, RtcConfig config = RtcConfig{});

    /**
     * @brief Destructor - releases subscriptions and joins the dispatcher
     */
    ~SignalingRouter();

    // Disable copy and move
    SignalingRouter(const SignalingRouter&) = delete;
    SignalingRouter& operator=(const SignalingRouter&) = delete;
    SignalingRouter(SignalingRouter&&) = delete;
    SignalingRouter& operator=(SignalingRouter&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Open direct and group subscriptions for a user
     * @param user_id Local user id
     * @throws RtcError NoClient, MissingUserId, NotConnected (after destroy) or StoreFailure
     */
    void initialize(const std::string& user_id);

    /**
     * @brief Kill and reopen both subscriptions (re-resolves group membership)
     * @throws RtcError NoClient, MissingUserId, NotConnected or StoreFailure
     */
    void reconnect();

    /**
     * @brief Permanently release subscriptions, drain and stop the dispatcher
     *
     * Idempotent. Listeners are cleared. Must not be called from a handler.
     */
    void destroy();

    /**
     * @brief Check whether subscriptions are open
     */
    bool is_connected() const;

    /**
     * @brief Status snapshot (never throws)
     */
    RouterStatus get_status() const;

    /**
     * @brief Merge listeners (set members overwrite, empty members are kept)
     */
    void set_event_listeners(const SignalingEventListeners& listeners);

    // ========================================================================
    // Sending
    // ========================================================================

    /**
     * @brief Write a signal addressed to one user
     * @param payload Typed payload (determines the signal type)
     * @param target_user_id Recipient
     * @param call_id Associated call (defaults to the payload's call id)
     * @return Store record id
     * @throws RtcError NoClient, NotConnected, InvalidArgument or StoreFailure
     */
    std::string send_private_signal(
        const SignalPayload& payload,
        const std::string& target_user_id,
        const std::optional<std::string>& call_id = std::nullopt
    );

    /**
     * @brief Write a signal addressed to a group
     * @param payload Typed payload (determines the signal type)
     * @param group_id Recipient group
     * @param call_id Associated call (defaults to the payload's call id)
     * @return Store record id
     * @throws RtcError NoClient, NotConnected, InvalidArgument or StoreFailure
     */
    std::string send_group_signal(
        const SignalPayload& payload,
        const std::string& group_id,
        const std::optional<std::string>& call_id = std::nullopt
    );

    std::string send_offer(const std::string& target_user_id, const std::string& sdp,
                           const MediaConstraints& constraints, const std::string& call_id);
    std::string send_answer(const std::string& target_user_id, const std::string& sdp,
                            const std::string& call_id);
    std::string send_ice_candidate(const std::string& target_user_id, const IceCandidateData& candidate,
                                   const std::string& call_id);
    std::string send_call_request(const std::string& target_user_id, const CallRequestData& request);
    std::string send_call_accept(const std::string& target_user_id, const std::string& call_id);
    std::string send_call_reject(const std::string& target_user_id, const std::string& call_id,
                                 const std::optional<std::string>& reason = std::nullopt);
    std::string send_call_end(const std::string& target_user_id, const std::string& call_id,
                              const std::optional<std::string>& reason = std::nullopt);
    std::string send_conference_invite(const std::string& target_user_id, const ConferenceInviteData& invite);
    std::string send_group_call_request(const std::string& group_id, const GroupCallRequestData& request);
    std::string send_group_call_join(const std::string& group_id, const GroupCallJoinData& join);
    std::string send_group_call_leave(const std::string& group_id, const GroupCallLeaveData& leave);

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief Read signal history (newest first)
     * @param target_user_id Conversation partner (both directions)
     * @param group_id Group (used when no partner is given)
     * @param limit Maximum number of signals
     * @return Parsed signals; malformed records are skipped
     * @throws RtcError NoClient, NotConnected or StoreFailure
     */
    std::vector<SignalMessage> get_signal_history(
        const std::optional<std::string>& target_user_id = std::nullopt,
        const std::optional<std::string>& group_id = std::nullopt,
        size_t limit = limits::DEFAULT_HISTORY_LIMIT
    );

    /**
     * @brief Delete expired signals and signals older than the retention window
     * @return Number of records removed
     * @throws RtcError NoClient or StoreFailure
     */
    size_t cleanup_expired_signals();

private:
    /**
     * @brief Gate between store callbacks and the dispatcher
     *
     * Shared with live callbacks through weak_ptr so a late notification
     * after destroy() is discarded instead of touching a dead router.
     */
    struct EventChannel {
        std::mutex mutex;
        bool open = true;
        std::function<void(const nlohmann::json&)> forward;
    };

    ClientGetter client_getter_;
    RtcConfig config_;

    /// ASIO I/O context owned by the dispatcher thread
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::steady_timer cleanup_timer_;
    std::thread dispatcher_thread_;

    std::shared_ptr<EventChannel> channel_;

    /// Subscription state
    std::string user_id_;
    std::vector<std::string> group_ids_;
    std::vector<std::string> subscription_ids_;
    std::shared_ptr<MessageStore> subscribed_client_;
    mutable std::mutex state_mutex_;

    SignalingEventListeners listeners_;
    mutable std::mutex listeners_mutex_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> destroyed_{false};
    std::atomic<uint64_t> signals_dispatched_{0};
    std::atomic<uint64_t> signals_dropped_{0};

    // ========================================================================
    // Private Methods
    // ========================================================================

    std::shared_ptr<MessageStore> require_client() const;
    std::vector<std::string> resolve_groups(const std::shared_ptr<MessageStore>& client,
                                            const std::string& user_id) const;
    void open_subscriptions_locked(const std::shared_ptr<MessageStore>& client);
    void close_subscriptions_locked();

    void dispatch(const nlohmann::json& record);
    bool mark_processed(const std::shared_ptr<MessageStore>& client, const SignalMessage& message,
                        const std::string& user_id);
    void invoke_handlers(const SignalMessage& message);

    std::string write_signal(SignalMessage message);
    void report_error(ErrorCode code, const std::string& message);
    void schedule_cleanup();
};

} // namespace rtcomm
