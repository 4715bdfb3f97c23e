/**
 * @file call_session_manager.hpp
 * @brief Call and conference state machine driving signaling and transfers
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides call orchestration with:
 * - 1:1 and group call state machines with legal-transition enforcement
 * - Capability checks before every privileged operation
 * - Ring/connect timeout and busy auto-reject
 * - Local media controls with renegotiation
 * - Explicit and network-driven video quality selection
 * - Conference roster and role management
 * - In-call file sharing through the TransferEngine
 */

#pragma once

#include "rtcomm/call_session.hpp"
#include "rtcomm/collaborators.hpp"
#include "rtcomm/errors.hpp"
#include "rtcomm/rtc_config.hpp"
#include "rtcomm/signaling_router.hpp"
#include "rtcomm/transfer_engine.hpp"

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rtcomm {

// ============================================================================
// Listener and Result Types
// ============================================================================

/**
 * @brief Aggregate call statistics
 */
struct CallStats {
    uint64_t total_calls = 0;
    uint64_t completed_calls = 0;   ///< Ended after reaching connected
    uint64_t failed_calls = 0;      ///< Ended or failed before connecting
    uint64_t rejected_calls = 0;
    double average_duration = 0.0;  ///< Mean connected duration (ms)
    double success_rate = 0.0;      ///< completed / total in percent
};

/**
 * @brief Listener set for the call session manager (empty members are not called)
 */
struct CallEventListeners {
    std::function<void(const std::string& call_id, const std::string& from_user, CallType type)> on_incoming_call;
    std::function<void(const std::string& call_id, CallState state, CallState previous)> on_call_state_changed;
    std::function<void(const std::string& call_id, const CallSession& session)> on_call_started;
    std::function<void(const std::string& call_id, uint64_t duration_ms,
                       const std::optional<std::string>& reason)> on_call_ended;
    std::function<void(const std::string& call_id, ErrorCode code, const std::string& message)> on_call_failed;
    std::function<void(const std::string& call_id, const Participant& participant)> on_participant_joined;
    std::function<void(const std::string& call_id, const std::string& user_id,
                       const std::optional<std::string>& reason)> on_participant_left;
    std::function<void(const std::string& call_id, const std::string& user_id,
                       const MediaState& media_state)> on_participant_media_changed;
    std::function<void(const std::string& call_id, const Participant& participant)> on_participant_role_changed;
    std::function<void(const std::string& call_id, const std::optional<std::string>& group_id,
                       const std::string& from_user, const GroupCallData& data)> on_group_call_invite;
    std::function<void(const std::string& call_id, VideoQualityLevel level,
                       std::optional<NetworkQuality> network)> on_quality_changed;
    ErrorCallback on_error;
};

/**
 * @brief Receives every chunk of an outgoing file in index order
 *
 * A throw aborts the transfer, which is marked failed.
 */
using ChunkSink = std::function<void(const FileMetadata& metadata, const FileChunk& chunk)>;

// ============================================================================
// CallSessionManager Class
// ============================================================================

/**
 * @brief CallSessionManager - owns every call session of the local user
 *
 * Sessions are created on initiation or on an incoming request and stay
 * owned by the manager until they reach a terminal state and the UI
 * acknowledges the end. Listeners and outbound signals always run after
 * the session lock is released.
 *
 * Thread-safe for concurrent access
 */
class CallSessionManager {
public:
    /**
     * @brief Construct manager
     * @param router Signaling router (shared with other consumers)
     * @param engine Transfer engine for in-call file sharing
     * @param permissions Capability collaborator
     * @param media Peer connection and capture layer
     * @param probe Network measurements for automatic quality
     * @param config Runtime configuration
     * @throws RtcError InvalidArgument if a collaborator is missing
     */
    CallSessionManager(
        std::shared_ptr<SignalingRouter> router,
        std::shared_ptr<TransferEngine> engine,
        std::shared_ptr<PermissionChecker> permissions,
        std::shared_ptr<MediaEngine> media,
        std::shared_ptr<NetworkQualityProbe> probe,
        RtcConfig config = RtcConfig{}
    );

    /**
     * @brief Destructor - ends active calls and joins the worker
     */
    ~CallSessionManager();

    // Disable copy and move
    CallSessionManager(const CallSessionManager&) = delete;
    CallSessionManager& operator=(const CallSessionManager&) = delete;
    CallSessionManager(CallSessionManager&&) = delete;
    CallSessionManager& operator=(CallSessionManager&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Bind to a local user and start receiving signals
     * @param user_id Local user id
     * @param display_name Name shown to peers (defaults to user_id)
     * @throws RtcError from SignalingRouter::initialize
     */
    void initialize(const std::string& user_id, const std::string& display_name = "");

    /**
     * @brief End every active call and stop receiving signals
     *
     * Idempotent. Must not be called from a listener.
     */
    void destroy();

    /**
     * @brief Merge listeners (set members overwrite, empty members are kept)
     */
    void set_event_listeners(const CallEventListeners& listeners);

    // ========================================================================
    // Call Control
    // ========================================================================

    /**
     * @brief Ring a user
     * @return New call id
     * @throws RtcError PermissionDenied, FeatureDisabled, InvalidState (busy),
     *         InvalidArgument, NotConnected or StoreFailure
     */
    std::string initiate_call(const std::string& target_user_id, CallType call_type,
                              const std::string& target_name = "");

    /**
     * @brief Ring every member of a group (local user becomes host)
     * @return New call id
     * @throws RtcError PermissionDenied, FeatureDisabled, InvalidArgument or InvalidState
     */
    std::string initiate_group_call(const std::string& group_id, const std::string& group_name,
                                    const std::vector<std::string>& participants, CallType call_type);

    /**
     * @brief Invite a user into a running conference
     * @throws RtcError PermissionDenied, NotFound, InvalidState or InvalidArgument
     */
    void invite_to_conference(const std::string& call_id, const std::string& user_id);

    /**
     * @brief Accept an incoming call (ringing only)
     * @throws RtcError PermissionDenied, NotFound or InvalidState
     */
    void accept_call(const std::string& call_id);

    /**
     * @brief Reject an incoming call (ringing only)
     * @throws RtcError PermissionDenied, NotFound or InvalidState
     */
    void reject_call(const std::string& call_id, const std::optional<std::string>& reason = std::nullopt);

    /**
     * @brief End a call (single exit path); no-op on unknown or finished calls
     * @throws RtcError PermissionDenied
     */
    void end_call(const std::string& call_id, const std::optional<std::string>& reason = std::nullopt);

    /**
     * @brief Release a terminal session
     * @return true if the session was removed
     * @throws RtcError InvalidState if the call is still active
     */
    bool acknowledge_call_end(const std::string& call_id);

    // ========================================================================
    // Negotiation (media layer callbacks)
    // ========================================================================

    /**
     * @brief Forward a local ICE candidate to a peer
     * @throws RtcError NotFound or StoreFailure
     */
    void send_local_ice_candidate(const std::string& call_id, const std::string& remote_user_id,
                                  const IceCandidateData& candidate);

    /**
     * @brief Transport state change reported by the media layer
     */
    void handle_connection_state(const std::string& remote_user_id, ConnectionState state);

    // ========================================================================
    // Media Controls
    // ========================================================================

    /// @return New muted state
    bool toggle_mute(const std::string& call_id);

    /// @return New camera-off state
    bool toggle_camera(const std::string& call_id);

    void switch_camera(const std::string& call_id);

    /// @return New speaker state
    bool toggle_speaker(const std::string& call_id);

    void start_screen_share(const std::string& call_id);
    void stop_screen_share(const std::string& call_id);

    // ========================================================================
    // Quality
    // ========================================================================

    /**
     * @brief Apply an explicit preset (cancels automatic adjustment in flight)
     * @throws RtcError PermissionDenied or NotFound
     */
    void adjust_video_quality(const std::string& call_id, VideoQualityLevel level);

    /**
     * @brief Sample the network on the worker and apply the matching preset
     *
     * Supersedes any adjustment still in flight.
     *
     * @throws RtcError PermissionDenied or NotFound
     */
    void auto_adjust_video_quality(const std::string& call_id);

    // ========================================================================
    // Conference Management
    // ========================================================================

    void mute_participant(const std::string& call_id, const std::string& user_id, bool muted = true);
    void set_participant_role(const std::string& call_id, const std::string& user_id, ParticipantRole role);
    void remove_participant(const std::string& call_id, const std::string& user_id,
                            const std::optional<std::string>& reason = std::nullopt);

    // ========================================================================
    // File Sharing
    // ========================================================================

    /**
     * @brief Split a file and hand every chunk to a sink
     * @return Transfer metadata (to be delivered to the receiver first)
     * @throws RtcError PermissionDenied, FeatureDisabled, NotFound, InvalidState
     *         or any TransferEngine validation error
     */
    FileMetadata send_file(const std::string& call_id, const MediaFile& file, const ChunkSink& sink);

    /**
     * @brief Register an incoming file announced by a peer
     */
    void begin_file_receive(const std::string& call_id, const FileMetadata& metadata);

    /**
     * @brief Feed one received chunk to the engine
     * @return true if the chunk was accepted
     */
    bool receive_file_chunk(const std::string& call_id, const FileChunk& chunk);

    // ========================================================================
    // Introspection
    // ========================================================================

    std::optional<CallSession> get_call_session(const std::string& call_id) const;

    /**
     * @brief The non-terminal session, if any
     */
    std::optional<CallSession> get_active_call() const;

    bool has_active_call() const;

    CallStats get_call_stats() const;

private:
    /**
     * @brief Gate between router callbacks and this manager
     *
     * Cleared by destroy() so a late signal never reaches a dead manager.
     * Recursive: a handler's store failure re-enters through on_error.
     */
    struct ListenerGate {
        std::recursive_mutex mutex;
        CallSessionManager* target = nullptr;
    };

    /// Deferred listener invocations and sends, run after the lock is released
    using Effects = std::vector<std::function<void()>>;

    std::shared_ptr<SignalingRouter> router_;
    std::shared_ptr<TransferEngine> engine_;
    std::shared_ptr<PermissionChecker> permissions_;
    std::shared_ptr<MediaEngine> media_;
    std::shared_ptr<NetworkQualityProbe> probe_;
    RtcConfig config_;

    /// Worker for timeouts and automatic quality
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread worker_thread_;

    std::shared_ptr<ListenerGate> gate_;

    std::string user_id_;
    std::string display_name_;

    std::map<std::string, CallSession> sessions_;
    std::map<std::string, std::shared_ptr<asio::steady_timer>> call_timers_;
    CallStats stats_;
    mutable std::mutex sessions_mutex_;

    CallEventListeners listeners_;
    mutable std::mutex listeners_mutex_;

    std::atomic<uint64_t> quality_generation_{0};
    std::atomic<bool> destroyed_{false};

    // ========================================================================
    // Private Methods
    // ========================================================================

    void require_permission(Permission permission);
    void require_feature(bool enabled, const std::string& feature);
    void require_initialized() const;
    std::string generate_call_id() const;

    CallSession make_session(const std::string& call_id, CallType call_type, CallDirection direction) const;
    Participant make_participant(const std::string& user_id, const std::string& user_name,
                                 CallType call_type, ParticipantRole role) const;
    static MediaConstraints constraints_for(CallType call_type);
    static MediaConstraints constraints_for(const MediaState& state, CallType call_type);

    CallSession& find_session_locked(const std::string& call_id);
    CallSession& find_active_session_locked(const std::string& call_id);
    bool has_active_call_locked() const;
    void transition_locked(CallSession& session, CallState state, Effects& effects);

    void finalize_call(const std::string& call_id, CallState terminal, const std::optional<std::string>& reason,
                       const std::optional<std::string>& skip_user, ErrorCode failure_code);
    void fail_call(const std::string& call_id, const std::string& reason, ErrorCode code);

    void arm_call_timeout_locked(const std::string& call_id);
    void release_call_timeout_locked(const std::string& call_id);
    void handle_call_timeout(const std::string& call_id, const asio::steady_timer* timer);

    bool send_offer_to(const std::string& call_id, const std::string& remote_user_id);
    void renegotiate(const std::string& call_id);
    void admit_participant(const std::string& call_id, const std::string& user_id,
                           const std::string& user_name, bool send_offer);
    void apply_quality(const std::string& call_id, VideoQualityLevel level,
                       std::optional<NetworkQuality> network);

    // Router signal handlers
    void handle_offer(const SignalMessage& message, const OfferData& data);
    void handle_answer(const SignalMessage& message, const AnswerData& data);
    void handle_ice_candidate(const SignalMessage& message, const IceCandidateData& data);
    void handle_call_request(const SignalMessage& message, const CallRequestData& data);
    void handle_call_accept(const SignalMessage& message, const CallAcceptData& data);
    void handle_call_reject(const SignalMessage& message, const CallRejectData& data);
    void handle_call_end(const SignalMessage& message, const CallEndData& data);
    void handle_conference_invite(const SignalMessage& message, const ConferenceInviteData& data);
    void handle_group_call_request(const SignalMessage& message, const GroupCallRequestData& data);
    void handle_group_call_join(const SignalMessage& message, const GroupCallJoinData& data);
    void handle_group_call_leave(const SignalMessage& message, const GroupCallLeaveData& data);
    void handle_group_invitation(const SignalMessage& message, const GroupCallData& data,
                                 ParticipantRole inviter_role);

    /**
     * @brief Wrap a signal handler so it only runs while the gate is open
     */
    template <typename T>
    SignalHandler<T> gated(void (CallSessionManager::*handler)(const SignalMessage&, const T&)) {
        std::weak_ptr<ListenerGate> weak_gate = gate_;
        return [weak_gate, handler](const SignalMessage& message, const T& data) {
            auto gate = weak_gate.lock();
            if (!gate) {
                return;
            }
            std::lock_guard<std::recursive_mutex> lock(gate->mutex);
            if (gate->target) {
                (gate->target->*handler)(message, data);
            }
        };
    }

    CallEventListeners listeners_snapshot() const;
    void report_error(ErrorCode code, const std::string& message);
    void run_effects(Effects& effects);
};

} // namespace rtcomm
