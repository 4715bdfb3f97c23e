/**
 * @file call_session_manager.cpp
 * @brief Implementation of the call session manager
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/call_session_manager.hpp"
#include "rtcomm/utilities.hpp"

#include <algorithm>

namespace rtcomm {

namespace {

/**
 * @brief Call a listener if set, logging anything it throws
 */
template <typename Fn, typename... Args>
void invoke_listener(const char* name, const Fn& listener, Args&&... args) {
    if (!listener) {
        return;
    }
    try {
        listener(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        utilities::log_error(std::string(name) + " listener threw: " + e.what());
    }
}

size_t count_hosts(const CallSession& session) {
    return static_cast<size_t>(std::count_if(
        session.participants.begin(), session.participants.end(),
        [](const auto& item) { return item.second.role == ParticipantRole::HOST; }));
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

CallSessionManager::CallSessionManager(
    std::shared_ptr<SignalingRouter> router,
    std::shared_ptr<TransferEngine> engine,
    std::shared_ptr<PermissionChecker> permissions,
    std::shared_ptr<MediaEngine> media,
    std::shared_ptr<NetworkQualityProbe> probe,
    RtcConfig config
)
    : router_(std::move(router))
    , engine_(std::move(engine))
    , permissions_(std::move(permissions))
    , media_(std::move(media))
    , probe_(std::move(probe))
    , config_(std::move(config))
    , work_guard_(asio::make_work_guard(io_context_))
    , gate_(std::make_shared<ListenerGate>()) {

    if (!router_ || !engine_ || !permissions_ || !media_ || !probe_) {
        throw RtcError(ErrorCode::InvalidArgument,
                       "CallSessionManager requires router, engine, permissions, media and probe");
    }

    worker_thread_ = std::thread([this]() {
        io_context_.run();
    });
}

CallSessionManager::~CallSessionManager() {
    try {
        destroy();
    } catch (const std::exception& e) {
        utilities::log_critical("CallSessionManager teardown failed: " + std::string(e.what()));
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

void CallSessionManager::initialize(const std::string& user_id, const std::string& display_name) {
    if (destroyed_) {
        throw RtcError(ErrorCode::NotConnected, "CallSessionManager has been destroyed");
    }

    router_->initialize(user_id);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        user_id_ = user_id;
        display_name_ = display_name.empty() ? user_id : display_name;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(gate_->mutex);
        gate_->target = this;
    }

    SignalingEventListeners listeners;
    listeners.on_offer_received = gated<OfferData>(&CallSessionManager::handle_offer);
    listeners.on_answer_received = gated<AnswerData>(&CallSessionManager::handle_answer);
    listeners.on_ice_candidate_received = gated<IceCandidateData>(&CallSessionManager::handle_ice_candidate);
    listeners.on_call_request = gated<CallRequestData>(&CallSessionManager::handle_call_request);
    listeners.on_call_accept = gated<CallAcceptData>(&CallSessionManager::handle_call_accept);
    listeners.on_call_reject = gated<CallRejectData>(&CallSessionManager::handle_call_reject);
    listeners.on_call_end = gated<CallEndData>(&CallSessionManager::handle_call_end);
    listeners.on_conference_invite = gated<ConferenceInviteData>(&CallSessionManager::handle_conference_invite);
    listeners.on_group_call_request = gated<GroupCallRequestData>(&CallSessionManager::handle_group_call_request);
    listeners.on_group_call_join = gated<GroupCallJoinData>(&CallSessionManager::handle_group_call_join);
    listeners.on_group_call_leave = gated<GroupCallLeaveData>(&CallSessionManager::handle_group_call_leave);

    std::weak_ptr<ListenerGate> weak_gate = gate_;
    listeners.on_error = [weak_gate](ErrorCode code, const std::string& message) {
        auto gate = weak_gate.lock();
        if (!gate) {
            return;
        }
        std::lock_guard<std::recursive_mutex> lock(gate->mutex);
        if (gate->target) {
            gate->target->report_error(code, message);
        }
    };

    router_->set_event_listeners(listeners);

    utilities::log_info("CallSessionManager initialized for " + user_id);
}

void CallSessionManager::destroy() {
    if (std::this_thread::get_id() == worker_thread_.get_id()) {
        throw RtcError(ErrorCode::InvalidState, "CallSessionManager cannot be destroyed from its worker");
    }

    if (destroyed_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(gate_->mutex);
        gate_->target = nullptr;
    }

    // Pending automatic adjustments become stale
    ++quality_generation_;

    std::vector<std::string> active;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [call_id, session] : sessions_) {
            if (!is_terminal_call_state(session.state)) {
                active.push_back(call_id);
            }
        }
    }

    for (const auto& call_id : active) {
        try {
            finalize_call(call_id, CallState::ENDED, std::string("shutdown"), std::nullopt, ErrorCode::Cancelled);
        } catch (const std::exception& e) {
            utilities::log_error("Failed to end call " + call_id + " during shutdown: " + e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        std::vector<std::string> timed;
        for (const auto& [call_id, timer] : call_timers_) {
            timed.push_back(call_id);
        }
        for (const auto& call_id : timed) {
            release_call_timeout_locked(call_id);
        }
    }

    work_guard_.reset();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_ = CallEventListeners{};
    }

    utilities::log_info("CallSessionManager destroyed");
}

void CallSessionManager::set_event_listeners(const CallEventListeners& listeners) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (listeners.on_incoming_call) listeners_.on_incoming_call = listeners.on_incoming_call;
    if (listeners.on_call_state_changed) listeners_.on_call_state_changed = listeners.on_call_state_changed;
    if (listeners.on_call_started) listeners_.on_call_started = listeners.on_call_started;
    if (listeners.on_call_ended) listeners_.on_call_ended = listeners.on_call_ended;
    if (listeners.on_call_failed) listeners_.on_call_failed = listeners.on_call_failed;
    if (listeners.on_participant_joined) listeners_.on_participant_joined = listeners.on_participant_joined;
    if (listeners.on_participant_left) listeners_.on_participant_left = listeners.on_participant_left;
    if (listeners.on_participant_media_changed) listeners_.on_participant_media_changed = listeners.on_participant_media_changed;
    if (listeners.on_participant_role_changed) listeners_.on_participant_role_changed = listeners.on_participant_role_changed;
    if (listeners.on_group_call_invite) listeners_.on_group_call_invite = listeners.on_group_call_invite;
    if (listeners.on_quality_changed) listeners_.on_quality_changed = listeners.on_quality_changed;
    if (listeners.on_error) listeners_.on_error = listeners.on_error;
}

// ============================================================================
// Guards and Factories
// ============================================================================

void CallSessionManager::require_permission(Permission permission) {
    if (permissions_->has_permission(permission)) {
        return;
    }

    std::string message = "Permission denied: " + permission_to_string(permission);
    report_error(ErrorCode::PermissionDenied, message);
    throw RtcError(ErrorCode::PermissionDenied, message);
}

void CallSessionManager::require_feature(bool enabled, const std::string& feature) {
    if (enabled) {
        return;
    }

    std::string message = "Feature disabled: " + feature;
    report_error(ErrorCode::FeatureDisabled, message);
    throw RtcError(ErrorCode::FeatureDisabled, message);
}

void CallSessionManager::require_initialized() const {
    if (destroyed_) {
        throw RtcError(ErrorCode::NotConnected, "CallSessionManager has been destroyed");
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (user_id_.empty()) {
        throw RtcError(ErrorCode::MissingUserId, "CallSessionManager is not initialized");
    }
}

std::string CallSessionManager::generate_call_id() const {
    return "call-" + std::to_string(utilities::current_time_ms()) + "-" +
           utilities::generate_random_string(9);
}

Participant CallSessionManager::make_participant(
    const std::string& user_id,
    const std::string& user_name,
    CallType call_type,
    ParticipantRole role
) const {
    Participant participant;
    participant.user_id = user_id;
    participant.user_name = user_name.empty() ? user_id : user_name;
    participant.role = role;
    participant.connection_state = ConnectionState::CONNECTING;
    participant.media_state = MediaState::for_call_type(call_type);
    participant.joined_at = utilities::current_time_ms();
    return participant;
}

CallSession CallSessionManager::make_session(
    const std::string& call_id,
    CallType call_type,
    CallDirection direction
) const {
    CallSession session;
    session.call_id = call_id;
    session.call_type = call_type;
    session.direction = direction;
    session.state = CallState::IDLE;
    session.local_user_id = user_id_;
    session.start_time = utilities::current_time_ms();
    session.quality_preset = config_.default_video_quality;

    Participant local = make_participant(user_id_, display_name_, call_type, ParticipantRole::PARTICIPANT);
    local.is_local = true;
    local.connection_state = ConnectionState::CONNECTED;
    session.participants.emplace(user_id_, std::move(local));

    return session;
}

MediaConstraints CallSessionManager::constraints_for(CallType call_type) {
    MediaConstraints constraints;
    constraints.audio = true;
    constraints.video = call_type == CallType::VIDEO;
    return constraints;
}

MediaConstraints CallSessionManager::constraints_for(const MediaState& state, CallType call_type) {
    MediaConstraints constraints;
    constraints.audio = !state.mic_muted;
    constraints.video = (call_type == CallType::VIDEO && !state.camera_off) || state.screen_sharing;
    return constraints;
}

// ============================================================================
// Session Lookup and Transitions
// ============================================================================

CallSession& CallSessionManager::find_session_locked(const std::string& call_id) {
    auto it = sessions_.find(call_id);
    if (it == sessions_.end()) {
        throw RtcError(ErrorCode::NotFound, "Unknown call: " + call_id);
    }
    return it->second;
}

CallSession& CallSessionManager::find_active_session_locked(const std::string& call_id) {
    CallSession& session = find_session_locked(call_id);
    if (is_terminal_call_state(session.state)) {
        throw RtcError(ErrorCode::InvalidState,
                       "Call " + call_id + " is " + call_state_to_string(session.state));
    }
    return session;
}

bool CallSessionManager::has_active_call_locked() const {
    return std::any_of(sessions_.begin(), sessions_.end(), [](const auto& item) {
        return !is_terminal_call_state(item.second.state);
    });
}

void CallSessionManager::transition_locked(CallSession& session, CallState state, Effects& effects) {
    if (!is_legal_call_transition(session.state, state)) {
        throw RtcError(ErrorCode::InvalidState,
                       "Illegal call transition " + call_state_to_string(session.state) +
                       " -> " + call_state_to_string(state));
    }

    CallState previous = session.state;
    session.state = state;
    std::string call_id = session.call_id;

    utilities::log_info("Call " + call_id + ": " + call_state_to_string(previous) +
                        " -> " + call_state_to_string(state));

    effects.push_back([this, call_id, state, previous]() {
        invoke_listener("on_call_state_changed", listeners_snapshot().on_call_state_changed,
                        call_id, state, previous);
    });

    if (state == CallState::CONNECTED) {
        session.start_time = utilities::current_time_ms();
        CallSession snapshot = session;
        effects.push_back([this, call_id, snapshot]() {
            invoke_listener("on_call_started", listeners_snapshot().on_call_started, call_id, snapshot);
        });
    }
}

// ============================================================================
// Call Control
// ============================================================================

std::string CallSessionManager::initiate_call(
    const std::string& target_user_id,
    CallType call_type,
    const std::string& target_name
) {
    require_initialized();

    switch (call_type) {
        case CallType::AUDIO:
            require_permission(Permission::VOICE_CALL_INITIATE);
            require_feature(config_.features.enable_voice_call, "voice_call");
            break;
        case CallType::VIDEO:
            require_permission(Permission::VIDEO_CALL_INITIATE);
            require_feature(config_.features.enable_video_call, "video_call");
            break;
        case CallType::SCREEN_SHARE:
            require_permission(Permission::SCREEN_SHARE);
            require_feature(config_.features.enable_screen_share, "screen_share");
            break;
    }

    if (!validate_identifier(target_user_id) || target_user_id == user_id_) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid call target: " + target_user_id);
    }

    std::string call_id = generate_call_id();
    Effects effects;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (has_active_call_locked()) {
            throw RtcError(ErrorCode::InvalidState, "Another call is already active");
        }

        CallSession session = make_session(call_id, call_type, CallDirection::OUTGOING);
        session.participants.emplace(
            target_user_id, make_participant(target_user_id, target_name, call_type, ParticipantRole::PARTICIPANT));

        CallSession& stored = sessions_.emplace(call_id, std::move(session)).first->second;
        ++stats_.total_calls;
        transition_locked(stored, CallState::INITIATING, effects);
    }
    run_effects(effects);

    try {
        media_->acquire_local_media(call_id, constraints_for(call_type));
    } catch (const std::exception& e) {
        finalize_call(call_id, CallState::FAILED, "Local media unavailable: " + std::string(e.what()),
                      target_user_id, ErrorCode::InvalidState);
        throw;
    }

    CallRequestData request;
    request.call_id = call_id;
    request.call_type = call_type;
    request.initiator_name = display_name_;
    request.constraints = constraints_for(call_type);

    try {
        router_->send_call_request(target_user_id, request);
    } catch (const RtcError& e) {
        finalize_call(call_id, CallState::FAILED, std::string(e.what()), target_user_id, e.code());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        // The callee may already have answered
        if (it != sessions_.end() && it->second.state == CallState::INITIATING) {
            transition_locked(it->second, CallState::RINGING, effects);
        }
        if (it != sessions_.end() && !is_terminal_call_state(it->second.state)) {
            arm_call_timeout_locked(call_id);
        }
    }
    run_effects(effects);

    utilities::log_info("Calling " + target_user_id + " (" + SignalHelpers::call_type_to_string(call_type) +
                        ", " + call_id + ")");
    return call_id;
}

std::string CallSessionManager::initiate_group_call(
    const std::string& group_id,
    const std::string& group_name,
    const std::vector<std::string>& participants,
    CallType call_type
) {
    require_initialized();
    require_permission(Permission::GROUP_CALL_CREATE);
    require_feature(config_.features.enable_group_call, "group_call");

    if (!validate_identifier(group_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid group id: " + group_id);
    }
    if (participants.size() + 1 > config_.max_conference_participants) {
        throw RtcError(ErrorCode::InvalidArgument,
                       "Too many participants (maximum " +
                       std::to_string(config_.max_conference_participants) + ")");
    }

    std::string call_id = generate_call_id();
    Effects effects;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (has_active_call_locked()) {
            throw RtcError(ErrorCode::InvalidState, "Another call is already active");
        }

        CallSession session = make_session(call_id, call_type, CallDirection::OUTGOING);
        session.is_group = true;
        session.group_id = group_id;
        session.group_name = group_name;
        session.local_participant().role = ParticipantRole::HOST;

        CallSession& stored = sessions_.emplace(call_id, std::move(session)).first->second;
        ++stats_.total_calls;
        transition_locked(stored, CallState::INITIATING, effects);
    }
    run_effects(effects);

    try {
        media_->acquire_local_media(call_id, constraints_for(call_type));
    } catch (const std::exception& e) {
        finalize_call(call_id, CallState::FAILED, "Local media unavailable: " + std::string(e.what()),
                      std::nullopt, ErrorCode::InvalidState);
        throw;
    }

    GroupCallRequestData request;
    request.call_id = call_id;
    request.call_type = call_type;
    request.group_name = group_name;
    request.initiator_name = display_name_;
    request.participants = participants;

    try {
        router_->send_group_call_request(group_id, request);
    } catch (const RtcError& e) {
        finalize_call(call_id, CallState::FAILED, std::string(e.what()), std::nullopt, e.code());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it != sessions_.end() && it->second.state == CallState::INITIATING) {
            transition_locked(it->second, CallState::RINGING, effects);
        }
        if (it != sessions_.end() && !is_terminal_call_state(it->second.state)) {
            arm_call_timeout_locked(call_id);
        }
    }
    run_effects(effects);

    utilities::log_info("Group call " + call_id + " started in " + group_id);
    return call_id;
}

void CallSessionManager::invite_to_conference(const std::string& call_id, const std::string& user_id) {
    require_permission(Permission::GROUP_CALL_INVITE);

    if (!validate_identifier(user_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid user id: " + user_id);
    }

    ConferenceInviteData invite;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (!session.is_group) {
            throw RtcError(ErrorCode::InvalidState, "Invitations require a group call");
        }
        if (session.participants.count(user_id) > 0) {
            throw RtcError(ErrorCode::InvalidArgument, user_id + " is already in call " + call_id);
        }
        if (session.participants.size() >= config_.max_conference_participants) {
            throw RtcError(ErrorCode::InvalidState, "Conference is full");
        }

        invite.call_id = call_id;
        invite.call_type = session.call_type;
        invite.group_name = session.group_name.value_or("");
        invite.initiator_name = display_name_;
        for (const auto& [participant_id, participant] : session.participants) {
            invite.participants.push_back(participant_id);
        }
    }

    router_->send_conference_invite(user_id, invite);
    utilities::log_info("Invited " + user_id + " to " + call_id);
}

void CallSessionManager::accept_call(const std::string& call_id) {
    require_permission(Permission::CALL_ANSWER);

    Effects effects;
    CallType call_type;
    bool is_group = false;
    std::optional<std::string> group_id;
    std::string group_name;
    std::vector<std::string> remotes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_session_locked(call_id);
        if (session.state != CallState::RINGING || session.direction != CallDirection::INCOMING) {
            throw RtcError(ErrorCode::InvalidState,
                           "Cannot accept call in state " + call_state_to_string(session.state));
        }

        transition_locked(session, CallState::CONNECTING, effects);
        arm_call_timeout_locked(call_id);

        call_type = session.call_type;
        is_group = session.is_group;
        group_id = session.group_id;
        group_name = session.group_name.value_or("");
        remotes = session.remote_user_ids();
    }
    run_effects(effects);

    try {
        media_->acquire_local_media(call_id, constraints_for(call_type));
    } catch (const std::exception& e) {
        fail_call(call_id, "Local media unavailable: " + std::string(e.what()), ErrorCode::InvalidState);
        throw;
    }

    try {
        if (is_group && group_id) {
            GroupCallJoinData join;
            join.call_id = call_id;
            join.call_type = call_type;
            join.group_name = group_name;
            join.initiator_name = display_name_;
            join.participants = remotes;
            router_->send_group_call_join(*group_id, join);
        } else if (!remotes.empty()) {
            router_->send_call_accept(remotes.front(), call_id);
        }
    } catch (const RtcError& e) {
        fail_call(call_id, std::string(e.what()), e.code());
        throw;
    }

    utilities::log_info("Accepted call " + call_id);
}

void CallSessionManager::reject_call(const std::string& call_id, const std::optional<std::string>& reason) {
    require_permission(Permission::CALL_REJECT);

    std::string why = reason.value_or("rejected");
    Effects effects;
    std::vector<std::string> remotes;
    bool notify_peers = true;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_session_locked(call_id);
        if (session.state != CallState::RINGING || session.direction != CallDirection::INCOMING) {
            throw RtcError(ErrorCode::InvalidState,
                           "Cannot reject call in state " + call_state_to_string(session.state));
        }

        transition_locked(session, CallState::REJECTED, effects);
        session.end_time = utilities::current_time_ms();
        session.end_reason = why;
        ++stats_.rejected_calls;
        release_call_timeout_locked(call_id);

        remotes = session.remote_user_ids();
        // Declining a group ring is local; the group is not told
        notify_peers = !(session.is_group && session.group_id);
    }
    run_effects(effects);

    if (notify_peers) {
        for (const auto& remote : remotes) {
            try {
                router_->send_call_reject(remote, call_id, why);
            } catch (const RtcError& e) {
                utilities::log_warn("Could not send call-reject to " + remote + ": " + e.what());
            }
        }
    }

    invoke_listener("on_call_ended", listeners_snapshot().on_call_ended,
                    call_id, uint64_t{0}, std::optional<std::string>(why));
}

void CallSessionManager::end_call(const std::string& call_id, const std::optional<std::string>& reason) {
    require_permission(Permission::CALL_END);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state)) {
            utilities::log_debug("end_call ignored for " + call_id);
            return;
        }
    }

    finalize_call(call_id, CallState::ENDED, reason, std::nullopt, ErrorCode::Cancelled);
}

bool CallSessionManager::acknowledge_call_end(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(call_id);
    if (it == sessions_.end()) {
        return false;
    }
    if (!is_terminal_call_state(it->second.state)) {
        throw RtcError(ErrorCode::InvalidState, "Call " + call_id + " is still active");
    }

    release_call_timeout_locked(call_id);
    sessions_.erase(it);
    utilities::log_debug("Released call session " + call_id);
    return true;
}

void CallSessionManager::finalize_call(
    const std::string& call_id,
    CallState terminal,
    const std::optional<std::string>& reason,
    const std::optional<std::string>& skip_user,
    ErrorCode failure_code
) {
    Effects effects;
    std::vector<std::string> remotes;
    bool is_group = false;
    bool is_host = false;
    std::optional<std::string> group_id;
    std::string group_name;
    CallType call_type = CallType::AUDIO;
    uint64_t duration = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state)) {
            return;
        }

        CallSession& session = it->second;
        CallState previous = session.state;
        transition_locked(session, terminal, effects);
        session.end_time = utilities::current_time_ms();
        session.end_reason = reason;

        if (previous == CallState::CONNECTED) {
            duration = session.duration_ms(*session.end_time);
            ++stats_.completed_calls;
            stats_.average_duration =
                (stats_.average_duration * static_cast<double>(stats_.completed_calls - 1) + duration) /
                static_cast<double>(stats_.completed_calls);
        } else {
            ++stats_.failed_calls;
        }

        release_call_timeout_locked(call_id);

        remotes = session.remote_user_ids();
        is_group = session.is_group;
        is_host = session.local_participant().role == ParticipantRole::HOST;
        group_id = session.group_id;
        group_name = session.group_name.value_or("");
        call_type = session.call_type;
    }

    ++quality_generation_;
    run_effects(effects);

    // Tell the peers (never echo to the user who ended it)
    if (is_group && group_id) {
        try {
            if (is_host) {
                CallEndData end;
                end.call_id = call_id;
                end.reason = reason;
                router_->send_group_signal(end, *group_id, call_id);
            } else {
                GroupCallLeaveData leave;
                leave.call_id = call_id;
                leave.call_type = call_type;
                leave.group_name = group_name;
                leave.initiator_name = display_name_;
                router_->send_group_call_leave(*group_id, leave);
            }
        } catch (const RtcError& e) {
            utilities::log_warn("Could not notify group " + *group_id + " of call end: " + e.what());
        }
    } else {
        for (const auto& remote : remotes) {
            if (skip_user && *skip_user == remote) {
                continue;
            }
            try {
                router_->send_call_end(remote, call_id, reason);
            } catch (const RtcError& e) {
                utilities::log_warn("Could not send call-end to " + remote + ": " + e.what());
            }
        }
    }

    for (const auto& remote : remotes) {
        try {
            media_->close_peer(remote);
        } catch (const std::exception& e) {
            utilities::log_warn("Closing peer " + remote + " failed: " + e.what());
        }
    }
    try {
        media_->release_local_media(call_id);
    } catch (const std::exception& e) {
        utilities::log_warn("Releasing local media failed: " + std::string(e.what()));
    }

    utilities::log_info("Call " + call_id + " " + call_state_to_string(terminal) +
                        (reason ? " (" + *reason + ")" : std::string()) +
                        ", duration " + utilities::format_duration(duration / 1000));

    auto listeners = listeners_snapshot();
    invoke_listener("on_call_ended", listeners.on_call_ended, call_id, duration, reason);
    if (terminal == CallState::FAILED) {
        invoke_listener("on_call_failed", listeners.on_call_failed,
                        call_id, failure_code, reason.value_or("failed"));
    }
}

void CallSessionManager::fail_call(const std::string& call_id, const std::string& reason, ErrorCode code) {
    finalize_call(call_id, CallState::FAILED, reason, std::nullopt, code);
}

// ============================================================================
// Timeouts
// ============================================================================

void CallSessionManager::arm_call_timeout_locked(const std::string& call_id) {
    release_call_timeout_locked(call_id);
    if (destroyed_) {
        return;
    }

    auto timer = std::make_shared<asio::steady_timer>(io_context_, config_.call_timeout);
    const asio::steady_timer* raw = timer.get();
    timer->async_wait([this, call_id, raw](const asio::error_code& ec) {
        if (!ec) {
            handle_call_timeout(call_id, raw);
        }
    });
    call_timers_[call_id] = std::move(timer);
}

void CallSessionManager::release_call_timeout_locked(const std::string& call_id) {
    auto it = call_timers_.find(call_id);
    if (it == call_timers_.end()) {
        return;
    }

    // Cancel on the worker, which owns armed timers
    auto timer = std::move(it->second);
    call_timers_.erase(it);
    asio::post(io_context_, [timer]() {
        timer->cancel();
    });
}

void CallSessionManager::handle_call_timeout(const std::string& call_id, const asio::steady_timer* timer) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto timer_it = call_timers_.find(call_id);
        if (timer_it == call_timers_.end() || timer_it->second.get() != timer) {
            return;
        }
        call_timers_.erase(timer_it);

        auto it = sessions_.find(call_id);
        if (it == sessions_.end()) {
            return;
        }
        CallState state = it->second.state;
        if (state != CallState::INITIATING && state != CallState::RINGING && state != CallState::CONNECTING) {
            return;
        }
    }

    utilities::log_warn("Call " + call_id + " timed out");
    finalize_call(call_id, CallState::FAILED, std::string("timeout"), std::nullopt, ErrorCode::Timeout);
}

// ============================================================================
// Negotiation
// ============================================================================

bool CallSessionManager::send_offer_to(const std::string& call_id, const std::string& remote_user_id) {
    MediaConstraints constraints;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state)) {
            return false;
        }
        const CallSession& session = it->second;
        constraints = constraints_for(session.local_participant().media_state, session.call_type);
    }

    try {
        std::string sdp = media_->create_offer(remote_user_id, constraints);
        router_->send_offer(remote_user_id, sdp, constraints, call_id);
        return true;
    } catch (const RtcError& e) {
        report_error(e.code(), "Offer to " + remote_user_id + " failed: " + e.what());
    } catch (const std::exception& e) {
        report_error(ErrorCode::InvalidState, "Offer to " + remote_user_id + " failed: " + e.what());
    }
    return false;
}

void CallSessionManager::renegotiate(const std::string& call_id) {
    std::vector<std::string> remotes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || it->second.state != CallState::CONNECTED) {
            return;
        }
        remotes = it->second.remote_user_ids();
    }

    for (const auto& remote : remotes) {
        send_offer_to(call_id, remote);
    }
}

void CallSessionManager::send_local_ice_candidate(
    const std::string& call_id,
    const std::string& remote_user_id,
    const IceCandidateData& candidate
) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (session.participants.count(remote_user_id) == 0) {
            throw RtcError(ErrorCode::NotFound, remote_user_id + " is not in call " + call_id);
        }
    }

    router_->send_ice_candidate(remote_user_id, candidate, call_id);
}

void CallSessionManager::handle_connection_state(const std::string& remote_user_id, ConnectionState state) {
    Effects effects;
    std::string call_id;
    bool fail_one_to_one = false;
    bool drop_member = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const auto& item) {
            return !is_terminal_call_state(item.second.state) &&
                   item.second.participants.count(remote_user_id) > 0;
        });
        if (it == sessions_.end()) {
            utilities::log_debug("Connection state for " + remote_user_id + " outside any call");
            return;
        }

        CallSession& session = it->second;
        call_id = session.call_id;
        session.participants.at(remote_user_id).connection_state = state;

        if (state == ConnectionState::CONNECTED && session.state == CallState::CONNECTING) {
            transition_locked(session, CallState::CONNECTED, effects);
            release_call_timeout_locked(call_id);
        } else if (state == ConnectionState::FAILED) {
            if (session.is_group) {
                session.participants.erase(remote_user_id);
                drop_member = true;
            } else {
                fail_one_to_one = true;
            }
        }
    }
    run_effects(effects);

    if (fail_one_to_one) {
        fail_call(call_id, "connection failed", ErrorCode::NotConnected);
    } else if (drop_member) {
        try {
            media_->close_peer(remote_user_id);
        } catch (const std::exception& e) {
            utilities::log_warn("Closing peer " + remote_user_id + " failed: " + e.what());
        }
        invoke_listener("on_participant_left", listeners_snapshot().on_participant_left,
                        call_id, remote_user_id, std::optional<std::string>("connection failed"));
    }
}

void CallSessionManager::admit_participant(
    const std::string& call_id,
    const std::string& user_id,
    const std::string& user_name,
    bool send_offer
) {
    Effects effects;
    std::optional<Participant> joined;
    bool offer = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state)) {
            return;
        }

        CallSession& session = it->second;
        if (session.participants.count(user_id) == 0) {
            if (session.participants.size() >= config_.max_conference_participants) {
                utilities::log_warn("Conference " + call_id + " is full, ignoring " + user_id);
                return;
            }
            Participant participant = make_participant(user_id, user_name, session.call_type,
                                                       ParticipantRole::PARTICIPANT);
            session.participants.emplace(user_id, participant);
            joined = participant;
        }

        if (session.direction == CallDirection::OUTGOING && session.state == CallState::RINGING) {
            transition_locked(session, CallState::CONNECTING, effects);
            arm_call_timeout_locked(call_id);
        }

        offer = send_offer && (session.state == CallState::CONNECTING || session.state == CallState::CONNECTED);
    }
    run_effects(effects);

    if (joined) {
        utilities::log_info(user_id + " joined call " + call_id);
        invoke_listener("on_participant_joined", listeners_snapshot().on_participant_joined, call_id, *joined);
    }

    if (offer) {
        send_offer_to(call_id, user_id);
    }
}

// ============================================================================
// Signal Handlers
// ============================================================================

void CallSessionManager::handle_offer(const SignalMessage& message, const OfferData& data) {
    if (!message.call_id) {
        utilities::log_warn("Offer from " + message.from_user + " has no call id");
        return;
    }
    const std::string& call_id = *message.call_id;

    bool is_group = false;
    bool known_sender = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state)) {
            utilities::log_debug("Offer for inactive call " + call_id);
            return;
        }
        is_group = it->second.is_group;
        known_sender = it->second.participants.count(message.from_user) > 0;
    }

    if (!known_sender) {
        if (!is_group) {
            utilities::log_warn("Offer from stranger " + message.from_user + " for " + call_id);
            return;
        }
        admit_participant(call_id, message.from_user, message.from_user, false);
    }

    try {
        std::string sdp = media_->create_answer(message.from_user, data.sdp);
        router_->send_answer(message.from_user, sdp, call_id);
    } catch (const std::exception& e) {
        ErrorCode code = ErrorCode::InvalidState;
        if (auto rtc = dynamic_cast<const RtcError*>(&e)) {
            code = rtc->code();
        }
        report_error(code, "Answering " + message.from_user + " failed: " + e.what());
        if (!is_group) {
            fail_call(call_id, "negotiation failed", code);
        }
    }
}

void CallSessionManager::handle_answer(const SignalMessage& message, const AnswerData& data) {
    try {
        media_->apply_answer(message.from_user, data.sdp);
    } catch (const std::exception& e) {
        report_error(ErrorCode::InvalidState, "Applying answer from " + message.from_user + " failed: " + e.what());
    }
}

void CallSessionManager::handle_ice_candidate(const SignalMessage& message, const IceCandidateData& data) {
    try {
        media_->add_ice_candidate(message.from_user, data);
    } catch (const std::exception& e) {
        report_error(ErrorCode::InvalidState, "ICE candidate from " + message.from_user + " failed: " + e.what());
    }
}

void CallSessionManager::handle_call_request(const SignalMessage& message, const CallRequestData& data) {
    Effects effects;
    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(data.call_id) > 0) {
            utilities::log_debug("Duplicate call request " + data.call_id);
            return;
        }

        if (has_active_call_locked()) {
            busy = true;
        } else {
            CallSession session = make_session(data.call_id, data.call_type, CallDirection::INCOMING);
            session.participants.emplace(
                message.from_user,
                make_participant(message.from_user, data.initiator_name, data.call_type, ParticipantRole::PARTICIPANT));

            CallSession& stored = sessions_.emplace(data.call_id, std::move(session)).first->second;
            ++stats_.total_calls;
            transition_locked(stored, CallState::RINGING, effects);
            arm_call_timeout_locked(data.call_id);
        }
    }

    if (busy) {
        utilities::log_info("Busy, rejecting " + data.call_id + " from " + message.from_user);
        try {
            router_->send_call_reject(message.from_user, data.call_id, std::string("busy"));
        } catch (const RtcError& e) {
            report_error(e.code(), "Could not send busy reject: " + std::string(e.what()));
        }
        return;
    }

    run_effects(effects);
    utilities::log_info("Incoming " + SignalHelpers::call_type_to_string(data.call_type) +
                        " call " + data.call_id + " from " + message.from_user);
    invoke_listener("on_incoming_call", listeners_snapshot().on_incoming_call,
                    data.call_id, message.from_user, data.call_type);
}

void CallSessionManager::handle_call_accept(const SignalMessage& message, const CallAcceptData& data) {
    Effects effects;
    bool group = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(data.call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state) ||
            it->second.direction != CallDirection::OUTGOING) {
            return;
        }

        CallSession& session = it->second;
        group = session.is_group;
        if (!group) {
            if (session.participants.count(message.from_user) == 0) {
                utilities::log_warn("Call accept from stranger " + message.from_user);
                return;
            }
            if (session.state == CallState::INITIATING) {
                transition_locked(session, CallState::RINGING, effects);
            }
            if (session.state != CallState::RINGING) {
                return;
            }
            transition_locked(session, CallState::CONNECTING, effects);
            arm_call_timeout_locked(data.call_id);
        }
    }
    run_effects(effects);

    if (group) {
        admit_participant(data.call_id, message.from_user, message.from_user, true);
        return;
    }

    if (!send_offer_to(data.call_id, message.from_user)) {
        fail_call(data.call_id, "negotiation failed", ErrorCode::InvalidState);
    }
}

void CallSessionManager::handle_call_reject(const SignalMessage& message, const CallRejectData& data) {
    Effects effects;
    std::string reason = data.reason.value_or("rejected");
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(data.call_id);
        if (it == sessions_.end()) {
            return;
        }

        CallSession& session = it->second;
        if (session.is_group) {
            // One declined invitation does not end a conference
            utilities::log_info(message.from_user + " declined " + data.call_id + ": " + reason);
            return;
        }
        if (session.direction != CallDirection::OUTGOING ||
            (session.state != CallState::INITIATING && session.state != CallState::RINGING) ||
            session.participants.count(message.from_user) == 0) {
            return;
        }

        transition_locked(session, CallState::REJECTED, effects);
        session.end_time = utilities::current_time_ms();
        session.end_reason = reason;
        ++stats_.rejected_calls;
        release_call_timeout_locked(data.call_id);
    }
    ++quality_generation_;
    run_effects(effects);

    try {
        media_->close_peer(message.from_user);
        media_->release_local_media(data.call_id);
    } catch (const std::exception& e) {
        utilities::log_warn("Releasing media after reject failed: " + std::string(e.what()));
    }

    utilities::log_info("Call " + data.call_id + " rejected by " + message.from_user + ": " + reason);
    invoke_listener("on_call_ended", listeners_snapshot().on_call_ended,
                    data.call_id, uint64_t{0}, std::optional<std::string>(reason));
}

void CallSessionManager::handle_call_end(const SignalMessage& message, const CallEndData& data) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(data.call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state) ||
            it->second.participants.count(message.from_user) == 0) {
            return;
        }
    }

    finalize_call(data.call_id, CallState::ENDED, data.reason.value_or("remote ended"),
                  message.from_user, ErrorCode::Cancelled);
}

void CallSessionManager::handle_conference_invite(const SignalMessage& message, const ConferenceInviteData& data) {
    handle_group_invitation(message, data, ParticipantRole::PARTICIPANT);
}

void CallSessionManager::handle_group_call_request(const SignalMessage& message, const GroupCallRequestData& data) {
    handle_group_invitation(message, data, ParticipantRole::HOST);
}

void CallSessionManager::handle_group_invitation(
    const SignalMessage& message,
    const GroupCallData& data,
    ParticipantRole inviter_role
) {
    if (!config_.features.enable_group_call) {
        utilities::log_debug("Group calls disabled, ignoring " + data.call_id);
        return;
    }

    Effects effects;
    bool busy = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(data.call_id) > 0) {
            return;
        }

        if (has_active_call_locked()) {
            busy = true;
        } else {
            CallSession session = make_session(data.call_id, data.call_type, CallDirection::INCOMING);
            session.is_group = true;
            session.group_id = message.group_id;
            session.group_name = data.group_name;
            session.participants.emplace(
                message.from_user,
                make_participant(message.from_user, data.initiator_name, data.call_type, inviter_role));

            CallSession& stored = sessions_.emplace(data.call_id, std::move(session)).first->second;
            ++stats_.total_calls;
            transition_locked(stored, CallState::RINGING, effects);
            arm_call_timeout_locked(data.call_id);
        }
    }

    if (busy) {
        if (!message.group_id) {
            try {
                router_->send_call_reject(message.from_user, data.call_id, std::string("busy"));
            } catch (const RtcError& e) {
                report_error(e.code(), "Could not send busy reject: " + std::string(e.what()));
            }
        } else {
            utilities::log_info("Busy, ignoring group call " + data.call_id);
        }
        return;
    }

    run_effects(effects);
    utilities::log_info("Group call invitation " + data.call_id + " from " + message.from_user);

    auto listeners = listeners_snapshot();
    invoke_listener("on_group_call_invite", listeners.on_group_call_invite,
                    data.call_id, message.group_id, message.from_user, data);
    invoke_listener("on_incoming_call", listeners.on_incoming_call,
                    data.call_id, message.from_user, data.call_type);
}

void CallSessionManager::handle_group_call_join(const SignalMessage& message, const GroupCallJoinData& data) {
    admit_participant(data.call_id, message.from_user, data.initiator_name, true);
}

void CallSessionManager::handle_group_call_leave(const SignalMessage& message, const GroupCallLeaveData& data) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(data.call_id);
        if (it == sessions_.end() || is_terminal_call_state(it->second.state) ||
            it->second.participants.erase(message.from_user) == 0) {
            return;
        }
    }

    try {
        media_->close_peer(message.from_user);
    } catch (const std::exception& e) {
        utilities::log_warn("Closing peer " + message.from_user + " failed: " + e.what());
    }

    utilities::log_info(message.from_user + " left call " + data.call_id);
    invoke_listener("on_participant_left", listeners_snapshot().on_participant_left,
                    data.call_id, message.from_user, std::optional<std::string>("left"));
}

// ============================================================================
// Media Controls
// ============================================================================

bool CallSessionManager::toggle_mute(const std::string& call_id) {
    require_permission(Permission::MICROPHONE_TOGGLE);

    bool muted;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        muted = !find_active_session_locked(call_id).local_participant().media_state.mic_muted;
    }

    media_->set_audio_enabled(!muted);

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Participant& local = find_active_session_locked(call_id).local_participant();
        local.media_state.mic_muted = muted;
        local.media_state.audio_enabled = !muted;
        state = local.media_state;
    }

    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id_, state);
    renegotiate(call_id);
    return muted;
}

bool CallSessionManager::toggle_camera(const std::string& call_id) {
    require_permission(Permission::CAMERA_TOGGLE);

    bool camera_off;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (session.call_type == CallType::AUDIO) {
            throw RtcError(ErrorCode::InvalidState, "Audio calls have no camera");
        }
        camera_off = !session.local_participant().media_state.camera_off;
    }

    media_->set_video_enabled(!camera_off);

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Participant& local = find_active_session_locked(call_id).local_participant();
        local.media_state.camera_off = camera_off;
        local.media_state.video_enabled = !camera_off;
        state = local.media_state;
    }

    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id_, state);
    renegotiate(call_id);
    return camera_off;
}

void CallSessionManager::switch_camera(const std::string& call_id) {
    require_permission(Permission::CAMERA_TOGGLE);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (session.call_type == CallType::AUDIO) {
            throw RtcError(ErrorCode::InvalidState, "Audio calls have no camera");
        }
    }

    media_->switch_camera();
    renegotiate(call_id);
}

bool CallSessionManager::toggle_speaker(const std::string& call_id) {
    require_permission(Permission::SPEAKER_TOGGLE);

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Participant& local = find_active_session_locked(call_id).local_participant();
        local.media_state.speaker_enabled = !local.media_state.speaker_enabled;
        state = local.media_state;
    }

    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id_, state);
    return state.speaker_enabled;
}

void CallSessionManager::start_screen_share(const std::string& call_id) {
    require_permission(Permission::SCREEN_SHARE);
    require_feature(config_.features.enable_screen_share, "screen_share");

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (find_active_session_locked(call_id).local_participant().media_state.screen_sharing) {
            return;
        }
    }

    media_->start_screen_capture();

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Participant& local = find_active_session_locked(call_id).local_participant();
        local.media_state.screen_sharing = true;
        local.is_presenting = true;
        state = local.media_state;
    }

    utilities::log_info("Screen share started in " + call_id);
    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id_, state);
    renegotiate(call_id);
}

void CallSessionManager::stop_screen_share(const std::string& call_id) {
    require_permission(Permission::SCREEN_SHARE);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (!find_active_session_locked(call_id).local_participant().media_state.screen_sharing) {
            return;
        }
    }

    media_->stop_screen_capture();

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        Participant& local = find_active_session_locked(call_id).local_participant();
        local.media_state.screen_sharing = false;
        local.is_presenting = false;
        state = local.media_state;
    }

    utilities::log_info("Screen share stopped in " + call_id);
    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id_, state);
    renegotiate(call_id);
}

// ============================================================================
// Quality
// ============================================================================

void CallSessionManager::adjust_video_quality(const std::string& call_id, VideoQualityLevel level) {
    require_permission(Permission::QUALITY_CONTROL);

    ++quality_generation_;
    apply_quality(call_id, level, std::nullopt);
}

void CallSessionManager::auto_adjust_video_quality(const std::string& call_id) {
    require_permission(Permission::QUALITY_CONTROL);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        find_active_session_locked(call_id);
    }

    uint64_t generation = ++quality_generation_;
    asio::post(io_context_, [this, call_id, generation]() {
        if (destroyed_ || generation != quality_generation_) {
            return;
        }

        try {
            auto sample = probe_->sample(call_id);
            NetworkQuality quality = sample
                ? classify_network_quality(*sample, config_.network_quality_thresholds)
                : NetworkQuality::Unknown;

            // A manual adjustment or call end may have happened during sampling
            if (generation != quality_generation_) {
                return;
            }
            apply_quality(call_id, recommended_video_quality(quality), quality);
        } catch (const RtcError& e) {
            report_error(e.code(), "Automatic quality adjustment failed: " + std::string(e.what()));
        } catch (const std::exception& e) {
            report_error(ErrorCode::InvalidState, "Automatic quality adjustment failed: " + std::string(e.what()));
        }
    });
}

void CallSessionManager::apply_quality(
    const std::string& call_id,
    VideoQualityLevel level,
    std::optional<NetworkQuality> network
) {
    VideoPreset preset;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (session.quality_preset == level) {
            return;
        }

        auto it = config_.video_presets.find(level);
        if (it == config_.video_presets.end()) {
            throw RtcError(ErrorCode::InvalidArgument, "No preset for quality " + video_quality_to_string(level));
        }
        preset = it->second;
    }

    media_->apply_video_preset(preset);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        find_active_session_locked(call_id).quality_preset = level;
    }

    utilities::log_info("Call " + call_id + " video quality " + video_quality_to_string(level) +
                        (network ? " (network " + network_quality_to_string(*network) + ")" : std::string()));
    invoke_listener("on_quality_changed", listeners_snapshot().on_quality_changed, call_id, level, network);
}

// ============================================================================
// Conference Management
// ============================================================================

void CallSessionManager::mute_participant(const std::string& call_id, const std::string& user_id, bool muted) {
    require_permission(Permission::GROUP_CALL_MANAGE);

    MediaState state;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (!session.is_group) {
            throw RtcError(ErrorCode::InvalidState, "Participant management requires a group call");
        }
        if (user_id == user_id_) {
            throw RtcError(ErrorCode::InvalidArgument, "Use toggle_mute for the local participant");
        }
        auto it = session.participants.find(user_id);
        if (it == session.participants.end()) {
            throw RtcError(ErrorCode::NotFound, user_id + " is not in call " + call_id);
        }

        Participant& participant = it->second;
        participant.is_muted_by_host = muted;
        participant.media_state.mic_muted = muted;
        participant.media_state.audio_enabled = !muted;
        state = participant.media_state;
    }

    utilities::log_info(std::string(muted ? "Muted " : "Unmuted ") + user_id + " in " + call_id);
    invoke_listener("on_participant_media_changed", listeners_snapshot().on_participant_media_changed,
                    call_id, user_id, state);
}

void CallSessionManager::set_participant_role(
    const std::string& call_id,
    const std::string& user_id,
    ParticipantRole role
) {
    require_permission(Permission::GROUP_CALL_MANAGE);

    Participant updated;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (!session.is_group) {
            throw RtcError(ErrorCode::InvalidState, "Participant management requires a group call");
        }
        if (user_id == user_id_) {
            throw RtcError(ErrorCode::InvalidArgument, "Cannot change the local participant's role");
        }
        auto it = session.participants.find(user_id);
        if (it == session.participants.end()) {
            throw RtcError(ErrorCode::NotFound, user_id + " is not in call " + call_id);
        }

        Participant& participant = it->second;
        if (participant.role == role) {
            return;
        }
        if (participant.role == ParticipantRole::HOST && count_hosts(session) == 1) {
            throw RtcError(ErrorCode::InvalidState, "A conference needs at least one host");
        }

        // Concurrent changes resolve to the last one applied
        participant.role = role;
        ++participant.role_revision;
        updated = participant;
    }

    utilities::log_info(user_id + " is now " + participant_role_to_string(role) + " in " + call_id);
    invoke_listener("on_participant_role_changed", listeners_snapshot().on_participant_role_changed,
                    call_id, updated);
}

void CallSessionManager::remove_participant(
    const std::string& call_id,
    const std::string& user_id,
    const std::optional<std::string>& reason
) {
    require_permission(Permission::GROUP_CALL_MANAGE);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_active_session_locked(call_id);
        if (!session.is_group) {
            throw RtcError(ErrorCode::InvalidState, "Participant management requires a group call");
        }
        if (user_id == user_id_) {
            throw RtcError(ErrorCode::InvalidArgument, "Use end_call to leave a conference");
        }
        auto it = session.participants.find(user_id);
        if (it == session.participants.end()) {
            throw RtcError(ErrorCode::NotFound, user_id + " is not in call " + call_id);
        }
        if (it->second.role == ParticipantRole::HOST && count_hosts(session) == 1) {
            throw RtcError(ErrorCode::InvalidState, "Cannot remove the only host");
        }
        session.participants.erase(it);
    }

    std::string why = reason.value_or("removed by host");
    try {
        router_->send_call_end(user_id, call_id, why);
    } catch (const RtcError& e) {
        report_error(e.code(), "Could not notify removed participant " + user_id + ": " + e.what());
    }
    try {
        media_->close_peer(user_id);
    } catch (const std::exception& e) {
        utilities::log_warn("Closing peer " + user_id + " failed: " + e.what());
    }

    utilities::log_info("Removed " + user_id + " from " + call_id);
    invoke_listener("on_participant_left", listeners_snapshot().on_participant_left,
                    call_id, user_id, std::optional<std::string>(why));
}

// ============================================================================
// File Sharing
// ============================================================================

FileMetadata CallSessionManager::send_file(const std::string& call_id, const MediaFile& file, const ChunkSink& sink) {
    require_permission(Permission::FILE_SEND);
    require_feature(config_.features.enable_file_transfer, "file_transfer");

    if (!sink) {
        throw RtcError(ErrorCode::InvalidArgument, "send_file requires a chunk sink");
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        CallSession& session = find_session_locked(call_id);
        if (session.state != CallState::CONNECTED) {
            throw RtcError(ErrorCode::InvalidState, "Files can only be sent during a connected call");
        }
    }

    SplitResult split = engine_->split_file_to_chunks(file);
    const std::string& transfer_id = split.metadata.transfer_id;

    for (const auto& chunk : split.chunks) {
        auto progress = engine_->get_transfer_progress(transfer_id);
        if (!progress || is_terminal_status(progress->status)) {
            throw RtcError(ErrorCode::Cancelled, "Transfer " + transfer_id + " was stopped");
        }

        try {
            sink(split.metadata, chunk);
        } catch (const std::exception& e) {
            auto current = engine_->get_transfer_progress(transfer_id);
            if (current && !is_terminal_status(current->status)) {
                engine_->update_transfer_status(transfer_id, TransferStatus::FAILED,
                                                "Chunk delivery failed: " + std::string(e.what()));
            }
            throw;
        }

        engine_->mark_chunk_processed(transfer_id, chunk.chunk_index);
    }

    if (split.chunks.empty()) {
        engine_->update_transfer_status(transfer_id, TransferStatus::COMPLETED);
    }

    utilities::log_info("Sent " + file.name + " (" + utilities::format_file_size(file.size()) +
                        ") in call " + call_id);
    return split.metadata;
}

void CallSessionManager::begin_file_receive(const std::string& call_id, const FileMetadata& metadata) {
    require_permission(Permission::FILE_RECEIVE);
    require_feature(config_.features.enable_file_transfer, "file_transfer");

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        find_active_session_locked(call_id);
    }

    engine_->begin_receive(metadata);
}

bool CallSessionManager::receive_file_chunk(const std::string& call_id, const FileChunk& chunk) {
    require_permission(Permission::FILE_RECEIVE);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        find_session_locked(call_id);
    }

    return engine_->add_received_chunk(chunk);
}

// ============================================================================
// Introspection
// ============================================================================

std::optional<CallSession> CallSessionManager::get_call_session(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(call_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CallSession> CallSessionManager::get_active_call() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& [call_id, session] : sessions_) {
        if (!is_terminal_call_state(session.state)) {
            return session;
        }
    }
    return std::nullopt;
}

bool CallSessionManager::has_active_call() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return has_active_call_locked();
}

CallStats CallSessionManager::get_call_stats() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    CallStats stats = stats_;
    stats.success_rate = stats.total_calls == 0
        ? 0.0
        : static_cast<double>(stats.completed_calls) * 100.0 / static_cast<double>(stats.total_calls);
    return stats;
}

// ============================================================================
// Listener Plumbing
// ============================================================================

CallEventListeners CallSessionManager::listeners_snapshot() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_;
}

void CallSessionManager::report_error(ErrorCode code, const std::string& message) {
    utilities::log_error(std::string("[") + error_code_to_string(code) + "] " + message);
    invoke_listener("on_error", listeners_snapshot().on_error, code, message);
}

void CallSessionManager::run_effects(Effects& effects) {
    for (auto& effect : effects) {
        effect();
    }
    effects.clear();
}

} // namespace rtcomm
