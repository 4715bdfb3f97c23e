/**
 * @file call_session.cpp
 * @brief Implementation of the call session model
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/call_session.hpp"
#include "rtcomm/errors.hpp"

namespace rtcomm {

// ============================================================================
// MediaState
// ============================================================================

MediaState MediaState::for_call_type(CallType type) {
    MediaState state;
    state.audio_enabled = true;
    state.mic_muted = false;
    state.video_enabled = type == CallType::VIDEO;
    state.camera_off = type != CallType::VIDEO;
    state.screen_sharing = false;
    state.speaker_enabled = false;
    return state;
}

bool MediaState::operator==(const MediaState& other) const {
    return audio_enabled == other.audio_enabled &&
           video_enabled == other.video_enabled &&
           speaker_enabled == other.speaker_enabled &&
           mic_muted == other.mic_muted &&
           camera_off == other.camera_off &&
           screen_sharing == other.screen_sharing;
}

// ============================================================================
// CallSession
// ============================================================================

const Participant& CallSession::local_participant() const {
    auto it = participants.find(local_user_id);
    if (it == participants.end()) {
        throw RtcError(ErrorCode::InvalidState, "Call " + call_id + " has no local participant");
    }
    return it->second;
}

Participant& CallSession::local_participant() {
    auto it = participants.find(local_user_id);
    if (it == participants.end()) {
        throw RtcError(ErrorCode::InvalidState, "Call " + call_id + " has no local participant");
    }
    return it->second;
}

std::vector<std::string> CallSession::remote_user_ids() const {
    std::vector<std::string> ids;
    for (const auto& [user_id, participant] : participants) {
        if (!participant.is_local) {
            ids.push_back(user_id);
        }
    }
    return ids;
}

uint64_t CallSession::duration_ms(uint64_t now_ms) const {
    uint64_t end = end_time.value_or(now_ms);
    return end > start_time ? end - start_time : 0;
}

// ============================================================================
// State Machine
// ============================================================================

bool is_terminal_call_state(CallState state) {
    return state == CallState::ENDED || state == CallState::FAILED || state == CallState::REJECTED;
}

bool is_legal_call_transition(CallState from, CallState to) {
    if (is_terminal_call_state(from)) {
        return false;
    }

    switch (to) {
        case CallState::INITIATING:
            return from == CallState::IDLE;
        case CallState::RINGING:
            return from == CallState::IDLE || from == CallState::INITIATING;
        case CallState::CONNECTING:
            return from == CallState::RINGING;
        case CallState::CONNECTED:
            return from == CallState::CONNECTING;
        case CallState::REJECTED:
            return from == CallState::INITIATING || from == CallState::RINGING;
        case CallState::ENDED:
        case CallState::FAILED:
            return true;
        case CallState::IDLE:
            return false;
    }
    return false;
}

// ============================================================================
// String Conversion
// ============================================================================

std::string call_state_to_string(CallState state) {
    switch (state) {
        case CallState::IDLE: return "idle";
        case CallState::INITIATING: return "initiating";
        case CallState::RINGING: return "ringing";
        case CallState::CONNECTING: return "connecting";
        case CallState::CONNECTED: return "connected";
        case CallState::ENDED: return "ended";
        case CallState::FAILED: return "failed";
        case CallState::REJECTED: return "rejected";
    }
    return "idle";
}

std::string call_direction_to_string(CallDirection direction) {
    return direction == CallDirection::INCOMING ? "incoming" : "outgoing";
}

std::string participant_role_to_string(ParticipantRole role) {
    switch (role) {
        case ParticipantRole::HOST: return "host";
        case ParticipantRole::MODERATOR: return "moderator";
        case ParticipantRole::PARTICIPANT: return "participant";
        case ParticipantRole::OBSERVER: return "observer";
    }
    return "participant";
}

std::optional<ParticipantRole> string_to_participant_role(const std::string& str) {
    if (str == "host") return ParticipantRole::HOST;
    if (str == "moderator") return ParticipantRole::MODERATOR;
    if (str == "participant") return ParticipantRole::PARTICIPANT;
    if (str == "observer") return ParticipantRole::OBSERVER;
    return std::nullopt;
}

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::CONNECTED: return "connected";
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::RECONNECTING: return "reconnecting";
        case ConnectionState::FAILED: return "failed";
    }
    return "failed";
}

} // namespace rtcomm
