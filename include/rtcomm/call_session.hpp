/**
 * @file call_session.hpp
 * @brief Call session, participant and media state model for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Call state machine values and legal transitions
 * - Participant roles and connection states
 * - Per-participant media state
 */

#pragma once

#include "rtcomm/rtc_config.hpp"
#include "rtcomm/signal_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rtcomm {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Call lifecycle states
 *
 * Outgoing calls start at INITIATING, incoming calls at RINGING.
 * ENDED, FAILED and REJECTED are terminal.
 */
enum class CallState {
    IDLE,
    INITIATING,
    RINGING,
    CONNECTING,
    CONNECTED,
    ENDED,
    FAILED,
    REJECTED
};

enum class CallDirection {
    INCOMING,
    OUTGOING
};

/**
 * @brief Conference roles
 */
enum class ParticipantRole {
    HOST,
    MODERATOR,
    PARTICIPANT,
    OBSERVER
};

/**
 * @brief Peer transport state reported by the media layer
 */
enum class ConnectionState {
    CONNECTING,
    CONNECTED,
    DISCONNECTED,
    RECONNECTING,
    FAILED
};

// ============================================================================
// Session Model
// ============================================================================

/**
 * @brief Media flags of one participant
 */
struct MediaState {
    bool audio_enabled = true;
    bool video_enabled = false;
    bool speaker_enabled = false;
    bool mic_muted = false;
    bool camera_off = true;
    bool screen_sharing = false;

    /**
     * @brief Initial media state for a call type
     */
    static MediaState for_call_type(CallType type);

    bool operator==(const MediaState& other) const;
    bool operator!=(const MediaState& other) const { return !(*this == other); }
};

/**
 * @brief One call participant
 */
struct Participant {
    std::string user_id;
    std::string user_name;
    bool is_local = false;
    ParticipantRole role = ParticipantRole::PARTICIPANT;
    uint64_t role_revision = 0;                 ///< Incremented on every role change
    ConnectionState connection_state = ConnectionState::CONNECTING;
    MediaState media_state;
    bool is_presenting = false;
    bool is_muted_by_host = false;
    uint64_t joined_at = 0;                     ///< ms since epoch
};

/**
 * @brief One call, including the local participant
 *
 * The participants map always holds exactly one entry with is_local set,
 * keyed by local_user_id.
 */
struct CallSession {
    std::string call_id;
    CallType call_type = CallType::AUDIO;
    CallDirection direction = CallDirection::OUTGOING;
    CallState state = CallState::IDLE;
    bool is_group = false;
    std::optional<std::string> group_id;
    std::optional<std::string> group_name;
    std::string local_user_id;
    std::map<std::string, Participant> participants;
    uint64_t start_time = 0;                    ///< Creation, then connection time (ms)
    std::optional<uint64_t> end_time;
    std::optional<std::string> end_reason;
    VideoQualityLevel quality_preset = VideoQualityLevel::Medium;

    const Participant& local_participant() const;
    Participant& local_participant();

    /**
     * @brief Ids of all non-local participants
     */
    std::vector<std::string> remote_user_ids() const;

    /**
     * @brief Elapsed time since start (until end_time once ended)
     */
    uint64_t duration_ms(uint64_t now_ms) const;
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Whether a state is terminal (ended, failed, rejected)
 */
bool is_terminal_call_state(CallState state);

/**
 * @brief Whether from -> to is a legal state machine transition
 */
bool is_legal_call_transition(CallState from, CallState to);

std::string call_state_to_string(CallState state);
std::string call_direction_to_string(CallDirection direction);
std::string participant_role_to_string(ParticipantRole role);
std::optional<ParticipantRole> string_to_participant_role(const std::string& str);
std::string connection_state_to_string(ConnectionState state);

} // namespace rtcomm
