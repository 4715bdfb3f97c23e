/**
 * @file signal_types.hpp
 * @brief Signal type definitions and serialization for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Call-negotiation signals with JSON serialization/deserialization:
 * - Session description exchange (offer/answer/ICE)
 * - Call lifecycle (request/accept/reject/end)
 * - Group call membership (invite/request/join/leave)
 *
 * Payloads form a closed tagged union: one alternative per signal type,
 * declared in the same order as SignalType.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>

namespace rtcomm {

/**
 * @brief Signal types carried by the signaling router
 */
enum class SignalType {
    OFFER,                   ///< SDP offer
    ANSWER,                  ///< SDP answer
    ICE_CANDIDATE,           ///< Trickled ICE candidate
    CALL_REQUEST,            ///< Ring a peer
    CALL_ACCEPT,             ///< Callee accepted
    CALL_REJECT,             ///< Callee rejected (or busy)
    CALL_END,                ///< Either side hung up
    CONFERENCE_INVITE,       ///< Invite into a running conference
    GROUP_CALL_REQUEST,      ///< Ring every member of a group
    GROUP_CALL_JOIN,         ///< Member joined a group call
    GROUP_CALL_LEAVE         ///< Member left a group call
};

/**
 * @brief Kind of media a call carries
 */
enum class CallType {
    AUDIO,
    VIDEO,
    SCREEN_SHARE
};

/**
 * @brief Requested local media
 */
struct MediaConstraints {
    bool audio = true;
    bool video = false;
};

// ============================================================================
// Payloads
// ============================================================================

/**
 * @brief SDP offer payload
 */
struct OfferData {
    std::string sdp;                        ///< Session description
    MediaConstraints constraints;           ///< Media the offerer sends
};

/**
 * @brief SDP answer payload
 */
struct AnswerData {
    std::string sdp;                        ///< Session description
};

/**
 * @brief ICE candidate payload
 */
struct IceCandidateData {
    std::string candidate;                          ///< Candidate line
    std::optional<int> sdp_m_line_index;            ///< Media line index
    std::optional<std::string> sdp_mid;             ///< Media stream id
    std::optional<std::string> username_fragment;   ///< ICE ufrag
};

/**
 * @brief Call request payload
 */
struct CallRequestData {
    std::string call_id;                    ///< Caller-generated call id
    CallType call_type = CallType::AUDIO;   ///< Requested call kind
    std::string initiator_name;             ///< Display name of caller
    MediaConstraints constraints;           ///< Caller's media
};

/**
 * @brief Common shape of accept/reject payloads
 */
struct CallResponseData {
    std::string call_id;                    ///< Call being answered
    bool accepted = false;                  ///< Whether the callee accepted
    std::optional<std::string> reason;      ///< Rejection reason (e.g. "busy")
};

struct CallAcceptData : CallResponseData {};
struct CallRejectData : CallResponseData {};

/**
 * @brief Call end payload
 */
struct CallEndData {
    std::string call_id;                    ///< Call being ended
    std::optional<std::string> reason;      ///< Why the call ended
};

/**
 * @brief Common shape of group call payloads
 */
struct GroupCallData {
    std::string call_id;                    ///< Conference call id
    CallType call_type = CallType::VIDEO;   ///< Conference media
    std::string group_name;                 ///< Display name of the group
    std::string initiator_name;             ///< Display name of the sender
    std::vector<std::string> participants;  ///< Known participant user ids
};

struct ConferenceInviteData : GroupCallData {};
struct GroupCallRequestData : GroupCallData {};
struct GroupCallJoinData : GroupCallData {};
struct GroupCallLeaveData : GroupCallData {};

/**
 * @brief Closed tagged union of all payloads (order matches SignalType)
 */
using SignalPayload = std::variant<
    OfferData,
    AnswerData,
    IceCandidateData,
    CallRequestData,
    CallAcceptData,
    CallRejectData,
    CallEndData,
    ConferenceInviteData,
    GroupCallRequestData,
    GroupCallJoinData,
    GroupCallLeaveData
>;

// ============================================================================
// Signal Record
// ============================================================================

/**
 * @brief One signal as stored in the message store
 *
 * Exactly one of to_user / group_id is set. processed only moves
 * false -> true; processed_by lists recipients that consumed the record.
 */
struct SignalMessage {
    std::string id;                         ///< Store record id
    std::string from_user;                  ///< Sender user id
    std::optional<std::string> to_user;     ///< Private recipient
    std::optional<std::string> group_id;    ///< Group recipient
    SignalPayload payload;                  ///< Typed payload
    std::optional<std::string> call_id;     ///< Associated call
    uint64_t created_at = 0;                ///< Creation time (ms since epoch)
    std::optional<uint64_t> expires_at;     ///< Expiry time (ms since epoch)
    bool processed = false;                 ///< Consumed by a recipient
    std::vector<std::string> processed_by;  ///< Recipients that consumed it

    /**
     * @brief Signal type derived from the payload alternative
     */
    SignalType type() const;

    /**
     * @brief Convert to store record
     * @return JSON object using store field names
     */
    nlohmann::json to_record() const;

    /**
     * @brief Parse a store record
     * @param record JSON object from the store
     * @return SignalMessage or std::nullopt if the type is unknown or fields are invalid
     */
    static std::optional<SignalMessage> from_record(const nlohmann::json& record);

    /**
     * @brief Serialize to JSON string
     */
    std::string to_json() const;

    /**
     * @brief Deserialize from JSON string
     * @param json_str JSON string
     * @return SignalMessage or std::nullopt if invalid
     */
    static std::optional<SignalMessage> from_json(const std::string& json_str);
};

/**
 * @brief Helper functions for signal handling
 */
class SignalHelpers {
public:
    /**
     * @brief Convert SignalType to wire name (e.g. "ice-candidate")
     */
    static std::string signal_type_to_string(SignalType type);

    /**
     * @brief Convert wire name to SignalType
     * @return SignalType or std::nullopt if unknown
     */
    static std::optional<SignalType> string_to_signal_type(const std::string& str);

    /**
     * @brief Convert CallType to wire name ("audio", "video", "screen-share")
     */
    static std::string call_type_to_string(CallType type);

    /**
     * @brief Convert wire name to CallType ("conference" maps to video)
     */
    static std::optional<CallType> string_to_call_type(const std::string& str);

    /**
     * @brief Serialize a payload to its JSON shape
     */
    static nlohmann::json payload_to_json(const SignalPayload& payload);

    /**
     * @brief Parse a payload for a given signal type
     * @return Payload or std::nullopt if required fields are missing
     */
    static std::optional<SignalPayload> payload_from_json(SignalType type, const nlohmann::json& data);

    /**
     * @brief Check addressing invariant (exactly one recipient kind)
     */
    static bool has_single_destination(const SignalMessage& message);
};

} // namespace rtcomm
