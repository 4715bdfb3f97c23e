/**
 * @file signal_types.cpp
 * @brief Implementation of signal types and serialization
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/signal_types.hpp"
#include "rtcomm/utilities.hpp"

#include <type_traits>

using json = nlohmann::json;

namespace rtcomm {

namespace {

template <typename T>
constexpr bool always_false = false;

json constraints_to_json(const MediaConstraints& constraints) {
    return json{{"audio", constraints.audio}, {"video", constraints.video}};
}

MediaConstraints constraints_from_json(const json& j) {
    MediaConstraints constraints;
    if (j.is_object()) {
        constraints.audio = j.value("audio", constraints.audio);
        constraints.video = j.value("video", constraints.video);
    }
    return constraints;
}

json group_to_json(const GroupCallData& data) {
    return json{
        {"call_id", data.call_id},
        {"call_type", SignalHelpers::call_type_to_string(data.call_type)},
        {"group_name", data.group_name},
        {"initiator_name", data.initiator_name},
        {"participants", data.participants}
    };
}

template <typename T>
std::optional<T> group_from_json(const json& j) {
    T data;
    data.call_id = j.at("call_id").get<std::string>();
    auto call_type = SignalHelpers::string_to_call_type(j.value("call_type", "video"));
    if (!call_type) {
        return std::nullopt;
    }
    data.call_type = *call_type;
    data.group_name = j.value("group_name", "");
    data.initiator_name = j.value("initiator_name", "");
    if (j.contains("participants")) {
        data.participants = j["participants"].get<std::vector<std::string>>();
    }
    return data;
}

json response_to_json(const CallResponseData& data) {
    json j{{"call_id", data.call_id}, {"accepted", data.accepted}};
    if (data.reason) {
        j["reason"] = *data.reason;
    }
    return j;
}

template <typename T>
T response_from_json(const json& j, bool default_accepted) {
    T data;
    data.call_id = j.at("call_id").get<std::string>();
    data.accepted = j.value("accepted", default_accepted);
    if (j.contains("reason") && j["reason"].is_string()) {
        data.reason = j["reason"].get<std::string>();
    }
    return data;
}

} // namespace

// ============================================================================
// Type String Conversion
// ============================================================================

std::string SignalHelpers::signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::OFFER: return "offer";
        case SignalType::ANSWER: return "answer";
        case SignalType::ICE_CANDIDATE: return "ice-candidate";
        case SignalType::CALL_REQUEST: return "call-request";
        case SignalType::CALL_ACCEPT: return "call-accept";
        case SignalType::CALL_REJECT: return "call-reject";
        case SignalType::CALL_END: return "call-end";
        case SignalType::CONFERENCE_INVITE: return "conference-invite";
        case SignalType::GROUP_CALL_REQUEST: return "group-call-request";
        case SignalType::GROUP_CALL_JOIN: return "group-call-join";
        case SignalType::GROUP_CALL_LEAVE: return "group-call-leave";
    }
    return "unknown";
}

std::optional<SignalType> SignalHelpers::string_to_signal_type(const std::string& str) {
    if (str == "offer") return SignalType::OFFER;
    if (str == "answer") return SignalType::ANSWER;
    if (str == "ice-candidate") return SignalType::ICE_CANDIDATE;
    if (str == "call-request") return SignalType::CALL_REQUEST;
    if (str == "call-accept") return SignalType::CALL_ACCEPT;
    if (str == "call-reject") return SignalType::CALL_REJECT;
    if (str == "call-end") return SignalType::CALL_END;
    if (str == "conference-invite") return SignalType::CONFERENCE_INVITE;
    if (str == "group-call-request") return SignalType::GROUP_CALL_REQUEST;
    if (str == "group-call-join") return SignalType::GROUP_CALL_JOIN;
    if (str == "group-call-leave") return SignalType::GROUP_CALL_LEAVE;
    return std::nullopt;
}

std::string SignalHelpers::call_type_to_string(CallType type) {
    switch (type) {
        case CallType::AUDIO: return "audio";
        case CallType::VIDEO: return "video";
        case CallType::SCREEN_SHARE: return "screen-share";
    }
    return "audio";
}

std::optional<CallType> SignalHelpers::string_to_call_type(const std::string& str) {
    if (str == "audio") return CallType::AUDIO;
    if (str == "video" || str == "conference") return CallType::VIDEO;
    if (str == "screen-share") return CallType::SCREEN_SHARE;
    return std::nullopt;
}

bool SignalHelpers::has_single_destination(const SignalMessage& message) {
    bool has_user = message.to_user.has_value() && !message.to_user->empty();
    bool has_group = message.group_id.has_value() && !message.group_id->empty();
    return has_user != has_group;
}

// ============================================================================
// Payload Serialization
// ============================================================================

json SignalHelpers::payload_to_json(const SignalPayload& payload) {
    return std::visit([](const auto& data) -> json {
        using T = std::decay_t<decltype(data)>;
        if constexpr (std::is_same_v<T, OfferData>) {
            return json{{"type", "offer"}, {"sdp", data.sdp},
                        {"constraints", constraints_to_json(data.constraints)}};
        } else if constexpr (std::is_same_v<T, AnswerData>) {
            return json{{"type", "answer"}, {"sdp", data.sdp}};
        } else if constexpr (std::is_same_v<T, IceCandidateData>) {
            json j{{"candidate", data.candidate}};
            if (data.sdp_m_line_index) j["sdp_m_line_index"] = *data.sdp_m_line_index;
            if (data.sdp_mid) j["sdp_mid"] = *data.sdp_mid;
            if (data.username_fragment) j["username_fragment"] = *data.username_fragment;
            return j;
        } else if constexpr (std::is_same_v<T, CallRequestData>) {
            return json{{"call_id", data.call_id},
                        {"call_type", call_type_to_string(data.call_type)},
                        {"initiator_name", data.initiator_name},
                        {"constraints", constraints_to_json(data.constraints)}};
        } else if constexpr (std::is_base_of_v<CallResponseData, T>) {
            return response_to_json(data);
        } else if constexpr (std::is_same_v<T, CallEndData>) {
            json j{{"call_id", data.call_id}};
            if (data.reason) j["reason"] = *data.reason;
            return j;
        } else if constexpr (std::is_base_of_v<GroupCallData, T>) {
            return group_to_json(data);
        } else {
            static_assert(always_false<T>, "unhandled signal payload");
        }
    }, payload);
}

std::optional<SignalPayload> SignalHelpers::payload_from_json(SignalType type, const json& data) {
    try {
        if (!data.is_object()) {
            return std::nullopt;
        }

        switch (type) {
            case SignalType::OFFER: {
                OfferData offer;
                offer.sdp = data.at("sdp").get<std::string>();
                if (data.contains("constraints")) {
                    offer.constraints = constraints_from_json(data["constraints"]);
                }
                return SignalPayload{offer};
            }
            case SignalType::ANSWER: {
                AnswerData answer;
                answer.sdp = data.at("sdp").get<std::string>();
                return SignalPayload{answer};
            }
            case SignalType::ICE_CANDIDATE: {
                IceCandidateData ice;
                ice.candidate = data.at("candidate").get<std::string>();
                if (data.contains("sdp_m_line_index") && data["sdp_m_line_index"].is_number_integer()) {
                    ice.sdp_m_line_index = data["sdp_m_line_index"].get<int>();
                }
                if (data.contains("sdp_mid") && data["sdp_mid"].is_string()) {
                    ice.sdp_mid = data["sdp_mid"].get<std::string>();
                }
                if (data.contains("username_fragment") && data["username_fragment"].is_string()) {
                    ice.username_fragment = data["username_fragment"].get<std::string>();
                }
                return SignalPayload{ice};
            }
            case SignalType::CALL_REQUEST: {
                CallRequestData request;
                request.call_id = data.at("call_id").get<std::string>();
                auto call_type = string_to_call_type(data.value("call_type", "audio"));
                if (!call_type) {
                    return std::nullopt;
                }
                request.call_type = *call_type;
                request.initiator_name = data.value("initiator_name", "");
                if (data.contains("constraints")) {
                    request.constraints = constraints_from_json(data["constraints"]);
                }
                return SignalPayload{request};
            }
            case SignalType::CALL_ACCEPT:
                return SignalPayload{response_from_json<CallAcceptData>(data, true)};
            case SignalType::CALL_REJECT:
                return SignalPayload{response_from_json<CallRejectData>(data, false)};
            case SignalType::CALL_END: {
                CallEndData end;
                end.call_id = data.at("call_id").get<std::string>();
                if (data.contains("reason") && data["reason"].is_string()) {
                    end.reason = data["reason"].get<std::string>();
                }
                return SignalPayload{end};
            }
            case SignalType::CONFERENCE_INVITE: {
                auto parsed = group_from_json<ConferenceInviteData>(data);
                if (!parsed) return std::nullopt;
                return SignalPayload{*parsed};
            }
            case SignalType::GROUP_CALL_REQUEST: {
                auto parsed = group_from_json<GroupCallRequestData>(data);
                if (!parsed) return std::nullopt;
                return SignalPayload{*parsed};
            }
            case SignalType::GROUP_CALL_JOIN: {
                auto parsed = group_from_json<GroupCallJoinData>(data);
                if (!parsed) return std::nullopt;
                return SignalPayload{*parsed};
            }
            case SignalType::GROUP_CALL_LEAVE: {
                auto parsed = group_from_json<GroupCallLeaveData>(data);
                if (!parsed) return std::nullopt;
                return SignalPayload{*parsed};
            }
        }
        return std::nullopt;

    } catch (const std::exception& e) {
        utilities::log_debug("Malformed " + signal_type_to_string(type) + " payload: " + e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Signal Record Serialization
// ============================================================================

SignalType SignalMessage::type() const {
    return static_cast<SignalType>(payload.index());
}

json SignalMessage::to_record() const {
    json j;
    if (!id.empty()) {
        j["id"] = id;
    }
    j["signal_type"] = SignalHelpers::signal_type_to_string(type());
    j["from_user"] = from_user;
    j["to_user"] = to_user ? json(*to_user) : json(nullptr);
    j["group_id"] = group_id ? json(*group_id) : json(nullptr);
    j["signal_data"] = SignalHelpers::payload_to_json(payload);
    j["call_id"] = call_id ? json(*call_id) : json(nullptr);
    j["created_at"] = created_at;
    j["expires_at"] = expires_at ? json(*expires_at) : json(nullptr);
    j["processed"] = processed;
    j["processed_by"] = processed_by;
    return j;
}

std::optional<SignalMessage> SignalMessage::from_record(const json& record) {
    try {
        if (!record.is_object()) {
            return std::nullopt;
        }

        auto type = SignalHelpers::string_to_signal_type(record.value("signal_type", ""));
        if (!type) {
            return std::nullopt;
        }

        auto payload = SignalHelpers::payload_from_json(*type, record.value("signal_data", json::object()));
        if (!payload) {
            return std::nullopt;
        }

        SignalMessage message;
        message.payload = std::move(*payload);
        message.id = record.value("id", "");
        message.from_user = record.at("from_user").get<std::string>();

        auto optional_string = [&record](const char* key) -> std::optional<std::string> {
            if (record.contains(key) && record[key].is_string()) {
                return record[key].get<std::string>();
            }
            return std::nullopt;
        };
        message.to_user = optional_string("to_user");
        message.group_id = optional_string("group_id");
        message.call_id = optional_string("call_id");

        message.created_at = record.value("created_at", uint64_t{0});
        if (record.contains("expires_at") && record["expires_at"].is_number()) {
            message.expires_at = record["expires_at"].get<uint64_t>();
        }
        message.processed = record.value("processed", false);
        if (record.contains("processed_by") && record["processed_by"].is_array()) {
            message.processed_by = record["processed_by"].get<std::vector<std::string>>();
        }

        if (!SignalHelpers::has_single_destination(message)) {
            return std::nullopt;
        }

        return message;

    } catch (const std::exception& e) {
        utilities::log_debug("Malformed signal record: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string SignalMessage::to_json() const {
    return to_record().dump();
}

std::optional<SignalMessage> SignalMessage::from_json(const std::string& json_str) {
    try {
        return from_record(json::parse(json_str));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace rtcomm
