/**
 * @file test_signal_types.cpp
 * @brief Unit tests for signal payloads and store records
 *
 * Tests signal type handling including:
 * - Wire names for signal and call types
 * - Payload serialization per signal type
 * - Store record parsing and addressing rules
 */

#include <gtest/gtest.h>
#include "rtcomm/signal_types.hpp"

using namespace rtcomm;
using json = nlohmann::json;

// Test fixture with a valid private call request
class SignalTypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        CallRequestData request;
        request.call_id = "call-1-abc";
        request.call_type = CallType::VIDEO;
        request.initiator_name = "Alice";
        request.constraints.video = true;

        message_.id = "signal:1";
        message_.from_user = "alice";
        message_.to_user = "bob";
        message_.payload = request;
        message_.call_id = request.call_id;
        message_.created_at = 1700000000000ULL;
        message_.expires_at = 1700003600000ULL;
    }

    SignalMessage message_;
};

// ============================================================================
// Type Conversion Tests
// ============================================================================

TEST_F(SignalTypesTest, SignalTypeWireNames) {
    EXPECT_EQ(SignalHelpers::signal_type_to_string(SignalType::ICE_CANDIDATE), "ice-candidate");
    EXPECT_EQ(SignalHelpers::signal_type_to_string(SignalType::GROUP_CALL_LEAVE), "group-call-leave");

    EXPECT_EQ(SignalHelpers::string_to_signal_type("conference-invite"), SignalType::CONFERENCE_INVITE);
    EXPECT_FALSE(SignalHelpers::string_to_signal_type("hangup").has_value());
}

TEST_F(SignalTypesTest, CallTypeWireNames) {
    EXPECT_EQ(SignalHelpers::call_type_to_string(CallType::SCREEN_SHARE), "screen-share");
    EXPECT_EQ(SignalHelpers::string_to_call_type("audio"), CallType::AUDIO);

    // Legacy conference calls are video calls
    EXPECT_EQ(SignalHelpers::string_to_call_type("conference"), CallType::VIDEO);
    EXPECT_FALSE(SignalHelpers::string_to_call_type("hologram").has_value());
}

TEST_F(SignalTypesTest, TypeFollowsPayload) {
    EXPECT_EQ(message_.type(), SignalType::CALL_REQUEST);

    message_.payload = CallEndData{"call-1-abc", std::string("bye")};
    EXPECT_EQ(message_.type(), SignalType::CALL_END);

    message_.payload = GroupCallJoinData{};
    EXPECT_EQ(message_.type(), SignalType::GROUP_CALL_JOIN);
}

// ============================================================================
// Payload Tests
// ============================================================================

TEST_F(SignalTypesTest, OfferPayloadShape) {
    OfferData offer;
    offer.sdp = "v=0";
    offer.constraints.video = true;

    json j = SignalHelpers::payload_to_json(offer);

    EXPECT_EQ(j["type"], "offer");
    EXPECT_EQ(j["sdp"], "v=0");
    EXPECT_TRUE(j["constraints"]["audio"].get<bool>());
    EXPECT_TRUE(j["constraints"]["video"].get<bool>());
}

TEST_F(SignalTypesTest, IceCandidateOptionalFields) {
    json minimal = {{"candidate", "candidate:1 1 udp 2122260223 10.0.0.1 54321 typ host"}};
    auto parsed = SignalHelpers::payload_from_json(SignalType::ICE_CANDIDATE, minimal);

    ASSERT_TRUE(parsed.has_value());
    const auto& ice = std::get<IceCandidateData>(*parsed);
    EXPECT_FALSE(ice.sdp_m_line_index.has_value());
    EXPECT_FALSE(ice.sdp_mid.has_value());

    json full = minimal;
    full["sdp_m_line_index"] = 0;
    full["sdp_mid"] = "audio";
    parsed = SignalHelpers::payload_from_json(SignalType::ICE_CANDIDATE, full);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(std::get<IceCandidateData>(*parsed).sdp_m_line_index, 0);
    EXPECT_EQ(std::get<IceCandidateData>(*parsed).sdp_mid, "audio");
}

TEST_F(SignalTypesTest, RejectReasonSurvives) {
    CallRejectData reject;
    reject.call_id = "call-1-abc";
    reject.reason = "busy";

    auto parsed = SignalHelpers::payload_from_json(SignalType::CALL_REJECT, SignalHelpers::payload_to_json(reject));

    ASSERT_TRUE(parsed.has_value());
    const auto& data = std::get<CallRejectData>(*parsed);
    EXPECT_EQ(data.reason, "busy");
    EXPECT_FALSE(data.accepted);
}

TEST_F(SignalTypesTest, AcceptDefaultsToAccepted) {
    auto parsed = SignalHelpers::payload_from_json(SignalType::CALL_ACCEPT, {{"call_id", "c"}});

    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(std::get<CallAcceptData>(*parsed).accepted);
}

TEST_F(SignalTypesTest, GroupPayloadParticipants) {
    GroupCallRequestData request;
    request.call_id = "call-9";
    request.group_name = "Team";
    request.participants = {"bob", "carol"};

    auto parsed = SignalHelpers::payload_from_json(SignalType::GROUP_CALL_REQUEST,
                                                   SignalHelpers::payload_to_json(request));

    ASSERT_TRUE(parsed.has_value());
    const auto& data = std::get<GroupCallRequestData>(*parsed);
    EXPECT_EQ(data.group_name, "Team");
    EXPECT_EQ(data.call_type, CallType::VIDEO);
    ASSERT_EQ(data.participants.size(), 2);
    EXPECT_EQ(data.participants[1], "carol");
}

TEST_F(SignalTypesTest, MissingRequiredFieldRejected) {
    EXPECT_FALSE(SignalHelpers::payload_from_json(SignalType::ANSWER, json::object()).has_value());
    EXPECT_FALSE(SignalHelpers::payload_from_json(SignalType::CALL_END, {{"reason", "x"}}).has_value());
    EXPECT_FALSE(SignalHelpers::payload_from_json(SignalType::OFFER, json::array()).has_value());
    EXPECT_FALSE(SignalHelpers::payload_from_json(SignalType::CALL_REQUEST,
                                                  {{"call_id", "c"}, {"call_type", "fax"}}).has_value());
}

// ============================================================================
// Record Tests
// ============================================================================

TEST_F(SignalTypesTest, RecordFieldNames) {
    json record = message_.to_record();

    EXPECT_EQ(record["signal_type"], "call-request");
    EXPECT_EQ(record["from_user"], "alice");
    EXPECT_EQ(record["to_user"], "bob");
    EXPECT_TRUE(record["group_id"].is_null());
    EXPECT_EQ(record["signal_data"]["call_type"], "video");
    EXPECT_FALSE(record["processed"].get<bool>());
    EXPECT_TRUE(record["processed_by"].is_array());
}

TEST_F(SignalTypesTest, RecordRoundTrip) {
    message_.processed_by = {"bob"};
    auto parsed = SignalMessage::from_record(message_.to_record());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->id, "signal:1");
    EXPECT_EQ(parsed->to_user, "bob");
    EXPECT_FALSE(parsed->group_id.has_value());
    EXPECT_EQ(parsed->call_id, "call-1-abc");
    EXPECT_EQ(parsed->expires_at, 1700003600000ULL);
    EXPECT_EQ(parsed->processed_by, std::vector<std::string>{"bob"});
    EXPECT_EQ(std::get<CallRequestData>(parsed->payload).initiator_name, "Alice");
}

TEST_F(SignalTypesTest, UnknownTypeRejected) {
    json record = message_.to_record();
    record["signal_type"] = "telepathy";

    EXPECT_FALSE(SignalMessage::from_record(record).has_value());
}

TEST_F(SignalTypesTest, BothDestinationsRejected) {
    json record = message_.to_record();
    record["group_id"] = "team";

    EXPECT_FALSE(SignalMessage::from_record(record).has_value());
}

TEST_F(SignalTypesTest, NoDestinationRejected) {
    json record = message_.to_record();
    record["to_user"] = nullptr;

    EXPECT_FALSE(SignalMessage::from_record(record).has_value());
}

TEST_F(SignalTypesTest, MalformedJsonString) {
    EXPECT_FALSE(SignalMessage::from_json("{broken").has_value());
    EXPECT_TRUE(SignalMessage::from_json(message_.to_json()).has_value());
}

TEST_F(SignalTypesTest, SingleDestinationHelper) {
    EXPECT_TRUE(SignalHelpers::has_single_destination(message_));

    message_.to_user = std::string();
    message_.group_id = "team";
    EXPECT_TRUE(SignalHelpers::has_single_destination(message_));

    message_.group_id.reset();
    EXPECT_FALSE(SignalHelpers::has_single_destination(message_));
}
