/**
 * @file test_signaling_router.cpp
 * @brief Unit tests for SignalingRouter
 *
 * Tests signal delivery including:
 * - Private and group addressing
 * - Exactly-once consumption across subscribers
 * - Malformed and expired signal handling
 * - Error reporting without a store
 * - History and retention cleanup
 */

#include <gtest/gtest.h>
#include "rtcomm/signaling_router.hpp"
#include "rtcomm/sqlite_message_store.hpp"
#include "rtcomm/utilities.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace rtcomm;
using json = nlohmann::json;

namespace {

bool wait_for(const std::function<bool()>& predicate,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // anonymous namespace

// Test fixture with one shared store and a router per user
class SignalingRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<SqliteMessageStore>(":memory:");
        store_->create(SignalingRouter::GROUP_MEMBER_COLLECTION, {{"group_id", "team"}, {"user_id", "alice"}});
        store_->create(SignalingRouter::GROUP_MEMBER_COLLECTION, {{"group_id", "team"}, {"user_id", "bob"}});
        store_->create(SignalingRouter::GROUP_MEMBER_COLLECTION, {{"group_id", "team"}, {"user_id", "carol"}});
    }

    void TearDown() override {
        routers_.clear();
        store_.reset();
    }

    std::shared_ptr<SignalingRouter> make_router(const std::string& user_id) {
        std::shared_ptr<MessageStore> store = store_;
        auto router = std::make_shared<SignalingRouter>([store]() { return store; });
        router->initialize(user_id);
        routers_.push_back(router);
        return router;
    }

    std::shared_ptr<SqliteMessageStore> store_;
    std::vector<std::shared_ptr<SignalingRouter>> routers_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(SignalingRouterTest, InitializeOpensSubscriptions) {
    auto router = make_router("alice");
    auto status = router->get_status();

    EXPECT_TRUE(status.connected);
    EXPECT_EQ(status.user_id, "alice");
    EXPECT_EQ(status.active_listeners, 2);
    ASSERT_EQ(status.groups.size(), 1);
    EXPECT_EQ(status.groups[0], "team");
    EXPECT_EQ(store_->get_subscription_count(), 2);
}

TEST_F(SignalingRouterTest, InitializeWithoutUserId) {
    SignalingRouter router([this]() -> std::shared_ptr<MessageStore> { return store_; });

    try {
        router.initialize("");
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingUserId);
    }
}

TEST_F(SignalingRouterTest, InitializeWithoutClient) {
    SignalingRouter router([]() -> std::shared_ptr<MessageStore> { return nullptr; });

    try {
        router.initialize("alice");
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoClient);
    }
    EXPECT_FALSE(router.is_connected());
}

TEST_F(SignalingRouterTest, SendWithoutClientReportsError) {
    std::shared_ptr<MessageStore> available = store_;
    auto getter = [&available]() { return available; };
    SignalingRouter router(getter);
    router.initialize("alice");

    available.reset();

    try {
        router.send_call_end("bob", "call-1");
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoClient);
    }
}

TEST_F(SignalingRouterTest, SendBeforeInitialize) {
    SignalingRouter router([this]() -> std::shared_ptr<MessageStore> { return store_; });

    try {
        router.send_call_end("bob", "call-1");
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotConnected);
    }
}

TEST_F(SignalingRouterTest, DestroyReleasesSubscriptions) {
    auto router = make_router("alice");
    router->destroy();

    EXPECT_FALSE(router->is_connected());
    EXPECT_EQ(store_->get_subscription_count(), 0);
    EXPECT_THROW(router->initialize("alice"), RtcError);

    // Idempotent
    EXPECT_NO_THROW(router->destroy());
}

TEST_F(SignalingRouterTest, ReconnectRefreshesGroups) {
    auto router = make_router("dave");
    EXPECT_TRUE(router->get_status().groups.empty());

    store_->create(SignalingRouter::GROUP_MEMBER_COLLECTION, {{"group_id", "team"}, {"user_id", "dave"}});
    router->reconnect();

    ASSERT_EQ(router->get_status().groups.size(), 1);
    EXPECT_EQ(store_->get_subscription_count(), 2);
}

// ============================================================================
// Private Delivery Tests
// ============================================================================

TEST_F(SignalingRouterTest, CallRequestDeliveredOnce) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");

    std::mutex mutex;
    std::vector<SignalMessage> received;
    SignalingEventListeners listeners;
    listeners.on_call_request = [&](const SignalMessage& message, const CallRequestData& data) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(message);
        EXPECT_EQ(data.call_type, CallType::VIDEO);
        EXPECT_EQ(data.initiator_name, "Alice");
    };
    bob->set_event_listeners(listeners);

    CallRequestData request;
    request.call_id = "call-1-abc";
    request.call_type = CallType::VIDEO;
    request.initiator_name = "Alice";
    std::string id = alice->send_call_request("bob", request);

    ASSERT_TRUE(wait_for([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return !received.empty();
    }));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 1);
    EXPECT_EQ(received[0].id, id);
    EXPECT_EQ(received[0].from_user, "alice");
    EXPECT_EQ(received[0].call_id, "call-1-abc");
    EXPECT_TRUE(received[0].processed);

    auto rows = store_->query(Query::on(SignalingRouter::SIGNAL_COLLECTION)
        .where({{"id", ConditionOp::EQ, id}}));
    ASSERT_EQ(rows.size(), 1);
    EXPECT_TRUE(rows[0]["processed"].get<bool>());
}

TEST_F(SignalingRouterTest, ExactlyOnceAcrossDuplicateSubscribers) {
    auto alice = make_router("alice");
    auto bob_phone = make_router("bob");
    auto bob_laptop = make_router("bob");

    std::atomic<int> deliveries{0};
    SignalingEventListeners listeners;
    listeners.on_call_end = [&deliveries](const SignalMessage&, const CallEndData&) {
        deliveries++;
    };
    bob_phone->set_event_listeners(listeners);
    bob_laptop->set_event_listeners(listeners);

    for (int i = 0; i < 10; ++i) {
        alice->send_call_end("bob", "call-" + std::to_string(i));
    }

    ASSERT_TRUE(wait_for([&]() { return deliveries.load() >= 10; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(deliveries.load(), 10);
}

TEST_F(SignalingRouterTest, OtherRecipientDoesNotReceive) {
    auto alice = make_router("alice");
    auto carol = make_router("carol");
    auto bob = make_router("bob");

    std::atomic<int> carol_received{0};
    std::atomic<int> bob_received{0};
    SignalingEventListeners carol_listeners;
    carol_listeners.on_signal_received = [&](const SignalMessage&) { carol_received++; };
    carol->set_event_listeners(carol_listeners);
    SignalingEventListeners bob_listeners;
    bob_listeners.on_signal_received = [&](const SignalMessage&) { bob_received++; };
    bob->set_event_listeners(bob_listeners);

    alice->send_answer("bob", "v=0", "call-1");

    ASSERT_TRUE(wait_for([&]() { return bob_received.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(carol_received.load(), 0);
}

TEST_F(SignalingRouterTest, OfferCarriesCallId) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");

    std::mutex mutex;
    std::optional<std::string> call_id;
    std::optional<OfferData> offer;
    SignalingEventListeners listeners;
    listeners.on_offer_received = [&](const SignalMessage& message, const OfferData& data) {
        std::lock_guard<std::mutex> lock(mutex);
        call_id = message.call_id;
        offer = data;
    };
    bob->set_event_listeners(listeners);

    MediaConstraints constraints;
    constraints.video = true;
    alice->send_offer("bob", "v=0 offer", constraints, "call-7");

    ASSERT_TRUE(wait_for([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return offer.has_value();
    }));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(call_id, "call-7");
    EXPECT_EQ(offer->sdp, "v=0 offer");
    EXPECT_TRUE(offer->constraints.video);
}

TEST_F(SignalingRouterTest, InvalidTargetRejected) {
    auto alice = make_router("alice");

    try {
        alice->send_call_end("bob smith", "call-1");
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

// ============================================================================
// Group Delivery Tests
// ============================================================================

TEST_F(SignalingRouterTest, GroupSignalReachesEveryMember) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");
    auto carol = make_router("carol");

    std::atomic<int> alice_received{0};
    std::atomic<int> bob_received{0};
    std::atomic<int> carol_received{0};

    SignalingEventListeners a;
    a.on_group_call_request = [&](const SignalMessage&, const GroupCallRequestData&) { alice_received++; };
    alice->set_event_listeners(a);

    SignalingEventListeners b;
    b.on_group_call_request = [&](const SignalMessage& message, const GroupCallRequestData& data) {
        EXPECT_EQ(message.group_id, "team");
        EXPECT_EQ(data.group_name, "Team");
        bob_received++;
    };
    bob->set_event_listeners(b);

    SignalingEventListeners c;
    c.on_group_call_request = [&](const SignalMessage&, const GroupCallRequestData&) { carol_received++; };
    carol->set_event_listeners(c);

    GroupCallRequestData request;
    request.call_id = "call-g1";
    request.group_name = "Team";
    request.participants = {"bob", "carol"};
    alice->send_group_call_request("team", request);

    ASSERT_TRUE(wait_for([&]() { return bob_received.load() == 1 && carol_received.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // The sender never hears its own group signal
    EXPECT_EQ(alice_received.load(), 0);
    EXPECT_EQ(bob_received.load(), 1);
    EXPECT_EQ(carol_received.load(), 1);

    auto rows = store_->query(Query::on(SignalingRouter::SIGNAL_COLLECTION));
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0]["processed_by"].size(), 2);
}

TEST_F(SignalingRouterTest, NonMemberMissesGroupSignal) {
    auto alice = make_router("alice");
    auto dave = make_router("dave");

    std::atomic<int> dave_received{0};
    SignalingEventListeners listeners;
    listeners.on_signal_received = [&](const SignalMessage&) { dave_received++; };
    dave->set_event_listeners(listeners);

    alice->send_group_call_join("team", GroupCallJoinData{});
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    EXPECT_EQ(dave_received.load(), 0);
}

// ============================================================================
// Robustness Tests
// ============================================================================

TEST_F(SignalingRouterTest, UnknownTypeDropped) {
    auto bob = make_router("bob");

    std::atomic<int> received{0};
    SignalingEventListeners listeners;
    listeners.on_signal_received = [&](const SignalMessage&) { received++; };
    bob->set_event_listeners(listeners);

    store_->create(SignalingRouter::SIGNAL_COLLECTION, {
        {"signal_type", "telepathy"},
        {"from_user", "alice"},
        {"to_user", "bob"},
        {"signal_data", json::object()},
        {"processed", false},
        {"processed_by", json::array()}
    });

    ASSERT_TRUE(wait_for([&]() { return bob->get_status().signals_dropped == 1; }));
    EXPECT_EQ(received.load(), 0);
}

TEST_F(SignalingRouterTest, ExpiredSignalDropped) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");

    std::atomic<int> received{0};
    SignalingEventListeners listeners;
    listeners.on_signal_received = [&](const SignalMessage&) { received++; };
    bob->set_event_listeners(listeners);

    SignalMessage stale;
    stale.from_user = "alice";
    stale.to_user = "bob";
    stale.payload = CallEndData{"call-old", std::nullopt};
    stale.created_at = 1000;
    stale.expires_at = 2000;
    store_->create(SignalingRouter::SIGNAL_COLLECTION, stale.to_record());

    ASSERT_TRUE(wait_for([&]() { return bob->get_status().signals_dropped == 1; }));
    EXPECT_EQ(received.load(), 0);
}

TEST_F(SignalingRouterTest, HandlerFailureDoesNotStopDelivery) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");

    std::atomic<int> ends{0};
    std::atomic<int> errors{0};
    SignalingEventListeners listeners;
    listeners.on_call_end = [&ends](const SignalMessage&, const CallEndData& data) {
        ends++;
        if (data.call_id == "call-bad") {
            throw RtcError(ErrorCode::InvalidState, "handler failure");
        }
    };
    listeners.on_error = [&errors](ErrorCode code, const std::string&) {
        EXPECT_EQ(code, ErrorCode::InvalidState);
        errors++;
    };
    bob->set_event_listeners(listeners);

    alice->send_call_end("bob", "call-bad");
    alice->send_call_end("bob", "call-good");

    ASSERT_TRUE(wait_for([&]() { return ends.load() == 2; }));
    EXPECT_TRUE(wait_for([&]() { return errors.load() == 1; }));
    EXPECT_EQ(bob->get_status().signals_dispatched, 2);
}

TEST_F(SignalingRouterTest, ListenersMerge) {
    auto alice = make_router("alice");
    auto bob = make_router("bob");

    std::atomic<int> requests{0};
    std::atomic<int> ends{0};

    SignalingEventListeners first;
    first.on_call_request = [&](const SignalMessage&, const CallRequestData&) { requests++; };
    bob->set_event_listeners(first);

    // Second registration only adds a handler
    SignalingEventListeners second;
    second.on_call_end = [&](const SignalMessage&, const CallEndData&) { ends++; };
    bob->set_event_listeners(second);

    CallRequestData request;
    request.call_id = "call-2";
    alice->send_call_request("bob", request);
    alice->send_call_end("bob", "call-2");

    EXPECT_TRUE(wait_for([&]() { return requests.load() == 1 && ends.load() == 1; }));
}

// ============================================================================
// Maintenance Tests
// ============================================================================

TEST_F(SignalingRouterTest, HistoryNewestFirst) {
    auto alice = make_router("alice");

    alice->send_call_end("bob", "call-1");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    alice->send_call_end("bob", "call-2");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    alice->send_call_end("carol", "call-3");

    auto history = alice->get_signal_history(std::string("bob"));

    ASSERT_EQ(history.size(), 2);
    EXPECT_EQ(history[0].call_id, "call-2");
    EXPECT_EQ(history[1].call_id, "call-1");

    EXPECT_EQ(alice->get_signal_history(std::nullopt, std::nullopt, 1).size(), 1);
}

TEST_F(SignalingRouterTest, CleanupRemovesExpiredSignals) {
    auto alice = make_router("alice");
    alice->send_call_end("bob", "call-fresh");

    SignalMessage stale;
    stale.from_user = "carol";
    stale.to_user = "dave";
    stale.payload = CallEndData{"call-stale", std::nullopt};
    uint64_t now = utilities::current_time_ms();
    stale.created_at = now - 10000;
    stale.expires_at = now - 5000;
    store_->create(SignalingRouter::SIGNAL_COLLECTION, stale.to_record());

    EXPECT_EQ(alice->cleanup_expired_signals(), 1);
    EXPECT_EQ(store_->get_record_count(SignalingRouter::SIGNAL_COLLECTION), 1);
}
