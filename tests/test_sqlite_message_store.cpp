/**
 * @file test_sqlite_message_store.cpp
 * @brief Unit tests for the SQLite-backed message store
 *
 * Tests:
 * - Record creation and id assignment
 * - Query conditions, ordering and limits
 * - Guarded updates (compare-and-set)
 * - Live query notifications
 * - Persistence across reopen
 */

#include <gtest/gtest.h>
#include "rtcomm/sqlite_message_store.hpp"
#include "rtcomm/errors.hpp"
#include <filesystem>
#include <vector>

using namespace rtcomm;
using json = nlohmann::json;
namespace fs = std::filesystem;

// Test fixture for message store tests
class SqliteMessageStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<SqliteMessageStore>(":memory:");
    }

    void TearDown() override {
        store_.reset();
    }

    std::string insert(const std::string& from, const std::string& to, uint64_t created_at) {
        auto rows = store_->create("signal", {
            {"from_user", from},
            {"to_user", to},
            {"created_at", created_at},
            {"processed", false},
            {"processed_by", json::array()}
        });
        return rows.at(0)["id"].get<std::string>();
    }

    std::unique_ptr<SqliteMessageStore> store_;
};

// ============================================================================
// Create and Query Tests
// ============================================================================

TEST_F(SqliteMessageStoreTest, CreateAssignsId) {
    auto rows = store_->create("signal", {{"from_user", "alice"}});

    ASSERT_EQ(rows.size(), 1);
    EXPECT_TRUE(rows[0]["id"].get<std::string>().rfind("signal:", 0) == 0);
    EXPECT_EQ(store_->get_record_count("signal"), 1);
}

TEST_F(SqliteMessageStoreTest, CreateKeepsProvidedId) {
    auto rows = store_->create("group_member", {{"id", "m1"}, {"group_id", "team"}});
    EXPECT_EQ(rows[0]["id"], "m1");
}

TEST_F(SqliteMessageStoreTest, CreateRejectsNonObject) {
    try {
        store_->create("signal", json::array({1, 2}));
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(SqliteMessageStoreTest, DuplicateIdFails) {
    store_->create("signal", {{"id", "dup"}});
    EXPECT_THROW(store_->create("signal", {{"id", "dup"}}), RtcError);
}

TEST_F(SqliteMessageStoreTest, CollectionsAreSeparate) {
    insert("alice", "bob", 1);
    store_->create("group_member", {{"group_id", "team"}, {"user_id", "bob"}});

    EXPECT_EQ(store_->query(Query::on("signal")).size(), 1);
    EXPECT_EQ(store_->query(Query::on("group_member")).size(), 1);
    EXPECT_EQ(store_->query(Query::on("empty")).size(), 0);
}

TEST_F(SqliteMessageStoreTest, QueryOrAndGroups) {
    insert("alice", "bob", 1);
    insert("bob", "alice", 2);
    insert("carol", "dave", 3);

    // Conversation between alice and bob in both directions
    auto rows = store_->query(Query::on("signal")
        .where({{"from_user", ConditionOp::EQ, "alice"}, {"to_user", ConditionOp::EQ, "bob"}})
        .where({{"from_user", ConditionOp::EQ, "bob"}, {"to_user", ConditionOp::EQ, "alice"}}));

    EXPECT_EQ(rows.size(), 2);
}

TEST_F(SqliteMessageStoreTest, QueryOrderAndLimit) {
    insert("alice", "bob", 10);
    insert("alice", "bob", 30);
    insert("alice", "bob", 20);

    auto rows = store_->query(Query::on("signal").order("created_at", true).take(2));

    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0]["created_at"], 30);
    EXPECT_EQ(rows[1]["created_at"], 20);
}

TEST_F(SqliteMessageStoreTest, ConditionOperators) {
    json record = {{"n", 5}, {"tags", json::array({"a", "b"})}, {"group_id", "team"}, {"empty", nullptr}};

    EXPECT_TRUE((Condition{"n", ConditionOp::LT, 6}).matches(record));
    EXPECT_FALSE((Condition{"n", ConditionOp::GT, 5}).matches(record));
    EXPECT_TRUE((Condition{"group_id", ConditionOp::IN, json::array({"x", "team"})}).matches(record));
    EXPECT_TRUE((Condition{"tags", ConditionOp::CONTAINS, "a"}).matches(record));
    EXPECT_TRUE((Condition{"tags", ConditionOp::NOT_CONTAINS, "c"}).matches(record));
    EXPECT_TRUE((Condition{"missing", ConditionOp::NOT_CONTAINS, "c"}).matches(record));
    EXPECT_TRUE((Condition{"empty", ConditionOp::EQ, nullptr}).matches(record));
    EXPECT_TRUE((Condition{"missing", ConditionOp::NE, "x"}).matches(record));
}

// ============================================================================
// Guarded Update Tests
// ============================================================================

TEST_F(SqliteMessageStoreTest, UpdateIfGuardHolds) {
    std::string id = insert("alice", "bob", 1);
    Query guard = Query::on("signal").where({{"processed", ConditionOp::EQ, false}});

    auto updated = store_->update_if("signal", id, guard, [](json& record) {
        record["processed"] = true;
    });

    ASSERT_TRUE(updated.has_value());
    EXPECT_TRUE((*updated)["processed"].get<bool>());
    EXPECT_EQ((*updated)["id"], id);
}

TEST_F(SqliteMessageStoreTest, UpdateIfConsumesOnlyOnce) {
    std::string id = insert("alice", "bob", 1);
    Query guard = Query::on("signal").where({{"processed", ConditionOp::EQ, false}});
    auto mark = [](json& record) { record["processed"] = true; };

    EXPECT_TRUE(store_->update_if("signal", id, guard, mark).has_value());
    EXPECT_FALSE(store_->update_if("signal", id, guard, mark).has_value());
}

TEST_F(SqliteMessageStoreTest, UpdateIfUnknownId) {
    EXPECT_FALSE(store_->update_if("signal", "nope", Query::on("signal"), [](json&) {}).has_value());
}

TEST_F(SqliteMessageStoreTest, UpdateCannotChangeId) {
    std::string id = insert("alice", "bob", 1);
    auto updated = store_->update_if("signal", id, Query::on("signal"), [](json& record) {
        record["id"] = "hijacked";
    });

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ((*updated)["id"], id);
}

// ============================================================================
// Remove Tests
// ============================================================================

TEST_F(SqliteMessageStoreTest, RemoveMatching) {
    insert("alice", "bob", 10);
    insert("alice", "bob", 20);
    insert("alice", "bob", 30);

    size_t removed = store_->remove(Query::on("signal").where({{"created_at", ConditionOp::LT, 25}}));

    EXPECT_EQ(removed, 2);
    EXPECT_EQ(store_->get_record_count("signal"), 1);
    EXPECT_EQ(store_->remove(Query::on("signal").where({{"created_at", ConditionOp::LT, 25}})), 0);
}

// ============================================================================
// Live Query Tests
// ============================================================================

TEST_F(SqliteMessageStoreTest, LiveNotifiesMatchingCreates) {
    std::vector<std::pair<LiveAction, json>> events;
    std::string sub = store_->live(
        Query::on("signal").where({{"to_user", ConditionOp::EQ, "bob"}}),
        [&events](LiveAction action, const json& record) { events.emplace_back(action, record); });

    insert("alice", "bob", 1);
    insert("alice", "carol", 2);

    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].first, LiveAction::CREATE);
    EXPECT_EQ(events[0].second["to_user"], "bob");

    EXPECT_TRUE(store_->kill(sub));
    EXPECT_FALSE(store_->kill(sub));

    insert("alice", "bob", 3);
    EXPECT_EQ(events.size(), 1);
}

TEST_F(SqliteMessageStoreTest, LiveSeesUpdatesAndDeletes) {
    std::vector<LiveAction> actions;
    store_->live(Query::on("signal"), [&actions](LiveAction action, const json&) {
        actions.push_back(action);
    });

    std::string id = insert("alice", "bob", 1);
    store_->update_if("signal", id, Query::on("signal"), [](json& r) { r["processed"] = true; });
    store_->remove(Query::on("signal"));

    ASSERT_EQ(actions.size(), 3);
    EXPECT_EQ(actions[0], LiveAction::CREATE);
    EXPECT_EQ(actions[1], LiveAction::UPDATE);
    EXPECT_EQ(actions[2], LiveAction::DELETE);
}

TEST_F(SqliteMessageStoreTest, ThrowingCallbackDoesNotBreakWrite) {
    int delivered = 0;
    store_->live(Query::on("signal"), [](LiveAction, const json&) {
        throw std::runtime_error("subscriber failure");
    });
    store_->live(Query::on("signal"), [&delivered](LiveAction, const json&) { ++delivered; });

    EXPECT_NO_THROW(insert("alice", "bob", 1));
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(store_->get_subscription_count(), 2);
}

TEST_F(SqliteMessageStoreTest, LiveRequiresCallback) {
    EXPECT_THROW(store_->live(Query::on("signal"), nullptr), RtcError);
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST(SqliteMessageStorePersistenceTest, SurvivesReopen) {
    fs::path dir = fs::temp_directory_path() / "rtcomm_store_test";
    fs::create_directories(dir);
    std::string path = (dir / "signals.db").string();

    {
        SqliteMessageStore store(path);
        store.create("signal", {{"id", "kept"}, {"from_user", "alice"}});
    }

    {
        SqliteMessageStore store(path);
        auto rows = store.query(Query::on("signal").where({{"id", ConditionOp::EQ, "kept"}}));
        ASSERT_EQ(rows.size(), 1);
        EXPECT_EQ(rows[0]["from_user"], "alice");
    }

    fs::remove_all(dir);
}
