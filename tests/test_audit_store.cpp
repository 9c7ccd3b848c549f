#include <gtest/gtest.h>
#include <toolgate/audit/store.hpp>
#include <toolgate/core/utils.hpp>

#include <cstdlib>
#include <string>
#include <unistd.h>

using namespace toolgate;

class AuditStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/toolgate_audit_XXXXXX";
        ASSERT_NE(nullptr, mkdtemp(tmpl));
        dir_ = tmpl;
        db_path_ = dir_ + "/nested/audit.db";
        ASSERT_TRUE(store_.open(db_path_)) << store_.last_error();
    }

    void TearDown() override {
        store_.close();
        std::string cmd = "rm -rf '" + dir_ + "'";
        int rc = system(cmd.c_str());
        (void)rc;
    }

    static AuditRecord make(const std::string& action, int64_t ts, Outcome outcome) {
        AuditRecord rec;
        rec.id = generate_uuid();
        rec.timestamp_ms = ts;
        rec.source = Source::LLM;
        rec.action = action;
        rec.tier = Tier::CONFIRM;
        rec.args = Json{{"node", "pve2"}, {"confirmed", true}};
        rec.outcome = outcome;
        rec.duration_ms = 12;
        return rec;
    }

    std::string dir_;
    std::string db_path_;
    SqliteAuditStore store_;
};

TEST_F(AuditStoreTest, RecordAndReadBack) {
    AuditRecord rec = make("reboot_node", 1000, Outcome::BLOCKED);
    rec.reason = "requires confirmed=true";
    rec.slow = true;
    store_.record(rec);

    ASSERT_EQ(1, store_.count());
    std::vector<AuditRecord> rows = store_.recent(10);
    ASSERT_EQ(1u, rows.size());

    const AuditRecord& got = rows[0];
    EXPECT_EQ(rec.id, got.id);
    EXPECT_EQ(1000, got.timestamp_ms);
    EXPECT_EQ(Source::LLM, got.source);
    EXPECT_EQ("reboot_node", got.action);
    EXPECT_EQ(Tier::CONFIRM, got.tier);
    EXPECT_EQ(Outcome::BLOCKED, got.outcome);
    EXPECT_EQ("pve2", got.args["node"].get<std::string>());
    EXPECT_EQ(12, got.duration_ms);
    EXPECT_EQ("requires confirmed=true", got.reason);
    EXPECT_TRUE(got.slow);
}

TEST_F(AuditStoreTest, EmptyIdIsGenerated) {
    AuditRecord rec = make("get_status", 5, Outcome::OK);
    rec.id.clear();
    store_.record(rec);
    std::vector<AuditRecord> rows = store_.recent(1);
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(36u, rows[0].id.size());
}

TEST_F(AuditStoreTest, DuplicateIdThrows) {
    AuditRecord rec = make("get_status", 5, Outcome::OK);
    store_.record(rec);
    EXPECT_THROW(store_.record(rec), AuditWriteError);
    EXPECT_EQ(1, store_.count());
}

TEST_F(AuditStoreTest, RangeAndRecentOrdering) {
    store_.record(make("a", 300, Outcome::OK));
    store_.record(make("b", 100, Outcome::OK));
    store_.record(make("c", 200, Outcome::ERROR));
    store_.record(make("d", 400, Outcome::OK));

    std::vector<AuditRecord> range = store_.query_range(100, 400);
    ASSERT_EQ(3u, range.size());
    EXPECT_EQ("b", range[0].action);
    EXPECT_EQ("c", range[1].action);
    EXPECT_EQ("a", range[2].action);

    std::vector<AuditRecord> newest = store_.recent(2);
    ASSERT_EQ(2u, newest.size());
    EXPECT_EQ("d", newest[0].action);
    EXPECT_EQ("a", newest[1].action);

    EXPECT_EQ(2u, store_.query_range(0, 1000, 2).size());
}

TEST_F(AuditStoreTest, PurgeOlderThan) {
    store_.record(make("old", 100, Outcome::OK));
    store_.record(make("older", 50, Outcome::OK));
    store_.record(make("new", 900, Outcome::OK));

    EXPECT_EQ(2, store_.purge_older_than(500));
    EXPECT_EQ(1, store_.count());
    EXPECT_EQ(0, store_.purge_older_than(500));
}

TEST_F(AuditStoreTest, PersistsAcrossReopen) {
    store_.record(make("get_status", 10, Outcome::OK));
    store_.close();
    EXPECT_FALSE(store_.is_open());

    ASSERT_TRUE(store_.open(db_path_));
    EXPECT_EQ(1, store_.count());
}

TEST_F(AuditStoreTest, ClosedStoreThrowsOnWrite) {
    store_.close();
    EXPECT_THROW(store_.record(make("get_status", 1, Outcome::OK)), AuditWriteError);
    EXPECT_TRUE(store_.recent(5).empty());
}

TEST(AuditStoreMemoryTest, InMemoryDatabase) {
    SqliteAuditStore store;
    ASSERT_TRUE(store.open(":memory:"));
    AuditRecord rec;
    rec.action = "list_actions";
    rec.timestamp_ms = 1;
    rec.outcome = Outcome::OK;
    store.record(rec);
    EXPECT_EQ(1, store.count());
}

TEST(AuditRecordTest, JsonShape) {
    AuditRecord rec;
    rec.id = "abc";
    rec.timestamp_ms = 0;
    rec.source = Source::MONITOR;
    rec.action = "get_status";
    rec.tier = Tier::AUTO;
    rec.args = Json::object();
    rec.outcome = Outcome::OK;

    Json j = rec.to_json();
    EXPECT_EQ("monitor", j["source"].get<std::string>());
    EXPECT_EQ("auto", j["tier"].get<std::string>());
    EXPECT_EQ("ok", j["outcome"].get<std::string>());
    EXPECT_EQ("1970-01-01T00:00:00.000Z", j["time"].get<std::string>());
    EXPECT_FALSE(j.contains("reason"));
    EXPECT_FALSE(j.contains("slow"));
}
