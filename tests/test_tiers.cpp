#include <gtest/gtest.h>
#include <toolgate/safety/tiers.hpp>

using namespace toolgate;

class TierClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        classifier_.set_resources(ResourceRegistry::defaults());
        classifier_.set_tier("get_status", Tier::AUTO);
        classifier_.set_tier("reboot_node", Tier::CONFIRM);
        classifier_.set_tier("delete_vm", Tier::DOUBLE_CONFIRM);
        classifier_.set_tier("install_package", Tier::KEYWORD_ELEVATED);
        classifier_.set_tier("wipe_disk", Tier::BLOCKED);
    }

    SafetyDecision check(const std::string& name, const Json& args, bool confirmed = false,
                         bool override_active = false, bool keyword = false) {
        return classifier_.check_safety(name, args, confirmed, override_active, keyword);
    }

    TierClassifier classifier_;
};

TEST_F(TierClassifierTest, UnknownActionsAreBlocked) {
    EXPECT_EQ(Tier::BLOCKED, classifier_.get_tier("format_everything"));
    EXPECT_FALSE(classifier_.knows("format_everything"));

    SafetyDecision d = check("format_everything", Json::object(), true, true, true);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(Tier::BLOCKED, d.tier);
}

TEST_F(TierClassifierTest, BlockedTierIgnoresEveryFlag) {
    for (int mask = 0; mask < 8; ++mask) {
        SafetyDecision d = check("wipe_disk", Json{{"disk", "/dev/sdb"}},
                                 (mask & 1) != 0, (mask & 2) != 0, (mask & 4) != 0);
        EXPECT_FALSE(d.allowed) << "flags=" << mask;
        EXPECT_EQ(Tier::BLOCKED, d.tier);
    }
}

TEST_F(TierClassifierTest, AutoRunsImmediately) {
    SafetyDecision d = check("get_status", Json{{"node", "pve2"}});
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(Tier::AUTO, d.tier);
}

TEST_F(TierClassifierTest, ProtectedResourceBlocksEvenAuto) {
    SafetyDecision d = check("get_status", Json{{"node", "agent1"}}, true, true, true);
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(Tier::AUTO, d.tier);
    EXPECT_NE(std::string::npos, d.reason.find("agent1"));
}

TEST_F(TierClassifierTest, ProtectedReasonWinsOverBlockedTier) {
    SafetyDecision d = check("wipe_disk", Json{{"node", "agent1"}});
    EXPECT_FALSE(d.allowed);
    EXPECT_NE(std::string::npos, d.reason.find("agent1"));
}

TEST_F(TierClassifierTest, ConfirmTiersNeedConfirmation) {
    EXPECT_FALSE(check("reboot_node", Json{{"node", "pve2"}}).allowed);
    EXPECT_FALSE(check("reboot_node", Json{{"node", "pve2"}}, false, true, true).allowed);
    EXPECT_TRUE(check("reboot_node", Json{{"node", "pve2"}}, true).allowed);

    EXPECT_FALSE(check("delete_vm", Json{{"vmid", 200}}).allowed);
    EXPECT_TRUE(check("delete_vm", Json{{"vmid", 200}}, true).allowed);
    EXPECT_FALSE(check("delete_vm", Json{{"vmid", 103}}, true).allowed);
}

TEST_F(TierClassifierTest, KeywordTierIgnoresConfirmAndOverride) {
    EXPECT_FALSE(check("install_package", Json{{"package", "htop"}}, true, true, false).allowed);
    EXPECT_TRUE(check("install_package", Json{{"package", "htop"}}, false, false, true).allowed);
}

TEST_F(TierClassifierTest, OverridesOnlyRaiseRestriction) {
    Json overrides = {
        {"get_status", "confirm"},         // raise: applied
        {"wipe_disk", "auto"},             // relax: ignored
        {"reboot_node", "auto"},           // relax: ignored
        {"install_package", "bogus"},      // invalid: ignored
        {"not_registered", "blocked"},     // unknown: ignored
        {"delete_vm", "double_confirm"}    // unchanged
    };
    EXPECT_EQ(1u, classifier_.apply_overrides(overrides));

    EXPECT_EQ(Tier::CONFIRM, classifier_.get_tier("get_status"));
    EXPECT_EQ(Tier::BLOCKED, classifier_.get_tier("wipe_disk"));
    EXPECT_EQ(Tier::CONFIRM, classifier_.get_tier("reboot_node"));
    EXPECT_EQ(Tier::KEYWORD_ELEVATED, classifier_.get_tier("install_package"));
    EXPECT_FALSE(classifier_.knows("not_registered"));

    EXPECT_FALSE(check("get_status", Json::object()).allowed);
}

TEST_F(TierClassifierTest, NonObjectOverridesIgnored) {
    EXPECT_EQ(0u, classifier_.apply_overrides(Json()));
    EXPECT_EQ(0u, classifier_.apply_overrides(Json::array({"get_status"})));
    EXPECT_EQ(Tier::AUTO, classifier_.get_tier("get_status"));
}

TEST_F(TierClassifierTest, ActionResourceKeys) {
    ResourceKeyList keys;
    keys.push_back(std::make_pair(std::string("container"), ResourceKind::VMID));
    classifier_.set_tier("stop_container", Tier::AUTO, keys);

    EXPECT_FALSE(check("stop_container", Json{{"container", 103}}).allowed);
    EXPECT_TRUE(check("get_status", Json{{"container", 103}}).allowed);
}
