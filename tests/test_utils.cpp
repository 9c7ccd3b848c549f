#include <gtest/gtest.h>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/types.hpp>

#include <set>

using namespace toolgate;

TEST(UtilsTest, NormalizePathResolvesDots) {
    EXPECT_EQ("/etc/passwd", normalize_path("/tmp/x/../../etc/passwd"));
    EXPECT_EQ("/a/b", normalize_path("/a/./b/"));
    EXPECT_EQ("/", normalize_path("/../.."));
    EXPECT_EQ("a/b", normalize_path("a//b"));
}

TEST(UtilsTest, IsWithinDirRespectsComponentBoundaries) {
    EXPECT_TRUE(is_within_dir("/tmp", "/tmp"));
    EXPECT_TRUE(is_within_dir("/tmp/a/b", "/tmp"));
    EXPECT_FALSE(is_within_dir("/tmpfoo", "/tmp"));
    EXPECT_FALSE(is_within_dir("/var", "/var/log"));
    EXPECT_TRUE(is_within_dir("/anything", "/"));
}

TEST(UtilsTest, TruncateSafeKeepsUtf8Intact) {
    std::string s = "ab\xC3\xA9";  // "abé"
    EXPECT_EQ("ab", truncate_safe(s, 3));
    EXPECT_EQ(s, truncate_safe(s, 4));
    EXPECT_EQ("a", truncate_safe("abc", 1));
}

TEST(UtilsTest, PercentDecode) {
    std::string out;
    EXPECT_TRUE(percent_decode("%2e%2E/etc", out));
    EXPECT_EQ("../etc", out);
    EXPECT_FALSE(percent_decode("bad%2", out));
    EXPECT_FALSE(percent_decode("bad%zz", out));
}

TEST(UtilsTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));
}

TEST(UtilsTest, ParentAndBaseName) {
    EXPECT_EQ("/var/log", parent_path("/var/log/syslog"));
    EXPECT_EQ("/", parent_path("/var"));
    EXPECT_EQ("syslog", base_name("/var/log/syslog"));
}

TEST(UtilsTest, GenerateUuidIsVersion4AndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(36u, id.size());
        EXPECT_EQ('-', id[8]);
        EXPECT_EQ('4', id[14]);
        seen.insert(id);
    }
    EXPECT_EQ(100u, seen.size());
}

TEST(UtilsTest, FormatDuration) {
    EXPECT_EQ("850ms", format_duration(850));
    EXPECT_EQ("2.5s", format_duration(2500));
    EXPECT_EQ("3m 12s", format_duration(192000));
}

TEST(TypesTest, TierStringsRoundTrip) {
    const Tier all[] = {Tier::AUTO, Tier::CONFIRM, Tier::DOUBLE_CONFIRM,
                        Tier::KEYWORD_ELEVATED, Tier::BLOCKED};
    for (size_t i = 0; i < 5; ++i) {
        Tier parsed;
        ASSERT_TRUE(tier_from_string(tier_to_string(all[i]), parsed));
        EXPECT_EQ(all[i], parsed);
    }
    Tier out;
    EXPECT_FALSE(tier_from_string("sometimes", out));
}

TEST(TypesTest, ConfirmationsPerTier) {
    EXPECT_EQ(0, tier_requires_confirmations(Tier::AUTO));
    EXPECT_EQ(1, tier_requires_confirmations(Tier::CONFIRM));
    EXPECT_EQ(2, tier_requires_confirmations(Tier::DOUBLE_CONFIRM));
    EXPECT_EQ(0, tier_requires_confirmations(Tier::KEYWORD_ELEVATED));
    EXPECT_EQ(0, tier_requires_confirmations(Tier::BLOCKED));
}

TEST(TypesTest, ToolResultJson) {
    ToolResult r = ToolResult::blocked(ErrorKind::POLICY_BLOCKED, Tier::CONFIRM, "needs confirmation");
    Json j = r.to_json();
    EXPECT_EQ("blocked", j["status"].get<std::string>());
    EXPECT_EQ("confirm", j["tier"].get<std::string>());
    EXPECT_EQ("policy_blocked", j["error_kind"].get<std::string>());
    EXPECT_EQ("needs confirmation", j["reason"].get<std::string>());
}
