#include <gtest/gtest.h>
#include <toolgate/safety/keyword.hpp>
#include <toolgate/core/config.hpp>

using namespace toolgate;

TEST(KeywordApprovalTest, CaseInsensitiveTrimmedMatch) {
    KeywordApproval kw("Open Sesame");
    EXPECT_TRUE(kw.enabled());
    EXPECT_TRUE(kw.validate("open sesame"));
    EXPECT_TRUE(kw.validate("  OPEN SESAME\n"));
    EXPECT_FALSE(kw.validate("open"));
    EXPECT_FALSE(kw.validate(""));
}

TEST(KeywordApprovalTest, DisabledNeverValidates) {
    KeywordApproval kw;
    EXPECT_FALSE(kw.enabled());
    EXPECT_FALSE(kw.validate(""));
    EXPECT_FALSE(kw.validate("anything"));
}

TEST(KeywordApprovalTest, Hint) {
    EXPECT_EQ("p********e", KeywordApproval("passphrase").hint());
    EXPECT_EQ("ab", KeywordApproval("ab").hint());
    EXPECT_EQ("a*c", KeywordApproval("abc").hint());
}

TEST(KeywordApprovalTest, FromConfig) {
    Config cfg = Config::parse(R"({"safety": {"approval_keyword": "  bananas "}})");
    KeywordApproval kw = KeywordApproval::from_config(cfg);
    EXPECT_TRUE(kw.validate("BANANAS"));
    EXPECT_FALSE(KeywordApproval::from_config(Config()).enabled());
}
