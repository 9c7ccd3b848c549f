#include <gtest/gtest.h>
#include <toolgate/safety/paths.hpp>
#include <toolgate/core/config.hpp>

#include <fstream>
#include <string>
#include <cstdlib>
#include <climits>
#include <unistd.h>
#include <sys/stat.h>

using namespace toolgate;

// Temporary directory under /tmp (an allowed base directory)
class PathSanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/toolgate_paths_XXXXXX";
        ASSERT_NE(nullptr, mkdtemp(tmpl));
        char real[PATH_MAX];
        ASSERT_NE(nullptr, realpath(tmpl, real));
        root_ = real;

        ASSERT_EQ(0, mkdir((root_ + "/data").c_str(), 0755));
        std::ofstream(root_ + "/data/report.txt") << "hello";
    }

    void TearDown() override {
        std::string cmd = "rm -rf '" + root_ + "'";
        int rc = system(cmd.c_str());
        (void)rc;
    }

    std::string root_;
};

TEST_F(PathSanitizerTest, ResolvesRelativeToRoot) {
    PathCheck c = sanitize_path("data/report.txt", root_);
    ASSERT_TRUE(c.safe) << c.reason;
    EXPECT_EQ(root_ + "/data/report.txt", c.resolved_path);
}

TEST_F(PathSanitizerTest, IdempotentOnOwnOutput) {
    PathCheck first = sanitize_path("./data/../data/report.txt", root_);
    ASSERT_TRUE(first.safe) << first.reason;
    PathCheck second = sanitize_path(first.resolved_path, root_);
    ASSERT_TRUE(second.safe) << second.reason;
    EXPECT_EQ(first.resolved_path, second.resolved_path);
}

TEST_F(PathSanitizerTest, IdempotentOnEncodedInput) {
    PathCheck first = sanitize_path("data%2Freport%20v2.txt", root_);
    ASSERT_TRUE(first.safe) << first.reason;
    EXPECT_EQ(root_ + "/data/report v2.txt", first.resolved_path);
    PathCheck second = sanitize_path(first.resolved_path, root_);
    ASSERT_TRUE(second.safe) << second.reason;
    EXPECT_EQ(first.resolved_path, second.resolved_path);
}

TEST_F(PathSanitizerTest, RejectsDoubleEncoding) {
    PathCheck c = sanitize_path("report100%2525x", root_);
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("double-encoded"));
    EXPECT_FALSE(sanitize_path("%252e%252e/etc/passwd", root_).safe);
}

TEST_F(PathSanitizerTest, TraversalOutOfRootToProtectedFile) {
    PathCheck c = sanitize_path(root_ + "/../../etc/passwd", root_);
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("protected"));
}

TEST_F(PathSanitizerTest, TraversalOutOfRoot) {
    PathCheck c = sanitize_path("../elsewhere", root_);
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("outside the allowed directory"));
}

TEST_F(PathSanitizerTest, PercentEncodedTraversal) {
    PathCheck c = sanitize_path("%2e%2e/%2e%2e/%2e%2e/etc/shadow", root_);
    EXPECT_FALSE(c.safe);
}

TEST_F(PathSanitizerTest, NonexistentFileUnderRealParent) {
    PathCheck c = sanitize_path("data/new/file.txt", root_);
    ASSERT_TRUE(c.safe) << c.reason;
    EXPECT_EQ(root_ + "/data/new/file.txt", c.resolved_path);
}

TEST_F(PathSanitizerTest, SymlinkEscapeIsRejected) {
    ASSERT_EQ(0, symlink("/etc", (root_ + "/link").c_str()));
    PathCheck c = sanitize_path("link/passwd", root_);
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("resolves to"));
}

TEST_F(PathSanitizerTest, SymlinkInsideRootIsResolved) {
    ASSERT_EQ(0, symlink((root_ + "/data").c_str(), (root_ + "/alias").c_str()));
    PathCheck c = sanitize_path("alias/report.txt", root_);
    ASSERT_TRUE(c.safe) << c.reason;
    EXPECT_EQ(root_ + "/data/report.txt", c.resolved_path);
}

TEST_F(PathSanitizerTest, DanglingSymlinkOutOfRoot) {
    ASSERT_EQ(0, symlink("/etc/nonexistent-toolgate", (root_ + "/dangling").c_str()));
    PathCheck c = sanitize_path("dangling", root_);
    EXPECT_FALSE(c.safe);
}

TEST(PathSanitizerStaticTest, RejectsNulAndEmpty) {
    EXPECT_FALSE(sanitize_path(std::string("/tmp/a\0b", 8)).safe);
    EXPECT_FALSE(sanitize_path("").safe);
    EXPECT_FALSE(sanitize_path("/tmp/%00").safe);
    EXPECT_FALSE(sanitize_path("/tmp/%zz").safe);
}

TEST(PathSanitizerStaticTest, RejectsInvalidUtf8) {
    PathCheck c = sanitize_path("/tmp/%ff");
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("UTF-8"));
    EXPECT_FALSE(sanitize_path("/tmp/%c0%af").safe);
    EXPECT_FALSE(sanitize_path(std::string("/tmp/\xff")).safe);
    EXPECT_TRUE(sanitize_path("/tmp/caf%C3%A9").safe);
}

TEST(PathSanitizerStaticTest, ProtectedPaths) {
    EXPECT_FALSE(sanitize_path("/etc/shadow").safe);
    EXPECT_FALSE(sanitize_path("/root/.ssh/authorized_keys").safe);
    EXPECT_FALSE(sanitize_path("/proc/self/environ").safe);
    EXPECT_FALSE(sanitize_path("/dev/sda").safe);
    EXPECT_FALSE(sanitize_path("/etc/pve/priv/authkey.key").safe);
}

TEST(PathSanitizerStaticTest, OutsideBaseDirectories) {
    PathCheck c = sanitize_path("/usr/bin/env");
    EXPECT_FALSE(c.safe);
    EXPECT_NE(std::string::npos, c.reason.find("outside the allowed directories"));
}

TEST(PathSanitizerStaticTest, CustomPolicy) {
    Config cfg = Config::parse(R"({"safety": {
        "allowed_base_dirs": ["/usr/share"],
        "protected_paths": ["/usr/share/secret/"]
    }})");
    PathPolicy policy = PathPolicy::from_config(cfg);

    EXPECT_FALSE(sanitize_path("/tmp/x", "", policy).safe);
    EXPECT_FALSE(sanitize_path("/usr/share/secret/a", "", policy).safe);
    EXPECT_TRUE(sanitize_path("/usr/share/toolgate-test-missing", "", policy).safe);
}

// ============================================================================
// Secret files
// ============================================================================

TEST(SecretFileTest, Basenames) {
    EXPECT_TRUE(is_secret_file("/opt/app/.env"));
    EXPECT_TRUE(is_secret_file("/opt/app/.ENV.production"));
    EXPECT_TRUE(is_secret_file("/opt/app/.env.custom"));
    EXPECT_TRUE(is_secret_file("/home/u/.npmrc"));
    EXPECT_TRUE(is_secret_file("/srv/credentials.json"));
    EXPECT_TRUE(is_secret_file("/srv/config/master.key"));
}

TEST(SecretFileTest, Suffixes) {
    EXPECT_TRUE(is_secret_file("/home/u/id_rsa"));
    EXPECT_TRUE(is_secret_file("/home/u/id_ed25519.pub"));
    EXPECT_TRUE(is_secret_file("/etc/ssl/server.PEM"));
    EXPECT_TRUE(is_secret_file("/opt/app/store.keystore"));
}

TEST(SecretFileTest, DirectorySegments) {
    EXPECT_TRUE(is_secret_file("/home/u/.aws/config"));
    EXPECT_TRUE(is_secret_file("/opt/repo/.git/config"));
    EXPECT_TRUE(is_secret_file("/home/u/.kube"));

    SecretCheck c = check_secret_file("/home/u/.gnupg/pubring.kbx");
    EXPECT_TRUE(c.blocked);
    EXPECT_NE(std::string::npos, c.reason.find(".gnupg"));
}

TEST(SecretFileTest, OrdinaryFiles) {
    EXPECT_FALSE(is_secret_file("/var/log/syslog"));
    EXPECT_FALSE(is_secret_file("/opt/app/README.md"));
    EXPECT_FALSE(is_secret_file("/opt/app/environment.txt"));
    EXPECT_FALSE(is_secret_file("/opt/app/keys.txt"));
}
