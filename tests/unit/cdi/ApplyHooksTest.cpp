#include "TestSupport.hpp"
#include "cdi/apply.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace cdihook;
namespace fs = std::filesystem;

namespace {

class ApplyHooksTest : public test::Workspace {
protected:
    void SetUp() override {
        test::Workspace::SetUp();
        rootfs = path("rootfs");
        fs::create_directories(rootfs);
    }

    std::optional<Error> apply(const std::string& plan) {
        write("gpu0_cdi_hooks.json", plan);
        return apply_hooks_to_container(path("gpu0_cdi_hooks.json"), rootfs, config, runner);
    }

    std::string rootfs;
    HookConfig config;
    test::FakeCommandRunner runner;
};

const char* kPlan = R"({
    "container_rootfs": "/var/lib/lxd/storage-pools/default/containers/c1/rootfs",
    "ld_cache_updates": ["/usr/lib/x"],
    "symlinks": [{"target": "/usr/lib/libfoo.so", "link": "/usr/lib/x/libfoo.so"}]
})";

}  // namespace

TEST_F(ApplyHooksTest, EndToEnd) {
    write("rootfs/etc/ld.so.cache", "stale");

    auto err = apply(kPlan);
    ASSERT_FALSE(err.has_value()) << err->to_string();

    fs::path link = fs::path(rootfs) / "usr/lib/x/libfoo.so";
    ASSERT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(fs::read_symlink(link).string(), "../libfoo.so");

    EXPECT_EQ(read("rootfs/etc/ld.so.conf.d/00-cdi-hook.conf"), "/usr/lib/x\n");
    EXPECT_FALSE(fs::exists(fs::path(rootfs) / "etc/ld.so.cache"));

    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0], (std::vector<std::string>{"/sbin/ldconfig", "-r", rootfs}));
}

TEST_F(ApplyHooksTest, HotplugReapplyIsIdempotent) {
    ASSERT_FALSE(apply(kPlan).has_value());
    ASSERT_FALSE(apply(kPlan).has_value());

    EXPECT_EQ(fs::read_symlink(fs::path(rootfs) / "usr/lib/x/libfoo.so").string(), "../libfoo.so");
    EXPECT_EQ(read("rootfs/etc/ld.so.conf.d/00-cdi-hook.conf"), "/usr/lib/x\n");
    EXPECT_EQ(runner.calls.size(), 2u);
}

TEST_F(ApplyHooksTest, EmptyUpdatesSkipLinkerWork) {
    write("rootfs/etc/ld.so.cache", "keep");

    auto err = apply(R"({"ld_cache_updates": [], "symlinks": [{"target": "a", "link": "/b"}]})");
    ASSERT_FALSE(err.has_value()) << err->to_string();

    EXPECT_TRUE(fs::is_symlink(fs::path(rootfs) / "b"));
    EXPECT_FALSE(fs::exists(fs::path(rootfs) / "etc/ld.so.conf.d"));
    EXPECT_EQ(read("rootfs/etc/ld.so.cache"), "keep");
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ApplyHooksTest, InvalidLinkRejectedBeforeAnyMutation) {
    auto err = apply(R"({
        "ld_cache_updates": ["/usr/lib/x"],
        "symlinks": [
            {"target": "/usr/lib/libfoo.so", "link": "/usr/lib/x/libfoo.so"},
            {"target": "/usr/lib/libbar.so", "link": "usr/lib/x/libbar.so"}
        ]
    })");

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::InvalidLink);
    EXPECT_EQ(err->entry_index, std::optional<size_t>(1));
    EXPECT_TRUE(fs::is_empty(rootfs));
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ApplyHooksTest, SymlinkFailureSkipsLinkerStages) {
    write("rootfs/usr", "file in the way");

    auto err = apply(kPlan);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::IOError);
    EXPECT_FALSE(fs::exists(fs::path(rootfs) / "etc"));
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(ApplyHooksTest, LdconfigFailureIsReported) {
    runner.result = {1, "ldconfig: boom"};

    auto err = apply(kPlan);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::SubprocessError);
    // Earlier stages stay applied
    EXPECT_TRUE(fs::is_symlink(fs::path(rootfs) / "usr/lib/x/libfoo.so"));
    EXPECT_EQ(read("rootfs/etc/ld.so.conf.d/00-cdi-hook.conf"), "/usr/lib/x\n");
}

TEST_F(ApplyHooksTest, MissingHooksFile) {
    auto err = apply_hooks_to_container(path("missing.json"), rootfs, config, runner);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::NotFound);
}

TEST_F(ApplyHooksTest, MissingRootfs) {
    write("hooks.json", kPlan);
    auto err = apply_hooks_to_container(path("hooks.json"), path("no-rootfs"), config, runner);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::NotFound);
    EXPECT_FALSE(fs::exists(path("no-rootfs")));
}

TEST_F(ApplyHooksTest, MalformedPlanTouchesNothing) {
    auto err = apply("{ not json");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::DecodeError);
    EXPECT_TRUE(fs::is_empty(rootfs));
}
