// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "Domain/EssentialProcessPolicy.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace Domain
{
namespace
{

TEST(EssentialProcessPolicyTest, DefaultsProtectKernelAndInit)
{
    const EssentialProcessPolicy policy;

    EXPECT_TRUE(policy.isEssential(0, "swapper"));
    EXPECT_TRUE(policy.isEssential(1, "anything"));
    EXPECT_FALSE(policy.isEssential(2, "bash"));
}

TEST(EssentialProcessPolicyTest, DefaultsProtectSystemNames)
{
    const EssentialProcessPolicy policy;

    EXPECT_TRUE(policy.isEssential(1234, "kernel_task"));
    EXPECT_TRUE(policy.isEssential(1234, "WindowServer"));
    EXPECT_TRUE(policy.isEssential(1234, "systemd"));
    EXPECT_TRUE(policy.isEssential(1234, "Xorg"));
}

TEST(EssentialProcessPolicyTest, NameMatchIsExactAndCaseSensitive)
{
    const EssentialProcessPolicy policy;

    EXPECT_FALSE(policy.isEssential(1234, "Launchd"));
    EXPECT_FALSE(policy.isEssential(1234, "launchd "));
    EXPECT_FALSE(policy.isEssential(1234, "mds_stores_helper"));
    EXPECT_TRUE(policy.isEssential(1234, "mds_stores"));
}

TEST(EssentialProcessPolicyTest, LongNamesMatchTheirKernelTruncatedForm)
{
    const EssentialProcessPolicy policy;

    // /proc/<pid>/stat reports "systemd-journald" as "systemd-journal"
    EXPECT_TRUE(policy.isEssential(1234, "systemd-journal"));
    EXPECT_TRUE(policy.isEssential(1234, "systemd-journald"));
}

TEST(EssentialProcessPolicyTest, TruncatedMatchRequiresFullCommLength)
{
    const EssentialProcessPolicy policy({}, {"postgres-replicator"});

    EXPECT_TRUE(policy.isEssential(10, "postgres-replic"));
    EXPECT_FALSE(policy.isEssential(10, "postgres-repli"));
    EXPECT_FALSE(policy.isEssential(10, "postgres"));
}

TEST(EssentialProcessPolicyTest, ShortNamesStayExact)
{
    const EssentialProcessPolicy policy({}, {"systemd-logind"});

    EXPECT_TRUE(policy.isEssential(10, "systemd-logind"));
    EXPECT_FALSE(policy.isEssential(10, "systemd-login"));
}

TEST(EssentialProcessPolicyTest, CustomListsReplaceDefaults)
{
    const EssentialProcessPolicy policy({42}, {"postgres"});

    EXPECT_TRUE(policy.isEssential(42, "x"));
    EXPECT_TRUE(policy.isEssential(7, "postgres"));
    EXPECT_FALSE(policy.isEssential(1, "launchd"));
}

TEST(EssentialProcessPolicyTest, EmptyNamesAreIgnored)
{
    const EssentialProcessPolicy policy({}, {"", "nginx"});

    EXPECT_EQ(policy.protectedNames().size(), 1U);
    EXPECT_FALSE(policy.isEssential(10, ""));
}

TEST(EssentialProcessPolicyTest, PlaceholderNameIsNotProtected)
{
    const EssentialProcessPolicy policy;

    EXPECT_FALSE(policy.isEssential(5000, "?"));
}

TEST(EssentialProcessPolicyTest, DefaultListsAreNonEmpty)
{
    EXPECT_FALSE(EssentialProcessPolicy::defaultProtectedPids().empty());
    EXPECT_FALSE(EssentialProcessPolicy::defaultProtectedNames().empty());
}

} // namespace
} // namespace Domain
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
