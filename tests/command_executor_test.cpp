#include "command_executor.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace iscsi_dev;
using testing::ElementsAre;

TEST(LocalExecutorTest, ReturnsTrimmedOutput)
{
    LocalExecutor executor;

    EXPECT_EQ("hello world", executor.execute("echo", {"hello", "world"}));
}

TEST(LocalExecutorTest, CapturesStderr)
{
    LocalExecutor executor;

    EXPECT_EQ("oops", executor.execute("sh", {"-c", "echo oops >&2"}));
}

TEST(LocalExecutorTest, NonZeroExit)
{
    LocalExecutor executor;

    try {
        executor.execute("sh", {"-c", "echo failed; exit 3"});
        FAIL() << "Non-zero exit code must throw";
    } catch (const CommandError& e) {
        EXPECT_EQ("sh -c echo failed; exit 3", e.command());
        EXPECT_EQ(3, e.exit_code());
        EXPECT_EQ("failed\n", e.output());
    }
}

TEST(LocalExecutorTest, MissingProgram)
{
    LocalExecutor executor;

    EXPECT_THROW(executor.execute("iscsi-dev-no-such-program", {}), CommandError);
}

TEST(NamespaceExecutorTest, MissingNamespace)
{
    EXPECT_THROW(NamespaceExecutor("/nonexistent/proc/1/ns/"), PreconditionError);
    EXPECT_THROW(NamespaceExecutor(""), PreconditionError);
}

TEST(NamespaceExecutorTest, BuildCommand)
{
    NamespaceExecutor executor("/proc/self/ns");

    EXPECT_EQ("/proc/self/ns/", executor.ns_dir()) << "Directory must end with a slash";
    EXPECT_THAT(executor.build_command("iscsiadm", {"-m", "session"}),
                ElementsAre("nsenter", "--mount=/proc/self/ns/mnt", "--net=/proc/self/ns/net",
                            "iscsiadm", "-m", "session"));
}

TEST(UtilsTest, JoinCommand)
{
    EXPECT_EQ("", join_command({}));
    EXPECT_EQ("tgtadm --lld iscsi", join_command({"tgtadm", "--lld", "iscsi"}));
}

TEST(UtilsTest, PathExists)
{
    EXPECT_TRUE(path_exists("/"));
    EXPECT_TRUE(directory_exists("/"));
    EXPECT_FALSE(path_exists("/nonexistent/iscsi-dev"));
    EXPECT_FALSE(directory_exists("/nonexistent/iscsi-dev"));
}

TEST(UtilsTest, LocalIpsExcludeLoopback)
{
    for (const auto& ip : get_local_ips()) {
        EXPECT_EQ(std::string::npos, ip.find_first_not_of("0123456789.")) << ip;
        EXPECT_NE(0U, ip.rfind("127.", 0)) << "Loopback address " << ip << " must be skipped";
    }
}
