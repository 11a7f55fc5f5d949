#include "device_node.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <future>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

using namespace iscsi_dev;
using namespace std::chrono_literals;

namespace {

class DeviceNodeTest : public testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/iscsi-dev-test-XXXXXX";
        ASSERT_NE(nullptr, mkdtemp(tmpl));
        dir = tmpl;
    }

    void TearDown() override {
        for (const auto& name : {"src", "dest", "file"}) {
            ::unlink((dir + "/" + name).c_str());
        }
        ::rmdir(dir.c_str());
    }

    std::string path(const std::string& name) const {
        return dir + "/" + name;
    }

    void create_file(const std::string& file) const {
        std::ofstream(file) << "data";
        ASSERT_TRUE(path_exists(file));
    }

    // mknod блочного устройства требует CAP_MKNOD
    bool make_source_node(unsigned major_number, unsigned minor_number) {
        try {
            make_block_node(path("src"), major_number, minor_number);
            return true;
        } catch (const OsError& e) {
            if (e.code() == EPERM || e.code() == EACCES) {
                return false;
            }
            throw;
        }
    }

    std::string dir;
};

} // namespace

TEST(DeviceNumberTest, Split)
{
    EXPECT_EQ(std::make_pair(8U, 1U), split_device_number(8 * 256 + 1));
    EXPECT_EQ(std::make_pair(0U, 0U), split_device_number(0));
    EXPECT_EQ(std::make_pair(253U, 255U), split_device_number(253 * 256 + 255));
}

TEST(DeviceNumberTest, Encode)
{
    EXPECT_EQ(0x801U, encode_device_number(8, 1));
    EXPECT_EQ(makedev(8, 1), encode_device_number(8, 1));
    EXPECT_EQ(makedev(259, 3), encode_device_number(259, 3));
    EXPECT_EQ(makedev(8, 300), encode_device_number(8, 300)) << "High minor bits go above the major";
}

TEST_F(DeviceNodeTest, DuplicateDevice)
{
    if (!make_source_node(8, 1)) {
        GTEST_SKIP() << "Not permitted to create block device nodes";
    }

    duplicate_device(path("src"), path("dest"));

    struct stat st;
    ASSERT_EQ(0, stat(path("dest").c_str(), &st));
    EXPECT_TRUE(S_ISBLK(st.st_mode));
    EXPECT_EQ(0600U, st.st_mode & 07777);
    EXPECT_EQ(8U, major(st.st_rdev));
    EXPECT_EQ(1U, minor(st.st_rdev));
}

TEST_F(DeviceNodeTest, DuplicateOverExistingFile)
{
    if (!make_source_node(8, 1)) {
        GTEST_SKIP() << "Not permitted to create block device nodes";
    }
    create_file(path("dest"));

    try {
        duplicate_device(path("src"), path("dest"));
        FAIL() << "Existing destination must not be replaced";
    } catch (const OsError& e) {
        EXPECT_EQ(EEXIST, e.code());
    }
}

TEST_F(DeviceNodeTest, DuplicateMissingSource)
{
    EXPECT_THROW(duplicate_device(path("src"), path("dest")), NotFoundError);
    EXPECT_FALSE(path_exists(path("dest")));
}

TEST_F(DeviceNodeTest, RemoveMissingPath)
{
    bool called = false;
    auto remover = [&called](const std::string&) { called = true; };

    EXPECT_NO_THROW(remove_device(path("file"), 10ms, remover));
    EXPECT_FALSE(called) << "Nothing to remove";
}

TEST_F(DeviceNodeTest, RemoveExistingFile)
{
    create_file(path("file"));

    remove_device(path("file"));

    EXPECT_FALSE(path_exists(path("file")));
}

TEST_F(DeviceNodeTest, RemoveDeviceNode)
{
    if (!make_source_node(8, 1)) {
        GTEST_SKIP() << "Not permitted to create block device nodes";
    }

    remove_device(path("src"));

    EXPECT_FALSE(path_exists(path("src")));
}

TEST_F(DeviceNodeTest, RemoveFailure)
{
    create_file(path("file"));
    auto remover = [](const std::string& p) { throw OsError("Failed to remove " + p, EBUSY); };

    try {
        remove_device(path("file"), 1000ms, remover);
        FAIL() << "Removal error must be reported";
    } catch (const OsError& e) {
        EXPECT_EQ(EBUSY, e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find(path("file")));
    }
}

TEST_F(DeviceNodeTest, RemoveTimeout)
{
    create_file(path("file"));

    // Удаление ждёт, пока тест его не отпустит
    std::promise<void> gate;
    std::shared_future<void> released = gate.get_future().share();
    auto finished = std::make_shared<std::promise<void>>();
    std::future<void> removal_done = finished->get_future();

    auto remover = [released, finished](const std::string& p) {
        released.wait();
        unlink_path(p);
        finished->set_value();
    };

    try {
        remove_device(path("file"), 50ms, remover);
        FAIL() << "Delayed removal must time out";
    } catch (const TimeoutError& e) {
        EXPECT_EQ(path("file"), e.path());
        EXPECT_NE(std::string::npos, std::string(e.what()).find(path("file")));
    }

    EXPECT_TRUE(path_exists(path("file"))) << "Removal is still in flight";

    // Фоновое удаление не отменено и завершается само
    gate.set_value();
    ASSERT_EQ(std::future_status::ready, removal_done.wait_for(5s));
    EXPECT_FALSE(path_exists(path("file")));
}
