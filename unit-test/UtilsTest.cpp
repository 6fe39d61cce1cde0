#include <signal.h>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "test/sandbox_env.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

TEST(UtilsTest, ParseSize) {
    EXPECT_EQ(parse_size("65536"), 65536);
    EXPECT_EQ(parse_size("64K"), 64 << 10);
    EXPECT_EQ(parse_size("50m"), 50LL << 20);
    EXPECT_EQ(parse_size("1G"), 1LL << 30);
    EXPECT_THROW(parse_size(""), invalid_argument);
    EXPECT_THROW(parse_size("12X"), invalid_argument);
    EXPECT_THROW(parse_size("-1"), invalid_argument);
    EXPECT_THROW(parse_size("99999999999999999999G"), invalid_argument);
}

TEST(UtilsTest, SignalName) {
    EXPECT_EQ(signal_name(SIGKILL), "SIGKILL");
    EXPECT_EQ(signal_name(SIGXCPU), "SIGXCPU");
    EXPECT_EQ(signal_name(SIGXFSZ), "SIGXFSZ");
    EXPECT_EQ(signal_name(200), "SIG200");
}

TEST(UtilsTest, Utf8Helpers) {
    EXPECT_TRUE(utf8_check_is_valid("plain ascii"));
    EXPECT_TRUE(utf8_check_is_valid("\xe4\xb8\xad\xe6\x96\x87"));
    EXPECT_FALSE(utf8_check_is_valid("\xe4\xb8"));
    EXPECT_EQ(utf8_sanitize("a\xe4\xb8"), "a\xef\xbf\xbd\xef\xbf\xbd");

    string text = "ab\xe4\xb8\xad";
    EXPECT_EQ(utf8_truncate_position(text, 10), text.size());
    EXPECT_EQ(utf8_truncate_position(text, 4), 2);
    EXPECT_EQ(utf8_truncate_position(text, 2), 2);
}

TEST(UtilsTest, ScratchDirectoryIsRemoved) {
    fs::path dir;
    {
        scratch_directory scratch(test_scratch_root());
        dir = scratch.path();
        ASSERT_TRUE(fs::is_directory(dir));
        write_file_content(dir / "main.py", "print(1)\n");
        EXPECT_EQ(read_file_content(dir / "main.py"), "print(1)\n");

        scratch_directory moved(move(scratch));
        EXPECT_EQ(moved.path().string(), dir.string());
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST(UtilsTest, ScratchDirectoryUnderMissingRootFails) {
    EXPECT_THROW(scratch_directory("/nonexistent/scratch/root"), spawn_error);
}

TEST(UtilsTest, ReadMissingFileThrows) {
    EXPECT_THROW(read_file_content("/nonexistent/file.py"), system_error);
}

TEST(UtilsTest, DeferRunsOnScopeExit) {
    int counter = 0;
    {
        defer { ++counter; };
        EXPECT_EQ(counter, 0);
    }
    EXPECT_EQ(counter, 1);
}

TEST(UtilsTest, ConcurrentQueueDrainsAfterClose) {
    concurrent_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();
    EXPECT_FALSE(queue.push(3));

    int value = 0;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    EXPECT_TRUE(queue.try_pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(queue.pop(value));
}
