#include <gtest/gtest.h>
#include <platform/singleton.hpp>
#include <filesystem>
#include <fstream>
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

class PidFileTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string pid_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "reclock_pidfile_test";
        fs::create_directories(test_dir);
        pid_path = (test_dir / "run" / "reclock.pid").string();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_record(const std::string& content) {
        fs::create_directories(fs::path(pid_path).parent_path());
        std::ofstream(pid_path) << content;
    }
};

TEST_F(PidFileTest, AcquireWriteRelease) {
    PidFile pid_file(pid_path);
    ASSERT_TRUE(pid_file.acquire());
    EXPECT_TRUE(pid_file.held());
    EXPECT_TRUE(fs::exists(pid_path));
    EXPECT_EQ(read_pid_record(pid_path), 0);   // nothing written yet

    pid_file.write_pid(getpid());
    EXPECT_EQ(read_pid_record(pid_path), getpid());

    pid_file.release();
    EXPECT_FALSE(pid_file.held());
    EXPECT_FALSE(fs::exists(pid_path));
}

TEST_F(PidFileTest, DestructorRemovesRecord) {
    {
        PidFile pid_file(pid_path);
        ASSERT_TRUE(pid_file.acquire());
        pid_file.write_pid(getpid());
    }
    EXPECT_FALSE(fs::exists(pid_path));
}

TEST_F(PidFileTest, SecondInstanceSeesHolder) {
    PidFile first(pid_path);
    ASSERT_TRUE(first.acquire());
    first.write_pid(getpid());

    PidFile second(pid_path);
    EXPECT_FALSE(second.acquire());
    EXPECT_FALSE(second.held());
    EXPECT_EQ(second.holder_pid(), getpid());

    // The loser must not disturb the holder's record
    second.release();
    EXPECT_EQ(read_pid_record(pid_path), getpid());
}

TEST_F(PidFileTest, StaleRecordIsReclaimed) {
    write_record("424242\n");

    PidFile pid_file(pid_path);
    ASSERT_TRUE(pid_file.acquire());
    EXPECT_EQ(pid_file.stale_pid(), 424242);
    EXPECT_EQ(read_pid_record(pid_path), 0);
}

TEST_F(PidFileTest, GarbageRecordIsReclaimed) {
    write_record("not-a-pid");

    PidFile pid_file(pid_path);
    ASSERT_TRUE(pid_file.acquire());
    EXPECT_EQ(pid_file.stale_pid(), 0);
}

TEST_F(PidFileTest, ReleaseLeavesReplacementAlone) {
    PidFile pid_file(pid_path);
    ASSERT_TRUE(pid_file.acquire());

    fs::remove(pid_path);
    write_record("777\n");

    pid_file.release();
    ASSERT_TRUE(fs::exists(pid_path));
    EXPECT_EQ(read_pid_record(pid_path), 777);
}

TEST_F(PidFileTest, WriteWithoutAcquireThrows) {
    PidFile pid_file(pid_path);
    EXPECT_THROW(pid_file.write_pid(1), std::runtime_error);
}

TEST_F(PidFileTest, KillWithoutRecord) {
    auto result = kill_recorded_instance(pid_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, 0);
}

TEST_F(PidFileTest, KillRemovesStaleRecord) {
    write_record("424242\n");

    auto result = kill_recorded_instance(pid_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, 0);
    EXPECT_FALSE(fs::exists(pid_path));
}

TEST_F(PidFileTest, KillOfStartingInstanceFails) {
    PidFile pid_file(pid_path);
    ASSERT_TRUE(pid_file.acquire());

    auto result = kill_recorded_instance(pid_path, 200);
    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(fs::exists(pid_path));
}

TEST_F(PidFileTest, KillSignalsLiveHolder) {
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        close(ready[0]);
        PidFile pid_file(pid_path);
        if (!pid_file.acquire()) _exit(2);
        pid_file.write_pid(getpid());
        char c = 'r';
        if (write(ready[1], &c, 1) != 1) _exit(3);
        for (;;) pause();
    }

    close(ready[1]);
    char c = 0;
    ASSERT_EQ(read(ready[0], &c, 1), 1);
    close(ready[0]);

    EXPECT_EQ(read_pid_record(pid_path), child);

    auto result = kill_recorded_instance(pid_path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, child);
    EXPECT_FALSE(fs::exists(pid_path));

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
}

// Holds the record, then after delay_ms either records its pid and waits to
// be killed, or gives up and releases the record.
static pid_t start_slow_instance(const std::string& pid_path, int delay_ms, bool becomes_leader) {
    int ready[2];
    if (pipe(ready) != 0) return -1;

    pid_t child = fork();
    if (child == 0) {
        close(ready[0]);
        PidFile pid_file(pid_path);
        if (!pid_file.acquire()) _exit(2);
        char c = 'r';
        if (write(ready[1], &c, 1) != 1) _exit(3);
        usleep(delay_ms * 1000);
        if (!becomes_leader) {
            pid_file.release();
            _exit(0);
        }
        pid_file.write_pid(getpid());
        for (;;) pause();
    }

    close(ready[1]);
    char c = 0;
    ssize_t n = read(ready[0], &c, 1);
    close(ready[0]);
    return n == 1 ? child : -1;
}

TEST_F(PidFileTest, KillWaitsForAcquiringInstance) {
    pid_t child = start_slow_instance(pid_path, 300, true);
    ASSERT_GT(child, 0);

    auto result = kill_recorded_instance(pid_path, 5000);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, child);
    EXPECT_FALSE(fs::exists(pid_path));

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
}

TEST_F(PidFileTest, KillOfInstanceThatGivesUpIsNoop) {
    pid_t child = start_slow_instance(pid_path, 300, false);
    ASSERT_GT(child, 0);

    auto result = kill_recorded_instance(pid_path, 5000);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value, 0);
    EXPECT_FALSE(fs::exists(pid_path));

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    EXPECT_TRUE(WIFEXITED(status));
}
