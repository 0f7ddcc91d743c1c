#include <gtest/gtest.h>
#include <cli/reclock_cli.hpp>
#include <core/log.hpp>
#include <platform/singleton.hpp>
#include "fake_volume.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

class ReclockCliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    CliOptions options;
    std::shared_ptr<FakeVolumeState> state = std::make_shared<FakeVolumeState>();
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "reclock_cli_test";
        fs::create_directories(test_dir);
        options.config_path = (test_dir / "reclock.conf").string();
        options.pid_path = (test_dir / "run" / "reclock.pid").string();
        write_config();
    }

    void TearDown() override {
        state->release();
        log_init("", 0);
        fs::remove_all(test_dir);
    }

    void write_config(const std::string& extra = "", int liveness_timeout = 1,
                      int acquire_timeout = 1) {
        std::ofstream(options.config_path)
            << "{\n"
            << "  \"volfile_servers\": [{\"host\": \"127.0.0.1\"}],\n"
            << "  \"reclock_path\": \"ctdb/.reclock\",\n"
            << "  \"volume_name\": \"ctdb_shared_vol\",\n"
            << "  \"log_file\": \"" << (test_dir / "reclock.log").string() << "\",\n"
            << "  \"log_level\": 9,\n"
            << "  \"check_interval\": 1,\n"
            << "  \"liveness_timeout\": " << liveness_timeout << ",\n"
            << "  \"acquire_timeout\": " << acquire_timeout << ",\n"
            << extra
            << "  \"notify_command\": null\n"
            << "}\n";
    }

    std::string log_text() {
        std::ifstream in(test_dir / "reclock.log");
        std::stringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    // Start the helper in a child process with its stdout on a pipe.
    // Returns the child pid; *token_fd is the read end.
    pid_t spawn_helper(int* token_fd) {
        int fds[2];
        if (pipe(fds) != 0) return -1;
        fflush(stdout);
        fflush(stderr);

        pid_t child = fork();
        if (child == 0) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            close(fds[1]);
            ReclockCLI cli(std::cout, std::cerr, fake_factory(state));
            int code = cli.run(options);
            std::cout.flush();
            fflush(stdout);
            _exit(code);
        }
        close(fds[1]);
        *token_fd = fds[0];
        return child;
    }

    // Read the handshake token, waiting at most timeout_ms.
    static std::string read_token(int fd, int timeout_ms) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (poll(&pfd, 1, timeout_ms) <= 0) return "";
        char c;
        if (read(fd, &c, 1) != 1) return "";
        return std::string(1, c);
    }

    static int wait_exit(pid_t child) {
        int status = 0;
        if (waitpid(child, &status, 0) != child) return -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    }
};

TEST_F(ReclockCliTest, LeaderEmitsZeroOnceAndRecordsPid) {
    // Fail the third probe so the watch ends on its own
    state->fail_after_probes = 2;
    int recorded_pid = -1;
    std::string pid_path = options.pid_path;
    state->on_probe = [&recorded_pid, pid_path](int probe) {
        if (probe == 1) recorded_pid = read_pid_record(pid_path);
    };

    ReclockCLI cli(out, err, fake_factory(state));
    int code = cli.run(options);

    EXPECT_EQ(code, 1);
    EXPECT_EQ(out.str(), "0");
    EXPECT_EQ(recorded_pid, getpid());
    EXPECT_EQ(state->connects, 1);
    EXPECT_FALSE(fs::exists(options.pid_path));
    EXPECT_NE(err.str().find("lost recovery lock"), std::string::npos) << err.str();
    EXPECT_FALSE(cli.abandoned_work());
    EXPECT_NE(log_text().find("acquired"), std::string::npos);
}

TEST_F(ReclockCliTest, ContentionEmitsOneWithoutPidRecord) {
    state->contended = true;

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 1);
    EXPECT_EQ(out.str(), "1");
    EXPECT_FALSE(fs::exists(options.pid_path));
}

TEST_F(ReclockCliTest, AlreadyRunningEmitsOneWithoutTouchingStorage) {
    PidFile running(options.pid_path);
    ASSERT_TRUE(running.acquire());
    running.write_pid(getpid());

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 1);
    EXPECT_EQ(out.str(), "1");
    EXPECT_EQ(state->connects, 0);
    EXPECT_NE(err.str().find("already running"), std::string::npos) << err.str();
    EXPECT_EQ(read_pid_record(options.pid_path), getpid());
}

TEST_F(ReclockCliTest, StaleRecordIsReclaimed) {
    fs::create_directories(fs::path(options.pid_path).parent_path());
    std::ofstream(options.pid_path) << "424242\n";
    state->fail_after_probes = 0;

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 1);
    EXPECT_EQ(out.str(), "0");
    EXPECT_EQ(state->connects, 1);
}

TEST_F(ReclockCliTest, MissingConfigEmitsThree) {
    options.config_path = (test_dir / "absent.conf").string();

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 3);
    EXPECT_EQ(out.str(), "3");
    EXPECT_NE(err.str().find("absent.conf"), std::string::npos) << err.str();
    EXPECT_EQ(state->connects, 0);
}

TEST_F(ReclockCliTest, InvalidConfigEmitsThree) {
    std::ofstream(options.config_path) << R"({"volume_name": "gv0"})";

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 3);
    EXPECT_EQ(out.str(), "3");
}

TEST_F(ReclockCliTest, LargestTimeoutsDoNotExpireEarly) {
    write_config("", MAX_TIMING_SECS, MAX_TIMING_SECS);
    state->fail_after_probes = 1;

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 1);
    EXPECT_EQ(out.str(), "0");
    EXPECT_EQ(state->probe_count(), 2);
    EXPECT_EQ(err.str().find("did not finish"), std::string::npos) << err.str();
}

TEST_F(ReclockCliTest, StorageErrorEmitsThree) {
    state->fail_open = true;

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 3);
    EXPECT_EQ(out.str(), "3");
    EXPECT_FALSE(fs::exists(options.pid_path));
}

TEST_F(ReclockCliTest, HungConnectIsBoundedByAcquireTimeout) {
    auto gate = std::make_shared<FakeVolumeState>();
    gate->hang = true;
    VolumeFactory hanging = [gate](const Config&) -> std::unique_ptr<Volume> {
        std::unique_lock<std::mutex> lock(gate->mutex);
        ++gate->in_flight;
        gate->cv.wait(lock, [gate] { return !gate->hang; });
        --gate->in_flight;
        gate->cv.notify_all();
        throw StorageError("connection refused");
    };

    ReclockCLI cli(out, err, hanging);
    auto start = steady_clock::now();
    int code = cli.run(options);
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();

    EXPECT_EQ(code, 3);
    EXPECT_EQ(out.str(), "3");
    EXPECT_TRUE(cli.abandoned_work());
    EXPECT_LT(elapsed, 3000);

    gate->release();
}

TEST_F(ReclockCliTest, HungProbeEndsWithinLivenessTimeout) {
    state->hang = true;

    ReclockCLI cli(out, err, fake_factory(state));
    auto start = steady_clock::now();
    int code = cli.run(options);
    auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();

    EXPECT_EQ(code, 1);
    EXPECT_EQ(out.str(), "0");
    EXPECT_TRUE(cli.abandoned_work());
    EXPECT_LT(elapsed, 3000);
    EXPECT_FALSE(fs::exists(options.pid_path));
}

TEST_F(ReclockCliTest, ReplacedLockFileExitsOne) {
    state->on_probe = [this](int probe) {
        if (probe == 1) state->set_identity("gfid-0002");
    };

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 1);
    EXPECT_EQ(out.str(), "0");
    EXPECT_NE(err.str().find("replaced"), std::string::npos) << err.str();
}

TEST_F(ReclockCliTest, ParentExitIsCleanShutdown) {
    pid_t gone = fork();
    if (gone == 0) _exit(0);
    int status = 0;
    ASSERT_EQ(waitpid(gone, &status, 0), gone);

    ReclockCLI cli(out, err, fake_factory(state));
    cli.set_parent_pid(gone);
    EXPECT_EQ(cli.run(options), 0);
    EXPECT_EQ(out.str(), "0");
    EXPECT_FALSE(fs::exists(options.pid_path));
}

TEST_F(ReclockCliTest, KillWithoutInstance) {
    options.kill = true;

    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(options), 0);
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReclockCliTest, SigtermIsCleanShutdown) {
    int token_fd = -1;
    pid_t child = spawn_helper(&token_fd);
    ASSERT_GT(child, 0);

    std::string token = read_token(token_fd, 5000);
    close(token_fd);
    if (token != "0") kill(child, SIGKILL);
    ASSERT_EQ(token, "0");

    // The pid is recorded right after the token; give it a moment
    for (int i = 0; i < 50 && read_pid_record(options.pid_path) != child; ++i) {
        usleep(20000);
    }
    EXPECT_EQ(read_pid_record(options.pid_path), child);

    ASSERT_EQ(kill(child, SIGTERM), 0);
    EXPECT_EQ(wait_exit(child), 0);
    EXPECT_FALSE(fs::exists(options.pid_path));
}

TEST_F(ReclockCliTest, KillModeStopsRunningInstance) {
    int token_fd = -1;
    pid_t child = spawn_helper(&token_fd);
    ASSERT_GT(child, 0);

    std::string token = read_token(token_fd, 5000);
    close(token_fd);
    if (token != "0") kill(child, SIGKILL);
    ASSERT_EQ(token, "0");
    for (int i = 0; i < 50 && read_pid_record(options.pid_path) != child; ++i) {
        usleep(20000);
    }

    CliOptions kill_options = options;
    kill_options.kill = true;
    ReclockCLI cli(out, err, fake_factory(state));
    EXPECT_EQ(cli.run(kill_options), 0);
    EXPECT_EQ(out.str(), "");
    EXPECT_NE(err.str().find(std::to_string(child)), std::string::npos) << err.str();

    EXPECT_EQ(wait_exit(child), 0);
    EXPECT_FALSE(fs::exists(options.pid_path));
}
