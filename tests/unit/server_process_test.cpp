/**
 * server_process_test.cpp - ServerProcess unit tests
 *
 * Tests:
 * - Spawn with missing executable (error path)
 * - PATH resolution for bare command names
 * - Pipes carry lines both ways
 * - Environment overrides reach the child
 * - Exit detection and exit status
 * - Clean shutdown on stdin EOF, forced shutdown of a child that ignores it
 * - Double shutdown safety
 */

#include "rpc/server_process.hpp"

#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace toolproxy::rpc;

class ServerProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_path_ = std::filesystem::temp_directory_path() /
                       ("toolproxy_server_process_test_" + std::to_string(getpid()) + ".sh");
    }

    void TearDown() override {
        if (std::filesystem::exists(script_path_)) {
            std::filesystem::remove(script_path_);
        }
    }

    void CreateScript(const std::string &body) {
        std::ofstream script(script_path_.string());
        script << "#!/bin/sh\n" << body;
        script.close();

        std::filesystem::permissions(script_path_,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
    }

    bool WaitForExit(ServerProcess &process, int timeout_ms) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (!process.is_running()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    std::filesystem::path script_path_;
};

TEST_F(ServerProcessTest, InitialState) {
    ServerProcess process("srv", "/bin/cat");
    EXPECT_EQ(process.server_name(), "srv");
    EXPECT_EQ(process.pid(), -1);
    EXPECT_FALSE(process.is_running());
    EXPECT_FALSE(process.exit_status().has_value());
}

TEST_F(ServerProcessTest, SpawnMissingExecutableFails) {
    ServerProcess process("srv", "/nonexistent_path/fake_server");
    EXPECT_FALSE(process.spawn());
    EXPECT_NE(process.last_error().find("Executable not found"), std::string::npos);
    EXPECT_FALSE(process.is_running());
}

TEST_F(ServerProcessTest, BareCommandResolvedOnPath) {
    auto resolved = ServerProcess::resolve_executable("sh", {});
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(std::filesystem::path(*resolved).filename(), "sh");

    EXPECT_FALSE(ServerProcess::resolve_executable("toolproxy-definitely-missing", {}).has_value());
    EXPECT_FALSE(ServerProcess::resolve_executable("sh", {{"PATH", "/nonexistent_dir"}}).has_value());
}

TEST_F(ServerProcessTest, PipesCarryLinesBothWays) {
    ServerProcess process("cat", "cat");
    ASSERT_TRUE(process.spawn()) << process.last_error();
    EXPECT_GT(process.pid(), 0);
    EXPECT_TRUE(process.is_running());

    ASSERT_TRUE(process.client().write_line("ping"));
    std::string line;
    ASSERT_EQ(process.client().read_line(line, 2000), LineStdioClient::ReadStatus::LINE);
    EXPECT_EQ(line, "ping");

    process.shutdown();
    EXPECT_FALSE(process.is_running());
    ASSERT_TRUE(process.exit_status().has_value());
    EXPECT_EQ(*process.exit_status(), 0);
}

TEST_F(ServerProcessTest, ArgumentsAndEnvironmentReachChild) {
    CreateScript("echo \"$1 $TOOLPROXY_TEST_VAR\"\n");
    ServerProcess process("env", script_path_.string(), {"arg-one"}, {{"TOOLPROXY_TEST_VAR", "from-config"}});
    ASSERT_TRUE(process.spawn()) << process.last_error();

    std::string line;
    ASSERT_EQ(process.client().read_line(line, 2000), LineStdioClient::ReadStatus::LINE);
    EXPECT_EQ(line, "arg-one from-config");
}

TEST_F(ServerProcessTest, ExitIsDetectedWithStatus) {
    CreateScript("exit 7\n");
    ServerProcess process("exit", script_path_.string());
    ASSERT_TRUE(process.spawn()) << process.last_error();

    ASSERT_TRUE(WaitForExit(process, 2000));
    ASSERT_TRUE(process.exit_status().has_value());
    EXPECT_EQ(*process.exit_status(), 7);

    std::string line;
    EXPECT_EQ(process.client().read_line(line, 1000), LineStdioClient::ReadStatus::END_OF_STREAM);
}

TEST_F(ServerProcessTest, ShutdownForcesChildThatIgnoresEof) {
    CreateScript("trap '' TERM\nwhile true; do sleep 1; done\n");
    ServerProcess process("stubborn", script_path_.string(), {}, {}, 100);
    ASSERT_TRUE(process.spawn()) << process.last_error();
    EXPECT_TRUE(process.is_running());

    auto start = std::chrono::steady_clock::now();
    process.shutdown();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(process.is_running());
    EXPECT_LT(elapsed.count(), 3000);
    ASSERT_TRUE(process.exit_status().has_value());
    EXPECT_EQ(*process.exit_status(), 128 + SIGKILL);
}

TEST_F(ServerProcessTest, KillNowTerminatesChild) {
    ServerProcess process("cat", "cat");
    ASSERT_TRUE(process.spawn()) << process.last_error();

    process.kill_now();
    ASSERT_TRUE(WaitForExit(process, 2000));
    EXPECT_EQ(*process.exit_status(), 128 + SIGKILL);
}

TEST_F(ServerProcessTest, DoubleShutdownIsSafe) {
    ServerProcess process("cat", "cat");
    ASSERT_TRUE(process.spawn()) << process.last_error();

    process.shutdown();
    EXPECT_NO_THROW(process.shutdown());
    EXPECT_FALSE(process.is_running());
}
