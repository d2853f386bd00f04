/**
 * worker_process_test.cpp - WorkerProcess unit tests
 *
 * Tests:
 * - Executable resolution (PATH search, missing, not executable)
 * - Spawn error paths
 * - Stdio round trip through a real child
 * - Environment overrides
 * - Exit code observation (normal exit and signal)
 * - Clean and forced shutdown
 */

#include "worker/worker_process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <thread>

#include "helpers/script_worker.hpp"

using namespace ccproxy::worker;
using ccproxy::tests::ScriptWorkerDir;

class WorkerProcessTest : public ::testing::Test {
protected:
    ScriptWorkerDir scripts{"ccproxy_worker_process_test"};
};

TEST_F(WorkerProcessTest, ResolvesCommandOnPath) {
    std::string resolved;
    std::string error;
    ASSERT_TRUE(resolve_executable("sh", resolved, error)) << error;
    EXPECT_EQ(resolved.back(), 'h');
    EXPECT_NE(resolved.find('/'), std::string::npos);
}

TEST_F(WorkerProcessTest, ResolveFailsForMissingCommand) {
    std::string resolved;
    std::string error;
    EXPECT_FALSE(resolve_executable("ccproxy-definitely-not-installed", resolved, error));
    EXPECT_NE(error.find("Executable not found"), std::string::npos);
}

TEST_F(WorkerProcessTest, ResolveFailsForNonExecutableFile) {
    std::string path = scripts.path("plain.txt");
    std::ofstream(path) << "data";

    std::string resolved;
    std::string error;
    EXPECT_FALSE(resolve_executable(path, resolved, error));
    EXPECT_NE(error.find("Permission denied"), std::string::npos);
}

TEST_F(WorkerProcessTest, SpawnFailsWithNonexistentExecutable) {
    WorkerProcess proc("test_worker", "/nonexistent_path/fake_worker");

    EXPECT_FALSE(proc.spawn());
    EXPECT_NE(proc.last_error().find("not found"), std::string::npos);
    EXPECT_FALSE(proc.is_running());
}

TEST_F(WorkerProcessTest, ShutdownSafeOnUnspawnedProcess) {
    WorkerProcess proc("test_worker", "/nonexistent_path/fake_worker");
    EXPECT_NO_THROW(proc.shutdown());
    EXPECT_NO_THROW(proc.shutdown());
}

TEST_F(WorkerProcessTest, RoundTripsLines) {
    std::string script = scripts.write("upper.sh",
                                       "while IFS= read -r line; do\n"
                                       "  echo \"got:$line\"\n"
                                       "  echo \"diag:$line\" >&2\n"
                                       "done\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();
    EXPECT_GT(proc.pid(), 0);
    EXPECT_EQ(proc.state(), WorkerState::RUNNING);

    ASSERT_TRUE(proc.client().write_line("ping"));

    std::string line;
    ASSERT_TRUE(proc.client().stdout_reader().read_line(line, 2000));
    EXPECT_EQ(line, "got:ping");
    ASSERT_TRUE(proc.client().stderr_reader().read_line(line, 2000));
    EXPECT_EQ(line, "diag:ping");

    // EOF on stdin ends the read loop
    proc.shutdown();
    EXPECT_EQ(proc.state(), WorkerState::EXITED);
    EXPECT_EQ(proc.exit_code(), 0);
}

TEST_F(WorkerProcessTest, PassesArgsAndEnvironmentOverrides) {
    std::string script = scripts.write("env.sh", "echo \"$1 $2 $CCPROXY_TEST_TOKEN\"\n");

    WorkerProcess proc("test_worker", script, {"alpha", "beta"}, {{"CCPROXY_TEST_TOKEN", "secret"}});
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    std::string line;
    ASSERT_TRUE(proc.client().stdout_reader().read_line(line, 2000));
    EXPECT_EQ(line, "alpha beta secret");
}

TEST_F(WorkerProcessTest, InheritsHostEnvironment) {
    ASSERT_EQ(setenv("CCPROXY_TEST_INHERITED", "from-host", 1), 0);
    std::string script = scripts.write("inherit.sh", "echo \"$CCPROXY_TEST_INHERITED\"\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    std::string line;
    ASSERT_TRUE(proc.client().stdout_reader().read_line(line, 2000));
    EXPECT_EQ(line, "from-host");
    unsetenv("CCPROXY_TEST_INHERITED");
}

TEST_F(WorkerProcessTest, ObservesExitCode) {
    std::string script = scripts.write("exit7.sh", "exit 7\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    ASSERT_TRUE(proc.wait_for_exit(2000));
    EXPECT_TRUE(proc.poll_exit());
    EXPECT_EQ(proc.state(), WorkerState::EXITED);
    EXPECT_EQ(proc.exit_code(), 7);
    EXPECT_FALSE(proc.is_running());
}

TEST_F(WorkerProcessTest, StdoutReachesEofAfterExit) {
    std::string script = scripts.write("once.sh", "echo bye\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    std::string line;
    ASSERT_TRUE(proc.client().stdout_reader().read_line(line, 2000));
    EXPECT_EQ(line, "bye");
    EXPECT_FALSE(proc.client().stdout_reader().read_line(line, 2000));
    EXPECT_TRUE(proc.client().stdout_reader().at_eof());
}

TEST_F(WorkerProcessTest, ShutdownKillsWorkerIgnoringEof) {
    // Ignores stdin entirely; only SIGKILL ends it
    std::string script = scripts.write("stubborn.sh", "exec sleep 30\n");

    WorkerProcess proc("test_worker", script, {}, {}, 200);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();
    EXPECT_TRUE(proc.is_running());

    auto start = std::chrono::steady_clock::now();
    proc.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(proc.state(), WorkerState::EXITED);
    EXPECT_EQ(proc.exit_code(), 128 + 9);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

TEST_F(WorkerProcessTest, DoubleShutdownIsSafe) {
    std::string script = scripts.write("cat.sh", "exec cat\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();

    proc.shutdown();
    EXPECT_NO_THROW(proc.shutdown());
    EXPECT_FALSE(proc.client().stdin_open());
}

TEST_F(WorkerProcessTest, SecondSpawnIsRejected) {
    std::string script = scripts.write("cat2.sh", "exec cat\n");

    WorkerProcess proc("test_worker", script);
    ASSERT_TRUE(proc.spawn()) << proc.last_error();
    EXPECT_FALSE(proc.spawn());
    EXPECT_NE(proc.last_error().find("already spawned"), std::string::npos);
}
