// Unit tests for subprocess launching and shell quoting.

#include "auto_shorts/cli.hpp"
#include "auto_shorts/command_runner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#include <signal.h>
#include <unistd.h>

using namespace auto_shorts;

TEST(ShellQuoteTest, SafeArgumentsAreUnchanged) {
  EXPECT_EQ(shell_quote("ffmpeg"), "ffmpeg");
  EXPECT_EQ(shell_quote("-c:v"), "-c:v");
  EXPECT_EQ(shell_quote("/tmp/out_1.mp4"), "/tmp/out_1.mp4");
}

TEST(ShellQuoteTest, SpecialCharactersAreQuoted) {
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("my video.mp4"), "'my video.mp4'");
  EXPECT_EQ(shell_quote("[0:v]split=2[in0][in1]"), "'[0:v]split=2[in0][in1]'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(ShellQuoteTest, JoinCommand) {
  EXPECT_EQ(join_command({"echo", "a b", "c"}), "echo 'a b' c");
}

TEST(SystemCommandRunnerTest, ReportsExitCodes) {
  SystemCommandRunner runner;
  EXPECT_EQ(runner.run({"true"}), 0);
  EXPECT_EQ(runner.run({"false"}), 1);
  EXPECT_EQ(runner.run({"sh", "-c", "exit 3"}), 3);
}

TEST(SystemCommandRunnerTest, ArgumentsAreNotInterpreted) {
  SystemCommandRunner runner;
  /// Would succeed if `; true` reached the shell unquoted
  EXPECT_NE(runner.run({"test", "a", "=", "b; true"}), 0);
  EXPECT_EQ(runner.run({"test", "a b", "=", "a b"}), 0);
}

TEST(SystemCommandRunnerTest, EmptyCommandFails) {
  SystemCommandRunner runner;
  EXPECT_EQ(runner.run({}), -1);
}

TEST(SystemCommandRunnerTest, MissingProgramIs127) {
  SystemCommandRunner runner;
  EXPECT_EQ(runner.run({"auto_shorts_no_such_program_xyz"}), 127);
}

TEST(SystemCommandRunnerTest, SigintWhileChildRunsRaisesStopFlag) {
  install_stop_handlers();
  std::atomic<bool> &stop = stop_signal_flag();
  stop.store(false);

  SystemCommandRunner runner;
  int code = -1;
  std::thread worker([&]() { code = runner.run({"sleep", "1"}); });

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  int sent = kill(getpid(), SIGINT);
  worker.join();

  EXPECT_EQ(sent, 0);
  EXPECT_TRUE(stop.load());
  /// Only this process was signalled; the child ran to completion
  EXPECT_EQ(code, 0);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}
