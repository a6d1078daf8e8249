/**
 * @file command_runner.cpp
 * @brief posix_spawnp() based command execution
 */

#include "auto_shorts/command_runner.hpp"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <fmt/core.h>

#include "auto_shorts/logging.hpp"

extern char **environ;

namespace auto_shorts {

std::string shell_quote(const std::string &arg) {
  if (arg.empty())
    return "''";

  bool plain = true;
  for (char c : arg) {
    bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                c == '/' || c == ':' || c == '=' || c == '+' || c == ',';
    if (!safe) {
      plain = false;
      break;
    }
  }
  if (plain)
    return arg;

  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string cmd;
  cmd.reserve(256);
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      cmd += ' ';
    cmd += shell_quote(argv[i]);
  }
  return cmd;
}

int SystemCommandRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty())
    return -1;

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    args.push_back(const_cast<char *>(arg.c_str()));
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
  if (rc != 0) {
    if (rc == ENOENT) {
      LOG_ERROR("{} not found (is it installed and on PATH?)", argv[0]);
      return 127;
    }
    LOG_ERROR("Failed to start {}: {}", argv[0], std::strerror(rc));
    return -1;
  }

  /// A stop signal for this process interrupts the wait, not the child
  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited == -1 && errno == EINTR);

  if (waited == -1) {
    LOG_ERROR("Lost track of {}: {}", argv[0], std::strerror(errno));
    return -1;
  }
  if (WIFEXITED(status)) {
    int exit_code = WEXITSTATUS(status);
    /// glibc reports a program missing from PATH as exit code 127
    if (exit_code == 127)
      LOG_ERROR("{} not found (is it installed and on PATH?)", argv[0]);
    else if (exit_code != 0)
      LOG_ERROR("{} exited with error code: {}", argv[0], exit_code);
    if (exit_code != 0)
      LOG_WARN("Failed command: {}", join_command(argv));
    return exit_code;
  }
  if (WIFSIGNALED(status)) {
    LOG_ERROR("{} killed by signal {}", argv[0], WTERMSIG(status));
    LOG_WARN("Failed command: {}", join_command(argv));
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace auto_shorts
