/**
 * @file command_runner.hpp
 * @brief Launching of external programs (ffmpeg, yt-dlp)
 *
 * @details The composer, the encoder and the acquisition step build an
 *          argument vector and hand it to a CommandRunner. The default
 *          runner starts the program with posix_spawnp() and waits for it,
 *          so no shell sees the arguments and the caller keeps its own
 *          SIGINT/SIGTERM handlers while the child runs. Tests substitute a
 *          runner that writes fixture files instead.
 */

#ifndef AUTO_SHORTS_COMMAND_RUNNER_HPP
#define AUTO_SHORTS_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

namespace auto_shorts {

/**
 * @class CommandRunner
 * @brief Runs one external command to completion.
 * @attention Implementations must be safe to call from several render
 *            workers at once.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run argv[0] with the remaining arguments.
   * @param argv Program followed by its arguments (not shell-interpreted)
   * @return Exit code of the program (0 = success, 128 + N when killed by
   *         signal N, -1 if it could not be started)
   */
  virtual int run(const std::vector<std::string> &argv) = 0;
};

/**
 * @class SystemCommandRunner
 * @brief CommandRunner backed by posix_spawnp() and waitpid().
 * @note A program that is not on PATH yields 127.
 */
class SystemCommandRunner : public CommandRunner {
public:
  int run(const std::vector<std::string> &argv) override;
};

/**
 * @brief Quote one argument for /bin/sh (single quotes, ' escaped).
 * @note Used to log command lines that can be pasted into a shell.
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Join argv into a shell command line, quoting where needed.
 */
std::string join_command(const std::vector<std::string> &argv);

} // namespace auto_shorts

#endif // AUTO_SHORTS_COMMAND_RUNNER_HPP
