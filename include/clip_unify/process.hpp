/**
 * @file process.hpp
 * @brief Scoped execution of the external engine (ffmpeg / ffprobe)
 *
 * @details Every engine call is one blocking subprocess. The outcome is
 *          returned as a value so callers decide between soft failure and
 *          abort with ordinary control flow:
 *
 *          - exit_code: child exit status, 128+N when killed by signal N,
 *            127 when the binary could not be executed
 *
 *          - output: everything the child wrote to stdout
 *
 *          - diagnostics: everything the child wrote to stderr
 *
 * @note The child is always reaped before run() returns.
 */

#ifndef CLIP_UNIFY_PROCESS_HPP
#define CLIP_UNIFY_PROCESS_HPP

#include <string>
#include <vector>

namespace clip_unify {

/**
 * @struct ProcessOutcome
 * @brief Result of one subprocess invocation.
 */
struct ProcessOutcome {
  bool spawned = false;    //< false if fork/pipe setup failed
  int exit_code = -1;      //< Exit status (valid when spawned)
  std::string output;      //< Captured stdout
  std::string diagnostics; //< Captured stderr, or the spawn error

  bool ok() const { return spawned && exit_code == 0; }

  /// Last non-empty line of diagnostics, for one-line failure notices
  std::string last_diagnostic_line() const;
};

/**
 * @class CommandRunner
 * @brief Runs an argv vector to completion.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Execute argv[0] with the given arguments and wait for it.
   * @param argv Program followed by its arguments (no shell involved)
   */
  virtual ProcessOutcome run(const std::vector<std::string> &argv) = 0;
};

/**
 * @class SubprocessRunner
 * @brief fork/execvp based runner with stdout and stderr capture.
 * @note Stateless; safe to share across normalization workers.
 */
class SubprocessRunner : public CommandRunner {
public:
  ProcessOutcome run(const std::vector<std::string> &argv) override;
};

/**
 * @brief Render argv as a shell-like string for log lines.
 */
std::string format_command(const std::vector<std::string> &argv);

} // namespace clip_unify

#endif // CLIP_UNIFY_PROCESS_HPP
