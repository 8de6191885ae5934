#ifndef __CPA_PSEUDO_TERMINAL_LAUNCHER__
#define __CPA_PSEUDO_TERMINAL_LAUNCHER__

#include "Headers.hpp"

namespace cpa {
/**
 * @brief Raised when the pty cannot be allocated or the command cannot be
 * spawned. Nothing from the failed attempt is left running or open.
 */
class StartFailure : public std::runtime_error {
 public:
  explicit StartFailure(const string& what) : std::runtime_error(what) {}
};

/** @brief What to run and where. */
struct LaunchRequest {
  string command;
  vector<string> args;
  string workingDirectory;
  unsigned short rows = 40;
  unsigned short cols = 200;
};

/** @brief Master side of the pty and the pid of the child attached to it. */
struct LaunchedChild {
  int masterFd;
  pid_t pid;
};

/**
 * @brief Forks a pseudo-terminal and execs a command on its slave end.
 *
 * The child gets the slave as stdin/stdout/stderr and its own session.
 * `launch` only returns once the exec has actually happened: exec failures
 * (missing binary, bad working directory) are reported back over a
 * close-on-exec status pipe and surface as a `StartFailure`.
 */
class PseudoTerminalLauncher {
 public:
  virtual ~PseudoTerminalLauncher() {}

  /**
   * @brief Starts the command on a new pty.
   * @throws StartFailure with a human readable cause.
   */
  virtual LaunchedChild launch(const LaunchRequest& request);

 protected:
  /** @brief Runs in the forked child, never returns. */
  [[noreturn]] void runChild(const vector<char*>& argv,
                             const string& workingDirectory, int statusFd);
};
}  // namespace cpa

#endif  // __CPA_PSEUDO_TERMINAL_LAUNCHER__
