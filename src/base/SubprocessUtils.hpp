#ifndef __FSN_SUBPROCESS_UTILS__
#define __FSN_SUBPROCESS_UTILS__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace fsn {
/**
 * @brief Utility class for launching and reaping helper subprocesses.
 *
 * Virtual so tests can substitute process control.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` with its stdin and stdout bound to one end of a
   * socket pair created through `socketHandler`.
   * @param hostFd Receives the end that stays in this process.
   * @return The child pid.
   * @throws std::runtime_error when the command is not executable or fork
   * fails.
   */
  virtual pid_t spawnWithDuplexStdio(shared_ptr<SocketHandler> socketHandler,
                                     const string& command,
                                     const vector<string>& args, int* hostFd);

  /** @brief Sends SIGTERM, or SIGKILL when `force` is set. */
  virtual void terminate(pid_t pid, bool force);

  /**
   * @brief Waits up to `timeoutMs` for the child to exit.
   * @param exitStatus Receives the raw wait status when the child was reaped.
   * @return true if the child has been reaped.
   */
  virtual bool reap(pid_t pid, int timeoutMs, int* exitStatus);

  /** @brief Terminates, waits for the grace period, then kills and reaps. */
  int terminateAndReap(pid_t pid, int graceMs);

  /** @brief Formats a wait status for logs ("exit code 1", "signal 9"). */
  static string describeStatus(int status);
};
}  // namespace fsn

#endif  // __FSN_SUBPROCESS_UTILS__
