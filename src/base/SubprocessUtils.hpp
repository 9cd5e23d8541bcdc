#ifndef __IGV_SUBPROCESS_UTILS__
#define __IGV_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace igv {
/**
 * @brief Utility class for executing subprocesses. Virtual so tests can
 * stand in for the system.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a shell command with stdout/stderr discarded.
   * @return The exit status, or -1 when the shell could not be run or the
   * command was killed by a signal.
   */
  virtual int SystemToExitCode(const string& command);

  /**
   * @brief Starts `command args...` without a shell as the leader of a new
   * process group, with stdout and stderr joined into one pipe.
   * @param outputFd Receives the read end of the output pipe.
   * @return The child pid. The child is not waited on.
   * @throws std::runtime_error when the pipe or fork fails.
   */
  virtual pid_t SpawnInNewProcessGroup(const string& command,
                                       const vector<string>& args,
                                       int* outputFd);
};
}  // namespace igv

#endif  // __IGV_SUBPROCESS_UTILS__
