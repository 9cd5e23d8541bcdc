#ifndef __IGV_LAUNCHER__
#define __IGV_LAUNCHER__

#include "Headers.hpp"
#include "IgvErrors.hpp"
#include "SubprocessUtils.hpp"

namespace igv {
struct LaunchOptions {
  /** @brief Server executable, looked up on PATH. */
  string command = "igv";
  int port = DEFAULT_BATCH_PORT;
  /**
   * @brief Seconds to wait for the readiness line. 0 waits forever, which
   * is the default.
   */
  int readyTimeoutSeconds = 0;
};

/**
 * @brief A server started by IgvLauncher. The child is never reaped; this
 * record only remembers how to reach and signal it.
 */
class ProcessRecord {
 public:
  ProcessRecord(pid_t _pid, pid_t _processGroupId, int _outputFd,
                const string& pendingOutput);
  ~ProcessRecord();

  // Owns outputFd
  ProcessRecord(const ProcessRecord&) = delete;
  ProcessRecord& operator=(const ProcessRecord&) = delete;

  pid_t getPid() const { return pid; }
  pid_t getProcessGroupId() const { return processGroupId; }
  int getOutputFd() const { return outputFd; }

  /**
   * @brief Echoes whatever the child has written since the last call,
   * without blocking. Keeps the child from stalling on a full pipe.
   */
  void drainOutput();

  /** @brief Stops listening to the child's output. */
  void closeOutput();

 protected:
  /** @brief Echoes complete lines held in `partialLine`. */
  void echoCompleteLines();

  pid_t pid;
  pid_t processGroupId;
  /** @brief Read end of the child's combined stdout/stderr, -1 once closed. */
  int outputFd;
  string partialLine;
};

/**
 * @brief Starts a fresh visualization server and waits until it accepts
 * batch connections.
 */
class IgvLauncher {
 public:
  explicit IgvLauncher(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}
  virtual ~IgvLauncher() {}

  /**
   * @brief Checks the port with `lsof -i:<port>`.
   * @return true when bound, false when free, std::nullopt when the check
   * could not tell (e.g. lsof is not installed).
   */
  optional<bool> portInUse(int port);

  /**
   * @brief Spawns `command -p <port>` in its own process group and blocks
   * until its output contains "Listening on port <port>". Every output
   * line is echoed to the "stdout" logger.
   * @throws PortInUse when the preflight finds the port bound.
   * @throws LaunchError when the child cannot be spawned, its output ends
   * before the readiness line, or the optional timeout expires.
   */
  shared_ptr<ProcessRecord> start(const LaunchOptions& options);

  /**
   * @brief Sends SIGTERM to the whole process group of a started server.
   * @return false if the group no longer exists.
   */
  bool terminate(ProcessRecord& record);

  /** @brief Prefix of the line a server prints once its port is bound. */
  static const string READY_MESSAGE;

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace igv

#endif  // __IGV_LAUNCHER__
