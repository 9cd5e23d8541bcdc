#include "IgvLauncher.hpp"

namespace igv {
const string IgvLauncher::READY_MESSAGE = "Listening on port ";

ProcessRecord::ProcessRecord(pid_t _pid, pid_t _processGroupId, int _outputFd,
                             const string& pendingOutput)
    : pid(_pid),
      processGroupId(_processGroupId),
      outputFd(_outputFd),
      partialLine(pendingOutput) {}

ProcessRecord::~ProcessRecord() { closeOutput(); }

void ProcessRecord::drainOutput() {
  if (outputFd == -1) {
    return;
  }
  char buf[4096];
  while (true) {
    pollfd pfd;
    pfd.fd = outputFd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, 0);
    if (rc == -1 && errno == EINTR) {
      continue;
    }
    if (rc <= 0) {
      break;
    }
    ssize_t bytesRead = ::read(outputFd, buf, sizeof(buf));
    if (bytesRead == -1 && errno == EINTR) {
      continue;
    }
    if (bytesRead <= 0) {
      // The child closed its output, most likely because it exited.
      VLOG(1) << "Server process " << pid << " closed its output";
      if (!partialLine.empty()) {
        CLOG(INFO, "stdout") << partialLine;
        partialLine.clear();
      }
      closeOutput();
      return;
    }
    partialLine.append(buf, bytesRead);
    echoCompleteLines();
  }
}

void ProcessRecord::echoCompleteLines() {
  size_t newline;
  while ((newline = partialLine.find('\n')) != string::npos) {
    CLOG(INFO, "stdout") << partialLine.substr(0, newline);
    partialLine.erase(0, newline + 1);
  }
}

void ProcessRecord::closeOutput() {
  if (outputFd == -1) {
    return;
  }
  ::close(outputFd);
  outputFd = -1;
}

optional<bool> IgvLauncher::portInUse(int port) {
  int rc = subprocessUtils->SystemToExitCode("lsof -i:" + to_string(port));
  switch (rc) {
    case 0:
      return true;
    case 1:
      return false;
    default:
      VLOG(1) << "lsof exited with " << rc;
      return nullopt;
  }
}

shared_ptr<ProcessRecord> IgvLauncher::start(const LaunchOptions& options) {
  if (options.port <= 0 || options.port > 65535) {
    throw InvalidArgument("Invalid port: " + to_string(options.port));
  }
  auto inUse = portInUse(options.port);
  if (!inUse) {
    LOG(WARNING) << "Cannot tell if port " << options.port << " is open";
    CLOG(INFO, "stdout") << "[igvclient] Cannot tell if port " << options.port
                         << " is open";
  } else if (*inUse) {
    throw PortInUse(options.port);
  } else {
    VLOG(1) << "Port " << options.port << " is available";
  }

  int outputFd = -1;
  pid_t pid;
  try {
    pid = subprocessUtils->SpawnInNewProcessGroup(
        options.command, {"-p", to_string(options.port)}, &outputFd);
  } catch (const std::runtime_error& err) {
    throw LaunchError("Could not start " + options.command + ": " +
                      err.what());
  }
  pid_t processGroupId = ::getpgid(pid);
  if (processGroupId == -1) {
    // The child made itself a group leader, so its pid is the group id.
    processGroupId = pid;
  }
  LOG(INFO) << "Started " << options.command << " as pid " << pid
            << " in process group " << processGroupId;

  const string readyLine = READY_MESSAGE + to_string(options.port);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::seconds(options.readyTimeoutSeconds);
  string buffer;
  char buf[4096];
  while (true) {
    size_t newline;
    while ((newline = buffer.find('\n')) != string::npos) {
      string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      CLOG(INFO, "stdout") << line;
      if (line.find(readyLine) != string::npos) {
        LOG(INFO) << options.command << " is ready on port " << options.port;
        return shared_ptr<ProcessRecord>(
            new ProcessRecord(pid, processGroupId, outputFd, buffer));
      }
    }

    if (options.readyTimeoutSeconds > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                           deadline - std::chrono::steady_clock::now())
                           .count();
      pollfd pfd;
      pfd.fd = outputFd;
      pfd.events = POLLIN;
      pfd.revents = 0;
      int rc = remaining > 0 ? ::poll(&pfd, 1, int(remaining)) : 0;
      if (rc == -1 && errno == EINTR) {
        continue;
      }
      if (rc == 0) {
        ProcessRecord abandoned(pid, processGroupId, outputFd, buffer);
        terminate(abandoned);
        throw LaunchError(options.command + " did not report '" + readyLine +
                          "' within " + to_string(options.readyTimeoutSeconds) +
                          " seconds");
      }
    }

    ssize_t bytesRead = ::read(outputFd, buf, sizeof(buf));
    if (bytesRead == -1 && errno == EINTR) {
      continue;
    }
    if (bytesRead <= 0) {
      auto localErrno = errno;
      if (!buffer.empty()) {
        CLOG(INFO, "stdout") << buffer;
      }
      bool sawReady = buffer.find(readyLine) != string::npos;
      if (sawReady) {
        // Ready line without a trailing newline, then the output closed
        return shared_ptr<ProcessRecord>(
            new ProcessRecord(pid, processGroupId, outputFd, ""));
      }
      ::close(outputFd);
      if (bytesRead < 0) {
        throw LaunchError("Error reading output of " + options.command + ": " +
                          strerror(localErrno));
      }
      throw LaunchError(options.command + " exited before listening on port " +
                        to_string(options.port));
    }
    buffer.append(buf, bytesRead);
  }
}

bool IgvLauncher::terminate(ProcessRecord& record) {
  pid_t processGroupId = record.getProcessGroupId();
  LOG(INFO) << "Sending SIGTERM to process group " << processGroupId;
  record.closeOutput();
  if (::kill(-processGroupId, SIGTERM) == -1) {
    LOG(WARNING) << "Could not signal process group " << processGroupId
                 << ": " << strerror(errno);
    return false;
  }
  return true;
}
}  // namespace igv
