#include "SubprocessUtils.hpp"

namespace igv {
int SubprocessUtils::SystemToExitCode(const string& command) {
  string quiet = command + " > /dev/null 2>&1";
  int status = ::system(quiet.c_str());
  if (status == -1) {
    LOG(WARNING) << "Could not run shell for: " << command << ": "
                 << strerror(errno);
    return -1;
  }
  if (!WIFEXITED(status)) {
    return -1;
  }
  return WEXITSTATUS(status);
}

pid_t SubprocessUtils::SpawnInNewProcessGroup(const string& command,
                                              const vector<string>& args,
                                              int* outputFd) {
  int link_client[2];
  if (pipe(link_client) == -1) {
    throw std::runtime_error(string("pipe: ") + strerror(errno));
  }

  // Build argv before forking so the child only calls async-signal-safe
  // functions.
  vector<char*> argsArray;
  argsArray.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    setpgid(0, 0);
    dup2(link_client[1], STDOUT_FILENO);
    dup2(link_client[1], STDERR_FILENO);
    ::close(link_client[0]);
    ::close(link_client[1]);

    execvp(command.c_str(), argsArray.data());

    dprintf(STDERR_FILENO, "Failed to execute %s: %s\n", command.c_str(),
            strerror(errno));
    _exit(127);
  } else if (pid > 0) {
    // parent process
    // Also set the group from this side so the pgid exists before we return
    if (setpgid(pid, pid) == -1 && errno != EACCES && errno != ESRCH) {
      LOG(WARNING) << "setpgid(" << pid << ") failed: " << strerror(errno);
    }
    ::close(link_client[1]);
    FATAL_FAIL(fcntl(link_client[0], F_SETFD, FD_CLOEXEC));
    *outputFd = link_client[0];
    VLOG(1) << "Spawned " << command << " as pid " << pid;
    return pid;
  } else {
    auto localErrno = errno;
    ::close(link_client[0]);
    ::close(link_client[1]);
    throw std::runtime_error(string("fork: ") + strerror(localErrno));
  }
}
}  // namespace igv
