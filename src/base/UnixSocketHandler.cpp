#include "UnixSocketHandler.hpp"

namespace igv {
UnixSocketHandler::UnixSocketHandler(int _readTimeoutMs)
    : readTimeoutMs(_readTimeoutMs) {}

UnixSocketHandler::~UnixSocketHandler() {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  for (int fd : activeSockets) {
    VLOG(1) << "Closing leaked socket " << fd;
    ::close(fd);
  }
  activeSockets.clear();
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (!isActive(fd)) {
    LOG(INFO) << "Tried to read from a socket that is not open: " << fd;
    errno = EBADF;
    return -1;
  }
  if (readTimeoutMs > 0) {
    int rc = waitForEvent(fd, POLLIN, readTimeoutMs);
    if (rc == 0) {
      VLOG(1) << "No data on fd " << fd << " after " << readTimeoutMs << " ms";
      errno = ETIMEDOUT;
      return -1;
    }
    if (rc < 0) {
      return -1;
    }
  }
  ssize_t bytesRead;
  do {
    bytesRead = ::read(fd, buf, count);
  } while (bytesRead == -1 && errno == EINTR);
  if (bytesRead < 0) {
    auto localErrno = errno;
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(localErrno);
    errno = localErrno;
  }
  VLOG(4) << "Read " << bytesRead << " bytes from fd " << fd;
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  if (!isActive(fd)) {
    LOG(INFO) << "Tried to write to a socket that is not open: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Writing " << count << " bytes to fd " << fd;
  // The peer going away must surface as EPIPE, never as a SIGPIPE
  return ::send(fd, buf, count, MSG_NOSIGNAL);
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    STERROR << "Tried to close a socket that is not open: " << fd;
    return;
  }
  VLOG(1) << "Closing socket " << fd;
  activeSockets.erase(it);
  FATAL_FAIL(::close(fd));
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  return vector<int>(activeSockets.begin(), activeSockets.end());
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  if (!activeSockets.insert(fd).second) {
    STFATAL << "Tried to track a socket twice: " << fd;
  }
}

bool UnixSocketHandler::isActive(int fd) {
  lock_guard<std::mutex> guard(activeSocketsMutex);
  return activeSockets.find(fd) != activeSockets.end();
}

int UnixSocketHandler::waitForEvent(int fd, short events, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    int remaining = -1;
    if (timeoutMs > 0) {
      remaining = int(std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - std::chrono::steady_clock::now())
                          .count());
      if (remaining < 0) {
        remaining = 0;
      }
    }
    int rc = ::poll(&pfd, 1, remaining);
    if (rc == -1 && errno == EINTR) {
      continue;
    }
    return rc > 0 ? 1 : rc;
  }
}

void UnixSocketHandler::setBlocking(int fd, bool blocking) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  if (blocking) {
    opts &= (~O_NONBLOCK);
  } else {
    opts |= O_NONBLOCK;
  }
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}
}  // namespace igv
