#include "LineConnection.hpp"

namespace igv {
LineConnection::LineConnection(shared_ptr<SocketHandler> _socketHandler)
    : socketHandler(_socketHandler), socketFd(-1) {}

LineConnection::~LineConnection() { close(); }

void LineConnection::connect(const SocketEndpoint& endpoint, int timeoutMs) {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  close();
  VLOG(1) << "Connecting to " << endpoint;
  int fd = socketHandler->connect(endpoint, timeoutMs);
  if (fd == -1) {
    stringstream oss;
    oss << "Could not connect to " << endpoint;
    throw ConnectionError(oss.str());
  }
  socketFd = fd;
}

optional<string> LineConnection::sendAndReceive(const string& line) {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (socketFd == -1) {
    throw NotConnected("Not connected: call connect() first");
  }
  string payload = line + "\n";
  VLOG(2) << "Sending: " << line;
  socketHandler->writeAllOrThrow(socketFd, payload.data(), payload.size());
  auto response = readLine();
  if (response) {
    VLOG(2) << "Received: " << *response;
  } else {
    LOG(INFO) << "Server closed the stream without a response to: " << line;
  }
  return response;
}

optional<string> LineConnection::readLine() {
  char buf[4096];
  while (true) {
    auto newline = readBuffer.find('\n');
    if (newline != string::npos) {
      string line = readBuffer.substr(0, newline);
      readBuffer.erase(0, newline + 1);
      return line;
    }
    ssize_t bytesRead = socketHandler->read(socketFd, buf, sizeof(buf));
    if (bytesRead == 0) {
      // Peer closed before a full line arrived
      return nullopt;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        continue;
      }
      if (localErrno == ETIMEDOUT) {
        // A late response would be paired with the next request
        LOG(WARNING) << "No response on fd " << socketFd
                     << ", dropping the connection";
        close();
        throw ConnectionError("Timed out waiting for a response");
      }
      if (localErrno == ECONNRESET || localErrno == EPIPE) {
        VLOG(1) << "Connection reset while reading: " << strerror(localErrno);
        return nullopt;
      }
      throw ConnectionError(string("Failed to read response: ") +
                            strerror(localErrno));
    }
    readBuffer.append(buf, bytesRead);
  }
}

void LineConnection::close() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (socketFd == -1) {
    return;
  }
  VLOG(1) << "Closing batch connection on fd " << socketFd;
  socketHandler->close(socketFd);
  socketFd = -1;
  readBuffer.clear();
}

bool LineConnection::isClosed() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return socketFd == -1;
}
}  // namespace igv
