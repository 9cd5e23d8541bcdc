#include "TcpSocketHandler.hpp"

namespace igv {
TcpSocketHandler::TcpSocketHandler(int _readTimeoutMs)
    : UnixSocketHandler(_readTimeoutMs) {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint, int timeoutMs) {
  addrinfo *results = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;
  string portname = std::to_string(endpoint.getPort());
  string hostname = endpoint.getName();

  // (re)initialize the DNS system
  ::res_init();
  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(INFO) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  int sockFd = -1;
  for (addrinfo *p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectAddress(p, endpoint, timeoutMs);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(INFO) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  return sockFd;
}

int TcpSocketHandler::connectAddress(const addrinfo *address,
                                     const SocketEndpoint &endpoint,
                                     int timeoutMs) {
  int sockFd = ::socket(address->ai_family, address->ai_socktype | SOCK_CLOEXEC,
                        address->ai_protocol);
  if (sockFd == -1) {
    LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
    return -1;
  }

  // Non-blocking only for the connect phase so the timeout applies
  setBlocking(sockFd, false);
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1 &&
      errno != EINPROGRESS) {
    VLOG(1) << "Error connecting to " << endpoint << ": " << strerror(errno);
    ::close(sockFd);
    return -1;
  }

  int ready = waitForEvent(sockFd, POLLOUT, timeoutMs);
  if (ready <= 0) {
    if (ready == 0) {
      LOG(INFO) << "Timed out connecting to " << endpoint << " after "
                << timeoutMs << " ms";
    } else {
      LOG(INFO) << "Error waiting on connect to " << endpoint << ": "
                << strerror(errno);
    }
    ::close(sockFd);
    return -1;
  }

  int soError = 0;
  socklen_t len = sizeof soError;
  FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &soError, &len));
  if (soError != 0) {
    VLOG(1) << "Error connecting to " << endpoint << ": " << strerror(soError);
    ::close(sockFd);
    return -1;
  }

  setBlocking(sockFd, true);
  int flag = 1;
  if (setsockopt(sockFd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag,
                 sizeof(int)) == -1) {
    LOG(WARNING) << "Could not set TCP_NODELAY on fd " << sockFd << ": "
                 << strerror(errno);
  }
  return sockFd;
}
}  // namespace igv
