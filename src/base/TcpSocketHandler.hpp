#ifndef __IGV_TCP_SOCKET_HANDLER__
#define __IGV_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace igv {
/**
 * @brief Connects to an IPv4/IPv6 batch port on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int _readTimeoutMs = 0);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and tries each address in turn with a
   * non-blocking connect bounded by timeoutMs. The connected socket is
   * switched back to blocking mode with TCP_NODELAY set.
   */
  virtual int connect(const SocketEndpoint& endpoint, int timeoutMs);

 protected:
  /** @brief Connects one resolved address, returning the fd or -1. */
  int connectAddress(const addrinfo* address, const SocketEndpoint& endpoint,
                     int timeoutMs);
};
}  // namespace igv

#endif  // __IGV_TCP_SOCKET_HANDLER__
