#ifndef __IGV_SOCKET_HANDLER__
#define __IGV_SOCKET_HANDLER__

#include "Headers.hpp"
#include "IgvErrors.hpp"
#include "SocketEndpoint.hpp"

namespace igv {
/**
 * @brief Client-side socket operations used by the batch transport.
 *
 * Implementations own every descriptor they hand out through connect()
 * until close() is called on it. Tests substitute in-memory handlers.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   * @return Bytes read, 0 when the peer closed the stream, or -1 with errno
   * set. ETIMEDOUT means no byte arrived within the handler's read timeout.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes every byte of buf, retrying short writes.
   * @throws ConnectionError when the peer is gone or the write fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count);

  /**
   * @brief Opens a stream connection to the endpoint.
   * @param timeoutMs Upper bound on the connect phase, 0 to wait for the
   * kernel to decide.
   * @return File descriptor of the connected socket, or -1 on failure.
   */
  virtual int connect(const SocketEndpoint& endpoint, int timeoutMs) = 0;
  /** @brief Closes a descriptor previously returned by connect(). */
  virtual void close(int fd) = 0;
  /** @brief Descriptors returned by connect() and not yet closed. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace igv

#endif  // __IGV_SOCKET_HANDLER__
