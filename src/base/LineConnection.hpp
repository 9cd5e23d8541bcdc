#ifndef __IGV_LINE_CONNECTION__
#define __IGV_LINE_CONNECTION__

#include "Headers.hpp"
#include "IgvErrors.hpp"
#include "SocketHandler.hpp"

namespace igv {
/**
 * @brief Owns at most one socket to a batch server and exchanges one line of
 * request for one line of response over it.
 *
 * There is never more than one request in flight: sendAndReceive() blocks
 * until the response terminator arrives or the peer goes away.
 */
class LineConnection {
 public:
  explicit LineConnection(shared_ptr<SocketHandler> _socketHandler);

  virtual ~LineConnection();

  /**
   * @brief Closes any existing socket and opens a new one to the endpoint.
   * @param timeoutMs Connect timeout, 0 to block until the kernel gives up.
   * @throws ConnectionError on refusal, timeout or resolution failure.
   */
  void connect(const SocketEndpoint& endpoint, int timeoutMs);

  /**
   * @brief Writes `line` plus a line feed and reads back one line.
   * @return The response without its line feed, or std::nullopt when the
   * peer closed the stream before a full line arrived.
   * @throws NotConnected when no socket is open.
   * @throws ConnectionError when the write fails, or when the socket
   * handler's read timeout expires first. A timed out connection is closed.
   */
  virtual optional<string> sendAndReceive(const string& line);

  /** @brief Idempotent; never throws. */
  virtual void close();

  /** @brief True before the first connect and after close(). */
  virtual bool isClosed();

  /** @brief File descriptor of the currently connected socket or -1. */
  int getSocketFd() { return socketFd; }

 protected:
  /**
   * @brief Pulls bytes from the socket until the buffer holds a full line.
   */
  optional<string> readLine();

  shared_ptr<SocketHandler> socketHandler;
  /** @brief Active socket descriptor, -1 when no connection exists. */
  int socketFd;
  /** @brief Bytes received past the last returned line. */
  string readBuffer;
  recursive_mutex connectionMutex;
};
}  // namespace igv

#endif  // __IGV_LINE_CONNECTION__
