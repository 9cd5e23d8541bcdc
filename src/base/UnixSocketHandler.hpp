#ifndef __IGV_UNIX_SOCKET_HANDLER__
#define __IGV_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace igv {
/**
 * @brief POSIX descriptor bookkeeping shared by the concrete handlers:
 * blocking reads bounded by an optional timeout, SIGPIPE-free writes and a
 * registry of the sockets this handler opened.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  /**
   * @param _readTimeoutMs How long read() waits for the first byte. 0
   * waits forever, matching a server that may take minutes to answer.
   */
  explicit UnixSocketHandler(int _readTimeoutMs = 0);
  virtual ~UnixSocketHandler();

  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

  int getReadTimeoutMs() const { return readTimeoutMs; }

 protected:
  /** @brief Starts tracking a freshly connected descriptor. */
  void addToActiveSockets(int fd);
  bool isActive(int fd);
  /**
   * @brief Waits until fd is readable or writable.
   * @return 1 when ready, 0 on timeout, -1 with errno set on error.
   */
  int waitForEvent(int fd, short events, int timeoutMs);
  void setBlocking(int fd, bool blocking);

  int readTimeoutMs;
  set<int> activeSockets;
  std::mutex activeSocketsMutex;
};
}  // namespace igv

#endif  // __IGV_UNIX_SOCKET_HANDLER__
