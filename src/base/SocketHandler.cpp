#include "SocketHandler.hpp"

namespace igv {
void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count) {
  const char* data = (const char*)buf;
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesWritten = write(fd, data + pos, count - pos);
    if (bytesWritten > 0) {
      pos += bytesWritten;
      continue;
    }
    auto localErrno = errno;
    if (bytesWritten < 0 && localErrno == EINTR) {
      continue;
    }
    string reason = (bytesWritten == 0) ? string("peer accepted no bytes")
                                        : string(strerror(localErrno));
    LOG(WARNING) << "Write on fd " << fd << " stopped after " << pos << " of "
                 << count << " bytes: " << reason;
    throw ConnectionError("Failed to write to socket: " + reason);
  }
}
}  // namespace igv
