#ifndef __IGV_ERRORS__
#define __IGV_ERRORS__

#include "Headers.hpp"

namespace igv {
/**
 * @brief Base class for every fault raised by the batch client.
 *
 * Text returned by the server is never turned into one of these; only
 * local validation, socket and process failures are.
 */
class IgvError : public std::runtime_error {
 public:
  explicit IgvError(const string& what) : std::runtime_error(what) {}
};

/** @brief A caller-supplied value cannot be encoded into a batch line. */
class InvalidArgument : public IgvError {
 public:
  explicit InvalidArgument(const string& what) : IgvError(what) {}
};

/** @brief A value outside a command's enumerated option set. */
class InvalidOption : public InvalidArgument {
 public:
  explicit InvalidOption(const string& what) : InvalidArgument(what) {}
};

/** @brief TCP connect, resolve or write failure. */
class ConnectionError : public IgvError {
 public:
  explicit ConnectionError(const string& what) : IgvError(what) {}
};

/** @brief A command was issued without a live connection. */
class NotConnected : public IgvError {
 public:
  explicit NotConnected(const string& what) : IgvError(what) {}
};

/** @brief The port preflight found the listen port already bound. */
class PortInUse : public IgvError {
 public:
  explicit PortInUse(int port)
      : IgvError("Port " + to_string(port) + " is already in use"),
        port(port) {}

  int getPort() const { return port; }

 protected:
  int port;
};

/** @brief The server process could not be started or never became ready. */
class LaunchError : public IgvError {
 public:
  explicit LaunchError(const string& what) : IgvError(what) {}
};
}  // namespace igv

#endif  // __IGV_ERRORS__
