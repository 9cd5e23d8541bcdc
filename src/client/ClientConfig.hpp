#ifndef __IGV_CLIENT_CONFIG__
#define __IGV_CLIENT_CONFIG__

#include "Headers.hpp"
#include "IgvErrors.hpp"

namespace igv {
/**
 * @brief Connection and launcher settings shared by the CLI and library
 * callers. Defaults match a server started with `igv -p 60151`.
 */
struct ClientConfig {
  string host = "127.0.0.1";
  int port = DEFAULT_BATCH_PORT;
  /** @brief 0 lets the kernel decide how long a connect may take. */
  int connectTimeoutMs = 0;
  /** @brief How long to wait for each response line, 0 forever. */
  int responseTimeoutMs = 0;
  string command = "igv";
  /** @brief Empty means the current working directory. */
  string snapshotDir;
  /** @brief 0 waits for the readiness line forever. */
  int readyTimeoutSeconds = 0;
  int verbose = 0;
};

/**
 * @brief Overlays values from an INI file onto `config`.
 *
 * Recognized keys:
 *   [Connection] host, port, connect_timeout_ms, response_timeout_ms
 *   [Launcher]   command, snapshot_dir, ready_timeout
 *   [Debug]      verbose
 *
 * @throws IgvError when the file cannot be read.
 * @throws InvalidArgument when a numeric key does not hold a valid number.
 */
void loadConfigFile(const string& filename, ClientConfig* config);

/** @throws InvalidArgument unless 0 < port <= 65535. */
void validatePort(int port);
}  // namespace igv

#endif  // __IGV_CLIENT_CONFIG__
