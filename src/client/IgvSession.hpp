#ifndef __IGV_SESSION__
#define __IGV_SESSION__

#include "BatchCommand.hpp"
#include "ClientConfig.hpp"
#include "Headers.hpp"
#include "IgvLauncher.hpp"
#include "LineConnection.hpp"
#include "SocketHandler.hpp"

namespace igv {
enum class SessionState { UNCONNECTED, CONNECTED, CLOSED };

/**
 * @brief Client-side handle for one visualization server.
 *
 * Each batch command is a method that validates its arguments, encodes one
 * line, sends it and returns the server's one-line reply untouched
 * (std::nullopt when the server hung up instead of replying). Calls block
 * until the reply arrives; a session is meant to be driven from one thread.
 *
 * The snapshot directory is a cache of the last value this session sent.
 * The server may change it behind our back (e.g. from its own UI) and there
 * is no command to read it back.
 */
class IgvSession {
 public:
  IgvSession(shared_ptr<SocketHandler> _socketHandler,
             const string& _host = "127.0.0.1", int _port = DEFAULT_BATCH_PORT,
             int _connectTimeoutMs = 0);

  /** @brief Closes the socket. A started server keeps running. */
  virtual ~IgvSession();

  /**
   * @brief Connects to an already running server and points its snapshot
   * directory at `config.snapshotDir` (or the working directory).
   */
  static shared_ptr<IgvSession> open(
      const ClientConfig& config, shared_ptr<SocketHandler> socketHandler);

  /**
   * @brief Runs `fn` against an open session; the socket is closed on
   * every exit path, including exceptions thrown by `fn`.
   */
  static void withSession(const ClientConfig& config,
                          shared_ptr<SocketHandler> socketHandler,
                          const std::function<void(IgvSession&)>& fn);

  /**
   * @brief Launches a fresh server, then opens a session to it. The session
   * remembers the server's process group so kill() can stop it.
   */
  static shared_ptr<IgvSession> start(const ClientConfig& config,
                                      shared_ptr<IgvLauncher> launcher,
                                      shared_ptr<SocketHandler> socketHandler);

  /** @brief (Re)connects to the configured host and port. */
  void connect();
  /** @brief Replaces the configured endpoint, then connects. */
  void connect(const string& _host, int _port, int _connectTimeoutMs = 0);
  /** @brief Idempotent. */
  void close();
  bool isClosed();
  SessionState state();

  /**
   * @brief Terminates the server's process group when this session started
   * it. Otherwise warns and does nothing.
   * @return true when a termination signal was sent.
   */
  bool kill();

  /**
   * @brief Sends any batch command. Used by every wrapper below and for
   * commands that have no wrapper.
   * @throws InvalidArgument before anything is sent or recorded.
   * @throws NotConnected when there is no open connection.
   * @throws ConnectionError when the write fails (the line is still
   * recorded in the history).
   */
  optional<string> send(const string& name,
                        const vector<CommandArg>& args = {});

  /** @brief Sends `set<name> args...`, e.g. set("SleepInterval", {200}). */
  optional<string> set(const string& name,
                       const vector<CommandArg>& args = {});

  optional<string> echo(const optional<string>& param = nullopt);

  optional<string> go(const string& locus);
  optional<string> go(const vector<string>& loci);
  optional<string> gotoLocus(const string& locus) { return go(locus); }
  optional<string> gotoLocus(const vector<string>& loci) { return go(loci); }

  optional<string> genome(const string& nameOrPath);
  optional<string> load(const string& pathOrUrlText,
                        const optional<string>& index = nullopt);
  optional<string> region(const string& chr, int64_t start, int64_t end,
                          const optional<string>& description = nullopt);
  optional<string> sort(const string& option = "base");
  optional<string> expand(const optional<string>& track = nullopt);
  optional<string> collapse(const optional<string>& track = nullopt);
  optional<string> squish(const optional<string>& track = nullopt);
  optional<string> viewAsPairs(const optional<string>& track = nullopt,
                               optional<bool> enable = nullopt);
  optional<string> clear();
  optional<string> newSession();
  /** @brief Asks the server to quit, then closes the socket. */
  optional<string> exit();
  optional<string> quit() { return exit(); }

  /**
   * @brief Points the server's snapshot directory at `dir`, creating it
   * locally first. Skipped when `dir` already is the cached directory,
   * unless `force` is set.
   * @return The server reply, or std::nullopt when nothing was sent.
   */
  optional<string> setSnapshotDir(const string& dir, bool force = false);
  const string& getSnapshotDir() const { return snapshotDir; }

  /**
   * @brief Saves an image. With a path outside the cached snapshot
   * directory, the server directory is switched for this one save and then
   * switched back.
   */
  optional<string> snapshot(const optional<string>& path = nullopt);
  optional<string> save(const optional<string>& path = nullopt) {
    return snapshot(path);
  }

  optional<string> preferences(const string& key, const string& value);
  optional<string> saveSession(const string& path);
  optional<string> setAltColor(const string& color,
                               const optional<string>& track = nullopt);
  optional<string> setColor(const string& color,
                            const optional<string>& track = nullopt);
  optional<string> setDataRange(const string& range,
                                const optional<string>& track = nullopt);
  optional<string> setLogScale(bool enable,
                               const optional<string>& track = nullopt);
  optional<string> setSequenceStrand(const string& strand);
  optional<string> setSequenceShowTranslation(bool enable);
  optional<string> setSleepInterval(int milliseconds);
  optional<string> setTrackHeight(int height,
                                  const optional<string>& track = nullopt);
  optional<string> maxPanelHeight(int height);
  optional<string> colorBy(const string& option,
                           const optional<string>& tag = nullopt);
  optional<string> group(const optional<string>& option = nullopt,
                         const optional<string>& tag = nullopt);
  optional<string> overlay(const vector<string>& tracks);
  optional<string> scrollToTop();
  optional<string> separate(const string& track);
  optional<string> setAccessToken(const string& token,
                                  const optional<string>& tokenHost = nullopt);
  optional<string> clearAccessTokens();

  const string& getHost() const { return host; }
  int getPort() const { return port; }
  /** @brief Every line handed to the socket, oldest first. */
  const vector<string>& getHistory() const { return history; }
  /** @brief Present only when this session started the server. */
  optional<pid_t> getProcessGroupId() const;

 protected:
  /** @throws NotConnected naming `what` when no socket is open. */
  void requireConnected(const string& what);

  shared_ptr<LineConnection> connection;
  string host;
  int port;
  int connectTimeoutMs;
  string snapshotDir;
  vector<string> history;
  bool everConnected;
  /** @brief Set when this session started its server. */
  shared_ptr<IgvLauncher> launcher;
  shared_ptr<ProcessRecord> process;
};
}  // namespace igv

#endif  // __IGV_SESSION__
