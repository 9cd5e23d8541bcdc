#include "IgvSession.hpp"

namespace igv {
IgvSession::IgvSession(shared_ptr<SocketHandler> _socketHandler,
                       const string& _host, int _port, int _connectTimeoutMs)
    : connection(new LineConnection(_socketHandler)),
      host(_host),
      port(_port),
      connectTimeoutMs(_connectTimeoutMs),
      everConnected(false) {
  validatePort(port);
}

IgvSession::~IgvSession() { close(); }

shared_ptr<IgvSession> IgvSession::open(
    const ClientConfig& config, shared_ptr<SocketHandler> socketHandler) {
  shared_ptr<IgvSession> session(new IgvSession(
      socketHandler, config.host, config.port, config.connectTimeoutMs));
  session->connect();
  string dir = config.snapshotDir.empty() ? fs::current_path().string()
                                          : config.snapshotDir;
  session->setSnapshotDir(dir);
  return session;
}

void IgvSession::withSession(const ClientConfig& config,
                             shared_ptr<SocketHandler> socketHandler,
                             const std::function<void(IgvSession&)>& fn) {
  auto session = open(config, socketHandler);
  try {
    fn(*session);
  } catch (...) {
    session->close();
    throw;
  }
  session->close();
}

shared_ptr<IgvSession> IgvSession::start(
    const ClientConfig& config, shared_ptr<IgvLauncher> launcher,
    shared_ptr<SocketHandler> socketHandler) {
  LaunchOptions launchOptions;
  launchOptions.command = config.command;
  launchOptions.port = config.port;
  launchOptions.readyTimeoutSeconds = config.readyTimeoutSeconds;
  auto record = launcher->start(launchOptions);

  shared_ptr<IgvSession> session;
  try {
    session = open(config, socketHandler);
  } catch (const IgvError& err) {
    LOG(ERROR) << "Started server but could not open a session: "
               << err.what();
    launcher->terminate(*record);
    throw;
  }
  session->launcher = launcher;
  session->process = record;
  return session;
}

void IgvSession::connect() {
  connection->connect(SocketEndpoint(host, port), connectTimeoutMs);
  everConnected = true;
}

void IgvSession::connect(const string& _host, int _port,
                         int _connectTimeoutMs) {
  validatePort(_port);
  host = _host;
  port = _port;
  connectTimeoutMs = _connectTimeoutMs;
  connect();
}

void IgvSession::close() { connection->close(); }

bool IgvSession::isClosed() { return connection->isClosed(); }

SessionState IgvSession::state() {
  if (!connection->isClosed()) {
    return SessionState::CONNECTED;
  }
  return everConnected ? SessionState::CLOSED : SessionState::UNCONNECTED;
}

bool IgvSession::kill() {
  if (!process) {
    LOG(WARNING) << "kill() called on a session that did not start its server";
    CLOG(INFO, "stdout")
        << "[igvclient] kill() only terminates a server started by this "
           "session. Use exit() or quit() instead.";
    return false;
  }
  CLOG(INFO, "stdout") << "[igvclient] Terminating process group "
                       << process->getProcessGroupId()
                       << ". Prefer exit() or quit() when possible.";
  bool signalled = launcher->terminate(*process);
  process.reset();
  launcher.reset();
  close();
  return signalled;
}

optional<pid_t> IgvSession::getProcessGroupId() const {
  if (!process) {
    return nullopt;
  }
  return process->getProcessGroupId();
}

optional<string> IgvSession::send(const string& name,
                                  const vector<CommandArg>& args) {
  string line = encodeCommand(name, args);
  requireConnected("send '" + line + "'");
  if (process) {
    process->drainOutput();
  }
  history.push_back(line);
  return connection->sendAndReceive(line);
}

void IgvSession::requireConnected(const string& what) {
  if (connection->isClosed()) {
    stringstream oss;
    oss << "Not connected to " << host << ":" << port << "; cannot " << what;
    throw NotConnected(oss.str());
  }
}

optional<string> IgvSession::set(const string& name,
                                 const vector<CommandArg>& args) {
  return send("set" + name, args);
}

optional<string> IgvSession::echo(const optional<string>& param) {
  return send("echo", {param});
}

optional<string> IgvSession::go(const string& locus) {
  return send("goto", {locus});
}

optional<string> IgvSession::go(const vector<string>& loci) {
  vector<CommandArg> args(loci.begin(), loci.end());
  return send("goto", args);
}

optional<string> IgvSession::genome(const string& nameOrPath) {
  return send("genome", {genomeArgument(nameOrPath)});
}

optional<string> IgvSession::load(const string& pathOrUrlText,
                                  const optional<string>& index) {
  CommandArg indexArg;
  if (index) {
    indexArg = CommandArg("index=" + *index);
  }
  return send("load", {pathOrUrl(pathOrUrlText), indexArg});
}

optional<string> IgvSession::region(const string& chr, int64_t start,
                                    int64_t end,
                                    const optional<string>& description) {
  return send("region", {chr, start, end, description});
}

optional<string> IgvSession::sort(const string& option) {
  validateSortOption(option);
  return send("sort", {option});
}

optional<string> IgvSession::expand(const optional<string>& track) {
  return send("expand", {track});
}

optional<string> IgvSession::collapse(const optional<string>& track) {
  return send("collapse", {track});
}

optional<string> IgvSession::squish(const optional<string>& track) {
  return send("squish", {track});
}

optional<string> IgvSession::viewAsPairs(const optional<string>& track,
                                         optional<bool> enable) {
  CommandArg enableArg;
  if (enable) {
    enableArg = CommandArg(*enable);
  }
  return send("viewaspairs", {track, enableArg});
}

optional<string> IgvSession::clear() { return send("clear"); }

optional<string> IgvSession::newSession() { return send("new"); }

optional<string> IgvSession::exit() {
  optional<string> response;
  try {
    response = send("exit");
  } catch (...) {
    // The server may already be gone; our end still has to go
    close();
    throw;
  }
  close();
  return response;
}

optional<string> IgvSession::setSnapshotDir(const string& dir, bool force) {
  string path = expandPath(dir);
  if (!force && path == snapshotDir) {
    VLOG(1) << "Snapshot directory already " << path;
    return nullopt;
  }
  // Leave the filesystem alone when the command cannot be delivered
  requireConnected("set the snapshot directory to " + path);
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw IgvError("Cannot create snapshot directory " + path + ": " +
                   ec.message());
  }
  auto response = send("snapshotDirectory", {path});
  snapshotDir = path;
  return response;
}

optional<string> IgvSession::snapshot(const optional<string>& path) {
  if (!path) {
    return send("snapshot");
  }
  fs::path target(*path);
  string filename = target.filename().string();
  if (filename.empty()) {
    throw InvalidArgument("Snapshot path has no file name: " + *path);
  }
  if (!target.has_parent_path()) {
    return send("snapshot", {filename});
  }
  string dir = expandPath(target.parent_path().string());
  if (dir == snapshotDir) {
    return send("snapshot", {filename});
  }

  string previous = snapshotDir;
  setSnapshotDir(dir);
  auto response = send("snapshot", {filename});
  if (!previous.empty()) {
    setSnapshotDir(previous);
  }
  return response;
}

optional<string> IgvSession::preferences(const string& key,
                                         const string& value) {
  return send("preference", {key, value});
}

optional<string> IgvSession::saveSession(const string& path) {
  return send("saveSession", {expandPath(path)});
}

optional<string> IgvSession::setAltColor(const string& color,
                                         const optional<string>& track) {
  return set("AltColor", {color, track});
}

optional<string> IgvSession::setColor(const string& color,
                                      const optional<string>& track) {
  return set("Color", {color, track});
}

optional<string> IgvSession::setDataRange(const string& range,
                                          const optional<string>& track) {
  return set("DataRange", {range, track});
}

optional<string> IgvSession::setLogScale(bool enable,
                                         const optional<string>& track) {
  return set("LogScale", {enable, track});
}

optional<string> IgvSession::setSequenceStrand(const string& strand) {
  validateStrand(strand);
  return set("SequenceStrand", {strand});
}

optional<string> IgvSession::setSequenceShowTranslation(bool enable) {
  return set("SequenceShowTranslation", {enable});
}

optional<string> IgvSession::setSleepInterval(int milliseconds) {
  return set("SleepInterval", {milliseconds});
}

optional<string> IgvSession::setTrackHeight(int height,
                                            const optional<string>& track) {
  return set("TrackHeight", {height, track});
}

optional<string> IgvSession::maxPanelHeight(int height) {
  return send("maxPanelHeight", {height});
}

optional<string> IgvSession::colorBy(const string& option,
                                     const optional<string>& tag) {
  return send("colorBy", {option, tag});
}

optional<string> IgvSession::group(const optional<string>& option,
                                   const optional<string>& tag) {
  return send("group", {option, tag});
}

optional<string> IgvSession::overlay(const vector<string>& tracks) {
  vector<CommandArg> args(tracks.begin(), tracks.end());
  return send("overlay", args);
}

optional<string> IgvSession::scrollToTop() { return send("scrollToTop"); }

optional<string> IgvSession::separate(const string& track) {
  return send("separate", {track});
}

optional<string> IgvSession::setAccessToken(
    const string& token, const optional<string>& tokenHost) {
  return set("AccessToken", {token, tokenHost});
}

optional<string> IgvSession::clearAccessTokens() {
  return send("clearAccessTokens");
}
}  // namespace igv
