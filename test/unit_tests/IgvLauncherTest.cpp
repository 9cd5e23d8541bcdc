#include "FakeIgvServer.hpp"
#include "FakeIgvSocketHandler.hpp"
#include "FakeSubprocessUtils.hpp"
#include "IgvLauncher.hpp"
#include "IgvSession.hpp"
#include "TestHeaders.hpp"

using namespace igv;

namespace {
const char* READY_VIEWER =
    "echo \"Starting fake viewer\"\n"
    "echo \"Listening on port $2\"\n"
    "exec sleep 30\n";
}  // namespace

TEST_CASE("IgvLauncher maps the port check result", "[IgvLauncher]") {
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  subprocessUtils->systemExitCode = 0;
  REQUIRE(launcher.portInUse(60151) == optional<bool>(true));
  subprocessUtils->systemExitCode = 1;
  REQUIRE(launcher.portInUse(60151) == optional<bool>(false));
  subprocessUtils->systemExitCode = 127;
  REQUIRE_FALSE(launcher.portInUse(60151).has_value());
  REQUIRE(subprocessUtils->systemCommands.back() == "lsof -i:60151");
}

TEST_CASE("IgvLauncher refuses a bound port", "[IgvLauncher]") {
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  subprocessUtils->systemExitCode = 0;
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.port = 60999;
  try {
    launcher.start(options);
    FAIL("Expected PortInUse");
  } catch (const PortInUse& err) {
    REQUIRE(err.getPort() == 60999);
  }
  REQUIRE(subprocessUtils->spawnedArgs.empty());
}

TEST_CASE("IgvLauncher rejects invalid ports", "[IgvLauncher]") {
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);
  LaunchOptions options;
  options.port = 0;
  REQUIRE_THROWS_AS(launcher.start(options), InvalidArgument);
  REQUIRE(subprocessUtils->systemCommands.empty());
}

TEST_CASE("IgvLauncher waits for the readiness line", "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_launch");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = writeFakeViewer(dir, READY_VIEWER);
  options.port = 61234;
  options.readyTimeoutSeconds = 10;
  auto record = launcher.start(options);

  REQUIRE(subprocessUtils->spawnedArgs.size() == 1);
  REQUIRE(subprocessUtils->spawnedArgs[0] == vector<string>({"-p", "61234"}));
  REQUIRE(record->getPid() > 0);
  REQUIRE(record->getProcessGroupId() == record->getPid());
  REQUIRE(record->getOutputFd() >= 0);

  REQUIRE(launcher.terminate(*record));
  REQUIRE(record->getOutputFd() == -1);
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WIFSIGNALED(statuses[0]));
  REQUIRE(WTERMSIG(statuses[0]) == SIGTERM);

  // The group is gone now
  REQUIRE_FALSE(launcher.terminate(*record));
  fs::remove_all(dir);
}

TEST_CASE("IgvLauncher proceeds when the port check is inconclusive",
          "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_launch_unknown");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  subprocessUtils->systemExitCode = 127;
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = writeFakeViewer(dir, READY_VIEWER);
  options.port = 61235;
  auto record = launcher.start(options);
  REQUIRE(launcher.terminate(*record));
  subprocessUtils->reapAll();
  fs::remove_all(dir);
}

TEST_CASE("IgvLauncher fails when the server exits early", "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_launch_exit");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = writeFakeViewer(dir,
                                    "echo \"Listening on port 1\"\n"
                                    "echo \"Could not bind\" >&2\n"
                                    "exit 3\n");
  options.port = 61236;
  REQUIRE_THROWS_AS(launcher.start(options), LaunchError);
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WIFEXITED(statuses[0]));
  REQUIRE(WEXITSTATUS(statuses[0]) == 3);
  fs::remove_all(dir);
}

TEST_CASE("IgvLauncher fails when the command does not exist",
          "[IgvLauncher]") {
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = "/nonexistent/igvclient/igv";
  REQUIRE_THROWS_AS(launcher.start(options), LaunchError);
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WEXITSTATUS(statuses[0]) == 127);
}

TEST_CASE("IgvLauncher gives up after the ready timeout", "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_launch_timeout");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = writeFakeViewer(dir, "exec sleep 30\n");
  options.port = 61237;
  options.readyTimeoutSeconds = 1;
  REQUIRE_THROWS_AS(launcher.start(options), LaunchError);
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WIFSIGNALED(statuses[0]));
  fs::remove_all(dir);
}

TEST_CASE("ProcessRecord cannot be copied", "[IgvLauncher]") {
  // A copy would close the output pipe twice
  STATIC_REQUIRE_FALSE(std::is_copy_constructible<ProcessRecord>::value);
  STATIC_REQUIRE_FALSE(std::is_copy_assignable<ProcessRecord>::value);
}

TEST_CASE("ProcessRecord drains output after the server exits",
          "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_launch_drain");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  IgvLauncher launcher(subprocessUtils);

  LaunchOptions options;
  options.command = writeFakeViewer(dir,
                                    "echo \"Listening on port $2\"\n"
                                    "echo \"Shutting down\"\n");
  options.port = 61238;
  auto record = launcher.start(options);
  subprocessUtils->reapAll();

  // Once the child is gone the pipe reaches EOF and gets closed
  record->drainOutput();
  record->drainOutput();
  REQUIRE(record->getOutputFd() == -1);
  fs::remove_all(dir);
}

TEST_CASE("IgvSession start launches and kills its server", "[IgvLauncher]") {
  FakeIgvServer server;
  string dir = makeTempDirectory("igvclient_start");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  auto launcher = make_shared<IgvLauncher>(subprocessUtils);

  ClientConfig config;
  config.command = writeFakeViewer(dir, READY_VIEWER);
  config.port = server.getPort();
  config.snapshotDir = dir;
  config.readyTimeoutSeconds = 10;

  auto session =
      IgvSession::start(config, launcher, make_shared<TcpSocketHandler>());
  REQUIRE(session->getProcessGroupId().has_value());
  REQUIRE(*session->echo("started") == "started");

  REQUIRE(session->kill());
  REQUIRE(session->isClosed());
  REQUIRE_FALSE(session->getProcessGroupId().has_value());
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WIFSIGNALED(statuses[0]));

  // A second kill has nothing left to stop
  REQUIRE_FALSE(session->kill());
  fs::remove_all(dir);
}

TEST_CASE("IgvSession start stops the server when it cannot connect",
          "[IgvLauncher]") {
  string dir = makeTempDirectory("igvclient_start_fail");
  auto subprocessUtils = make_shared<FakeSubprocessUtils>();
  auto launcher = make_shared<IgvLauncher>(subprocessUtils);
  auto handler = make_shared<FakeIgvSocketHandler>();
  handler->refuseConnections = true;

  ClientConfig config;
  config.command = writeFakeViewer(dir, READY_VIEWER);
  config.port = 61239;
  config.snapshotDir = dir;

  REQUIRE_THROWS_AS(IgvSession::start(config, launcher, handler),
                    ConnectionError);
  auto statuses = subprocessUtils->reapAll();
  REQUIRE(WIFSIGNALED(statuses[0]));
  fs::remove_all(dir);
}
