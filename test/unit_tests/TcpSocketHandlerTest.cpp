#include "FakeIgvServer.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace igv;

TEST_CASE("TcpSocketHandler tracks connected sockets", "[TcpSocketHandler]") {
  FakeIgvServer server;
  TcpSocketHandler handler;
  REQUIRE(handler.getActiveSockets().empty());

  int fd = handler.connect(SocketEndpoint("127.0.0.1", server.getPort()), 2000);
  REQUIRE(fd >= 0);
  REQUIRE(handler.getActiveSockets() == vector<int>({fd}));

  string request = "echo ping\n";
  handler.writeAllOrThrow(fd, request.c_str(), request.length());
  char buf[16];
  string reply;
  while (reply.find('\n') == string::npos) {
    ssize_t bytesRead = handler.read(fd, buf, sizeof(buf));
    REQUIRE(bytesRead > 0);
    reply.append(buf, bytesRead);
  }
  REQUIRE(reply == "ping\n");

  handler.close(fd);
  REQUIRE(handler.getActiveSockets().empty());
}

TEST_CASE("TcpSocketHandler connect returns -1 when refused",
          "[TcpSocketHandler]") {
  TcpSocketHandler handler;
  REQUIRE(handler.connect(SocketEndpoint("127.0.0.1", pickUnusedPort()), 0) ==
          -1);
  REQUIRE(handler.getActiveSockets().empty());
}

TEST_CASE("TcpSocketHandler read times out when nothing arrives",
          "[TcpSocketHandler]") {
  FakeIgvServer server({"hang"});
  TcpSocketHandler handler(100);
  REQUIRE(handler.getReadTimeoutMs() == 100);
  int fd = handler.connect(SocketEndpoint("127.0.0.1", server.getPort()), 2000);
  REQUIRE(fd >= 0);

  string request = "hang\n";
  handler.writeAllOrThrow(fd, request.c_str(), request.length());
  char buf[16];
  REQUIRE(handler.read(fd, buf, sizeof(buf)) == -1);
  REQUIRE(errno == ETIMEDOUT);

  handler.close(fd);
}

TEST_CASE("TcpSocketHandler refuses unknown descriptors",
          "[TcpSocketHandler]") {
  TcpSocketHandler handler;
  char buf[4];
  REQUIRE(handler.read(12345, buf, sizeof(buf)) == -1);
  REQUIRE(errno == EBADF);
  REQUIRE(handler.write(12345, "x", 1) == -1);
  REQUIRE(errno == EPIPE);
  REQUIRE_THROWS_AS(handler.writeAllOrThrow(12345, "x", 1), ConnectionError);
}
