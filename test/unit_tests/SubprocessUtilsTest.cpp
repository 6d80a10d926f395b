#include "SubprocessUtils.hpp"

#include "FrameCodec.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

using namespace fsn;

TEST_CASE("SubprocessUtils binds stdin and stdout to one socket",
          "[SubprocessUtils]") {
  // cat echoes whatever it reads, so a frame comes back unchanged
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  SubprocessUtils utils;
  int fd = -1;
  pid_t pid =
      utils.spawnWithDuplexStdio(socketHandler, "/bin/cat", {}, &fd);
  REQUIRE(pid > 0);
  REQUIRE(fd >= 0);
  REQUIRE(socketHandler->getActiveSockets() == vector<int>({fd}));

  FrameCodec codec(socketHandler);
  codec.writeFrame(fd, Frame(9, "echo me"));
  Frame frame;
  REQUIRE(codec.readFrame(fd, &frame));
  REQUIRE(frame == Frame(9, "echo me"));

  // Shutting the stream down makes cat see end-of-file and exit
  socketHandler->shutdownSocket(fd);
  int status = -1;
  REQUIRE(utils.reap(pid, 5000, &status));
  REQUIRE(WIFEXITED(status));
  REQUIRE(WEXITSTATUS(status) == 0);
  socketHandler->close(fd);
}

TEST_CASE("SubprocessUtils rejects a missing helper", "[SubprocessUtils]") {
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  SubprocessUtils utils;
  int fd = -1;
  REQUIRE_THROWS_AS(utils.spawnWithDuplexStdio(
                        socketHandler, "/nonexistent/helper", {}, &fd),
                    std::runtime_error);
  REQUIRE(fd == -1);
  REQUIRE(socketHandler->getActiveSockets().empty());
}

TEST_CASE("SubprocessUtils terminates a helper that keeps running",
          "[SubprocessUtils]") {
  shared_ptr<SocketHandler> socketHandler(new UnixSocketHandler());
  SubprocessUtils utils;
  int fd = -1;
  pid_t pid =
      utils.spawnWithDuplexStdio(socketHandler, "/bin/sleep", {"30"}, &fd);

  int status = -1;
  REQUIRE(!utils.reap(pid, 0, &status));
  status = utils.terminateAndReap(pid, 2000);
  REQUIRE(WIFSIGNALED(status));
  REQUIRE(WTERMSIG(status) == SIGTERM);
  REQUIRE(SubprocessUtils::describeStatus(status) == "signal 15");
  socketHandler->close(fd);
}

TEST_CASE("SubprocessUtils describes exit statuses", "[SubprocessUtils]") {
  REQUIRE(SubprocessUtils::describeStatus(0) == "exit code 0");
  REQUIRE(SubprocessUtils::describeStatus(3 << 8) == "exit code 3");
  REQUIRE(SubprocessUtils::describeStatus(-1) == "unknown status");
}
