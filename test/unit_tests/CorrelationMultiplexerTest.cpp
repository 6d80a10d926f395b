#include "CorrelationMultiplexer.hpp"

#include "FsNotifyErrors.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

using namespace fsn;

namespace {
// Records strings handed over by the read thread.
class Recorder {
 public:
  void record(const string& value) {
    {
      lock_guard<mutex> guard(recorderMutex);
      values.push_back(value);
    }
    recorderCv.notify_all();
  }

  bool waitFor(size_t count, std::chrono::milliseconds timeout) {
    unique_lock<mutex> lock(recorderMutex);
    return recorderCv.wait_for(lock, timeout,
                               [&] { return values.size() >= count; });
  }

  vector<string> get() {
    lock_guard<mutex> guard(recorderMutex);
    return values;
  }

 private:
  mutex recorderMutex;
  condition_variable recorderCv;
  vector<string> values;
};

// Lets a fixed number of bytes through on one descriptor, then behaves like
// a socket whose buffer never drains.
class StallingSocketHandler : public UnixSocketHandler {
 public:
  StallingSocketHandler() : stalledFd(-1), budget(0) {}

  void stallAfter(int fd, size_t bytes) {
    stalledFd = fd;
    budget = bytes;
  }

  virtual ssize_t write(int fd, const void* buf, size_t count) {
    if (fd != stalledFd) {
      return UnixSocketHandler::write(fd, buf, count);
    }
    if (budget == 0) {
      errno = EAGAIN;
      return -1;
    }
    ssize_t written =
        UnixSocketHandler::write(fd, buf, std::min<size_t>(count, budget));
    if (written > 0) {
      budget -= written;
    }
    return written;
  }

 private:
  std::atomic<int> stalledFd;
  std::atomic<size_t> budget;
};

class TestMultiplexer : public CorrelationMultiplexer {
 public:
  using CorrelationMultiplexer::CorrelationMultiplexer;

  void setIdCounter(uint64_t value) { idCounter = value; }
};

// A multiplexer on one end of a socket pair, with the test playing the
// helper on the other end.
class MultiplexerHarness {
 public:
  explicit MultiplexerHarness(
      std::chrono::milliseconds timeout =
          std::chrono::milliseconds(DEFAULT_COMMAND_TIMEOUT_MS),
      shared_ptr<SocketHandler> _socketHandler =
          make_shared<UnixSocketHandler>())
      : socketHandler(_socketHandler), peerCodec(socketHandler) {
    pair<int, int> fds = socketHandler->createPair();
    hostFd = fds.first;
    peerFd = fds.second;
    multiplexer.reset(new TestMultiplexer(
        socketHandler, hostFd,
        [this](const string& payload) {
          if (broadcastHook) {
            broadcastHook(payload);
          }
          broadcasts.record(payload);
        },
        [this](const string& reason) { disconnects.record(reason); },
        timeout));
    multiplexer->start();
  }

  ~MultiplexerHarness() {
    multiplexer->shutdown();
    if (peerThread.joinable()) {
      peerThread.join();
    }
    multiplexer.reset();
    socketHandler->close(hostFd);
    if (peerFd != -1) {
      socketHandler->close(peerFd);
    }
  }

  /** @brief Reads the next command the multiplexer sent. */
  bool readCommand(Frame* frame) {
    try {
      return peerCodec.readFrame(peerFd, frame);
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Peer read ended: " << re.what();
      return false;
    }
  }

  void send(uint64_t id, const string& payload) {
    peerCodec.writeFrame(peerFd, Frame(id, payload));
  }

  void sendRaw(const string& bytes) {
    socketHandler->writeAllOrThrow(peerFd, bytes.data(), bytes.length(),
                                   false);
  }

  void closePeer() {
    socketHandler->close(peerFd);
    peerFd = -1;
  }

  shared_ptr<SocketHandler> socketHandler;
  FrameCodec peerCodec;
  int hostFd;
  int peerFd;
  shared_ptr<TestMultiplexer> multiplexer;
  std::function<void(const string&)> broadcastHook;
  Recorder broadcasts;
  Recorder disconnects;
  std::thread peerThread;
};

const std::chrono::milliseconds WAIT(5000);
}  // namespace

TEST_CASE("Replies reach the caller that sent the command",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  const int numCallers = 8;

  // Answer in reverse arrival order so replies never line up with sends
  harness.peerThread = std::thread([&harness, numCallers]() {
    vector<Frame> commands;
    Frame frame;
    while (int(commands.size()) < numCallers && harness.readCommand(&frame)) {
      commands.push_back(frame);
    }
    for (auto it = commands.rbegin(); it != commands.rend(); ++it) {
      harness.send(it->getCorrelationId(), "reply-" + it->getPayload());
    }
  });

  vector<CommandResponse> responses(numCallers);
  vector<std::thread> callers;
  for (int i = 0; i < numCallers; i++) {
    callers.emplace_back([&harness, &responses, i]() {
      responses[i] = harness.multiplexer->call("cmd-" + to_string(i));
    });
  }
  for (auto& it : callers) {
    it.join();
  }

  for (int i = 0; i < numCallers; i++) {
    REQUIRE(responses[i].status == CommandResponse::RESOLVED);
    REQUIRE(responses[i].payload == "reply-cmd-" + to_string(i));
  }
  REQUIRE(harness.multiplexer->numPending() == 0);
}

TEST_CASE("Id 0 frames go to the broadcast handler",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  harness.send(0, "{\"Name\":\"/a\",\"Op\":1}");
  harness.send(0, "{\"Err\":\"overflow\"}");

  REQUIRE(harness.broadcasts.waitFor(2, WAIT));
  vector<string> received = harness.broadcasts.get();
  REQUIRE(received[0] == "{\"Name\":\"/a\",\"Op\":1}");
  REQUIRE(received[1] == "{\"Err\":\"overflow\"}");
  REQUIRE(harness.multiplexer->isConnected());
}

TEST_CASE("Command ids are nonzero and unique", "[CorrelationMultiplexer]") {
  MultiplexerHarness harness(std::chrono::milliseconds(10));
  harness.multiplexer->setIdCounter(UINT64_MAX - 1);

  uint64_t last = harness.multiplexer->send("a");
  uint64_t wrapped = harness.multiplexer->send("b");
  REQUIRE(last == UINT64_MAX);
  REQUIRE(wrapped == 1);
  harness.multiplexer->await(last);
  harness.multiplexer->await(wrapped);

  Frame frame;
  REQUIRE(harness.readCommand(&frame));
  REQUIRE(frame.getCorrelationId() == UINT64_MAX);
  REQUIRE(frame.getPayload() == "a");
  REQUIRE(harness.readCommand(&frame));
  REQUIRE(frame.getCorrelationId() == 1);
}

TEST_CASE("A reply after the timeout is discarded",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness(std::chrono::milliseconds(100));

  auto start = std::chrono::steady_clock::now();
  CommandResponse response = harness.multiplexer->call("slow");
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(response.status == CommandResponse::TIMED_OUT);
  REQUIRE(elapsed >= std::chrono::milliseconds(100));
  REQUIRE(harness.multiplexer->numPending() == 0);

  Frame slow;
  REQUIRE(harness.readCommand(&slow));
  REQUIRE(slow.getPayload() == "slow");

  harness.peerThread = std::thread([&harness, slow]() {
    Frame fast;
    if (harness.readCommand(&fast)) {
      // The late reply arrives first and must not resolve "fast"
      harness.send(slow.getCorrelationId(), "late");
      harness.send(fast.getCorrelationId(), "on time");
    }
  });
  response = harness.multiplexer->call("fast");
  REQUIRE(response.status == CommandResponse::RESOLVED);
  REQUIRE(response.payload == "on time");
  REQUIRE(harness.multiplexer->isConnected());
}

TEST_CASE("Replies for unknown ids are dropped", "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  harness.peerThread = std::thread([&harness]() {
    Frame frame;
    if (harness.readCommand(&frame)) {
      harness.send(frame.getCorrelationId() + 1000, "stray");
      harness.send(frame.getCorrelationId(), "mine");
    }
  });

  CommandResponse response = harness.multiplexer->call("cmd");
  REQUIRE(response.status == CommandResponse::RESOLVED);
  REQUIRE(response.payload == "mine");
  REQUIRE(harness.broadcasts.get().empty());
}

TEST_CASE("Losing the helper fails pending commands",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  harness.peerThread = std::thread([&harness]() {
    Frame frame;
    if (harness.readCommand(&frame)) {
      harness.closePeer();
    }
  });

  CommandResponse response = harness.multiplexer->call("never answered");
  REQUIRE(response.status == CommandResponse::CONNECTION_LOST);
  REQUIRE(harness.disconnects.waitFor(1, WAIT));
  REQUIRE(!harness.multiplexer->isConnected());

  // Later commands fail without waiting for the timeout
  auto start = std::chrono::steady_clock::now();
  response = harness.multiplexer->call("too late");
  REQUIRE(response.status == CommandResponse::CONNECTION_LOST);
  REQUIRE(std::chrono::steady_clock::now() - start <
          std::chrono::milliseconds(DEFAULT_COMMAND_TIMEOUT_MS));
  REQUIRE(harness.disconnects.get().size() == 1);
}

TEST_CASE("Malformed frames end the read loop", "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;

  SECTION("Length shorter than an id") {
    harness.sendRaw(string("\x00\x02xy", 4));
    REQUIRE(harness.disconnects.waitFor(1, WAIT));
    REQUIRE(harness.disconnects.get()[0].find("framing error") == 0);
  }

  SECTION("Stream ends inside a frame") {
    string bytes = FrameCodec::encode(5, "truncated");
    harness.sendRaw(bytes.substr(0, 6));
    harness.closePeer();
    REQUIRE(harness.disconnects.waitFor(1, WAIT));
    REQUIRE(harness.disconnects.get()[0].find("framing error") == 0);
  }

  REQUIRE(!harness.multiplexer->isConnected());
}

TEST_CASE("A protocol error from the broadcast handler ends the read loop",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  harness.broadcastHook = [](const string& payload) {
    throw ProtocolError("cannot decode " + payload);
  };
  harness.send(0, "garbage");

  REQUIRE(harness.disconnects.waitFor(1, WAIT));
  REQUIRE(harness.disconnects.get()[0].find("protocol error") == 0);
}

TEST_CASE("Shutdown wakes the read loop", "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  uint64_t id = harness.multiplexer->send("pending");

  harness.multiplexer->shutdown();
  REQUIRE(harness.disconnects.get().size() == 1);
  REQUIRE(harness.multiplexer->await(id).status ==
          CommandResponse::CONNECTION_LOST);

  // A second shutdown is a no-op
  harness.multiplexer->shutdown();
  REQUIRE(harness.disconnects.get().size() == 1);
}

TEST_CASE("Commands too large for a frame are rejected",
          "[CorrelationMultiplexer]") {
  MultiplexerHarness harness;
  REQUIRE_THROWS_AS(
      harness.multiplexer->send(string(Frame::MAX_PAYLOAD_SIZE + 1, 'x')),
      FramingError);
  REQUIRE(harness.multiplexer->numPending() == 0);
}

TEST_CASE("A helper that stops reading cannot hold commands past their deadline",
          "[CorrelationMultiplexer]") {
  const std::chrono::milliseconds timeout(100);
  MultiplexerHarness harness(timeout);
  // Nothing reads the peer end, so the socket buffer fills after a few
  // commands
  const string command = "add_watch /" + string(60000, 'p');

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 20; i++) {
    auto callStart = std::chrono::steady_clock::now();
    CommandResponse response = harness.multiplexer->call(command);
    auto elapsed = std::chrono::steady_clock::now() - callStart;
    INFO("call " << i);
    REQUIRE(response.status != CommandResponse::RESOLVED);
    REQUIRE(elapsed < timeout + std::chrono::milliseconds(500));
  }
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  REQUIRE(harness.multiplexer->numPending() == 0);
}

TEST_CASE("A frame cut off by a stalled write drops the connection",
          "[CorrelationMultiplexer]") {
  auto socketHandler = make_shared<StallingSocketHandler>();
  MultiplexerHarness harness(std::chrono::milliseconds(100), socketHandler);
  const string first = "add_watch /a";
  const size_t firstFrameSize = FrameCodec::encode(1, first).length();

  // The first frame fits, the second is cut off after its length prefix and
  // part of its id
  socketHandler->stallAfter(harness.hostFd, firstFrameSize + 6);
  REQUIRE(harness.multiplexer->call(first).status ==
          CommandResponse::TIMED_OUT);
  REQUIRE(harness.multiplexer->isConnected());

  auto start = std::chrono::steady_clock::now();
  CommandResponse response = harness.multiplexer->call("add_watch /b");
  REQUIRE(response.status == CommandResponse::CONNECTION_LOST);
  REQUIRE(response.payload.find("stalled after 6 bytes") != string::npos);
  REQUIRE(std::chrono::steady_clock::now() - start <
          std::chrono::milliseconds(600));

  REQUIRE(harness.disconnects.waitFor(1, WAIT));
  REQUIRE(harness.disconnects.get()[0].find("stalled") != string::npos);
  REQUIRE(!harness.multiplexer->isConnected());
  REQUIRE(harness.multiplexer->call("add_watch /c").status ==
          CommandResponse::CONNECTION_LOST);

  // Only the intact first frame reached the helper
  Frame frame;
  REQUIRE(harness.readCommand(&frame));
  REQUIRE(frame.getPayload() == first);
  REQUIRE(!harness.readCommand(&frame));
}

TEST_CASE("A command that never reaches the socket only times out",
          "[CorrelationMultiplexer]") {
  auto socketHandler = make_shared<StallingSocketHandler>();
  MultiplexerHarness harness(std::chrono::milliseconds(100), socketHandler);
  socketHandler->stallAfter(harness.hostFd, 0);

  REQUIRE(harness.multiplexer->call("add_watch /a").status ==
          CommandResponse::TIMED_OUT);
  REQUIRE(harness.multiplexer->isConnected());
  REQUIRE(harness.disconnects.get().empty());

  // Once the stream drains again commands go through
  socketHandler->stallAfter(-1, 0);
  harness.peerThread = std::thread([&harness]() {
    Frame frame;
    if (harness.readCommand(&frame)) {
      harness.send(frame.getCorrelationId(), "ok");
    }
  });
  CommandResponse response = harness.multiplexer->call("add_watch /b");
  REQUIRE(response.status == CommandResponse::RESOLVED);
  REQUIRE(response.payload == "ok");
}
