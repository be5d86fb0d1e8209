#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include "fpss_modbus/client/modbus_client.hpp"
#include "fpss_modbus/transport/socket_transport.hpp"

using fpssmb::ClientOptions;
using fpssmb::ConnectionState;
using fpssmb::ErrorKind;
using fpssmb::FramingMode;
using fpssmb::ModbusClient;
using fpssmb::ReadResult;
using fpssmb::SocketTransport;
using fpssmb::SocketTransportOptions;

namespace {

size_t CountOpenFds() {
  return static_cast<size_t>(std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                                           std::filesystem::directory_iterator{}));
}

// Loopback listener that answers one request with a canned reply
class OneShotServer {
 public:
  OneShotServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)), 0);
    EXPECT_EQ(::listen(listen_fd_, 8), 0);
    socklen_t len = sizeof(addr);
    EXPECT_EQ(::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len), 0);
    port_ = ntohs(addr.sin_port);
  }

  ~OneShotServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(listen_fd_);
  }

  OneShotServer(const OneShotServer &) = delete;
  OneShotServer &operator=(const OneShotServer &) = delete;

  void Serve(size_t request_size, std::vector<uint8_t> reply) {
    thread_ = std::thread([this, request_size, reply = std::move(reply)]() {
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }
      std::vector<uint8_t> buffer(request_size);
      size_t got = 0;
      while (got < request_size) {
        ssize_t n = ::recv(fd, buffer.data() + got, request_size - got, 0);
        if (n <= 0) {
          break;
        }
        got += static_cast<size_t>(n);
      }
      buffer.resize(got);
      request_ = buffer;
      if (!reply.empty()) {
        EXPECT_EQ(::send(fd, reply.data(), reply.size(), 0), static_cast<ssize_t>(reply.size()));
      }
      ::close(fd);
    });
  }

  // Reads the request, never answers, and hangs up once the client does
  void ServeSilently(size_t request_size) {
    thread_ = std::thread([this, request_size]() {
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }
      std::vector<uint8_t> buffer(256);
      size_t got = 0;
      while (true) {
        ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (n <= 0) {
          break;
        }
        got += static_cast<size_t>(n);
      }
      EXPECT_GE(got, request_size);
      ::close(fd);
    });
  }

  void Join() { thread_.join(); }

  [[nodiscard]] uint16_t GetPort() const { return port_; }
  [[nodiscard]] const std::vector<uint8_t> &GetRequest() const { return request_; }

 private:
  int listen_fd_{-1};
  uint16_t port_{0};
  std::thread thread_;
  std::vector<uint8_t> request_;
};

}  // namespace

TEST(SocketTransport, ReadOverLoopback) {
  OneShotServer server;
  server.Serve(12, {0x00, 0x00, 0x00, 0x00, 0x00, 0x07, 0x01, 0x03, 0x04, 0x12, 0x34, 0x56, 0x78});

  ClientOptions options;
  options.framing = FramingMode::kTcp;
  ModbusClient client(std::make_unique<SocketTransport>(SocketTransportOptions{.receive_timeout_ms = 5000}),
                      options);

  std::vector<ConnectionState> states;
  client.Connect("127.0.0.1", server.GetPort(), [&states](ConnectionState state) { states.push_back(state); });
  ASSERT_EQ(states, (std::vector<ConnectionState>{ConnectionState::kPreparing, ConnectionState::kReady}));

  std::optional<ReadResult> result;
  client.ReadHoldingRegisters(1, 0x0020, 2, [&result](ReadResult r) { result = std::move(r); });
  server.Join();

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->HasValue());
  EXPECT_EQ(result->Value(), (std::vector<uint16_t>{0x1234, 0x5678}));
  EXPECT_EQ(server.GetRequest(),
            (std::vector<uint8_t>{0x00, 0x00, 0x00, 0x00, 0x00, 0x06, 0x01, 0x03, 0x00, 0x20, 0x00, 0x02}));

  client.Close();
  EXPECT_EQ(states.back(), ConnectionState::kCancelled);
}

TEST(SocketTransport, PeerClosingWithoutReplyIsTransportError) {
  OneShotServer server;
  server.Serve(8, {});

  ClientOptions options;
  options.framing = FramingMode::kRtuOverTcp;
  ModbusClient client(std::make_unique<SocketTransport>(SocketTransportOptions{.receive_timeout_ms = 5000}),
                      options);
  client.Connect("127.0.0.1", server.GetPort(), nullptr);
  ASSERT_TRUE(client.IsConnected());

  std::optional<ReadResult> result;
  client.ReadHoldingRegisters(0, 1, [&result](ReadResult r) { result = std::move(r); });
  server.Join();

  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->HasValue());
  EXPECT_EQ(result->Error().kind, ErrorKind::kTransport);
}

TEST(SocketTransport, UnresolvableHostFails) {
  SocketTransport transport;
  std::vector<ConnectionState> states;
  transport.Connect("host.invalid", 502, [&states](ConnectionState state) { states.push_back(state); });

  EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::kPreparing, ConnectionState::kFailed}));
  EXPECT_FALSE(transport.IsOpen());

  std::vector<uint8_t> data{0x01};
  EXPECT_FALSE(transport.Send(data));
}

TEST(SocketTransport, ReceiveTimeoutIsTransportErrorAndClientStaysUsable) {
  OneShotServer server;
  server.ServeSilently(12);

  ClientOptions options;
  options.framing = FramingMode::kTcp;
  ModbusClient client(std::make_unique<SocketTransport>(SocketTransportOptions{.receive_timeout_ms = 200}), options);
  client.Connect("127.0.0.1", server.GetPort(), nullptr);
  ASSERT_TRUE(client.IsConnected());

  // The second exchange shows the first one left nothing outstanding
  for (int attempt = 0; attempt < 2; ++attempt) {
    std::optional<ReadResult> result;
    const auto started = std::chrono::steady_clock::now();
    client.ReadHoldingRegisters(1, 0x0000, 1, [&result](ReadResult r) { result = std::move(r); });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->HasValue());
    EXPECT_EQ(result->Error().kind, ErrorKind::kTransport);
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_FALSE(client.IsBusy());
    EXPECT_TRUE(client.IsConnected());
  }

  client.Close();
  server.Join();
}

TEST(SocketTransport, ReconnectReleasesPreviousSocket) {
  OneShotServer server;  // Connections wait in the listen backlog
  const size_t baseline = CountOpenFds();

  std::vector<ConnectionState> states;
  SocketTransport transport;
  for (int i = 0; i < 4; ++i) {
    transport.Connect("127.0.0.1", server.GetPort(), [&states](ConnectionState state) { states.push_back(state); });
    ASSERT_TRUE(transport.IsOpen());
    EXPECT_EQ(CountOpenFds(), baseline + 1);
  }
  EXPECT_EQ(states.size(), 8u);  // preparing, ready per connect; the dropped ones are not reported

  transport.Close();
  EXPECT_EQ(CountOpenFds(), baseline);
  EXPECT_EQ(states.back(), ConnectionState::kCancelled);
}

TEST(SocketTransport, CloseFromAnotherThreadAbortsBlockedReceive) {
  OneShotServer server;
  const size_t baseline = CountOpenFds();
  server.ServeSilently(4);

  SocketTransport transport;  // no timeout: only Close can end the Receive
  transport.Connect("127.0.0.1", server.GetPort(), nullptr);
  ASSERT_TRUE(transport.IsOpen());
  std::vector<uint8_t> request{0x01, 0x02, 0x03, 0x04};
  ASSERT_TRUE(transport.Send(request));

  std::thread closer([&transport]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    transport.Close();
  });

  int calls = 0;
  bool got_error = false;
  transport.Receive(1, 256, [&calls, &got_error](std::optional<std::vector<uint8_t>> bytes) {
    ++calls;
    got_error = !bytes.has_value();
  });
  closer.join();

  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(got_error);
  EXPECT_FALSE(transport.IsOpen());
  EXPECT_FALSE(transport.Send(request));

  // Descriptor closed once the Receive returned; the server saw the hangup
  server.Join();
  EXPECT_EQ(CountOpenFds(), baseline);
}
