#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/log.hpp"
#include "transport/socket_transport.hpp"

namespace fpssmb {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo *info) const { ::freeaddrinfo(info); }
};

}  // namespace

SocketTransport::~SocketTransport() {
  std::lock_guard<std::mutex> lock(mutex_);
  CloseFdLocked();
}

void SocketTransport::Report(ConnectionState state) {
  FPSSMB_LOG_DEBUG("socket state %s", ToString(state));
  if (on_state_) {
    on_state_(state);
  }
}

void SocketTransport::CloseFdLocked() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  open_ = false;
}

int SocketTransport::AcquireFd() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return -1;
  }
  ++users_;
  return fd_;
}

void SocketTransport::ReleaseFd() {
  std::lock_guard<std::mutex> lock(mutex_);
  --users_;
  if (users_ == 0 && !open_) {
    CloseFdLocked();
  }
}

bool SocketTransport::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

void SocketTransport::Connect(const std::string &host, uint16_t port, StateHandler on_state) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
      FPSSMB_LOG_INFO("dropping previous connection before connecting to %s:%u", host.c_str(),
                      static_cast<unsigned>(port));
      ::shutdown(fd_, SHUT_RDWR);
      CloseFdLocked();
    }
  }

  on_state_ = std::move(on_state);
  Report(ConnectionState::kPreparing);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *raw_result = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw_result);
  if (rc != 0) {
    FPSSMB_LOG_WARN("cannot resolve %s:%u: %s", host.c_str(), static_cast<unsigned>(port), ::gai_strerror(rc));
    Report(ConnectionState::kFailed);
    return;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> result(raw_result);

  int last_errno = 0;
  for (addrinfo *ai = result.get(); ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      int one = 1;
      // Requests are small and latency-bound
      if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
        FPSSMB_LOG_DEBUG("TCP_NODELAY not set: %s", std::strerror(errno));
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        fd_ = fd;
        open_ = true;
      }
      FPSSMB_LOG_INFO("connected to %s:%u", host.c_str(), static_cast<unsigned>(port));
      Report(ConnectionState::kReady);
      return;
    }
    last_errno = errno;
    ::close(fd);
  }

  FPSSMB_LOG_WARN("connect to %s:%u failed: %s", host.c_str(), static_cast<unsigned>(port),
                  std::strerror(last_errno));
  Report(ConnectionState::kFailed);
}

bool SocketTransport::Send(std::span<const uint8_t> data) {
  FdLease lease(*this);
  if (lease.Get() < 0) {
    return false;
  }

  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(lease.Get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      FPSSMB_LOG_WARN("send failed: %s", std::strerror(errno));
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

std::optional<std::vector<uint8_t>> SocketTransport::ReadChunk(size_t min_length, size_t max_length) {
  FdLease lease(*this);
  if (lease.Get() < 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> buffer(max_length);
  size_t received = 0;
  const int timeout = options_.receive_timeout_ms == 0 ? -1 : static_cast<int>(options_.receive_timeout_ms);

  while (received < min_length || received == 0) {
    pollfd pfd{lease.Get(), POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeout);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      FPSSMB_LOG_WARN("poll failed: %s", std::strerror(errno));
      return std::nullopt;
    }
    if (ready == 0) {
      FPSSMB_LOG_WARN("receive timed out after %u ms", options_.receive_timeout_ms);
      return std::nullopt;
    }

    ssize_t n = ::recv(lease.Get(), buffer.data() + received, max_length - received, 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      FPSSMB_LOG_WARN("recv failed: %s", std::strerror(errno));
      return std::nullopt;
    }
    if (n == 0) {
      if (IsOpen()) {
        FPSSMB_LOG_WARN("connection closed by peer");
      } else {
        FPSSMB_LOG_INFO("receive aborted by close");
      }
      return std::nullopt;
    }
    received += static_cast<size_t>(n);
    if (received >= max_length) {
      break;
    }
  }

  buffer.resize(received);
  return buffer;
}

void SocketTransport::Receive(size_t min_length, size_t max_length, ReceiveHandler on_receive) {
  // Lease already released here; the handler may Close or start the next exchange
  auto data = ReadChunk(min_length, max_length);
  on_receive(std::move(data));
}

void SocketTransport::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      return;
    }
    // Wakes a Send or Receive blocked on another thread; the last one out closes the descriptor
    ::shutdown(fd_, SHUT_RDWR);
    if (users_ == 0) {
      CloseFdLocked();
    } else {
      open_ = false;
    }
  }
  Report(ConnectionState::kCancelled);
}

}  // namespace fpssmb
