#include "telnet_session.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::console {

namespace {

constexpr unsigned char kIac  = 255;
constexpr unsigned char kDont = 254;
constexpr unsigned char kDo   = 253;
constexpr unsigned char kWont = 252;
constexpr unsigned char kWill = 251;
constexpr unsigned char kSb   = 250;
constexpr unsigned char kSe   = 240;

constexpr unsigned char kOptEcho = 1;
constexpr unsigned char kOptSga  = 3;

using SteadyClock = std::chrono::steady_clock;

std::string Describe(const ConsoleEndpoint& endpoint) {
  return endpoint.host + ":" + std::to_string(endpoint.port);
}

int PollFor(int fd, short events, std::chrono::milliseconds wait) {
  pollfd pfd{};
  pfd.fd     = fd;
  pfd.events = events;

  while (true) {
    int rc = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return rc;
    return pfd.revents;
  }
}

// Non-blocking connect bounded by `timeout`. Returns the fd or -1 with `error` set.
int ConnectOne(const addrinfo* ai, std::chrono::milliseconds timeout, std::string& error) {
  int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
  if (fd < 0) {
    error = std::strerror(errno);
    return -1;
  }

  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
    return fd;
  }
  if (errno != EINPROGRESS) {
    error = std::strerror(errno);
    ::close(fd);
    return -1;
  }

  int revents = PollFor(fd, POLLOUT, timeout);
  if (revents == 0) {
    error = "connect timed out";
    ::close(fd);
    return -1;
  }

  int       so_error = 0;
  socklen_t len      = sizeof(so_error);
  if (revents < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
    error = std::strerror(so_error != 0 ? so_error : errno);
    ::close(fd);
    return -1;
  }

  return fd;
}

} // namespace

std::unique_ptr<TelnetSession> TelnetSession::Connect(const ConsoleEndpoint& endpoint, std::chrono::milliseconds connect_timeout,
                                                      TelnetOptions options) {
  if (endpoint.host.empty() || endpoint.port == 0) {
    throw util::ConnectError("console endpoint incomplete: '" + Describe(endpoint) + "'");
  }

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*   result = nullptr;
  const auto  port   = std::to_string(endpoint.port);
  const int   gai    = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
  if (gai != 0) {
    throw util::ConnectError("cannot resolve console host " + endpoint.host + ": " + ::gai_strerror(gai));
  }

  const auto  deadline = SteadyClock::now() + connect_timeout;
  std::string error    = "no usable address";
  int         fd       = -1;

  for (auto* ai = result; ai != nullptr && fd < 0; ai = ai->ai_next) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (left.count() <= 0) {
      error = "connect timed out";
      break;
    }
    fd = ConnectOne(ai, left, error);
  }
  ::freeaddrinfo(result);

  if (fd < 0) {
    throw util::ConnectError("console " + Describe(endpoint) + " unreachable: " + error);
  }

  LABFLEET_LOG_DEBUG("Console connected", {observability::StringField("peer", Describe(endpoint))});
  return std::unique_ptr<TelnetSession>(new TelnetSession(fd, Describe(endpoint), std::move(options)));
}

TelnetSession::TelnetSession(int fd, std::string peer, TelnetOptions options)
    : fd_(fd), peer_(std::move(peer)), options_(std::move(options)) {
}

TelnetSession::~TelnetSession() {
  Close();
}

void TelnetSession::SendLine(std::string_view text) {
  if (fd_ < 0 || eof_) {
    throw util::ConnectError("console " + peer_ + " is closed");
  }

  std::string bytes;
  bytes.reserve(text.size() + options_.newline.size());
  for (char c : text) {
    bytes.push_back(c);
    if (static_cast<unsigned char>(c) == kIac) bytes.push_back(static_cast<char>(kIac));
  }
  bytes += options_.newline;

  WriteAll(bytes);
}

void TelnetSession::WriteAll(std::string_view bytes) {
  const auto deadline = SteadyClock::now() + options_.write_timeout;

  while (!bytes.empty()) {
    ssize_t n = ::send(fd_, bytes.data(), bytes.size(), MSG_NOSIGNAL);
    if (n > 0) {
      bytes.remove_prefix(static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
      if (left.count() <= 0 || PollFor(fd_, POLLOUT, left) <= 0) {
        throw util::ConnectError("console " + peer_ + " write stalled");
      }
      continue;
    }
    throw util::ConnectError("console " + peer_ + " write failed: " + std::strerror(errno));
  }
}

bool TelnetSession::ReceiveOnce(std::chrono::milliseconds wait) {
  int revents = PollFor(fd_, POLLIN, wait);
  if (revents == 0) return true;
  if (revents < 0) {
    throw util::ConnectError("console " + peer_ + " poll failed: " + std::strerror(errno));
  }

  unsigned char buf[4096];
  while (true) {
    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n > 0) {
      Consume(buf, static_cast<size_t>(n));
      if (static_cast<size_t>(n) < sizeof(buf)) break;
      continue;
    }
    if (n == 0) {
      eof_ = true;
      return false;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) break;
    throw util::ConnectError("console " + peer_ + " read failed: " + std::strerror(errno));
  }

  if (!replies_.empty()) {
    std::string replies;
    replies.swap(replies_);
    WriteAll(replies);
  }
  return true;
}

void TelnetSession::Consume(const unsigned char* data, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    const unsigned char c = data[i];
    switch (state_) {
      case ParseState::kData:
        if (c == kIac) {
          state_ = ParseState::kIac;
        } else if (c != '\0') {
          pending_.push_back(static_cast<char>(c));
        }
        break;

      case ParseState::kIac:
        if (c == kIac) {
          pending_.push_back(static_cast<char>(c));
          state_ = ParseState::kData;
        } else if (c == kWill || c == kWont || c == kDo || c == kDont) {
          verb_  = c;
          state_ = ParseState::kOption;
        } else if (c == kSb) {
          state_ = ParseState::kSub;
        } else {
          state_ = ParseState::kData;
        }
        break;

      case ParseState::kOption:
        if (verb_ == kWill) {
          Reply((c == kOptEcho || c == kOptSga) ? kDo : kDont, c);
        } else if (verb_ == kDo) {
          Reply(c == kOptSga ? kWill : kWont, c);
        }
        state_ = ParseState::kData;
        break;

      case ParseState::kSub:
        if (c == kIac) state_ = ParseState::kSubIac;
        break;

      case ParseState::kSubIac:
        state_ = (c == kSe) ? ParseState::kData : ParseState::kSub;
        break;
    }
  }
}

void TelnetSession::Reply(unsigned char verb, unsigned char option) {
  replies_.push_back(static_cast<char>(kIac));
  replies_.push_back(static_cast<char>(verb));
  replies_.push_back(static_cast<char>(option));
}

ReadResult TelnetSession::ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) {
  ReadResult result;
  const auto deadline = SteadyClock::now() + timeout;

  while (true) {
    if (pattern != nullptr) {
      std::smatch match;
      if (std::regex_search(pending_, match, *pattern)) {
        const auto end = static_cast<size_t>(match.position(0) + match.length(0));
        for (size_t i = 1; i < match.size(); ++i) {
          result.groups.push_back(match[i].str());
        }
        result.text    = pending_.substr(0, end);
        result.matched = true;
        pending_.erase(0, end);
        return result;
      }
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (left.count() <= 0 || fd_ < 0 || eof_) break;

    ReceiveOnce(std::min(left, options_.poll_interval));
  }

  result.text.swap(pending_);
  return result;
}

void TelnetSession::Close() {
  if (fd_ < 0) return;

  if (!eof_ && !options_.exit_command.empty()) {
    // best effort, the console may already be gone
    const std::string bye = options_.exit_command + options_.newline;
    (void)::send(fd_, bye.data(), bye.size(), MSG_NOSIGNAL);
  }

  ::shutdown(fd_, SHUT_RDWR);
  ::close(fd_);
  fd_ = -1;
}

std::unique_ptr<ConsoleSession> TelnetConnector::Open(const ConsoleEndpoint& endpoint, std::chrono::milliseconds connect_timeout) {
  return TelnetSession::Connect(endpoint, connect_timeout, options_);
}

} // namespace labfleet::console
