#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace labfleet::console {

struct ConsoleEndpoint {
  std::string   host;
  std::uint16_t port = 0;
};

struct ReadResult {
  // Everything captured up to and including the match, or everything captured
  // before the window elapsed.
  std::string text;
  bool        matched = false;
  // Sub-matches of the pattern when matched.
  std::vector<std::string> groups;
};

/*
  One bounded conversation with one node's text console.

  A session belongs to exactly one node workflow at a time and is never
  shared between threads. Every read carries an explicit timeout; running
  out of time is a normal outcome and returns the partial capture.
*/
class ConsoleSession {
 public:
  virtual ~ConsoleSession() = default;

  // Throws util::ConnectError when the console is gone.
  virtual void SendLine(std::string_view text) = 0;

  // Reads until `pattern` matches the captured text or `timeout` elapses.
  // A null pattern reads for the whole window.
  virtual ReadResult ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;

  std::string ReadFor(std::chrono::milliseconds window) {
    return ReadUntil(nullptr, window).text;
  }
};

class ConsoleConnector {
 public:
  virtual ~ConsoleConnector() = default;

  // Throws util::ConnectError when the endpoint cannot be reached in time.
  virtual std::unique_ptr<ConsoleSession> Open(const ConsoleEndpoint& endpoint, std::chrono::milliseconds connect_timeout) = 0;
};

} // namespace labfleet::console
