#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/console/console_session.hpp"
#include "internal/util/errors.hpp"

namespace labfleet::testing {

// What the fake shell prints for one command. nullopt from a Script means the
// console goes silent.
struct Reply {
  std::string output;
  int         exit_code = 0;
};

using Script = std::function<std::optional<Reply>(const std::string& command)>;

inline std::optional<Reply> CommandNotFound(const std::string& command) {
  auto program = command.substr(0, command.find(' '));
  return Reply{"sh: " + program + ": not found", 127};
}

// Splits a CommandRunner line into the command and its marker token.
inline std::pair<std::string, std::string> SplitMarker(const std::string& line) {
  static const std::regex kMarker("; printf '%s%s %s\\\\n' '__LF' 'END_([0-9a-f]+)' \"\\$\\?\"$");
  std::smatch             match;
  if (std::regex_search(line, match, kMarker)) {
    return {line.substr(0, static_cast<size_t>(match.position(0))), match[1].str()};
  }
  return {line, {}};
}

/*
  Console that behaves like a shell: echoes each line, prints the scripted
  output, then the marker line CommandRunner waits for. Reads that find no
  match wait out their full timeout, like a real silent console.
*/
class FakeSession : public console::ConsoleSession {
 public:
  FakeSession(Script script, std::shared_ptr<std::vector<std::string>> log) : script_(std::move(script)), log_(std::move(log)) {
  }

  void SendLine(std::string_view text) override {
    if (closed_) throw util::ConnectError("fake console closed");

    const std::string line(text);
    buffer_ += line + "\r\n";
    if (line.empty()) {
      buffer_ += "# ";
      return;
    }

    auto [command, token] = SplitMarker(line);
    log_->push_back(command);

    auto reply = script_(command);
    if (!reply) return;

    if (!reply->output.empty()) buffer_ += reply->output + "\r\n";
    if (!token.empty()) buffer_ += "__LFEND_" + token + " " + std::to_string(reply->exit_code) + "\r\n";
    buffer_ += "# ";
  }

  console::ReadResult ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) override {
    console::ReadResult result;
    if (pattern == nullptr) {
      result.text.swap(buffer_);
      return result;
    }

    std::smatch match;
    if (std::regex_search(buffer_, match, *pattern)) {
      const auto end = static_cast<size_t>(match.position(0) + match.length(0));
      for (size_t i = 1; i < match.size(); ++i) result.groups.push_back(match[i].str());
      result.text    = buffer_.substr(0, end);
      result.matched = true;
      buffer_.erase(0, end);
      return result;
    }

    std::this_thread::sleep_for(timeout);
    result.text.swap(buffer_);
    return result;
  }

  void Close() override {
    closed_ = true;
  }

 private:
  Script                                    script_;
  std::shared_ptr<std::vector<std::string>> log_;
  std::string                               buffer_;
  bool                                      closed_ = false;
};

/*
  Hands out FakeSessions by console port and keeps every command each port
  received.
*/
class FakeConnector : public console::ConsoleConnector {
 public:
  void Add(std::uint16_t port, Script script) {
    std::lock_guard<std::mutex> lock(mu_);
    scripts_[port] = std::move(script);
    logs_[port]    = std::make_shared<std::vector<std::string>>();
  }

  std::unique_ptr<console::ConsoleSession> Open(const console::ConsoleEndpoint& endpoint, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mu_);
    opened_.push_back(endpoint);
    auto it = scripts_.find(endpoint.port);
    if (it == scripts_.end()) {
      throw util::ConnectError("nothing listening on port " + std::to_string(endpoint.port));
    }
    return std::make_unique<FakeSession>(it->second, logs_[endpoint.port]);
  }

  std::vector<std::string> Commands(std::uint16_t port) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = logs_.find(port);
    return it == logs_.end() ? std::vector<std::string>{} : *it->second;
  }

  std::vector<console::ConsoleEndpoint> Opened() const {
    std::lock_guard<std::mutex> lock(mu_);
    return opened_;
  }

 private:
  mutable std::mutex                                                   mu_;
  std::map<std::uint16_t, Script>                                      scripts_;
  std::map<std::uint16_t, std::shared_ptr<std::vector<std::string>>>   logs_;
  std::vector<console::ConsoleEndpoint>                                opened_;
};

inline size_t CountPrefix(const std::vector<std::string>& commands, const std::string& prefix) {
  size_t n = 0;
  for (const auto& c : commands) {
    if (c.compare(0, prefix.size(), prefix) == 0) ++n;
  }
  return n;
}

} // namespace labfleet::testing
