#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/console/console_session.hpp"

namespace labfleet::console {

struct TelnetOptions {
  std::string               newline = "\r";
  std::string               exit_command = "exit";
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds write_timeout{5000};
};

/*
  ConsoleSession over a raw TCP telnet console.

  Negotiation is answered minimally: the server may echo and suppress
  go-ahead, everything else is refused. IAC sequences never reach the
  captured text.
*/
class TelnetSession : public ConsoleSession {
 public:
  static std::unique_ptr<TelnetSession> Connect(const ConsoleEndpoint& endpoint, std::chrono::milliseconds connect_timeout,
                                                TelnetOptions options);

  ~TelnetSession() override;

  TelnetSession(const TelnetSession&)            = delete;
  TelnetSession& operator=(const TelnetSession&) = delete;

  void       SendLine(std::string_view text) override;
  ReadResult ReadUntil(const std::regex* pattern, std::chrono::milliseconds timeout) override;
  void       Close() override;

 private:
  enum class ParseState { kData, kIac, kOption, kSub, kSubIac };

  TelnetSession(int fd, std::string peer, TelnetOptions options);

  void WriteAll(std::string_view bytes);
  // Returns false once the peer has closed the connection.
  bool ReceiveOnce(std::chrono::milliseconds wait);
  void Consume(const unsigned char* data, size_t size);
  void Reply(unsigned char verb, unsigned char option);

  int           fd_;
  std::string   peer_;
  TelnetOptions options_;

  std::string   pending_;
  std::string   replies_;
  ParseState    state_ = ParseState::kData;
  unsigned char verb_  = 0;
  bool          eof_   = false;
};

class TelnetConnector : public ConsoleConnector {
 public:
  explicit TelnetConnector(TelnetOptions options) : options_(std::move(options)) {
  }

  std::unique_ptr<ConsoleSession> Open(const ConsoleEndpoint& endpoint, std::chrono::milliseconds connect_timeout) override;

 private:
  TelnetOptions options_;
};

} // namespace labfleet::console
