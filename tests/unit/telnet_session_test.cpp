#include "internal/console/telnet_session.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <regex>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using labfleet::console::ConsoleEndpoint;
using labfleet::console::TelnetOptions;
using labfleet::console::TelnetSession;

// Listening socket on 127.0.0.1 with an ephemeral port.
int Listen(std::uint16_t* port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  assert(fd >= 0);

  sockaddr_in addr{};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port        = 0;
  assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  assert(::listen(fd, 1) == 0);

  socklen_t len = sizeof(addr);
  assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
  *port = ntohs(addr.sin_port);
  return fd;
}

void SendRaw(int fd, const std::string& bytes) {
  assert(::send(fd, bytes.data(), bytes.size(), 0) == static_cast<ssize_t>(bytes.size()));
}

void TestNegotiationAndCapture() {
  std::uint16_t port     = 0;
  int           listener = Listen(&port);

  std::string from_client;
  std::thread server([&] {
    int conn = ::accept(listener, nullptr, nullptr);
    assert(conn >= 0);

    // WILL ECHO, DO TTYPE, a sub-negotiation, then text with an escaped 0xFF
    SendRaw(conn, std::string("\xff\xfb\x01\xff\xfd\x18", 6));
    SendRaw(conn, std::string("\xff\xfa\x18\x01\xff\xf0", 6));
    SendRaw(conn, std::string("lab banner \xff\xff\r\n# ", 17));

    char buf[256];
    while (from_client.find("echo hi\r") == std::string::npos) {
      ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
      if (n <= 0) break;
      from_client.append(buf, static_cast<size_t>(n));
    }

    SendRaw(conn, "echo hi\r\nhi\r\nDONE\r\n");
    ::close(conn);
  });

  auto session = TelnetSession::Connect(ConsoleEndpoint{"127.0.0.1", port}, 2000ms, TelnetOptions{});

  const std::regex banner("banner");
  auto             first = session->ReadUntil(&banner, 2000ms);
  assert(first.matched);
  assert(first.text == "lab banner");

  auto rest = session->ReadFor(100ms);
  assert(rest == std::string(" \xff\r\n# ", 6));

  session->SendLine("echo hi");

  const std::regex done("DONE\\r\\n");
  auto             reply = session->ReadUntil(&done, 2000ms);
  assert(reply.matched);
  assert(reply.text.find("hi\r\n") != std::string::npos);

  // peer closed: no match, returns early instead of waiting out the window
  const auto       started = std::chrono::steady_clock::now();
  const std::regex never("never");
  auto             tail = session->ReadUntil(&never, 5000ms);
  assert(!tail.matched);
  assert(std::chrono::steady_clock::now() - started < 4000ms);

  session->Close();
  server.join();
  ::close(listener);

  // DO ECHO accepted, WONT TTYPE refused, line ends with the configured "\r"
  assert(from_client.find(std::string("\xff\xfd\x01", 3)) != std::string::npos);
  assert(from_client.find(std::string("\xff\xfc\x18", 3)) != std::string::npos);
  assert(from_client.find("echo hi\r") != std::string::npos);
}

void TestSilentConsoleTimesOutWithPartialCapture() {
  std::uint16_t port     = 0;
  int           listener = Listen(&port);

  std::thread server([&] {
    int conn = ::accept(listener, nullptr, nullptr);
    SendRaw(conn, "partial output");
    std::this_thread::sleep_for(600ms);
    ::close(conn);
  });

  auto session = TelnetSession::Connect(ConsoleEndpoint{"127.0.0.1", port}, 2000ms, TelnetOptions{});

  const std::regex marker("__LFEND_");
  auto             result = session->ReadUntil(&marker, 300ms);
  assert(!result.matched);
  assert(result.text == "partial output");

  session->Close();
  server.join();
  ::close(listener);
}

void TestRefusedConnectionIsConnectError() {
  std::uint16_t port     = 0;
  int           listener = Listen(&port);
  ::close(listener);

  bool threw = false;
  try {
    (void)TelnetSession::Connect(ConsoleEndpoint{"127.0.0.1", port}, 1000ms, TelnetOptions{});
  } catch (const labfleet::util::ConnectError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)TelnetSession::Connect(ConsoleEndpoint{"127.0.0.1", 0}, 1000ms, TelnetOptions{});
  } catch (const labfleet::util::ConnectError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNegotiationAndCapture();
  TestSilentConsoleTimesOutWithPartialCapture();
  TestRefusedConnectionIsConnectError();

  std::cout << "labfleet_unit_telnet_session: pass\n";
  return 0;
}
