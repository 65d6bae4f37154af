#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/base64.hpp"
#include "internal/util/ip_address.hpp"
#include "internal/util/shell.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace labfleet::util;

void TestIpv4Validation() {
  assert(IsValidIpv4("192.168.0.23"));
  assert(IsValidIpv4("0.0.0.0"));
  assert(IsValidIpv4("255.255.255.255"));
  assert(!IsValidIpv4("256.1.1.1"));
  assert(!IsValidIpv4("999.1.2.3"));
  assert(!IsValidIpv4("10.0.0"));
  assert(!IsValidIpv4("10.0.0.1.2"));
  assert(!IsValidIpv4("10.00.0.1"));
  assert(!IsValidIpv4("10.0.0.a"));
  assert(!IsValidIpv4(""));

  assert(IsValidIpAddress("fe80::1"));
  assert(IsValidIpAddress("10.0.0.1"));
  assert(!IsValidIpAddress("not-an-ip"));
}

void TestCidr() {
  auto bare = ParseCidr("10.0.0.5", 24);
  assert(bare && bare->ip == "10.0.0.5" && bare->prefix_length == 24);

  auto with_len = ParseCidr("10.0.0.5/16", 24);
  assert(with_len && with_len->prefix_length == 16);
  assert(FormatCidr(*with_len) == "10.0.0.5/16");

  assert(!ParseCidr("10.0.0.5/33", 24));
  assert(!ParseCidr("10.0.0.5/", 24));
  assert(!ParseCidr("10.0.0.300/24", 24));
}

void TestBase64() {
  assert(Base64Encode("") == "");
  assert(Base64Encode("f") == "Zg==");
  assert(Base64Encode("fo") == "Zm8=");
  assert(Base64Encode("foo") == "Zm9v");
  assert(Base64Encode("#!/bin/sh\necho 'hi'\n") == "IyEvYmluL3NoCmVjaG8gJ2hpJwo=");
  assert(Base64Encode(std::string("\xff\x00\x10", 3)) == "/wAQ");
}

void TestShellHelpers() {
  assert(ShellQuote("/tmp/a b") == "'/tmp/a b'");
  assert(ShellQuote("it's") == "'it'\\''s'");

  assert(IsPlainProgram("sh"));
  assert(IsPlainProgram("/bin/bash"));
  assert(IsPlainProgram("python3"));
  assert(!IsPlainProgram(""));
  assert(!IsPlainProgram("sh -c"));
  assert(!IsPlainProgram("sh;rm"));
  assert(!IsPlainProgram("$(id)"));
}

void TestDeadline() {
  Deadline never;
  assert(!never.Expired());
  assert(!never.Bounded());
  assert(never.Clamp(std::chrono::milliseconds(500)) == std::chrono::milliseconds(500));

  Deadline soon(std::chrono::milliseconds(50));
  assert(soon.Bounded());
  assert(soon.Clamp(std::chrono::milliseconds(10000)) <= std::chrono::milliseconds(50));
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  assert(soon.Expired());
  assert(soon.Remaining(std::chrono::milliseconds(1000)) == std::chrono::milliseconds(0));
}

void TestWaitingOutRemainingReachesDeadline() {
  for (int i = 0; i < 20; ++i) {
    Deadline budget(std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::microseconds(1300));

    const auto left = budget.Remaining(std::chrono::milliseconds(1000));
    assert(left > std::chrono::milliseconds(0));
    std::this_thread::sleep_for(left);
    assert(budget.Expired());
    assert(budget.Clamp(std::chrono::milliseconds(1000)) == std::chrono::milliseconds(0));
  }
}

void TestTokensAreUnique() {
  auto a = GenerateToken();
  auto b = GenerateToken();
  assert(a.size() == 32);
  assert(a != b);
  assert(a.find_first_not_of("0123456789abcdef") == std::string::npos);
}

} // namespace

int main() {
  TestIpv4Validation();
  TestCidr();
  TestBase64();
  TestShellHelpers();
  TestDeadline();
  TestWaitingOutRemainingReachesDeadline();
  TestTokensAreUnique();

  std::cout << "labfleet_unit_util: pass\n";
  return 0;
}
