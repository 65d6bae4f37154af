#pragma once

#include <string>
#include <string_view>

namespace labfleet::util {

// Wraps `value` in single quotes for a POSIX shell, escaping embedded quotes.
std::string ShellQuote(std::string_view value);

// True for a program name or absolute path made of [A-Za-z0-9_./+-] only.
bool IsPlainProgram(std::string_view value);

} // namespace labfleet::util
