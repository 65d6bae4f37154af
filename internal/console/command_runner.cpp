#include "command_runner.hpp"

#include <regex>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace labfleet::console {

namespace {

constexpr std::string_view kMarkerHead = "__LF";
constexpr std::string_view kMarkerTail = "END_";

// Drops the echoed input line: everything through the first newline that
// follows `echo_tail`.
std::string StripEcho(const std::string& text, std::string_view echo_tail) {
  if (echo_tail.empty()) return text;
  auto at = text.find(echo_tail);
  if (at == std::string::npos) return text;
  auto eol = text.find('\n', at + echo_tail.size());
  if (eol == std::string::npos) return {};
  return text.substr(eol + 1);
}

std::string TrimLineEnds(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
  size_t start = 0;
  while (start < text.size() && (text[start] == '\n' || text[start] == '\r')) ++start;
  return text.substr(start);
}

} // namespace

std::string_view CommandStep(std::string_view command) {
  auto start = command.find_first_not_of(' ');
  if (start == std::string_view::npos) return "command";
  command.remove_prefix(start);
  return command.substr(0, command.find(' '));
}

CommandRunner::CommandRunner(ConsoleSession& session, std::string node_name) : session_(session), node_name_(std::move(node_name)) {
}

void CommandRunner::Settle(std::chrono::milliseconds window) {
  session_.SendLine("");
  session_.ReadFor(window);
}

model::CommandResult CommandRunner::Run(const std::string& command, std::chrono::milliseconds timeout) {
  const auto        started = std::chrono::steady_clock::now();
  const std::string token   = util::GenerateToken();

  // '__LF' 'END_<token>' on the wire, __LFEND_<token> once printed
  const std::string echo_tail = "'" + std::string(kMarkerTail) + token + "' \"$?\"";
  const std::string line      = command + "; printf '%s%s %s\\n' '" + std::string(kMarkerHead) + "' " + echo_tail;
  const std::string marker    = std::string(kMarkerHead) + std::string(kMarkerTail) + token;
  const std::regex  pattern(marker + " (-?[0-9]+)\\r?\\n");

  LABFLEET_LOG_DEBUG("Console command", {observability::NodeField(node_name_), observability::StringField("command", command)});

  session_.SendLine(line);
  auto read = session_.ReadUntil(&pattern, timeout);

  auto result = Finish(command, std::string(), started);
  if (!read.matched) {
    result.timed_out       = true;
    result.captured_output = TrimLineEnds(StripEcho(read.text, echo_tail));
    LABFLEET_LOG_WARN("Console command timed out",
                      {observability::NodeField(node_name_), observability::StringField("command", command),
                       observability::DurationField("timeout", timeout)});
    return result;
  }

  std::string body = read.text.substr(0, read.text.rfind(marker));
  result.captured_output = TrimLineEnds(StripEcho(body, echo_tail));
  result.exit_code       = std::stoi(read.groups.at(0));
  result.succeeded       = *result.exit_code == 0;
  return result;
}

model::CommandResult CommandRunner::SendAndCapture(const std::string& command, std::chrono::milliseconds window) {
  const auto started = std::chrono::steady_clock::now();

  session_.SendLine(command);
  auto text = session_.ReadFor(window);

  auto result      = Finish(command, TrimLineEnds(StripEcho(text, command)), started);
  result.succeeded = true;
  return result;
}

model::CommandResult CommandRunner::Finish(const std::string& command, std::string output, std::chrono::steady_clock::time_point started) {
  model::CommandResult result;
  result.node_name       = node_name_;
  result.command         = command;
  result.captured_output = std::move(output);
  result.elapsed         = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  observability::Metrics::Instance().ObserveCommandLatencyMs(CommandStep(command), static_cast<double>(result.elapsed.count()));
  return result;
}

} // namespace labfleet::console
