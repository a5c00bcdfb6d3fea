#include "logger.hpp"

#include <algorithm>
#include <cctype>

namespace poolcore {

arrow::Result<LogLevel> parse_log_level(std::string_view name) {
  std::string lower(name);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "info") return LogLevel::INFO;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  return arrow::Status::Invalid("Unknown log level: '", name, "'");
}

}  // namespace poolcore
