#ifndef ARXML_LOG_H_
#define ARXML_LOG_H_

#include <iostream>
#include <optional>
#include <string>

namespace arxml {

enum class LogLevel
{
  Debug = 0,
  Info,
  Warning,
  Error,
  Off,
};

const char* logLevelToString(LogLevel level);

// Case-insensitive ("debug", "INFO", "warn", ...). std::nullopt on unknown names.
std::optional<LogLevel> logLevelFromString(const std::string& name);

/**
 * @brief Level-gated diagnostics written to a stream (std::cerr by default).
 *
 * Lines look like "[arxml] WARNING: message". Copies share the target stream, which
 * must outlive them.
 */
class Logger
{
public:
  Logger(LogLevel level = LogLevel::Warning, std::ostream* out = &std::cerr);

  LogLevel level() const
  {
    return level_;
  }
  void setLevel(LogLevel level)
  {
    level_ = level;
  }

  bool enabled(LogLevel level) const;

  void log(LogLevel level, const std::string& msg) const;

  void debug(const std::string& msg) const
  {
    log(LogLevel::Debug, msg);
  }
  void info(const std::string& msg) const
  {
    log(LogLevel::Info, msg);
  }
  void warning(const std::string& msg) const
  {
    log(LogLevel::Warning, msg);
  }
  void error(const std::string& msg) const
  {
    log(LogLevel::Error, msg);
  }

private:
  LogLevel level_;
  std::ostream* out_;
};

}  // namespace arxml

#endif  // ARXML_LOG_H_
