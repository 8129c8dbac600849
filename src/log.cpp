#include <arxml/log.h>
#include <arxml/xml/utils.h>

namespace arxml {

const char* logLevelToString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      return "OFF";
    default:
      return "UNKNOWN";
  }
}

std::optional<LogLevel> logLevelFromString(const std::string& name)
{
  const std::string n = xml::to_lower_copy(xml::trim_copy(name));
  if (n == "debug")
    return LogLevel::Debug;
  if (n == "info")
    return LogLevel::Info;
  if (n == "warning" || n == "warn")
    return LogLevel::Warning;
  if (n == "error")
    return LogLevel::Error;
  if (n == "off" || n == "none")
    return LogLevel::Off;
  return std::nullopt;
}

Logger::Logger(LogLevel level, std::ostream* out) : level_(level), out_(out)
{
}

bool Logger::enabled(LogLevel level) const
{
  return out_ && level != LogLevel::Off && level >= level_;
}

void Logger::log(LogLevel level, const std::string& msg) const
{
  if (!enabled(level))
    return;
  *out_ << "[arxml] " << logLevelToString(level) << ": " << msg << std::endl;
}

}  // namespace arxml
