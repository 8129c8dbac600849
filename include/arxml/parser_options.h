#ifndef ARXML_PARSER_OPTIONS_H_
#define ARXML_PARSER_OPTIONS_H_

#include <string>

#include <arxml/log.h>

namespace arxml {

struct ParserOptions
{
  LogLevel log_level = LogLevel::Warning;

  // Prefix under which the document's primary namespace is made addressable.
  std::string namespace_prefix = "ar";

  // Second pass over compositions (prototypes + connectors).
  bool resolve_compositions = true;

  // Parse *-INTERFACE elements and resolve port interface references.
  bool parse_interfaces = true;

  /**
   * Defaults, with the log level taken from ARXML_LOG_LEVEL when it holds a known level.
   *
   * @param env_level Optional override for ARXML_LOG_LEVEL (tests)
   */
  static ParserOptions fromEnvironment(const char* env_level = nullptr);
};

}  // namespace arxml

#endif  // ARXML_PARSER_OPTIONS_H_
