#include <arxml/parser_options.h>

#include <cstdlib>

namespace arxml {

ParserOptions ParserOptions::fromEnvironment(const char* env_level)
{
  ParserOptions options;

  const char* level = env_level ? env_level : std::getenv("ARXML_LOG_LEVEL");
  if (level && *level)
  {
    if (auto parsed = logLevelFromString(level))
      options.log_level = *parsed;
  }
  return options;
}

}  // namespace arxml
