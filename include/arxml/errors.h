#ifndef ARXML_ERRORS_H_
#define ARXML_ERRORS_H_

#include <stdexcept>
#include <string>

namespace arxml {

/// The file cannot be opened/read, or it is not well-formed XML.
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string& file, const std::string& what)
    : std::runtime_error(file.empty() ? what : file + ": " + what), file_(file)
  {
  }

  const std::string& file() const
  {
    return file_;
  }

private:
  std::string file_;
};

namespace xml {

/// Malformed or unsupported path expression.
class QueryError : public std::runtime_error
{
public:
  QueryError(const std::string& expression, const std::string& what)
    : std::runtime_error("'" + expression + "': " + what), expression_(expression)
  {
  }

  const std::string& expression() const
  {
    return expression_;
  }

private:
  std::string expression_;
};

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_ERRORS_H_
