#ifndef ARXML_XML_QUERY_HELPER_H_
#define ARXML_XML_QUERY_HELPER_H_

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <tinyxml2.h>

#include <arxml/errors.h>
#include <arxml/log.h>
#include <arxml/xml/namespace_resolver.h>
#include <arxml/xml/path_query.h>

namespace arxml {
namespace xml {

/// Prefix the name part of every unqualified segment with `prefix` ("A/B[@x='1']" -> "ar:A/ar:B[@x='1']").
/// Segments starting with '@', '*' or '.', or whose name already has a prefix, are kept as is.
std::string qualify_path(const std::string& path, const std::string& prefix);

using QueryResult = std::variant<std::vector<const tinyxml2::XMLElement*>, QueryError>;

/**
 * @brief Namespace-aware lookups relative to any element of one parsed document.
 *
 * None of the lookup functions throw: malformed expressions and unknown prefixes are
 * logged at debug level and reported as "no match". tryFindElements() exposes the
 * failure instead.
 */
class QueryHelper
{
public:
  QueryHelper(const NamespaceResolver& resolver, Logger logger = Logger());

  const tinyxml2::XMLElement* findElement(const tinyxml2::XMLNode* parent, const std::string& path) const;

  std::vector<const tinyxml2::XMLElement*> findElements(const tinyxml2::XMLNode* parent,
                                                        const std::string& path) const;

  std::string getText(const tinyxml2::XMLNode* parent, const std::string& path,
                      const std::string& fallback = "") const;

  std::string getAttribute(const tinyxml2::XMLNode* parent, const std::string& path, const std::string& attr_name,
                           const std::string& fallback = "") const;

  QueryResult tryFindElements(const tinyxml2::XMLNode* parent, const std::string& path) const;

  /// The expression actually evaluated for `path`.
  std::string preparePath(const std::string& path) const;

  const NamespaceMap& namespaces() const
  {
    return namespaces_;
  }

private:
  const PathExpr& compiled(const std::string& path) const;

  NamespaceMap namespaces_;
  std::string qualify_prefix_;
  Logger logger_;

  mutable std::unordered_map<std::string, PathExpr> cache_;
};

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_XML_QUERY_HELPER_H_
