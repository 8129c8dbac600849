#ifndef ARXML_XML_NAMESPACE_RESOLVER_H_
#define ARXML_XML_NAMESPACE_RESOLVER_H_

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tinyxml2.h>

namespace arxml {
namespace xml {

/// prefix -> URI. The default namespace is stored under the empty prefix.
using NamespaceMap = std::map<std::string, std::string>;

/// xmlns / xmlns:p attributes declared directly on `e`.
NamespaceMap declared_namespaces(const tinyxml2::XMLElement* e);

/**
 * @brief Builds the prefix map of one parsed document.
 *
 * XPath-style queries cannot address the default namespace, so it is also registered
 * under a synthetic prefix. When the root carries no default namespace but is itself
 * prefixed (<ar:AUTOSAR xmlns:ar="...">), the root namespace is used instead, which
 * makes both spellings of a document answer the same unqualified queries.
 */
class NamespaceResolver
{
public:
  NamespaceResolver(std::string synthetic_prefix = "ar");

  void extractNamespaces(const tinyxml2::XMLElement* root);

  const NamespaceMap& namespaces() const
  {
    return namespaces_;
  }

  /// URI of the unnamed declaration on the root, empty if none.
  const std::string& defaultNamespace() const
  {
    return default_namespace_;
  }

  /// Namespace unqualified query segments are qualified with, empty if none.
  const std::string& primaryNamespace() const
  {
    return primary_namespace_;
  }

  /// Prefix bound to primaryNamespace() (normally the synthetic prefix).
  const std::string& primaryPrefix() const
  {
    return primary_prefix_;
  }

  bool hasPrimaryNamespace() const
  {
    return !primary_namespace_.empty();
  }

  std::optional<std::string> uriForPrefix(std::string_view prefix) const;

private:
  std::string bindSyntheticPrefix(const std::string& uri);

  std::string synthetic_prefix_;
  NamespaceMap namespaces_;
  std::string default_namespace_;
  std::string primary_namespace_;
  std::string primary_prefix_;
};

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_XML_NAMESPACE_RESOLVER_H_
