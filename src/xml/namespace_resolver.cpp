#include <arxml/xml/namespace_resolver.h>
#include <arxml/xml/utils.h>

#include <cstring>

namespace arxml {
namespace xml {

NamespaceMap declared_namespaces(const tinyxml2::XMLElement* e)
{
  NamespaceMap out;
  if (!e)
    return out;
  for (const auto* a = e->FirstAttribute(); a; a = a->Next())
  {
    const char* name = a->Name();
    if (std::strcmp(name, "xmlns") == 0)
      out[""] = a->Value();
    else if (std::strncmp(name, "xmlns:", 6) == 0 && name[6] != '\0')
      out[name + 6] = a->Value();
  }
  return out;
}

NamespaceResolver::NamespaceResolver(std::string synthetic_prefix) : synthetic_prefix_(std::move(synthetic_prefix))
{
  if (synthetic_prefix_.empty())
    synthetic_prefix_ = "ar";
}

void NamespaceResolver::extractNamespaces(const tinyxml2::XMLElement* root)
{
  namespaces_.clear();
  default_namespace_.clear();
  primary_namespace_.clear();
  primary_prefix_.clear();

  if (!root)
    return;

  namespaces_ = declared_namespaces(root);

  if (auto it = namespaces_.find(""); it != namespaces_.end() && !it->second.empty())
  {
    default_namespace_ = it->second;
    primary_namespace_ = default_namespace_;
  }
  else if (!name_prefix(root).empty())
  {
    // <ar:AUTOSAR xmlns:ar="..."> : no default, the root namespace takes its place
    primary_namespace_ = namespace_uri(root);
  }

  if (!primary_namespace_.empty())
    primary_prefix_ = bindSyntheticPrefix(primary_namespace_);
}

std::string NamespaceResolver::bindSyntheticPrefix(const std::string& uri)
{
  std::string prefix = synthetic_prefix_;
  for (int i = 0;; ++i)
  {
    auto it = namespaces_.find(prefix);
    if (it == namespaces_.end())
    {
      namespaces_.emplace(prefix, uri);
      return prefix;
    }
    if (it->second == uri)
      return prefix;
    prefix = synthetic_prefix_ + std::to_string(i);
  }
}

std::optional<std::string> NamespaceResolver::uriForPrefix(std::string_view prefix) const
{
  auto it = namespaces_.find(std::string(prefix));
  if (it == namespaces_.end())
    return std::nullopt;
  return it->second;
}

}  // namespace xml
}  // namespace arxml
