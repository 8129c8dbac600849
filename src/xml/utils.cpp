#include <arxml/xml/utils.h>

#include <algorithm>
#include <cctype>

namespace arxml {
namespace xml {

std::string trim_copy(std::string_view s)
{
  auto issp = [](unsigned char c) { return std::isspace(c); };
  while (!s.empty() && issp(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && issp(s.back()))
    s.remove_suffix(1);
  return std::string(s);
}

std::string to_lower_copy(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string_view local_name(const tinyxml2::XMLElement* e)
{
  if (!e || !e->Name())
    return {};
  std::string_view name = e->Name();
  auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string_view name_prefix(const tinyxml2::XMLElement* e)
{
  if (!e || !e->Name())
    return {};
  std::string_view name = e->Name();
  auto colon = name.find(':');
  return colon == std::string_view::npos ? std::string_view{} : name.substr(0, colon);
}

std::string namespace_uri(const tinyxml2::XMLElement* e)
{
  if (!e)
    return {};
  const std::string_view prefix = name_prefix(e);
  const std::string attr = prefix.empty() ? std::string("xmlns") : "xmlns:" + std::string(prefix);

  for (const tinyxml2::XMLNode* n = e; n; n = n->Parent())
  {
    if (const auto* el = n->ToElement())
    {
      if (const char* uri = el->Attribute(attr.c_str()))
        return uri;
    }
  }
  return {};
}

std::string element_text(const tinyxml2::XMLElement* e)
{
  if (!e)
    return {};
  const char* t = e->GetText();
  return t ? trim_copy(t) : std::string{};
}

std::string last_ref_segment(std::string_view ref)
{
  std::string r = trim_copy(ref);
  while (!r.empty() && r.back() == '/')
    r.pop_back();
  auto slash = r.rfind('/');
  return slash == std::string::npos ? r : r.substr(slash + 1);
}

}  // namespace xml
}  // namespace arxml
