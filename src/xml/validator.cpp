#include <arxml/xml/validator.h>
#include <arxml/xml/utils.h>

#include <cctype>
#include <memory>
#include <tinyxml2.h>

namespace arxml {
namespace xml {

namespace {

std::unique_ptr<tinyxml2::XMLDocument> load(const std::string& filename, std::string* error = nullptr)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
  {
    if (error)
      *error = doc->ErrorStr() ? doc->ErrorStr() : "Error loading XML file";
    return nullptr;
  }
  if (!doc->RootElement())
  {
    if (error)
      *error = "Document has no root element";
    return nullptr;
  }
  return doc;
}

// version="1.0" encoding='UTF-8' ...
std::string pseudo_attribute(const std::string& decl, const std::string& name)
{
  std::size_t pos = 0;
  while ((pos = decl.find(name, pos)) != std::string::npos)
  {
    std::size_t i = pos + name.size();
    const bool boundary = pos == 0 || std::isspace(static_cast<unsigned char>(decl[pos - 1]));
    while (i < decl.size() && std::isspace(static_cast<unsigned char>(decl[i])))
      ++i;
    if (!boundary || i >= decl.size() || decl[i] != '=')
    {
      pos += name.size();
      continue;
    }
    ++i;
    while (i < decl.size() && std::isspace(static_cast<unsigned char>(decl[i])))
      ++i;
    if (i >= decl.size() || (decl[i] != '"' && decl[i] != '\''))
      return {};
    const char quote = decl[i];
    const auto end = decl.find(quote, i + 1);
    if (end == std::string::npos)
      return {};
    return decl.substr(i + 1, end - i - 1);
  }
  return {};
}

std::size_t count_elements(const tinyxml2::XMLElement* e)
{
  std::size_t n = 1;
  for (const auto* c = e->FirstChildElement(); c; c = c->NextSiblingElement())
    n += count_elements(c);
  return n;
}

}  // namespace

bool isValidXml(const std::string& filename)
{
  return load(filename) != nullptr;
}

bool isAutosarXml(const std::string& filename)
{
  auto doc = load(filename);
  if (!doc)
    return false;

  const auto* root = doc->RootElement();
  const std::string_view name = local_name(root);
  if (name == "AUTOSAR" || name == "MSRSW")
    return true;

  for (const auto& kv : declared_namespaces(root))
  {
    if (to_lower_copy(kv.second).find("autosar") != std::string::npos)
      return true;
  }
  return false;
}

XmlInfo getXmlInfo(const std::string& filename)
{
  XmlInfo info;
  auto doc = load(filename, &info.error);
  if (!doc)
    return info;

  const auto* root = doc->RootElement();
  info.valid = true;
  info.root_element = std::string(local_name(root));
  info.namespace_uri = namespace_uri(root);
  info.namespaces = declared_namespaces(root);
  info.element_count = count_elements(root);

  for (const auto* n = doc->FirstChild(); n; n = n->NextSibling())
  {
    if (const auto* decl = n->ToDeclaration())
    {
      const std::string text = decl->Value() ? decl->Value() : "";
      info.xml_version = pseudo_attribute(text, "version");
      info.encoding = pseudo_attribute(text, "encoding");
      break;
    }
  }
  return info;
}

}  // namespace xml
}  // namespace arxml
