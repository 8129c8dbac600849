#ifndef ARXML_XML_VALIDATOR_H_
#define ARXML_XML_VALIDATOR_H_

#include <cstddef>
#include <string>

#include <arxml/xml/namespace_resolver.h>

namespace arxml {
namespace xml {

struct XmlInfo
{
  bool valid = false;
  std::string error;  // set when !valid

  std::string root_element;   // local name
  std::string namespace_uri;  // of the root element
  std::string encoding;       // from the XML declaration, empty if undeclared
  std::string xml_version;    // idem
  NamespaceMap namespaces;    // declared on the root
  std::size_t element_count = 0;
};

// Cheap checks ahead of a full parse. None of them throw.

/// True only if the document parses without a syntax error.
bool isValidXml(const std::string& filename);

/// Root local name AUTOSAR/MSRSW, or any namespace declared on the root mentioning "autosar".
bool isAutosarXml(const std::string& filename);

XmlInfo getXmlInfo(const std::string& filename);

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_XML_VALIDATOR_H_
