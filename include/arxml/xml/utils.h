#ifndef ARXML_XML_UTILS_H_
#define ARXML_XML_UTILS_H_

#include <string>
#include <string_view>
#include <tinyxml2.h>

namespace arxml {
namespace xml {

// Simple trim
std::string trim_copy(std::string_view s);

std::string to_lower_copy(std::string_view s);

// "ar:SHORT-NAME" -> "SHORT-NAME"
std::string_view local_name(const tinyxml2::XMLElement* e);

// "ar:SHORT-NAME" -> "ar", "SHORT-NAME" -> ""
std::string_view name_prefix(const tinyxml2::XMLElement* e);

/// Namespace URI of `e`, looked up through the xmlns declarations of its ancestors.
/// Returns an empty string for elements in no namespace.
std::string namespace_uri(const tinyxml2::XMLElement* e);

/// Trimmed text of the element, empty when it has none.
std::string element_text(const tinyxml2::XMLElement* e);

/// Last segment of an AUTOSAR reference ("/Pkg/Comp/Port" -> "Port").
std::string last_ref_segment(std::string_view ref);

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_XML_UTILS_H_
