#ifndef ARXML_ARXML_PARSER_H_
#define ARXML_ARXML_PARSER_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <tinyxml2.h>

#include <arxml/errors.h>
#include <arxml/log.h>
#include <arxml/parser_options.h>
#include <arxml/model/component.h>
#include <arxml/model/connection.h>
#include <arxml/model/interface.h>
#include <arxml/model/package.h>
#include <arxml/xml/namespace_resolver.h>
#include <arxml/xml/query_helper.h>

namespace arxml {

struct ParseStatistics
{
  std::size_t packages_parsed = 0;  // nested packages included
  std::size_t components_parsed = 0;
  std::size_t ports_parsed = 0;
  std::size_t connections_parsed = 0;
  std::size_t interfaces_parsed = 0;

  std::size_t elements_skipped = 0;         // unhandled children of <ELEMENTS>
  std::size_t unknown_component_types = 0;  // *-SW-COMPONENT-TYPE tags not modeled
  std::size_t unknown_port_tags = 0;        // children of <PORTS> other than P-/R-PORT-PROTOTYPE
  std::size_t missing_short_names = 0;

  double parse_time = 0.0;  // seconds
};

struct ParseDebugInfo
{
  std::size_t composition_found = 0;
  std::size_t prototypes_attempted = 0;   // TYPE-TREFs and connector endpoints
  std::size_t prototypes_successful = 0;
  std::size_t standalone_components = 0;  // not instantiated by any composition
  std::size_t connectors_skipped = 0;
  std::size_t endpoints_unresolved = 0;
  std::size_t interface_refs_resolved = 0;
};

struct ParseMetadata
{
  std::string file_path;
  std::uintmax_t file_size = 0;
  std::string autosar_version = "Unknown";
  xml::NamespaceMap namespaces;
  ParseStatistics statistics;
  ParseDebugInfo debug_info;
};

struct ParseResult
{
  std::vector<model::Package> packages;  // root packages, document order
  ParseMetadata metadata;
};

/// "AUTOSAR_4-3-0.xsd" -> "4.3.0", "AUTOSAR_00046.xsd" -> "R00046", otherwise "Unknown".
std::string detectAutosarVersion(const tinyxml2::XMLElement* root);

/**
 * @brief Reads ARXML documents into a package forest.
 *
 * Two passes: the package tree (components, ports, interfaces) is built first, then
 * composition prototypes, connectors and port interface references are resolved
 * against lookup tables over the finished tree.
 *
 * Only unreadable files and XML syntax errors throw (ParseError). Anything
 * structurally unexpected is skipped and counted in the metadata.
 *
 * Not safe for concurrent use; separate instances share nothing.
 */
class ArxmlParser
{
public:
  ArxmlParser(const ParserOptions& options = ParserOptions());
  ~ArxmlParser();

  ParseResult parseFile(const std::string& filename);

  // Same as parseFile on an in-memory document
  ParseResult parseText(const std::string& text, const std::string& source_name = "<text>");

  /// Connectors of the last parse. Empty before the first parse and after a failed one.
  const std::vector<model::Connection>& getParsedConnections() const
  {
    return connections_;
  }

  /// Copies of the interfaces of the last parse, flattened in document order.
  const std::vector<model::Interface>& getParsedInterfaces() const
  {
    return interfaces_;
  }

  const ParseStatistics& getStatistics() const
  {
    return stats_;
  }

  const ParserOptions& options() const
  {
    return options_;
  }

private:
  struct PendingComposition
  {
    std::string component_uuid;
    const tinyxml2::XMLElement* connectors;  // may be null
  };

  void reset();
  ParseResult parseDocument(const std::string& source, std::uintmax_t file_size,
                            std::chrono::steady_clock::time_point start);

  model::Package parsePackage(const tinyxml2::XMLElement* elem, const std::string& parent_path);
  void parseElements(const tinyxml2::XMLElement* elements, model::Package& pkg);
  model::Component parseComponent(const tinyxml2::XMLElement* elem, model::ComponentType type,
                                  const std::string& package_path);
  void parsePorts(const tinyxml2::XMLElement* ports, model::Component& component);
  model::Interface parseInterface(const tinyxml2::XMLElement* elem, model::InterfaceType type);
  std::vector<model::DataElement> parseDataElements(const tinyxml2::XMLElement* elem, const std::string& path);
  model::Operation parseOperation(const tinyxml2::XMLElement* elem);
  model::DataTypeRef parseDataType(const tinyxml2::XMLElement* elem);
  std::string shortName(const tinyxml2::XMLElement* elem);

  // second pass
  void indexComponents(std::vector<model::Package>& packages);
  model::Component* lookupComponent(const std::string& ref) const;
  void resolveCompositions();
  void resolveConnector(model::Component& composition, const tinyxml2::XMLElement* connector);
  model::ConnectionEndpoint resolveInnerEndpoint(const model::Component& composition,
                                                 const tinyxml2::XMLElement* iref, const std::string& target_tag,
                                                 model::PortDirection direction);
  model::ConnectionEndpoint resolveOuterEndpoint(const model::Component& composition, const std::string& port_ref);
  void resolveInterfaceRefs(std::vector<model::Package>& packages);

  ParserOptions options_;
  Logger logger_;

  /// Pointer to the loaded XML document (lifetime is managed).
  std::unique_ptr<tinyxml2::XMLDocument> doc_;
  xml::NamespaceResolver resolver_;
  std::unique_ptr<xml::QueryHelper> query_;

  std::vector<model::Connection> connections_;
  std::vector<model::Interface> interfaces_;
  ParseStatistics stats_;
  ParseDebugInfo debug_;

  std::vector<PendingComposition> pending_;
  std::unordered_map<std::string, model::Component*> components_by_uuid_;
  std::unordered_map<std::string, model::Component*> components_by_path_;
  std::unordered_map<std::string, model::Component*> components_by_name_;
};

}  // namespace arxml

#endif  // ARXML_ARXML_PARSER_H_
