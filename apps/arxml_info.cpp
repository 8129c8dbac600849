// Prints the package tree, connections and statistics of an ARXML file.
//
// Usage: arxml-info <file> [--log-level LEVEL] [--validate-only]

#include <cstring>
#include <iostream>
#include <string>
#include <unordered_map>

#include <arxml/arxml_parser.h>
#include <arxml/xml/validator.h>

namespace {

struct Config
{
  std::string file;
  arxml::ParserOptions options = arxml::ParserOptions::fromEnvironment();
  bool validate_only = false;
};

void printUsage(const char* prog)
{
  std::cout << "Usage: " << prog << " <file> [options]\n"
            << "Options:\n"
            << "  --log-level <level>     debug, info, warning, error or off (default: warning,\n"
            << "                          or ARXML_LOG_LEVEL)\n"
            << "  --validate-only         Only check that the file is well-formed AUTOSAR XML\n"
            << "  --help, -h              Show this help message\n";
}

bool parseArgs(int argc, char** argv, Config& config)
{
  for (int i = 1; i < argc; ++i)
  {
    const char* arg = argv[i];

    if (std::strcmp(arg, "--log-level") == 0 || std::strncmp(arg, "--log-level=", 12) == 0)
    {
      std::string value;
      if (arg[11] == '=')
        value = arg + 12;
      else if (i + 1 < argc)
        value = argv[++i];
      else
      {
        std::cerr << "[arxml-info] Missing value for --log-level" << std::endl;
        return false;
      }

      auto level = arxml::logLevelFromString(value);
      if (!level)
      {
        std::cerr << "[arxml-info] Invalid log level: " << value << std::endl;
        return false;
      }
      config.options.log_level = *level;
    }
    else if (std::strcmp(arg, "--validate-only") == 0)
    {
      config.validate_only = true;
    }
    else if (arg[0] == '-')
    {
      std::cerr << "[arxml-info] Unknown argument: " << arg << std::endl;
      return false;
    }
    else if (config.file.empty())
    {
      config.file = arg;
    }
    else
    {
      std::cerr << "[arxml-info] Unexpected argument: " << arg << std::endl;
      return false;
    }
  }

  if (config.file.empty())
  {
    std::cerr << "[arxml-info] No input file" << std::endl;
    return false;
  }
  return true;
}

bool wantsHelp(int argc, char** argv)
{
  for (int i = 1; i < argc; ++i)
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
      return true;
  return false;
}

// uuid -> "Component" or "Component.port"
using NameIndex = std::unordered_map<std::string, std::string>;

void indexNames(const std::vector<arxml::model::Package>& packages, NameIndex& names)
{
  for (const auto& pkg : packages)
  {
    for (const auto& component : pkg.components)
    {
      names[component.uuid] = component.short_name;
      for (const auto& port : component.ports)
        names[port.uuid] = component.short_name + "." + port.short_name;
    }
    indexNames(pkg.sub_packages, names);
  }
}

void printPackage(const arxml::model::Package& pkg, int depth)
{
  std::string indent(depth * 2, ' ');
  std::cout << indent << "Package " << pkg.full_path;
  if (!pkg.desc.empty())
    std::cout << "  (" << pkg.desc << ")";
  std::cout << "\n";

  for (const auto& intf : pkg.interfaces)
  {
    std::cout << indent << "  Interface " << intf.short_name << " [" << arxml::model::interfaceTypeToString(intf.type)
              << "]\n";
    for (const auto& de : intf.data_elements)
      std::cout << indent << "    " << de.short_name << ": " << de.data_type.name << "\n";
    for (const auto& op : intf.operations)
      std::cout << indent << "    " << op.signature() << "\n";
  }

  for (const auto& component : pkg.components)
  {
    std::cout << indent << "  Component " << component.short_name << " ["
              << arxml::model::componentTypeToString(component.type) << "]\n";
    for (const auto& port : component.ports)
    {
      std::cout << indent << "    " << (port.isProvided() ? "P " : "R ") << port.short_name;
      if (!port.interface_ref.empty())
        std::cout << " : " << port.interface_ref << (port.interface_uuid.empty() ? " (unresolved)" : "");
      std::cout << "\n";
    }
    for (const auto& proto : component.prototypes)
      std::cout << indent << "    Prototype " << proto.short_name << " -> " << proto.type_ref
                << (proto.isResolved() ? "" : " (unresolved)") << "\n";
  }

  for (const auto& sub : pkg.sub_packages)
    printPackage(sub, depth + 1);
}

std::string endpointName(const arxml::model::ConnectionEndpoint& ep, const NameIndex& names)
{
  auto it = names.find(ep.port_uuid);
  if (it != names.end())
    return it->second;
  return "?" + ep.component_ref + "/" + ep.port_ref;
}

int validateOnly(const std::string& file)
{
  arxml::xml::XmlInfo info = arxml::xml::getXmlInfo(file);
  if (!info.valid)
  {
    std::cerr << "[arxml-info] " << file << ": " << info.error << std::endl;
    return 1;
  }

  std::cout << "File:        " << file << "\n"
            << "Root:        " << info.root_element << "\n"
            << "Namespace:   " << (info.namespace_uri.empty() ? "(none)" : info.namespace_uri) << "\n"
            << "XML version: " << (info.xml_version.empty() ? "(undeclared)" : info.xml_version) << "\n"
            << "Encoding:    " << (info.encoding.empty() ? "(undeclared)" : info.encoding) << "\n"
            << "Elements:    " << info.element_count << "\n"
            << "AUTOSAR:     " << (arxml::xml::isAutosarXml(file) ? "yes" : "no") << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  if (wantsHelp(argc, argv))
  {
    printUsage(argv[0]);
    return 0;
  }

  Config config;
  if (!parseArgs(argc, argv, config))
  {
    printUsage(argv[0]);
    return 2;
  }

  if (config.validate_only)
    return validateOnly(config.file);

  arxml::Logger logger(config.options.log_level);
  if (!arxml::xml::isAutosarXml(config.file) && arxml::xml::isValidXml(config.file))
    logger.warning(config.file + " does not look like an AUTOSAR document");

  arxml::ArxmlParser parser(config.options);
  arxml::ParseResult result;
  try
  {
    result = parser.parseFile(config.file);
  }
  catch (const arxml::ParseError& e)
  {
    std::cerr << "[arxml-info] " << e.what() << std::endl;
    return 1;
  }

  const auto& meta = result.metadata;
  std::cout << "File: " << meta.file_path << " (" << meta.file_size << " bytes), AUTOSAR " << meta.autosar_version
            << "\n";
  for (const auto& [prefix, uri] : meta.namespaces)
    std::cout << "  xmlns" << (prefix.empty() ? "" : ":" + prefix) << " = " << uri << "\n";

  std::cout << "\n";
  for (const auto& pkg : result.packages)
    printPackage(pkg, 0);

  NameIndex names;
  indexNames(result.packages, names);

  const auto& connections = parser.getParsedConnections();
  if (!connections.empty())
  {
    std::cout << "\nConnections:\n";
    for (const auto& conn : connections)
      std::cout << "  " << conn.short_name << " [" << arxml::model::connectionTypeToString(conn.type)
                << "]: " << endpointName(conn.provider, names) << " -> " << endpointName(conn.requester, names)
                << "\n";
  }

  const auto& s = meta.statistics;
  const auto& d = meta.debug_info;
  std::cout << "\nStatistics:\n"
            << "  packages:            " << s.packages_parsed << "\n"
            << "  components:          " << s.components_parsed << "\n"
            << "  ports:               " << s.ports_parsed << "\n"
            << "  interfaces:          " << s.interfaces_parsed << "\n"
            << "  connections:         " << s.connections_parsed << "\n"
            << "  skipped elements:    " << s.elements_skipped << "\n"
            << "  unknown components:  " << s.unknown_component_types << "\n"
            << "  unknown ports:       " << s.unknown_port_tags << "\n"
            << "  missing short names: " << s.missing_short_names << "\n"
            << "  prototypes:          " << d.prototypes_successful << "/" << d.prototypes_attempted << " resolved\n"
            << "  parse time:          " << s.parse_time << " s\n";
  return 0;
}
