#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include <arxml/arxml_parser.h>
#include <arxml/xml/utils.h>

using namespace tinyxml2;

namespace arxml {

namespace {

bool endsWith(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "<component>.<port>" of an endpoint, from the references as written
std::string endpointLabel(const model::ConnectionEndpoint& ep)
{
  return xml::last_ref_segment(ep.component_ref) + "." + xml::last_ref_segment(ep.port_ref);
}

std::string formatSeconds(double seconds)
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << seconds << "s";
  return oss.str();
}

}  // namespace

std::string detectAutosarVersion(const XMLElement* root)
{
  if (!root)
    return "Unknown";

  for (const XMLAttribute* attr = root->FirstAttribute(); attr; attr = attr->Next())
  {
    std::string_view name = attr->Name();
    if (name != "schemaLocation" && !endsWith(name, ":schemaLocation"))
      continue;

    std::string_view value = attr->Value();
    auto pos = value.find("AUTOSAR_");
    if (pos == std::string_view::npos)
      continue;
    pos += 8;

    std::string token;
    while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '-'))
      token.push_back(value[pos++]);
    if (token.empty() || token.front() == '-' || token.back() == '-')
      continue;

    if (token.find('-') == std::string::npos)
      return "R" + token;  // release number, e.g. AUTOSAR_00046
    std::replace(token.begin(), token.end(), '-', '.');
    return token;
  }
  return "Unknown";
}

ArxmlParser::ArxmlParser(const ParserOptions& options)
  : options_(options), logger_(options.log_level), resolver_(options.namespace_prefix)
{
}

ArxmlParser::~ArxmlParser() = default;

void ArxmlParser::reset()
{
  connections_.clear();
  interfaces_.clear();
  stats_ = ParseStatistics();
  debug_ = ParseDebugInfo();
  pending_.clear();
  components_by_uuid_.clear();
  components_by_path_.clear();
  components_by_name_.clear();
  query_.reset();
  resolver_ = xml::NamespaceResolver(options_.namespace_prefix);
}

ParseResult ArxmlParser::parseFile(const std::string& filename)
{
  reset();
  auto start = std::chrono::steady_clock::now();

  std::error_code ec;
  if (!std::filesystem::exists(filename, ec))
    throw ParseError(filename, "File not found");
  if (std::filesystem::is_directory(filename, ec))
    throw ParseError(filename, "Not a regular file");

  std::uintmax_t file_size = std::filesystem::file_size(filename, ec);
  if (ec)
    file_size = 0;

  logger_.info("Starting ARXML parsing: " + filename + " (" + std::to_string(file_size) + " bytes)");

  doc_ = std::make_unique<XMLDocument>();
  XMLError err = doc_->LoadFile(filename.c_str());
  if (err != XML_SUCCESS)
  {
    std::string msg = doc_->ErrorStr();
    doc_.reset();
    if (err == XML_ERROR_FILE_COULD_NOT_BE_OPENED)
      throw ParseError(filename, "Cannot open file: " + msg);
    if (err == XML_ERROR_FILE_READ_ERROR)
      throw ParseError(filename, "Cannot read file: " + msg);
    throw ParseError(filename, "XML syntax error: " + msg);
  }

  return parseDocument(filename, file_size, start);
}

ParseResult ArxmlParser::parseText(const std::string& text, const std::string& source_name)
{
  reset();
  auto start = std::chrono::steady_clock::now();

  logger_.info("Starting ARXML parsing: " + source_name + " (" + std::to_string(text.size()) + " bytes)");

  doc_ = std::make_unique<XMLDocument>();
  if (doc_->Parse(text.c_str(), text.size()) != XML_SUCCESS)
  {
    std::string msg = doc_->ErrorStr();
    doc_.reset();
    throw ParseError(source_name, "XML syntax error: " + msg);
  }

  return parseDocument(source_name, text.size(), start);
}

ParseResult ArxmlParser::parseDocument(const std::string& source, std::uintmax_t file_size,
                                       std::chrono::steady_clock::time_point start)
{
  const XMLElement* root = doc_->RootElement();
  if (!root)
    throw ParseError(source, "Document has no root element");

  resolver_.extractNamespaces(root);
  query_ = std::make_unique<xml::QueryHelper>(resolver_, logger_);

  ParseResult result;
  for (const auto* pkg_elem : query_->findElements(root, "AR-PACKAGES/AR-PACKAGE"))
    result.packages.push_back(parsePackage(pkg_elem, ""));

  if (options_.resolve_compositions)
  {
    indexComponents(result.packages);
    resolveCompositions();
  }
  if (options_.parse_interfaces)
    resolveInterfaceRefs(result.packages);

  // Lookup tables point into result.packages, which is about to be moved out
  components_by_uuid_.clear();
  components_by_path_.clear();
  components_by_name_.clear();
  pending_.clear();

  stats_.connections_parsed = connections_.size();
  stats_.parse_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

  result.metadata.file_path = source;
  result.metadata.file_size = file_size;
  result.metadata.autosar_version = detectAutosarVersion(root);
  result.metadata.namespaces = resolver_.namespaces();
  result.metadata.statistics = stats_;
  result.metadata.debug_info = debug_;

  logger_.info("ARXML parsing completed in " + formatSeconds(stats_.parse_time));
  logger_.info("Parsed: " + std::to_string(stats_.packages_parsed) + " packages, " +
               std::to_string(stats_.components_parsed) + " components, " + std::to_string(stats_.ports_parsed) +
               " ports, " + std::to_string(stats_.connections_parsed) + " connections");
  return result;
}

std::string ArxmlParser::shortName(const XMLElement* elem)
{
  std::string name = query_->getText(elem, "SHORT-NAME");
  if (name.empty())
  {
    ++stats_.missing_short_names;
    logger_.debug("<" + std::string(xml::local_name(elem)) + "> at line " + std::to_string(elem->GetLineNum()) +
                  " has no SHORT-NAME");
  }
  return name;
}

model::Package ArxmlParser::parsePackage(const XMLElement* elem, const std::string& parent_path)
{
  model::Package pkg;
  pkg.short_name = shortName(elem);
  pkg.full_path = parent_path + "/" + pkg.short_name;
  pkg.desc = query_->getText(elem, "DESC/L-2");
  ++stats_.packages_parsed;

  if (const auto* elements = query_->findElement(elem, "ELEMENTS"))
    parseElements(elements, pkg);

  for (const auto* sub : query_->findElements(elem, "SUB-PACKAGES/AR-PACKAGE"))
    pkg.sub_packages.push_back(parsePackage(sub, pkg.full_path));

  return pkg;
}

void ArxmlParser::parseElements(const XMLElement* elements, model::Package& pkg)
{
  for (const auto* child : query_->findElements(elements, "*"))
  {
    std::string_view tag = xml::local_name(child);

    model::ComponentType ctype = model::componentTypeFromTag(tag);
    if (ctype != model::ComponentType::Unknown)
    {
      pkg.addComponent(parseComponent(child, ctype, pkg.full_path));
      ++stats_.components_parsed;
      continue;
    }

    model::InterfaceType itype = model::interfaceTypeFromTag(tag);
    if (itype != model::InterfaceType::Unknown && options_.parse_interfaces)
    {
      model::Interface intf = parseInterface(child, itype);
      pkg.addInterface(intf);
      interfaces_.push_back(pkg.interfaces.back());
      ++stats_.interfaces_parsed;
      continue;
    }

    if (endsWith(tag, "-SW-COMPONENT-TYPE"))
    {
      ++stats_.unknown_component_types;
      logger_.debug("Unsupported component type <" + std::string(tag) + "> in " + pkg.full_path);
      continue;
    }

    ++stats_.elements_skipped;
    logger_.debug("Skipping <" + std::string(tag) + "> in " + pkg.full_path);
  }
}

model::Component ArxmlParser::parseComponent(const XMLElement* elem, model::ComponentType type,
                                             const std::string& package_path)
{
  model::Component component;
  component.type = type;
  component.short_name = shortName(elem);
  component.desc = query_->getText(elem, "DESC/L-2");
  component.package_path = package_path;

  if (const auto* ports = query_->findElement(elem, "PORTS"))
    parsePorts(ports, component);

  if (component.isComposition())
  {
    ++debug_.composition_found;
    for (const auto* proto_elem : query_->findElements(elem, "COMPONENTS/SW-COMPONENT-PROTOTYPE"))
    {
      model::ComponentPrototype proto;
      proto.short_name = shortName(proto_elem);
      proto.type_ref = query_->getText(proto_elem, "TYPE-TREF");
      component.prototypes.push_back(std::move(proto));
    }
    pending_.push_back({ component.uuid, query_->findElement(elem, "CONNECTORS") });
  }

  return component;
}

void ArxmlParser::parsePorts(const XMLElement* ports, model::Component& component)
{
  for (const auto* port_elem : query_->findElements(ports, "*"))
  {
    std::string_view tag = xml::local_name(port_elem);
    model::PortDirection direction = model::portDirectionFromTag(tag);
    if (direction == model::PortDirection::Unknown)
    {
      ++stats_.unknown_port_tags;
      logger_.debug("Skipping port <" + std::string(tag) + "> of " + component.short_name);
      continue;
    }

    model::Port port;
    port.short_name = shortName(port_elem);
    port.direction = direction;
    port.desc = query_->getText(port_elem, "DESC/L-2");
    port.interface_ref = query_->getText(port_elem, "*[contains(local-name(),'INTERFACE-TREF')]");
    component.addPort(std::move(port));
    ++stats_.ports_parsed;
  }
}

model::Interface ArxmlParser::parseInterface(const XMLElement* elem, model::InterfaceType type)
{
  model::Interface intf;
  intf.type = type;
  intf.short_name = shortName(elem);
  intf.desc = query_->getText(elem, "DESC/L-2");

  auto collect = [&](const std::string& path, std::vector<std::string>& out) {
    for (const auto* e : query_->findElements(elem, path))
      out.push_back(shortName(e));
  };

  switch (type)
  {
    case model::InterfaceType::SenderReceiver:
      intf.data_elements = parseDataElements(elem, "DATA-ELEMENTS/VARIABLE-DATA-PROTOTYPE");
      break;
    case model::InterfaceType::NvData:
      intf.data_elements = parseDataElements(elem, "NV-DATAS/VARIABLE-DATA-PROTOTYPE");
      break;
    case model::InterfaceType::ClientServer:
      for (const auto* op : query_->findElements(elem, "OPERATIONS/CLIENT-SERVER-OPERATION"))
        intf.operations.push_back(parseOperation(op));
      break;
    case model::InterfaceType::Trigger:
      collect("TRIGGERS/TRIGGER", intf.triggers);
      break;
    case model::InterfaceType::ModeSwitch:
      collect("MODE-GROUP", intf.mode_groups);
      break;
    default:
      break;
  }
  return intf;
}

std::vector<model::DataElement> ArxmlParser::parseDataElements(const XMLElement* elem, const std::string& path)
{
  std::vector<model::DataElement> out;
  for (const auto* e : query_->findElements(elem, path))
  {
    model::DataElement de;
    de.short_name = shortName(e);
    de.desc = query_->getText(e, "DESC/L-2");
    de.data_type = parseDataType(e);
    out.push_back(std::move(de));
  }
  return out;
}

model::Operation ArxmlParser::parseOperation(const XMLElement* elem)
{
  model::Operation op;
  op.short_name = shortName(elem);
  op.desc = query_->getText(elem, "DESC/L-2");

  for (const auto* arg_elem : query_->findElements(elem, "ARGUMENTS/ARGUMENT-DATA-PROTOTYPE"))
  {
    model::OperationArgument arg;
    arg.short_name = shortName(arg_elem);
    arg.desc = query_->getText(arg_elem, "DESC/L-2");
    arg.data_type = parseDataType(arg_elem);

    std::string direction = query_->getText(arg_elem, "DIRECTION");
    std::transform(direction.begin(), direction.end(), direction.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    arg.direction = model::argumentDirectionFromTag(direction);
    if (arg.direction == model::ArgumentDirection::Unknown)
    {
      if (!direction.empty())
        logger_.debug("Argument " + op.short_name + "/" + arg.short_name + " has unknown direction '" + direction +
                      "', assuming IN");
      arg.direction = model::ArgumentDirection::In;
    }
    op.arguments.push_back(std::move(arg));
  }
  return op;
}

model::DataTypeRef ArxmlParser::parseDataType(const XMLElement* elem)
{
  model::DataTypeRef type;
  type.type_ref = query_->getText(elem, "TYPE-TREF");
  if (!type.type_ref.empty())
    type.name = xml::last_ref_segment(type.type_ref);
  return type;
}

void ArxmlParser::indexComponents(std::vector<model::Package>& packages)
{
  for (auto& pkg : packages)
  {
    for (auto& component : pkg.components)
    {
      components_by_uuid_[component.uuid] = &component;
      components_by_path_.emplace(component.referencePath(), &component);
      if (!component.short_name.empty())
        components_by_name_.emplace(component.short_name, &component);  // first one wins
    }
    indexComponents(pkg.sub_packages);
  }
}

model::Component* ArxmlParser::lookupComponent(const std::string& ref) const
{
  if (ref.empty())
    return nullptr;

  auto by_path = components_by_path_.find(ref);
  if (by_path != components_by_path_.end())
    return by_path->second;

  auto by_name = components_by_name_.find(xml::last_ref_segment(ref));
  if (by_name != components_by_name_.end())
    return by_name->second;
  return nullptr;
}

void ArxmlParser::resolveCompositions()
{
  std::unordered_set<std::string> instantiated;

  for (const auto& pending : pending_)
  {
    auto it = components_by_uuid_.find(pending.component_uuid);
    if (it == components_by_uuid_.end())
      continue;
    model::Component& composition = *it->second;

    for (auto& proto : composition.prototypes)
    {
      ++debug_.prototypes_attempted;
      if (const auto* type = lookupComponent(proto.type_ref))
      {
        proto.type_uuid = type->uuid;
        instantiated.insert(type->uuid);
        ++debug_.prototypes_successful;
      }
      else
      {
        logger_.warning("Cannot resolve prototype " + composition.short_name + "/" + proto.short_name + " -> '" +
                        proto.type_ref + "'");
      }
    }

    if (!pending.connectors)
      continue;

    for (const auto* connector : query_->findElements(pending.connectors, "*"))
      resolveConnector(composition, connector);
  }

  for (const auto& [uuid, component] : components_by_uuid_)
    if (!instantiated.count(uuid))
      ++debug_.standalone_components;
}

void ArxmlParser::resolveConnector(model::Component& composition, const XMLElement* connector)
{
  std::string_view tag = xml::local_name(connector);
  model::ConnectionType type = model::connectionTypeFromTag(tag);
  if (type == model::ConnectionType::Unknown)
  {
    ++debug_.connectors_skipped;
    logger_.debug("Skipping connector <" + std::string(tag) + "> in " + composition.short_name);
    return;
  }

  model::Connection conn;
  conn.type = type;
  conn.short_name = query_->getText(connector, "SHORT-NAME");
  conn.composition_uuid = composition.uuid;

  switch (type)
  {
    case model::ConnectionType::Assembly:
      conn.provider = resolveInnerEndpoint(composition, query_->findElement(connector, "PROVIDER-IREF"),
                                           "TARGET-P-PORT-REF", model::PortDirection::Provided);
      conn.requester = resolveInnerEndpoint(composition, query_->findElement(connector, "REQUESTER-IREF"),
                                            "TARGET-R-PORT-REF", model::PortDirection::Required);
      break;

    case model::ConnectionType::Delegation:
    {
      // <INNER-PORT-IREF> wraps a P- or R-PORT-IN-COMPOSITION-INSTANCE-REF
      const XMLElement* inner_iref = query_->findElement(connector, "INNER-PORT-IREF/*");
      bool inner_provided = inner_iref && xml::local_name(inner_iref).substr(0, 2) == "P-";

      model::ConnectionEndpoint inner =
          inner_provided ?
              resolveInnerEndpoint(composition, inner_iref, "TARGET-P-PORT-REF", model::PortDirection::Provided) :
              resolveInnerEndpoint(composition, inner_iref, "TARGET-R-PORT-REF", model::PortDirection::Required);
      model::ConnectionEndpoint outer =
          resolveOuterEndpoint(composition, query_->getText(connector, "OUTER-PORT-REF"));

      conn.provider = inner_provided ? inner : outer;
      conn.requester = inner_provided ? outer : inner;
      break;
    }

    case model::ConnectionType::PassThrough:
      conn.provider = resolveOuterEndpoint(composition, query_->getText(connector, "PROVIDED-OUTER-PORT-REF"));
      conn.requester = resolveOuterEndpoint(composition, query_->getText(connector, "REQUIRED-OUTER-PORT-REF"));
      break;

    default:
      break;
  }

  if (conn.short_name.empty())
    conn.short_name = endpointLabel(conn.provider) + "->" + endpointLabel(conn.requester);

  composition.connection_uuids.push_back(conn.uuid);
  connections_.push_back(std::move(conn));
}

model::ConnectionEndpoint ArxmlParser::resolveInnerEndpoint(const model::Component& composition,
                                                            const XMLElement* iref, const std::string& target_tag,
                                                            model::PortDirection direction)
{
  model::ConnectionEndpoint ep;
  ++debug_.prototypes_attempted;

  if (!iref)
  {
    ++debug_.endpoints_unresolved;
    logger_.warning("Connector endpoint without instance reference in " + composition.short_name);
    return ep;
  }

  ep.component_ref = query_->getText(iref, "CONTEXT-COMPONENT-REF");
  ep.port_ref = query_->getText(iref, target_tag);

  // A matching prototype decides the target alone. Without one, only an exact
  // component path is accepted.
  const model::Component* target = nullptr;
  if (const auto* proto = composition.findPrototype(xml::last_ref_segment(ep.component_ref)))
  {
    ep.prototype_uuid = proto->uuid;
    if (proto->isResolved())
    {
      auto it = components_by_uuid_.find(proto->type_uuid);
      if (it != components_by_uuid_.end())
        target = it->second;
    }
  }
  else
  {
    auto it = components_by_path_.find(ep.component_ref);
    if (it != components_by_path_.end())
      target = it->second;
  }

  if (target)
  {
    ep.component_uuid = target->uuid;
    ++debug_.prototypes_successful;

    std::string port_name = xml::last_ref_segment(ep.port_ref);
    const model::Port* port = target->findPort(port_name, direction);
    if (!port)
      port = target->findPort(port_name);
    if (port)
      ep.port_uuid = port->uuid;
  }

  if (!ep.isResolved())
  {
    ++debug_.endpoints_unresolved;
    logger_.warning("Unresolved connector endpoint " + endpointLabel(ep) + " in " + composition.short_name);
  }
  return ep;
}

model::ConnectionEndpoint ArxmlParser::resolveOuterEndpoint(const model::Component& composition,
                                                            const std::string& port_ref)
{
  model::ConnectionEndpoint ep;
  ep.component_ref = composition.referencePath();
  ep.port_ref = port_ref;
  ep.component_uuid = composition.uuid;

  if (const auto* port = composition.findPort(xml::last_ref_segment(port_ref)))
    ep.port_uuid = port->uuid;

  if (!ep.isResolved())
  {
    ++debug_.endpoints_unresolved;
    logger_.warning("Unresolved outer port '" + port_ref + "' of " + composition.short_name);
  }
  return ep;
}

void ArxmlParser::resolveInterfaceRefs(std::vector<model::Package>& packages)
{
  std::unordered_map<std::string, const model::Interface*> by_path;
  std::unordered_map<std::string, const model::Interface*> by_name;
  for (const auto& intf : interfaces_)
  {
    by_path.emplace(intf.referencePath(), &intf);
    if (!intf.short_name.empty())
      by_name.emplace(intf.short_name, &intf);
  }
  if (by_path.empty())
    return;

  auto resolve = [&](auto& self, std::vector<model::Package>& pkgs) -> void {
    for (auto& pkg : pkgs)
    {
      for (auto& component : pkg.components)
      {
        for (auto& port : component.ports)
        {
          if (port.interface_ref.empty())
            continue;

          const model::Interface* found = nullptr;
          auto it = by_path.find(port.interface_ref);
          if (it != by_path.end())
            found = it->second;
          else
          {
            auto by_last = by_name.find(xml::last_ref_segment(port.interface_ref));
            if (by_last != by_name.end())
              found = by_last->second;
          }

          if (found)
          {
            port.interface_uuid = found->uuid;
            ++debug_.interface_refs_resolved;
          }
          else
            logger_.debug("Interface '" + port.interface_ref + "' of port " + port.short_name + " not found");
        }
      }
      self(self, pkg.sub_packages);
    }
  };
  resolve(resolve, packages);
}

}  // namespace arxml
