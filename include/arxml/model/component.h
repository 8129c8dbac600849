#ifndef ARXML_MODEL_COMPONENT_H_
#define ARXML_MODEL_COMPONENT_H_

#include <cstddef>
#include <string>
#include <vector>

#include <arxml/model/identifier.h>
#include <arxml/model/port.h>
#include <arxml/model/types.h>

namespace arxml {
namespace model {

// Instance of a component type inside a composition (<SW-COMPONENT-PROTOTYPE>).
struct ComponentPrototype
{
  std::string uuid = generateUuid();
  std::string short_name;
  std::string type_ref;   // TYPE-TREF as written
  std::string type_uuid;  // empty when unresolved

  bool isResolved() const
  {
    return !type_uuid.empty();
  }
};

struct Component
{
  std::string uuid = generateUuid();
  std::string short_name;
  ComponentType type = ComponentType::Application;
  std::string desc;
  std::string package_path;

  // Provided and required ports, in document order
  std::vector<Port> ports;

  // Compositions only
  std::vector<ComponentPrototype> prototypes;
  std::vector<std::string> connection_uuids;

  /// Appends the port and points its component_uuid at this component.
  void addPort(Port port);

  std::vector<const Port*> providedPorts() const;
  std::vector<const Port*> requiredPorts() const;

  const Port* findPort(const std::string& name) const;
  const Port* findPort(const std::string& name, PortDirection direction) const;

  const ComponentPrototype* findPrototype(const std::string& name) const;

  std::size_t portCount() const
  {
    return ports.size();
  }

  bool isComposition() const
  {
    return type == ComponentType::Composition;
  }

  /// AUTOSAR absolute reference, e.g. "/DemoPackage/SensorComponent".
  std::string referencePath() const
  {
    return package_path + "/" + short_name;
  }
};

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_COMPONENT_H_
