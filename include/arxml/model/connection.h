#ifndef ARXML_MODEL_CONNECTION_H_
#define ARXML_MODEL_CONNECTION_H_

#include <string>

#include <arxml/model/identifier.h>
#include <arxml/model/types.h>

namespace arxml {
namespace model {

// One side of a connector. Refers to entities by uuid only; both uuids stay empty
// when the reference could not be resolved.
struct ConnectionEndpoint
{
  std::string component_ref;  // CONTEXT-COMPONENT-REF (or the composition for outer ports)
  std::string port_ref;       // TARGET-*-PORT-REF / *-OUTER-PORT-REF

  std::string component_uuid;
  std::string prototype_uuid;  // inner endpoints only, when the context matched a prototype
  std::string port_uuid;

  bool isResolved() const
  {
    return !component_uuid.empty() && !port_uuid.empty();
  }
};

struct Connection
{
  std::string uuid = generateUuid();
  std::string short_name;
  ConnectionType type = ConnectionType::Assembly;
  std::string composition_uuid;  // composition declaring the connector

  ConnectionEndpoint provider;
  ConnectionEndpoint requester;

  bool isResolved() const
  {
    return provider.isResolved() && requester.isResolved();
  }

  bool involvesComponent(const std::string& component_uuid) const;
  bool involvesPort(const std::string& port_uuid) const;
};

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_CONNECTION_H_
