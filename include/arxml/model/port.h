#ifndef ARXML_MODEL_PORT_H_
#define ARXML_MODEL_PORT_H_

#include <string>

#include <arxml/model/identifier.h>
#include <arxml/model/types.h>

namespace arxml {
namespace model {

struct Port
{
  std::string uuid = generateUuid();
  std::string short_name;
  PortDirection direction = PortDirection::Provided;  // fixed by the P-/R-PORT-PROTOTYPE tag
  std::string desc;

  std::string component_uuid;  // owning component, not an ownership link

  std::string interface_ref;   // *-INTERFACE-TREF as written
  std::string interface_uuid;  // empty when unresolved

  bool isProvided() const
  {
    return direction == PortDirection::Provided;
  }
  bool isRequired() const
  {
    return direction == PortDirection::Required;
  }
};

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_PORT_H_
