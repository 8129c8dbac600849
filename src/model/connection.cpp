#include <arxml/model/connection.h>

namespace arxml {
namespace model {

bool Connection::involvesComponent(const std::string& component_uuid) const
{
  if (component_uuid.empty())
    return false;
  return provider.component_uuid == component_uuid || requester.component_uuid == component_uuid;
}

bool Connection::involvesPort(const std::string& port_uuid) const
{
  if (port_uuid.empty())
    return false;
  return provider.port_uuid == port_uuid || requester.port_uuid == port_uuid;
}

}  // namespace model
}  // namespace arxml
