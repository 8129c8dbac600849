#include <arxml/model/component.h>

namespace arxml {
namespace model {

void Component::addPort(Port port)
{
  port.component_uuid = uuid;
  ports.push_back(std::move(port));
}

std::vector<const Port*> Component::providedPorts() const
{
  std::vector<const Port*> out;
  for (const auto& p : ports)
    if (p.isProvided())
      out.push_back(&p);
  return out;
}

std::vector<const Port*> Component::requiredPorts() const
{
  std::vector<const Port*> out;
  for (const auto& p : ports)
    if (p.isRequired())
      out.push_back(&p);
  return out;
}

const Port* Component::findPort(const std::string& name) const
{
  for (const auto& p : ports)
    if (p.short_name == name)
      return &p;
  return nullptr;
}

const Port* Component::findPort(const std::string& name, PortDirection direction) const
{
  for (const auto& p : ports)
    if (p.short_name == name && p.direction == direction)
      return &p;
  return nullptr;
}

const ComponentPrototype* Component::findPrototype(const std::string& name) const
{
  for (const auto& proto : prototypes)
    if (proto.short_name == name)
      return &proto;
  return nullptr;
}

}  // namespace model
}  // namespace arxml
