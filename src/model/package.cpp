#include <arxml/model/package.h>

namespace arxml {
namespace model {

void Package::addComponent(Component component)
{
  component.package_path = full_path;
  components.push_back(std::move(component));
}

void Package::addInterface(Interface interface)
{
  interface.package_path = full_path;
  interfaces.push_back(std::move(interface));
}

std::vector<const Component*> Package::allComponents(bool recursive) const
{
  std::vector<const Component*> out;
  for (const auto& c : components)
    out.push_back(&c);
  if (recursive)
  {
    for (const auto& sub : sub_packages)
    {
      auto nested = sub.allComponents(true);
      out.insert(out.end(), nested.begin(), nested.end());
    }
  }
  return out;
}

const Component* Package::findComponentByName(const std::string& name, bool recursive) const
{
  for (const auto& c : components)
    if (c.short_name == name)
      return &c;

  if (recursive)
  {
    for (const auto& sub : sub_packages)
      if (const auto* found = sub.findComponentByName(name, true))
        return found;
  }
  return nullptr;
}

std::vector<std::string> Package::pathSegments() const
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : full_path)
  {
    if (c == '/')
    {
      if (!cur.empty())
        out.push_back(cur), cur.clear();
    }
    else
      cur.push_back(c);
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

std::size_t Package::depth() const
{
  return pathSegments().size();
}

}  // namespace model
}  // namespace arxml
