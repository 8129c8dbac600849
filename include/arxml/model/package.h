#ifndef ARXML_MODEL_PACKAGE_H_
#define ARXML_MODEL_PACKAGE_H_

#include <cstddef>
#include <string>
#include <vector>

#include <arxml/model/component.h>
#include <arxml/model/identifier.h>
#include <arxml/model/interface.h>

namespace arxml {
namespace model {

/**
 * @brief One <AR-PACKAGE> and everything declared in it.
 *
 * Owns its components, interfaces and sub-packages by value, in document order.
 * There is no parent link; callers walking the tree keep their own.
 */
struct Package
{
  std::string uuid = generateUuid();
  std::string short_name;
  std::string full_path;  // "/Root/Sub"
  std::string desc;

  std::vector<Component> components;
  std::vector<Interface> interfaces;
  std::vector<Package> sub_packages;

  /// Appends the component and sets its package_path to this package.
  void addComponent(Component component);
  void addInterface(Interface interface);

  std::vector<const Component*> allComponents(bool recursive = false) const;
  const Component* findComponentByName(const std::string& name, bool recursive = false) const;

  std::vector<std::string> pathSegments() const;
  std::size_t depth() const;
};

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_PACKAGE_H_
