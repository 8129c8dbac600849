#include <arxml/model/interface.h>

namespace arxml {
namespace model {

std::string Operation::signature() const
{
  std::string out = short_name + "(";
  for (std::size_t i = 0; i < arguments.size(); ++i)
  {
    if (i > 0)
      out += ", ";
    out += arguments[i].short_name + ": " + arguments[i].data_type.name;
  }
  return out + ")";
}

const DataElement* Interface::findDataElement(const std::string& name) const
{
  for (const auto& e : data_elements)
    if (e.short_name == name)
      return &e;
  return nullptr;
}

const Operation* Interface::findOperation(const std::string& name) const
{
  for (const auto& op : operations)
    if (op.short_name == name)
      return &op;
  return nullptr;
}

}  // namespace model
}  // namespace arxml
