#include <arxml/model/identifier.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace arxml {
namespace model {

std::string generateUuid()
{
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

}  // namespace model
}  // namespace arxml
