#ifndef ARXML_MODEL_IDENTIFIER_H_
#define ARXML_MODEL_IDENTIFIER_H_

#include <string>

namespace arxml {
namespace model {

/// Random (version 4) UUID in its canonical 36 character form.
std::string generateUuid();

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_IDENTIFIER_H_
