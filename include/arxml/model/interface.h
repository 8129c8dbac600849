#ifndef ARXML_MODEL_INTERFACE_H_
#define ARXML_MODEL_INTERFACE_H_

#include <string>
#include <vector>

#include <arxml/model/identifier.h>
#include <arxml/model/types.h>

namespace arxml {
namespace model {

/// Data type named by a <TYPE-TREF>; "Unknown" with an empty reference when absent.
struct DataTypeRef
{
  std::string name = "Unknown";
  std::string type_ref;

  bool isKnown() const
  {
    return !type_ref.empty();
  }
};

/// Variable data prototype of a sender-receiver or NV data interface
struct DataElement
{
  std::string short_name;
  std::string desc;
  DataTypeRef data_type;
};

struct OperationArgument
{
  std::string short_name;
  std::string desc;
  ArgumentDirection direction = ArgumentDirection::In;
  DataTypeRef data_type;

  bool isInput() const
  {
    return direction == ArgumentDirection::In || direction == ArgumentDirection::InOut;
  }

  bool isOutput() const
  {
    return direction == ArgumentDirection::Out || direction == ArgumentDirection::InOut;
  }
};

/// Client-server operation with its arguments in document order
struct Operation
{
  std::string short_name;
  std::string desc;
  std::vector<OperationArgument> arguments;

  /// e.g. "ReadDtc(Id: uint16, Status: uint8)"
  std::string signature() const;
};

struct Interface
{
  std::string uuid = generateUuid();
  std::string short_name;
  InterfaceType type = InterfaceType::SenderReceiver;
  std::string desc;
  std::string package_path;

  std::vector<DataElement> data_elements;  // sender-receiver, NV data
  std::vector<Operation> operations;       // client-server
  std::vector<std::string> triggers;       // trigger
  std::vector<std::string> mode_groups;    // mode switch

  std::string referencePath() const
  {
    return package_path + "/" + short_name;
  }

  const DataElement* findDataElement(const std::string& name) const;
  const Operation* findOperation(const std::string& name) const;
};

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_INTERFACE_H_
