#ifndef ARXML_MODEL_TYPES_H_
#define ARXML_MODEL_TYPES_H_

#include <string_view>

namespace arxml {
namespace model {

/// Component kinds recognized under <ELEMENTS>, with their ARXML tag
#define ARXML_COMPONENT_TYPES(X)                                                                                       \
  X(Application, "APPLICATION-SW-COMPONENT-TYPE")                                                                      \
  X(Composition, "COMPOSITION-SW-COMPONENT-TYPE")                                                                      \
  X(Service, "SERVICE-SW-COMPONENT-TYPE")                                                                              \
  X(SensorActuator, "SENSOR-ACTUATOR-SW-COMPONENT-TYPE")                                                               \
  X(ComplexDeviceDriver, "COMPLEX-DEVICE-DRIVER-SW-COMPONENT-TYPE")                                                    \
  X(EcuAbstraction, "ECU-ABSTRACTION-SW-COMPONENT-TYPE")                                                               \
  X(NvBlock, "NV-BLOCK-SW-COMPONENT-TYPE")                                                                             \
  X(Parameter, "PARAMETER-SW-COMPONENT-TYPE")

/// Port prototypes under <PORTS>
#define ARXML_PORT_DIRECTIONS(X)                                                                                       \
  X(Provided, "P-PORT-PROTOTYPE")                                                                                      \
  X(Required, "R-PORT-PROTOTYPE")

/// Connectors under <CONNECTORS>
#define ARXML_CONNECTION_TYPES(X)                                                                                      \
  X(Assembly, "ASSEMBLY-SW-CONNECTOR")                                                                                 \
  X(Delegation, "DELEGATION-SW-CONNECTOR")                                                                             \
  X(PassThrough, "PASS-THROUGH-SW-CONNECTOR")

/// Port interfaces under <ELEMENTS>
#define ARXML_INTERFACE_TYPES(X)                                                                                       \
  X(SenderReceiver, "SENDER-RECEIVER-INTERFACE")                                                                       \
  X(ClientServer, "CLIENT-SERVER-INTERFACE")                                                                           \
  X(Trigger, "TRIGGER-INTERFACE")                                                                                      \
  X(ModeSwitch, "MODE-SWITCH-INTERFACE")                                                                               \
  X(NvData, "NV-DATA-INTERFACE")

/// <DIRECTION> of a client-server operation argument
#define ARXML_ARGUMENT_DIRECTIONS(X)                                                                                   \
  X(In, "IN")                                                                                                          \
  X(Out, "OUT")                                                                                                        \
  X(InOut, "INOUT")

// Unknown is only ever produced by the *FromTag lookups, never stored in the model.

enum class ComponentType
{
  Unknown = 0,
#define X(name, tag) name,
  ARXML_COMPONENT_TYPES(X)
#undef X
};

enum class PortDirection
{
  Unknown = 0,
#define X(name, tag) name,
  ARXML_PORT_DIRECTIONS(X)
#undef X
};

enum class ConnectionType
{
  Unknown = 0,
#define X(name, tag) name,
  ARXML_CONNECTION_TYPES(X)
#undef X
};

enum class InterfaceType
{
  Unknown = 0,
#define X(name, tag) name,
  ARXML_INTERFACE_TYPES(X)
#undef X
};

enum class ArgumentDirection
{
  Unknown = 0,
#define X(name, tag) name,
  ARXML_ARGUMENT_DIRECTIONS(X)
#undef X
};

inline ComponentType componentTypeFromTag(std::string_view tag)
{
#define X(name, t)                                                                                                     \
  if (tag == t)                                                                                                        \
    return ComponentType::name;
  ARXML_COMPONENT_TYPES(X)
#undef X
  return ComponentType::Unknown;
}

inline const char* componentTypeToTag(ComponentType type)
{
  switch (type)
  {
#define X(name, t)                                                                                                     \
  case ComponentType::name:                                                                                            \
    return t;
    ARXML_COMPONENT_TYPES(X)
#undef X
    default:
      return "";
  }
}

inline const char* componentTypeToString(ComponentType type)
{
  switch (type)
  {
#define X(name, t)                                                                                                     \
  case ComponentType::name:                                                                                            \
    return #name;
    ARXML_COMPONENT_TYPES(X)
#undef X
    default:
      return "Unknown";
  }
}

inline PortDirection portDirectionFromTag(std::string_view tag)
{
#define X(name, t)                                                                                                     \
  if (tag == t)                                                                                                        \
    return PortDirection::name;
  ARXML_PORT_DIRECTIONS(X)
#undef X
  return PortDirection::Unknown;
}

inline const char* portDirectionToString(PortDirection direction)
{
  switch (direction)
  {
#define X(name, t)                                                                                                     \
  case PortDirection::name:                                                                                            \
    return #name;
    ARXML_PORT_DIRECTIONS(X)
#undef X
    default:
      return "Unknown";
  }
}

inline ConnectionType connectionTypeFromTag(std::string_view tag)
{
#define X(name, t)                                                                                                     \
  if (tag == t)                                                                                                        \
    return ConnectionType::name;
  ARXML_CONNECTION_TYPES(X)
#undef X
  return ConnectionType::Unknown;
}

inline const char* connectionTypeToString(ConnectionType type)
{
  switch (type)
  {
#define X(name, t)                                                                                                     \
  case ConnectionType::name:                                                                                           \
    return #name;
    ARXML_CONNECTION_TYPES(X)
#undef X
    default:
      return "Unknown";
  }
}

inline InterfaceType interfaceTypeFromTag(std::string_view tag)
{
#define X(name, t)                                                                                                     \
  if (tag == t)                                                                                                        \
    return InterfaceType::name;
  ARXML_INTERFACE_TYPES(X)
#undef X
  return InterfaceType::Unknown;
}

inline const char* interfaceTypeToString(InterfaceType type)
{
  switch (type)
  {
#define X(name, t)                                                                                                     \
  case InterfaceType::name:                                                                                            \
    return #name;
    ARXML_INTERFACE_TYPES(X)
#undef X
    default:
      return "Unknown";
  }
}

inline ArgumentDirection argumentDirectionFromTag(std::string_view tag)
{
#define X(name, t)                                                                                                     \
  if (tag == t)                                                                                                        \
    return ArgumentDirection::name;
  ARXML_ARGUMENT_DIRECTIONS(X)
#undef X
  return ArgumentDirection::Unknown;
}

inline const char* argumentDirectionToString(ArgumentDirection direction)
{
  switch (direction)
  {
#define X(name, t)                                                                                                     \
  case ArgumentDirection::name:                                                                                        \
    return #name;
    ARXML_ARGUMENT_DIRECTIONS(X)
#undef X
    default:
      return "Unknown";
  }
}

}  // namespace model
}  // namespace arxml

#endif  // ARXML_MODEL_TYPES_H_
