#ifndef BLUEPRINT_XML_MACROS_H_
#define BLUEPRINT_XML_MACROS_H_

#include <optional>
#include <string>

namespace blueprint {
namespace xml {

/// Elements of the core namespace: enum name, tag
#define BLUEPRINT_XML_CORE_ELEMENTS(X)                                                                                 \
  X(Blueprint, "blueprint")                                                                                            \
  X(Description, "description")                                                                                        \
  X(TypeConverters, "type-converters")                                                                                 \
  X(Bean, "bean")                                                                                                      \
  X(Argument, "argument")                                                                                              \
  X(Property, "property")                                                                                              \
  X(Ref, "ref")                                                                                                        \
  X(IdRef, "idref")                                                                                                    \
  X(Value, "value")                                                                                                    \
  X(List, "list")                                                                                                      \
  X(Set, "set")                                                                                                        \
  X(Array, "array")                                                                                                    \
  X(Map, "map")                                                                                                        \
  X(Entry, "entry")                                                                                                    \
  X(Key, "key")                                                                                                        \
  X(Props, "props")                                                                                                    \
  X(Prop, "prop")                                                                                                      \
  X(Null, "null")

enum class CoreElement
{
#define X(name, tag) name,
  BLUEPRINT_XML_CORE_ELEMENTS(X)
#undef X
      COUNT
};

inline std::optional<CoreElement> coreElementFromString(const std::string& tag)
{
#define X(name, str)                                                                                                   \
  if (tag == str)                                                                                                      \
    return CoreElement::name;
  BLUEPRINT_XML_CORE_ELEMENTS(X)
#undef X
  return std::nullopt;
}

/// Core elements that may appear where a value is expected
inline bool isValueElement(CoreElement element)
{
  switch (element)
  {
    case CoreElement::Bean:
    case CoreElement::Ref:
    case CoreElement::IdRef:
    case CoreElement::Value:
    case CoreElement::List:
    case CoreElement::Set:
    case CoreElement::Array:
    case CoreElement::Map:
    case CoreElement::Props:
    case CoreElement::Null:
      return true;
    default:
      return false;
  }
}

}  // namespace xml
}  // namespace blueprint

#endif  // BLUEPRINT_XML_MACROS_H_
