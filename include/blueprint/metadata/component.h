#ifndef BLUEPRINT_METADATA_COMPONENT_H_
#define BLUEPRINT_METADATA_COMPONENT_H_

#include <any>
#include <optional>
#include <string>
#include <vector>

#include <blueprint/database/database.h>
#include <blueprint/metadata/metadata.h>

namespace blueprint {
namespace metadata {

enum class Activation
{
  Eager,
  Lazy
};

inline const char* activationToString(Activation activation)
{
  return activation == Activation::Lazy ? "lazy" : "eager";
}

inline std::optional<Activation> activationFromString(const std::string& s)
{
  if (s == "eager")
    return Activation::Eager;
  if (s == "lazy")
    return Activation::Lazy;
  return std::nullopt;
}

constexpr char SCOPE_SINGLETON[] = "singleton";
constexpr char SCOPE_PROTOTYPE[] = "prototype";

/// Shared by all component kinds.
struct ComponentInfo
{
  std::string id;
  Activation activation = Activation::Eager;
  std::vector<std::string> depends_on;
};

struct BeanArgument
{
  MetadataID value;
  std::string value_type;  // empty = not specified
  int index = -1;          // -1 = positional
};

struct BeanMetadata
{
  std::string class_name;
  std::string scope;
  std::string init_method;
  std::string destroy_method;
  std::string factory_method;
  std::string factory_component;  // id of the factory component, if any

  std::vector<BeanArgument> arguments;
  database::ElementMap<std::string, MetadataID> properties;

  // Extension flags set by decorators
  bool field_injection = false;
  bool processor = false;
};

/// Wraps an object supplied by the host environment (module handle, container, ...).
struct PassThroughMetadata
{
  std::any object;
};

}  // namespace metadata
}  // namespace blueprint

#endif  // BLUEPRINT_METADATA_COMPONENT_H_
