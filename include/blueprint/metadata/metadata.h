#ifndef BLUEPRINT_METADATA_METADATA_H_
#define BLUEPRINT_METADATA_METADATA_H_

#include <optional>
#include <string>

#include <blueprint/database/entity_id.h>

namespace blueprint {
namespace metadata {

/// Handle of a metadata node in the graph arena.
using MetadataID = database::EntityID;

/// Every node kind the parser can produce, with whether it is a component
/// (a named, registrable node) or a plain value.
#define BLUEPRINT_METADATA_KINDS(X)                                                                                    \
  X(Bean, true)                                                                                                        \
  X(PassThrough, true)                                                                                                 \
  X(Value, false)                                                                                                      \
  X(Ref, false)                                                                                                        \
  X(IdRef, false)                                                                                                      \
  X(Null, false)                                                                                                       \
  X(Collection, false)                                                                                                 \
  X(Map, false)                                                                                                        \
  X(Props, false)

enum class MetadataKind
{
#define X(name, is_component) name,
  BLUEPRINT_METADATA_KINDS(X)
#undef X
      COUNT
};

inline bool isComponentKind(MetadataKind kind)
{
  switch (kind)
  {
#define X(name, is_component)                                                                                          \
  case MetadataKind::name:                                                                                             \
    return is_component;
    BLUEPRINT_METADATA_KINDS(X)
#undef X
    default:
      return false;
  }
}

inline const char* metadataKindToString(MetadataKind kind)
{
  switch (kind)
  {
#define X(name, is_component)                                                                                          \
  case MetadataKind::name:                                                                                             \
    return #name;
    BLUEPRINT_METADATA_KINDS(X)
#undef X
    default:
      return "Unknown";
  }
}

inline std::optional<MetadataKind> metadataKindFromString(const std::string& name)
{
#define X(tag, is_component)                                                                                           \
  if (name == #tag)                                                                                                    \
    return MetadataKind::tag;
  BLUEPRINT_METADATA_KINDS(X)
#undef X
  return std::nullopt;
}

/// Attached to every node; the kind is fixed at creation.
struct NodeInfo
{
  MetadataKind kind = MetadataKind::Null;
};

}  // namespace metadata
}  // namespace blueprint

#endif  // BLUEPRINT_METADATA_METADATA_H_
