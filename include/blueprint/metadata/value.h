#ifndef BLUEPRINT_METADATA_VALUE_H_
#define BLUEPRINT_METADATA_VALUE_H_

#include <string>
#include <vector>

#include <blueprint/metadata/metadata.h>

namespace blueprint {
namespace metadata {

struct ValueMetadata
{
  std::string string_value;
  std::string type;
};

struct RefMetadata
{
  std::string component_id;
};

struct IdRefMetadata
{
  std::string component_id;
};

enum class CollectionClass
{
  List,
  Set,
  Array
};

struct CollectionMetadata
{
  CollectionClass collection_class = CollectionClass::List;
  std::string value_type;
  std::vector<MetadataID> values;
};

struct MapEntry
{
  MetadataID key;
  MetadataID value;
};

struct MapMetadata
{
  std::string key_type;
  std::string value_type;
  std::vector<MapEntry> entries;
};

struct PropsEntry
{
  std::string key;
  std::string value;
};

struct PropsMetadata
{
  std::vector<PropsEntry> entries;
};

}  // namespace metadata
}  // namespace blueprint

#endif  // BLUEPRINT_METADATA_VALUE_H_
