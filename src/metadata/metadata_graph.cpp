#include <blueprint/metadata/metadata_graph.h>

#include <stdexcept>

namespace blueprint {
namespace metadata {

IdGenerator::IdGenerator(std::string prefix) : prefix_(std::move(prefix))
{
}

void IdGenerator::reserve(const std::string& id)
{
  if (!id.empty())
    taken_.insert(id);
}

bool IdGenerator::isReserved(const std::string& id) const
{
  return taken_.count(id) > 0;
}

std::string IdGenerator::generateId()
{
  std::string id;
  do
  {
    id = prefix_ + std::to_string(++counter_);
  } while (taken_.count(id));
  taken_.insert(id);
  return id;
}

MetadataID MetadataGraph::createMetadata(MetadataKind kind)
{
  MetadataID id = db_.create();
  db_.add(id, NodeInfo{ kind });

  switch (kind)
  {
    case MetadataKind::Bean:
      db_.add(id, ComponentInfo{});
      db_.add(id, BeanMetadata{});
      break;
    case MetadataKind::PassThrough:
      db_.add(id, ComponentInfo{});
      db_.add(id, PassThroughMetadata{});
      break;
    case MetadataKind::Value:
      db_.add(id, ValueMetadata{});
      break;
    case MetadataKind::Ref:
      db_.add(id, RefMetadata{});
      break;
    case MetadataKind::IdRef:
      db_.add(id, IdRefMetadata{});
      break;
    case MetadataKind::Null:
      break;
    case MetadataKind::Collection:
      db_.add(id, CollectionMetadata{});
      break;
    case MetadataKind::Map:
      db_.add(id, MapMetadata{});
      break;
    case MetadataKind::Props:
      db_.add(id, PropsMetadata{});
      break;
    default:
      db_.destroy(id);
      throw std::invalid_argument(std::string("Cannot create metadata of kind '") + metadataKindToString(kind) + "'");
  }

  nodes_.insert(id);
  return id;
}

bool MetadataGraph::contains(MetadataID id) const
{
  return nodes_.count(id) > 0;
}

MetadataKind MetadataGraph::kind(MetadataID id) const
{
  const NodeInfo* info = get<NodeInfo>(id);
  if (!info)
    throw std::out_of_range("Metadata node #" + std::to_string(id.index) + " does not belong to this graph");
  return info->kind;
}

bool MetadataGraph::isComponent(MetadataID id) const
{
  return contains(id) && isComponentKind(kind(id));
}

std::string MetadataGraph::componentId(MetadataID id) const
{
  if (const auto* info = get<ComponentInfo>(id))
    return info->id;
  return {};
}

}  // namespace metadata
}  // namespace blueprint
