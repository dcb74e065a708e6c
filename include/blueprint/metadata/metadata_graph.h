#ifndef BLUEPRINT_METADATA_METADATA_GRAPH_H_
#define BLUEPRINT_METADATA_METADATA_GRAPH_H_

#include <cstddef>
#include <string>
#include <unordered_set>

#include <blueprint/database/database.h>
#include <blueprint/metadata/metadata.h>
#include <blueprint/metadata/component.h>
#include <blueprint/metadata/value.h>

namespace blueprint {
namespace metadata {

/**
 * @brief Issues component ids that are unique within one parse session.
 *
 * Ids already used by the documents or by registered components are reserved
 * up front; generated ids skip every reserved or previously generated value.
 */
class IdGenerator
{
public:
  explicit IdGenerator(std::string prefix = ".component-");

  void reserve(const std::string& id);
  bool isReserved(const std::string& id) const;

  std::string generateId();

private:
  std::string prefix_;
  std::size_t counter_ = 0;
  std::unordered_set<std::string> taken_;
};

/**
 * @brief Arena owning every metadata node of one parse session.
 *
 * Nodes are entities of the backing database. A node carries a NodeInfo
 * record, its kind payload (BeanMetadata, ValueMetadata, ...) and, for
 * component kinds, a ComponentInfo record. Nodes only come into existence
 * through createMetadata(), which attaches the full record set for the kind.
 *
 * Pointers returned by get() are transient: creating another node may move
 * the storage, so re-fetch after every createMetadata() call.
 *
 * The graph is neither copyable nor movable; hold it by unique_ptr.
 */
class MetadataGraph
{
public:
  MetadataGraph() = default;
  MetadataGraph(const MetadataGraph&) = delete;
  MetadataGraph& operator=(const MetadataGraph&) = delete;

  MetadataID createMetadata(MetadataKind kind);

  bool contains(MetadataID id) const;

  /// Throws std::out_of_range for an id that does not belong to this graph.
  MetadataKind kind(MetadataID id) const;
  bool isComponent(MetadataID id) const;

  /// Component id of a component node, empty for value nodes.
  std::string componentId(MetadataID id) const;

  std::size_t size() const
  {
    return nodes_.size();
  }

  template <class C>
  C* get(MetadataID id)
  {
    if (!contains(id))
      return nullptr;
    return db_.get<C>(id);
  }

  template <class C>
  const C* get(MetadataID id) const
  {
    if (!contains(id))
      return nullptr;
    return db_.get_const<C>(id);
  }

  IdGenerator& idGenerator()
  {
    return ids_;
  }
  const IdGenerator& idGenerator() const
  {
    return ids_;
  }

private:
  database::Database db_;
  std::unordered_set<MetadataID> nodes_;
  IdGenerator ids_;
};

}  // namespace metadata
}  // namespace blueprint

#endif  // BLUEPRINT_METADATA_METADATA_GRAPH_H_
