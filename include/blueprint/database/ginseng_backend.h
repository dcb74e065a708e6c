#pragma once
#include <ginseng.hpp>

#include <blueprint/database/registry_p.h>

namespace blueprint {
namespace database {

struct GinsengBackend
{
  ginseng::database db;

  // Adapters between façade EntityID and ginseng::database::ent_id
  static EntityID toEntityID(ginseng::database::ent_id id)
  {
    return { id.get_index(), id.get_version() };
  }
  static ginseng::database::ent_id toBackendID(const EntityID& e)
  {
    return ginseng::database::ent_id::compose(e.index, e.generation);
  }
};

template <>
struct ecs_traits<GinsengBackend>
{
  using backend_type = GinsengBackend;
  using entity_type = EntityID;

  static entity_type create(backend_type& b)
  {
    return backend_type::toEntityID(b.db.create_entity());
  }

  static void destroy(backend_type& b, entity_type e)
  {
    b.db.destroy_entity(backend_type::toBackendID(e));
  }

  template <class C>
  static C* get(backend_type& b, entity_type e)
  {
    return b.db.template get_component<C*>(backend_type::toBackendID(e));
  }

  // default-construct if missing and return a reference
  template <class C>
  static C& add(backend_type& b, entity_type e)
  {
    auto ge = backend_type::toBackendID(e);
    if (auto* p = b.db.template get_component<C*>(ge))
      return *p;
    b.db.add_component(ge, C{});
    return b.db.template get_component<C>(ge);
  }
};

}  // namespace database
}  // namespace blueprint
