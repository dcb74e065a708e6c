#pragma once
#include <type_traits>
#include <utility>

#include <blueprint/database/entity_id.h>

namespace blueprint {
namespace database {

// Backends specialize this with their entity/record operations.
template <class Backend>
struct ecs_traits;

// Thin wrapper that forwards to ecs_traits<Backend>
template <class Backend>
class Registry
{
public:
  using traits = ecs_traits<Backend>;
  using entity_type = EntityID;

  explicit Registry(Backend& impl) : impl_(impl)
  {
  }

  // Holds a reference to a backend owned elsewhere (usually by the derived class).
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // entity lifecycle
  entity_type create()
  {
    return traits::create(impl_);
  }
  void destroy(entity_type e)
  {
    traits::destroy(impl_, e);
  }

  // records
  template <class C>
  C& add(entity_type e)
  {
    return traits::template add<C>(impl_, e);
  }
  template <class C>
  std::decay_t<C>& add(entity_type e, C&& value)
  {
    using T = std::decay_t<C>;
    T& ref = traits::template add<T>(impl_, e);
    ref = std::forward<C>(value);
    return ref;
  }
  template <class C>
  C* get(entity_type e)
  {
    return traits::template get<C>(impl_, e);
  }
  template <class C>
  const C* get_const(entity_type e) const
  {
    return traits::template get<C>(const_cast<Backend&>(impl_), e);
  }

private:
  Backend& impl_;
};

}  // namespace database
}  // namespace blueprint
