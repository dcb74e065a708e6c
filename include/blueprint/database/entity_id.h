#pragma once
#include <cstddef>
#include <functional>

namespace blueprint {
namespace database {

// Stable handle of a record in the database: slot index plus the generation
// of the slot, so a recycled slot never aliases an older handle.
struct EntityID
{
  std::size_t index{ 0 };
  std::size_t generation{ 0 };

  bool operator==(const EntityID& o) const
  {
    return index == o.index && generation == o.generation;
  }
  bool operator!=(const EntityID& o) const
  {
    return !(*this == o);
  }
  bool operator<(const EntityID& o) const
  {
    return index < o.index || (index == o.index && generation < o.generation);
  }
};

}  // namespace database
}  // namespace blueprint

namespace std {
template <>
struct hash<blueprint::database::EntityID>
{
  std::size_t operator()(const blueprint::database::EntityID& e) const noexcept
  {
    std::size_t h1 = std::hash<std::size_t>{}(e.index);
    std::size_t h2 = std::hash<std::size_t>{}(e.generation);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};
}  // namespace std
