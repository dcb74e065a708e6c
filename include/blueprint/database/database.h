#ifndef BLUEPRINT_DATABASE_DATABASE_H_
#define BLUEPRINT_DATABASE_DATABASE_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <blueprint/database/registry_p.h>
#include <blueprint/database/ginseng_backend.h>

namespace blueprint {
namespace database {

/// Flat, insertion-ordered map used by records whose entry order is meaningful.
template <class K, class V>
using ElementMap = std::vector<std::pair<K, V>>;

template <class V>
inline V* get_element(ElementMap<std::string, V>& elements, std::string_view key)
{
  for (auto& kv : elements)
  {
    if (kv.first == key)
      return &kv.second;
  }
  return nullptr;
}

template <class V>
inline const V* get_element(const ElementMap<std::string, V>& elements, std::string_view key)
{
  for (const auto& kv : elements)
  {
    if (kv.first == key)
      return &kv.second;
  }
  return nullptr;
}

/// Last write wins; a replaced key keeps its original position.
template <class V>
inline V& set_element(ElementMap<std::string, V>& elements, std::string_view key, V value)
{
  if (auto* existing = get_element(elements, key))
  {
    *existing = std::move(value);
    return *existing;
  }
  elements.emplace_back(std::string(key), std::move(value));
  return elements.back().second;
}

// Owns the backend so you can write `database::Database db;`
class Database : public Registry<GinsengBackend>
{
public:
  Database() : Registry<GinsengBackend>(backend_)
  {
  }

private:
  GinsengBackend backend_;
};

}  // namespace database
}  // namespace blueprint

#endif  // BLUEPRINT_DATABASE_DATABASE_H_
