#ifndef BLUEPRINT_CLASS_SPACE_H_
#define BLUEPRINT_CLASS_SPACE_H_

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace blueprint {

/**
 * @brief Opaque class identity.
 *
 * Two refs are the same class only if both the name and the artifact that
 * defines it match; equally named classes from different artifacts differ.
 */
struct ClassRef
{
  std::string name;
  std::string artifact;

  bool operator==(const ClassRef& o) const
  {
    return name == o.name && artifact == o.artifact;
  }
  bool operator!=(const ClassRef& o) const
  {
    return !(*this == o);
  }
  bool operator<(const ClassRef& o) const
  {
    return name < o.name || (name == o.name && artifact < o.artifact);
  }
};

/// The classes visible to one deployed module.
class ClassSpace
{
public:
  virtual ~ClassSpace() = default;

  /// Resolves a class by name; empty when the class is not visible.
  virtual std::optional<ClassRef> loadClass(const std::string& name) const = 0;
};

/// Class space backed by an explicit name -> artifact table.
class StaticClassSpace : public ClassSpace
{
public:
  StaticClassSpace() = default;
  StaticClassSpace(std::initializer_list<ClassRef> classes);

  /// Later additions shadow earlier ones of the same name.
  void addClass(const ClassRef& cls);
  std::optional<ClassRef> loadClass(const std::string& name) const override;

private:
  std::unordered_map<std::string, ClassRef> classes_;
};

}  // namespace blueprint

#endif  // BLUEPRINT_CLASS_SPACE_H_
