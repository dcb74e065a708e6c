#include <blueprint/class_space.h>

namespace blueprint {

StaticClassSpace::StaticClassSpace(std::initializer_list<ClassRef> classes)
{
  for (const auto& cls : classes)
    addClass(cls);
}

void StaticClassSpace::addClass(const ClassRef& cls)
{
  classes_[cls.name] = cls;
}

std::optional<ClassRef> StaticClassSpace::loadClass(const std::string& name) const
{
  auto it = classes_.find(name);
  if (it == classes_.end())
    return std::nullopt;
  return it->second;
}

}  // namespace blueprint
