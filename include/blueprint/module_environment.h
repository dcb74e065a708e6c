#ifndef BLUEPRINT_MODULE_ENVIRONMENT_H_
#define BLUEPRINT_MODULE_ENVIRONMENT_H_

#include <any>
#include <memory>
#include <optional>
#include <string>

#include <blueprint/class_space.h>
#include <blueprint/database/database.h>

namespace blueprint {

/// Names of the entries a backing module contributes to every parse.
constexpr char ENTRY_MODULE[] = "blueprintModule";
constexpr char ENTRY_CONTAINER[] = "blueprintContainer";
constexpr char ENTRY_CONVERTER[] = "blueprintConverter";

/**
 * @brief The backing module a document is parsed for.
 *
 * Supplies the class space used for handler compatibility checks and the
 * predefined component entries (module handle, container, ...). A parse
 * without an environment is a dry parse: no compatibility checks and none of
 * these entries.
 */
class ModuleEnvironment
{
public:
  /// Registers ENTRY_MODULE holding the module name.
  ModuleEnvironment(std::string name, std::shared_ptr<const ClassSpace> class_space);

  const std::string& name() const
  {
    return name_;
  }
  const ClassSpace* classSpace() const
  {
    return class_space_.get();
  }

  void setEntry(const std::string& id, std::any object);
  std::optional<std::any> getEntry(const std::string& id) const;
  const database::ElementMap<std::string, std::any>& entries() const
  {
    return entries_;
  }

private:
  std::string name_;
  std::shared_ptr<const ClassSpace> class_space_;
  database::ElementMap<std::string, std::any> entries_;
};

}  // namespace blueprint

#endif  // BLUEPRINT_MODULE_ENVIRONMENT_H_
