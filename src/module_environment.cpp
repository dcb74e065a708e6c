#include <blueprint/module_environment.h>

#include <stdexcept>

namespace blueprint {

ModuleEnvironment::ModuleEnvironment(std::string name, std::shared_ptr<const ClassSpace> class_space)
  : name_(std::move(name)), class_space_(std::move(class_space))
{
  entries_.emplace_back(ENTRY_MODULE, std::any(name_));
}

void ModuleEnvironment::setEntry(const std::string& id, std::any object)
{
  if (id.empty())
    throw std::invalid_argument("Environment entry id cannot be empty");
  database::set_element(entries_, id, std::move(object));
}

std::optional<std::any> ModuleEnvironment::getEntry(const std::string& id) const
{
  if (const auto* entry = database::get_element(entries_, std::string_view(id)))
    return *entry;
  return std::nullopt;
}

}  // namespace blueprint
