#include <blueprint/blueprint.h>

#include <stdexcept>

namespace blueprint {

Blueprint::Blueprint(std::unique_ptr<metadata::MetadataGraph> graph,
                     std::unique_ptr<ComponentDefinitionRegistry> registry)
  : graph_(std::move(graph)), registry_(std::move(registry))
{
  if (!graph_ || !registry_)
    throw std::invalid_argument("Blueprint requires a graph and a registry");
}

const metadata::BeanMetadata* Blueprint::getBean(const std::string& id) const
{
  auto component = getComponent(id);
  if (!component)
    return nullptr;
  return graph_->get<metadata::BeanMetadata>(*component);
}

std::optional<metadata::MetadataID> Blueprint::getProperty(const std::string& bean_id,
                                                           const std::string& property) const
{
  const auto* bean = getBean(bean_id);
  if (!bean)
    return std::nullopt;
  if (const auto* value = database::get_element(bean->properties, std::string_view(property)))
    return *value;
  return std::nullopt;
}

}  // namespace blueprint
