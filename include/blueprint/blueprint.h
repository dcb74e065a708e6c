#ifndef BLUEPRINT_BLUEPRINT_H_
#define BLUEPRINT_BLUEPRINT_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <blueprint/component_definition_registry.h>
#include <blueprint/metadata/metadata_graph.h>

namespace blueprint {

/**
 * @brief Finished metadata graph of a successful parse.
 *
 * Read-only; handed to the runtime keyed by component id.
 */
class Blueprint
{
public:
  Blueprint(std::unique_ptr<metadata::MetadataGraph> graph, std::unique_ptr<ComponentDefinitionRegistry> registry);

  Blueprint(Blueprint&&) = default;
  Blueprint& operator=(Blueprint&&) = default;

  const metadata::MetadataGraph& graph() const
  {
    return *graph_;
  }
  const ComponentDefinitionRegistry& registry() const
  {
    return *registry_;
  }

  /// Top-level component ids in declaration order.
  const std::vector<std::string>& getComponentIds() const
  {
    return registry_->getComponentDefinitionNames();
  }
  std::optional<metadata::MetadataID> getComponent(const std::string& id) const
  {
    return registry_->getComponentDefinition(id);
  }

  template <class C>
  const C* get(metadata::MetadataID id) const
  {
    return graph_->get<C>(id);
  }

  /// Bean payload of a top-level component, null if absent or not a bean.
  const metadata::BeanMetadata* getBean(const std::string& id) const;

  /// Node bound to a bean property, empty if the bean or property is absent.
  std::optional<metadata::MetadataID> getProperty(const std::string& bean_id, const std::string& property) const;

  std::vector<InterceptorPtr> getInterceptors(metadata::MetadataID component) const
  {
    return registry_->getInterceptors(component);
  }

private:
  std::unique_ptr<metadata::MetadataGraph> graph_;
  std::unique_ptr<ComponentDefinitionRegistry> registry_;
};

}  // namespace blueprint

#endif  // BLUEPRINT_BLUEPRINT_H_
