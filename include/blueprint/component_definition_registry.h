#ifndef BLUEPRINT_COMPONENT_DEFINITION_REGISTRY_H_
#define BLUEPRINT_COMPONENT_DEFINITION_REGISTRY_H_

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <blueprint/interceptor.h>
#include <blueprint/metadata/metadata_graph.h>

namespace blueprint {

/**
 * @brief Top-level components of one parse session, keyed by component id.
 *
 * Also records interceptor bindings (keyed by node) and type converters.
 * Registration order is preserved.
 */
class ComponentDefinitionRegistry
{
public:
  explicit ComponentDefinitionRegistry(metadata::MetadataGraph& graph);
  ComponentDefinitionRegistry(const ComponentDefinitionRegistry&) = delete;
  ComponentDefinitionRegistry& operator=(const ComponentDefinitionRegistry&) = delete;

  /// Throws ParseError(DuplicateIdentifier) if the id is taken and
  /// ParseError(MalformedDeclaration) if the node is not a component with an id.
  void registerComponentDefinition(metadata::MetadataID component);
  bool removeComponentDefinition(const std::string& id);

  bool containsComponentDefinition(const std::string& id) const;
  std::optional<metadata::MetadataID> getComponentDefinition(const std::string& id) const;
  const std::vector<std::string>& getComponentDefinitionNames() const
  {
    return names_;
  }

  void registerInterceptorWithComponent(metadata::MetadataID component, InterceptorPtr interceptor);
  std::vector<InterceptorPtr> getInterceptors(metadata::MetadataID component) const;

  /// Re-keys every interceptor bound to `from` onto `to` (appended after the
  /// ones `to` already has, rank order re-applied).
  void transferInterceptors(metadata::MetadataID from, metadata::MetadataID to);

  void registerTypeConverter(metadata::MetadataID converter);
  const std::vector<metadata::MetadataID>& getTypeConverters() const
  {
    return type_converters_;
  }

  const metadata::MetadataGraph& graph() const
  {
    return graph_;
  }

private:
  metadata::MetadataGraph& graph_;
  std::vector<std::string> names_;
  std::unordered_map<std::string, metadata::MetadataID> components_;
  std::unordered_map<metadata::MetadataID, std::vector<InterceptorPtr>> interceptors_;
  std::vector<metadata::MetadataID> type_converters_;
};

}  // namespace blueprint

#endif  // BLUEPRINT_COMPONENT_DEFINITION_REGISTRY_H_
