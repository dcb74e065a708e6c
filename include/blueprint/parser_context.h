#ifndef BLUEPRINT_PARSER_CONTEXT_H_
#define BLUEPRINT_PARSER_CONTEXT_H_

#include <any>
#include <functional>
#include <optional>
#include <string>

#include <tinyxml2.h>

#include <blueprint/component_definition_registry.h>
#include <blueprint/metadata/metadata_graph.h>
#include <blueprint/module_environment.h>

namespace blueprint {

/**
 * @brief Capabilities handed to every NamespaceHandler call.
 *
 * Scoped to one parse session: nodes created here belong to the session graph
 * and are discarded with it if the parse fails.
 */
class ParserContext
{
public:
  using ElementParseFunc = std::function<metadata::MetadataID(const tinyxml2::XMLElement*)>;

  ParserContext(metadata::MetadataGraph& graph, ComponentDefinitionRegistry& registry,
                const ModuleEnvironment* environment, ElementParseFunc parse_element);

  ParserContext(const ParserContext&) = delete;
  ParserContext& operator=(const ParserContext&) = delete;

  /// Fresh node of `kind`, not attached anywhere yet.
  metadata::MetadataID createMetadata(metadata::MetadataKind kind);

  /// Session-unique component id.
  std::string generateId();

  /// Parses a nested element (core or custom) with the parser's own dispatch.
  metadata::MetadataID parseElement(const tinyxml2::XMLElement* element);

  /// As above; throws ParseError(MalformedDeclaration) if the result is not of `expected` kind.
  metadata::MetadataID parseElement(const tinyxml2::XMLElement* element, metadata::MetadataKind expected);

  metadata::MetadataGraph& graph()
  {
    return graph_;
  }

  /// Shortcut for graph().get<C>(id).
  template <class C>
  C* get(metadata::MetadataID id)
  {
    return graph_.get<C>(id);
  }

  ComponentDefinitionRegistry& getComponentDefinitionRegistry()
  {
    return registry_;
  }

  /// Entry supplied by the backing module; empty in a dry parse.
  std::optional<std::any> getEnvironmentEntry(const std::string& id) const;

  bool isDryParse() const
  {
    return environment_ == nullptr;
  }

  /// Element being dispatched (for attribute decorations, the owning element).
  const tinyxml2::XMLElement* getSourceNode() const
  {
    return source_node_;
  }
  void setSourceNode(const tinyxml2::XMLElement* node)
  {
    source_node_ = node;
  }

  metadata::Activation getDefaultActivation() const
  {
    return default_activation_;
  }
  void setDefaultActivation(metadata::Activation activation)
  {
    default_activation_ = activation;
  }

private:
  metadata::MetadataGraph& graph_;
  ComponentDefinitionRegistry& registry_;
  const ModuleEnvironment* environment_;
  ElementParseFunc parse_element_;

  const tinyxml2::XMLElement* source_node_ = nullptr;
  metadata::Activation default_activation_ = metadata::Activation::Eager;
};

}  // namespace blueprint

#endif  // BLUEPRINT_PARSER_CONTEXT_H_
