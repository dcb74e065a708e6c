#include <blueprint/parser_context.h>
#include <blueprint/parse_error.h>

namespace blueprint {

using metadata::MetadataID;
using metadata::MetadataKind;

ParserContext::ParserContext(metadata::MetadataGraph& graph, ComponentDefinitionRegistry& registry,
                             const ModuleEnvironment* environment, ElementParseFunc parse_element)
  : graph_(graph), registry_(registry), environment_(environment), parse_element_(std::move(parse_element))
{
}

MetadataID ParserContext::createMetadata(MetadataKind kind)
{
  return graph_.createMetadata(kind);
}

std::string ParserContext::generateId()
{
  return graph_.idGenerator().generateId();
}

MetadataID ParserContext::parseElement(const tinyxml2::XMLElement* element)
{
  if (!element)
    throw ParseError(ErrorKind::MalformedDeclaration, "Cannot parse a null element");

  // Restore the caller's source node once the nested parse returns.
  const tinyxml2::XMLElement* previous = source_node_;
  MetadataID result = parse_element_(element);
  source_node_ = previous;
  return result;
}

MetadataID ParserContext::parseElement(const tinyxml2::XMLElement* element, MetadataKind expected)
{
  MetadataID result = parseElement(element);
  const MetadataKind actual = graph_.kind(result);
  if (actual != expected)
    throw ParseError(ErrorKind::MalformedDeclaration,
                     std::string("Expected ") + metadataKindToString(expected) + " metadata but element produced " +
                         metadataKindToString(actual),
                     element->Name(), element->GetLineNum());
  return result;
}

std::optional<std::any> ParserContext::getEnvironmentEntry(const std::string& id) const
{
  if (!environment_)
    return std::nullopt;
  return environment_->getEntry(id);
}

}  // namespace blueprint
