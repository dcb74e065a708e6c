#include <blueprint/component_definition_registry.h>
#include <blueprint/parse_error.h>

#include <algorithm>

namespace blueprint {

using metadata::MetadataID;

namespace {

void sortByRank(std::vector<InterceptorPtr>& interceptors)
{
  std::stable_sort(interceptors.begin(), interceptors.end(),
                   [](const InterceptorPtr& a, const InterceptorPtr& b) { return a->getRank() > b->getRank(); });
}

}  // namespace

ComponentDefinitionRegistry::ComponentDefinitionRegistry(metadata::MetadataGraph& graph) : graph_(graph)
{
}

void ComponentDefinitionRegistry::registerComponentDefinition(MetadataID component)
{
  if (!graph_.isComponent(component))
    throw ParseError(ErrorKind::MalformedDeclaration, "Only component metadata can be registered as a top-level component");

  const std::string id = graph_.componentId(component);
  if (id.empty())
    throw ParseError(ErrorKind::MalformedDeclaration, "Cannot register a component without an id");

  if (components_.count(id))
    throw ParseError(ErrorKind::DuplicateIdentifier, "Component with id '" + id + "' is already registered");

  components_.emplace(id, component);
  names_.push_back(id);
  graph_.idGenerator().reserve(id);
}

bool ComponentDefinitionRegistry::removeComponentDefinition(const std::string& id)
{
  auto it = components_.find(id);
  if (it == components_.end())
    return false;

  interceptors_.erase(it->second);
  components_.erase(it);
  names_.erase(std::remove(names_.begin(), names_.end(), id), names_.end());
  return true;
}

bool ComponentDefinitionRegistry::containsComponentDefinition(const std::string& id) const
{
  return components_.count(id) > 0;
}

std::optional<MetadataID> ComponentDefinitionRegistry::getComponentDefinition(const std::string& id) const
{
  auto it = components_.find(id);
  if (it == components_.end())
    return std::nullopt;
  return it->second;
}

void ComponentDefinitionRegistry::registerInterceptorWithComponent(MetadataID component, InterceptorPtr interceptor)
{
  if (!interceptor)
    throw std::invalid_argument("Cannot register a null interceptor");
  if (!graph_.isComponent(component))
    throw ParseError(ErrorKind::MalformedDeclaration, "Interceptors can only be bound to component metadata");

  auto& bound = interceptors_[component];
  bound.push_back(std::move(interceptor));
  sortByRank(bound);
}

std::vector<InterceptorPtr> ComponentDefinitionRegistry::getInterceptors(MetadataID component) const
{
  auto it = interceptors_.find(component);
  if (it == interceptors_.end())
    return {};
  return it->second;
}

void ComponentDefinitionRegistry::transferInterceptors(MetadataID from, MetadataID to)
{
  if (from == to)
    return;

  auto it = interceptors_.find(from);
  if (it == interceptors_.end())
    return;

  std::vector<InterceptorPtr> moved = std::move(it->second);
  interceptors_.erase(it);

  auto& target = interceptors_[to];
  for (auto& interceptor : moved)
  {
    if (std::find(target.begin(), target.end(), interceptor) == target.end())
      target.push_back(std::move(interceptor));
  }
  sortByRank(target);
}

void ComponentDefinitionRegistry::registerTypeConverter(MetadataID converter)
{
  if (!graph_.contains(converter))
    throw ParseError(ErrorKind::MalformedDeclaration, "Type converter does not belong to this graph");
  type_converters_.push_back(converter);
}

}  // namespace blueprint
