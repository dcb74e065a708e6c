#include <iostream>
#include <map>
#include <set>

#include <blueprint/xml/blueprint_parser.h>
#include <blueprint/xml/macros.h>
#include <blueprint/xml/namespace.h>
#include <blueprint/xml/utils.h>
#include <blueprint/parser_context.h>
#include <blueprint/parse_error.h>

namespace blueprint {
namespace xml {

using metadata::Activation;
using metadata::MetadataID;
using metadata::MetadataKind;

namespace {

[[noreturn]] void malformed(const tinyxml2::XMLElement* elem, const std::string& message)
{
  throw ParseError(ErrorKind::MalformedDeclaration, message, elem->Name(), elem->GetLineNum());
}

std::vector<const tinyxml2::XMLElement*> childElements(const tinyxml2::XMLElement* elem)
{
  std::vector<const tinyxml2::XMLElement*> out;
  for (const auto* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
    out.push_back(child);
  return out;
}

bool isCoreElement(const tinyxml2::XMLElement* elem, CoreElement type)
{
  return namespaceOf(elem) == BLUEPRINT_NAMESPACE && coreElementFromString(localName(elem->Name())) == type;
}

Activation activationAttribute(const tinyxml2::XMLElement* elem, const char* attr, Activation fallback)
{
  std::string text;
  if (!tryTextAttribute(elem, attr, &text))
    return fallback;
  auto activation = metadata::activationFromString(text);
  if (!activation)
    malformed(elem, std::string("Attribute '") + attr + "' must be 'eager' or 'lazy', got '" + text + "'");
  return *activation;
}

/**
 * State of one parse: the session graph, its component registry and the
 * context handed to namespace handlers. Core elements are parsed here;
 * everything outside the core namespace is dispatched to the resolved
 * handlers.
 */
class ParseSession
{
public:
  ParseSession(const NamespaceHandlerSet& handlers, const ModuleEnvironment* environment)
    : handlers_(handlers)
    , environment_(environment)
    , graph_(std::make_unique<metadata::MetadataGraph>())
    , registry_(std::make_unique<ComponentDefinitionRegistry>(*graph_))
    , context_(*graph_, *registry_, environment, [this](const tinyxml2::XMLElement* e) { return parseValueElement(e); })
  {
    registerEnvironmentEntries();
  }

  ParseSession(const ParseSession&) = delete;
  ParseSession& operator=(const ParseSession&) = delete;

  // Every id written in a document is off limits for generated ids, even
  // ids of components declared further down.
  void reserveDocumentIds(const tinyxml2::XMLElement* elem)
  {
    std::string id;
    if (tryTextAttribute(elem, "id", &id) && !id.empty())
      graph_->idGenerator().reserve(id);
    for (const auto* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
      reserveDocumentIds(child);
  }

  void parseRoot(const tinyxml2::XMLElement* root)
  {
    if (namespaceOf(root) != BLUEPRINT_NAMESPACE || localName(root->Name()) != "blueprint")
      malformed(root, std::string("Document root must be <blueprint> in namespace '") + BLUEPRINT_NAMESPACE + "'");

    context_.setDefaultActivation(activationAttribute(root, "default-activation", Activation::Eager));

    for (const auto* child : childElements(root))
    {
      if (namespaceOf(child) != BLUEPRINT_NAMESPACE)
      {
        registerTopLevel(parseCustomComponent(child), child);
        continue;
      }

      auto type = coreElementFromString(localName(child->Name()));
      if (!type)
        malformed(child, "Unknown element <" + std::string(child->Name()) + "> in the core namespace");

      switch (*type)
      {
        case CoreElement::Description:
          break;
        case CoreElement::TypeConverters:
          parseTypeConverters(child);
          break;
        case CoreElement::Bean:
          registerTopLevel(parseBean(child, true), child);
          break;
        default:
          malformed(child, "<" + std::string(child->Name()) + "> is not allowed directly under <blueprint>");
      }
    }
  }

  Blueprint publish()
  {
    return Blueprint(std::move(graph_), std::move(registry_));
  }

private:
  void registerEnvironmentEntries()
  {
    if (!environment_)
      return;

    for (const auto& [id, object] : environment_->entries())
    {
      MetadataID node = graph_->createMetadata(MetadataKind::PassThrough);
      graph_->get<metadata::ComponentInfo>(node)->id = id;
      graph_->get<metadata::PassThroughMetadata>(node)->object = object;
      registry_->registerComponentDefinition(node);
      claimed_ids_.emplace(id, node);
    }
  }

  void registerTopLevel(MetadataID component, const tinyxml2::XMLElement* elem)
  {
    const std::string id = graph_->componentId(component);
    if (registry_->containsComponentDefinition(id))
      throw ParseError(ErrorKind::DuplicateIdentifier, "Component id '" + id + "' is already declared", elem->Name(),
                       elem->GetLineNum());
    registry_->registerComponentDefinition(component);
  }

  // Component ids are unique across the whole session graph, whatever the
  // position of the component. Claiming the same id again for the same node
  // is allowed (a handler may hand back a node it got from parseElement).
  void claimId(const std::string& id, MetadataID component, const std::string& node_name, int line)
  {
    auto [it, inserted] = claimed_ids_.emplace(id, component);
    if (!inserted && it->second != component)
      throw ParseError(ErrorKind::DuplicateIdentifier, "Component id '" + id + "' is already declared", node_name,
                       line);
  }

  std::string declaredId(const tinyxml2::XMLElement* elem, MetadataID component)
  {
    std::string id;
    if (!tryTextAttribute(elem, "id", &id))
      id = graph_->idGenerator().generateId();
    else if (id.empty())
      malformed(elem, "Attribute 'id' must not be empty");
    claimId(id, component, elem->Name(), elem->GetLineNum());
    return id;
  }

  /////////////////////////////////////////////////////////////////////////////
  // Core elements
  /////////////////////////////////////////////////////////////////////////////

  MetadataID parseBean(const tinyxml2::XMLElement* elem, bool top_level)
  {
    MetadataID bean = graph_->createMetadata(MetadataKind::Bean);
    {
      auto* info = graph_->get<metadata::ComponentInfo>(bean);
      info->id = declaredId(elem, bean);
      info->activation =
          activationAttribute(elem, "activation", top_level ? context_.getDefaultActivation() : Activation::Lazy);
      info->depends_on = splitList(textAttribute(elem, "depends-on"));
    }
    {
      auto* payload = graph_->get<metadata::BeanMetadata>(bean);
      payload->class_name = textAttribute(elem, "class");
      payload->scope = textAttribute(elem, "scope", top_level ? metadata::SCOPE_SINGLETON : metadata::SCOPE_PROTOTYPE);
      payload->init_method = textAttribute(elem, "init-method");
      payload->destroy_method = textAttribute(elem, "destroy-method");
      payload->factory_method = textAttribute(elem, "factory-method");
      payload->factory_component = textAttribute(elem, "factory-ref");

      if (!payload->factory_component.empty() && payload->factory_method.empty())
        malformed(elem, "Attribute 'factory-ref' requires 'factory-method'");
    }

    // Core children first: inner beans come back fully decorated.
    std::vector<const tinyxml2::XMLElement*> custom_children;
    for (const auto* child : childElements(elem))
    {
      if (namespaceOf(child) != BLUEPRINT_NAMESPACE)
      {
        custom_children.push_back(child);
        continue;
      }

      auto type = coreElementFromString(localName(child->Name()));
      if (type == CoreElement::Description)
        continue;
      else if (type == CoreElement::Argument)
        parseArgument(bean, child);
      else if (type == CoreElement::Property)
        parseProperty(bean, child);
      else
        malformed(child, "<" + std::string(child->Name()) + "> is not allowed inside <bean>");
    }
    validateArguments(bean, elem);

    // Then custom attributes, then custom child elements, in document order.
    MetadataID current = bean;
    for (const auto* attr = elem->FirstAttribute(); attr; attr = attr->Next())
    {
      if (isReservedAttribute(attr, elem))
        continue;
      const std::string ns = namespaceOf(attr, elem);
      if (ns.empty() || ns == BLUEPRINT_NAMESPACE)
        continue;
      current = decorate(attr, ns, current, elem);
    }
    for (const auto* child : custom_children)
      current = decorate(child, namespaceOf(child), current, elem);

    return current;
  }

  void parseArgument(MetadataID bean, const tinyxml2::XMLElement* elem)
  {
    metadata::BeanArgument argument;
    if (elem->Attribute("index"))
    {
      int index = -1;
      if (elem->QueryIntAttribute("index", &index) != tinyxml2::XML_SUCCESS || index < 0)
        malformed(elem, "Attribute 'index' must be a non-negative integer");
      argument.index = index;
    }
    argument.value_type = textAttribute(elem, "type");
    argument.value = parseInjectedValue(elem);

    graph_->get<metadata::BeanMetadata>(bean)->arguments.push_back(argument);
  }

  void validateArguments(MetadataID bean, const tinyxml2::XMLElement* elem)
  {
    const auto& arguments = graph_->get<metadata::BeanMetadata>(bean)->arguments;

    bool indexed = false;
    bool positional = false;
    std::set<int> seen;
    for (const auto& argument : arguments)
    {
      if (argument.index < 0)
      {
        positional = true;
        continue;
      }
      indexed = true;
      if (!seen.insert(argument.index).second)
        malformed(elem, "Duplicate argument index " + std::to_string(argument.index));
    }
    if (indexed && positional)
      malformed(elem, "Either all or none of the arguments of a bean must specify 'index'");
  }

  void parseProperty(MetadataID bean, const tinyxml2::XMLElement* elem)
  {
    const std::string name = textAttributeRequired(elem, "name");
    MetadataID value = parseInjectedValue(elem);
    database::set_element(graph_->get<metadata::BeanMetadata>(bean)->properties, name, value);
  }

  // Value of <argument>/<property>: exactly one of value="", ref="" or a
  // nested value element.
  MetadataID parseInjectedValue(const tinyxml2::XMLElement* elem)
  {
    const char* value = elem->Attribute("value");
    const char* ref = elem->Attribute("ref");

    std::vector<const tinyxml2::XMLElement*> children;
    for (const auto* child : childElements(elem))
      if (!isCoreElement(child, CoreElement::Description))
        children.push_back(child);

    if (children.size() > 1)
      malformed(elem, "<" + std::string(elem->Name()) + "> must contain at most one value element");

    const int count = (value ? 1 : 0) + (ref ? 1 : 0) + (children.empty() ? 0 : 1);
    if (count != 1)
      malformed(elem, "<" + std::string(elem->Name()) +
                          "> must specify exactly one of 'value', 'ref' or a nested value element");

    if (value)
      return createValue(value, "");
    if (ref)
      return createRef(MetadataKind::Ref, ref);
    return parseValueElement(children.front());
  }

  MetadataID createValue(const std::string& text, const std::string& type)
  {
    MetadataID node = graph_->createMetadata(MetadataKind::Value);
    auto* payload = graph_->get<metadata::ValueMetadata>(node);
    payload->string_value = text;
    payload->type = type;
    return node;
  }

  MetadataID createRef(MetadataKind kind, const std::string& component_id)
  {
    MetadataID node = graph_->createMetadata(kind);
    if (kind == MetadataKind::IdRef)
      graph_->get<metadata::IdRefMetadata>(node)->component_id = component_id;
    else
      graph_->get<metadata::RefMetadata>(node)->component_id = component_id;
    return node;
  }

  /// Any element in value position; also backs ParserContext::parseElement().
  MetadataID parseValueElement(const tinyxml2::XMLElement* elem)
  {
    if (namespaceOf(elem) != BLUEPRINT_NAMESPACE)
      return parseCustomValue(elem);

    auto type = coreElementFromString(localName(elem->Name()));
    if (!type || !isValueElement(*type))
      malformed(elem, "<" + std::string(elem->Name()) + "> cannot be used as a value");

    switch (*type)
    {
      case CoreElement::Bean:
        return parseBean(elem, false);
      case CoreElement::Ref:
        return createRef(MetadataKind::Ref, textAttributeRequired(elem, "component-id"));
      case CoreElement::IdRef:
        return createRef(MetadataKind::IdRef, textAttributeRequired(elem, "component-id"));
      case CoreElement::Value:
        return createValue(elementText(elem), textAttribute(elem, "type"));
      case CoreElement::Null:
        return graph_->createMetadata(MetadataKind::Null);
      case CoreElement::List:
        return parseCollection(elem, metadata::CollectionClass::List);
      case CoreElement::Set:
        return parseCollection(elem, metadata::CollectionClass::Set);
      case CoreElement::Array:
        return parseCollection(elem, metadata::CollectionClass::Array);
      case CoreElement::Map:
        return parseMap(elem);
      case CoreElement::Props:
        return parseProps(elem);
      default:
        malformed(elem, "<" + std::string(elem->Name()) + "> cannot be used as a value");
    }
  }

  MetadataID parseCollection(const tinyxml2::XMLElement* elem, metadata::CollectionClass collection_class)
  {
    std::vector<MetadataID> values;
    for (const auto* child : childElements(elem))
      values.push_back(parseValueElement(child));

    MetadataID node = graph_->createMetadata(MetadataKind::Collection);
    auto* payload = graph_->get<metadata::CollectionMetadata>(node);
    payload->collection_class = collection_class;
    payload->value_type = textAttribute(elem, "value-type");
    payload->values = std::move(values);
    return node;
  }

  MetadataID parseMap(const tinyxml2::XMLElement* elem)
  {
    const std::string key_type = textAttribute(elem, "key-type");
    const std::string value_type = textAttribute(elem, "value-type");

    std::vector<metadata::MapEntry> entries;
    for (const auto* entry : childElements(elem))
    {
      if (!isCoreElement(entry, CoreElement::Entry))
        malformed(entry, "<map> may only contain <entry> elements");

      std::optional<MetadataID> key;
      std::optional<MetadataID> value;
      int key_count = 0;
      int value_count = 0;

      if (const char* k = entry->Attribute("key"))
      {
        key = createValue(k, key_type);
        ++key_count;
      }
      if (const char* k = entry->Attribute("key-ref"))
      {
        key = createRef(MetadataKind::Ref, k);
        ++key_count;
      }
      if (const char* v = entry->Attribute("value"))
      {
        value = createValue(v, value_type);
        ++value_count;
      }
      if (const char* v = entry->Attribute("value-ref"))
      {
        value = createRef(MetadataKind::Ref, v);
        ++value_count;
      }

      for (const auto* child : childElements(entry))
      {
        if (isCoreElement(child, CoreElement::Key))
        {
          auto key_children = childElements(child);
          if (key_children.size() != 1)
            malformed(child, "<key> must contain exactly one value element");
          key = parseValueElement(key_children.front());
          ++key_count;
        }
        else
        {
          value = parseValueElement(child);
          ++value_count;
        }
      }

      if (key_count != 1)
        malformed(entry, "<entry> must specify exactly one of 'key', 'key-ref' or <key>");
      if (value_count != 1)
        malformed(entry, "<entry> must specify exactly one of 'value', 'value-ref' or a nested value element");

      entries.push_back(metadata::MapEntry{ *key, *value });
    }

    MetadataID node = graph_->createMetadata(MetadataKind::Map);
    auto* payload = graph_->get<metadata::MapMetadata>(node);
    payload->key_type = key_type;
    payload->value_type = value_type;
    payload->entries = std::move(entries);
    return node;
  }

  MetadataID parseProps(const tinyxml2::XMLElement* elem)
  {
    std::vector<metadata::PropsEntry> entries;
    for (const auto* prop : childElements(elem))
    {
      if (!isCoreElement(prop, CoreElement::Prop))
        malformed(prop, "<props> may only contain <prop> elements");

      metadata::PropsEntry entry;
      entry.key = textAttributeRequired(prop, "key");
      const char* value = prop->Attribute("value");
      const char* text = prop->GetText();
      if (value && text)
        malformed(prop, "<prop> must not have both a 'value' attribute and text content");
      entry.value = value ? value : (text ? text : "");
      entries.push_back(std::move(entry));
    }

    MetadataID node = graph_->createMetadata(MetadataKind::Props);
    graph_->get<metadata::PropsMetadata>(node)->entries = std::move(entries);
    return node;
  }

  void parseTypeConverters(const tinyxml2::XMLElement* elem)
  {
    for (const auto* child : childElements(elem))
    {
      MetadataID converter;
      if (namespaceOf(child) != BLUEPRINT_NAMESPACE)
      {
        converter = parseCustomComponent(child);
        registerTopLevel(converter, child);
      }
      else if (isCoreElement(child, CoreElement::Bean))
      {
        converter = parseBean(child, true);
        registerTopLevel(converter, child);
      }
      else if (isCoreElement(child, CoreElement::Ref))
        converter = parseValueElement(child);
      else
        malformed(child, "<type-converters> may only contain <bean>, <ref> or custom components");

      registry_->registerTypeConverter(converter);
    }
  }

  /////////////////////////////////////////////////////////////////////////////
  // Extension dispatch
  /////////////////////////////////////////////////////////////////////////////

  const ClassSpace* classSpace() const
  {
    return environment_ ? environment_->classSpace() : nullptr;
  }

  const HandlerRegistration& resolveHandler(const std::string& namespace_uri, const std::string& node_name, int line)
  {
    if (namespace_uri.empty())
      throw ParseError(ErrorKind::MalformedDeclaration, "Element is not in any namespace", node_name, line);

    const HandlerRegistration* registration = handlers_.getRegistration(namespace_uri);
    if (!registration)
      throw ParseError(ErrorKind::UnresolvedNamespace, "No namespace handler registered for '" + namespace_uri + "'",
                       node_name, line);

    // One check per namespace and session.
    auto cached = compatibility_.find(namespace_uri);
    if (cached == compatibility_.end())
      cached = compatibility_.emplace(namespace_uri, isCompatible(*registration, classSpace())).first;

    if (!cached->second)
      throw ParseError(ErrorKind::IncompatibleHandler,
                       "Namespace handler for '" + namespace_uri + "' is not compatible with the class space of module '" +
                           environment_->name() + "'",
                       node_name, line);
    return *registration;
  }

  template <class Fn>
  MetadataID invokeHandler(const HandlerRegistration& registration, const std::string& node_name, int line, Fn&& fn)
  {
    MetadataID result;
    try
    {
      result = fn();
    }
    catch (const ParseError& e)
    {
      // Errors raised outside of any node (registry calls) get the location
      // of the node being dispatched.
      if (!e.nodeName().empty())
        throw;
      throw ParseError(e.kind(), e.detail(), node_name, line);
    }
    catch (const std::exception& e)
    {
      throw ParseError(ErrorKind::HandlerInvocationFailure,
                       "Namespace handler for '" + registration.namespace_uri + "' failed: " + e.what(), node_name, line);
    }

    if (!graph_->contains(result))
      throw ParseError(ErrorKind::MalformedDeclaration,
                       "Namespace handler for '" + registration.namespace_uri +
                           "' returned metadata that was not created through the parser context",
                       node_name, line);
    return result;
  }

  MetadataID parseCustomValue(const tinyxml2::XMLElement* elem)
  {
    const HandlerRegistration& registration = resolveHandler(namespaceOf(elem), elem->Name(), elem->GetLineNum());

    context_.setSourceNode(elem);
    MetadataID result = invokeHandler(registration, elem->Name(), elem->GetLineNum(),
                                      [&] { return registration.handler->parse(elem, context_); });

    if (graph_->isComponent(result))
    {
      auto* info = graph_->get<metadata::ComponentInfo>(result);
      if (info->id.empty())
        info->id = graph_->idGenerator().generateId();
      claimId(info->id, result, elem->Name(), elem->GetLineNum());
    }
    return result;
  }

  MetadataID parseCustomComponent(const tinyxml2::XMLElement* elem)
  {
    MetadataID result = parseCustomValue(elem);
    if (!graph_->isComponent(result))
      malformed(elem, "Namespace handler for '" + namespaceOf(elem) + "' returned " +
                          metadata::metadataKindToString(graph_->kind(result)) +
                          " metadata where a component is required");
    return result;
  }

  MetadataID decorate(const DecorationNode& node, const std::string& namespace_uri, MetadataID component,
                      const tinyxml2::XMLElement* owner)
  {
    const std::string name = nodeName(node);
    const int line = nodeLine(node);
    const HandlerRegistration& registration = resolveHandler(namespace_uri, name, line);

    context_.setSourceNode(owner);
    MetadataID result = invokeHandler(registration, name, line,
                                      [&] { return registration.handler->decorate(node, component, context_); });

    if (!graph_->isComponent(result))
      throw ParseError(ErrorKind::MalformedDeclaration,
                       "Namespace handler for '" + namespace_uri + "' must return component metadata from decorate",
                       name, line);

    if (result != component)
    {
      registry_->transferInterceptors(component, result);
      const std::string replaced_id = graph_->componentId(component);
      auto* info = graph_->get<metadata::ComponentInfo>(result);
      if (info->id.empty())
        info->id = replaced_id;

      if (info->id == replaced_id)
        claimed_ids_[replaced_id] = result;
      else
        claimId(info->id, result, name, line);
    }
    return result;
  }

  const NamespaceHandlerSet& handlers_;
  const ModuleEnvironment* environment_;

  std::unique_ptr<metadata::MetadataGraph> graph_;
  std::unique_ptr<ComponentDefinitionRegistry> registry_;
  ParserContext context_;

  std::map<std::string, MetadataID> claimed_ids_;
  std::map<std::string, bool> compatibility_;
};

}  // namespace

BlueprintParser::BlueprintParser() = default;
BlueprintParser::~BlueprintParser() = default;

bool BlueprintParser::loadFromFile(const std::string& filename)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->LoadFile(filename.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: failed to load XML file: " << filename << " (" << doc->ErrorStr() << ")" << std::endl;
    return false;
  }
  if (!doc->RootElement())
  {
    std::cerr << "ERROR: XML file has no root element: " << filename << std::endl;
    return false;
  }
  roots_.push_back(doc->RootElement());
  owned_docs_.push_back(std::move(doc));
  return true;
}

bool BlueprintParser::loadFromText(const std::string& text)
{
  auto doc = std::make_unique<tinyxml2::XMLDocument>();
  if (doc->Parse(text.c_str()) != tinyxml2::XML_SUCCESS)
  {
    std::cerr << "ERROR: failed to parse XML text (" << doc->ErrorStr() << ")" << std::endl;
    return false;
  }
  if (!doc->RootElement())
  {
    std::cerr << "ERROR: XML text has no root element" << std::endl;
    return false;
  }
  roots_.push_back(doc->RootElement());
  owned_docs_.push_back(std::move(doc));
  return true;
}

void BlueprintParser::addDocument(const tinyxml2::XMLDocument* doc)
{
  if (!doc || !doc->RootElement())
    throw ParseError(ErrorKind::MalformedDeclaration, "Document has no root element");
  roots_.push_back(doc->RootElement());
}

std::set<std::string> BlueprintParser::getNamespaces() const
{
  std::set<std::string> namespaces;
  for (const auto* root : roots_)
    collectNamespaces(root, namespaces);
  return namespaces;
}

Blueprint BlueprintParser::populate(const NamespaceHandlerSet& handlers, const ModuleEnvironment* environment) const
{
  for (const auto& ns : handlers.getMissingNamespaces())
    std::cerr << "WARNING: no namespace handler registered for '" << ns << "'" << std::endl;

  ParseSession session(handlers, environment);
  for (const auto* root : roots_)
    session.reserveDocumentIds(root);
  for (const auto* root : roots_)
    session.parseRoot(root);
  return session.publish();
}

Blueprint BlueprintParser::parse(const NamespaceHandlerRegistry& registry, const ModuleEnvironment* environment) const
{
  return populate(registry.getNamespaceHandlers(getNamespaces()), environment);
}

Blueprint parseDocument(const tinyxml2::XMLElement* root, const NamespaceHandlerRegistry& registry,
                        const ModuleEnvironment* environment)
{
  if (!root)
    throw ParseError(ErrorKind::MalformedDeclaration, "Cannot parse a null document root");

  std::set<std::string> namespaces;
  collectNamespaces(root, namespaces);
  const NamespaceHandlerSet handlers = registry.getNamespaceHandlers(namespaces);

  ParseSession session(handlers, environment);
  session.reserveDocumentIds(root);
  session.parseRoot(root);
  return session.publish();
}

}  // namespace xml
}  // namespace blueprint
