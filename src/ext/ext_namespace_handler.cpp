#include <blueprint/ext/ext_namespace_handler.h>
#include <blueprint/parser_context.h>
#include <blueprint/parse_error.h>
#include <blueprint/xml/namespace.h>
#include <blueprint/xml/utils.h>

namespace blueprint {
namespace ext {

using metadata::MetadataID;
using metadata::MetadataKind;

namespace {

bool isExtElement(const tinyxml2::XMLElement* elem, const char* local_name)
{
  return xml::namespaceOf(elem) == EXT_NAMESPACE && xml::localName(elem->Name()) == local_name;
}

MetadataID createValue(ParserContext& context, const std::string& text)
{
  MetadataID node = context.createMetadata(MetadataKind::Value);
  context.get<metadata::ValueMetadata>(node)->string_value = text;
  return node;
}

}  // namespace

std::optional<std::string> ExtNamespaceHandler::getSchemaLocation(const std::string& namespace_uri) const
{
  if (namespace_uri == EXT_NAMESPACE)
    return std::string(EXT_SCHEMA_LOCATION);
  return std::nullopt;
}

std::optional<std::vector<ClassRef>> ExtNamespaceHandler::getManagedClasses() const
{
  return std::nullopt;
}

MetadataID ExtNamespaceHandler::parse(const tinyxml2::XMLElement* element, ParserContext& context)
{
  if (isExtElement(element, "property-placeholder"))
    return parsePropertyPlaceholder(element, context);

  throw ParseError(ErrorKind::MalformedDeclaration, "Unsupported element in the ext namespace", element->Name(),
                   element->GetLineNum());
}

MetadataID ExtNamespaceHandler::parsePropertyPlaceholder(const tinyxml2::XMLElement* element, ParserContext& context)
{
  std::vector<MetadataID> locations;
  std::vector<metadata::PropsEntry> defaults;

  for (const auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement())
  {
    if (isExtElement(child, "location"))
    {
      locations.push_back(createValue(context, xml::elementText(child)));
    }
    else if (isExtElement(child, "default-properties"))
    {
      for (const auto* prop = child->FirstChildElement(); prop; prop = prop->NextSiblingElement())
      {
        if (!isExtElement(prop, "property"))
          throw ParseError(ErrorKind::MalformedDeclaration, "<default-properties> may only contain <property>",
                           prop->Name(), prop->GetLineNum());
        defaults.push_back({ xml::textAttributeRequired(prop, "name"), xml::textAttribute(prop, "value") });
      }
    }
    else
      throw ParseError(ErrorKind::MalformedDeclaration, "Unexpected element inside <property-placeholder>",
                       child->Name(), child->GetLineNum());
  }

  MetadataID prefix = createValue(context, xml::textAttribute(element, "placeholder-prefix", "${"));
  MetadataID suffix = createValue(context, xml::textAttribute(element, "placeholder-suffix", "}"));

  MetadataID defaults_node = context.createMetadata(MetadataKind::Props);
  context.get<metadata::PropsMetadata>(defaults_node)->entries = std::move(defaults);

  MetadataID locations_node = context.createMetadata(MetadataKind::Collection);
  {
    auto* list = context.get<metadata::CollectionMetadata>(locations_node);
    list->collection_class = metadata::CollectionClass::List;
    list->values = std::move(locations);
  }

  MetadataID bean = context.createMetadata(MetadataKind::Bean);
  {
    auto* info = context.get<metadata::ComponentInfo>(bean);
    info->id = xml::textAttribute(element, "id");
    if (info->id.empty())
      info->id = context.generateId();
    info->activation = metadata::Activation::Eager;
  }

  auto* payload = context.get<metadata::BeanMetadata>(bean);
  payload->class_name = PLACEHOLDER_CLASS;
  payload->scope = metadata::SCOPE_SINGLETON;
  payload->processor = true;
  database::set_element(payload->properties, "placeholderPrefix", prefix);
  database::set_element(payload->properties, "placeholderSuffix", suffix);
  database::set_element(payload->properties, "defaultProperties", defaults_node);
  database::set_element(payload->properties, "locations", locations_node);
  return bean;
}

MetadataID ExtNamespaceHandler::decorate(const DecorationNode& node, MetadataID component, ParserContext& context)
{
  const auto* attr = std::get_if<const tinyxml2::XMLAttribute*>(&node);
  if (!attr)
    throw ParseError(ErrorKind::MalformedDeclaration, "Unsupported decoration element in the ext namespace",
                     xml::nodeName(node), xml::nodeLine(node));

  auto* bean = context.get<metadata::BeanMetadata>(component);
  if (!bean)
    throw ParseError(ErrorKind::MalformedDeclaration, "ext attributes only apply to <bean>", xml::nodeName(node),
                     xml::nodeLine(node));

  const std::string name = xml::localName((*attr)->Name());
  const std::string value = (*attr)->Value();
  if (name == "field-injection")
  {
    if (value != "true" && value != "false")
      throw ParseError(ErrorKind::MalformedDeclaration, "ext:field-injection must be 'true' or 'false'",
                       (*attr)->Name(), (*attr)->GetLineNum());
    bean->field_injection = value == "true";
  }
  else if (name == "role")
  {
    if (value != "processor")
      throw ParseError(ErrorKind::MalformedDeclaration, "Unsupported ext:role '" + value + "'", (*attr)->Name(),
                       (*attr)->GetLineNum());
    bean->processor = true;
  }
  else
    throw ParseError(ErrorKind::MalformedDeclaration, "Unsupported attribute in the ext namespace", (*attr)->Name(),
                     (*attr)->GetLineNum());

  return component;
}

}  // namespace ext
}  // namespace blueprint
