#ifndef BLUEPRINT_EXT_EXT_NAMESPACE_HANDLER_H_
#define BLUEPRINT_EXT_EXT_NAMESPACE_HANDLER_H_

#include <blueprint/namespace_handler.h>

namespace blueprint {
namespace ext {

constexpr char EXT_NAMESPACE[] = "http://blueprint/xmlns/blueprint-ext/v1.0.0";
constexpr char EXT_SCHEMA_LOCATION[] = "blueprint://schemas/blueprint-ext.xsd";

constexpr char PLACEHOLDER_CLASS[] = "blueprint.ext.PropertyPlaceholder";

/**
 * @brief Handler for the bundled extension namespace.
 *
 *   <ext:property-placeholder id="..." placeholder-prefix="${" placeholder-suffix="}">
 *     <ext:default-properties>
 *       <ext:property name="key" value="fallback"/>
 *     </ext:default-properties>
 *     <ext:location>file:///etc/app.properties</ext:location>
 *   </ext:property-placeholder>
 *
 * becomes a processor bean of class PLACEHOLDER_CLASS. On a <bean>,
 * ext:field-injection="true|false" and ext:role="processor" edit the bean in
 * place.
 */
class ExtNamespaceHandler : public NamespaceHandler
{
public:
  std::optional<std::string> getSchemaLocation(const std::string& namespace_uri) const override;
  std::optional<std::vector<ClassRef>> getManagedClasses() const override;

  metadata::MetadataID parse(const tinyxml2::XMLElement* element, ParserContext& context) override;
  metadata::MetadataID decorate(const DecorationNode& node, metadata::MetadataID component,
                                ParserContext& context) override;

private:
  metadata::MetadataID parsePropertyPlaceholder(const tinyxml2::XMLElement* element, ParserContext& context);
};

}  // namespace ext
}  // namespace blueprint

#endif  // BLUEPRINT_EXT_EXT_NAMESPACE_HANDLER_H_
