#ifndef BLUEPRINT_NAMESPACE_HANDLER_H_
#define BLUEPRINT_NAMESPACE_HANDLER_H_

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <tinyxml2.h>

#include <blueprint/class_space.h>
#include <blueprint/metadata/metadata.h>

namespace blueprint {

class ParserContext;

/// Node handed to NamespaceHandler::decorate: a custom child element or a
/// custom attribute of the enclosing component's element.
using DecorationNode = std::variant<const tinyxml2::XMLElement*, const tinyxml2::XMLAttribute*>;

/**
 * @brief Processor for elements and attributes outside the core namespace.
 *
 * Handlers are registered in a NamespaceHandlerRegistry under the namespace
 * URIs they understand. While parsing, a custom element that is a direct
 * child of the document root is handed to parse(); a custom element or
 * attribute attached to a core component is handed to decorate() together
 * with the current metadata of that component.
 *
 * Handlers should:
 *  - create nodes with ParserContext::createMetadata() and component ids with
 *    ParserContext::generateId();
 *  - prefer editing the component passed to decorate() in place over returning
 *    a new node;
 *  - not assume environment entries (module handle, container) exist: in a dry
 *    parse they do not.
 */
class NamespaceHandler
{
public:
  virtual ~NamespaceHandler() = default;

  /**
   * Location of the schema for a namespace this handler serves, or empty when
   * the namespace needs no validation.
   */
  virtual std::optional<std::string> getSchemaLocation(const std::string& namespace_uri) const = 0;

  /**
   * Classes that must resolve to the very same artifact in the class space of
   * the module being parsed. The handler is not invoked for a module where any
   * of them resolves differently. Empty optional = no compatibility checks.
   */
  virtual std::optional<std::vector<ClassRef>> getManagedClasses() const = 0;

  /**
   * Parse a stand-alone custom element. At the document root the result must
   * be a component; in a value position any kind is accepted.
   */
  virtual metadata::MetadataID parse(const tinyxml2::XMLElement* element, ParserContext& context) = 0;

  /**
   * Decorate the enclosing component. Returning a different node replaces the
   * component for all later processing; the parser moves the interceptors of
   * the old node onto the returned one.
   */
  virtual metadata::MetadataID decorate(const DecorationNode& node, metadata::MetadataID component,
                                        ParserContext& context) = 0;
};

using NamespaceHandlerPtr = std::shared_ptr<NamespaceHandler>;

}  // namespace blueprint

#endif  // BLUEPRINT_NAMESPACE_HANDLER_H_
