#ifndef BLUEPRINT_XML_NAMESPACE_H_
#define BLUEPRINT_XML_NAMESPACE_H_

#include <optional>
#include <set>
#include <string>

#include <tinyxml2.h>

#include <blueprint/namespace_handler.h>

namespace blueprint {
namespace xml {

/// Namespace of the core component-definition language.
constexpr char BLUEPRINT_NAMESPACE[] = "http://www.osgi.org/xmlns/blueprint/v1.0.0";
constexpr char XML_NAMESPACE[] = "http://www.w3.org/XML/1998/namespace";
constexpr char XMLNS_NAMESPACE[] = "http://www.w3.org/2000/xmlns/";
constexpr char XSI_NAMESPACE[] = "http://www.w3.org/2001/XMLSchema-instance";

// tinyxml2 keeps qualified names as written ("ext:foo"); namespaces are
// resolved here from the xmlns declarations in scope.

std::string prefixOf(const char* qualified_name);
std::string localName(const char* qualified_name);

/// Nearest xmlns[:prefix] declaration on the element or its ancestors.
std::optional<std::string> lookupNamespaceUri(const tinyxml2::XMLElement* elem, const std::string& prefix);

/// Namespace URI of an element (empty when unqualified and no default
/// namespace is in scope). Throws ParseError for an undeclared prefix.
std::string namespaceOf(const tinyxml2::XMLElement* elem);

/// Namespace URI of an attribute of `owner`; unprefixed attributes have none.
std::string namespaceOf(const tinyxml2::XMLAttribute* attr, const tinyxml2::XMLElement* owner);

bool isNamespaceDeclaration(const tinyxml2::XMLAttribute* attr);

/// True for attributes that belong to neither the element nor a handler
/// (xmlns declarations, xml:* and xsi:*).
bool isReservedAttribute(const tinyxml2::XMLAttribute* attr, const tinyxml2::XMLElement* owner);

/// Collects the non-core namespaces used by elements and attributes of the
/// subtree rooted at `elem`.
void collectNamespaces(const tinyxml2::XMLElement* elem, std::set<std::string>& out);

std::string nodeName(const DecorationNode& node);
std::string nodeLocalName(const DecorationNode& node);
int nodeLine(const DecorationNode& node);

}  // namespace xml
}  // namespace blueprint

#endif  // BLUEPRINT_XML_NAMESPACE_H_
