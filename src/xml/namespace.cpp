#include <blueprint/xml/namespace.h>
#include <blueprint/parse_error.h>

#include <cstring>

namespace blueprint {
namespace xml {

std::string prefixOf(const char* qualified_name)
{
  if (!qualified_name)
    return {};
  const char* colon = std::strchr(qualified_name, ':');
  return colon ? std::string(qualified_name, colon) : std::string{};
}

std::string localName(const char* qualified_name)
{
  if (!qualified_name)
    return {};
  const char* colon = std::strchr(qualified_name, ':');
  return colon ? std::string(colon + 1) : std::string(qualified_name);
}

std::optional<std::string> lookupNamespaceUri(const tinyxml2::XMLElement* elem, const std::string& prefix)
{
  if (prefix == "xml")
    return std::string(XML_NAMESPACE);
  if (prefix == "xmlns")
    return std::string(XMLNS_NAMESPACE);

  const std::string decl = prefix.empty() ? "xmlns" : "xmlns:" + prefix;
  for (const tinyxml2::XMLNode* n = elem; n; n = n->Parent())
  {
    if (auto* el = n->ToElement())
    {
      if (const char* uri = el->Attribute(decl.c_str()))
        return std::string(uri);
    }
  }
  return std::nullopt;
}

std::string namespaceOf(const tinyxml2::XMLElement* elem)
{
  const std::string prefix = prefixOf(elem->Name());
  auto uri = lookupNamespaceUri(elem, prefix);
  if (!uri)
  {
    if (prefix.empty())
      return {};
    throw ParseError(ErrorKind::MalformedDeclaration, "Undeclared namespace prefix '" + prefix + "'", elem->Name(),
                     elem->GetLineNum());
  }
  return *uri;
}

std::string namespaceOf(const tinyxml2::XMLAttribute* attr, const tinyxml2::XMLElement* owner)
{
  if (isNamespaceDeclaration(attr))
    return XMLNS_NAMESPACE;

  const std::string prefix = prefixOf(attr->Name());
  if (prefix.empty())
    return {};

  auto uri = lookupNamespaceUri(owner, prefix);
  if (!uri)
    throw ParseError(ErrorKind::MalformedDeclaration, "Undeclared namespace prefix '" + prefix + "'", attr->Name(),
                     attr->GetLineNum());
  return *uri;
}

bool isNamespaceDeclaration(const tinyxml2::XMLAttribute* attr)
{
  const char* name = attr->Name();
  return std::strcmp(name, "xmlns") == 0 || std::strncmp(name, "xmlns:", 6) == 0;
}

bool isReservedAttribute(const tinyxml2::XMLAttribute* attr, const tinyxml2::XMLElement* owner)
{
  if (isNamespaceDeclaration(attr))
    return true;
  const std::string prefix = prefixOf(attr->Name());
  if (prefix.empty())
    return false;
  if (prefix == "xml")
    return true;
  auto uri = lookupNamespaceUri(owner, prefix);
  return uri && *uri == XSI_NAMESPACE;
}

void collectNamespaces(const tinyxml2::XMLElement* elem, std::set<std::string>& out)
{
  const std::string ns = namespaceOf(elem);
  if (!ns.empty() && ns != BLUEPRINT_NAMESPACE)
    out.insert(ns);

  for (const auto* attr = elem->FirstAttribute(); attr; attr = attr->Next())
  {
    if (isReservedAttribute(attr, elem))
      continue;
    const std::string attr_ns = namespaceOf(attr, elem);
    if (!attr_ns.empty() && attr_ns != BLUEPRINT_NAMESPACE)
      out.insert(attr_ns);
  }

  for (const auto* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
    collectNamespaces(child, out);
}

std::string nodeName(const DecorationNode& node)
{
  if (const auto* elem = std::get_if<const tinyxml2::XMLElement*>(&node))
    return (*elem)->Name();
  return std::get<const tinyxml2::XMLAttribute*>(node)->Name();
}

std::string nodeLocalName(const DecorationNode& node)
{
  return localName(nodeName(node).c_str());
}

int nodeLine(const DecorationNode& node)
{
  if (const auto* elem = std::get_if<const tinyxml2::XMLElement*>(&node))
    return (*elem)->GetLineNum();
  return std::get<const tinyxml2::XMLAttribute*>(node)->GetLineNum();
}

}  // namespace xml
}  // namespace blueprint
