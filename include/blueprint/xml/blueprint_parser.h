#ifndef BLUEPRINT_XML_BLUEPRINT_PARSER_H_
#define BLUEPRINT_XML_BLUEPRINT_PARSER_H_

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <tinyxml2.h>

#include <blueprint/blueprint.h>
#include <blueprint/module_environment.h>
#include <blueprint/namespace_handler_registry.h>

namespace blueprint {
namespace xml {

/**
 * @brief Parses one or more component-definition documents into a Blueprint.
 *
 * Typical use by a loader:
 *   1. loadFromFile()/loadFromText()/addDocument() for every document;
 *   2. getNamespaces() to find the extension namespaces the documents need;
 *   3. resolve them (NamespaceHandlerRegistry::getNamespaceHandlers) and
 *      populate() the graph, or call parse() to do both.
 *
 * Every populate() runs a fresh session; a failure throws ParseError and
 * leaves no graph behind.
 */
class BlueprintParser
{
public:
  BlueprintParser();
  ~BlueprintParser();

  /// False (with an error on stderr) if the file is not well-formed XML.
  bool loadFromFile(const std::string& filename);
  bool loadFromText(const std::string& text);

  /// Adds a document owned by the caller; it must outlive the parser.
  void addDocument(const tinyxml2::XMLDocument* doc);

  std::size_t documentCount() const
  {
    return roots_.size();
  }

  /// Non-core namespaces used by elements or attributes of all documents.
  std::set<std::string> getNamespaces() const;

  Blueprint populate(const NamespaceHandlerSet& handlers, const ModuleEnvironment* environment = nullptr) const;

  Blueprint parse(const NamespaceHandlerRegistry& registry, const ModuleEnvironment* environment = nullptr) const;

private:
  std::vector<std::unique_ptr<tinyxml2::XMLDocument>> owned_docs_;
  std::vector<const tinyxml2::XMLElement*> roots_;
};

/// Parses a single <blueprint> root. A null environment is a dry parse.
Blueprint parseDocument(const tinyxml2::XMLElement* root, const NamespaceHandlerRegistry& registry,
                        const ModuleEnvironment* environment = nullptr);

}  // namespace xml
}  // namespace blueprint

#endif  // BLUEPRINT_XML_BLUEPRINT_PARSER_H_
