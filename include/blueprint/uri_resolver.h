#ifndef BLUEPRINT_URI_RESOLVER_H_
#define BLUEPRINT_URI_RESOLVER_H_

#include <map>
#include <string>

#include <blueprint/namespace_handler_registry.h>

namespace blueprint {

struct ResolvedSchema
{
  std::string local_path;   // file to hand to the schema validator
  std::string source_root;  // schema root that matched; empty for plain paths
};

/**
 * Resolve a schema location returned by NamespaceHandler::getSchemaLocation().
 *
 * Supported inputs:
 *  - blueprint://vendor/schema.xsd  (searched under BLUEPRINT_SCHEMA_PATH roots)
 *  - file:///abs/path.xsd, absolute or relative filesystem paths
 *
 * Search roots are read from BLUEPRINT_SCHEMA_PATH (Unix ':' | Windows ';'
 * separated) unless `env_roots` is given.
 *
 * @throws std::runtime_error on failure (unset roots, not found, remote URL).
 */
ResolvedSchema resolve_schema_location(const std::string& uri, const std::string& current_dir = "",
                                       const char* env_roots = nullptr);

/// Resolves every schema location of a handler set (namespace -> local file).
std::map<std::string, std::string> resolve_schema_locations(const NamespaceHandlerSet& handlers,
                                                            const std::string& current_dir = "",
                                                            const char* env_roots = nullptr);

}  // namespace blueprint

#endif  // BLUEPRINT_URI_RESOLVER_H_
