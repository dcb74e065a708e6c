#include <blueprint/uri_resolver.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#define BLUEPRINT_PATH_SEP ';'
#else
#define BLUEPRINT_PATH_SEP ':'
#endif

namespace {

constexpr char SCHEME[] = "blueprint://";
constexpr char FILE_SCHEME[] = "file://";

std::vector<std::string> split_roots(const std::string& roots)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : roots)
  {
    if (c == BLUEPRINT_PATH_SEP)
    {
      if (!cur.empty())
        out.push_back(cur), cur.clear();
    }
    else
      cur.push_back(c);
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

bool starts_with(const std::string& s, const char* prefix)
{
  return s.rfind(prefix, 0) == 0;
}

bool is_remote(const std::string& s)
{
  return starts_with(s, "http://") || starts_with(s, "https://");
}

// drop "." and ".." so a schema uri cannot escape its root
std::string sanitize_relpath(const std::string& rel)
{
  std::filesystem::path clean;
  for (const auto& part : std::filesystem::path(rel))
  {
    if (part == ".." || part == "." || part == "/" || part.empty())
      continue;
    clean /= part;
  }
  return clean.generic_string();
}

}  // namespace

namespace blueprint {

ResolvedSchema resolve_schema_location(const std::string& uri, const std::string& current_dir, const char* env_roots)
{
  if (uri.empty())
    throw std::runtime_error("Empty schema location");

  if (is_remote(uri))
    throw std::runtime_error("Remote schema locations are not supported: " + uri);

  if (!starts_with(uri, SCHEME))
  {
    std::filesystem::path p(starts_with(uri, FILE_SCHEME) ? uri.substr(std::string(FILE_SCHEME).size()) : uri);
    if (p.is_relative() && !current_dir.empty())
      p = std::filesystem::path(current_dir) / p;
    if (!std::filesystem::exists(p))
      throw std::runtime_error("Schema file not found: " + p.string());
    return { std::filesystem::weakly_canonical(p).string(), "" };
  }

  const char* roots_c = env_roots ? env_roots : std::getenv("BLUEPRINT_SCHEMA_PATH");
  if (!roots_c || std::string(roots_c).empty())
    throw std::runtime_error("BLUEPRINT_SCHEMA_PATH not set (use ':' or ';' to separate multiple roots).");

  const std::string rel = sanitize_relpath(uri.substr(std::string(SCHEME).size()));
  for (const auto& root : split_roots(roots_c))
  {
    // remote roots are never fetched
    if (is_remote(root))
      continue;

    std::filesystem::path candidate = std::filesystem::path(root) / rel;
    if (std::filesystem::exists(candidate))
      return { std::filesystem::weakly_canonical(candidate).string(), root };
  }

  throw std::runtime_error("blueprint:// schema not found in any root: " + uri);
}

std::map<std::string, std::string> resolve_schema_locations(const NamespaceHandlerSet& handlers,
                                                            const std::string& current_dir, const char* env_roots)
{
  std::map<std::string, std::string> out;
  for (const auto& [ns, location] : handlers.getSchemaLocations())
    out[ns] = resolve_schema_location(location, current_dir, env_roots).local_path;
  return out;
}

}  // namespace blueprint
