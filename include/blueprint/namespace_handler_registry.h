#ifndef BLUEPRINT_NAMESPACE_HANDLER_REGISTRY_H_
#define BLUEPRINT_NAMESPACE_HANDLER_REGISTRY_H_

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <blueprint/class_space.h>
#include <blueprint/namespace_handler.h>

namespace blueprint {

/// One namespace bound to a handler, with the managed classes recorded at
/// registration time.
struct HandlerRegistration
{
  std::string namespace_uri;
  NamespaceHandlerPtr handler;
  std::optional<std::vector<ClassRef>> managed_classes;
};

/**
 * @brief Checks that every managed class of the registration resolves to the
 * identical class in `class_space`.
 *
 * A managed class the class space cannot see does not conflict. No managed
 * classes (empty optional or empty list) is always compatible, and so is a
 * null class space (dry parse: the check is skipped).
 */
bool isCompatible(const HandlerRegistration& registration, const ClassSpace* class_space);

/**
 * @brief Handlers resolved for the namespaces of one parse.
 *
 * A snapshot: later changes to the registry do not affect it, so a parse in
 * flight keeps using the handlers it started with.
 */
class NamespaceHandlerSet
{
public:
  const std::set<std::string>& getNamespaces() const
  {
    return namespaces_;
  }

  bool isComplete() const
  {
    return missing_.empty();
  }
  const std::set<std::string>& getMissingNamespaces() const
  {
    return missing_;
  }

  /// Null when no handler was registered for the namespace.
  const HandlerRegistration* getRegistration(const std::string& namespace_uri) const;
  NamespaceHandlerPtr getNamespaceHandler(const std::string& namespace_uri) const;

  /// Namespace -> schema location, for namespaces whose handler asks for validation.
  std::map<std::string, std::string> getSchemaLocations() const;

private:
  friend class NamespaceHandlerRegistry;

  std::set<std::string> namespaces_;
  std::set<std::string> missing_;
  std::map<std::string, HandlerRegistration> handlers_;
};

/**
 * @brief Maps namespace URIs to the handler currently serving them.
 *
 * Safe for concurrent use: lookups share a lock, (un)registration takes it
 * exclusively. The last registration for a namespace wins.
 */
class NamespaceHandlerRegistry
{
public:
  /// (namespace, true) after a registration, (namespace, false) after a removal.
  using Listener = std::function<void(const std::string&, bool)>;
  using ListenerToken = std::size_t;

  NamespaceHandlerRegistry() = default;
  NamespaceHandlerRegistry(const NamespaceHandlerRegistry&) = delete;
  NamespaceHandlerRegistry& operator=(const NamespaceHandlerRegistry&) = delete;

  /// Records handler->getManagedClasses() as the managed classes.
  void registerHandler(const std::string& namespace_uri, NamespaceHandlerPtr handler);
  void registerHandler(const std::string& namespace_uri, NamespaceHandlerPtr handler,
                       std::optional<std::vector<ClassRef>> managed_classes);
  void registerHandler(const std::vector<std::string>& namespace_uris, NamespaceHandlerPtr handler);

  /// Removes the binding only if it still points at `handler`.
  bool unregisterHandler(const std::string& namespace_uri, const NamespaceHandlerPtr& handler);
  /// Removes every namespace bound to `handler` (its module went away).
  std::size_t unregisterHandler(const NamespaceHandlerPtr& handler);

  /// Empty when nothing is registered for the namespace.
  std::optional<HandlerRegistration> lookup(const std::string& namespace_uri) const;

  NamespaceHandlerSet getNamespaceHandlers(const std::set<std::string>& namespace_uris) const;

  std::size_t size() const;

  ListenerToken addListener(Listener listener);
  void removeListener(ListenerToken token);

private:
  void notify(const std::string& namespace_uri, bool registered);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, HandlerRegistration> handlers_;

  std::mutex listeners_mutex_;
  std::vector<std::pair<ListenerToken, Listener>> listeners_;
  ListenerToken next_token_ = 0;
};

}  // namespace blueprint

#endif  // BLUEPRINT_NAMESPACE_HANDLER_REGISTRY_H_
