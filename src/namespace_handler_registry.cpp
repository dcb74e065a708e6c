#include <blueprint/namespace_handler_registry.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace blueprint {

bool isCompatible(const HandlerRegistration& registration, const ClassSpace* class_space)
{
  if (!class_space || !registration.managed_classes)
    return true;

  for (const auto& managed : *registration.managed_classes)
  {
    auto resolved = class_space->loadClass(managed.name);
    if (!resolved)
      continue;  // not visible to the module, nothing to clash with
    if (*resolved != managed)
      return false;
  }
  return true;
}

const HandlerRegistration* NamespaceHandlerSet::getRegistration(const std::string& namespace_uri) const
{
  auto it = handlers_.find(namespace_uri);
  return it == handlers_.end() ? nullptr : &it->second;
}

NamespaceHandlerPtr NamespaceHandlerSet::getNamespaceHandler(const std::string& namespace_uri) const
{
  const auto* registration = getRegistration(namespace_uri);
  return registration ? registration->handler : nullptr;
}

std::map<std::string, std::string> NamespaceHandlerSet::getSchemaLocations() const
{
  std::map<std::string, std::string> locations;
  for (const auto& [ns, registration] : handlers_)
  {
    if (auto location = registration.handler->getSchemaLocation(ns))
      locations.emplace(ns, *location);
  }
  return locations;
}

void NamespaceHandlerRegistry::registerHandler(const std::string& namespace_uri, NamespaceHandlerPtr handler)
{
  if (!handler)
    throw std::invalid_argument("Cannot register a null namespace handler for '" + namespace_uri + "'");
  auto managed = handler->getManagedClasses();
  registerHandler(namespace_uri, std::move(handler), std::move(managed));
}

void NamespaceHandlerRegistry::registerHandler(const std::string& namespace_uri, NamespaceHandlerPtr handler,
                                               std::optional<std::vector<ClassRef>> managed_classes)
{
  if (namespace_uri.empty())
    throw std::invalid_argument("Cannot register a namespace handler for an empty namespace");
  if (!handler)
    throw std::invalid_argument("Cannot register a null namespace handler for '" + namespace_uri + "'");

  {
    std::unique_lock lock(mutex_);
    HandlerRegistration registration{ namespace_uri, std::move(handler), std::move(managed_classes) };
    auto [it, inserted] = handlers_.insert_or_assign(namespace_uri, std::move(registration));
    if (!inserted)
      std::cerr << "WARNING: namespace handler for '" << namespace_uri << "' replaced by a newer registration\n";
  }
  notify(namespace_uri, true);
}

void NamespaceHandlerRegistry::registerHandler(const std::vector<std::string>& namespace_uris,
                                               NamespaceHandlerPtr handler)
{
  for (const auto& ns : namespace_uris)
    registerHandler(ns, handler);
}

bool NamespaceHandlerRegistry::unregisterHandler(const std::string& namespace_uri, const NamespaceHandlerPtr& handler)
{
  {
    std::unique_lock lock(mutex_);
    auto it = handlers_.find(namespace_uri);
    if (it == handlers_.end() || it->second.handler != handler)
      return false;
    handlers_.erase(it);
  }
  notify(namespace_uri, false);
  return true;
}

std::size_t NamespaceHandlerRegistry::unregisterHandler(const NamespaceHandlerPtr& handler)
{
  std::vector<std::string> removed;
  {
    std::unique_lock lock(mutex_);
    for (auto it = handlers_.begin(); it != handlers_.end();)
    {
      if (it->second.handler == handler)
      {
        removed.push_back(it->first);
        it = handlers_.erase(it);
      }
      else
        ++it;
    }
  }
  for (const auto& ns : removed)
    notify(ns, false);
  return removed.size();
}

std::optional<HandlerRegistration> NamespaceHandlerRegistry::lookup(const std::string& namespace_uri) const
{
  std::shared_lock lock(mutex_);
  auto it = handlers_.find(namespace_uri);
  if (it == handlers_.end())
    return std::nullopt;
  return it->second;
}

NamespaceHandlerSet NamespaceHandlerRegistry::getNamespaceHandlers(const std::set<std::string>& namespace_uris) const
{
  NamespaceHandlerSet set;
  set.namespaces_ = namespace_uris;

  std::shared_lock lock(mutex_);
  for (const auto& ns : namespace_uris)
  {
    auto it = handlers_.find(ns);
    if (it == handlers_.end())
      set.missing_.insert(ns);
    else
      set.handlers_.emplace(ns, it->second);
  }
  return set;
}

std::size_t NamespaceHandlerRegistry::size() const
{
  std::shared_lock lock(mutex_);
  return handlers_.size();
}

NamespaceHandlerRegistry::ListenerToken NamespaceHandlerRegistry::addListener(Listener listener)
{
  std::lock_guard lock(listeners_mutex_);
  const ListenerToken token = ++next_token_;
  listeners_.emplace_back(token, std::move(listener));
  return token;
}

void NamespaceHandlerRegistry::removeListener(ListenerToken token)
{
  std::lock_guard lock(listeners_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [token](const auto& entry) { return entry.first == token; }),
                   listeners_.end());
}

void NamespaceHandlerRegistry::notify(const std::string& namespace_uri, bool registered)
{
  // Copy so listeners may (un)register without deadlocking.
  std::vector<Listener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    for (const auto& entry : listeners_)
      listeners.push_back(entry.second);
  }
  for (const auto& listener : listeners)
    listener(namespace_uri, registered);
}

}  // namespace blueprint
