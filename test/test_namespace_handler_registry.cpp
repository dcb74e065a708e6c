#include <blueprint/namespace_handler_registry.h>

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "test_handlers.h"

using namespace blueprint;

namespace {

constexpr char NS_A[] = "http://example.org/ns/a";
constexpr char NS_B[] = "http://example.org/ns/b";

}  // namespace

TEST(NamespaceHandlerRegistry, LookupMissingIsEmpty)
{
  NamespaceHandlerRegistry registry;
  EXPECT_FALSE(registry.lookup(NS_A).has_value());
  EXPECT_EQ(registry.size(), 0u);
}

TEST(NamespaceHandlerRegistry, LastRegistrationWins)
{
  NamespaceHandlerRegistry registry;
  auto first = std::make_shared<test::LambdaHandler>();
  auto second = std::make_shared<test::LambdaHandler>();

  registry.registerHandler(NS_A, first);
  ASSERT_TRUE(registry.lookup(NS_A).has_value());
  EXPECT_EQ(registry.lookup(NS_A)->handler, first);

  registry.registerHandler(NS_A, second);
  EXPECT_EQ(registry.lookup(NS_A)->handler, second);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(NamespaceHandlerRegistry, OneHandlerManyNamespaces)
{
  NamespaceHandlerRegistry registry;
  auto handler = std::make_shared<test::LambdaHandler>();
  registry.registerHandler(std::vector<std::string>{ NS_A, NS_B }, handler);

  EXPECT_EQ(registry.lookup(NS_A)->handler, handler);
  EXPECT_EQ(registry.lookup(NS_B)->handler, handler);
  EXPECT_EQ(registry.lookup(NS_B)->namespace_uri, NS_B);

  EXPECT_EQ(registry.unregisterHandler(handler), 2u);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(NamespaceHandlerRegistry, InvalidRegistrations)
{
  NamespaceHandlerRegistry registry;
  EXPECT_THROW(registry.registerHandler(NS_A, nullptr), std::invalid_argument);
  EXPECT_THROW(registry.registerHandler("", std::make_shared<test::LambdaHandler>()), std::invalid_argument);
}

TEST(NamespaceHandlerRegistry, UnregisterOnlyMatchingHandler)
{
  NamespaceHandlerRegistry registry;
  auto old_handler = std::make_shared<test::LambdaHandler>();
  auto new_handler = std::make_shared<test::LambdaHandler>();
  registry.registerHandler(NS_A, old_handler);
  registry.registerHandler(NS_A, new_handler);

  EXPECT_FALSE(registry.unregisterHandler(NS_A, old_handler));
  EXPECT_EQ(registry.lookup(NS_A)->handler, new_handler);

  EXPECT_TRUE(registry.unregisterHandler(NS_A, new_handler));
  EXPECT_FALSE(registry.lookup(NS_A).has_value());
}

TEST(NamespaceHandlerRegistry, ManagedClassesRecordedAtRegistration)
{
  NamespaceHandlerRegistry registry;
  auto handler = std::make_shared<test::LambdaHandler>();
  handler->managed_classes = std::vector<ClassRef>{ { "org.example.Tx", "tx-1.0" } };

  registry.registerHandler(NS_A, handler);
  registry.registerHandler(NS_B, handler, std::vector<ClassRef>{});

  ASSERT_TRUE(registry.lookup(NS_A)->managed_classes.has_value());
  EXPECT_EQ(registry.lookup(NS_A)->managed_classes->size(), 1u);
  EXPECT_TRUE(registry.lookup(NS_B)->managed_classes->empty());
}

TEST(IsCompatible, ManagedClassMustResolveIdentically)
{
  HandlerRegistration registration{ NS_A, std::make_shared<test::LambdaHandler>(),
                                    std::vector<ClassRef>{ { "org.example.Tx", "tx-1.0" } } };

  StaticClassSpace same{ { "org.example.Tx", "tx-1.0" } };
  StaticClassSpace other{ { "org.example.Tx", "tx-2.0" } };
  StaticClassSpace unrelated{ { "org.example.Other", "other-1.0" } };

  EXPECT_TRUE(isCompatible(registration, &same));
  EXPECT_FALSE(isCompatible(registration, &other));
  EXPECT_TRUE(isCompatible(registration, &unrelated));
  EXPECT_TRUE(isCompatible(registration, nullptr));
}

TEST(IsCompatible, NoManagedClassesAlwaysCompatible)
{
  StaticClassSpace space{ { "org.example.Tx", "tx-2.0" } };

  HandlerRegistration unchecked{ NS_A, std::make_shared<test::LambdaHandler>(), std::nullopt };
  HandlerRegistration empty{ NS_A, std::make_shared<test::LambdaHandler>(), std::vector<ClassRef>{} };

  EXPECT_TRUE(isCompatible(unchecked, &space));
  EXPECT_TRUE(isCompatible(empty, &space));
}

TEST(NamespaceHandlerSet, SnapshotSurvivesReregistration)
{
  NamespaceHandlerRegistry registry;
  auto first = std::make_shared<test::LambdaHandler>();
  registry.registerHandler(NS_A, first);

  NamespaceHandlerSet set = registry.getNamespaceHandlers({ NS_A, NS_B });
  registry.registerHandler(NS_A, std::make_shared<test::LambdaHandler>());
  registry.unregisterHandler(first);

  EXPECT_EQ(set.getNamespaceHandler(NS_A), first);
  EXPECT_FALSE(set.isComplete());
  ASSERT_EQ(set.getMissingNamespaces().size(), 1u);
  EXPECT_EQ(*set.getMissingNamespaces().begin(), NS_B);
  EXPECT_EQ(set.getRegistration(NS_B), nullptr);
  EXPECT_EQ(set.getNamespaces().size(), 2u);
}

TEST(NamespaceHandlerSet, SchemaLocations)
{
  NamespaceHandlerRegistry registry;
  auto validated = std::make_shared<test::LambdaHandler>();
  validated->schema_location = "blueprint://schemas/a.xsd";
  registry.registerHandler(NS_A, validated);
  registry.registerHandler(NS_B, std::make_shared<test::LambdaHandler>());

  auto locations = registry.getNamespaceHandlers({ NS_A, NS_B }).getSchemaLocations();
  ASSERT_EQ(locations.size(), 1u);
  EXPECT_EQ(locations[NS_A], "blueprint://schemas/a.xsd");
}

TEST(NamespaceHandlerRegistry, ListenersNotified)
{
  NamespaceHandlerRegistry registry;
  std::vector<std::pair<std::string, bool>> events;
  auto token = registry.addListener([&](const std::string& ns, bool registered) { events.emplace_back(ns, registered); });

  auto handler = std::make_shared<test::LambdaHandler>();
  registry.registerHandler(NS_A, handler);
  registry.unregisterHandler(NS_A, handler);
  registry.removeListener(token);
  registry.registerHandler(NS_B, handler);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], std::make_pair(std::string(NS_A), true));
  EXPECT_EQ(events[1], std::make_pair(std::string(NS_A), false));
}

TEST(NamespaceHandlerRegistry, ListenerMayQueryRegistry)
{
  NamespaceHandlerRegistry registry;
  bool seen = false;
  registry.addListener([&](const std::string& ns, bool registered) {
    if (registered)
      seen = registry.lookup(ns).has_value();
  });

  registry.registerHandler(NS_A, std::make_shared<test::LambdaHandler>());
  EXPECT_TRUE(seen);
}

TEST(NamespaceHandlerRegistry, ConcurrentLookupsSeeCompleteEntries)
{
  NamespaceHandlerRegistry registry;
  std::vector<NamespaceHandlerPtr> handlers;
  for (int i = 0; i < 4; ++i)
    handlers.push_back(std::make_shared<test::LambdaHandler>());

  std::atomic<bool> stop{ false };
  std::atomic<int> torn{ 0 };

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r)
  {
    readers.emplace_back([&] {
      while (!stop)
      {
        auto registration = registry.lookup(NS_A);
        if (registration && (!registration->handler || registration->namespace_uri != NS_A))
          ++torn;
      }
    });
  }

  for (int i = 0; i < 500; ++i)
  {
    registry.registerHandler(NS_A, handlers[i % handlers.size()], std::nullopt);
    if (i % 3 == 0)
      registry.unregisterHandler(NS_A, handlers[i % handlers.size()]);
  }
  stop = true;
  for (auto& t : readers)
    t.join();

  EXPECT_EQ(torn, 0);
}
