#include <blueprint/component_definition_registry.h>
#include <blueprint/parse_error.h>

#include <gtest/gtest.h>

#include "test_handlers.h"

using namespace blueprint;
using namespace blueprint::metadata;

namespace {

MetadataID makeBean(MetadataGraph& graph, const std::string& id)
{
  auto bean = graph.createMetadata(MetadataKind::Bean);
  graph.get<ComponentInfo>(bean)->id = id;
  return bean;
}

}  // namespace

TEST(ComponentDefinitionRegistry, RegisterAndLookup)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);

  auto a = makeBean(graph, "A");
  auto b = makeBean(graph, "B");
  registry.registerComponentDefinition(b);
  registry.registerComponentDefinition(a);

  EXPECT_TRUE(registry.containsComponentDefinition("A"));
  EXPECT_EQ(registry.getComponentDefinition("A"), a);
  EXPECT_FALSE(registry.getComponentDefinition("C").has_value());

  // registration order, not id order
  ASSERT_EQ(registry.getComponentDefinitionNames().size(), 2u);
  EXPECT_EQ(registry.getComponentDefinitionNames()[0], "B");
  EXPECT_EQ(registry.getComponentDefinitionNames()[1], "A");
}

TEST(ComponentDefinitionRegistry, DuplicateIdRejected)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);

  registry.registerComponentDefinition(makeBean(graph, "x"));
  try
  {
    registry.registerComponentDefinition(makeBean(graph, "x"));
    FAIL() << "expected DuplicateIdentifier";
  }
  catch (const ParseError& e)
  {
    EXPECT_EQ(e.kind(), ErrorKind::DuplicateIdentifier);
  }
  EXPECT_EQ(registry.getComponentDefinitionNames().size(), 1u);
}

TEST(ComponentDefinitionRegistry, OnlyComponentsWithIdsRegister)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);

  auto value = graph.createMetadata(MetadataKind::Value);
  auto anonymous = graph.createMetadata(MetadataKind::Bean);

  EXPECT_THROW(registry.registerComponentDefinition(value), ParseError);
  EXPECT_THROW(registry.registerComponentDefinition(anonymous), ParseError);
}

TEST(ComponentDefinitionRegistry, RegisteredIdsAreNeverGenerated)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);

  registry.registerComponentDefinition(makeBean(graph, ".component-1"));
  EXPECT_EQ(graph.idGenerator().generateId(), ".component-2");
}

TEST(ComponentDefinitionRegistry, RemoveDropsNameAndInterceptors)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);

  auto a = makeBean(graph, "A");
  registry.registerComponentDefinition(a);
  registry.registerInterceptorWithComponent(a, std::make_shared<test::TestInterceptor>("tx", 1));

  EXPECT_TRUE(registry.removeComponentDefinition("A"));
  EXPECT_FALSE(registry.removeComponentDefinition("A"));
  EXPECT_TRUE(registry.getComponentDefinitionNames().empty());
  EXPECT_TRUE(registry.getInterceptors(a).empty());
}

TEST(ComponentDefinitionRegistry, InterceptorsSortedByRank)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);
  auto a = makeBean(graph, "A");

  registry.registerInterceptorWithComponent(a, std::make_shared<test::TestInterceptor>("low", 1));
  registry.registerInterceptorWithComponent(a, std::make_shared<test::TestInterceptor>("high", 10));
  registry.registerInterceptorWithComponent(a, std::make_shared<test::TestInterceptor>("low-2", 1));

  auto interceptors = registry.getInterceptors(a);
  ASSERT_EQ(interceptors.size(), 3u);
  EXPECT_EQ(interceptors[0]->getName(), "high");
  EXPECT_EQ(interceptors[1]->getName(), "low");
  EXPECT_EQ(interceptors[2]->getName(), "low-2");
}

TEST(ComponentDefinitionRegistry, InterceptorsNeedComponent)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);
  auto value = graph.createMetadata(MetadataKind::Value);
  auto bean = makeBean(graph, "A");

  EXPECT_THROW(registry.registerInterceptorWithComponent(value, std::make_shared<test::TestInterceptor>("x", 0)),
               ParseError);
  EXPECT_THROW(registry.registerInterceptorWithComponent(bean, nullptr), std::invalid_argument);
}

TEST(ComponentDefinitionRegistry, TransferInterceptorsMergesWithoutDuplicates)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);
  auto from = makeBean(graph, "A");
  auto to = graph.createMetadata(MetadataKind::Bean);

  auto shared = std::make_shared<test::TestInterceptor>("shared", 5);
  registry.registerInterceptorWithComponent(from, shared);
  registry.registerInterceptorWithComponent(from, std::make_shared<test::TestInterceptor>("log", 1));
  registry.registerInterceptorWithComponent(to, shared);
  registry.registerInterceptorWithComponent(to, std::make_shared<test::TestInterceptor>("security", 9));

  registry.transferInterceptors(from, to);

  EXPECT_TRUE(registry.getInterceptors(from).empty());
  auto moved = registry.getInterceptors(to);
  ASSERT_EQ(moved.size(), 3u);
  EXPECT_EQ(moved[0]->getName(), "security");
  EXPECT_EQ(moved[1]->getName(), "shared");
  EXPECT_EQ(moved[2]->getName(), "log");
}

TEST(ComponentDefinitionRegistry, TypeConverters)
{
  MetadataGraph graph;
  ComponentDefinitionRegistry registry(graph);
  auto ref = graph.createMetadata(MetadataKind::Ref);
  registry.registerTypeConverter(ref);

  ASSERT_EQ(registry.getTypeConverters().size(), 1u);
  EXPECT_EQ(registry.getTypeConverters()[0], ref);

  MetadataGraph other;
  other.createMetadata(MetadataKind::Value);
  auto foreign = other.createMetadata(MetadataKind::Value);
  EXPECT_THROW(registry.registerTypeConverter(foreign), ParseError);
}
