#ifndef BLUEPRINT_TEST_TEST_HANDLERS_H_
#define BLUEPRINT_TEST_TEST_HANDLERS_H_

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <blueprint/interceptor.h>
#include <blueprint/namespace_handler.h>
#include <blueprint/parser_context.h>

namespace blueprint {
namespace test {

/// Handler whose behaviour is supplied per test; counts its invocations.
class LambdaHandler : public NamespaceHandler
{
public:
  using ParseFn = std::function<metadata::MetadataID(const tinyxml2::XMLElement*, ParserContext&)>;
  using DecorateFn = std::function<metadata::MetadataID(const DecorationNode&, metadata::MetadataID, ParserContext&)>;

  ParseFn on_parse;
  DecorateFn on_decorate;
  std::optional<std::string> schema_location;
  std::optional<std::vector<ClassRef>> managed_classes;

  std::atomic<int> parse_calls{ 0 };
  std::atomic<int> decorate_calls{ 0 };

  std::optional<std::string> getSchemaLocation(const std::string&) const override
  {
    return schema_location;
  }

  std::optional<std::vector<ClassRef>> getManagedClasses() const override
  {
    return managed_classes;
  }

  metadata::MetadataID parse(const tinyxml2::XMLElement* element, ParserContext& context) override
  {
    ++parse_calls;
    if (!on_parse)
      throw std::logic_error("parse not expected");
    return on_parse(element, context);
  }

  metadata::MetadataID decorate(const DecorationNode& node, metadata::MetadataID component,
                                ParserContext& context) override
  {
    ++decorate_calls;
    if (!on_decorate)
      throw std::logic_error("decorate not expected");
    return on_decorate(node, component, context);
  }
};

class TestInterceptor : public Interceptor
{
public:
  TestInterceptor(std::string name, int rank) : name_(std::move(name)), rank_(rank)
  {
  }

  int getRank() const override
  {
    return rank_;
  }
  std::string getName() const override
  {
    return name_;
  }

private:
  std::string name_;
  int rank_;
};

/// parse(): a bean whose id is the element's "id" attribute (may be empty)
/// and whose class is its local name.
inline LambdaHandler::ParseFn beanFromElement()
{
  return [](const tinyxml2::XMLElement* element, ParserContext& context) {
    metadata::MetadataID bean = context.createMetadata(metadata::MetadataKind::Bean);
    const char* id = element->Attribute("id");
    context.get<metadata::ComponentInfo>(bean)->id = id ? id : "";
    std::string name = element->Name();
    auto colon = name.find(':');
    context.get<metadata::BeanMetadata>(bean)->class_name = colon == std::string::npos ? name : name.substr(colon + 1);
    return bean;
  };
}

}  // namespace test
}  // namespace blueprint

#endif  // BLUEPRINT_TEST_TEST_HANDLERS_H_
