#ifndef BLUEPRINT_XML_UTILS_H_
#define BLUEPRINT_XML_UTILS_H_

#include <string>
#include <vector>

#include <tinyxml2.h>

#include <blueprint/parse_error.h>

namespace blueprint {
namespace xml {

inline bool tryTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, std::string* out)
{
  if (!elem || !attr || !out)
    return false;
  const char* raw = elem->Attribute(attr);
  if (!raw)
    return false;
  *out = raw;
  return true;
}

inline std::string textAttribute(const tinyxml2::XMLElement* elem, const char* attr, const std::string& fallback = "")
{
  const char* raw = elem ? elem->Attribute(attr) : nullptr;
  return raw ? std::string(raw) : fallback;
}

inline std::string textAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* raw = elem ? elem->Attribute(attr) : nullptr;
  if (!raw || !*raw)
    throw ParseError(ErrorKind::MalformedDeclaration, std::string("Missing required attribute '") + attr + "'",
                     elem ? elem->Name() : "?", elem ? elem->GetLineNum() : 0);
  return raw;
}

inline std::string elementText(const tinyxml2::XMLElement* elem)
{
  const char* raw = (elem && elem->GetText()) ? elem->GetText() : "";
  return raw;
}

/// Splits on commas and whitespace, dropping empty tokens ("a, b c" -> a b c).
inline std::vector<std::string> splitList(const std::string& s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s)
  {
    if (c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r')
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

}  // namespace xml
}  // namespace blueprint

#endif  // BLUEPRINT_XML_UTILS_H_
