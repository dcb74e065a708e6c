#ifndef BLUEPRINT_PARSE_ERROR_H_
#define BLUEPRINT_PARSE_ERROR_H_

#include <stdexcept>
#include <string>

namespace blueprint {

#define BLUEPRINT_ERROR_KINDS(X)                                                                                       \
  X(UnresolvedNamespace)                                                                                               \
  X(IncompatibleHandler)                                                                                               \
  X(DuplicateIdentifier)                                                                                               \
  X(HandlerInvocationFailure)                                                                                          \
  X(MalformedDeclaration)

enum class ErrorKind
{
#define X(name) name,
  BLUEPRINT_ERROR_KINDS(X)
#undef X
};

inline const char* errorKindToString(ErrorKind kind)
{
  switch (kind)
  {
#define X(name)                                                                                                        \
  case ErrorKind::name:                                                                                                \
    return #name;
    BLUEPRINT_ERROR_KINDS(X)
#undef X
    default:
      return "Unknown";
  }
}

/**
 * @brief Single structured failure of a parse session.
 *
 * Carries the error kind plus the name and line of the offending element or
 * attribute (empty / 0 when raised outside of any document node).
 */
class ParseError : public std::runtime_error
{
public:
  ParseError(ErrorKind kind, const std::string& message, std::string node_name = {}, int line = 0);

  ErrorKind kind() const
  {
    return kind_;
  }
  const std::string& nodeName() const
  {
    return node_name_;
  }
  int line() const
  {
    return line_;
  }
  /// Message without the kind/location decoration.
  const std::string& detail() const
  {
    return detail_;
  }

private:
  ErrorKind kind_;
  std::string node_name_;
  int line_;
  std::string detail_;
};

}  // namespace blueprint

#endif  // BLUEPRINT_PARSE_ERROR_H_
