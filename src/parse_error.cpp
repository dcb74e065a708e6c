#include <blueprint/parse_error.h>

namespace blueprint {
namespace {

std::string formatMessage(ErrorKind kind, const std::string& message, const std::string& node_name, int line)
{
  std::string out = std::string("[") + errorKindToString(kind) + "] " + message;
  if (!node_name.empty())
    out += " at <" + node_name + ">";
  if (line > 0)
    out += " (line " + std::to_string(line) + ")";
  return out;
}

}  // namespace

ParseError::ParseError(ErrorKind kind, const std::string& message, std::string node_name, int line)
  : std::runtime_error(formatMessage(kind, message, node_name, line))
  , kind_(kind)
  , node_name_(std::move(node_name))
  , line_(line)
  , detail_(message)
{
}

}  // namespace blueprint
