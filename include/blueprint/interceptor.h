#ifndef BLUEPRINT_INTERCEPTOR_H_
#define BLUEPRINT_INTERCEPTOR_H_

#include <memory>
#include <string>

namespace blueprint {

/// Opaque interceptor bound to a component. Invocation belongs to the runtime;
/// the parser only records the bindings, ordered by rank (highest first).
class Interceptor
{
public:
  virtual ~Interceptor() = default;

  virtual int getRank() const = 0;
  virtual std::string getName() const = 0;
};

using InterceptorPtr = std::shared_ptr<Interceptor>;

}  // namespace blueprint

#endif  // BLUEPRINT_INTERCEPTOR_H_
