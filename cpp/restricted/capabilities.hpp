#ifndef RESTRICTED_CAPABILITIES_HPP
#define RESTRICTED_CAPABILITIES_HPP

#include <set>
#include <string>

namespace restricted {

// The builtins that in-process code is allowed to see. Anything not listed is
// simply not reachable by name. Some builtins can never be granted, since they
// would give access to modules, files or arbitrary code.
class CapabilitySet {
 public:
  // Iteration helpers, min/max/len and a few other pure functions, print, and
  // the common exception types.
  static CapabilitySet Default();

  // Throws a kj exception if builtins contains a forbidden name.
  explicit CapabilitySet(std::set<std::string> builtins);

  bool Allows(const std::string& name) const {
    return builtins_.count(name) != 0;
  }
  const std::set<std::string>& Builtins() const { return builtins_; }

  // Names that are rejected by the constructor.
  static const std::set<std::string>& Forbidden();

  // Whether code may spell .name. Attribute lookups do not go through the
  // builtins, so dunder attributes and the ones that lead from a value to
  // frames, code objects or module globals are never allowed.
  static bool AllowsAttribute(const std::string& name);

  // Whether code may refer to name as a variable. Dunder names are reserved,
  // except __name__.
  static bool AllowsName(const std::string& name);

 private:
  std::set<std::string> builtins_;
};

}  // namespace restricted

#endif
