#include "restricted/capabilities.hpp"

#include <kj/debug.h>

namespace restricted {

CapabilitySet CapabilitySet::Default() {
  return CapabilitySet({
      // Output
      "print",
      // Iteration
      "range", "enumerate", "zip", "reversed", "sorted", "len", "iter",
      "next", "any", "all", "map", "filter",
      // Arithmetic
      "min", "max", "abs", "sum", "divmod", "round", "pow",
      // Values
      "int", "bool", "float", "str", "list", "tuple", "dict", "set",
      "frozenset", "isinstance",
      // Errors the code may want to raise or catch
      "Exception", "ValueError", "IndexError", "KeyError", "TypeError",
      "StopIteration", "ZeroDivisionError",
      // Needed by class statements
      "__build_class__",
  });
}

const std::set<std::string>& CapabilitySet::Forbidden() {
  static const std::set<std::string>* forbidden = new std::set<std::string>{
      "__import__", "open",    "eval",    "exec",   "compile",
      "input",      "globals", "locals",  "vars",   "getattr",
      "setattr",    "delattr", "type",    "object", "super",
      "memoryview", "help",    "breakpoint", "exit", "quit"};
  return *forbidden;
}

namespace {
bool IsDunder(const std::string& name) {
  return name.size() >= 2 && name.compare(0, 2, "__") == 0;
}
}  // namespace

bool CapabilitySet::AllowsAttribute(const std::string& name) {
  static const std::set<std::string>* traversals = new std::set<std::string>{
      // Frames and code
      "gi_frame", "gi_code", "gi_yieldfrom", "cr_frame", "cr_code",
      "cr_await", "ag_frame", "ag_code", "f_back", "f_globals", "f_locals",
      "f_builtins", "f_code", "tb_frame", "tb_next", "co_code", "co_consts",
      // Format strings can look attributes up by name
      "format", "format_map",
      "mro"};
  return !IsDunder(name) && traversals->count(name) == 0;
}

bool CapabilitySet::AllowsName(const std::string& name) {
  return !IsDunder(name) || name == "__name__";
}

CapabilitySet::CapabilitySet(std::set<std::string> builtins)
    : builtins_(std::move(builtins)) {
  for (const std::string& name : builtins_) {
    KJ_REQUIRE(Forbidden().count(name) == 0,
               "Builtin cannot be granted to in-process code", name);
  }
}

}  // namespace restricted
