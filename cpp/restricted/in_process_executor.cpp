#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#pragma GCC diagnostic pop

#include "restricted/in_process_executor.hpp"

#include <cstdint>
#include <mutex>
#include <string>

#include <kj/debug.h>

namespace restricted {

namespace {

// The interpreter lives until the process exits. The lock is released after
// the initialization, and every run acquires it.
void EnsureInterpreter() {
  static std::once_flag initialized;
  std::call_once(initialized, []() {
    if (Py_IsInitialized()) return;
    pybind11::initialize_interpreter();
    PyEval_SaveThread();
    KJ_LOG(INFO, "Embedded interpreter initialized");
  });
}

// Sends sys.stdout and sys.stderr to a buffer while in scope.
class CapturedOutput {
 public:
  CapturedOutput() {
    pybind11::module sys = pybind11::module::import("sys");
    buffer_ = pybind11::module::import("io").attr("StringIO")();
    stdout_ = sys.attr("stdout");
    stderr_ = sys.attr("stderr");
    sys.attr("stdout") = buffer_;
    sys.attr("stderr") = buffer_;
  }
  ~CapturedOutput() {
    if (PySys_SetObject("stdout", stdout_.ptr()) != 0 ||
        PySys_SetObject("stderr", stderr_.ptr()) != 0) {
      PyErr_Clear();
      KJ_LOG(ERROR, "Cannot restore the standard streams");
    }
  }
  KJ_DISALLOW_COPY(CapturedOutput);

  std::string Text() const {
    return buffer_.attr("getvalue")().cast<std::string>();
  }

 private:
  pybind11::object buffer_;
  pybind11::object stdout_;
  pybind11::object stderr_;
};

bool ReadCoordinate(const pybind11::object& item, int32_t* value) {
  if (!pybind11::isinstance<pybind11::int_>(item) || PyBool_Check(item.ptr())) {
    return false;
  }
  long long number = 0;  // NOLINT
  try {
    number = item.cast<long long>();  // NOLINT
  } catch (const pybind11::cast_error&) {
    return false;
  }
  if (number < INT32_MIN || number > INT32_MAX) return false;
  *value = static_cast<int32_t>(number);
  return true;
}

// Reads a (row, col) tuple or list. Anything else is not a move.
core::MoveCandidate ReadMove(const pybind11::dict& globals) {
  if (!globals.contains("next_move")) return core::MoveCandidate();
  pybind11::object value = globals["next_move"];
  std::string raw = pybind11::str(value).cast<std::string>();
  if (!pybind11::isinstance<pybind11::tuple>(value) &&
      !pybind11::isinstance<pybind11::list>(value)) {
    return core::MoveCandidate::Empty(raw);
  }
  auto pair = pybind11::reinterpret_borrow<pybind11::sequence>(value);
  int32_t row = 0;
  int32_t col = 0;
  if (pair.size() != 2 || !ReadCoordinate(pair[0], &row) ||
      !ReadCoordinate(pair[1], &col)) {
    return core::MoveCandidate::Empty(raw);
  }
  return core::MoveCandidate::Of(row, col, raw);
}

// Parses the code and checks every attribute and variable it spells out.
// Returns false and sets error_msg on the first one that is not allowed.
// Syntax errors are raised as Python exceptions.
bool CheckIdentifiers(const std::string& code, std::string* error_msg) {
  pybind11::module ast = pybind11::module::import("ast");
  pybind11::object tree = ast.attr("parse")(code);
  pybind11::object attribute_type = ast.attr("Attribute");
  pybind11::object name_type = ast.attr("Name");
  auto reject = [error_msg](pybind11::handle node, const std::string& what) {
    *error_msg = "'" + what + "' is not accessible";
    if (pybind11::hasattr(node, "lineno")) {
      *error_msg += " (line " +
                    std::to_string(node.attr("lineno").cast<int>()) + ")";
    }
    return false;
  };
  for (pybind11::handle node : ast.attr("walk")(tree)) {
    if (pybind11::isinstance(node, attribute_type)) {
      std::string attr = node.attr("attr").cast<std::string>();
      if (!CapabilitySet::AllowsAttribute(attr)) return reject(node, attr);
    } else if (pybind11::isinstance(node, name_type)) {
      std::string id = node.attr("id").cast<std::string>();
      if (!CapabilitySet::AllowsName(id)) return reject(node, id);
    } else if (pybind11::hasattr(node, "kwd_attrs")) {
      // Class patterns look attributes up by keyword.
      for (pybind11::handle attr : node.attr("kwd_attrs")) {
        std::string name = attr.cast<std::string>();
        if (!CapabilitySet::AllowsAttribute(name)) return reject(node, name);
      }
    }
  }
  return true;
}

pybind11::dict MakeGlobals(const CapabilitySet& capabilities,
                           const core::RuntimeContext& context) {
  pybind11::dict all_builtins =
      pybind11::module::import("builtins").attr("__dict__");
  pybind11::dict builtins;
  for (const std::string& name : capabilities.Builtins()) {
    if (all_builtins.contains(name.c_str())) {
      builtins[name.c_str()] = all_builtins[name.c_str()];
    }
  }
  pybind11::dict globals;
  globals["__builtins__"] = builtins;
  globals["__name__"] = "__movebox__";
  globals["board"] = pybind11::cast(context.board);
  globals["current_player"] = context.current_player;
  return globals;
}

}  // namespace

core::ExecutionOutcome InProcessExecutor::Run(
    const core::CodeSubmission& submission) {
  EnsureInterpreter();
  pybind11::gil_scoped_acquire acquire;
  std::string output;
  try {
    pybind11::dict globals =
        MakeGlobals(capabilities_, submission.Context());
    CapturedOutput captured;
    try {
      std::string error_msg;
      if (!CheckIdentifiers(submission.Code(), &error_msg)) {
        KJ_LOG(INFO, "In-process code rejected", error_msg);
        return core::ExecutionOutcome::Failed(
            core::FailureCategory::RUNTIME_FAULT, "AccessError: " + error_msg,
            core::kExitNotApplicable);
      }
      pybind11::exec(pybind11::str(submission.Code()), globals);
    } catch (const pybind11::error_already_set& exc) {
      output = captured.Text();
      KJ_LOG(INFO, "In-process execution raised", exc.what());
      return core::ExecutionOutcome::Failed(
          core::FailureCategory::RUNTIME_FAULT, output + exc.what(),
          core::kExitNotApplicable);
    }
    output = captured.Text();
    return core::ExecutionOutcome::Succeeded(output, core::kExitNotApplicable)
        .WithMove(ReadMove(globals));
  } catch (const pybind11::error_already_set& exc) {
    KJ_LOG(ERROR, "Cannot prepare the in-process execution", exc.what());
    return core::ExecutionOutcome::Failed(core::FailureCategory::RUNTIME_FAULT,
                                          output + exc.what(),
                                          core::kExitNotApplicable);
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "In-process execution failed", exc.what());
    return core::ExecutionOutcome::Failed(core::FailureCategory::RUNTIME_FAULT,
                                          output + exc.what(),
                                          core::kExitNotApplicable);
  }
}

}  // namespace restricted
