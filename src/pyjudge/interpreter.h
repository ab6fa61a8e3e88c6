#ifndef PYJUDGE_INTERPRETER_H_
#define PYJUDGE_INTERPRETER_H_

#include "py_value.h"

#include <string>
#include <vector>
#include <stdexcept>
#include <functional>

#include <nlohmann/json.hpp>

// A Python exception, or a failure of the script to honor the entry-point
// contract, carried out of the interpreter.
class ScriptError : public std::runtime_error {
  std::string trace_;
 public:
  ScriptError(const std::string& message, const std::string& trace) :
      std::runtime_error(message), trace_(trace) {}
  const std::string& Trace() const { return trace_; }
};

// The embedded interpreter of a runner process. Only one may exist per
// process; it is never finalized since the runner exits right after the job.
//
// Scripts see a restricted set of builtins: pure helpers, an import hook that
// accepts only allowed modules, print/log routed to the log callback, and
// is_equal bound to ValuesEqual.
class Interpreter {
  std::vector<std::string> allowed_modules_;
  std::function<void(std::string)> log_;
  PyRef capsule_;
  PyRef builtins_;
  PyRef traceback_;

  static PyObject* Log(PyObject* self, PyObject* args, PyObject* kwargs);
  static PyObject* IsEqual(PyObject* self, PyObject* args);
  static PyObject* Import(PyObject* self, PyObject* args, PyObject* kwargs);

  void Bind(PyMethodDef* def, const char* name);
  bool ModuleAllowed(const std::string& name) const;
  ScriptError FetchError() const;
 public:
  // throws std::runtime_error if the interpreter cannot start
  Interpreter(const std::vector<std::string>& allowed_modules, std::function<void(std::string)> log);
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  // Execute source in a fresh namespace and return the callable it binds to
  // entry_point. Each call gets its own copy of the builtins.
  PyRef Load(const std::string& source, const char* filename, const char* module_name,
             const std::string& entry_point);
  // args is an argument tuple
  PyRef Call(const PyRef& func, const nlohmann::json& args) const;
  // ValuesEqual on two results
  bool Equal(const PyRef& a, const PyRef& b) const;
  // ValueToJson for the response
  nlohmann::json Report(const PyRef& value) const;
};

#endif  // PYJUDGE_INTERPRETER_H_
