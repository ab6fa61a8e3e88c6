#include "interpreter.h"

namespace {

constexpr char kCapsuleName[] = "pyjudge.interpreter";

const char* kSafeBuiltins[] = {
  "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes", "callable", "chr",
  "classmethod", "complex", "delattr", "dict", "dir", "divmod", "enumerate", "filter", "float",
  "format", "frozenset", "getattr", "hasattr", "hash", "hex", "id", "int", "isinstance",
  "issubclass", "iter", "len", "list", "map", "max", "memoryview", "min", "next", "object",
  "oct", "ord", "pow", "property", "range", "repr", "reversed", "round", "set", "setattr",
  "slice", "sorted", "staticmethod", "str", "sum", "super", "tuple", "type", "vars", "zip",
  "__build_class__",
  "None", "True", "False", "Ellipsis", "NotImplemented",
  // exception hierarchy; names missing from this Python version are skipped
  "BaseException", "BaseExceptionGroup", "Exception", "ExceptionGroup", "GeneratorExit",
  "KeyboardInterrupt", "SystemExit", "ArithmeticError", "AssertionError", "AttributeError",
  "BufferError", "EOFError", "FloatingPointError", "ImportError", "ModuleNotFoundError",
  "IndexError", "KeyError", "LookupError", "MemoryError", "NameError", "UnboundLocalError",
  "NotImplementedError", "OSError", "EnvironmentError", "IOError", "BlockingIOError",
  "ChildProcessError", "ConnectionError", "BrokenPipeError", "ConnectionAbortedError",
  "ConnectionRefusedError", "ConnectionResetError", "FileExistsError", "FileNotFoundError",
  "InterruptedError", "IsADirectoryError", "NotADirectoryError", "PermissionError",
  "ProcessLookupError", "TimeoutError", "OverflowError", "RecursionError", "ReferenceError",
  "RuntimeError", "StopAsyncIteration", "StopIteration", "SyntaxError", "IndentationError",
  "TabError", "SystemError", "TypeError", "ValueError", "UnicodeError", "UnicodeDecodeError",
  "UnicodeEncodeError", "UnicodeTranslateError", "ZeroDivisionError",
  "Warning", "BytesWarning", "DeprecationWarning", "EncodingWarning", "FutureWarning",
  "ImportWarning", "PendingDeprecationWarning", "ResourceWarning", "RuntimeWarning",
  "SyntaxWarning", "UnicodeWarning", "UserWarning",
};

// ml_meth is filled in by the Interpreter, which owns the implementations
PyMethodDef kLogDef = {"log", nullptr, METH_VARARGS | METH_KEYWORDS, nullptr};
PyMethodDef kIsEqualDef = {"is_equal", nullptr, METH_VARARGS, nullptr};
PyMethodDef kImportDef = {"__import__", nullptr, METH_VARARGS | METH_KEYWORDS, nullptr};

std::string ToString(PyObject* obj) {
  PyRef str(PyObject_Str(obj));
  if (!str) return "";
  Py_ssize_t size;
  const char* data = PyUnicode_AsUTF8AndSize(str.get(), &size);
  if (!data) return "";
  return std::string(data, size);
}

inline Interpreter* Self(PyObject* capsule) {
  return static_cast<Interpreter*>(PyCapsule_GetPointer(capsule, kCapsuleName));
}

} // namespace

PyObject* Interpreter::Log(PyObject* self, PyObject* args, PyObject* kwargs) {
  Interpreter* interp = Self(self);
  if (!interp) return nullptr;
  std::string sep = " ";
  if (kwargs) {
    PyObject* sep_obj = PyDict_GetItemString(kwargs, "sep");
    if (sep_obj && sep_obj != Py_None) {
      if (!PyUnicode_Check(sep_obj)) {
        PyErr_SetString(PyExc_TypeError, "sep must be None or a string");
        return nullptr;
      }
      sep = ToString(sep_obj);
    }
  }
  std::string line;
  for (Py_ssize_t i = 0; i < PyTuple_GET_SIZE(args); i++) {
    PyRef str(PyObject_Str(PyTuple_GET_ITEM(args, i)));
    if (!str) return nullptr;
    Py_ssize_t size;
    const char* data = PyUnicode_AsUTF8AndSize(str.get(), &size);
    if (!data) return nullptr;
    if (i) line += sep;
    line.append(data, size);
  }
  try {
    interp->log_(std::move(line));
  } catch (const std::exception& e) {
    PyErr_SetString(PyExc_RuntimeError, e.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

PyObject* Interpreter::IsEqual(PyObject*, PyObject* args) {
  PyObject *a, *b;
  if (!PyArg_ParseTuple(args, "OO:is_equal", &a, &b)) return nullptr;
  int eq = ValuesEqual(a, b);
  if (eq < 0) return nullptr;
  return PyBool_FromLong(eq);
}

PyObject* Interpreter::Import(PyObject* self, PyObject* args, PyObject* kwargs) {
  Interpreter* interp = Self(self);
  if (!interp) return nullptr;
  static const char* kwlist[] = {"name", "globals", "locals", "fromlist", "level", nullptr};
  PyObject *name, *globals = nullptr, *locals = nullptr, *fromlist = nullptr;
  int level = 0;
  if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", const_cast<char**>(kwlist),
                                   &name, &globals, &locals, &fromlist, &level)) {
    return nullptr;
  }
  if (level != 0) {
    PyErr_SetString(PyExc_ImportError, "relative imports are not allowed");
    return nullptr;
  }
  std::string module = ToString(name);
  if (!interp->ModuleAllowed(module.substr(0, module.find('.')))) {
    PyErr_Format(PyExc_ImportError, "import of '%s' is not allowed", module.c_str());
    return nullptr;
  }
  return PyImport_ImportModuleLevelObject(name, globals, locals, fromlist, 0);
}

Interpreter::Interpreter(const std::vector<std::string>& allowed_modules,
                         std::function<void(std::string)> log) :
    allowed_modules_(allowed_modules), log_(std::move(log)) {
  PyConfig config;
  PyConfig_InitIsolatedConfig(&config);
  config.write_bytecode = 0;
  config.site_import = 0;
  config.install_signal_handlers = 0;
  PyStatus status = Py_InitializeFromConfig(&config);
  PyConfig_Clear(&config);
  if (PyStatus_Exception(status)) {
    throw std::runtime_error(std::string("interpreter initialization failed: ") +
                             (status.err_msg ? status.err_msg : "unknown error"));
  }

  capsule_ = PyRef(PyCapsule_New(this, kCapsuleName, nullptr));
  builtins_ = PyRef(PyDict_New());
  traceback_ = PyRef(PyImport_ImportModule("traceback"));
  PyRef builtins_module(PyImport_ImportModule("builtins"));
  if (!capsule_ || !builtins_ || !traceback_ || !builtins_module) {
    throw std::runtime_error("interpreter initialization failed: " + std::string(FetchError().what()));
  }
  PyObject* all_builtins = PyModule_GetDict(builtins_module.get());
  for (const char* name : kSafeBuiltins) {
    if (PyObject* item = PyDict_GetItemString(all_builtins, name)) {
      PyDict_SetItemString(builtins_.get(), name, item);
    }
  }
  kLogDef.ml_meth = (PyCFunction)(void (*)(void))Log;
  kIsEqualDef.ml_meth = IsEqual;
  kImportDef.ml_meth = (PyCFunction)(void (*)(void))Import;
  Bind(&kLogDef, "print");
  Bind(&kLogDef, "log");
  Bind(&kIsEqualDef, "is_equal");
  Bind(&kImportDef, "__import__");
}

void Interpreter::Bind(PyMethodDef* def, const char* name) {
  PyRef func(PyCFunction_New(def, capsule_.get()));
  if (!func || PyDict_SetItemString(builtins_.get(), name, func.get()) < 0) {
    throw std::runtime_error("interpreter initialization failed: " + std::string(FetchError().what()));
  }
}

bool Interpreter::ModuleAllowed(const std::string& name) const {
  for (auto& i : allowed_modules_) {
    if (i == name) return true;
  }
  return false;
}

ScriptError Interpreter::FetchError() const {
  PyObject *type, *value, *tb;
  PyErr_Fetch(&type, &value, &tb);
  if (!type) return ScriptError("unknown error", "");
  PyErr_NormalizeException(&type, &value, &tb);
  if (tb && value) PyException_SetTraceback(value, tb);
  PyRef type_ref(type), value_ref(value), tb_ref(tb);

  std::string message = ((PyTypeObject*)type)->tp_name;
  if (value) {
    std::string text = ToString(value);
    if (PyErr_Occurred()) PyErr_Clear();
    if (text.size()) message += ": " + text;
  }
  std::string trace;
  if (traceback_) {
    PyRef lines(PyObject_CallMethod(traceback_.get(), "format_exception", "OOO",
                                    type, value ? value : Py_None, tb ? tb : Py_None));
    PyRef empty(PyUnicode_FromString(""));
    PyRef joined(lines && empty ? PyUnicode_Join(empty.get(), lines.get()) : nullptr);
    if (joined) {
      trace = ToString(joined.get());
      while (trace.size() && trace.back() == '\n') trace.pop_back();
    }
    if (PyErr_Occurred()) PyErr_Clear();
  }
  return ScriptError(message, trace);
}

PyRef Interpreter::Load(const std::string& source, const char* filename, const char* module_name,
                        const std::string& entry_point) {
  PyRef globals(PyDict_New());
  PyRef builtins(PyDict_Copy(builtins_.get()));
  PyRef name(PyUnicode_FromString(module_name));
  if (!globals || !builtins || !name ||
      PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) < 0 ||
      PyDict_SetItemString(globals.get(), "__name__", name.get()) < 0) {
    throw FetchError();
  }
  PyRef code(Py_CompileString(source.c_str(), filename, Py_file_input));
  if (!code) throw FetchError();
  PyRef result(PyEval_EvalCode(code.get(), globals.get(), globals.get()));
  if (!result) throw FetchError();
  PyObject* func = PyDict_GetItemString(globals.get(), entry_point.c_str());
  if (!func) {
    throw ScriptError("NameError: name '" + entry_point + "' is not defined in " + filename, "");
  }
  if (!PyCallable_Check(func)) {
    throw ScriptError("TypeError: '" + entry_point + "' in " + filename + " is not callable", "");
  }
  return PyRef::Borrow(func);
}

PyRef Interpreter::Call(const PyRef& func, const nlohmann::json& args) const {
  if (!args.is_array()) throw ScriptError("TypeError: test case is not an argument list", "");
  PyRef tuple(PyTuple_New(args.size()));
  if (!tuple) throw FetchError();
  for (size_t i = 0; i < args.size(); i++) {
    PyObject* item = ValueFromJson(args[i]);
    if (!item) throw FetchError();
    PyTuple_SET_ITEM(tuple.get(), i, item);
  }
  PyRef ret(PyObject_CallObject(func.get(), tuple.get()));
  if (!ret) throw FetchError();
  return ret;
}

bool Interpreter::Equal(const PyRef& a, const PyRef& b) const {
  int eq = ValuesEqual(a.get(), b.get());
  if (eq < 0) throw FetchError();
  return eq;
}

nlohmann::json Interpreter::Report(const PyRef& value) const {
  nlohmann::json ret;
  if (!ValueToJson(value.get(), ret)) throw FetchError();
  return ret;
}
