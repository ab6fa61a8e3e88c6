#include "py_value.h"

#include <cmath>
#include <string>

namespace {

inline bool IsNumber(PyObject* obj) {
  return (PyLong_Check(obj) && !PyBool_Check(obj)) || PyFloat_Check(obj);
}

inline bool IsNan(PyObject* obj) {
  return PyFloat_Check(obj) && std::isnan(PyFloat_AS_DOUBLE(obj));
}

inline bool IsSequence(PyObject* obj) {
  return PyList_Check(obj) || PyTuple_Check(obj);
}

// str with lone surrogates comes out backslash-escaped
bool AsString(PyObject* str, std::string& out) {
  Py_ssize_t size;
  if (const char* data = PyUnicode_AsUTF8AndSize(str, &size)) {
    out.assign(data, size);
    return true;
  }
  if (!PyErr_ExceptionMatches(PyExc_UnicodeEncodeError)) return false;
  PyErr_Clear();
  PyRef bytes(PyUnicode_AsEncodedString(str, "utf-8", "backslashreplace"));
  if (!bytes) return false;
  out.assign(PyBytes_AS_STRING(bytes.get()), PyBytes_GET_SIZE(bytes.get()));
  return true;
}

bool ReprString(PyObject* obj, std::string& out) {
  PyRef repr(PyObject_Repr(obj));
  return repr && AsString(repr.get(), out);
}

bool IntToJson(PyObject* obj, nlohmann::json& out) {
  int overflow = 0;
  long long val = PyLong_AsLongLongAndOverflow(obj, &overflow);
  if (val == -1 && PyErr_Occurred()) return false;
  if (!overflow) {
    out = (int64_t)val;
    return true;
  }
  if (overflow > 0) {
    unsigned long long uval = PyLong_AsUnsignedLongLong(obj);
    if (!PyErr_Occurred()) {
      out = (uint64_t)uval;
      return true;
    }
    if (!PyErr_ExceptionMatches(PyExc_OverflowError)) return false;
    PyErr_Clear();
  }
  PyRef digits(PyNumber_ToBase(obj, 10));
  if (!digits) {
    // decimal conversion is capped by sys.get_int_max_str_digits()
    if (!PyErr_ExceptionMatches(PyExc_ValueError)) return false;
    PyErr_Clear();
    digits = PyRef(PyNumber_ToBase(obj, 16));
    if (!digits) return false;
  }
  std::string str;
  if (!AsString(digits.get(), str)) return false;
  out = std::move(str);
  return true;
}

bool SequenceToJson(PyObject* obj, nlohmann::json& out) {
  PyRef items(PySequence_Tuple(obj));
  if (!items) return false;
  out = nlohmann::json::array();
  for (Py_ssize_t i = 0; i < PyTuple_GET_SIZE(items.get()); i++) {
    nlohmann::json val;
    if (!ValueToJson(PyTuple_GET_ITEM(items.get(), i), val)) return false;
    out.push_back(std::move(val));
  }
  return true;
}

bool DictToJson(PyObject* obj, nlohmann::json& out) {
  PyRef items(PyDict_Items(obj));
  if (!items) return false;
  out = nlohmann::json::object();
  for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); i++) {
    PyObject* pair = PyList_GET_ITEM(items.get(), i);
    PyObject* key = PyTuple_GET_ITEM(pair, 0);
    std::string name;
    if (!(PyUnicode_Check(key) ? AsString(key, name) : ReprString(key, name))) return false;
    nlohmann::json val;
    if (!ValueToJson(PyTuple_GET_ITEM(pair, 1), val)) return false;
    out[name] = std::move(val);
  }
  return true;
}

int SequenceEqual(PyObject* a, PyObject* b) {
  // snapshots; __eq__ of an element may mutate either list
  PyRef x(PySequence_Tuple(a)), y(PySequence_Tuple(b));
  if (!x || !y) return -1;
  Py_ssize_t size = PyTuple_GET_SIZE(x.get());
  if (size != PyTuple_GET_SIZE(y.get())) return 0;
  for (Py_ssize_t i = 0; i < size; i++) {
    int eq = ValuesEqual(PyTuple_GET_ITEM(x.get(), i), PyTuple_GET_ITEM(y.get(), i));
    if (eq != 1) return eq;
  }
  return 1;
}

int DictEqual(PyObject* a, PyObject* b) {
  if (PyDict_Size(a) != PyDict_Size(b)) return 0;
  PyRef items(PyDict_Items(a));
  if (!items) return -1;
  for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); i++) {
    PyObject* pair = PyList_GET_ITEM(items.get(), i);
    PyRef other = PyRef::Borrow(PyDict_GetItemWithError(b, PyTuple_GET_ITEM(pair, 0)));
    if (!other) return PyErr_Occurred() ? -1 : 0;
    int eq = ValuesEqual(PyTuple_GET_ITEM(pair, 1), other.get());
    if (eq != 1) return eq;
  }
  return 1;
}

} // namespace

PyObject* ValueFromJson(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::null: Py_INCREF(Py_None); return Py_None;
    case nlohmann::json::value_t::boolean: return PyBool_FromLong(value.get<bool>());
    case nlohmann::json::value_t::number_integer: return PyLong_FromLongLong(value.get<int64_t>());
    case nlohmann::json::value_t::number_unsigned:
      return PyLong_FromUnsignedLongLong(value.get<uint64_t>());
    case nlohmann::json::value_t::number_float: return PyFloat_FromDouble(value.get<double>());
    case nlohmann::json::value_t::string: {
      const std::string& str = value.get_ref<const std::string&>();
      return PyUnicode_FromStringAndSize(str.data(), str.size());
    }
    case nlohmann::json::value_t::array: {
      PyRef list(PyList_New(value.size()));
      if (!list) return nullptr;
      for (size_t i = 0; i < value.size(); i++) {
        PyObject* item = ValueFromJson(value[i]);
        if (!item) return nullptr;
        PyList_SET_ITEM(list.get(), i, item);
      }
      return list.release();
    }
    case nlohmann::json::value_t::object: {
      PyRef dict(PyDict_New());
      if (!dict) return nullptr;
      for (auto it = value.begin(); it != value.end(); ++it) {
        PyRef key(PyUnicode_FromStringAndSize(it.key().data(), it.key().size()));
        PyRef item(ValueFromJson(it.value()));
        if (!key || !item || PyDict_SetItem(dict.get(), key.get(), item.get()) < 0) return nullptr;
      }
      return dict.release();
    }
    default:
      PyErr_SetString(PyExc_TypeError, "unsupported test case value");
      return nullptr;
  }
}

bool ValueToJson(PyObject* obj, nlohmann::json& out) {
  if (obj == Py_None) {
    out = nullptr;
    return true;
  }
  if (PyBool_Check(obj)) {
    out = obj == Py_True;
    return true;
  }
  if (PyLong_Check(obj)) return IntToJson(obj, out);
  if (PyFloat_Check(obj) && std::isfinite(PyFloat_AS_DOUBLE(obj))) {
    out = PyFloat_AS_DOUBLE(obj);
    return true;
  }
  if (PyUnicode_Check(obj)) {
    std::string str;
    if (!AsString(obj, str)) return false;
    out = std::move(str);
    return true;
  }
  if (IsSequence(obj) || PyDict_Check(obj)) {
    if (Py_EnterRecursiveCall(" while converting a value")) return false;
    bool ret = IsSequence(obj) ? SequenceToJson(obj, out) : DictToJson(obj, out);
    Py_LeaveRecursiveCall();
    return ret;
  }
  std::string repr;
  if (!ReprString(obj, repr)) return false;
  out = std::move(repr);
  return true;
}

int ValuesEqual(PyObject* a, PyObject* b) {
  if (a == Py_None || b == Py_None) return a == b;
  if (PyBool_Check(a) || PyBool_Check(b)) return a == b;
  if (IsNumber(a) || IsNumber(b)) {
    if (!IsNumber(a) || !IsNumber(b)) return 0;
    if (IsNan(a) || IsNan(b)) return IsNan(a) && IsNan(b);
    return PyObject_RichCompareBool(a, b, Py_EQ);
  }
  if (PyUnicode_Check(a) || PyUnicode_Check(b)) {
    if (!PyUnicode_Check(a) || !PyUnicode_Check(b)) return 0;
    return PyObject_RichCompareBool(a, b, Py_EQ);
  }
  bool seq = IsSequence(a), dict = PyDict_Check(a);
  if (seq || dict || IsSequence(b) || PyDict_Check(b)) {
    if (seq != IsSequence(b) || dict != (bool)PyDict_Check(b)) return 0;
    if (Py_EnterRecursiveCall(" while comparing values")) return -1;
    int ret = seq ? SequenceEqual(a, b) : DictEqual(a, b);
    Py_LeaveRecursiveCall();
    return ret;
  }
  if (Py_TYPE(a) != Py_TYPE(b)) return 0;
  return PyObject_RichCompareBool(a, b, Py_EQ);
}
