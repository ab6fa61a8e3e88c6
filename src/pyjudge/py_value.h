#ifndef PYJUDGE_PY_VALUE_H_
#define PYJUDGE_PY_VALUE_H_

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <utility>

#include <nlohmann/json.hpp>

// Owning reference to a Python object
class PyRef {
  PyObject* obj_;
 public:
  PyRef() : obj_(nullptr) {}
  explicit PyRef(PyObject* obj) : obj_(obj) {} // steals
  PyRef(const PyRef&) = delete;
  PyRef(PyRef&& x) noexcept : obj_(x.obj_) { x.obj_ = nullptr; }
  PyRef& operator=(const PyRef&) = delete;
  PyRef& operator=(PyRef&& x) noexcept {
    std::swap(obj_, x.obj_);
    return *this;
  }
  ~PyRef() { Py_XDECREF(obj_); }

  static PyRef Borrow(PyObject* obj) {
    Py_XINCREF(obj);
    return PyRef(obj);
  }
  PyObject* get() const { return obj_; }
  PyObject* release() {
    PyObject* ret = obj_;
    obj_ = nullptr;
    return ret;
  }
  explicit operator bool() const { return obj_ != nullptr; }
};

// Conversions between test-case JSON and Python values, and the comparator
// that judges a case. All of them need the GIL and report failures as a set
// Python exception.

// New reference, or nullptr
PyObject* ValueFromJson(const nlohmann::json& value);

// Render a value for the response; false on failure.
// - int outside int64/uint64: its exact decimal digits as a string
// - non-finite float, or any type without a JSON counterpart: repr() string
// - tuple: array
// - dict key that is not a str: repr() of the key
bool ValueToJson(PyObject* obj, nlohmann::json& out);

// Deep equality used to judge a test case. 1 if equal, 0 if not, -1 on error.
// - list and tuple are one kind of sequence, compared element-wise in order
// - dict: same key set as dict lookup sees it (any hashable key), values recursively
// - int and float are one numeric kind compared exactly (1 == 1.0); NaN equals NaN
// - no coercion between kinds (True != 1, "1" != 1, None != 0)
// - other values are equal only if of the same type and == says so
int ValuesEqual(PyObject* a, PyObject* b);

#endif  // PYJUDGE_PY_VALUE_H_
