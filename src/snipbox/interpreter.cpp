#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "interpreter.h"

#include <sys/resource.h>
#include <set>
#include <climits>
#include <cstring>

#include <spdlog/spdlog.h>
#include "capability.h"
#include "utils.h"

namespace {

const int kMaxConvertDepth = 64;
const char kSnippetFilename[] = "<snippet>";

class PyRef {
  PyObject* obj_;
 public:
  PyRef() : obj_(nullptr) {}
  // steals the reference
  explicit PyRef(PyObject* obj) : obj_(obj) {}
  PyRef(const PyRef&) = delete;
  PyRef& operator=(const PyRef&) = delete;
  PyRef(PyRef&& x) : obj_(x.obj_) { x.obj_ = nullptr; }
  PyRef& operator=(PyRef&& x) {
    if (this != &x) {
      Py_XDECREF(obj_);
      obj_ = x.obj_;
      x.obj_ = nullptr;
    }
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

// the process runs one snippet, so the guarded import works on globals
const CapabilityTable* g_capabilities = nullptr;
PyObject* g_real_import = nullptr;
PyObject* g_policy_violation = nullptr;

PyObject* GuardedImport(PyObject*, PyObject* args, PyObject* kwargs) {
  PyObject* name = nullptr;
  if (PyTuple_GET_SIZE(args) > 0) {
    name = PyTuple_GET_ITEM(args, 0);
  } else if (kwargs) {
    name = PyDict_GetItemString(kwargs, "name");
  }
  if (!name || !PyUnicode_Check(name)) {
    PyErr_SetString(PyExc_TypeError, "__import__() argument 'name' must be str");
    return nullptr;
  }
  const char* str = PyUnicode_AsUTF8(name);
  if (!str) return nullptr;
  std::string reason;
  if (!g_capabilities->AdmitImport(str, reason)) {
    PyErr_SetString(g_policy_violation, reason.c_str());
    return nullptr;
  }
  return PyObject_Call(g_real_import, args, kwargs);
}

PyMethodDef kGuardedImportDef = {
  "__import__", (PyCFunction)(void(*)(void))GuardedImport, METH_VARARGS | METH_KEYWORDS,
  "Import a module admitted by the execution policy.",
};

// UTF-8 text of a str object; lone surrogates are replaced
std::string Utf8(PyObject* obj) {
  PyRef bytes(PyUnicode_AsEncodedString(obj, "utf-8", "replace"));
  if (!bytes) {
    PyErr_Clear();
    return "";
  }
  return std::string(PyBytes_AS_STRING(bytes.get()), PyBytes_GET_SIZE(bytes.get()));
}

std::string Str(PyObject* obj, bool repr = false) {
  PyRef text(repr ? PyObject_Repr(obj) : PyObject_Str(obj));
  if (!text) {
    PyErr_Clear();
    return "<unprintable>";
  }
  return Utf8(text.get());
}

PyRef JsonToPy(const nlohmann::json& val) {
  using value_t = nlohmann::json::value_t;
  switch (val.type()) {
    case value_t::boolean:
      return PyRef::Borrow(val.get<bool>() ? Py_True : Py_False);
    case value_t::number_integer: return PyRef(PyLong_FromLongLong(val.get<long long>()));
    case value_t::number_unsigned:
      return PyRef(PyLong_FromUnsignedLongLong(val.get<unsigned long long>()));
    case value_t::number_float: return PyRef(PyFloat_FromDouble(val.get<double>()));
    case value_t::string: {
      auto& str = val.get_ref<const std::string&>();
      return PyRef(PyUnicode_DecodeUTF8(str.data(), str.size(), "replace"));
    }
    case value_t::array: {
      PyRef ret(PyList_New(val.size()));
      if (!ret) return ret;
      Py_ssize_t idx = 0;
      for (auto& i : val) {
        PyRef item = JsonToPy(i);
        if (!item) return PyRef();
        PyList_SET_ITEM(ret.get(), idx++, item.release());
      }
      return ret;
    }
    case value_t::object: {
      PyRef ret(PyDict_New());
      if (!ret) return ret;
      for (auto& [key, value] : val.items()) {
        PyRef item = JsonToPy(value);
        if (!item || PyDict_SetItemString(ret.get(), key.c_str(), item.get()) < 0) return PyRef();
      }
      return ret;
    }
    default: break;
  }
  return PyRef::Borrow(Py_None);
}

// Objects without a JSON form are stringified; nesting beyond the depth limit is repr'd
nlohmann::json PyToJson(PyObject* obj, int depth) {
  if (obj == Py_None) return nullptr;
  if (PyBool_Check(obj)) return obj == Py_True;
  if (depth > kMaxConvertDepth) return Str(obj, true);
  if (PyLong_Check(obj)) {
    int overflow = 0;
    long long val = PyLong_AsLongLongAndOverflow(obj, &overflow);
    if (!overflow && !(val == -1 && PyErr_Occurred())) return val;
    PyErr_Clear();
    return Str(obj);
  }
  if (PyFloat_Check(obj)) return PyFloat_AS_DOUBLE(obj);
  if (PyUnicode_Check(obj)) return Utf8(obj);
  if (PyList_Check(obj) || PyTuple_Check(obj)) {
    PyRef seq(PySequence_Fast(obj, "expected a sequence"));
    if (!seq) {
      PyErr_Clear();
      return Str(obj);
    }
    nlohmann::json ret = nlohmann::json::array();
    Py_ssize_t n = PySequence_Fast_GET_SIZE(seq.get());
    PyObject** items = PySequence_Fast_ITEMS(seq.get());
    for (Py_ssize_t i = 0; i < n; i++) ret.push_back(PyToJson(items[i], depth + 1));
    return ret;
  }
  if (PyDict_Check(obj)) {
    nlohmann::json ret = nlohmann::json::object();
    PyRef items(PyDict_Items(obj));
    if (!items) {
      PyErr_Clear();
      return Str(obj);
    }
    for (Py_ssize_t i = 0; i < PyList_GET_SIZE(items.get()); i++) {
      PyObject* pair = PyList_GET_ITEM(items.get(), i);
      PyObject* key = PyTuple_GET_ITEM(pair, 0);
      ret[PyUnicode_Check(key) ? Utf8(key) : Str(key)] =
          PyToJson(PyTuple_GET_ITEM(pair, 1), depth + 1);
    }
    return ret;
  }
  return Str(obj);
}

bool InitInterpreter(const std::string& program, std::string& error) {
  PyConfig config;
  PyConfig_InitIsolatedConfig(&config);
  config.install_signal_handlers = 0;
  PyStatus status;
  if (program.size()) {
    // sys.prefix follows the environment's pyvenv.cfg
    status = PyConfig_SetBytesString(&config, &config.program_name, program.c_str());
    if (PyStatus_Exception(status)) goto err;
  }
  status = Py_InitializeFromConfig(&config);
  if (PyStatus_Exception(status)) goto err;
  PyConfig_Clear(&config);
  return true;
err:
  error = fmt::format("Interpreter initialization failed: {}",
                      status.err_msg ? status.err_msg : "unknown error");
  PyConfig_Clear(&config);
  return false;
}

// Fresh builtins table holding only admitted names; __import__ is always the guarded one.
PyRef AdmittedBuiltins(const CapabilityTable& table, std::set<std::string>& denied) {
  PyObject* builtins = PyEval_GetBuiltins();
  PyRef ret(PyDict_New());
  if (!builtins || !ret) return PyRef();
  PyObject *key, *value;
  Py_ssize_t pos = 0;
  while (PyDict_Next(builtins, &pos, &key, &value)) {
    if (!PyUnicode_Check(key)) continue;
    std::string name = Utf8(key);
    if (name == "__import__") continue;
    if (!table.AdmitBuiltin(name)) {
      denied.insert(name);
      continue;
    }
    if (PyDict_SetItem(ret.get(), key, value) < 0) return PyRef();
  }
  PyRef guarded(PyCFunction_New(&kGuardedImportDef, nullptr));
  if (!guarded || PyDict_SetItemString(ret.get(), "__import__", guarded.get()) < 0) return PyRef();
  return ret;
}

void ApplyMemoryLimit(long memory_mb) {
  rlim_t bytes = (rlim_t)memory_mb * 1024 * 1024;
  struct rlimit cur;
  if (getrlimit(RLIMIT_AS, &cur) < 0) {
    spdlog::warn("getrlimit failed: {}", strerror(errno));
    return;
  }
  if (cur.rlim_max != RLIM_INFINITY && cur.rlim_max < bytes) bytes = cur.rlim_max;
  struct rlimit lim = {bytes, cur.rlim_max};
  if (setrlimit(RLIMIT_AS, &lim) < 0) {
    spdlog::warn("Failed to apply memory limit of {} MiB: {}", memory_mb, strerror(errno));
  }
}

struct PendingError {
  PyRef type, value, traceback;
};

PendingError FetchError() {
  PyObject *type, *value, *tb;
  PyErr_Fetch(&type, &value, &tb);
  PyErr_NormalizeException(&type, &value, &tb);
  if (tb && value) PyException_SetTraceback(value, tb);
  return {PyRef(type), PyRef(value), PyRef(tb)};
}

std::string TypeName(PyObject* type) {
  std::string name = ((PyTypeObject*)type)->tp_name;
  size_t dot = name.rfind('.');
  return dot == std::string::npos ? name : name.substr(dot + 1);
}

std::string FormatTraceback(PyObject* traceback_module, const PendingError& exc) {
  if (!traceback_module || !exc.value) return "";
  PyRef lines(PyObject_CallMethod(traceback_module, "format_exception", "O", exc.value.get()));
  if (!lines) {
    PyErr_Clear();
    return "";
  }
  std::string ret;
  PyRef seq(PySequence_Fast(lines.get(), "expected a list"));
  if (!seq) {
    PyErr_Clear();
    return "";
  }
  for (Py_ssize_t i = 0; i < PySequence_Fast_GET_SIZE(seq.get()); i++) {
    PyObject* line = PySequence_Fast_GET_ITEM(seq.get(), i);
    if (PyUnicode_Check(line)) ret += Utf8(line);
  }
  return ret;
}

void DescribeError(const PendingError& exc, PyObject* traceback_module,
                   const std::set<std::string>& denied_builtins,
                   const std::set<std::string>& denied_globals, SnippetOutcome& ret) {
  PyObject* type = exc.type.get();
  PyObject* value = exc.value.get();
  if (PyErr_GivenExceptionMatches(type, PyExc_SystemExit)) {
    PyRef code(value ? PyObject_GetAttrString(value, "code") : nullptr);
    if (!code) PyErr_Clear();
    if (!code || code.get() == Py_None) {
      ret.ok = true;
      ret.exit_code = 0;
      return;
    }
    if (PyLong_Check(code.get())) {
      long val = PyLong_AsLong(code.get());
      if (val == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        val = 1;
      }
      if (val == 0) {
        ret.ok = true;
        ret.exit_code = 0;
        return;
      }
      // reported unmasked; the worker's own exit status is masked separately
      ret.exit_code = val > INT_MAX || val < INT_MIN ? 1 : (int)val;
      ret.error = fmt::format("SystemExit: {}", val);
      ret.error_kind = ErrorKind::EXIT_NONZERO;
      return;
    }
    std::string message = Str(code.get());
    ret.err += message + "\n";
    ret.error = fmt::format("SystemExit: {}", message);
    ret.error_kind = ErrorKind::EXIT_NONZERO;
    ret.exit_code = 1;
    return;
  }
  if (PyErr_GivenExceptionMatches(type, PyExc_MemoryError)) {
    ret.resource_exceeded = true;
    ret.error = "MemoryError: Memory limit exceeded";
    ret.error_kind = ErrorKind::RESOURCE_EXCEEDED;
    ret.exit_code = kExitMemory;
    return;
  }

  std::string message = value ? Str(value) : "";
  ret.error = fmt::format("{}: {}", TypeName(type), message);
  ret.error_kind = ErrorKind::RUNTIME_ERROR;
  ret.exit_code = 1;
  if (PyErr_GivenExceptionMatches(type, g_policy_violation)) {
    ret.error_kind = ErrorKind::POLICY_VIOLATION;
  } else if (PyErr_GivenExceptionMatches(type, PyExc_NameError) && value) {
    PyRef name(PyObject_GetAttrString(value, "name"));
    if (!name) PyErr_Clear();
    if (name && PyUnicode_Check(name.get())) {
      std::string str = Utf8(name.get());
      const char* kind = denied_builtins.count(str) ? "builtin" :
                         denied_globals.count(str) ? "global" : nullptr;
      if (kind) {
        ret.error += fmt::format(" ({} '{}' is blocked by policy)", kind, str);
        ret.error_kind = ErrorKind::POLICY_VIOLATION;
      }
    }
  }
  ret.err += FormatTraceback(traceback_module, exc);
}

std::string ReadBuffer(PyObject* buffer) {
  if (!buffer) return "";
  PyRef text(PyObject_CallMethod(buffer, "getvalue", nullptr));
  if (!text || !PyUnicode_Check(text.get())) {
    PyErr_Clear();
    return "";
  }
  return Utf8(text.get());
}

} // namespace

SnippetOutcome SnippetOutcome::Failure(std::string error, int exit_code) {
  SnippetOutcome ret;
  ret.error = std::move(error);
  ret.error_kind = ErrorKind::INFRASTRUCTURE;
  ret.exit_code = exit_code;
  return ret;
}

nlohmann::json SnippetOutcome::ToJson() const {
  nlohmann::json ret = {
    {"ok", ok},
    {"stdout", out},
    {"stderr", err},
    {"resource_exceeded", resource_exceeded},
    {"error", ok ? nlohmann::json() : nlohmann::json(error)},
    {"error_kind", ErrorKindName(error_kind)},
    {"exit_code", exit_code},
  };
  if (result) ret["result"] = *result;
  return ret;
}

SnippetOutcome RunSnippet(const std::string& program, const std::string& code,
                          const nlohmann::json& input_data, const Policy& policy) {
  CapabilityTable table(policy);
  g_capabilities = &table;
  std::string error;
  if (!Py_IsInitialized() && !InitInterpreter(program, error)) return SnippetOutcome::Failure(error);

  PyRef io(PyImport_ImportModule("io"));
  PyRef traceback(PyImport_ImportModule("traceback"));
  PyRef builtins_module(PyImport_ImportModule("builtins"));
  if (!io || !traceback || !builtins_module) {
    PyErr_Clear();
    return SnippetOutcome::Failure("Interpreter is missing its standard library");
  }
  PyRef out(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  PyRef err(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  PyRef in(PyObject_CallMethod(io.get(), "StringIO", nullptr));
  if (!out || !err || !in || PySys_SetObject("stdout", out.get()) < 0 ||
      PySys_SetObject("stderr", err.get()) < 0 || PySys_SetObject("stdin", in.get()) < 0) {
    PyErr_Clear();
    return SnippetOutcome::Failure("Failed to capture interpreter output");
  }
  g_real_import = PyObject_GetAttrString(builtins_module.get(), "__import__");
  g_policy_violation = PyErr_NewException("snipbox.PolicyViolation", PyExc_ImportError, nullptr);
  if (!g_real_import || !g_policy_violation) {
    PyErr_Clear();
    return SnippetOutcome::Failure("Failed to install the import guard");
  }

  std::set<std::string> denied_builtins;
  PyRef builtins = AdmittedBuiltins(table, denied_builtins);
  PyRef globals(PyDict_New());
  PyRef main_name(PyUnicode_FromString("__main__"));
  if (!builtins || !globals || !main_name ||
      PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) < 0 ||
      PyDict_SetItemString(globals.get(), "__name__", main_name.get()) < 0) {
    PyErr_Clear();
    return SnippetOutcome::Failure("Failed to build the snippet namespace");
  }
  GlobalBindings bindings = table.BindGlobals(input_data, policy.extra_globals);
  for (auto& [name, value] : bindings.admitted) {
    PyRef obj = JsonToPy(value);
    if (!obj || PyDict_SetItemString(globals.get(), name.c_str(), obj.get()) < 0) {
      PyErr_Clear();
      return SnippetOutcome::Failure(fmt::format("Failed to bind global '{}'", name));
    }
  }
  spdlog::debug("Namespace ready: {} builtins denied, {} globals bound, {} denied",
      denied_builtins.size(), bindings.admitted.size(), bindings.denied.size());

  ApplyMemoryLimit(policy.memory_limit_mb);

  SnippetOutcome ret;
  ret.ok = true;
  PyRef compiled;
  if (code.find('\0') != std::string::npos) {
    PyErr_SetString(PyExc_SyntaxError, "source code string cannot contain null bytes");
  } else {
    compiled = PyRef(Py_CompileString(code.c_str(), kSnippetFilename, Py_file_input));
  }
  PyRef value;
  if (compiled) value = PyRef(PyEval_EvalCode(compiled.get(), globals.get(), globals.get()));
  if (!value) {
    ret.ok = false;
    PendingError exc = FetchError();
    DescribeError(exc, traceback.get(), denied_builtins, bindings.denied, ret);
    PyErr_Clear();
  }

  if (PyObject* result = PyDict_GetItemString(globals.get(), "result")) {
    ret.result = PyToJson(result, 0);
  }
  std::string err_text = ReadBuffer(err.get()) + ret.err;
  ret.out = TruncateUtf8(ReadBuffer(out.get()), policy.MaxOutputBytes());
  ret.err = TruncateUtf8(err_text, policy.MaxOutputBytes());
  PyErr_Clear();
  return ret;
}
