#include "common/python.hpp"
#include <glog/logging.h>
#include <utility>

namespace codebench {
using namespace std;

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

python_interpreter::python_interpreter() {
    CHECK(!Py_IsInitialized()) << "Python interpreter can only be initialized once";

    // 隔离模式：忽略 PYTHON* 环境变量和用户 site-packages，也不注册信号处理函数
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.install_signal_handlers = 0;
    PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status))
        LOG(FATAL) << "Unable to initialize Python interpreter: " << (status.err_msg ? status.err_msg : "unknown error");

    // 主线程释放 GIL，之后所有的解析都通过 GIL_guard 获取
    main_state = PyEval_SaveThread();
    LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
}

python_interpreter::~python_interpreter() {
    PyEval_RestoreThread(main_state);
    Py_FinalizeEx();
}

bool python_interpreter::initialized() {
    return Py_IsInitialized();
}

py_object::py_object(PyObject *obj) : obj(obj) {}

py_object::py_object(const py_object &other) : obj(other.obj) {
    Py_XINCREF(obj);
}

py_object::py_object(py_object &&other) noexcept : obj(other.obj) {
    other.obj = nullptr;
}

py_object &py_object::operator=(py_object other) noexcept {
    swap(obj, other.obj);
    return *this;
}

py_object::~py_object() {
    Py_XDECREF(obj);
}

py_object py_object::borrow(PyObject *obj) {
    Py_XINCREF(obj);
    return py_object(obj);
}

py_object py_object::attr(const char *name) const {
    if (!obj) return {};
    PyObject *value = PyObject_GetAttrString(obj, name);
    if (!value) PyErr_Clear();
    return py_object(value);
}

string to_utf8(PyObject *obj) {
    if (!obj || !PyUnicode_Check(obj)) return "";
    Py_ssize_t size = 0;
    const char *data = PyUnicode_AsUTF8AndSize(obj, &size);
    if (!data) {
        PyErr_Clear();
        return "";
    }
    return string(data, size);
}

string fetch_python_error(string *type_name) {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_object type_obj(type), value_obj(value), traceback_obj(traceback);

    string name = "Exception";
    if (type_obj && PyType_Check(type_obj.get()))
        name = reinterpret_cast<PyTypeObject *>(type_obj.get())->tp_name;
    if (type_name) *type_name = name;

    string message;
    if (value_obj) {
        py_object str(PyObject_Str(value_obj.get()));
        if (str)
            message = to_utf8(str.get());
        else
            PyErr_Clear();
    }
    return message.empty() ? name : name + ": " + message;
}

}  // namespace codebench
