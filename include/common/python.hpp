#pragma once

#include <Python.h>
#include <string>

namespace codebench {

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 任何线程调用 Python C API 之前都必须持有该锁
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

    GIL_guard(const GIL_guard &) = delete;
    GIL_guard &operator=(const GIL_guard &) = delete;

private:
    PyGILState_STATE state;
};

/**
 * @brief 内嵌 Python 解释器的生命周期
 * 内嵌解释器只用来调用 ast 模块解析代码，绝不会执行候选代码。
 * 必须在主线程创建，且整个进程只能创建一个。
 * 构造完成后主线程已经释放 GIL。
 */
class python_interpreter {
public:
    python_interpreter();
    ~python_interpreter();

    python_interpreter(const python_interpreter &) = delete;
    python_interpreter &operator=(const python_interpreter &) = delete;

    static bool initialized();

private:
    PyThreadState *main_state = nullptr;
};

/**
 * @brief PyObject 的强引用，析构时 Py_XDECREF
 * 必须在持有 GIL 时构造和析构
 */
class py_object {
public:
    py_object() = default;

    /**
     * @brief 接管一个新引用（C API 中返回 New reference 的函数）
     */
    explicit py_object(PyObject *obj);

    py_object(const py_object &other);
    py_object(py_object &&other) noexcept;
    py_object &operator=(py_object other) noexcept;
    ~py_object();

    /**
     * @brief 从借用引用构造，会增加引用计数
     */
    static py_object borrow(PyObject *obj);

    PyObject *get() const { return obj; }
    explicit operator bool() const { return obj != nullptr; }

    /**
     * @brief 读取属性，若属性不存在则清除 Python 异常并返回空对象
     */
    py_object attr(const char *name) const;

private:
    PyObject *obj = nullptr;
};

/**
 * @brief 将 Python str 对象转换为 UTF-8 字符串，非 str 返回空串
 */
std::string to_utf8(PyObject *obj);

/**
 * @brief 取出当前的 Python 异常，返回 "类名: 信息" 并清除异常状态
 * @param type_name 若非空，写入异常类名
 */
std::string fetch_python_error(std::string *type_name = nullptr);

}  // namespace codebench
