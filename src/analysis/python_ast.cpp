#include "analysis/python_ast.hpp"
#include <glog/logging.h>
#include "common/python.hpp"

namespace codebench {
using namespace std;

python_syntax_error::python_syntax_error(const string &error_class, const string &message, int lineno)
    : bench_exception(message), error_class(error_class), lineno(lineno) {}

static string string_attr(const py_object &obj, const char *name) {
    py_object value = obj.attr(name);
    if (!value || !PyUnicode_Check(value.get())) return "";
    return to_utf8(value.get());
}

static int int_attr(const py_object &obj, const char *name) {
    py_object value = obj.attr(name);
    if (!value || !PyLong_Check(value.get())) return 0;
    long result = PyLong_AsLong(value.get());
    if (result == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return 0;
    }
    return static_cast<int>(result);
}

static string node_name(const py_object &node, const string &type) {
    if (type == "alias") {
        // import a.b as c 绑定 c，import a.b 绑定 a
        string asname = string_attr(node, "asname");
        if (!asname.empty()) return asname;
        string name = string_attr(node, "name");
        return name.substr(0, name.find('.'));
    }
    for (const char *attr : {"id", "attr", "name", "arg"}) {
        string value = string_attr(node, attr);
        if (!value.empty()) return value;
    }
    return "";
}

static syntax_node convert(const py_object &iter_child_nodes, const py_object &node) {
    syntax_node result;
    py_object node_type = py_object::borrow(reinterpret_cast<PyObject *>(Py_TYPE(node.get())));
    result.type = string_attr(node_type, "__name__");
    result.name = node_name(node, result.type);
    result.lineno = int_attr(node, "lineno");

    py_object iter(PyObject_CallFunctionObjArgs(iter_child_nodes.get(), node.get(), nullptr));
    if (!iter) throw internal_error("ast.iter_child_nodes failed: " + fetch_python_error());

    while (true) {
        py_object child(PyIter_Next(iter.get()));
        if (!child) break;
        result.children.push_back(convert(iter_child_nodes, child));
    }
    if (PyErr_Occurred()) throw internal_error("ast.iter_child_nodes failed: " + fetch_python_error());
    return result;
}

syntax_node parse_python(const string &source) {
    CHECK(python_interpreter::initialized()) << "Python interpreter is not initialized";

    GIL_guard guard;

    py_object text(PyUnicode_DecodeUTF8(source.data(), source.size(), "strict"));
    if (!text) {
        string type;
        string message = fetch_python_error(&type);
        throw python_syntax_error(type, message, 0);
    }

    py_object ast(PyImport_ImportModule("ast"));
    if (!ast) throw internal_error("Unable to import ast: " + fetch_python_error());
    py_object parse = ast.attr("parse");
    py_object iter_child_nodes = ast.attr("iter_child_nodes");
    if (!parse || !iter_child_nodes) throw internal_error("Unexpected ast module");

    py_object tree(PyObject_CallFunctionObjArgs(parse.get(), text.get(), nullptr));
    if (!tree) {
        string type;
        string message = fetch_python_error(&type);
        // SyntaxError、IndentationError、TabError 之外还可能有 ValueError（源码中含有 NUL）
        // 和 RecursionError（嵌套过深），对调用方来说都是无法解析
        throw python_syntax_error(type, message, 0);
    }

    syntax_node module = convert(iter_child_nodes, tree);
    DLOG(INFO) << "Parsed python module with " << module.children.size() << " top level statements";
    return module;
}

void walk(const syntax_node &node, const function<bool(const syntax_node &)> &visitor) {
    if (!visitor(node)) return;
    for (const syntax_node &child : node.children)
        walk(child, visitor);
}

}  // namespace codebench
