#pragma once

#include <functional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"

namespace codebench {

/**
 * @brief Python 语法树节点的 C++ 副本
 * 节点由内嵌解释器的 ast.parse 生成后转换而来，
 * 转换完成后不再持有任何 PyObject，因此可以在不持有 GIL 的线程中遍历。
 */
struct syntax_node {
    /**
     * @brief 节点类型，即 ast 模块中的类名，比如 If、For、FunctionDef、Call
     */
    std::string type;

    /**
     * @brief 节点携带的标识符
     * FunctionDef/ClassDef 为定义的名字，Name 为变量名，Attribute 为属性名，
     * alias 为导入后绑定的名字，其他节点为空
     */
    std::string name;

    /**
     * @brief 节点所在行号，没有位置信息的节点（比如 Load）为 0
     */
    int lineno = 0;

    /**
     * @brief 按照 ast.iter_child_nodes 的顺序排列的子节点
     */
    std::vector<syntax_node> children;

    bool is(const char *t) const { return type == t; }
};

/**
 * @brief 表示 Python 代码无法通过语法检查
 */
struct python_syntax_error : public bench_exception {
    python_syntax_error(const std::string &error_class, const std::string &message, int lineno);

    /**
     * @brief Python 异常类名，比如 SyntaxError、IndentationError
     */
    std::string error_class;
    int lineno;
};

/**
 * @brief 使用内嵌解释器的 ast 模块解析 Python 代码
 * 只解析不执行。调用前 python_interpreter 必须已经初始化，
 * 函数内部会获取 GIL，可以在任意线程中调用。
 * @param source UTF-8 编码的 Python 代码
 * @return Module 节点
 * @throw python_syntax_error 若代码存在语法错误或者不是合法的 UTF-8
 */
syntax_node parse_python(const std::string &source);

/**
 * @brief 先序遍历语法树
 * @param visitor 返回 false 时不再访问该节点的子节点
 */
void walk(const syntax_node &node, const std::function<bool(const syntax_node &)> &visitor);

}  // namespace codebench
