#include "judge/adapter.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <glog/logging.h>
#include <set>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

/**
 * 评测脚本的公共部分。
 * 候选代码和测试代码分别在 candidate、candidate_tests 两个模块中执行，
 * 测试只能看到入口符号（以入口名和 candidate 两个名字绑定），
 * 两边的辅助函数重名也不会互相覆盖。
 * 评测结果写入 result.json，同时以返回值表示，两者必须一致。
 */
static const char *HARNESS_PROLOGUE = R"PY(# -*- coding: utf-8 -*-
# Generated by codebench, do not edit.
import json
import os
import sys
import traceback
import types

E_PASS = @E_PASS@
E_FAIL = @E_FAIL@
E_ERROR = @E_ERROR@

_HERE = os.path.dirname(os.path.abspath(__file__))
_MESSAGE_LIMIT = 4096


class MissingEntryPoint(Exception):
    pass


def _disable_network():
    import socket

    def denied(*args, **kwargs):
        raise PermissionError("network access is disabled")

    for name in ("connect", "connect_ex", "bind", "listen", "sendto"):
        setattr(socket.socket, name, denied)
    socket.create_connection = denied
    socket.getaddrinfo = denied


def _load_module(name, filename, bindings=None):
    path = os.path.join(_HERE, filename)
    with open(path, encoding="utf-8") as f:
        source = f.read()
    module = types.ModuleType(name)
    module.__file__ = path
    if bindings:
        module.__dict__.update(bindings)
    sys.modules[name] = module
    exec(compile(source, path, "exec"), module.__dict__)
    return module


def results_equivalent(result, expected):
    if result == expected:
        return True
    if result is None and expected is None:
        return True
    if isinstance(result, (list, tuple)) and isinstance(expected, (list, tuple)):
        return list(result) == list(expected)
    if isinstance(result, dict) and isinstance(expected, dict):
        if set(result.keys()) != set(expected.keys()):
            return False
        return all(results_equivalent(result[key], expected[key]) for key in result)
    if isinstance(result, set) and isinstance(expected, set):
        return result == expected
    if isinstance(result, str) and isinstance(expected, str):
        return result.strip() == expected.strip()
    if isinstance(result, (int, float)) and isinstance(expected, (int, float)):
        return abs(result - expected) < 1e-9
    return False


def _call(fn, args):
    return fn(*args) if isinstance(args, list) else fn(args)


def _load_cases(filename):
    with open(os.path.join(_HERE, filename), encoding="utf-8") as f:
        return [(case["input"], case["output"]) for case in json.load(f)]


def _run_test_source(candidate, target, entry_point, filename):
    # 测试可以调用候选代码中的其他函数，测试自身的定义会覆盖同名函数
    bindings = {name: value for name, value in candidate.__dict__.items()
                if not (name.startswith("__") and name.endswith("__"))}
    bindings[entry_point] = target
    bindings["candidate"] = target
    tests = _load_module("candidate_tests", filename, bindings)
    check = tests.__dict__.get("check")
    if callable(check):
        check(target)

)PY";

static const char *HARNESS_EPILOGUE = R"PY(

def _describe(error):
    try:
        return str(error)
    except Exception:
        return type(error).__name__


def _write_result(status, error_class=None, message=None, resource=None):
    if message is not None and len(message) > _MESSAGE_LIMIT:
        message = message[:_MESSAGE_LIMIT] + "..."
    result = {"status": status, "error_class": error_class, "message": message, "resource": resource}
    with open(os.path.join(_HERE, "@RESULT_FILE@"), "w", encoding="utf-8") as f:
        json.dump(result, f)


def main():
    with open(os.path.join(_HERE, "@UNIT_FILE@"), encoding="utf-8") as f:
        unit = json.load(f)
    _disable_network()

    code = E_ERROR
    try:
        candidate = _load_module("candidate", "@CANDIDATE_FILE@")
        target = resolve_entry_point(candidate, unit)
        if unit["tests_file"] == "@CASES_FILE@":
            run_cases(target, _load_cases(unit["tests_file"]))
        else:
            _run_test_source(candidate, target, unit["entry_point"], unit["tests_file"])
    except AssertionError as e:
        traceback.print_exc()
        _write_result("fail", type(e).__name__, _describe(e))
        code = E_FAIL
    except MissingEntryPoint as e:
        _write_result("error", "missing_entry_point", _describe(e))
    except MemoryError as e:
        _write_result("error", "MemoryError", _describe(e), "memory")
    except BaseException as e:
        traceback.print_exc()
        _write_result("error", type(e).__name__, _describe(e))
    else:
        _write_result("pass")
        code = E_PASS

    sys.stdout.flush()
    sys.stderr.flush()
    os._exit(code)


if __name__ == "__main__":
    main()
)PY";

static const char *FUNCTION_SECTION = R"PY(
def resolve_entry_point(candidate, unit):
    namespace = candidate.__dict__
    entry_point = unit["entry_point"]
    owner = unit.get("owner_class")
    if owner:
        if owner not in namespace:
            raise MissingEntryPoint("class %s is not defined" % owner)
        return getattr(namespace[owner](), entry_point)
    if entry_point not in namespace:
        raise MissingEntryPoint("%s is not defined" % entry_point)
    return namespace[entry_point]


def run_cases(fn, cases):
    for index, (args, expected) in enumerate(cases):
        result = _call(fn, args)
        if not results_equivalent(result, expected):
            raise AssertionError("case %d: result=%r expected=%r" % (index, result, expected))
)PY";

static const char *CLASS_SECTION = R"PY(
def resolve_entry_point(candidate, unit):
    entry_point = unit["entry_point"]
    cls = candidate.__dict__.get(entry_point)
    if cls is None:
        raise MissingEntryPoint("%s is not defined" % entry_point)
    return cls


def run_cases(cls, cases):
    for index, (calls, expected_list) in enumerate(cases):
        methods, args_list = calls[0], calls[1]
        if len(methods) != len(args_list) or len(methods) != len(expected_list):
            raise AssertionError("case %d: length mismatch in test data" % index)
        obj = None
        for step, (method, args, expected) in enumerate(zip(methods, args_list, expected_list)):
            if step == 0:
                # 构造函数的返回值视为 None
                obj = _call(cls, args)
                result = None
            else:
                result = _call(getattr(obj, method), args)
            if not results_equivalent(result, expected):
                raise AssertionError("case %d, step %d (%s): result=%r expected=%r" % (index, step, method, result, expected))
)PY";

static string render_harness(const string &section) {
    string harness = string(HARNESS_PROLOGUE) + section + HARNESS_EPILOGUE;
    boost::replace_all(harness, "@E_PASS@", boost::lexical_cast<string>((int)E_PASS));
    boost::replace_all(harness, "@E_FAIL@", boost::lexical_cast<string>((int)E_FAIL));
    boost::replace_all(harness, "@E_ERROR@", boost::lexical_cast<string>((int)E_ERROR));
    boost::replace_all(harness, "@RESULT_FILE@", RESULT_FILE);
    boost::replace_all(harness, "@UNIT_FILE@", UNIT_FILE);
    boost::replace_all(harness, "@CANDIDATE_FILE@", CANDIDATE_FILE);
    boost::replace_all(harness, "@CASES_FILE@", CASES_FILE);
    return harness;
}

static bool has_store_context(const syntax_node &node) {
    for (const syntax_node &child : node.children)
        if (child.is("Store")) return true;
    return false;
}

bool binds_top_level_name(const syntax_node &module, const string &name) {
    static const set<string> definitions = {"FunctionDef", "AsyncFunctionDef", "ClassDef", "alias"};
    // 这些表达式拥有自己的作用域
    static const set<string> scopes = {"Lambda", "ListComp", "SetComp", "DictComp", "GeneratorExp"};

    bool found = false;
    walk(module, [&](const syntax_node &node) {
        if (found) return false;
        if (definitions.count(node.type)) {
            if (node.name == name) found = true;
            return false;
        }
        if (node.is("Name")) {
            if (node.name == name && has_store_context(node)) found = true;
            return false;
        }
        return scopes.count(node.type) == 0;
    });
    return found;
}

executable_unit task_adapter::build(const benchmark_task &task, const string &candidate) const {
    syntax_node module;
    try {
        module = parse_python(candidate);
    } catch (python_syntax_error &e) {
        throw adapter_error(adapter_error::error_kind::SYNTAX_ERROR, e.what());
    }

    if (task.entry_point.empty())
        throw adapter_error(adapter_error::error_kind::MISSING_SYMBOL, "task " + task.id + " has no entry point");
    optional<symbol_location> location = locate(module, task.entry_point);
    if (!location)
        throw adapter_error(adapter_error::error_kind::MISSING_SYMBOL, fmt::format("{} is not defined at top level", task.entry_point));

    executable_unit unit;
    unit.files[CANDIDATE_FILE] = candidate;

    json config = {
        {"kind", to_string(kind())},
        {"entry_point", task.entry_point},
        {"owner_class", location->owner_class ? json(*location->owner_class) : json()}};

    if (task.has_structured_tests()) {
        json cases = json::array();
        for (const json &test : task.tests)
            if (test.is_object() && test.count("input") && test.count("output"))
                cases.push_back({{"input", test.at("input")}, {"output", test.at("output")}});
        if (cases.empty())
            throw adapter_error(adapter_error::error_kind::NO_TESTS, "task " + task.id + " has no structured test cases");
        unit.files[CASES_FILE] = cases.dump(-1, ' ', false, json::error_handler_t::replace);
        config["tests_file"] = CASES_FILE;
    } else {
        string source = task.test_source();
        if (boost::trim_copy(source).empty())
            throw adapter_error(adapter_error::error_kind::NO_TESTS, "task " + task.id + " has no tests");
        unit.files[TESTS_FILE] = source;
        config["tests_file"] = TESTS_FILE;
    }

    unit.files[UNIT_FILE] = config.dump(-1, ' ', false, json::error_handler_t::replace);
    unit.files[HARNESS_FILE] = render_harness(harness_section());
    return unit;
}

task_kind function_adapter::kind() const {
    return task_kind::FUNCTION;
}

optional<symbol_location> function_adapter::locate(const syntax_node &module, const string &entry_point) const {
    if (binds_top_level_name(module, entry_point)) return symbol_location{};

    // LeetCode 风格：入口函数是顶层类中的方法
    for (const syntax_node &stmt : module.children) {
        if (!stmt.is("ClassDef")) continue;
        for (const syntax_node &member : stmt.children)
            if ((member.is("FunctionDef") || member.is("AsyncFunctionDef")) && member.name == entry_point)
                return symbol_location{stmt.name};
    }
    return {};
}

string function_adapter::harness_section() const {
    return FUNCTION_SECTION;
}

task_kind class_adapter::kind() const {
    return task_kind::CLASS;
}

optional<symbol_location> class_adapter::locate(const syntax_node &module, const string &entry_point) const {
    if (binds_top_level_name(module, entry_point)) return symbol_location{};
    return {};
}

string class_adapter::harness_section() const {
    return CLASS_SECTION;
}

static map<task_kind, unique_ptr<task_adapter>> adapters;

void register_adapter(unique_ptr<task_adapter> &&adapter) {
    task_kind kind = adapter->kind();
    adapters[kind] = move(adapter);
}

const task_adapter &get_adapter(task_kind kind) {
    // 适配器只在启动时注册，之后只读，不需要加锁
    auto it = adapters.find(kind);
    if (it == adapters.end())
        throw out_of_range("No adapter registered for " + to_string(kind) + " tasks");
    return *it->second;
}

void register_default_adapters() {
    register_adapter(make_unique<function_adapter>());
    register_adapter(make_unique<class_adapter>());
}

}  // namespace codebench
