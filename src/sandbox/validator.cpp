#include "common/python.hpp"
#include "sandbox/validator.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static const char *kind_name(violation_kind kind) {
    switch (kind) {
        case violation_kind::SYNTAX: return "syntax";
        case violation_kind::IMPORT: return "import";
        case violation_kind::BUILTIN: return "builtin";
        case violation_kind::ATTRIBUTE: return "attribute";
        case violation_kind::SOURCE_SIZE: return "source_size";
        case violation_kind::INTERNAL: return "internal";
    }
    return "internal";
}

void to_json(json &j, const violation &v) {
    j = json{{"line", v.line},
             {"column", v.column},
             {"rule_id", v.rule_id},
             {"message", v.message},
             {"kind", kind_name(v.kind)}};
}

void to_json(json &j, const validation_verdict &verdict) {
    vector<string> blocked_imports, blocked_operations;
    for (auto &v : verdict.violations) {
        if (v.kind == violation_kind::IMPORT)
            blocked_imports.push_back(v.rule_id);
        else if (v.kind == violation_kind::BUILTIN || v.kind == violation_kind::ATTRIBUTE)
            blocked_operations.push_back(v.rule_id);
    }
    j = json{{"allowed", verdict.allowed},
             {"violations", verdict.violations},
             {"blocked_imports", blocked_imports},
             {"blocked_operations", blocked_operations}};
}

/**
 * @brief 读取 Python 对象的整数属性，属性不存在或者为 None 时返回 def
 */
static long get_long_attr(PyObject *obj, const char *name, long def) {
    py_ref attr(PyObject_GetAttrString(obj, name));
    if (!attr) {
        PyErr_Clear();
        return def;
    }
    if (attr.get() == Py_None) return def;
    long value = PyLong_AsLong(attr.get());
    if (value == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return def;
    }
    return value;
}

/**
 * @brief 读取 Python 对象的字符串属性，属性不存在或者不是字符串时返回空串
 */
static string get_str_attr(PyObject *obj, const char *name) {
    py_ref attr(PyObject_GetAttrString(obj, name));
    if (!attr) {
        PyErr_Clear();
        return "";
    }
    if (!PyUnicode_Check(attr.get())) return "";
    const char *utf8 = PyUnicode_AsUTF8(attr.get());
    if (!utf8) {
        PyErr_Clear();
        return "";
    }
    return utf8;
}

static py_ref get_attr(PyObject *obj, const char *name) {
    py_ref attr(PyObject_GetAttrString(obj, name));
    if (!attr) throw internal_error(string("missing attribute ") + name + ": " + python_fetch_error());
    return attr;
}

static bool is_instance(PyObject *obj, const py_ref &cls) {
    int ret = PyObject_IsInstance(obj, cls.get());
    if (ret < 0) throw internal_error("isinstance failed: " + python_fetch_error());
    return ret == 1;
}

static violation make_violation(int line, int column, const string &rule_id, const string &message, violation_kind kind) {
    violation v;
    v.line = line;
    v.column = column;
    v.rule_id = rule_id;
    v.message = message;
    v.kind = kind;
    return v;
}

/**
 * @brief 将 ast.parse 抛出的 SyntaxError 或 ValueError 转换为违规项
 * 必须在 PyErr_Occurred() 时调用，调用后异常被清除
 */
static violation syntax_violation(const string &source_code) {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref type_ref(type), value_ref(value), traceback_ref(traceback);

    if (value && PyErr_GivenExceptionMatches(type, PyExc_SyntaxError)) {
        int line = (int)get_long_attr(value, "lineno", 1);
        int column = (int)get_long_attr(value, "offset", 1);
        string msg = get_str_attr(value, "msg");
        if (msg.empty()) msg = "invalid syntax";
        return make_violation(line, max(column, 1), rules::SYNTAX_ERROR, msg, violation_kind::SYNTAX);
    }

    // Python 3.11 对于包含 '\0' 的代码抛出 ValueError 而不是 SyntaxError
    size_t pos = source_code.find('\0');
    int line = 1, column = 1;
    if (pos != string::npos) {
        line += (int)count(source_code.begin(), source_code.begin() + pos, '\n');
        size_t line_start = source_code.rfind('\n', pos);
        column = (int)(line_start == string::npos ? pos + 1 : pos - line_start);
    }
    return make_violation(line, column, rules::SYNTAX_ERROR, "source code cannot contain null bytes", violation_kind::SYNTAX);
}

validator::validator(rule_set rules) : ruleset(move(rules)) {}

const rule_set &validator::rules() const {
    return ruleset;
}

validation_verdict validator::validate(const string &source_code) const {
    validation_verdict verdict;

    if (source_code.size() > ruleset.max_source_bytes) {
        verdict.violations.push_back(make_violation(
            1, 1, rules::SOURCE_TOO_LARGE,
            "source code is " + to_string(source_code.size()) + " bytes, exceeding the limit of " + to_string(ruleset.max_source_bytes) + " bytes",
            violation_kind::SOURCE_SIZE));
        verdict.allowed = false;
        return verdict;
    }

    try {
        python_initialize();
        GIL_guard gil;
        walk(source_code, verdict.violations);
    } catch (const std::exception &ex) {
        LOG(ERROR) << "validator failed to analyze submission: " << ex.what();
        verdict.violations.clear();
        verdict.violations.push_back(make_violation(0, 0, rules::INTERNAL_ERROR, "unable to analyze source code", violation_kind::INTERNAL));
    }

    stable_sort(verdict.violations.begin(), verdict.violations.end(), [](const violation &a, const violation &b) {
        return make_pair(a.line, a.column) < make_pair(b.line, b.column);
    });
    verdict.allowed = verdict.violations.empty();
    return verdict;
}

void validator::check_module(const string &module, int line, int column, vector<violation> &violations) const {
    string root = substr_before_first(module, '.');
    if (root == "__future__") return;
    if (contains(ruleset.denied_modules, root)) {
        violations.push_back(make_violation(line, column, root, "import of denylisted module '" + module + "'", violation_kind::IMPORT));
    } else if (!ruleset.allowed_modules.empty() && !contains(ruleset.allowed_modules, root)) {
        violations.push_back(make_violation(line, column, root, "module '" + module + "' is not in the allowed import list", violation_kind::IMPORT));
    }
}

void validator::walk(const string &source_code, vector<violation> &violations) const {
    py_ref ast(PyImport_ImportModule("ast"));
    if (!ast) throw internal_error("unable to import ast: " + python_fetch_error());

    py_ref parse = get_attr(ast.get(), "parse");
    py_ref walk = get_attr(ast.get(), "walk");
    py_ref import_cls = get_attr(ast.get(), "Import");
    py_ref import_from_cls = get_attr(ast.get(), "ImportFrom");
    py_ref call_cls = get_attr(ast.get(), "Call");
    py_ref name_cls = get_attr(ast.get(), "Name");
    py_ref attribute_cls = get_attr(ast.get(), "Attribute");
    py_ref load_cls = get_attr(ast.get(), "Load");

    // 以 bytes 的形式交给 ast.parse，由 Python 按 PEP 263 处理编码声明
    py_ref source(PyBytes_FromStringAndSize(source_code.data(), (Py_ssize_t)source_code.size()));
    if (!source) throw internal_error("unable to copy source: " + python_fetch_error());

    py_ref tree(PyObject_CallFunction(parse.get(), "Os", source.get(), "<submission>"));
    if (!tree) {
        if (PyErr_ExceptionMatches(PyExc_SyntaxError) || PyErr_ExceptionMatches(PyExc_ValueError)) {
            violations.push_back(syntax_violation(source_code));
            return;
        }
        // RecursionError、MemoryError 等是解析器自身的问题
        throw internal_error("ast.parse failed: " + python_fetch_error());
    }

    py_ref nodes(PyObject_CallFunctionObjArgs(walk.get(), tree.get(), nullptr));
    if (!nodes) throw internal_error("ast.walk failed: " + python_fetch_error());
    py_ref iter(PyObject_GetIter(nodes.get()));
    if (!iter) throw internal_error("ast.walk is not iterable: " + python_fetch_error());

    // ast.walk 广度优先遍历，Call 节点一定先于它的 func 节点被访问，
    // 已经作为调用目标报告过的 Name 节点不再重复报告
    set<PyObject *> call_targets;

    while (true) {
        py_ref node(PyIter_Next(iter.get()));
        if (!node) break;
        PyObject *n = node.get();
        int line = (int)get_long_attr(n, "lineno", 0);
        int column = (int)get_long_attr(n, "col_offset", -1) + 1;

        if (is_instance(n, import_cls)) {
            py_ref names = get_attr(n, "names");
            Py_ssize_t size = PyList_Size(names.get());
            for (Py_ssize_t i = 0; i < size; ++i) {
                PyObject *alias = PyList_GetItem(names.get(), i);  // borrowed
                check_module(get_str_attr(alias, "name"), line, column, violations);
            }
        } else if (is_instance(n, import_from_cls)) {
            string module = get_str_attr(n, "module");
            if (!module.empty()) {
                check_module(module, line, column, violations);
            } else {
                // from . import x：没有模块名，只能检查导入的名字
                py_ref names = get_attr(n, "names");
                Py_ssize_t size = PyList_Size(names.get());
                for (Py_ssize_t i = 0; i < size; ++i) {
                    PyObject *alias = PyList_GetItem(names.get(), i);
                    check_module(get_str_attr(alias, "name"), line, column, violations);
                }
            }
        } else if (is_instance(n, call_cls)) {
            py_ref func = get_attr(n, "func");
            if (is_instance(func.get(), name_cls)) {
                string id = get_str_attr(func.get(), "id");
                if (contains(ruleset.denied_builtins, id)) {
                    violations.push_back(make_violation(line, column, id, "call to denylisted builtin '" + id + "()'", violation_kind::BUILTIN));
                    call_targets.insert(func.get());
                }
            }
        } else if (is_instance(n, name_cls)) {
            if (contains(call_targets, n)) continue;
            py_ref ctx = get_attr(n, "ctx");
            if (!is_instance(ctx.get(), load_cls)) continue;
            string id = get_str_attr(n, "id");
            if (contains(ruleset.denied_builtins, id)) {
                violations.push_back(make_violation(line, column, id, "reference to denylisted builtin '" + id + "'", violation_kind::BUILTIN));
            } else if (contains(ruleset.denied_attributes, id)) {
                violations.push_back(make_violation(line, column, id, "reference to restricted name '" + id + "'", violation_kind::ATTRIBUTE));
            }
        } else if (is_instance(n, attribute_cls)) {
            string attr = get_str_attr(n, "attr");
            if (contains(ruleset.denied_attributes, attr)) {
                violations.push_back(make_violation(line, column, attr, "access to restricted attribute '" + attr + "'", violation_kind::ATTRIBUTE));
            } else if (contains(ruleset.denied_builtins, attr) && !contains(ruleset.attribute_safe_builtins, attr)) {
                // 拿到 builtins 模块之后可以用 b.exec 调用
                violations.push_back(make_violation(line, column, attr, "access to denylisted builtin '" + attr + "' as an attribute", violation_kind::BUILTIN));
            }
        }
    }
    if (PyErr_Occurred()) throw internal_error("ast.walk failed: " + python_fetch_error());
}

}  // namespace sandbox
