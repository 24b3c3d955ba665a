#include "analysis/difficulty.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/format.h>
#include <glog/logging.h>
#include <cmath>
#include "analysis/coverage.hpp"
#include "common/io_utils.hpp"

namespace codebench {
using namespace std;

static const vector<string> constraint_vocabulary = {
    "must", "should", "always", "never",
    "edge case", "corner case", "robust", "handle", "invalid", "raise",
    "assume", "guarantee", "strictly", "exactly"};

const vector<string> &constraint_words() {
    return constraint_vocabulary;
}

namespace {

struct enclosing_function {
    string name;
    bool is_method;
};

struct metrics_visitor {
    const string &entry_point;
    code_metrics metrics;
    vector<enclosing_function> functions;

    explicit metrics_visitor(const string &entry_point) : entry_point(entry_point) {}

    static bool is_block(const syntax_node &node) {
        return node.is("If") || node.is("For") || node.is("While") || node.is("Try") ||
               node.is("With") || node.is("FunctionDef") || node.is("AsyncFunctionDef");
    }

    bool is_recursive_call(const syntax_node &call) const {
        if (call.children.empty()) return false;
        const syntax_node &func = call.children.front();

        if (func.is("Name")) {
            if (!entry_point.empty() && func.name == entry_point) return true;
            for (const enclosing_function &f : functions)
                if (f.name == func.name) return true;
            return false;
        }

        // self.method(...)，只在 method 的方法体内才算递归
        if (func.is("Attribute") && !func.children.empty() &&
            func.children.front().is("Name") && func.children.front().name == "self") {
            for (const enclosing_function &f : functions)
                if (f.is_method && f.name == func.name) return true;
        }
        return false;
    }

    void visit(const syntax_node &node, size_t depth, bool in_class_body) {
        bool block = is_block(node);
        if (block) {
            ++depth;
            metrics.max_nesting_depth = max(metrics.max_nesting_depth, depth);
        }

        if (node.is("If"))
            metrics.branching++;
        else if (node.is("For") || node.is("While"))
            metrics.loop++;
        else if (node.is("Try"))
            metrics.try_count++;
        else if (node.is("Raise"))
            metrics.raise++;
        else if (node.is("ListComp") || node.is("DictComp") || node.is("SetComp") || node.is("GeneratorExp"))
            metrics.comprehension++;
        else if (node.is("Call")) {
            metrics.call++;
            if (is_recursive_call(node)) metrics.recursion_calls++;
        }

        bool function = node.is("FunctionDef") || node.is("AsyncFunctionDef");
        if (function) functions.push_back({node.name, in_class_body});

        for (const syntax_node &child : node.children)
            visit(child, depth, node.is("ClassDef"));

        if (function) functions.pop_back();
    }
};

// Python 的 len 按码点计数
size_t utf8_length(const string &text) {
    size_t length = 0;
    for (unsigned char c : text)
        if ((c & 0xC0) != 0x80) ++length;
    return length;
}

size_t count_occurrences(const string &text, const string &word) {
    size_t count = 0;
    for (size_t pos = text.find(word); pos != string::npos; pos = text.find(word, pos + word.size()))
        ++count;
    return count;
}

}  // namespace

code_metrics analyze_code(const syntax_node &module, const string &entry_point) {
    metrics_visitor visitor(entry_point);
    visitor.visit(module, 0, false);
    return visitor.metrics;
}

prompt_metrics analyze_prompt(const string &prompt) {
    prompt_metrics metrics;
    metrics.prompt_length = utf8_length(prompt);

    string lower = boost::algorithm::to_lower_copy(prompt);
    for (const string &word : constraint_vocabulary)
        metrics.constraint_markers += count_occurrences(lower, word);
    return metrics;
}

test_metrics analyze_tests(const string &source) {
    test_metrics metrics;
    metrics.num_asserts = count_asserts(source);
    metrics.flags = detect_patterns(source);
    return metrics;
}

const char *to_string(confidence value) {
    return value == confidence::HIGH ? "high" : "low";
}

map<string, double> difficulty_row::metrics() const {
    map<string, double> result = {
        {"branching", (double)code.branching},
        {"loop", (double)code.loop},
        {"try", (double)code.try_count},
        {"raise", (double)code.raise},
        {"call", (double)code.call},
        {"comprehension", (double)code.comprehension},
        {"recursion_calls", (double)code.recursion_calls},
        {"max_nesting_depth", (double)code.max_nesting_depth},
        {"prompt_length", (double)prompt.prompt_length},
        {"constraint_markers", (double)prompt.constraint_markers},
        {"num_asserts", (double)tests.num_asserts}};
    for (auto &[key, present] : tests.flags)
        result[key] = present ? 1 : 0;
    return result;
}

double difficulty_score(const map<string, double> &metrics, const map<string, double> &weights) {
    double score = 0;
    for (auto &[key, weight] : weights) {
        auto it = metrics.find(key);
        if (it != metrics.end()) score += weight * it->second;
    }
    return round(score * 100) / 100;
}

string category_for_score(double score, const vector<double> &thresholds) {
    static const char *names[] = {"Easy", "Medium", "Hard", "Challenging"};
    size_t level = 0;
    while (level < thresholds.size() && level < 3 && score >= thresholds[level]) ++level;
    return names[level];
}

difficulty_row analyze_difficulty(const benchmark_task &task, const difficulty_config &config) {
    difficulty_row row;
    row.task_id = task.id;
    row.entry_point = task.entry_point;

    try {
        row.code = analyze_code(parse_python(task.reference_solution), task.entry_point);
    } catch (python_syntax_error &e) {
        LOG(WARNING) << "Reference solution of " << task.id << " does not parse, " << e.error_class << " at line " << e.lineno << ": " << e.what();
        row.code = code_metrics();
        row.level = confidence::LOW;
    }

    row.prompt = analyze_prompt(task.prompt);
    row.tests = analyze_tests(task.test_source());
    row.score = difficulty_score(row.metrics(), config.weights);
    row.category = category_for_score(row.score, config.thresholds);
    return row;
}

void write_difficulty_csv(ostream &os, const vector<difficulty_row> &rows) {
    os << "task_id,entry_point,branching_count,loop_count,try_count,raise_count,call_count,"
          "comprehension_count,recursion_calls,max_nesting_depth,has_recursion,has_exception_handling,"
          "prompt_length,constraint_markers,num_asserts";
    for (const coverage_category &category : coverage_categories()) os << "," << category.key;
    os << ",difficulty_score,difficulty_bucket,confidence\n";

    for (const difficulty_row &row : rows) {
        os << csv_escape(row.task_id) << "," << csv_escape(row.entry_point);
        os << fmt::format(",{},{},{},{},{},{},{},{}",
                          row.code.branching, row.code.loop, row.code.try_count, row.code.raise,
                          row.code.call, row.code.comprehension, row.code.recursion_calls, row.code.max_nesting_depth);
        os << "," << (row.code.has_recursion() ? "True" : "False")
           << "," << (row.code.has_exception_handling() ? "True" : "False");
        os << fmt::format(",{},{},{}", row.prompt.prompt_length, row.prompt.constraint_markers, row.tests.num_asserts);
        for (const coverage_category &category : coverage_categories()) {
            auto it = row.tests.flags.find(category.key);
            os << "," << (it != row.tests.flags.end() && it->second ? "True" : "False");
        }
        os << fmt::format(",{:.2f},{},{}\n", row.score, row.category, to_string(row.level));
    }
}

}  // namespace codebench
