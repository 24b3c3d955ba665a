#include "dataset/task.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <fstream>
#include <set>
#include <system_error>
#include "common/json_utils.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

string to_string(task_kind kind) {
    return kind == task_kind::CLASS ? "class" : "function";
}

bool benchmark_task::has_structured_tests() const {
    return tests.is_array();
}

string benchmark_task::test_source() const {
    return to_source_text(tests);
}

bool is_class_based_cases(const json &tests) {
    if (!tests.is_array() || tests.empty()) return false;
    const json *input = find_member(tests[0], "input");
    return input && input->is_array() && input->size() == 2 &&
           (*input)[0].is_array() && (*input)[1].is_array() &&
           !(*input)[0].empty() && (*input)[0][0].is_string();
}

static string python_string_literal(const string &s) {
    // 和 Python 的 repr 一致：优先使用单引号，只包含单引号时改用双引号
    char quote = '\'';
    if (s.find('\'') != string::npos && s.find('"') == string::npos) quote = '"';

    string result(1, quote);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c == quote)
                    result += string("\\") + (char)c;
                else if (c < 0x20 || c == 0x7F)
                    result += fmt::format("\\x{:02x}", c);
                else
                    result += (char)c;
        }
    }
    result += quote;
    return result;
}

string to_python_literal(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
            return "None";
        case json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case json::value_t::string:
            return python_string_literal(value.get<string>());
        case json::value_t::array: {
            string result = "[";
            for (size_t i = 0; i < value.size(); ++i) {
                if (i) result += ", ";
                result += to_python_literal(value[i]);
            }
            return result + "]";
        }
        case json::value_t::object: {
            string result = "{";
            bool first = true;
            for (auto &item : value.items()) {
                if (!first) result += ", ";
                first = false;
                result += python_string_literal(item.key()) + ": " + to_python_literal(item.value());
            }
            return result + "}";
        }
        default:
            // 数字
            return value.dump();
    }
}

string to_source_text(const json &value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<string>();
    if (!value.is_array()) return to_python_literal(value);

    string result;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i) result += "\n\n";
        result += value[i].is_string() ? value[i].get<string>() : to_python_literal(value[i]);
    }
    return result;
}

static string id_to_string(const json &id) {
    if (id.is_string()) return id.get<string>();
    if (id.is_number()) return id.dump();
    return "";
}

void from_json(const json &j, benchmark_task &task) {
    if (!j.is_object()) throw invalid_argument("Task must be a json object");

    task.id = id_to_string(access_optional(j, "task_id"));
    if (task.id.empty()) task.id = id_to_string(access_optional(j, "id"));
    if (task.id.empty()) throw invalid_argument("Task has no task_id");

    task.prompt = to_source_text(exists(j, "prompt") ? j.at("prompt") : access_optional(j, "question"));
    task.reference_solution = to_source_text(exists(j, "canonical_solution") ? j.at("canonical_solution") : access_optional(j, "reference_solution"));
    task.entry_point = get_value_def<string>(j, "", "entry_point");
    task.tests = exists(j, "test") ? j.at("test") : access_optional(j, "tests");

    if (exists(j, "kind")) {
        string kind = get_value<string>(j, "kind");
        if (kind == "function")
            task.kind = task_kind::FUNCTION;
        else if (kind == "class")
            task.kind = task_kind::CLASS;
        else
            throw out_of_range("Unrecognized task kind " + kind);
    } else {
        task.kind = is_class_based_cases(task.tests) ? task_kind::CLASS : task_kind::FUNCTION;
    }
}

void from_json(const json &j, model_response &response) {
    if (!j.is_object()) throw invalid_argument("Response must be a json object");

    if (exists(j, "raw_item")) {
        auto task = make_shared<benchmark_task>();
        json raw = j.at("raw_item");
        // 早期的输出文件中题目可能没有编号，使用数据集中的下标代替
        if (!exists(raw, "task_id") && !exists(raw, "id") && exists(j, "dataset_index"))
            raw["task_id"] = id_to_string(j.at("dataset_index"));
        from_json(raw, *task);
        response.embedded_task = task;
    }

    response.task_id = id_to_string(access_optional(j, "task_id"));
    if (response.task_id.empty() && response.embedded_task) response.task_id = response.embedded_task->id;
    if (response.task_id.empty()) throw invalid_argument("Response has no task_id");

    response.model = get_value_def<string>(j, "unknown", "model");
    response.provider = get_value_def<string>(j, "", "provider");
    response.raw_text = get_value_def<string>(j, "", "response");

    const json error = access_optional(j, "error");
    if (error.is_object()) {
        response.failure_type = get_value_def<string>(error, "model_error", "type");
        response.failure_message = get_value_def<string>(error, "", "message");
    } else if (error.is_string()) {
        response.failure_type = "model_error";
        response.failure_message = error.get<string>();
    } else if (exists(j, "success") && !get_value_def<bool>(j, true, "success")) {
        response.failure_type = "model_error";
    }
}

template <typename T, typename F>
static void read_jsonl(const filesystem::path &path, F &&consume) {
    ifstream fin(path);
    if (!fin) throw system_error(errno, system_category(), "Unable to open " + path.string());

    string line;
    size_t lineno = 0;
    while (getline(fin, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;
        try {
            T value;
            from_json(json::parse(line), value);
            consume(move(value));
        } catch (json::exception &e) {
            LOG(WARNING) << "Skipping malformed line " << path.string() << ":" << lineno << ": " << e.what();
        } catch (logic_error &e) {
            LOG(WARNING) << "Skipping invalid line " << path.string() << ":" << lineno << ": " << e.what();
        }
    }
}

vector<benchmark_task> load_tasks(const filesystem::path &path) {
    vector<benchmark_task> tasks;
    set<string> seen;
    read_jsonl<benchmark_task>(path, [&](benchmark_task &&task) {
        if (!seen.insert(task.id).second) {
            LOG(WARNING) << "Duplicate task " << task.id << " in " << path.string() << ", keeping the first one";
            return;
        }
        tasks.push_back(move(task));
    });
    LOG(INFO) << "Loaded " << tasks.size() << " tasks from " << path.string();
    return tasks;
}

vector<model_response> load_responses(const filesystem::path &path) {
    vector<model_response> responses;
    read_jsonl<model_response>(path, [&](model_response &&response) {
        responses.push_back(move(response));
    });
    LOG(INFO) << "Loaded " << responses.size() << " model responses from " << path.string();
    return responses;
}

map<string, benchmark_task> index_tasks(const vector<benchmark_task> &tasks) {
    map<string, benchmark_task> index;
    for (const benchmark_task &task : tasks)
        index.emplace(task.id, task);
    return index;
}

}  // namespace codebench
