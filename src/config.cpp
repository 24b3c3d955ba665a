#include "config.hpp"
#include <boost/assign.hpp>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

filesystem::path RUN_DIR;
string PYTHON_EXECUTABLE = "python3";
bool DEBUG = false;

difficulty_config::difficulty_config()
    : weights(boost::assign::map_list_of
              // 参考代码的结构特征
              ("branching", 2.0)
              ("loop", 1.8)
              ("try", 1.5)
              ("raise", 1.2)
              ("call", 0.5)
              ("comprehension", 0.7)
              ("recursion_calls", 2.5)
              ("max_nesting_depth", 2.0)
              // 题面特征
              ("prompt_length", 0.003)
              ("constraint_markers", 1.0)
              // 测试特征
              ("num_asserts", 0.2)
              ("has_negative", 0.6)
              ("has_zero", 0.4)
              ("has_large_int", 0.6)
              ("has_float", 0.7)
              ("has_empty_list", 0.5)
              ("has_empty_str", 0.5)
              ("has_none", 0.6)
              ("has_unicode", 0.8)
              ("has_exception", 0.8)
              ("has_whitespace_edge", 0.7)
              .convert_to_container<map<string, double>>()) {}

void from_json(const json &j, sandbox_config &config) {
    assign_optional(j, config.time_limit, "time_limit");
    assign_optional(j, config.memory_limit, "memory_limit");
    assign_optional(j, config.file_limit, "file_limit");
    assign_optional(j, config.proc_limit, "proc_limit");
    assign_optional(j, config.stream_size, "stream_size");
    assign_optional(j, config.isolate_network, "isolate_network");
}

void from_json(const json &j, evaluation_config &config) {
    if (exists(j, "sandbox")) from_json(j.at("sandbox"), config.sandbox);
    assign_optional(j, config.workers, "workers");
    assign_optional(j, config.voting, "voting");
    assign_optional(j, config.trials, "trials");

    if (exists(j, "resume")) {
        string mode = get_value<string>(j, "resume");
        if (mode == "skip")
            config.resume = resume_mode::SKIP;
        else if (mode == "overwrite")
            config.resume = resume_mode::OVERWRITE;
        else
            throw out_of_range("Unrecognized resume mode " + mode);
    }
}

void from_json(const json &j, difficulty_config &config) {
    if (exists(j, "weights")) {
        for (auto &item : access(j, "weights").items()) {
            if (!config.weights.count(item.key()))
                throw out_of_range("Unrecognized difficulty metric " + item.key());
            config.weights[item.key()] = get_value<double>(item.value());
        }
    }
    assign_optional(j, config.thresholds, "thresholds");
}

void from_json(const json &j, coverage_config &config) {
    assign_optional(j, config.categories, "categories");
}

void from_json(const json &j, configuration &config) {
    if (exists(j, "evaluation")) from_json(j.at("evaluation"), config.evaluation);
    if (exists(j, "difficulty")) from_json(j.at("difficulty"), config.difficulty);
    if (exists(j, "coverage")) from_json(j.at("coverage"), config.coverage);
}

configuration load_configuration(const filesystem::path &config_path) {
    ifstream fin(config_path);
    if (!fin) throw config_error("Unable to open configuration file " + config_path.string());

    configuration config;
    try {
        json j = json::parse(fin);
        from_json(j, config);
    } catch (json::exception &e) {
        throw config_error("Malformed configuration file " + config_path.string() + ": " + e.what());
    } catch (logic_error &e) {
        // invalid_argument 和 out_of_range 都来自于 from_json
        throw config_error("Invalid configuration file " + config_path.string() + ": " + e.what());
    }
    validate_configuration(config);
    return config;
}

void validate_configuration(const configuration &config) {
    const evaluation_config &eval = config.evaluation;
    if (eval.workers == 0)
        throw config_error("evaluation.workers must be positive");
    if (eval.voting && eval.trials == 0)
        throw config_error("evaluation.trials must be positive when voting is enabled");
    if (!(eval.sandbox.time_limit > 0))
        throw config_error("evaluation.sandbox.time_limit must be positive");

    const auto &thresholds = config.difficulty.thresholds;
    if (thresholds.size() != 3)
        throw config_error("difficulty.thresholds must contain exactly 3 boundaries");
    for (size_t i = 1; i < thresholds.size(); ++i)
        if (!(thresholds[i - 1] < thresholds[i]))
            throw config_error("difficulty.thresholds must be strictly ascending");
}

}  // namespace codebench
