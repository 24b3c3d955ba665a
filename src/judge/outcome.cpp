#include "judge/outcome.hpp"
#include <boost/algorithm/string/join.hpp>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

// 评测报告中保留的输出片段长度
const size_t EXCERPT_SIZE = 2048;

execution_outcome make_error(const string &error_class, const string &message) {
    execution_outcome outcome;
    outcome.result = status::ERROR;
    outcome.error_class = error_class;
    outcome.message = message;
    return outcome;
}

static string excerpt(const string &data) {
    string text = utf8_sanitize(data.substr(0, EXCERPT_SIZE));
    if (data.size() > EXCERPT_SIZE) text += "...";
    return text;
}

void to_json(json &j, const evaluation_record &record) {
    const execution_outcome &outcome = record.outcome;
    j = {
        {"task_id", record.task_id},
        {"model", record.model},
        {"provider", record.provider},
        {"status", to_string(outcome.result)},
        {"duration", outcome.duration},
        {"trials", record.trials}};
    if (!outcome.error_class.empty()) j["error_class"] = outcome.error_class;
    if (!outcome.message.empty()) j["message"] = utf8_sanitize(outcome.message);
    if (!outcome.resource.empty()) j["resource"] = outcome.resource;
    if (!record.votes.empty()) {
        json votes = json::object();
        for (auto &[s, count] : record.votes) votes[to_string(s)] = count;
        j["votes"] = votes;
    }
    // 通过的评测对不需要输出片段
    if (outcome.result != status::PASS) {
        if (!outcome.stdout_excerpt.empty()) j["stdout"] = excerpt(outcome.stdout_excerpt);
        if (!outcome.stderr_excerpt.empty()) j["stderr"] = excerpt(outcome.stderr_excerpt);
    }
}

void from_json(const json &j, evaluation_record &record) {
    record.task_id = get_value<string>(j, "task_id");
    record.model = get_value<string>(j, "model");
    record.provider = get_value_def<string>(j, "", "provider");
    record.trials = get_value_def<size_t>(j, 1, "trials");

    execution_outcome &outcome = record.outcome;
    outcome.result = status_from_string(get_value<string>(j, "status"));
    outcome.error_class = get_value_def<string>(j, "", "error_class");
    outcome.message = get_value_def<string>(j, "", "message");
    outcome.resource = get_value_def<string>(j, "", "resource");
    outcome.duration = get_value_def<double>(j, 0, "duration");
    outcome.stdout_excerpt = get_value_def<string>(j, "", "stdout");
    outcome.stderr_excerpt = get_value_def<string>(j, "", "stderr");

    record.votes.clear();
    if (exists(j, "votes"))
        for (auto &item : access(j, "votes").items())
            record.votes[status_from_string(item.key())] = item.value().get<size_t>();
}

vote_result vote(const vector<execution_outcome> &trials) {
    if (trials.empty()) throw invalid_argument("vote requires at least one trial");

    vote_result result;
    double duration = 0;
    for (const execution_outcome &trial : trials) {
        result.votes[trial.result]++;
        duration += trial.duration;
    }

    size_t best = 0;
    vector<status> leaders;
    for (auto &[s, count] : result.votes) {
        if (count > best) {
            best = count;
            leaders = {s};
        } else if (count == best) {
            leaders.push_back(s);
        }
    }

    if (leaders.size() > 1) {
        vector<string> names;
        for (status s : leaders) names.push_back(to_string(s));
        result.outcome.result = status::FAIL;
        result.outcome.error_class = "vote_tie";
        result.outcome.message = "tie between " + boost::algorithm::join(names, ", ");
    } else {
        for (const execution_outcome &trial : trials) {
            if (trial.result == leaders[0]) {
                result.outcome = trial;
                break;
            }
        }
    }
    result.outcome.duration = duration;
    return result;
}

}  // namespace codebench
