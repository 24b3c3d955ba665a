#include "judge/evaluator.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <optional>
#include <ostream>
#include <set>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "judge/adapter.hpp"
#include "judge/extractor.hpp"
#include "judge/report.hpp"
#include "judge/runner.hpp"
#include "sandbox/sandbox.hpp"

namespace codebench {
using namespace std;

// 停止评测的标记
static atomic<bool> stop{false};

void stop_evaluation() {
    stop = true;
    stop_sandboxes();
}

bool evaluation_stopped() {
    return stop;
}

void reset_evaluation() {
    stop = false;
    resume_sandboxes();
}

double model_summary::pass_rate() const {
    return total == 0 ? 0 : (double)passed / total;
}

pass_rate_table record_outcome(pass_rate_table table, const evaluation_record &record) {
    model_summary &summary = table.models[record.model];
    summary.total++;
    switch (record.outcome.result) {
        case status::PASS: summary.passed++; break;
        case status::FAIL: summary.failed++; break;
        case status::TIMEOUT: summary.timeouts++; break;
        default: summary.errors++; break;
    }
    return table;
}

void print_summary(ostream &os, const pass_rate_table &table) {
    os << fmt::format("{:<40} {:>7} {:>7} {:>7} {:>7} {:>8} {:>9}", "model", "total", "pass", "fail", "error", "timeout", "pass rate") << endl;
    for (auto &[model, summary] : table.models) {
        os << fmt::format("{:<40} {:>7} {:>7} {:>7} {:>7} {:>8} {:>8.2f}%",
                          model, summary.total, summary.passed, summary.failed,
                          summary.errors, summary.timeouts, summary.pass_rate() * 100)
           << endl;
    }
}

static string adapter_error_class(adapter_error::error_kind kind) {
    switch (kind) {
        case adapter_error::error_kind::SYNTAX_ERROR: return "SyntaxError";
        case adapter_error::error_kind::MISSING_SYMBOL: return "missing_entry_point";
        default: return "no_tests";
    }
}

evaluation_record evaluate_pair(const benchmark_task &task, const model_response &response, const evaluation_config &config) {
    evaluation_record record;
    record.task_id = task.id;
    record.model = response.model;
    record.provider = response.provider;
    record.trials = 0;

    if (response.failure_type) {
        // 模型调用失败，保留调用层报告的错误类型
        record.outcome = make_error(*response.failure_type, response.failure_message);
        return record;
    }

    try {
        extraction_result extracted = extract_code(response.raw_text, task.entry_point, task.kind);
        if (!extracted.found()) throw extraction_error();
        DLOG(INFO) << "Extracted candidate for " << task.id << "/" << response.model << " by " << to_string(extracted.policy);

        executable_unit unit = get_adapter(task.kind).build(task, *extracted.code);

        size_t trials = config.voting ? config.trials : 1;
        vector<execution_outcome> outcomes;
        for (size_t i = 0; i < trials; ++i)
            outcomes.push_back(run_unit(unit, config.sandbox));

        record.trials = trials;
        if (config.voting) {
            vote_result result = vote(outcomes);
            record.outcome = result.outcome;
            record.votes = result.votes;
        } else {
            record.outcome = outcomes.front();
        }
    } catch (extraction_error &e) {
        record.outcome = make_error("no_code_extracted", e.what());
    } catch (adapter_error &e) {
        record.outcome = make_error(adapter_error_class(e.kind), e.what());
    } catch (interrupted_error &e) {
        throw;
    } catch (exception &e) {
        LOG(ERROR) << "Internal error when evaluating " << task.id << "/" << response.model << ": " << e.what() << endl
                   << boost::diagnostic_information(e);
        record.outcome = make_error("internal_error", e.what());
    }
    return record;
}

struct evaluation_job {
    const benchmark_task *task;
    const model_response *response;
};

static void worker_loop(int worker_id, const evaluation_config &config,
                        concurrent_queue<evaluation_job> &pending,
                        concurrent_queue<optional<evaluation_record>> &finished) {
    evaluation_job job;
    while (!stop && pending.try_pop(job)) {
        try {
            finished.push(evaluate_pair(*job.task, *job.response, config));
        } catch (interrupted_error &e) {
            LOG(WARNING) << "Worker " << worker_id << " interrupted while evaluating " << job.task->id << "/" << job.response->model;
            break;
        } catch (exception &e) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << e.what() << endl
                       << boost::diagnostic_information(e);
        }
    }
    // 通知报告线程该 worker 已经退出
    finished.push(nullopt);
}

pass_rate_table run_evaluation(const vector<benchmark_task> &tasks,
                               const vector<model_response> &responses,
                               const evaluation_config &config,
                               const filesystem::path &report_path) {
    report_writer writer(report_path);
    return run_evaluation(tasks, responses, config, writer);
}

pass_rate_table run_evaluation(const vector<benchmark_task> &tasks,
                               const vector<model_response> &responses,
                               const evaluation_config &config,
                               report_writer &writer) {
    map<string, benchmark_task> index = index_tasks(tasks);

    vector<evaluation_job> jobs;
    set<pair_key> planned;
    for (const model_response &response : responses) {
        pair_key key(response.task_id, response.model);
        if (!planned.insert(key).second) {
            LOG(WARNING) << "Duplicate response for " << response.task_id << "/" << response.model << ", evaluating it once";
            continue;
        }

        const benchmark_task *task = nullptr;
        auto it = index.find(response.task_id);
        if (it != index.end())
            task = &it->second;
        else if (response.embedded_task)
            task = response.embedded_task.get();
        if (!task) {
            LOG(WARNING) << "Skipping response of " << response.model << " for unknown task " << response.task_id;
            continue;
        }
        jobs.push_back({task, &response});
    }

    const set<pair_key> &existing = writer.existing_pairs();
    if (config.resume == resume_mode::SKIP) {
        size_t before = jobs.size();
        jobs.erase(remove_if(jobs.begin(), jobs.end(), [&](const evaluation_job &job) {
                       return existing.count(pair_key(job.task->id, job.response->model)) > 0;
                   }),
                   jobs.end());
        if (before != jobs.size())
            LOG(INFO) << "Skipping " << before - jobs.size() << " pairs already in the report";
    } else {
        set<pair_key> rerun;
        for (const evaluation_job &job : jobs) rerun.emplace(job.task->id, job.response->model);
        writer.discard(rerun);
    }

    pass_rate_table table;
    for (const evaluation_record &record : writer.existing_records())
        table = record_outcome(table, record);

    concurrent_queue<evaluation_job> pending;
    concurrent_queue<optional<evaluation_record>> finished;
    for (const evaluation_job &job : jobs) pending.push(job);

    size_t workers = max<size_t>(1, min(config.workers, jobs.size()));
    LOG(INFO) << "Evaluating " << jobs.size() << " pairs with " << workers << " workers";

    vector<thread> threads;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back(worker_loop, (int)i, cref(config), ref(pending), ref(finished));

    exception_ptr fatal;
    size_t active = workers, done = 0;
    while (active > 0) {
        optional<evaluation_record> record = finished.pop();
        if (!record) {
            --active;
            continue;
        }
        if (fatal) continue;

        try {
            writer.write(*record);
        } catch (report_io_error &e) {
            // 报告无法写入时无法继续，停止所有 worker
            LOG(ERROR) << e.what();
            fatal = current_exception();
            stop_evaluation();
            continue;
        }
        table = record_outcome(table, *record);
        ++done;

        const model_summary &summary = table.models[record->model];
        LOG(INFO) << fmt::format("[{}/{}] {} {} -> {}{}, {} pass rate {:.2f}%",
                                 done, jobs.size(), record->task_id, record->model,
                                 get_display_message(record->outcome.result),
                                 record->outcome.error_class.empty() ? "" : " (" + record->outcome.error_class + ")",
                                 record->model, summary.pass_rate() * 100);
    }

    for (thread &t : threads) t.join();

    if (fatal) rethrow_exception(fatal);
    if (stop) LOG(WARNING) << "Evaluation interrupted after " << done << " of " << jobs.size() << " pairs";
    return table;
}

}  // namespace codebench
