#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <set>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/evaluator.hpp"
#include "judge/report.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;

class EvaluatorTest : public ::testing::Test {
protected:
    scoped_temp_dir dir{"evaluator"};
    evaluation_config config = fast_config();

    void TearDown() override {
        reset_evaluation();
    }

    vector<benchmark_task> tasks() {
        vector<benchmark_task> result;
        for (int i = 0; i < 4; ++i)
            result.push_back(make_add_task(fmt::format("add/{}", i)));
        return result;
    }

    vector<json> report_lines(const filesystem::path &path) {
        vector<json> result;
        for (const string &line : read_lines(path)) result.push_back(json::parse(line));
        return result;
    }
};

TEST_F(EvaluatorTest, ModelFailureBecomesError) {
    model_response response = make_response("add/0", "m", "");
    response.failure_type = "rate_limit";
    response.failure_message = "429";
    evaluation_record record = evaluate_pair(make_add_task(), response, config);
    EXPECT_EQ(record.outcome.result, status::ERROR);
    EXPECT_EQ(record.outcome.error_class, "rate_limit");
    EXPECT_EQ(record.trials, 0u);
}

TEST_F(EvaluatorTest, EachStageFailureIsIsolated) {
    benchmark_task task = make_add_task();
    EXPECT_EQ(evaluate_pair(task, make_response(task.id, "m", "No idea, sorry."), config).outcome.error_class, "no_code_extracted");
    EXPECT_EQ(evaluate_pair(task, make_response(task.id, "m", fenced("def add(a, b)\n    return a\n")), config).outcome.error_class, "SyntaxError");
    EXPECT_EQ(evaluate_pair(task, make_response(task.id, "m", fenced("def plus(a, b):\n    return a + b\n")), config).outcome.error_class, "missing_entry_point");

    evaluation_record record = evaluate_pair(task, make_response(task.id, "m", fenced(task.reference_solution)), config);
    EXPECT_EQ(record.outcome.result, status::PASS);
    EXPECT_EQ(record.trials, 1u);
}

TEST_F(EvaluatorTest, VotingRunsConfiguredTrials) {
    config.voting = true;
    config.trials = 3;
    benchmark_task task = make_add_task();
    evaluation_record record = evaluate_pair(task, make_response(task.id, "m", fenced(task.reference_solution)), config);
    EXPECT_EQ(record.outcome.result, status::PASS);
    EXPECT_EQ(record.trials, 3u);
    EXPECT_EQ(record.votes[status::PASS], 3u);
}

TEST_F(EvaluatorTest, BatchWithOneUnparsableResponseCompletes) {
    vector<benchmark_task> dataset = tasks();
    vector<model_response> responses;
    for (size_t i = 0; i < dataset.size(); ++i) {
        string text = i == 2 ? "I cannot solve this problem." : fenced(dataset[i].reference_solution);
        responses.push_back(make_response(dataset[i].id, "model-a", text));
    }

    filesystem::path report = dir.path / "report.jsonl";
    pass_rate_table table = run_evaluation(dataset, responses, config, report);

    vector<json> lines = report_lines(report);
    ASSERT_EQ(lines.size(), dataset.size());
    size_t no_code = 0, passed = 0;
    for (const json &line : lines) {
        if (line.value("error_class", "") == "no_code_extracted") ++no_code;
        if (line.at("status") == "pass") ++passed;
    }
    EXPECT_EQ(no_code, 1u);
    EXPECT_EQ(passed, dataset.size() - 1);

    const model_summary &summary = table.models.at("model-a");
    EXPECT_EQ(summary.total, dataset.size());
    EXPECT_EQ(summary.passed, dataset.size() - 1);
    EXPECT_EQ(summary.errors, 1u);
    EXPECT_DOUBLE_EQ(summary.pass_rate(), 0.75);
}

TEST_F(EvaluatorTest, UnknownTasksAndDuplicatePairsAreSkipped) {
    vector<benchmark_task> dataset = tasks();
    vector<model_response> responses = {
        make_response("add/0", "m", fenced(dataset[0].reference_solution)),
        make_response("add/0", "m", fenced(dataset[0].reference_solution)),
        make_response("missing/9", "m", fenced(dataset[0].reference_solution))};

    filesystem::path report = dir.path / "report.jsonl";
    run_evaluation(dataset, responses, config, report);
    EXPECT_EQ(read_lines(report).size(), 1u);
}

TEST_F(EvaluatorTest, ResumeNeverDuplicatesPairs) {
    vector<benchmark_task> dataset = tasks();
    vector<model_response> responses;
    for (const benchmark_task &task : dataset)
        responses.push_back(make_response(task.id, "m", fenced(task.reference_solution)));

    filesystem::path report = dir.path / "report.jsonl";
    vector<model_response> first_half(responses.begin(), responses.begin() + 2);
    run_evaluation(dataset, first_half, config, report);
    ASSERT_EQ(read_lines(report).size(), 2u);

    // 模拟上次评测在写入时被杀死，留下不完整的最后一行
    {
        ofstream fout(report, ios::app);
        fout << R"({"task_id": "add/3", "mod)";
    }

    pass_rate_table table = run_evaluation(dataset, responses, config, report);
    vector<json> lines = report_lines(report);
    ASSERT_EQ(lines.size(), dataset.size());
    set<string> ids;
    for (const json &line : lines) ids.insert(line.at("task_id").get<string>());
    EXPECT_EQ(ids.size(), dataset.size());
    EXPECT_EQ(table.models.at("m").total, dataset.size());

    // overwrite 模式重新评测已有的评测对，并替换旧的记录
    config.resume = resume_mode::OVERWRITE;
    responses[0].raw_text = fenced("def add(a, b):\n    return 0\n");
    table = run_evaluation(dataset, {responses[0]}, config, report);
    lines = report_lines(report);
    ASSERT_EQ(lines.size(), dataset.size());
    size_t failed = 0;
    for (const json &line : lines)
        if (line.at("task_id") == "add/0") {
            EXPECT_EQ(line.at("status"), "fail");
            ++failed;
        }
    EXPECT_EQ(failed, 1u);
    EXPECT_EQ(table.models.at("m").failed, 1u);
    EXPECT_EQ(table.models.at("m").total, dataset.size());
}

TEST_F(EvaluatorTest, ReportIsLockedAgainstConcurrentWriters) {
    filesystem::path report = dir.path / "report.jsonl";
    report_writer writer(report);
    EXPECT_THROW(report_writer second(report), report_io_error);
}

TEST_F(EvaluatorTest, InterruptKillsRunningPairAndKeepsReportValid) {
    vector<benchmark_task> dataset = tasks();
    vector<model_response> responses = {
        make_response("add/0", "m", fenced(dataset[0].reference_solution)),
        make_response("add/1", "m", fenced("def add(a, b):\n    while True:\n        pass\n"))};
    config.workers = 1;
    config.sandbox.time_limit = 60;

    filesystem::path report = dir.path / "report.jsonl";
    // 第一条记录写入后中断评测，此时死循环的评测对正在运行或者尚未开始
    thread stopper([&] {
        elapsed_time waited;
        while (waited.seconds() < 60 && read_lines(report).empty())
            this_thread::sleep_for(chrono::milliseconds(50));
        this_thread::sleep_for(chrono::milliseconds(500));
        stop_evaluation();
    });

    elapsed_time timer;
    pass_rate_table table = run_evaluation(dataset, responses, config, report);
    stopper.join();

    EXPECT_TRUE(evaluation_stopped());
    EXPECT_LT(timer.seconds(), 30.0);
    vector<json> lines = report_lines(report);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].at("task_id"), "add/0");
    EXPECT_EQ(lines[0].at("status"), "pass");
    EXPECT_EQ(table.models.at("m").total, 1u);

    // 再次运行时补齐被中断的评测对
    reset_evaluation();
    config.sandbox.time_limit = 1;
    run_evaluation(dataset, responses, config, report);
    lines = report_lines(report);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].at("task_id"), "add/1");
    EXPECT_EQ(lines[1].at("status"), "timeout");
}

class failing_report_writer : public report_writer {
public:
    using report_writer::report_writer;

    MOCK_METHOD(void, write, (const evaluation_record &), (override));
};

TEST_F(EvaluatorTest, ReportWriteFailureStopsEvaluation) {
    vector<benchmark_task> dataset = tasks();
    vector<model_response> responses;
    for (const benchmark_task &task : dataset)
        responses.push_back(make_response(task.id, "m", fenced(task.reference_solution)));

    failing_report_writer writer(dir.path / "report.jsonl");
    EXPECT_CALL(writer, write(::testing::_))
        .WillOnce(::testing::Throw(report_io_error("No space left on device")));

    EXPECT_THROW(run_evaluation(dataset, responses, config, writer), report_io_error);
    EXPECT_TRUE(evaluation_stopped());
}

TEST(PassRateTest, RecordOutcomeReturnsUpdatedTable) {
    evaluation_record record;
    record.model = "m";
    record.outcome.result = status::TIMEOUT;

    pass_rate_table empty;
    pass_rate_table table = record_outcome(empty, record);
    EXPECT_TRUE(empty.models.empty());
    EXPECT_EQ(table.models.at("m").timeouts, 1u);

    record.outcome.result = status::PASS;
    table = record_outcome(table, record);
    EXPECT_DOUBLE_EQ(table.models.at("m").pass_rate(), 0.5);
}
