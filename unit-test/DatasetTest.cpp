#include <fstream>
#include "dataset/task.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;

TEST(DatasetTest, HumanEvalStyleTask) {
    json j = {
        {"task_id", "HumanEval/0"},
        {"prompt", "def add(a, b):\n"},
        {"canonical_solution", "    return a + b\n"},
        {"entry_point", "add"},
        {"test", "def check(candidate):\n    assert candidate(1, 2) == 3\n"}};
    benchmark_task task = j.get<benchmark_task>();
    EXPECT_EQ(task.id, "HumanEval/0");
    EXPECT_EQ(task.entry_point, "add");
    EXPECT_EQ(task.kind, task_kind::FUNCTION);
    EXPECT_FALSE(task.has_structured_tests());
    EXPECT_EQ(task.test_source(), "def check(candidate):\n    assert candidate(1, 2) == 3\n");
}

TEST(DatasetTest, NumericIdAndAlternativeFieldNames) {
    json j = {
        {"id", 17},
        {"question", json::array({"Line one.", "Line two."})},
        {"reference_solution", "def f():\n    return 1\n"},
        {"entry_point", "f"},
        {"tests", json::array({{{"input", json::array({1, 2})}, {"output", 3}}})}};
    benchmark_task task = j.get<benchmark_task>();
    EXPECT_EQ(task.id, "17");
    EXPECT_EQ(task.prompt, "Line one.\n\nLine two.");
    EXPECT_EQ(task.reference_solution, "def f():\n    return 1\n");
    EXPECT_TRUE(task.has_structured_tests());
    EXPECT_EQ(task.kind, task_kind::FUNCTION);
    EXPECT_EQ(task.test_source(), "{'input': [1, 2], 'output': 3}");
}

TEST(DatasetTest, ClassBasedCasesAreInferred) {
    json cases = json::array({{{"input", json::array({json::array({"MinStack", "push", "getMin"}), json::array({json::array(), json::array({3}), json::array()})})},
                               {"output", json::array({nullptr, nullptr, 3})}}});
    EXPECT_TRUE(is_class_based_cases(cases));

    json j = {{"task_id", "lc/155"}, {"entry_point", "MinStack"}, {"test", cases}};
    EXPECT_EQ(j.get<benchmark_task>().kind, task_kind::CLASS);

    json explicit_kind = {{"task_id", "lc/155"}, {"entry_point", "MinStack"}, {"test", cases}, {"kind", "function"}};
    EXPECT_EQ(explicit_kind.get<benchmark_task>().kind, task_kind::FUNCTION);
}

TEST(DatasetTest, PythonLiterals) {
    EXPECT_EQ(to_python_literal(nullptr), "None");
    EXPECT_EQ(to_python_literal(true), "True");
    EXPECT_EQ(to_python_literal(false), "False");
    EXPECT_EQ(to_python_literal("a\nb"), "'a\\nb'");
    EXPECT_EQ(to_python_literal("it's"), "\"it's\"");
    EXPECT_EQ(to_python_literal(json::array({-5, 0, 3.14, json::array()})), "[-5, 0, 3.14, []]");
}

TEST(DatasetTest, ModelErrorIsPreserved) {
    json j = {{"task_id", "t1"}, {"model", "m"}, {"provider", "p"}, {"error", {{"type", "rate_limit"}, {"message", "slow down"}}}};
    model_response response = j.get<model_response>();
    ASSERT_TRUE(response.failure_type);
    EXPECT_EQ(*response.failure_type, "rate_limit");
    EXPECT_EQ(response.failure_message, "slow down");

    json failed = {{"task_id", "t1"}, {"model", "m"}, {"success", false}};
    EXPECT_EQ(*failed.get<model_response>().failure_type, "model_error");

    json ok = {{"task_id", "t1"}, {"response", "def f(): pass"}};
    model_response plain = ok.get<model_response>();
    EXPECT_FALSE(plain.failure_type);
    EXPECT_EQ(plain.model, "unknown");
}

TEST(DatasetTest, EmbeddedRawItem) {
    json j = {
        {"dataset_index", 4},
        {"model", "m"},
        {"response", "```python\ndef f():\n    return 1\n```"},
        {"raw_item", {{"prompt", "p"}, {"entry_point", "f"}, {"test", "assert f() == 1"}}}};
    model_response response = j.get<model_response>();
    ASSERT_TRUE(response.embedded_task);
    EXPECT_EQ(response.task_id, "4");
    EXPECT_EQ(response.embedded_task->id, "4");
    EXPECT_EQ(response.embedded_task->entry_point, "f");
}

TEST(DatasetTest, LoadSkipsMalformedLinesAndDuplicates) {
    scoped_temp_dir dir("dataset");
    filesystem::path path = dir.path / "tasks.jsonl";
    {
        ofstream fout(path);
        fout << R"({"task_id": "a", "entry_point": "f", "test": "assert True"})" << "\n";
        fout << "{not json\n";
        fout << "\n";
        fout << R"({"entry_point": "no id"})" << "\n";
        fout << R"({"task_id": "a", "entry_point": "g", "test": "assert True"})" << "\n";
        fout << R"({"task_id": "b", "entry_point": "h", "test": "assert True"})" << "\n";
    }

    vector<benchmark_task> tasks = load_tasks(path);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].id, "a");
    EXPECT_EQ(tasks[0].entry_point, "f");
    EXPECT_EQ(tasks[1].id, "b");

    EXPECT_THROW(load_tasks(dir.path / "missing.jsonl"), system_error);
}
