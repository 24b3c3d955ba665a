#include <signal.h>
#include "gtest/gtest.h"
#include "judge/adapter.hpp"
#include "judge/runner.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;

class RunnerTest : public ::testing::Test {
protected:
    sandbox_config config;

    void SetUp() override {
        config.time_limit = 5;
        config.memory_limit = 1 << 19;  // 512M
    }

    execution_outcome run(const benchmark_task &task, const string &candidate) {
        return run_unit(get_adapter(task.kind).build(task, candidate), config);
    }
};

TEST_F(RunnerTest, ReferenceSolutionPasses) {
    benchmark_task task = make_add_task();
    execution_outcome outcome = run(task, task.reference_solution);
    EXPECT_EQ(outcome.result, status::PASS) << outcome.error_class << ": " << outcome.message << "\n"
                                            << outcome.stderr_excerpt;
}

TEST_F(RunnerTest, WrongAnswerFails) {
    execution_outcome outcome = run(make_add_task(), "def add(a, b):\n    return a - b\n");
    EXPECT_EQ(outcome.result, status::FAIL);
    EXPECT_EQ(outcome.error_class, "AssertionError");
}

TEST_F(RunnerTest, UnexpectedExceptionClassIsPreserved) {
    execution_outcome outcome = run(make_add_task(), "def add(a, b):\n    raise ValueError('bad input')\n");
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.error_class, "ValueError");
    EXPECT_NE(outcome.message.find("bad input"), string::npos);
}

TEST_F(RunnerTest, InfiniteLoopTimesOut) {
    config.time_limit = 1;
    execution_outcome outcome = run(make_add_task(), "def add(a, b):\n    while True:\n        pass\n");
    EXPECT_EQ(outcome.result, status::TIMEOUT);
    EXPECT_LT(outcome.duration, 1 + 1.0);
}

TEST_F(RunnerTest, MemoryErrorIsTaggedWithResource) {
    config.memory_limit = 1 << 18;  // 256M
    execution_outcome outcome = run(make_add_task(), "def add(a, b):\n    return len(bytearray(10 ** 10))\n");
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.resource, "memory");
}

TEST_F(RunnerTest, HardExitWithoutResultIsError) {
    execution_outcome outcome = run(make_add_task(), "import os\ndef add(a, b):\n    os._exit(0)\n");
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.error_class, "no_result");
}

TEST_F(RunnerTest, TestsCanCallHelpersDefinedByCandidate) {
    benchmark_task task;
    task.id = "HumanEval/38";
    task.entry_point = "decode_cyclic";
    task.tests =
        "def check(candidate):\n"
        "    for s in ['abcdef', 'hello world', '']:\n"
        "        assert candidate(encode_cyclic(s)) == s\n";

    string candidate =
        "def encode_cyclic(s):\n"
        "    groups = [s[(3 * i):min((3 * i + 3), len(s))] for i in range((len(s) + 2) // 3)]\n"
        "    groups = [(group[1:] + group[0]) if len(group) == 3 else group for group in groups]\n"
        "    return ''.join(groups)\n"
        "\n"
        "def decode_cyclic(s):\n"
        "    return encode_cyclic(encode_cyclic(s))\n";
    execution_outcome outcome = run(task, candidate);
    EXPECT_EQ(outcome.result, status::PASS) << outcome.error_class << ": " << outcome.message;
}

TEST_F(RunnerTest, TestDefinitionsShadowCandidateHelpers) {
    benchmark_task task;
    task.id = "shadow/0";
    task.entry_point = "f";
    task.tests =
        "def helper():\n"
        "    return 100\n"
        "\n"
        "def check(candidate):\n"
        "    assert helper() == 100\n"
        "    assert candidate() == 1\n";

    // 候选函数仍然使用自己模块中的 helper
    execution_outcome outcome = run(task, "def helper():\n    return 1\n\ndef f():\n    return helper()\n");
    EXPECT_EQ(outcome.result, status::PASS) << outcome.error_class << ": " << outcome.message;
}

TEST_F(RunnerTest, StructuredCasesForMethodOfSolutionClass) {
    benchmark_task task = make_add_task();
    task.tests = json::array({{{"input", json::array({1, 2})}, {"output", 3}},
                              {{"input", json::array({-1, 1})}, {"output", 0}}});
    execution_outcome outcome = run(task, "class Solution:\n    def add(self, a, b):\n        return a + b\n");
    EXPECT_EQ(outcome.result, status::PASS) << outcome.error_class << ": " << outcome.message;

    outcome = run(task, "class Solution:\n    def add(self, a, b):\n        return a * b\n");
    EXPECT_EQ(outcome.result, status::FAIL);
}

TEST_F(RunnerTest, ClassBasedCasesReplayMethodCalls) {
    benchmark_task task;
    task.id = "lc/155";
    task.entry_point = "MinStack";
    task.kind = task_kind::CLASS;
    task.tests = json::array({{{"input", json::array({json::array({"MinStack", "push", "push", "getMin", "pop", "getMin"}),
                                                      json::array({json::array(), json::array({5}), json::array({2}), json::array(), json::array(), json::array()})})},
                               {"output", json::array({nullptr, nullptr, nullptr, 2, nullptr, 5})}}});

    string candidate =
        "class MinStack:\n"
        "    def __init__(self):\n"
        "        self.items = []\n"
        "    def push(self, x):\n"
        "        self.items.append(x)\n"
        "    def pop(self):\n"
        "        self.items.pop()\n"
        "    def getMin(self):\n"
        "        return min(self.items)\n";
    execution_outcome outcome = run(task, candidate);
    EXPECT_EQ(outcome.result, status::PASS) << outcome.error_class << ": " << outcome.message;
}

TEST(ClassifyTest, HarnessResultMustAgreeWithExitCode) {
    sandbox_result result;
    result.exitcode = E_PASS;
    result.signal = -1;
    EXPECT_EQ(classify(result, {{"status", "pass"}}).result, status::PASS);

    result.exitcode = 0;
    execution_outcome outcome = classify(result, {{"status", "pass"}});
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.error_class, "inconsistent_result");

    outcome = classify(result, json());
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.error_class, "no_result");
}

TEST(ClassifyTest, TimeoutsAndSignals) {
    sandbox_result result;
    result.timed_out = true;
    result.signal = SIGKILL;
    EXPECT_EQ(classify(result, json()).result, status::TIMEOUT);

    result.timed_out = false;
    result.signal = SIGXCPU;
    EXPECT_EQ(classify(result, json()).result, status::TIMEOUT);

    result.signal = SIGXFSZ;
    execution_outcome outcome = classify(result, json());
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.resource, "file_size");

    result.signal = SIGSEGV;
    EXPECT_EQ(classify(result, json()).resource, "memory");
}

TEST(ClassifyTest, ProcessLimitFromBlockingIOError) {
    sandbox_result result;
    result.exitcode = E_ERROR;
    execution_outcome outcome = classify(result, {{"status", "error"}, {"error_class", "BlockingIOError"}, {"message", "fork"}});
    EXPECT_EQ(outcome.result, status::ERROR);
    EXPECT_EQ(outcome.resource, "processes");
}

TEST(ClassifyTest, SandboxOptionsFromConfig) {
    sandbox_config config;
    config.memory_limit = 1024;
    sandbox_options opt = make_sandbox_options(config);
    EXPECT_EQ(opt.memory_limit, 1024u * 1024);
    EXPECT_EQ(opt.command.back(), HARNESS_FILE);
    EXPECT_DOUBLE_EQ(opt.cpu_limit, config.time_limit);
}
