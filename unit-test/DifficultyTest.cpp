#include <sstream>
#include "analysis/difficulty.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace codebench;

TEST(DifficultyTest, RecursiveFunction) {
    code_metrics metrics = analyze_code(parse_python(
                                            "def fib(n):\n"
                                            "    if n < 2:\n"
                                            "        return n\n"
                                            "    return fib(n - 1) + fib(n - 2)\n"),
                                        "fib");
    EXPECT_EQ(metrics.branching, 1u);
    EXPECT_EQ(metrics.loop, 0u);
    EXPECT_EQ(metrics.call, 2u);
    EXPECT_EQ(metrics.recursion_calls, 2u);
    EXPECT_EQ(metrics.max_nesting_depth, 2u);
    EXPECT_TRUE(metrics.has_recursion());
    EXPECT_FALSE(metrics.has_exception_handling());
}

TEST(DifficultyTest, RecursionThroughHelperAndSelfMethod) {
    code_metrics helper = analyze_code(parse_python(
                                           "def solve(xs):\n"
                                           "    def go(i):\n"
                                           "        return 0 if i == len(xs) else xs[i] + go(i + 1)\n"
                                           "    return go(0)\n"),
                                       "solve");
    // go(i + 1) 在 go 内部，go(0) 在 go 外部
    EXPECT_EQ(helper.recursion_calls, 1u);

    code_metrics method = analyze_code(parse_python(
                                           "class Solution:\n"
                                           "    def depth(self, node):\n"
                                           "        if node is None:\n"
                                           "            return 0\n"
                                           "        return 1 + max(self.depth(node.left), self.depth(node.right))\n"
                                           "    def other(self):\n"
                                           "        return self.depth(None)\n"),
                                       "maxDepth");
    EXPECT_EQ(method.recursion_calls, 2u);
}

TEST(DifficultyTest, LoopsExceptionsAndComprehensions) {
    code_metrics metrics = analyze_code(parse_python(
                                            "def f(xs):\n"
                                            "    for x in xs:\n"
                                            "        while x > 0:\n"
                                            "            x -= 1\n"
                                            "    try:\n"
                                            "        return [y for y in xs]\n"
                                            "    except ValueError:\n"
                                            "        raise\n"),
                                        "f");
    EXPECT_EQ(metrics.loop, 2u);
    EXPECT_EQ(metrics.try_count, 1u);
    EXPECT_EQ(metrics.raise, 1u);
    EXPECT_EQ(metrics.comprehension, 1u);
    EXPECT_EQ(metrics.branching, 0u);
    EXPECT_EQ(metrics.max_nesting_depth, 3u);
    EXPECT_TRUE(metrics.has_exception_handling());
    EXPECT_FALSE(metrics.has_recursion());
}

TEST(DifficultyTest, PromptMetrics) {
    prompt_metrics metrics = analyze_prompt("You MUST handle the edge case. Must be robust.");
    EXPECT_EQ(metrics.constraint_markers, 5u);
    EXPECT_EQ(analyze_prompt("caf\xc3\xa9").prompt_length, 4u);
    EXPECT_EQ(analyze_prompt("").constraint_markers, 0u);
}

TEST(DifficultyTest, CategoryThresholds) {
    vector<double> thresholds = {6, 12, 18};
    EXPECT_EQ(category_for_score(0, thresholds), "Easy");
    EXPECT_EQ(category_for_score(5.99, thresholds), "Easy");
    EXPECT_EQ(category_for_score(6, thresholds), "Medium");
    EXPECT_EQ(category_for_score(12, thresholds), "Hard");
    EXPECT_EQ(category_for_score(18, thresholds), "Challenging");
    EXPECT_EQ(category_for_score(100, thresholds), "Challenging");
}

TEST(DifficultyTest, ScoreIsWeightedSumRoundedToTwoDecimals) {
    EXPECT_DOUBLE_EQ(difficulty_score({{"a", 3}, {"b", 1}}, {{"a", 0.5}, {"b", 0.333}}), 1.83);
    EXPECT_DOUBLE_EQ(difficulty_score({{"a", 3}}, {{"a", 1}, {"missing", 10}}), 3);
}

TEST(DifficultyTest, AnalyzeTask) {
    difficulty_config config;
    benchmark_task task = make_add_task();
    difficulty_row row = analyze_difficulty(task, config);

    EXPECT_EQ(row.level, confidence::HIGH);
    EXPECT_EQ(row.code.max_nesting_depth, 1u);
    EXPECT_EQ(row.prompt.prompt_length, 86u);
    EXPECT_EQ(row.prompt.constraint_markers, 2u);
    EXPECT_EQ(row.tests.num_asserts, 2u);
    EXPECT_TRUE(row.tests.flags.at("has_negative"));
    EXPECT_TRUE(row.tests.flags.at("has_zero"));
    EXPECT_FALSE(row.tests.flags.at("has_float"));
    EXPECT_DOUBLE_EQ(row.score, 5.66);
    EXPECT_EQ(row.category, "Easy");

    // 纯函数：相同输入得到相同结果
    EXPECT_DOUBLE_EQ(analyze_difficulty(task, config).score, row.score);
}

TEST(DifficultyTest, UnparsableReferenceKeepsLowConfidenceRow) {
    difficulty_config config;
    benchmark_task task = make_add_task();
    task.reference_solution = "def add(a, b:\n    return a + b\n";
    difficulty_row row = analyze_difficulty(task, config);
    EXPECT_EQ(row.level, confidence::LOW);
    EXPECT_EQ(row.code.call, 0u);
    EXPECT_EQ(row.code.max_nesting_depth, 0u);
    EXPECT_EQ(row.tests.num_asserts, 2u);

    ostringstream os;
    write_difficulty_csv(os, {row});
    string csv = os.str();
    EXPECT_EQ(csv.substr(0, csv.find(',')), "task_id");
    EXPECT_NE(csv.find(",max_nesting_depth,has_recursion,has_exception_handling,prompt_length,"), string::npos);
    EXPECT_NE(csv.find("add/0,add,0,0,0,0,0,0,0,0,False,False,86,2,2,True,True,False"), string::npos);
    EXPECT_NE(csv.find(",Easy,low\n"), string::npos);
}
