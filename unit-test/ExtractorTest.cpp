#include "gtest/gtest.h"
#include "judge/extractor.hpp"

using namespace std;
using namespace codebench;

TEST(ExtractorTest, FencedBlockDefiningEntryPointIsReturnedVerbatim) {
    string raw =
        "Sure! First a helper:\n"
        "```python\n"
        "def helper(x):\n"
        "    return x\n"
        "```\n"
        "And the solution:\n"
        "```python\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "```\n"
        "Hope this helps.";

    extraction_result result = extract_code(raw, "add", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::FENCED_ENTRY_POINT);
    EXPECT_EQ(*result.code, "def add(a, b):\n    return a + b");
}

TEST(ExtractorTest, TildeFenceAndLongerClosingFence) {
    string raw =
        "~~~py\n"
        "def solve(n):\n"
        "    return n * 2\n"
        "~~~~\n";
    extraction_result result = extract_code(raw, "solve", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(*result.code, "def solve(n):\n    return n * 2");
}

TEST(ExtractorTest, UnclosedFenceRunsToEndOfText) {
    vector<fenced_block> blocks = find_fenced_blocks("```python\ndef f():\n    pass\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_FALSE(blocks[0].closed);
    EXPECT_EQ(blocks[0].info, "python");
    EXPECT_EQ(blocks[0].body, "def f():\n    pass\n");
}

TEST(ExtractorTest, RawDefinitionWithImportsAndTrailingProse) {
    string raw =
        "The answer is below.\n"
        "import math\n"
        "\n"
        "def area(r):\n"
        "    return math.pi * r * r\n"
        "\n"
        "This computes the area of a circle.";

    extraction_result result = extract_code(raw, "area", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::ENTRY_POINT_SCAN);
    EXPECT_EQ(*result.code, "import math\n\ndef area(r):\n    return math.pi * r * r");
}

TEST(ExtractorTest, MethodOfSolutionClassTakesWholeClass) {
    string raw =
        "class Solution:\n"
        "    def twoSum(self, nums, target):\n"
        "        return [0, 1]\n"
        "\n"
        "Explanation follows.";

    extraction_result result = extract_code(raw, "twoSum", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::ENTRY_POINT_SCAN);
    EXPECT_EQ(*result.code, "class Solution:\n    def twoSum(self, nums, target):\n        return [0, 1]");
}

TEST(ExtractorTest, FallsBackToFirstPythonBlock) {
    string raw =
        "```text\nnot code at all\n```\n"
        "```python\n"
        "def other(x):\n"
        "    return x\n"
        "```\n";
    extraction_result result = extract_code(raw, "missing", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::FIRST_FENCED_BLOCK);
    EXPECT_EQ(*result.code, "def other(x):\n    return x");
}

TEST(ExtractorTest, FallsBackToAnyDefinition) {
    string raw = "I think this works:\ndef other(x):\n    return x + 1\nThat is all.";
    extraction_result result = extract_code(raw, "missing", task_kind::FUNCTION);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::DEFINITION_SCAN);
    EXPECT_EQ(*result.code, "def other(x):\n    return x + 1");
}

TEST(ExtractorTest, ProseOnlyYieldsNothing) {
    extraction_result result = extract_code("I'm sorry, I cannot help with that request.", "add", task_kind::FUNCTION);
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.policy, extraction_policy::NONE);

    EXPECT_FALSE(extract_code("", "add", task_kind::FUNCTION).found());
    EXPECT_FALSE(extract_code("   \n\n", "add", task_kind::FUNCTION).found());
}

TEST(ExtractorTest, NormalizeStripsCommonIndentAndBlankEdges) {
    EXPECT_EQ(normalize_code("\n\n    def f():\n        return 1\n\n"), "def f():\n    return 1");
    EXPECT_EQ(normalize_code("  \n \n"), "");
}

TEST(ExtractorTest, DefinesSymbol) {
    EXPECT_TRUE(defines_symbol("def add(a, b):\n    pass", "add"));
    EXPECT_TRUE(defines_symbol("async def add(a, b):\n    pass", "add"));
    EXPECT_TRUE(defines_symbol("class Solution:\n    def add(self):\n        pass", "add"));
    EXPECT_TRUE(defines_symbol("class MinStack:\n    pass", "MinStack"));
    EXPECT_FALSE(defines_symbol("def adder(a, b):\n    pass", "add"));
    EXPECT_FALSE(defines_symbol("result = add(1, 2)", "add"));
    EXPECT_FALSE(defines_symbol("def add(a, b): pass", "a.b"));
}
