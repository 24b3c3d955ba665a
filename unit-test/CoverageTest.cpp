#include <sstream>
#include "analysis/coverage.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace nlohmann;
using namespace codebench;

static benchmark_task task_with_tests(const string &id, const json &tests) {
    benchmark_task task;
    task.id = id;
    task.entry_point = "f";
    task.tests = tests;
    return task;
}

TEST(CoverageTest, EdgeValuesCoverAtLeastFourCategories) {
    coverage_analyzer analyzer{coverage_config()};
    coverage_profile profile = analyzer.analyze(task_with_tests("t", "assert f(-5) == 0\nassert f(3.14) == []\n"));

    EXPECT_GE(profile.covered(), 4u);
    EXPECT_TRUE(profile.flags.at("has_negative"));
    EXPECT_TRUE(profile.flags.at("has_zero"));
    EXPECT_TRUE(profile.flags.at("has_float"));
    EXPECT_TRUE(profile.flags.at("has_empty_list"));
    EXPECT_FALSE(profile.flags.at("has_none"));
    EXPECT_EQ(profile.num_asserts, 2u);
    EXPECT_EQ(profile.flags.size(), coverage_categories().size());
}

TEST(CoverageTest, Detectors) {
    auto flags = detect_patterns("x = 123456\ny = ''\nz = None\nw = '\xe4\xbd\xa0'\n");
    EXPECT_TRUE(flags.at("has_large_int"));
    EXPECT_TRUE(flags.at("has_empty_str"));
    EXPECT_TRUE(flags.at("has_none"));
    EXPECT_TRUE(flags.at("has_unicode"));
    EXPECT_FALSE(flags.at("has_negative"));
    EXPECT_FALSE(flags.at("has_exception"));

    EXPECT_TRUE(detect_patterns("with pytest.raises(ValueError):\n    f(1)\n").at("has_exception"));
    EXPECT_TRUE(detect_patterns("self.assertRaises(KeyError, f)").at("has_exception"));
    EXPECT_TRUE(detect_patterns("try:\n    f()\nexcept ValueError:\n    pass\n").at("has_exception"));
    EXPECT_TRUE(detect_patterns(R"(assert f("a\tb") == 1)").at("has_whitespace_edge"));

    // 标识符中的数字不算负数或者零
    auto identifiers = detect_patterns("x0 = a-1 + v0");
    EXPECT_FALSE(identifiers.at("has_zero"));
    EXPECT_FALSE(identifiers.at("has_negative"));
}

TEST(CoverageTest, AssertCountIgnoresIdentifiers) {
    EXPECT_EQ(count_asserts("assert x\nassertEqual(a, b)\nmy_assert(1)\n    assert y"), 2u);
}

TEST(CoverageTest, StructuredTestsAreRenderedAsPythonLiterals) {
    coverage_analyzer analyzer{coverage_config()};
    coverage_profile profile = analyzer.analyze(task_with_tests("t", json::array({{{"input", json::array({nullptr, ""})}, {"output", false}}})));
    EXPECT_TRUE(profile.flags.at("has_none"));
    EXPECT_TRUE(profile.flags.at("has_empty_str"));
    EXPECT_EQ(profile.num_asserts, 0u);
}

TEST(CoverageTest, EnabledCategoriesAreConfigurable) {
    coverage_config config;
    config.categories = {"has_zero", "has_none"};
    coverage_analyzer analyzer(config);
    ASSERT_EQ(analyzer.enabled().size(), 2u);

    coverage_profile profile = analyzer.analyze(task_with_tests("t", "assert f(0) is None"));
    EXPECT_EQ(profile.flags.size(), 2u);
    EXPECT_DOUBLE_EQ(profile.ratio(), 1.0);

    profile = analyzer.analyze(task_with_tests("t", "assert f(1) == 2"));
    EXPECT_DOUBLE_EQ(profile.ratio(), 0.0);

    config.categories = {"has_zero", "has_infinity"};
    EXPECT_THROW(coverage_analyzer{config}, config_error);
}

TEST(CoverageTest, Reports) {
    coverage_config config;
    config.categories = {"has_negative", "has_zero"};
    coverage_analyzer analyzer(config);
    vector<coverage_profile> profiles = {
        analyzer.analyze(task_with_tests("a,1", "assert f(-1) == 0")),
        analyzer.analyze(task_with_tests("b", "assert f(1) == 1"))};

    coverage_summary summary = analyzer.aggregate(profiles);
    EXPECT_EQ(summary.tasks, 2u);
    EXPECT_EQ(summary.covered.at("has_negative"), 1u);
    EXPECT_EQ(summary.covered.at("has_zero"), 1u);

    ostringstream csv;
    analyzer.write_csv(csv, profiles);
    EXPECT_EQ(csv.str(),
              "task_id,entry_point,num_asserts,has_negative,has_zero,coverage_ratio\n"
              "\"a,1\",f,1,True,True,1.0000\n"
              "b,f,1,False,False,0.0000\n");

    ostringstream markdown;
    analyzer.write_markdown(markdown, profiles);
    EXPECT_NE(markdown.str().find("| Negatives | 1/2 | 50.0% |"), string::npos);
    EXPECT_NE(markdown.str().find("- missing: Negatives, Zero"), string::npos);

    ostringstream console;
    analyzer.print_summary(console, profiles);
    EXPECT_NE(console.str().find("* b: missing -> Negatives, Zero"), string::npos);
}
