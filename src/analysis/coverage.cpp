#include "analysis/coverage.hpp"
#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codebench {
using namespace std;

// clang-format off
static const vector<coverage_category> categories_table = {
    {"has_negative",        "Negatives",          boost::regex(R"re((?<![\w])-\d)re")},
    {"has_zero",            "Zero",               boost::regex(R"re((?<![\w])0(?!\.))re")},
    {"has_large_int",       "Large integers",     boost::regex(R"re(\b\d{5,}\b)re")},
    {"has_float",           "Floats/Scientific",  boost::regex(R"re(\d+\.\d+|\d+e-?\d+|\d+\.0e-?\d+)re", boost::regex::perl | boost::regex::icase)},
    {"has_empty_list",      "Empty list",         boost::regex(R"re(\[\s*\])re")},
    {"has_empty_str",       "Empty string",       boost::regex(R"re((?<!\\)''|(?<!\\)"")re")},
    {"has_none",            "None/null",          boost::regex(R"re((?<!\w)None(?!\w))re")},
    {"has_unicode",         "Unicode",            boost::regex(R"re([^\x00-\x7F])re")},
    {"has_exception",       "Exceptions",         boost::regex(R"re(try:|except\s+[A-Za-z_]\w*:|pytest\.raises|assertRaises)re", boost::regex::perl | boost::regex::icase)},
    {"has_whitespace_edge", "Whitespace/Escapes", boost::regex(R"re(['"][^'"]*\\n|\\t|\\r|\\s['"])re")},
};
// clang-format on

static const boost::regex assert_pattern(R"((?<![A-Za-z_])assert(?![A-Za-z_]))");

const vector<coverage_category> &coverage_categories() {
    return categories_table;
}

size_t count_asserts(const string &source) {
    boost::sregex_iterator begin(source.begin(), source.end(), assert_pattern), end;
    return distance(begin, end);
}

map<string, bool> detect_patterns(const string &source) {
    map<string, bool> flags;
    for (const coverage_category &category : categories_table)
        flags[category.key] = boost::regex_search(source, category.pattern);
    return flags;
}

size_t coverage_profile::covered() const {
    return count_if(flags.begin(), flags.end(), [](auto &flag) { return flag.second; });
}

double coverage_profile::ratio() const {
    return flags.empty() ? 0 : (double)covered() / flags.size();
}

coverage_analyzer::coverage_analyzer(const coverage_config &config) {
    for (const string &key : config.categories) {
        auto it = find_if(categories_table.begin(), categories_table.end(),
                          [&](const coverage_category &category) { return category.key == key; });
        if (it == categories_table.end())
            throw config_error("Unrecognized coverage category " + key);
    }

    for (const coverage_category &category : categories_table) {
        if (config.categories.empty() ||
            find(config.categories.begin(), config.categories.end(), category.key) != config.categories.end())
            categories.push_back(&category);
    }
}

coverage_profile coverage_analyzer::analyze(const benchmark_task &task) const {
    coverage_profile profile;
    profile.task_id = task.id;
    profile.entry_point = task.entry_point;

    string source = task.test_source();
    profile.num_asserts = count_asserts(source);
    for (const coverage_category *category : categories)
        profile.flags[category->key] = boost::regex_search(source, category->pattern);
    return profile;
}

coverage_summary coverage_analyzer::aggregate(const vector<coverage_profile> &profiles) const {
    coverage_summary summary;
    summary.tasks = profiles.size();
    for (const coverage_category *category : categories)
        summary.covered[category->key] = 0;
    for (const coverage_profile &profile : profiles)
        for (auto &[key, present] : profile.flags)
            if (present) summary.covered[key]++;
    return summary;
}

vector<string> coverage_analyzer::missing_categories(const coverage_profile &profile) const {
    vector<string> missing;
    for (const coverage_category *category : categories) {
        auto it = profile.flags.find(category->key);
        if (it == profile.flags.end() || !it->second) missing.push_back(category->readable);
    }
    return missing;
}

void coverage_analyzer::write_csv(ostream &os, const vector<coverage_profile> &profiles) const {
    os << "task_id,entry_point,num_asserts";
    for (const coverage_category *category : categories) os << "," << category->key;
    os << ",coverage_ratio\n";

    for (const coverage_profile &profile : profiles) {
        os << csv_escape(profile.task_id) << "," << csv_escape(profile.entry_point) << "," << profile.num_asserts;
        for (const coverage_category *category : categories) {
            auto it = profile.flags.find(category->key);
            os << "," << (it != profile.flags.end() && it->second ? "True" : "False");
        }
        os << fmt::format(",{:.4f}\n", profile.ratio());
    }
}

void coverage_analyzer::write_markdown(ostream &os, const vector<coverage_profile> &profiles, size_t excerpt) const {
    coverage_summary summary = aggregate(profiles);
    size_t n = max<size_t>(summary.tasks, 1);

    os << "# Test Coverage Gap Report\n\n";
    os << "## Coverage summary by category\n\n";
    os << "| Category | Covered | Coverage |\n";
    os << "|---|---:|---:|\n";
    for (const coverage_category *category : categories) {
        size_t v = summary.covered[category->key];
        os << fmt::format("| {} | {}/{} | {:.1f}% |\n", category->readable, v, n, 100.0 * v / n);
    }

    os << "\n## Per-task coverage (excerpt)\n\n";
    os << "`num_asserts` alongside covered and missing categories.\n\n";
    for (size_t i = 0; i < profiles.size() && i < excerpt; ++i) {
        const coverage_profile &profile = profiles[i];
        vector<string> covered;
        for (const coverage_category *category : categories) {
            auto it = profile.flags.find(category->key);
            if (it != profile.flags.end() && it->second) covered.push_back(category->readable);
        }
        vector<string> missing = missing_categories(profile);

        os << fmt::format("### {} (`{}`)\n", profile.task_id, profile.entry_point);
        os << fmt::format("- asserts: **{}**\n", profile.num_asserts);
        os << "- covered: " << (covered.empty() ? "-" : boost::algorithm::join(covered, ", ")) << "\n";
        os << "- missing: " << (missing.empty() ? "-" : boost::algorithm::join(missing, ", ")) << "\n\n";
    }
}

void coverage_analyzer::print_summary(ostream &os, const vector<coverage_profile> &profiles, size_t excerpt) const {
    coverage_summary summary = aggregate(profiles);
    size_t n = max<size_t>(summary.tasks, 1);

    os << "Coverage summary by category" << endl;
    for (const coverage_category *category : categories) {
        size_t v = summary.covered[category->key];
        os << fmt::format("- {:<20}: {}/{}  ({:.1f}%)", category->readable, v, n, 100.0 * v / n) << endl;
    }

    os << endl << fmt::format("Examples of missing categories per task (first {}):", excerpt) << endl;
    for (size_t i = 0; i < profiles.size() && i < excerpt; ++i) {
        vector<string> missing = missing_categories(profiles[i]);
        os << "* " << profiles[i].task_id << ": missing -> " << (missing.empty() ? "-" : boost::algorithm::join(missing, ", ")) << endl;
    }
}

}  // namespace codebench
