#include "judge/extractor.hpp"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/range/iterator_range.hpp>
#include <boost/regex.hpp>
#include <glog/logging.h>

namespace codebench {
using namespace std;

string to_string(extraction_policy policy) {
    switch (policy) {
        case extraction_policy::FENCED_ENTRY_POINT: return "fenced_entry_point";
        case extraction_policy::ENTRY_POINT_SCAN: return "entry_point_scan";
        case extraction_policy::FIRST_FENCED_BLOCK: return "first_fenced_block";
        case extraction_policy::DEFINITION_SCAN: return "definition_scan";
        default: return "none";
    }
}

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    for (string &line : lines)
        if (!line.empty() && line.back() == '\r') line.pop_back();
    return lines;
}

static string join_lines(vector<string>::const_iterator begin, vector<string>::const_iterator end) {
    return boost::algorithm::join(boost::make_iterator_range(begin, end), "\n");
}

static bool is_blank(const string &line) {
    return boost::algorithm::all(line, boost::is_space());
}

static size_t indentation(const string &line) {
    size_t n = line.find_first_not_of(" \t");
    return n == string::npos ? line.size() : n;
}

vector<fenced_block> find_fenced_blocks(const string &text) {
    static const boost::regex opening(R"(^ {0,3}(`{3,}|~{3,})(.*)$)");

    vector<fenced_block> blocks;
    vector<string> lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        boost::smatch match;
        if (!boost::regex_match(lines[i], match, opening)) continue;

        string fence = match[1];
        string info = boost::trim_copy(string(match[2]));
        // ``` 开头的 info string 不能包含反引号，否则只是行内代码
        if (fence[0] == '`' && info.find('`') != string::npos) continue;

        fenced_block block;
        block.info = info;
        block.closed = false;
        size_t j = i + 1;
        for (; j < lines.size(); ++j) {
            const string &line = lines[j];
            size_t indent = line.find_first_not_of(' ');
            if (indent == string::npos || indent > 3) continue;
            size_t run = line.find_first_not_of(fence[0], indent);
            if (run == string::npos) run = line.size();
            if (run - indent >= fence.size() && is_blank(line.substr(run))) {
                block.closed = true;
                break;
            }
        }
        block.body = join_lines(lines.begin() + i + 1, lines.begin() + j);
        blocks.push_back(block);
        i = j;
    }
    return blocks;
}

string normalize_code(const string &code) {
    vector<string> lines = split_lines(code);

    auto first = find_if(lines.begin(), lines.end(), [](const string &line) { return !is_blank(line); });
    if (first == lines.end()) return "";
    auto last = find_if(lines.rbegin(), lines.rend(), [](const string &line) { return !is_blank(line); }).base();
    lines = vector<string>(first, last);

    // 所有非空行共同的缩进前缀，制表符和空格视为不同的字符
    string prefix;
    bool initialized = false;
    for (const string &line : lines) {
        if (is_blank(line)) continue;
        string indent = line.substr(0, indentation(line));
        if (!initialized) {
            prefix = indent;
            initialized = true;
        } else {
            size_t n = 0;
            while (n < prefix.size() && n < indent.size() && prefix[n] == indent[n]) ++n;
            prefix.resize(n);
        }
    }

    for (string &line : lines) {
        if (is_blank(line))
            line.clear();
        else
            line.erase(0, prefix.size());
    }
    return boost::algorithm::join(lines, "\n");
}

static bool is_identifier(const string &name) {
    static const boost::regex identifier(R"([A-Za-z_][A-Za-z0-9_]*)");
    return boost::regex_match(name, identifier);
}

static boost::regex function_definition(const string &name) {
    return boost::regex(R"(^[ \t]*(async[ \t]+)?def[ \t]+)" + name + R"([ \t]*\()");
}

static boost::regex class_definition(const string &name) {
    return boost::regex(R"(^[ \t]*class[ \t]+)" + name + R"(\b)");
}

static bool matches_any_line(const string &code, const boost::regex &pattern) {
    return boost::regex_search(code, pattern, boost::match_not_dot_newline);
}

bool defines_symbol(const string &code, const string &entry_point) {
    if (!is_identifier(entry_point)) return false;
    return matches_any_line(code, function_definition(entry_point)) ||
           matches_any_line(code, class_definition(entry_point));
}

/**
 * @brief 判断一个没有缩进的行是不是代码
 * 语句关键字、装饰器、注释、赋值、函数调用都算作代码，其他的视为自然语言
 */
static bool looks_like_code(const string &line) {
    static const boost::regex code_line(
        R"(^(def|class|async|import|from|if|elif|else|for|while|try|except|finally|with|return|raise|assert|pass|global|nonlocal|del|yield|print|lambda)\b)"
        R"(|^[@#)\]}])"
        R"(|^[A-Za-z_][\w.]*(\[[^\]]*\])?([ \t]*,[ \t]*[A-Za-z_][\w.]*)*[ \t]*(=|\+=|-=|\*=|/=|//=|%=|\|=|&=)(?!=))"
        R"(|^[A-Za-z_][\w.]*\(.*\)[ \t]*$)");
    return boost::regex_search(boost::trim_right_copy(line), code_line);
}

/**
 * @brief 从第 start 行开始截取代码
 * 向前包含紧邻的 import、from 和装饰器行，向后遇到第一个没有缩进的自然语言行为止
 */
static string take_code_from(const vector<string> &lines, size_t start) {
    static const boost::regex prelude(R"(^(import|from)[ \t]|^@)");

    size_t begin = start;
    for (size_t k = start; k-- > 0;) {
        if (is_blank(lines[k])) continue;
        if (!boost::regex_search(lines[k], prelude)) break;
        begin = k;
    }

    size_t end = start + 1;
    for (; end < lines.size(); ++end) {
        const string &line = lines[end];
        if (is_blank(line) || indentation(line) > 0) continue;
        if (!looks_like_code(line)) break;
    }
    return normalize_code(join_lines(lines.begin() + begin, lines.begin() + end));
}

/**
 * @brief 在原始文本中找到匹配 pattern 的行，并截取代码
 * 若匹配的行有缩进（类中的方法），从外层没有缩进的 class 行开始截取
 */
static optional<string> scan_definition(const string &raw, const boost::regex &pattern) {
    static const boost::regex class_line(R"(^class[ \t]+[A-Za-z_])");

    vector<string> lines = split_lines(raw);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!boost::regex_search(lines[i], pattern)) continue;
        size_t start = i;
        if (indentation(lines[i]) > 0) {
            size_t k = i;
            while (k > 0 && (is_blank(lines[k]) || indentation(lines[k]) > 0)) --k;
            if (!boost::regex_search(lines[k], class_line)) continue;
            start = k;
        }
        return take_code_from(lines, start);
    }
    return {};
}

static bool is_python_info(const string &info) {
    if (info.empty()) return true;
    string lang = boost::to_lower_copy(info.substr(0, info.find_first_of(" \t{")));
    return lang == "python" || lang == "py" || lang == "python3";
}

extraction_result extract_code(const string &raw, const string &entry_point, task_kind kind) {
    extraction_result result;
    if (is_blank(raw)) return result;

    vector<fenced_block> blocks = find_fenced_blocks(raw);

    if (is_identifier(entry_point)) {
        for (const fenced_block &block : blocks) {
            if (defines_symbol(block.body, entry_point)) {
                result.code = normalize_code(block.body);
                result.policy = extraction_policy::FENCED_ENTRY_POINT;
                return result;
            }
        }

        // 原始文本中优先匹配题目类型对应的定义形式，再匹配另一种形式
        boost::regex primary = kind == task_kind::CLASS ? class_definition(entry_point) : function_definition(entry_point);
        boost::regex secondary = kind == task_kind::CLASS ? function_definition(entry_point) : class_definition(entry_point);
        for (const boost::regex *pattern : {&primary, &secondary}) {
            if (auto code = scan_definition(raw, *pattern)) {
                result.code = code;
                result.policy = extraction_policy::ENTRY_POINT_SCAN;
                return result;
            }
        }
    }

    for (const fenced_block &block : blocks) {
        if (!is_python_info(block.info)) continue;
        vector<string> lines = split_lines(normalize_code(block.body));
        bool has_code = any_of(lines.begin(), lines.end(), [](const string &line) {
            return !is_blank(line) && looks_like_code(boost::trim_left_copy(line));
        });
        if (has_code) {
            result.code = normalize_code(block.body);
            result.policy = extraction_policy::FIRST_FENCED_BLOCK;
            return result;
        }
    }

    static const boost::regex any_definition(R"(^(async[ \t]+)?def[ \t]+[A-Za-z_]\w*[ \t]*\(|^class[ \t]+[A-Za-z_])");
    if (auto code = scan_definition(raw, any_definition)) {
        result.code = code;
        result.policy = extraction_policy::DEFINITION_SCAN;
        return result;
    }

    DLOG(INFO) << "No code found in response of " << raw.size() << " bytes";
    return result;
}

}  // namespace codebench
