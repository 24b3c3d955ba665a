#include "judge/report.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <system_error>
#include "common/exceptions.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

report_writer::report_writer(const filesystem::path &path) : path(path) {
    try {
        if (path.has_parent_path()) filesystem::create_directories(path.parent_path());
        lock = lock_file_exclusive(path);
    } catch (filesystem::filesystem_error &e) {
        throw report_io_error("Unable to create report directory for " + path.string() + ": " + e.what());
    } catch (system_error &e) {
        throw report_io_error("Unable to lock report " + path.string() + ": " + e.what());
    }
    load();
    open_for_append();
}

void report_writer::load() {
    error_code ec;
    if (!filesystem::exists(path, ec)) return;

    string content = read_file_content(path);
    size_t complete = content.rfind('\n');
    complete = complete == string::npos ? 0 : complete + 1;
    if (complete < content.size()) {
        // 上次评测在写入最后一行时被中断，截断不完整的行
        LOG(WARNING) << "Truncating incomplete last line of report " << path.string();
        filesystem::resize_file(path, complete, ec);
        if (ec) throw report_io_error("Unable to truncate report " + path.string() + ": " + ec.message());
        content.resize(complete);
    }

    size_t begin = 0;
    while (begin < content.size()) {
        size_t end = content.find('\n', begin);
        string line = content.substr(begin, end - begin);
        begin = end + 1;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        optional<pair_key> key;
        try {
            evaluation_record record = json::parse(line).get<evaluation_record>();
            key = pair_key(record.task_id, record.model);
            if (pairs.insert(*key).second) records.push_back(move(record));
        } catch (json::exception &e) {
            LOG(WARNING) << "Keeping unparsable report line as is: " << e.what();
        } catch (logic_error &e) {
            LOG(WARNING) << "Keeping invalid report line as is: " << e.what();
        }
        lines.push_back(line);
        line_keys.push_back(key);
    }
    LOG(INFO) << "Report " << path.string() << " already contains " << pairs.size() << " evaluated pairs";
}

void report_writer::open_for_append() {
    if (out.is_open()) out.close();
    out.clear();
    out.open(path, ios::out | ios::app | ios::binary);
    if (!out) throw report_io_error("Unable to open report " + path.string());
}

const set<pair_key> &report_writer::existing_pairs() const {
    return pairs;
}

const vector<evaluation_record> &report_writer::existing_records() const {
    return records;
}

void report_writer::discard(const set<pair_key> &discarded) {
    bool affected = false;
    for (const pair_key &key : discarded)
        if (pairs.count(key)) affected = true;
    if (!affected) return;

    vector<string> kept_lines;
    vector<optional<pair_key>> kept_keys;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (line_keys[i] && discarded.count(*line_keys[i])) continue;
        kept_lines.push_back(lines[i]);
        kept_keys.push_back(line_keys[i]);
    }

    filesystem::path temp = path;
    temp += ".tmp";
    {
        ofstream fout(temp, ios::out | ios::trunc | ios::binary);
        for (const string &line : kept_lines) fout << line << '\n';
        fout.flush();
        if (!fout) throw report_io_error("Unable to write temporary report " + temp.string());
    }

    out.close();
    error_code ec;
    filesystem::rename(temp, path, ec);
    if (ec) throw report_io_error("Unable to replace report " + path.string() + ": " + ec.message());

    size_t removed = lines.size() - kept_lines.size();
    lines = move(kept_lines);
    line_keys = move(kept_keys);
    for (const pair_key &key : discarded) pairs.erase(key);
    records.erase(remove_if(records.begin(), records.end(), [&](const evaluation_record &record) {
                      return discarded.count(pair_key(record.task_id, record.model)) > 0;
                  }),
                  records.end());
    LOG(INFO) << "Removed " << removed << " lines from report " << path.string() << " for re-evaluation";

    open_for_append();
}

void report_writer::write(const evaluation_record &record) {
    string line = json(record).dump(-1, ' ', false, json::error_handler_t::replace);
    out << line << '\n';
    out.flush();
    if (!out) throw report_io_error("Unable to write report " + path.string());

    pair_key key(record.task_id, record.model);
    pairs.insert(key);
    lines.push_back(line);
    line_keys.push_back(key);
}

}  // namespace codebench
