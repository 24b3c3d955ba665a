#include "judge/runner.hpp"
#include <signal.h>
#include <string.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace codebench {
using namespace std;
using namespace nlohmann;

sandbox_options make_sandbox_options(const sandbox_config &config) {
    sandbox_options opt;
    opt.command = {PYTHON_EXECUTABLE, HARNESS_FILE};
    opt.env = {
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONIOENCODING=utf-8",
        "PYTHONHASHSEED=0",
        "LANG=C.UTF-8"};
    opt.wall_limit = config.time_limit;
    opt.cpu_limit = config.time_limit;
    opt.memory_limit = config.memory_limit * 1024;
    opt.file_limit = config.file_limit * 1024;
    opt.nproc = config.proc_limit;
    opt.stream_size = config.stream_size * 1024;
    opt.isolate_network = config.isolate_network;
    return opt;
}

execution_outcome classify(const sandbox_result &result, const json &harness_result) {
    execution_outcome outcome;
    outcome.duration = result.wall_time;
    outcome.stdout_excerpt = result.stdout_data;
    outcome.stderr_excerpt = result.stderr_data;

    if (result.timed_out) {
        outcome.result = status::TIMEOUT;
        outcome.message = fmt::format("wall time limit exceeded after {:.2f}s", result.wall_time);
        return outcome;
    }
    if (result.signal == SIGXCPU) {
        outcome.result = status::TIMEOUT;
        outcome.message = "cpu time limit exceeded";
        return outcome;
    }

    string reported = get_value_def<string>(harness_result, "", "status");
    string error_class = get_value_def<string>(harness_result, "", "error_class");
    string message = get_value_def<string>(harness_result, "", "message");
    string resource = get_value_def<string>(harness_result, "", "resource");

    if (reported == "pass" && result.exitcode == E_PASS) {
        outcome.result = status::PASS;
        return outcome;
    }
    if (reported == "fail" && result.exitcode == E_FAIL) {
        outcome.result = status::FAIL;
        outcome.error_class = error_class.empty() ? "AssertionError" : error_class;
        outcome.message = message;
        return outcome;
    }
    if (reported == "error" && result.exitcode == E_ERROR) {
        outcome.result = status::ERROR;
        outcome.error_class = error_class.empty() ? "Exception" : error_class;
        outcome.message = message;
        outcome.resource = resource;
        // 进程数超限时 fork 失败，Python 抛出 BlockingIOError
        if (resource.empty() && error_class == "BlockingIOError") outcome.resource = "processes";
        return outcome;
    }

    // 评测脚本没有正常结束：被信号杀死、直接调用了 os._exit 或者结果文件和返回值不一致
    outcome.result = status::ERROR;
    if (result.signal == SIGXFSZ) {
        outcome.error_class = "resource_limit";
        outcome.resource = "file_size";
        outcome.message = "file size limit exceeded";
    } else if (result.signal == SIGSEGV || result.signal == SIGKILL || result.signal == SIGBUS) {
        outcome.error_class = "resource_limit";
        outcome.resource = "memory";
        outcome.message = fmt::format("killed by signal {} ({})", result.signal, strsignal(result.signal));
    } else if (!reported.empty()) {
        outcome.error_class = "inconsistent_result";
        outcome.message = fmt::format("harness reported {} but exited with code {}", reported, result.exitcode);
    } else if (result.stdout_truncated || result.stderr_truncated) {
        outcome.error_class = "resource_limit";
        outcome.resource = "output";
        outcome.message = fmt::format("output limit exceeded, exited with code {}", result.exitcode);
    } else if (result.signal > 0) {
        outcome.error_class = "no_result";
        outcome.message = fmt::format("killed by signal {} ({})", result.signal, strsignal(result.signal));
    } else {
        outcome.error_class = "no_result";
        outcome.message = fmt::format("harness exited with code {} without a result", result.exitcode);
    }
    return outcome;
}

static json read_harness_result(const filesystem::path &path) {
    string content = read_file_content(path, "");
    if (content.empty()) return {};
    try {
        return json::parse(content);
    } catch (json::exception &e) {
        LOG(WARNING) << "Malformed harness result " << path.string() << ": " << e.what();
        return {};
    }
}

execution_outcome run_unit(const executable_unit &unit, const sandbox_config &config) {
    static thread_local boost::uuids::random_generator uuid_generator;

    filesystem::path run_dir = RUN_DIR / boost::uuids::to_string(uuid_generator());
    filesystem::create_directories(run_dir);
    defer {
        if (DEBUG) return;
        error_code ec;
        filesystem::remove_all(run_dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove run directory " << run_dir.string() << ": " << ec.message();
    };

    for (auto &[name, content] : unit.files)
        write_file_content(run_dir / assert_safe_path(name), content);

    sandbox_options opt = make_sandbox_options(config);
    opt.command.back() = unit.entry_script;
    opt.work_dir = run_dir;

    sandbox_result result = run_sandboxed(opt);
    if (result.interrupted) throw interrupted_error();

    execution_outcome outcome = classify(result, read_harness_result(run_dir / RESULT_FILE));
    DLOG(INFO) << "Run " << run_dir.filename().string() << " finished with " << to_string(outcome.result)
               << " in " << result.wall_time << "s, exit code " << result.exitcode;
    return outcome;
}

}  // namespace codebench
