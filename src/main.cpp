#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include "analysis/coverage.hpp"
#include "analysis/difficulty.hpp"
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "dataset/task.hpp"
#include "judge/adapter.hpp"
#include "judge/evaluator.hpp"
using namespace std;
namespace po = boost::program_options;

void stopHandler(int) {
    // 信号处理函数中只能调用异步信号安全的函数
    static const char message[] = "Received stop signal, stopping evaluation\n";
    ssize_t written = write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)written;
    codebench::stop_evaluation();
}

template <typename T>
bool override_option(const po::variables_map &vm, const string &option, const string &env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
        return true;
    } else if (getenv(env.c_str())) {
        target = boost::lexical_cast<T>(getenv(env.c_str()));
        return true;
    }
    return false;
}

vector<codebench::benchmark_task> load_dataset(const po::variables_map &vm) {
    if (!vm.count("dataset")) {
        cerr << "--dataset is required" << endl;
        exit(EXIT_FAILURE);
    }
    string path = vm.at("dataset").as<string>();
    try {
        return codebench::load_tasks(path);
    } catch (system_error &e) {
        LOG(FATAL) << "Unable to read dataset " << path << ": " << e.what();
    }
    return {};
}

int run_evaluate(const po::variables_map &vm, const codebench::configuration &config) {
    vector<codebench::benchmark_task> tasks = load_dataset(vm);
    if (!vm.count("responses") || !vm.count("report")) {
        cerr << "evaluate requires --responses and --report" << endl;
        return EXIT_FAILURE;
    }

    string responses_path = vm.at("responses").as<string>();
    vector<codebench::model_response> responses;
    try {
        responses = codebench::load_responses(responses_path);
    } catch (system_error &e) {
        LOG(FATAL) << "Unable to read model responses " << responses_path << ": " << e.what();
    }

    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);

    codebench::pass_rate_table table;
    try {
        table = codebench::run_evaluation(tasks, responses, config.evaluation, vm.at("report").as<string>());
    } catch (codebench::report_io_error &e) {
        LOG(FATAL) << "Evaluation report is lost, " << e.what() << endl
                   << boost::diagnostic_information(e);
    }

    codebench::print_summary(cout, table);
    return codebench::evaluation_stopped() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int run_difficulty(const po::variables_map &vm, const codebench::configuration &config) {
    vector<codebench::benchmark_task> tasks = load_dataset(vm);

    vector<codebench::difficulty_row> rows;
    for (auto &task : tasks)
        rows.push_back(codebench::analyze_difficulty(task, config.difficulty));

    if (vm.count("out")) {
        string out = vm.at("out").as<string>();
        ofstream fout(out);
        codebench::write_difficulty_csv(fout, rows);
        if (!fout) LOG(FATAL) << "Unable to write difficulty report " << out;
        LOG(INFO) << "Difficulty report of " << rows.size() << " tasks written to " << out;
    } else {
        codebench::write_difficulty_csv(cout, rows);
    }
    return EXIT_SUCCESS;
}

int run_coverage(const po::variables_map &vm, const codebench::configuration &config) {
    vector<codebench::benchmark_task> tasks = load_dataset(vm);

    unique_ptr<codebench::coverage_analyzer> analyzer;
    try {
        analyzer = make_unique<codebench::coverage_analyzer>(config.coverage);
    } catch (codebench::config_error &e) {
        LOG(FATAL) << e.what();
    }

    vector<codebench::coverage_profile> profiles;
    for (auto &task : tasks)
        profiles.push_back(analyzer->analyze(task));

    if (vm.count("out")) {
        string out = vm.at("out").as<string>();
        ofstream fout(out);
        analyzer->write_csv(fout, profiles);
        if (!fout) LOG(FATAL) << "Unable to write coverage report " << out;
        cout << "CSV written: " << out << endl;
    }
    if (vm.count("markdown")) {
        string markdown = vm.at("markdown").as<string>();
        ofstream fout(markdown);
        analyzer->write_markdown(fout, profiles);
        if (!fout) LOG(FATAL) << "Unable to write coverage gap report " << markdown;
        cout << "Markdown written: " << markdown << endl;
    }
    if (vm.count("summary") || (!vm.count("out") && !vm.count("markdown")))
        analyzer->print_summary(cout, profiles);
    return EXIT_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("codebench options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "evaluate, difficulty or coverage")
        ("config", po::value<string>(), "load configuration from the given JSON file")
        ("dataset", po::value<string>(), "benchmark tasks in JSONL")
        ("responses", po::value<string>(), "evaluate: model responses in JSONL")
        ("report", po::value<string>(), "evaluate: JSONL evaluation report, appended and resumed")
        ("out", po::value<string>(), "difficulty, coverage: write CSV report here, default to stdout for difficulty")
        ("markdown", po::value<string>(), "coverage: write Markdown gap report here")
        ("summary", "coverage: print summary to stdout")
        ("categories", po::value<string>(), "coverage: comma separated categories to detect, default to all")
        ("workers", po::value<size_t>(), "number of pairs evaluated concurrently. You can either pass it from environ WORKERS")
        ("timeout", po::value<double>(), "wall time limit in seconds for each run")
        ("memory-limit", po::value<size_t>(), "address space limit in KB for each run, 0 for unlimited")
        ("file-limit", po::value<size_t>(), "file size limit in KB for each run, 0 for unlimited")
        ("proc-limit", po::value<size_t>(), "process limit for each run, 0 for unlimited")
        ("stream-size", po::value<size_t>(), "bytes in KB of stdout and stderr kept for each run")
        ("no-network-isolation", "do not move runs into a new network namespace")
        ("voting", "run each pair several times and take the majority status")
        ("trials", po::value<size_t>(), "number of runs per pair when voting")
        ("resume", po::value<string>(), "skip or overwrite pairs already in the report, default to skip")
        ("python", po::value<string>(), "python interpreter running the candidates. You can either pass it from environ PYTHON")
        ("run-dir", po::value<string>(), "set the directory to run candidates. You can either pass it from environ RUNDIR")
        ("debug", "turn on the debug mode to keep run directories for inspecting generated harnesses")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    po::positional_options_description positional;
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codebench: evaluate LLM generated code against benchmark tests, analyze task difficulty and test coverage" << endl
             << "Usage: " << argv[0] << " <evaluate|difficulty|coverage> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codebench 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("command")) {
        cerr << "No command given" << endl
             << endl
             << desc << endl;
        return EXIT_FAILURE;
    }
    string command = vm.at("command").as<string>();
    if (command != "evaluate" && command != "difficulty" && command != "coverage") {
        cerr << "Unrecognized command " << command << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || getenv("DEBUG"))
        codebench::DEBUG = true;

    codebench::configuration config;
    try {
        if (vm.count("config"))
            config = codebench::load_configuration(vm.at("config").as<string>());

        auto &eval = config.evaluation;
        override_option(vm, "workers", "WORKERS", eval.workers);
        override_option(vm, "timeout", "TIMEOUT", eval.sandbox.time_limit);
        override_option(vm, "memory-limit", "MEMLIMIT", eval.sandbox.memory_limit);
        override_option(vm, "file-limit", "FILELIMIT", eval.sandbox.file_limit);
        override_option(vm, "proc-limit", "PROCLIMIT", eval.sandbox.proc_limit);
        override_option(vm, "stream-size", "STREAMSIZE", eval.sandbox.stream_size);
        override_option(vm, "trials", "TRIALS", eval.trials);
        if (vm.count("voting")) eval.voting = true;
        if (vm.count("no-network-isolation")) eval.sandbox.isolate_network = false;

        string resume;
        if (override_option(vm, "resume", "RESUME", resume)) {
            if (resume == "skip")
                eval.resume = codebench::resume_mode::SKIP;
            else if (resume == "overwrite")
                eval.resume = codebench::resume_mode::OVERWRITE;
            else
                throw codebench::config_error("Unrecognized resume mode " + resume);
        }

        if (vm.count("categories")) {
            vector<string> categories;
            boost::split(categories, vm.at("categories").as<string>(), boost::is_any_of(","), boost::token_compress_on);
            categories.erase(remove(categories.begin(), categories.end(), ""), categories.end());
            config.coverage.categories = categories;
        }

        codebench::validate_configuration(config);
    } catch (codebench::config_error &e) {
        LOG(FATAL) << e.what();
    } catch (boost::bad_lexical_cast &e) {
        LOG(FATAL) << "Malformed environment variable: " << e.what();
    }

    override_option(vm, "python", "PYTHON", codebench::PYTHON_EXECUTABLE);

    if (vm.count("run-dir")) {
        codebench::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        codebench::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    } else {
        codebench::RUN_DIR = filesystem::temp_directory_path() / "codebench";
    }
    if (command == "evaluate") {
        error_code ec;
        filesystem::create_directories(codebench::RUN_DIR, ec);
        CHECK(filesystem::is_directory(codebench::RUN_DIR))
            << "Run directory " << codebench::RUN_DIR << " does not exist";
    }

    // 候选代码写出的文件只允许当前用户写入
    umask(0022);

    codebench::python_interpreter interpreter;
    codebench::register_default_adapters();

    if (command == "evaluate")
        return run_evaluate(vm, config);
    else if (command == "difficulty")
        return run_difficulty(vm, config);
    else
        return run_coverage(vm, config);
}
