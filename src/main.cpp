#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/classifier.hpp"
#include "sandbox/grader.hpp"
#include "sandbox/runner.hpp"
using namespace std;
using namespace sandbox;
using nlohmann::json;

static int get_exit_code(const status &stat) {
    return visit(overloaded{
                     [](const outcome::success &) { return (int)E_SUCCESS; },
                     [](const outcome::runtime_error &) { return (int)E_RUNTIME_ERROR; },
                     [](const outcome::timeout &) { return (int)E_TIME_LIMIT; },
                     [](const outcome::memory_exceeded &) { return (int)E_MEM_LIMIT; },
                     [](const outcome::resource_denied &) { return (int)E_RESOURCE_DENIED; },
                     [](const outcome::output_truncated &) { return (int)E_OUTPUT_LIMIT; },
                     [](const outcome::internal_error &) { return (int)E_INTERNAL_ERROR; },
                 },
                 stat);
}

/**
 * @brief 读取文件内容，"-" 表示标准输入
 */
static string read_input(const string &path) {
    if (path == "-") return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return read_file_content(path);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 标准输出只用于输出 JSON 结果
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("pysandbox options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("source,s", po::value<string>(), "Python source file to run, - for standard input")
        ("stdin-file,i", po::value<string>(), "file passed to the program as standard input")
        ("timeout,t", po::value<double>(), "wall clock and CPU time limit in seconds. You can either pass it from environ SANDBOX_TIMEOUT")
        ("memory-limit,m", po::value<string>(), "address space limit in bytes, accepts K/M/G suffix. You can either pass it from environ SANDBOX_MEMORY_LIMIT")
        ("config,c", po::value<string>(), "JSON configuration file. You can either pass it from environ SANDBOX_CONFIG")
        ("python", po::value<string>(), "Python interpreter running the submission. You can either pass it from environ SANDBOX_PYTHON")
        ("scratch-root", po::value<string>(), "directory to create scratch directories in. You can either pass it from environ SANDBOX_SCRATCH_ROOT")
        ("validate-only", "only run the static validator and print the verdict")
        ("tests", po::value<string>(), "JSON file with an array of test cases, print the grading report")
        ("limits", "print the effective limits and exit")
        ("verbose,v", "log informational messages to stderr")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("source", 1);

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
        return E_INTERNAL_ERROR;
    }

    if (vm.count("help")) {
        cout << "pysandbox: validate and run untrusted Python code under resource limits" << endl
             << "Usage: " << argv[0] << " [options] [source]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "pysandbox 1.0" << endl;
        return E_SUCCESS;
    }

    FLAGS_minloglevel = vm.count("verbose") ? google::GLOG_INFO : google::GLOG_WARNING;

    sandbox_config config;
    try {
        string config_path = vm.count("config") ? vm.at("config").as<string>() : get_env("SANDBOX_CONFIG", "");
        if (!config_path.empty()) config = load_config(config_path);

        if (vm.count("python")) {
            config.python_executable = vm.at("python").as<string>();
        } else if (getenv("SANDBOX_PYTHON")) {
            config.python_executable = getenv("SANDBOX_PYTHON");
        }

        if (vm.count("scratch-root")) {
            config.scratch_root = vm.at("scratch-root").as<string>();
        } else if (getenv("SANDBOX_SCRATCH_ROOT")) {
            config.scratch_root = getenv("SANDBOX_SCRATCH_ROOT");
        }

        // 命令行的使用者就是部署者，因此命令行指定的限制同时作为上限
        if (vm.count("timeout")) {
            config.default_timeout_seconds = vm.at("timeout").as<double>();
        } else if (getenv("SANDBOX_TIMEOUT")) {
            config.default_timeout_seconds = boost::lexical_cast<double>(getenv("SANDBOX_TIMEOUT"));
        }

        if (vm.count("memory-limit")) {
            config.default_memory_limit_bytes = parse_size(vm.at("memory-limit").as<string>());
        } else if (getenv("SANDBOX_MEMORY_LIMIT")) {
            config.default_memory_limit_bytes = parse_size(getenv("SANDBOX_MEMORY_LIMIT"));
        }

        config = finalize_config(config);
    } catch (std::exception &e) {
        cerr << "invalid configuration: " << e.what() << endl;
        return E_INTERNAL_ERROR;
    }

    submission_request request;
    request.timeout_seconds = config.default_timeout_seconds;
    request.memory_limit_bytes = config.default_memory_limit_bytes;

    try {
        runner pipeline(config);

        if (vm.count("limits")) {
            cout << json(pipeline.effective_limits(request)).dump(4) << endl;
            return E_SUCCESS;
        }

        if (!vm.count("source")) {
            cerr << "no source file given" << endl
                 << endl;
            cerr << desc << endl;
            return E_INTERNAL_ERROR;
        }
        request.source_code = read_input(vm.at("source").as<string>());
        if (vm.count("stdin-file"))
            request.stdin_data = read_input(vm.at("stdin-file").as<string>());

        if (vm.count("validate-only")) {
            validation_verdict verdict = pipeline.check(request.source_code);
            cout << json(verdict).dump(4) << endl;
            return verdict.allowed ? E_SUCCESS : get_exit_code(classify(verdict).status);
        }

        if (vm.count("tests")) {
            json j = json::parse(read_file_content(vm.at("tests").as<string>()));
            vector<test_case> test_cases = j.get<vector<test_case>>();
            grader g(pipeline);
            grading_report report = g.grade(request, test_cases);
            cout << json(report).dump(4) << endl;
            return report.passed_count == report.total_count && report.total_count > 0 ? E_ACCEPTED : E_WRONG_ANSWER;
        }

        result res = pipeline.run(request);
        cout << json(res).dump(4) << endl;
        return get_exit_code(res.status);
    } catch (std::exception &e) {
        LOG(ERROR) << "pysandbox failed: " << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return E_INTERNAL_ERROR;
    }
}
