#include <glog/logging.h>
#include <signal.h>
#include <sys/stat.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include "common/cancellation.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/judger.hpp"
#include "judge/language.hpp"
#include "judge/verdict.hpp"
#include "monitor/monitor.hpp"
#include "sandbox/docker.hpp"
#include "server/problem_store.hpp"
#include "server/service.hpp"
using namespace std;

boxjudge::cancellation_token cancellation;

void sigintHandler(int /* signum */) {
    // 信号处理函数中只做原子写入，评测线程轮询取消标记后销毁沙箱
    cancellation.cancel();
}

/**
 * @brief 读取配置项，命令行参数优先，其次是环境变量，都没有时保持默认值
 */
template <typename T>
static void load_option(const boost::program_options::variables_map& vm, const char* option, const char* env, T& target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else {
        string value = boxjudge::get_env(env, "");
        if (value.empty()) return;
        try {
            target = boost::lexical_cast<T>(value);
        } catch (boost::bad_lexical_cast&) {
            LOG(FATAL) << "Environment variable " << env << " is malformed: " << value;
        }
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 不设置 SA_RESTART，使阻塞在标准输入上的读取被 SIGINT 打断，服务循环随之结束
    struct sigaction action = {};
    action.sa_handler = sigintHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    // docker 命令行工具提前退出时，向它的标准输入写入数据不应该杀死评测系统
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("boxjudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("languages", po::value<string>(), "set the language configuration file, built-in python and cpp are used if absent. You can either pass it from environ LANGUAGES")
        ("problem-dir", po::value<string>(), "set the directory containing <problemId>.json test data. You can either pass it from environ PROBLEMDIR")
        ("run-dir", po::value<string>(), "set the directory to store submission sources and sandbox workspaces. You can either pass it from environ RUNDIR")
        ("workers", po::value<size_t>(), "set the maximum number of sandboxes running at the same time for one submission, default to 4. You can either pass it from environ JUDGEWORKERS")
        ("docker", po::value<string>(), "set the docker executable, default to docker. You can either pass it from environ DOCKER")
        ("max-processes", po::value<int>(), "set the process limit of each sandbox, default to 64. You can either pass it from environ MAXPROCESSES")
        ("cpus", po::value<double>(), "set the number of cpus each sandbox can use, default to 1. You can either pass it from environ SANDBOXCPUS")
        ("compile-time-limit", po::value<int>(), "set time limit in milliseconds for compilation, default to 10000. You can either pass it from environ COMPILETIMELIMIT")
        ("compile-memory-limit", po::value<int64_t>(), "set memory limit in bytes for compilation, default to 536870912(512MB). You can either pass it from environ COMPILEMEMLIMIT")
        ("cleanup-timeout", po::value<int>(), "set time limit in milliseconds for tearing down a sandbox, default to 10000. You can either pass it from environ CLEANUPTIMEOUT")
        ("runtime-timeout", po::value<int>(), "set time limit in milliseconds for creating and inspecting a sandbox, default to 30000. You can either pass it from environ RUNTIMETIMEOUT")
        ("sample-interval", po::value<int>(), "set memory sampling interval in milliseconds, default to 50. You can either pass it from environ SAMPLEINTERVAL")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of captured stdout and stderr, default to 67108864(64MB). You can either pass it from environ OUTPUTLIMIT")
        ("severity", po::value<string>(), "set the severity order of results, most severe first, separated by comma. You can either pass it from environ SEVERITY")
        ("request", po::value<string>(), "judge the request stored in this file, otherwise read requests line by line from stdin")
        ("debug", "turn on the debug mode to keep submission directories to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "boxjudge: Judge submissions in isolated docker sandboxes" << endl
             << "Requests are read from --request or stdin, one JSON object per line" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "boxjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || !boxjudge::get_env("DEBUG", "").empty()) {
        boxjudge::DEBUG = true;
    }

    string run_dir = boxjudge::RUN_DIR.string();
    load_option(vm, "run-dir", "RUNDIR", run_dir);
    boxjudge::RUN_DIR = run_dir;
    filesystem::create_directories(boxjudge::RUN_DIR);
    CHECK(filesystem::is_directory(boxjudge::RUN_DIR))
        << "Run directory " << boxjudge::RUN_DIR << " does not exist";

    load_option(vm, "docker", "DOCKER", boxjudge::DOCKER_BIN);
    load_option(vm, "workers", "JUDGEWORKERS", boxjudge::MAX_WORKERS);
    load_option(vm, "max-processes", "MAXPROCESSES", boxjudge::MAX_PROCESSES);
    load_option(vm, "cpus", "SANDBOXCPUS", boxjudge::SANDBOX_CPUS);
    load_option(vm, "compile-time-limit", "COMPILETIMELIMIT", boxjudge::COMPILE_TIME_LIMIT);
    load_option(vm, "compile-memory-limit", "COMPILEMEMLIMIT", boxjudge::COMPILE_MEMORY_LIMIT);
    load_option(vm, "cleanup-timeout", "CLEANUPTIMEOUT", boxjudge::CLEANUP_TIMEOUT);
    load_option(vm, "runtime-timeout", "RUNTIMETIMEOUT", boxjudge::RUNTIME_CALL_TIMEOUT);
    load_option(vm, "sample-interval", "SAMPLEINTERVAL", boxjudge::SAMPLE_INTERVAL);
    load_option(vm, "output-limit", "OUTPUTLIMIT", boxjudge::OUTPUT_LIMIT);

    CHECK(boxjudge::MAX_WORKERS > 0) << "At least one worker is required";
    CHECK(boxjudge::SAMPLE_INTERVAL > 0) << "Sample interval should be positive";

    string problem_dir;
    load_option(vm, "problem-dir", "PROBLEMDIR", problem_dir);
    CHECK(!problem_dir.empty() && filesystem::is_directory(problem_dir))
        << "Problem directory " << problem_dir << " does not exist";

    string languages_path;
    load_option(vm, "languages", "LANGUAGES", languages_path);
    unique_ptr<boxjudge::language_registry> languages;
    try {
        if (languages_path.empty())
            languages = make_unique<boxjudge::language_registry>(boxjudge::language_registry::builtin());
        else
            languages = make_unique<boxjudge::language_registry>(boxjudge::language_registry::load(languages_path));
    } catch (std::exception& e) {
        LOG(FATAL) << "Language configuration " << languages_path << " is malformed: " << e.what();
    }

    string severity;
    load_option(vm, "severity", "SEVERITY", severity);
    boxjudge::severity_policy policy = boxjudge::severity_policy::standard();
    if (!severity.empty()) {
        try {
            policy = boxjudge::severity_policy::parse(severity);
        } catch (std::invalid_argument& e) {
            LOG(FATAL) << "Severity order " << severity << " is malformed: " << e.what();
        }
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    boxjudge::docker_runtime runtime(boxjudge::DOCKER_BIN);
    boxjudge::logging_monitor logger;
    boxjudge::judger judger(*languages, runtime, policy, {&logger});
    boxjudge::server::local_problem_store problems(problem_dir);
    boxjudge::server::judge_service service(*languages, problems, judger);

    if (vm.count("request")) {
        filesystem::path request_path = vm.at("request").as<string>();
        CHECK(filesystem::is_regular_file(request_path))
            << "Request file " << request_path << " does not exist";
        cout << service.handle(boxjudge::read_file_content(request_path), &cancellation).dump() << endl;
    } else {
        size_t handled = service.serve(cin, cout, &cancellation);
        LOG(INFO) << "Handled " << handled << " request(s)";
    }

    if (cancellation.cancelled()) {
        LOG(ERROR) << "Received SIGINT, stopped judging";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
