#include <atomic>
#include <filesystem>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/judger.hpp"
#include "test/environment.hpp"
#include "test/mock_runtime.hpp"

using namespace std;
using namespace boxjudge;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::InSequence;

/**
 * @brief 模拟 python 解释器和 g++ 编译器：
 * 1. 编译命令在源代码包含 "syntax error" 时失败
 * 2. 运行命令根据源代码的内容决定行为
 */
static mock::behaviour interpreter(const mock::exec_call &call) {
    mock::behaviour b;
    string source;
    if (call.command.find("g++") == 0) {
        source = read_file_content(call.caps.workspace / "main.cpp");
        if (source.find("syntax error") != string::npos) {
            b.exit_code = 1;
            b.error = "main.cpp:1:1: error: expected unqualified-id";
        } else {
            write_file_content(call.caps.workspace / "main", "binary");
        }
        return b;
    }

    if (call.command == "./main") {
        if (!filesystem::exists(call.caps.workspace / "main")) {
            b.exit_code = 127;
            b.error = "sh: ./main: not found";
        }
        b.output = call.input;
        return b;
    }

    source = read_file_content(call.caps.workspace / "main.py");
    if (source == "while True: pass") {
        b.hang = true;
    } else if (source == "print(1/0)") {
        b.exit_code = 1;
        b.error = "ZeroDivisionError: division by zero";
    } else if (source == "x = 'a' * 10**9") {
        b.duration = chrono::milliseconds(1000);
        b.memory = 1ll << 30;
    } else if (source == "print(input())") {
        b.output = call.input;
    } else if (source == "print(int(input()) * 2)") {
        b.output = to_string(stoi(call.input) * 2) + "\n";
    }
    return b;
}

struct mock_monitor : public monitor {
    MOCK_METHOD(void, submission_state_changed, (const submission &submit, submission_state state), (override));
    MOCK_METHOD(void, test_state_changed, (const submission &submit, std::size_t index, const std::string &test_case_id, test_state state), (override));
};

class JudgerTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        MAX_WORKERS = 4;
        runtime.script = interpreter;
    }

    void TearDown() override {
        MAX_WORKERS = 4;
        if (!check_teardown) return;
        // 每个创建的沙箱都被删除恰好一次
        for (auto &[id, count] : runtime.remove_counts())
            EXPECT_EQ(count, 1) << "container " << id;
        EXPECT_EQ(runtime.remove_counts().size(), runtime.created_count());
        EXPECT_EQ(runtime.alive_count(), 0u);
    }

    language_registry languages = language_registry::builtin();
    mock::mock_container_runtime runtime;
    bool check_teardown = true;
};

TEST_F(JudgerTest, PythonAcceptedTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(int(input()) * 2)"),
                          {make_test_case("1", "21", "42\n"), make_test_case("2", "0", "0")});
    EXPECT_EQ(result.sub_id, "12340");
    EXPECT_EQ(result.result, status::ACCEPTED);
    ASSERT_EQ(result.test_results.size(), 2u);
    EXPECT_EQ(result.test_results[0].test_case_id, "1");
    EXPECT_EQ(result.test_results[0].status, status::ACCEPTED);
    EXPECT_EQ(result.test_results[1].test_case_id, "2");
    EXPECT_EQ(result.test_results[1].status, status::ACCEPTED);
    EXPECT_FALSE(result.cancelled);
    EXPECT_TRUE(result.message.empty());
}

TEST_F(JudgerTest, TrailingNewlineAcceptedTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "hello world\n\n", "hello world")});
    EXPECT_EQ(result.result, status::ACCEPTED);
}

TEST_F(JudgerTest, WrongAnswerTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "1", "1"), make_test_case("2", "2", "3")});
    EXPECT_EQ(result.result, status::WRONG_ANSWER);
    EXPECT_EQ(result.test_results[0].status, status::ACCEPTED);
    EXPECT_EQ(result.test_results[1].status, status::WRONG_ANSWER);
}

TEST_F(JudgerTest, InfiniteLoopTimeLimitExceededTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "while True: pass"),
                          {make_test_case("1", "", "", 2000)});
    EXPECT_EQ(result.result, status::TIME_LIMIT_EXCEEDED);
    ASSERT_EQ(result.test_results.size(), 1u);
    EXPECT_EQ(result.test_results[0].status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.test_results[0].run_time, 2000);
}

TEST_F(JudgerTest, RuntimeErrorTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(1/0)"),
                          {make_test_case("1", "", "")});
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    EXPECT_NE(result.test_results[0].error_log.find("ZeroDivisionError"), string::npos);
}

TEST_F(JudgerTest, MemoryLimitExceededTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "x = 'a' * 10**9"),
                          {make_test_case("1", "", "")});
    EXPECT_EQ(result.result, status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_GE(result.test_results[0].memory_used, 256ll << 20);
}

TEST_F(JudgerTest, CppAcceptedTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("cpp", "int main() { return 0; }"),
                          {make_test_case("1", "7\n", "7"), make_test_case("2", "8\n", "8")});
    EXPECT_EQ(result.result, status::ACCEPTED);
    ASSERT_EQ(result.test_results.size(), 2u);

    // 一个编译沙箱和两个运行沙箱
    EXPECT_EQ(runtime.created_count(), 3u);
    auto caps = runtime.created_constraints();
    EXPECT_EQ(caps[0].memory_limit, COMPILE_MEMORY_LIMIT);
}

TEST_F(JudgerTest, CppCompileErrorTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("cpp", "syntax error"),
                          {make_test_case("1", "", ""), make_test_case("2", "", "")});
    EXPECT_EQ(result.result, status::COMPILATION_ERROR);
    EXPECT_TRUE(result.test_results.empty());
    EXPECT_NE(result.message.find("expected unqualified-id"), string::npos);
    // 只创建了编译沙箱
    EXPECT_EQ(runtime.created_count(), 1u);
}

TEST_F(JudgerTest, UnsupportedLanguageTest) {
    judger j(languages, runtime);
    EXPECT_THROW(j.judge(make_submission("cobol", "DISPLAY 'HI'."), {make_test_case("1", "", "")}),
                 unsupported_language);
    EXPECT_EQ(runtime.created_count(), 0u);
}

TEST_F(JudgerTest, EmptyTestCasesAcceptedTest) {
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(1)"), {});
    EXPECT_EQ(result.result, status::ACCEPTED);
    EXPECT_TRUE(result.test_results.empty());
}

TEST_F(JudgerTest, SandboxCreationFailureIsolatedTest) {
    MAX_WORKERS = 1;
    runtime.fail_create_at = 2;
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "1", "1"), make_test_case("2", "2", "2"), make_test_case("3", "3", "3")});
    ASSERT_EQ(result.test_results.size(), 3u);
    EXPECT_EQ(result.test_results[0].status, status::ACCEPTED);
    EXPECT_EQ(result.test_results[1].status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.test_results[1].test_case_id, "2");
    EXPECT_EQ(result.test_results[2].status, status::ACCEPTED);
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
}

TEST_F(JudgerTest, CompileSandboxFailureTest) {
    runtime.fail_create_at = 1;
    judger j(languages, runtime);
    auto result = j.judge(make_submission("cpp", "int main() {}"),
                          {make_test_case("1", "", ""), make_test_case("2", "", "")});
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    ASSERT_EQ(result.test_results.size(), 2u);
    EXPECT_EQ(result.test_results[0].status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.test_results[1].status, status::RUNTIME_ERROR);
}

TEST_F(JudgerTest, OrderPreservedTest) {
    // 前面的测试点运行得更久，完成顺序和输入顺序相反
    runtime.script = [](const mock::exec_call &call) {
        mock::behaviour b;
        b.output = call.input;
        b.duration = chrono::milliseconds(300 - 50 * stoi(call.input));
        return b;
    };
    judger j(languages, runtime);
    vector<test_case> test_cases;
    for (int i = 0; i < 6; ++i)
        test_cases.push_back(make_test_case("case-" + to_string(i), to_string(i), to_string(i)));
    auto result = j.judge(make_submission("python", "print(input())"), test_cases);
    ASSERT_EQ(result.test_results.size(), test_cases.size());
    for (size_t i = 0; i < test_cases.size(); ++i) {
        EXPECT_EQ(result.test_results[i].test_case_id, test_cases[i].id);
        EXPECT_EQ(result.test_results[i].status, status::ACCEPTED);
    }
}

TEST_F(JudgerTest, BoundedParallelismTest) {
    MAX_WORKERS = 2;
    runtime.script = [](const mock::exec_call &call) {
        mock::behaviour b;
        b.output = call.input;
        b.duration = chrono::milliseconds(50);
        return b;
    };
    judger j(languages, runtime);
    vector<test_case> test_cases;
    for (int i = 0; i < 8; ++i)
        test_cases.push_back(make_test_case(to_string(i), "x", "x"));
    auto result = j.judge(make_submission("python", "print(input())"), test_cases);
    EXPECT_EQ(result.result, status::ACCEPTED);
    EXPECT_LE(runtime.max_alive(), 2u);
    EXPECT_EQ(runtime.created_count(), 8u);
}

TEST_F(JudgerTest, TimeLimitOnlyTerminatesItsSandboxTest) {
    runtime.script = [](const mock::exec_call &call) {
        mock::behaviour b;
        if (call.input == "loop")
            b.hang = true;
        else
            b.output = call.input;
        return b;
    };
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "loop", "", 300), make_test_case("2", "ok", "ok", 300)});
    EXPECT_EQ(result.test_results[0].status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.test_results[1].status, status::ACCEPTED);
}

TEST_F(JudgerTest, TeardownFailureIsRuntimeErrorTest) {
    runtime.fail_remove = true;
    judger j(languages, runtime);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "1", "1"), make_test_case("2", "2", "2")});
    ASSERT_EQ(result.test_results.size(), 2u);
    for (auto &verdict : result.test_results) {
        EXPECT_EQ(verdict.status, status::RUNTIME_ERROR);
        EXPECT_NE(verdict.error_log.find("Sandbox teardown failed"), string::npos);
    }
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    EXPECT_FALSE(result.cancelled);

    // 每个沙箱仍然只尝试销毁一次
    auto removes = runtime.remove_counts();
    ASSERT_EQ(removes.size(), 2u);
    for (auto &[id, count] : removes) EXPECT_EQ(count, 1) << id;
    check_teardown = false;
}

TEST_F(JudgerTest, MonitorTeardownFailureTest) {
    runtime.fail_remove = true;
    mock_monitor m;
    EXPECT_CALL(m, submission_state_changed(_, _)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::LAUNCHING));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::RUNNING));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::COMPLETED));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::EVALUATED));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::SANDBOX_ERROR));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::RELEASED));
    }
    judger j(languages, runtime, severity_policy::standard(), {&m});
    auto result = j.judge(make_submission("python", "print(input())"), {make_test_case("1", "1", "1")});
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    check_teardown = false;
}

TEST_F(JudgerTest, MonitorCancelledBeforeLaunchTest) {
    mock_monitor m;
    EXPECT_CALL(m, submission_state_changed(_, _)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::LAUNCHING));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::SANDBOX_ERROR));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::EVALUATED));
    }
    cancellation_token cancel;
    cancel.cancel();
    judger j(languages, runtime, severity_policy::standard(), {&m});
    auto result = j.judge(make_submission("python", "print(input())"), {make_test_case("1", "1", "1")}, &cancel);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    EXPECT_EQ(runtime.created_count(), 0u);
}

TEST_F(JudgerTest, CancellationTest) {
    MAX_WORKERS = 2;
    runtime.script = [](const mock::exec_call &) {
        mock::behaviour b;
        b.hang = true;
        return b;
    };
    judger j(languages, runtime);
    cancellation_token cancel;
    thread canceller([&cancel] {
        this_thread::sleep_for(chrono::milliseconds(200));
        cancel.cancel();
    });
    vector<test_case> test_cases;
    for (int i = 0; i < 5; ++i)
        test_cases.push_back(make_test_case(to_string(i), "", "", 10000));
    elapsed_time timer;
    auto result = j.judge(make_submission("python", "while True: pass"), test_cases, &cancel);
    canceller.join();

    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.test_results.size(), 5u);
    for (auto &verdict : result.test_results)
        EXPECT_EQ(verdict.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.result, status::RUNTIME_ERROR);
    // 只有开始运行的测试点创建了沙箱
    EXPECT_EQ(runtime.created_count(), 2u);
}

TEST_F(JudgerTest, CustomSeverityPolicyTest) {
    runtime.script = [](const mock::exec_call &call) {
        mock::behaviour b;
        if (call.input == "loop")
            b.hang = true;
        else
            b.exit_code = 1;
        return b;
    };
    auto policy = severity_policy::parse("COMPILE_ERROR,TIME_LIMIT_EXCEEDED,RUNTIME_ERROR,MEMORY_LIMIT_EXCEEDED,WRONG_ANSWER,ACCEPTED");
    judger j(languages, runtime, policy);
    auto result = j.judge(make_submission("python", "print(input())"),
                          {make_test_case("1", "crash", ""), make_test_case("2", "loop", "", 200)});
    EXPECT_EQ(result.result, status::TIME_LIMIT_EXCEEDED);
}

TEST_F(JudgerTest, MonitorTransitionsTest) {
    mock_monitor m;
    auto submit = make_submission("python", "print(input())");
    {
        InSequence seq;
        EXPECT_CALL(m, submission_state_changed(_, submission_state::RECEIVED));
        EXPECT_CALL(m, submission_state_changed(_, submission_state::RUNNING_TESTS));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::LAUNCHING));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::RUNNING));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::COMPLETED));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::EVALUATED));
        EXPECT_CALL(m, test_state_changed(_, 0u, "1", test_state::RELEASED));
        EXPECT_CALL(m, submission_state_changed(_, submission_state::AGGREGATED));
    }
    judger j(languages, runtime, severity_policy::standard(), {&m});
    auto result = j.judge(submit, {make_test_case("1", "1", "1")});
    EXPECT_EQ(result.result, status::ACCEPTED);
}

TEST_F(JudgerTest, MonitorCompileErrorTest) {
    mock_monitor m;
    EXPECT_CALL(m, test_state_changed(_, _, _, _)).Times(0);
    {
        InSequence seq;
        EXPECT_CALL(m, submission_state_changed(_, submission_state::RECEIVED));
        EXPECT_CALL(m, submission_state_changed(_, submission_state::COMPILING));
        EXPECT_CALL(m, submission_state_changed(_, submission_state::COMPILE_ERROR));
    }
    judger j(languages, runtime, severity_policy::standard(), {&m});
    auto result = j.judge(make_submission("cpp", "syntax error"), {make_test_case("1", "", "")});
    EXPECT_EQ(result.result, status::COMPILATION_ERROR);
}

TEST_F(JudgerTest, MonitorFailureIgnoredTest) {
    mock_monitor m;
    EXPECT_CALL(m, submission_state_changed(_, _)).Times(AnyNumber()).WillRepeatedly(::testing::Throw(runtime_error("monitor down")));
    EXPECT_CALL(m, test_state_changed(_, _, _, _)).Times(AnyNumber());
    judger j(languages, runtime, severity_policy::standard(), {&m});
    auto result = j.judge(make_submission("python", "print(input())"), {make_test_case("1", "1", "1")});
    EXPECT_EQ(result.result, status::ACCEPTED);
}

TEST_F(JudgerTest, RunDirectoryRemovedTest) {
    judger j(languages, runtime);
    j.judge(make_submission("python", "print(input())", "cleanup-check"), {make_test_case("1", "1", "1")});
    for (auto &entry : filesystem::directory_iterator(RUN_DIR))
        EXPECT_NE(entry.path().filename().string().rfind("cleanup-check-", 0), 0u) << entry.path();
}
