#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace boxjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 提交使用了没有配置的语言
 * 这个错误发生在任何沙箱工作开始之前，整个提交将被拒绝
 */
struct unsupported_language : public judge_exception {
    explicit unsupported_language(const std::string &language);

    /**
     * @brief 提交所使用的语言 id
     */
    std::string language;
};

/**
 * @brief 容器运行时无法访问，或者拒绝了要求的资源限制
 * 遇到这个错误时不允许降级为不带限制运行，只会把对应测试点标记为运行时错误
 */
struct sandbox_creation_error : public judge_exception {
    sandbox_creation_error();
    explicit sandbox_creation_error(const std::string &message);
};

/**
 * @brief 销毁沙箱失败
 * 只会被记录到日志中，不会让评测失败
 */
struct sandbox_teardown_error : public judge_exception {
    sandbox_teardown_error();
    explicit sandbox_teardown_error(const std::string &message);
};

/**
 * @brief 容器运行时的命令行工具无法执行，或者在期限内没有返回
 */
struct runtime_unavailable : public judge_exception {
    runtime_unavailable();
    explicit runtime_unavailable(const std::string &message);
};

/**
 * @brief 题目数据源中找不到提交所对应的题目
 */
struct problem_not_found : public judge_exception {
    explicit problem_not_found(const std::string &prob_id);

    std::string prob_id;
};

}  // namespace boxjudge
