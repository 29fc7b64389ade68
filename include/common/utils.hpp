#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace boxjudge {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<const Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表
 * @code{.cpp}
 *     // {"docker", "kill", "<id>"}
 *     auto argv = make_arguments(docker, "kill", container_id);
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_arguments(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 外部命令的执行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值，被信号杀死时为 128 + 信号值
     */
    int exit_code = -1;

    /**
     * @brief 若外部命令被信号杀死，保存信号值，否则为 0
     */
    int signal = 0;

    /**
     * @brief 外部命令是否因为超出期限被杀死
     */
    bool timed_out = false;

    std::string output;

    std::string error;
};

/**
 * @brief 执行外部命令，喂入标准输入并收集标准输出和标准错误输出
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @note 调用方进程需要忽略 SIGPIPE，外部命令提前关闭标准输入时这里只会停止写入
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @param input 写入外部命令标准输入的内容
 * @param timeout 外部命令的最长运行时间，超时后外部命令会被 SIGKILL 杀死
 * @param output_limit 标准输出和标准错误输出各自最多保存多少字节，超出的部分被丢弃
 * @throw std::system_error 无法创建管道或者 fork 失败
 */
process_result run_process(const std::vector<std::string> &argv,
                           const std::string &input,
                           std::chrono::milliseconds timeout,
                           std::size_t output_limit);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成一个随机的 uuid 字符串，用作运行目录和容器的名字
 */
std::string random_uuid();

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace boxjudge
