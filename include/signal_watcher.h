#pragma once
#include <chrono>
#include <signal.h>
#include <vector>

namespace tickhive
{

// 进程信号监听
// 构造时安装信号处理函数，析构时恢复原来的处理函数
// 同一时间只能存在一个 SignalWatcher，第二个构造时抛出 std::logic_error
class SignalWatcher
{
public:
    // 安装失败抛出 std::system_error
    explicit SignalWatcher(std::vector<int> signals = {SIGINT, SIGTERM});
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // 阻塞直到收到信号，返回信号值
    int wait() const;

    // 超时返回 0
    int wait_for(std::chrono::milliseconds timeout) const;

    // 已收到的信号，没有则为 0
    int received() const;

private:
    static void handle_signal(int signum);
    void restore();

    std::vector<int> signals_;
    std::vector<struct sigaction> old_actions_;
};

} // namespace tickhive
