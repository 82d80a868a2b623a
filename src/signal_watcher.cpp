#include "signal_watcher.h"

#include <atomic>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace tickhive
{

namespace
{
// 信号处理函数里只允许写这个变量
volatile sig_atomic_t g_received_signal = 0;

// 信号标志和旧处理函数都是进程级的，只允许一个监听者
std::atomic<bool> g_watcher_active{false};

// 轮询间隔
const auto kSignalPollInterval = std::chrono::milliseconds(20);
} // namespace

SignalWatcher::SignalWatcher(std::vector<int> signals) : signals_(std::move(signals))
{
    if (g_watcher_active.exchange(true))
    {
        throw std::logic_error("已经存在一个 SignalWatcher");
    }
    g_received_signal = 0;

    struct sigaction action;
    action.sa_handler = &SignalWatcher::handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int signum : signals_)
    {
        struct sigaction old_action;
        if (sigaction(signum, &action, &old_action) == -1)
        {
            int err = errno;
            // 已经安装的先恢复
            restore();
            g_watcher_active = false;
            throw std::system_error(err, std::generic_category(), "安装信号处理函数失败");
        }
        old_actions_.push_back(old_action);
    }
}

SignalWatcher::~SignalWatcher()
{
    restore();
    g_watcher_active = false;
}

void SignalWatcher::restore()
{
    for (size_t i = 0; i < old_actions_.size(); ++i)
    {
        sigaction(signals_[i], &old_actions_[i], nullptr);
    }
    old_actions_.clear();
}

void SignalWatcher::handle_signal(int signum)
{
    g_received_signal = signum;
}

int SignalWatcher::wait() const
{
    while (g_received_signal == 0)
    {
        std::this_thread::sleep_for(kSignalPollInterval);
    }
    return g_received_signal;
}

int SignalWatcher::wait_for(std::chrono::milliseconds timeout) const
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (g_received_signal == 0)
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return 0;
        }
        std::this_thread::sleep_for(kSignalPollInterval);
    }
    return g_received_signal;
}

int SignalWatcher::received() const
{
    return g_received_signal;
}

} // namespace tickhive
