#include "scheduler.h"

#include <stdexcept>
#include <string>
#include <system_error>

#include "signal_watcher.h"
#include "Logger.hpp"

namespace tickhive
{

Scheduler::Scheduler() : tracker_(std::make_unique<TaskTracker>())
{
}

Scheduler::Scheduler(Scheduler&& other) noexcept
    : tracker_(std::move(other.tracker_)),
      token_(other.token_),
      consumed_(other.consumed_.load())
{
}

Scheduler::~Scheduler()
{
    if (!tracker_ || consumed_)
    {
        return;
    }
    try
    {
        stop();
    }
    catch (const std::exception& e)
    {
        TICKHIVE_LOG_ERROR("调度器析构时停止失败: %s", e.what());
    }
}

Scheduler& Scheduler::spawn(std::unique_ptr<Job> job)
{
    if (!tracker_)
    {
        throw std::logic_error("spawn: 调度器已被移走");
    }
    if (!job)
    {
        throw std::invalid_argument("spawn: 任务为空");
    }

    // 注册时读取一次，之后任务再改也不生效
    const auto period = job->period();
    const bool truncate = job->with_truncate_time();
    const bool with_cancel = job->with_cancel();
    const std::string name = job->name();
    if (period.count() <= 0)
    {
        throw std::invalid_argument("任务[" + name + "]的周期必须大于0");
    }
    // 唤醒时刻 = steady_clock::now() + period，不能溢出
    if (period > std::chrono::nanoseconds::max() - std::chrono::steady_clock::now().time_since_epoch())
    {
        throw std::invalid_argument("任务[" + name + "]的周期过大");
    }

    // std::function 要求可拷贝，用 shared_ptr 持有，任务仍只属于这一个循环
    std::shared_ptr<Job> owned(std::move(job));
    CancellationToken token = token_;
    bool admitted = tracker_->spawn([owned, period, truncate, with_cancel, name, token]() {
        try
        {
            run_job_loop(*owned, period, truncate, with_cancel, token);
        }
        catch (const std::exception& e)
        {
            // 只结束这个任务自己的循环，不影响其它任务和调度器
            TICKHIVE_LOG_ERROR("任务[%s]执行异常，循环终止: %s", name.c_str(), e.what());
            return;
        }
        TICKHIVE_LOG_DEBUG("任务[%s]循环退出", name.c_str());
    });

    if (admitted)
    {
        TICKHIVE_LOG_DEBUG("注册任务[%s]，周期 %lld ns，对齐时间: %s，可取消: %s",
                           name.c_str(), static_cast<long long>(period.count()),
                           truncate ? "是" : "否", with_cancel ? "是" : "否");
    }
    else
    {
        TICKHIVE_LOG_WARN("调度器已关闭，任务[%s]不会启动", name.c_str());
    }
    return *this;
}

void Scheduler::run_job_loop(Job& job, std::chrono::nanoseconds period, bool truncate,
                             bool with_cancel, const CancellationToken& token)
{
    while (true)
    {
        auto delay = truncate ? truncate_period(period) : period;
        // 取消和睡眠赛跑，取消先到就直接退出，不再执行
        if (token.wait_for(delay))
        {
            break;
        }
        if (with_cancel)
        {
            job.run_with_cancel(token.child_token());
        }
        else
        {
            job.run();
        }
    }
}

void Scheduler::stop()
{
    ensure_usable("stop");
    if (consumed_.exchange(true))
    {
        throw std::logic_error("stop: 调度器已经停止");
    }

    TICKHIVE_LOG_INFO("调度器停止中，等待 %zu 个任务循环退出", tracker_->len());
    tracker_->close();
    token_.cancel();
    tracker_->wait();
    TICKHIVE_LOG_INFO("调度器已停止");
}

void Scheduler::wait()
{
    ensure_usable("wait");
    int signum = 0;
    try
    {
        SignalWatcher watcher;
        signum = watcher.wait();
    }
    catch (const std::system_error& e)
    {
        TICKHIVE_LOG_FATAL("监听退出信号失败: %s", e.what());
        throw;
    }
    TICKHIVE_LOG_INFO("接收到终止信号 %d，正在关闭调度器...", signum);
    stop();
}

void Scheduler::wait_cancel(const CancellationToken& token)
{
    ensure_usable("wait_cancel");
    token.wait();
    TICKHIVE_LOG_INFO("外部令牌已取消，正在关闭调度器...");
    stop();
}

size_t Scheduler::running() const
{
    return tracker_ ? tracker_->len() : 0;
}

std::chrono::nanoseconds Scheduler::truncate_period(std::chrono::nanoseconds period,
                                                    std::chrono::nanoseconds since_epoch)
{
    if (period.count() <= 0)
    {
        throw std::invalid_argument("周期必须大于0");
    }
    auto remainder = since_epoch.count() % period.count();
    // 纪元之前的时间取模为负数，归一化到 [0, period)
    if (remainder < 0)
    {
        remainder += period.count();
    }
    return std::chrono::nanoseconds(period.count() - remainder);
}

std::chrono::nanoseconds Scheduler::truncate_period(std::chrono::nanoseconds period)
{
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());
    return truncate_period(period, now);
}

void Scheduler::ensure_usable(const char* op) const
{
    if (!tracker_)
    {
        throw std::logic_error(std::string(op) + ": 调度器已被移走");
    }
    if (consumed_)
    {
        throw std::logic_error(std::string(op) + ": 调度器已经停止");
    }
}

} // namespace tickhive
