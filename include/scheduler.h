#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "cancellation_token.h"
#include "job.h"
#include "task_tracker.h"

namespace tickhive
{

// 周期任务调度器
// 每个注册的任务在独立线程里循环执行，所有循环共享一个根取消令牌
//
//   tickhive::Scheduler scheduler;
//   scheduler.spawn<JobA>().spawn<JobB>();
//   scheduler.wait(); // 收到 SIGINT/SIGTERM 后停止
//
// stop()/wait()/wait_cancel() 是终结操作，调用后调度器不可再用
class Scheduler
{
public:
    Scheduler();
    // 未执行终结操作时析构会先 stop()
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&& other) noexcept;
    Scheduler& operator=(Scheduler&& other) = delete;

    // 注册任务并启动它的循环，返回自身以便链式注册
    // 周期不大于0，或大到算不出唤醒时刻时，抛出 std::invalid_argument
    // 登记表已关闭时任务不会启动，也不报错
    Scheduler& spawn(std::unique_ptr<Job> job);

    template <typename J, typename... Args>
    Scheduler& spawn(Args&&... args)
    {
        return spawn(std::make_unique<J>(std::forward<Args>(args)...));
    }

    // 关闭登记表、取消根令牌，阻塞直到所有任务循环退出
    void stop();

    // 阻塞直到收到 SIGINT 或 SIGTERM，然后 stop()
    // 信号处理函数安装失败抛出 std::system_error
    // 进程内已有其它 wait() 或 SignalWatcher 在监听时抛出 std::logic_error
    void wait();

    // 阻塞直到 token 被取消，然后 stop()
    void wait_cancel(const CancellationToken& token);

    // 还在运行的任务循环数
    size_t running() const;

    // 对齐到周期整数倍还需要睡眠的时间: period - since_epoch % period
    static std::chrono::nanoseconds truncate_period(std::chrono::nanoseconds period,
                                                   std::chrono::nanoseconds since_epoch);
    // 以系统时钟的当前时间计算
    static std::chrono::nanoseconds truncate_period(std::chrono::nanoseconds period);

private:
    static void run_job_loop(Job& job, std::chrono::nanoseconds period, bool truncate,
                             bool with_cancel, const CancellationToken& token);

    // 终结操作前检查，已终结或已被移走时抛出 std::logic_error
    void ensure_usable(const char* op) const;

    std::unique_ptr<TaskTracker> tracker_;
    CancellationToken token_;
    std::atomic<bool> consumed_{false};
};

} // namespace tickhive
