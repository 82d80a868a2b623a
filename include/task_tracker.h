#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tickhive
{

// 任务登记表：跟踪正在运行的任务线程
// 关闭后不再接收新任务；wait() 在关闭且所有任务结束后返回
class TaskTracker
{
public:
    using Task = std::function<void()>;

    TaskTracker() = default;
    ~TaskTracker();

    TaskTracker(const TaskTracker&) = delete;
    TaskTracker& operator=(const TaskTracker&) = delete;

    // 为任务启动一个线程，已关闭时返回 false 且任务不会执行
    bool spawn(Task task);

    // 关闭登记表（幂等）
    void close();

    // 阻塞直到已关闭且没有未完成的任务，然后回收所有线程
    // 不能在被跟踪的任务线程里调用
    void wait();

    bool is_closed() const;
    // 未完成的任务数
    size_t len() const;
    bool is_empty() const;

private:
    void finish_one();

    mutable std::mutex mutex_;
    std::condition_variable done_cond_; // 任务结束或登记表关闭时通知
    bool closed_ = false;
    size_t outstanding_ = 0;
    std::vector<std::thread> threads_;
};

} // namespace tickhive
