#include "task_tracker.h"

#include "Logger.hpp"

namespace tickhive
{

TaskTracker::~TaskTracker()
{
    close();
    wait();
}

bool TaskTracker::spawn(Task task)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
    {
        return false;
    }
    ++outstanding_;
    try
    {
        threads_.emplace_back([this, task = std::move(task)]() {
            try
            {
                task();
            }
            catch (const std::exception& e)
            {
                TICKHIVE_LOG_ERROR("被跟踪的任务异常退出: %s", e.what());
            }
            catch (...)
            {
                TICKHIVE_LOG_ERROR("被跟踪的任务因未知异常退出");
            }
            finish_one();
        });
    }
    catch (...)
    {
        // 线程没有创建成功，撤销计数后继续抛出
        --outstanding_;
        throw;
    }
    return true;
}

void TaskTracker::finish_one()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --outstanding_;
    }
    done_cond_.notify_all();
}

void TaskTracker::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    done_cond_.notify_all();
}

void TaskTracker::wait()
{
    std::vector<std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cond_.wait(lock, [this]() { return closed_ && outstanding_ == 0; });
        threads.swap(threads_);
    }
    for (auto& th : threads)
    {
        if (th.joinable())
        {
            th.join();
        }
    }
}

bool TaskTracker::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TaskTracker::len() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

bool TaskTracker::is_empty() const
{
    return len() == 0;
}

} // namespace tickhive
