// 任务登记表测试
#include "task_tracker.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using tickhive::TaskTracker;

static void check(bool cond, const std::string& what)
{
    if (!cond)
    {
        throw std::runtime_error("check failed: " + what);
    }
}

int main()
{
    try
    {
        // 基础功能
        {
            TaskTracker tracker;
            std::atomic<int> done{0};
            std::atomic<bool> release{false};
            for (int i = 0; i < 8; ++i)
            {
                bool ok = tracker.spawn([&done, &release]() {
                    while (!release)
                    {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                    ++done;
                });
                check(ok, "spawn on open tracker");
            }
            check(tracker.len() == 8, "eight outstanding");
            check(!tracker.is_empty(), "not empty");
            check(!tracker.is_closed(), "not closed yet");

            tracker.close();
            check(tracker.is_closed(), "closed");
            check(!tracker.spawn([]() {}), "spawn after close is rejected");

            release = true;
            tracker.wait();
            check(done == 8, "all tasks ran");
            check(tracker.is_empty(), "empty after wait");
            std::cout << "basic ok" << std::endl;
        }

        // 未关闭时 wait 不返回
        {
            TaskTracker tracker;
            tracker.spawn([]() {});
            std::atomic<bool> returned{false};
            std::thread waiter([&tracker, &returned]() {
                tracker.wait();
                returned = true;
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            check(!returned, "wait blocks while tracker is open");
            tracker.close();
            waiter.join();
            check(returned, "wait returns once closed and drained");
            std::cout << "wait-until-closed ok" << std::endl;
        }

        // 任务抛异常也算完成
        {
            TaskTracker tracker;
            tracker.spawn([]() { throw std::runtime_error("task exception"); });
            tracker.spawn([]() { throw 42; });
            tracker.spawn([]() {});
            tracker.close();
            tracker.wait();
            check(tracker.is_empty(), "throwing task is counted as finished");
            std::cout << "exception ok" << std::endl;
        }

        // 析构时关闭并等待
        {
            std::atomic<int> done{0};
            {
                TaskTracker tracker;
                for (int i = 0; i < 4; ++i)
                {
                    tracker.spawn([&done]() {
                        std::this_thread::sleep_for(std::chrono::milliseconds(20));
                        ++done;
                    });
                }
            }
            check(done == 4, "destructor drains tasks");
            std::cout << "destructor ok" << std::endl;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "test_task_tracker exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
