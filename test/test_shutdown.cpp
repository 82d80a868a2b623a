// 关闭流程测试: wait_cancel / wait / 信号监听
#include "scheduler.h"
#include "signal_watcher.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

using namespace std::chrono;
using tickhive::CancellationToken;
using tickhive::Scheduler;

static void check(bool cond, const std::string& what)
{
    if (!cond)
    {
        throw std::runtime_error("check failed: " + what);
    }
}

class CountingJob : public tickhive::Job
{
public:
    explicit CountingJob(std::atomic<int>* runs) : runs_(runs) {}
    nanoseconds period() const override { return milliseconds(20); }
    void run() override { ++*runs_; }

private:
    std::atomic<int>* runs_;
};

int main()
{
    try
    {
        // 只有传入的令牌能结束 wait_cancel
        {
            std::atomic<int> runs{0};
            std::atomic<bool> returned{false};
            CancellationToken trigger;
            CancellationToken unrelated;
            CancellationToken trigger_child = trigger.child_token();

            Scheduler scheduler;
            scheduler.spawn<CountingJob>(&runs);
            std::thread waiter([&scheduler, &returned, trigger]() {
                scheduler.wait_cancel(trigger);
                returned = true;
            });

            std::this_thread::sleep_for(milliseconds(100));
            unrelated.cancel();
            trigger_child.cancel();
            std::this_thread::sleep_for(milliseconds(100));
            check(!returned, "unrelated or child cancellation does not release wait_cancel");
            check(scheduler.running() == 1, "loop still running");

            trigger.cancel();
            waiter.join();
            check(returned, "wait_cancel returned after its token was cancelled");
            check(scheduler.running() == 0, "scheduler drained");
            int after = runs;
            check(after > 0, "job ran while waiting");
            std::this_thread::sleep_for(milliseconds(60));
            check(runs == after, "no run after wait_cancel returned");
            std::cout << "wait_cancel ok" << std::endl;
        }

        // 信号监听超时与收到信号
        {
            tickhive::SignalWatcher watcher({SIGUSR1});
            check(watcher.received() == 0, "nothing received yet");
            check(watcher.wait_for(milliseconds(50)) == 0, "wait_for times out");
            kill(getpid(), SIGUSR1);
            check(watcher.wait_for(seconds(5)) == SIGUSR1, "SIGUSR1 observed");
            std::cout << "signal watcher ok" << std::endl;
        }

        // 无法安装的信号: 抛 system_error，已装的处理函数被恢复
        {
            bool threw = false;
            try
            {
                tickhive::SignalWatcher watcher({SIGUSR2, SIGKILL});
            }
            catch (const std::system_error& e)
            {
                std::cout << "expected failure: " << e.what() << std::endl;
                threw = true;
            }
            check(threw, "SIGKILL handler cannot be installed");
            struct sigaction current;
            sigaction(SIGUSR2, nullptr, &current);
            check(current.sa_handler == SIG_DFL, "SIGUSR2 handler restored after failure");

            // 失败之后仍可以再建监听者
            tickhive::SignalWatcher watcher({SIGUSR2});
            check(watcher.received() == 0, "watcher usable after a failed one");
            std::cout << "install failure ok" << std::endl;
        }

        // 同一时间只能有一个监听者
        {
            std::atomic<int> runs{0};
            Scheduler scheduler;
            scheduler.spawn<CountingJob>(&runs);
            {
                tickhive::SignalWatcher first({SIGUSR1});
                bool threw = false;
                try
                {
                    tickhive::SignalWatcher second({SIGUSR2});
                }
                catch (const std::logic_error&)
                {
                    threw = true;
                }
                check(threw, "second watcher rejected");

                threw = false;
                try
                {
                    scheduler.wait();
                }
                catch (const std::logic_error&)
                {
                    threw = true;
                }
                check(threw, "wait rejected while another watcher is active");
                check(scheduler.running() == 1, "rejected wait leaves the scheduler running");
            }
            scheduler.stop();
            check(scheduler.running() == 0, "scheduler still stoppable");
            std::cout << "single watcher ok" << std::endl;
        }

        // wait() 收到 SIGINT 后停止
        {
            std::atomic<int> runs{0};
            Scheduler scheduler;
            scheduler.spawn<CountingJob>(&runs);
            std::thread sender([]() {
                std::this_thread::sleep_for(milliseconds(300));
                kill(getpid(), SIGINT);
            });
            scheduler.wait();
            sender.join();
            check(scheduler.running() == 0, "wait drained the scheduler");
            check(runs > 0, "job ran before the signal");

            // 处理函数已恢复，再次 wait 属于误用
            bool threw = false;
            try
            {
                scheduler.wait();
            }
            catch (const std::logic_error&)
            {
                threw = true;
            }
            check(threw, "wait after shutdown throws");
            std::cout << "wait ok" << std::endl;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "test_shutdown exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
