// 周期对齐测试
#include "scheduler.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono;
using tickhive::Scheduler;

static void check(bool cond, const std::string& what)
{
    if (!cond)
    {
        throw std::runtime_error("check failed: " + what);
    }
}

// 记录每次执行的系统时间
class RecordingJob : public tickhive::Job
{
public:
    RecordingJob(nanoseconds period, bool truncate, std::vector<nanoseconds>* stamps, std::mutex* mu)
        : period_(period), truncate_(truncate), stamps_(stamps), mu_(mu)
    {
    }
    nanoseconds period() const override { return period_; }
    bool with_truncate_time() const override { return truncate_; }
    void run() override
    {
        auto now = duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
        std::lock_guard<std::mutex> lock(*mu_);
        stamps_->push_back(now);
    }

private:
    nanoseconds period_;
    bool truncate_;
    std::vector<nanoseconds>* stamps_;
    std::mutex* mu_;
};

int main()
{
    try
    {
        // 抽象单位: 周期4，当前11 -> 睡1，之后在12、16、20唤醒
        {
            check(Scheduler::truncate_period(nanoseconds(4), nanoseconds(11)) == nanoseconds(1), "4 - 11 % 4 == 1");
            check(Scheduler::truncate_period(nanoseconds(4), nanoseconds(12)) == nanoseconds(4), "aligned time sleeps a full period");
            check(Scheduler::truncate_period(nanoseconds(4), nanoseconds(16)) == nanoseconds(4), "16 -> 20");
            nanoseconds t(11);
            std::vector<int64_t> wakes;
            for (int i = 0; i < 3; ++i)
            {
                t += Scheduler::truncate_period(nanoseconds(4), t);
                wakes.push_back(t.count());
            }
            check(wakes == std::vector<int64_t>({12, 16, 20}), "wake-ups at 12, 16, 20");

            // 纪元之前
            check(Scheduler::truncate_period(nanoseconds(4), nanoseconds(-1)) == nanoseconds(1), "negative time normalised");
            check(Scheduler::truncate_period(nanoseconds(1), nanoseconds(12345)) == nanoseconds(1), "period 1 always sleeps 1");

            // 当前时间版本落在 (0, period]
            auto d = Scheduler::truncate_period(seconds(2));
            check(d > nanoseconds(0) && d <= seconds(2), "now-based delay within (0, period]");

            bool threw = false;
            try
            {
                Scheduler::truncate_period(nanoseconds(0), nanoseconds(5));
            }
            catch (const std::invalid_argument&)
            {
                threw = true;
            }
            check(threw, "zero period rejected");
            std::cout << "arithmetic ok" << std::endl;
        }

        const auto period = milliseconds(200);
        const auto tolerance = milliseconds(40);

        // 开启对齐: 每次执行时间对周期取模接近0
        {
            std::vector<nanoseconds> stamps;
            std::mutex mu;
            Scheduler scheduler;
            scheduler.spawn(std::make_unique<RecordingJob>(period, true, &stamps, &mu));
            std::this_thread::sleep_for(milliseconds(1100));
            scheduler.stop();

            check(stamps.size() >= 4, "truncated job ran several times");
            for (auto& s : stamps)
            {
                auto rem = s % duration_cast<nanoseconds>(period);
                check(rem < duration_cast<nanoseconds>(tolerance), "run aligned to a period multiple");
            }
            std::cout << "truncated runs=" << stamps.size() << std::endl;
        }

        // 关闭对齐: 相邻两次间隔约等于周期
        {
            std::vector<nanoseconds> stamps;
            std::mutex mu;
            auto start = duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
            Scheduler scheduler;
            scheduler.spawn(std::make_unique<RecordingJob>(period, false, &stamps, &mu));
            std::this_thread::sleep_for(milliseconds(1100));
            scheduler.stop();

            check(stamps.size() >= 4, "untruncated job ran several times");
            auto first = stamps.front() - start;
            check(first >= duration_cast<nanoseconds>(period) && first < duration_cast<nanoseconds>(period + tolerance),
                  "first run one period after loop start");
            for (size_t i = 1; i < stamps.size(); ++i)
            {
                auto gap = stamps[i] - stamps[i - 1];
                check(gap >= duration_cast<nanoseconds>(period - milliseconds(5)) &&
                          gap < duration_cast<nanoseconds>(period + tolerance),
                      "interval equals the period");
            }
            std::cout << "untruncated runs=" << stamps.size() << std::endl;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "test_truncate_time exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
