#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "job.h"
#include "tickhive_config.h"

namespace tickhive
{

// 系统信息结构
struct SystemInfo {
    double cpu_usage = 0.0;
    double memory_usage = 0.0;
    double disk_usage = 0.0;
    std::string timestamp;
};

// 系统信息存储，采样任务写、心跳任务读
class SystemInfoStore
{
public:
    SystemInfo get() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_;
    }
    void set(const SystemInfo& info)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = info;
    }

private:
    mutable std::mutex mutex_;
    SystemInfo info_;
};

// 心跳任务：周期性输出存活信息和最近一次的系统信息
class HeartbeatJob : public Job
{
public:
    HeartbeatJob(const JobConfig& config, std::shared_ptr<const SystemInfoStore> store);

    std::chrono::nanoseconds period() const override { return config_.period; }
    bool with_truncate_time() const override { return config_.truncate_time; }
    std::string name() const override { return "heartbeat"; }
    void run() override;

    uint64_t beats() const { return beats_; }

private:
    JobConfig config_;
    std::shared_ptr<const SystemInfoStore> store_;
    std::chrono::steady_clock::time_point started_;
    std::atomic<uint64_t> beats_{0};
};

// 系统信息采样任务，每一步采样之间检查取消令牌
class SystemInfoJob : public Job
{
public:
    SystemInfoJob(const JobConfig& config, std::shared_ptr<SystemInfoStore> store);

    std::chrono::nanoseconds period() const override { return config_.period; }
    bool with_truncate_time() const override { return config_.truncate_time; }
    bool with_cancel() const override { return true; }
    std::string name() const override { return "system_info"; }
    void run_with_cancel(const CancellationToken& token) override;

    // 单项采样，失败返回 false
    static bool read_cpu_usage(double* usage);
    static bool read_memory_usage(double* usage);
    static bool read_disk_usage(double* usage);

private:
    JobConfig config_;
    std::shared_ptr<SystemInfoStore> store_;
};

} // namespace tickhive
