#include "system_jobs.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <thread>

#include "Logger.hpp"

namespace tickhive
{

HeartbeatJob::HeartbeatJob(const JobConfig& config, std::shared_ptr<const SystemInfoStore> store)
    : config_(config), store_(std::move(store)), started_(std::chrono::steady_clock::now())
{
}

void HeartbeatJob::run()
{
    uint64_t beat = ++beats_;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_);
    if (store_)
    {
        SystemInfo info = store_->get();
        TICKHIVE_LOG_INFO("心跳 #%llu 运行 %llds cpu=%.1f%% mem=%.1f%% disk=%.1f%%",
                          static_cast<unsigned long long>(beat), static_cast<long long>(uptime.count()),
                          info.cpu_usage, info.memory_usage, info.disk_usage);
    }
    else
    {
        TICKHIVE_LOG_INFO("心跳 #%llu 运行 %llds",
                          static_cast<unsigned long long>(beat), static_cast<long long>(uptime.count()));
    }
}

SystemInfoJob::SystemInfoJob(const JobConfig& config, std::shared_ptr<SystemInfoStore> store)
    : config_(config), store_(std::move(store))
{
}

void SystemInfoJob::run_with_cancel(const CancellationToken& token)
{
    SystemInfo new_info;

    if (!read_cpu_usage(&new_info.cpu_usage))
    {
        TICKHIVE_LOG_WARN("获取CPU使用率失败");
    }
    if (token.is_cancelled())
    {
        return;
    }
    if (!read_memory_usage(&new_info.memory_usage))
    {
        TICKHIVE_LOG_WARN("获取内存使用率失败");
    }
    if (token.is_cancelled())
    {
        return;
    }
    // df 可能较慢，放在最后
    if (!read_disk_usage(&new_info.disk_usage))
    {
        TICKHIVE_LOG_WARN("获取磁盘使用率失败");
    }
    if (token.is_cancelled())
    {
        return;
    }

    new_info.timestamp = std::to_string(time(nullptr));
    store_->set(new_info);
    TICKHIVE_LOG_DEBUG("系统信息已更新 cpu=%.1f%% mem=%.1f%% disk=%.1f%%",
                       new_info.cpu_usage, new_info.memory_usage, new_info.disk_usage);
}

bool SystemInfoJob::read_cpu_usage(double* usage)
{
    FILE* cpu_file = fopen("/proc/loadavg", "r");
    if (!cpu_file)
    {
        return false;
    }
    float load1 = 0, load5 = 0, load15 = 0;
    int n = fscanf(cpu_file, "%f %f %f", &load1, &load5, &load15);
    fclose(cpu_file);
    if (n != 3)
    {
        return false;
    }
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0)
    {
        cores = 1;
    }
    *usage = (load1 * 100.0) / cores;
    return true;
}

bool SystemInfoJob::read_memory_usage(double* usage)
{
    FILE* mem_file = fopen("/proc/meminfo", "r");
    if (!mem_file)
    {
        return false;
    }
    long total_mem = 0, available_mem = 0;
    char line[256];
    while (fgets(line, sizeof(line), mem_file))
    {
        if (strncmp(line, "MemTotal:", 9) == 0)
        {
            sscanf(line, "MemTotal: %ld", &total_mem);
        }
        else if (strncmp(line, "MemAvailable:", 13) == 0)
        {
            sscanf(line, "MemAvailable: %ld", &available_mem);
        }
    }
    fclose(mem_file);
    if (total_mem <= 0)
    {
        return false;
    }
    *usage = ((total_mem - available_mem) * 100.0) / total_mem;
    return true;
}

bool SystemInfoJob::read_disk_usage(double* usage)
{
    FILE* disk_file = popen("df / 2>/dev/null | tail -1 | awk '{print $5}' | sed 's/%//'", "r");
    if (!disk_file)
    {
        return false;
    }
    char disk_usage_str[16];
    bool ok = false;
    if (fgets(disk_usage_str, sizeof(disk_usage_str), disk_file))
    {
        // 移除换行符
        disk_usage_str[strcspn(disk_usage_str, "\n")] = 0;
        char* end = nullptr;
        double value = strtod(disk_usage_str, &end);
        if (end != disk_usage_str)
        {
            *usage = value;
            ok = true;
        }
    }
    pclose(disk_file);
    return ok;
}

} // namespace tickhive
