#pragma once

#include <chrono>
#include <string>
#include <json/json.h>
#include "config_base.h"

namespace tickhive
{

// 单个内置任务的配置
struct JobConfig
{
    bool enabled = true;
    std::chrono::milliseconds period{1000};
    bool truncate_time = true;
};

// 日志配置
struct LogConfig
{
    std::string level = "INFO";
    std::string file;           // 为空则不写普通日志文件
    std::string rolling_file;   // 为空则不写滚动日志
    size_t rolling_max_size = 10 * 1024 * 1024;
    Json::Value raw;            // 原始 log 节点，缓冲区等参数交给日志系统自己解析
};

class TickHiveConfig : public ConfigBase {
public:
    // 首次调用时加载，之后的 path 参数被忽略
    static TickHiveConfig* GetInstance(const std::string& path) {
        static TickHiveConfig instance(path);
        return &instance;
    }

    // 加载失败抛出 std::runtime_error
    explicit TickHiveConfig(const std::string& configfilepath) : ConfigBase(configfilepath) {
        load_config_file();
    }
    TickHiveConfig(const TickHiveConfig&) = delete;
    TickHiveConfig& operator=(const TickHiveConfig&) = delete;

    // 日志配置
    const LogConfig& get_log_config() const { return log_; }

    // 内置任务配置
    const JobConfig& get_heartbeat_config() const { return heartbeat_; }
    const JobConfig& get_system_info_config() const { return system_info_; }

    void print() const override;

    // 把 log 节点应用到日志系统，并按配置构建默认日志器
    void apply_log_config() const;

private:
    void load_config_file() override;

    static JobConfig parse_job(const Json::Value& node, const std::string& section,
                               std::chrono::milliseconds default_period);

private:
    LogConfig log_;
    JobConfig heartbeat_;
    JobConfig system_info_;
};

} // namespace tickhive
