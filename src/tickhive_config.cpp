#include "tickhive_config.h"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "Logger.hpp"

namespace tickhive
{

void TickHiveConfig::load_config_file()
{
    std::ifstream ifs(get_config_file_path(), std::ifstream::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + get_config_file_path());
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
        throw std::runtime_error("Failed to parse config file: " + errs);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Config root must be a json object: " + get_config_file_path());
    }

    // log
    const Json::Value& log = root["log"];
    log_.level = log.get("level", log_.level).asString();
    log_.file = log.get("file", log_.file).asString();
    log_.rolling_file = log.get("rolling_file", log_.rolling_file).asString();
    log_.rolling_max_size = log.get("rolling_max_size", static_cast<Json::UInt64>(log_.rolling_max_size)).asUInt64();
    log_.raw = log;
    try {
        logsystem::LogLevel::FromString(log_.level);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
    if (!log_.rolling_file.empty() && log_.rolling_max_size == 0) {
        throw std::runtime_error("log.rolling_max_size must be positive");
    }

    // 内置任务
    heartbeat_ = parse_job(root["heartbeat"], "heartbeat", std::chrono::milliseconds(1000));
    system_info_ = parse_job(root["system_info"], "system_info", std::chrono::milliseconds(5000));
}

JobConfig TickHiveConfig::parse_job(const Json::Value& node, const std::string& section,
                                    std::chrono::milliseconds default_period)
{
    JobConfig job;
    job.enabled = node.get("enabled", true).asBool();
    Json::Int64 period_ms = node.get("period_ms", static_cast<Json::Int64>(default_period.count())).asInt64();
    if (period_ms <= 0) {
        throw std::runtime_error(section + ".period_ms must be positive");
    }
    job.period = std::chrono::milliseconds(period_ms);
    job.truncate_time = node.get("truncate_time", true).asBool();
    return job;
}

void TickHiveConfig::apply_log_config() const
{
    logsystem::Config::GetInstance()->LoadFromJson(log_.raw);

    logsystem::LoggerBuilder builder;
    builder.BuildLoggerName("tickhive");
    builder.BuildLoggerLevel(logsystem::LogLevel::FromString(log_.level));
    builder.BuildLoggerFlush<logsystem::StdoutFlush>();
    if (!log_.file.empty()) {
        builder.BuildLoggerFlush<logsystem::FileFlush>(log_.file);
    }
    if (!log_.rolling_file.empty()) {
        builder.BuildLoggerFlush<logsystem::RollingFileFlush>(log_.rolling_file, log_.rolling_max_size);
    }
    logsystem::LoggerManager::GetInstance().SetDefaultLogger(builder.Build());
}

void TickHiveConfig::print() const
{
    std::cout << "======= TickHive Configuration =======" << std::endl;

    std::cout << "[Log]" << std::endl;
    std::cout << "Level        : " << log_.level << std::endl;
    std::cout << "File         : " << log_.file << std::endl;
    std::cout << "Rolling File : " << log_.rolling_file << std::endl;
    std::cout << "Rolling Size : " << log_.rolling_max_size << std::endl;

    std::cout << "\n[Heartbeat]" << std::endl;
    std::cout << "Enabled      : " << heartbeat_.enabled << std::endl;
    std::cout << "Period (ms)  : " << heartbeat_.period.count() << std::endl;
    std::cout << "Truncate     : " << heartbeat_.truncate_time << std::endl;

    std::cout << "\n[System Info]" << std::endl;
    std::cout << "Enabled      : " << system_info_.enabled << std::endl;
    std::cout << "Period (ms)  : " << system_info_.period.count() << std::endl;
    std::cout << "Truncate     : " << system_info_.truncate_time << std::endl;

    std::cout << "======================================" << std::endl;
}

} // namespace tickhive
