#pragma once

#include "Manager.hpp"

namespace logsystem
{
    // 用户获取日志器
    inline logsystem::AsyncLogger::ptr GetLogger(const std::string &name)
    {
        return logsystem::LoggerManager::GetInstance().GetLogger(name);
    }
    // 获取默认日志器
    inline logsystem::AsyncLogger::ptr DefaultLogger()
    {
        return logsystem::LoggerManager::GetInstance().DefaultLogger();
    }
} // namespace logsystem

// 简化使用，宏函数默认填上文件名+行号，输出到默认日志器
#define TICKHIVE_LOG_DEBUG(fmt, ...) logsystem::DefaultLogger()->Debug(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define TICKHIVE_LOG_INFO(fmt, ...) logsystem::DefaultLogger()->Info(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define TICKHIVE_LOG_WARN(fmt, ...) logsystem::DefaultLogger()->Warn(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define TICKHIVE_LOG_ERROR(fmt, ...) logsystem::DefaultLogger()->Error(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define TICKHIVE_LOG_FATAL(fmt, ...) logsystem::DefaultLogger()->Fatal(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
