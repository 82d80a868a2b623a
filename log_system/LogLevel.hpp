#pragma once
#include <string>
#include <stdexcept>

namespace logsystem
{
    class LogLevel
    {
    public:
        enum class value
        {
            DEBUG, // 调试信息
            INFO,  // 一般信息
            WARN,  // 警告信息
            ERROR, // 错误信息
            FATAL  // 致命错误
        };

        // 提供日志等级的字符串转换接口
        static const char *ToString(value level)
        {
            switch (level)
            {
            case value::DEBUG:
                return "DEBUG";
            case value::INFO:
                return "INFO";
            case value::WARN:
                return "WARN";
            case value::ERROR:
                return "ERROR";
            case value::FATAL:
                return "FATAL";
            default:
                return "UNKNOW";
            }
            return "UNKNOW";
        }

        // 配置文件中的等级字符串转换为枚举，不认识的等级直接抛异常
        static value FromString(const std::string &level)
        {
            if (level == "DEBUG")
                return value::DEBUG;
            if (level == "INFO")
                return value::INFO;
            if (level == "WARN")
                return value::WARN;
            if (level == "ERROR")
                return value::ERROR;
            if (level == "FATAL")
                return value::FATAL;
            throw std::invalid_argument("未知的日志等级: " + level);
        }
    };
} // namespace logsystem
