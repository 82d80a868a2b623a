#pragma once
#include <ctime>
#include <sstream>
#include <string>
#include <thread>

#include "LogLevel.hpp"
#include "Util.hpp"

namespace logsystem
{
    // 一条日志消息
    struct LogMessage
    {
        LogMessage(LogLevel::value level, std::string file, size_t line,
                   std::string name, std::string payload)
            : level_(level),
              file_(std::move(file)),
              line_(line),
              name_(std::move(name)),
              payload_(std::move(payload)),
              ctime_(logsystem::Data::GetCurrentTime()),
              tid_(std::this_thread::get_id())
        {
        }

        // 格式: [时间][等级][线程id][日志器][文件:行号]\t消息\n
        std::string format() const
        {
            struct tm t;
            localtime_r(&ctime_, &t);
            char time_buf[32];
            strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &t);

            std::stringstream ss;
            ss << "[" << time_buf << "]"
               << "[" << LogLevel::ToString(level_) << "]"
               << "[" << tid_ << "]"
               << "[" << name_ << "]"
               << "[" << file_ << ":" << line_ << "]"
               << "\t" << payload_ << "\n";
            return ss.str();
        }

        LogLevel::value level_; // 日志等级
        std::string file_;      // 文件名
        size_t line_;           // 行号
        std::string name_;      // 日志器名称
        std::string payload_;   // 日志内容
        time_t ctime_;          // 产生时间
        std::thread::id tid_;   // 线程id
    };
} // namespace logsystem
