#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <vector>

#include "LogLevel.hpp"
#include "AsyncWorker.hpp"
#include "LogMessage.hpp"
#include "LogFlush.hpp"

namespace logsystem
{

    // 异步日志记录器
    class AsyncLogger
    {
    public:
        using ptr = std::shared_ptr<AsyncLogger>;
        AsyncLogger(std::string logger_name, std::vector<logsystem::LogFlush::ptr> &flush_list,
                    logsystem::AsyncType async_type = logsystem::AsyncType::BLOCKING_BOUNDED,
                    logsystem::LogLevel::value level = logsystem::LogLevel::value::DEBUG)
            : logger_name_(std::move(logger_name)),
              level_(level),
              flush_list_(flush_list.begin(), flush_list.end()),
              async_worker_(std::bind(&AsyncLogger::RealFlush, this, std::placeholders::_1), async_type)
        {
        }
        ~AsyncLogger() {};
        std::string Name() const { return logger_name_; }

        // 低于该等级的日志直接丢弃
        void SetLevel(logsystem::LogLevel::value level) { level_ = level; }
        logsystem::LogLevel::value Level() const { return level_; }

        void Debug(const std::string &file, size_t line, const char *format, ...)
        {
            va_list va;
            va_start(va, format);
            Log(LogLevel::value::DEBUG, file, line, format, va);
            va_end(va);
        }
        void Info(const std::string &file, size_t line, const char *format, ...)
        {
            va_list va;
            va_start(va, format);
            Log(LogLevel::value::INFO, file, line, format, va);
            va_end(va);
        }
        void Warn(const std::string &file, size_t line, const char *format, ...)
        {
            va_list va;
            va_start(va, format);
            Log(LogLevel::value::WARN, file, line, format, va);
            va_end(va);
        }
        void Error(const std::string &file, size_t line, const char *format, ...)
        {
            va_list va;
            va_start(va, format);
            Log(LogLevel::value::ERROR, file, line, format, va);
            va_end(va);
        }
        void Fatal(const std::string &file, size_t line, const char *format, ...)
        {
            va_list va;
            va_start(va, format);
            Log(LogLevel::value::FATAL, file, line, format, va);
            va_end(va);
        }

    private:
        // 使用可变参数格式化字符串
        void Log(logsystem::LogLevel::value level, const std::string &file, size_t line, const char *format, va_list va)
        {
            if (level < level_.load())
            {
                return;
            }
            char *ret = nullptr;
            int r = vasprintf(&ret, format, va);
            if (r == -1 || ret == nullptr)
            {
                perror("vasprintf failed!!!: ");
                return;
            }
            serialize(level, file, line, ret);
            free(ret);
        }

        // 将日志信息组织起来交给异步工作器
        void serialize(logsystem::LogLevel::value level, const std::string &file, size_t line, const char *ret)
        {
            logsystem::LogMessage msg(level, file, line, logger_name_, ret);
            std::string data = msg.format();
            async_worker_.Push(data.c_str(), data.size());
        }
        // 异步工作器的回调函数
        void RealFlush(logsystem::Buffer &buffer)
        {
            if (buffer.isEmpty())
            {
                return;
            }
            for (auto &e : flush_list_)
            {
                e->Flush(buffer.Begin(), buffer.ReadableSize()); // 遍历所有的日志输出方向，写入日志
            }
        }

    private:
        std::string logger_name_;                               // 日志器名称
        std::atomic<logsystem::LogLevel::value> level_;         // 最低输出等级
        std::vector<logsystem::LogFlush::ptr> flush_list_;      // 存放各种日志输出方向
        logsystem::AsyncWorker async_worker_;                   // 异步工作器，最后构造、最先析构
    };
    // 异步日志构建器
    class LoggerBuilder
    {
    public:
        using ptr = std::shared_ptr<LoggerBuilder>;

        void BuildLoggerName(const std::string &name)
        {
            logger_name_ = name;
        }

        void BuildLopperType(AsyncType type)
        {
            async_type_ = type;
        }

        void BuildLoggerLevel(LogLevel::value level)
        {
            level_ = level;
        }

        template <typename FlushType, typename... Args>
        void BuildLoggerFlush(Args &&...args)
        {
            flush_list_.emplace_back(
                LogFlushFactory::CreateLog<FlushType>(std::forward<Args>(args)...));
        }

        AsyncLogger::ptr Build()
        {
            if (logger_name_.empty())
            {
                throw std::runtime_error("Logger name cannot be empty");
            }
            // 日志输出方式为空，默认输出到控制台
            if (flush_list_.empty())
            {
                flush_list_.emplace_back(std::make_shared<logsystem::StdoutFlush>());
            }
            return std::make_shared<AsyncLogger>(logger_name_, flush_list_, async_type_, level_);
        }

    private:
        std::string logger_name_;                                                  // 日志器名称
        std::vector<logsystem::LogFlush::ptr> flush_list_;                         // 存放各种日志输出方式
        logsystem::AsyncType async_type_ = logsystem::AsyncType::BLOCKING_BOUNDED; // 异步类型,默认为阻塞有界缓冲区
        logsystem::LogLevel::value level_ = logsystem::LogLevel::value::DEBUG;     // 默认全部输出
    };
} // namespace logsystem
