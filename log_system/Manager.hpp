#pragma once
#include <unordered_map>
#include "AsyncLogger.hpp"

namespace logsystem
{
    // 对日志器进行管理 懒汉式单例模式
    class LoggerManager
    {
    public:
        static LoggerManager &GetInstance()
        {
            static LoggerManager instance;
            return instance;
        }
        bool LoggerExist(const std::string &name)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return logger_map_.find(name) != logger_map_.end();
        }

        void AddLogger(AsyncLogger::ptr &&logger)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (logger_map_.find(logger->Name()) != logger_map_.end())
                return;
            logger_map_.insert(std::make_pair(logger->Name(), std::move(logger)));
        }

        AsyncLogger::ptr GetLogger(const std::string &name)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto it = logger_map_.find(name);
            if (it == logger_map_.end())
            {
                return AsyncLogger::ptr(); // 日志器不存在，返回空指针
            }
            return it->second;
        }

        AsyncLogger::ptr DefaultLogger()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            return default_logger_;
        }

        // 替换默认日志器，旧的默认日志器在最后一个持有者释放后刷完退出
        void SetDefaultLogger(AsyncLogger::ptr logger)
        {
            if (!logger)
                return;
            std::unique_lock<std::mutex> lock(mutex_);
            default_logger_ = logger;
            logger_map_[logger->Name()] = std::move(logger);
        }

    private:
        LoggerManager()
        {
            std::unique_ptr<logsystem::LoggerBuilder> builder(new logsystem::LoggerBuilder());
            builder->BuildLoggerName("default");
            default_logger_ = builder->Build();
            logger_map_.insert(std::make_pair("default", default_logger_));
        }

    private:
        std::mutex mutex_;                                                        // 互斥锁，保护日志器的线程安全
        logsystem::AsyncLogger::ptr default_logger_;                              // 默认日志器
        std::unordered_map<std::string, logsystem::AsyncLogger::ptr> logger_map_; // 存储日志器的映射表
    };

} // namespace logsystem
