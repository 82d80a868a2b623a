#pragma once
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>
#include <fcntl.h>  // open
#include <unistd.h> // fsync, close

#include "Util.hpp"

namespace logsystem
{
    // 日志刷新接口类
    class LogFlush
    {
    public:
        using ptr = std::shared_ptr<LogFlush>;
        virtual ~LogFlush() {};
        virtual void Flush(const char *data, size_t len) = 0;
    };

    // 标准输出日志刷新类
    class StdoutFlush : public LogFlush
    {
    public:
        using ptr = std::shared_ptr<StdoutFlush>;
        void Flush(const char *data, size_t len) override
        {
            if (data == nullptr || len == 0)
                return;
            std::cout.write(data, static_cast<std::streamsize>(len));
            std::cout.flush();
            size_t flush_log = logsystem::Config::GetInstance()->flush_log;
            if (flush_log == 1)
            {
                fflush(stdout); // 把用户缓冲写入操作系统缓存
            }
            else if (flush_log == 2)
            {
                int fd = fileno(stdout);
                if (fd >= 0)
                {
                    fflush(stdout);
                    fsync(fd); // 刷新文件描述符到磁盘
                }
                else
                {
                    std::cerr << "StdoutFlush: 获取标准输出文件描述符失败" << std::endl;
                }
            }
        }
    };
    // 文件日志刷新类
    class FileFlush : public LogFlush
    {
    public:
        using ptr = std::shared_ptr<FileFlush>;
        explicit FileFlush(const std::string &filename)
            : filename_(filename)
        {
            // 创建所给目录
            logsystem::File::CreateDirectory(filename);
            ofs_.open(filename, std::ios::app | std::ios::binary);
            if (!ofs_)
            {
                throw std::runtime_error("打开日志文件失败: " + filename);
            }
        }
        void Flush(const char *data, size_t len) override
        {
            ofs_.write(data, static_cast<std::streamsize>(len));
            if (!ofs_)
            {
                throw std::runtime_error("写日志文件失败: " + filename_);
            }
            size_t flush_log = logsystem::Config::GetInstance()->flush_log;
            if (flush_log == 1)
            {
                ofs_.flush();
            }
            else if (flush_log == 2)
            {
                ofs_.flush(); // 用户缓冲 -> 内核
                int fd = ::open(filename_.c_str(), O_WRONLY);
                if (fd >= 0)
                {
                    ::fsync(fd); // 内核 -> 硬盘
                    ::close(fd);
                }
            }
        }

    private:
        std::string filename_;
        std::ofstream ofs_;
    };

    // 滚动文件日志刷新类，单个文件写满 max_size 后换新文件
    class RollingFileFlush : public LogFlush
    {
    public:
        using ptr = std::shared_ptr<RollingFileFlush>;
        RollingFileFlush(const std::string &basename, size_t max_size)
            : base_name_(basename), max_size_(max_size), current_size_(0), cnt_(0)
        {
            std::string path = logsystem::File::Path(basename);
            if (!path.empty())
            {
                logsystem::File::CreateDirectory(path);
            }
        }
        void Flush(const char *data, size_t len) override
        {
            InitLogFile();
            ofs_.write(data, static_cast<std::streamsize>(len));
            if (!ofs_)
            {
                throw std::runtime_error("写滚动日志文件失败: " + filename_);
            }
            current_size_ += len;
            size_t flush_log = logsystem::Config::GetInstance()->flush_log;
            if (flush_log == 1)
            {
                ofs_.flush();
            }
            else if (flush_log == 2)
            {
                ofs_.flush();
                int fd = ::open(filename_.c_str(), O_WRONLY);
                if (fd >= 0)
                {
                    ::fsync(fd);
                    ::close(fd);
                }
            }
        }

        // 当前正在写的文件名
        std::string CurrentFile() const { return filename_; }

    private:
        // 文件未打开或已写满时打开新文件
        void InitLogFile()
        {
            if (ofs_.is_open() && current_size_ < max_size_)
            {
                return;
            }
            if (ofs_.is_open())
            {
                ofs_.close();
            }
            filename_ = CreatLogFileName();
            ofs_.open(filename_, std::ios::app | std::ios::binary);
            if (!ofs_)
            {
                throw std::runtime_error("打开滚动日志文件失败: " + filename_);
            }
            // 已存在则续写
            current_size_ = std::filesystem::exists(filename_)
                                ? static_cast<size_t>(std::filesystem::file_size(filename_))
                                : 0;
        }
        // 创建日志文件名: 基础名 + 年月日时分秒 + 序号
        std::string CreatLogFileName()
        {
            time_t now = logsystem::Data::GetCurrentTime();
            struct tm t;
            localtime_r(&now, &t);
            char time_buf[32];
            strftime(time_buf, sizeof(time_buf), "%Y%m%d%H%M%S", &t);
            return base_name_ + time_buf + "-" + std::to_string(cnt_++) + ".log";
        }

    private:
        std::string base_name_; // 基础文件名
        size_t max_size_;       // 最大文件大小
        size_t current_size_;   // 当前文件大小
        size_t cnt_;            // 记录滚动次数
        std::string filename_;  // 当前日志文件名
        std::ofstream ofs_;     // 输出文件流
    };

    // 工厂类用于创建不同类型的日志刷新器
    class LogFlushFactory
    {
    public:
        template <typename FlushType, typename... Args>
        static std::shared_ptr<LogFlush> CreateLog(Args &&...args)
        {
            return std::make_shared<FlushType>(std::forward<Args>(args)...);
        }
    };
} // namespace logsystem
