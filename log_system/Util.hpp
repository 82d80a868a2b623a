#pragma once
#include <sys/stat.h>
#include <sys/types.h>
#include <json/json.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace logsystem
{
    class Data
    {
    public:
        // 获取当前时间戳
        static time_t GetCurrentTime()
        {
            return time(nullptr);
        }
    };

    class File
    {
    public:
        // 获取文件所在目录
        static std::string Path(const std::string &filename)
        {
            if (filename.empty())
                return "";
            size_t pos = filename.find_last_of("/\\"); // 查找最后一个斜杠或反斜杠的位置
            if (pos != std::string::npos)
                return filename.substr(0, pos + 1);
            return "";
        }
        // 创建文件所在目录
        static void CreateDirectory(const std::string &pathname)
        {
            if (pathname.empty())
            {
                throw std::invalid_argument("路径为空");
            }
            std::filesystem::path p(pathname);
            // 以 / 结尾的是目录路径，否则取 parent_path（即文件所在目录）
            std::filesystem::path dir = (std::filesystem::is_directory(p) || pathname.back() == '/' || pathname.back() == '\\') ? p : p.parent_path();

            if (!dir.empty() && !std::filesystem::exists(dir))
            {
                std::filesystem::create_directories(dir);
            }
        }

        // 获取文件大小
        static int64_t GetFileSize(const std::string &filename)
        {
            struct stat fileStat;
            if (stat(filename.c_str(), &fileStat) != 0)
            {
                return -1; // 文件不存在
            }
            return fileStat.st_size;
        }

        // 获取文件内容
        static bool GetFileContent(std::string *content, const std::string &filename)
        {
            std::ifstream ifs(filename.c_str(), std::ios::in | std::ios::binary);
            if (!ifs)
            {
                std::cerr << "GetFileContent: 无法打开文件: " << filename << std::endl;
                return false;
            }
            int64_t fileSize = GetFileSize(filename);
            if (fileSize < 0)
            {
                std::cerr << "GetFileContent: 无法获取文件大小: " << filename << std::endl;
                return false;
            }
            content->resize(static_cast<size_t>(fileSize));
            ifs.read(&(*content)[0], fileSize);
            if (!ifs.good() && !ifs.eof())
            {
                std::cerr << "GetFileContent: 读取文件内容失败: " << filename << std::endl;
                return false;
            }
            return true;
        }
    };

    // JSON 相关操作
    class JsonUtil
    {
    public:
        // 反序列化 json
        static bool DeSerialize(const std::string &str, Json::Value *val)
        {
            Json::CharReaderBuilder crb;
            std::unique_ptr<Json::CharReader> ucr(crb.newCharReader());
            std::string err;
            if (!ucr->parse(str.c_str(), str.c_str() + str.size(), val, &err))
            {
                std::cerr << __FILE__ << ":" << __LINE__ << " parse error " << err << std::endl;
                return false;
            }
            return true;
        }
    };

    // 日志系统的配置，单例 懒汉
    // 未加载配置文件时使用默认值
    class Config
    {
    public:
        static Config *GetInstance()
        {
            static Config instance;
            return &instance;
        }

        // 从 json 对象中读取配置，缺失的字段保持原值
        void LoadFromJson(const Json::Value &root)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            buffer_size = root.get("buffer_size", static_cast<Json::UInt64>(buffer_size)).asUInt64();
            threshold = root.get("threshold", static_cast<Json::UInt64>(threshold)).asUInt64();
            linear_growth = root.get("linear_growth", static_cast<Json::UInt64>(linear_growth)).asUInt64();
            flush_log = root.get("flush_log", static_cast<Json::UInt64>(flush_log)).asUInt64();
            if (buffer_size == 0 || linear_growth == 0)
            {
                throw std::runtime_error("日志缓冲区配置无效: buffer_size/linear_growth 不能为0");
            }
        }

        // 从配置文件读取
        void LoadFromFile(const std::string &filename)
        {
            std::string content;
            if (!logsystem::File::GetFileContent(&content, filename))
            {
                throw std::runtime_error("打开日志配置文件失败: " + filename);
            }
            Json::Value root;
            if (!logsystem::JsonUtil::DeSerialize(content, &root))
            {
                throw std::runtime_error("解析日志配置文件失败: " + filename);
            }
            LoadFromJson(root);
        }

    private:
        Config() = default;
        std::mutex mutex_;

    public:
        size_t buffer_size = 4096;    // 缓冲区基础容量
        size_t threshold = 65536;     // 阈值容量，之前翻倍增长，之后线性增长
        size_t linear_growth = 4096;  // 线性增长容量
        size_t flush_log = 1;         // 控制日志同步到磁盘的时机，0不处理，1调用fflush，2调用fsync
    };

} // namespace logsystem
