#pragma once
#include <algorithm>
#include <vector>
#include "Util.hpp"

namespace logsystem
{
    // 日志缓冲类
    class Buffer
    {
    public:
        Buffer() : write_pos_(0), read_pos_(0)
        {
            buffer_.resize(logsystem::Config::GetInstance()->buffer_size); // 初始化缓冲区
        }
        // 写入日志到缓冲区
        void Push(const char *data, size_t size)
        {
            TobeEnough(size);
            // 若写入超出了当前 size，需要先扩展 size()，否则 std::copy 会越界
            if (write_pos_ + size > buffer_.size())
            {
                buffer_.resize(write_pos_ + size);
            }
            std::copy(data, data + size, buffer_.begin() + write_pos_);
            write_pos_ += size;
        }
        bool isEmpty() const
        {
            return write_pos_ == read_pos_;
        }

        // 交换缓冲区
        void Swap(Buffer &other)
        {
            buffer_.swap(other.buffer_);
            std::swap(write_pos_, other.write_pos_);
            std::swap(read_pos_, other.read_pos_);
        }
        // 写空间剩余容量
        size_t WriteableSize() const
        {
            return buffer_.capacity() - write_pos_;
        }
        // 读空间剩余容量
        size_t ReadableSize() const
        {
            return write_pos_ - read_pos_;
        }

        // 重置缓冲区
        void reset()
        {
            write_pos_ = 0;
            read_pos_ = 0;
        }
        const char *Begin() const { return buffer_.data() + read_pos_; }

    private:
        // 检查缓冲区空间是否足够，不够则扩容
        void TobeEnough(size_t len)
        {
            const logsystem::Config *config = logsystem::Config::GetInstance();
            size_t cap = buffer_.capacity();
            size_t need_cap = len + write_pos_;
            if (cap == 0)
            {
                cap = config->buffer_size;
            }
            while (cap < need_cap)
            {
                if (cap < config->threshold)
                {
                    cap *= 2;
                }
                else
                {
                    cap += config->linear_growth;
                }
            }
            buffer_.reserve(cap);
        }

    private:
        std::vector<char> buffer_; // 日志缓冲区
        size_t write_pos_;         // 写入位置
        size_t read_pos_;          // 读位置
    };
} // namespace logsystem
