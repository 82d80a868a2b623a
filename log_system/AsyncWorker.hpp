#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>

#include "AsyncBuffer.hpp"
namespace logsystem
{
    enum class AsyncType
    {
        BLOCKING_BOUNDED, // 固定容量，写不下就阻塞
        NONBLOCKING_GROW  // 可扩容，优先吞吐
    };
    using functor = std::function<void(logsystem::Buffer &)>; // 处理日志缓冲区的回调
    // 异步工作线程类
    class AsyncWorker
    {
    public:
        AsyncWorker(const logsystem::functor &cb, logsystem::AsyncType at = logsystem::AsyncType::BLOCKING_BOUNDED)
            : async_type_(at), stop_(false), callback_(cb)
        {
            // 所有成员初始化完成后再启动线程
            thread_ = std::thread(&logsystem::AsyncWorker::ThreadFunc, this);
        }

        AsyncWorker(const AsyncWorker &) = delete;
        AsyncWorker &operator=(const AsyncWorker &) = delete;

        ~AsyncWorker()
        {
            Stop();
        }
        void Stop()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stop_ = true;
            }
            cond_consumer_.notify_all();
            cond_productor_.notify_all();
            if (thread_.joinable())
            {
                thread_.join(); // 等待剩余日志刷完
            }
        }
        // 向生产者缓冲区推送数据
        void Push(const char *data, size_t len)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_)
            {
                std::cerr << "Push: 异步工作器已停止，无法推送数据" << std::endl;
                return;
            }
            if (async_type_ == logsystem::AsyncType::BLOCKING_BOUNDED)
            {
                // 阻塞有界缓冲区，等待直到空间足够；缓冲区为空时允许超长消息直接扩容写入
                cond_productor_.wait(lock, [this, len]()
                                     { return stop_ || buffer_productor_.isEmpty() || buffer_productor_.WriteableSize() >= len; });
                if (stop_)
                {
                    std::cerr << "Push: 异步工作器已停止，无法推送数据" << std::endl;
                    return;
                }
            }
            buffer_productor_.Push(data, len);
            cond_consumer_.notify_one(); // 通知消费者线程有新数据可处理
        }

    private:
        // 异步工作器的线程函数
        void ThreadFunc()
        {
            while (true)
            {
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    cond_consumer_.wait(lock, [this]()
                                        { return stop_ || !buffer_productor_.isEmpty(); });
                    if (stop_ && buffer_productor_.isEmpty())
                    {
                        return; // 停止且没有剩余数据，退出线程
                    }
                    buffer_productor_.Swap(buff_consumer_); // 交换生产者和消费者缓冲区
                    // 固定容量的缓冲区才需要唤醒
                    if (async_type_ == logsystem::AsyncType::BLOCKING_BOUNDED)
                        cond_productor_.notify_all();
                }
                try
                {
                    callback_(buff_consumer_);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "AsyncWorker: 日志落地失败: " << e.what() << std::endl;
                }
                buff_consumer_.reset();
            }
        }

    private:
        logsystem::AsyncType async_type_;        // 异步类型
        bool stop_;                              // 停止标志，受 mutex_ 保护
        std::mutex mutex_;                       // 互斥锁，保护缓冲区和条件变量
        logsystem::Buffer buffer_productor_;     // 生产者缓冲区
        logsystem::Buffer buff_consumer_;        // 消费者缓冲区
        std::condition_variable cond_productor_; // 生产者条件变量
        std::condition_variable cond_consumer_;  // 消费者条件变量
        logsystem::functor callback_;            // 回调函数
        std::thread thread_;                     // 异步工作器的线程
    };
} // namespace logsystem
