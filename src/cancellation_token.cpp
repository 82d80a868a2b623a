#include "cancellation_token.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace tickhive
{

struct CancellationToken::State
{
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::condition_variable cv;
    // 子令牌只保留弱引用，子令牌的生命周期由使用者决定
    std::vector<std::weak_ptr<State>> children;
};

CancellationToken::CancellationToken() : state_(std::make_shared<State>())
{
}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state))
{
}

void CancellationToken::cancel() const
{
    cancel_state(state_);
}

void CancellationToken::cancel_state(const std::shared_ptr<State>& state)
{
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mu);
        if (state->cancelled.load(std::memory_order_acquire))
        {
            return;
        }
        state->cancelled.store(true, std::memory_order_release);
        // 取消之后不会再挂新的子令牌，直接把列表拿出来
        children.swap(state->children);
    }
    state->cv.notify_all();

    // 不持有父令牌的锁去取消子令牌，避免锁嵌套
    for (auto& weak : children)
    {
        if (auto child = weak.lock())
        {
            cancel_state(child);
        }
    }
}

bool CancellationToken::is_cancelled() const
{
    return state_->cancelled.load(std::memory_order_acquire);
}

void CancellationToken::wait() const
{
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->cv.wait(lock, [this]() { return state_->cancelled.load(std::memory_order_acquire); });
}

bool CancellationToken::wait_for(std::chrono::nanoseconds timeout) const
{
    auto now = std::chrono::steady_clock::now();
    // 截止时刻溢出时等同于无限等待
    if (timeout > std::chrono::steady_clock::time_point::max() - now)
    {
        wait();
        return true;
    }
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_until(lock, now + timeout,
                                 [this]() { return state_->cancelled.load(std::memory_order_acquire); });
}

CancellationToken CancellationToken::child_token() const
{
    auto child = std::make_shared<State>();
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        if (!state_->cancelled.load(std::memory_order_acquire))
        {
            // 每个周期都会派生子令牌，挂新子令牌前清理掉已经释放的
            auto& children = state_->children;
            children.erase(std::remove_if(children.begin(), children.end(),
                                          [](const std::weak_ptr<State>& w) { return w.expired(); }),
                           children.end());
            children.push_back(child);
            return CancellationToken(child);
        }
    }
    // 父令牌已取消，子令牌生来就是取消状态
    child->cancelled.store(true, std::memory_order_release);
    return CancellationToken(child);
}

} // namespace tickhive
