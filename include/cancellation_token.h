#pragma once
#include <chrono>
#include <memory>

namespace tickhive
{

// 分层的协作式取消令牌
// 拷贝令牌共享同一个状态；取消父令牌会取消所有子孙令牌，取消子令牌不影响父令牌和兄弟令牌
class CancellationToken
{
public:
    // 创建一个新的根令牌
    CancellationToken();

    // 取消令牌（幂等），并传递给所有子孙令牌
    void cancel() const;

    // 是否已取消，不阻塞
    bool is_cancelled() const;

    // 阻塞直到令牌（或其祖先）被取消，已取消则立即返回
    void wait() const;

    // 在超时前等待取消
    // 返回 true 表示被取消，false 表示超时
    bool wait_for(std::chrono::nanoseconds timeout) const;

    // 派生子令牌：父令牌取消时子令牌一起取消，子令牌可以单独取消
    CancellationToken child_token() const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    static void cancel_state(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace tickhive
