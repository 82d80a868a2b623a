#pragma once
#include <chrono>
#include <string>

#include "cancellation_token.h"

namespace tickhive
{

// 周期任务
// 使用者继承并按需重写，所有方法都有默认实现
class Job
{
public:
    virtual ~Job() = default;

    // 执行周期，必须大于0，默认1秒
    virtual std::chrono::nanoseconds period() const { return std::chrono::seconds(1); }

    // 是否按周期的整数倍对齐到绝对时间（自 Unix 纪元起），默认开启
    // 例如周期2秒时在 :00 :02 :04 唤醒，而不是相对循环启动时间
    virtual bool with_truncate_time() const { return true; }

    // 为 true 时每个周期调用 run_with_cancel，否则调用 run
    virtual bool with_cancel() const { return false; }

    virtual void run() {}

    // token 是本次执行专属的子令牌，实现者需要自己检查并在取消后尽快返回
    virtual void run_with_cancel(const CancellationToken& token) { (void)token; }

    // 日志里使用的任务名
    virtual std::string name() const { return "job"; }
};

} // namespace tickhive
