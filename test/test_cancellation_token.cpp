// 取消令牌测试
#include "cancellation_token.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tickhive::CancellationToken;

static void check(bool cond, const std::string& what)
{
    if (!cond)
    {
        throw std::runtime_error("check failed: " + what);
    }
}

int main()
{
    try
    {
        // 根令牌
        {
            CancellationToken root;
            check(!root.is_cancelled(), "new root is not cancelled");
            root.cancel();
            check(root.is_cancelled(), "root cancelled");
            root.cancel(); // 幂等
            check(root.is_cancelled(), "cancel is idempotent");

            // 拷贝共享状态
            CancellationToken copy = root;
            check(copy.is_cancelled(), "copy shares state");
            std::cout << "root ok" << std::endl;
        }

        // 父子关系
        {
            CancellationToken root;
            CancellationToken child = root.child_token();
            CancellationToken sibling = root.child_token();
            CancellationToken grandchild = child.child_token();

            child.cancel();
            check(child.is_cancelled(), "child cancelled by itself");
            check(grandchild.is_cancelled(), "grandchild follows child");
            check(!root.is_cancelled(), "parent unaffected by child");
            check(!sibling.is_cancelled(), "sibling unaffected by child");

            root.cancel();
            check(sibling.is_cancelled(), "sibling follows root");

            CancellationToken late = root.child_token();
            check(late.is_cancelled(), "child of cancelled token is born cancelled");
            std::cout << "hierarchy ok" << std::endl;
        }

        // 深层传播
        {
            CancellationToken root;
            std::vector<CancellationToken> chain{root};
            for (int i = 0; i < 50; ++i)
            {
                chain.push_back(chain.back().child_token());
            }
            root.cancel();
            for (auto& t : chain)
            {
                check(t.is_cancelled(), "deep descendant cancelled");
            }
            std::cout << "deep chain ok" << std::endl;
        }

        // wait / wait_for
        {
            CancellationToken root;
            CancellationToken child = root.child_token();
            check(!child.wait_for(std::chrono::milliseconds(20)), "wait_for times out");

            auto start = std::chrono::steady_clock::now();
            std::thread canceller([root]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                root.cancel();
            });
            child.wait();
            auto elapsed = std::chrono::steady_clock::now() - start;
            canceller.join();
            check(child.is_cancelled(), "wait returns after parent cancel");
            check(elapsed >= std::chrono::milliseconds(90), "wait actually blocked");

            // 已取消时立即返回
            check(child.wait_for(std::chrono::seconds(10)), "wait_for on cancelled token returns true");
            child.wait();
            std::cout << "wait ok" << std::endl;
        }

        // 超时大到截止时刻溢出: 按无限等待处理，只有取消能唤醒
        {
            CancellationToken token;
            std::atomic<bool> returned{false};
            bool result = false;
            std::thread waiter([&token, &returned, &result]() {
                result = token.wait_for(std::chrono::nanoseconds::max());
                returned = true;
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            check(!returned, "huge timeout does not return immediately");
            token.cancel();
            waiter.join();
            check(result, "huge timeout returns true after cancel");
            std::cout << "huge timeout ok" << std::endl;
        }

        // 并发取消和派生
        {
            CancellationToken root;
            std::atomic<int> observed{0};
            std::vector<std::thread> threads;
            for (int i = 0; i < 16; ++i)
            {
                threads.emplace_back([root, &observed]() {
                    CancellationToken mine = root.child_token();
                    for (int j = 0; j < 100; ++j)
                    {
                        CancellationToken scratch = mine.child_token();
                        (void)scratch;
                    }
                    mine.wait();
                    ++observed;
                });
            }
            std::vector<std::thread> cancellers;
            for (int i = 0; i < 4; ++i)
            {
                cancellers.emplace_back([root]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    root.cancel();
                });
            }
            for (auto& t : cancellers) t.join();
            for (auto& t : threads) t.join();
            check(observed == 16, "every waiter observed cancellation");
            std::cout << "concurrent ok" << std::endl;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "test_cancellation_token exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
