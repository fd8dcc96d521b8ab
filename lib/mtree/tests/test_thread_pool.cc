#include "mtree/thread_pool.hpp"
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/resource.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace Mtree {

namespace {

    // 把地址空间限制在当前用量之上一点，新线程的栈很快就分配不出来
    bool limit_address_space(size_t headroom_bytes)
    {
        size_t pages = 0;
        std::ifstream statm("/proc/self/statm");
        if (!(statm >> pages)) {
            return false;
        }
        rlim_t limit = static_cast<rlim_t>(pages) * static_cast<rlim_t>(sysconf(_SC_PAGESIZE)) + headroom_bytes;
        struct rlimit rl = { limit, limit };
        return setrlimit(RLIMIT_AS, &rl) == 0;
    }

} // namespace

TEST(ThreadPoolTest, ReturnsValues)
{
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4U);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1U);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ExceptionPropagatesThroughFuture)
{
    ThreadPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    auto fine = pool.submit([] { return 1; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 1);
}

// 析构时队列中剩余的任务必须全部执行完
TEST(ThreadPoolTest, DestructorDrainsQueue)
{
    std::atomic<int> counter { 0 };
    {
        ThreadPool pool(2);
        for (int i = 0; i < 1000; ++i) {
            (void)pool.submit([&counter] { counter.fetch_add(1, std::memory_order_relaxed); });
        }
    }
    EXPECT_EQ(counter.load(), 1000);
}

// 部分线程已经启动后创建失败：构造函数必须 join 已启动的线程再抛出
TEST(ThreadPoolDeathTest, StartupFailureJoinsStartedWorkers)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(
        {
            if (!limit_address_space(size_t { 64 } << 20)) {
                std::_Exit(3);
            }
            try {
                ThreadPool pool(4096);
            } catch (const std::system_error&) {
                std::_Exit(0);
            } catch (const std::bad_alloc&) {
                std::_Exit(0);
            }
            std::_Exit(1);
        },
        ::testing::ExitedWithCode(0), "");
}

} // namespace Mtree
