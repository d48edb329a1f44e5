//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <atomic>
#include <stdexcept>

#include "error.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"
#include "nursery.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace nursery {

inline heb::co<int> co_park(heb::future<void> f, int ret) {
    co_await test::park_until(std::move(f));
    co_return ret;
}

inline heb::co<void> co_throw() {
    throw std::runtime_error("fail");
    co_return;
}

inline heb::co<void> co_flag(std::atomic<bool>& flag) {
    flag = true;
    co_return;
}

}
}

// a scheduler running on its own thread for the duration of a test
struct nursery : public ::testing::Test {
    void SetUp() override {
        sch = heb::scheduler::make();
        auto s = sch;
        thd = std::thread([s]{ s->run(); });
    }

    void TearDown() override {
        sch->stop();
        thd.join();
        sch.reset();
    }

    std::shared_ptr<heb::scheduler> sch;
    std::thread thd;
};

TEST_F(nursery, empty_join) {
    auto n = heb::nursery::make(sch);
    EXPECT_EQ(sch, n->get_scheduler());

    auto joined = n->join();
    EXPECT_TRUE(joined.done());
    EXPECT_NO_THROW(joined.result());
}

TEST_F(nursery, join_waits_for_children) {
    auto n = heb::nursery::make(sch);
    heb::future<void> f1;
    heb::future<void> f2;

    n->start_soon(test::nursery::co_park(f1, 1));
    n->start_soon(test::nursery::co_park(f2, 2));
    EXPECT_EQ(2u, n->children());

    auto joined = n->join();
    EXPECT_FALSE(joined.wait(std::chrono::milliseconds(10)));

    f1.set_result();
    EXPECT_TRUE(test::eventually([&]{ return n->children() == 1; }));
    EXPECT_FALSE(joined.done());

    f2.set_result();
    EXPECT_NO_THROW(joined.result());
    EXPECT_EQ(0u, n->children());
    EXPECT_FALSE(n->cancel_called());
}

TEST_F(nursery, first_failure_cancels_siblings) {
    auto n = heb::nursery::make(sch);
    heb::future<void> never;

    n->start_soon(test::nursery::co_park(never, 1));
    n->start_soon(test::nursery::co_throw());

    auto joined = n->join();
    EXPECT_THROW(joined.result(), std::runtime_error);
    EXPECT_TRUE(n->cancel_called());
    EXPECT_EQ(0u, n->children());
}

TEST_F(nursery, start_soon_after_join_throws) {
    auto n = heb::nursery::make(sch);
    auto joined = n->join();

    EXPECT_THROW(n->start_soon(test::nursery::co_throw()), heb::configuration_error);
    EXPECT_NO_THROW(joined.result());
}

TEST_F(nursery, cancel) {
    auto n = heb::nursery::make(sch);
    heb::future<void> never;

    n->start_soon(test::nursery::co_park(never, 1));
    n->cancel();
    EXPECT_TRUE(n->cancel_called());

    // a child started in a cancelled nursery never executes
    std::atomic<bool> executed(false);
    n->start_soon(test::nursery::co_flag(executed));

    // cancelled children are not failures
    auto joined = n->join();
    EXPECT_NO_THROW(joined.result());
    EXPECT_FALSE(executed);
}

TEST_F(nursery, content) {
    auto n = heb::nursery::make(sch);
    EXPECT_NE(std::string::npos, n->to_string().find("children:0"));
    n->cancel();
    EXPECT_NE(std::string::npos, n->to_string().find("cancelled:true"));
}

TEST(capacity_limiter, acquire_release) {
    heb::capacity_limiter l(2);
    EXPECT_EQ(2u, l.total());
    EXPECT_EQ(0u, l.borrowed());

    l.acquire();
    l.acquire();
    EXPECT_EQ(2u, l.borrowed());

    std::atomic<bool> acquired(false);

    std::thread thd([&]{
        heb::capacity_limiter::token tk(l);
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_FALSE(acquired);

    l.release();
    thd.join();
    EXPECT_TRUE(acquired);

    l.release();
    EXPECT_EQ(0u, l.borrowed());
}

TEST(capacity_limiter, token) {
    heb::capacity_limiter l(1);

    {
        heb::capacity_limiter::token tk(l);
        EXPECT_EQ(1u, l.borrowed());
    }

    EXPECT_EQ(0u, l.borrowed());

    // at least one token is always available
    heb::capacity_limiter zero(0);
    EXPECT_EQ(1u, zero.total());
}
