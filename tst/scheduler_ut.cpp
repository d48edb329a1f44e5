//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <stdexcept>

#include "utility.hpp"
#include "context.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace scheduler {

template <typename T>
inline heb::co<T> co_return_T(T t) {
    co_return t;
}

inline heb::co<int> co_throw() {
    throw std::runtime_error("fail");
    co_return 0;
}

inline heb::co<int> co_park(heb::future<void> f, int ret) {
    co_await test::park_until(std::move(f));
    co_return ret;
}

inline heb::co<bool> co_in(heb::scheduler* sch) {
    co_return heb::scheduler::in() && &(heb::scheduler::local()) == sch;
}

inline heb::co<bool> co_has_task() {
    co_return (bool)heb::scheduler::current_task();
}

inline heb::co<int> co_read_and_write(heb::context_var<int>& var) {
    int v = var.get(-1);
    var.set(v + 1);
    co_return var.get(-1);
}

}
}

TEST(scheduler, spawn_and_run) {
    auto sch = heb::scheduler::make();
    std::thread thd([sch]{ sch->run(); });

    auto j = sch->spawn(test::scheduler::co_return_T<int>(3));
    EXPECT_EQ(3, j.result());

    auto js = sch->spawn(test::scheduler::co_return_T<std::string>("three"));
    EXPECT_EQ(std::string("three"), js.result());

    auto jo = sch->spawn(test::scheduler::co_return_T<test::CustomObject>(test::CustomObject(3)));
    EXPECT_EQ(test::CustomObject(3), jo.result());

    sch->stop();
    thd.join();
    EXPECT_EQ(0u, sch->task_count());
}

TEST(scheduler, run_until_complete) {
    auto sch = heb::scheduler::make();
    EXPECT_EQ(3, sch->run_until_complete(test::scheduler::co_return_T<int>(3)));
    EXPECT_EQ(0u, sch->task_count());

    // the scheduler can run again
    EXPECT_EQ(4, sch->run_until_complete(test::scheduler::co_return_T<int>(4)));
    EXPECT_THROW(sch->run_until_complete(test::scheduler::co_throw()), std::runtime_error);
}

TEST(scheduler, exception) {
    auto sch = heb::scheduler::make();
    std::thread thd([sch]{ sch->run(); });

    auto j = sch->spawn(test::scheduler::co_throw());
    EXPECT_THROW(j.result(), std::runtime_error);

    sch->stop();
    thd.join();
}

TEST(scheduler, post_from_thread) {
    auto sch = heb::scheduler::make();
    test::queue<std::thread::id> ids;
    test::queue<bool> ins;

    EXPECT_FALSE(heb::scheduler::in());

    std::thread thd([sch]{ sch->run(); });

    sch->post([&]{
        ids.push(std::this_thread::get_id());
        ins.push(heb::scheduler::in());
    });

    EXPECT_EQ(thd.get_id(), ids.pop());
    EXPECT_TRUE(ins.pop());

    // an operation which throws does not stop the scheduler
    sch->post([]{ throw std::runtime_error("fail"); });
    sch->post([&]{ ids.push(std::this_thread::get_id()); });
    EXPECT_EQ(thd.get_id(), ids.pop());

    sch->stop();
    thd.join();
}

TEST(scheduler, in_and_local) {
    auto sch = heb::scheduler::make();
    EXPECT_TRUE(sch->run_until_complete(test::scheduler::co_in(sch.get())));
    EXPECT_TRUE(sch->run_until_complete(test::scheduler::co_has_task()));

    EXPECT_FALSE(heb::scheduler::in());
    EXPECT_FALSE(heb::scheduler::current_task());
}

TEST(scheduler, park_and_wake) {
    auto sch = heb::scheduler::make();
    std::thread thd([sch]{ sch->run(); });

    heb::future<void> f;
    auto j = sch->spawn(test::scheduler::co_park(f, 5));
    EXPECT_FALSE(j.get_future().wait(std::chrono::milliseconds(10)));
    EXPECT_FALSE(j.done());
    EXPECT_EQ(1u, sch->task_count());

    f.set_result();
    EXPECT_EQ(5, j.result());

    sch->stop();
    thd.join();
    EXPECT_EQ(0u, sch->task_count());
}

TEST(scheduler, cancel_parked) {
    auto sch = heb::scheduler::make();
    std::thread thd([sch]{ sch->run(); });

    heb::future<void> f;
    auto j = sch->spawn(test::scheduler::co_park(f, 5));
    EXPECT_FALSE(j.done());

    j.cancel();
    EXPECT_THROW(j.result(), heb::cancelled_error);

    // the task resumed exactly once
    f.set_result();

    sch->stop();
    thd.join();
    EXPECT_EQ(0u, sch->task_count());
}

TEST(scheduler, cancel_before_start) {
    auto sch = heb::scheduler::make();

    auto j = sch->spawn(test::scheduler::co_return_T<int>(3));
    j.cancel();

    // the tasks execute in submission order
    sch->run_until_complete(test::scheduler::co_return_T<int>(0));
    EXPECT_TRUE(j.done());
    EXPECT_THROW(j.result(), heb::cancelled_error);
}

TEST(scheduler, context_copied_per_task) {
    heb::context_var<int> var("test::scheduler::var");
    heb::context ctx;

    ctx.run([&]{
        var.set(1);
        auto sch = heb::scheduler::make();

        EXPECT_EQ(2, sch->run_until_complete(test::scheduler::co_read_and_write(var)));
        EXPECT_EQ(2, sch->run_until_complete(test::scheduler::co_read_and_write(var)));

        // the writes of the tasks never leak into the spawning context
        EXPECT_EQ(1, var.get(-1));
    });
}

TEST(scheduler, abandoned_tasks_are_cancelled) {
    auto sch = heb::scheduler::make();
    auto j = sch->spawn(test::scheduler::co_return_T<int>(3));
    EXPECT_EQ(1u, sch->task_count());

    {
        test::warning_counter wc;
        sch.reset();
        EXPECT_EQ(1u, wc.count());
    }

    EXPECT_TRUE(j.done());
    EXPECT_THROW(j.result(), heb::cancelled_error);
}

TEST(scheduler, content) {
    auto sch = heb::scheduler::make();
    auto j = sch->spawn(test::scheduler::co_return_T<int>(3));
    EXPECT_NE(std::string::npos, sch->to_string().find("tasks:1"));

    sch->run_until_complete(test::scheduler::co_return_T<int>(0));
    EXPECT_NE(std::string::npos, sch->to_string().find("tasks:0"));
}
