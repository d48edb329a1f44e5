//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <atomic>
#include <vector>
#include <stdexcept>

#include "error.hpp"
#include "context.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "event_loop.hpp"
#include "scheduler.hpp"
#include "nursery.hpp"
#include "adapters.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace adapters {

inline heb::co<int> co_await_future(heb::future<int> f) {
    co_return co_await heb::get_loop()->await_future(std::move(f));
}

inline heb::co<std::thread::id> co_to_thread() {
    co_return co_await heb::to_thread([]{ return std::this_thread::get_id(); });
}

inline heb::co<bool> co_next_cycle() {
    auto loop = heb::get_loop();
    co_await loop->await_future(loop->next_cycle());
    co_return true;
}

inline heb::co<bool> co_cancelled_cycle() {
    auto loop = heb::get_loop();
    heb::scheduler::current_task()->cancel();
    bool raised = false;

    try {
        co_await loop->await_future(loop->next_cycle());
    } catch(const heb::scheduler::cancelled_exception&) {
        raised = true;
    }

    co_return raised;
}

}
}

// the installed loop is always reset
struct scheduler_loop : public ::testing::Test {
    void TearDown() override { heb::reset_loop(); }
};

// a scheduler running on its own thread and installed as the loop
struct running_loop : public scheduler_loop {
    void SetUp() override {
        sch = heb::scheduler::make();
        auto s = sch;
        thd = std::thread([s]{ s->run(); });
        heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));
    }

    void TearDown() override {
        heb::reset_loop();
        sch->stop();
        thd.join();
        sch.reset();
    }

    std::shared_ptr<heb::scheduler> sch;
    std::thread thd;
};

TEST_F(running_loop, from_thread_runs_on_scheduler) {
    EXPECT_EQ(heb::scheduler_loop::info_name(), heb::get_loop()->name());

    auto f = heb::get_loop()->from_thread([]{ return std::this_thread::get_id(); });
    EXPECT_EQ(thd.get_id(), f.result());

    auto e = heb::get_loop()->from_thread([]() -> int { throw std::runtime_error("fail"); });
    EXPECT_THROW(e.result(), std::runtime_error);
}

TEST_F(running_loop, from_thread_copies_context) {
    heb::context_var<int> var("test::adapters::var");
    heb::context ctx;
    heb::future<int> f;

    ctx.run([&]{
        var.set(3);
        f = heb::get_loop()->from_thread([&]{ return var.get(-1); });
    });

    EXPECT_EQ(3, f.result());
}

TEST_F(running_loop, await_parks_task) {
    heb::future<int> f;
    auto j = sch->spawn(test::adapters::co_await_future(f));

    // the scheduler thread is not blocked by the awaiting task
    test::queue<std::thread::id> q;
    sch->post([&]{ q.push(std::this_thread::get_id()); });
    EXPECT_EQ(thd.get_id(), q.pop());
    EXPECT_FALSE(j.done());

    f.set_result(4);
    EXPECT_EQ(4, j.result());
}

TEST_F(running_loop, cancel_awaiting_task) {
    heb::future<int> f;
    auto j = sch->spawn(test::adapters::co_await_future(f));
    EXPECT_FALSE(j.get_future().wait(std::chrono::milliseconds(10)));

    j.cancel();
    EXPECT_THROW(j.result(), heb::cancelled_error);
}

TEST_F(running_loop, to_thread_from_task) {
    auto j = sch->spawn(test::adapters::co_to_thread());
    auto id = j.result();
    EXPECT_NE(thd.get_id(), id);
    EXPECT_NE(std::this_thread::get_id(), id);
}

TEST_F(running_loop, await_outside_task_blocks) {
    auto a = heb::get_loop()->to_thread([]{ return 3; });
    EXPECT_EQ(3, a.get());

    heb::future<int> f;
    auto co = test::adapters::co_await_future(f);
    std::thread setter([f]() mutable { f.set_result(5); });

    co.resume();
    setter.join();
    EXPECT_TRUE(co.done());
    EXPECT_EQ(5, co.result());
}

TEST_F(scheduler_loop, next_cycle) {
    auto sch = heb::scheduler::make();
    heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));

    EXPECT_TRUE(sch->run_until_complete(test::adapters::co_next_cycle()));
    EXPECT_TRUE(sch->run_until_complete(test::adapters::co_cancelled_cycle()));
}

TEST_F(scheduler_loop, throw_if_cancelled) {
    auto sch = heb::scheduler::make();
    auto loop = std::make_shared<heb::scheduler_loop>(sch);

    // outside of a task nothing is cancelled
    EXPECT_NO_THROW(loop->throw_if_cancelled());
    EXPECT_THROW(loop->wrap_cancelled([]() -> int { throw heb::cancelled(); }),
                 heb::scheduler::cancelled_exception);
    EXPECT_EQ(sch, loop->get_scheduler());
}

TEST_F(scheduler_loop, nursery_loop_attach_detach) {
    auto sch = heb::scheduler::make();
    auto n = heb::nursery::make(sch);
    auto loop = std::make_shared<heb::nursery_loop>(n);

    // unusable until attached
    EXPECT_FALSE(loop->get_scheduler());
    EXPECT_THROW(loop->from_thread([]{ return 1; }), heb::configuration_error);
    EXPECT_THROW(loop->next_cycle(), heb::configuration_error);

    heb::set_loop(loop);
    EXPECT_EQ(sch, loop->get_scheduler());
    EXPECT_EQ(n, loop->get_nursery());
    EXPECT_EQ(heb::nursery_loop::info_name(), heb::get_loop()->name());

    auto f = heb::get_loop()->from_thread([]{ return 2; });
    sch->run_until_complete(test::adapters::co_next_cycle());
    EXPECT_EQ(2, f.result());

    heb::reset_loop();
    EXPECT_FALSE(loop->get_scheduler());
    EXPECT_TRUE(n->cancel_called());
}

TEST_F(scheduler_loop, nursery_loop_cancelled_nursery) {
    auto sch = heb::scheduler::make();
    auto n = heb::nursery::make(sch);
    n->cancel();

    test::warning_counter wc;
    EXPECT_THROW(heb::set_loop(std::make_shared<heb::nursery_loop>(n)), heb::configuration_error);
    EXPECT_EQ(1u, wc.count());
    EXPECT_EQ(heb::no_loop::info_name(), heb::get_loop()->name());
}

TEST_F(scheduler_loop, nursery_loop_cancellation) {
    auto sch = heb::scheduler::make();
    auto n = heb::nursery::make(sch);
    auto loop = std::make_shared<heb::nursery_loop>(n);
    heb::set_loop(loop);

    EXPECT_NO_THROW(loop->throw_if_cancelled());

    // cancelling the nursery cancels every caller of the loop
    n->cancel();
    EXPECT_THROW(loop->throw_if_cancelled(), heb::cancelled);
    EXPECT_THROW(loop->wrap_cancelled([]() -> int { throw heb::cancelled(); }),
                 heb::nursery::cancelled_exception);
}

TEST_F(scheduler_loop, nursery_loop_limits_threads) {
    auto sch = heb::scheduler::make();
    auto n = heb::nursery::make(sch);
    auto limiter = std::make_shared<heb::capacity_limiter>(1);
    auto loop = std::make_shared<heb::nursery_loop>(n, limiter);

    std::atomic<size_t> running(0);
    std::atomic<size_t> most(0);

    auto op = [&]{
        size_t r = ++running;
        size_t m = most.load();
        while(r > m && !most.compare_exchange_weak(m, r)) { }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
    };

    std::vector<heb::event_loop::awaiter<void>> awaiters;
    for(size_t i=0; i<4; ++i) { awaiters.push_back(loop->to_thread(op)); }
    for(auto& a : awaiters) { a.get(); }

    EXPECT_EQ(1u, most.load());
    EXPECT_TRUE(test::eventually([&]{ return limiter->borrowed() == 0; }));
}
