//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <vector>

#include "error.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "native.hpp"
#include "event_loop.hpp"
#include "scheduler.hpp"
#include "adapters.hpp"
#include "hospice.hpp"
#include "unified.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace unified_future {

// a scoped resource recording how it was used
struct resource {
    inline int enter() {
        ++entered;
        return 3;
    }

    inline void exit(std::exception_ptr eptr) {
        ++exited;
        failed = (bool)eptr;
    }

    size_t entered = 0;
    size_t exited = 0;
    bool failed = false;
};

// a scoped resource without an entered value
struct lock {
    inline void enter() { held = true; }
    inline void exit(std::exception_ptr) { held = false; }

    bool held = false;
};

// a scoped resource entered and exited asynchronously
struct async_resource {
    inline heb::co<int> async_enter() {
        ++entered;
        co_return 4;
    }

    inline heb::co<void> async_exit(std::exception_ptr eptr) {
        ++exited;
        failed = (bool)eptr;
        co_return;
    }

    size_t entered = 0;
    size_t exited = 0;
    bool failed = false;
};

inline heb::future<int> request(int i) {
    return heb::make_ready_future<int>(i);
}

inline heb::co<int> co_value(int i) {
    co_return i;
}

inline heb::future<int> failing_request() {
    throw std::runtime_error("fail");
}

}
}

struct unified_future_environment : public test::policy_fixture {
    void TearDown() override {
        heb::reset_loop();
        test::policy_fixture::TearDown();
    }
};

TEST(unified_future, from_call) {
    auto u = heb::unified_future<int>::from_call(test::unified_future::request, 3);
    EXPECT_TRUE(u.done());
    EXPECT_EQ(3, u.result());

    // a Callable which throws rejects the result
    auto e = heb::unified_future<int>::from_call(test::unified_future::failing_request);
    EXPECT_TRUE(e.done());
    EXPECT_THROW(e.result(), std::runtime_error);
    EXPECT_TRUE(e.exception());
}

TEST(unified_future, shares_future) {
    heb::future<int> f;
    heb::unified_future<int> u(f);
    auto cpy = u;

    EXPECT_FALSE(u.done());
    EXPECT_FALSE(u.wait(std::chrono::milliseconds(10)));

    std::thread thd([f]() mutable { f.set_result(5); });
    EXPECT_EQ(5, u.result());
    EXPECT_EQ(5, cpy.result());
    EXPECT_TRUE(u.get_future() == f);
    thd.join();
}

TEST(unified_future, resolve_reject) {
    EXPECT_EQ(1, heb::unified_future<int>::resolve(1).result());
    EXPECT_NO_THROW(heb::unified_future<void>::resolve().result());
    EXPECT_THROW(heb::unified_future<int>::reject(std::runtime_error("fail")).result(),
                 std::runtime_error);
}

TEST(unified_future, cancel) {
    heb::unified_future<int> u(heb::future<int>{});
    EXPECT_TRUE(u.cancel());
    EXPECT_TRUE(u.cancelled());
    EXPECT_THROW(u.result(), heb::cancelled_error);

    // derived results are cancelled too
    auto d = u.map([](int i) { return i + 1; });
    EXPECT_TRUE(d.cancelled());
}

TEST(unified_future, then) {
    heb::future<int> f;
    heb::unified_future<int> u(f);

    auto d = u.then([](int i) { return std::to_string(i); },
                    [](std::exception_ptr) { return std::string("error"); });

    EXPECT_FALSE(d.done());
    f.set_result(3);
    EXPECT_EQ(std::string("3"), d.result());

    auto r = heb::unified_future<int>::reject(std::runtime_error("fail"));
    auto rd = r.then([](int i) { return std::to_string(i); },
                     [](std::exception_ptr) { return std::string("error"); });
    EXPECT_EQ(std::string("error"), rd.result());
}

TEST(unified_future, then_callback_throws) {
    auto u = heb::unified_future<int>::resolve(3);

    // never throws synchronously
    heb::unified_future<int> d;
    EXPECT_NO_THROW(d = u.map([](int) -> int { throw std::logic_error("fail"); }));
    EXPECT_THROW(d.result(), std::logic_error);

    auto r = heb::unified_future<int>::reject(std::runtime_error("fail"));
    auto rd = r.then([](int i) { return i; },
                     [](std::exception_ptr) -> int { throw std::logic_error("fail"); });
    EXPECT_THROW(rd.result(), std::logic_error);
}

TEST(unified_future, map) {
    auto u = heb::unified_future<int>::resolve(3);
    EXPECT_EQ(6, u.map([](int i) { return i * 2; }).result());
    EXPECT_EQ(std::string("3"), u.map([](int i) { return std::to_string(i); }).result());

    // a rejection passes through unchanged
    auto r = heb::unified_future<int>::reject(std::runtime_error("fail"));
    EXPECT_THROW(r.map([](int i) { return i * 2; }).result(), std::runtime_error);

    auto v = heb::unified_future<void>::resolve();
    EXPECT_EQ(1, v.map([]{ return 1; }).result());
}

TEST(unified_future, plain_value_types) {
    auto s = heb::unified_future<std::string>::resolve("a");
    EXPECT_EQ(std::string("ab"), s.map([](std::string& v) { return v + "b"; }).result());

    heb::future<void> f;
    heb::unified_future<void> v(f);
    EXPECT_FALSE(v.done());

    f.set_result();
    EXPECT_TRUE(v.done());
    EXPECT_NO_THROW(v.result());

    // the result of a job is observed through a const future
    auto sch = heb::scheduler::make();
    auto j = sch->spawn(test::unified_future::co_value(5));
    std::string observed;

    j.get_future().add_done_callback([&](heb::future<int> r) {
        observed = std::to_string(r.result());
    });

    sch->run_until_complete(test::unified_future::co_value(0));
    EXPECT_EQ(std::string("5"), observed);
}

TEST(unified_future, catch_error) {
    auto r = heb::unified_future<int>::reject(std::runtime_error("fail"));
    EXPECT_EQ(-1, r.catch_error([](std::exception_ptr) { return -1; }).result());

    auto u = heb::unified_future<int>::resolve(3);
    EXPECT_EQ(3, u.catch_error([](std::exception_ptr) { return -1; }).result());

    auto rv = heb::unified_future<void>::reject(std::runtime_error("fail"));
    EXPECT_NO_THROW(rv.catch_error([](std::exception_ptr) { }).result());
}

TEST(unified_future, add_done_callback) {
    heb::future<int> f;
    heb::unified_future<int> u(f);
    std::vector<int> order;

    u.add_done_callback([&](heb::unified_future<int> d) { order.push_back(d.result()); });
    u.add_done_callback([&](heb::unified_future<int>) { order.push_back(2); });
    EXPECT_TRUE(order.empty());

    f.set_result(1);
    ASSERT_EQ(2u, order.size());
    EXPECT_EQ(1, order[0]);
    EXPECT_EQ(2, order[1]);
}

TEST_F(unified_future_environment, add_done_callback_keeps_environment) {
    auto p = make_policy(heb::environment_store::thread);
    auto env = p->new_environment();
    auto& rt = heb::service<heb::native::runtime>::get();

    heb::future<int> f;
    test::queue<std::shared_ptr<heb::native::environment_data>> q;

    {
        auto s = env.use();
        heb::unified_future<int> u(f);
        u.add_done_callback([&](heb::unified_future<int>) {
            q.push(rt.current_environment());
        });
    }

    // resolved on a thread which never entered the environment
    std::thread thd([f]() mutable { f.set_result(1); });
    thd.join();
    EXPECT_EQ(env.data(), q.pop());

    env.dispose();
    EXPECT_FALSE(heb::service<heb::hospice>::get().any_alive());
}

TEST_F(unified_future_environment, add_loop_callback) {
    auto sch = heb::scheduler::make();
    std::thread sthd([sch]{ sch->run(); });
    heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));

    heb::future<int> f;
    heb::unified_future<int> u(f);
    test::queue<std::thread::id> q;

    u.add_loop_callback([&](heb::unified_future<int> d) {
        EXPECT_EQ(1, d.result());
        q.push(std::this_thread::get_id());
    });

    std::thread thd([f]() mutable { f.set_result(1); });
    thd.join();

    // executes on the loop, not on the resolving thread
    EXPECT_EQ(sthd.get_id(), q.pop());

    heb::reset_loop();
    sch->stop();
    sthd.join();
}

TEST(unified_future, co_await) {
    heb::reset_loop();
    heb::future<int> f;
    heb::unified_future<int> u(f);

    auto co = [](heb::unified_future<int> uf) -> heb::co<int> {
        co_return co_await uf;
    }(u);

    std::thread thd([f]() mutable { f.set_result(2); });
    co.resume();
    thd.join();

    EXPECT_TRUE(co.done());
    EXPECT_EQ(2, co.result());
}

TEST(unified_future, with) {
    auto r = std::make_shared<test::unified_future::resource>();
    auto u = heb::unified_future<std::shared_ptr<test::unified_future::resource>>::resolve(r);

    EXPECT_EQ(4, u.with([](int v) { return v + 1; }));
    EXPECT_EQ(1u, r->entered);
    EXPECT_EQ(1u, r->exited);
    EXPECT_FALSE(r->failed);

    // exit receives the exception thrown by the body
    EXPECT_THROW(u.with([](int) -> int { throw std::runtime_error("fail"); }),
                 std::runtime_error);
    EXPECT_EQ(2u, r->entered);
    EXPECT_EQ(2u, r->exited);
    EXPECT_TRUE(r->failed);

    auto l = std::make_shared<test::unified_future::lock>();
    auto ul = heb::unified_future<std::shared_ptr<test::unified_future::lock>>::resolve(l);
    bool held = false;
    ul.with([&]{ held = l->held; });
    EXPECT_TRUE(held);
    EXPECT_FALSE(l->held);

    // a rejected result never enters
    auto e = heb::unified_future<std::shared_ptr<test::unified_future::resource>>::reject(
        std::runtime_error("fail"));
    EXPECT_THROW(e.with([](int v) { return v; }), std::runtime_error);
    EXPECT_EQ(2u, r->entered);
}

TEST(unified_future, async_with) {
    heb::reset_loop();

    auto r = std::make_shared<test::unified_future::async_resource>();
    auto u = heb::unified_future<std::shared_ptr<test::unified_future::async_resource>>::resolve(r);

    auto co = u.async_with([](int v) { return v + 1; });
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_EQ(5, co.result());
    EXPECT_EQ(1u, r->entered);
    EXPECT_EQ(1u, r->exited);
    EXPECT_FALSE(r->failed);

    auto failing = u.async_with([](int) -> int { throw std::runtime_error("fail"); });
    failing.resume();
    EXPECT_THROW(failing.result(), std::runtime_error);
    EXPECT_EQ(2u, r->exited);
    EXPECT_TRUE(r->failed);

    // synchronous resources work too
    auto s = std::make_shared<test::unified_future::resource>();
    auto us = heb::unified_future<std::shared_ptr<test::unified_future::resource>>::resolve(s);
    auto sco = us.async_with([](int v) { return v * 2; });
    sco.resume();
    EXPECT_EQ(6, sco.result());
    EXPECT_EQ(1u, s->exited);
}

TEST(unified_future, content) {
    heb::future<int> f;
    heb::unified_future<int> u(f);
    EXPECT_EQ(std::string("pending"), u.content());
    f.set_result(1);
    EXPECT_EQ(std::string("resolved"), u.content());
}
