//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <functional>
#include <stdexcept>

#include "service.hpp"
#include "native.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "hospice.hpp"
#include "event_loop.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace event_loop {

// an inline loop recording its ownership lifecycle
struct recording_loop : public heb::no_loop {
    recording_loop(bool fail_attach = false) : fail_attach_(fail_attach) { }

    static inline std::string info_name() { return "test::event_loop::recording_loop"; }
    inline std::string name() const { return recording_loop::info_name(); }

    inline void attach() {
        ++attached;
        if(fail_attach_) { throw std::runtime_error("attach failed"); }
    }

    inline void detach() { ++detached; }

    size_t attached = 0;
    size_t detached = 0;

private:
    const bool fail_attach_;
};

inline heb::co<int> co_await_future(heb::future<int> f) {
    co_return co_await heb::get_loop()->await_future(std::move(f));
}

inline heb::co<std::thread::id> co_to_thread() {
    co_return co_await heb::to_thread([]{ return std::this_thread::get_id(); });
}

}
}

// a registered policy and the installed loop are reset after every test
struct event_loop_environment : public test::policy_fixture {
    void TearDown() override {
        heb::reset_loop();
        test::policy_fixture::TearDown();
    }
};

TEST(event_loop, default_is_no_loop) {
    heb::reset_loop();
    EXPECT_EQ(heb::no_loop::info_name(), heb::get_loop()->name());
}

TEST(event_loop, no_loop_from_thread_is_inline) {
    heb::reset_loop();
    bool executed = false;
    auto self = std::this_thread::get_id();

    auto f = heb::get_loop()->from_thread([&](int i) {
        executed = true;
        EXPECT_EQ(self, std::this_thread::get_id());
        return i * 2;
    }, 3);

    EXPECT_TRUE(executed);
    EXPECT_TRUE(f.done());
    EXPECT_EQ(6, f.result());

    auto e = heb::get_loop()->from_thread([]{ throw std::runtime_error("fail"); });
    EXPECT_TRUE(e.done());
    EXPECT_THROW(e.result(), std::runtime_error);
}

TEST(event_loop, no_loop_to_thread) {
    heb::reset_loop();
    auto self = std::this_thread::get_id();
    auto a = heb::get_loop()->to_thread([]{ return std::this_thread::get_id(); });
    EXPECT_NE(self, a.get());

    auto e = heb::get_loop()->to_thread([]() -> int { throw std::runtime_error("fail"); });
    EXPECT_THROW(e.get(), std::runtime_error);
}

TEST(event_loop, no_loop_await_blocks) {
    heb::reset_loop();
    heb::future<int> f;
    auto co = test::event_loop::co_await_future(f);

    std::thread thd([f]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        f.set_result(4);
    });

    // the coroutine blocks this thread until the future resolves
    co.resume();
    thd.join();

    EXPECT_TRUE(co.done());
    EXPECT_EQ(4, co.result());

    auto t = test::event_loop::co_to_thread();
    t.resume();
    EXPECT_TRUE(t.done());
    EXPECT_NE(std::this_thread::get_id(), t.result());
}

TEST(event_loop, no_loop_next_cycle) {
    heb::reset_loop();
    auto f = heb::get_loop()->next_cycle();
    EXPECT_TRUE(f.done());
    EXPECT_NO_THROW(f.result());
}

TEST(event_loop, await_cancelled_future) {
    heb::reset_loop();
    heb::future<int> f;
    f.cancel();

    auto a = heb::get_loop()->await_future(f);
    EXPECT_TRUE(a.await_ready());
    EXPECT_THROW(a.get(), heb::cancelled_error);
}

TEST(event_loop, wrap_cancelled) {
    heb::reset_loop();
    auto loop = heb::get_loop();

    EXPECT_EQ(3, loop->wrap_cancelled([]{ return 3; }));
    EXPECT_THROW(loop->wrap_cancelled([]() -> int { throw heb::cancelled(); }),
                 heb::cancelled_error);
    EXPECT_THROW(loop->wrap_cancelled([]{ throw std::runtime_error("fail"); }),
                 std::runtime_error);
    EXPECT_NO_THROW(loop->throw_if_cancelled());
}

TEST(event_loop, set_loop_attaches_and_detaches) {
    auto l1 = std::make_shared<test::event_loop::recording_loop>();
    auto l2 = std::make_shared<test::event_loop::recording_loop>();

    heb::set_loop(l1);
    EXPECT_EQ(l1, heb::get_loop());
    EXPECT_EQ(1u, l1->attached);
    EXPECT_EQ(0u, l1->detached);

    heb::set_loop(l2);
    EXPECT_EQ(l2, heb::get_loop());
    EXPECT_EQ(1u, l1->detached);
    EXPECT_EQ(1u, l2->attached);

    heb::reset_loop();
    EXPECT_EQ(1u, l2->detached);
    EXPECT_EQ(heb::no_loop::info_name(), heb::get_loop()->name());
}

TEST(event_loop, set_loop_attach_failure_installs_no_loop) {
    auto l1 = std::make_shared<test::event_loop::recording_loop>();
    auto failing = std::make_shared<test::event_loop::recording_loop>(true);

    heb::set_loop(l1);

    test::warning_counter wc;
    EXPECT_THROW(heb::set_loop(failing), std::runtime_error);
    EXPECT_EQ(1u, wc.count());

    EXPECT_EQ(1u, l1->detached);
    EXPECT_EQ(1u, failing->attached);
    EXPECT_EQ(heb::no_loop::info_name(), heb::get_loop()->name());

    heb::reset_loop();

    // the failed loop was never installed, so it is never detached
    EXPECT_EQ(0u, failing->detached);
}

TEST_F(event_loop_environment, keep_environment) {
    auto p = make_policy(heb::environment_store::thread);
    auto env = p->new_environment();
    auto& rt = heb::service<heb::native::runtime>::get();

    auto unkept = heb::keep_environment([&]{ return rt.current_environment(); });
    EXPECT_FALSE(unkept());

    std::function<std::shared_ptr<heb::native::environment_data>()> kept;

    {
        auto s = env.use();
        kept = heb::keep_environment([&]{ return rt.current_environment(); });
    }

    EXPECT_EQ(env.data(), kept());

    // the previous environment is restored afterwards
    EXPECT_FALSE(rt.current_environment());

    // on any thread
    test::queue<std::shared_ptr<heb::native::environment_data>> q;

    std::thread thd([&]{
        q.push(kept());
        q.push(rt.current_environment());
    });

    thd.join();
    EXPECT_EQ(env.data(), q.pop());
    EXPECT_FALSE(q.pop());

    // the kept Callable holds the environment
    kept = nullptr;
    env.dispose();
    EXPECT_FALSE(heb::service<heb::hospice>::get().any_alive());
}

TEST_F(event_loop_environment, free_functions_keep_environment) {
    heb::reset_loop();
    auto p = make_policy(heb::environment_store::thread);
    auto env = p->new_environment();
    auto& rt = heb::service<heb::native::runtime>::get();

    {
        auto s = env.use();

        auto f = heb::from_thread([&](int i) {
            EXPECT_EQ(env.data(), rt.current_environment());
            return i;
        }, 1);

        EXPECT_EQ(1, f.result());

        // the worker thread executes inside the environment
        auto a = heb::to_thread([&]{ return rt.current_environment(); });
        EXPECT_EQ(env.data(), a.get());
    }

    env.dispose();

    // the worker thread releases its environment after resolving
    EXPECT_TRUE(test::eventually([]{ 
        return !heb::service<heb::hospice>::get().any_alive(); 
    }));
}
