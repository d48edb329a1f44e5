//SPDX-License-Identifier: Apache-2.0
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <stdexcept>

#include "error.hpp"
#include "future.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace future {

template <typename T>
void resolve_T(T t) {
    heb::future<T> f;
    EXPECT_FALSE(f.done());
    EXPECT_FALSE(f.running());
    EXPECT_FALSE(f.cancelled());

    f.set_result(t);
    EXPECT_TRUE(f.done());
    EXPECT_EQ(t, f.result());
    EXPECT_FALSE(f.exception());

    // copies share the result
    heb::future<T> cpy = f;
    EXPECT_TRUE(cpy == f);
    EXPECT_EQ(t, cpy.result());
}

}
}

TEST(future, resolve) {
    test::future::resolve_T<int>(3);
    test::future::resolve_T<std::string>("three");
    test::future::resolve_T<test::CustomObject>(test::CustomObject(3));

    heb::future<void> f;
    f.set_result();
    EXPECT_TRUE(f.done());
    EXPECT_NO_THROW(f.result());
}

TEST(future, reject) {
    heb::future<int> f;
    f.set_exception(std::make_exception_ptr(std::runtime_error("fail")));

    EXPECT_TRUE(f.done());
    EXPECT_FALSE(f.cancelled());
    EXPECT_THROW(f.result(), std::runtime_error);
    EXPECT_TRUE(f.exception());
    EXPECT_EQ(std::string("rejected"), f.content());
}

TEST(future, single_assignment) {
    heb::future<int> f;
    f.set_result(1);

    EXPECT_THROW(f.set_result(2), heb::invalid_state_error);
    EXPECT_THROW(f.set_exception(std::make_exception_ptr(std::runtime_error("fail"))),
                 heb::invalid_state_error);
    EXPECT_FALSE(f.cancel());
    EXPECT_EQ(1, f.result());
}

TEST(future, cancel) {
    heb::future<int> f;
    EXPECT_TRUE(f.cancel());
    EXPECT_TRUE(f.cancel());
    EXPECT_TRUE(f.done());
    EXPECT_TRUE(f.cancelled());
    EXPECT_FALSE(f.set_running_or_notify_cancel());
    EXPECT_THROW(f.result(), heb::cancelled_error);
    EXPECT_THROW(f.exception(), heb::cancelled_error);
    EXPECT_THROW(f.set_result(1), heb::invalid_state_error);
}

TEST(future, running_cannot_be_cancelled) {
    heb::future<int> f;
    EXPECT_TRUE(f.set_running_or_notify_cancel());
    EXPECT_TRUE(f.running());
    EXPECT_FALSE(f.cancel());
    EXPECT_THROW(f.set_running_or_notify_cancel(), heb::invalid_state_error);

    f.set_result(3);
    EXPECT_FALSE(f.running());
    EXPECT_EQ(3, f.result());
}

TEST(future, timeout) {
    heb::future<int> f;
    EXPECT_FALSE(f.wait(std::chrono::milliseconds(10)));
    EXPECT_THROW(f.result(std::chrono::milliseconds(10)), heb::timeout_error);
    EXPECT_THROW(f.exception(std::chrono::milliseconds(10)), heb::timeout_error);

    f.set_result(1);
    EXPECT_TRUE(f.wait(std::chrono::milliseconds(10)));
    EXPECT_EQ(1, f.result(std::chrono::milliseconds(10)));
}

TEST(future, resolve_from_thread) {
    heb::future<int> f;
    std::thread thd([f]() mutable { f.set_result(5); });
    EXPECT_EQ(5, f.result());
    thd.join();
}

TEST(future, callbacks_in_registration_order) {
    heb::future<int> f;
    std::vector<int> order;

    f.add_done_callback([&](heb::future<int> d) { order.push_back(d.result()); });
    f.add_done_callback([&](heb::future<int>) { order.push_back(2); });
    f.add_done_callback([&](heb::future<int>) { throw std::runtime_error("fail"); });
    f.add_done_callback([&](heb::future<int>) { order.push_back(3); });
    EXPECT_TRUE(order.empty());

    f.set_result(1);
    ASSERT_EQ(3u, order.size());
    EXPECT_EQ(1, order[0]);
    EXPECT_EQ(2, order[1]);
    EXPECT_EQ(3, order[2]);

    // done futures invoke immediately
    f.add_done_callback([&](heb::future<int>) { order.push_back(4); });
    ASSERT_EQ(4u, order.size());
    EXPECT_EQ(4, order[3]);
}

TEST(future, callbacks_on_cancel) {
    heb::future<void> f;
    bool cancelled = false;
    f.add_done_callback([&](heb::future<void> d) { cancelled = d.cancelled(); });
    f.cancel();
    EXPECT_TRUE(cancelled);
}

TEST(future, cancelled_operation_is_skipped_at_every_verbosity) {
    heb::future<int> f;
    EXPECT_TRUE(f.cancel());

    bool running = true;
    EXPECT_TRUE(test::verbose([&]{ running = f.set_running_or_notify_cancel(); }));
    EXPECT_FALSE(running);
    EXPECT_TRUE(f.cancelled());
}

TEST(future, callbacks_on_const_future) {
    const heb::future<std::string> f;
    std::string v;

    f.add_done_callback([&](heb::future<std::string> r) { v = r.result(); });
    EXPECT_TRUE(v.empty());

    // copies share the callbacks
    heb::future<std::string> cpy = f;
    cpy.set_result("done");
    EXPECT_EQ("done", v);
}

TEST(future, make_ready) {
    auto f = heb::make_ready_future<int>(3);
    EXPECT_TRUE(f.done());
    EXPECT_EQ(3, f.result());

    auto v = heb::make_ready_future<void>();
    EXPECT_TRUE(v.done());

    auto e = heb::make_exceptional_future<int>(
        std::make_exception_ptr(std::runtime_error("fail")));
    EXPECT_THROW(e.result(), std::runtime_error);
}
