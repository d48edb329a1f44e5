//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <stdexcept>

#include "error.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "event_loop.hpp"
#include "scheduler.hpp"
#include "adapters.hpp"
#include "unified.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace unified_iterator {

// yields the given futures in order, counting how many were pulled
inline heb::future_generator<int> make_source(std::vector<heb::future<int>> fs,
                                              std::shared_ptr<size_t> pulled = nullptr) {
    size_t i = 0;

    return [fs, i, pulled]() mutable -> std::optional<heb::future<int>> {
        if(i >= fs.size()) { return std::nullopt; }
        if(pulled) { ++(*pulled); }
        return fs[i++];
    };
}

inline std::vector<heb::future<int>> ready_futures(size_t count) {
    std::vector<heb::future<int>> fs;
    for(size_t i=0; i<count; ++i) { fs.push_back(heb::make_ready_future<int>((int)i)); }
    return fs;
}

inline heb::future_generator<int> make_range(size_t count) {
    return test::unified_iterator::make_source(test::unified_iterator::ready_futures(count));
}

inline heb::co<std::vector<int>> co_collect(heb::unified_iterator<int> it) {
    std::vector<int> values;

    while(auto v = co_await it.anext()) {
        values.push_back(*v);
    }

    co_return values;
}

}
}

TEST(unified_iterator, range_for) {
    heb::unified_iterator<int> it(test::unified_iterator::make_range(5));
    std::vector<int> values;

    for(int v : it) { values.push_back(v); }

    ASSERT_EQ(5u, values.size());
    for(int i=0; i<5; ++i) { EXPECT_EQ(i, values[i]); }

    // the sequence is consumed
    EXPECT_FALSE(it.next());

    heb::unified_iterator<int> empty(test::unified_iterator::make_range(0));
    EXPECT_TRUE(empty.begin() == empty.end());
}

TEST(unified_iterator, next) {
    heb::future<int> pending;
    auto rejected = heb::make_exceptional_future<int>(
        std::make_exception_ptr(std::runtime_error("fail")));

    heb::unified_iterator<int> it(test::unified_iterator::make_source({
        heb::make_ready_future<int>(1), pending, rejected }));

    EXPECT_EQ(1, *(it.next()));

    std::thread thd([pending]() mutable { pending.set_result(2); });
    EXPECT_EQ(2, *(it.next()));
    thd.join();

    EXPECT_THROW(it.next(), std::runtime_error);
    EXPECT_FALSE(it.next());
}

TEST(unified_iterator, copies_share_the_sequence) {
    heb::unified_iterator<int> it(test::unified_iterator::make_range(3));
    auto cpy = it;

    EXPECT_EQ(0, *(it.next()));
    EXPECT_EQ(1, *(cpy.next()));
    EXPECT_EQ(2, *(it.next()));
    EXPECT_FALSE(cpy.next());
}

TEST(unified_iterator, anext) {
    heb::reset_loop();
    heb::unified_iterator<int> it(test::unified_iterator::make_range(4));

    auto co = test::unified_iterator::co_collect(it);
    co.resume();
    EXPECT_TRUE(co.done());

    auto values = co.result();
    ASSERT_EQ(4u, values.size());
    for(int i=0; i<4; ++i) { EXPECT_EQ(i, values[i]); }
}

TEST(unified_iterator, run_as_completed) {
    heb::reset_loop();
    std::vector<int> values;
    heb::unified_iterator<int> it(test::unified_iterator::make_range(4));

    auto done = it.run_as_completed([&](heb::future<int> f) {
        values.push_back(f.result());
    });

    EXPECT_NO_THROW(done.result());
    ASSERT_EQ(4u, values.size());
    for(int i=0; i<4; ++i) { EXPECT_EQ(i, values[i]); }
}

TEST(unified_iterator, run_as_completed_preserves_order) {
    heb::reset_loop();
    heb::future<int> a;
    heb::future<int> b;
    std::vector<int> values;

    heb::unified_iterator<int> it(test::unified_iterator::make_source({ a, b }));

    auto done = it.run_as_completed([&](heb::future<int> f) {
        values.push_back(f.result());
    });

    EXPECT_FALSE(done.done());

    // completion order does not change processing order
    b.set_result(2);
    EXPECT_TRUE(values.empty());

    a.set_result(1);
    EXPECT_NO_THROW(done.result());
    ASSERT_EQ(2u, values.size());
    EXPECT_EQ(1, values[0]);
    EXPECT_EQ(2, values[1]);
}

TEST(unified_iterator, run_as_completed_false_stops) {
    heb::reset_loop();
    auto pulled = std::make_shared<size_t>(0);
    size_t calls = 0;

    heb::unified_iterator<int> it(test::unified_iterator::make_source(
        test::unified_iterator::ready_futures(5), pulled));

    auto done = it.run_as_completed([&](heb::future<int> f) {
        ++calls;
        return f.result() < 1;
    });

    EXPECT_NO_THROW(done.result());
    EXPECT_EQ(2u, calls);
    EXPECT_EQ(2u, *pulled);

    // the rest of the sequence is still available
    EXPECT_EQ(2, *(it.next()));
}

TEST(unified_iterator, run_as_completed_callback_throws) {
    heb::reset_loop();
    size_t calls = 0;
    heb::unified_iterator<int> it(test::unified_iterator::make_range(5));

    auto done = it.run_as_completed([&](heb::future<int> f) {
        ++calls;
        if(f.result() == 2) { throw std::logic_error("fail"); }
    });

    EXPECT_THROW(done.result(), std::logic_error);
    EXPECT_EQ(3u, calls);
}

TEST(unified_iterator, run_as_completed_source_throws) {
    heb::reset_loop();
    size_t i = 0;

    heb::future_generator<int> source = [i]() mutable -> std::optional<heb::future<int>> {
        if(i == 2) { throw std::runtime_error("fail"); }
        return heb::make_ready_future<int>((int)(i++));
    };

    size_t calls = 0;
    heb::unified_iterator<int> it(std::move(source));
    auto done = it.run_as_completed([&](heb::future<int>) { ++calls; });

    EXPECT_THROW(done.result(), std::runtime_error);
    EXPECT_EQ(2u, calls);
}

TEST(unified_iterator, run_as_completed_on_loop) {
    auto sch = heb::scheduler::make();
    std::thread thd([sch]{ sch->run(); });
    heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));

    test::queue<std::thread::id> ids;
    heb::unified_iterator<int> it(test::unified_iterator::make_range(3));

    auto done = it.run_as_completed([&](heb::future<int>) {
        ids.push(std::this_thread::get_id());
    });

    EXPECT_NO_THROW(done.result());
    EXPECT_EQ(3u, ids.size());
    for(size_t i=0; i<3; ++i) { EXPECT_EQ(thd.get_id(), ids.pop()); }

    heb::reset_loop();
    sch->stop();
    thd.join();
}

TEST(unified_iterator, unified) {
    auto request = heb::unified([](int i) { return heb::make_ready_future<int>(i * 2); });
    heb::unified_future<int> u = request(2);
    EXPECT_EQ(4, u.result());

    auto range = heb::unified([](size_t count) { return test::unified_iterator::make_range(count); });
    heb::unified_iterator<int> it = range(2);
    EXPECT_EQ(0, *(it.next()));
    EXPECT_EQ(1, *(it.next()));
    EXPECT_FALSE(it.next());

    auto failing = heb::unified([]() -> heb::future<int> { throw std::runtime_error("fail"); });
    EXPECT_THROW(failing().result(), std::runtime_error);

    auto from_call = heb::unified_iterator<int>::from_call(test::unified_iterator::make_range, 1);
    EXPECT_EQ(0, *(from_call.next()));
}
