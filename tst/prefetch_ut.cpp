//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <mutex>
#include <thread>
#include <chrono>
#include <vector>
#include <optional>
#include <exception>
#include <stdexcept>

#include "future.hpp"
#include "prefetch.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace prefetch {

// requests completed by the test itself, in any order it chooses
struct requests {
    requests() { issued.reserve(64); }

    inline heb::future<int> operator()(size_t) {
        heb::future<int> f;
        issued.push_back(f);
        return f;
    }

    // resolve every issued request with its index, including ones issued meanwhile
    inline void resolve_all() {
        for(size_t k=0; k<issued.size(); ++k) {
            if(!issued[k].done()) {
                auto f = issued[k];
                f.set_result((int)k);
            }
        }
    }

    inline size_t size() const { return issued.size(); }

    std::vector<heb::future<int>> issued;
};

// requests completed by worker threads, later requests often finishing first
struct delayed_requests {
    ~delayed_requests() {
        std::vector<std::thread> thds;

        {
            std::lock_guard<std::mutex> lk(mtx);
            std::swap(thds, threads);
        }

        for(auto& thd : thds) { thd.join(); }
    }

    inline heb::future<int> operator()(size_t i) {
        heb::future<int> f;
        auto delay = std::chrono::milliseconds(i % 3 == 0 ? 8 : 1);

        std::lock_guard<std::mutex> lk(mtx);
        threads.emplace_back([f, i, delay]() mutable {
            std::this_thread::sleep_for(delay);
            f.set_result((int)i);
        });

        return f;
    }

    std::mutex mtx;
    std::vector<std::thread> threads;
};

// a resource which can be entered and exited once
struct resource {
    resource(int i) : value(i) { }

    inline int enter() {
        ++entered;
        return value;
    }

    inline void exit(std::exception_ptr) { ++exited; }

    const int value;
    size_t entered = 0;
    size_t exited = 0;
};

inline std::vector<int> consume(heb::future_generator<int>& gen) {
    std::vector<int> values;
    while(auto f = gen()) { values.push_back(f->result()); }
    return values;
}

}
}

TEST(prefetch, preserves_order) {
    test::prefetch::delayed_requests r;
    auto gen = heb::ordered_requests(10, [&r](size_t i) { return r(i); }, 3);

    auto values = test::prefetch::consume(gen);
    ASSERT_EQ(10u, values.size());
    for(int i=0; i<10; ++i) { EXPECT_EQ(i, values[i]); }
}

TEST(prefetch, bounds) {
    test::prefetch::requests r;
    auto gen = heb::ordered_requests(10, [&r](size_t i) { return r(i); }, 2, 4);

    // at most prefetch requests in flight
    EXPECT_EQ(2u, r.size());

    // at most backlog requests issued but not consumed
    r.resolve_all();
    EXPECT_EQ(4u, r.size());

    // consuming makes room in the backlog
    auto f = gen();
    ASSERT_TRUE(f);
    EXPECT_EQ(0, f->result());
    EXPECT_EQ(5u, r.size());

    std::vector<int> values{ 0 };

    while(true) {
        r.resolve_all();
        auto n = gen();
        if(!n) { break; }
        values.push_back(n->result());
    }

    ASSERT_EQ(10u, values.size());
    for(int i=0; i<10; ++i) { EXPECT_EQ(i, values[i]); }
}

TEST(prefetch, default_backlog) {
    test::prefetch::requests r;
    auto gen = heb::ordered_requests(20, [&r](size_t i) { return r(i); }, 2);
    r.resolve_all();
    EXPECT_EQ(2u * heb::config::prefetch::backlog_factor(), r.size());

    // the backlog is never lower than prefetch
    test::prefetch::requests r2;
    auto gen2 = heb::ordered_requests(20, [&r2](size_t i) { return r2(i); }, 3, 1);
    EXPECT_EQ(3u, r2.size());
    r2.resolve_all();
    EXPECT_EQ(3u, r2.size());
}

TEST(prefetch, default_prefetch) {
    auto gen = heb::ordered_requests(5, [](size_t i) {
        return heb::make_ready_future<int>((int)i);
    });

    auto values = test::prefetch::consume(gen);
    ASSERT_EQ(5u, values.size());
    for(int i=0; i<5; ++i) { EXPECT_EQ(i, values[i]); }
}

TEST(prefetch, failure_stops_requests) {
    size_t issued = 0;

    auto gen = heb::ordered_requests(10, [&issued](size_t i) {
        ++issued;

        if(i == 2) {
            return heb::make_exceptional_future<int>(
                std::make_exception_ptr(std::runtime_error("fail")));
        } else {
            return heb::make_ready_future<int>((int)i);
        }
    }, 1, 1);

    EXPECT_EQ(0, gen()->result());
    EXPECT_EQ(1, gen()->result());

    auto failed = gen();
    ASSERT_TRUE(failed);
    EXPECT_THROW(failed->result(), std::runtime_error);

    EXPECT_FALSE(gen());
    EXPECT_EQ(3u, issued);
}

TEST(prefetch, source_exception) {
    size_t i = 0;

    heb::future_generator<int> source = [i]() mutable -> std::optional<heb::future<int>> {
        if(i == 2) { throw std::runtime_error("fail"); }
        return heb::make_ready_future<int>((int)(i++));
    };

    auto gen = heb::buffer_futures<int>(std::move(source), 2, 4);

    // the requests issued before the failure are yielded first
    EXPECT_EQ(0, gen()->result());
    EXPECT_EQ(1, gen()->result());
    EXPECT_THROW(gen(), std::runtime_error);
    EXPECT_FALSE(gen());
}

TEST(prefetch, destroyed_generator_stops_requests) {
    test::prefetch::requests r;

    {
        auto gen = heb::ordered_requests(10, [&r](size_t i) { return r(i); }, 2, 4);
        EXPECT_EQ(2u, r.size());
    }

    // in flight requests finish but nothing new is issued
    r.resolve_all();
    EXPECT_EQ(2u, r.size());
}

TEST(prefetch, close_when_needed) {
    std::vector<std::shared_ptr<test::prefetch::resource>> resources;
    for(int i=0; i<3; ++i) { resources.push_back(std::make_shared<test::prefetch::resource>(i)); }

    size_t idx = 0;

    heb::future_generator<std::shared_ptr<test::prefetch::resource>> source =
        [&resources, idx]() mutable
            -> std::optional<heb::future<std::shared_ptr<test::prefetch::resource>>> {
            if(idx >= resources.size()) { return std::nullopt; }
            return heb::make_ready_future<std::shared_ptr<test::prefetch::resource>>(resources[idx++]);
        };

    {
        auto gen = heb::close_when_needed(std::move(source));

        auto f0 = gen();
        ASSERT_TRUE(f0);
        EXPECT_EQ(0, f0->result());
        EXPECT_EQ(1u, resources[0]->entered);
        EXPECT_EQ(0u, resources[0]->exited);

        // retrieving the next item exits the previous resource
        auto f1 = gen();
        ASSERT_TRUE(f1);
        EXPECT_EQ(1, f1->result());
        EXPECT_EQ(1u, resources[0]->exited);
        EXPECT_EQ(0u, resources[1]->exited);
    }

    // destroying the generator exits the last resource
    EXPECT_EQ(1u, resources[1]->exited);
    EXPECT_EQ(0u, resources[2]->entered);
    EXPECT_EQ(0u, resources[2]->exited);
}
