//SPDX-License-Identifier: Apache-2.0
#ifndef __HEB_ENVIRONMENT_BRIDGE_TEST_HELPERS__
#define __HEB_ENVIRONMENT_BRIDGE_TEST_HELPERS__

#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <condition_variable>
#include <coroutine>

#include "loguru.hpp"
#include "atomic.hpp"
#include "logging.hpp"
#include "store.hpp"
#include "policy.hpp"
#include "testing.hpp"
#include "future.hpp"
#include "scheduler.hpp"

#include <gtest/gtest.h>

namespace test {

/*
 Test only replacement for something like a channel. Synchronizes sends and
 receives between two threads or a thread and a coroutine. Is *not* safe for
 general usage by user code.
 */
template <typename T>
struct queue {
    template <typename TSHADOW>
    void push(TSHADOW&& t) {
        HEB_INFO_LOG("test::queue<T>::push()+");
        {
            std::lock_guard<heb::spinlock> lk(slk);
            vals.push_back(std::forward<TSHADOW>(t));
        }
        cv.notify_one();
        HEB_INFO_LOG("test::queue<T>::push()-");
    }

    T pop() {
        HEB_INFO_LOG("test::queue<T>::pop()+");
        std::unique_lock<heb::spinlock> lk(slk);
        while(!vals.size()) {
            cv.wait(lk);
        }

        T res = std::move(vals.front());
        vals.pop_front();
        HEB_INFO_LOG("test::queue<T>::pop()-");
        return res;
    }

    size_t size() {
        HEB_INFO_LOG("test::queue<T>::size()+");
        std::lock_guard<heb::spinlock> lk(slk);
        HEB_INFO_LOG("test::queue<T>::size()-");
        return vals.size();
    }

private:
    heb::spinlock slk;
    std::condition_variable_any cv;
    std::deque<T> vals;
};

/*
 Counts the warnings logged through loguru while in scope. Warnings logged by
 any thread are counted.
 */
struct warning_counter {
    warning_counter() :
        id_("test::warning_counter@" + std::to_string((size_t)this)),
        count_(0)
    {
        loguru::add_callback(id_.c_str(),
                             &warning_counter::on_message_,
                             this,
                             loguru::Verbosity_WARNING);
    }

    ~warning_counter() { loguru::remove_callback(id_.c_str()); }

    inline size_t count() const { return count_.load(); }

private:
    static void on_message_(void* user_data, const loguru::Message& message) {
        if(message.verbosity == loguru::Verbosity_WARNING) {
            static_cast<warning_counter*>(user_data)->count_.fetch_add(1);
        }
    }

    const std::string id_;
    std::atomic<size_t> count_;
};

/*
 Fixture composing an `heb::policy` with an `heb::testing::proxy_policy`.
 Whatever happens in the test the policy under test is detached from the native
 runtime in TearDown(), so a failing test cannot poison the ones after it.
 */
struct policy_fixture : public ::testing::Test {
    void SetUp() override {
        proxy = heb::testing::proxy_policy::install();
    }

    void TearDown() override {
        proxy->forcefully_unregister();
        proxy->uninstall();
        proxy.reset();
    }

    // construct a registered policy with the given store strategy
    inline std::unique_ptr<heb::policy> make_policy(
            heb::environment_store::strategy s = heb::environment_store::global) {
        std::unique_ptr<heb::policy> p(
            new heb::policy(heb::environment_store::make(s), proxy.get()));
        p->register_policy();
        return p;
    }

    std::shared_ptr<heb::testing::proxy_policy> proxy;
};

/*
 Awaitable parking the current `heb::scheduler` task until a future completes.
 A cancelled task resumes with `heb::scheduler::cancelled_exception`.
 */
struct park_until {
    park_until(heb::future<void> f) : f_(std::move(f)) { }

    inline bool await_ready() { return f_.done(); }

    inline void await_suspend(std::coroutine_handle<> h) {
        heb::future<void> fut = f_;

        heb::scheduler::local().park(
            heb::scheduler::current_task(),
            h,
            [fut](heb::thunk wake) mutable {
                fut.add_done_callback([wake](heb::future<void>) { wake(); });
            });
    }

    inline void await_resume() {
        auto t = heb::scheduler::current_task();
        if(t && t->cancelled()) { throw heb::scheduler::cancelled_exception(); }
    }

private:
    heb::future<void> f_;
};

// wait for a predicate with a bounded timeout
template <typename F>
bool eventually(F&& f, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while(!f()) {
        if(std::chrono::steady_clock::now() > deadline) { return false; }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    return true;
}

/*
 Execute a Callable on a new thread logging at the highest verbosity, so every
 log statement formats the objects it names. Returns false if the Callable did
 not return within the timeout, in which case the thread is abandoned.
 */
template <typename F>
bool verbose(F f, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    heb::future<void> done;

    std::thread thd([f = std::move(f), done]() mutable {
        heb::logger::thread_log_level(9);
        f();
        done.set_result();
    });

    if(done.wait(timeout)) {
        thd.join();
        return true;
    } else {
        thd.detach();
        return false;
    }
}

struct CustomObject {
    CustomObject() : i_(0) {}
    CustomObject(const CustomObject&) = default;
    CustomObject(CustomObject&&) = default;

    CustomObject(int i) : i_(i) {}

    CustomObject& operator=(const CustomObject&) = default;
    CustomObject& operator=(CustomObject&&) = default;

    inline bool operator==(const CustomObject& rhs) const {
        return i_ == rhs.i_;
    }

    inline bool operator!=(const CustomObject& rhs) const {
        return !(*this == rhs);
    }

    inline int value() const { return i_; }

private:
    int i_;
};

}

#endif
