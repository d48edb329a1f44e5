//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_NURSERY
#define HERMES_ENVIRONMENT_BRIDGE_NURSERY

#include <memory>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <string>
#include <sstream>

#include "utility.hpp"
#include "logging.hpp"
#include "error.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "scheduler.hpp"

namespace heb {

/**
 @brief a structured concurrency scope on an `heb::scheduler`

 Every child task started in the nursery completes before the future returned 
 by `join()` completes. The first child which fails cancels all of its 
 siblings, and its exception rejects the joined future.
 ```
 auto n = heb::nursery::make(sch);
 n->start_soon(child_a());
 n->start_soon(child_b());
 co_await heb::get_loop()->await_future(n->join());
 ```
 */
struct nursery : public printable, 
                 public std::enable_shared_from_this<nursery> 
{
    /// the native cancellation exception of tasks in a nursery
    struct cancelled_exception : public scheduler::cancelled_exception {
        inline const char* what() const noexcept { return "nursery was cancelled"; }
    };

    virtual ~nursery() { HEB_INFO_DESTRUCTOR(); }

    /// @return a new nursery on a scheduler
    static inline std::shared_ptr<nursery> make(std::shared_ptr<scheduler> sch) {
        return std::shared_ptr<nursery>(new nursery(std::move(sch)));
    }

    static inline std::string info_name() { return "heb::nursery"; }
    inline std::string name() const { return nursery::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        std::lock_guard<std::mutex> lk(mtx_);
        ss << "children:" << children_ 
           << ", cancelled:" << std::boolalpha << cancel_called_
           << ", closed:" << closed_;
        return ss.str();
    }

    /**
     @brief start a child task

     Throws `heb::configuration_error` once the nursery is joined. A child 
     started in a cancelled nursery never executes.
     */
    template <typename T>
    void start_soon(co<T> c) {
        HEB_MED_METHOD_ENTER("start_soon", c);
        bool cancelled_before;

        {
            std::lock_guard<std::mutex> lk(mtx_);

            if(closed_) [[unlikely]] {
                throw configuration_error("heb::nursery::start_soon() called after join()");
            }

            ++children_;
            cancelled_before = cancel_called_;
        }

        if(cancelled_before) [[unlikely]] {
            child_done_(nullptr);
            return;
        }

        auto j = sch_->spawn(std::move(c));
        bool cancel_now;

        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancellers_.push_back([j]() mutable { j.cancel(); });
            cancel_now = cancel_called_;
        }

        if(cancel_now) { j.cancel(); }

        auto self = shared_from_this();

        j.get_future().add_done_callback([self](future<T> f) {
            if(f.cancelled()) { self->child_done_(nullptr); }
            else { self->child_done_(f.exception()); }
        });
    }

    /// cancel every child task
    void cancel();

    /// @return true once `cancel()` was called or a child failed
    inline bool cancel_called() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return cancel_called_;
    }

    /**
     @brief close the nursery

     No more children can be started.

     @return a future completed once every child is done, rejected with the first child failure
     */
    future<void> join();

    /// @return the count of unfinished children
    inline size_t children() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return children_;
    }

    /// @return the scheduler the children execute on
    inline const std::shared_ptr<scheduler>& get_scheduler() const { return sch_; }

private:
    nursery(std::shared_ptr<scheduler> sch) : 
        sch_(std::move(sch)),
        children_(0),
        cancel_called_(false),
        closed_(false),
        resolved_(false)
    { 
        HEB_INFO_CONSTRUCTOR(sch_); 
    }

    // a child completed with an optional failure
    void child_done_(std::exception_ptr eptr);

    // complete the joined future if closed and empty, lock must be held
    bool should_resolve_();

    // complete the joined future
    void resolve_();

    std::shared_ptr<scheduler> sch_;
    mutable std::mutex mtx_;
    size_t children_;
    bool cancel_called_;
    bool closed_;
    bool resolved_;
    std::exception_ptr error_;
    std::vector<thunk> cancellers_;
    future<void> joined_;
};

/**
 @brief limit the count of concurrently executing operations

 Tokens are acquired before an operation executes and released after.
 */
struct capacity_limiter : public printable {
    /// releases its token when destroyed
    struct token {
        token(capacity_limiter& l) : limiter_(&l) { limiter_->acquire(); }
        token(const token&) = delete;
        token& operator=(const token&) = delete;
        ~token() { limiter_->release(); }

    private:
        capacity_limiter* limiter_;
    };

    capacity_limiter(size_t total) : total_(total ? total : 1), borrowed_(0) { 
        HEB_INFO_CONSTRUCTOR(total); 
    }

    virtual ~capacity_limiter() { HEB_INFO_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::capacity_limiter"; }
    inline std::string name() const { return capacity_limiter::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        std::lock_guard<std::mutex> lk(mtx_);
        ss << borrowed_ << "/" << total_;
        return ss.str();
    }

    /// block until a token is available and take it
    inline void acquire() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [&]{ return borrowed_ < total_; });
        ++borrowed_;
    }

    /// return a token
    inline void release() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --borrowed_;
        }

        cv_.notify_one();
    }

    /// @return the count of tokens currently taken
    inline size_t borrowed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return borrowed_;
    }

    inline size_t total() const { return total_; }

private:
    const size_t total_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    size_t borrowed_;
};

}

#endif
