//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_FUTURE
#define HERMES_ENVIRONMENT_BRIDGE_FUTURE

#include <memory>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <functional>
#include <optional>
#include <vector>
#include <chrono>
#include <string>

#include "utility.hpp"
#include "logging.hpp"
#include "error.hpp"

namespace heb {

/**
 @brief a threadsafe single assignment result cell

 Futures share their state: every copy observes the same result. The state
 transitions are monotonic:
 - pending -> running -> finished
 - pending -> cancelled
 - pending -> finished

 A future is `done()` once it is finished or cancelled. Callbacks registered
 with `add_done_callback()` are invoked exactly once in registration order when
 the future becomes done, or immediately if it already is. Callbacks execute on
 whichever thread completed the future.

 `void` futures store no value.
 */
template <typename T>
struct future : public printable {
    typedef T value_type;
    typedef std::function<void(future<T>)> callback;
    typedef std::chrono::steady_clock::duration duration;

    future() : state_(std::make_shared<state>()) { }
    future(const future<T>&) = default;
    future(future<T>&&) = default;
    future<T>& operator=(const future<T>&) = default;
    future<T>& operator=(future<T>&&) = default;

    virtual ~future() { }

    static inline std::string info_name() {
        return type::templatize<T>("heb::future");
    }

    inline std::string name() const { return future<T>::info_name(); }

    inline std::string content() const {
        std::lock_guard<std::mutex> lk(state_->mtx);

        switch(state_->status) {
            case phase::pending: return "pending";
            case phase::running: return "running";
            case phase::cancelled: return "cancelled";
            default: return state_->eptr ? "rejected" : "resolved";
        }
    }

    /// @return true if both futures share the same state
    inline bool operator==(const future<T>& rhs) const {
        return state_ == rhs.state_;
    }

    /**
     @brief mark the future as running unless it was cancelled

     Workers call this before executing the operation the future represents.

     @return false if the future was cancelled and the operation must be skipped
     */
    inline bool set_running_or_notify_cancel() {
        {
            std::lock_guard<std::mutex> lk(state_->mtx);

            if(state_->status == phase::pending) {
                state_->status = phase::running;
                return true;
            }

            if(state_->status != phase::cancelled) [[unlikely]] {
                throw invalid_state_error(to_string_(), "set_running_or_notify_cancel()");
            }
        }

        // logging prints content(), which takes the lock
        HEB_LOW_METHOD_BODY("set_running_or_notify_cancel","cancelled");
        return false;
    }

    /**
     @brief resolve the future
     @param as constructor arguments of the stored value (none for `void`)
     */
    template <typename... As>
    inline void set_result(As&&... as) {
        HEB_LOW_METHOD_ENTER("set_result");
        std::unique_lock<std::mutex> lk(state_->mtx);

        if(state_->status == phase::finished || state_->status == phase::cancelled) [[unlikely]] {
            throw invalid_state_error(to_string_(), "set_result()");
        }

        state_->value.emplace(std::forward<As>(as)...);
        finish_(lk, phase::finished);
    }

    /// reject the future
    inline void set_exception(std::exception_ptr eptr) {
        HEB_LOW_METHOD_ENTER("set_exception");
        std::unique_lock<std::mutex> lk(state_->mtx);

        if(state_->status == phase::finished || state_->status == phase::cancelled) [[unlikely]] {
            throw invalid_state_error(to_string_(), "set_exception()");
        }

        state_->eptr = eptr;
        finish_(lk, phase::finished);
    }

    /**
     @brief attempt to cancel the future
     @return true if the future is cancelled, false if it is already running or finished
     */
    inline bool cancel() {
        HEB_LOW_METHOD_ENTER("cancel");
        std::unique_lock<std::mutex> lk(state_->mtx);

        if(state_->status == phase::cancelled) { return true; }
        if(state_->status != phase::pending) { return false; }

        finish_(lk, phase::cancelled);
        return true;
    }

    inline bool done() const {
        std::lock_guard<std::mutex> lk(state_->mtx);
        return state_->status == phase::finished || state_->status == phase::cancelled;
    }

    inline bool cancelled() const {
        std::lock_guard<std::mutex> lk(state_->mtx);
        return state_->status == phase::cancelled;
    }

    inline bool running() const {
        std::lock_guard<std::mutex> lk(state_->mtx);
        return state_->status == phase::running;
    }

    /**
     @brief block until the future is done
     @param timeout optional maximum time to wait
     @return true if the future is done, else false
     */
    inline bool wait(std::optional<duration> timeout = std::nullopt) const {
        std::unique_lock<std::mutex> lk(state_->mtx);
        return wait_(lk, timeout);
    }

    /**
     @brief block until done and return the result

     Throws `heb::cancelled_error` if the future was cancelled,
     `heb::timeout_error` if the timeout elapsed, or rethrows the stored
     exception if the future was rejected.
     */
    inline T result(std::optional<duration> timeout = std::nullopt) const {
        std::unique_lock<std::mutex> lk(state_->mtx);

        if(!wait_(lk, timeout)) [[unlikely]] {
            throw timeout_error(to_string_() + "::result()");
        }

        if(state_->status == phase::cancelled) { throw cancelled_error(); }
        if(state_->eptr) { std::rethrow_exception(state_->eptr); }

        if constexpr (!std::is_void_v<T>) {
            return *(state_->value);
        }
    }

    /**
     @brief block until done and return the stored exception
     @return the exception the future was rejected with, or nullptr if resolved
     */
    inline std::exception_ptr exception(std::optional<duration> timeout = std::nullopt) const {
        std::unique_lock<std::mutex> lk(state_->mtx);

        if(!wait_(lk, timeout)) [[unlikely]] {
            throw timeout_error(to_string_() + "::exception()");
        }

        if(state_->status == phase::cancelled) { throw cancelled_error(); }
        return state_->eptr;
    }

    /**
     @brief register a callback to be called when the future is done

     Exceptions thrown by the callback are logged and discarded, so they cannot
     prevent later callbacks from running.
     */
    inline void add_done_callback(callback cb) const {
        {
            std::lock_guard<std::mutex> lk(state_->mtx);

            if(state_->status != phase::finished && state_->status != phase::cancelled) {
                state_->callbacks.push_back(std::move(cb));
                return;
            }
        }

        invoke_(cb);
    }

private:
    enum class phase {
        pending,
        running,
        finished,
        cancelled
    };

    struct state {
        mutable std::mutex mtx;
        std::condition_variable cv;
        phase status = phase::pending;
        std::optional<storage<T>> value;
        std::exception_ptr eptr;
        std::vector<callback> callbacks;
    };

    // lock free printing for use while the lock is held
    inline std::string to_string_() const {
        std::stringstream ss;
        ss << name() << "@" << (void*)this;
        return ss.str();
    }

    inline bool wait_(std::unique_lock<std::mutex>& lk,
                      const std::optional<duration>& timeout) const {
        auto is_done = [&]{
            return state_->status == phase::finished ||
                   state_->status == phase::cancelled;
        };

        if(timeout) {
            return state_->cv.wait_for(lk, *timeout, is_done);
        } else {
            state_->cv.wait(lk, is_done);
            return true;
        }
    }

    // lock must be held, it is released before callbacks execute
    inline void finish_(std::unique_lock<std::mutex>& lk, phase s) {
        state_->status = s;
        std::vector<callback> cbs = std::move(state_->callbacks);
        state_->callbacks.clear();
        lk.unlock();
        state_->cv.notify_all();

        for(auto& cb : cbs) { invoke_(cb); }
    }

    inline void invoke_(callback& cb) const {
        try {
            cb(*this);
        } catch(const std::exception& e) {
            HEB_ERROR_METHOD_BODY("add_done_callback", "callback threw: ", e.what());
        }
    }

    std::shared_ptr<state> state_;
};

/**
 @brief a pull based sequence of futures

 Every call returns the next future of the sequence, or `std::nullopt` once the 
 sequence is exhausted. Exceptions thrown by a generator are failures of the 
 sequence itself. Generators carry state, so they are moved, never copied.
 */
template <typename T>
using future_generator = std::function<std::optional<future<T>>()>;

/// @return a resolved future
template <typename T, typename... As>
inline future<T> make_ready_future(As&&... as) {
    future<T> f;
    f.set_result(std::forward<As>(as)...);
    return f;
}

/// @return a rejected future
template <typename T>
inline future<T> make_exceptional_future(std::exception_ptr eptr) {
    future<T> f;
    f.set_exception(eptr);
    return f;
}

}

#endif
