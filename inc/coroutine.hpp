//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_COROUTINE
#define HERMES_ENVIRONMENT_BRIDGE_COROUTINE

#include <coroutine>
#include <exception>
#include <optional>
#include <string>
#include <sstream>

#include "utility.hpp"
#include "logging.hpp"

namespace heb {

template <typename T> struct co;

namespace detail {
namespace coroutine {

// storage of the `co_return`ed value
template <typename T>
struct promise_result {
    template <typename TSHADOW>
    inline void return_value(TSHADOW&& t) {
        result.emplace(std::forward<TSHADOW>(t));
    }

    inline T take() { return std::move(*result); }

    std::optional<T> result;
};

template <>
struct promise_result<void> {
    inline void return_void() { }
    inline void take() { }
};

}
}

/**
 @brief stackless coroutine with templated return type

 User coroutines return this object to select the proper promise_type. A `co<T>`
 acts like a `std::unique_ptr` for its `std::coroutine_handle<>`: destroying
 the object destroys the coroutine frame.

 Coroutines are lazily started. Another coroutine may `co_await` a `co<T>`
 rvalue, which starts it and resumes the awaiter with its result (or rethrows
 its exception) when it completes. Schedulers own top level coroutines, see
 `heb::scheduler::spawn()`.
 */
template <typename T>
struct co : public printable {
    typedef T value_type;

    struct promise_type : public printable,
                          public detail::coroutine::promise_result<T>
    {
        // symmetric transfer to the awaiting coroutine when complete
        struct final_awaiter {
            inline bool await_ready() noexcept { return false; }

            inline std::coroutine_handle<> await_suspend(
                    std::coroutine_handle<promise_type> h) noexcept {
                auto c = h.promise().continuation;
                return c ? c : std::noop_coroutine();
            }

            inline void await_resume() noexcept { }
        };

        promise_type() { }
        virtual ~promise_type() { }

        static inline std::string info_name() {
            return co<T>::info_name() + "::promise_type";
        }

        inline std::string name() const { return promise_type::info_name(); }

        inline co<T> get_return_object() {
            return co<T>(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        inline std::suspend_always initial_suspend() noexcept { return {}; }
        inline final_awaiter final_suspend() noexcept { return {}; }

        inline void unhandled_exception() { eptr = std::current_exception(); }

        /// the coroutine to resume when this one completes
        std::coroutine_handle<> continuation;

        /// exception thrown out of the coroutine body
        std::exception_ptr eptr;
    };

    typedef std::coroutine_handle<promise_type> handle_type;

    // awaiter returned when another coroutine awaits this one
    struct awaiter {
        inline bool await_ready() { return !handle || handle.done(); }

        inline std::coroutine_handle<> await_suspend(std::coroutine_handle<> h) {
            handle.promise().continuation = h;
            return handle;
        }

        inline T await_resume() {
            auto& p = handle.promise();
            if(p.eptr) { std::rethrow_exception(p.eptr); }
            return p.take();
        }

        handle_type handle;
    };

    co() { }
    co(const co<T>&) = delete;

    co(co<T>&& rhs) : handle_(rhs.handle_) {
        rhs.handle_ = handle_type();
    }

    explicit co(handle_type h) : handle_(h) {
        HEB_MIN_GUARD(h, HEB_MIN_CONSTRUCTOR(h));
    }

    virtual ~co() {
        HEB_MIN_GUARD(handle_, HEB_MIN_DESTRUCTOR());
        reset();
    }

    inline co<T>& operator=(const co<T>&) = delete;

    inline co<T>& operator=(co<T>&& rhs) {
        if(this != &rhs) {
            reset();
            handle_ = rhs.handle_;
            rhs.handle_ = handle_type();
        }

        return *this;
    }

    static inline std::string info_name() {
        return type::templatize<T>("heb::co");
    }

    inline std::string name() const { return co<T>::info_name(); }

    inline std::string content() const {
        if(handle_) {
            std::stringstream ss;
            ss << handle_;
            return ss.str();
        } else { return std::string(); }
    }

    /// return true if the handle is valid, else false
    inline operator bool() const { return (bool)handle_; }

    /// return true if the coroutine is done, else false
    inline bool done() const { return handle_.done(); }

    /// access the promise
    inline promise_type& promise() { return handle_.promise(); }

    /// releases ownership of the managed handle and returns it
    inline handle_type release() {
        auto h = handle_;
        handle_ = handle_type();
        return h;
    }

    /// destroy the managed handle
    inline void reset() {
        if(handle_) {
            HEB_MIN_METHOD_BODY("reset", handle_);
            handle_.destroy();
        }

        handle_ = handle_type();
    }

    /// start or continue the coroutine from a non-coroutine context
    inline void resume() {
        HEB_MIN_METHOD_ENTER("resume");
        handle_.resume();
    }

    /**
     @brief return the result of a completed coroutine

     Rethrows any exception which escaped the coroutine body.
     */
    inline T result() {
        auto& p = handle_.promise();
        if(p.eptr) { std::rethrow_exception(p.eptr); }
        return p.take();
    }

    /// start this coroutine as a child of the awaiting coroutine
    inline awaiter operator co_await() && { return awaiter{ handle_ }; }

private:
    handle_type handle_;
};

}

#endif
