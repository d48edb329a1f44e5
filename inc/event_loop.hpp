//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_EVENT_LOOP
#define HERMES_ENVIRONMENT_BRIDGE_EVENT_LOOP

#include <memory>
#include <mutex>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <optional>
#include <thread>
#include <tuple>
#include <string>

#include "utility.hpp"
#include "logging.hpp"
#include "error.hpp"
#include "future.hpp"
#include "native.hpp"

namespace heb {

/**
 @brief interface normalizing a host scheduler 

 The bridge never talks to a host scheduler directly. Every operation which 
 must interact with the host (resuming on the host's thread, suspending a task, 
 polling for cancellation) goes through the `heb::event_loop` installed with 
 `heb::set_loop()`.

 Implementations provide:
 - `schedule_()`: execute an operation on the host, callable from any thread
 - `next_cycle()`: a future resolved on a later iteration of the host
 - `suspend_()`: the host's suspension mechanism for awaiting coroutines
 - `raise_native_cancelled_()`: the host's native cancellation exception

 The default implementations of the other hooks are correct for any host 
 which has no native suspension mechanism.
 */
struct event_loop : public printable,
                    public std::enable_shared_from_this<event_loop> 
{
    /// a callback a suspended operation is resumed with exactly once
    typedef std::function<void(thunk)> subscriber;

    /**
     @brief awaitable result of a cross-thread operation

     In a coroutine `co_await` suspends the awaiting task with the loop's 
     native suspension mechanism. Outside a coroutine `get()` blocks the 
     calling thread.
     */
    template <typename T>
    struct awaiter : public printable {
        awaiter(std::shared_ptr<event_loop> loop, future<T> fut) :
            loop_(std::move(loop)),
            fut_(std::move(fut))
        { }

        static inline std::string info_name() { 
            return type::templatize<T>("heb::event_loop::awaiter"); 
        }

        inline std::string name() const { return awaiter<T>::info_name(); }

        inline bool await_ready() { return fut_.done(); }

        inline bool await_suspend(std::coroutine_handle<> h) {
            future<T> fut = fut_;

            return loop_->suspend_(h, [fut](thunk wake) mutable {
                fut.add_done_callback([wake](future<T>) { wake(); });
            });
        }

        inline T await_resume() {
            return loop_->wrap_cancelled([&]() -> T {
                loop_->throw_if_cancelled();
                return fut_.result();
            });
        }

        /// block until the result is available and return it
        inline T get() {
            fut_.wait();
            return await_resume();
        }

        /// @return the awaited future
        inline const future<T>& get_future() const { return fut_; }

    private:
        std::shared_ptr<event_loop> loop_;
        future<T> fut_;
    };

    virtual ~event_loop() { }

    /// called when the loop is installed with `heb::set_loop()`
    virtual void attach() { }

    /// called when another loop replaces this one
    virtual void detach() { }

    /**
     @brief schedule a Callable onto the loop

     Safe to call from any thread, typically native worker threads. Exceptions 
     thrown by the Callable reject the returned future.

     @param f a Callable
     @param as arguments for f
     @return a future resolving with the result of f
     */
    template <typename F, typename... As>
    auto from_thread(F&& f, As&&... as) {
        typedef std::invoke_result_t<unqualified<F>&, unqualified<As>&...> R;
        future<R> fut;
        schedule_(make_operation_(fut, std::forward<F>(f), std::forward<As>(as)...));
        return fut;
    }

    /**
     @brief execute a Callable on a dedicated worker thread

     @param f a Callable
     @param as arguments for f
     @return an awaitable of the result of f
     */
    template <typename F, typename... As>
    auto to_thread(F&& f, As&&... as) {
        typedef std::invoke_result_t<unqualified<F>&, unqualified<As>&...> R;
        future<R> fut;
        spawn_(make_operation_(fut, std::forward<F>(f), std::forward<As>(as)...));
        return awaiter<R>(shared_from_this(), std::move(fut));
    }

    /// bridge a cross-thread future into the loop's suspension mechanism
    template <typename T>
    inline awaiter<T> await_future(future<T> fut) {
        return awaiter<T>(shared_from_this(), std::move(fut));
    }

    /**
     @brief yield to the loop

     The returned future is completed on a later iteration of the loop. It is 
     rejected with `heb::cancelled` when the awaiting task was cancelled in the 
     meantime.
     */
    virtual future<void> next_cycle() = 0;

    /// throw `heb::cancelled` if the calling task was cancelled
    virtual void throw_if_cancelled() { }

    /**
     @brief execute a Callable, translating `heb::cancelled` to the loop's native cancellation
     */
    template <typename F>
    auto wrap_cancelled(F&& f) -> function_return_type<F> {
        try {
            return std::invoke(std::forward<F>(f));
        } catch(const cancelled&) {
            raise_native_cancelled_();
        }
    }

protected:
    /// execute an operation on the loop, must be safe to call from any thread
    virtual void schedule_(thunk op) = 0;

    /// execute an operation on a dedicated worker thread
    virtual void spawn_(thunk op) {
        std::thread(std::move(op)).detach();
    }

    /**
     @brief suspend the calling coroutine until subscribe's callback is invoked

     The default implementation blocks the calling thread and resumes the 
     coroutine inline.

     @param h the suspending coroutine
     @param subscribe called with the thunk waking the suspended operation
     @return true if the coroutine is suspended, false to resume it immediately
     */
    virtual bool suspend_(std::coroutine_handle<> h, const subscriber& subscribe);

    /// throw the loop's native cancellation exception
    [[noreturn]] virtual void raise_native_cancelled_() {
        throw cancelled_error();
    }

private:
    template <typename R, typename F, typename... As>
    static thunk make_operation_(future<R> fut, F&& f, As&&... as) {
        return [fut, 
                f=std::forward<F>(f), 
                args=std::make_tuple(std::forward<As>(as)...)]() mutable {
            if(!fut.set_running_or_notify_cancel()) { return; }

            try {
                if constexpr (std::is_void_v<R>) {
                    std::apply(f, args);
                    fut.set_result();
                } else {
                    fut.set_result(std::apply(f, args));
                }
            } catch(...) {
                fut.set_exception(std::current_exception());
            }
        };
    }
};

/**
 @brief the default loop used while no host scheduler is installed

 Every operation is executed inline, `to_thread()` spawns a plain worker thread
 and awaiting blocks the calling thread.
 */
struct no_loop : public event_loop {
    no_loop() { HEB_MED_CONSTRUCTOR(); }
    virtual ~no_loop() { HEB_MED_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::no_loop"; }
    inline std::string name() const { return no_loop::info_name(); }

    inline future<void> next_cycle() { return make_ready_future<void>(); }

protected:
    inline void schedule_(thunk op) { op(); }
};

/// @return the installed loop
std::shared_ptr<event_loop> get_loop();

/**
 @brief install a loop

 The previous loop is detached first. If the new loop's `attach()` throws, an 
 `heb::no_loop` is installed and the exception is rethrown, so a loop is always 
 installed.
 */
void set_loop(std::shared_ptr<event_loop> loop);

/// install an `heb::no_loop`
void reset_loop();

/**
 @brief wrap a Callable so it executes inside the environment active right now

 The returned Callable can be executed on any thread at any later time. If no 
 environment is active when this is called the Callable executes unchanged.
 */
template <typename F>
auto keep_environment(F&& f) {
    std::shared_ptr<native::environment_data> env;

    if(service<native::runtime>::ready()) {
        env = service<native::runtime>::get().try_current_environment();
    }

    return [env, f=std::forward<F>(f)](auto&&... as) mutable -> decltype(auto) {
        std::optional<native::runtime::scoped_environment> scope;

        if(env && service<native::runtime>::ready()) {
            scope.emplace(service<native::runtime>::get().use(env));
        }

        return std::invoke(f, std::forward<decltype(as)>(as)...);
    };
}

/// `event_loop::from_thread()` on the installed loop, preserving the active environment
template <typename F, typename... As>
auto from_thread(F&& f, As&&... as) {
    return get_loop()->from_thread(keep_environment(std::forward<F>(f)), 
                                   std::forward<As>(as)...);
}

/// `event_loop::to_thread()` on the installed loop, preserving the active environment
template <typename F, typename... As>
auto to_thread(F&& f, As&&... as) {
    return get_loop()->to_thread(keep_environment(std::forward<F>(f)), 
                                 std::forward<As>(as)...);
}

}

#endif
