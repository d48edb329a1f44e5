//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_UNIFIED
#define HERMES_ENVIRONMENT_BRIDGE_UNIFIED

#include <memory>
#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <iterator>
#include <string>

#include "utility.hpp"
#include "logging.hpp"
#include "error.hpp"
#include "future.hpp"
#include "coroutine.hpp"
#include "event_loop.hpp"

namespace heb {

template <typename T> struct unified_future;
template <typename T> struct unified_iterator;

namespace detail {
namespace unified {

template <typename T>
struct is_future : std::false_type { };

template <typename T>
struct is_future<heb::future<T>> : std::true_type { };

template <typename T>
struct generator_value { };

template <typename T>
struct generator_value<heb::future_generator<T>> { typedef T type; };

// the object a value refers to, smart pointers are dereferenced
template <typename T>
inline T& deref(T& t) { return t; }

template <typename T>
inline T& deref(std::shared_ptr<T>& t) { return *t; }

template <typename T>
inline T& deref(std::unique_ptr<T>& t) { return *t; }

template <typename U>
using resource = unqualified<decltype(deref(std::declval<U&>()))>;

template <typename R>
constexpr bool has_async_enter = requires(R& r) { r.async_enter(); };

template <typename R>
constexpr bool has_async_exit = requires(R& r) { r.async_exit(std::exception_ptr()); };

// the value produced by entering a scoped resource
template <typename R, bool ASYNC = has_async_enter<R>>
struct entered { typedef decltype(std::declval<R&>().enter()) type; };

template <typename R>
struct entered<R,true> { 
    typedef typename decltype(std::declval<R&>().async_enter())::value_type type; 
};

// the result of a Callable receiving the value a Callable of V produced
template <typename V, typename F>
struct result_of { typedef std::invoke_result_t<F&,V&> type; };

template <typename F>
struct result_of<void,F> { typedef std::invoke_result_t<F&> type; };

// resolve a future with the result of a Callable or reject it with its exception
template <typename V, typename F, typename... As>
void settle(heb::future<V>& out, F& f, As&&... as) {
    try {
        if constexpr (std::is_void_v<V>) {
            std::invoke(f, std::forward<As>(as)...);
            out.set_result();
        } else {
            out.set_result(std::invoke(f, std::forward<As>(as)...));
        }
    } catch(...) {
        out.set_exception(std::current_exception());
    }
}

// execute a Callable between a resource's enter and exit
template <typename R, typename F>
auto run_scoped(R& r, F&& f) -> function_return_type<F> {
    typedef function_return_type<F> V;
    std::optional<storage<V>> ret;

    try {
        ret.emplace(invoke_to_storage(std::forward<F>(f)));
    } catch(...) {
        r.exit(std::current_exception());
        throw;
    }

    r.exit(nullptr);
    if constexpr (!std::is_void_v<V>) { return std::move(*ret); }
}

template <typename T>
struct as_completed;

}
}

/**
 @brief a loop agnostic single value result 

 Wraps an `heb::future` with operations which work the same no matter which 
 `heb::event_loop` is installed:
 - blocking: `result()`, `wait()`
 - awaiting: `co_await` suspends through `heb::get_loop()`
 - chaining: `then()`, `map()`, `catch_error()` never throw synchronously, 
   exceptions thrown by their callbacks reject the derived result
 - scoped resources: `with()` and `async_with()` for values implementing 
   `enter()`/`exit(std::exception_ptr)`

 Copies share the same result.
 */
template <typename T>
struct unified_future : public printable {
    typedef T value_type;

    unified_future() { }
    unified_future(future<T> f) : fut_(std::move(f)) { }

    static inline std::string info_name() {
        return type::templatize<T>("heb::unified_future");
    }

    inline std::string name() const { return unified_future<T>::info_name(); }
    inline std::string content() const { return fut_.content(); }

    /**
     @brief wrap the future returned by a Callable

     An exception thrown by the Callable rejects the result.
     */
    template <typename F, typename... As>
    static unified_future<T> from_call(F&& f, As&&... as) {
        try {
            return from_future(std::invoke(std::forward<F>(f), std::forward<As>(as)...));
        } catch(...) {
            return reject(std::current_exception());
        }
    }

    static inline unified_future<T> from_future(future<T> f) {
        return unified_future<T>(std::move(f));
    }

    /// @return a resolved result
    template <typename... As>
    static inline unified_future<T> resolve(As&&... as) {
        return unified_future<T>(make_ready_future<T>(std::forward<As>(as)...));
    }

    /// @return a rejected result
    static inline unified_future<T> reject(std::exception_ptr eptr) {
        return unified_future<T>(make_exceptional_future<T>(eptr));
    }

    /// @return a result rejected with e
    template <typename E>
    static inline unified_future<T> reject(E e) {
        return reject(std::make_exception_ptr(std::move(e)));
    }

    /// block until done and return the result, see `heb::future::result()`
    inline T result(std::optional<typename future<T>::duration> timeout = std::nullopt) const { 
        return fut_.result(timeout); 
    }

    inline std::exception_ptr exception(std::optional<typename future<T>::duration> timeout = std::nullopt) const {
        return fut_.exception(timeout);
    }

    inline bool wait(std::optional<typename future<T>::duration> timeout = std::nullopt) const {
        return fut_.wait(timeout);
    }

    inline bool done() const { return fut_.done(); }
    inline bool cancelled() const { return fut_.cancelled(); }
    inline bool cancel() { return fut_.cancel(); }

    inline const future<T>& get_future() const { return fut_; }

    /**
     @brief call a Callable with this result once it is done

     The Callable executes inside the environment active during registration, 
     on whichever thread completed the result.
     */
    template <typename F>
    void add_done_callback(F&& f) {
        auto kept = keep_environment(std::forward<F>(f));

        fut_.add_done_callback([kept](future<T> fut) mutable {
            kept(unified_future<T>(std::move(fut)));
        });
    }

    /**
     @brief call a Callable with this result on the loop once it is done

     The Callable is scheduled with `heb::event_loop::from_thread()`, so it 
     executes on the loop's thread regardless of which thread completed the 
     result.
     */
    template <typename F>
    void add_loop_callback(F&& f) {
        add_done_callback([f=std::forward<F>(f)](unified_future<T> u) {
            get_loop()->from_thread(f, std::move(u));
        });
    }

    /**
     @brief derive a result from this one

     @param on_success Callable receiving the value
     @param on_error Callable receiving the `std::exception_ptr` of a rejection
     @return a result completed with the return value of whichever Callable was called
     */
    template <typename S, typename E>
    auto then(S on_success, E on_error) {
        typedef typename detail::unified::result_of<T,S>::type V;
        future<V> out;

        add_done_callback([out, on_success, on_error](unified_future<T> src) mutable {
            auto f = src.get_future();

            if(f.cancelled()) {
                out.cancel();
                return;
            } 

            auto eptr = f.exception();

            if(eptr) {
                detail::unified::settle(out, on_error, eptr);
            } else if constexpr (std::is_void_v<T>) {
                detail::unified::settle(out, on_success);
            } else {
                T value = f.result();
                detail::unified::settle(out, on_success, value);
            }
        });

        return unified_future<V>(std::move(out));
    }

    /// derive a result from the value, a rejection passes through unchanged
    template <typename F>
    auto map(F f) {
        typedef typename detail::unified::result_of<T,F>::type V;

        return then(std::move(f), [](std::exception_ptr eptr) -> V { 
            std::rethrow_exception(eptr); 
        });
    }

    /// recover from a rejection with the value returned by f
    template <typename F>
    unified_future<T> catch_error(F f) {
        if constexpr (std::is_void_v<T>) {
            return then([]{ }, std::move(f));
        } else {
            return then([](T& v) -> T { return std::move(v); }, std::move(f));
        }
    }

    /**
     @brief execute a Callable inside the scoped resource this result resolves to

     Blocks until the result is available, then calls `enter()` on it, executes
     the Callable with the entered value (if any), and calls `exit()` with the 
     exception the Callable threw or nullptr. Smart pointers are dereferenced.

     @return the return value of the Callable
     */
    template <typename F>
    auto with(F&& body) {
        static_assert(!std::is_void_v<T>, "heb::unified_future<void> is not a scoped resource");
        T obj = result();
        auto& r = detail::unified::deref(obj);

        if constexpr (std::is_void_v<decltype(r.enter())>) {
            r.enter();
            return detail::unified::run_scoped(r, [&]{ return std::invoke(body); });
        } else {
            auto v = r.enter();
            return detail::unified::run_scoped(r, [&]{ return std::invoke(body, v); });
        }
    }

    /**
     @brief the asynchronous form of `with()`

     The result is awaited through the installed loop. Resources implementing 
     `async_enter()`/`async_exit(std::exception_ptr)` returning `heb::co` are 
     entered and exited asynchronously, others with `enter()`/`exit()`.
     */
    template <typename F>
    auto async_with(F body) {
        static_assert(!std::is_void_v<T>, "heb::unified_future<void> is not a scoped resource");
        return async_with_<F,T>(fut_, std::move(body));
    }

    /// suspend through the installed loop until the result is available
    inline auto operator co_await() const { return get_loop()->await_future(fut_); }

private:
    // U defers forming the resource type until async_with() is called
    template <typename F, typename U>
    using async_with_result = typename detail::unified::result_of<
        typename detail::unified::entered<detail::unified::resource<U>>::type, F>::type;

    template <typename F, typename U>
    static co<async_with_result<F,U>> async_with_(future<U> fut, F body) {
        typedef detail::unified::resource<U> R;
        typedef typename detail::unified::entered<R>::type E;
        typedef async_with_result<F,U> V;

        U obj = co_await get_loop()->await_future(fut);
        auto& r = detail::unified::deref(obj);
        std::optional<storage<E>> entered;

        if constexpr (detail::unified::has_async_enter<R>) {
            if constexpr (std::is_void_v<E>) { co_await r.async_enter(); }
            else { entered.emplace(co_await r.async_enter()); }
        } else {
            if constexpr (std::is_void_v<E>) { r.enter(); }
            else { entered.emplace(r.enter()); }
        }

        std::exception_ptr eptr;
        std::optional<storage<V>> ret;

        try {
            if constexpr (std::is_void_v<E>) { ret.emplace(invoke_to_storage(body)); }
            else { ret.emplace(invoke_to_storage(body, *entered)); }
        } catch(...) {
            eptr = std::current_exception();
        }

        if constexpr (detail::unified::has_async_exit<R>) { co_await r.async_exit(eptr); }
        else { r.exit(eptr); }

        if(eptr) { std::rethrow_exception(eptr); }

        if constexpr (std::is_void_v<V>) { co_return; }
        else { co_return std::move(*ret); }
    }

    future<T> fut_;
};

/**
 @brief a loop agnostic sequence of results

 Iterates one underlying `heb::future_generator`. Copies share the generator, 
 so every item is consumed exactly once.
 ```
 heb::unified_iterator<int> it(heb::ordered_requests(10, request));

 for(int v : it) {
     // blocking iteration
 }
 ```
 */
template <typename T>
struct unified_iterator : public printable {
    static_assert(!std::is_void_v<T>, "heb::unified_iterator requires a value type");

    typedef T value_type;

    /// input iterator for range-based for loops
    struct iterator {
        typedef std::input_iterator_tag iterator_category;
        typedef T value_type;
        typedef std::ptrdiff_t difference_type;
        typedef T* pointer;
        typedef T& reference;

        iterator() : parent_(nullptr) { }
        iterator(unified_iterator<T>* parent) : parent_(parent) { advance_(); }

        inline T& operator*() { return *current_; }
        inline T* operator->() { return &(*current_); }

        inline iterator& operator++() { 
            advance_();
            return *this;
        }

        inline bool operator==(const iterator& rhs) const { 
            return !current_ && !rhs.current_; 
        }

        inline bool operator!=(const iterator& rhs) const { return !(*this == rhs); }

    private:
        inline void advance_() {
            current_ = parent_->next();
        }

        unified_iterator<T>* parent_;
        std::optional<T> current_;
    };

    unified_iterator(future_generator<T> source) : 
        source_(std::make_shared<future_generator<T>>(std::move(source)))
    { }

    static inline std::string info_name() {
        return type::templatize<T>("heb::unified_iterator");
    }

    inline std::string name() const { return unified_iterator<T>::info_name(); }

    /// @return an iterator over the future_generator returned by a Callable
    template <typename F, typename... As>
    static unified_iterator<T> from_call(F&& f, As&&... as) {
        return unified_iterator<T>(std::invoke(std::forward<F>(f), std::forward<As>(as)...));
    }

    /// @return the underlying sequence of futures
    inline future_generator<T>& futures() { return *source_; }

    /**
     @brief block until the next value is available
     @return the next value, or std::nullopt once the sequence is exhausted
     */
    inline std::optional<T> next() {
        auto f = (*source_)();
        if(!f) { return std::nullopt; }
        return f->result();
    }

    inline iterator begin() { return iterator(this); }
    inline iterator end() { return iterator(); }

    /**
     @brief await the next value through the installed loop
     @return the next value, or std::nullopt once the sequence is exhausted
     */
    inline co<std::optional<T>> anext() {
        return unified_iterator<T>::anext_((*source_)());
    }

    /**
     @brief process every future of the sequence in order as it completes

     The callback receives each completed future in turn, executing on the 
     loop inside the environment active during this call. Control is yielded 
     back to the loop after every item. Processing stops when:
     - the sequence is exhausted: the result resolves
     - the callback returns false: the result resolves
     - the callback or the sequence throws: the result is rejected
     - the result is cancelled

     @param callback a Callable receiving `heb::future<T>`, returning bool or void
     @return the completion of processing
     */
    template <typename F>
    unified_future<void> run_as_completed(F&& callback);

private:
    static co<std::optional<T>> anext_(std::optional<future<T>> f) {
        if(!f) { co_return std::nullopt; }
        co_return co_await get_loop()->await_future(std::move(*f));
    }

    std::shared_ptr<future_generator<T>> source_;
};

namespace detail {
namespace unified {

// the state of an `heb::unified_iterator::run_as_completed()` call
template <typename T>
struct as_completed : public std::enable_shared_from_this<as_completed<T>> {
    as_completed(std::shared_ptr<heb::future_generator<T>> source,
                 std::function<bool(heb::future<T>)> callback) :
        source_(std::move(source)),
        callback_(std::move(callback)),
        settled_(false)
    { }

    inline void start() {
        auto self = this->shared_from_this();

        try {
            get_loop()->from_thread([self]{ self->run_callbacks_(); });
        } catch(...) {
            finish_(std::current_exception());
        }
    }

    heb::future<void> state;

private:
    inline bool stopped_() const { return settled_.load() || state.done(); }

    inline void finish_(std::exception_ptr eptr) {
        if(settled_.exchange(true) || state.done()) { return; }
        if(eptr) { state.set_exception(eptr); }
        else { state.set_result(); }
    }

    inline std::optional<heb::future<T>> next_() {
        if(stopped_()) { return std::nullopt; }

        try {
            auto f = (*source_)();
            if(!f) { finish_(nullptr); }
            return f;
        } catch(...) {
            finish_(std::current_exception());
            return std::nullopt;
        }
    }

    // @return true if processing continues
    inline bool run_single_(heb::future<T> f) {
        if(stopped_()) { return false; }

        try {
            if(!callback_(std::move(f))) {
                finish_(nullptr);
                return false;
            }

            return true;
        } catch(...) {
            finish_(std::current_exception());
            return false;
        }
    }

    void run_callbacks_() {
        auto self = this->shared_from_this();

        try {
            while(auto f = next_()) {
                if(!f->done()) {
                    // continue on the loop once the future completes
                    f->add_done_callback([self](heb::future<T> fut) {
                        try {
                            get_loop()->from_thread([self, fut]{
                                if(self->run_single_(fut)) { self->run_callbacks_(); }
                            });
                        } catch(...) {
                            self->finish_(std::current_exception());
                        }
                    });

                    return;
                }

                if(!run_single_(*f)) { return; }

                // give control back to the loop
                auto nc = get_loop()->next_cycle();

                if(!nc.done()) {
                    nc.add_done_callback([self](heb::future<void> c) {
                        if(c.cancelled()) { self->finish_(std::make_exception_ptr(cancelled())); }
                        else if(auto eptr = c.exception()) { self->finish_(eptr); }
                        else { self->run_callbacks_(); }
                    });

                    return;
                }

                if(nc.cancelled()) {
                    finish_(std::make_exception_ptr(cancelled()));
                    return;
                } else if(auto eptr = nc.exception()) {
                    finish_(eptr);
                    return;
                }
            }
        } catch(...) {
            finish_(std::current_exception());
        }
    }

    std::shared_ptr<heb::future_generator<T>> source_;
    std::function<bool(heb::future<T>)> callback_;
    std::atomic<bool> settled_;
};

}
}

template <typename T>
template <typename F>
unified_future<void> unified_iterator<T>::run_as_completed(F&& callback) {
    auto kept = keep_environment(std::forward<F>(callback));

    std::function<bool(future<T>)> cb = [kept](future<T> f) mutable -> bool {
        if constexpr (std::is_void_v<decltype(kept(f))>) {
            kept(std::move(f));
            return true;
        } else {
            return (bool)kept(std::move(f));
        }
    };

    auto state = std::make_shared<detail::unified::as_completed<T>>(source_, std::move(cb));
    state->start();
    return unified_future<void>(state->state);
}

/**
 @brief wrap a Callable returning futures into one returning unified results

 A Callable returning `heb::future<T>` becomes one returning 
 `heb::unified_future<T>`, and a Callable returning `heb::future_generator<T>`
 becomes one returning `heb::unified_iterator<T>`.
 */
template <typename F>
auto unified(F f) {
    return [f](auto&&... as) mutable {
        typedef std::invoke_result_t<F&, decltype(as)...> R;

        if constexpr (detail::unified::is_future<unqualified<R>>::value) {
            typedef typename unqualified<R>::value_type T;
            return unified_future<T>::from_call(f, std::forward<decltype(as)>(as)...);
        } else {
            typedef typename detail::unified::generator_value<unqualified<R>>::type T;
            return unified_iterator<T>::from_call(f, std::forward<decltype(as)>(as)...);
        }
    };
}

}

#endif
