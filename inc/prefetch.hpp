//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_PREFETCH
#define HERMES_ENVIRONMENT_BRIDGE_PREFETCH

#include <memory>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <functional>
#include <optional>
#include <thread>
#include <map>
#include <string>
#include <sstream>

#include "utility.hpp"
#include "logging.hpp"
#include "future.hpp"
#include "service.hpp"
#include "native.hpp"

namespace heb {
namespace config {
namespace prefetch {

/// @return the default ratio of backlog to prefetch
size_t backlog_factor();

}
}

namespace detail {
namespace prefetch {

/*
 The reorder buffer. Requests are issued while:
 - fewer than `prefetch` requests are in flight
 - fewer than `backlog` requests are issued but not consumed

 The lock is recursive because a request which is already done when it is 
 issued calls back into the buffer on the issuing thread.
 */
template <typename T>
struct buffer : public printable, 
                public std::enable_shared_from_this<buffer<T>> 
{
    buffer(heb::future_generator<T> source, size_t prefetch, size_t backlog) :
        source_(std::move(source)),
        prefetch_(prefetch),
        backlog_(backlog)
    { 
        HEB_MED_CONSTRUCTOR(prefetch, backlog); 
    }

    virtual ~buffer() { HEB_MED_DESTRUCTOR(); }

    static inline std::string info_name() { 
        return type::templatize<T>("heb::detail::prefetch::buffer"); 
    }

    inline std::string name() const { return buffer<T>::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        ss << "prefetch:" << prefetch_ 
           << ", backlog:" << backlog_ 
           << ", running:" << running_ 
           << ", buffered:" << reorder_.size();
        return ss.str();
    }

    // issue requests until a bound is reached
    inline void refill() {
        std::lock_guard<std::recursive_mutex> lk(mtx_);

        while(!finished_ && running_ < prefetch_ && reorder_.size() < backlog_) {
            request_next_();
        }
    }

    // block until the next future in submission order is available
    std::optional<heb::future<T>> next() {
        std::unique_lock<std::recursive_mutex> lk(mtx_);

        while(true) {
            auto it = reorder_.find(consumed_);

            if(it != reorder_.end()) {
                heb::future<T> f = it->second;
                reorder_.erase(it);
                ++consumed_;
                refill();
                return f;
            } 
            
            // wait for in flight requests to finish before ending the sequence
            if(finished_ && !running_) {
                if(source_error_) {
                    auto eptr = source_error_;
                    source_error_ = nullptr;
                    std::rethrow_exception(eptr);
                }

                return std::nullopt;
            }

            cv_.wait(lk);
        }
    }

    // stop issuing requests
    inline void close() {
        HEB_MED_METHOD_ENTER("close");
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        finished_ = true;
        cv_.notify_all();
    }

private:
    // lock must be held
    inline void request_next_() {
        std::optional<heb::future<T>> f;

        try {
            f = source_();
        } catch(...) {
            // rethrown to the consumer once everything issued is consumed
            source_error_ = std::current_exception();
            finished_ = true;
            cv_.notify_all();
            return;
        }

        if(!f) {
            finished_ = true;
            cv_.notify_all();
            return;
        }

        ++running_;
        reorder_.emplace(issued_++, *f);
        std::weak_ptr<buffer<T>> self = this->shared_from_this();

        f->add_done_callback([self](heb::future<T> done) {
            auto b = self.lock();
            if(b) { b->finished_request_(done); }
        });
    }

    inline void finished_request_(heb::future<T>& f) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        --running_;

        if(!finished_) {
            if(f.cancelled() || f.exception()) {
                HEB_MED_METHOD_BODY("finished_request_", "request failed, no more requests are issued");
                finished_ = true;
            } else {
                refill();
            }
        }

        cv_.notify_all();
    }

    heb::future_generator<T> source_;
    const size_t prefetch_;
    const size_t backlog_;

    mutable std::recursive_mutex mtx_;
    std::condition_variable_any cv_;
    bool finished_ = false;
    size_t running_ = 0;
    size_t issued_ = 0;
    size_t consumed_ = 0;
    std::map<size_t, heb::future<T>> reorder_;
    std::exception_ptr source_error_;
};

// closes the buffer when the consuming generator is destroyed
template <typename T>
struct closer {
    closer(std::shared_ptr<buffer<T>> b) : buffer_(std::move(b)) { }
    ~closer() { buffer_->close(); }

    std::shared_ptr<buffer<T>> buffer_;
};

}
}

/**
 @brief pipeline a sequence of requests, preserving submission order

 Requests are pulled from the source ahead of the consumer. The returned 
 generator yields them strictly in submission order regardless of the order 
 they complete in. Retrieving a future which is not issued yet blocks.

 Once a request fails or the returned generator is destroyed no further 
 requests are issued, but requests already in flight are allowed to finish. An 
 exception thrown by the source is rethrown by the returned generator once 
 every issued request has been yielded.

 @param source the sequence of requests
 @param prefetch maximum count of requests in flight, 0 selects the native runtime's available parallelism
 @param backlog maximum count of issued but unconsumed requests, defaults to `prefetch * heb::config::prefetch::backlog_factor()` and is never lower than prefetch
 @return the reordered sequence
 */
template <typename T>
future_generator<T> buffer_futures(future_generator<T> source, 
                                   size_t prefetch = 0, 
                                   std::optional<size_t> backlog = std::nullopt) {
    if(prefetch == 0) {
        prefetch = service<native::runtime>::ready() 
            ? service<native::runtime>::get().available_parallelism()
            : std::thread::hardware_concurrency();

        if(prefetch == 0) { prefetch = 1; }
    }

    size_t bl = backlog ? *backlog : prefetch * config::prefetch::backlog_factor();
    if(bl < prefetch) { bl = prefetch; }

    HEB_MED_FUNCTION_ENTER("heb::buffer_futures", prefetch, bl);

    auto b = std::make_shared<detail::prefetch::buffer<T>>(std::move(source), prefetch, bl);
    b->refill();

    auto c = std::make_shared<detail::prefetch::closer<T>>(b);
    return [c]() -> std::optional<future<T>> { return c->buffer_->next(); };
}

/**
 @brief enter every scoped resource of a sequence, exiting it once consumed

 Each yielded future resolves with the value returned by `enter()` of the 
 resource the source's future resolved to. The resource's `exit()` is called 
 once its future completed and the consumer retrieved the next item (or the 
 generator is destroyed). Resources are held by pointer, typically 
 `std::shared_ptr`, and `enter()` must return a value.
 */
template <typename T>
auto close_when_needed(future_generator<T> source) {
    typedef decltype(std::declval<T&>()->enter()) E;

    struct state {
        future_generator<T> source;
        std::optional<future<T>> previous;

        ~state() { close_previous(); }

        // exit the previous resource once its future is done
        inline void close_previous() {
            if(!previous) { return; }

            previous->add_done_callback([](future<T> f) {
                if(!f.cancelled() && !f.exception()) {
                    T r = f.result();
                    r->exit(nullptr);
                }
            });

            previous.reset();
        }
    };

    auto s = std::make_shared<state>();
    s->source = std::move(source);

    return future_generator<E>([s]() -> std::optional<future<E>> {
        s->close_previous();
        auto f = s->source();

        if(!f) { return std::nullopt; }

        future<E> entered;
        s->previous = *f;

        f->add_done_callback([entered](future<T> src) mutable {
            if(src.cancelled()) {
                entered.cancel();
                return;
            }

            try {
                auto eptr = src.exception();

                if(eptr) { entered.set_exception(eptr); }
                else {
                    T r = src.result();
                    entered.set_result(r->enter());
                }
            } catch(...) {
                entered.set_exception(std::current_exception());
            }
        });

        return entered;
    });
}

/**
 @brief pipeline `request(i)` for every i in [0,count)
 @return the results in index order, see `heb::buffer_futures()`
 */
template <typename F>
auto ordered_requests(size_t count, 
                      F request, 
                      size_t prefetch = 0, 
                      std::optional<size_t> backlog = std::nullopt) {
    typedef typename unqualified<function_return_type<F&,size_t>>::value_type T;
    size_t i = 0;

    future_generator<T> source = [i, count, request]() mutable -> std::optional<future<T>> {
        if(i >= count) { return std::nullopt; }
        return request(i++);
    };

    return buffer_futures<T>(std::move(source), prefetch, backlog);
}

}

#endif
