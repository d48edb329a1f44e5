//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_LOCAL_RUNTIME
#define HERMES_ENVIRONMENT_BRIDGE_LOCAL_RUNTIME

#include <deque>
#include <vector>
#include <thread>
#include <condition_variable>
#include <tuple>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "future.hpp"
#include "native.hpp"

namespace heb {
namespace config {
namespace runtime {

/**
 0: match the worker count of each core to the count of detected CPU cores
 n: launch n workers for each core

 @return the configured count of worker threads per core
 */
size_t threads();

}
}

namespace native {

/**
 @brief core of the reference runtime

 Owns a fixed pool of worker threads which execute submitted requests. Workers 
 are joined when the core is destroyed, which happens once the hospice releases 
 the last reference.
 */
struct local_core : public core {
    local_core(size_t threads);
    virtual ~local_core();

    static inline std::string info_name() { return "heb::native::local_core"; }
    inline std::string name() const { return local_core::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "threads:" << workers_.size();
        return ss.str();
    }

    inline size_t num_threads() const { return workers_.size(); }

    /**
     @brief the asynchronous per-item request primitive

     The returned future is resolved with the Callable's result or rejected 
     with its exception. Requests whose future is cancelled before a worker 
     picks them up are skipped.
     */
    template <typename F, typename... As>
    auto submit(F&& f, As&&... as) {
        typedef function_return_type<unqualified<F>,unqualified<As>...> R;
        HEB_MIN_METHOD_ENTER("submit");
        future<R> fut;

        post([fut, 
              f = unqualified<F>(std::forward<F>(f)), 
              args = std::make_tuple(std::forward<As>(as)...)]() mutable {
            if(!fut.set_running_or_notify_cancel()) { return; }

            try {
                if constexpr (std::is_void_v<R>) {
                    std::apply(f, std::move(args));
                    fut.set_result();
                } else {
                    fut.set_result(std::apply(f, std::move(args)));
                }
            } catch(...) {
                fut.set_exception(std::current_exception());
            }
        });

        return fut;
    }

    /// enqueue an operation on the workers
    void post(thunk t);

private:
    void run_();

    spinlock lk_;
    std::condition_variable_any cv_;
    bool halt_;
    std::deque<thunk> queue_;
    std::vector<std::thread> workers_;
};

/**
 @brief the reference native runtime

 Every environment gets its own `local_core`.
 */
struct local_runtime : public runtime {
    /// @param threads workers per core, 0 selects the count of detected CPU cores
    local_runtime(size_t threads = 0);
    virtual ~local_runtime();

    static inline std::string info_name() { return "heb::native::local_runtime"; }
    inline std::string name() const { return local_runtime::info_name(); }

    /// @return the configured worker count of each core
    inline size_t threads_per_core() const { return threads_; }

    size_t available_parallelism() const;

    /**
     @brief submit a request to the core of the current environment

     Throws `heb::no_environment_error` when no environment is current.
     */
    template <typename F, typename... As>
    static auto request(F&& f, As&&... as) {
        auto c = std::dynamic_pointer_cast<local_core>(
            service<runtime>::get().current_core());

        if(!c) [[unlikely]] {
            throw heb::configuration_error("the current core is not a heb::native::local_core");
        }

        return c->submit(std::forward<F>(f), std::forward<As>(as)...);
    }

protected:
    std::shared_ptr<core> make_core_();

private:
    const size_t threads_;
};

}
}

#endif
