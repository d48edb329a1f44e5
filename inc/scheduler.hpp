//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_SCHEDULER
#define HERMES_ENVIRONMENT_BRIDGE_SCHEDULER

#include <memory>
#include <mutex>
#include <condition_variable>
#include <coroutine>
#include <atomic>
#include <deque>
#include <unordered_set>
#include <functional>
#include <string>
#include <sstream>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "error.hpp"
#include "context.hpp"
#include "future.hpp"
#include "coroutine.hpp"

namespace heb {

struct scheduler;

namespace detail {
namespace scheduler {

// the scheduler running on this thread
heb::scheduler*& tl_this_scheduler();

}
}

/**
 @brief a single threaded cooperative coroutine scheduler

 Coroutines are spawned as tasks. Each task executes inside a copy of the 
 context of the thread which spawned it and carries a cancellation flag. A task
 suspends by parking on the scheduler, and is resumed exactly once per park on 
 the thread calling `run()`.

 Operations can be posted onto the scheduler from any thread.
 ```
 auto sch = heb::scheduler::make();
 auto j = sch->spawn(my_coroutine());
 std::thread thd([sch]{ sch->run(); });
 int result = j.result();
 sch->stop();
 thd.join();
 ```
 */
struct scheduler : public printable, 
                   public std::enable_shared_from_this<scheduler> 
{
    /// the native cancellation exception of tasks on this scheduler
    struct cancelled_exception : public std::exception {
        virtual ~cancelled_exception() { }
        inline const char* what() const noexcept { return "task was cancelled"; }
    };

    /// a coroutine executing on the scheduler
    struct task : public printable, 
                  public std::enable_shared_from_this<task> 
    {
        task(context c) : ctx(std::move(c)), cancel_requested_(false) { 
            HEB_MED_CONSTRUCTOR(); 
        }

        virtual ~task() { HEB_MED_DESTRUCTOR(); }

        static inline std::string info_name() { return "heb::scheduler::task"; }
        inline std::string name() const { return task::info_name(); }

        /// request cancellation, a parked task is woken
        inline void cancel() {
            HEB_MED_METHOD_ENTER("cancel");
            cancel_requested_.store(true, std::memory_order_release);
            thunk w;

            {
                std::lock_guard<spinlock> lk(lk_);
                if(parked_) { w = wake_; }
            }

            if(w) { w(); }
        }

        /// @return true if cancellation was requested
        inline bool cancelled() const {
            return cancel_requested_.load(std::memory_order_acquire);
        }

        /// the context installed every time the task is resumed
        context ctx;

    private:
        std::atomic<bool> cancel_requested_;
        spinlock lk_;
        bool parked_ = false;
        size_t generation_ = 0;
        std::coroutine_handle<> parked_handle_;
        thunk wake_;
        co<void> root_;
        thunk on_abandon_;

        friend scheduler;
    };

    /// the handle to a spawned task's result
    template <typename T>
    struct job : public printable {
        job(future<T> f, std::weak_ptr<task> t) : fut_(std::move(f)), task_(std::move(t)) { }

        static inline std::string info_name() { 
            return type::templatize<T>("heb::scheduler::job"); 
        }

        inline std::string name() const { return job<T>::info_name(); }

        /**
         @brief block until the task is done and return its result

         Throws `heb::cancelled_error` if the task was cancelled.
         */
        inline T result(std::optional<typename future<T>::duration> timeout = std::nullopt) const { 
            return fut_.result(timeout); 
        }

        /// request cancellation of the task
        inline void cancel() {
            auto t = task_.lock();
            if(t) { t->cancel(); }
        }

        inline bool done() const { return fut_.done(); }

        /// @return the future resolved with the task's result
        inline const future<T>& get_future() const { return fut_; }

    private:
        future<T> fut_;
        std::weak_ptr<task> task_;
    };

    virtual ~scheduler();

    /// @return a new scheduler
    static inline std::shared_ptr<scheduler> make() {
        return std::shared_ptr<scheduler>(new scheduler);
    }

    static inline std::string info_name() { return "heb::scheduler"; }
    inline std::string name() const { return scheduler::info_name(); }
    std::string content() const;

    /// @return true if the calling thread is executing a scheduler's run()
    static inline bool in() {
        bool b = detail::scheduler::tl_this_scheduler();
        HEB_TRACE_FUNCTION_ENTER("heb::scheduler::in", b);
        return b;
    }

    /**
     @brief retrieve the calling thread's running scheduler 

     It is an ERROR to call this when `scheduler::in() == false`.
     */
    static inline scheduler& local() {
        HEB_TRACE_FUNCTION_ENTER("heb::scheduler::local");
        return *(detail::scheduler::tl_this_scheduler());
    }

    /// @return the task executing on the calling thread or nullptr
    static std::shared_ptr<task> current_task();

    /// execute an operation on the scheduler's thread, callable from any thread
    void post(thunk op);

    /**
     @brief schedule a coroutine as a new task

     The task executes inside a copy of the calling thread's current context.

     @param c a coroutine
     @return a job for the task's result
     */
    template <typename T>
    job<T> spawn(co<T> c) {
        HEB_MED_METHOD_ENTER("spawn", c);
        future<T> result;
        auto t = std::make_shared<task>(context::copy());
        t->on_abandon_ = [result]() mutable { result.cancel(); };
        t->root_ = scheduler::drive_<T>(std::move(c), result);
        std::coroutine_handle<> h = co<void>::handle_type::from_promise(t->root_.promise());

        {
            std::lock_guard<spinlock> lk(lk_);
            tasks_.insert(t);
        }

        std::weak_ptr<scheduler> self = shared_from_this();

        post([self, t, h]{
            auto s = self.lock();
            if(s) { s->resume_(t, h); }
        });

        return job<T>(std::move(result), t);
    }

    /**
     @brief execute operations until `stop()` is called

     It is an ERROR to call this while another thread is executing `run()`.
     */
    void run();

    /// cause `run()` to return after the current batch of operations
    void stop();

    /**
     @brief spawn a coroutine and run the scheduler until its task is done
     @return the result of the task
     */
    template <typename T>
    T run_until_complete(co<T> c) {
        HEB_MED_METHOD_ENTER("run_until_complete", c);
        auto j = spawn(std::move(c));
        std::weak_ptr<scheduler> self = shared_from_this();

        j.get_future().add_done_callback([self](future<T>) {
            auto s = self.lock();
            if(s) { s->stop(); }
        });

        run();
        return j.result();
    }

    /**
     @brief park a task until the thunk passed to subscribe is invoked

     The task is resumed on the scheduler exactly once: either when the thunk 
     is invoked or when the task is cancelled, whichever happens first.

     @param t the suspending task
     @param h the coroutine handle to resume
     @param subscribe called with the waking thunk
     */
    void park(const std::shared_ptr<task>& t, 
              std::coroutine_handle<> h, 
              const std::function<void(thunk)>& subscribe);

    /// @return the count of unfinished tasks
    size_t task_count() const;

private:
    scheduler() : stop_(false), waiting_(false) { HEB_INFO_CONSTRUCTOR(); }

    // the top level coroutine of a task, completes the task's future
    template <typename T>
    static co<void> drive_(co<T> c, future<T> result) {
        auto t = scheduler::current_task();

        if(t && t->cancelled()) {
            result.cancel();
            co_return;
        }

        try {
            if constexpr (std::is_void_v<T>) {
                co_await std::move(c);
                result.set_result();
            } else {
                result.set_result(co_await std::move(c));
            }
        } catch(const cancelled_exception&) {
            result.cancel();
        } catch(const cancelled&) {
            result.cancel();
        } catch(...) {
            result.set_exception(std::current_exception());
        }
    }

    // resume a task's coroutine with the task's context installed
    void resume_(const std::shared_ptr<task>& t, std::coroutine_handle<> h);

    // post the resumption of a parked task if it is still parked in generation
    void wake_(const std::shared_ptr<task>& t, size_t generation);

    mutable spinlock lk_;
    std::condition_variable_any cv_;
    std::deque<thunk> queue_;
    std::unordered_set<std::shared_ptr<task>> tasks_;
    bool stop_;
    bool waiting_;
};

}

#endif
