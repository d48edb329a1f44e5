//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_ADAPTERS
#define HERMES_ENVIRONMENT_BRIDGE_ADAPTERS

#include <memory>
#include <string>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "error.hpp"
#include "context.hpp"
#include "future.hpp"
#include "event_loop.hpp"
#include "scheduler.hpp"
#include "nursery.hpp"

namespace heb {

/**
 @brief `heb::event_loop` adapter for an `heb::scheduler`

 Operations scheduled with `from_thread()` and `to_thread()` execute inside a
 copy of the calling thread's context. Coroutines awaiting on a task of the 
 adapted scheduler park the task, anywhere else the calling thread blocks.
 ```
 auto sch = heb::scheduler::make();
 heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));
 ```
 */
struct scheduler_loop : public event_loop {
    scheduler_loop(std::shared_ptr<scheduler> sch) : sch_(std::move(sch)) { 
        HEB_INFO_CONSTRUCTOR(sch_); 
    }

    virtual ~scheduler_loop() { HEB_INFO_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::scheduler_loop"; }
    virtual std::string name() const { return scheduler_loop::info_name(); }

    /**
     @brief a future completed on the scheduler's next batch

     Rejected with `heb::cancelled` if the calling task was cancelled by then.
     */
    future<void> next_cycle();

    void throw_if_cancelled();

    /// @return the adapted scheduler, nullptr if not available yet
    std::shared_ptr<scheduler> get_scheduler() const;

protected:
    scheduler_loop() { }

    void schedule_(thunk op);
    void spawn_(thunk op);
    bool suspend_(std::coroutine_handle<> h, const subscriber& subscribe);

    [[noreturn]] void raise_native_cancelled_() { 
        throw scheduler::cancelled_exception(); 
    }

    /// @return the scheduler, throws `heb::configuration_error` if not available
    std::shared_ptr<scheduler> scheduler_or_throw_() const;

    /// @return true if cancellation was requested for the calling task
    virtual bool cancel_requested_() const;

    mutable spinlock lk_;
    std::shared_ptr<scheduler> sch_;
};

/**
 @brief `heb::event_loop` adapter for an `heb::nursery`

 The adapter is unusable until attached, when it adopts the nursery's 
 scheduler. Detaching cancels the nursery. Operations executed with 
 `to_thread()` are limited by an optional `heb::capacity_limiter`.
 */
struct nursery_loop : public scheduler_loop {
    nursery_loop(std::shared_ptr<nursery> n, 
                 std::shared_ptr<capacity_limiter> limiter = nullptr) : 
        n_(std::move(n)),
        limiter_(std::move(limiter))
    { 
        HEB_INFO_CONSTRUCTOR(n_, limiter_); 
    }

    virtual ~nursery_loop() { HEB_INFO_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::nursery_loop"; }
    inline std::string name() const { return nursery_loop::info_name(); }

    /// throws `heb::configuration_error` if the nursery was already cancelled
    void attach();

    /// cancels the nursery
    void detach();

    /// @return the adapted nursery
    inline const std::shared_ptr<nursery>& get_nursery() const { return n_; }

protected:
    void spawn_(thunk op);

    [[noreturn]] void raise_native_cancelled_() { 
        throw nursery::cancelled_exception(); 
    }

    bool cancel_requested_() const;

private:
    std::shared_ptr<nursery> n_;
    std::shared_ptr<capacity_limiter> limiter_;
};

}

#endif
