//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_ATOMIC
#define HERMES_ENVIRONMENT_BRIDGE_ATOMIC

#include <atomic>

#include "logging.hpp"

namespace heb {

/**
@brief core mechanism for short critical sections 

Implements the Lockable API without operating system blocking. Pairs with 
`std::condition_variable_any` when a waiter must block.
*/
struct spinlock : public printable {
    spinlock() { 
        HEB_TRACE_CONSTRUCTOR();
        lock_.clear(); 
    }

    virtual ~spinlock() { HEB_TRACE_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::spinlock"; }
    inline std::string name() const { return spinlock::info_name(); }

    inline void lock() {
        HEB_TRACE_METHOD_ENTER("lock");
        while(lock_.test_and_set(std::memory_order_acquire)){ } 
    }

    inline bool try_lock() {
        HEB_TRACE_METHOD_ENTER("try_lock");
        return !(lock_.test_and_set(std::memory_order_acquire)); 
    }

    inline void unlock() {
        HEB_TRACE_METHOD_ENTER("unlock");
        lock_.clear(std::memory_order_release); 
    }

private:
    std::atomic_flag lock_;
};

}

#endif
