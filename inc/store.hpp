//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_STORE
#define HERMES_ENVIRONMENT_BRIDGE_STORE

#include <cstdint>
#include <memory>
#include <sstream>
#include <unordered_map>

#include "logging.hpp"
#include "atomic.hpp"
#include "context.hpp"
#include "native.hpp"

namespace heb {

/**
 @brief where the current environment is remembered

 Stores never own an environment, they only hold weak references. Liveness 
 checks are the responsibility of the policy wrapping the store.

 Implementations must be safe to call from any thread.
 */
struct environment_store : public printable {
    /// the strategies selectable with `make()`
    enum strategy {
        global, /// one slot shared by the entire process
        thread, /// one slot per system thread
        task /// one slot per logical task (`heb::context`)
    };

    virtual ~environment_store() { }

    /// remember an environment, an empty pointer clears the slot
    virtual void set_current_environment(std::weak_ptr<native::environment_data> env) = 0;

    /// @return the remembered environment, possibly expired or empty
    virtual std::weak_ptr<native::environment_data> get_current_environment() const = 0;

    /// @return a newly allocated store implementing the given strategy
    static std::unique_ptr<environment_store> make(strategy s);
};

/// a single slot shared by every thread and task
struct global_store : public environment_store {
    static inline std::string info_name() { return "heb::global_store"; }
    inline std::string name() const { return global_store::info_name(); }

    inline void set_current_environment(std::weak_ptr<native::environment_data> env) {
        HEB_MIN_METHOD_ENTER("set_current_environment");
        std::lock_guard<spinlock> lk(lk_);
        env_ = std::move(env);
    }

    inline std::weak_ptr<native::environment_data> get_current_environment() const {
        std::lock_guard<spinlock> lk(lk_);
        return env_;
    }

private:
    mutable spinlock lk_;
    std::weak_ptr<native::environment_data> env_;
};

namespace detail {
namespace store {

typedef std::unordered_map<std::uint64_t,std::weak_ptr<native::environment_data>> slots;

// the calling thread's slots of every thread_local_store, destroyed with the thread
slots& tl_slots();

// a process unique store identifier, never reused
std::uint64_t make_key();

}
}

/**
 @brief one slot per system thread

 Slots live in thread local storage and die with their thread, so a new 
 thread never observes the value of an exited one, even when the system 
 reuses its thread id. Slots are private to the store instance: two stores 
 never observe each other's values. A cleared slot is erased.
 */
struct thread_local_store : public environment_store {
    thread_local_store() : key_(detail::store::make_key()) { }

    static inline std::string info_name() { return "heb::thread_local_store"; }
    inline std::string name() const { return thread_local_store::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "key:" << key_;
        return ss.str();
    }

    inline void set_current_environment(std::weak_ptr<native::environment_data> env) {
        HEB_MIN_METHOD_ENTER("set_current_environment");
        auto& slots = detail::store::tl_slots();

        if(env.expired()) { slots.erase(key_); }
        else { slots[key_] = std::move(env); }
    }

    inline std::weak_ptr<native::environment_data> get_current_environment() const {
        auto& slots = detail::store::tl_slots();
        auto it = slots.find(key_);
        return it == slots.end() ? std::weak_ptr<native::environment_data>() : it->second;
    }

    /// @return the count of slots the calling thread holds across every store
    static inline size_t thread_slots() { return detail::store::tl_slots().size(); }

private:
    const std::uint64_t key_;
};

/**
 @brief one slot per logical task

 Backed by a `heb::context_var`, so tasks inherit the value of their spawner 
 at spawn time and later changes are not visible across siblings.
 */
struct context_store : public environment_store {
    context_store() : var_("heb::context_store::environment") { }

    static inline std::string info_name() { return "heb::context_store"; }
    inline std::string name() const { return context_store::info_name(); }

    inline void set_current_environment(std::weak_ptr<native::environment_data> env) {
        HEB_MIN_METHOD_ENTER("set_current_environment");
        if(env.expired()) { var_.reset(); }
        else { var_.set(std::move(env)); }
    }

    inline std::weak_ptr<native::environment_data> get_current_environment() const {
        return var_.get(std::weak_ptr<native::environment_data>());
    }

private:
    context_var<std::weak_ptr<native::environment_data>> var_;
};

}

#endif
