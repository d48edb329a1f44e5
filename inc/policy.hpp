//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_POLICY
#define HERMES_ENVIRONMENT_BRIDGE_POLICY

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "logging.hpp"
#include "error.hpp"
#include "native.hpp"
#include "store.hpp"

namespace heb {

/**
 @brief environment policy wrapping an `heb::environment_store`

 Adds what a bare store cannot provide:
 - liveness verification: a dead environment found in the store is logged as
   a warning, cleared from the store and reported as "no environment"
 - mutual exclusion: the check-then-use sequence of every lookup is atomic
 - inline sections: a per-thread override consulted before the store which
   never makes an environment switch observable to the store

 Access to the native API is only available while registered.
 */
struct managed_policy : public native::environment_policy,
                        public printable,
                        public std::enable_shared_from_this<managed_policy>
{
    /**
     @brief makes an environment current for the calling thread only

     The store is not touched. Not reentrant, and the calling task must not
     suspend while the section is open.
     */
    struct inline_section {
        inline_section(std::shared_ptr<managed_policy> p,
                       std::shared_ptr<native::environment_data> env) :
            policy_(std::move(p)),
            prev_(policy_->inline_.get_current_environment())
        {
            policy_->inline_.set_current_environment(env);
        }

        inline_section(const inline_section&) = delete;

        inline_section(inline_section&& rhs) :
            policy_(std::move(rhs.policy_)),
            prev_(std::move(rhs.prev_))
        { }

        inline_section& operator=(const inline_section&) = delete;
        inline_section& operator=(inline_section&&) = delete;

        ~inline_section() {
            if(policy_) { policy_->inline_.set_current_environment(prev_); }
        }

    private:
        std::shared_ptr<managed_policy> policy_;
        std::weak_ptr<native::environment_data> prev_;
    };

    managed_policy(std::unique_ptr<environment_store> store);
    virtual ~managed_policy();

    static inline std::string info_name() { return "heb::managed_policy"; }
    inline std::string name() const { return managed_policy::info_name(); }
    std::string content() const;

    void on_policy_registered(native::environment_policy_api api);
    void on_policy_cleared();
    std::shared_ptr<native::environment_data> get_current_environment();

    std::shared_ptr<native::environment_data> set_environment(
        std::shared_ptr<native::environment_data> env);

    inline bool is_alive(const native::environment_data& env) {
        return env.alive();
    }

    /**
     @brief the native API issued at registration

     Throws `heb::configuration_error` when not registered.
     */
    native::environment_policy_api api() const;

    /// @return true if registered
    bool registered() const;

    /// @return the wrapped store
    inline environment_store& store() { return *store_; }

private:
    mutable std::mutex mtx_;
    std::unique_ptr<environment_store> store_;
    std::optional<native::environment_policy_api> api_;
    thread_local_store inline_;
};

struct policy;

/**
 @brief an environment created by an `heb::policy`

 Owns exactly one native core, 1:1 with its environment. The environment is
 created in the constructor and must be released with `dispose()`, which hands
 the core to the `heb::hospice` and destroys the environment. Disposing is
 idempotent.

 A managed environment destroyed without being disposed logs a resource leak
 warning and disposes itself.
 */
struct managed_environment : public printable {
    managed_environment(std::shared_ptr<managed_policy> p,
                        std::shared_ptr<native::environment_data> data,
                        std::shared_ptr<native::core> core);

    managed_environment(const managed_environment&) = delete;
    managed_environment(managed_environment&& rhs);
    managed_environment& operator=(const managed_environment&) = delete;
    managed_environment& operator=(managed_environment&& rhs);

    virtual ~managed_environment();

    static inline std::string info_name() { return "heb::managed_environment"; }
    inline std::string name() const { return managed_environment::info_name(); }
    std::string content() const;

    /**
     @brief make this environment current until the returned object is destroyed

     The previously active environment is restored on every exit path. Throws
     `heb::disposed_environment_error` once disposed.
     */
    native::runtime::scoped_environment use() const;

    /// make this environment current without restoring the previous one
    void switch_to() const;

    /// open an inline section for this environment on the calling thread
    managed_policy::inline_section inline_section() const;

    /// hand the core to the hospice and destroy the environment
    void dispose();

    /// @return true once disposed
    inline bool disposed() const { return !data_; }

    /// @return the core owned by this environment
    std::shared_ptr<native::core> core() const;

    /// @return the underlying native environment or nullptr once disposed
    inline const std::shared_ptr<native::environment_data>& data() const {
        return data_;
    }

private:
    inline void check_() const {
        if(!data_) [[unlikely]] { throw disposed_environment_error(this); }
    }

    std::shared_ptr<managed_policy> policy_;
    std::shared_ptr<native::environment_data> data_;
    std::shared_ptr<native::core> core_;
};

/**
 @brief the lifecycle API of the bridge

 Wraps a store in an `heb::managed_policy` and registers it with a
 `heb::native::policy_registrar` (by default the process' native runtime). Only
 one policy can be registered at a time.
 ```
 heb::policy p(heb::environment_store::make(heb::environment_store::global));
 auto reg = p.registration(); // unregisters on scope exit

 auto env = p.new_environment();

 {
     auto scope = env.use();
     // native requests here use env's core
 }

 env.dispose();
 ```
 */
struct policy : public printable {
    /// unregisters the policy when destroyed
    struct scoped_registration {
        scoped_registration(policy* p) : policy_(p) { policy_->register_policy(); }
        scoped_registration(const scoped_registration&) = delete;
        scoped_registration(scoped_registration&& rhs) : policy_(rhs.policy_) { rhs.policy_ = nullptr; }
        scoped_registration& operator=(const scoped_registration&) = delete;

        ~scoped_registration();

    private:
        policy* policy_;
    };

    /**
     @param store the store remembering the current environment
     @param registrar the registration slot, the process' native runtime if nullptr
     */
    policy(std::unique_ptr<environment_store> store,
           native::policy_registrar* registrar = nullptr);

    policy(const policy&) = delete;
    policy& operator=(const policy&) = delete;

    virtual ~policy();

    static inline std::string info_name() { return "heb::policy"; }
    inline std::string name() const { return policy::info_name(); }

    /// register this policy, throws `heb::configuration_error` if another is registered
    void register_policy();

    /// unregister this policy through its native API
    void unregister_policy();

    /// @return true if registered
    inline bool registered() const { return managed_->registered(); }

    /// @return a registration which unregisters on every exit path
    inline scoped_registration registration() { return scoped_registration(this); }

    /// create a new isolated environment with its own core
    managed_environment new_environment();

    /// @return the native API, throws `heb::configuration_error` if not registered
    inline native::environment_policy_api api() const { return managed_->api(); }

    /// @return the underlying environment policy
    inline const std::shared_ptr<managed_policy>& managed() const { return managed_; }

private:
    std::shared_ptr<managed_policy> managed_;
    native::policy_registrar* registrar_;
};

/**
 @brief activation helper for engine functions accepting an optional environment

 With a managed environment an inline section is opened for it. With no
 environment an environment must already be current, otherwise
 `heb::no_environment_error` naming `function_name` is thrown.
 */
std::optional<managed_policy::inline_section> use_inline(
    const std::string& function_name,
    const managed_environment* env);

/// as above for a native environment, which is activated with `runtime::use()`
std::optional<native::runtime::scoped_environment> use_inline(
    const std::string& function_name,
    std::shared_ptr<native::environment_data> env);

}

#endif
