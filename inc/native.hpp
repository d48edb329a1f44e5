//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_NATIVE
#define HERMES_ENVIRONMENT_BRIDGE_NATIVE

#include <memory>
#include <mutex>
#include <atomic>
#include <string>
#include <sstream>
#include <functional>

#include "utility.hpp"
#include "logging.hpp"
#include "atomic.hpp"
#include "cleanup.hpp"
#include "service.hpp"
#include "error.hpp"

namespace heb {

/**
 @brief the capability surface of the native processing runtime

 The bridge never assumes anything about the native runtime beyond what this
 namespace declares:
 - environments can be created and destroyed
 - every environment owns exactly one core
 - the runtime asks a single registered policy for the current environment
 */
namespace native {

struct runtime;
struct environment_policy;

/// an isolated instance of the native runtime's processing state
struct core : public printable {
    virtual ~core() { }

    /// @return the count of worker threads processing requests for this core
    virtual size_t num_threads() const = 0;
};

/**
 @brief opaque identity handle of a native environment

 Aliveness must always be queried with `alive()`, the native side may
 invalidate an environment concurrently. Death observers installed with
 `observe()` fire exactly once when the last strong reference is released.
 */
struct environment_data final : public printable, private cleanup {
    environment_data(size_t id, std::shared_ptr<native::core> c) :
        id_(id),
        alive_(true),
        core_(std::move(c))
    {
        HEB_MED_CONSTRUCTOR(id);
    }

    ~environment_data() {
        HEB_MED_DESTRUCTOR();
        clean();
    }

    static inline std::string info_name() { return "heb::native::environment_data"; }
    inline std::string name() const { return environment_data::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "id:" << id_ << ", alive:" << std::boolalpha << alive();
        return ss.str();
    }

    inline size_t id() const { return id_; }
    inline bool alive() const { return alive_.load(std::memory_order_acquire); }

    /// @return the environment's core, or nullptr once invalidated
    inline std::shared_ptr<native::core> core() const {
        std::lock_guard<spinlock> lk(lk_);
        return core_;
    }

    /// install a single-fire observer called when this handle is destroyed
    inline void observe(cleanup::operation op) { install(std::move(op)); }

private:
    // mark the environment dead and release its reference to the core
    inline void invalidate_() {
        HEB_MED_METHOD_ENTER("invalidate_");
        std::shared_ptr<native::core> c;

        {
            std::lock_guard<spinlock> lk(lk_);
            alive_.store(false, std::memory_order_release);
            std::swap(c, core_);
        }
    }

    const size_t id_;
    std::atomic<bool> alive_;
    mutable spinlock lk_;
    std::shared_ptr<native::core> core_;

    friend runtime;
};

/**
 @brief the API handed to a registered policy

 Every operation requires that the policy this API was issued to is still the
 registered policy, otherwise `heb::configuration_error` is thrown.
 */
struct environment_policy_api : public printable {
    environment_policy_api(runtime* rt, std::weak_ptr<environment_policy> owner) :
        rt_(rt),
        owner_(std::move(owner))
    { }

    environment_policy_api(const environment_policy_api&) = default;
    environment_policy_api& operator=(const environment_policy_api&) = default;

    static inline std::string info_name() { return "heb::native::environment_policy_api"; }
    inline std::string name() const { return environment_policy_api::info_name(); }

    /// create a new environment with its own core
    std::shared_ptr<environment_data> create_environment() const;

    /// destroy an environment, releasing its reference to its core
    void destroy_environment(const std::shared_ptr<environment_data>& env) const;

    /// unregister the policy this API was issued to
    void unregister_policy() const;

    /// @return the core of a living environment
    std::shared_ptr<core> core_of(const environment_data& env) const;

    /**
     @brief copy this API with a replacement `unregister_policy()` operation

     Used by policies which forward the API to a decorated policy.
     */
    inline environment_policy_api with_unregister(thunk op) const {
        environment_policy_api api(*this);
        api.unregister_ = std::move(op);
        return api;
    }

private:
    // throw if the owner is not the registered policy
    std::shared_ptr<environment_policy> check_(const char* op) const;

    runtime* rt_;
    std::weak_ptr<environment_policy> owner_;
    thunk unregister_;
};

/**
 @brief the interface the native runtime consults for the current environment
 */
struct environment_policy {
    virtual ~environment_policy() { }

    /// called when the policy becomes the registered policy
    virtual void on_policy_registered(environment_policy_api api) = 0;

    /// called after the policy is unregistered
    virtual void on_policy_cleared() = 0;

    /// @return the current environment or nullptr
    virtual std::shared_ptr<environment_data> get_current_environment() = 0;

    /**
     @brief set the current environment
     @return the previously current environment or nullptr
     */
    virtual std::shared_ptr<environment_data> set_environment(
        std::shared_ptr<environment_data> env) = 0;

    /// @return true if the environment is still usable
    virtual bool is_alive(const environment_data& env) = 0;
};

/// the single process wide registration slot for policies
struct policy_registrar {
    virtual ~policy_registrar() { }

    /// throws `heb::configuration_error` if a policy is already registered
    virtual void register_policy(std::shared_ptr<environment_policy> policy) = 0;
};

/**
 @brief process service implementing the native runtime's registration slot

 Implementations provide the cores. The lifecycle constructs the configured
 implementation, see `heb::lifecycle::config::runtime`.
 */
struct runtime : public service<runtime>,
                 public policy_registrar,
                 public printable
{
    /// restores the previous environment when destroyed
    struct scoped_environment {
        scoped_environment(std::shared_ptr<environment_policy> p,
                           std::shared_ptr<environment_data> prev) :
            policy_(std::move(p)),
            prev_(std::move(prev))
        { }

        scoped_environment(const scoped_environment&) = delete;
        scoped_environment(scoped_environment&&) = default;
        scoped_environment& operator=(const scoped_environment&) = delete;

        ~scoped_environment() {
            if(policy_) { policy_->set_environment(std::move(prev_)); }
        }

    private:
        std::shared_ptr<environment_policy> policy_;
        std::shared_ptr<environment_data> prev_;
    };

    runtime() : next_id_(1) { }
    virtual ~runtime() { }

    static inline std::string info_name() { return "heb::native::runtime"; }
    virtual std::string name() const { return runtime::info_name(); }

    void register_policy(std::shared_ptr<environment_policy> policy);

    /// unregister a policy, throws if it is not the registered policy
    void unregister_policy(const std::shared_ptr<environment_policy>& policy);

    /// @return true if a policy is registered
    bool registered() const;

    /// @return the registered policy or nullptr
    std::shared_ptr<environment_policy> policy() const;

    /**
     @brief ask the registered policy for the current environment
     @return the current environment or nullptr
     */
    std::shared_ptr<environment_data> current_environment() const;

    /// as current_environment() but returns nullptr when no policy is registered
    std::shared_ptr<environment_data> try_current_environment() const;

    /// @return the core of the current environment
    std::shared_ptr<core> current_core() const;

    /**
     @brief make an environment current until the returned object is destroyed

     Throws `heb::configuration_error` if no policy is registered and
     `heb::dead_environment_error` if the environment is no longer alive.
     */
    scoped_environment use(std::shared_ptr<environment_data> env) const;

    /// @return the parallelism available to native requests
    virtual size_t available_parallelism() const;

protected:
    /// construct the core for a new environment
    virtual std::shared_ptr<core> make_core_() = 0;

private:
    std::shared_ptr<environment_data> create_environment_();
    void destroy_environment_(const std::shared_ptr<environment_data>& env);

    mutable std::mutex mtx_;
    std::shared_ptr<environment_policy> policy_;
    std::atomic<size_t> next_id_;

    friend environment_policy_api;
};

}
}

#endif
