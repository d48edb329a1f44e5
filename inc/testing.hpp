//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_TESTING
#define HERMES_ENVIRONMENT_BRIDGE_TESTING

#include <memory>
#include <mutex>
#include <optional>

#include "logging.hpp"
#include "native.hpp"

namespace heb {
namespace testing {

/**
 @brief a policy decorator allowing test harnesses to forcefully unregister

 The proxy registers itself in the native runtime's slot and acts as the 
 registrar for the policy under test. A failing test can then call 
 `forcefully_unregister()` to detach whatever policy is attached, leaving the 
 proxy registered and ready for the next test.
 ```
 auto proxy = heb::testing::proxy_policy::install();
 heb::policy p(heb::environment_store::make(heb::environment_store::global), proxy.get());
 p.register_policy();
 // ... test fails ...
 proxy->forcefully_unregister();
 ```
 */
struct proxy_policy : public native::environment_policy,
                      public native::policy_registrar,
                      public printable,
                      public std::enable_shared_from_this<proxy_policy>
{
    proxy_policy(native::runtime& rt) : rt_(rt) { HEB_INFO_CONSTRUCTOR(); }
    virtual ~proxy_policy() { HEB_INFO_DESTRUCTOR(); }

    static inline std::string info_name() { return "heb::testing::proxy_policy"; }
    inline std::string name() const { return proxy_policy::info_name(); }

    /// construct a proxy and register it with the process' native runtime
    static std::shared_ptr<proxy_policy> install();

    /// unregister the proxy (and any attached policy) from the native runtime
    void uninstall();

    /// attach a policy to the proxy, it receives the proxy's native API
    void register_policy(std::shared_ptr<native::environment_policy> policy);

    /// detach the attached policy, if any, and re-register the proxy
    void forcefully_unregister();

    /// @return true if a policy is attached
    bool attached() const;

    void on_policy_registered(native::environment_policy_api api);
    void on_policy_cleared();

    /// @return the attached policy's environment, or nullptr if detached
    std::shared_ptr<native::environment_data> get_current_environment();

    std::shared_ptr<native::environment_data> set_environment(
        std::shared_ptr<native::environment_data> env);

    bool is_alive(const native::environment_data& env);

private:
    std::shared_ptr<native::environment_policy> attached_or_throw_() const;

    native::runtime& rt_;
    mutable std::mutex mtx_;
    std::optional<native::environment_policy_api> api_;
    std::shared_ptr<native::environment_policy> policy_;
};

}
}

#endif
