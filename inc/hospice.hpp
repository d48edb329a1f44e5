//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_HOSPICE
#define HERMES_ENVIRONMENT_BRIDGE_HOSPICE

#include <memory>
#include <mutex>
#include <map>
#include <set>

#include "logging.hpp"
#include "service.hpp"
#include "native.hpp"

namespace heb {
namespace config {
namespace hospice {

/// @return the maximum count of notifications `any_alive()` performs
size_t any_alive_passes();

}
}

/**
 @brief staged, deferred reclamation of native cores

 A native core cannot be released synchronously when its environment dies, 
 because the native side may still be finishing work for it. Admitted cores are 
 kept alive until the environment died and several collector cycles elapsed 
 without any outside holder of the core.

 An admitted entry moves through the following states:
 - active: the environment is alive
 - stage1: the environment died
 - staged: the core had no outside holder during a notification
 - stage2: the core is released during the next notification unless held

 The first notification after the environment died confirms that the core is 
 unreferenced. Two more notifications must elapse before the core is released.
 Cores which are still referenced from outside the hospice are retained and 
 reported with a warning every notification.

 Stage transitions only ever happen during `notify()`. The registry is 
 protected by a single lock spanning admission, promotion and release.
 */
struct hospice : public service<hospice>, public printable {
    hospice();
    virtual ~hospice();

    static inline std::string info_name() { return "heb::hospice"; }
    inline std::string name() const { return hospice::info_name(); }
    std::string content() const;

    /**
     @brief take custody of an environment's core
     @return the id assigned to the entry
     */
    size_t admit(const std::shared_ptr<native::environment_data>& env,
                 std::shared_ptr<native::core> core);

    /// one collector cycle completed, advance the stages
    void notify();

    /**
     @brief report whether any admitted core is still retained

     While anything is outstanding, performs up to 
     `heb::config::hospice::any_alive_passes()` notifications first. Always 
     false while frozen, so a test harness can stop reporting cascading 
     failures.
     */
    bool any_alive();

    /// pause stage advancement
    void freeze();

    /// resume stage advancement
    void unfreeze();

    /// @return true if frozen
    bool frozen() const;

    /// @return the count of retained cores
    size_t outstanding() const;

private:
    struct registry {
        mutable std::mutex mtx;
        size_t next_id = 0;
        bool frozen = false;
        std::map<size_t,std::shared_ptr<native::core>> cores;
        std::set<size_t> stage1;
        std::set<size_t> staged;
        std::set<size_t> stage2;
    };

    // the hospice holds the only reference when use_count() is 1
    static inline bool still_used_(const std::shared_ptr<native::core>& c) {
        return c.use_count() > 1;
    }

    void notify_(std::unique_lock<std::mutex>& lk);

    // observers only hold weak references to the registry
    std::shared_ptr<registry> registry_;
};

}

#endif
