//SPDX-License-Identifier: MIT
/*
 This file contains the various `heb::config::` implementations necessary for 
 reading runtime bridge values. 

 They are accessors to the `heb::lifecycle::config` object returned from 
 `heb::service<heb::lifecycle>::get().get_config()`. Said object is declared 
 after the other objects of the bridge, because the `heb::lifecycle` manages 
 the memory of all services. Therefore these functions are declared early by 
 each feature to be able to indirectly access what it needs to configure 
 itself.

 Outside of a lifecycle the compile time defaults apply.
 */
#include "lifecycle.hpp"
#include "prefetch.hpp"

namespace heb {
namespace detail {
namespace config {

inline const heb::lifecycle::config& get() {
    static const heb::lifecycle::config defaults;

    return service<heb::lifecycle>::ready() 
        ? service<heb::lifecycle>::get().get_config() 
        : defaults;
}

}
}
}

int heb::config::logging::default_log_level() {
    return heb::detail::config::get().log.loglevel;
}

size_t heb::config::runtime::threads() {
    return heb::detail::config::get().rt.threads;
}

size_t heb::config::hospice::any_alive_passes() {
    return heb::detail::config::get().hsp.any_alive_passes;
}

size_t heb::config::prefetch::backlog_factor() {
    return heb::detail::config::get().pf.backlog_factor;
}
