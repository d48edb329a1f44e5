//SPDX-License-Identifier: MIT
#include <atomic>

#include "store.hpp"

heb::detail::store::slots& heb::detail::store::tl_slots() {
    thread_local heb::detail::store::slots s;
    return s;
}

std::uint64_t heb::detail::store::make_key() {
    static std::atomic<std::uint64_t> next(1);
    return next.fetch_add(1, std::memory_order_relaxed);
}

std::unique_ptr<heb::environment_store> 
heb::environment_store::make(heb::environment_store::strategy s) {
    switch(s) {
        case heb::environment_store::thread:
            return std::make_unique<heb::thread_local_store>();
        case heb::environment_store::task:
            return std::make_unique<heb::context_store>();
        default:
            return std::make_unique<heb::global_store>();
    }
}
