//SPDX-License-Identifier: MIT
#include <atomic>

#include "context.hpp"

heb::context*& heb::detail::context::tl_this_context() {
    thread_local heb::context* c = nullptr;
    return c;
}

heb::context& heb::detail::context::tl_root_context() {
    thread_local heb::context root;
    return root;
}

std::uint64_t heb::detail::context::make_key() {
    static std::atomic<std::uint64_t> next(1);
    return next.fetch_add(1, std::memory_order_relaxed);
}
