//SPDX-License-Identifier: MIT
#include "nursery.hpp"

void heb::nursery::cancel() {
    HEB_INFO_METHOD_ENTER("cancel");
    std::vector<thunk> cancellers;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        cancel_called_ = true;
        cancellers = cancellers_;
    }

    for(auto& c : cancellers) { c(); }
}

heb::future<void> heb::nursery::join() {
    HEB_INFO_METHOD_ENTER("join");
    bool resolve;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
        resolve = should_resolve_();
    }

    if(resolve) { resolve_(); }
    return joined_;
}

void heb::nursery::child_done_(std::exception_ptr eptr) {
    bool cancel_siblings = false;
    bool resolve;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        --children_;

        if(eptr && !error_) {
            error_ = eptr;
            cancel_siblings = true;
        }

        resolve = should_resolve_();
    }

    if(cancel_siblings) {
        HEB_WARNING_METHOD_BODY("child_done_", "a child failed, cancelling its siblings");
        cancel();
    }

    if(resolve) { resolve_(); }
}

bool heb::nursery::should_resolve_() {
    if(closed_ && !children_ && !resolved_) {
        resolved_ = true;
        return true;
    }

    return false;
}

void heb::nursery::resolve_() {
    std::exception_ptr eptr;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        eptr = error_;
        cancellers_.clear();
    }

    if(eptr) { joined_.set_exception(eptr); }
    else { joined_.set_result(); }
}
