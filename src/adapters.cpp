//SPDX-License-Identifier: MIT
#include <thread>

#include "adapters.hpp"

heb::future<void> heb::scheduler_loop::next_cycle() {
    auto sch = scheduler_or_throw_();
    future<void> f;
    std::weak_ptr<scheduler::task> wt = scheduler::current_task();
    std::weak_ptr<event_loop> self = shared_from_this();

    sch->post([f, wt, self]() mutable {
        auto t = wt.lock();
        auto l = std::dynamic_pointer_cast<scheduler_loop>(self.lock());
        bool c = (t && t->cancelled()) || (l && l->cancel_requested_());

        if(c) { f.set_exception(std::make_exception_ptr(cancelled())); }
        else { f.set_result(); }
    });

    return f;
}

void heb::scheduler_loop::throw_if_cancelled() {
    if(cancel_requested_()) { throw cancelled(); }
}

std::shared_ptr<heb::scheduler> heb::scheduler_loop::get_scheduler() const {
    std::lock_guard<spinlock> lk(lk_);
    return sch_;
}

void heb::scheduler_loop::schedule_(thunk op) {
    auto sch = scheduler_or_throw_();
    auto ctx = context::copy();
    sch->post([ctx, op]() mutable { ctx.run(op); });
}

void heb::scheduler_loop::spawn_(thunk op) {
    auto ctx = context::copy();
    std::thread([ctx, op]() mutable { ctx.run(op); }).detach();
}

bool heb::scheduler_loop::suspend_(std::coroutine_handle<> h, const subscriber& subscribe) {
    auto sch = get_scheduler();
    auto t = scheduler::current_task();

    if(sch && t && scheduler::in() && &(scheduler::local()) == sch.get()) {
        sch->park(t, h, subscribe);
        return true;
    } else {
        return event_loop::suspend_(h, subscribe);
    }
}

std::shared_ptr<heb::scheduler> heb::scheduler_loop::scheduler_or_throw_() const {
    auto sch = get_scheduler();

    if(!sch) [[unlikely]] {
        throw configuration_error(name() + " is not attached");
    }

    return sch;
}

bool heb::scheduler_loop::cancel_requested_() const {
    auto t = scheduler::current_task();
    return t && t->cancelled();
}

void heb::nursery_loop::attach() {
    HEB_INFO_METHOD_ENTER("attach");

    if(n_->cancel_called()) [[unlikely]] {
        throw configuration_error("cannot attach to a cancelled heb::nursery");
    }

    std::lock_guard<spinlock> lk(lk_);
    sch_ = n_->get_scheduler();
}

void heb::nursery_loop::detach() {
    HEB_INFO_METHOD_ENTER("detach");

    {
        std::lock_guard<spinlock> lk(lk_);
        sch_.reset();
    }

    n_->cancel();
}

void heb::nursery_loop::spawn_(thunk op) {
    auto ctx = context::copy();
    auto limiter = limiter_;

    std::thread([ctx, op, limiter]() mutable { 
        if(limiter) {
            capacity_limiter::token tk(*limiter);
            ctx.run(op); 
        } else {
            ctx.run(op); 
        }
    }).detach();
}

bool heb::nursery_loop::cancel_requested_() const {
    return n_->cancel_called() || scheduler_loop::cancel_requested_();
}
