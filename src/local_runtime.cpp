//SPDX-License-Identifier: MIT
#include "local_runtime.hpp"

heb::native::local_core::local_core(size_t threads) : halt_(false) {
    if(threads == 0) { threads = 1; }
    HEB_INFO_CONSTRUCTOR(threads);
    workers_.reserve(threads);

    for(size_t i=0; i<threads; ++i) {
        workers_.emplace_back([this]{ run_(); });
    }
}

heb::native::local_core::~local_core() {
    HEB_INFO_DESTRUCTOR();

    {
        std::lock_guard<spinlock> lk(lk_);
        halt_ = true;
    }

    cv_.notify_all();
    const auto self = std::this_thread::get_id();

    for(auto& w : workers_) {
        // a worker cannot join itself
        if(w.get_id() == self) [[unlikely]] { w.detach(); } 
        else { w.join(); }
    }
}

void heb::native::local_core::post(thunk t) {
    {
        std::lock_guard<spinlock> lk(lk_);
        queue_.push_back(std::move(t));
    }

    cv_.notify_one();
}

void heb::native::local_core::run_() {
    std::unique_lock<spinlock> lk(lk_);

    while(true) {
        while(queue_.empty() && !halt_) { cv_.wait(lk); }

        // drain remaining requests before halting
        if(queue_.empty()) { break; }

        thunk t = std::move(queue_.front());
        queue_.pop_front();
        lk.unlock();
        t();
        lk.lock();
    }
}

heb::native::local_runtime::local_runtime(size_t threads) :
    threads_([&]() -> size_t {
        if(threads) { return threads; }
        size_t n = std::thread::hardware_concurrency();
        return n ? n : 1;
    }())
{ 
    HEB_INFO_CONSTRUCTOR(threads_);
}

heb::native::local_runtime::~local_runtime() { HEB_INFO_DESTRUCTOR(); }

size_t heb::native::local_runtime::available_parallelism() const { 
    return threads_; 
}

std::shared_ptr<heb::native::core> heb::native::local_runtime::make_core_() {
    return std::make_shared<local_core>(threads_);
}
