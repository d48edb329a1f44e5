//SPDX-License-Identifier: MIT
#include <memory>
#include <vector>

#include "scheduler.hpp"

namespace heb {
namespace detail {
namespace scheduler {

// the task executing on this thread
heb::scheduler::task*& tl_this_task() {
    thread_local heb::scheduler::task* t = nullptr;
    return t;
}

}
}
}

heb::scheduler*& heb::detail::scheduler::tl_this_scheduler() {
    thread_local heb::scheduler* s = nullptr;
    return s;
}

heb::scheduler::~scheduler() {
    HEB_INFO_DESTRUCTOR();
    std::deque<thunk> queue;
    std::unordered_set<std::shared_ptr<task>> tasks;

    {
        std::lock_guard<spinlock> lk(lk_);
        std::swap(queue, queue_);
        std::swap(tasks, tasks_);
    }

    queue.clear();

    // destroy the frames of unfinished tasks, cancelling their results
    for(auto& t : tasks) {
        HEB_WARNING_METHOD_BODY("~scheduler", "abandoning unfinished ", t);
        t->root_.reset();

        if(t->on_abandon_) { t->on_abandon_(); }
    }
}

std::string heb::scheduler::content() const {
    std::stringstream ss;
    std::lock_guard<spinlock> lk(lk_);
    ss << "tasks:" << tasks_.size() << ", queued:" << queue_.size();
    return ss.str();
}

std::shared_ptr<heb::scheduler::task> heb::scheduler::current_task() {
    auto t = detail::scheduler::tl_this_task();
    return t ? t->shared_from_this() : nullptr;
}

void heb::scheduler::post(thunk op) {
    HEB_TRACE_METHOD_ENTER("post");
    std::lock_guard<spinlock> lk(lk_);
    queue_.push_back(std::move(op));

    if(waiting_) {
        waiting_ = false;
        cv_.notify_one();
    }
}

void heb::scheduler::run() {
    // manage the thread_local pointers for this scheduler with RAII
    struct scoped_locals {
        scoped_locals(scheduler* s) : prev_(detail::scheduler::tl_this_scheduler()) {
            detail::scheduler::tl_this_scheduler() = s;
        }

        ~scoped_locals() { detail::scheduler::tl_this_scheduler() = prev_; }

    private:
        scheduler* prev_;
    };

    scoped_locals stl(this);
    HEB_HIGH_METHOD_ENTER("run");

    std::deque<thunk> batch;
    std::unique_lock<spinlock> lk(lk_);

    while(!stop_) [[likely]] {
        if(queue_.size()) [[likely]] {
            // acquire the entire batch with a swap to reduce lock contention
            std::swap(batch, queue_);
            lk.unlock();

            for(auto& op : batch) {
                try {
                    op();
                } catch(const std::exception& e) {
                    HEB_ERROR_METHOD_BODY("run", "operation threw: ", e.what());
                }
            }

            batch.clear();
            lk.lock();
        } else [[unlikely]] {
            waiting_ = true;
            cv_.wait(lk);
        }
    }

    // allow the scheduler to be run again
    stop_ = false;
    lk.unlock();
    HEB_HIGH_METHOD_BODY("run", "stopped");
}

void heb::scheduler::stop() {
    HEB_HIGH_METHOD_ENTER("stop");
    std::lock_guard<spinlock> lk(lk_);
    stop_ = true;

    if(waiting_) {
        waiting_ = false;
        cv_.notify_one();
    }
}

void heb::scheduler::park(const std::shared_ptr<task>& t, 
                          std::coroutine_handle<> h, 
                          const std::function<void(thunk)>& subscribe) {
    HEB_LOW_METHOD_ENTER("park", t, h);
    size_t generation;
    thunk w;
    std::weak_ptr<scheduler> ws = shared_from_this();
    std::weak_ptr<task> wt = t;

    {
        std::lock_guard<spinlock> lk(t->lk_);
        generation = ++(t->generation_);
        t->parked_ = true;
        t->parked_handle_ = h;
        t->wake_ = [ws, wt, generation]{
            auto s = ws.lock();
            auto t = wt.lock();
            if(s && t) { s->wake_(t, generation); }
        };
        w = t->wake_;
    }

    subscribe(w);

    // a cancellation before the park must still wake the task
    if(t->cancelled()) { w(); }
}

size_t heb::scheduler::task_count() const {
    std::lock_guard<spinlock> lk(lk_);
    return tasks_.size();
}

void heb::scheduler::resume_(const std::shared_ptr<task>& t, std::coroutine_handle<> h) {
    struct scoped_task {
        scoped_task(task* t) : prev_(detail::scheduler::tl_this_task()) {
            detail::scheduler::tl_this_task() = t;
        }

        ~scoped_task() { detail::scheduler::tl_this_task() = prev_; }

    private:
        task* prev_;
    };

    if(!(t->root_)) [[unlikely]] { return; }

    {
        scoped_task st(t.get());
        t->ctx.run([&]{ h.resume(); });
    }

    if(t->root_.done()) {
        HEB_MED_METHOD_BODY("resume_", t, " completed");
        t->root_.reset();

        std::lock_guard<spinlock> lk(lk_);
        tasks_.erase(t);
    }
}

void heb::scheduler::wake_(const std::shared_ptr<task>& t, size_t generation) {
    std::coroutine_handle<> h;

    {
        std::lock_guard<spinlock> lk(t->lk_);

        // resumed exactly once per park
        if(!(t->parked_) || t->generation_ != generation) { return; }

        t->parked_ = false;
        h = t->parked_handle_;
        t->parked_handle_ = nullptr;
        t->wake_ = nullptr;
    }

    HEB_LOW_METHOD_BODY("wake_", t);
    std::weak_ptr<scheduler> self = shared_from_this();

    post([self, t, h]{
        auto s = self.lock();
        if(s) { s->resume_(t, h); }
    });
}
