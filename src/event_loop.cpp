//SPDX-License-Identifier: MIT
#include "event_loop.hpp"

namespace heb {
namespace detail {
namespace event_loop {

std::recursive_mutex& mtx() {
    static std::recursive_mutex m;
    return m;
}

std::shared_ptr<heb::event_loop>& installed() {
    static std::shared_ptr<heb::event_loop> l = std::make_shared<heb::no_loop>();
    return l;
}

}
}
}

bool heb::event_loop::suspend_(std::coroutine_handle<>, const subscriber& subscribe) {
    struct wakeup {
        std::mutex mtx;
        std::condition_variable cv;
        bool ready = false;
    };

    auto w = std::make_shared<wakeup>();

    subscribe([w]{
        std::lock_guard<std::mutex> lk(w->mtx);
        w->ready = true;
        w->cv.notify_all();
    });

    std::unique_lock<std::mutex> lk(w->mtx);
    w->cv.wait(lk, [&]{ return w->ready; });

    // resume inline
    return false;
}

std::shared_ptr<heb::event_loop> heb::get_loop() {
    std::lock_guard<std::recursive_mutex> lk(detail::event_loop::mtx());
    return detail::event_loop::installed();
}

void heb::set_loop(std::shared_ptr<event_loop> loop) {
    HEB_INFO_FUNCTION_ENTER("heb::set_loop", loop);
    std::lock_guard<std::recursive_mutex> lk(detail::event_loop::mtx());
    auto& installed = detail::event_loop::installed();

    // a loop is installed on every exit path
    auto old = std::move(installed);
    installed = std::make_shared<no_loop>();

    old->detach();

    if(loop) {
        try {
            loop->attach();
        } catch(const std::exception& e) {
            HEB_WARNING_FUNCTION_BODY("heb::set_loop", "attach() failed, reverting to no loop: ", e.what());
            throw;
        }

        installed = std::move(loop);
    }
}

void heb::reset_loop() {
    set_loop(std::make_shared<no_loop>());
}
