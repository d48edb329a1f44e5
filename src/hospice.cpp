//SPDX-License-Identifier: MIT
#include <vector>

#include "hospice.hpp"

heb::hospice::hospice() : registry_(std::make_shared<registry>()) { 
    HEB_INFO_CONSTRUCTOR(); 
}

heb::hospice::~hospice() { 
    HEB_INFO_DESTRUCTOR(); 

    std::map<size_t,std::shared_ptr<native::core>> cores;

    {
        std::lock_guard<std::mutex> lk(registry_->mtx);
        std::swap(cores, registry_->cores);
    }

    if(cores.size()) {
        HEB_WARNING_METHOD_BODY("~hospice", "releasing ", cores.size(), " cores without a grace period");
    }
}

std::string heb::hospice::content() const {
    std::lock_guard<std::mutex> lk(registry_->mtx);
    std::stringstream ss;
    ss << "cores:" << registry_->cores.size()
       << ", stage1:" << registry_->stage1.size()
       << ", staged:" << registry_->staged.size()
       << ", stage2:" << registry_->stage2.size();
    return ss.str();
}

size_t heb::hospice::admit(const std::shared_ptr<native::environment_data>& env,
                           std::shared_ptr<native::core> core) {
    size_t id;

    {
        std::lock_guard<std::mutex> lk(registry_->mtx);
        id = registry_->next_id++;
        registry_->cores[id] = std::move(core);
    }

    HEB_INFO_METHOD_BODY("admit", "admitted ", env, " as id:", id);
    std::weak_ptr<registry> wr = registry_;

    env->observe([wr, id]{
        auto r = wr.lock();

        if(r) {
            HEB_INFO_FUNCTION_BODY("heb::hospice", "environment has died, keeping core for a few cycles, id:", id);
            std::lock_guard<std::mutex> lk(r->mtx);
            if(r->cores.count(id)) { r->stage1.insert(id); }
        }
    });

    return id;
}

void heb::hospice::notify() {
    HEB_MED_METHOD_ENTER("notify");
    std::unique_lock<std::mutex> lk(registry_->mtx);
    if(registry_->frozen) { return; }
    notify_(lk);
}

void heb::hospice::notify_(std::unique_lock<std::mutex>& lk) {
    auto& r = *registry_;

    // released cores are destroyed after the lock is released
    std::vector<std::shared_ptr<native::core>> garbage;
    std::vector<size_t> released;
    std::vector<size_t> held_stage2;
    std::vector<size_t> held_stage1;

    for(auto it = r.stage2.begin(); it != r.stage2.end();) {
        auto id = *it;
        auto& c = r.cores[id];

        if(still_used_(c)) {
            held_stage2.push_back(id);
            ++it;
            continue;
        }

        released.push_back(id);
        garbage.push_back(std::move(c));
        r.cores.erase(id);
        it = r.stage2.erase(it);
    }

    r.stage2.insert(r.staged.begin(), r.staged.end());
    r.staged.clear();

    for(auto it = r.stage1.begin(); it != r.stage1.end();) {
        auto id = *it;

        if(still_used_(r.cores[id])) {
            held_stage1.push_back(id);
            ++it;
            continue;
        }

        r.staged.insert(id);
        it = r.stage1.erase(it);
    }

    // logging prints content(), which takes the lock
    lk.unlock();

    for(auto id : held_stage2) {
        HEB_WARNING_METHOD_BODY("notify", "core is still in use in stage 2, id:", id);
    }

    for(auto id : released) {
        HEB_INFO_METHOD_BODY("notify", "marking core for collection, id:", id);
    }

    for(auto id : held_stage1) {
        HEB_WARNING_METHOD_BODY("notify", "core is still in use, id:", id);
    }

    garbage.clear();
    lk.lock();
}

bool heb::hospice::any_alive() {
    HEB_MED_METHOD_ENTER("any_alive");
    std::unique_lock<std::mutex> lk(registry_->mtx);

    // a frozen hospice has given up on its cores
    if(registry_->frozen) { return false; }

    const size_t passes = heb::config::hospice::any_alive_passes();

    for(size_t i=0; i<passes && registry_->cores.size(); ++i) {
        notify_(lk);
    }

    return !(registry_->cores.empty());
}

void heb::hospice::freeze() {
    HEB_INFO_METHOD_ENTER("freeze");
    std::lock_guard<std::mutex> lk(registry_->mtx);
    registry_->frozen = true;
}

void heb::hospice::unfreeze() {
    HEB_INFO_METHOD_ENTER("unfreeze");
    std::lock_guard<std::mutex> lk(registry_->mtx);
    registry_->frozen = false;
}

bool heb::hospice::frozen() const {
    std::lock_guard<std::mutex> lk(registry_->mtx);
    return registry_->frozen;
}

size_t heb::hospice::outstanding() const {
    std::lock_guard<std::mutex> lk(registry_->mtx);
    return registry_->cores.size();
}
