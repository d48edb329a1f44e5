//SPDX-License-Identifier: MIT
#include <thread>

#include "native.hpp"

std::shared_ptr<heb::native::environment_policy> 
heb::native::environment_policy_api::check_(const char* op) const {
    auto owner = owner_.lock();

    if(!rt_ || !owner || rt_->policy() != owner) [[unlikely]] {
        std::stringstream ss;
        ss << op << " failed because the policy is not registered";
        throw heb::configuration_error(ss.str());
    }

    return owner;
}

std::shared_ptr<heb::native::environment_data> 
heb::native::environment_policy_api::create_environment() const {
    check_("create_environment()");
    return rt_->create_environment_();
}

void heb::native::environment_policy_api::destroy_environment(
        const std::shared_ptr<environment_data>& env) const {
    check_("destroy_environment()");
    rt_->destroy_environment_(env);
}

void heb::native::environment_policy_api::unregister_policy() const {
    if(unregister_) {
        unregister_();
    } else {
        rt_->unregister_policy(check_("unregister_policy()"));
    }
}

std::shared_ptr<heb::native::core> 
heb::native::environment_policy_api::core_of(const environment_data& env) const {
    check_("core_of()");
    auto c = env.core();
    if(!c) { throw heb::dead_environment_error(env.id()); }
    return c;
}

void heb::native::runtime::register_policy(std::shared_ptr<environment_policy> policy) {
    HEB_INFO_METHOD_ENTER("register_policy", policy.get());

    {
        std::lock_guard<std::mutex> lk(mtx_);

        if(policy_) [[unlikely]] {
            throw heb::configuration_error("a policy is already registered");
        }

        policy_ = policy;
    }

    try {
        policy->on_policy_registered(
            environment_policy_api(this, std::weak_ptr<environment_policy>(policy)));
    } catch(...) {
        // a policy that failed to accept registration is not registered
        {
            std::lock_guard<std::mutex> lk(mtx_);
            policy_.reset();
        }

        throw;
    }
}

void heb::native::runtime::unregister_policy(
        const std::shared_ptr<environment_policy>& policy) {
    HEB_INFO_METHOD_ENTER("unregister_policy", policy.get());

    {
        std::lock_guard<std::mutex> lk(mtx_);

        if(!policy_ || policy_ != policy) [[unlikely]] {
            throw heb::configuration_error("the policy is not registered");
        }

        policy_.reset();
    }

    policy->on_policy_cleared();
}

bool heb::native::runtime::registered() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return (bool)policy_;
}

std::shared_ptr<heb::native::environment_policy> heb::native::runtime::policy() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return policy_;
}

std::shared_ptr<heb::native::environment_data> 
heb::native::runtime::current_environment() const {
    auto p = policy();

    if(!p) [[unlikely]] {
        throw heb::configuration_error("no environment policy is registered");
    }

    return p->get_current_environment();
}

std::shared_ptr<heb::native::environment_data> 
heb::native::runtime::try_current_environment() const {
    auto p = policy();
    return p ? p->get_current_environment() : nullptr;
}

std::shared_ptr<heb::native::core> heb::native::runtime::current_core() const {
    auto env = current_environment();

    if(!env) [[unlikely]] { 
        throw heb::no_environment_error("heb::native::runtime::current_core()"); 
    }

    auto c = env->core();
    if(!c) [[unlikely]] { throw heb::dead_environment_error(env->id()); }
    return c;
}

heb::native::runtime::scoped_environment 
heb::native::runtime::use(std::shared_ptr<environment_data> env) const {
    HEB_MED_METHOD_ENTER("use", env);
    auto p = policy();

    if(!p) [[unlikely]] {
        throw heb::configuration_error("no environment policy is registered");
    }

    if(env && !p->is_alive(*env)) [[unlikely]] {
        throw heb::dead_environment_error(env->id());
    }

    auto prev = p->set_environment(std::move(env));
    return scoped_environment(std::move(p), std::move(prev));
}

size_t heb::native::runtime::available_parallelism() const {
    size_t n = std::thread::hardware_concurrency();
    return n ? n : 1;
}

std::shared_ptr<heb::native::environment_data> 
heb::native::runtime::create_environment_() {
    auto env = std::make_shared<environment_data>(
        next_id_.fetch_add(1, std::memory_order_relaxed), 
        make_core_());
    HEB_INFO_METHOD_BODY("create_environment_", env);
    return env;
}

void heb::native::runtime::destroy_environment_(
        const std::shared_ptr<environment_data>& env) {
    HEB_INFO_METHOD_ENTER("destroy_environment_", env);
    if(env) { env->invalidate_(); }
}
