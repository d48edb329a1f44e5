//SPDX-License-Identifier: MIT
#include "testing.hpp"

std::shared_ptr<heb::testing::proxy_policy> heb::testing::proxy_policy::install() {
    if(!service<native::runtime>::ready()) [[unlikely]] {
        throw heb::configuration_error("heb::native::runtime is not running");
    }

    auto& rt = service<native::runtime>::get();
    auto p = std::make_shared<proxy_policy>(rt);
    rt.register_policy(p);
    return p;
}

void heb::testing::proxy_policy::uninstall() {
    HEB_INFO_METHOD_ENTER("uninstall");
    std::optional<native::environment_policy_api> api;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        api = api_;
    }

    if(api) { rt_.unregister_policy(shared_from_this()); }
}

void heb::testing::proxy_policy::register_policy(
        std::shared_ptr<native::environment_policy> policy) {
    HEB_INFO_METHOD_ENTER("register_policy", policy.get());
    std::optional<native::environment_policy_api> api;

    {
        std::lock_guard<std::mutex> lk(mtx_);

        if(!api_) [[unlikely]] {
            throw heb::configuration_error("this proxy is not active");
        }

        if(policy_) [[unlikely]] {
            throw heb::configuration_error("a policy is already registered");
        }

        policy_ = policy;
        api = api_;
    }

    std::weak_ptr<proxy_policy> self = shared_from_this();

    try {
        policy->on_policy_registered(api->with_unregister([self]{
            auto p = self.lock();
            if(p) { p->forcefully_unregister(); }
        }));
    } catch(...) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            policy_.reset();
        }

        throw;
    }
}

void heb::testing::proxy_policy::forcefully_unregister() {
    HEB_INFO_METHOD_ENTER("forcefully_unregister");

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if(!policy_ || !api_) { return; }
    }

    // clears the attached policy through on_policy_cleared()
    rt_.unregister_policy(shared_from_this());
    rt_.register_policy(shared_from_this());
}

bool heb::testing::proxy_policy::attached() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return (bool)policy_;
}

void heb::testing::proxy_policy::on_policy_registered(native::environment_policy_api api) {
    std::lock_guard<std::mutex> lk(mtx_);
    api_.emplace(std::move(api));
}

void heb::testing::proxy_policy::on_policy_cleared() {
    std::shared_ptr<native::environment_policy> policy;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::swap(policy, policy_);
        api_.reset();
    }

    if(policy) { policy->on_policy_cleared(); }
}

std::shared_ptr<heb::native::environment_policy> 
heb::testing::proxy_policy::attached_or_throw_() const {
    std::lock_guard<std::mutex> lk(mtx_);

    if(!policy_) [[unlikely]] {
        throw heb::configuration_error("this proxy is not attached to a policy");
    }

    return policy_;
}

std::shared_ptr<heb::native::environment_data> 
heb::testing::proxy_policy::get_current_environment() {
    std::shared_ptr<native::environment_policy> policy;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        policy = policy_;
    }

    return policy ? policy->get_current_environment() : nullptr;
}

std::shared_ptr<heb::native::environment_data> heb::testing::proxy_policy::set_environment(
        std::shared_ptr<native::environment_data> env) {
    return attached_or_throw_()->set_environment(std::move(env));
}

bool heb::testing::proxy_policy::is_alive(const native::environment_data& env) {
    return attached_or_throw_()->is_alive(env);
}
