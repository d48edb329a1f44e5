//SPDX-License-Identifier: MIT
#include "policy.hpp"
#include "hospice.hpp"

namespace heb {
namespace detail {
namespace policy {

// true if the weak pointer was never assigned, as opposed to expired
template <typename T>
inline bool unassigned(const std::weak_ptr<T>& w) {
    std::weak_ptr<T> empty;
    return !w.owner_before(empty) && !empty.owner_before(w);
}

}
}
}

heb::managed_policy::managed_policy(std::unique_ptr<environment_store> store) :
    store_(std::move(store))
{
    HEB_HIGH_CONSTRUCTOR(store_.get());
}

heb::managed_policy::~managed_policy() { HEB_HIGH_DESTRUCTOR(); }

std::string heb::managed_policy::content() const {
    std::stringstream ss;
    ss << store_.get() << ", registered:" << std::boolalpha << registered();
    return ss.str();
}

void heb::managed_policy::on_policy_registered(native::environment_policy_api api) {
    HEB_INFO_METHOD_ENTER("on_policy_registered");
    std::lock_guard<std::mutex> lk(mtx_);
    api_.emplace(std::move(api));
}

void heb::managed_policy::on_policy_cleared() {
    HEB_INFO_METHOD_ENTER("on_policy_cleared");
    std::lock_guard<std::mutex> lk(mtx_);
    api_.reset();
}

std::shared_ptr<heb::native::environment_data>
heb::managed_policy::get_current_environment() {
    // inline sections bypass the store
    auto inl = inline_.get_current_environment();

    if(!detail::policy::unassigned(inl)) {
        auto env = inl.lock();
        if(env && is_alive(*env)) { return env; }

        HEB_WARNING_METHOD_BODY("get_current_environment",
                                "got dead environment in an inline section, ignoring it");
    }

    std::shared_ptr<native::environment_data> env;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto w = store_->get_current_environment();

        if(detail::policy::unassigned(w)) { return nullptr; }

        env = w.lock();

        if(env && is_alive(*env)) { return env; }

        store_->set_current_environment(std::weak_ptr<native::environment_data>());
    }

    // logging prints content(), which takes the lock
    HEB_WARNING_METHOD_BODY("get_current_environment",
                            "got dead environment, cleared it from ",
                            store_.get());
    return nullptr;
}

std::shared_ptr<heb::native::environment_data> heb::managed_policy::set_environment(
        std::shared_ptr<native::environment_data> env) {
    HEB_MED_METHOD_ENTER("set_environment", env);
    const bool dead = env && !is_alive(*env);
    std::shared_ptr<native::environment_data> prev;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        prev = store_->get_current_environment().lock();

        if(dead) [[unlikely]] {
            store_->set_current_environment(std::weak_ptr<native::environment_data>());
        } else {
            store_->set_current_environment(env);
        }
    }

    if(dead) [[unlikely]] {
        HEB_WARNING_METHOD_BODY("set_environment",
                                "got dead environment, cleared ",
                                store_.get(),
                                " instead");
    }

    return prev;
}

heb::native::environment_policy_api heb::managed_policy::api() const {
    std::lock_guard<std::mutex> lk(mtx_);

    if(!api_) [[unlikely]] {
        throw heb::configuration_error("the policy is not registered");
    }

    return *api_;
}

bool heb::managed_policy::registered() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return (bool)api_;
}

heb::managed_environment::managed_environment(
        std::shared_ptr<managed_policy> p,
        std::shared_ptr<native::environment_data> data,
        std::shared_ptr<native::core> core) :
    policy_(std::move(p)),
    data_(std::move(data)),
    core_(std::move(core))
{
    HEB_INFO_CONSTRUCTOR(data_);
}

heb::managed_environment::managed_environment(managed_environment&& rhs) :
    policy_(std::move(rhs.policy_)),
    data_(std::move(rhs.data_)),
    core_(std::move(rhs.core_))
{ }

heb::managed_environment& heb::managed_environment::operator=(managed_environment&& rhs) {
    if(this != &rhs) {
        if(data_) { dispose(); }
        policy_ = std::move(rhs.policy_);
        data_ = std::move(rhs.data_);
        core_ = std::move(rhs.core_);
    }

    return *this;
}

heb::managed_environment::~managed_environment() {
    if(data_) [[unlikely]] {
        HEB_WARNING_METHOD_BODY("~managed_environment",
                                "disposing ", data_, " in its destructor, this might cause leaks");

        try {
            dispose();
        } catch(const std::exception& e) {
            HEB_ERROR_METHOD_BODY("~managed_environment", "dispose() failed: ", e.what());
        }
    } else {
        HEB_INFO_DESTRUCTOR();
    }
}

std::string heb::managed_environment::content() const {
    if(data_) { return data_->to_string(); }
    else { return "disposed"; }
}

heb::native::runtime::scoped_environment heb::managed_environment::use() const {
    HEB_MED_METHOD_ENTER("use");
    check_();
    auto prev = policy_->set_environment(data_);
    return native::runtime::scoped_environment(policy_, std::move(prev));
}

void heb::managed_environment::switch_to() const {
    HEB_MED_METHOD_ENTER("switch_to");
    check_();
    policy_->set_environment(data_);
}

heb::managed_policy::inline_section heb::managed_environment::inline_section() const {
    check_();
    return managed_policy::inline_section(policy_, data_);
}

std::shared_ptr<heb::native::core> heb::managed_environment::core() const {
    check_();
    return core_;
}

void heb::managed_environment::dispose() {
    if(!data_) { return; }

    HEB_INFO_METHOD_BODY("dispose", "disposing ", data_);

    // the environment is disposed even if a later step throws
    auto data = std::move(data_);
    auto core = std::move(core_);

    if(!service<hospice>::ready()) [[unlikely]] {
        throw heb::configuration_error("heb::hospice is not running");
    }

    service<hospice>::get().admit(data, std::move(core));
    policy_->api().destroy_environment(data);
}

heb::policy::scoped_registration::~scoped_registration() {
    if(policy_ && policy_->registered()) {
        try {
            policy_->unregister_policy();
        } catch(const std::exception& e) {
            HEB_ERROR_FUNCTION_BODY("heb::policy::scoped_registration::~scoped_registration", e.what());
        }
    }
}

heb::policy::policy(std::unique_ptr<environment_store> store,
                    native::policy_registrar* registrar) :
    managed_(std::make_shared<managed_policy>(std::move(store))),
    registrar_(registrar)
{
    HEB_INFO_CONSTRUCTOR();
}

heb::policy::~policy() { HEB_INFO_DESTRUCTOR(); }

void heb::policy::register_policy() {
    HEB_INFO_METHOD_ENTER("register_policy");
    native::policy_registrar* r = registrar_;

    if(!r) {
        if(!service<native::runtime>::ready()) [[unlikely]] {
            throw heb::configuration_error("heb::native::runtime is not running");
        }

        r = &(service<native::runtime>::get());
    }

    r->register_policy(managed_);
}

void heb::policy::unregister_policy() {
    HEB_INFO_METHOD_ENTER("unregister_policy");
    managed_->api().unregister_policy();
}

heb::managed_environment heb::policy::new_environment() {
    HEB_INFO_METHOD_ENTER("new_environment");
    auto api = managed_->api();
    auto data = api.create_environment();
    auto core = api.core_of(*data);
    return managed_environment(managed_, std::move(data), std::move(core));
}

std::optional<heb::managed_policy::inline_section> heb::use_inline(
        const std::string& function_name,
        const managed_environment* env) {
    if(env) { return env->inline_section(); }

    if(!service<native::runtime>::ready() ||
       !service<native::runtime>::get().try_current_environment()) [[unlikely]]
    {
        throw heb::no_environment_error(function_name);
    }

    return std::nullopt;
}

std::optional<heb::native::runtime::scoped_environment> heb::use_inline(
        const std::string& function_name,
        std::shared_ptr<native::environment_data> env) {
    if(env) { return service<native::runtime>::get().use(std::move(env)); }

    if(!service<native::runtime>::ready() ||
       !service<native::runtime>::get().try_current_environment()) [[unlikely]]
    {
        throw heb::no_environment_error(function_name);
    }

    return std::nullopt;
}
