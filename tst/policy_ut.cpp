//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <thread>
#include <optional>

#include "service.hpp"
#include "native.hpp"
#include "local_runtime.hpp"
#include "hospice.hpp"
#include "store.hpp"
#include "policy.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace policy {

inline heb::native::runtime& runtime() {
    return heb::service<heb::native::runtime>::get();
}

// release every core the test disposed
inline void drain_hospice() {
    EXPECT_FALSE(heb::service<heb::hospice>::get().any_alive());
}

}
}

struct policy : public test::policy_fixture { };

TEST_F(policy, register_and_unregister) {
    heb::policy p(heb::environment_store::make(heb::environment_store::global), proxy.get());

    EXPECT_FALSE(p.registered());
    EXPECT_THROW(p.api(), heb::configuration_error);
    EXPECT_THROW(p.new_environment(), heb::configuration_error);

    p.register_policy();
    EXPECT_TRUE(p.registered());
    EXPECT_TRUE(proxy->attached());

    p.unregister_policy();
    EXPECT_FALSE(p.registered());
    EXPECT_FALSE(proxy->attached());

    // the slot is free again
    p.register_policy();
    EXPECT_TRUE(p.registered());
}

TEST_F(policy, only_one_policy_registered) {
    auto p1 = make_policy();
    heb::policy p2(heb::environment_store::make(heb::environment_store::global), proxy.get());

    EXPECT_THROW(p2.register_policy(), heb::configuration_error);
    EXPECT_FALSE(p2.registered());
    EXPECT_TRUE(p1->registered());

    // the process slot is taken by the proxy
    heb::policy p3(heb::environment_store::make(heb::environment_store::global));
    EXPECT_THROW(p3.register_policy(), heb::configuration_error);
}

TEST_F(policy, scoped_registration) {
    heb::policy p(heb::environment_store::make(heb::environment_store::global), proxy.get());

    {
        auto reg = p.registration();
        EXPECT_TRUE(p.registered());
    }

    EXPECT_FALSE(p.registered());

    try {
        auto reg = p.registration();
        EXPECT_TRUE(p.registered());
        throw std::runtime_error("fail");
    } catch(const std::runtime_error&) { }

    EXPECT_FALSE(p.registered());
}

TEST_F(policy, api_fails_once_unregistered) {
    // register directly in the process slot
    proxy->uninstall();

    {
        heb::policy p(heb::environment_store::make(heb::environment_store::global));
        p.register_policy();
        EXPECT_EQ(p.managed(), test::policy::runtime().policy());

        auto api = p.api();
        p.unregister_policy();

        EXPECT_FALSE(test::policy::runtime().registered());
        EXPECT_THROW(api.create_environment(), heb::configuration_error);
        EXPECT_THROW(api.unregister_policy(), heb::configuration_error);
        EXPECT_THROW(p.api(), heb::configuration_error);
    }

    test::policy::runtime().register_policy(proxy);
}

TEST_F(policy, new_environment) {
    auto p = make_policy();
    auto env = p->new_environment();

    EXPECT_FALSE(env.disposed());
    EXPECT_TRUE(env.data());
    EXPECT_TRUE(env.data()->alive());
    EXPECT_TRUE(env.core());
    EXPECT_EQ(env.core(), env.data()->core());

    // every environment owns its own core
    auto env2 = p->new_environment();
    EXPECT_NE(env.core(), env2.core());
    EXPECT_NE(env.data()->id(), env2.data()->id());

    env.dispose();
    env2.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, use_restores_previous) {
    auto p = make_policy();
    auto env1 = p->new_environment();
    auto env2 = p->new_environment();

    EXPECT_FALSE(test::policy::runtime().current_environment());

    {
        auto s1 = env1.use();
        EXPECT_EQ(env1.data(), test::policy::runtime().current_environment());

        {
            auto s2 = env2.use();
            EXPECT_EQ(env2.data(), test::policy::runtime().current_environment());
            EXPECT_EQ(env2.core(), test::policy::runtime().current_core());
        }

        EXPECT_EQ(env1.data(), test::policy::runtime().current_environment());
    }

    EXPECT_FALSE(test::policy::runtime().current_environment());

    try {
        auto s = env1.use();
        throw std::runtime_error("fail");
    } catch(const std::runtime_error&) { }

    EXPECT_FALSE(test::policy::runtime().current_environment());

    env1.dispose();
    env2.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, switch_to) {
    auto p = make_policy();
    auto env = p->new_environment();

    env.switch_to();
    EXPECT_EQ(env.data(), test::policy::runtime().current_environment());

    {
        auto s = test::policy::runtime().use(nullptr);
        EXPECT_FALSE(test::policy::runtime().current_environment());
    }

    EXPECT_EQ(env.data(), test::policy::runtime().current_environment());

    env.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, dispose_is_idempotent) {
    auto p = make_policy();
    auto env = p->new_environment();
    auto& hsp = heb::service<heb::hospice>::get();
    size_t outstanding = hsp.outstanding();

    env.dispose();
    EXPECT_TRUE(env.disposed());
    EXPECT_EQ(outstanding + 1, hsp.outstanding());

    env.dispose();
    EXPECT_TRUE(env.disposed());
    EXPECT_EQ(outstanding + 1, hsp.outstanding());

    EXPECT_THROW(env.use(), heb::disposed_environment_error);
    EXPECT_THROW(env.switch_to(), heb::disposed_environment_error);
    EXPECT_THROW(env.core(), heb::disposed_environment_error);
    EXPECT_THROW(env.inline_section(), heb::disposed_environment_error);
    EXPECT_FALSE(env.data());

    test::policy::drain_hospice();
}

TEST_F(policy, dead_environment_is_cleared_with_warning) {
    auto p = make_policy();
    auto env = p->new_environment();
    env.switch_to();
    env.dispose();

    test::warning_counter wc;
    EXPECT_FALSE(test::policy::runtime().current_environment());
    EXPECT_EQ(1u, wc.count());

    // the store was cleared
    EXPECT_FALSE(test::policy::runtime().current_environment());
    EXPECT_EQ(1u, wc.count());

    test::policy::drain_hospice();
}

TEST_F(policy, dead_environment_is_cleared_at_every_verbosity) {
    auto p = make_policy();
    auto env = p->new_environment();
    env.switch_to();
    env.dispose();

    test::warning_counter wc;
    std::shared_ptr<heb::native::environment_data> cur;

    EXPECT_TRUE(test::verbose([&]{ cur = test::policy::runtime().current_environment(); }));
    EXPECT_FALSE(cur);
    EXPECT_EQ(1u, wc.count());

    test::policy::drain_hospice();
}

TEST_F(policy, dead_environment_in_inline_section_is_ignored) {
    auto p = make_policy();
    auto env1 = p->new_environment();
    auto env2 = p->new_environment();
    env1.switch_to();

    {
        auto section = env2.inline_section();
        auto data = env2.data();
        env2.dispose();
        EXPECT_FALSE(data->alive());

        // the store is consulted instead
        test::warning_counter wc;
        EXPECT_EQ(env1.data(), test::policy::runtime().current_environment());
        EXPECT_EQ(1u, wc.count());
    }

    EXPECT_EQ(env1.data(), test::policy::runtime().current_environment());

    env1.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, set_dead_environment_clears_the_store) {
    auto p = make_policy();
    auto env1 = p->new_environment();
    auto env2 = p->new_environment();
    env1.switch_to();

    auto data = env2.data();
    env2.dispose();

    {
        test::warning_counter wc;
        auto prev = p->managed()->set_environment(data);
        EXPECT_EQ(env1.data(), prev);
        EXPECT_EQ(1u, wc.count());

        EXPECT_FALSE(p->managed()->store().get_current_environment().lock());
        EXPECT_FALSE(test::policy::runtime().current_environment());
        EXPECT_EQ(1u, wc.count());
    }

    data.reset();
    env1.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, use_of_dead_native_environment_throws) {
    auto p = make_policy();
    auto env = p->new_environment();
    auto data = env.data();
    env.dispose();

    EXPECT_FALSE(data->alive());
    EXPECT_THROW(test::policy::runtime().use(data), heb::dead_environment_error);

    data.reset();
    test::policy::drain_hospice();
}

TEST_F(policy, destroy_without_dispose_warns) {
    auto p = make_policy();
    auto& hsp = heb::service<heb::hospice>::get();
    size_t outstanding = hsp.outstanding();
    test::warning_counter wc;

    {
        auto env = p->new_environment();
    }

    EXPECT_LE(1u, wc.count());
    EXPECT_EQ(outstanding + 1, hsp.outstanding());

    test::policy::drain_hospice();
}

TEST_F(policy, inline_section) {
    auto p = make_policy();
    auto env1 = p->new_environment();
    auto env2 = p->new_environment();

    env1.switch_to();

    {
        auto section = env2.inline_section();
        EXPECT_EQ(env2.data(), test::policy::runtime().current_environment());

        // the store is not touched
        EXPECT_EQ(env1.data(), p->managed()->store().get_current_environment().lock());

        // only the calling thread observes the section
        test::queue<std::shared_ptr<heb::native::environment_data>> q;
        std::thread thd([&]{ q.push(test::policy::runtime().current_environment()); });
        thd.join();
        EXPECT_EQ(env1.data(), q.pop());
    }

    EXPECT_EQ(env1.data(), test::policy::runtime().current_environment());

    env1.dispose();
    env2.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, use_inline) {
    auto p = make_policy();
    auto env = p->new_environment();

    try {
        heb::use_inline("test_function", (const heb::managed_environment*)nullptr);
        ADD_FAILURE() << "expected heb::no_environment_error";
    } catch(const heb::no_environment_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("test_function"));
    }

    {
        auto section = heb::use_inline("test_function", &env);
        EXPECT_TRUE(section);
        EXPECT_EQ(env.data(), test::policy::runtime().current_environment());
    }

    EXPECT_FALSE(test::policy::runtime().current_environment());

    {
        auto scope = heb::use_inline("test_function", env.data());
        EXPECT_TRUE(scope);
        EXPECT_EQ(env.data(), test::policy::runtime().current_environment());

        // an active environment satisfies the check
        auto none = heb::use_inline("test_function", (const heb::managed_environment*)nullptr);
        EXPECT_FALSE(none);
    }

    env.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, thread_strategy) {
    auto p = make_policy(heb::environment_store::thread);
    auto env = p->new_environment();

    {
        auto s = env.use();
        test::queue<bool> q;
        std::thread thd([&]{ q.push((bool)test::policy::runtime().current_environment()); });
        thd.join();

        EXPECT_FALSE(q.pop());
        EXPECT_EQ(env.data(), test::policy::runtime().current_environment());
    }

    env.dispose();
    test::policy::drain_hospice();
}

TEST_F(policy, forcefully_unregister) {
    auto p = make_policy();
    EXPECT_TRUE(p->registered());

    proxy->forcefully_unregister();
    EXPECT_FALSE(p->registered());
    EXPECT_FALSE(proxy->attached());
    EXPECT_FALSE(test::policy::runtime().current_environment());
    EXPECT_EQ(proxy, test::policy::runtime().policy());

    // a new policy can attach
    auto p2 = make_policy();
    EXPECT_TRUE(p2->registered());
}

TEST_F(policy, request_runs_on_current_core) {
    auto p = make_policy();
    auto env = p->new_environment();

    EXPECT_THROW(heb::native::local_runtime::request([]{ return 1; }),
                 heb::no_environment_error);

    {
        auto s = env.use();
        auto f = heb::native::local_runtime::request([](int i){ return i + 1; }, 2);
        EXPECT_EQ(3, f.result());

        auto e = heb::native::local_runtime::request([]() -> int {
            throw std::runtime_error("fail");
        });

        EXPECT_THROW(e.result(), std::runtime_error);
    }

    env.dispose();
    test::policy::drain_hospice();
}
