//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <thread>

#include "context.hpp"
#include "native.hpp"
#include "store.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace store {

inline std::shared_ptr<heb::native::environment_data> make_env(size_t id) {
    return std::make_shared<heb::native::environment_data>(id, nullptr);
}

}
}

TEST(store, make) {
    auto g = heb::environment_store::make(heb::environment_store::global);
    auto t = heb::environment_store::make(heb::environment_store::thread);
    auto c = heb::environment_store::make(heb::environment_store::task);

    EXPECT_EQ(heb::global_store::info_name(), g->name());
    EXPECT_EQ(heb::thread_local_store::info_name(), t->name());
    EXPECT_EQ(heb::context_store::info_name(), c->name());
}

TEST(store, global) {
    heb::global_store s;
    auto env = test::store::make_env(1);

    EXPECT_FALSE(s.get_current_environment().lock());
    s.set_current_environment(env);
    EXPECT_EQ(env, s.get_current_environment().lock());

    // visible from every thread
    test::queue<std::shared_ptr<heb::native::environment_data>> q;
    std::thread thd([&]{ q.push(s.get_current_environment().lock()); });
    thd.join();
    EXPECT_EQ(env, q.pop());

    s.set_current_environment(std::weak_ptr<heb::native::environment_data>());
    EXPECT_FALSE(s.get_current_environment().lock());
}

TEST(store, global_holds_weak_references) {
    heb::global_store s;
    auto env = test::store::make_env(1);
    std::weak_ptr<heb::native::environment_data> w = env;

    s.set_current_environment(env);
    env.reset();
    EXPECT_TRUE(w.expired());
    EXPECT_FALSE(s.get_current_environment().lock());
}

TEST(store, thread_local) {
    heb::thread_local_store s;
    auto env1 = test::store::make_env(1);
    auto env2 = test::store::make_env(2);

    s.set_current_environment(env1);
    test::queue<std::shared_ptr<heb::native::environment_data>> q;

    std::thread thd([&]{
        q.push(s.get_current_environment().lock());
        s.set_current_environment(env2);
        q.push(s.get_current_environment().lock());
    });

    thd.join();
    EXPECT_FALSE(q.pop());
    EXPECT_EQ(env2, q.pop());
    EXPECT_EQ(env1, s.get_current_environment().lock());
}

TEST(store, thread_local_slots_die_with_their_thread) {
    heb::thread_local_store s;
    auto env = test::store::make_env(1);

    // new threads often reuse the id of a joined one
    for(size_t i=0; i<8; ++i) {
        test::queue<bool> q;

        std::thread thd([&]{
            q.push((bool)s.get_current_environment().lock());
            s.set_current_environment(env);
        });

        thd.join();
        EXPECT_FALSE(q.pop());
    }

    EXPECT_FALSE(s.get_current_environment().lock());
}

TEST(store, thread_local_cleared_slots_are_erased) {
    size_t before = heb::thread_local_store::thread_slots();
    heb::thread_local_store s;
    auto env = test::store::make_env(1);

    s.set_current_environment(env);
    EXPECT_EQ(before + 1, heb::thread_local_store::thread_slots());

    s.set_current_environment(std::weak_ptr<heb::native::environment_data>());
    EXPECT_EQ(before, heb::thread_local_store::thread_slots());
}

TEST(store, thread_local_instances_are_private) {
    heb::thread_local_store s1;
    heb::thread_local_store s2;
    auto env = test::store::make_env(1);

    s1.set_current_environment(env);
    EXPECT_EQ(env, s1.get_current_environment().lock());
    EXPECT_FALSE(s2.get_current_environment().lock());
}

TEST(store, context) {
    heb::context_store s;
    auto env1 = test::store::make_env(1);
    auto env2 = test::store::make_env(2);
    heb::context parent;

    parent.run([&]{ s.set_current_environment(env1); });

    heb::context child(parent);

    child.run([&]{
        // inherited at copy time
        EXPECT_EQ(env1, s.get_current_environment().lock());
        s.set_current_environment(env2);
        EXPECT_EQ(env2, s.get_current_environment().lock());
    });

    parent.run([&]{ EXPECT_EQ(env1, s.get_current_environment().lock()); });

    parent.run([&]{
        s.set_current_environment(std::weak_ptr<heb::native::environment_data>());
        EXPECT_FALSE(s.get_current_environment().lock());
    });
}
