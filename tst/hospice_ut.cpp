//SPDX-License-Identifier: Apache-2.0
#include <memory>
#include <string>

#include "service.hpp"
#include "native.hpp"
#include "hospice.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace hospice {

struct core : public heb::native::core {
    static inline std::string info_name() { return "test::hospice::core"; }
    inline std::string name() const { return core::info_name(); }
    inline size_t num_threads() const { return 0; }
};

inline heb::hospice& get() { return heb::service<heb::hospice>::get(); }

inline std::shared_ptr<heb::native::environment_data> make_env() {
    return std::make_shared<heb::native::environment_data>(0, nullptr);
}

inline void notify(size_t count) {
    for(size_t i=0; i<count; ++i) { test::hospice::get().notify(); }
}

}
}

TEST(hospice, delays_release) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();
    std::weak_ptr<test::hospice::core> w = c;
    size_t outstanding = test::hospice::get().outstanding();

    test::hospice::get().admit(env, std::move(c));
    EXPECT_EQ(outstanding + 1, test::hospice::get().outstanding());

    // nothing advances while the environment lives
    test::hospice::notify(3);
    EXPECT_FALSE(w.expired());

    env.reset();
    EXPECT_FALSE(w.expired());

    test::hospice::notify(1);
    EXPECT_FALSE(w.expired());

    test::hospice::notify(1);
    EXPECT_FALSE(w.expired());

    test::hospice::notify(1);
    EXPECT_TRUE(w.expired());
    EXPECT_EQ(outstanding, test::hospice::get().outstanding());
}

TEST(hospice, delayed_on_held_core) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();
    std::weak_ptr<test::hospice::core> w = c;

    test::hospice::get().admit(env, c);
    env.reset();

    {
        test::warning_counter wc;
        test::hospice::notify(2);
        EXPECT_EQ(2u, wc.count());
    }

    c.reset();
    EXPECT_FALSE(w.expired());

    test::hospice::notify(2);
    EXPECT_FALSE(w.expired());

    test::hospice::notify(1);
    EXPECT_TRUE(w.expired());
}

TEST(hospice, retained_in_stage2_while_held) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();
    std::weak_ptr<test::hospice::core> w = c;

    test::hospice::get().admit(env, std::move(c));
    env.reset();

    test::hospice::notify(1);

    // a holder appears after the first notification
    auto held = w.lock();
    ASSERT_TRUE(held);

    test::hospice::notify(1);

    {
        test::warning_counter wc;
        test::hospice::notify(1);
        EXPECT_EQ(1u, wc.count());
    }

    held.reset();
    EXPECT_FALSE(w.expired());

    test::hospice::notify(1);
    EXPECT_TRUE(w.expired());
}

TEST(hospice, any_alive) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();

    EXPECT_FALSE(test::hospice::get().any_alive());

    test::hospice::get().admit(env, c);
    env.reset();

    {
        test::warning_counter wc;
        EXPECT_TRUE(test::hospice::get().any_alive());
        EXPECT_LE(1u, wc.count());
    }

    c.reset();
    EXPECT_FALSE(test::hospice::get().any_alive());
    EXPECT_EQ(0u, test::hospice::get().outstanding());
}

TEST(hospice, any_alive_with_living_environment) {
    auto env = test::hospice::make_env();
    test::hospice::get().admit(env, std::make_shared<test::hospice::core>());

    EXPECT_TRUE(test::hospice::get().any_alive());

    env.reset();
    EXPECT_FALSE(test::hospice::get().any_alive());
}

TEST(hospice, freeze) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();
    std::weak_ptr<test::hospice::core> w = c;

    test::hospice::get().admit(env, c);
    env.reset();

    {
        test::warning_counter wc;
        EXPECT_TRUE(test::hospice::get().any_alive());
    }

    test::hospice::get().freeze();
    EXPECT_TRUE(test::hospice::get().frozen());
    EXPECT_FALSE(test::hospice::get().any_alive());

    test::hospice::get().unfreeze();
    EXPECT_FALSE(test::hospice::get().frozen());

    {
        test::warning_counter wc;
        EXPECT_TRUE(test::hospice::get().any_alive());
    }

    c.reset();

    // transitions halt until unfrozen
    test::hospice::get().freeze();
    test::hospice::notify(3);
    EXPECT_FALSE(w.expired());
    EXPECT_EQ(1u, test::hospice::get().outstanding());

    test::hospice::get().unfreeze();
    test::hospice::notify(3);
    EXPECT_TRUE(w.expired());
    EXPECT_EQ(0u, test::hospice::get().outstanding());
}

TEST(hospice, logs_while_releasing) {
    auto env = test::hospice::make_env();
    auto c = std::make_shared<test::hospice::core>();
    std::weak_ptr<test::hospice::core> w = c;

    test::hospice::get().admit(env, c);
    env.reset();

    test::warning_counter wc;
    bool alive = true;

    // warnings about held cores are logged at every verbosity
    EXPECT_TRUE(test::verbose([&]{
        test::hospice::notify(2);
        c.reset();
        alive = test::hospice::get().any_alive();
    }));

    EXPECT_EQ(2u, wc.count());
    EXPECT_FALSE(alive);
    EXPECT_TRUE(w.expired());
}

TEST(hospice, content) {
    auto env = test::hospice::make_env();
    test::hospice::get().admit(env, std::make_shared<test::hospice::core>());
    env.reset();

    std::string s = test::hospice::get().to_string();
    EXPECT_NE(std::string::npos, s.find("heb::hospice"));
    EXPECT_NE(std::string::npos, s.find("cores:1"));
    EXPECT_NE(std::string::npos, s.find("stage1:1"));

    EXPECT_FALSE(test::hospice::get().any_alive());
}
