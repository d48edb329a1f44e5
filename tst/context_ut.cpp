//SPDX-License-Identifier: Apache-2.0
#include <string>
#include <thread>
#include <stdexcept>

#include "context.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

TEST(context, var_default) {
    heb::context_var<int> unset("unset");
    heb::context_var<int> dflt("dflt", 3);

    EXPECT_FALSE(unset.get());
    EXPECT_EQ(7, unset.get(7));
    EXPECT_EQ(3, *(dflt.get()));
    EXPECT_EQ(3, dflt.get(7));
}

TEST(context, var_set_reset) {
    heb::context_var<std::string> var("var");
    heb::context c;

    c.run([&]{
        EXPECT_FALSE(var.get());
        var.set("hello");
        EXPECT_EQ(std::string("hello"), *(var.get()));
        var.reset();
        EXPECT_FALSE(var.get());
    });

    EXPECT_EQ(0u, c.size());
}

TEST(context, copies_are_isolated) {
    heb::context_var<int> var("var");
    heb::context parent;

    parent.run([&]{ var.set(1); });

    heb::context child(parent);

    child.run([&]{
        EXPECT_EQ(1, *(var.get()));
        var.set(2);
        EXPECT_EQ(2, *(var.get()));
    });

    parent.run([&]{ EXPECT_EQ(1, *(var.get())); });
    EXPECT_EQ(1u, parent.size());
    EXPECT_EQ(1u, child.size());
}

TEST(context, run_restores_previous) {
    heb::context_var<int> var("var");
    heb::context outer;
    heb::context inner;

    outer.run([&]{
        var.set(1);

        inner.run([&]{
            EXPECT_FALSE(var.get());
            var.set(2);
        });

        EXPECT_EQ(1, *(var.get()));
        EXPECT_EQ(&outer, &(heb::context::current()));
    });

    // exceptions restore the previous context too
    EXPECT_THROW(inner.run([]{ throw std::runtime_error("fail"); }), std::runtime_error);
    EXPECT_NE(&inner, &(heb::context::current()));
}

TEST(context, threads_have_root_contexts) {
    heb::context_var<int> var("var");
    heb::context c;
    c.run([&]{ var.set(1); });

    test::queue<bool> q;

    c.run([&]{
        std::thread thd([&]{ q.push((bool)var.get()); });
        thd.join();
    });

    EXPECT_FALSE(q.pop());
}

TEST(context, copy_captures_current) {
    heb::context_var<int> var("var");
    heb::context c;
    heb::context cpy;

    c.run([&]{
        var.set(5);
        cpy = heb::context::copy();
        var.set(6);
    });

    cpy.run([&]{ EXPECT_EQ(5, *(var.get())); });
    c.run([&]{ EXPECT_EQ(6, *(var.get())); });
}
