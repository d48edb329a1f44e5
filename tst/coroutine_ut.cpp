//SPDX-License-Identifier: Apache-2.0
#include <string>
#include <vector>
#include <stdexcept>

#include "coroutine.hpp"

#include <gtest/gtest.h>
#include "test_helpers.hpp"

namespace test {
namespace coroutine {

inline heb::co<void> co_void() {
    co_return;
}

template <typename T>
inline heb::co<T> co_return_T(T t) {
    co_return t;
}

inline heb::co<int> co_throw() {
    throw std::runtime_error("fail");
    co_return 0;
}

inline heb::co<int> co_add(int a, int b) {
    int x = co_await co_return_T<int>(a);
    int y = co_await co_return_T<int>(b);
    co_return x + y;
}

inline heb::co<int> co_catch() {
    try {
        co_return co_await co_throw();
    } catch(const std::runtime_error&) {
        co_return -1;
    }
}

// resumes symmetrically through every level
inline heb::co<int> co_depth(int depth) {
    if(depth == 0) { co_return 0; }
    co_return 1 + co_await co_depth(depth - 1);
}

template <typename T>
void co_return_value_T(T t) {
    heb::co<T> co = test::coroutine::co_return_T<T>(t);
    EXPECT_TRUE(co);
    EXPECT_FALSE(co.done());
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_EQ(t, co.result());
}

}
}

TEST(coroutine, co_return_void) {
    heb::co<void> co = test::coroutine::co_void();
    EXPECT_TRUE(co);
    EXPECT_FALSE(co.done());
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_NO_THROW(co.result());
}

TEST(coroutine, co_return_value) {
    test::coroutine::co_return_value_T<int>(3);
    test::coroutine::co_return_value_T<double>(3.5);
    test::coroutine::co_return_value_T<std::string>("three");
    test::coroutine::co_return_value_T<test::CustomObject>(test::CustomObject(3));
}

TEST(coroutine, release_and_reset) {
    heb::co<void> co = test::coroutine::co_void();
    EXPECT_TRUE(co);

    auto h = co.release();
    EXPECT_FALSE(co);

    co = heb::co<void>(h);
    EXPECT_TRUE(co);
    co.reset();
    EXPECT_FALSE(co);
}

TEST(coroutine, move) {
    heb::co<int> co = test::coroutine::co_return_T<int>(3);
    heb::co<int> co2(std::move(co));
    EXPECT_FALSE(co);
    EXPECT_TRUE(co2);

    co = std::move(co2);
    EXPECT_TRUE(co);
    EXPECT_FALSE(co2);

    co.resume();
    EXPECT_EQ(3, co.result());
}

TEST(coroutine, exception) {
    heb::co<int> co = test::coroutine::co_throw();
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_THROW(co.result(), std::runtime_error);
}

TEST(coroutine, co_await_co) {
    heb::co<int> co = test::coroutine::co_add(1, 2);
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_EQ(3, co.result());

    heb::co<int> c = test::coroutine::co_catch();
    c.resume();
    EXPECT_TRUE(c.done());
    EXPECT_EQ(-1, c.result());
}

TEST(coroutine, deep_chain) {
    heb::co<int> co = test::coroutine::co_depth(1000);
    co.resume();
    EXPECT_TRUE(co.done());
    EXPECT_EQ(1000, co.result());
}

TEST(coroutine, name) {
    heb::co<int> co = test::coroutine::co_return_T<int>(3);
    EXPECT_EQ(std::string("heb::co<int>"), co.name());
}
