#include <gtest/gtest.h>

#include "heb.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Enable fail-fast
    GTEST_FLAG_SET(fail_fast, true);

    // initialize and manage the bridge's services
    auto lifecycle = heb::initialize();

    return RUN_ALL_TESTS();
}
