//SPDX-License-Identifier: Apache-2.0

#include <thread>

#include "service.hpp"
#include "native.hpp"
#include "local_runtime.hpp"
#include "hospice.hpp"
#include "prefetch.hpp"
#include "event_loop.hpp"
#include "lifecycle.hpp"

#include <gtest/gtest.h>

TEST(lifecycle, config_logging) {
    heb::lifecycle::config c;

    EXPECT_LT(c.log.loglevel, 10);
    EXPECT_GT(c.log.loglevel, -10);
}

TEST(lifecycle, config_runtime) {
    heb::lifecycle::config c;
    EXPECT_EQ(0u, c.rt.threads);
}

TEST(lifecycle, config_hospice) {
    heb::lifecycle::config c;

    // a released core needs 3 notifications after its environment died
    EXPECT_EQ(3u, c.hsp.any_alive_passes);
}

TEST(lifecycle, config_prefetch) {
    heb::lifecycle::config c;
    EXPECT_EQ(3u, c.pf.backlog_factor);
}

TEST(lifecycle, config_accessors) {
    ASSERT_TRUE(heb::service<heb::lifecycle>::ready());
    auto& c = heb::service<heb::lifecycle>::get().get_config();

    EXPECT_EQ(c.log.loglevel, heb::config::logging::default_log_level());
    EXPECT_EQ(c.rt.threads, heb::config::runtime::threads());
    EXPECT_EQ(c.hsp.any_alive_passes, heb::config::hospice::any_alive_passes());
    EXPECT_EQ(c.pf.backlog_factor, heb::config::prefetch::backlog_factor());
}

TEST(lifecycle, services) {
    EXPECT_TRUE(heb::service<heb::native::runtime>::ready());
    EXPECT_TRUE(heb::service<heb::hospice>::ready());

    auto& rt = heb::service<heb::native::runtime>::get();
    EXPECT_EQ(heb::native::local_runtime::info_name(), rt.name());

    size_t expected = std::thread::hardware_concurrency();
    if(expected == 0) { expected = 1; }
    EXPECT_EQ(expected, rt.available_parallelism());
}

TEST(lifecycle, default_loop) {
    EXPECT_TRUE(heb::get_loop());
}
