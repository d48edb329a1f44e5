//SPDX-License-Identifier: MIT
#include "logging.hpp"

int& heb::logger::tl_loglevel() {
    // threads inherit the process default log level
    thread_local int level = heb::config::logging::default_log_level();
    return level;
}

/// return the thread local loglevel
int heb::logger::thread_log_level() { return heb::logger::tl_loglevel(); }

/// set the thread local loglevel
void heb::logger::thread_log_level(int level) {
    if(level > 9) { level = 9; }
    else if(level < -9) { level = -9; }
    heb::logger::tl_loglevel() = level;
}
