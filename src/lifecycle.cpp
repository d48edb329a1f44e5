//SPDX-License-Identifier: MIT
#include <sstream>

#include "lifecycle.hpp"

#ifndef HEBLOGLEVEL
/*
 Library compile time macro determining default printing log level. Default to 
 loguru::Verbosity_WARNING.
 */
#define HEBLOGLEVEL -1
#endif 

// force a loglevel of loguru::Verbosity_OFF or higher
#if HEBLOGLEVEL < -10 
#define HEBLOGLEVEL loguru::Verbosity_OFF
#endif 

// force a loglevel of 9 or lower
#if HEBLOGLEVEL > 9
#define HEBLOGLEVEL 9
#endif 

/*
 The count of worker threads of each native core of the reference runtime. A 
 value of 0 allows the library to match the count of CPU cores.
 */
#ifndef HEBRUNTIMETHREADS
#define HEBRUNTIMETHREADS 0
#endif

/*
 The maximum count of collector cycle notifications `heb::hospice::any_alive()` 
 performs while cores are outstanding. A core needs 3 notifications after its 
 environment died to be released.
 */
#ifndef HEBHOSPICEANYALIVEPASSES
#define HEBHOSPICEANYALIVEPASSES 3
#endif

// the default ratio of backlog to prefetch in the reorder buffer
#ifndef HEBPREFETCHBACKLOGFACTOR
#define HEBPREFETCHBACKLOGFACTOR 3
#endif

heb::lifecycle::config::logging::logging() :
    loglevel(HEBLOGLEVEL)
{ }

heb::lifecycle::config::runtime::runtime() :
    threads(HEBRUNTIMETHREADS)
{ }

heb::lifecycle::config::hospice::hospice() :
    any_alive_passes(HEBHOSPICEANYALIVEPASSES)
{ }

heb::lifecycle::config::prefetch::prefetch() :
    backlog_factor(HEBPREFETCHBACKLOGFACTOR)
{ }

heb::lifecycle::lifecycle(const config& c) :
    config_(c)
{ 
    HEB_INFO_CONSTRUCTOR(); 
}

heb::lifecycle::~lifecycle() { 
    HEB_INFO_DESTRUCTOR(); 

    // loops may hold schedulers which reference the services
    reset_loop();

    // destroy services in the reverse order of their dependencies
    hospice_.reset();
    runtime_.reset();
}

std::unique_ptr<heb::lifecycle> heb::lifecycle::initialize(config c) {
    std::unique_ptr<heb::lifecycle> l(new heb::lifecycle(c));

    // services register themselves on construction
    l->runtime_.reset(new native::local_runtime(c.rt.threads));
    l->hospice_.reset(new heb::hospice);
    return l;
}

heb::lifecycle::logging_init::logging_init() {
    struct do_once {
        do_once() {
            std::stringstream ss;
            ss << "-v" << heb::config::logging::default_log_level();
            std::string process("heb");
            std::string verbosity = ss.str();

            // Create raw char pointers for argc/argv
            const char* argv[] = {process.c_str(), verbosity.c_str(), nullptr};
            int argc = 2; // Number of actual arguments (excluding the nullptr)

            loguru::Options opt;
            opt.main_thread_name = nullptr;
            opt.signal_options = loguru::SignalOptions::none();
            loguru::init(argc, const_cast<char**>(argv), opt);
        }
    };

    static do_once d; // static so init only happens once
}
