//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_LIFECYCLE
#define HERMES_ENVIRONMENT_BRIDGE_LIFECYCLE

#include <memory>
#include <string>

#include "loguru.hpp"
#include "logging.hpp"
#include "service.hpp"
#include "native.hpp"
#include "local_runtime.hpp"
#include "hospice.hpp"
#include "event_loop.hpp"

namespace heb {

/**
 @brief RAII configuration and management object for the bridge

 The instance of this object configures the bridge and constructs and maintains
 all singleton services: the native runtime and the hospice.
 */
struct lifecycle : public service<lifecycle>, public printable {
    /**
     @brief configuration for the bridge

     The user can customize these options at runtime and pass the result to 
     `heb::lifecycle::initialize()` to set the process-wide configuration.

     Default values are determined by compiler defines (see below). 
     */
    struct config {
        struct logging {
            logging();

            /**
             @brief runtime default log level

             Defaults set by compiler define(s):
             HEBLOGLEVEL
             */
            int loglevel; 
        };

        struct runtime {
            runtime();

            /**
             @brief count of worker threads of each native core

             0: match the count of runtime detected CPU cores
             n: launch n workers for each core

             Defaults set by compiler define(s):
             HEBRUNTIMETHREADS
             */
            size_t threads;
        };

        struct hospice {
            hospice();

            /**
             @brief maximum count of notifications performed by `heb::hospice::any_alive()`

             Defaults set by compiler define(s):
             HEBHOSPICEANYALIVEPASSES
             */
            size_t any_alive_passes;
        };

        struct prefetch {
            prefetch();

            /**
             @brief the default backlog of `heb::buffer_futures()` as a multiple of its prefetch

             Defaults set by compiler define(s):
             HEBPREFETCHBACKLOGFACTOR
             */
            size_t backlog_factor;
        };

        logging log;
        runtime rt;
        hospice hsp;
        prefetch pf;
    };

    virtual ~lifecycle();

    /**
     @brief set the bridge's global configuration and construct and start its services

     The returned lifecycle object starts the bridge and manages its memory. 
     When the returned lifecycle object goes out scope every service is 
     destroyed and the installed loop is reset to an `heb::no_loop`. 

     All environments must be disposed, and the policy unregistered, before the 
     lifecycle is destroyed.

     There can only be one lifecycle in existence at a time. Recommended design 
     is to hold this pointer on the `main()` thread's stack.

     @param c optional bridge configuration
     @return a lifecycle object managing the bridge
     */
    static std::unique_ptr<heb::lifecycle> initialize(config c = {});

    static inline std::string info_name() { return "heb::lifecycle"; }
    inline std::string name() const { return lifecycle::info_name(); }

    /// return the lifecycle's config
    inline const config& get_config() const { return config_; }

private:
    struct logging_init {
        logging_init();
    };

    lifecycle(const config& c);

    config config_;

    // loguru is initialized with the configured log level before any service logs
    logging_init logging_init_;

    // the services, in order of dependencies
    std::unique_ptr<native::runtime> runtime_;
    std::unique_ptr<heb::hospice> hospice_;
};

/**
 @brief a convenience for calling `heb::lifecycle::initialize()`
 @returns the newly allocated and constructed process `heb::lifecycle` pointer
 */
inline std::unique_ptr<lifecycle> initialize(lifecycle::config c = {}) {
    return heb::lifecycle::initialize(std::move(c));
}

}

#endif
