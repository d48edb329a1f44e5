//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_SERVICE
#define HERMES_ENVIRONMENT_BRIDGE_SERVICE 

#include "utility.hpp"
#include "logging.hpp"

namespace heb {

/**
 @brief services are process singleton objects 

 Implementations of this CRTP (curiously recurring template pattern) are 
 singleton objects with a consistent accessor pattern:
 ```
 heb::service<IMPLEMENTATION>::get(); // return the singleton
 ```

 The lifetime of every service is managed by `heb::lifecycle`. Polymorphic 
 services (such as `heb::native::runtime`) register the base type, so 
 `service<BASE>::get()` returns whichever implementation was constructed.
 */
template <typename IMPLEMENTATION>
struct service {
    service() {
        service<IMPLEMENTATION>::ptr_ref() = static_cast<IMPLEMENTATION*>(this);
    }

    virtual ~service() { 
        service<IMPLEMENTATION>::ptr_ref() = nullptr;
    }

    /// @return true if the service exists, else false
    static inline bool ready() { return ptr_ref() != nullptr; }

    /// @return the implementation 
    static inline IMPLEMENTATION& get() { return *(ptr_ref()); }

private:
    // get a reference to the instanced pointer
    static IMPLEMENTATION*& ptr_ref();
};

}

#endif
