//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_CLEANUP
#define HERMES_ENVIRONMENT_BRIDGE_CLEANUP 

#include <memory>
#include <functional>
#include <mutex>

#include "atomic.hpp"

namespace heb {

/**
 @brief low-level mechanism for installing single-fire cleanup handlers

 Cleanup handlers are installed as a list and executed FILO (first in, last 
 out) by `clean()`. Each handler fires at most once, and handlers installed 
 after `clean()` has run are executed immediately by `install()`.

 Installation is threadsafe. Handlers are executed without the lock held so 
 they may freely call back into the owning object.
 */
struct cleanup {
    /// cleanup operation 
    using operation = std::function<void()>;

    cleanup() : cleaned_(false) { }
    cleanup(const cleanup&) = delete;
    cleanup& operator=(const cleanup&) = delete;

    virtual ~cleanup(){ }

    /**
     @brief install a cleanup operation 
     @param op the operation to call when `clean()` executes
     */
    inline void install(operation op) {
        {
            std::lock_guard<spinlock> lk(lk_);

            if(!cleaned_) [[likely]] {
                list_ = std::make_unique<node>(std::move(list_), std::move(op));
                return;
            }
        }

        op();
    }

    /**
     @brief execute any installed cleanup operations

     Cleanup often needs to happen at a topmost destructor while all members are 
     valid, so it must be explicitly called.
     */
    inline void clean() {
        std::unique_ptr<node> list;

        {
            std::lock_guard<spinlock> lk(lk_);
            cleaned_ = true;
            list = std::move(list_);
        }

        while(list) {
            list->op();
            list = std::move(list->next);
        }
    }

private:
    struct node {
        node(std::unique_ptr<node>&& n, operation&& o) :
            next(std::move(n)),
            op(std::move(o))
        { }

        std::unique_ptr<node> next; /// the next node in the handler list
        operation op; /// the cleanup operation provided to install()
    };

    spinlock lk_;
    bool cleaned_;
    std::unique_ptr<node> list_;
};

}

#endif
