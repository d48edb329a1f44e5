//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_CONTEXT
#define HERMES_ENVIRONMENT_BRIDGE_CONTEXT

#include <any>
#include <map>
#include <memory>
#include <string>
#include <sstream>
#include <optional>
#include <cstdint>

#include "utility.hpp"
#include "logging.hpp"

namespace heb {

struct context;

namespace detail {
namespace context {

// the context installed on this thread, nullptr when the root context is active
heb::context*& tl_this_context();

// the root context of this thread
heb::context& tl_root_context();

// acquire a process unique variable key
std::uint64_t make_key();

}
}

/**
 @brief logical task local storage

 Every system thread starts in its own empty root context. A context is a 
 copy-on-write mapping of variable keys to values: copies are cheap, and 
 mutations to one copy are never observed by another. 

 Schedulers copy the spawner's context when a task is spawned and install that 
 copy every time the task is resumed, so a task inherits its parent's values at 
 spawn time while sibling tasks stay isolated from each other.
 */
struct context : public printable {
    typedef std::map<std::uint64_t,std::any> map;

    context() : values_(std::make_shared<const map>()) { }
    context(const context&) = default;
    context(context&&) = default;
    context& operator=(const context&) = default;
    context& operator=(context&&) = default;

    static inline std::string info_name() { return "heb::context"; }
    inline std::string name() const { return context::info_name(); }

    inline std::string content() const {
        std::stringstream ss;
        ss << "size:" << values_->size();
        return ss.str();
    }

    /// @return the context active on the calling thread
    static inline context& current() {
        auto c = detail::context::tl_this_context();
        return c ? *c : detail::context::tl_root_context();
    }

    /// @return a copy of the context active on the calling thread
    static inline context copy() { return context(current()); }

    /**
     @brief execute a Callable with this context installed as the current context

     The previously installed context is restored on every exit path.
     */
    template <typename F, typename... As>
    auto run(F&& f, As&&... as) {
        struct scope {
            scope(context* c) : prev_(detail::context::tl_this_context()) {
                detail::context::tl_this_context() = c;
            }

            ~scope() { detail::context::tl_this_context() = prev_; }

        private:
            context* prev_;
        };

        scope s(this);
        return std::invoke(std::forward<F>(f), std::forward<As>(as)...);
    }

    /// @return a pointer to the value stored for key, or nullptr
    inline const std::any* find(std::uint64_t key) const {
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &(it->second);
    }

    /// assign a value to a key in this context only
    inline void assign(std::uint64_t key, std::any value) {
        auto m = std::make_shared<map>(*values_);
        (*m)[key] = std::move(value);
        values_ = std::move(m);
    }

    /// remove a key from this context only
    inline void erase(std::uint64_t key) {
        if(values_->count(key)) {
            auto m = std::make_shared<map>(*values_);
            m->erase(key);
            values_ = std::move(m);
        }
    }

    /// @return the count of assigned variables
    inline size_t size() const { return values_->size(); }

private:
    std::shared_ptr<const map> values_;
};

/**
 @brief a typed variable stored in the current `heb::context`
 */
template <typename T>
struct context_var : public printable {
    context_var(std::string name) : 
        key_(detail::context::make_key()), 
        name_(std::move(name)) 
    { }

    context_var(std::string name, T dflt) : 
        key_(detail::context::make_key()), 
        name_(std::move(name)),
        default_(std::move(dflt))
    { }

    context_var(const context_var&) = delete;
    context_var& operator=(const context_var&) = delete;

    static inline std::string info_name() { 
        return type::templatize<T>("heb::context_var"); 
    }

    inline std::string name() const { return context_var<T>::info_name(); }
    inline std::string content() const { return name_; }

    /// @return the value in the current context, or the default if unset
    inline std::optional<T> get() const {
        auto a = context::current().find(key_);
        if(a) { return std::any_cast<T>(*a); }
        else { return default_; }
    }

    /// @return the value in the current context, or fallback if unset 
    inline T get(T fallback) const {
        auto v = get();
        return v ? std::move(*v) : std::move(fallback);
    }

    /// set the value in the current context
    inline void set(T value) { 
        context::current().assign(key_, std::any(std::move(value))); 
    }

    /// unset the value in the current context
    inline void reset() { context::current().erase(key_); }

private:
    const std::uint64_t key_;
    const std::string name_;
    std::optional<T> default_;
};

}

#endif
