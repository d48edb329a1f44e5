//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_UTILITY
#define HERMES_ENVIRONMENT_BRIDGE_UTILITY

#include <utility>
#include <functional>
#include <type_traits>
#include <variant>

/// ensures dynamic linkage can see the marked variable
#ifdef _WIN32
    #define HEB_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define HEB_EXPORT __attribute__((visibility("default")))
#else
    #define HEB_EXPORT
#endif

namespace heb {

/// type with no qualifiers
template <typename T>
using unqualified = typename std::decay<T>::type;

/// the return type of an arbitrary Callable
template <typename F, typename... Args>
using function_return_type = std::invoke_result_t<F, Args...>;

/// Callable accepting and returning no arguments
typedef std::function<void()> thunk;

/**
 @brief storage type for a value of `T`

 `void` cannot be stored, so it is represented by `std::monostate`. Used by
 templates which need to hold a result regardless of its type.
 */
template <typename T>
using storage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

/**
 @brief invoke a Callable and return its result as `storage<R>`

 Allows template code to treat `void` returning Callables identically to value
 returning ones.
 */
template <typename F, typename... As>
inline storage<function_return_type<F,As...>> invoke_to_storage(F&& f, As&&... as) {
    if constexpr (std::is_void_v<function_return_type<F,As...>>) {
        std::invoke(std::forward<F>(f), std::forward<As>(as)...);
        return std::monostate{};
    } else {
        return std::invoke(std::forward<F>(f), std::forward<As>(as)...);
    }
}

}

#endif
