//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_LOGGING
#define HERMES_ENVIRONMENT_BRIDGE_LOGGING

#include <utility>
#include <string>
#include <sstream>
#include <ostream>
#include <coroutine>
#include <chrono>
#include <memory>
#include <variant>
#include <typeinfo>

#include "loguru.hpp"
#include "utility.hpp"

/**
 User source code compile time macro determining compiled log code. Statements 
 above the specified limit resolve to an empty statement and are never compiled.

 Setting HEBLOGLIMIT to -9 removes all library logging. It should realistically 
 never be set lower than -1 because the bridge reports recoverable problems 
 (dead environments, leaked environments, held native cores) as warnings.

 The `CONSTRUCTOR`, `DESTRUCTOR`, and `METHOD` logging macros can *only* be 
 called by implementions of `heb::printable`. `FUNCTION` and `LOG` macros can be 
 called anywhere. `CONSTRUCTOR`, `DESTRUCTOR`, and `METHOD` macros print the 
 object's `this` pointer, its namespaced name and its optional content.

 `ENTER` and `CONSTRUCTOR` macros interpret their arguments as the arguments of 
 the function being entered:
 HEB_INFO_FUNCTION_ENTER("heb::set_loop", loop);

 prints something like:
 heb::set_loop(heb::scheduler_loop@0x5581f0)

 `BODY` macros concatenate their arguments into a single logline:
 HEB_WARNING_METHOD_BODY("notify", "core ", id, " is still referenced");

 `LOG` macros accept a `printf()` style format string for precision output.
 */
#ifndef HEBLOGLIMIT
#define HEBLOGLIMIT -1
#endif 

// HEBLOGLIMIT min value is -9
#if HEBLOGLIMIT < -9
#define HEBLOGLIMIT -9
#endif

// HEBLOGLIMIT max value is 9
#if HEBLOGLIMIT > 9
#define HEBLOGLIMIT 9
#endif

#if HEBLOGLIMIT >= -3
#define HEB_FATAL_CONSTRUCTOR(...) heb::logger::constructor(this, loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_FATAL_DESTRUCTOR() heb::logger::destructor(this, loguru::Verbosity_FATAL, __FILE__, __LINE__)
#define HEB_FATAL_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_FATAL_METHOD_ENTER(...) heb::logger::method_enter(this, loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_FATAL_METHOD_BODY(...) heb::logger::method_body(this, loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_FATAL_FUNCTION_ENTER(...) heb::logger::function_enter(loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_FATAL_FUNCTION_BODY(...) heb::logger::function_body(loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_FATAL_LOG(...) loguru::log(loguru::Verbosity_FATAL, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else 
#define HEB_FATAL_CONSTRUCTOR(...) (void)0
#define HEB_FATAL_DESTRUCTOR() (void)0
#define HEB_FATAL_GUARD(...) (void)0
#define HEB_FATAL_METHOD_ENTER(...) (void)0
#define HEB_FATAL_METHOD_BODY(...) (void)0
#define HEB_FATAL_FUNCTION_ENTER(...) (void)0
#define HEB_FATAL_FUNCTION_BODY(...) (void)0
#define HEB_FATAL_LOG(...) (void)0
#endif

#if HEBLOGLIMIT >= -2
#define HEB_ERROR_CONSTRUCTOR(...) heb::logger::constructor(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_ERROR_DESTRUCTOR() heb::logger::destructor(this, loguru::Verbosity_ERROR, __FILE__, __LINE__)
#define HEB_ERROR_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_ERROR_METHOD_ENTER(...) heb::logger::method_enter(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_ERROR_METHOD_BODY(...) heb::logger::method_body(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_ERROR_FUNCTION_ENTER(...) heb::logger::function_enter(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_ERROR_FUNCTION_BODY(...) heb::logger::function_body(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_ERROR_LOG(...) loguru::log(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else 
#define HEB_ERROR_CONSTRUCTOR(...) (void)0
#define HEB_ERROR_DESTRUCTOR() (void)0
#define HEB_ERROR_GUARD(...) (void)0
#define HEB_ERROR_METHOD_ENTER(...) (void)0
#define HEB_ERROR_METHOD_BODY(...) (void)0
#define HEB_ERROR_FUNCTION_ENTER(...) (void)0
#define HEB_ERROR_FUNCTION_BODY(...) (void)0
#define HEB_ERROR_LOG(...) (void)0
#endif

#if HEBLOGLIMIT >= -1
#define HEB_WARNING_CONSTRUCTOR(...) heb::logger::constructor(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_WARNING_DESTRUCTOR() heb::logger::destructor(this, loguru::Verbosity_WARNING, __FILE__, __LINE__)
#define HEB_WARNING_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_WARNING_METHOD_ENTER(...) heb::logger::method_enter(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_WARNING_METHOD_BODY(...) heb::logger::method_body(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_WARNING_FUNCTION_ENTER(...) heb::logger::function_enter(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_WARNING_FUNCTION_BODY(...) heb::logger::function_body(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_WARNING_LOG(...) loguru::log(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_WARNING_CONSTRUCTOR(...) (void)0
#define HEB_WARNING_DESTRUCTOR() (void)0
#define HEB_WARNING_GUARD(...) (void)0
#define HEB_WARNING_METHOD_ENTER(...) (void)0
#define HEB_WARNING_METHOD_BODY(...) (void)0
#define HEB_WARNING_FUNCTION_ENTER(...) (void)0
#define HEB_WARNING_FUNCTION_BODY(...) (void)0
#define HEB_WARNING_LOG(...) (void)0
#endif

#if HEBLOGLIMIT >= 0
#define HEB_INFO_CONSTRUCTOR(...) heb::logger::constructor(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_INFO_DESTRUCTOR() heb::logger::destructor(this, loguru::Verbosity_INFO, __FILE__, __LINE__)
#define HEB_INFO_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_INFO_METHOD_ENTER(...) heb::logger::method_enter(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_INFO_METHOD_BODY(...) heb::logger::method_body(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_INFO_FUNCTION_ENTER(...) heb::logger::function_enter(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_INFO_FUNCTION_BODY(...) heb::logger::function_body(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_INFO_LOG(...) loguru::log(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_INFO_CONSTRUCTOR(...) (void)0
#define HEB_INFO_DESTRUCTOR() (void)0
#define HEB_INFO_GUARD(...) (void)0
#define HEB_INFO_METHOD_ENTER(...) (void)0
#define HEB_INFO_METHOD_BODY(...) (void)0
#define HEB_INFO_FUNCTION_ENTER(...) (void)0
#define HEB_INFO_FUNCTION_BODY(...) (void)0
#define HEB_INFO_LOG(...) (void)0
#endif

// high criticality lifecycle
#if HEBLOGLIMIT >= 1
#define HEB_HIGH_CONSTRUCTOR(...) heb::logger::constructor(this, 1, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_HIGH_DESTRUCTOR() heb::logger::destructor(this, 1, __FILE__, __LINE__)
#define HEB_HIGH_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define HEB_HIGH_CONSTRUCTOR(...) (void)0
#define HEB_HIGH_DESTRUCTOR() (void)0
#define HEB_HIGH_GUARD(...) (void)0
#endif 

// high criticality functions and methods
#if HEBLOGLIMIT >= 2
#define HEB_HIGH_METHOD_ENTER(...) heb::logger::method_enter(this, 2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_HIGH_METHOD_BODY(...) heb::logger::method_body(this, 2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_HIGH_FUNCTION_ENTER(...) heb::logger::function_enter(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_HIGH_FUNCTION_BODY(...) heb::logger::function_body(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_HIGH_LOG_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_HIGH_LOG(...) loguru::log(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_HIGH_METHOD_ENTER(...) (void)0
#define HEB_HIGH_METHOD_BODY(...) (void)0
#define HEB_HIGH_FUNCTION_ENTER(...) (void)0
#define HEB_HIGH_FUNCTION_BODY(...) (void)0
#define HEB_HIGH_LOG_GUARD(...) (void)0
#define HEB_HIGH_LOG(...) (void)0
#endif

// medium criticality lifecycle
#if HEBLOGLIMIT >= 3
#define HEB_MED_CONSTRUCTOR(...) heb::logger::constructor(this, 3, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MED_DESTRUCTOR() heb::logger::destructor(this, 3, __FILE__, __LINE__)
#define HEB_MED_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define HEB_MED_CONSTRUCTOR(...) (void)0
#define HEB_MED_DESTRUCTOR() (void)0
#define HEB_MED_GUARD(...) (void)0
#endif 

// medium criticality functions and methods
#if HEBLOGLIMIT >= 4
#define HEB_MED_METHOD_ENTER(...) heb::logger::method_enter(this, 4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MED_METHOD_BODY(...) heb::logger::method_body(this, 4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MED_FUNCTION_ENTER(...) heb::logger::function_enter(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MED_FUNCTION_BODY(...) heb::logger::function_body(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MED_LOG_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_MED_LOG(...) loguru::log(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_MED_METHOD_ENTER(...) (void)0
#define HEB_MED_METHOD_BODY(...) (void)0
#define HEB_MED_FUNCTION_ENTER(...) (void)0
#define HEB_MED_FUNCTION_BODY(...) (void)0
#define HEB_MED_LOG_GUARD(...) (void)0
#define HEB_MED_LOG(...) (void)0
#endif

// low criticality lifecycle
#if HEBLOGLIMIT >= 5
#define HEB_LOW_CONSTRUCTOR(...) heb::logger::constructor(this, 5, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_LOW_DESTRUCTOR() heb::logger::destructor(this, 5, __FILE__, __LINE__)
#define HEB_LOW_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define HEB_LOW_CONSTRUCTOR(...) (void)0
#define HEB_LOW_DESTRUCTOR() (void)0
#define HEB_LOW_GUARD(...) (void)0
#endif 

// low criticality functions and methods
#if HEBLOGLIMIT >= 6
#define HEB_LOW_METHOD_ENTER(...) heb::logger::method_enter(this, 6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_LOW_METHOD_BODY(...) heb::logger::method_body(this, 6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_LOW_FUNCTION_ENTER(...) heb::logger::function_enter(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_LOW_FUNCTION_BODY(...) heb::logger::function_body(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_LOW_LOG_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_LOW_LOG(...) loguru::log(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_LOW_METHOD_ENTER(...) (void)0
#define HEB_LOW_METHOD_BODY(...) (void)0
#define HEB_LOW_FUNCTION_ENTER(...) (void)0
#define HEB_LOW_FUNCTION_BODY(...) (void)0
#define HEB_LOW_LOG_GUARD(...) (void)0
#define HEB_LOW_LOG(...) (void)0
#endif

// minimal criticality lifecycle
#if HEBLOGLIMIT >= 7
#define HEB_MIN_CONSTRUCTOR(...) heb::logger::constructor(this, 7, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MIN_DESTRUCTOR() heb::logger::destructor(this, 7, __FILE__, __LINE__)
#define HEB_MIN_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define HEB_MIN_CONSTRUCTOR(...) (void)0
#define HEB_MIN_DESTRUCTOR() (void)0
#define HEB_MIN_GUARD(...) (void)0
#endif 

// minimal criticality functions and methods
#if HEBLOGLIMIT >= 8
#define HEB_MIN_METHOD_ENTER(...) heb::logger::method_enter(this, 8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MIN_METHOD_BODY(...) heb::logger::method_body(this, 8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MIN_FUNCTION_ENTER(...) heb::logger::function_enter(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MIN_FUNCTION_BODY(...) heb::logger::function_body(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_MIN_LOG_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_MIN_LOG(...) loguru::log(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_MIN_METHOD_ENTER(...) (void)0
#define HEB_MIN_METHOD_BODY(...) (void)0
#define HEB_MIN_FUNCTION_ENTER(...) (void)0
#define HEB_MIN_FUNCTION_BODY(...) (void)0
#define HEB_MIN_LOG_GUARD(...) (void)0
#define HEB_MIN_LOG(...) (void)0 
#endif

// trace logs are of such low importance, you only want to print them when
// trying to actively debug code when stepping through with a debugger would be 
// painful or otherwise not useful
#if HEBLOGLIMIT >= 9
#define HEB_TRACE_CONSTRUCTOR(...) heb::logger::constructor(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_TRACE_DESTRUCTOR() heb::logger::destructor(this, 9, __FILE__, __LINE__)
#define HEB_TRACE_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_TRACE_METHOD_ENTER(...) heb::logger::method_enter(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_TRACE_METHOD_BODY(...) heb::logger::method_body(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_TRACE_FUNCTION_ENTER(...) heb::logger::function_enter(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_TRACE_FUNCTION_BODY(...) heb::logger::function_body(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define HEB_TRACE_LOG_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define HEB_TRACE_LOG(...) loguru::log(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define HEB_TRACE_CONSTRUCTOR(...) (void)0
#define HEB_TRACE_DESTRUCTOR() (void)0
#define HEB_TRACE_GUARD(...) (void)0
#define HEB_TRACE_METHOD_ENTER(...) (void)0
#define HEB_TRACE_METHOD_BODY(...) (void)0
#define HEB_TRACE_FUNCTION_ENTER(...) (void)0
#define HEB_TRACE_FUNCTION_BODY(...) (void)0
#define HEB_TRACE_LOG_GUARD(...) (void)0
#define HEB_TRACE_LOG(...) (void)0
#endif

namespace heb {

/**
 @brief namespace for type information deduction 

 `heb::type::name<T>()` produces a readable name for a type without requiring an 
 instance. Types may specialize `heb::type::info` or provide a 
 `static std::string info_name()` method. The compiler's `typeid(T).name()` is 
 the final fallback.
 */
namespace type {

/// return a string representing the cv type qualifier
template <typename T>
std::string cv_name() {
    if constexpr (std::is_const_v<T>) {
        if constexpr (std::is_volatile_v<T>) {
            return "const volatile";
        } else {
            return "const";
        }
    } else if constexpr (std::is_volatile_v<T>) {
        return "volatile";
    } else {
        return "";
    }
}

/// return a string representing the reference type qualifier
template <typename T>
std::string reference_name() {
    if constexpr (std::is_pointer_v<T>) {
        return "*";
    } else if constexpr (std::is_lvalue_reference_v<T>) {
        return "&";
    } else if constexpr (std::is_rvalue_reference_v<T>) {
        return "&&";
    } else {
        return "";
    }
}

/// acquire the base name of an object without namespace or template text
inline std::string basename(std::string name) {
    // strip template arguments first, they may contain "::" themselves
    size_t open_pos = name.find('<');

    if(open_pos != std::string::npos) {
        name = name.substr(0, open_pos);
    }

    size_t pos = name.rfind("::");

    if (pos != std::string::npos) [[likely]] {
        name = name.substr(pos + 2);
    } 

    return name;
}

/// general template for acquiring a type `T`'s stringified name 
template <typename T, typename = void>
struct info {
    static inline std::string name(){ return typeid(T).name(); }
};

/// specialization for types with method `static std::string info_name()`
template <typename T>
struct info<T, std::void_t<decltype(T::info_name())>> {
    static inline std::string name() { return T::info_name(); }
};

template <>
struct info<void,void> {
    static inline std::string name(){ return "void"; }
};

template <>
struct info<int,void> {
    static inline std::string name(){ return "int"; }
};

template <>
struct info<unsigned int,void> {
    static inline std::string name(){ return "unsigned int"; }
};

template <>
struct info<long int,void> {
    static inline std::string name(){ return "long int"; }
};

template <>
struct info<unsigned long int,void> {
    static inline std::string name(){ return "unsigned long int"; }
};

template <>
struct info<long long int,void> {
    static inline std::string name(){ return "long long int"; }
};

template <>
struct info<unsigned long long int,void> {
    static inline std::string name(){ return "unsigned long long int"; }
};

template <>
struct info<bool,void> {
    static inline std::string name(){ return "bool"; }
};

template <>
struct info<float,void> {
    static inline std::string name(){ return "float"; }
};

template <>
struct info<double,void> {
    static inline std::string name(){ return "double"; }
};

template <>
struct info<char,void> {
    static inline std::string name(){ return "char"; }
};

template <>
struct info<std::string,void> {
    static inline std::string name(){ return "std::string"; }
};

template <>
struct info<std::monostate,void> {
    static inline std::string name(){ return "std::monostate"; }
};

/// acquire a runtime accessible name string of a type T
template <typename T>
inline std::string name() { 
    std::stringstream ss;
    ss << cv_name<T>() << info<unqualified<T>>::name() << reference_name<T>(); 
    return ss.str();
};

template <>
inline std::string name<void>() { return info<void,void>::name(); };

namespace detail {

template <typename T>
inline void templatize_rest(std::stringstream& ss) { 
    ss << "," << name<T>();
}

template <typename T, typename T2, typename... Ts>
inline void templatize_rest(std::stringstream& ss) {
    ss << "," << name<T>();
    templatize_rest<T2,Ts...>(ss);
}

}

/**
 @brief transform a string by appending template tags and template types' names

 `heb::type::templatize<int,std::string>("my_type")` returns 
 "my_type<int,std::string>".
 */
template <typename T, typename... Ts>
inline std::string templatize(const std::string& s) {
    std::stringstream ss;
    ss << s << "<" << name<T>();

    if constexpr (sizeof...(Ts) > 0) {
        detail::templatize_rest<Ts...>(ss);
    }

    ss << ">";
    return ss.str();
}

template <typename T>
struct info<std::coroutine_handle<T>,void> {
    static inline std::string name(){ 
        return templatize<T>("std::coroutine_handle"); 
    }
};

template <typename T>
struct info<std::unique_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::unique_ptr"); }
};

template <typename T>
struct info<std::shared_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::shared_ptr"); }
};

template <typename T>
struct info<std::weak_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::weak_ptr"); }
};

}

// time-to-string conversions
namespace chrono {

template <typename Rep, typename Period>
inline std::string to_string(const std::chrono::duration<Rep, Period>& d) {
    std::stringstream ss;
    ss << "std::chrono::duration[" 
       << std::chrono::duration_cast<std::chrono::microseconds>(d).count() 
       << " µs]";
    return ss.str();
}

}

/*
 @brief interface for allowing an object instance to be printable

 Objects which implement printable can passed to streams and converted to 
 `std::string` representation.
 */
struct printable {
    virtual ~printable() { }

    /// @return the namespaced and templatized object name 
    virtual std::string name() const = 0;

    /// @return string with optional content of this object 
    virtual inline std::string content() const { return {}; }

    /// string conversion
    inline std::string to_string() const { 
        std::stringstream ss;
        ss << this->name() << "@" << (void*)this;

        std::string c = this->content();

        if(!(c.empty())) { 
            ss << "[" << c << "]";
        }

        return ss.str();
    }

    inline operator std::string() const { return to_string(); }
};

}

namespace std {

/// std:: printable string conversion
inline std::string to_string(const heb::printable& p) { return p.to_string(); }

}

/// :: ostream writing of a printable reference
inline std::ostream& operator<<(std::ostream& out, const heb::printable& p) {
    out << p.to_string();
    return out;
}

/// :: ostream writing of a printable pointer
inline std::ostream& operator<<(std::ostream& out, const heb::printable* p) {
    if(p) { out << *p; } 
    else { out << "heb::printable@nullptr"; }
    return out;
}

/// :: ostream writing for generic coroutine_handle
template <typename PROMISE>
inline std::ostream& operator<<(std::ostream& out, const std::coroutine_handle<PROMISE>& h) {
    out << heb::type::name<std::coroutine_handle<PROMISE>>() << "@" << h.address();
    return out;
}

namespace heb {
namespace config {
namespace logging {

/**
 @brief the process wide default_log_level

 Set to compiler define HEBLOGLEVEL unless overridden by the lifecycle's 
 configuration. Threads inherit this log level.
 */
int default_log_level();

}
}

/**
 @brief namespace object for underlying logging functions

 `logger` is rarely utilized by the user directly, but through macros which 
 determine at compile time if logging statements need to be written.
 */
struct logger {
    /// @return the current thread local log level
    static int thread_log_level();

    /**
     @brief set the thread local log level, clamped to [-9,9]
     @param the new log level for the calling thread
     */
    static void thread_log_level(int level);

    template <typename... As>
    static inline void constructor(const printable* p, 
                                   int verbosity, 
                                   const char* file, 
                                   int line, 
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::%s(%s)", 
                        self.c_str(), name_str.c_str(), ingested.c_str());
        }
    }

    static inline void destructor(const printable* p, 
                                  int verbosity, 
                                  const char* file, 
                                  int line) {
        if(verbosity <= logger::thread_log_level()) {
            std::string self(*p);
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::~%s()", 
                        self.c_str(), name_str.c_str());
        }
    }

    template <typename... As>
    static inline void method_enter(const printable* p, 
                                    int verbosity, 
                                    const char* file, 
                                    int line, 
                                    std::string method_name, 
                                    As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s(%s)", 
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void method_body(const printable* p, 
                                   int verbosity, 
                                   const char* file, 
                                   int line, 
                                   std::string method_name, 
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s():%s", 
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_enter(int verbosity, 
                                      const char* file, 
                                      int line, 
                                      std::string function_name, 
                                      As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s(%s)", 
                        function_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_body(int verbosity, 
                                     const char* file, 
                                     int line, 
                                     std::string function_name, 
                                     As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s():%s", 
                        function_name.c_str(), ingested.c_str());
        }
    }

private:
    logger(){}

    // thread_local loglevel
    static int& tl_loglevel();

    template <typename T>
    struct is_shared_ptr_ : std::false_type { };

    template <typename T>
    struct is_shared_ptr_<std::shared_ptr<T>> : std::true_type { };

    template <typename T>
    struct is_duration_ : std::false_type { };

    template <typename Rep, typename Period>
    struct is_duration_<std::chrono::duration<Rep,Period>> : std::true_type { };

    // ingest a single item
    template <typename A>
    static inline void ingest_item_(std::stringstream& ss, A&& a) {
        using U = unqualified<A>;

        if constexpr (is_duration_<U>::value) {
            ss << heb::chrono::to_string(a);
        } else if constexpr (is_shared_ptr_<U>::value) {
            // shared pointers print the object they point to
            using T = typename U::element_type;

            if constexpr (std::is_base_of_v<printable,T>) {
                ss << static_cast<const printable*>(a.get());
            } else {
                ss << type::name<U>() << "@" << (void*)a.get();
            }
        } else {
            ss << std::forward<A>(a);
        }
    }

    static inline void ingest_rest_of_args_(std::stringstream& ss) { }

    // in argument lists, begin inserting "," between arguments
    template <typename A, typename... As>
    static inline void ingest_rest_of_args_(std::stringstream& ss, A&& a, As&&... as) {
        ss << ", "; 
        ingest_item_(ss,std::forward<A>(a));
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }
   
    static inline void ingest_parameters_(std::stringstream& ss) { }

    // for ingesting a list of function or method arguments
    template <typename A, typename... As>
    static inline void ingest_parameters_(std::stringstream& ss, A&& a, As&&... as) {
        ingest_item_(ss,std::forward<A>(a));
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }
    
    static inline void ingest_(std::stringstream& ss) { }

    // for ingesting arbitrary data into a logline
    template <typename A, typename... As>
    static inline void ingest_(std::stringstream& ss, A&& a, As&&... as) {
        ingest_item_(ss,std::forward<A>(a));
        ingest_(ss, std::forward<As>(as)...);
    }
};

}

#endif
