//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE_ERROR
#define HERMES_ENVIRONMENT_BRIDGE_ERROR

#include <string>
#include <sstream>
#include <exception>
#include <cstddef>

namespace heb {

/**
 @brief the bridge is not configured for the requested operation

 Thrown when no policy is registered, when a second policy is registered, or 
 when a loop is used before it is attached. Not retryable.
 */
struct configuration_error : public std::exception {
    configuration_error(const std::string& reason) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "configuration error: " << reason;
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/// a managed environment was used after `dispose()`
struct disposed_environment_error : public std::exception {
    disposed_environment_error(const void* env) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "heb::managed_environment@" << env << " has been disposed";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/// a native environment was used after the native side invalidated it
struct dead_environment_error : public std::exception {
    dead_environment_error(size_t id) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "environment " << id << " is no longer alive";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/// an engine function was called while no environment was active
struct no_environment_error : public std::exception {
    no_environment_error(const std::string& function_name) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "You are currently not running within an environment. "
               << "Pass the environment directly to " 
               << function_name 
               << ".";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief loop agnostic cancellation condition

 Raised by `heb::event_loop::throw_if_cancelled()` and by the futures returned 
 from `heb::event_loop::next_cycle()`. An `heb::event_loop` translates it into 
 its host's native cancellation type with `wrap_cancelled()`.
 */
struct cancelled : public std::exception {
    inline const char* what() const noexcept { return "operation was cancelled"; }
};

/// the result of a cancelled `heb::future` was requested 
struct cancelled_error : public std::exception {
    inline const char* what() const noexcept { return "future was cancelled"; }
};

/// a bounded wait elapsed before the awaited state was reached
struct timeout_error : public std::exception {
    timeout_error(const std::string& operation) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << operation << " timed out";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/// a single assignment value was assigned a second time
struct invalid_state_error : public std::exception {
    invalid_state_error(const std::string& object, const std::string& operation) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << operation << " failed because " << object << " is already done";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

}

#endif
