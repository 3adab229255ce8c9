#pragma once

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace adsim {

// Raised for setup bugs: bad budgets, windows, hurdles or controller constants.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

namespace detail {

template <typename Exception>
[[noreturn]] void throw_or_abort(Exception&& ex, const char* file, int line) {
#if defined(__cpp_exceptions)
    throw std::forward<Exception>(ex);
#else
    std::cerr << "fatal: " << ex.what() << " (" << file << ':' << line << ")\n";
    std::abort();
#endif
}

} // namespace detail

} // namespace adsim

#if defined(__cpp_exceptions)
#define ADSIM_THROW(expr) throw expr
#else
#define ADSIM_THROW(expr) ::adsim::detail::throw_or_abort((expr), __FILE__, __LINE__)
#endif

#define ADSIM_REQUIRE(cond, message)                           \
    do {                                                       \
        if (!(cond)) {                                         \
            ADSIM_THROW(::adsim::ConfigError(message));        \
        }                                                      \
    } while (false)
