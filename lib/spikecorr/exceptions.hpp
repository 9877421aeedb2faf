#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace spikecorr::error_check {

// Precondition violation on caller-supplied arrays or parameters.
class DetailedException : public std::invalid_argument {
public:
    explicit DetailedException(
        std::string_view user_msg,
        const std::source_location& loc = std::source_location::current())
        : std::invalid_argument(compose_message(user_msg, loc)) {}

private:
    static std::string compose_message(std::string_view msg,
                                       const std::source_location& loc) {
        return fmt::format("{}:{}:{}: error: {}\n  in function '{}'",
                           loc.file_name(), loc.line(), loc.column(), msg,
                           loc.function_name());
    }
};

template <typename T, typename U, typename Comparator>
inline void check_with_comparator(
    const T& a,
    const U& b,
    Comparator cmp,
    std::string_view op_str,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    if (!cmp(a, b)) {
        std::string composed =
            msg.empty() ? fmt::format("Check failed: {} {} {}", a, op_str, b)
                        : fmt::format("{} ({} {} {})", msg, a, op_str, b);
        throw DetailedException(composed, loc);
    }
}

// Check if actual is equal to expected
template <typename T, typename U>
inline void
check_equal(const T& actual,
            const U& expected,
            std::string_view msg            = "",
            const std::source_location& loc = std::source_location::current()) {
    check_with_comparator(actual, expected, std::equal_to<>(), "==", msg, loc);
}

// Check if actual is greater than or equal to expected
template <typename T, typename U>
inline void check_greater_equal(
    const T& actual,
    const U& expected,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    check_with_comparator(actual, expected, std::greater_equal<>(), ">=", msg,
                          loc);
}

// Check if actual is less than or equal to expected
template <typename T, typename U>
inline void check_less_equal(
    const T& actual,
    const U& expected,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    check_with_comparator(actual, expected, std::less_equal<>(), "<=", msg,
                          loc);
}

// Product of two extents; throws if it does not fit in std::size_t.
inline std::size_t checked_product(
    std::size_t a,
    std::size_t b,
    std::string_view msg,
    const std::source_location& loc = std::source_location::current()) {
    if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) {
        throw DetailedException(
            fmt::format("{} ({} * {} overflows)", msg, a, b), loc);
    }
    return a * b;
}

inline void
check(bool condition,
      std::string_view msg,
      const std::source_location& loc = std::source_location::current()) {
    if (!condition) {
        throw DetailedException(msg, loc);
    }
}

} // namespace spikecorr::error_check
