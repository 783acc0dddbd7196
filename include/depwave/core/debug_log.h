// core/debug_log.h - Optional trace output for the partitioning passes
// Part of the depwave deployment-wave library (C++20)
//
// DEPWAVE_DEBUG_LOG(fmt, ...) is printf-style and compiles to nothing
// unless DEPWAVE_ENABLE_DEBUG_OUTPUT is defined.  When enabled, each
// message is prefixed with "[depwave] " and handed to the installed
// callback, or written to stdout when none is installed.  Message bodies
// longer than max_message_length are cut.

#ifndef DEPWAVE_CORE_DEBUG_LOG_H
#define DEPWAVE_CORE_DEBUG_LOG_H

#include <atomic>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <string>

namespace depwave::debug {

/// Receives one formatted message, without trailing newline.
using debug_callback = void (*)(char const* message);

inline constexpr std::size_t max_message_length = 512;
inline constexpr char const* message_prefix = "[depwave] ";

namespace detail {

[[nodiscard]] inline std::atomic<debug_callback>& callback_slot() noexcept {
    static std::atomic<debug_callback> slot{nullptr};
    return slot;
}

/// Prefix plus the formatted body, the body cut to max_message_length.
[[nodiscard]] inline std::string format_message(char const* fmt, std::va_list args) {
    std::va_list sizing;
    va_copy(sizing, args);
    int const needed = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);

    std::string message(message_prefix);
    if (needed <= 0) {
        return message;
    }
    auto const body = static_cast<std::size_t>(needed) < max_message_length
        ? static_cast<std::size_t>(needed)
        : max_message_length;
    auto const offset = message.size();
    message.resize(offset + body + 1);
    std::vsnprintf(message.data() + offset, body + 1, fmt, args);
    message.resize(offset + body);
    return message;
}

} // namespace detail

inline void set_debug_callback(debug_callback cb) noexcept {
    detail::callback_slot().store(cb, std::memory_order_release);
}

inline void clear_debug_callback() noexcept {
    set_debug_callback(nullptr);
}

inline void debug_output(char const* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    auto const message = detail::format_message(fmt, args);
    va_end(args);

    if (auto cb = detail::callback_slot().load(std::memory_order_acquire)) {
        cb(message.c_str());
        return;
    }
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace depwave::debug

#ifdef DEPWAVE_ENABLE_DEBUG_OUTPUT
    #define DEPWAVE_DEBUG_LOG(fmt, ...) ::depwave::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define DEPWAVE_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // DEPWAVE_CORE_DEBUG_LOG_H
