#ifndef COLOURGEN_DEBUG_LOG_HPP
#define COLOURGEN_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace colourgen {
namespace debug {

// Receives one formatted line, without trailing newline
using DebugCallback = void (*)(const char* message);

// When null, COLOURGEN_DEBUG_LOG writes to stdout
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

constexpr bool output_enabled() {
#ifdef COLOURGEN_ENABLE_DEBUG_OUTPUT
    return true;
#else
    return false;
#endif
}

/**
 * Installs a callback for the lifetime of the object and restores the
 * previous one afterwards.
 */
class ScopedDebugCallback {
private:
    DebugCallback previous_;

public:
    explicit ScopedDebugCallback(DebugCallback cb)
        : previous_(g_debug_callback.exchange(cb, std::memory_order_acq_rel)) {}
    ~ScopedDebugCallback() { g_debug_callback.store(previous_, std::memory_order_release); }

    ScopedDebugCallback(const ScopedDebugCallback&) = delete;
    ScopedDebugCallback& operator=(const ScopedDebugCallback&) = delete;
};

inline void debug_output(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sizing;
    va_copy(sizing, args);
    int length = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);

    std::string message = "[colourgen] ";
    if (length > 0) {
        std::size_t offset = message.size();
        message.resize(offset + static_cast<std::size_t>(length) + 1);
        std::vsnprintf(&message[offset], static_cast<std::size_t>(length) + 1, fmt, args);
        message.resize(offset + static_cast<std::size_t>(length));
    }
    va_end(args);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(message.c_str());
    } else {
        std::printf("%s\n", message.c_str());
        std::fflush(stdout);
    }
}

} // namespace debug
} // namespace colourgen

#ifdef COLOURGEN_ENABLE_DEBUG_OUTPUT
    #define COLOURGEN_DEBUG_LOG(fmt, ...) ::colourgen::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define COLOURGEN_DEBUG_LOG(fmt, ...) ((void)0)
#endif

#endif // COLOURGEN_DEBUG_LOG_HPP
