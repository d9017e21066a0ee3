// Lightweight diagnostic tracing, enabled with IQDEC_DEBUG in the environment.
#pragma once
#include <cstdio>
#include <cstdlib>

namespace iqdec { namespace log {
inline bool enabled() {
    static const bool on = std::getenv("IQDEC_DEBUG") != nullptr;
    return on;
}
} } // namespace iqdec::log

#define IQDEC_LOGF(fmt, ...)                                                   \
    do {                                                                       \
        if (::iqdec::log::enabled())                                           \
            std::fprintf(stderr, "[iqdec] " fmt "\n", ##__VA_ARGS__);          \
    } while (0)
