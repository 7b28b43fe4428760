// Lightweight debug hooks for the receive chain.
#pragma once
#include <cstdio>
#include <cstdlib>

namespace adsb { namespace debug {

inline thread_local int last_fail_step = 0; // set by RX helpers on rejection paths
inline void set_fail(int code) { last_fail_step = code; }

inline bool enabled() {
    static const bool on = std::getenv("ADSB_DEBUG") != nullptr;
    return on;
}

// Failure step codes recorded through set_fail().
enum FailStep : int {
    FAIL_NONE            = 0,
    FAIL_SYNC_STRUCTURE  = 101,
    FAIL_SYNC_CAPACITY   = 102,
    FAIL_CRC             = 201,
    FAIL_DF_UNSUPPORTED  = 202,
    FAIL_CPR_ZONE        = 301,
    FAIL_CPR_STALE       = 302,
    FAIL_CPR_LATITUDE    = 303,
};

} } // namespace adsb::debug

#define ADSB_DEBUGF(fmt, ...) \
    do { if (adsb::debug::enabled()) std::fprintf(stderr, "[adsb] " fmt "\n", ##__VA_ARGS__); } while (0)
