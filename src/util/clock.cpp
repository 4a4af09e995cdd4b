/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Monotonic clock */

#include "clock.hpp"
#include "err.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/time.h>
#include <time.h>
#endif

static const uint64_t usecs_per_sec = 1000000;
#ifndef _WIN32
static const uint64_t nsecs_per_usec = 1000;
#endif

uint64_t chr::now_us()
{
#if defined(_WIN32)

    LARGE_INTEGER ticks_per_second;
    QueryPerformanceFrequency(&ticks_per_second);

    LARGE_INTEGER tick;
    QueryPerformanceCounter(&tick);

    const double ticks_div =
        static_cast<double>(ticks_per_second.QuadPart) / usecs_per_sec;
    return static_cast<uint64_t>(tick.QuadPart / ticks_div);

#else

    struct timespec tv;
    int rc = clock_gettime(CLOCK_MONOTONIC, &tv);
    // Fall back to wall time where CLOCK_MONOTONIC is not supported.
    if (rc != 0) {
        struct timeval tv2;
        rc = gettimeofday(&tv2, nullptr);
        errno_assert(rc == 0);
        return static_cast<uint64_t>(tv2.tv_sec) * usecs_per_sec + tv2.tv_usec;
    }
    return static_cast<uint64_t>(tv.tv_sec) * usecs_per_sec
           + tv.tv_nsec / nsecs_per_usec;

#endif
}
