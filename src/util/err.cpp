/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Error codes and assertion support */

#include "err.hpp"

#if defined __GLIBC__
#include <execinfo.h>
#include <unistd.h>
#endif

const char *chr::errno_to_string(int errno_)
{
    switch (errno_) {
        case CR_ENONODES:
            return "Node list is empty";
        case CR_EREPLICAS:
            return "Invalid replica count";
        case CR_ECOLLISION:
            return "Virtual node hash collision";
        case CR_EEMPTYRING:
            return "Ring has no virtual nodes";
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror(errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void chr::cr_abort(const char *errmsg_)
{
    CR_UNUSED(errmsg_);
    print_backtrace();
    abort();
}

void chr::print_backtrace()
{
#if defined __GLIBC__
    void *frames[64];
    const int depth = backtrace(frames, 64);
    if (depth > 0)
        backtrace_symbols_fd(frames, depth, STDERR_FILENO);
#endif
}
