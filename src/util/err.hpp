/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Error codes and assertion macros */

#ifndef CR_ERR_HPP_INCLUDED
#define CR_ERR_HPP_INCLUDED

#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstdio>

#include "macros.hpp"

// chring-specific error codes, set in errno by the internal API
#define CR_ENONODES    160
#define CR_EREPLICAS   161
#define CR_ECOLLISION  162
#define CR_EEMPTYRING  163

namespace chr {

const char *errno_to_string(int errno_);

#if defined __clang__
#if __has_feature(attribute_analyzer_noreturn)
void cr_abort(const char *errmsg_) __attribute__((analyzer_noreturn));
#else
void cr_abort(const char *errmsg_);
#endif
#elif defined _MSC_VER
__declspec(noreturn) void cr_abort(const char *errmsg_);
#else
void cr_abort(const char *errmsg_) __attribute__((noreturn));
#endif

void print_backtrace();

}  // namespace chr

// This macro works in exactly the same way as the normal assert, but is
// not compiled out with NDEBUG.
#define cr_assert(x) \
    do { \
        if (cr_unlikely(!(x))) { \
            fprintf(stderr, "Assertion failed: %s (%s:%d)\n", #x, __FILE__, \
                    __LINE__); \
            fflush(stderr); \
            chr::cr_abort(#x); \
        } \
    } while (false)

// Provides convenient way to check for errno-style errors.
#define errno_assert(x) \
    do { \
        if (cr_unlikely(!(x))) { \
            const char *errstr = strerror(errno); \
            fprintf(stderr, "%s (%s:%d)\n", errstr, __FILE__, __LINE__); \
            fflush(stderr); \
            chr::cr_abort(errstr); \
        } \
    } while (false)

// Provides convenient way to check whether memory allocation have succeeded.
#define alloc_assert(x) \
    do { \
        if (cr_unlikely(!(x))) { \
            fprintf(stderr, "FATAL ERROR: OUT OF MEMORY (%s:%d)\n", __FILE__, \
                    __LINE__); \
            fflush(stderr); \
            chr::cr_abort("FATAL ERROR: OUT OF MEMORY"); \
        } \
    } while (false)

#endif
