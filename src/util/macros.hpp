/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Internal macros */

#ifndef CR_MACROS_HPP_INCLUDED
#define CR_MACROS_HPP_INCLUDED

/******************************************************************************/
/*  chring Internal Use                                                       */
/******************************************************************************/

#define CR_UNUSED(object) (void) object

#if defined __GNUC__
#define cr_likely(x) __builtin_expect((x), 1)
#define cr_unlikely(x) __builtin_expect((x), 0)
#else
#define cr_likely(x) (x)
#define cr_unlikely(x) (x)
#endif

// Non-copyable and non-movable class macro
#define CR_NON_COPYABLE_NOR_MOVABLE(classname) \
  public: \
    classname(const classname &) = delete; \
    classname &operator=(const classname &) = delete; \
    classname(classname &&) = delete; \
    classname &operator=(classname &&) = delete;

// Debug logging - only enabled when explicitly requested
#ifdef CR_ENABLE_DEBUG_LOG
    #include <cstdio>
    #define CR_DEBUG_LOG(...) fprintf(stderr, __VA_ARGS__)
#else
    #define CR_DEBUG_LOG(...)
#endif

#endif
