/* SPDX-License-Identifier: MPL-2.0 */
/* chring - C++20 Concepts for type constraints */

#ifndef CR_CONCEPTS_HPP_INCLUDED
#define CR_CONCEPTS_HPP_INCLUDED

#include <chring/config.h>

#if CHR_HAVE_CONCEPTS

#include <concepts>
#include <type_traits>
#include <cstddef>
#include <cstdint>

namespace chr {

// =============================================================================
// Hashing Concepts
// =============================================================================

// Callables usable as a ring hash: a pure function of a byte range
// returning a value convertible to a 64-bit ring position.
template <typename F>
concept RingHashFunction = std::copy_constructible<F>
    && requires(const F &f, const void *data, size_t size) {
    { f(data, size) } -> std::convertible_to<uint64_t>;
};

// Types that can name a node: contiguous bytes with a known size.
template <typename T>
concept NodeKeyLike = requires(const T &t) {
    { t.data() } -> std::convertible_to<const char*>;
    { t.size() } -> std::convertible_to<size_t>;
};

} // namespace chr

#else // !CHR_HAVE_CONCEPTS

// Fallback: No concept constraints for pre-C++20 compilers
#define RingHashFunction typename
#define NodeKeyLike typename

#endif // CHR_HAVE_CONCEPTS

#endif // CR_CONCEPTS_HPP_INCLUDED
