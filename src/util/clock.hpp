/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Monotonic clock */

#ifndef CR_CLOCK_HPP_INCLUDED
#define CR_CLOCK_HPP_INCLUDED

#include <cstdint>

namespace chr {

// High precision monotonic timestamp in microseconds.
uint64_t now_us();

}  // namespace chr

#endif
