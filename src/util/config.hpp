/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Compile-time settings */

#ifndef CR_CONFIG_HPP_INCLUDED
#define CR_CONFIG_HPP_INCLUDED

// Include platform configuration
#include <chring/config.h>

#include <cstddef>
#include <cstdint>

namespace chr {

// Replica count used by tools when none is given. 1000 virtual nodes per
// real node keeps the per-node share within a few percent of the mean.
inline constexpr int default_replicas = 1000;

// Upper bound for the replica count of a single node.
inline constexpr int max_replicas = 1 << 20;

// Upper bound for the virtual nodes of a whole ring. Node indexes and
// replica sequence numbers are stored as 32-bit values.
inline constexpr size_t max_vnodes = size_t(1) << 28;

// Separates the node key from the replica sequence number in the byte
// string hashed for a virtual node: "<key>#<seq>".
inline constexpr char vnode_separator = '#';

// Enough room for the decimal form of any replica sequence number.
inline constexpr size_t max_seq_digits = 10;

}  // namespace chr

#endif
