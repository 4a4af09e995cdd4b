/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Real and virtual ring nodes */

#ifndef CR_NODE_HPP_INCLUDED
#define CR_NODE_HPP_INCLUDED

#include "../util/concepts.hpp"

#include <cstdint>
#include <string>

namespace chr
{

/**
 * A real node placed on a ring.
 *
 * key      - opaque identifier, hashed and compared bytewise
 * quantity - number of virtual nodes (replicas) this node owns
 * value    - caller data carried with the node, never dereferenced
 */
struct node_t
{
    std::string key;
    int quantity;
    void *value;
};

// One placement of a real node on the ring
struct vnode_t
{
    uint64_t hash;
    uint32_t node;
    uint32_t seq;
};

template <NodeKeyLike K>
inline node_t make_node (const K &key_, int quantity_, void *value_ = nullptr)
{
    return node_t{std::string (key_.data (), key_.size ()), quantity_, value_};
}

} // namespace chr

#endif
