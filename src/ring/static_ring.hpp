/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Statically built virtual-node hash ring */

#ifndef CR_STATIC_RING_HPP_INCLUDED
#define CR_STATIC_RING_HPP_INCLUDED

#include "node.hpp"
#include "ring_hash.hpp"
#include "../util/macros.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chr
{

class candidates_t;

/**
 * @brief Consistent hash ring built once from a fixed node set
 *
 * Every real node is hashed into the 64-bit keyspace once per replica.
 * The resulting virtual nodes are kept sorted by hash; a key is owned by
 * the first virtual node at or after the key's hash, wrapping around to
 * the first virtual node past the end of the keyspace.
 *
 * Construction:
 *   - Nodes whose key was already seen are ignored (first one wins)
 *   - Replica counts must be within [1, max_replicas]
 *   - Equal virtual node hashes are resolved by the collision policy
 *
 * Thread Safety:
 *   - Immutable after create(), all accessors are const
 *   - Any number of threads may look up concurrently
 *   - Changing membership means building a new ring
 */
class static_ring_t
{
  public:
    enum collision_policy_t
    {
        //  Keep the virtual node with the smallest (key, seq), drop others
        collision_dedup = 0,
        //  Fail the build with CR_ECOLLISION
        collision_reject = 1
    };

    /**
     * @brief Build a ring
     *
     * @param hash_ Hash used for virtual nodes and lookup keys
     * @param nodes_ Real nodes with their replica counts
     * @param policy_ What to do with equal virtual node hashes
     * @return The ring, or nullptr with errno set to CR_ENONODES,
     *         CR_EREPLICAS, CR_ECOLLISION or EINVAL
     */
    static std::unique_ptr<static_ring_t>
    create (std::unique_ptr<i_ring_hash> hash_,
            std::vector<node_t> nodes_,
            collision_policy_t policy_ = collision_dedup);

    ~static_ring_t ();

    /**
     * @brief Find the node owning a key
     *
     * @return Index of the owning node, or -1 with errno set to
     *         CR_EEMPTYRING when the ring has no virtual nodes
     */
    int lookup (const void *key_, size_t size_) const;
    int lookup (const std::string &key_) const;

    //  Distinct nodes for a key in priority order; the first one is
    //  the node lookup() returns.
    candidates_t candidates (const void *key_, size_t size_) const;
    candidates_t candidates (const std::string &key_) const;

    //  Position of a key on the ring.
    uint64_t hash (const void *key_, size_t size_) const;

    size_t node_count () const { return _nodes.size (); }
    const node_t &node (size_t index_) const { return _nodes[index_]; }
    const std::vector<node_t> &nodes () const { return _nodes; }

    size_t vnode_count () const { return _vnodes.size (); }
    const vnode_t &vnode (size_t index_) const { return _vnodes[index_]; }

    //  Virtual nodes dropped because another one had the same hash
    size_t collisions () const { return _collisions; }

  private:
    static_ring_t (std::unique_ptr<i_ring_hash> hash_,
                   std::vector<node_t> nodes_);

    //  Fills and sorts _vnodes. Returns -1 with errno set on failure.
    int build (collision_policy_t policy_);

    //  Index of the first virtual node with hash >= hash_, wrapping to 0.
    size_t successor (uint64_t hash_) const;

    const std::unique_ptr<i_ring_hash> _hash;
    const std::vector<node_t> _nodes;
    std::vector<vnode_t> _vnodes;
    size_t _collisions;

    CR_NON_COPYABLE_NOR_MOVABLE (static_ring_t)
};

/**
 * @brief Walks the ring clockwise from a key's position
 *
 * Yields each real node the first time one of its virtual nodes is met.
 * Stops once every node has been yielded or the walk went round the ring
 * once. Must not outlive the ring it was obtained from.
 */
class candidates_t
{
  public:
    candidates_t (const static_ring_t &ring_, size_t start_);

    //  Next node index, or -1 when exhausted
    int next ();

  private:
    const static_ring_t &_ring;
    size_t _pos;
    size_t _visited;
    size_t _found;
    std::vector<bool> _seen;
};

} // namespace chr

#endif
