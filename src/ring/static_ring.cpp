/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Statically built virtual-node hash ring implementation */

#include "static_ring.hpp"
#include "../util/config.hpp"
#include "../util/err.hpp"

#include <algorithm>
#include <cerrno>
#include <new>
#include <unordered_set>

namespace chr
{

std::unique_ptr<static_ring_t>
static_ring_t::create (std::unique_ptr<i_ring_hash> hash_,
                       std::vector<node_t> nodes_,
                       collision_policy_t policy_)
{
    if (!hash_) {
        errno = EINVAL;
        return nullptr;
    }
    if (policy_ != collision_dedup && policy_ != collision_reject) {
        errno = EINVAL;
        return nullptr;
    }
    if (nodes_.empty ()) {
        errno = CR_ENONODES;
        return nullptr;
    }

    //  Drop repeated keys, keeping the first occurrence and input order
    std::vector<node_t> unique_nodes;
    unique_nodes.reserve (nodes_.size ());
    std::unordered_set<std::string> seen;
    size_t total = 0;
    for (auto &node : nodes_) {
        if (!seen.insert (node.key).second) {
            CR_DEBUG_LOG ("chring: ignoring duplicate node '%s'\n",
                          node.key.c_str ());
            continue;
        }
        if (node.quantity < 1 || node.quantity > max_replicas) {
            errno = CR_EREPLICAS;
            return nullptr;
        }
        total += static_cast<size_t> (node.quantity);
        if (total > max_vnodes) {
            errno = CR_EREPLICAS;
            return nullptr;
        }
        unique_nodes.push_back (std::move (node));
    }

    std::unique_ptr<static_ring_t> ring (
      new (std::nothrow) static_ring_t (std::move (hash_),
                                        std::move (unique_nodes)));
    if (!ring) {
        errno = ENOMEM;
        return nullptr;
    }
    if (ring->build (policy_) < 0)
        return nullptr;
    return ring;
}

static_ring_t::static_ring_t (std::unique_ptr<i_ring_hash> hash_,
                              std::vector<node_t> nodes_) :
    _hash (std::move (hash_)),
    _nodes (std::move (nodes_)),
    _collisions (0)
{
}

static_ring_t::~static_ring_t ()
{
}

int static_ring_t::build (collision_policy_t policy_)
{
    size_t total = 0;
    for (const auto &node : _nodes)
        total += static_cast<size_t> (node.quantity);
    _vnodes.reserve (total);

    for (size_t i = 0; i < _nodes.size (); ++i) {
        const node_t &node = _nodes[i];
        for (int seq = 0; seq < node.quantity; ++seq) {
            const uint32_t s = static_cast<uint32_t> (seq);
            _vnodes.push_back (
              vnode_t{_hash->hash_vnode (node.key, s),
                      static_cast<uint32_t> (i), s});
        }
    }

    //  (hash, key, seq) is a total order: keys are unique after
    //  deduplication and seq is unique per node.
    std::sort (_vnodes.begin (), _vnodes.end (),
               [this] (const vnode_t &a, const vnode_t &b) {
                   if (a.hash != b.hash)
                       return a.hash < b.hash;
                   if (a.node != b.node)
                       return _nodes[a.node].key < _nodes[b.node].key;
                   return a.seq < b.seq;
               });

    //  Within a run of equal hashes the first entry has the smallest
    //  (key, seq) and is the one kept.
    auto last = std::unique (_vnodes.begin (), _vnodes.end (),
                             [] (const vnode_t &a, const vnode_t &b) {
                                 return a.hash == b.hash;
                             });
    _collisions = static_cast<size_t> (_vnodes.end () - last);
    if (_collisions > 0) {
        if (policy_ == collision_reject) {
            _vnodes.clear ();
            errno = CR_ECOLLISION;
            return -1;
        }
        CR_DEBUG_LOG ("chring: dropped %zu colliding virtual nodes\n",
                      _collisions);
        _vnodes.erase (last, _vnodes.end ());
    }
    return 0;
}

size_t static_ring_t::successor (uint64_t hash_) const
{
    auto it = std::lower_bound (
      _vnodes.begin (), _vnodes.end (), hash_,
      [] (const vnode_t &vnode, uint64_t h) { return vnode.hash < h; });
    if (it == _vnodes.end ())
        return 0;
    return static_cast<size_t> (it - _vnodes.begin ());
}

uint64_t static_ring_t::hash (const void *key_, size_t size_) const
{
    return _hash->hash_item (key_, size_);
}

int static_ring_t::lookup (const void *key_, size_t size_) const
{
    //  Defensive only: create() never yields a ring without virtual nodes
    if (cr_unlikely (_vnodes.empty ())) {
        errno = CR_EEMPTYRING;
        return -1;
    }
    return static_cast<int> (_vnodes[successor (hash (key_, size_))].node);
}

int static_ring_t::lookup (const std::string &key_) const
{
    return lookup (key_.data (), key_.size ());
}

candidates_t static_ring_t::candidates (const void *key_, size_t size_) const
{
    if (_vnodes.empty ())
        return candidates_t (*this, 0);
    return candidates_t (*this, successor (hash (key_, size_)));
}

candidates_t static_ring_t::candidates (const std::string &key_) const
{
    return candidates (key_.data (), key_.size ());
}

candidates_t::candidates_t (const static_ring_t &ring_, size_t start_) :
    _ring (ring_),
    _pos (start_),
    _visited (0),
    _found (0),
    _seen (ring_.node_count (), false)
{
}

int candidates_t::next ()
{
    const size_t vnodes = _ring.vnode_count ();
    while (_found < _seen.size () && _visited < vnodes) {
        const uint32_t node = _ring.vnode (_pos).node;
        _pos = _pos + 1 == vnodes ? 0 : _pos + 1;
        _visited++;
        if (_seen[node])
            continue;
        _seen[node] = true;
        _found++;
        return static_cast<int> (node);
    }
    return -1;
}

} // namespace chr
