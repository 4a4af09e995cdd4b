/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Public C API Implementation */

#include "chring/chring.h"

#include <stdint.h>
#include <string.h>
#include <stdlib.h>
#include <errno.h>

#include <new>
#include <vector>

#include "ring/static_ring.hpp"
#include "ring/ring_hash.hpp"
#include "util/clock.hpp"
#include "util/config.hpp"
#include "util/err.hpp"

static_assert (chr::default_replicas == CHR_DEFAULT_REPLICAS,
               "default replica count mismatch");

// Thread-local storage for errno
#ifdef _WIN32
static __declspec(thread) int chr_errno_value = 0;
#else
static __thread int chr_errno_value = 0;
#endif

// Helper function to set errno and return error code
static inline int set_errno(int err)
{
    errno = err;
    chr_errno_value = err;
    return -1;
}

// Helper to convert internal error codes to public API error codes
static int map_errno(int internal_errno)
{
    switch (internal_errno) {
        case EINVAL:
            return CHR_EINVAL;
        case ENOMEM:
            return CHR_ENOMEM;
        case CR_ENONODES:
            return CHR_ENONODES;
        case CR_EREPLICAS:
            return CHR_EREPLICAS;
        case CR_ECOLLISION:
            return CHR_ECOLLISION;
        case CR_EEMPTYRING:
            return CHR_EEMPTYRING;
        default:
            return internal_errno;
    }
}

// Helper to validate pointers
#define CHECK_PTR(ptr, ret) \
    do { \
        if (!(ptr)) { \
            set_errno(CHR_EINVAL); \
            return ret; \
        } \
    } while(0)

static inline const chr::static_ring_t *as_ring(const chr_ring_t *ring_)
{
    return reinterpret_cast<const chr::static_ring_t*>(ring_);
}

static inline bool valid_node(const chr_ring_t *ring_, int node)
{
    return node >= 0 && static_cast<size_t>(node) < as_ring(ring_)->node_count();
}

static chr_ring_t *build_ring(std::vector<chr::node_t> nodes,
                              const chr_ring_opts_t *opts)
{
    if (opts->collision != CHR_COLLISION_DEDUP
        && opts->collision != CHR_COLLISION_REJECT) {
        set_errno(CHR_EINVAL);
        return nullptr;
    }

    try {
        std::unique_ptr<chr::i_ring_hash> hash;
        if (opts->hash_fn) {
            hash = std::make_unique<chr::fn_hash_t>(opts->hash_fn, opts->hash_hint);
        } else {
            hash = chr::create_ring_hash(opts->hash);
            if (!hash) {
                set_errno(map_errno(errno));
                return nullptr;
            }
        }

        std::unique_ptr<chr::static_ring_t> ring = chr::static_ring_t::create(
            std::move(hash), std::move(nodes),
            static_cast<chr::static_ring_t::collision_policy_t>(opts->collision));
        if (!ring) {
            set_errno(map_errno(errno));
            return nullptr;
        }
        return reinterpret_cast<chr_ring_t*>(ring.release());
    } catch (const std::bad_alloc&) {
        set_errno(CHR_ENOMEM);
        return nullptr;
    }
}

extern "C" {

/****************************************************************************/
/*  Version Information                                                     */
/****************************************************************************/

void CHR_CALL chr_version(int *major, int *minor, int *patch)
{
    if (major) *major = CHR_VERSION_MAJOR;
    if (minor) *minor = CHR_VERSION_MINOR;
    if (patch) *patch = CHR_VERSION_PATCH;
}

/****************************************************************************/
/*  Error Handling                                                          */
/****************************************************************************/

int CHR_CALL chr_errno(void)
{
    return chr_errno_value;
}

const char* CHR_CALL chr_strerror(int errnum)
{
    switch (errnum) {
        case CHR_EINVAL:
            return "Invalid argument";
        case CHR_ENOMEM:
            return "Out of memory";
        case CHR_ENONODES:
            return "Node list is empty";
        case CHR_EREPLICAS:
            return "Invalid replica count";
        case CHR_ECOLLISION:
            return "Virtual node hash collision";
        case CHR_EEMPTYRING:
            return "Ring has no virtual nodes";
        default:
            return "Unknown error";
    }
}

/****************************************************************************/
/*  Hash Functions                                                          */
/****************************************************************************/

int CHR_CALL chr_hash(int type, const void *data, size_t len, uint64_t *value)
{
    CHECK_PTR(value, -1);
    if (!data && len > 0)
        return set_errno(CHR_EINVAL);

    try {
        std::unique_ptr<chr::i_ring_hash> hash = chr::create_ring_hash(type);
        if (!hash)
            return set_errno(map_errno(errno));
        *value = hash->hash_item(data, len);
        return 0;
    } catch (const std::bad_alloc&) {
        return set_errno(CHR_ENOMEM);
    }
}

/****************************************************************************/
/*  Ring Construction                                                       */
/****************************************************************************/

void CHR_CALL chr_ring_opts_init(chr_ring_opts_t *opts)
{
    if (!opts)
        return;
    opts->hash = CHR_HASH_MD5;
    opts->hash_fn = nullptr;
    opts->hash_hint = nullptr;
    opts->collision = CHR_COLLISION_DEDUP;
}

chr_ring_t* CHR_CALL chr_ring_new(const char **nodes, size_t count, int replicas)
{
    if (count > 0)
        CHECK_PTR(nodes, nullptr);

    try {
        std::vector<chr::node_t> list;
        list.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            CHECK_PTR(nodes[i], nullptr);
            list.push_back(chr::node_t{nodes[i], replicas, nullptr});
        }

        chr_ring_opts_t opts;
        chr_ring_opts_init(&opts);
        return build_ring(std::move(list), &opts);
    } catch (const std::bad_alloc&) {
        set_errno(CHR_ENOMEM);
        return nullptr;
    }
}

chr_ring_t* CHR_CALL chr_ring_new_ex(const chr_node_t *nodes, size_t count,
                                     const chr_ring_opts_t *opts)
{
    if (count > 0)
        CHECK_PTR(nodes, nullptr);

    chr_ring_opts_t defaults;
    if (!opts) {
        chr_ring_opts_init(&defaults);
        opts = &defaults;
    }

    try {
        std::vector<chr::node_t> list;
        list.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (!nodes[i].key && nodes[i].key_len > 0) {
                set_errno(CHR_EINVAL);
                return nullptr;
            }
            const char *key = static_cast<const char*>(nodes[i].key);
            list.push_back(chr::node_t{
                key ? std::string(key, nodes[i].key_len) : std::string(),
                nodes[i].replicas, nodes[i].value});
        }
        return build_ring(std::move(list), opts);
    } catch (const std::bad_alloc&) {
        set_errno(CHR_ENOMEM);
        return nullptr;
    }
}

void CHR_CALL chr_ring_destroy(chr_ring_t **ring_)
{
    if (!ring_ || !*ring_)
        return;

    delete reinterpret_cast<chr::static_ring_t*>(*ring_);
    *ring_ = nullptr;
}

/****************************************************************************/
/*  Lookup                                                                  */
/****************************************************************************/

int CHR_CALL chr_ring_lookup(const chr_ring_t *ring_, const void *key, size_t len)
{
    CHECK_PTR(ring_, -1);
    if (!key && len > 0)
        return set_errno(CHR_EINVAL);

    const int node = as_ring(ring_)->lookup(key, len);
    if (node < 0)
        return set_errno(map_errno(errno));
    return node;
}

int CHR_CALL chr_ring_candidates(const chr_ring_t *ring_, const void *key,
                                 size_t len, int *nodes, int max)
{
    CHECK_PTR(ring_, -1);
    if ((!key && len > 0) || max < 0 || (!nodes && max > 0))
        return set_errno(CHR_EINVAL);

    const chr::static_ring_t *ring = as_ring(ring_);
    if (ring->vnode_count() == 0)
        return set_errno(CHR_EEMPTYRING);

    try {
        chr::candidates_t candidates = ring->candidates(key, len);
        int count = 0;
        while (count < max) {
            const int node = candidates.next();
            if (node < 0)
                break;
            nodes[count++] = node;
        }
        return count;
    } catch (const std::bad_alloc&) {
        return set_errno(CHR_ENOMEM);
    }
}

int CHR_CALL chr_ring_hash(const chr_ring_t *ring_, const void *key, size_t len,
                           uint64_t *value)
{
    CHECK_PTR(ring_, -1);
    CHECK_PTR(value, -1);
    if (!key && len > 0)
        return set_errno(CHR_EINVAL);

    *value = as_ring(ring_)->hash(key, len);
    return 0;
}

/****************************************************************************/
/*  Introspection                                                           */
/****************************************************************************/

size_t CHR_CALL chr_ring_node_count(const chr_ring_t *ring_)
{
    CHECK_PTR(ring_, 0);
    return as_ring(ring_)->node_count();
}

size_t CHR_CALL chr_ring_vnode_count(const chr_ring_t *ring_)
{
    CHECK_PTR(ring_, 0);
    return as_ring(ring_)->vnode_count();
}

size_t CHR_CALL chr_ring_collisions(const chr_ring_t *ring_)
{
    CHECK_PTR(ring_, 0);
    return as_ring(ring_)->collisions();
}

const void* CHR_CALL chr_ring_node_key(const chr_ring_t *ring_, int node,
                                       size_t *len)
{
    CHECK_PTR(ring_, nullptr);
    if (!valid_node(ring_, node)) {
        set_errno(CHR_EINVAL);
        return nullptr;
    }

    const std::string &key = as_ring(ring_)->node(static_cast<size_t>(node)).key;
    if (len)
        *len = key.size();
    return key.c_str();
}

void* CHR_CALL chr_ring_node_value(const chr_ring_t *ring_, int node)
{
    CHECK_PTR(ring_, nullptr);
    if (!valid_node(ring_, node)) {
        set_errno(CHR_EINVAL);
        return nullptr;
    }
    return as_ring(ring_)->node(static_cast<size_t>(node)).value;
}

int CHR_CALL chr_ring_node_replicas(const chr_ring_t *ring_, int node)
{
    CHECK_PTR(ring_, -1);
    if (!valid_node(ring_, node))
        return set_errno(CHR_EINVAL);
    return as_ring(ring_)->node(static_cast<size_t>(node)).quantity;
}

int CHR_CALL chr_ring_vnode(const chr_ring_t *ring_, size_t index,
                            uint64_t *hash, int *node)
{
    CHECK_PTR(ring_, -1);

    const chr::static_ring_t *ring = as_ring(ring_);
    if (index >= ring->vnode_count())
        return set_errno(CHR_EINVAL);

    const chr::vnode_t &vnode = ring->vnode(index);
    if (hash) *hash = vnode.hash;
    if (node) *node = static_cast<int>(vnode.node);
    return 0;
}

/****************************************************************************/
/*  Utility Functions                                                       */
/****************************************************************************/

uint64_t CHR_CALL chr_clock(void)
{
    return chr::now_us();
}

} // extern "C"
