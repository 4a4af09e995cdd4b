/* chring - Consistent hashing on a statically built virtual-node ring */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef CHRING_H
#define CHRING_H

#include "chring_export.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/****************************************************************************/
/*  Version Information                                                     */
/****************************************************************************/

#define CHR_VERSION_MAJOR 0
#define CHR_VERSION_MINOR 1
#define CHR_VERSION_PATCH 0

CHR_EXPORT void CHR_CALL chr_version(int *major, int *minor, int *patch);

/****************************************************************************/
/*  Error Codes                                                             */
/****************************************************************************/

#define CHR_EINVAL       1   /* Invalid argument */
#define CHR_ENOMEM       2   /* Out of memory */

/* Ring-specific error codes */
#define CHR_ENONODES     20  /* Node list is empty */
#define CHR_EREPLICAS    21  /* Replica count out of range */
#define CHR_ECOLLISION   22  /* Virtual node hashes collide (reject policy) */
#define CHR_EEMPTYRING   23  /* Lookup on a ring without virtual nodes */

CHR_EXPORT int CHR_CALL chr_errno(void);
CHR_EXPORT const char* CHR_CALL chr_strerror(int errnum);

/****************************************************************************/
/*  Hash Functions                                                          */
/****************************************************************************/

#define CHR_HASH_MD5     0   /* MD5, first 8 bytes big-endian (default) */
#define CHR_HASH_FNV1A   1   /* 64-bit FNV-1a with murmur3 finalizer */

/* Caller-supplied hash: must be a pure function of the bytes */
typedef uint64_t (*chr_hash_fn)(const void *data, size_t len, void *hint);

/* Hash bytes with a built-in hash function */
CHR_EXPORT int CHR_CALL chr_hash(int type, const void *data, size_t len,
                                 uint64_t *value);

/****************************************************************************/
/*  Ring Construction                                                       */
/****************************************************************************/

/* Collision policies for equal virtual node hashes */
#define CHR_COLLISION_DEDUP  0   /* Keep the smallest (key, replica), drop others */
#define CHR_COLLISION_REJECT 1   /* Fail with CHR_ECOLLISION */

/* Replica count the tools use when none is given */
#define CHR_DEFAULT_REPLICAS 1000

typedef struct chr_ring_t chr_ring_t;

typedef struct chr_node_t {
    const void *key;        /* Node identifier bytes */
    size_t key_len;         /* Node identifier length */
    int replicas;           /* Virtual nodes for this node (>= 1) */
    void *value;            /* Caller data, returned by chr_ring_node_value */
} chr_node_t;

typedef struct chr_ring_opts_t {
    int hash;               /* CHR_HASH_* */
    chr_hash_fn hash_fn;    /* Overrides hash when not NULL */
    void *hash_hint;        /* Passed to hash_fn */
    int collision;          /* CHR_COLLISION_* */
} chr_ring_opts_t;

/* Default options: MD5, dedup */
CHR_EXPORT void CHR_CALL chr_ring_opts_init(chr_ring_opts_t *opts);

/* Build a ring from NUL-terminated node names, same replica count each */
CHR_EXPORT chr_ring_t* CHR_CALL chr_ring_new(const char **nodes, size_t count,
                                             int replicas);

/* Build a ring from node descriptors; opts may be NULL for defaults */
CHR_EXPORT chr_ring_t* CHR_CALL chr_ring_new_ex(const chr_node_t *nodes,
                                                size_t count,
                                                const chr_ring_opts_t *opts);

/* Destroy a ring and set *ring to NULL */
CHR_EXPORT void CHR_CALL chr_ring_destroy(chr_ring_t **ring);

/****************************************************************************/
/*  Lookup                                                                  */
/****************************************************************************/

/* Index of the node owning key, or -1 on error */
CHR_EXPORT int CHR_CALL chr_ring_lookup(const chr_ring_t *ring, const void *key,
                                        size_t len);

/* Distinct nodes for key in priority order; writes at most max indexes
 * and returns the number written, or -1 on error */
CHR_EXPORT int CHR_CALL chr_ring_candidates(const chr_ring_t *ring,
                                            const void *key, size_t len,
                                            int *nodes, int max);

/* Position of key on the ring */
CHR_EXPORT int CHR_CALL chr_ring_hash(const chr_ring_t *ring, const void *key,
                                      size_t len, uint64_t *value);

/****************************************************************************/
/*  Introspection                                                           */
/****************************************************************************/

CHR_EXPORT size_t CHR_CALL chr_ring_node_count(const chr_ring_t *ring);
CHR_EXPORT size_t CHR_CALL chr_ring_vnode_count(const chr_ring_t *ring);
CHR_EXPORT size_t CHR_CALL chr_ring_collisions(const chr_ring_t *ring);

/* Node data; key is not NUL-terminated when built with chr_ring_new_ex */
CHR_EXPORT const void* CHR_CALL chr_ring_node_key(const chr_ring_t *ring,
                                                  int node, size_t *len);
CHR_EXPORT void* CHR_CALL chr_ring_node_value(const chr_ring_t *ring, int node);
CHR_EXPORT int CHR_CALL chr_ring_node_replicas(const chr_ring_t *ring, int node);

/* Virtual node at position index in ring order */
CHR_EXPORT int CHR_CALL chr_ring_vnode(const chr_ring_t *ring, size_t index,
                                       uint64_t *hash, int *node);

/****************************************************************************/
/*  Utility Functions                                                       */
/****************************************************************************/

/* Get current high-resolution timestamp (microseconds) */
CHR_EXPORT uint64_t CHR_CALL chr_clock(void);

#ifdef __cplusplus
}
#endif

#endif /* CHRING_H */
