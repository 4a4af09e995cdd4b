/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Hash functions placing keys and virtual nodes on the ring */

#include "ring_hash.hpp"
#include "../util/config.hpp"
#include "../util/err.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <cstring>

namespace chr
{

uint64_t i_ring_hash::hash_vnode (const std::string &key_, uint32_t seq_) const
{
    //  "<key>#<seq>" is unambiguous: the digits after the last separator
    //  are always the sequence number.
    std::string buf;
    buf.reserve (key_.size () + 1 + max_seq_digits);
    buf.append (key_);
    buf.push_back (vnode_separator);
    buf.append (std::to_string (seq_));
    return hash_item (buf.data (), buf.size ());
}

uint64_t md5_hash_t::hash_item (const void *data_, size_t size_) const
{
    static const unsigned char empty = 0;
    if (!data_)
        data_ = &empty;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;

    const int rc = EVP_Digest (data_, size_, digest, &digest_size, EVP_md5 (),
                               nullptr);
    cr_assert (rc == 1);
    cr_assert (digest_size >= 8);

    uint64_t h = 0;
    for (int i = 0; i < 8; ++i)
        h = (h << 8) | digest[i];
    return h;
}

uint64_t fnv1a_hash_t::fnv1a (const void *data_, size_t size_)
{
    const uint64_t offset_basis = 14695981039346656037ULL;
    const uint64_t prime = 1099511628211ULL;

    const unsigned char *p = static_cast<const unsigned char *> (data_);
    uint64_t h = offset_basis;
    for (size_t i = 0; i < size_; ++i) {
        h ^= p[i];
        h *= prime;
    }
    return h;
}

uint64_t fnv1a_hash_t::fmix64 (uint64_t h_)
{
    h_ ^= h_ >> 33;
    h_ *= 0xff51afd7ed558ccdULL;
    h_ ^= h_ >> 33;
    h_ *= 0xc4ceb9fe1a85ec53ULL;
    h_ ^= h_ >> 33;
    return h_;
}

uint64_t fnv1a_hash_t::hash_item (const void *data_, size_t size_) const
{
    //  Plain FNV-1a barely moves the high bits for keys that differ only in
    //  their last byte, which "<key>#<seq>" strings do.
    return fmix64 (fnv1a (data_, size_));
}

fn_hash_t::fn_hash_t (fn_t fn_, void *hint_) : _fn (fn_), _hint (hint_)
{
    cr_assert (_fn);
}

uint64_t fn_hash_t::hash_item (const void *data_, size_t size_) const
{
    return _fn (data_, size_, _hint);
}

std::unique_ptr<i_ring_hash> create_ring_hash (int type_)
{
    switch (type_) {
        case hash_md5:
            return std::make_unique<md5_hash_t> ();
        case hash_fnv1a:
            return std::make_unique<fnv1a_hash_t> ();
        default:
            errno = EINVAL;
            return nullptr;
    }
}

} // namespace chr
