/* SPDX-License-Identifier: MPL-2.0 */
/* chring - Hash functions placing keys and virtual nodes on the ring */

#ifndef CR_RING_HASH_HPP_INCLUDED
#define CR_RING_HASH_HPP_INCLUDED

#include "../util/concepts.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace chr
{

/**
 * Hash capability a ring depends on.
 *
 * Both virtual nodes and lookup keys go through the same instance, so they
 * land in the same 64-bit keyspace. Implementations must be pure: the same
 * bytes always hash to the same value, with no side effects, so that a ring
 * can be read from any number of threads.
 */
class i_ring_hash
{
  public:
    virtual ~i_ring_hash () = default;

    //  Hash of an arbitrary byte sequence.
    virtual uint64_t hash_item (const void *data_, size_t size_) const = 0;

    //  Hash of replica seq_ of the node named key_. The default hashes the
    //  byte string "<key>#<seq>" with hash_item.
    virtual uint64_t hash_vnode (const std::string &key_, uint32_t seq_) const;
};

//  MD5 digest (OpenSSL), first 8 bytes read big-endian.
class md5_hash_t final : public i_ring_hash
{
  public:
    uint64_t hash_item (const void *data_, size_t size_) const override;
};

//  64-bit FNV-1a followed by the murmur3 fmix64 finalizer.
class fnv1a_hash_t final : public i_ring_hash
{
  public:
    uint64_t hash_item (const void *data_, size_t size_) const override;

    static uint64_t fnv1a (const void *data_, size_t size_);
    static uint64_t fmix64 (uint64_t h_);
};

//  Caller-supplied C function with an opaque hint.
class fn_hash_t final : public i_ring_hash
{
  public:
    typedef uint64_t (*fn_t) (const void *data_, size_t size_, void *hint_);

    fn_hash_t (fn_t fn_, void *hint_);

    uint64_t hash_item (const void *data_, size_t size_) const override;

  private:
    fn_t _fn;
    void *_hint;
};

//  Any C++ callable taking (const void *, size_t).
template <RingHashFunction F> class callable_hash_t final : public i_ring_hash
{
  public:
    explicit callable_hash_t (F fn_) : _fn (std::move (fn_)) {}

    uint64_t hash_item (const void *data_, size_t size_) const override
    {
        return static_cast<uint64_t> (_fn (data_, size_));
    }

  private:
    F _fn;
};

template <RingHashFunction F>
std::unique_ptr<i_ring_hash> make_ring_hash (F fn_)
{
    return std::make_unique<callable_hash_t<F> > (std::move (fn_));
}

//  Built-in hash families, numbered as in the public API.
enum hash_type_t
{
    hash_md5 = 0,
    hash_fnv1a = 1
};

//  Returns nullptr and sets errno to EINVAL for an unknown type.
std::unique_ptr<i_ring_hash> create_ring_hash (int type_);

} // namespace chr

#endif
