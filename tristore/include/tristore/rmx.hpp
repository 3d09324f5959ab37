#pragma once
// RMX: Rotate-Mask-XOR composite keys
//
// Folds two 128-bit terms into one 128-bit, order-sensitive key:
//
//   1. finalize each 64-bit half of both terms (fmix64)
//   2. symmetric part: both terms xored, plus a finalized mix of their
//      products (Ha*Hb, La*Lb, Ha*Lb + Hb*La), which couples them
//      non-linearly
//   3. asymmetric part: xor in b's halves weighted by W1, and the axis seed
//   4. one rotate-mask-xor round, high half first, then low half
//   5. finalize both halves again
//
// Swapping a and b leaves step 2 unchanged and changes step 3 by
// ((Ha ^ Hb) * W1, (La ^ Lb) * W1). W1 is odd and fmix64 is a bijection,
// so that difference is zero only when a == b, and steps 4 and 5 keep it.
// Not a cryptographic hash.

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace tristore {
namespace rmx {

// MurmurHash3 64-bit finalizer constants
constexpr uint64_t FMIX_C1 = 0xff51afd7ed558ccdULL;
constexpr uint64_t FMIX_C2 = 0xc4ceb9fe1a85ec53ULL;

// Weight of the second term: golden ratio, odd
constexpr uint64_t W1 = 0x9E3779B97F4A7C15ULL;

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

// Parameters of one key space
struct Axis {
    const char* name;
    unsigned rotation;   // odd, so co-prime with 64
    uint64_t mask;       // bits of the other half mixed into the high half
    uint64_t seed;       // separates axes, keeps mix(0, 0) away from 0
};

// Seeds are consecutive 64-bit words of pi's fractional part
inline constexpr Axis SP{"sp", 17, 0xAAAAAAAAAAAAAAAAULL, 0x243F6A8885A308D3ULL};  // alternate bits
inline constexpr Axis PO{"po", 29, 0xCCCCCCCCCCCCCCCCULL, 0x13198A2E03707344ULL};  // 2-bit groups
inline constexpr Axis OS{"os", 43, 0xF0F0F0F0F0F0F0F0ULL, 0xA4093822299F31D0ULL};  // nibbles
inline constexpr Axis REIFY{"reify", 53, 0xFF00FF00FF00FF00ULL, 0x082EFA98EC4E6C89ULL};
inline constexpr Axis LITERAL{"literal", 59, 0xFFFF0000FFFF0000ULL, 0x452821E638D01377ULL};

inline constexpr uint64_t fmix64(uint64_t x) {
    x ^= x >> 33;
    x *= FMIX_C1;
    x ^= x >> 33;
    x *= FMIX_C2;
    x ^= x >> 33;
    return x;
}

inline constexpr uint64_t rotl64(uint64_t x, unsigned r) {
    r &= 63;
    if (r == 0) return x;
    return (x << r) | (x >> (64 - r));
}

inline constexpr uint64_t rotr64(uint64_t x, unsigned r) {
    return rotl64(x, 64 - (r & 63));
}

// One rotate-mask-xor round. Sequential, hence invertible:
//   lo = rotr(lo' ^ (hi' & ~mask)), then hi = rotr(hi' ^ (lo & mask))
inline void rotate_mask_xor(uint64_t& hi, uint64_t& lo, const Axis& axis) {
    hi = rotl64(hi, axis.rotation) ^ (lo & axis.mask);
    lo = rotl64(lo, axis.rotation) ^ (hi & ~axis.mask);
}

// Composite key of (a, b) on one axis
inline Id128 mix(const Id128& a, const Id128& b, const Axis& axis) {
    uint64_t ha = fmix64(a.high);
    uint64_t la = fmix64(a.low);
    uint64_t hb = fmix64(b.high);
    uint64_t lb = fmix64(b.low);

    uint64_t cross = ha * lb + hb * la;
    uint64_t sym_hi = ha ^ hb ^ fmix64(ha * hb + rotl64(cross, 29));
    uint64_t sym_lo = la ^ lb ^ fmix64((la * lb) ^ rotl64(cross, 41));

    uint64_t hi = sym_hi ^ (hb * W1) ^ axis.seed;
    uint64_t lo = sym_lo ^ (lb * W1) ^ rotl64(axis.seed, 32);

    rotate_mask_xor(hi, lo, axis);

    return {fmix64(hi), fmix64(lo)};
}

// Deterministic identifier for literal bytes. The tag keeps "1", 1 and
// true apart.
inline Id128 hash_bytes(const void* data, size_t len, uint64_t tag) {
    const auto* p = static_cast<const unsigned char*>(data);
    uint64_t h = FNV_OFFSET;
    uint64_t l = FNV_OFFSET ^ W1;
    for (size_t i = 0; i < len; ++i) {
        h = (h ^ p[i]) * FNV_PRIME;
        l = (l ^ p[len - 1 - i]) * FNV_PRIME;
    }
    return mix(Id128{h, l}, Id128{tag, static_cast<uint64_t>(len)}, LITERAL);
}

// Number of set bits in a 128-bit value
inline int popcount128(const Id128& x) {
    return __builtin_popcountll(x.high) + __builtin_popcountll(x.low);
}

inline int hamming(const Id128& a, const Id128& b) {
    return popcount128(a ^ b);
}

} // namespace rmx
} // namespace tristore
