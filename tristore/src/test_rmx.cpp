#include <tristore/rmx.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <random>
#include <set>
#include <vector>

using namespace tristore;

static const rmx::Axis* const AXES[] = {&rmx::SP, &rmx::PO, &rmx::OS, &rmx::REIFY, &rmx::LITERAL};

static Id128 random_id(std::mt19937_64& rng) {
    uint64_t h = rng();
    uint64_t l = rng();
    return {h, l};
}

static Id128 flip_bit(Id128 x, unsigned bit) {
    if (bit < 64) {
        x.low ^= 1ULL << bit;
    } else {
        x.high ^= 1ULL << (bit - 64);
    }
    return x;
}

// Inverse of an odd multiplier modulo 2^64 (Newton, 3 -> 96 bits)
static uint64_t inverse64(uint64_t c) {
    uint64_t x = c;
    for (int i = 0; i < 5; ++i) x *= 2 - c * x;
    return x;
}

static uint64_t unfmix64(uint64_t h) {
    h ^= h >> 33;
    h *= inverse64(rmx::FMIX_C2);
    h ^= h >> 33;
    h *= inverse64(rmx::FMIX_C1);
    h ^= h >> 33;
    return h;
}

// Key with the final finalizer, the round and the axis seed taken off
static Id128 unwind(const Id128& key, const rmx::Axis& axis) {
    uint64_t hi = unfmix64(key.high);
    uint64_t lo = unfmix64(key.low);
    uint64_t lo1 = rmx::rotr64(lo ^ (hi & ~axis.mask), axis.rotation);
    uint64_t hi1 = rmx::rotr64(hi ^ (lo1 & axis.mask), axis.rotation);
    return {hi1 ^ axis.seed, lo1 ^ rmx::rotl64(axis.seed, 32)};
}

void test_fmix_and_rotations() {
    std::cout << "Testing fmix64 / rotl64..." << std::endl;

    static_assert(rmx::fmix64(0) == 0, "fmix64 fixes zero");
    static_assert(rmx::rotl64(1, 1) == 2, "");
    static_assert(rmx::rotl64(0x8000000000000000ULL, 1) == 1, "");
    static_assert(rmx::rotr64(rmx::rotl64(0x0123456789ABCDEFULL, 17), 17) == 0x0123456789ABCDEFULL, "");
    assert(rmx::rotl64(0xDEADBEEFULL, 0) == 0xDEADBEEFULL);
    assert(rmx::rotl64(0xDEADBEEFULL, 64) == 0xDEADBEEFULL);

    // Finalizer is a bijection: distinct inputs stay distinct
    std::set<uint64_t> seen;
    for (uint64_t i = 0; i < 4096; ++i) {
        seen.insert(rmx::fmix64(i));
    }
    assert(seen.size() == 4096);

    std::mt19937_64 rng(1);
    for (int i = 0; i < 1000; ++i) {
        uint64_t x = rng();
        assert(rmx::fmix64(unfmix64(x)) == x);
        assert(unfmix64(rmx::fmix64(x)) == x);
    }

    std::cout << "  PASS" << std::endl;
}

void test_axis_parameters() {
    std::cout << "Testing axis parameters..." << std::endl;

    const size_t n = sizeof(AXES) / sizeof(AXES[0]);
    for (size_t i = 0; i < n; ++i) {
        assert(AXES[i]->rotation % 2 == 1);
        assert(AXES[i]->rotation < 64);
        assert(AXES[i]->mask != 0 && AXES[i]->mask != ~0ULL);
        for (size_t j = i + 1; j < n; ++j) {
            assert(AXES[i]->rotation != AXES[j]->rotation);
            assert(AXES[i]->mask != AXES[j]->mask);
            assert(AXES[i]->seed != AXES[j]->seed);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_determinism() {
    std::cout << "Testing mix determinism..." << std::endl;

    std::mt19937_64 rng(7);
    for (int i = 0; i < 1000; ++i) {
        Id128 a = random_id(rng);
        Id128 b = random_id(rng);
        for (const auto* axis : AXES) {
            assert(rmx::mix(a, b, *axis) == rmx::mix(a, b, *axis));
        }
    }

    // Fixed inputs give fixed keys across calls within one process
    Id128 a{0x0123456789ABCDEFULL, 0xFEDCBA9876543210ULL};
    Id128 b{42, 43};
    Id128 k1 = rmx::mix(a, b, rmx::SP);
    Id128 k2 = rmx::mix(Id128{a.high, a.low}, Id128{b.high, b.low}, rmx::SP);
    assert(k1 == k2);

    std::cout << "  PASS" << std::endl;
}

void test_zero_inputs() {
    std::cout << "Testing zero inputs..." << std::endl;

    Id128 zero{};
    std::set<Id128> keys;
    for (const auto* axis : AXES) {
        Id128 k = rmx::mix(zero, zero, *axis);
        assert(k.valid());
        // Not degenerate: a reasonable share of bits set
        int bits = rmx::popcount128(k);
        assert(bits > 32 && bits < 96);
        keys.insert(k);
    }
    assert(keys.size() == sizeof(AXES) / sizeof(AXES[0]));

    std::cout << "  PASS" << std::endl;
}

void test_order_sensitivity() {
    std::cout << "Testing order sensitivity..." << std::endl;

    std::mt19937_64 rng(11);
    for (int i = 0; i < 20000; ++i) {
        Id128 a = random_id(rng);
        Id128 b = random_id(rng);
        for (const auto* axis : AXES) {
            assert(rmx::mix(a, b, *axis) != rmx::mix(b, a, *axis));
        }
    }

    // Structured pairs: shared halves, single-bit differences, zero
    std::vector<std::pair<Id128, Id128>> pairs = {
        {{0, 0}, {0, 1}},
        {{0, 1}, {1, 0}},
        {{5, 7}, {5, 8}},
        {{5, 7}, {6, 7}},
        {{~0ULL, ~0ULL}, {0, 0}},
        {{1ULL << 63, 0}, {0, 1ULL << 63}},
    };
    for (const auto& [a, b] : pairs) {
        for (const auto* axis : AXES) {
            assert(rmx::mix(a, b, *axis) != rmx::mix(b, a, *axis));
        }
    }

    // Finalized halves that differ only in the top bit, or not at all
    const uint64_t top = 1ULL << 63;
    std::mt19937_64 structured(12);
    for (int i = 0; i < 200; ++i) {
        uint64_t h = structured();
        uint64_t l = structured();
        Id128 same_low_a{unfmix64(h), 42};
        Id128 same_low_b{unfmix64(h ^ top), 42};
        Id128 both_a{unfmix64(h), unfmix64(l)};
        Id128 both_b{unfmix64(h ^ top), unfmix64(l ^ top)};
        Id128 low_a{7, unfmix64(l)};
        Id128 low_b{7, unfmix64(l ^ top)};
        for (const auto* axis : AXES) {
            assert(rmx::mix(same_low_a, same_low_b, *axis) != rmx::mix(same_low_b, same_low_a, *axis));
            assert(rmx::mix(both_a, both_b, *axis) != rmx::mix(both_b, both_a, *axis));
            assert(rmx::mix(low_a, low_b, *axis) != rmx::mix(low_b, low_a, *axis));
        }
    }

    // Swapping changes the unwound key by exactly the weighted half differences
    for (int i = 0; i < 1000; ++i) {
        Id128 a = random_id(rng);
        Id128 b = random_id(rng);
        for (const auto* axis : AXES) {
            Id128 ab = unwind(rmx::mix(a, b, *axis), *axis);
            Id128 ba = unwind(rmx::mix(b, a, *axis), *axis);
            uint64_t ha = rmx::fmix64(a.high);
            uint64_t la = rmx::fmix64(a.low);
            uint64_t hb = rmx::fmix64(b.high);
            uint64_t lb = rmx::fmix64(b.low);
            assert((ab.high ^ ba.high) == ((ha * rmx::W1) ^ (hb * rmx::W1)));
            assert((ab.low ^ ba.low) == ((la * rmx::W1) ^ (lb * rmx::W1)));
        }
    }

    // Equal terms commute trivially
    Id128 x{99, 100};
    assert(rmx::mix(x, x, rmx::SP) == rmx::mix(x, x, rmx::SP));

    std::cout << "  PASS" << std::endl;
}

void test_fold_nonlinear() {
    std::cout << "Testing non-linear fold..." << std::endl;

    // Zero terms unwind to zero
    for (const auto* axis : AXES) {
        assert(unwind(rmx::mix(Id128{}, Id128{}, *axis), *axis) == Id128{});
    }

    std::mt19937_64 rng(13);
    for (const auto* axis : AXES) {
        for (int i = 0; i < 200; ++i) {
            Id128 a1 = random_id(rng);
            Id128 a2 = random_id(rng);

            // With b fixed, the change from a1 to a2 depends on b
            std::set<uint64_t> xor_diffs;
            std::set<uint64_t> add_diffs;
            for (int j = 0; j < 8; ++j) {
                Id128 b = random_id(rng);
                Id128 k1 = unwind(rmx::mix(a1, b, *axis), *axis);
                Id128 k2 = unwind(rmx::mix(a2, b, *axis), *axis);
                xor_diffs.insert(k1.high ^ k2.high);
                add_diffs.insert(k1.low - k2.low);
            }
            assert(xor_diffs.size() == 8);
            assert(add_diffs.size() == 8);

            // Taking b's own terms off does not leave a's finalized half
            Id128 b = random_id(rng);
            uint64_t hb = rmx::fmix64(b.high);
            uint64_t lb = rmx::fmix64(b.low);
            Id128 k = unwind(rmx::mix(a1, b, *axis), *axis);
            assert((k.high ^ hb ^ (hb * rmx::W1)) != rmx::fmix64(a1.high));
            assert((k.low ^ lb ^ (lb * rmx::W1)) != rmx::fmix64(a1.low));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_avalanche() {
    std::cout << "Testing avalanche..." << std::endl;

    std::mt19937_64 rng(2024);
    for (const auto* axis : AXES) {
        const int trials = 4000;
        double sum = 0.0;
        double sum_sq = 0.0;
        int min_flips = 128;

        for (int i = 0; i < trials; ++i) {
            Id128 a = random_id(rng);
            Id128 b = random_id(rng);
            unsigned bit = static_cast<unsigned>(rng() % 256);

            Id128 base = rmx::mix(a, b, *axis);
            Id128 changed = bit < 128 ? rmx::mix(flip_bit(a, bit), b, *axis)
                                      : rmx::mix(a, flip_bit(b, bit - 128), *axis);
            int flips = rmx::hamming(base, changed);
            sum += flips;
            sum_sq += static_cast<double>(flips) * flips;
            if (flips < min_flips) min_flips = flips;
        }

        double mean = sum / trials;
        double stddev = std::sqrt(sum_sq / trials - mean * mean);
        std::cout << "  " << axis->name << ": mean=" << mean << " stddev=" << stddev
                  << " min=" << min_flips << std::endl;

        // Binomial(128, 0.5): mean 64, stddev ~5.66
        assert(std::fabs(mean - 64.0) < 1.5);
        assert(stddev > 4.0 && stddev < 7.5);
        assert(min_flips > 20);
    }

    std::cout << "  PASS" << std::endl;
}

void test_avalanche_per_bit() {
    std::cout << "Testing avalanche per input bit..." << std::endl;

    std::mt19937_64 rng(99);
    const int trials = 128;
    for (unsigned bit = 0; bit < 256; ++bit) {
        double sum = 0.0;
        for (int i = 0; i < trials; ++i) {
            Id128 a = random_id(rng);
            Id128 b = random_id(rng);
            Id128 base = rmx::mix(a, b, rmx::PO);
            Id128 changed = bit < 128 ? rmx::mix(flip_bit(a, bit), b, rmx::PO)
                                      : rmx::mix(a, flip_bit(b, bit - 128), rmx::PO);
            sum += rmx::hamming(base, changed);
        }
        double mean = sum / trials;
        assert(std::fabs(mean - 64.0) < 4.0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_round_inverse() {
    std::cout << "Testing rotate-mask-xor round inverse..." << std::endl;

    std::mt19937_64 rng(5);
    for (const auto* axis : AXES) {
        for (int i = 0; i < 1000; ++i) {
            uint64_t hi0 = rng();
            uint64_t lo0 = rng();
            uint64_t hi = hi0;
            uint64_t lo = lo0;
            rmx::rotate_mask_xor(hi, lo, *axis);

            uint64_t lo1 = rmx::rotr64(lo ^ (hi & ~axis->mask), axis->rotation);
            uint64_t hi1 = rmx::rotr64(hi ^ (lo1 & axis->mask), axis->rotation);
            assert(hi1 == hi0);
            assert(lo1 == lo0);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_axis_independence() {
    std::cout << "Testing axis independence..." << std::endl;

    // Same pair on two axes: keys look unrelated (about half the bits differ)
    std::mt19937_64 rng(3);
    const size_t n = sizeof(AXES) / sizeof(AXES[0]);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            double sum = 0.0;
            const int trials = 2000;
            for (int t = 0; t < trials; ++t) {
                Id128 a = random_id(rng);
                Id128 b = random_id(rng);
                sum += rmx::hamming(rmx::mix(a, b, *AXES[i]), rmx::mix(a, b, *AXES[j]));
            }
            assert(std::fabs(sum / trials - 64.0) < 1.5);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_literal_hash() {
    std::cout << "Testing literal hash..." << std::endl;

    const char one = '1';
    int64_t one_int = 1;
    unsigned char one_bool = 1;

    Id128 s = rmx::hash_bytes(&one, 1, 0x73);
    Id128 i = rmx::hash_bytes(&one_int, sizeof(one_int), 0x69);
    Id128 b = rmx::hash_bytes(&one_bool, 1, 0x62);
    assert(s != i && s != b && i != b);

    // Tag alone separates identical bytes
    assert(rmx::hash_bytes(&one, 1, 0x73) != rmx::hash_bytes(&one, 1, 0x74));

    // Empty input still hashes to a non-zero id
    assert(rmx::hash_bytes(nullptr, 0, 0x73).valid());

    // Byte order matters
    const char ab[] = {'a', 'b'};
    const char ba[] = {'b', 'a'};
    assert(rmx::hash_bytes(ab, 2, 0x73) != rmx::hash_bytes(ba, 2, 0x73));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Tristore RMX Tests ===" << std::endl;
    std::cout << std::endl;

    test_fmix_and_rotations();
    test_axis_parameters();
    test_determinism();
    test_zero_inputs();
    test_order_sensitivity();
    test_fold_nonlinear();
    test_avalanche();
    test_avalanche_per_bit();
    test_round_inverse();
    test_axis_independence();
    test_literal_hash();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
