#pragma once
// Posting: an owned roaring bitmap of 32-bit slots
//
// Every index in the engine maps a key to a Posting. Slots are dense, so
// roaring keeps sparse postings as sorted arrays and dense ones as bitsets,
// and AND across postings is O(min(n, m)).

#include <roaring/roaring.h>
#include <cstdint>
#include <new>
#include <utility>
#include <vector>

namespace tristore {

class Posting {
public:
    Posting() : bitmap_(roaring_bitmap_create()) {
        if (!bitmap_) throw std::bad_alloc();
    }

    ~Posting() {
        if (bitmap_) roaring_bitmap_free(bitmap_);
    }

    Posting(const Posting& other) : bitmap_(roaring_bitmap_copy(other.bitmap_)) {
        if (!bitmap_) throw std::bad_alloc();
    }

    Posting& operator=(const Posting& other) {
        if (this != &other) {
            Posting copy(other);
            std::swap(bitmap_, copy.bitmap_);
        }
        return *this;
    }

    Posting(Posting&& other) noexcept : bitmap_(other.bitmap_) {
        other.bitmap_ = nullptr;
    }

    Posting& operator=(Posting&& other) noexcept {
        std::swap(bitmap_, other.bitmap_);
        return *this;
    }

    // true if the slot was not present
    bool add(uint32_t slot) {
        return roaring_bitmap_add_checked(bitmap_, slot);
    }

    // true if the slot was present
    bool remove(uint32_t slot) {
        return roaring_bitmap_remove_checked(bitmap_, slot);
    }

    uint64_t cardinality() const {
        return roaring_bitmap_get_cardinality(bitmap_);
    }

    bool empty() const {
        return roaring_bitmap_is_empty(bitmap_);
    }

    // this &= other
    void intersect(const Posting& other) {
        roaring_bitmap_and_inplace(bitmap_, other.bitmap_);
    }

    // Slots in ascending order
    std::vector<uint32_t> to_vector() const {
        std::vector<uint32_t> result(cardinality());
        if (!result.empty()) {
            roaring_bitmap_to_uint32_array(bitmap_, result.data());
        }
        return result;
    }

    size_t memory_bytes() const {
        return roaring_bitmap_size_in_bytes(bitmap_);
    }

private:
    roaring_bitmap_t* bitmap_;
};

} // namespace tristore
