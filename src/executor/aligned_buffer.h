// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_EXECUTOR_ALIGNED_BUFFER_H
#define ABVM_EXECUTOR_ALIGNED_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace ABVM {

/** Storage unit of aligned buffers, every allocation is 16-byte aligned */
struct alignas(16) AlignedBlock {
    uint8_t bytes[16];
};

class SharedAlignedBuffer;

/**
 * @brief Mutable byte buffer with 16-byte alignment and an explicit capacity
 *
 * Length never exceeds capacity. Pointers returned by Data() are invalidated
 * by any operation that grows the capacity.
 */
class OwnedAlignedBuffer {
public:
    OwnedAlignedBuffer() = default;

    static OwnedAlignedBuffer WithCapacity(uint32_t capacity);
    static OwnedAlignedBuffer FromBytes(const uint8_t* data, uint32_t len);

    uint8_t* Data();
    const uint8_t* Data() const;
    uint32_t Size() const { return len; }
    uint32_t Capacity() const { return capacity; }
    bool Empty() const { return len == 0; }

    /** Reallocate preserving contents if capacity is below the requested one */
    void EnsureCapacity(uint32_t newCapacity);
    /** Replace contents, growing the capacity if needed */
    void CopyFrom(const uint8_t* data, uint32_t newLen);
    /** Set length, returns false if it exceeds the capacity */
    bool SetLen(uint32_t newLen);

    SharedAlignedBuffer IntoShared() &&;

private:
    std::vector<AlignedBlock> blocks;
    uint32_t capacity = 0;
    uint32_t len = 0;
};

/**
 * @brief Immutable reference-counted aligned buffer, cheap to copy
 *
 * A default constructed instance is empty and still has a valid data pointer.
 */
class SharedAlignedBuffer {
public:
    SharedAlignedBuffer() = default;

    static SharedAlignedBuffer FromBytes(const uint8_t* data, uint32_t len);
    static SharedAlignedBuffer FromBytes(const std::vector<uint8_t>& bytes);

    const uint8_t* Data() const;
    uint32_t Size() const { return inner ? inner->Size() : 0; }
    bool Empty() const { return Size() == 0; }

    /** Copy into a fresh owned buffer of at least the given capacity */
    OwnedAlignedBuffer ToOwned(uint32_t minCapacity = 0) const;

    std::vector<uint8_t> ToVector() const { return std::vector<uint8_t>(Data(), Data() + Size()); }

    /** Whether both share the same allocation */
    bool SharesWith(const SharedAlignedBuffer& other) const { return inner == other.inner; }

private:
    friend class OwnedAlignedBuffer;

    explicit SharedAlignedBuffer(std::shared_ptr<const OwnedAlignedBuffer> innerIn) : inner(std::move(innerIn)) {}

    std::shared_ptr<const OwnedAlignedBuffer> inner;
};

} // namespace ABVM

#endif // ABVM_EXECUTOR_ALIGNED_BUFFER_H
