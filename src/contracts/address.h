// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_ADDRESS_H
#define ABVM_CONTRACTS_ADDRESS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ABVM {

/**
 * @brief Shard index, a number below MAX_SHARDS
 */
class ShardIndex {
public:
    /** Total number of shards, 2^20 */
    static constexpr uint32_t MAX_SHARDS = 1u << 20;
    static constexpr uint32_t MAX_SHARD_INDEX = MAX_SHARDS - 1;

    constexpr ShardIndex() = default;

    /** Returns nothing if the index is out of range */
    static std::optional<ShardIndex> New(uint32_t value) {
        if (value > MAX_SHARD_INDEX) {
            return std::nullopt;
        }
        return ShardIndex(value);
    }

    uint32_t Get() const { return index; }

    bool operator==(const ShardIndex& other) const { return index == other.index; }
    bool operator!=(const ShardIndex& other) const { return index != other.index; }

private:
    explicit constexpr ShardIndex(uint32_t value) : index(value) {}

    uint32_t index = 0;
};

/**
 * @brief 128-bit contract address
 *
 * Stored as two little-endian 64-bit words, so the in-memory layout is the
 * little-endian encoding of the number on little-endian hosts and the type
 * has alignment 8 in method arguments.
 */
struct Address {
    static constexpr size_t SIZE = 16;

    uint64_t low = 0;
    uint64_t high = 0;

    constexpr Address() = default;
    constexpr Address(uint64_t lowIn, uint64_t highIn) : low(lowIn), high(highIn) {}

    bool IsNull() const { return low == 0 && high == 0; }

    /** Checked addition; returns nothing on overflow past 2^128 - 1 */
    std::optional<Address> CheckedAdd(const Address& other) const;
    /** Checked subtraction; returns nothing on underflow */
    std::optional<Address> CheckedSub(const Address& other) const;

    void Serialize(unsigned char out[SIZE]) const;
    static Address Deserialize(const unsigned char in[SIZE]);

    /** Hex rendering, most significant digit first, with a 0x prefix */
    std::string ToString() const;

    bool operator==(const Address& other) const { return low == other.low && high == other.high; }
    bool operator!=(const Address& other) const { return !(*this == other); }
    bool operator<(const Address& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }
};

static_assert(sizeof(Address) == Address::SIZE, "Address must be 16 bytes");
static_assert(alignof(Address) == 8, "Address must have alignment 8");

inline std::ostream& operator<<(std::ostream& os, const Address& address) {
    return os << address.ToString();
}

/** Sentinel and namespace for temporary storage */
static constexpr Address ADDRESS_NULL{0, 0};
/** System contract for managing code of other contracts */
static constexpr Address ADDRESS_SYSTEM_CODE{1, 0};
/** System contract for block-related information */
static constexpr Address ADDRESS_SYSTEM_BLOCK{2, 0};
/** System contract for managing state of other contracts */
static constexpr Address ADDRESS_SYSTEM_STATE{3, 0};
/** System contract for the native token */
static constexpr Address ADDRESS_SYSTEM_NATIVE_TOKEN{4, 0};
/** System simple wallet base contract that can be used by end user wallets */
static constexpr Address ADDRESS_SYSTEM_SIMPLE_WALLET_BASE{10, 0};

/** Addresses per shard: 2^128 / MAX_SHARDS = 2^108 */
static constexpr Address MAX_ADDRESSES_PER_SHARD{0, uint64_t{1} << 44};

/** Address allocator contract of the given shard, the first address of the shard's range */
Address SystemAddressAllocator(ShardIndex shardIndex);

} // namespace ABVM

#endif // ABVM_CONTRACTS_ADDRESS_H
