// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/address.h>
#include <crypto/common.h>
#include <util.h>

namespace ABVM {

std::optional<Address> Address::CheckedAdd(const Address& other) const
{
    Address result;
    result.low = low + other.low;
    uint64_t carry = result.low < low ? 1 : 0;
    result.high = high + other.high;
    if (result.high < high) {
        return std::nullopt;
    }
    if (carry) {
        if (result.high == UINT64_MAX) {
            return std::nullopt;
        }
        result.high += 1;
    }
    return result;
}

std::optional<Address> Address::CheckedSub(const Address& other) const
{
    if (*this < other) {
        return std::nullopt;
    }
    Address result;
    result.low = low - other.low;
    uint64_t borrow = low < other.low ? 1 : 0;
    result.high = high - other.high - borrow;
    return result;
}

void Address::Serialize(unsigned char out[SIZE]) const
{
    WriteLE64(out, low);
    WriteLE64(out + 8, high);
}

Address Address::Deserialize(const unsigned char in[SIZE])
{
    return Address(ReadLE64(in), ReadLE64(in + 8));
}

std::string Address::ToString() const
{
    if (high == 0) {
        return strprintf("0x%x", low);
    }
    return strprintf("0x%x%016x", high, low);
}

Address SystemAddressAllocator(ShardIndex shardIndex)
{
    // shard * 2^108: the index lands in the upper 20 bits of the high word
    return Address(0, uint64_t{shardIndex.Get()} << 44);
}

} // namespace ABVM
