// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <executor/aligned_buffer.h>

#include <algorithm>
#include <cstring>

namespace ABVM {

static const AlignedBlock EMPTY_BLOCK = {};

OwnedAlignedBuffer OwnedAlignedBuffer::WithCapacity(uint32_t capacity)
{
    OwnedAlignedBuffer buffer;
    buffer.blocks.resize((size_t{capacity} + sizeof(AlignedBlock) - 1) / sizeof(AlignedBlock));
    buffer.capacity = capacity;
    return buffer;
}

OwnedAlignedBuffer OwnedAlignedBuffer::FromBytes(const uint8_t* data, uint32_t len)
{
    OwnedAlignedBuffer buffer = WithCapacity(len);
    buffer.CopyFrom(data, len);
    return buffer;
}

uint8_t* OwnedAlignedBuffer::Data()
{
    if (blocks.empty()) {
        // Nothing can be written with zero capacity, but the pointer must still be aligned
        return const_cast<uint8_t*>(EMPTY_BLOCK.bytes);
    }
    return blocks.front().bytes;
}

const uint8_t* OwnedAlignedBuffer::Data() const
{
    if (blocks.empty()) {
        return EMPTY_BLOCK.bytes;
    }
    return blocks.front().bytes;
}

void OwnedAlignedBuffer::EnsureCapacity(uint32_t newCapacity)
{
    if (newCapacity <= capacity) {
        return;
    }
    OwnedAlignedBuffer grown = WithCapacity(newCapacity);
    grown.CopyFrom(Data(), len);
    *this = std::move(grown);
}

void OwnedAlignedBuffer::CopyFrom(const uint8_t* data, uint32_t newLen)
{
    if (newLen > capacity) {
        *this = WithCapacity(newLen);
    }
    if (newLen > 0) {
        std::memmove(Data(), data, newLen);
    }
    len = newLen;
}

bool OwnedAlignedBuffer::SetLen(uint32_t newLen)
{
    if (newLen > capacity) {
        return false;
    }
    len = newLen;
    return true;
}

SharedAlignedBuffer OwnedAlignedBuffer::IntoShared() &&
{
    return SharedAlignedBuffer(std::make_shared<const OwnedAlignedBuffer>(std::move(*this)));
}

SharedAlignedBuffer SharedAlignedBuffer::FromBytes(const uint8_t* data, uint32_t len)
{
    return OwnedAlignedBuffer::FromBytes(data, len).IntoShared();
}

SharedAlignedBuffer SharedAlignedBuffer::FromBytes(const std::vector<uint8_t>& bytes)
{
    return FromBytes(bytes.data(), static_cast<uint32_t>(bytes.size()));
}

const uint8_t* SharedAlignedBuffer::Data() const
{
    return inner ? inner->Data() : EMPTY_BLOCK.bytes;
}

OwnedAlignedBuffer SharedAlignedBuffer::ToOwned(uint32_t minCapacity) const
{
    OwnedAlignedBuffer owned = OwnedAlignedBuffer::WithCapacity(std::max(minCapacity, Size()));
    owned.CopyFrom(Data(), Size());
    return owned;
}

} // namespace ABVM
