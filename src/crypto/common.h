// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CRYPTO_COMMON_H
#define ABVM_CRYPTO_COMMON_H

#include <stdint.h>
#include <string.h>

uint16_t static inline ReadLE16(const unsigned char* ptr)
{
    return (uint16_t)ptr[0] | ((uint16_t)ptr[1] << 8);
}

uint32_t static inline ReadLE32(const unsigned char* ptr)
{
    return (uint32_t)ptr[0] | ((uint32_t)ptr[1] << 8) | ((uint32_t)ptr[2] << 16) | ((uint32_t)ptr[3] << 24);
}

uint64_t static inline ReadLE64(const unsigned char* ptr)
{
    return (uint64_t)ReadLE32(ptr) | ((uint64_t)ReadLE32(ptr + 4) << 32);
}

void static inline WriteLE16(unsigned char* ptr, uint16_t x)
{
    ptr[0] = x;
    ptr[1] = x >> 8;
}

void static inline WriteLE32(unsigned char* ptr, uint32_t x)
{
    WriteLE16(ptr, x);
    WriteLE16(ptr + 2, x >> 16);
}

void static inline WriteLE64(unsigned char* ptr, uint64_t x)
{
    WriteLE32(ptr, x);
    WriteLE32(ptr + 4, x >> 32);
}

uint32_t static inline ReadBE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0] << 24) | ((uint32_t)ptr[1] << 16) | ((uint32_t)ptr[2] << 8) | (uint32_t)ptr[3];
}

void static inline WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x >> 24;
    ptr[1] = x >> 16;
    ptr[2] = x >> 8;
    ptr[3] = x;
}

void static inline WriteBE64(unsigned char* ptr, uint64_t x)
{
    WriteBE32(ptr, x >> 32);
    WriteBE32(ptr + 4, x);
}

#endif // ABVM_CRYPTO_COMMON_H
