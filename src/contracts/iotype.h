// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_IOTYPE_H
#define ABVM_CONTRACTS_IOTYPE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ABVM {

/**
 * @brief Bounds-checked cursor over a metadata byte stream
 *
 * Decoders for nested items share one reader by reference, so advancing a
 * child decoder advances its parent too. Every read either succeeds or leaves
 * the position unchanged and returns false; nothing is ever read past the end.
 */
class MetadataReader {
public:
    MetadataReader(const uint8_t* dataIn, size_t sizeIn) : data(dataIn), size(sizeIn) {}
    explicit MetadataReader(const std::vector<uint8_t>& bytes) : data(bytes.data()), size(bytes.size()) {}

    size_t Remaining() const { return size - pos; }
    bool Empty() const { return pos == size; }
    size_t Position() const { return pos; }
    void Rewind(size_t position) { if (position <= size) pos = position; }
    const uint8_t* Current() const { return data + pos; }

    bool PeekU8(uint8_t& out) const;
    bool ReadU8(uint8_t& out);
    bool ReadLE16(uint16_t& out);
    bool ReadLE32(uint32_t& out);
    bool Skip(size_t n);
    /** u8 length followed by that many bytes */
    bool ReadName(std::string_view& out);

private:
    const uint8_t* data;
    size_t size;
    size_t pos = 0;
};

/**
 * Tags of the recursive type metadata grammar.
 */
enum class IoTypeMetadataKind : uint8_t {
    UNIT = 0,
    BOOL,
    U8,
    U16,
    U32,
    U64,
    U128,
    I8,
    I16,
    I32,
    I64,
    I128,
    /** Struct with explicit field count */
    STRUCT = 12,
    /** STRUCT0 + n is a struct with n named fields, n <= 10 */
    STRUCT0 = 13,
    STRUCT10 = 23,
    /** Tuple struct with explicit field count */
    TUPLE_STRUCT = 24,
    /** TUPLE_STRUCT1 + (n - 1) is a tuple struct with n fields, 1 <= n <= 10 */
    TUPLE_STRUCT1 = 25,
    TUPLE_STRUCT10 = 34,
    ENUM = 35,
    ENUM1 = 36,
    ENUM10 = 45,
    ENUM_NO_FIELDS = 46,
    ENUM_NO_FIELDS1 = 47,
    ENUM_NO_FIELDS10 = 56,
    ARRAY_8B = 57,
    ARRAY_16B,
    ARRAY_32B,
    ARRAY_U8X8 = 60,
    ARRAY_U8X16,
    ARRAY_U8X32,
    ARRAY_U8X64,
    ARRAY_U8X128,
    ARRAY_U8X256,
    ARRAY_U8X512,
    ARRAY_U8X1024,
    ARRAY_U8X2028,
    ARRAY_U8X4096,
    VARIABLE_BYTES_8B = 70,
    VARIABLE_BYTES_16B,
    VARIABLE_BYTES_32B,
    VARIABLE_BYTES0 = 73,
    VARIABLE_BYTES512,
    VARIABLE_BYTES1024,
    VARIABLE_BYTES2028,
    VARIABLE_BYTES4096,
    VARIABLE_BYTES8192,
    VARIABLE_BYTES16384,
    VARIABLE_BYTES32768,
    VARIABLE_BYTES65536,
    VARIABLE_BYTES131072,
    VARIABLE_BYTES262144,
    VARIABLE_BYTES524288,
    VARIABLE_BYTES1048576 = 85,
    VARIABLE_ELEMENTS_8B = 86,
    VARIABLE_ELEMENTS_16B,
    VARIABLE_ELEMENTS_32B,
    VARIABLE_ELEMENTS0 = 89,
    /** u8 length prefix followed by up to N bytes, N encoded as one byte */
    FIXED_CAPACITY_BYTES_8B = 90,
    /** LE u16 length prefix followed by up to N bytes, N encoded as LE u16 */
    FIXED_CAPACITY_BYTES_16B,
    FIXED_CAPACITY_STRING_8B,
    FIXED_CAPACITY_STRING_16B,
    /** Wrapper dropping the alignment of the contained type */
    UNALIGNED = 94,
    /** u128 with 8 byte alignment */
    ADDRESS = 128,
    BALANCE = 129,
};

/** Whether the byte is one of the tags above */
bool IsIoTypeMetadataKind(uint8_t byte);

/** Byte sizes of the fixed-size ArrayU8xN kinds, in tag order */
extern const uint32_t ARRAY_U8_SIZES[10];
/** Byte sizes of the fixed-size VariableBytesN kinds, in tag order starting at VARIABLE_BYTES0 */
extern const uint32_t VARIABLE_BYTES_SIZES[13];

/**
 * @brief Buffer requirements derived from type metadata
 */
struct IoTypeDetails {
    /** Recommended capacity in bytes for a buffer holding the type */
    uint32_t recommendedCapacity = 0;
    /** Alignment in bytes, never zero */
    uint8_t alignment = 1;

    static IoTypeDetails Bytes(uint32_t size) { return IoTypeDetails{size, 1}; }

    bool operator==(const IoTypeDetails& other) const {
        return recommendedCapacity == other.recommendedCapacity && alignment == other.alignment;
    }
};

/**
 * Decode type details of one type, advancing the reader past its metadata.
 * Returns nothing on malformed metadata or when the capacity overflows u32;
 * the reader position is then unspecified.
 */
std::optional<IoTypeDetails> DecodeIoTypeDetails(MetadataReader& reader);

/** Convenience wrapper for a whole buffer holding exactly one type */
std::optional<IoTypeDetails> DecodeIoTypeDetails(const std::vector<uint8_t>& metadata);

/**
 * Human-readable type name, e.g. "u8", "[u8; 32]" or the name embedded in a
 * struct or enum. Does not advance the reader.
 */
std::optional<std::string> DecodeIoTypeName(const MetadataReader& reader);

/**
 * Append the compact form of one type to out, advancing the reader past it.
 * Compact metadata keeps the shape of the type but drops struct, enum and
 * variant names and field names; structs with an implied field count become
 * tuple structs. Returns false on malformed metadata.
 */
bool CompactIoTypeMetadata(MetadataReader& reader, std::vector<uint8_t>& out);

} // namespace ABVM

#endif // ABVM_CONTRACTS_IOTYPE_H
