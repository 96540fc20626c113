// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/iotype.h>
#include <crypto/common.h>
#include <util.h>

namespace ABVM {

const uint32_t ARRAY_U8_SIZES[10] = {8, 16, 32, 64, 128, 256, 512, 1024, 2028, 4096};
const uint32_t VARIABLE_BYTES_SIZES[13] = {
    0, 512, 1024, 2028, 4096, 8192, 16384, 32768, 65536, 131072, 262144, 524288, 1048576,
};

bool MetadataReader::PeekU8(uint8_t& out) const
{
    if (Empty()) {
        return false;
    }
    out = data[pos];
    return true;
}

bool MetadataReader::ReadU8(uint8_t& out)
{
    if (!PeekU8(out)) {
        return false;
    }
    ++pos;
    return true;
}

bool MetadataReader::ReadLE16(uint16_t& out)
{
    if (Remaining() < sizeof(uint16_t)) {
        return false;
    }
    out = ::ReadLE16(data + pos);
    pos += sizeof(uint16_t);
    return true;
}

bool MetadataReader::ReadLE32(uint32_t& out)
{
    if (Remaining() < sizeof(uint32_t)) {
        return false;
    }
    out = ::ReadLE32(data + pos);
    pos += sizeof(uint32_t);
    return true;
}

bool MetadataReader::Skip(size_t n)
{
    if (Remaining() < n) {
        return false;
    }
    pos += n;
    return true;
}

bool MetadataReader::ReadName(std::string_view& out)
{
    uint8_t length;
    if (!PeekU8(length) || Remaining() < size_t{1} + length) {
        return false;
    }
    out = std::string_view(reinterpret_cast<const char*>(data + pos + 1), length);
    pos += size_t{1} + length;
    return true;
}

bool IsIoTypeMetadataKind(uint8_t byte)
{
    return byte <= static_cast<uint8_t>(IoTypeMetadataKind::UNALIGNED) ||
           byte == static_cast<uint8_t>(IoTypeMetadataKind::ADDRESS) ||
           byte == static_cast<uint8_t>(IoTypeMetadataKind::BALANCE);
}

namespace {

bool CheckedMul(uint32_t a, uint32_t b, uint32_t& out)
{
    uint64_t result = uint64_t{a} * b;
    if (result > UINT32_MAX) {
        return false;
    }
    out = static_cast<uint32_t>(result);
    return true;
}

bool CheckedAdd(uint32_t a, uint32_t b, uint32_t& out)
{
    uint64_t result = uint64_t{a} + b;
    if (result > UINT32_MAX) {
        return false;
    }
    out = static_cast<uint32_t>(result);
    return true;
}

/**
 * Struct body: name, optional explicit field count, then fields. Tuple
 * structs carry no field names.
 */
std::optional<IoTypeDetails> StructTypeDetails(MetadataReader& reader, std::optional<uint8_t> fieldCount, bool tuple)
{
    std::string_view name;
    if (!reader.ReadName(name)) {
        return std::nullopt;
    }

    uint8_t remainingFields;
    if (fieldCount) {
        remainingFields = *fieldCount;
    } else if (!reader.ReadU8(remainingFields)) {
        return std::nullopt;
    }

    IoTypeDetails details{0, 1};
    while (remainingFields > 0) {
        if (!tuple) {
            std::string_view fieldName;
            if (!reader.ReadName(fieldName)) {
                return std::nullopt;
            }
        }

        std::optional<IoTypeDetails> field = DecodeIoTypeDetails(reader);
        if (!field) {
            return std::nullopt;
        }
        if (!CheckedAdd(details.recommendedCapacity, field->recommendedCapacity, details.recommendedCapacity)) {
            return std::nullopt;
        }
        if (field->alignment > details.alignment) {
            details.alignment = field->alignment;
        }

        --remainingFields;
    }

    return details;
}

/**
 * Enum body: name, optional explicit variant count, then variants encoded as
 * structs. Every variant plus its one-byte discriminant must have the same size.
 */
std::optional<IoTypeDetails> EnumTypeDetails(MetadataReader& reader, std::optional<uint8_t> variantCount, bool hasFields)
{
    std::string_view name;
    if (!reader.ReadName(name)) {
        return std::nullopt;
    }

    uint8_t remainingVariants;
    if (variantCount) {
        remainingVariants = *variantCount;
    } else if (!reader.ReadU8(remainingVariants)) {
        return std::nullopt;
    }

    std::optional<uint32_t> enumCapacity;
    uint8_t alignment = 1;
    while (remainingVariants > 0) {
        std::optional<IoTypeDetails> variant = StructTypeDetails(
            reader, hasFields ? std::nullopt : std::optional<uint8_t>(0), false);
        if (!variant) {
            return std::nullopt;
        }

        uint32_t variantCapacity;
        if (!CheckedAdd(variant->recommendedCapacity, 1, variantCapacity)) {
            return std::nullopt;
        }
        if (variant->alignment > alignment) {
            alignment = variant->alignment;
        }

        if (enumCapacity && *enumCapacity != variantCapacity) {
            return std::nullopt;
        }
        enumCapacity = variantCapacity;

        --remainingVariants;
    }

    return IoTypeDetails{enumCapacity.value_or(0), alignment};
}

std::optional<IoTypeDetails> ArrayTypeDetails(MetadataReader& reader, uint32_t numElements)
{
    std::optional<IoTypeDetails> element = DecodeIoTypeDetails(reader);
    if (!element) {
        return std::nullopt;
    }
    uint32_t capacity;
    if (!CheckedMul(element->recommendedCapacity, numElements, capacity)) {
        return std::nullopt;
    }
    return IoTypeDetails{capacity, element->alignment};
}

/** Reads a u8, LE u16 or LE u32 count depending on width */
bool ReadCount(MetadataReader& reader, int width, uint32_t& count)
{
    if (width == 1) {
        uint8_t value;
        if (!reader.ReadU8(value)) return false;
        count = value;
        return true;
    }
    if (width == 2) {
        uint16_t value;
        if (!reader.ReadLE16(value)) return false;
        count = value;
        return true;
    }
    return reader.ReadLE32(count);
}

} // namespace

std::optional<IoTypeDetails> DecodeIoTypeDetails(MetadataReader& reader)
{
    uint8_t byte;
    if (!reader.ReadU8(byte) || !IsIoTypeMetadataKind(byte)) {
        return std::nullopt;
    }
    const IoTypeMetadataKind kind = static_cast<IoTypeMetadataKind>(byte);

    switch (kind) {
        case IoTypeMetadataKind::UNIT:
            return IoTypeDetails{0, 1};
        case IoTypeMetadataKind::BOOL:
        case IoTypeMetadataKind::U8:
        case IoTypeMetadataKind::I8:
            return IoTypeDetails{1, 1};
        case IoTypeMetadataKind::U16:
        case IoTypeMetadataKind::I16:
            return IoTypeDetails{2, 2};
        case IoTypeMetadataKind::U32:
        case IoTypeMetadataKind::I32:
            return IoTypeDetails{4, 4};
        case IoTypeMetadataKind::U64:
        case IoTypeMetadataKind::I64:
            return IoTypeDetails{8, 8};
        case IoTypeMetadataKind::U128:
        case IoTypeMetadataKind::I128:
            return IoTypeDetails{16, 16};
        case IoTypeMetadataKind::STRUCT:
            return StructTypeDetails(reader, std::nullopt, false);
        case IoTypeMetadataKind::TUPLE_STRUCT:
            return StructTypeDetails(reader, std::nullopt, true);
        case IoTypeMetadataKind::ENUM:
            return EnumTypeDetails(reader, std::nullopt, true);
        case IoTypeMetadataKind::ENUM_NO_FIELDS:
            return EnumTypeDetails(reader, std::nullopt, false);
        case IoTypeMetadataKind::ARRAY_8B:
        case IoTypeMetadataKind::ARRAY_16B:
        case IoTypeMetadataKind::ARRAY_32B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_8B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_16B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_32B: {
            const bool array = byte <= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_32B);
            const uint8_t first = static_cast<uint8_t>(array ? IoTypeMetadataKind::ARRAY_8B : IoTypeMetadataKind::VARIABLE_ELEMENTS_8B);
            uint32_t numElements;
            if (!ReadCount(reader, 1 << (byte - first), numElements)) {
                return std::nullopt;
            }
            return ArrayTypeDetails(reader, numElements);
        }
        case IoTypeMetadataKind::VARIABLE_BYTES_8B:
        case IoTypeMetadataKind::VARIABLE_BYTES_16B:
        case IoTypeMetadataKind::VARIABLE_BYTES_32B: {
            const int width = 1 << (byte - static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES_8B));
            uint32_t numBytes;
            if (!ReadCount(reader, width, numBytes)) {
                return std::nullopt;
            }
            return IoTypeDetails::Bytes(numBytes);
        }
        case IoTypeMetadataKind::VARIABLE_ELEMENTS0: {
            if (!DecodeIoTypeDetails(reader)) {
                return std::nullopt;
            }
            return IoTypeDetails{0, 1};
        }
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_8B:
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_8B: {
            uint8_t capacity;
            if (!reader.ReadU8(capacity)) {
                return std::nullopt;
            }
            return IoTypeDetails::Bytes(uint32_t{capacity} + 1);
        }
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_16B:
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_16B: {
            uint16_t capacity;
            if (!reader.ReadLE16(capacity)) {
                return std::nullopt;
            }
            // u16 length followed by the bytes, padded to the length's alignment
            const uint32_t size = uint32_t{capacity} + 2;
            return IoTypeDetails{(size + 1) & ~uint32_t{1}, 2};
        }
        case IoTypeMetadataKind::UNALIGNED: {
            std::optional<IoTypeDetails> inner = DecodeIoTypeDetails(reader);
            if (!inner) {
                return std::nullopt;
            }
            return IoTypeDetails::Bytes(inner->recommendedCapacity);
        }
        case IoTypeMetadataKind::ADDRESS:
        case IoTypeMetadataKind::BALANCE:
            return IoTypeDetails{16, 8};
        default:
            break;
    }

    // Ranges of numbered kinds
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::STRUCT0) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::STRUCT10)) {
        return StructTypeDetails(reader, byte - static_cast<uint8_t>(IoTypeMetadataKind::STRUCT0), false);
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::TUPLE_STRUCT1) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::TUPLE_STRUCT10)) {
        return StructTypeDetails(reader, byte - static_cast<uint8_t>(IoTypeMetadataKind::TUPLE_STRUCT1) + 1, true);
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::ENUM1) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ENUM10)) {
        return EnumTypeDetails(reader, byte - static_cast<uint8_t>(IoTypeMetadataKind::ENUM1) + 1, true);
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::ENUM_NO_FIELDS1) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ENUM_NO_FIELDS10)) {
        return EnumTypeDetails(reader, byte - static_cast<uint8_t>(IoTypeMetadataKind::ENUM_NO_FIELDS1) + 1, false);
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X8) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X4096)) {
        return IoTypeDetails::Bytes(ARRAY_U8_SIZES[byte - static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X8)]);
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES0) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES1048576)) {
        return IoTypeDetails::Bytes(VARIABLE_BYTES_SIZES[byte - static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES0)]);
    }

    return std::nullopt;
}

std::optional<IoTypeDetails> DecodeIoTypeDetails(const std::vector<uint8_t>& metadata)
{
    MetadataReader reader(metadata);
    return DecodeIoTypeDetails(reader);
}

std::optional<std::string> DecodeIoTypeName(const MetadataReader& source)
{
    MetadataReader reader = source;

    uint8_t byte;
    if (!reader.ReadU8(byte) || !IsIoTypeMetadataKind(byte)) {
        return std::nullopt;
    }

    static const char* const PRIMITIVE_NAMES[] = {
        "()", "bool", "u8", "u16", "u32", "u64", "u128", "i8", "i16", "i32", "i64", "i128",
    };
    if (byte <= static_cast<uint8_t>(IoTypeMetadataKind::I128)) {
        return std::string(PRIMITIVE_NAMES[byte]);
    }

    // Structs and enums of every flavor start with their name
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::STRUCT) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ENUM_NO_FIELDS10)) {
        std::string_view name;
        if (!reader.ReadName(name)) {
            return std::nullopt;
        }
        return std::string(name);
    }

    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_8B) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_32B)) {
        uint32_t numElements;
        if (!ReadCount(reader, 1 << (byte - static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_8B)), numElements)) {
            return std::nullopt;
        }
        std::optional<std::string> element = DecodeIoTypeName(reader);
        if (!element) {
            return std::nullopt;
        }
        return strprintf("[%s; %u]", *element, numElements);
    }

    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X8) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X4096)) {
        return strprintf("[u8; %u]", ARRAY_U8_SIZES[byte - static_cast<uint8_t>(IoTypeMetadataKind::ARRAY_U8X8)]);
    }

    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES_8B) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_BYTES1048576)) {
        return std::string("VariableBytes");
    }
    if (byte >= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_ELEMENTS_8B) && byte <= static_cast<uint8_t>(IoTypeMetadataKind::VARIABLE_ELEMENTS0)) {
        return std::string("VariableElements");
    }
    switch (static_cast<IoTypeMetadataKind>(byte)) {
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_8B:
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_16B:
            return std::string("FixedCapacityBytes");
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_8B:
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_16B:
            return std::string("FixedCapacityString");
        case IoTypeMetadataKind::UNALIGNED:
            return std::string("Unaligned");
        case IoTypeMetadataKind::ADDRESS:
            return std::string("Address");
        default:
            return std::string("Balance");
    }
}

namespace {

bool CopyBytes(MetadataReader& reader, std::vector<uint8_t>& out, size_t n)
{
    if (reader.Remaining() < n) {
        return false;
    }
    out.insert(out.end(), reader.Current(), reader.Current() + n);
    return reader.Skip(n);
}

/** Replaces the name with an empty one */
bool DropName(MetadataReader& reader, std::vector<uint8_t>& out)
{
    std::string_view name;
    if (!reader.ReadName(name)) {
        return false;
    }
    out.push_back(0);
    return true;
}

bool CompactStruct(MetadataReader& reader, std::vector<uint8_t>& out, std::optional<uint8_t> fieldCount, bool tuple)
{
    if (!DropName(reader, out)) {
        return false;
    }

    uint8_t remainingFields;
    if (fieldCount) {
        remainingFields = *fieldCount;
    } else {
        if (!reader.ReadU8(remainingFields)) {
            return false;
        }
        out.push_back(remainingFields);
    }

    for (; remainingFields > 0; --remainingFields) {
        if (!tuple) {
            std::string_view fieldName;
            if (!reader.ReadName(fieldName)) {
                return false;
            }
        }
        if (!CompactIoTypeMetadata(reader, out)) {
            return false;
        }
    }
    return true;
}

bool CompactEnum(MetadataReader& reader, std::vector<uint8_t>& out, std::optional<uint8_t> variantCount, bool hasFields)
{
    if (!DropName(reader, out)) {
        return false;
    }

    uint8_t remainingVariants;
    if (variantCount) {
        remainingVariants = *variantCount;
    } else {
        if (!reader.ReadU8(remainingVariants)) {
            return false;
        }
        out.push_back(remainingVariants);
    }

    for (; remainingVariants > 0; --remainingVariants) {
        if (!CompactStruct(reader, out, hasFields ? std::nullopt : std::optional<uint8_t>(0), false)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool CompactIoTypeMetadata(MetadataReader& reader, std::vector<uint8_t>& out)
{
    uint8_t byte;
    if (!reader.ReadU8(byte) || !IsIoTypeMetadataKind(byte)) {
        return false;
    }
    const IoTypeMetadataKind kind = static_cast<IoTypeMetadataKind>(byte);
    const auto tag = [](IoTypeMetadataKind k) { return static_cast<uint8_t>(k); };

    if (byte <= tag(IoTypeMetadataKind::I128)) {
        out.push_back(byte);
        return true;
    }

    switch (kind) {
        case IoTypeMetadataKind::STRUCT:
            out.push_back(byte);
            return CompactStruct(reader, out, std::nullopt, false);
        case IoTypeMetadataKind::STRUCT0:
            out.push_back(byte);
            return CompactStruct(reader, out, 0, false);
        case IoTypeMetadataKind::TUPLE_STRUCT:
            out.push_back(byte);
            return CompactStruct(reader, out, std::nullopt, true);
        case IoTypeMetadataKind::ENUM:
            out.push_back(byte);
            return CompactEnum(reader, out, std::nullopt, true);
        case IoTypeMetadataKind::ENUM_NO_FIELDS:
            out.push_back(byte);
            return CompactEnum(reader, out, std::nullopt, false);
        case IoTypeMetadataKind::ARRAY_8B:
        case IoTypeMetadataKind::ARRAY_16B:
        case IoTypeMetadataKind::ARRAY_32B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_8B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_16B:
        case IoTypeMetadataKind::VARIABLE_ELEMENTS_32B: {
            const bool array = byte <= tag(IoTypeMetadataKind::ARRAY_32B);
            const uint8_t first = tag(array ? IoTypeMetadataKind::ARRAY_8B : IoTypeMetadataKind::VARIABLE_ELEMENTS_8B);
            out.push_back(byte);
            return CopyBytes(reader, out, size_t{1} << (byte - first)) && CompactIoTypeMetadata(reader, out);
        }
        case IoTypeMetadataKind::VARIABLE_BYTES_8B:
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_8B:
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_8B:
            out.push_back(byte);
            return CopyBytes(reader, out, 1);
        case IoTypeMetadataKind::VARIABLE_BYTES_16B:
        case IoTypeMetadataKind::FIXED_CAPACITY_BYTES_16B:
        case IoTypeMetadataKind::FIXED_CAPACITY_STRING_16B:
            out.push_back(byte);
            return CopyBytes(reader, out, 2);
        case IoTypeMetadataKind::VARIABLE_BYTES_32B:
            out.push_back(byte);
            return CopyBytes(reader, out, 4);
        case IoTypeMetadataKind::VARIABLE_ELEMENTS0:
        case IoTypeMetadataKind::UNALIGNED:
            out.push_back(byte);
            return CompactIoTypeMetadata(reader, out);
        default:
            break;
    }

    if (byte > tag(IoTypeMetadataKind::STRUCT0) && byte <= tag(IoTypeMetadataKind::STRUCT10)) {
        const uint8_t numFields = byte - tag(IoTypeMetadataKind::STRUCT0);
        // Field names are dropped, so the struct becomes a tuple struct
        out.push_back(static_cast<uint8_t>(tag(IoTypeMetadataKind::TUPLE_STRUCT1) + numFields - 1));
        return CompactStruct(reader, out, numFields, false);
    }
    if (byte >= tag(IoTypeMetadataKind::TUPLE_STRUCT1) && byte <= tag(IoTypeMetadataKind::TUPLE_STRUCT10)) {
        out.push_back(byte);
        return CompactStruct(reader, out, byte - tag(IoTypeMetadataKind::TUPLE_STRUCT1) + 1, true);
    }
    if (byte >= tag(IoTypeMetadataKind::ENUM1) && byte <= tag(IoTypeMetadataKind::ENUM10)) {
        out.push_back(byte);
        return CompactEnum(reader, out, byte - tag(IoTypeMetadataKind::ENUM1) + 1, true);
    }
    if (byte >= tag(IoTypeMetadataKind::ENUM_NO_FIELDS1) && byte <= tag(IoTypeMetadataKind::ENUM_NO_FIELDS10)) {
        out.push_back(byte);
        return CompactEnum(reader, out, byte - tag(IoTypeMetadataKind::ENUM_NO_FIELDS1) + 1, false);
    }

    // ArrayU8xN, VariableBytesN, Address and Balance carry nothing but the tag
    out.push_back(byte);
    return true;
}

} // namespace ABVM
