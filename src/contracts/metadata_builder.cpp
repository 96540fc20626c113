// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/metadata_builder.h>
#include <util.h>

#include <stdexcept>

namespace ABVM {

namespace {

uint8_t Tag(IoTypeMetadataKind kind)
{
    return static_cast<uint8_t>(kind);
}

uint8_t Tag(ContractMetadataKind kind)
{
    return static_cast<uint8_t>(kind);
}

void AppendName(std::vector<uint8_t>& out, const std::string& name)
{
    if (name.size() > UINT8_MAX) {
        throw std::invalid_argument(strprintf("Name \"%s\" is longer than 255 bytes", name));
    }
    out.push_back(static_cast<uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());
}

void AppendCount8(std::vector<uint8_t>& out, size_t count, const char* what)
{
    if (count > UINT8_MAX) {
        throw std::invalid_argument(strprintf("Too many %s: %u", what, count));
    }
    out.push_back(static_cast<uint8_t>(count));
}

void Append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

/** u8, LE u16 or LE u32 count selected by magnitude; returns width index 0..2 */
int AppendVariableCount(std::vector<uint8_t>& out, uint32_t count)
{
    if (count <= UINT8_MAX) {
        out.push_back(static_cast<uint8_t>(count));
        return 0;
    }
    if (count <= UINT16_MAX) {
        out.push_back(static_cast<uint8_t>(count));
        out.push_back(static_cast<uint8_t>(count >> 8));
        return 1;
    }
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(count >> (8 * i)));
    }
    return 2;
}

std::vector<uint8_t> Single(IoTypeMetadataKind kind)
{
    return std::vector<uint8_t>{Tag(kind)};
}

std::vector<uint8_t> FixedCapacity(IoTypeMetadataKind kind8b, IoTypeMetadataKind kind16b, uint16_t capacity)
{
    if (capacity <= UINT8_MAX) {
        return std::vector<uint8_t>{Tag(kind8b), static_cast<uint8_t>(capacity)};
    }
    return std::vector<uint8_t>{Tag(kind16b), static_cast<uint8_t>(capacity), static_cast<uint8_t>(capacity >> 8)};
}

void AppendFields(std::vector<uint8_t>& out, const std::vector<IoTypeMetadata::FieldMetadata>& fields)
{
    for (const auto& field : fields) {
        AppendName(out, field.first);
        Append(out, field.second);
    }
}

} // namespace

namespace IoTypeMetadata {

std::vector<uint8_t> Unit() { return Single(IoTypeMetadataKind::UNIT); }
std::vector<uint8_t> Bool() { return Single(IoTypeMetadataKind::BOOL); }
std::vector<uint8_t> U8() { return Single(IoTypeMetadataKind::U8); }
std::vector<uint8_t> U16() { return Single(IoTypeMetadataKind::U16); }
std::vector<uint8_t> U32() { return Single(IoTypeMetadataKind::U32); }
std::vector<uint8_t> U64() { return Single(IoTypeMetadataKind::U64); }
std::vector<uint8_t> U128() { return Single(IoTypeMetadataKind::U128); }
std::vector<uint8_t> I8() { return Single(IoTypeMetadataKind::I8); }
std::vector<uint8_t> I16() { return Single(IoTypeMetadataKind::I16); }
std::vector<uint8_t> I32() { return Single(IoTypeMetadataKind::I32); }
std::vector<uint8_t> I64() { return Single(IoTypeMetadataKind::I64); }
std::vector<uint8_t> I128() { return Single(IoTypeMetadataKind::I128); }
std::vector<uint8_t> Address() { return Single(IoTypeMetadataKind::ADDRESS); }
std::vector<uint8_t> Balance() { return Single(IoTypeMetadataKind::BALANCE); }

std::vector<uint8_t> FixedCapacityBytes(uint16_t capacity)
{
    return FixedCapacity(IoTypeMetadataKind::FIXED_CAPACITY_BYTES_8B, IoTypeMetadataKind::FIXED_CAPACITY_BYTES_16B, capacity);
}

std::vector<uint8_t> FixedCapacityString(uint16_t capacity)
{
    return FixedCapacity(IoTypeMetadataKind::FIXED_CAPACITY_STRING_8B, IoTypeMetadataKind::FIXED_CAPACITY_STRING_16B, capacity);
}

std::vector<uint8_t> Unaligned(const std::vector<uint8_t>& inner)
{
    std::vector<uint8_t> out = Single(IoTypeMetadataKind::UNALIGNED);
    Append(out, inner);
    return out;
}

std::vector<uint8_t> ByteArray(uint32_t size)
{
    for (size_t i = 0; i < sizeof(ARRAY_U8_SIZES) / sizeof(ARRAY_U8_SIZES[0]); ++i) {
        if (ARRAY_U8_SIZES[i] == size) {
            return std::vector<uint8_t>{static_cast<uint8_t>(Tag(IoTypeMetadataKind::ARRAY_U8X8) + i)};
        }
    }
    return Array(size, U8());
}

std::vector<uint8_t> Array(uint32_t numElements, const std::vector<uint8_t>& element)
{
    std::vector<uint8_t> out{0};
    int width = AppendVariableCount(out, numElements);
    out[0] = static_cast<uint8_t>(Tag(IoTypeMetadataKind::ARRAY_8B) + width);
    Append(out, element);
    return out;
}

std::vector<uint8_t> VariableBytes(uint32_t maxBytes)
{
    for (size_t i = 0; i < sizeof(VARIABLE_BYTES_SIZES) / sizeof(VARIABLE_BYTES_SIZES[0]); ++i) {
        if (VARIABLE_BYTES_SIZES[i] == maxBytes) {
            return std::vector<uint8_t>{static_cast<uint8_t>(Tag(IoTypeMetadataKind::VARIABLE_BYTES0) + i)};
        }
    }
    std::vector<uint8_t> out{0};
    int width = AppendVariableCount(out, maxBytes);
    out[0] = static_cast<uint8_t>(Tag(IoTypeMetadataKind::VARIABLE_BYTES_8B) + width);
    return out;
}

std::vector<uint8_t> VariableElements(uint32_t maxElements, const std::vector<uint8_t>& element)
{
    std::vector<uint8_t> out;
    if (maxElements == 0) {
        out.push_back(Tag(IoTypeMetadataKind::VARIABLE_ELEMENTS0));
    } else {
        out.push_back(0);
        int width = AppendVariableCount(out, maxElements);
        out[0] = static_cast<uint8_t>(Tag(IoTypeMetadataKind::VARIABLE_ELEMENTS_8B) + width);
    }
    Append(out, element);
    return out;
}

std::vector<uint8_t> Struct(const std::string& name, const std::vector<FieldMetadata>& fields)
{
    std::vector<uint8_t> out;
    if (fields.size() <= 10) {
        out.push_back(static_cast<uint8_t>(Tag(IoTypeMetadataKind::STRUCT0) + fields.size()));
        AppendName(out, name);
    } else {
        out.push_back(Tag(IoTypeMetadataKind::STRUCT));
        AppendName(out, name);
        AppendCount8(out, fields.size(), "struct fields");
    }
    AppendFields(out, fields);
    return out;
}

std::vector<uint8_t> TupleStruct(const std::string& name, const std::vector<std::vector<uint8_t>>& fields)
{
    std::vector<uint8_t> out;
    if (!fields.empty() && fields.size() <= 10) {
        out.push_back(static_cast<uint8_t>(Tag(IoTypeMetadataKind::TUPLE_STRUCT1) + fields.size() - 1));
        AppendName(out, name);
    } else {
        out.push_back(Tag(IoTypeMetadataKind::TUPLE_STRUCT));
        AppendName(out, name);
        AppendCount8(out, fields.size(), "tuple struct fields");
    }
    for (const auto& field : fields) {
        Append(out, field);
    }
    return out;
}

std::vector<uint8_t> Enum(const std::string& name, const std::vector<VariantMetadata>& variants)
{
    std::vector<uint8_t> out;
    if (!variants.empty() && variants.size() <= 10) {
        out.push_back(static_cast<uint8_t>(Tag(IoTypeMetadataKind::ENUM1) + variants.size() - 1));
        AppendName(out, name);
    } else {
        out.push_back(Tag(IoTypeMetadataKind::ENUM));
        AppendName(out, name);
        AppendCount8(out, variants.size(), "enum variants");
    }
    // Variants with fields always carry an explicit field count
    for (const VariantMetadata& variant : variants) {
        AppendName(out, variant.name);
        AppendCount8(out, variant.fields.size(), "variant fields");
        AppendFields(out, variant.fields);
    }
    return out;
}

std::vector<uint8_t> EnumNoFields(const std::string& name, const std::vector<std::string>& variants)
{
    std::vector<uint8_t> out;
    if (!variants.empty() && variants.size() <= 10) {
        out.push_back(static_cast<uint8_t>(Tag(IoTypeMetadataKind::ENUM_NO_FIELDS1) + variants.size() - 1));
        AppendName(out, name);
    } else {
        out.push_back(Tag(IoTypeMetadataKind::ENUM_NO_FIELDS));
        AppendName(out, name);
        AppendCount8(out, variants.size(), "enum variants");
    }
    for (const std::string& variant : variants) {
        AppendName(out, variant);
    }
    return out;
}

} // namespace IoTypeMetadata

MethodMetadataBuilder::MethodMetadataBuilder(MethodKind kind, const std::string& name)
    : methodKind(kind), methodName(name)
{
    if (methodName.size() > UINT8_MAX) {
        throw std::invalid_argument(strprintf("Method name \"%s\" is longer than 255 bytes", methodName));
    }
}

void MethodMetadataBuilder::AddArgument(ContractMetadataKind kind)
{
    if (numArguments == UINT8_MAX) {
        throw std::invalid_argument(strprintf("Method %s has too many arguments", methodName));
    }
    ++numArguments;
    arguments.push_back(Tag(kind));
}

void MethodMetadataBuilder::AddNamedArgument(ContractMetadataKind kind, const std::string& name)
{
    AddArgument(kind);
    AppendName(arguments, name);
}

MethodMetadataBuilder& MethodMetadataBuilder::EnvRo()
{
    AddArgument(ContractMetadataKind::ENV_RO);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::EnvRw()
{
    AddArgument(ContractMetadataKind::ENV_RW);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::TmpRo(const std::string& name)
{
    AddNamedArgument(ContractMetadataKind::TMP_RO, name);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::TmpRw(const std::string& name)
{
    AddNamedArgument(ContractMetadataKind::TMP_RW, name);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::SlotRo(const std::string& name)
{
    AddNamedArgument(ContractMetadataKind::SLOT_RO, name);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::SlotRw(const std::string& name)
{
    AddNamedArgument(ContractMetadataKind::SLOT_RW, name);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::Input(const std::string& name, const std::vector<uint8_t>& type)
{
    AddNamedArgument(ContractMetadataKind::INPUT, name);
    Append(arguments, type);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::Output(const std::string& name, const std::vector<uint8_t>& type)
{
    AddNamedArgument(ContractMetadataKind::OUTPUT, name);
    Append(arguments, type);
    return *this;
}

MethodMetadataBuilder& MethodMetadataBuilder::InitOutput(const std::string& name)
{
    AddNamedArgument(ContractMetadataKind::OUTPUT, name);
    return *this;
}

std::vector<uint8_t> MethodMetadataBuilder::Build() const
{
    std::vector<uint8_t> out;
    out.push_back(static_cast<uint8_t>(Tag(ContractMetadataKind::INIT) + static_cast<uint8_t>(methodKind)));
    AppendName(out, methodName);
    out.push_back(static_cast<uint8_t>(numArguments));
    Append(out, arguments);
    return out;
}

ContractMetadataBuilder::ContractMetadataBuilder(const std::vector<uint8_t>& stateType,
                                                 const std::vector<uint8_t>& slotType,
                                                 const std::vector<uint8_t>& tmpType)
{
    header.push_back(Tag(ContractMetadataKind::CONTRACT));
    Append(header, stateType);
    Append(header, slotType);
    Append(header, tmpType);
}

ContractMetadataBuilder& ContractMetadataBuilder::Method(const std::vector<uint8_t>& methodMetadata)
{
    if (numMethods == UINT8_MAX) {
        throw std::invalid_argument("Contract has too many methods");
    }
    ++numMethods;
    Append(methods, methodMetadata);
    return *this;
}

ContractMetadataBuilder& ContractMetadataBuilder::Trait(const std::vector<uint8_t>& traitMetadata)
{
    Append(traits, traitMetadata);
    return *this;
}

std::vector<uint8_t> ContractMetadataBuilder::Build() const
{
    std::vector<uint8_t> out = header;
    out.push_back(static_cast<uint8_t>(numMethods));
    Append(out, methods);
    Append(out, traits);
    return out;
}

TraitMetadataBuilder::TraitMetadataBuilder(const std::string& name)
    : traitName(name)
{
    if (traitName.size() > UINT8_MAX) {
        throw std::invalid_argument(strprintf("Trait name \"%s\" is longer than 255 bytes", traitName));
    }
}

TraitMetadataBuilder& TraitMetadataBuilder::Method(const std::vector<uint8_t>& methodMetadata)
{
    if (numMethods == UINT8_MAX) {
        throw std::invalid_argument(strprintf("Trait %s has too many methods", traitName));
    }
    ++numMethods;
    Append(methods, methodMetadata);
    return *this;
}

std::vector<uint8_t> TraitMetadataBuilder::Build() const
{
    std::vector<uint8_t> out;
    out.push_back(Tag(ContractMetadataKind::TRAIT));
    AppendName(out, traitName);
    out.push_back(static_cast<uint8_t>(numMethods));
    Append(out, methods);
    return out;
}

} // namespace ABVM
