// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_METADATA_BUILDER_H
#define ABVM_CONTRACTS_METADATA_BUILDER_H

#include <contracts/metadata.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ABVM {

/**
 * Encoders for type metadata, producing exactly what DecodeIoTypeDetails()
 * and DecodeIoTypeName() consume. Names longer than 255 bytes and counts that
 * do not fit the encoding throw std::invalid_argument.
 */
namespace IoTypeMetadata {

using FieldMetadata = std::pair<std::string, std::vector<uint8_t>>;

struct VariantMetadata {
    std::string name;
    std::vector<FieldMetadata> fields;
};

std::vector<uint8_t> Unit();
std::vector<uint8_t> Bool();
std::vector<uint8_t> U8();
std::vector<uint8_t> U16();
std::vector<uint8_t> U32();
std::vector<uint8_t> U64();
std::vector<uint8_t> U128();
std::vector<uint8_t> I8();
std::vector<uint8_t> I16();
std::vector<uint8_t> I32();
std::vector<uint8_t> I64();
std::vector<uint8_t> I128();
std::vector<uint8_t> Address();
std::vector<uint8_t> Balance();

/** [u8; N], using a dedicated tag where one exists */
std::vector<uint8_t> ByteArray(uint32_t size);
/** [T; N] */
std::vector<uint8_t> Array(uint32_t numElements, const std::vector<uint8_t>& element);
/** Variable bytes up to maxBytes, using a dedicated tag where one exists */
std::vector<uint8_t> VariableBytes(uint32_t maxBytes);
/** Variable elements up to maxElements */
std::vector<uint8_t> VariableElements(uint32_t maxElements, const std::vector<uint8_t>& element);
/** Length-prefixed bytes with fixed capacity, u8 prefix when capacity fits */
std::vector<uint8_t> FixedCapacityBytes(uint16_t capacity);
std::vector<uint8_t> FixedCapacityString(uint16_t capacity);
std::vector<uint8_t> Unaligned(const std::vector<uint8_t>& inner);

std::vector<uint8_t> Struct(const std::string& name, const std::vector<FieldMetadata>& fields);
std::vector<uint8_t> TupleStruct(const std::string& name, const std::vector<std::vector<uint8_t>>& fields);
std::vector<uint8_t> Enum(const std::string& name, const std::vector<VariantMetadata>& variants);
std::vector<uint8_t> EnumNoFields(const std::string& name, const std::vector<std::string>& variants);

} // namespace IoTypeMetadata

/**
 * @brief Builder of one method's metadata
 *
 * Arguments are emitted in the order they are added. The builder does not
 * enforce which argument kinds a method kind accepts, so that malformed
 * metadata can be produced on purpose.
 */
class MethodMetadataBuilder {
public:
    MethodMetadataBuilder(MethodKind kind, const std::string& name);

    MethodMetadataBuilder& EnvRo();
    MethodMetadataBuilder& EnvRw();
    MethodMetadataBuilder& TmpRo(const std::string& name);
    MethodMetadataBuilder& TmpRw(const std::string& name);
    MethodMetadataBuilder& SlotRo(const std::string& name);
    MethodMetadataBuilder& SlotRw(const std::string& name);
    MethodMetadataBuilder& Input(const std::string& name, const std::vector<uint8_t>& type);
    MethodMetadataBuilder& Output(const std::string& name, const std::vector<uint8_t>& type);
    /** Last output of an init method: the new state, encoded without type */
    MethodMetadataBuilder& InitOutput(const std::string& name);

    std::vector<uint8_t> Build() const;

private:
    void AddArgument(ContractMetadataKind kind);
    void AddNamedArgument(ContractMetadataKind kind, const std::string& name);

    MethodKind methodKind;
    std::string methodName;
    uint32_t numArguments = 0;
    std::vector<uint8_t> arguments;
};

/**
 * @brief Builder of a contract's main metadata: the Contract item, its
 * methods and the traits it implements
 */
class ContractMetadataBuilder {
public:
    ContractMetadataBuilder(const std::vector<uint8_t>& stateType, const std::vector<uint8_t>& slotType,
                            const std::vector<uint8_t>& tmpType);

    ContractMetadataBuilder& Method(const std::vector<uint8_t>& methodMetadata);
    /** Append a complete trait item built with TraitMetadataBuilder */
    ContractMetadataBuilder& Trait(const std::vector<uint8_t>& traitMetadata);

    std::vector<uint8_t> Build() const;

private:
    std::vector<uint8_t> header;
    uint32_t numMethods = 0;
    std::vector<uint8_t> methods;
    std::vector<uint8_t> traits;
};

class TraitMetadataBuilder {
public:
    explicit TraitMetadataBuilder(const std::string& name);

    TraitMetadataBuilder& Method(const std::vector<uint8_t>& methodMetadata);

    std::vector<uint8_t> Build() const;

private:
    std::string traitName;
    uint32_t numMethods = 0;
    std::vector<uint8_t> methods;
};

} // namespace ABVM

#endif // ABVM_CONTRACTS_METADATA_BUILDER_H
