// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/metadata.h>
#include <util.h>

namespace ABVM {

std::optional<ContractMetadataKind> ContractMetadataKindFromByte(uint8_t byte)
{
    if (byte > static_cast<uint8_t>(ContractMetadataKind::OUTPUT)) {
        return std::nullopt;
    }
    return static_cast<ContractMetadataKind>(byte);
}

std::string ContractMetadataKindToString(ContractMetadataKind kind)
{
    switch (kind) {
        case ContractMetadataKind::CONTRACT: return "Contract";
        case ContractMetadataKind::TRAIT: return "Trait";
        case ContractMetadataKind::INIT: return "Init";
        case ContractMetadataKind::UPDATE_STATELESS: return "UpdateStateless";
        case ContractMetadataKind::UPDATE_STATEFUL_RO: return "UpdateStatefulRo";
        case ContractMetadataKind::UPDATE_STATEFUL_RW: return "UpdateStatefulRw";
        case ContractMetadataKind::VIEW_STATELESS: return "ViewStateless";
        case ContractMetadataKind::VIEW_STATEFUL: return "ViewStateful";
        case ContractMetadataKind::ENV_RO: return "EnvRo";
        case ContractMetadataKind::ENV_RW: return "EnvRw";
        case ContractMetadataKind::TMP_RO: return "TmpRo";
        case ContractMetadataKind::TMP_RW: return "TmpRw";
        case ContractMetadataKind::SLOT_RO: return "SlotRo";
        case ContractMetadataKind::SLOT_RW: return "SlotRw";
        case ContractMetadataKind::INPUT: return "Input";
        case ContractMetadataKind::OUTPUT: return "Output";
    }
    return "Unknown";
}

std::string MethodKindToString(MethodKind kind)
{
    switch (kind) {
        case MethodKind::INIT: return "Init";
        case MethodKind::UPDATE_STATELESS: return "UpdateStateless";
        case MethodKind::UPDATE_STATEFUL_RO: return "UpdateStatefulRo";
        case MethodKind::UPDATE_STATEFUL_RW: return "UpdateStatefulRw";
        case MethodKind::VIEW_STATELESS: return "ViewStateless";
        case MethodKind::VIEW_STATEFUL: return "ViewStateful";
    }
    return "Unknown";
}

bool MethodKindHasSelf(MethodKind kind)
{
    switch (kind) {
        case MethodKind::UPDATE_STATEFUL_RO:
        case MethodKind::UPDATE_STATEFUL_RW:
        case MethodKind::VIEW_STATEFUL:
            return true;
        case MethodKind::INIT:
        case MethodKind::UPDATE_STATELESS:
        case MethodKind::VIEW_STATELESS:
            return false;
    }
    return false;
}

bool MethodKindIsUpdate(MethodKind kind)
{
    return kind != MethodKind::VIEW_STATELESS && kind != MethodKind::VIEW_STATEFUL;
}

std::string ArgumentKindToString(ArgumentKind kind)
{
    switch (kind) {
        case ArgumentKind::ENV_RO: return "EnvRo";
        case ArgumentKind::ENV_RW: return "EnvRw";
        case ArgumentKind::TMP_RO: return "TmpRo";
        case ArgumentKind::TMP_RW: return "TmpRw";
        case ArgumentKind::SLOT_RO: return "SlotRo";
        case ArgumentKind::SLOT_RW: return "SlotRw";
        case ArgumentKind::INPUT: return "Input";
        case ArgumentKind::OUTPUT: return "Output";
    }
    return "Unknown";
}

std::string MethodsContainerKindToString(MethodsContainerKind kind)
{
    switch (kind) {
        case MethodsContainerKind::CONTRACT: return "Contract";
        case MethodsContainerKind::TRAIT: return "Trait";
        case MethodsContainerKind::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

MetadataDecodingError MetadataDecodingError::NotEnoughMetadata()
{
    return MetadataDecodingError();
}

MetadataDecodingError MetadataDecodingError::InvalidFirstMetadataByte(uint8_t byte)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::INVALID_FIRST_METADATA_BYTE;
    error.byte = byte;
    return error;
}

MetadataDecodingError MetadataDecodingError::MultipleContractsFound()
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::MULTIPLE_CONTRACTS_FOUND;
    return error;
}

MetadataDecodingError MetadataDecodingError::ExpectedContractOrTrait(ContractMetadataKind metadataKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::EXPECTED_CONTRACT_OR_TRAIT;
    error.metadataKind = metadataKind;
    return error;
}

MetadataDecodingError MetadataDecodingError::FailedToDecodeStateTypeName()
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::FAILED_TO_DECODE_STATE_TYPE_NAME;
    return error;
}

MetadataDecodingError MetadataDecodingError::InvalidStateIoType()
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::INVALID_STATE_IO_TYPE;
    return error;
}

MetadataDecodingError MetadataDecodingError::UnexpectedMethodKind(MethodKind methodKind, MethodsContainerKind containerKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::UNEXPECTED_METHOD_KIND;
    error.methodKind = methodKind;
    error.containerKind = containerKind;
    return error;
}

MetadataDecodingError MetadataDecodingError::ExpectedMethodKind(ContractMetadataKind metadataKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::EXPECTED_METHOD_KIND;
    error.metadataKind = metadataKind;
    return error;
}

MetadataDecodingError MetadataDecodingError::ExpectedArgumentKind(ContractMetadataKind metadataKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::EXPECTED_ARGUMENT_KIND;
    error.metadataKind = metadataKind;
    return error;
}

MetadataDecodingError MetadataDecodingError::UnexpectedArgumentKind(ArgumentKind argumentKind, MethodKind methodKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::UNEXPECTED_ARGUMENT_KIND;
    error.argumentKind = argumentKind;
    error.methodKind = methodKind;
    return error;
}

MetadataDecodingError MetadataDecodingError::InvalidArgumentIoType(std::string_view argumentName, ArgumentKind argumentKind)
{
    MetadataDecodingError error;
    error.kind = MetadataDecodingErrorKind::INVALID_ARGUMENT_IO_TYPE;
    error.argumentName = std::string(argumentName);
    error.argumentKind = argumentKind;
    return error;
}

std::string MetadataDecodingError::ToString() const
{
    switch (kind) {
        case MetadataDecodingErrorKind::NOT_ENOUGH_METADATA:
            return "Not enough metadata to decode";
        case MetadataDecodingErrorKind::INVALID_FIRST_METADATA_BYTE:
            return strprintf("Invalid first metadata byte %u", byte);
        case MetadataDecodingErrorKind::MULTIPLE_CONTRACTS_FOUND:
            return "Multiple contracts found";
        case MetadataDecodingErrorKind::EXPECTED_CONTRACT_OR_TRAIT:
            return strprintf("Expected contract or trait kind, found something else: %s", ContractMetadataKindToString(metadataKind));
        case MetadataDecodingErrorKind::FAILED_TO_DECODE_STATE_TYPE_NAME:
            return "Failed to decode state type name";
        case MetadataDecodingErrorKind::INVALID_STATE_IO_TYPE:
            return "Invalid state I/O type";
        case MetadataDecodingErrorKind::UNEXPECTED_METHOD_KIND:
            return strprintf("Unexpected method kind %s for container kind %s",
                MethodKindToString(methodKind), MethodsContainerKindToString(containerKind));
        case MetadataDecodingErrorKind::EXPECTED_METHOD_KIND:
            return strprintf("Expected method kind, found something else: %s", ContractMetadataKindToString(metadataKind));
        case MetadataDecodingErrorKind::EXPECTED_ARGUMENT_KIND:
            return strprintf("Expected argument kind, found something else: %s", ContractMetadataKindToString(metadataKind));
        case MetadataDecodingErrorKind::UNEXPECTED_ARGUMENT_KIND:
            return strprintf("Unexpected argument kind %s for method kind %s",
                ArgumentKindToString(argumentKind), MethodKindToString(methodKind));
        case MetadataDecodingErrorKind::INVALID_ARGUMENT_IO_TYPE:
            return strprintf("Invalid argument I/O type of kind %s for \"%s\"",
                ArgumentKindToString(argumentKind), argumentName);
    }
    return "Unknown metadata decoding error";
}

MetadataDecodeResult<MetadataItem> MetadataDecoder::DecodeNext()
{
    uint8_t byte;
    if (!reader.ReadU8(byte)) {
        return MetadataDecodeResult<MetadataItem>::End();
    }

    std::optional<ContractMetadataKind> metadataKind = ContractMetadataKindFromByte(byte);
    if (!metadataKind) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::InvalidFirstMetadataByte(byte));
    }

    switch (*metadataKind) {
        case ContractMetadataKind::CONTRACT:
            if (foundContract) {
                return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::MultipleContractsFound());
            }
            foundContract = true;
            return DecodeContract();
        case ContractMetadataKind::TRAIT:
            return DecodeTrait();
        default:
            // Methods and arguments can't appear at the top level
            return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::ExpectedContractOrTrait(*metadataKind));
    }
}

MetadataDecodeResult<MetadataItem> MetadataDecoder::DecodeContract()
{
    std::optional<std::string> stateTypeName = DecodeIoTypeName(reader);
    if (!stateTypeName) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::FailedToDecodeStateTypeName());
    }

    std::optional<IoTypeDetails> stateTypeDetails = DecodeIoTypeDetails(reader);
    if (!stateTypeDetails) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::InvalidStateIoType());
    }
    std::optional<IoTypeDetails> slotTypeDetails = DecodeIoTypeDetails(reader);
    if (!slotTypeDetails) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::InvalidStateIoType());
    }
    std::optional<IoTypeDetails> tmpTypeDetails = DecodeIoTypeDetails(reader);
    if (!tmpTypeDetails) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::InvalidStateIoType());
    }

    uint8_t numMethods;
    if (!reader.ReadU8(numMethods)) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    MetadataItem item(ContractMetadataKind::CONTRACT,
        MethodsMetadataDecoder(reader, MethodsContainerKind::CONTRACT, numMethods));
    item.stateTypeName = std::move(*stateTypeName);
    item.stateTypeDetails = *stateTypeDetails;
    item.slotTypeDetails = *slotTypeDetails;
    item.tmpTypeDetails = *tmpTypeDetails;
    item.numMethods = numMethods;
    return MetadataDecodeResult<MetadataItem>::Item(std::move(item));
}

MetadataDecodeResult<MetadataItem> MetadataDecoder::DecodeTrait()
{
    std::string_view traitName;
    uint8_t numMethods;
    if (!reader.ReadName(traitName) || !reader.ReadU8(numMethods)) {
        return MetadataDecodeResult<MetadataItem>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    MetadataItem item(ContractMetadataKind::TRAIT,
        MethodsMetadataDecoder(reader, MethodsContainerKind::TRAIT, numMethods));
    item.traitName = traitName;
    item.numMethods = numMethods;
    return MetadataDecodeResult<MetadataItem>::Item(std::move(item));
}

std::optional<MethodMetadataDecoder> MethodsMetadataDecoder::DecodeNext()
{
    if (remaining == 0) {
        return std::nullopt;
    }
    --remaining;
    return MethodMetadataDecoder(*reader, containerKind);
}

MetadataDecodeResult<DecodedMethod> MethodMetadataDecoder::DecodeNext()
{
    uint8_t byte;
    if (!reader->ReadU8(byte)) {
        return MetadataDecodeResult<DecodedMethod>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    std::optional<ContractMetadataKind> metadataKind = ContractMetadataKindFromByte(byte);
    if (!metadataKind) {
        return MetadataDecodeResult<DecodedMethod>::Error(MetadataDecodingError::InvalidFirstMetadataByte(byte));
    }

    MethodKind methodKind;
    switch (*metadataKind) {
        case ContractMetadataKind::INIT: methodKind = MethodKind::INIT; break;
        case ContractMetadataKind::UPDATE_STATELESS: methodKind = MethodKind::UPDATE_STATELESS; break;
        case ContractMetadataKind::UPDATE_STATEFUL_RO: methodKind = MethodKind::UPDATE_STATEFUL_RO; break;
        case ContractMetadataKind::UPDATE_STATEFUL_RW: methodKind = MethodKind::UPDATE_STATEFUL_RW; break;
        case ContractMetadataKind::VIEW_STATELESS: methodKind = MethodKind::VIEW_STATELESS; break;
        case ContractMetadataKind::VIEW_STATEFUL: methodKind = MethodKind::VIEW_STATEFUL; break;
        default:
            return MetadataDecodeResult<DecodedMethod>::Error(MetadataDecodingError::ExpectedMethodKind(*metadataKind));
    }

    // Traits have no state, so only stateless methods can be declared there
    if (containerKind == MethodsContainerKind::TRAIT &&
        methodKind != MethodKind::UPDATE_STATELESS && methodKind != MethodKind::VIEW_STATELESS) {
        return MetadataDecodeResult<DecodedMethod>::Error(MetadataDecodingError::UnexpectedMethodKind(methodKind, containerKind));
    }

    std::string_view methodName;
    uint8_t numArguments;
    if (!reader->ReadName(methodName) || !reader->ReadU8(numArguments)) {
        return MetadataDecodeResult<DecodedMethod>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    MethodMetadataItem item;
    item.methodName = methodName;
    item.methodKind = methodKind;
    item.numArguments = numArguments;
    return MetadataDecodeResult<DecodedMethod>::Item(
        DecodedMethod{ArgumentsMetadataDecoder(*reader, methodKind, numArguments), item});
}

MetadataDecodeResult<ArgumentMetadataItem> ArgumentsMetadataDecoder::DecodeNext()
{
    if (remaining == 0) {
        return MetadataDecodeResult<ArgumentMetadataItem>::End();
    }
    --remaining;
    return DecodeArgument();
}

static bool ArgumentAllowed(MethodKind methodKind, ArgumentKind argumentKind)
{
    if (MethodKindIsUpdate(methodKind)) {
        return true;
    }
    // Views can't mutate anything and tmp only exists for updates
    switch (argumentKind) {
        case ArgumentKind::ENV_RO:
        case ArgumentKind::SLOT_RO:
        case ArgumentKind::INPUT:
        case ArgumentKind::OUTPUT:
            return true;
        default:
            return false;
    }
}

MetadataDecodeResult<ArgumentMetadataItem> ArgumentsMetadataDecoder::DecodeArgument()
{
    uint8_t byte;
    if (!reader->ReadU8(byte)) {
        return MetadataDecodeResult<ArgumentMetadataItem>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    std::optional<ContractMetadataKind> metadataKind = ContractMetadataKindFromByte(byte);
    if (!metadataKind) {
        return MetadataDecodeResult<ArgumentMetadataItem>::Error(MetadataDecodingError::InvalidFirstMetadataByte(byte));
    }

    if (*metadataKind < ContractMetadataKind::ENV_RO) {
        return MetadataDecodeResult<ArgumentMetadataItem>::Error(MetadataDecodingError::ExpectedArgumentKind(*metadataKind));
    }
    const ArgumentKind argumentKind = static_cast<ArgumentKind>(
        static_cast<uint8_t>(*metadataKind) - static_cast<uint8_t>(ContractMetadataKind::ENV_RO));

    if (!ArgumentAllowed(methodKind, argumentKind)) {
        return MetadataDecodeResult<ArgumentMetadataItem>::Error(MetadataDecodingError::UnexpectedArgumentKind(argumentKind, methodKind));
    }

    ArgumentMetadataItem item;
    item.argumentKind = argumentKind;

    if (argumentKind == ArgumentKind::ENV_RO || argumentKind == ArgumentKind::ENV_RW) {
        item.argumentName = "env";
        return MetadataDecodeResult<ArgumentMetadataItem>::Item(item);
    }

    if (!reader->ReadName(item.argumentName)) {
        return MetadataDecodeResult<ArgumentMetadataItem>::Error(MetadataDecodingError::NotEnoughMetadata());
    }

    bool hasTypeDetails = false;
    if (argumentKind == ArgumentKind::INPUT) {
        hasTypeDetails = true;
    } else if (argumentKind == ArgumentKind::OUTPUT) {
        // The last output of init is the new state and carries no type
        const bool lastArgument = remaining == 0;
        hasTypeDetails = !(methodKind == MethodKind::INIT && lastArgument);
    }

    if (hasTypeDetails) {
        item.typeDetails = DecodeIoTypeDetails(*reader);
        if (!item.typeDetails) {
            return MetadataDecodeResult<ArgumentMetadataItem>::Error(
                MetadataDecodingError::InvalidArgumentIoType(item.argumentName, argumentKind));
        }
    }

    return MetadataDecodeResult<ArgumentMetadataItem>::Item(item);
}

namespace {

bool CompactItem(MetadataReader& reader, std::vector<uint8_t>& out, bool forExternalArgs);

bool CompactArgument(MetadataReader& reader, std::vector<uint8_t>& out, ContractMetadataKind methodKind,
                     bool lastArgument, bool forExternalArgs)
{
    uint8_t byte;
    if (!reader.ReadU8(byte)) {
        return false;
    }
    std::optional<ContractMetadataKind> kind = ContractMetadataKindFromByte(byte);
    if (!kind) {
        return false;
    }

    std::string_view name;
    switch (*kind) {
        case ContractMetadataKind::ENV_RO:
        case ContractMetadataKind::ENV_RW:
            // No type and no name
            if (!forExternalArgs) {
                out.push_back(byte);
            }
            return true;
        case ContractMetadataKind::TMP_RO:
        case ContractMetadataKind::TMP_RW:
            if (forExternalArgs) {
                return reader.ReadName(name);
            }
            out.push_back(byte);
            if (!reader.ReadName(name)) {
                return false;
            }
            out.push_back(0);
            return true;
        case ContractMetadataKind::SLOT_RO:
        case ContractMetadataKind::SLOT_RW:
            out.push_back(forExternalArgs ? static_cast<uint8_t>(ContractMetadataKind::SLOT_RO) : byte);
            if (!reader.ReadName(name)) {
                return false;
            }
            out.push_back(0);
            return true;
        case ContractMetadataKind::INPUT:
        case ContractMetadataKind::OUTPUT:
            out.push_back(byte);
            if (!reader.ReadName(name)) {
                return false;
            }
            out.push_back(0);
            // The state returned by an init method has no type metadata
            if (methodKind == ContractMetadataKind::INIT && *kind == ContractMetadataKind::OUTPUT && lastArgument) {
                return true;
            }
            return CompactIoTypeMetadata(reader, out);
        default:
            return false;
    }
}

bool CompactMethods(MetadataReader& reader, std::vector<uint8_t>& out, bool forExternalArgs)
{
    uint8_t numMethods;
    if (!reader.ReadU8(numMethods)) {
        return false;
    }
    out.push_back(numMethods);
    for (; numMethods > 0; --numMethods) {
        if (!CompactItem(reader, out, forExternalArgs)) {
            return false;
        }
    }
    return true;
}

bool CompactItem(MetadataReader& reader, std::vector<uint8_t>& out, bool forExternalArgs)
{
    uint8_t byte;
    if (!reader.ReadU8(byte)) {
        return false;
    }
    std::optional<ContractMetadataKind> kind = ContractMetadataKindFromByte(byte);
    if (!kind) {
        return false;
    }

    switch (*kind) {
        case ContractMetadataKind::CONTRACT:
            out.push_back(byte);
            // State, slot and tmp types
            for (int i = 0; i < 3; ++i) {
                if (!CompactIoTypeMetadata(reader, out)) {
                    return false;
                }
            }
            return CompactMethods(reader, out, forExternalArgs);
        case ContractMetadataKind::TRAIT: {
            out.push_back(byte);
            std::string_view traitName;
            if (!reader.ReadName(traitName)) {
                return false;
            }
            out.push_back(0);
            return CompactMethods(reader, out, forExternalArgs);
        }
        case ContractMetadataKind::INIT:
            out.push_back(byte);
            break;
        case ContractMetadataKind::UPDATE_STATELESS:
        case ContractMetadataKind::UPDATE_STATEFUL_RO:
        case ContractMetadataKind::UPDATE_STATEFUL_RW:
            out.push_back(forExternalArgs ? static_cast<uint8_t>(ContractMetadataKind::UPDATE_STATELESS) : byte);
            break;
        case ContractMetadataKind::VIEW_STATELESS:
        case ContractMetadataKind::VIEW_STATEFUL:
            out.push_back(forExternalArgs ? static_cast<uint8_t>(ContractMetadataKind::VIEW_STATELESS) : byte);
            break;
        default:
            // Arguments can't start an item
            return false;
    }

    // Method name is kept
    std::string_view methodName;
    if (!reader.ReadName(methodName)) {
        return false;
    }
    out.push_back(static_cast<uint8_t>(methodName.size()));
    out.insert(out.end(), methodName.begin(), methodName.end());

    uint8_t numArguments;
    if (!reader.ReadU8(numArguments)) {
        return false;
    }
    out.push_back(numArguments);
    for (; numArguments > 0; --numArguments) {
        if (!CompactArgument(reader, out, *kind, numArguments == 1, forExternalArgs)) {
            return false;
        }
    }
    return true;
}

std::optional<std::vector<uint8_t>> Compact(const std::vector<uint8_t>& metadata, bool forExternalArgs)
{
    MetadataReader reader(metadata);
    std::vector<uint8_t> out;
    out.reserve(metadata.size());
    if (!CompactItem(reader, out, forExternalArgs) || !reader.Empty()) {
        return std::nullopt;
    }
    return out;
}

} // namespace

std::optional<std::vector<uint8_t>> CompactMetadata(const std::vector<uint8_t>& metadata)
{
    return Compact(metadata, false);
}

std::optional<std::vector<uint8_t>> CompactExternalArgsMetadata(const std::vector<uint8_t>& metadata)
{
    return Compact(metadata, true);
}

} // namespace ABVM
