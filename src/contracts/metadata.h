// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_METADATA_H
#define ABVM_CONTRACTS_METADATA_H

#include <contracts/iotype.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ABVM {

/**
 * Tags of the contract metadata grammar.
 *
 * A contract is described by one Contract item and any number of Trait items
 * it implements, each followed by its methods, each method by its arguments.
 */
enum class ContractMetadataKind : uint8_t {
    CONTRACT = 0,
    TRAIT,
    INIT,
    UPDATE_STATELESS,
    UPDATE_STATEFUL_RO,
    UPDATE_STATEFUL_RW,
    VIEW_STATELESS,
    VIEW_STATEFUL,
    ENV_RO,
    ENV_RW,
    TMP_RO,
    TMP_RW,
    SLOT_RO,
    SLOT_RW,
    INPUT,
    OUTPUT,
};

std::optional<ContractMetadataKind> ContractMetadataKindFromByte(uint8_t byte);
std::string ContractMetadataKindToString(ContractMetadataKind kind);

enum class MethodKind : uint8_t {
    /** Creates the initial state of the contract */
    INIT,
    UPDATE_STATELESS,
    UPDATE_STATEFUL_RO,
    UPDATE_STATEFUL_RW,
    VIEW_STATELESS,
    VIEW_STATEFUL,
};

std::string MethodKindToString(MethodKind kind);

/** Whether the method receives the contract state as implicit first argument */
bool MethodKindHasSelf(MethodKind kind);
/** Whether the method may mutate anything */
bool MethodKindIsUpdate(MethodKind kind);

enum class ArgumentKind : uint8_t {
    ENV_RO,
    ENV_RW,
    TMP_RO,
    TMP_RW,
    SLOT_RO,
    SLOT_RW,
    INPUT,
    OUTPUT,
};

std::string ArgumentKindToString(ArgumentKind kind);

enum class MethodsContainerKind : uint8_t {
    CONTRACT,
    TRAIT,
    /** Standalone method metadata, e.g. at call time; any method kind is accepted */
    UNKNOWN,
};

std::string MethodsContainerKindToString(MethodsContainerKind kind);

inline std::ostream& operator<<(std::ostream& os, ContractMetadataKind kind) {
    return os << ContractMetadataKindToString(kind);
}
inline std::ostream& operator<<(std::ostream& os, MethodKind kind) {
    return os << MethodKindToString(kind);
}
inline std::ostream& operator<<(std::ostream& os, ArgumentKind kind) {
    return os << ArgumentKindToString(kind);
}
inline std::ostream& operator<<(std::ostream& os, MethodsContainerKind kind) {
    return os << MethodsContainerKindToString(kind);
}

enum class MetadataDecodingErrorKind : uint8_t {
    NOT_ENOUGH_METADATA,
    INVALID_FIRST_METADATA_BYTE,
    MULTIPLE_CONTRACTS_FOUND,
    EXPECTED_CONTRACT_OR_TRAIT,
    FAILED_TO_DECODE_STATE_TYPE_NAME,
    INVALID_STATE_IO_TYPE,
    UNEXPECTED_METHOD_KIND,
    EXPECTED_METHOD_KIND,
    EXPECTED_ARGUMENT_KIND,
    UNEXPECTED_ARGUMENT_KIND,
    INVALID_ARGUMENT_IO_TYPE,
};

/**
 * @brief Metadata decoding error with the context relevant to its kind
 */
struct MetadataDecodingError {
    MetadataDecodingErrorKind kind = MetadataDecodingErrorKind::NOT_ENOUGH_METADATA;
    uint8_t byte = 0;
    ContractMetadataKind metadataKind = ContractMetadataKind::CONTRACT;
    MethodKind methodKind = MethodKind::INIT;
    MethodsContainerKind containerKind = MethodsContainerKind::UNKNOWN;
    ArgumentKind argumentKind = ArgumentKind::ENV_RO;
    std::string argumentName;

    static MetadataDecodingError NotEnoughMetadata();
    static MetadataDecodingError InvalidFirstMetadataByte(uint8_t byte);
    static MetadataDecodingError MultipleContractsFound();
    static MetadataDecodingError ExpectedContractOrTrait(ContractMetadataKind metadataKind);
    static MetadataDecodingError FailedToDecodeStateTypeName();
    static MetadataDecodingError InvalidStateIoType();
    static MetadataDecodingError UnexpectedMethodKind(MethodKind methodKind, MethodsContainerKind containerKind);
    static MetadataDecodingError ExpectedMethodKind(ContractMetadataKind metadataKind);
    static MetadataDecodingError ExpectedArgumentKind(ContractMetadataKind metadataKind);
    static MetadataDecodingError UnexpectedArgumentKind(ArgumentKind argumentKind, MethodKind methodKind);
    static MetadataDecodingError InvalidArgumentIoType(std::string_view argumentName, ArgumentKind argumentKind);

    std::string ToString() const;
};

inline std::ostream& operator<<(std::ostream& os, const MetadataDecodingError& error) {
    return os << error.ToString();
}

/**
 * @brief Outcome of one decoding step: end of input, an item or an error
 */
template <typename T>
class MetadataDecodeResult {
public:
    static MetadataDecodeResult End() { return MetadataDecodeResult(); }
    static MetadataDecodeResult Item(T itemIn) {
        MetadataDecodeResult result;
        result.item.emplace(std::move(itemIn));
        return result;
    }
    static MetadataDecodeResult Error(MetadataDecodingError errorIn) {
        MetadataDecodeResult result;
        result.error.emplace(std::move(errorIn));
        return result;
    }

    bool IsEnd() const { return !item && !error; }
    bool IsItem() const { return item.has_value(); }
    bool IsError() const { return error.has_value(); }

    T& GetItem() { return *item; }
    const T& GetItem() const { return *item; }
    const MetadataDecodingError& GetError() const { return *error; }

private:
    MetadataDecodeResult() = default;

    std::optional<T> item;
    std::optional<MetadataDecodingError> error;
};

struct ArgumentMetadataItem {
    /** Argument name, "env" for environment arguments */
    std::string_view argumentName;
    ArgumentKind argumentKind = ArgumentKind::ENV_RO;
    /**
     * Present for inputs and outputs, except the last output of an init
     * method, which is the contract's initial state of unconstrained size
     */
    std::optional<IoTypeDetails> typeDetails;
};

/**
 * @brief Decoder of the arguments of one method
 *
 * Must be exhausted before the reader is used by the parent decoder again.
 */
class ArgumentsMetadataDecoder {
public:
    ArgumentsMetadataDecoder(MetadataReader& readerIn, MethodKind methodKindIn, uint8_t numArguments)
        : reader(&readerIn), methodKind(methodKindIn), remaining(numArguments) {}

    /** Number of arguments not decoded yet */
    uint8_t Remaining() const { return remaining; }

    MetadataDecodeResult<ArgumentMetadataItem> DecodeNext();

private:
    MetadataDecodeResult<ArgumentMetadataItem> DecodeArgument();

    MetadataReader* reader;
    MethodKind methodKind;
    uint8_t remaining;
};

struct MethodMetadataItem {
    std::string_view methodName;
    MethodKind methodKind = MethodKind::INIT;
    uint8_t numArguments = 0;
};

/**
 * @brief Method header together with the decoder of its arguments
 */
struct DecodedMethod {
    ArgumentsMetadataDecoder arguments;
    MethodMetadataItem item;
};

/**
 * @brief Decoder of a single method header
 */
class MethodMetadataDecoder {
public:
    MethodMetadataDecoder(MetadataReader& readerIn, MethodsContainerKind containerKindIn)
        : reader(&readerIn), containerKind(containerKindIn) {}

    /** The number of bytes left in the metadata that were not processed yet */
    size_t RemainingMetadataBytes() const { return reader->Remaining(); }

    /** Decode the method header; end of input is reported as NotEnoughMetadata */
    MetadataDecodeResult<DecodedMethod> DecodeNext();

private:
    MetadataReader* reader;
    MethodsContainerKind containerKind;
};

/**
 * @brief Decoder of the methods of a contract or trait
 */
class MethodsMetadataDecoder {
public:
    MethodsMetadataDecoder(MetadataReader& readerIn, MethodsContainerKind containerKindIn, uint8_t numMethods)
        : reader(&readerIn), containerKind(containerKindIn), remaining(numMethods) {}

    uint8_t Remaining() const { return remaining; }

    /** Next method decoder, or nothing once all methods were handed out */
    std::optional<MethodMetadataDecoder> DecodeNext();

private:
    MetadataReader* reader;
    MethodsContainerKind containerKind;
    uint8_t remaining;
};

/**
 * @brief Top-level Contract or Trait item
 */
struct MetadataItem {
    MetadataItem(ContractMetadataKind kindIn, MethodsMetadataDecoder methodsIn)
        : kind(kindIn), methods(methodsIn) {}

    /** CONTRACT or TRAIT */
    ContractMetadataKind kind = ContractMetadataKind::CONTRACT;

    // Contract
    std::string stateTypeName;
    IoTypeDetails stateTypeDetails;
    IoTypeDetails slotTypeDetails;
    IoTypeDetails tmpTypeDetails;

    // Trait
    std::string_view traitName;

    uint8_t numMethods = 0;
    MethodsMetadataDecoder methods;

    bool IsContract() const { return kind == ContractMetadataKind::CONTRACT; }
};

/**
 * @brief Decoder of a complete contract metadata blob
 *
 * Yields one item per Contract or Trait; at most one Contract is accepted.
 * Each item's methods (and their arguments) must be fully decoded before
 * calling DecodeNext() again.
 */
class MetadataDecoder {
public:
    MetadataDecoder(const uint8_t* data, size_t size) : reader(data, size) {}
    explicit MetadataDecoder(const std::vector<uint8_t>& metadata) : reader(metadata) {}

    MetadataDecoder(const MetadataDecoder&) = delete;
    MetadataDecoder& operator=(const MetadataDecoder&) = delete;

    MetadataDecodeResult<MetadataItem> DecodeNext();

private:
    MetadataDecodeResult<MetadataItem> DecodeContract();
    MetadataDecodeResult<MetadataItem> DecodeTrait();

    MetadataReader reader;
    bool foundContract = false;
};

/**
 * Compact form of one Contract, Trait or method item. Trait names, argument
 * names and all names inside types are dropped; method names are kept. Two
 * methods that differ only in such names compact to the same bytes.
 *
 * Returns nothing when the metadata is malformed or has trailing bytes.
 */
std::optional<std::vector<uint8_t>> CompactMetadata(const std::vector<uint8_t>& metadata);

/**
 * Like CompactMetadata(), additionally dropping what has no external
 * representation in a call: env and tmp arguments are skipped, update and
 * view kinds collapse to their stateless variants, slot kinds to SLOT_RO.
 * Argument counts are copied unchanged.
 */
std::optional<std::vector<uint8_t>> CompactExternalArgsMetadata(const std::vector<uint8_t>& metadata);

} // namespace ABVM

#endif // ABVM_CONTRACTS_METADATA_H
