// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/wallet_payload.h>

#include <contracts/metadata.h>
#include <crypto/common.h>
#include <util.h>

#include <cstring>

namespace ABVM {

namespace {

static const uint8_t INPUT_VALUE_FLAG = 0x80;
static const size_t MAX_ALIGNMENT = 16;

std::optional<uint8_t> AlignmentPower(size_t alignment)
{
    switch (alignment) {
        case 1: return 0;
        case 2: return 1;
        case 4: return 2;
        case 8: return 3;
        case 16: return 4;
        default: return std::nullopt;
    }
}

std::optional<TransactionMethodContext> TransactionMethodContextFromU8(uint8_t byte)
{
    switch (byte) {
        case 0: return TransactionMethodContext::NULL_CONTEXT;
        case 1: return TransactionMethodContext::WALLET;
        default: return std::nullopt;
    }
}

} // namespace

bool TransactionPayloadBuilder::WithMethodCall(const Address& contract, const std::vector<uint8_t>& methodMetadata,
                                               const MethodFingerprint& fingerprint, void** externalArgs,
                                               TransactionMethodContext methodContext,
                                               const std::vector<std::optional<uint8_t>>& inputOutputIndex,
                                               std::string& strError)
{
    MetadataReader reader(methodMetadata);
    MethodMetadataDecoder methodDecoder(reader, MethodsContainerKind::UNKNOWN);
    MetadataDecodeResult<DecodedMethod> decoded = methodDecoder.DecodeNext();
    if (!decoded.IsItem()) {
        strError = decoded.IsError() ? strprintf("Metadata decoding error: %s", decoded.GetError().ToString())
                                     : std::string("Metadata decoding error: empty metadata");
        return false;
    }

    const MethodKind methodKind = decoded.GetItem().item.methodKind;
    const size_t numberOfArguments = decoded.GetItem().item.numArguments + (MethodKindHasSelf(methodKind) ? 1 : 0);
    if (numberOfArguments > MAX_TOTAL_METHOD_ARGS) {
        strError = strprintf("Too many arguments: %u", numberOfArguments);
        return false;
    }

    // Collect everything first so that the payload is only extended on success
    size_t numSlots = 0;
    std::vector<IoTypeDetails> inputDetails;
    std::vector<IoTypeDetails> outputDetails;
    ArgumentsMetadataDecoder& arguments = decoded.GetItem().arguments;
    while (true) {
        MetadataDecodeResult<ArgumentMetadataItem> argument = arguments.DecodeNext();
        if (argument.IsEnd()) {
            break;
        }
        if (argument.IsError()) {
            strError = strprintf("Metadata decoding error: %s", argument.GetError().ToString());
            return false;
        }
        const ArgumentMetadataItem& item = argument.GetItem();
        switch (item.argumentKind) {
            case ArgumentKind::ENV_RO:
            case ArgumentKind::ENV_RW:
            case ArgumentKind::TMP_RO:
            case ArgumentKind::TMP_RW:
                // Not represented in external args
                break;
            case ArgumentKind::SLOT_RO:
            case ArgumentKind::SLOT_RW:
                ++numSlots;
                break;
            case ArgumentKind::INPUT:
                inputDetails.push_back(item.typeDetails.value_or(IoTypeDetails::Bytes(0)));
                break;
            case ArgumentKind::OUTPUT:
                outputDetails.push_back(item.typeDetails.value_or(IoTypeDetails::Bytes(0)));
                break;
        }
    }

    std::vector<uint8_t> inputTags;
    for (size_t i = 0; i < inputDetails.size(); ++i) {
        if (i < inputOutputIndex.size() && inputOutputIndex[i]) {
            const uint8_t outputIndex = *inputOutputIndex[i];
            if (outputIndex & INPUT_VALUE_FLAG) {
                strError = strprintf("Invalid output index: %u", static_cast<unsigned int>(outputIndex));
                return false;
            }
            inputTags.push_back(outputIndex);
        } else {
            std::optional<uint8_t> power = AlignmentPower(inputDetails[i].alignment);
            if (!power) {
                strError = strprintf("Invalid alignment: %u", static_cast<unsigned int>(inputDetails[i].alignment));
                return false;
            }
            inputTags.push_back(INPUT_VALUE_FLAG | *power);
        }
    }
    std::vector<uint8_t> outputPowers;
    for (const IoTypeDetails& details : outputDetails) {
        std::optional<uint8_t> power = AlignmentPower(details.alignment);
        if (!power) {
            strError = strprintf("Invalid alignment: %u", static_cast<unsigned int>(details.alignment));
            return false;
        }
        outputPowers.push_back(*power);
    }

    ExtendWithAlignment(&contract, sizeof(contract), alignof(Address));
    ExtendWithAlignment(fingerprint.bytes.data(), fingerprint.bytes.size(), 1);
    PushByte(static_cast<uint8_t>(methodContext));
    PushByte(static_cast<uint8_t>(numSlots));
    PushByte(static_cast<uint8_t>(inputDetails.size()));
    PushByte(static_cast<uint8_t>(outputDetails.size()));

    size_t argIndex = 0;
    for (size_t i = 0; i < numSlots; ++i) {
        const Address* address = static_cast<const Address*>(externalArgs[argIndex++]);
        ExtendWithAlignment(address, sizeof(Address), alignof(Address));
    }

    for (size_t i = 0; i < inputDetails.size(); ++i) {
        // Inputs taken from outputs still occupy two pointers, which are not read
        const uint8_t* data = static_cast<const uint8_t*>(externalArgs[argIndex++]);
        const uint32_t* sizePtr = static_cast<const uint32_t*>(externalArgs[argIndex++]);
        PushByte(inputTags[i]);
        if (inputTags[i] & INPUT_VALUE_FLAG) {
            const uint32_t size = *sizePtr;
            unsigned char sizeBytes[4];
            WriteLE32(sizeBytes, size);
            ExtendWithAlignment(sizeBytes, sizeof(sizeBytes), alignof(uint32_t));
            ExtendWithAlignment(data, size, inputDetails[i].alignment);
        }
    }

    for (size_t i = 0; i < outputDetails.size(); ++i) {
        unsigned char capacityBytes[4];
        WriteLE32(capacityBytes, outputDetails[i].recommendedCapacity);
        ExtendWithAlignment(capacityBytes, sizeof(capacityBytes), alignof(uint32_t));
        PushByte(outputPowers[i]);
    }

    return true;
}

void TransactionPayloadBuilder::ExtendWithAlignment(const void* data, size_t size, size_t alignment)
{
    const size_t unalignedBy = payload.size() % alignment;
    if (unalignedBy > 0) {
        payload.resize(payload.size() + (alignment - unalignedBy), 0);
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    payload.insert(payload.end(), bytes, bytes + size);
}

std::vector<TransactionPayloadWord> TransactionPayloadBuilder::IntoAlignedWords() const
{
    std::vector<TransactionPayloadWord> words((payload.size() + MAX_ALIGNMENT - 1) / MAX_ALIGNMENT);
    if (!words.empty()) {
        std::memset(words.data(), 0, words.size() * sizeof(TransactionPayloadWord));
        std::memcpy(words.data(), payload.data(), payload.size());
    }
    return words;
}

std::string TransactionPayloadDecoderErrorToString(TransactionPayloadDecoderError error)
{
    switch (error) {
        case TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL: return "Payload too small";
        case TransactionPayloadDecoderError::INVALID_METHOD_CONTEXT: return "Invalid method context";
        case TransactionPayloadDecoderError::INVALID_ALIGNMENT: return "Invalid alignment";
        case TransactionPayloadDecoderError::EXTERNAL_ARGS_BUFFER_TOO_SMALL: return "ExternalArgs buffer too small";
        case TransactionPayloadDecoderError::OUTPUT_INDEX_NOT_FOUND: return "Output index not found";
        case TransactionPayloadDecoderError::OUTPUT_BUFFER_TOO_SMALL: return "Output buffer too small";
        case TransactionPayloadDecoderError::OUTPUT_BUFFER_OFFSETS_TOO_SMALL: return "Output buffer offsets too small";
    }
    return "Unknown error";
}

TransactionPayloadDecoder::TransactionPayloadDecoder(const TransactionPayloadWord* payloadIn, size_t numWords,
                                                     MapContextFn mapContextIn)
    : payload(reinterpret_cast<const uint8_t*>(payloadIn)),
      remaining(numWords * sizeof(TransactionPayloadWord)),
      mapContext(mapContextIn),
      outputBuffer(OUTPUT_BUFFER_SIZE / sizeof(TransactionPayloadWord))
{
    outputBufferOffsets.reserve(OUTPUT_BUFFER_OFFSETS_SIZE);
}

bool TransactionPayloadDecoder::DecodeNextMethod(std::optional<PreparedMethod>& method,
                                                 TransactionPayloadDecoderError& error)
{
    method.reset();
    if (remaining <= MAX_ALIGNMENT) {
        return true;
    }

    const uint8_t* bytes = nullptr;
    PreparedMethod prepared;
    if (!GetBytes(sizeof(Address), alignof(Address), bytes, error)) {
        return false;
    }
    std::memcpy(&prepared.contract, bytes, sizeof(Address));
    if (!GetBytes(MethodFingerprint::SIZE, 1, bytes, error)) {
        return false;
    }
    std::memcpy(prepared.fingerprint.bytes.data(), bytes, MethodFingerprint::SIZE);

    uint8_t contextByte = 0;
    uint8_t numSlots = 0;
    uint8_t numInputs = 0;
    uint8_t numOutputs = 0;
    if (!ReadU8(contextByte, error) || !ReadU8(numSlots, error) || !ReadU8(numInputs, error) ||
        !ReadU8(numOutputs, error)) {
        return false;
    }
    std::optional<TransactionMethodContext> methodContext = TransactionMethodContextFromU8(contextByte);
    if (!methodContext) {
        error = TransactionPayloadDecoderError::INVALID_METHOD_CONTEXT;
        return false;
    }
    prepared.methodContext = mapContext(*methodContext);

    const size_t expectedExternalArgs = size_t{numSlots} + size_t{numInputs} * 2 + size_t{numOutputs} * 3;
    if (expectedExternalArgs > externalArgs.size()) {
        error = TransactionPayloadDecoderError::EXTERNAL_ARGS_BUFFER_TOO_SMALL;
        return false;
    }

    size_t cursor = 0;
    for (uint8_t i = 0; i < numSlots; ++i) {
        if (!GetBytes(sizeof(Address), alignof(Address), bytes, error)) {
            return false;
        }
        externalArgs[cursor++] = const_cast<uint8_t*>(bytes);
    }

    uint8_t* outputBytes = reinterpret_cast<uint8_t*>(outputBuffer.data());
    for (uint8_t i = 0; i < numInputs; ++i) {
        uint8_t tag = 0;
        if (!ReadU8(tag, error)) {
            return false;
        }
        if (tag & INPUT_VALUE_FLAG) {
            const uint8_t alignmentPower = tag & ~INPUT_VALUE_FLAG;
            if (alignmentPower > 4) {
                error = TransactionPayloadDecoderError::INVALID_ALIGNMENT;
                return false;
            }
            const uint8_t* sizeBytes = nullptr;
            if (!GetBytes(sizeof(uint32_t), alignof(uint32_t), sizeBytes, error)) {
                return false;
            }
            const uint32_t size = ReadLE32(sizeBytes);
            if (!GetBytes(size, size_t{1} << alignmentPower, bytes, error)) {
                return false;
            }
            externalArgs[cursor++] = const_cast<uint8_t*>(bytes);
            externalArgs[cursor++] = const_cast<uint8_t*>(sizeBytes);
        } else {
            if (tag >= outputBufferOffsets.size()) {
                error = TransactionPayloadDecoderError::OUTPUT_INDEX_NOT_FOUND;
                return false;
            }
            const std::pair<uint32_t, uint32_t>& offsets = outputBufferOffsets[tag];
            externalArgs[cursor++] = outputBytes + offsets.second;
            externalArgs[cursor++] = outputBytes + offsets.first;
        }
    }

    for (uint8_t i = 0; i < numOutputs; ++i) {
        const uint8_t* capacityBytes = nullptr;
        uint8_t alignmentPower = 0;
        if (!GetBytes(sizeof(uint32_t), alignof(uint32_t), capacityBytes, error) || !ReadU8(alignmentPower, error)) {
            return false;
        }
        if (alignmentPower > 4) {
            error = TransactionPayloadDecoderError::INVALID_ALIGNMENT;
            return false;
        }
        uint32_t* size = nullptr;
        uint8_t* data = nullptr;
        if (!AllocateOutput(ReadLE32(capacityBytes), size_t{1} << alignmentPower, size, data, error)) {
            return false;
        }
        externalArgs[cursor++] = data;
        externalArgs[cursor++] = size;
        externalArgs[cursor++] = const_cast<uint8_t*>(capacityBytes);
    }

    prepared.externalArgs = externalArgs.data();
    method = prepared;
    return true;
}

bool TransactionPayloadDecoder::ReadU8(uint8_t& out, TransactionPayloadDecoderError& error)
{
    if (remaining < 1) {
        error = TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL;
        return false;
    }
    out = *payload;
    ++payload;
    --remaining;
    return true;
}

bool TransactionPayloadDecoder::GetBytes(size_t size, size_t alignment, const uint8_t*& out,
                                         TransactionPayloadDecoderError& error)
{
    EnsureAlignment(alignment);
    if (size > remaining) {
        error = TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL;
        return false;
    }
    out = payload;
    payload += size;
    remaining -= size;
    return true;
}

void TransactionPayloadDecoder::EnsureAlignment(size_t alignment)
{
    const size_t unalignedBy = remaining % alignment;
    payload += unalignedBy;
    remaining -= unalignedBy;
}

bool TransactionPayloadDecoder::AllocateOutput(uint32_t capacity, size_t alignment, uint32_t*& size, uint8_t*& data,
                                               TransactionPayloadDecoderError& error)
{
    if (outputBufferOffsets.size() == OUTPUT_BUFFER_OFFSETS_SIZE) {
        error = TransactionPayloadDecoderError::OUTPUT_BUFFER_OFFSETS_TOO_SMALL;
        return false;
    }

    auto allocate = [this](size_t allocAlignment, size_t allocSize, size_t& offset) {
        const size_t unalignedBy = outputBufferCursor % allocAlignment;
        offset = outputBufferCursor + (unalignedBy > 0 ? allocAlignment - unalignedBy : 0);
        if (offset + allocSize > OUTPUT_BUFFER_SIZE) {
            return false;
        }
        outputBufferCursor = offset + allocSize;
        return true;
    };

    size_t sizeOffset = 0;
    size_t dataOffset = 0;
    if (!allocate(alignof(uint32_t), sizeof(uint32_t), sizeOffset) || !allocate(alignment, capacity, dataOffset)) {
        error = TransactionPayloadDecoderError::OUTPUT_BUFFER_TOO_SMALL;
        return false;
    }

    uint8_t* outputBytes = reinterpret_cast<uint8_t*>(outputBuffer.data());
    size = reinterpret_cast<uint32_t*>(outputBytes + sizeOffset);
    *size = 0;
    data = outputBytes + dataOffset;
    outputBufferOffsets.emplace_back(static_cast<uint32_t>(sizeOffset), static_cast<uint32_t>(dataOffset));
    return true;
}

} // namespace ABVM
