// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_WALLET_PAYLOAD_H
#define ABVM_SYSTEM_WALLET_PAYLOAD_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/method.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ABVM {

/** Upper bound of arguments of one method, including the state */
static constexpr size_t MAX_TOTAL_METHOD_ARGS = 8;
/** External arguments of one method in pointers: one per slot, two per input, three per output */
static constexpr size_t EXTERNAL_ARGS_BUFFER_SIZE = 3 * MAX_TOTAL_METHOD_ARGS;
/** Bytes available for outputs of all methods of one payload together */
static constexpr size_t OUTPUT_BUFFER_SIZE = 32 * 1024;
/** Number of outputs of all methods of one payload together */
static constexpr size_t OUTPUT_BUFFER_OFFSETS_SIZE = 16;

/** Context a payload method is called under */
enum class TransactionMethodContext : uint8_t {
    /** NULL context, MethodContext::RESET */
    NULL_CONTEXT = 0,
    /** Context of the wallet, MethodContext::KEEP from within the wallet's execute */
    WALLET = 1,
};

/**
 * @brief Serializer of method calls into a transaction payload
 *
 * Each method call is laid out as follows, every value aligned to its natural
 * alignment with zero padding:
 *  - contract address, fingerprint (32 bytes), context (u8)
 *  - number of slots, inputs and outputs (u8 each)
 *  - address of each slot
 *  - each input: a u8 tag followed by the value for value inputs. Tags with
 *    the high bit set carry the value's alignment power in the low bits and
 *    are followed by a u32 size and the bytes; other tags are the index of an
 *    output of an earlier method to use instead.
 *  - each output: u32 recommended capacity and u8 alignment power
 *
 * The payload ends with zero padding up to a multiple of 16 bytes.
 */
class TransactionPayloadBuilder {
public:
    /**
     * Append a call described by its metadata. externalArgs are read for
     * slots and inputs, outputs are never read. inputOutputIndex optionally
     * points inputs at outputs of earlier calls.
     */
    bool WithMethodCall(const Address& contract, const std::vector<uint8_t>& methodMetadata,
                        const MethodFingerprint& fingerprint, void** externalArgs,
                        TransactionMethodContext methodContext,
                        const std::vector<std::optional<uint8_t>>& inputOutputIndex, std::string& strError);

    bool WithMethodCall(const Address& contract, const NativeContractMethod& method, ExternalArgs& externalArgs,
                        TransactionMethodContext methodContext,
                        const std::vector<std::optional<uint8_t>>& inputOutputIndex, std::string& strError)
    {
        return WithMethodCall(contract, method.metadata, method.fingerprint, externalArgs.Data(), methodContext,
                              inputOutputIndex, strError);
    }

    std::vector<TransactionPayloadWord> IntoAlignedWords() const;

private:
    void ExtendWithAlignment(const void* data, size_t size, size_t alignment);
    void PushByte(uint8_t byte) { payload.push_back(byte); }

    std::vector<uint8_t> payload;
};

enum class TransactionPayloadDecoderError {
    PAYLOAD_TOO_SMALL,
    INVALID_METHOD_CONTEXT,
    INVALID_ALIGNMENT,
    EXTERNAL_ARGS_BUFFER_TOO_SMALL,
    OUTPUT_INDEX_NOT_FOUND,
    OUTPUT_BUFFER_TOO_SMALL,
    OUTPUT_BUFFER_OFFSETS_TOO_SMALL,
};

std::string TransactionPayloadDecoderErrorToString(TransactionPayloadDecoderError error);

/**
 * @brief Decoder of payloads produced by TransactionPayloadBuilder
 *
 * Prepared methods point into the payload and into buffers owned by the
 * decoder, and are only valid until the next call to DecodeNextMethod().
 */
class TransactionPayloadDecoder {
public:
    using MapContextFn = MethodContext (*)(TransactionMethodContext);

    TransactionPayloadDecoder(const TransactionPayloadWord* payloadIn, size_t numWords, MapContextFn mapContextIn);

    TransactionPayloadDecoder(const TransactionPayloadDecoder&) = delete;
    TransactionPayloadDecoder& operator=(const TransactionPayloadDecoder&) = delete;

    /** Next method of the payload, or nothing once it is exhausted; false on malformed payload */
    bool DecodeNextMethod(std::optional<PreparedMethod>& method, TransactionPayloadDecoderError& error);

private:
    bool ReadU8(uint8_t& out, TransactionPayloadDecoderError& error);
    bool GetBytes(size_t size, size_t alignment, const uint8_t*& out, TransactionPayloadDecoderError& error);
    void EnsureAlignment(size_t alignment);
    bool AllocateOutput(uint32_t capacity, size_t alignment, uint32_t*& size, uint8_t*& data,
                        TransactionPayloadDecoderError& error);

    const uint8_t* payload;
    /** Bytes left; alignment is relative to the end of the payload, which is 16-byte aligned */
    size_t remaining;
    MapContextFn mapContext;
    std::array<void*, EXTERNAL_ARGS_BUFFER_SIZE> externalArgs{};
    std::vector<TransactionPayloadWord> outputBuffer;
    size_t outputBufferCursor = 0;
    /** Offsets of the size and of the data of each output in outputBuffer */
    std::vector<std::pair<uint32_t, uint32_t>> outputBufferOffsets;
};

} // namespace ABVM

#endif // ABVM_SYSTEM_WALLET_PAYLOAD_H
