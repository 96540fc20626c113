// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file wallet_payload_tests.cpp
 * @brief Tests for the transaction payload builder and decoder used by wallets
 */

#include <contracts/metadata_builder.h>
#include <system/wallet_payload.h>
#include <test/test_abvm.h>
#include <test/test_contracts.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using namespace ABVM;

BOOST_FIXTURE_TEST_SUITE(wallet_payload_tests, BasicTestingSetup)

static MethodContext MapContext(TransactionMethodContext methodContext)
{
    return methodContext == TransactionMethodContext::WALLET ? MethodContext::KEEP : MethodContext::RESET;
}

static uint8_t* PayloadBytes(std::vector<TransactionPayloadWord>& words)
{
    return reinterpret_cast<uint8_t*>(words.data());
}

static std::vector<TransactionPayloadWord> FlipperNewPayload(const Address& flipper, bool initValue)
{
    const uint8_t value = initValue ? 1 : 0;
    const uint32_t valueSize = 1;
    ExternalArgs args;
    args.Input(&value, &valueSize);

    TransactionPayloadBuilder builder;
    std::string strError;
    BOOST_REQUIRE(builder.WithMethodCall(flipper, FlipperContract().methods[0], args,
                                         TransactionMethodContext::WALLET, {}, strError));
    return builder.IntoAlignedWords();
}

/** Decode the whole payload, expecting it to fail with the given error */
static bool DecodeFails(const std::vector<TransactionPayloadWord>& words, TransactionPayloadDecoderError expected)
{
    TransactionPayloadDecoder decoder(words.data(), words.size(), &MapContext);
    std::optional<PreparedMethod> method;
    TransactionPayloadDecoderError error = TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL;
    while (decoder.DecodeNextMethod(method, error)) {
        if (!method) {
            return false;
        }
    }
    BOOST_TEST_MESSAGE(TransactionPayloadDecoderErrorToString(error));
    return error == expected;
}

static std::vector<uint8_t> ManyOutputsMetadata(MethodKind kind, size_t numOutputs)
{
    MethodMetadataBuilder builder(kind, "outputs");
    for (size_t i = 0; i < numOutputs; ++i) {
        builder.Output(strprintf("o%u", i), IoTypeMetadata::U8());
    }
    return builder.Build();
}

BOOST_AUTO_TEST_CASE(builder_layout)
{
    const Address flipper(0x0102030405060708ULL, 0x1112131415161718ULL);
    std::vector<TransactionPayloadWord> words = FlipperNewPayload(flipper, true);
    BOOST_REQUIRE_EQUAL(words.size(), 4U);

    const uint8_t* bytes = PayloadBytes(words);
    Address contract;
    std::memcpy(&contract, bytes, sizeof(contract));
    BOOST_CHECK(contract == flipper);
    BOOST_CHECK(std::memcmp(bytes + 16, FlipperContract().methods[0].fingerprint.bytes.data(), 32) == 0);
    BOOST_CHECK_EQUAL(int{bytes[48]}, 1);
    BOOST_CHECK_EQUAL(int{bytes[49]}, 0);
    BOOST_CHECK_EQUAL(int{bytes[50]}, 1);
    BOOST_CHECK_EQUAL(int{bytes[51]}, 0);
    // Value tag with alignment power 0, then u32 size aligned to 4
    BOOST_CHECK_EQUAL(int{bytes[52]}, 0x80);
    BOOST_CHECK_EQUAL(int{bytes[53]} + bytes[54] + bytes[55], 0);
    BOOST_CHECK_EQUAL(int{bytes[56]}, 1);
    BOOST_CHECK_EQUAL(int{bytes[60]}, 1);
    // Zero padding to the end of the last word
    for (size_t i = 61; i < 64; ++i) {
        BOOST_CHECK_EQUAL(int{bytes[i]}, 0);
    }
}

BOOST_AUTO_TEST_CASE(decode_method_calls)
{
    const Address token(42, 0);
    const Address from(1000, 0);
    const Address to(1001, 0);
    const uint64_t amount = 0x1122334455667788ULL;
    const uint32_t amountSize = sizeof(amount);

    TransactionPayloadBuilder builder;
    std::string strError;
    {
        ExternalArgs args;
        args.Slot(&from).Slot(&to).Input(&amount, &amountSize);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[1], args,
                                             TransactionMethodContext::NULL_CONTEXT, {}, strError));
    }
    {
        uint64_t balance = 0;
        uint32_t size = 0;
        const uint32_t capacity = sizeof(balance);
        ExternalArgs args;
        args.Slot(&to).Output(&balance, &size, &capacity);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[2], args,
                                             TransactionMethodContext::WALLET, {}, strError));
    }
    std::vector<TransactionPayloadWord> words = builder.IntoAlignedWords();

    TransactionPayloadDecoder decoder(words.data(), words.size(), &MapContext);
    std::optional<PreparedMethod> method;
    TransactionPayloadDecoderError error;

    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_REQUIRE(method);
    BOOST_CHECK(method->contract == token);
    BOOST_CHECK(method->fingerprint == TokenContract().methods[1].fingerprint);
    BOOST_CHECK(method->methodContext == MethodContext::RESET);
    BOOST_CHECK(*static_cast<const Address*>(method->externalArgs[0]) == from);
    BOOST_CHECK(*static_cast<const Address*>(method->externalArgs[1]) == to);
    uint64_t decodedAmount = 0;
    BOOST_REQUIRE_EQUAL(*static_cast<const uint32_t*>(method->externalArgs[3]), sizeof(uint64_t));
    std::memcpy(&decodedAmount, method->externalArgs[2], sizeof(decodedAmount));
    BOOST_CHECK_EQUAL(decodedAmount, amount);
    // Value is aligned for direct access
    BOOST_CHECK_EQUAL(reinterpret_cast<uintptr_t>(method->externalArgs[2]) % alignof(uint64_t), 0U);

    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_REQUIRE(method);
    BOOST_CHECK(method->fingerprint == TokenContract().methods[2].fingerprint);
    BOOST_CHECK(method->methodContext == MethodContext::KEEP);
    BOOST_CHECK(*static_cast<const Address*>(method->externalArgs[0]) == to);
    // Output: data, size starting at zero, capacity from metadata
    BOOST_CHECK_EQUAL(reinterpret_cast<uintptr_t>(method->externalArgs[1]) % alignof(uint64_t), 0U);
    BOOST_CHECK_EQUAL(*static_cast<const uint32_t*>(method->externalArgs[2]), 0U);
    BOOST_CHECK_EQUAL(*static_cast<const uint32_t*>(method->externalArgs[3]), sizeof(uint64_t));

    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_CHECK(!method);
    // Exhausted decoder stays exhausted
    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_CHECK(!method);
}

BOOST_AUTO_TEST_CASE(input_from_earlier_output)
{
    const Address token(42, 0);
    const Address owner(1000, 0);
    const Address to(1001, 0);

    TransactionPayloadBuilder builder;
    std::string strError;
    {
        ExternalArgs args;
        args.Slot(&owner).Output(nullptr, nullptr, nullptr);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[2], args,
                                             TransactionMethodContext::WALLET, {}, strError));
    }
    {
        ExternalArgs args;
        args.Slot(&owner).Slot(&to).Input(nullptr, nullptr);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[1], args,
                                             TransactionMethodContext::WALLET, {uint8_t{0}}, strError));
    }
    std::vector<TransactionPayloadWord> words = builder.IntoAlignedWords();

    TransactionPayloadDecoder decoder(words.data(), words.size(), &MapContext);
    std::optional<PreparedMethod> method;
    TransactionPayloadDecoderError error;

    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_REQUIRE(method);
    void* const outputData = method->externalArgs[1];
    void* const outputSize = method->externalArgs[2];

    BOOST_REQUIRE(decoder.DecodeNextMethod(method, error));
    BOOST_REQUIRE(method);
    BOOST_CHECK_EQUAL(method->externalArgs[2], outputData);
    BOOST_CHECK_EQUAL(method->externalArgs[3], outputSize);
}

BOOST_AUTO_TEST_CASE(builder_errors)
{
    const Address contract(42, 0);
    std::string strError;
    {
        MethodMetadataBuilder metadata(MethodKind::UPDATE_STATELESS, "many");
        for (int i = 0; i < 9; ++i) {
            metadata.Input(strprintf("i%d", i), IoTypeMetadata::U8());
        }
        const NativeContractMethod method = NativeContractMethod::New(metadata.Build(), nullptr);
        ExternalArgs args;
        TransactionPayloadBuilder builder;
        BOOST_CHECK(!builder.WithMethodCall(contract, method, args, TransactionMethodContext::WALLET, {}, strError));
        BOOST_CHECK(!strError.empty());
        BOOST_CHECK(builder.IntoAlignedWords().empty());
    }
    {
        // State counts towards the limit
        const NativeContractMethod method =
            NativeContractMethod::New(ManyOutputsMetadata(MethodKind::VIEW_STATEFUL, 8), nullptr);
        ExternalArgs args;
        TransactionPayloadBuilder builder;
        BOOST_CHECK(!builder.WithMethodCall(contract, method, args, TransactionMethodContext::WALLET, {}, strError));
    }
    {
        const uint8_t value = 1;
        const uint32_t valueSize = 1;
        ExternalArgs args;
        args.Input(&value, &valueSize);
        TransactionPayloadBuilder builder;
        strError.clear();
        BOOST_CHECK(!builder.WithMethodCall(contract, FlipperContract().methods[0], args,
                                            TransactionMethodContext::WALLET, {uint8_t{0x80}}, strError));
        BOOST_CHECK(!strError.empty());
        BOOST_CHECK(builder.IntoAlignedWords().empty());
    }
    {
        ExternalArgs args;
        TransactionPayloadBuilder builder;
        BOOST_CHECK(!builder.WithMethodCall(contract, std::vector<uint8_t>{}, MethodFingerprint(), args.Data(),
                                            TransactionMethodContext::WALLET, {}, strError));
    }
}

BOOST_AUTO_TEST_CASE(decoder_header_errors)
{
    const std::vector<TransactionPayloadWord> valid = FlipperNewPayload(Address(42, 0), false);

    // Too small to hold a method is simply empty
    std::vector<TransactionPayloadWord> words(valid.begin(), valid.begin() + 1);
    {
        TransactionPayloadDecoder decoder(words.data(), words.size(), &MapContext);
        std::optional<PreparedMethod> method;
        TransactionPayloadDecoderError error;
        BOOST_CHECK(decoder.DecodeNextMethod(method, error));
        BOOST_CHECK(!method);
    }

    words.assign(valid.begin(), valid.begin() + 3);
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL));

    words = valid;
    PayloadBytes(words)[48] = 2;
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::INVALID_METHOD_CONTEXT));

    words = valid;
    PayloadBytes(words)[52] = 0x85;
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::INVALID_ALIGNMENT));

    // 9 outputs take 27 pointers
    words = valid;
    PayloadBytes(words)[51] = 9;
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::EXTERNAL_ARGS_BUFFER_TOO_SMALL));

    // Reference to an output that doesn't exist
    words = valid;
    PayloadBytes(words)[52] = 0;
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::OUTPUT_INDEX_NOT_FOUND));

    // Size larger than what is left
    words = valid;
    PayloadBytes(words)[57] = 1;
    BOOST_CHECK(DecodeFails(words, TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL));
}

BOOST_AUTO_TEST_CASE(decoder_output_limits)
{
    const Address contract(42, 0);
    std::string strError;

    {
        const NativeContractMethod method = NativeContractMethod::New(
            MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "big")
                .Output("data", IoTypeMetadata::VariableBytes(65536))
                .Build(),
            nullptr);
        ExternalArgs args;
        TransactionPayloadBuilder builder;
        BOOST_REQUIRE(builder.WithMethodCall(contract, method, args, TransactionMethodContext::WALLET, {}, strError));
        BOOST_CHECK(DecodeFails(builder.IntoAlignedWords(), TransactionPayloadDecoderError::OUTPUT_BUFFER_TOO_SMALL));
    }

    {
        const NativeContractMethod method =
            NativeContractMethod::New(ManyOutputsMetadata(MethodKind::VIEW_STATELESS, 8), nullptr);
        ExternalArgs args;
        TransactionPayloadBuilder builder;
        for (int i = 0; i < 2; ++i) {
            BOOST_REQUIRE(builder.WithMethodCall(contract, method, args, TransactionMethodContext::WALLET, {},
                                                 strError));
        }
        // Exactly 16 outputs fit
        std::vector<TransactionPayloadWord> words = builder.IntoAlignedWords();
        TransactionPayloadDecoder decoder(words.data(), words.size(), &MapContext);
        std::optional<PreparedMethod> decoded;
        TransactionPayloadDecoderError error;
        BOOST_CHECK(decoder.DecodeNextMethod(decoded, error) && decoded);
        BOOST_CHECK(decoder.DecodeNextMethod(decoded, error) && decoded);
        BOOST_CHECK(decoder.DecodeNextMethod(decoded, error) && !decoded);

        BOOST_REQUIRE(builder.WithMethodCall(contract, method, args, TransactionMethodContext::WALLET, {}, strError));
        BOOST_CHECK(DecodeFails(builder.IntoAlignedWords(),
                                TransactionPayloadDecoderError::OUTPUT_BUFFER_OFFSETS_TOO_SMALL));
    }
}

BOOST_AUTO_TEST_SUITE_END()
