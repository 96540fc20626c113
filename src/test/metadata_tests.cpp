// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file metadata_tests.cpp
 * @brief Tests for contract metadata encoding and streaming decoding
 */

#include <contracts/metadata.h>
#include <contracts/metadata_builder.h>
#include <contracts/method.h>
#include <system/state.h>
#include <test/test_abvm.h>
#include <test/test_contracts.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ABVM;

BOOST_FIXTURE_TEST_SUITE(metadata_tests, BasicTestingSetup)

/** One decoded method: "name:KIND(arg,arg,...)" */
static std::string DescribeMethod(const MethodMetadataItem& item, const std::vector<std::string>& arguments)
{
    std::string out = std::string(item.methodName) + ":" + MethodKindToString(item.methodKind) + "(";
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) out += ",";
        out += arguments[i];
    }
    return out + ")";
}

/**
 * Walk the whole metadata the way the executor does. Returns false and fills
 * error on the first decoding error.
 */
static bool DecodeAll(const std::vector<uint8_t>& metadata, std::vector<std::string>& items,
                      std::vector<std::string>& methods, MetadataDecodingError& error)
{
    MetadataDecoder decoder(metadata);
    while (true) {
        MetadataDecodeResult<MetadataItem> result = decoder.DecodeNext();
        if (result.IsEnd()) {
            return true;
        }
        if (result.IsError()) {
            error = result.GetError();
            return false;
        }
        MetadataItem& item = result.GetItem();
        items.push_back(item.IsContract() ? "contract " + item.stateTypeName : "trait " + std::string(item.traitName));

        while (std::optional<MethodMetadataDecoder> methodDecoder = item.methods.DecodeNext()) {
            MetadataDecodeResult<DecodedMethod> method = methodDecoder->DecodeNext();
            if (method.IsError()) {
                error = method.GetError();
                return false;
            }
            std::vector<std::string> arguments;
            while (true) {
                MetadataDecodeResult<ArgumentMetadataItem> argument = method.GetItem().arguments.DecodeNext();
                if (argument.IsEnd()) break;
                if (argument.IsError()) {
                    error = argument.GetError();
                    return false;
                }
                arguments.emplace_back(argument.GetItem().argumentName);
            }
            methods.push_back(DescribeMethod(method.GetItem().item, arguments));
        }
    }
}

static MetadataDecodingError DecodeError(const std::vector<uint8_t>& metadata)
{
    std::vector<std::string> items;
    std::vector<std::string> methods;
    MetadataDecodingError error;
    BOOST_REQUIRE(!DecodeAll(metadata, items, methods, error));
    return error;
}

static std::vector<uint8_t> Concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b)
{
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

BOOST_AUTO_TEST_CASE(decode_contract_and_traits)
{
    std::vector<std::string> items;
    std::vector<std::string> methods;
    MetadataDecodingError error;

    BOOST_REQUIRE(DecodeAll(FlipperContract().mainContractMetadata, items, methods, error));
    BOOST_REQUIRE_EQUAL(items.size(), 1U);
    BOOST_CHECK_EQUAL(items[0], "contract Flipper");
    BOOST_REQUIRE_EQUAL(methods.size(), 4U);
    BOOST_CHECK_EQUAL(methods[0], "new:Init(init_value,state)");
    BOOST_CHECK_EQUAL(methods[1], "flip:UpdateStatefulRw()");
    BOOST_CHECK_EQUAL(methods[2], "value:ViewStateful(value)");
    BOOST_CHECK_EQUAL(methods[3], "flip_and_fail:UpdateStatefulRw()");

    items.clear();
    methods.clear();
    BOOST_REQUIRE(DecodeAll(TestWalletContract().mainContractMetadata, items, methods, error));
    BOOST_REQUIRE_EQUAL(items.size(), 2U);
    BOOST_CHECK_EQUAL(items[0], "contract TestWallet");
    BOOST_CHECK_EQUAL(items[1], "trait TxHandler");
    BOOST_REQUIRE_EQUAL(methods.size(), 4U);
    BOOST_CHECK_EQUAL(methods[0], "initialize:UpdateStateless(env,public_key)");
    BOOST_CHECK_EQUAL(methods[2], "authorize:ViewStateless(env,header,read_slots,write_slots,payload,seal)");
    BOOST_CHECK_EQUAL(methods[3], "execute:UpdateStateless(env,header,read_slots,write_slots,payload,seal)");

    items.clear();
    methods.clear();
    BOOST_REQUIRE(DecodeAll(StateContract().mainContractMetadata, items, methods, error));
    BOOST_CHECK_EQUAL(methods.size(), StateContract().methods.size());
    BOOST_CHECK_EQUAL(methods.back(), "is_empty:ViewStateless(contract_state,is_empty)");

    // Empty metadata decodes to nothing
    const std::vector<uint8_t> nothing;
    MetadataDecoder empty(nothing);
    BOOST_CHECK(empty.DecodeNext().IsEnd());
}

BOOST_AUTO_TEST_CASE(decode_contract_types)
{
    MetadataDecoder decoder(TokenContract().mainContractMetadata);
    MetadataDecodeResult<MetadataItem> result = decoder.DecodeNext();
    BOOST_REQUIRE(result.IsItem());
    const MetadataItem& item = result.GetItem();
    BOOST_CHECK(item.IsContract());
    BOOST_CHECK_EQUAL(item.stateTypeName, "Token");
    BOOST_CHECK(item.stateTypeDetails == (IoTypeDetails{0, 1}));
    BOOST_CHECK(item.slotTypeDetails == (IoTypeDetails{8, 8}));
    BOOST_CHECK(item.tmpTypeDetails == (IoTypeDetails{8, 8}));
    BOOST_CHECK_EQUAL(item.numMethods, 4);
}

BOOST_AUTO_TEST_CASE(decode_argument_details)
{
    const std::vector<uint8_t> method = MethodMetadataBuilder(MethodKind::INIT, "new")
                                            .EnvRw()
                                            .Input("owner", IoTypeMetadata::Address())
                                            .Output("receipt", IoTypeMetadata::VariableBytes(64))
                                            .InitOutput("state")
                                            .Build();
    MetadataReader reader(method);
    MethodMetadataDecoder decoder(reader, MethodsContainerKind::UNKNOWN);
    MetadataDecodeResult<DecodedMethod> decoded = decoder.DecodeNext();
    BOOST_REQUIRE(decoded.IsItem());
    BOOST_CHECK_EQUAL(decoded.GetItem().item.methodName, "new");
    BOOST_CHECK_EQUAL(decoded.GetItem().item.numArguments, 4);

    ArgumentsMetadataDecoder& arguments = decoded.GetItem().arguments;
    MetadataDecodeResult<ArgumentMetadataItem> env = arguments.DecodeNext();
    BOOST_REQUIRE(env.IsItem());
    BOOST_CHECK_EQUAL(env.GetItem().argumentName, "env");
    BOOST_CHECK(env.GetItem().argumentKind == ArgumentKind::ENV_RW);
    BOOST_CHECK(!env.GetItem().typeDetails);

    MetadataDecodeResult<ArgumentMetadataItem> owner = arguments.DecodeNext();
    BOOST_REQUIRE(owner.IsItem());
    BOOST_REQUIRE(owner.GetItem().typeDetails);
    BOOST_CHECK(*owner.GetItem().typeDetails == (IoTypeDetails{16, 8}));

    MetadataDecodeResult<ArgumentMetadataItem> receipt = arguments.DecodeNext();
    BOOST_REQUIRE(receipt.IsItem());
    BOOST_CHECK(receipt.GetItem().argumentKind == ArgumentKind::OUTPUT);
    BOOST_REQUIRE(receipt.GetItem().typeDetails);
    BOOST_CHECK_EQUAL(receipt.GetItem().typeDetails->recommendedCapacity, 64U);

    // The new state has no type of its own
    MetadataDecodeResult<ArgumentMetadataItem> state = arguments.DecodeNext();
    BOOST_REQUIRE(state.IsItem());
    BOOST_CHECK_EQUAL(state.GetItem().argumentName, "state");
    BOOST_CHECK(!state.GetItem().typeDetails);

    BOOST_CHECK(arguments.DecodeNext().IsEnd());
    BOOST_CHECK_EQUAL(decoder.RemainingMetadataBytes(), 0U);
}

BOOST_AUTO_TEST_CASE(decode_top_level_errors)
{
    const std::vector<uint8_t> flipper = FlipperContract().mainContractMetadata;

    BOOST_CHECK(DecodeError(Concat(flipper, flipper)).kind == MetadataDecodingErrorKind::MULTIPLE_CONTRACTS_FOUND);

    MetadataDecodingError error = DecodeError(std::vector<uint8_t>{200});
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::INVALID_FIRST_METADATA_BYTE);
    BOOST_CHECK_EQUAL(static_cast<int>(error.byte), 200);
    BOOST_CHECK_EQUAL(error.ToString(), "Invalid first metadata byte 200");

    error = DecodeError(MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "orphan").Build());
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::EXPECTED_CONTRACT_OR_TRAIT);
    BOOST_CHECK(error.metadataKind == ContractMetadataKind::VIEW_STATELESS);

    // Invalid state type
    error = DecodeError(std::vector<uint8_t>{static_cast<uint8_t>(ContractMetadataKind::CONTRACT), 0xff});
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::FAILED_TO_DECODE_STATE_TYPE_NAME);

    // Enum variants of different sizes
    error = DecodeError(ContractMetadataBuilder(
        IoTypeMetadata::Enum("Broken", {{"A", {{"a", IoTypeMetadata::U8()}}}, {"B", {{"b", IoTypeMetadata::U32()}}}}),
        IoTypeMetadata::Unit(), IoTypeMetadata::Unit()).Build());
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::INVALID_STATE_IO_TYPE);

    // Method count promises more than there is
    std::vector<uint8_t> truncated = ContractMetadataBuilder(IoTypeMetadata::Unit(), IoTypeMetadata::Unit(),
                                                             IoTypeMetadata::Unit()).Build();
    truncated.back() = 1;
    BOOST_CHECK(DecodeError(truncated).kind == MetadataDecodingErrorKind::NOT_ENOUGH_METADATA);

    // A second contract after a trait is still a duplicate
    const std::vector<uint8_t> wallet = TestWalletContract().mainContractMetadata;
    BOOST_CHECK(DecodeError(Concat(wallet, flipper)).kind == MetadataDecodingErrorKind::MULTIPLE_CONTRACTS_FOUND);
}

BOOST_AUTO_TEST_CASE(decode_truncated_metadata)
{
    const std::vector<uint8_t> flipper = FlipperContract().mainContractMetadata;
    for (size_t len = 1; len < flipper.size(); ++len) {
        std::vector<uint8_t> prefix(flipper.begin(), flipper.begin() + len);
        std::vector<std::string> items;
        std::vector<std::string> methods;
        MetadataDecodingError error;
        BOOST_CHECK_MESSAGE(!DecodeAll(prefix, items, methods, error), strprintf("prefix of %u bytes", len));
    }
}

BOOST_AUTO_TEST_CASE(decode_method_kind_legality)
{
    // Only stateless methods in traits
    const std::vector<uint8_t> initTrait = TraitMetadataBuilder("Bad")
        .Method(MethodMetadataBuilder(MethodKind::INIT, "new").InitOutput("state").Build())
        .Build();
    MetadataDecodingError error = DecodeError(initTrait);
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::UNEXPECTED_METHOD_KIND);
    BOOST_CHECK(error.methodKind == MethodKind::INIT);
    BOOST_CHECK(error.containerKind == MethodsContainerKind::TRAIT);

    const std::vector<uint8_t> statefulTrait = TraitMetadataBuilder("Bad")
        .Method(MethodMetadataBuilder(MethodKind::VIEW_STATEFUL, "get").Build())
        .Build();
    BOOST_CHECK(DecodeError(statefulTrait).kind == MetadataDecodingErrorKind::UNEXPECTED_METHOD_KIND);

    // Contracts accept every method kind
    const std::vector<uint8_t> allKinds = ContractMetadataBuilder(IoTypeMetadata::Unit(), IoTypeMetadata::Unit(),
                                                                  IoTypeMetadata::Unit())
        .Method(MethodMetadataBuilder(MethodKind::INIT, "a").InitOutput("state").Build())
        .Method(MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "b").Build())
        .Method(MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RO, "c").Build())
        .Method(MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RW, "d").Build())
        .Method(MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "e").Build())
        .Method(MethodMetadataBuilder(MethodKind::VIEW_STATEFUL, "f").Build())
        .Build();
    std::vector<std::string> items;
    std::vector<std::string> methods;
    BOOST_CHECK(DecodeAll(allKinds, items, methods, error));
    BOOST_CHECK_EQUAL(methods.size(), 6U);

    // So does standalone method metadata
    const std::vector<uint8_t> init = MethodMetadataBuilder(MethodKind::INIT, "new").InitOutput("state").Build();
    MetadataReader reader(init);
    BOOST_CHECK(MethodMetadataDecoder(reader, MethodsContainerKind::UNKNOWN).DecodeNext().IsItem());

    // An argument where a method is expected
    std::vector<uint8_t> notMethod{static_cast<uint8_t>(ContractMetadataKind::INPUT)};
    MetadataReader argReader(notMethod);
    MetadataDecodeResult<DecodedMethod> result = MethodMetadataDecoder(argReader, MethodsContainerKind::UNKNOWN).DecodeNext();
    BOOST_REQUIRE(result.IsError());
    BOOST_CHECK(result.GetError().kind == MetadataDecodingErrorKind::EXPECTED_METHOD_KIND);
}

static MetadataDecodingError FirstArgumentError(const std::vector<uint8_t>& method)
{
    MetadataReader reader(method);
    MetadataDecodeResult<DecodedMethod> decoded = MethodMetadataDecoder(reader, MethodsContainerKind::UNKNOWN).DecodeNext();
    BOOST_REQUIRE(decoded.IsItem());
    while (true) {
        MetadataDecodeResult<ArgumentMetadataItem> argument = decoded.GetItem().arguments.DecodeNext();
        BOOST_REQUIRE(!argument.IsEnd());
        if (argument.IsError()) {
            return argument.GetError();
        }
    }
}

static const MethodKind ALL_METHOD_KINDS[] = {
    MethodKind::INIT, MethodKind::UPDATE_STATELESS, MethodKind::UPDATE_STATEFUL_RO,
    MethodKind::UPDATE_STATEFUL_RW, MethodKind::VIEW_STATELESS, MethodKind::VIEW_STATEFUL,
};

static const ArgumentKind ALL_ARGUMENT_KINDS[] = {
    ArgumentKind::ENV_RO, ArgumentKind::ENV_RW, ArgumentKind::TMP_RO, ArgumentKind::TMP_RW,
    ArgumentKind::SLOT_RO, ArgumentKind::SLOT_RW, ArgumentKind::INPUT, ArgumentKind::OUTPUT,
};

static MethodMetadataBuilder& AddArgument(MethodMetadataBuilder& builder, MethodKind methodKind,
                                          ArgumentKind argumentKind, const std::string& name,
                                          const std::vector<uint8_t>& type, bool last)
{
    switch (argumentKind) {
        case ArgumentKind::ENV_RO: return builder.EnvRo();
        case ArgumentKind::ENV_RW: return builder.EnvRw();
        case ArgumentKind::TMP_RO: return builder.TmpRo(name);
        case ArgumentKind::TMP_RW: return builder.TmpRw(name);
        case ArgumentKind::SLOT_RO: return builder.SlotRo(name);
        case ArgumentKind::SLOT_RW: return builder.SlotRw(name);
        case ArgumentKind::INPUT: return builder.Input(name, type);
        case ArgumentKind::OUTPUT:
            if (methodKind == MethodKind::INIT && last) {
                return builder.InitOutput(name);
            }
            return builder.Output(name, type);
    }
    return builder;
}

static bool ExpectArgumentAllowed(MethodKind methodKind, ArgumentKind argumentKind)
{
    switch (methodKind) {
        case MethodKind::INIT:
        case MethodKind::UPDATE_STATELESS:
        case MethodKind::UPDATE_STATEFUL_RO:
        case MethodKind::UPDATE_STATEFUL_RW:
            return true;
        case MethodKind::VIEW_STATELESS:
        case MethodKind::VIEW_STATEFUL:
            return argumentKind == ArgumentKind::ENV_RO || argumentKind == ArgumentKind::SLOT_RO ||
                   argumentKind == ArgumentKind::INPUT || argumentKind == ArgumentKind::OUTPUT;
    }
    return false;
}

BOOST_AUTO_TEST_CASE(decode_argument_kind_legality)
{
    for (MethodKind methodKind : ALL_METHOD_KINDS) {
        for (ArgumentKind argumentKind : ALL_ARGUMENT_KINDS) {
            const std::string what = MethodKindToString(methodKind) + "/" + ArgumentKindToString(argumentKind);
            MethodMetadataBuilder builder(methodKind, "m");
            AddArgument(builder, methodKind, argumentKind, "a", IoTypeMetadata::U32(), true);
            const std::vector<uint8_t> method = builder.Build();

            MetadataReader reader(method);
            MetadataDecodeResult<DecodedMethod> decoded =
                MethodMetadataDecoder(reader, MethodsContainerKind::CONTRACT).DecodeNext();
            BOOST_REQUIRE_MESSAGE(decoded.IsItem(), what);
            MetadataDecodeResult<ArgumentMetadataItem> argument = decoded.GetItem().arguments.DecodeNext();

            if (ExpectArgumentAllowed(methodKind, argumentKind)) {
                BOOST_CHECK_MESSAGE(argument.IsItem(), what);
                if (argument.IsItem()) {
                    BOOST_CHECK_MESSAGE(argument.GetItem().argumentKind == argumentKind, what);
                }
                BOOST_CHECK_MESSAGE(decoded.GetItem().arguments.DecodeNext().IsEnd(), what);
                BOOST_CHECK_MESSAGE(reader.Empty(), what);
            } else {
                BOOST_REQUIRE_MESSAGE(argument.IsError(), what);
                const MetadataDecodingError& error = argument.GetError();
                BOOST_CHECK_MESSAGE(error.kind == MetadataDecodingErrorKind::UNEXPECTED_ARGUMENT_KIND, what);
                BOOST_CHECK_MESSAGE(error.argumentKind == argumentKind, what);
                BOOST_CHECK_MESSAGE(error.methodKind == methodKind, what);
            }
        }
    }

    // A method kind where an argument is expected
    std::vector<uint8_t> method = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "u").Build();
    method.back() = 1;
    method.push_back(static_cast<uint8_t>(ContractMetadataKind::INIT));
    BOOST_CHECK(FirstArgumentError(method).kind == MetadataDecodingErrorKind::EXPECTED_ARGUMENT_KIND);

    // Input with a broken type
    std::vector<uint8_t> badInput = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "u").Input("amount", {0xff}).Build();
    MetadataDecodingError error = FirstArgumentError(badInput);
    BOOST_CHECK(error.kind == MetadataDecodingErrorKind::INVALID_ARGUMENT_IO_TYPE);
    BOOST_CHECK_EQUAL(error.argumentName, "amount");
    BOOST_CHECK(error.argumentKind == ArgumentKind::INPUT);
}

BOOST_AUTO_TEST_CASE(metadata_builder_limits)
{
    const std::string longName(256, 'n');
    BOOST_CHECK_THROW(MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, longName), std::invalid_argument);
    BOOST_CHECK_THROW(TraitMetadataBuilder{longName}, std::invalid_argument);
    BOOST_CHECK_THROW(MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "m").SlotRo(longName), std::invalid_argument);

    MethodMetadataBuilder builder(MethodKind::UPDATE_STATELESS, "many");
    for (int i = 0; i < 255; ++i) {
        builder.EnvRo();
    }
    BOOST_CHECK_THROW(builder.EnvRo(), std::invalid_argument);

    ContractMetadataBuilder contract(IoTypeMetadata::Unit(), IoTypeMetadata::Unit(), IoTypeMetadata::Unit());
    const std::vector<uint8_t> method = MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "m").Build();
    for (int i = 0; i < 255; ++i) {
        contract.Method(method);
    }
    BOOST_CHECK_THROW(contract.Method(method), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(metadata_builder_encoding)
{
    const std::vector<uint8_t> method = MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "get")
        .SlotRo("owner")
        .Output("value", IoTypeMetadata::U64())
        .Build();
    const std::vector<uint8_t> expected{
        static_cast<uint8_t>(ContractMetadataKind::VIEW_STATELESS), 3, 'g', 'e', 't', 2,
        static_cast<uint8_t>(ContractMetadataKind::SLOT_RO), 5, 'o', 'w', 'n', 'e', 'r',
        static_cast<uint8_t>(ContractMetadataKind::OUTPUT), 5, 'v', 'a', 'l', 'u', 'e',
        static_cast<uint8_t>(IoTypeMetadataKind::U64),
    };
    BOOST_CHECK(method == expected);

    // Fingerprints follow the metadata
    const std::vector<uint8_t> other = MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "get")
        .SlotRo("owner")
        .Output("value", IoTypeMetadata::U32())
        .Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(method) == MethodFingerprint::FromMetadata(method));
    BOOST_CHECK(MethodFingerprint::FromMetadata(method) != MethodFingerprint::FromMetadata(other));

    const std::vector<uint8_t> trait = TraitMetadataBuilder("T").Method(method).Build();
    BOOST_REQUIRE_EQUAL(trait.size(), 4 + method.size());
    BOOST_CHECK_EQUAL(trait[0], static_cast<uint8_t>(ContractMetadataKind::TRAIT));
    BOOST_CHECK_EQUAL(trait[3], 1);
}

struct ExpectedArgument {
    ArgumentKind kind;
    std::string name;
    std::vector<uint8_t> type;
    std::optional<IoTypeDetails> details;
};

struct ExpectedMethod {
    MethodKind kind;
    std::string name;
    std::vector<ExpectedArgument> arguments;
};

static std::vector<uint8_t> BuildMethod(const ExpectedMethod& expected)
{
    MethodMetadataBuilder builder(expected.kind, expected.name);
    for (size_t i = 0; i < expected.arguments.size(); ++i) {
        const ExpectedArgument& argument = expected.arguments[i];
        AddArgument(builder, expected.kind, argument.kind, argument.name, argument.type,
                    i + 1 == expected.arguments.size());
    }
    return builder.Build();
}

/** Decodes every method of the item and compares it field by field */
static void CheckMethods(MetadataItem& item, const std::vector<ExpectedMethod>& expected, size_t remainingAfter)
{
    BOOST_REQUIRE_EQUAL(size_t{item.numMethods}, expected.size());
    size_t remainingBytes = SIZE_MAX;
    for (const ExpectedMethod& expectedMethod : expected) {
        std::optional<MethodMetadataDecoder> methodDecoder = item.methods.DecodeNext();
        BOOST_REQUIRE(methodDecoder);
        MetadataDecodeResult<DecodedMethod> method = methodDecoder->DecodeNext();
        BOOST_REQUIRE(method.IsItem());
        const MethodMetadataItem& header = method.GetItem().item;
        BOOST_CHECK_EQUAL(header.methodName, expectedMethod.name);
        BOOST_CHECK(header.methodKind == expectedMethod.kind);
        BOOST_REQUIRE_EQUAL(size_t{header.numArguments}, expectedMethod.arguments.size());

        for (const ExpectedArgument& expectedArgument : expectedMethod.arguments) {
            MetadataDecodeResult<ArgumentMetadataItem> argument = method.GetItem().arguments.DecodeNext();
            BOOST_REQUIRE(argument.IsItem());
            BOOST_CHECK_EQUAL(argument.GetItem().argumentName, expectedArgument.name);
            BOOST_CHECK(argument.GetItem().argumentKind == expectedArgument.kind);
            BOOST_CHECK(argument.GetItem().typeDetails == expectedArgument.details);
        }
        BOOST_CHECK(method.GetItem().arguments.DecodeNext().IsEnd());
        remainingBytes = methodDecoder->RemainingMetadataBytes();
    }
    BOOST_CHECK(!item.methods.DecodeNext());
    BOOST_CHECK_EQUAL(remainingBytes, remainingAfter);
}

BOOST_AUTO_TEST_CASE(builder_decoder_round_trip)
{
    const std::vector<ExpectedMethod> contractMethods{
        {MethodKind::INIT, "new", {
            {ArgumentKind::ENV_RW, "env", {}, std::nullopt},
            {ArgumentKind::INPUT, "owner", IoTypeMetadata::Address(), IoTypeDetails{16, 8}},
            {ArgumentKind::OUTPUT, "state", {}, std::nullopt},
        }},
        {MethodKind::UPDATE_STATEFUL_RW, "deposit", {
            {ArgumentKind::ENV_RO, "env", {}, std::nullopt},
            {ArgumentKind::TMP_RW, "pending", {}, std::nullopt},
            {ArgumentKind::SLOT_RW, "account", {}, std::nullopt},
            {ArgumentKind::INPUT, "amount", IoTypeMetadata::Balance(), IoTypeDetails{16, 8}},
            {ArgumentKind::OUTPUT, "receipt", IoTypeMetadata::FixedCapacityBytes(32), IoTypeDetails{33, 1}},
        }},
        {MethodKind::UPDATE_STATEFUL_RO, "audit", {
            {ArgumentKind::TMP_RO, "cache", {}, std::nullopt},
            {ArgumentKind::INPUT, "range",
             IoTypeMetadata::TupleStruct("Range", {IoTypeMetadata::U32(), IoTypeMetadata::U32()}), IoTypeDetails{8, 4}},
        }},
        {MethodKind::VIEW_STATEFUL, "balance", {
            {ArgumentKind::SLOT_RO, "account", {}, std::nullopt},
            {ArgumentKind::OUTPUT, "value", IoTypeMetadata::Balance(), IoTypeDetails{16, 8}},
        }},
        {MethodKind::UPDATE_STATELESS, "noop", {}},
    };
    const std::vector<ExpectedMethod> traitMethods{
        {MethodKind::VIEW_STATELESS, "check", {
            {ArgumentKind::ENV_RO, "env", {}, std::nullopt},
            {ArgumentKind::INPUT, "data", IoTypeMetadata::VariableBytes(100), IoTypeDetails{100, 1}},
            {ArgumentKind::OUTPUT, "ok", IoTypeMetadata::Bool(), IoTypeDetails{1, 1}},
        }},
        {MethodKind::UPDATE_STATELESS, "touch", {
            {ArgumentKind::ENV_RW, "env", {}, std::nullopt},
            {ArgumentKind::SLOT_RW, "s", {}, std::nullopt},
        }},
    };

    ContractMetadataBuilder contract(
        IoTypeMetadata::Struct("Vault", {{"owner", IoTypeMetadata::Address()}, {"balance", IoTypeMetadata::Balance()}}),
        IoTypeMetadata::U64(), IoTypeMetadata::Unit());
    for (const ExpectedMethod& method : contractMethods) {
        contract.Method(BuildMethod(method));
    }
    TraitMetadataBuilder trait("Auditable");
    for (const ExpectedMethod& method : traitMethods) {
        trait.Method(BuildMethod(method));
    }
    const std::vector<uint8_t> traitMetadata = trait.Build();
    const std::vector<uint8_t> metadata = contract.Trait(traitMetadata).Build();

    MetadataDecoder decoder(metadata);
    MetadataDecodeResult<MetadataItem> first = decoder.DecodeNext();
    BOOST_REQUIRE(first.IsItem());
    MetadataItem& contractItem = first.GetItem();
    BOOST_CHECK(contractItem.kind == ContractMetadataKind::CONTRACT);
    BOOST_CHECK_EQUAL(contractItem.stateTypeName, "Vault");
    BOOST_CHECK(contractItem.stateTypeDetails == (IoTypeDetails{32, 8}));
    BOOST_CHECK(contractItem.slotTypeDetails == (IoTypeDetails{8, 8}));
    BOOST_CHECK(contractItem.tmpTypeDetails == (IoTypeDetails{0, 1}));
    // Only the trait is left once the contract's methods are decoded
    CheckMethods(contractItem, contractMethods, traitMetadata.size());

    MetadataDecodeResult<MetadataItem> second = decoder.DecodeNext();
    BOOST_REQUIRE(second.IsItem());
    MetadataItem& traitItem = second.GetItem();
    BOOST_CHECK(traitItem.kind == ContractMetadataKind::TRAIT);
    BOOST_CHECK_EQUAL(traitItem.traitName, "Auditable");
    CheckMethods(traitItem, traitMethods, 0);

    BOOST_CHECK(decoder.DecodeNext().IsEnd());

    // A trait on its own decodes the same way
    MetadataDecoder traitDecoder(traitMetadata);
    MetadataDecodeResult<MetadataItem> standalone = traitDecoder.DecodeNext();
    BOOST_REQUIRE(standalone.IsItem());
    CheckMethods(standalone.GetItem(), traitMethods, 0);
    BOOST_CHECK(traitDecoder.DecodeNext().IsEnd());
}

BOOST_AUTO_TEST_CASE(compact_metadata)
{
    using K = ContractMetadataKind;
    const auto tag = [](K kind) { return static_cast<uint8_t>(kind); };

    const std::vector<uint8_t> method = MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RW, "set")
        .EnvRw()
        .SlotRw("owner")
        .Input("value", IoTypeMetadata::Struct("Pair", {{"a", IoTypeMetadata::U8()}, {"b", IoTypeMetadata::U16()}}))
        .Build();
    const uint8_t tuplePair = static_cast<uint8_t>(IoTypeMetadataKind::TUPLE_STRUCT1) + 1;
    const uint8_t u8 = static_cast<uint8_t>(IoTypeMetadataKind::U8);
    const uint8_t u16 = static_cast<uint8_t>(IoTypeMetadataKind::U16);

    // Names are dropped, the method name and argument count stay
    const std::vector<uint8_t> compact{
        tag(K::UPDATE_STATEFUL_RW), 3, 's', 'e', 't', 3,
        tag(K::ENV_RW),
        tag(K::SLOT_RW), 0,
        tag(K::INPUT), 0, tuplePair, 0, u8, u16,
    };
    BOOST_CHECK(CompactMetadata(method) == compact);

    const std::vector<uint8_t> external{
        tag(K::UPDATE_STATELESS), 3, 's', 'e', 't', 3,
        tag(K::SLOT_RO), 0,
        tag(K::INPUT), 0, tuplePair, 0, u8, u16,
    };
    BOOST_CHECK(CompactExternalArgsMetadata(method) == external);

    // Traits lose their name
    const std::vector<uint8_t> trait = TraitMetadataBuilder("Named")
        .Method(MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "v").Build())
        .Build();
    const std::vector<uint8_t> compactTrait{tag(K::TRAIT), 0, 1, tag(K::VIEW_STATELESS), 1, 'v', 0};
    BOOST_CHECK(CompactMetadata(trait) == compactTrait);

    // Init state output has no type to compact
    const std::vector<uint8_t> init = MethodMetadataBuilder(MethodKind::INIT, "new").InitOutput("state").Build();
    const std::vector<uint8_t> compactInit{tag(K::INIT), 3, 'n', 'e', 'w', 1, tag(K::OUTPUT), 0};
    BOOST_CHECK(CompactMetadata(init) == compactInit);

    BOOST_CHECK(CompactMetadata(FlipperContract().mainContractMetadata));
    // One item at a time, a contract followed by its traits is not a single item
    BOOST_CHECK(!CompactMetadata(TestWalletContract().mainContractMetadata));
    BOOST_CHECK(!CompactMetadata({}));
    BOOST_CHECK(!CompactMetadata(std::vector<uint8_t>{tag(K::INPUT)}));
    BOOST_CHECK(!CompactMetadata(Concat(init, {0})));
    std::vector<uint8_t> truncated = method;
    truncated.pop_back();
    BOOST_CHECK(!CompactMetadata(truncated));
}

BOOST_AUTO_TEST_CASE(fingerprint_ignores_names)
{
    const std::vector<uint8_t> transfer = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "transfer")
        .EnvRo()
        .Input("from", IoTypeMetadata::Address())
        .Input("to", IoTypeMetadata::Address())
        .Input("amount", IoTypeMetadata::Struct("Amount", {{"value", IoTypeMetadata::Balance()}}))
        .Build();
    const std::vector<uint8_t> renamed = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "transfer")
        .EnvRo()
        .Input("sender", IoTypeMetadata::Address())
        .Input("receiver", IoTypeMetadata::Address())
        .Input("value", IoTypeMetadata::Struct("Value", {{"inner", IoTypeMetadata::Balance()}}))
        .Build();
    BOOST_CHECK(transfer != renamed);
    BOOST_CHECK(MethodFingerprint::FromMetadata(transfer) == MethodFingerprint::FromMetadata(renamed));

    // Env and the flavor of update are not visible to callers
    const std::vector<uint8_t> stateful = MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RW, "transfer")
        .EnvRw()
        .Input("from", IoTypeMetadata::Address())
        .Input("to", IoTypeMetadata::Address())
        .Input("amount", IoTypeMetadata::Struct("Amount", {{"value", IoTypeMetadata::Balance()}}))
        .Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(stateful) == MethodFingerprint::FromMetadata(transfer));
    // A tmp argument is skipped, but the argument count still includes it
    const std::vector<uint8_t> withTmp = MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RW, "transfer")
        .EnvRw()
        .TmpRw("scratch")
        .Input("from", IoTypeMetadata::Address())
        .Input("to", IoTypeMetadata::Address())
        .Input("amount", IoTypeMetadata::Struct("Amount", {{"value", IoTypeMetadata::Balance()}}))
        .Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(withTmp) != MethodFingerprint::FromMetadata(transfer));
    const std::vector<uint8_t> slotRo = MethodMetadataBuilder(MethodKind::VIEW_STATEFUL, "get").SlotRo("s").Build();
    const std::vector<uint8_t> slotRw = MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "get").SlotRw("t").Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(slotRo) == MethodFingerprint::FromMetadata(slotRw));

    // Method name and argument types still matter
    const std::vector<uint8_t> otherName = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "send")
        .EnvRo()
        .Input("from", IoTypeMetadata::Address())
        .Input("to", IoTypeMetadata::Address())
        .Input("amount", IoTypeMetadata::Struct("Amount", {{"value", IoTypeMetadata::Balance()}}))
        .Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(otherName) != MethodFingerprint::FromMetadata(transfer));
    const std::vector<uint8_t> otherType = MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "transfer")
        .EnvRo()
        .Input("from", IoTypeMetadata::Address())
        .Input("to", IoTypeMetadata::Address())
        .Input("amount", IoTypeMetadata::Struct("Amount", {{"value", IoTypeMetadata::U128()}}))
        .Build();
    BOOST_CHECK(MethodFingerprint::FromMetadata(otherType) != MethodFingerprint::FromMetadata(transfer));

    BOOST_CHECK_THROW(MethodFingerprint::FromMetadata({}), std::invalid_argument);
    BOOST_CHECK_THROW(MethodFingerprint::FromMetadata(std::vector<uint8_t>{0xff}), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
