// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/simple_wallet_base.h>

#include <contracts/metadata_builder.h>
#include <system/state.h>
#include <system/wallet_payload.h>
#include <util.h>

#include <cstring>
#include <limits>
#include <optional>

namespace ABVM {

namespace {

const char* const SIMPLE_WALLET_BASE_CODE = "abvm-system-simple-wallet-base";

std::vector<uint8_t> WalletStateType()
{
    return IoTypeMetadata::VariableBytes(sizeof(WalletState));
}

std::vector<uint8_t> InitializeMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "initialize")
        .Input("public_key", IoTypeMetadata::ByteArray(WALLET_PUBLIC_KEY_SIZE))
        .Output("state", WalletStateType())
        .Build();
}

std::vector<uint8_t> AuthorizeMetadata()
{
    MethodMetadataBuilder builder(MethodKind::VIEW_STATELESS, "authorize");
    builder.Input("state", WalletStateType());
    return TxHandlerInputs(builder).Build();
}

std::vector<uint8_t> ExecuteMetadata()
{
    MethodMetadataBuilder builder(MethodKind::UPDATE_STATELESS, "execute");
    builder.EnvRw();
    return TxHandlerInputs(builder).Build();
}

std::vector<uint8_t> IncreaseNonceMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "increase_nonce")
        .Input("state", WalletStateType())
        .Input("seal", IoTypeMetadata::VariableBytes(0))
        .Output("new_state", WalletStateType())
        .Build();
}

std::vector<uint8_t> ChangePublicKeyMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "change_public_key")
        .Input("state", WalletStateType())
        .Input("public_key", IoTypeMetadata::ByteArray(WALLET_PUBLIC_KEY_SIZE))
        .Output("new_state", WalletStateType())
        .Build();
}

ExitCode InitializeFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    ReadOnlyBytes publicKey = args.NextRo();
    ReadWriteBytes state = args.NextRw();

    if (publicKey.size != WALLET_PUBLIC_KEY_SIZE || !IsValidWalletPublicKey(publicKey.data, publicKey.size)) {
        return ContractError::BadInput().Code();
    }

    WalletState newState;
    std::memset(&newState, 0, sizeof(newState));
    std::memcpy(newState.publicKey, publicKey.data, WALLET_PUBLIC_KEY_SIZE);
    newState.nonce = 0;
    if (!state.Write(newState)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode AuthorizeFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    ReadOnlyBytes stateBytes = args.NextRo();
    TxHandlerArgs txArgs;
    if (!txArgs.FromInternalArgs(args)) {
        return ContractError::BadInput().Code();
    }

    WalletState state;
    Seal seal;
    if (!stateBytes.Read(state) || !ReadOnlyBytes{txArgs.seal, txArgs.sealSize}.Read(seal)) {
        return ContractError::BadInput().Code();
    }

    // Check if max nonce value was already reached
    if (state.nonce == std::numeric_limits<uint64_t>::max()) {
        return ContractError::Forbidden().Code();
    }

    return HashAndVerify(state.publicKey, state.nonce, *txArgs.header, txArgs.readSlots, txArgs.numReadSlots,
                         txArgs.writeSlots, txArgs.numWriteSlots, txArgs.payload, txArgs.numPayloadWords, seal)
        .ToExitCode();
}

MethodContext MapTransactionMethodContext(TransactionMethodContext methodContext)
{
    switch (methodContext) {
        case TransactionMethodContext::NULL_CONTEXT:
            return MethodContext::RESET;
        case TransactionMethodContext::WALLET:
            return MethodContext::KEEP;
    }
    return MethodContext::RESET;
}

ExitCode ExecuteFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    TxHandlerArgs txArgs;
    if (!txArgs.FromInternalArgs(args)) {
        return ContractError::BadInput().Code();
    }

    // Only allow direct calls by context owner
    if (env.Caller() != env.Context()) {
        return ContractError::Forbidden().Code();
    }

    TransactionPayloadDecoder decoder(txArgs.payload, txArgs.numPayloadWords, &MapTransactionMethodContext);
    while (true) {
        std::optional<PreparedMethod> preparedMethod;
        TransactionPayloadDecoderError decodeError = TransactionPayloadDecoderError::PAYLOAD_TOO_SMALL;
        if (!decoder.DecodeNextMethod(preparedMethod, decodeError)) {
            LogPrint(BCLog::SYSTEM, "SimpleWalletBase: invalid payload: %s\n",
                     TransactionPayloadDecoderErrorToString(decodeError));
            return ContractError::BadInput().Code();
        }
        if (!preparedMethod) {
            break;
        }
        ContractResult result = env.Call(*preparedMethod);
        if (!result) {
            return result.ToExitCode();
        }
    }

    return EXIT_CODE_OK;
}

ExitCode IncreaseNonceFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    ReadOnlyBytes stateBytes = args.NextRo();
    args.NextRo();
    ReadWriteBytes newState = args.NextRw();

    WalletState state;
    if (!stateBytes.Read(state)) {
        return ContractError::BadInput().Code();
    }
    if (state.nonce == std::numeric_limits<uint64_t>::max()) {
        return ContractError::Forbidden().Code();
    }
    ++state.nonce;

    if (!newState.Write(state)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode ChangePublicKeyFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    ReadOnlyBytes stateBytes = args.NextRo();
    ReadOnlyBytes publicKey = args.NextRo();
    ReadWriteBytes newState = args.NextRw();

    WalletState state;
    if (!stateBytes.Read(state)) {
        return ContractError::BadInput().Code();
    }
    if (publicKey.size != WALLET_PUBLIC_KEY_SIZE || !IsValidWalletPublicKey(publicKey.data, publicKey.size)) {
        return ContractError::BadInput().Code();
    }
    std::memcpy(state.publicKey, publicKey.data, WALLET_PUBLIC_KEY_SIZE);

    if (!newState.Write(state)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

/** Read the wallet state through the State contract */
ContractResult LoadCurrentState(Env& env, std::vector<uint8_t>& state)
{
    ContractResult result = StateRead(env, ADDRESS_SYSTEM_STATE, env.OwnAddress(), state);
    if (!result) {
        return result;
    }
    if (state.size() != sizeof(WalletState)) {
        return ContractResult::Err(ContractError::BadOutput());
    }
    return result;
}

ContractResult CallWithStateOutput(Env& env, const Address& walletBase, const MethodFingerprint& fingerprint,
                                   ExternalArgs& args, std::vector<uint8_t>& state, uint32_t& stateSize)
{
    ContractResult result = env.Call(walletBase, fingerprint, args, MethodContext::KEEP);
    if (result && stateSize != sizeof(WalletState)) {
        return ContractResult::Err(ContractError::BadOutput());
    }
    state.resize(result ? stateSize : 0);
    return result;
}

} // namespace

const NativeContract& SimpleWalletBaseContract()
{
    static const NativeContract contract = [] {
        NativeContract result;
        result.code = SIMPLE_WALLET_BASE_CODE;
        ContractMetadataBuilder builder(IoTypeMetadata::Struct("SimpleWalletBase", {}), IoTypeMetadata::Unit(),
                                        IoTypeMetadata::Unit());
        const std::pair<std::vector<uint8_t>, FfiFunction> methods[] = {
            {InitializeMetadata(), &InitializeFfi},
            {AuthorizeMetadata(), &AuthorizeFfi},
            {ExecuteMetadata(), &ExecuteFfi},
            {IncreaseNonceMetadata(), &IncreaseNonceFfi},
            {ChangePublicKeyMetadata(), &ChangePublicKeyFfi},
        };
        for (const auto& method : methods) {
            builder.Method(method.first);
            result.methods.push_back(NativeContractMethod::New(method.first, method.second));
        }
        result.mainContractMetadata = builder.Build();
        return result;
    }();
    return contract;
}

const MethodFingerprint& SimpleWalletBaseInitializeFingerprint() { return SimpleWalletBaseContract().methods[0].fingerprint; }
const MethodFingerprint& SimpleWalletBaseAuthorizeFingerprint() { return SimpleWalletBaseContract().methods[1].fingerprint; }
const MethodFingerprint& SimpleWalletBaseExecuteFingerprint() { return SimpleWalletBaseContract().methods[2].fingerprint; }
const MethodFingerprint& SimpleWalletBaseIncreaseNonceFingerprint() { return SimpleWalletBaseContract().methods[3].fingerprint; }
const MethodFingerprint& SimpleWalletBaseChangePublicKeyFingerprint() { return SimpleWalletBaseContract().methods[4].fingerprint; }

ContractResult SimpleWalletBaseInitialize(Env& env, const Address& walletBase, const WalletPublicKey& publicKey,
                                          std::vector<uint8_t>& state)
{
    const uint32_t publicKeySize = WALLET_PUBLIC_KEY_SIZE;
    state.resize(sizeof(WalletState));
    uint32_t stateSize = 0;
    const uint32_t stateCapacity = sizeof(WalletState);
    ExternalArgs args;
    args.Input(publicKey.data(), &publicKeySize).Output(state.data(), &stateSize, &stateCapacity);
    return CallWithStateOutput(env, walletBase, SimpleWalletBaseInitializeFingerprint(), args, state, stateSize);
}

ContractResult SimpleWalletBaseAuthorize(Env& env, const Address& walletBase, const std::vector<uint8_t>& state,
                                         const TxHandlerArgs& txArgs)
{
    const uint32_t stateSize = static_cast<uint32_t>(state.size());
    const uint32_t headerSize = sizeof(TransactionHeader);
    const uint32_t readSlotsSize = txArgs.numReadSlots * sizeof(TransactionSlot);
    const uint32_t writeSlotsSize = txArgs.numWriteSlots * sizeof(TransactionSlot);
    const uint32_t payloadSize = txArgs.numPayloadWords * sizeof(TransactionPayloadWord);
    const uint32_t sealSize = txArgs.sealSize;
    ExternalArgs args;
    args.Input(state.data(), &stateSize)
        .Input(txArgs.header, &headerSize)
        .Input(txArgs.readSlots, &readSlotsSize)
        .Input(txArgs.writeSlots, &writeSlotsSize)
        .Input(txArgs.payload, &payloadSize)
        .Input(txArgs.seal, &sealSize);
    return env.Call(walletBase, SimpleWalletBaseAuthorizeFingerprint(), args, MethodContext::KEEP);
}

ContractResult SimpleWalletBaseExecute(Env& env, MethodContext methodContext, const Address& walletBase,
                                       const TxHandlerArgs& txArgs)
{
    const uint32_t headerSize = sizeof(TransactionHeader);
    const uint32_t readSlotsSize = txArgs.numReadSlots * sizeof(TransactionSlot);
    const uint32_t writeSlotsSize = txArgs.numWriteSlots * sizeof(TransactionSlot);
    const uint32_t payloadSize = txArgs.numPayloadWords * sizeof(TransactionPayloadWord);
    const uint32_t sealSize = txArgs.sealSize;
    ExternalArgs args;
    args.Input(txArgs.header, &headerSize)
        .Input(txArgs.readSlots, &readSlotsSize)
        .Input(txArgs.writeSlots, &writeSlotsSize)
        .Input(txArgs.payload, &payloadSize)
        .Input(txArgs.seal, &sealSize);
    return env.Call(walletBase, SimpleWalletBaseExecuteFingerprint(), args, methodContext);
}

ContractResult SimpleWalletBaseIncreaseNonce(Env& env, const Address& walletBase, const std::vector<uint8_t>& state,
                                             const TxHandlerArgs& txArgs, std::vector<uint8_t>& newState)
{
    const uint32_t stateSize = static_cast<uint32_t>(state.size());
    const uint32_t sealSize = txArgs.sealSize;
    newState.resize(sizeof(WalletState));
    uint32_t newStateSize = 0;
    const uint32_t newStateCapacity = sizeof(WalletState);
    ExternalArgs args;
    args.Input(state.data(), &stateSize)
        .Input(txArgs.seal, &sealSize)
        .Output(newState.data(), &newStateSize, &newStateCapacity);
    return CallWithStateOutput(env, walletBase, SimpleWalletBaseIncreaseNonceFingerprint(), args, newState,
                               newStateSize);
}

ContractResult SimpleWalletBaseChangePublicKey(Env& env, const Address& walletBase,
                                               const std::vector<uint8_t>& state, const WalletPublicKey& publicKey,
                                               std::vector<uint8_t>& newState)
{
    const uint32_t stateSize = static_cast<uint32_t>(state.size());
    const uint32_t publicKeySize = WALLET_PUBLIC_KEY_SIZE;
    newState.resize(sizeof(WalletState));
    uint32_t newStateSize = 0;
    const uint32_t newStateCapacity = sizeof(WalletState);
    ExternalArgs args;
    args.Input(state.data(), &stateSize)
        .Input(publicKey.data(), &publicKeySize)
        .Output(newState.data(), &newStateSize, &newStateCapacity);
    return CallWithStateOutput(env, walletBase, SimpleWalletBaseChangePublicKeyFingerprint(), args, newState,
                               newStateSize);
}

ContractResult WalletInitializeState(Env& env, const WalletPublicKey& publicKey)
{
    std::vector<uint8_t> state;
    ContractResult result = SimpleWalletBaseInitialize(env, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, publicKey, state);
    if (!result) {
        return result;
    }
    return StateInitialize(env, MethodContext::RESET, ADDRESS_SYSTEM_STATE, env.OwnAddress(), state);
}

ContractResult WalletAuthorize(Env& env, const TxHandlerArgs& args)
{
    std::vector<uint8_t> state;
    ContractResult result = LoadCurrentState(env, state);
    if (!result) {
        return result;
    }
    return SimpleWalletBaseAuthorize(env, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, state, args);
}

ContractResult WalletExecute(Env& env, const TxHandlerArgs& args)
{
    // Only execution environment is allowed to make this call
    if (env.Caller() != ADDRESS_NULL) {
        return ContractResult::Err(ContractError::Forbidden());
    }

    std::vector<uint8_t> oldState;
    ContractResult result = LoadCurrentState(env, oldState);
    if (!result) {
        return result;
    }

    result = SimpleWalletBaseExecute(env, MethodContext::REPLACE, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, args);
    if (!result) {
        return result;
    }

    // Calls in the payload may have updated the state too (like changing the public key), so the nonce is
    // only increased if the state is still the one execution started with
    std::vector<uint8_t> newState;
    result = SimpleWalletBaseIncreaseNonce(env, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, oldState, args, newState);
    if (!result) {
        return result;
    }
    bool written = false;
    result = StateCompareAndWrite(env, MethodContext::RESET, ADDRESS_SYSTEM_STATE, env.OwnAddress(), oldState,
                                  newState, written);
    if (result && !written) {
        LogPrint(BCLog::SYSTEM, "SimpleWalletBase: state of %s changed during execution, nonce not increased\n",
                 env.OwnAddress().ToString());
    }
    return result;
}

ContractResult WalletChangePublicKey(Env& env, const WalletPublicKey& publicKey)
{
    if (!(env.Context() == env.OwnAddress() && env.Caller() == ADDRESS_SYSTEM_SIMPLE_WALLET_BASE)) {
        return ContractResult::Err(ContractError::Forbidden());
    }

    std::vector<uint8_t> oldState;
    ContractResult result = LoadCurrentState(env, oldState);
    if (!result) {
        return result;
    }
    std::vector<uint8_t> newState;
    result = SimpleWalletBaseChangePublicKey(env, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, oldState, publicKey, newState);
    if (!result) {
        return result;
    }
    return StateWrite(env, MethodContext::RESET, ADDRESS_SYSTEM_STATE, env.OwnAddress(), newState);
}

} // namespace ABVM
