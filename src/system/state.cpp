// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/state.h>

#include <contracts/metadata_builder.h>
#include <util.h>

#include <cstring>

namespace ABVM {

namespace {

const char* const STATE_CODE = "abvm-system-state";

std::vector<uint8_t> WriteLikeMetadata(const std::string& name)
{
    return MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, name)
        .EnvRw()
        .SlotRw("contract_state")
        .Input("state", IoTypeMetadata::VariableBytes(STATE_RECOMMENDED_CAPACITY))
        .Build();
}

std::vector<uint8_t> CompareAndWriteMetadata()
{
    return MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "compare_and_write")
        .EnvRw()
        .SlotRw("contract_state")
        .Input("old_state", IoTypeMetadata::VariableBytes(STATE_RECOMMENDED_CAPACITY))
        .Input("new_state", IoTypeMetadata::VariableBytes(STATE_RECOMMENDED_CAPACITY))
        .Output("written", IoTypeMetadata::Bool())
        .Build();
}

std::vector<uint8_t> ReadMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "read")
        .SlotRo("contract_state")
        .Output("state", IoTypeMetadata::VariableBytes(STATE_RECOMMENDED_CAPACITY))
        .Build();
}

std::vector<uint8_t> IsEmptyMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "is_empty")
        .SlotRo("contract_state")
        .Output("is_empty", IoTypeMetadata::Bool())
        .Build();
}

bool SameBytes(const ReadOnlyBytes& a, const ReadOnlyBytes& b)
{
    return a.size == b.size && (a.size == 0 || std::memcmp(a.data, b.data, a.size) == 0);
}

ExitCode WriteState(Env& env, const Address& address, ReadWriteBytes& state, const ReadOnlyBytes& newState)
{
    // Only the contract itself may write its state, and only directly
    if (env.Caller() != address) {
        LogPrint(BCLog::SYSTEM, "State: %s is not allowed to write state of %s\n", env.Caller().ToString(),
                 address.ToString());
        return ContractError::Forbidden().Code();
    }
    if (!state.Assign(newState.data, newState.size)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode InitializeFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    const Address& address = args.NextAddress();
    ReadWriteBytes contractState = args.NextRw();
    ReadOnlyBytes state = args.NextRo();

    if (contractState.Size() != 0) {
        return ContractError::Conflict().Code();
    }
    return WriteState(env, address, contractState, state);
}

ExitCode WriteFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    const Address& address = args.NextAddress();
    ReadWriteBytes contractState = args.NextRw();
    ReadOnlyBytes newState = args.NextRo();

    return WriteState(env, address, contractState, newState);
}

ExitCode CompareAndWriteFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    const Address& address = args.NextAddress();
    ReadWriteBytes contractState = args.NextRw();
    ReadOnlyBytes oldState = args.NextRo();
    ReadOnlyBytes newState = args.NextRo();
    ReadWriteBytes written = args.NextRw();

    if (env.Caller() != address) {
        return ContractError::Forbidden().Code();
    }

    if (!SameBytes(contractState.AsReadOnly(), oldState)) {
        if (!written.Write(uint8_t{0})) {
            return ContractError::BadOutput().Code();
        }
        return EXIT_CODE_OK;
    }

    const ExitCode exitCode = WriteState(env, address, contractState, newState);
    if (exitCode != EXIT_CODE_OK) {
        return exitCode;
    }
    if (!written.Write(uint8_t{1})) {
        return ContractError::BadOutput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode ReadFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    args.NextAddress();
    ReadOnlyBytes contractState = args.NextRo();
    ReadWriteBytes state = args.NextRw();

    if (!state.Assign(contractState.data, contractState.size)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode IsEmptyFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    args.NextAddress();
    ReadOnlyBytes contractState = args.NextRo();
    ReadWriteBytes isEmpty = args.NextRw();

    const uint8_t value = contractState.size == 0 ? 1 : 0;
    if (!isEmpty.Write(value)) {
        return ContractError::BadOutput().Code();
    }
    return EXIT_CODE_OK;
}

ContractResult ReadBool(const ContractResult& result, uint32_t size, uint8_t value, bool& out)
{
    if (!result) {
        return result;
    }
    if (size != 1 || value > 1) {
        return ContractResult::Err(ContractError::BadOutput());
    }
    out = value == 1;
    return result;
}

} // namespace

const NativeContract& StateContract()
{
    static const NativeContract contract = [] {
        NativeContract result;
        result.code = STATE_CODE;
        std::vector<std::pair<std::vector<uint8_t>, FfiFunction>> methods{
            {WriteLikeMetadata("initialize"), &InitializeFfi},
            {WriteLikeMetadata("write"), &WriteFfi},
            {CompareAndWriteMetadata(), &CompareAndWriteFfi},
            {ReadMetadata(), &ReadFfi},
            {IsEmptyMetadata(), &IsEmptyFfi},
        };
        ContractMetadataBuilder builder(IoTypeMetadata::Struct("State", {}),
                                        IoTypeMetadata::VariableBytes(STATE_RECOMMENDED_CAPACITY),
                                        IoTypeMetadata::Unit());
        for (const auto& method : methods) {
            builder.Method(method.first);
            result.methods.push_back(NativeContractMethod::New(method.first, method.second));
        }
        result.mainContractMetadata = builder.Build();
        return result;
    }();
    return contract;
}

const MethodFingerprint& StateInitializeFingerprint() { return StateContract().methods[0].fingerprint; }
const MethodFingerprint& StateWriteFingerprint() { return StateContract().methods[1].fingerprint; }
const MethodFingerprint& StateCompareAndWriteFingerprint() { return StateContract().methods[2].fingerprint; }
const MethodFingerprint& StateReadFingerprint() { return StateContract().methods[3].fingerprint; }
const MethodFingerprint& StateIsEmptyFingerprint() { return StateContract().methods[4].fingerprint; }

ContractResult StateInitialize(Env& env, MethodContext methodContext, const Address& stateContract,
                               const Address& address, const std::vector<uint8_t>& state)
{
    const uint32_t stateSize = static_cast<uint32_t>(state.size());
    ExternalArgs args;
    args.Slot(&address).Input(state.data(), &stateSize);
    return env.Call(stateContract, StateInitializeFingerprint(), args, methodContext);
}

ContractResult StateWrite(Env& env, MethodContext methodContext, const Address& stateContract,
                          const Address& address, const std::vector<uint8_t>& newState)
{
    const uint32_t newStateSize = static_cast<uint32_t>(newState.size());
    ExternalArgs args;
    args.Slot(&address).Input(newState.data(), &newStateSize);
    return env.Call(stateContract, StateWriteFingerprint(), args, methodContext);
}

ContractResult StateCompareAndWrite(Env& env, MethodContext methodContext, const Address& stateContract,
                                    const Address& address, const std::vector<uint8_t>& oldState,
                                    const std::vector<uint8_t>& newState, bool& written)
{
    const uint32_t oldStateSize = static_cast<uint32_t>(oldState.size());
    const uint32_t newStateSize = static_cast<uint32_t>(newState.size());
    uint8_t writtenValue = 0;
    uint32_t writtenSize = 0;
    const uint32_t writtenCapacity = 1;
    ExternalArgs args;
    args.Slot(&address)
        .Input(oldState.data(), &oldStateSize)
        .Input(newState.data(), &newStateSize)
        .Output(&writtenValue, &writtenSize, &writtenCapacity);
    return ReadBool(env.Call(stateContract, StateCompareAndWriteFingerprint(), args, methodContext), writtenSize,
                    writtenValue, written);
}

ContractResult StateRead(Env& env, const Address& stateContract, const Address& address,
                         std::vector<uint8_t>& state)
{
    state.resize(STATE_RECOMMENDED_CAPACITY);
    uint32_t stateSize = 0;
    const uint32_t stateCapacity = STATE_RECOMMENDED_CAPACITY;
    ExternalArgs args;
    args.Slot(&address).Output(state.data(), &stateSize, &stateCapacity);
    ContractResult result = env.Call(stateContract, StateReadFingerprint(), args, MethodContext::KEEP);
    state.resize(result ? stateSize : 0);
    return result;
}

ContractResult StateIsEmpty(Env& env, const Address& stateContract, const Address& address, bool& isEmpty)
{
    uint8_t value = 0;
    uint32_t size = 0;
    const uint32_t capacity = 1;
    ExternalArgs args;
    args.Slot(&address).Output(&value, &size, &capacity);
    return ReadBool(env.Call(stateContract, StateIsEmptyFingerprint(), args, MethodContext::KEEP), size, value,
                    isEmpty);
}

} // namespace ABVM
