// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/metadata.h>
#include <executor/context.h>
#include <util.h>

#include <cstring>
#include <memory>
#include <optional>
#include <vector>

namespace ABVM {

namespace {

/**
 * Slot handed to the method whose size (and for written slots, data pointer)
 * must be looked at after the call returns.
 */
struct DelayedSlot {
    uint32_t size = 0;
    uint32_t capacity = 0;
    bool readWrite = false;
    SlotIndex slotIndex = 0;
    /** Position of the data pointer in the internal arguments */
    size_t dataArgIndex = 0;
    /** Set for the state returned by init methods */
    bool mustBeNotEmpty = false;
};

} // namespace

ContractResult MakeFfiCall(const NativeExecutorContext& parentContext, Slots& parentSlots,
                           bool isAllocateNewAddressMethod, const Address& contract,
                           const MethodDetails& methodDetails, void** externalArgs, const EnvState& envState)
{
    MetadataReader reader(methodDetails.methodMetadata);
    MethodMetadataDecoder methodDecoder(reader, MethodsContainerKind::UNKNOWN);
    MetadataDecodeResult<DecodedMethod> decoded = methodDecoder.DecodeNext();
    if (!decoded.IsItem()) {
        if (decoded.IsError()) {
            LogPrintf("MakeFfiCall: method metadata decoding error: %s\n", decoded.GetError().ToString());
        }
        return ContractResult::Err(ContractError::InternalError());
    }
    ArgumentsMetadataDecoder& argumentsDecoder = decoded.GetItem().arguments;
    const MethodKind methodKind = decoded.GetItem().item.methodKind;
    const size_t totalArguments = decoded.GetItem().item.numArguments + (MethodKindHasSelf(methodKind) ? 1 : 0);

    // Slots take up to four pointers: address, data, size and capacity
    std::vector<void*> internalArgs;
    internalArgs.reserve(totalArguments * 4);
    // Internal arguments point at sizes and capacities in here, must not reallocate
    std::vector<DelayedSlot> delayed;
    delayed.reserve(totalArguments);
    // Keeps read-only buffers alive until the call returns
    std::vector<SharedAlignedBuffer> readOnlyBuffers;
    readOnlyBuffers.reserve(totalArguments);

    const bool viewOnly = !MethodKindIsUpdate(methodKind);
    if (!viewOnly && !parentContext.AllowEnvMutation()) {
        LogPrint(BCLog::EXECUTOR, "MakeFfiCall: only view methods are allowed, %s is %s\n",
                 decoded.GetItem().item.methodName, MethodKindToString(methodKind));
        return ContractResult::Err(ContractError::Forbidden());
    }
    std::optional<Slots> slots = viewOnly ? std::optional<Slots>(parentSlots.NewNestedRo()) : parentSlots.NewNestedRw();
    if (!slots) {
        LogPrintf("MakeFfiCall: unexpected creation of read-write slots from read-only slots\n");
        return ContractResult::Err(ContractError::InternalError());
    }

    auto fail = [&slots](const ContractError& error) {
        slots->Reset();
        return ContractResult::Err(error);
    };

    auto addReadOnly = [&](SharedAlignedBuffer buffer) {
        delayed.emplace_back();
        DelayedSlot& entry = delayed.back();
        entry.size = buffer.Size();
        internalArgs.push_back(const_cast<uint8_t*>(buffer.Data()));
        internalArgs.push_back(&entry.size);
        readOnlyBuffers.push_back(std::move(buffer));
    };

    auto addReadWrite = [&](OwnedAlignedBuffer* buffer, SlotIndex slotIndex, bool mustBeNotEmpty) {
        delayed.emplace_back();
        DelayedSlot& entry = delayed.back();
        entry.size = buffer->Size();
        entry.capacity = buffer->Capacity();
        entry.readWrite = true;
        entry.slotIndex = slotIndex;
        entry.dataArgIndex = internalArgs.size();
        entry.mustBeNotEmpty = mustBeNotEmpty;
        internalArgs.push_back(buffer->Data());
        internalArgs.push_back(&entry.size);
        internalArgs.push_back(&entry.capacity);
    };

    const SlotKey stateKey{contract, ADDRESS_SYSTEM_STATE};

    // Contract state comes first for methods with self
    switch (methodKind) {
        case MethodKind::INIT:
        case MethodKind::UPDATE_STATELESS:
        case MethodKind::VIEW_STATELESS:
            break;
        case MethodKind::UPDATE_STATEFUL_RO:
        case MethodKind::VIEW_STATEFUL: {
            std::optional<SharedAlignedBuffer> stateBytes = slots->UseRo(stateKey);
            if (!stateBytes) {
                return fail(ContractError::Forbidden());
            }
            if (stateBytes->Empty()) {
                LogPrint(BCLog::EXECUTOR, "MakeFfiCall: contract %s has no state yet\n", contract.ToString());
                return fail(ContractError::Forbidden());
            }
            addReadOnly(std::move(*stateBytes));
            break;
        }
        case MethodKind::UPDATE_STATEFUL_RW: {
            SlotIndex slotIndex = 0;
            OwnedAlignedBuffer* stateBytes = slots->UseRw(stateKey, methodDetails.recommendedStateCapacity, slotIndex);
            if (stateBytes == nullptr) {
                return fail(ContractError::Forbidden());
            }
            if (stateBytes->Empty()) {
                LogPrint(BCLog::EXECUTOR, "MakeFfiCall: contract %s has no state yet\n", contract.ToString());
                return fail(ContractError::Forbidden());
            }
            addReadWrite(stateBytes, slotIndex, false);
            break;
        }
    }

    // Env arguments are filled in once the nested view is no longer needed here
    std::vector<size_t> envArgIndices;
    bool envReadWrite = false;
    void* newAddressPtr = nullptr;

    while (true) {
        MetadataDecodeResult<ArgumentMetadataItem> argument = argumentsDecoder.DecodeNext();
        if (argument.IsEnd()) {
            break;
        }
        if (argument.IsError()) {
            LogPrintf("MakeFfiCall: argument metadata decoding error: %s\n", argument.GetError().ToString());
            return fail(ContractError::InternalError());
        }
        const ArgumentKind argumentKind = argument.GetItem().argumentKind;
        const bool lastArgument = argumentsDecoder.Remaining() == 0;

        switch (argumentKind) {
            case ArgumentKind::ENV_RO:
            case ArgumentKind::ENV_RW:
                if (argumentKind == ArgumentKind::ENV_RW) {
                    if (viewOnly) {
                        return fail(ContractError::Forbidden());
                    }
                    envReadWrite = true;
                }
                envArgIndices.push_back(internalArgs.size());
                internalArgs.push_back(nullptr);
                break;
            case ArgumentKind::TMP_RO:
            case ArgumentKind::SLOT_RO: {
                const bool tmp = argumentKind == ArgumentKind::TMP_RO;
                if (tmp && viewOnly) {
                    return fail(ContractError::Forbidden());
                }
                const Address* owner = &contract;
                SlotKey slotKey{contract, ADDRESS_NULL};
                if (!tmp) {
                    owner = static_cast<const Address*>(*externalArgs++);
                    slotKey = SlotKey{*owner, contract};
                }
                std::optional<SharedAlignedBuffer> slotBytes = slots->UseRo(slotKey);
                if (!slotBytes) {
                    return fail(ContractError::Forbidden());
                }
                if (!tmp) {
                    internalArgs.push_back(const_cast<Address*>(owner));
                }
                addReadOnly(std::move(*slotBytes));
                break;
            }
            case ArgumentKind::TMP_RW:
            case ArgumentKind::SLOT_RW: {
                if (viewOnly) {
                    return fail(ContractError::Forbidden());
                }
                const bool tmp = argumentKind == ArgumentKind::TMP_RW;
                const Address* owner = &contract;
                SlotKey slotKey{contract, ADDRESS_NULL};
                uint32_t capacity = methodDetails.recommendedTmpCapacity;
                if (!tmp) {
                    owner = static_cast<const Address*>(*externalArgs++);
                    slotKey = SlotKey{*owner, contract};
                    capacity = methodDetails.recommendedSlotCapacity;
                }
                SlotIndex slotIndex = 0;
                OwnedAlignedBuffer* slotBytes = slots->UseRw(slotKey, capacity, slotIndex);
                if (slotBytes == nullptr) {
                    return fail(ContractError::Forbidden());
                }
                if (!tmp) {
                    internalArgs.push_back(const_cast<Address*>(owner));
                }
                addReadWrite(slotBytes, slotIndex, false);
                break;
            }
            case ArgumentKind::INPUT:
                // Data and size
                internalArgs.push_back(*externalArgs++);
                internalArgs.push_back(*externalArgs++);
                break;
            case ArgumentKind::OUTPUT: {
                if (methodKind == MethodKind::INIT && lastArgument) {
                    // State of the newly initialized contract
                    SlotIndex slotIndex = 0;
                    OwnedAlignedBuffer* stateBytes =
                        slots->UseRw(stateKey, methodDetails.recommendedStateCapacity, slotIndex);
                    if (stateBytes == nullptr) {
                        return fail(ContractError::Forbidden());
                    }
                    if (!stateBytes->Empty()) {
                        LogPrint(BCLog::EXECUTOR, "MakeFfiCall: contract %s is already initialized\n",
                                 contract.ToString());
                        return fail(ContractError::Forbidden());
                    }
                    addReadWrite(stateBytes, slotIndex, true);
                    break;
                }

                void* data = *externalArgs++;
                if (lastArgument && isAllocateNewAddressMethod) {
                    newAddressPtr = data;
                }
                internalArgs.push_back(data);
                auto* size = static_cast<uint32_t*>(*externalArgs++);
                // Caller might have put something there, outputs always start empty
                if (size != nullptr) {
                    *size = 0;
                }
                internalArgs.push_back(size);
                internalArgs.push_back(*externalArgs++);
                break;
            }
        }
    }

    std::unique_ptr<NativeExecutorContext> nestedContext;
    std::unique_ptr<Env> env;
    Slots* callSlots = &*slots;
    if (!envArgIndices.empty()) {
        nestedContext.reset(new NativeExecutorContext(parentContext.GetShardIndex(), parentContext.Methods(),
                                                      std::move(*slots), envReadWrite));
        callSlots = &nestedContext->GetSlots();
        env.reset(new Env(envState, *nestedContext));
        for (size_t index : envArgIndices) {
            internalArgs[index] = env.get();
        }
    }

    const ExitCode exitCode = methodDetails.ffiFn(internalArgs.data());
    ContractResult result = ContractResult::FromExitCode(exitCode);
    if (!result) {
        callSlots->Reset();
        return result;
    }

    // Make slots of a freshly allocated address creatable, code and state included
    if (newAddressPtr != nullptr) {
        Address newAddress;
        std::memcpy(&newAddress, newAddressPtr, sizeof(newAddress));
        if (!callSlots->AddNewContract(newAddress)) {
            LogPrintf("MakeFfiCall: failed to add new contract %s returned by address allocator\n",
                      newAddress.ToString());
            callSlots->Reset();
            return ContractResult::Err(ContractError::InternalError());
        }
    }

    for (const DelayedSlot& entry : delayed) {
        if (!entry.readWrite) {
            continue;
        }
        if (entry.mustBeNotEmpty && entry.size == 0) {
            LogPrint(BCLog::EXECUTOR, "MakeFfiCall: init method of %s returned empty state\n", contract.ToString());
            callSlots->Reset();
            return ContractResult::Err(ContractError::BadOutput());
        }

        const auto* dataPtr = static_cast<const uint8_t*>(internalArgs[entry.dataArgIndex]);
        OwnedAlignedBuffer* slotBytes = callSlots->AccessUsedRw(entry.slotIndex);
        if (slotBytes == nullptr) {
            LogPrintf("MakeFfiCall: slot %u written by %s is no longer accessible\n", entry.slotIndex,
                      contract.ToString());
            callSlots->Reset();
            return ContractResult::Err(ContractError::InternalError());
        }

        // Method pointed the slot at its own memory, copy from there
        if (dataPtr != slotBytes->Data()) {
            if (dataPtr == nullptr) {
                LogPrint(BCLog::EXECUTOR, "MakeFfiCall: %s returned null pointer for slot data\n",
                         contract.ToString());
                callSlots->Reset();
                return ContractResult::Err(ContractError::BadOutput());
            }
            slotBytes->CopyFrom(dataPtr, entry.size);
            continue;
        }

        if (!slotBytes->SetLen(entry.size)) {
            LogPrint(BCLog::EXECUTOR, "MakeFfiCall: %s returned size %u exceeding capacity %u\n",
                     contract.ToString(), entry.size, slotBytes->Capacity());
            callSlots->Reset();
            return ContractResult::Err(ContractError::BadOutput());
        }
    }

    return result;
}

} // namespace ABVM
