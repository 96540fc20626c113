// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <executor/context.h>
#include <system/address_allocator.h>
#include <util.h>

#include <utility>

namespace ABVM {

NativeExecutorContext::NativeExecutorContext(ShardIndex shardIndexIn, const MethodsByCode& methodsByCodeIn,
                                             Slots slotsIn, bool allowEnvMutationIn)
    : shardIndex(shardIndexIn),
      systemAllocatorAddress(SystemAddressAllocator(shardIndexIn)),
      methodsByCode(&methodsByCodeIn),
      slots(std::move(slotsIn)),
      allowEnvMutation(allowEnvMutationIn)
{
}

ContractResult NativeExecutorContext::Call(const EnvState& previousEnvState, PreparedMethod& preparedMethod)
{
    const Address& contract = preparedMethod.contract;

    EnvState envState{shardIndex, contract, previousEnvState.context, previousEnvState.ownAddress};
    switch (preparedMethod.methodContext) {
        case MethodContext::KEEP:
            break;
        case MethodContext::RESET:
            envState.context = ADDRESS_NULL;
            break;
        case MethodContext::REPLACE:
            envState.context = previousEnvState.ownAddress;
            break;
    }

    std::optional<SharedAlignedBuffer> code = slots.GetCode(contract);
    if (!code) {
        LogPrint(BCLog::EXECUTOR, "NativeExecutorContext: contract %s or its code not found\n", contract.ToString());
        return ContractResult::Err(ContractError::NotFound());
    }

    std::string codeString(reinterpret_cast<const char*>(code->Data()), code->Size());
    auto it = methodsByCode->find(std::make_pair(codeString, preparedMethod.fingerprint));
    if (it == methodsByCode->end()) {
        LogPrint(BCLog::EXECUTOR, "NativeExecutorContext: method %s not found for code \"%s\" of contract %s\n",
                 preparedMethod.fingerprint.ToString(), codeString, contract.ToString());
        return ContractResult::Err(ContractError::NotImplemented());
    }

    const bool isAllocateNewAddressMethod = contract == systemAllocatorAddress &&
                                            preparedMethod.fingerprint == AddressAllocatorAllocateAddressFingerprint();

    LogPrint(BCLog::EXECUTOR, "NativeExecutorContext: calling %s on %s (caller %s, context %s)\n",
             preparedMethod.fingerprint.ToString(), contract.ToString(), envState.caller.ToString(),
             envState.context.ToString());

    ContractResult result = MakeFfiCall(*this, slots, isAllocateNewAddressMethod, contract, it->second,
                                        preparedMethod.externalArgs, envState);
    if (!result) {
        LogPrint(BCLog::EXECUTOR, "NativeExecutorContext: call to %s failed: %s\n", contract.ToString(),
                 result.error->ToString());
    }
    return result;
}

} // namespace ABVM
