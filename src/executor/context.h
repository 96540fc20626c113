// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_EXECUTOR_CONTEXT_H
#define ABVM_EXECUTOR_CONTEXT_H

#include <contracts/env.h>
#include <contracts/method.h>
#include <executor/slots.h>

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ABVM {

/**
 * @brief Registry entry of one native method
 */
struct MethodDetails {
    uint32_t recommendedStateCapacity = 0;
    uint32_t recommendedSlotCapacity = 0;
    uint32_t recommendedTmpCapacity = 0;
    std::vector<uint8_t> methodMetadata;
    FfiFunction ffiFn = nullptr;
};

/** Indexed by contract's code and method fingerprint */
using MethodsByCode = std::map<std::pair<std::string, MethodFingerprint>, MethodDetails>;

/**
 * @brief Executor context bound to one Slots view
 *
 * Every call dispatched through it opens a nested view of its own slots for
 * the duration of the call. Read-only contexts (allowEnvMutation == false)
 * only dispatch view methods.
 */
class NativeExecutorContext : public ExecutorContext {
public:
    NativeExecutorContext(ShardIndex shardIndexIn, const MethodsByCode& methodsByCodeIn, Slots slotsIn,
                          bool allowEnvMutationIn);

    ContractResult Call(const EnvState& previousEnvState, PreparedMethod& preparedMethod) override;

    ShardIndex GetShardIndex() const { return shardIndex; }
    const MethodsByCode& Methods() const { return *methodsByCode; }
    bool AllowEnvMutation() const { return allowEnvMutation; }
    Slots& GetSlots() { return slots; }

private:
    ShardIndex shardIndex;
    Address systemAllocatorAddress;
    const MethodsByCode* methodsByCode;
    Slots slots;
    bool allowEnvMutation;
};

/**
 * Marshal arguments of one call from the caller's ExternalArgs into the
 * method's InternalArgs, invoke it in a nested view of parentSlots and fold
 * the outcome back: written slots are committed on success and rolled back
 * on any error.
 */
ContractResult MakeFfiCall(const NativeExecutorContext& parentContext, Slots& parentSlots,
                           bool isAllocateNewAddressMethod, const Address& contract,
                           const MethodDetails& methodDetails, void** externalArgs, const EnvState& envState);

} // namespace ABVM

#endif // ABVM_EXECUTOR_CONTEXT_H
