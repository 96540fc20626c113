// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_TX_HANDLER_H
#define ABVM_SYSTEM_TX_HANDLER_H

#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/metadata_builder.h>
#include <contracts/method.h>

#include <cstdint>
#include <vector>

namespace ABVM {

/**
 * TxHandler trait, implemented by contracts that can be the target of a
 * transaction (typically wallets).
 *
 * authorize (view) decides whether the transaction may run, with a limited
 * amount of work; execute (update) is then called by the execution
 * environment with caller and context set to NULL and must implement replay
 * protection on its own.
 *
 * Both take the same inputs: header, read slots, write slots, payload (16
 * byte words) and seal, whose format is up to the implementation.
 */
std::vector<uint8_t> TxHandlerTraitMetadata();

/** Append the five transaction inputs shared by TxHandler methods and their implementations */
MethodMetadataBuilder& TxHandlerInputs(MethodMetadataBuilder& builder);

const MethodFingerprint& TxHandlerAuthorizeFingerprint();
const MethodFingerprint& TxHandlerExecuteFingerprint();

/** Trait methods backed by the given implementations, for NativeExecutorBuilder::WithContractTrait() */
std::vector<NativeContractMethod> TxHandlerMethods(FfiFunction authorizeFn, FfiFunction executeFn);

/**
 * @brief Transaction arguments as seen by a TxHandler implementation
 */
struct TxHandlerArgs {
    const TransactionHeader* header = nullptr;
    const TransactionSlot* readSlots = nullptr;
    uint32_t numReadSlots = 0;
    const TransactionSlot* writeSlots = nullptr;
    uint32_t numWriteSlots = 0;
    const TransactionPayloadWord* payload = nullptr;
    uint32_t numPayloadWords = 0;
    const uint8_t* seal = nullptr;
    uint32_t sealSize = 0;

    /** Take the five inputs off the internal arguments; false if their sizes are malformed */
    bool FromInternalArgs(InternalArgs& args);
};

/** Transaction components reinterpreted as TxHandler inputs; false if some size does not fit u32 */
bool TxHandlerArgsFromTransaction(const Transaction& transaction, TxHandlerArgs& args);

ContractResult TxHandlerAuthorize(Env& env, const Address& contract, const TxHandlerArgs& args);
ContractResult TxHandlerExecute(Env& env, MethodContext methodContext, const Address& contract,
                                const TxHandlerArgs& args);

} // namespace ABVM

#endif // ABVM_SYSTEM_TX_HANDLER_H
