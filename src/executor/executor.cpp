// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <executor/executor.h>

#include <contracts/metadata.h>
#include <system/address_allocator.h>
#include <system/code.h>
#include <system/simple_wallet_base.h>
#include <system/state.h>
#include <system/tx_handler.h>
#include <util.h>

namespace ABVM {

std::optional<ExecutorConfig> ExecutorConfig::FromArgs(const ArgsManager& args, std::string& strError)
{
    const int64_t shardIndex = args.GetArg("-shardindex", int64_t{DEFAULT_SHARD_INDEX});
    // Shard 0's address allocator would be at the NULL address
    if (shardIndex < 1 || shardIndex > ShardIndex::MAX_SHARD_INDEX) {
        strError = strprintf("Invalid -shardindex=%d, must be between 1 and %u", shardIndex,
                             ShardIndex::MAX_SHARD_INDEX);
        return std::nullopt;
    }
    ExecutorConfig config;
    config.shardIndex = *ShardIndex::New(static_cast<uint32_t>(shardIndex));
    return config;
}

NativeExecutorBuilder::NativeExecutorBuilder(ShardIndex shardIndexIn)
    : shardIndex(shardIndexIn)
{
    WithContract(AddressAllocatorContract());
    WithContract(CodeContract());
    WithContract(StateContract());
    WithContract(SimpleWalletBaseContract());
}

NativeExecutorBuilder& NativeExecutorBuilder::WithContract(const NativeContract& contract)
{
    entries.push_back(MethodsEntry{contract.code, contract.mainContractMetadata, contract.methods});
    return *this;
}

NativeExecutorBuilder& NativeExecutorBuilder::WithContractTrait(const NativeContract& contract,
                                                                const std::vector<NativeContractMethod>& traitMethods)
{
    entries.push_back(MethodsEntry{contract.code, contract.mainContractMetadata, traitMethods});
    return *this;
}

NativeExecutor NativeExecutorBuilder::Build() const
{
    MethodsByCode methodsByCode;
    for (const MethodsEntry& entry : entries) {
        MetadataDecoder decoder(entry.mainContractMetadata);
        MetadataDecodeResult<MetadataItem> decoded = decoder.DecodeNext();
        if (decoded.IsEnd()) {
            throw NativeExecutorError(NativeExecutorErrorKind::CONTRACT_METADATA_NOT_FOUND,
                                      strprintf("Contract metadata not found for code \"%s\"", entry.code));
        }
        if (decoded.IsError()) {
            throw NativeExecutorError(NativeExecutorErrorKind::CONTRACT_METADATA_DECODING_ERROR,
                                      strprintf("Contract metadata decoding error for code \"%s\": %s", entry.code,
                                                decoded.GetError().ToString()));
        }
        const MetadataItem& item = decoded.GetItem();
        if (!item.IsContract()) {
            throw NativeExecutorError(NativeExecutorErrorKind::EXPECTED_CONTRACT_METADATA_FOUND_TRAIT,
                                      strprintf("Expected contract metadata for code \"%s\", found trait %s",
                                                entry.code, std::string(item.traitName)));
        }

        for (const NativeContractMethod& method : entry.methods) {
            MethodDetails details;
            details.recommendedStateCapacity = item.stateTypeDetails.recommendedCapacity;
            details.recommendedSlotCapacity = item.slotTypeDetails.recommendedCapacity;
            details.recommendedTmpCapacity = item.tmpTypeDetails.recommendedCapacity;
            details.methodMetadata = method.metadata;
            details.ffiFn = method.ffiFn;

            if (!methodsByCode.emplace(std::make_pair(entry.code, method.fingerprint), std::move(details)).second) {
                throw NativeExecutorError(NativeExecutorErrorKind::DUPLICATE_METHOD_IN_CONTRACT,
                                          strprintf("Duplicate method %s in contract with code \"%s\"",
                                                    method.fingerprint.ToString(), entry.code));
            }
        }
    }

    LogPrint(BCLog::EXECUTOR, "NativeExecutorBuilder: %u methods registered for shard %u\n", methodsByCode.size(),
             shardIndex.Get());
    return NativeExecutor(shardIndex, std::move(methodsByCode));
}

Storage NativeExecutor::NewStorage() const
{
    // Code contract can't deploy itself
    Slots::Entries entries;
    entries.emplace_back(SlotKey{ADDRESS_SYSTEM_CODE, ADDRESS_SYSTEM_CODE},
                         SharedAlignedBuffer::FromBytes(CodeContract().CodeBytes()));
    Storage storage(Slots::New(entries));

    const Address addressAllocator = SystemAddressAllocator(shardIndex);

    {
        std::optional<Slots> nested = storage.slots.NewNestedRw();
        if (!nested || !nested->AddNewContract(addressAllocator) || !nested->AddNewContract(ADDRESS_SYSTEM_STATE) ||
            !nested->AddNewContract(ADDRESS_SYSTEM_SIMPLE_WALLET_BASE)) {
            throw NativeExecutorError(NativeExecutorErrorKind::STORAGE_INITIALIZATION_FAILED,
                                      "Failed to register system contracts");
        }
    }

    ContractResult result = TransactionEmulate(ADDRESS_SYSTEM_CODE, storage, [&](Env& env) {
        ContractResult stepResult = CodeStore(env, MethodContext::KEEP, ADDRESS_SYSTEM_CODE, ADDRESS_SYSTEM_STATE,
                                              StateContract().CodeBytes());
        if (!stepResult) {
            return stepResult;
        }
        stepResult = CodeStore(env, MethodContext::KEEP, ADDRESS_SYSTEM_CODE, addressAllocator,
                               AddressAllocatorContract().CodeBytes());
        if (!stepResult) {
            return stepResult;
        }
        stepResult = AddressAllocatorNew(env, MethodContext::KEEP, addressAllocator);
        if (!stepResult) {
            return stepResult;
        }
        return CodeStore(env, MethodContext::KEEP, ADDRESS_SYSTEM_CODE, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE,
                         SimpleWalletBaseContract().CodeBytes());
    });
    if (!result) {
        throw NativeExecutorError(NativeExecutorErrorKind::STORAGE_INITIALIZATION_FAILED,
                                  strprintf("Failed to deploy system contracts: %s", result.error->ToString()));
    }

    LogPrint(BCLog::EXECUTOR, "NativeExecutor: new storage for shard %u with %u slots\n", shardIndex.Get(),
             storage.NumSlots());
    return storage;
}

ContractResult NativeExecutor::TransactionVerify(const Transaction& transaction, Storage& storage) const
{
    TxHandlerArgs args;
    if (!TxHandlerArgsFromTransaction(transaction, args)) {
        LogPrint(BCLog::EXECUTOR, "NativeExecutor: transaction components are too large\n");
        return ContractResult::Err(ContractError::BadInput());
    }

    ContractResult result = WithEnvRo(storage, [&](Env& env) {
        return TxHandlerAuthorize(env, transaction.header.contract, args);
    });
    ClearTmp(storage);
    return result;
}

ContractResult NativeExecutor::TransactionExecute(const Transaction& transaction, Storage& storage) const
{
    TxHandlerArgs args;
    if (!TxHandlerArgsFromTransaction(transaction, args)) {
        LogPrint(BCLog::EXECUTOR, "NativeExecutor: transaction components are too large\n");
        return ContractResult::Err(ContractError::BadInput());
    }

    ContractResult result;
    {
        std::optional<Slots> nested = storage.slots.NewNestedRw();
        if (!nested) {
            return ContractResult::Err(ContractError::InternalError());
        }
        NativeExecutorContext context(shardIndex, methodsByCode, std::move(*nested), true);
        Env env(EnvState{shardIndex, ADDRESS_NULL, ADDRESS_NULL, ADDRESS_NULL}, context);
        result = TxHandlerExecute(env, MethodContext::RESET, transaction.header.contract, args);
        if (!result) {
            LogPrint(BCLog::EXECUTOR, "NativeExecutor: transaction for %s failed: %s\n",
                     transaction.header.contract.ToString(), result.error->ToString());
            context.GetSlots().Reset();
        }
    }
    ClearTmp(storage);
    return result;
}

ContractResult NativeExecutor::TransactionVerifyExecute(const Transaction& transaction, Storage& storage) const
{
    ContractResult result = TransactionVerify(transaction, storage);
    if (!result) {
        return result;
    }
    return TransactionExecute(transaction, storage);
}

void NativeExecutor::ClearTmp(Storage& storage) const
{
    if (!storage.slots.ClearTmp()) {
        LogPrintf("NativeExecutor: failed to clear tmp storage\n");
    }
}

} // namespace ABVM
