// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_EXECUTOR_EXECUTOR_H
#define ABVM_EXECUTOR_EXECUTOR_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/method.h>
#include <executor/context.h>
#include <executor/slots.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class ArgsManager;

namespace ABVM {

static const uint32_t DEFAULT_SHARD_INDEX = 1;

/**
 * Executor settings taken from the command line:
 *  -shardindex=<n>  shard the executor serves (default: 1)
 */
struct ExecutorConfig {
    ShardIndex shardIndex;

    /** Nothing with strError set if an argument is invalid */
    static std::optional<ExecutorConfig> FromArgs(const ArgsManager& args, std::string& strError);
};

enum class NativeExecutorErrorKind {
    CONTRACT_METADATA_NOT_FOUND,
    CONTRACT_METADATA_DECODING_ERROR,
    EXPECTED_CONTRACT_METADATA_FOUND_TRAIT,
    DUPLICATE_METHOD_IN_CONTRACT,
    STORAGE_INITIALIZATION_FAILED,
};

/**
 * Thrown when building the executor or its storage fails. The executor must
 * not be used after that.
 */
class NativeExecutorError : public std::runtime_error
{
public:
    NativeExecutorError(NativeExecutorErrorKind kindIn, const std::string& what)
        : std::runtime_error(what), kind(kindIn) {}

    NativeExecutorErrorKind Kind() const { return kind; }

private:
    NativeExecutorErrorKind kind;
};

/**
 * @brief Storage of one shard: slots with the system contracts deployed
 */
class Storage
{
public:
    /** Current value of a slot, for inspection */
    std::optional<SharedAlignedBuffer> Get(const SlotKey& key) const { return slots.Get(key); }

    size_t NumSlots() const { return slots.NumSlots(); }

    Slots& GetSlots() { return slots; }

private:
    friend class NativeExecutor;

    explicit Storage(Slots slotsIn) : slots(std::move(slotsIn)) {}

    Slots slots;
};

class NativeExecutor;

/**
 * @brief Collects native contracts and builds the method registry
 *
 * System contracts are always registered.
 */
class NativeExecutorBuilder
{
public:
    explicit NativeExecutorBuilder(ShardIndex shardIndexIn);

    /** Register all methods of the contract */
    NativeExecutorBuilder& WithContract(const NativeContract& contract);
    /** Register trait methods implemented by the contract */
    NativeExecutorBuilder& WithContractTrait(const NativeContract& contract,
                                             const std::vector<NativeContractMethod>& traitMethods);

    /** Throws NativeExecutorError on malformed metadata or duplicate methods */
    NativeExecutor Build() const;

private:
    struct MethodsEntry {
        std::string code;
        std::vector<uint8_t> mainContractMetadata;
        std::vector<NativeContractMethod> methods;
    };

    ShardIndex shardIndex;
    std::vector<MethodsEntry> entries;
};

/**
 * @brief Executes transactions and calls against a shard's storage
 *
 * Temporary (tmp) slots are cleared after every transaction and emulation.
 */
class NativeExecutor
{
public:
    ShardIndex GetShardIndex() const { return shardIndex; }
    const MethodsByCode& Methods() const { return methodsByCode; }

    /** Create new storage with the system contracts deployed; throws NativeExecutorError on failure */
    Storage NewStorage() const;

    /** Authorize the transaction with its contract's TxHandler, read-only */
    ContractResult TransactionVerify(const Transaction& transaction, Storage& storage) const;
    /** Execute a previously verified transaction, discarding all its effects on failure */
    ContractResult TransactionExecute(const Transaction& transaction, Storage& storage) const;
    ContractResult TransactionVerifyExecute(const Transaction& transaction, Storage& storage) const;

    /**
     * Run calls as if made by the contract itself (own address and context
     * set to contract, caller NULL) in a read-write view. Calls that fail
     * are rolled back individually.
     */
    template <typename Fn>
    auto TransactionEmulate(const Address& contract, Storage& storage, Fn&& fn) const
    {
        auto result = [&] {
            // The root view always opens read-write views
            std::optional<Slots> nested = storage.slots.NewNestedRw();
            NativeExecutorContext context(shardIndex, methodsByCode, std::move(*nested), true);
            Env env(EnvState{shardIndex, contract, contract, ADDRESS_NULL}, context);
            return fn(env);
        }();
        ClearTmp(storage);
        return result;
    }

    /** Run view calls with a read-only env (own address, context and caller NULL) */
    template <typename Fn>
    auto WithEnvRo(Storage& storage, Fn&& fn) const
    {
        NativeExecutorContext context(shardIndex, methodsByCode, storage.slots.NewNestedRo(), false);
        Env env(EnvState{shardIndex, ADDRESS_NULL, ADDRESS_NULL, ADDRESS_NULL}, context);
        return fn(env);
    }

private:
    friend class NativeExecutorBuilder;

    NativeExecutor(ShardIndex shardIndexIn, MethodsByCode methodsByCodeIn)
        : shardIndex(shardIndexIn), methodsByCode(std::move(methodsByCodeIn)) {}

    void ClearTmp(Storage& storage) const;

    ShardIndex shardIndex;
    MethodsByCode methodsByCode;
};

} // namespace ABVM

#endif // ABVM_EXECUTOR_EXECUTOR_H
