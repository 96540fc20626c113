// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_ENV_H
#define ABVM_CONTRACTS_ENV_H

#include <contracts/address.h>
#include <contracts/error.h>
#include <contracts/method.h>

#include <cstdint>
#include <vector>

namespace ABVM {

/**
 * Context to use for the callee of a method call
 */
enum class MethodContext : uint8_t {
    /** Keep the current context */
    KEEP,
    /** Reset context to NULL */
    RESET,
    /** Replace context with the current contract's address */
    REPLACE,
};

/**
 * @brief Identity of the currently executing method
 */
struct EnvState {
    ShardIndex shardIndex;
    Address ownAddress;
    /** Address on whose behalf the call is made, see MethodContext */
    Address context;
    /** Direct caller, NULL for calls originating outside contracts */
    Address caller;
};

/**
 * @brief Method call that is ready to be dispatched
 */
struct PreparedMethod {
    Address contract;
    MethodFingerprint fingerprint;
    /** Caller side argument table, see ExternalArgs */
    void** externalArgs = nullptr;
    MethodContext methodContext = MethodContext::KEEP;
};

/**
 * Dispatcher of calls made through Env. Implemented by the executor.
 */
class ExecutorContext {
public:
    virtual ~ExecutorContext() = default;

    virtual ContractResult Call(const EnvState& previousEnvState, PreparedMethod& preparedMethod) = 0;
};

/**
 * @brief Environment handed to methods with an env argument
 *
 * Read-only or read-write access is a property of the executor context it is
 * bound to: update methods can only be reached through an env that allows
 * mutation.
 */
class Env {
public:
    Env(const EnvState& stateIn, ExecutorContext& executorContextIn)
        : state(stateIn), executorContext(&executorContextIn) {}

    ShardIndex GetShardIndex() const { return state.shardIndex; }
    const Address& OwnAddress() const { return state.ownAddress; }
    const Address& Context() const { return state.context; }
    const Address& Caller() const { return state.caller; }
    const EnvState& State() const { return state; }

    ContractResult Call(PreparedMethod& preparedMethod);
    ContractResult Call(const Address& contract, const MethodFingerprint& fingerprint,
                        ExternalArgs& args, MethodContext methodContext);

private:
    EnvState state;
    ExecutorContext* executorContext;
};

/**
 * @brief Transaction header, passed to transaction handlers as a single input
 */
struct TransactionHeader {
    uint8_t blockHash[32];
    uint64_t gasLimit;
    /** Contract implementing the transaction handler, typically a wallet */
    Address contract;
};

static_assert(sizeof(TransactionHeader) == 48, "Transaction header has a fixed layout");

/**
 * @brief Slot that a transaction declares it will read or write
 */
struct TransactionSlot {
    Address owner;
    Address contract;
};

static_assert(sizeof(TransactionSlot) == 32, "Transaction slot has a fixed layout");

/** 128-bit payload word, payloads are 16-byte aligned */
struct alignas(16) TransactionPayloadWord {
    uint8_t bytes[16];
};

struct Transaction {
    TransactionHeader header;
    std::vector<TransactionSlot> readSlots;
    std::vector<TransactionSlot> writeSlots;
    std::vector<TransactionPayloadWord> payload;
    std::vector<uint8_t> seal;
};

} // namespace ABVM

#endif // ABVM_CONTRACTS_ENV_H
