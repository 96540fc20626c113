// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_STATE_H
#define ABVM_SYSTEM_STATE_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/method.h>

#include <cstdint>
#include <vector>

namespace ABVM {

static constexpr uint32_t STATE_RECOMMENDED_CAPACITY = 1024;

/**
 * State system contract at ADDRESS_SYSTEM_STATE, giving contracts explicit
 * access to the state slot (contract, ADDRESS_SYSTEM_STATE). Writes are only
 * allowed for the contract itself calling directly.
 */
const NativeContract& StateContract();

const MethodFingerprint& StateInitializeFingerprint();
const MethodFingerprint& StateWriteFingerprint();
const MethodFingerprint& StateCompareAndWriteFingerprint();
const MethodFingerprint& StateReadFingerprint();
const MethodFingerprint& StateIsEmptyFingerprint();

/** Like StateWrite() but fails with Conflict if there is state already */
ContractResult StateInitialize(Env& env, MethodContext methodContext, const Address& stateContract,
                               const Address& address, const std::vector<uint8_t>& state);
ContractResult StateWrite(Env& env, MethodContext methodContext, const Address& stateContract,
                          const Address& address, const std::vector<uint8_t>& newState);
/** Write newState only if current state equals oldState; written reports whether it did */
ContractResult StateCompareAndWrite(Env& env, MethodContext methodContext, const Address& stateContract,
                                    const Address& address, const std::vector<uint8_t>& oldState,
                                    const std::vector<uint8_t>& newState, bool& written);
ContractResult StateRead(Env& env, const Address& stateContract, const Address& address,
                         std::vector<uint8_t>& state);
ContractResult StateIsEmpty(Env& env, const Address& stateContract, const Address& address, bool& isEmpty);

} // namespace ABVM

#endif // ABVM_SYSTEM_STATE_H
