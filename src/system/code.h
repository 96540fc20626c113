// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_CODE_H
#define ABVM_SYSTEM_CODE_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/method.h>

#include <cstdint>
#include <vector>

namespace ABVM {

static constexpr uint32_t MAX_CODE_SIZE = 1024 * 1024;

/**
 * Code system contract at ADDRESS_SYSTEM_CODE. Code of a contract lives in
 * slot (contract, ADDRESS_SYSTEM_CODE). Methods:
 *  - deploy (update): allocates a new address and stores code there
 *  - store (update): overrides code, allowed for direct calls from outside,
 *    from this contract and from the target contract itself
 *  - read (view)
 */
const NativeContract& CodeContract();

const MethodFingerprint& CodeDeployFingerprint();
const MethodFingerprint& CodeStoreFingerprint();
const MethodFingerprint& CodeReadFingerprint();

ContractResult CodeDeploy(Env& env, MethodContext methodContext, const Address& codeContract,
                          const std::vector<uint8_t>& code, Address& newAddress);
ContractResult CodeStore(Env& env, MethodContext methodContext, const Address& codeContract,
                         const Address& address, const std::vector<uint8_t>& newCode);
ContractResult CodeRead(Env& env, const Address& codeContract, const Address& address, std::vector<uint8_t>& code);

} // namespace ABVM

#endif // ABVM_SYSTEM_CODE_H
