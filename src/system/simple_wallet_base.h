// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_SIMPLE_WALLET_BASE_H
#define ABVM_SYSTEM_SIMPLE_WALLET_BASE_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/method.h>
#include <system/tx_handler.h>
#include <system/wallet_seal.h>

#include <cstdint>
#include <vector>

namespace ABVM {

/**
 * Simple wallet base system contract at ADDRESS_SYSTEM_SIMPLE_WALLET_BASE,
 * holding the core logic of a wallet so that wallet contracts stay compact.
 * It keeps no state of its own; wallets store WalletState through the State
 * contract and pass it in.
 *
 * The general workflow is:
 *  - initialize() produces the initial state for a public key
 *  - authorize() checks the seal of a transaction against the state
 *  - execute() runs the method calls of the payload, to be followed by
 *    increase_nonce()
 *  - change_public_key() produces state with a different public key
 *
 * See WalletInitializeState() and friends for the typical setup.
 */
const NativeContract& SimpleWalletBaseContract();

const MethodFingerprint& SimpleWalletBaseInitializeFingerprint();
const MethodFingerprint& SimpleWalletBaseAuthorizeFingerprint();
const MethodFingerprint& SimpleWalletBaseExecuteFingerprint();
const MethodFingerprint& SimpleWalletBaseIncreaseNonceFingerprint();
const MethodFingerprint& SimpleWalletBaseChangePublicKeyFingerprint();

ContractResult SimpleWalletBaseInitialize(Env& env, const Address& walletBase, const WalletPublicKey& publicKey,
                                          std::vector<uint8_t>& state);
ContractResult SimpleWalletBaseAuthorize(Env& env, const Address& walletBase, const std::vector<uint8_t>& state,
                                         const TxHandlerArgs& args);
/**
 * Execute the method calls of the payload. Must only be called with trusted
 * input, e.g. after successful authorization, and the caller must set itself
 * as the context.
 */
ContractResult SimpleWalletBaseExecute(Env& env, MethodContext methodContext, const Address& walletBase,
                                       const TxHandlerArgs& args);
ContractResult SimpleWalletBaseIncreaseNonce(Env& env, const Address& walletBase, const std::vector<uint8_t>& state,
                                             const TxHandlerArgs& args, std::vector<uint8_t>& newState);
ContractResult SimpleWalletBaseChangePublicKey(Env& env, const Address& walletBase,
                                               const std::vector<uint8_t>& state, const WalletPublicKey& publicKey,
                                               std::vector<uint8_t>& newState);

/** Initialize the state of the wallet in a typical setup, from an update method of the wallet */
ContractResult WalletInitializeState(Env& env, const WalletPublicKey& publicKey);
/** TxHandler authorize of a wallet in a typical setup */
ContractResult WalletAuthorize(Env& env, const TxHandlerArgs& args);
/** TxHandler execute of a wallet in a typical setup, increasing the nonce afterwards */
ContractResult WalletExecute(Env& env, const TxHandlerArgs& args);
/**
 * Change the public key of the wallet in a typical setup. Only allowed for
 * the wallet base calling under the wallet's context, i.e. from a payload
 * of a transaction of this wallet.
 */
ContractResult WalletChangePublicKey(Env& env, const WalletPublicKey& publicKey);

} // namespace ABVM

#endif // ABVM_SYSTEM_SIMPLE_WALLET_BASE_H
