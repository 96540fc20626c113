// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_WALLET_SEAL_H
#define ABVM_SYSTEM_WALLET_SEAL_H

#include <contracts/env.h>
#include <contracts/error.h>

#include <array>
#include <cstdint>

namespace ABVM {

static constexpr size_t WALLET_PUBLIC_KEY_SIZE = 33;
static constexpr size_t WALLET_SECRET_KEY_SIZE = 32;
static constexpr size_t WALLET_SIGNATURE_SIZE = 64;

using WalletPublicKey = std::array<uint8_t, WALLET_PUBLIC_KEY_SIZE>;
using WalletSecretKey = std::array<uint8_t, WALLET_SECRET_KEY_SIZE>;
using TransactionHash = std::array<uint8_t, 32>;

/**
 * @brief Transaction seal: compact ECDSA signature over the transaction hash
 * and the nonce it was created for
 */
struct Seal {
    uint8_t signature[WALLET_SIGNATURE_SIZE];
    uint64_t nonce;
};

static_assert(sizeof(Seal) == 72, "Seal has a fixed layout");

/**
 * @brief State of a simple wallet: compressed secp256k1 public key and the
 * nonce the next transaction must be sealed with
 */
struct WalletState {
    uint8_t publicKey[WALLET_PUBLIC_KEY_SIZE];
    uint64_t nonce;
};

static_assert(sizeof(WalletState) == 48, "Wallet state has a fixed layout");

/** Initialize the elliptic curve support. May not be called twice without calling ECC_Stop first. */
void ECC_Start();

/** Deinitialize the elliptic curve support. No-op if ECC_Start wasn't called first. */
void ECC_Stop();

bool ECC_Started();

/** Whether the bytes are a valid compressed public key */
bool IsValidWalletPublicKey(const uint8_t* publicKey, size_t size);

/** Derive the compressed public key; false for invalid secret keys */
bool WalletPublicKeyFromSecret(const WalletSecretKey& secretKey, WalletPublicKey& publicKey);

/**
 * Hash signed by the wallet owner: SHA-256 over header, read slots, write
 * slots, payload bytes and the little-endian nonce.
 */
TransactionHash HashTransaction(const TransactionHeader& header, const TransactionSlot* readSlots,
                                size_t numReadSlots, const TransactionSlot* writeSlots, size_t numWriteSlots,
                                const TransactionPayloadWord* payload, size_t numPayloadWords, uint64_t nonce);

bool SignTransactionHash(const WalletSecretKey& secretKey, const TransactionHash& hash,
                         uint8_t signature[WALLET_SIGNATURE_SIZE]);

/** Hash and sign a transaction, filling seal; false for invalid secret keys */
bool HashAndSign(const WalletSecretKey& secretKey, const Transaction& transaction, uint64_t nonce, Seal& seal);

/**
 * Check the seal against the expected nonce and the public key. A nonce
 * mismatch or unparsable signature is BadInput, a signature that does not
 * verify is Forbidden.
 */
ContractResult HashAndVerify(const uint8_t publicKey[WALLET_PUBLIC_KEY_SIZE], uint64_t expectedNonce,
                             const TransactionHeader& header, const TransactionSlot* readSlots,
                             size_t numReadSlots, const TransactionSlot* writeSlots, size_t numWriteSlots,
                             const TransactionPayloadWord* payload, size_t numPayloadWords, const Seal& seal);

} // namespace ABVM

#endif // ABVM_SYSTEM_WALLET_SEAL_H
