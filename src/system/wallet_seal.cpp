// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/wallet_seal.h>

#include <crypto/common.h>
#include <crypto/sha256.h>
#include <util.h>

#include <secp256k1.h>

#include <assert.h>
#include <random>

namespace ABVM {

static secp256k1_context* secp256k1_context_wallet = nullptr;

void ECC_Start() {
    assert(secp256k1_context_wallet == nullptr);

    secp256k1_context *ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    assert(ctx != nullptr);

    {
        // Pass in a random blinding seed to the secp256k1 context.
        std::random_device rd;
        unsigned char vseed[32];
        for (size_t i = 0; i < sizeof(vseed); i += 4) {
            WriteLE32(vseed + i, rd());
        }
        bool ret = secp256k1_context_randomize(ctx, vseed);
        assert(ret);
    }

    secp256k1_context_wallet = ctx;
}

void ECC_Stop() {
    secp256k1_context *ctx = secp256k1_context_wallet;
    secp256k1_context_wallet = nullptr;

    if (ctx) {
        secp256k1_context_destroy(ctx);
    }
}

bool ECC_Started()
{
    return secp256k1_context_wallet != nullptr;
}

bool IsValidWalletPublicKey(const uint8_t* publicKey, size_t size)
{
    if (!ECC_Started()) {
        return error("%s: elliptic curve support is not initialized", __func__);
    }
    if (size != WALLET_PUBLIC_KEY_SIZE || (publicKey[0] != 0x02 && publicKey[0] != 0x03)) {
        return false;
    }
    secp256k1_pubkey pubkey;
    return secp256k1_ec_pubkey_parse(secp256k1_context_wallet, &pubkey, publicKey, size) == 1;
}

bool WalletPublicKeyFromSecret(const WalletSecretKey& secretKey, WalletPublicKey& publicKey)
{
    if (!ECC_Started()) {
        return error("%s: elliptic curve support is not initialized", __func__);
    }
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(secp256k1_context_wallet, &pubkey, secretKey.data())) {
        return false;
    }
    size_t clen = publicKey.size();
    secp256k1_ec_pubkey_serialize(secp256k1_context_wallet, publicKey.data(), &clen, &pubkey, SECP256K1_EC_COMPRESSED);
    return clen == publicKey.size();
}

TransactionHash HashTransaction(const TransactionHeader& header, const TransactionSlot* readSlots,
                                size_t numReadSlots, const TransactionSlot* writeSlots, size_t numWriteSlots,
                                const TransactionPayloadWord* payload, size_t numPayloadWords, uint64_t nonce)
{
    CSHA256 hasher;
    hasher.Write(reinterpret_cast<const unsigned char*>(&header), sizeof(header));
    for (size_t i = 0; i < numReadSlots; ++i) {
        hasher.Write(reinterpret_cast<const unsigned char*>(&readSlots[i]), sizeof(TransactionSlot));
    }
    for (size_t i = 0; i < numWriteSlots; ++i) {
        hasher.Write(reinterpret_cast<const unsigned char*>(&writeSlots[i]), sizeof(TransactionSlot));
    }
    if (numPayloadWords > 0) {
        hasher.Write(reinterpret_cast<const unsigned char*>(payload), numPayloadWords * sizeof(TransactionPayloadWord));
    }
    unsigned char nonceBytes[8];
    WriteLE64(nonceBytes, nonce);
    hasher.Write(nonceBytes, sizeof(nonceBytes));

    TransactionHash hash;
    hasher.Finalize(hash.data());
    return hash;
}

bool SignTransactionHash(const WalletSecretKey& secretKey, const TransactionHash& hash,
                         uint8_t signature[WALLET_SIGNATURE_SIZE])
{
    if (!ECC_Started()) {
        return error("%s: elliptic curve support is not initialized", __func__);
    }
    secp256k1_ecdsa_signature sig;
    int ret = secp256k1_ecdsa_sign(secp256k1_context_wallet, &sig, hash.data(), secretKey.data(),
                                   secp256k1_nonce_function_rfc6979, nullptr);
    if (!ret) {
        return false;
    }
    secp256k1_ecdsa_signature_serialize_compact(secp256k1_context_wallet, signature, &sig);
    return true;
}

bool HashAndSign(const WalletSecretKey& secretKey, const Transaction& transaction, uint64_t nonce, Seal& seal)
{
    const TransactionHash hash =
        HashTransaction(transaction.header, transaction.readSlots.data(), transaction.readSlots.size(),
                        transaction.writeSlots.data(), transaction.writeSlots.size(), transaction.payload.data(),
                        transaction.payload.size(), nonce);
    seal.nonce = nonce;
    return SignTransactionHash(secretKey, hash, seal.signature);
}

ContractResult HashAndVerify(const uint8_t publicKey[WALLET_PUBLIC_KEY_SIZE], uint64_t expectedNonce,
                             const TransactionHeader& header, const TransactionSlot* readSlots,
                             size_t numReadSlots, const TransactionSlot* writeSlots, size_t numWriteSlots,
                             const TransactionPayloadWord* payload, size_t numPayloadWords, const Seal& seal)
{
    if (seal.nonce != expectedNonce) {
        LogPrint(BCLog::SYSTEM, "HashAndVerify: nonce %u does not match expected %u\n", seal.nonce, expectedNonce);
        return ContractResult::Err(ContractError::BadInput());
    }
    if (!ECC_Started()) {
        LogPrintf("HashAndVerify: elliptic curve support is not initialized\n");
        return ContractResult::Err(ContractError::InternalError());
    }

    const TransactionHash hash = HashTransaction(header, readSlots, numReadSlots, writeSlots, numWriteSlots,
                                                 payload, numPayloadWords, seal.nonce);

    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ecdsa_signature_parse_compact(secp256k1_context_wallet, &sig, seal.signature)) {
        return ContractResult::Err(ContractError::BadInput());
    }
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_parse(secp256k1_context_wallet, &pubkey, publicKey, WALLET_PUBLIC_KEY_SIZE)) {
        return ContractResult::Err(ContractError::BadInput());
    }
    /* libsecp256k1's ECDSA verification requires lower-S signatures */
    secp256k1_ecdsa_signature_normalize(secp256k1_context_wallet, &sig, &sig);
    if (!secp256k1_ecdsa_verify(secp256k1_context_wallet, &sig, hash.data(), &pubkey)) {
        LogPrint(BCLog::SYSTEM, "HashAndVerify: invalid signature\n");
        return ContractResult::Err(ContractError::Forbidden());
    }
    return ContractResult::Ok();
}

} // namespace ABVM
