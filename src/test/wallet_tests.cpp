// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file wallet_tests.cpp
 * @brief Transactions sealed by a simple wallet, from authorization to payload execution
 */

#include <executor/executor.h>
#include <system/simple_wallet_base.h>
#include <system/state.h>
#include <system/tx_handler.h>
#include <system/wallet_payload.h>
#include <system/wallet_seal.h>
#include <test/test_abvm.h>
#include <test/test_contracts.h>

#include <boost/test/unit_test.hpp>

#include <cstring>
#include <limits>
#include <string>
#include <vector>

using namespace ABVM;

namespace {

static WalletSecretKey SecretKey(uint8_t last)
{
    WalletSecretKey secretKey{};
    secretKey[31] = last;
    return secretKey;
}

struct WalletSetup : public BasicTestingSetup {
    NativeExecutor executor;
    Storage storage;
    Address wallet;
    Address flipper;
    Address token;
    WalletSecretKey secretKey;
    WalletPublicKey publicKey;

    WalletSetup()
        : executor(BuildTestExecutor()), storage(executor.NewStorage()), secretKey(SecretKey(1))
    {
        BOOST_REQUIRE(WalletPublicKeyFromSecret(secretKey, publicKey));
        BOOST_REQUIRE(DeployTestContract(executor, storage, TestWalletContract(), wallet));
        BOOST_REQUIRE(DeployTestContract(executor, storage, FlipperContract(), flipper));
        BOOST_REQUIRE(DeployTestContract(executor, storage, TokenContract(), token));
        BOOST_REQUIRE(executor.TransactionEmulate(ADDRESS_NULL, storage, [&](Env& env) {
            ContractResult result = TestWalletInitialize(env, wallet, publicKey);
            if (!result) {
                return result;
            }
            result = FlipperNew(env, flipper, false);
            if (!result) {
                return result;
            }
            return TokenMint(env, token, wallet, 100);
        }));
    }

    Transaction MakeTransaction(const std::vector<TransactionPayloadWord>& payload, uint64_t nonce,
                                const WalletSecretKey& signer) const
    {
        Transaction transaction;
        std::memset(transaction.header.blockHash, 0, sizeof(transaction.header.blockHash));
        transaction.header.gasLimit = 1000000;
        transaction.header.contract = wallet;
        transaction.readSlots.push_back(TransactionSlot{wallet, ADDRESS_SYSTEM_STATE});
        transaction.writeSlots.push_back(TransactionSlot{wallet, ADDRESS_SYSTEM_STATE});
        transaction.payload = payload;
        Seal seal;
        BOOST_REQUIRE(HashAndSign(signer, transaction, nonce, seal));
        const uint8_t* sealBytes = reinterpret_cast<const uint8_t*>(&seal);
        transaction.seal.assign(sealBytes, sealBytes + sizeof(seal));
        return transaction;
    }

    Transaction MakeTransaction(const std::vector<TransactionPayloadWord>& payload, uint64_t nonce) const
    {
        return MakeTransaction(payload, nonce, secretKey);
    }

    std::vector<TransactionPayloadWord> FlipPayload(bool thenFail = false) const
    {
        TransactionPayloadBuilder builder;
        std::string strError;
        ExternalArgs flipArgs;
        BOOST_REQUIRE(builder.WithMethodCall(flipper, FlipperContract().methods[1], flipArgs,
                                             TransactionMethodContext::WALLET, {}, strError));
        if (thenFail) {
            ExternalArgs failArgs;
            BOOST_REQUIRE(builder.WithMethodCall(flipper, FlipperContract().methods[3], failArgs,
                                                 TransactionMethodContext::WALLET, {}, strError));
        }
        return builder.IntoAlignedWords();
    }

    uint64_t Nonce() const
    {
        WalletState state;
        BOOST_REQUIRE(ReadWalletState(storage, wallet, state));
        return state.nonce;
    }

    bool FlipperValueNow()
    {
        bool value = false;
        BOOST_REQUIRE(executor.WithEnvRo(storage, [&](Env& env) { return FlipperValue(env, flipper, value); }));
        return value;
    }

    uint64_t BalanceOf(const Address& owner)
    {
        uint64_t balance = 0;
        BOOST_REQUIRE(executor.WithEnvRo(storage, [&](Env& env) { return TokenBalance(env, token, owner, balance); }));
        return balance;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(wallet_tests, WalletSetup)

BOOST_AUTO_TEST_CASE(seal_signing)
{
    const Transaction transaction = MakeTransaction(FlipPayload(), 5);
    BOOST_REQUIRE_EQUAL(transaction.seal.size(), sizeof(Seal));
    Seal seal;
    std::memcpy(&seal, transaction.seal.data(), sizeof(seal));
    BOOST_CHECK_EQUAL(seal.nonce, 5U);

    auto verify = [&](const WalletPublicKey& key, uint64_t nonce, const Transaction& tx) {
        return HashAndVerify(key.data(), nonce, tx.header, tx.readSlots.data(), tx.readSlots.size(),
                             tx.writeSlots.data(), tx.writeSlots.size(), tx.payload.data(), tx.payload.size(), seal);
    };

    BOOST_CHECK(verify(publicKey, 5, transaction));
    BOOST_CHECK_EQUAL(verify(publicKey, 6, transaction).ToExitCode(), ContractError::BadInput().Code());

    WalletPublicKey otherKey;
    BOOST_REQUIRE(WalletPublicKeyFromSecret(SecretKey(2), otherKey));
    BOOST_CHECK(otherKey != publicKey);
    BOOST_CHECK_EQUAL(verify(otherKey, 5, transaction).ToExitCode(), ContractError::Forbidden().Code());

    // Every part of the transaction is covered
    Transaction changed = transaction;
    changed.header.gasLimit += 1;
    BOOST_CHECK_EQUAL(verify(publicKey, 5, changed).ToExitCode(), ContractError::Forbidden().Code());
    changed = transaction;
    changed.writeSlots.clear();
    BOOST_CHECK_EQUAL(verify(publicKey, 5, changed).ToExitCode(), ContractError::Forbidden().Code());
    changed = transaction;
    changed.payload = FlipPayload(true);
    BOOST_CHECK_EQUAL(verify(publicKey, 5, changed).ToExitCode(), ContractError::Forbidden().Code());

    // Zero is not a valid secret key
    WalletPublicKey invalid;
    BOOST_CHECK(!WalletPublicKeyFromSecret(WalletSecretKey{}, invalid));
    BOOST_CHECK(!HashAndSign(WalletSecretKey{}, transaction, 0, seal));
    const WalletPublicKey zero{};
    BOOST_CHECK(!IsValidWalletPublicKey(zero.data(), zero.size()));
    BOOST_CHECK(IsValidWalletPublicKey(publicKey.data(), publicKey.size()));
}

BOOST_AUTO_TEST_CASE(wallet_initialization)
{
    WalletState state;
    BOOST_REQUIRE(ReadWalletState(storage, wallet, state));
    BOOST_CHECK(std::memcmp(state.publicKey, publicKey.data(), publicKey.size()) == 0);
    BOOST_CHECK_EQUAL(state.nonce, 0U);

    ContractResult result = executor.TransactionEmulate(ADDRESS_NULL, storage, [&](Env& env) {
        return TestWalletInitialize(env, wallet, publicKey);
    });
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::Conflict().Code());

    Address other;
    BOOST_REQUIRE(DeployTestContract(executor, storage, TestWalletContract(), other));
    result = executor.TransactionEmulate(ADDRESS_NULL, storage, [&](Env& env) {
        return TestWalletInitialize(env, other, WalletPublicKey{});
    });
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::BadInput().Code());
    BOOST_CHECK(!ReadWalletState(storage, other, state));
}

BOOST_AUTO_TEST_CASE(verify_and_execute)
{
    const Transaction transaction = MakeTransaction(FlipPayload(), 0);
    BOOST_REQUIRE(executor.TransactionVerify(transaction, storage));
    // Verification alone changes nothing
    BOOST_CHECK_EQUAL(Nonce(), 0U);
    BOOST_CHECK(!FlipperValueNow());

    BOOST_REQUIRE(executor.TransactionExecute(transaction, storage));
    BOOST_CHECK_EQUAL(Nonce(), 1U);
    BOOST_CHECK(FlipperValueNow());

    // Replay
    BOOST_CHECK_EQUAL(executor.TransactionVerifyExecute(transaction, storage).ToExitCode(),
                      ContractError::BadInput().Code());
    BOOST_CHECK_EQUAL(Nonce(), 1U);
    BOOST_CHECK(FlipperValueNow());

    BOOST_REQUIRE(executor.TransactionVerifyExecute(MakeTransaction(FlipPayload(), 1), storage));
    BOOST_CHECK_EQUAL(Nonce(), 2U);
    BOOST_CHECK(!FlipperValueNow());
}

BOOST_AUTO_TEST_CASE(authorization_failures)
{
    BOOST_CHECK_EQUAL(executor.TransactionVerifyExecute(MakeTransaction(FlipPayload(), 0, SecretKey(2)), storage)
                          .ToExitCode(),
                      ContractError::Forbidden().Code());
    BOOST_CHECK_EQUAL(executor.TransactionVerify(MakeTransaction(FlipPayload(), 1), storage).ToExitCode(),
                      ContractError::BadInput().Code());

    Transaction truncated = MakeTransaction(FlipPayload(), 0);
    truncated.seal.resize(10);
    BOOST_CHECK_EQUAL(executor.TransactionVerify(truncated, storage).ToExitCode(), ContractError::BadInput().Code());

    // Not a transaction handler
    Transaction notWallet = MakeTransaction(FlipPayload(), 0);
    notWallet.header.contract = flipper;
    BOOST_CHECK_EQUAL(executor.TransactionVerify(notWallet, storage).ToExitCode(),
                      ContractError::NotImplemented().Code());

    BOOST_CHECK_EQUAL(Nonce(), 0U);
    BOOST_CHECK(!FlipperValueNow());
}

BOOST_AUTO_TEST_CASE(exhausted_nonce)
{
    WalletState state;
    BOOST_REQUIRE(ReadWalletState(storage, wallet, state));
    state.nonce = std::numeric_limits<uint64_t>::max();
    const uint8_t* stateBytes = reinterpret_cast<const uint8_t*>(&state);
    const std::vector<uint8_t> newState(stateBytes, stateBytes + sizeof(state));
    BOOST_REQUIRE(executor.TransactionEmulate(wallet, storage, [&](Env& env) {
        return StateWrite(env, MethodContext::KEEP, ADDRESS_SYSTEM_STATE, wallet, newState);
    }));

    const Transaction transaction = MakeTransaction(FlipPayload(), std::numeric_limits<uint64_t>::max());
    BOOST_CHECK_EQUAL(executor.TransactionVerify(transaction, storage).ToExitCode(),
                      ContractError::Forbidden().Code());
}

BOOST_AUTO_TEST_CASE(failed_payload_discards_everything)
{
    ContractResult result = executor.TransactionVerifyExecute(MakeTransaction(FlipPayload(true), 0), storage);
    BOOST_REQUIRE(!result);
    BOOST_CHECK(result.error->Kind() == ContractErrorKind::CUSTOM);
    BOOST_CHECK_EQUAL(result.error->Code(), TEST_CONTRACT_CUSTOM_ERROR);

    // Neither the successful flip nor the nonce increase survive
    BOOST_CHECK(!FlipperValueNow());
    BOOST_CHECK_EQUAL(Nonce(), 0U);

    // Malformed payload
    std::vector<TransactionPayloadWord> payload = FlipPayload();
    reinterpret_cast<uint8_t*>(payload.data())[48] = 7;
    result = executor.TransactionVerifyExecute(MakeTransaction(payload, 0), storage);
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::BadInput().Code());
    BOOST_CHECK_EQUAL(Nonce(), 0U);
}

BOOST_AUTO_TEST_CASE(execute_only_from_outside)
{
    const Transaction transaction = MakeTransaction(FlipPayload(), 0);
    TxHandlerArgs args;
    BOOST_REQUIRE(TxHandlerArgsFromTransaction(transaction, args));

    ContractResult result = executor.TransactionEmulate(flipper, storage, [&](Env& env) {
        return TxHandlerExecute(env, MethodContext::KEEP, wallet, args);
    });
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::Forbidden().Code());

    // The wallet base only runs payloads for its direct caller's context
    result = executor.TransactionEmulate(flipper, storage, [&](Env& env) {
        return SimpleWalletBaseExecute(env, MethodContext::RESET, ADDRESS_SYSTEM_SIMPLE_WALLET_BASE, args);
    });
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::Forbidden().Code());

    BOOST_CHECK(!FlipperValueNow());
    BOOST_CHECK_EQUAL(Nonce(), 0U);
}

BOOST_AUTO_TEST_CASE(payload_method_context)
{
    const Address bob(5000, 0);
    const uint64_t amount = 30;
    const uint32_t amountSize = sizeof(amount);

    auto transferPayload = [&](TransactionMethodContext methodContext) {
        ExternalArgs args;
        args.Slot(&wallet).Slot(&bob).Input(&amount, &amountSize);
        TransactionPayloadBuilder builder;
        std::string strError;
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[1], args, methodContext, {}, strError));
        return builder.IntoAlignedWords();
    };

    // Token accepts the wallet as context
    BOOST_REQUIRE(executor.TransactionVerifyExecute(
        MakeTransaction(transferPayload(TransactionMethodContext::WALLET), 0), storage));
    BOOST_CHECK_EQUAL(BalanceOf(wallet), 70U);
    BOOST_CHECK_EQUAL(BalanceOf(bob), 30U);
    BOOST_CHECK_EQUAL(Nonce(), 1U);

    // Direct caller is the wallet base, without context nobody speaks for the wallet
    ContractResult result = executor.TransactionVerifyExecute(
        MakeTransaction(transferPayload(TransactionMethodContext::NULL_CONTEXT), 1), storage);
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::Forbidden().Code());
    BOOST_CHECK_EQUAL(BalanceOf(wallet), 70U);
    BOOST_CHECK_EQUAL(Nonce(), 1U);
}

BOOST_AUTO_TEST_CASE(payload_output_as_input)
{
    const Address bob(5000, 0);

    TransactionPayloadBuilder builder;
    std::string strError;
    {
        ExternalArgs args;
        args.Slot(&wallet).Output(nullptr, nullptr, nullptr);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[2], args,
                                             TransactionMethodContext::WALLET, {}, strError));
    }
    {
        // Transfer the whole balance read above
        ExternalArgs args;
        args.Slot(&wallet).Slot(&bob).Input(nullptr, nullptr);
        BOOST_REQUIRE(builder.WithMethodCall(token, TokenContract().methods[1], args,
                                             TransactionMethodContext::WALLET, {uint8_t{0}}, strError));
    }

    BOOST_REQUIRE(executor.TransactionVerifyExecute(MakeTransaction(builder.IntoAlignedWords(), 0), storage));
    BOOST_CHECK_EQUAL(BalanceOf(wallet), 0U);
    BOOST_CHECK_EQUAL(BalanceOf(bob), 100U);
}

BOOST_AUTO_TEST_CASE(change_public_key)
{
    const WalletSecretKey newSecretKey = SecretKey(2);
    WalletPublicKey newPublicKey;
    BOOST_REQUIRE(WalletPublicKeyFromSecret(newSecretKey, newPublicKey));

    // Only through the wallet's own transactions
    ContractResult result = executor.TransactionEmulate(wallet, storage, [&](Env& env) {
        const uint32_t size = WALLET_PUBLIC_KEY_SIZE;
        ExternalArgs args;
        args.Input(newPublicKey.data(), &size);
        return env.Call(wallet, TestWalletContract().methods[1].fingerprint, args, MethodContext::KEEP);
    });
    BOOST_CHECK_EQUAL(result.ToExitCode(), ContractError::Forbidden().Code());

    TransactionPayloadBuilder builder;
    std::string strError;
    const uint32_t size = WALLET_PUBLIC_KEY_SIZE;
    ExternalArgs args;
    args.Input(newPublicKey.data(), &size);
    BOOST_REQUIRE(builder.WithMethodCall(wallet, TestWalletContract().methods[1], args,
                                         TransactionMethodContext::WALLET, {}, strError));
    BOOST_REQUIRE(executor.TransactionVerifyExecute(MakeTransaction(builder.IntoAlignedWords(), 0), storage));

    WalletState state;
    BOOST_REQUIRE(ReadWalletState(storage, wallet, state));
    BOOST_CHECK(std::memcmp(state.publicKey, newPublicKey.data(), newPublicKey.size()) == 0);
    // State changed during execution, the nonce stays
    BOOST_CHECK_EQUAL(state.nonce, 0U);

    BOOST_CHECK_EQUAL(executor.TransactionVerify(MakeTransaction(FlipPayload(), 0), storage).ToExitCode(),
                      ContractError::Forbidden().Code());
    BOOST_REQUIRE(executor.TransactionVerifyExecute(MakeTransaction(FlipPayload(), 0, newSecretKey), storage));
    BOOST_CHECK_EQUAL(Nonce(), 1U);
    BOOST_CHECK(FlipperValueNow());
}

BOOST_AUTO_TEST_SUITE_END()
