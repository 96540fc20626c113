// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/code.h>

#include <contracts/metadata_builder.h>
#include <system/address_allocator.h>
#include <util.h>

namespace ABVM {

namespace {

const char* const CODE_CODE = "abvm-system-code";

std::vector<uint8_t> DeployMetadata()
{
    return MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "deploy")
        .EnvRw()
        .Input("code", IoTypeMetadata::VariableBytes(MAX_CODE_SIZE))
        .Output("new_address", IoTypeMetadata::Address())
        .Build();
}

std::vector<uint8_t> StoreMetadata()
{
    return MethodMetadataBuilder(MethodKind::UPDATE_STATELESS, "store")
        .EnvRw()
        .SlotRw("contract_code")
        .Input("new_code", IoTypeMetadata::VariableBytes(MAX_CODE_SIZE))
        .Build();
}

std::vector<uint8_t> ReadMetadata()
{
    return MethodMetadataBuilder(MethodKind::VIEW_STATELESS, "read")
        .SlotRo("contract_code")
        .Output("code", IoTypeMetadata::VariableBytes(MAX_CODE_SIZE))
        .Build();
}

ExitCode DeployFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    ReadOnlyBytes code = args.NextRo();
    ReadWriteBytes newAddressOut = args.NextRw();

    Address newAddress;
    ContractResult result = AddressAllocatorAllocateAddress(env, MethodContext::REPLACE,
                                                            SystemAddressAllocator(env.GetShardIndex()), newAddress);
    if (!result) {
        return result.ToExitCode();
    }

    result = CodeStore(env, MethodContext::REPLACE, env.OwnAddress(), newAddress,
                       std::vector<uint8_t>(code.data, code.data + code.size));
    if (!result) {
        return result.ToExitCode();
    }

    if (!newAddressOut.Write(newAddress)) {
        return ContractError::BadOutput().Code();
    }

    LogPrint(BCLog::SYSTEM, "Code: deployed %u bytes of code to %s\n", code.size, newAddress.ToString());
    return EXIT_CODE_OK;
}

ExitCode StoreFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    const Address& address = args.NextAddress();
    ReadWriteBytes contractCode = args.NextRw();
    ReadOnlyBytes newCode = args.NextRo();

    // Initial deployment from outside, deployment through this contract and upgrades by the contract itself
    if (!(env.Caller() == ADDRESS_NULL || env.Caller() == env.OwnAddress() || env.Caller() == address)) {
        LogPrint(BCLog::SYSTEM, "Code: %s is not allowed to store code of %s\n", env.Caller().ToString(),
                 address.ToString());
        return ContractError::Forbidden().Code();
    }

    if (!contractCode.Assign(newCode.data, newCode.size)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

ExitCode ReadFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    args.NextAddress();
    ReadOnlyBytes contractCode = args.NextRo();
    ReadWriteBytes code = args.NextRw();

    if (!code.Assign(contractCode.data, contractCode.size)) {
        return ContractError::BadInput().Code();
    }
    return EXIT_CODE_OK;
}

} // namespace

const NativeContract& CodeContract()
{
    static const NativeContract contract = [] {
        NativeContract result;
        result.code = CODE_CODE;
        std::vector<uint8_t> deployMetadata = DeployMetadata();
        std::vector<uint8_t> storeMetadata = StoreMetadata();
        std::vector<uint8_t> readMetadata = ReadMetadata();
        result.mainContractMetadata =
            ContractMetadataBuilder(IoTypeMetadata::Struct("Code", {}),
                                    IoTypeMetadata::VariableBytes(MAX_CODE_SIZE), IoTypeMetadata::Unit())
                .Method(deployMetadata)
                .Method(storeMetadata)
                .Method(readMetadata)
                .Build();
        result.methods.push_back(NativeContractMethod::New(deployMetadata, &DeployFfi));
        result.methods.push_back(NativeContractMethod::New(storeMetadata, &StoreFfi));
        result.methods.push_back(NativeContractMethod::New(readMetadata, &ReadFfi));
        return result;
    }();
    return contract;
}

const MethodFingerprint& CodeDeployFingerprint()
{
    return CodeContract().methods[0].fingerprint;
}

const MethodFingerprint& CodeStoreFingerprint()
{
    return CodeContract().methods[1].fingerprint;
}

const MethodFingerprint& CodeReadFingerprint()
{
    return CodeContract().methods[2].fingerprint;
}

ContractResult CodeDeploy(Env& env, MethodContext methodContext, const Address& codeContract,
                          const std::vector<uint8_t>& code, Address& newAddress)
{
    const uint32_t codeSize = static_cast<uint32_t>(code.size());
    uint32_t newAddressSize = 0;
    const uint32_t newAddressCapacity = sizeof(Address);
    ExternalArgs args;
    args.Input(code.data(), &codeSize).Output(&newAddress, &newAddressSize, &newAddressCapacity);
    ContractResult result = env.Call(codeContract, CodeDeployFingerprint(), args, methodContext);
    if (result && newAddressSize != sizeof(Address)) {
        return ContractResult::Err(ContractError::BadOutput());
    }
    return result;
}

ContractResult CodeStore(Env& env, MethodContext methodContext, const Address& codeContract,
                         const Address& address, const std::vector<uint8_t>& newCode)
{
    const uint32_t newCodeSize = static_cast<uint32_t>(newCode.size());
    ExternalArgs args;
    args.Slot(&address).Input(newCode.data(), &newCodeSize);
    return env.Call(codeContract, CodeStoreFingerprint(), args, methodContext);
}

ContractResult CodeRead(Env& env, const Address& codeContract, const Address& address, std::vector<uint8_t>& code)
{
    code.resize(MAX_CODE_SIZE);
    uint32_t codeSize = 0;
    const uint32_t codeCapacity = MAX_CODE_SIZE;
    ExternalArgs args;
    args.Slot(&address).Output(code.data(), &codeSize, &codeCapacity);
    ContractResult result = env.Call(codeContract, CodeReadFingerprint(), args, MethodContext::KEEP);
    code.resize(result ? codeSize : 0);
    return result;
}

} // namespace ABVM
