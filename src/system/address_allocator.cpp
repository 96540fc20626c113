// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <system/address_allocator.h>

#include <contracts/metadata_builder.h>
#include <util.h>

namespace ABVM {

namespace {

const char* const ADDRESS_ALLOCATOR_CODE = "abvm-system-address-allocator";

std::vector<uint8_t> NewMetadata()
{
    return MethodMetadataBuilder(MethodKind::INIT, "new")
        .EnvRo()
        .InitOutput("state")
        .Build();
}

std::vector<uint8_t> AllocateAddressMetadata()
{
    return MethodMetadataBuilder(MethodKind::UPDATE_STATEFUL_RW, "allocate_address")
        .EnvRo()
        .Output("new_address", IoTypeMetadata::Address())
        .Build();
}

/** state = new(env) */
ExitCode NewFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    Env& env = args.NextEnv();
    ReadWriteBytes state = args.NextRw();

    const Address& ownAddress = env.OwnAddress();
    std::optional<Address> nextAddress = ownAddress.CheckedAdd(Address{1, 0});
    std::optional<Address> rangeSize = MAX_ADDRESSES_PER_SHARD.CheckedSub(Address{1, 0});
    std::optional<Address> maxAddress = rangeSize ? ownAddress.CheckedAdd(*rangeSize) : std::nullopt;
    if (!nextAddress || !maxAddress) {
        return ContractError::BadInput().Code();
    }

    AddressAllocatorState newState{*nextAddress, *maxAddress};
    if (!state.Write(newState)) {
        return ContractError::BadOutput().Code();
    }
    return EXIT_CODE_OK;
}

/** new_address = allocate_address(&mut self, env) */
ExitCode AllocateAddressFfi(void** internalArgs)
{
    InternalArgs args(internalArgs);
    ReadWriteBytes self = args.NextRw();
    Env& env = args.NextEnv();
    ReadWriteBytes newAddress = args.NextRw();

    AddressAllocatorState state;
    if (!self.Read(state)) {
        return ContractError::BadInput().Code();
    }

    // Only the shard's own allocator hands out addresses, and only to the code contract
    if (env.OwnAddress() != SystemAddressAllocator(env.GetShardIndex())) {
        return ContractError::Forbidden().Code();
    }
    if (env.Caller() != ADDRESS_SYSTEM_CODE) {
        LogPrint(BCLog::SYSTEM, "AddressAllocator: allocation requested by %s\n", env.Caller().ToString());
        return ContractError::Forbidden().Code();
    }

    if (state.maxAddress < state.nextAddress) {
        LogPrintf("AddressAllocator: address range of %s is exhausted\n", env.OwnAddress().ToString());
        return ContractError::Forbidden().Code();
    }

    const Address allocated = state.nextAddress;
    std::optional<Address> nextAddress = allocated.CheckedAdd(Address{1, 0});
    if (!nextAddress) {
        return ContractError::Forbidden().Code();
    }
    state.nextAddress = *nextAddress;

    if (!newAddress.Write(allocated)) {
        return ContractError::BadOutput().Code();
    }
    if (!self.Write(state)) {
        return ContractError::BadOutput().Code();
    }

    LogPrint(BCLog::SYSTEM, "AddressAllocator: allocated %s\n", allocated.ToString());
    return EXIT_CODE_OK;
}

} // namespace

const NativeContract& AddressAllocatorContract()
{
    static const NativeContract contract = [] {
        NativeContract result;
        result.code = ADDRESS_ALLOCATOR_CODE;
        std::vector<uint8_t> newMetadata = NewMetadata();
        std::vector<uint8_t> allocateAddressMetadata = AllocateAddressMetadata();
        result.mainContractMetadata =
            ContractMetadataBuilder(IoTypeMetadata::Struct("AddressAllocator",
                                                           {{"next_address", IoTypeMetadata::Address()},
                                                            {"max_address", IoTypeMetadata::Address()}}),
                                    IoTypeMetadata::Unit(), IoTypeMetadata::Unit())
                .Method(newMetadata)
                .Method(allocateAddressMetadata)
                .Build();
        result.methods.push_back(NativeContractMethod::New(newMetadata, &NewFfi));
        result.methods.push_back(NativeContractMethod::New(allocateAddressMetadata, &AllocateAddressFfi));
        return result;
    }();
    return contract;
}

const MethodFingerprint& AddressAllocatorNewFingerprint()
{
    return AddressAllocatorContract().methods[0].fingerprint;
}

const MethodFingerprint& AddressAllocatorAllocateAddressFingerprint()
{
    return AddressAllocatorContract().methods[1].fingerprint;
}

ContractResult AddressAllocatorNew(Env& env, MethodContext methodContext, const Address& allocator)
{
    ExternalArgs args;
    return env.Call(allocator, AddressAllocatorNewFingerprint(), args, methodContext);
}

ContractResult AddressAllocatorAllocateAddress(Env& env, MethodContext methodContext, const Address& allocator,
                                               Address& newAddress)
{
    uint32_t size = 0;
    const uint32_t capacity = sizeof(Address);
    ExternalArgs args;
    args.Output(&newAddress, &size, &capacity);
    ContractResult result = env.Call(allocator, AddressAllocatorAllocateAddressFingerprint(), args, methodContext);
    if (result && size != sizeof(Address)) {
        return ContractResult::Err(ContractError::BadOutput());
    }
    return result;
}

} // namespace ABVM
