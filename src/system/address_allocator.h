// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_SYSTEM_ADDRESS_ALLOCATOR_H
#define ABVM_SYSTEM_ADDRESS_ALLOCATOR_H

#include <contracts/address.h>
#include <contracts/env.h>
#include <contracts/error.h>
#include <contracts/method.h>

namespace ABVM {

/**
 * @brief State of a shard's address allocator
 *
 * Addresses in [nextAddress, maxAddress] are still available.
 */
struct AddressAllocatorState {
    Address nextAddress;
    Address maxAddress;
};

static_assert(sizeof(AddressAllocatorState) == 32, "Address allocator state has a fixed layout");

/**
 * Address allocator system contract, deployed at SystemAddressAllocator() of
 * every shard. Methods:
 *  - new (init): range starts right after the allocator's own address
 *  - allocate_address (update, self rw): hands out the next address, only to
 *    the code system contract
 */
const NativeContract& AddressAllocatorContract();

const MethodFingerprint& AddressAllocatorNewFingerprint();
const MethodFingerprint& AddressAllocatorAllocateAddressFingerprint();

ContractResult AddressAllocatorNew(Env& env, MethodContext methodContext, const Address& allocator);
ContractResult AddressAllocatorAllocateAddress(Env& env, MethodContext methodContext, const Address& allocator,
                                               Address& newAddress);

} // namespace ABVM

#endif // ABVM_SYSTEM_ADDRESS_ALLOCATOR_H
