// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <contracts/method.h>
#include <contracts/metadata.h>
#include <crypto/sha256.h>

#include <optional>
#include <stdexcept>
#include <utility>

namespace ABVM {

MethodFingerprint MethodFingerprint::FromMetadata(const std::vector<uint8_t>& methodMetadata)
{
    std::optional<std::vector<uint8_t>> compact = CompactExternalArgsMetadata(methodMetadata);
    if (!compact) {
        throw std::invalid_argument("Can't derive method fingerprint from malformed method metadata");
    }
    MethodFingerprint fingerprint;
    CSHA256().Write(compact->data(), compact->size()).Finalize(fingerprint.bytes.data());
    return fingerprint;
}

std::string MethodFingerprint::ToString() const
{
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string rv;
    rv.reserve(SIZE * 2);
    for (uint8_t byte : bytes) {
        rv.push_back(hexmap[byte >> 4]);
        rv.push_back(hexmap[byte & 15]);
    }
    return rv;
}

NativeContractMethod NativeContractMethod::New(std::vector<uint8_t> methodMetadata, FfiFunction fn)
{
    NativeContractMethod method;
    method.fingerprint = MethodFingerprint::FromMetadata(methodMetadata);
    method.metadata = std::move(methodMetadata);
    method.ffiFn = fn;
    return method;
}

ExternalArgs& ExternalArgs::Slot(const Address* address)
{
    ptrs.push_back(const_cast<Address*>(address));
    return *this;
}

ExternalArgs& ExternalArgs::Input(const void* data, const uint32_t* size)
{
    ptrs.push_back(const_cast<void*>(data));
    ptrs.push_back(const_cast<uint32_t*>(size));
    return *this;
}

ExternalArgs& ExternalArgs::Output(void* data, uint32_t* size, const uint32_t* capacity)
{
    ptrs.push_back(data);
    ptrs.push_back(size);
    ptrs.push_back(const_cast<uint32_t*>(capacity));
    return *this;
}

} // namespace ABVM
