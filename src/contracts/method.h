// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_CONTRACTS_METHOD_H
#define ABVM_CONTRACTS_METHOD_H

#include <contracts/address.h>
#include <contracts/error.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace ABVM {

class Env;

/**
 * @brief Unique identifier of a method signature: SHA-256 of the method's
 * metadata compacted with CompactExternalArgsMetadata()
 *
 * Argument names, names inside types and arguments without an external
 * representation don't affect the fingerprint; the method name does.
 */
struct MethodFingerprint {
    static constexpr size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};

    /** Throws std::invalid_argument on malformed method metadata */
    static MethodFingerprint FromMetadata(const std::vector<uint8_t>& methodMetadata);

    std::string ToString() const;

    bool operator==(const MethodFingerprint& other) const { return bytes == other.bytes; }
    bool operator!=(const MethodFingerprint& other) const { return bytes != other.bytes; }
    bool operator<(const MethodFingerprint& other) const { return bytes < other.bytes; }
};

/**
 * Native method entry point. Receives the internal arguments table built by
 * the executor and returns EXIT_CODE_OK or an error code.
 */
using FfiFunction = ExitCode (*)(void** internalArgs);

/**
 * @brief Native implementation of one method
 */
struct NativeContractMethod {
    std::vector<uint8_t> metadata;
    MethodFingerprint fingerprint;
    FfiFunction ffiFn = nullptr;

    static NativeContractMethod New(std::vector<uint8_t> methodMetadata, FfiFunction fn);
};

/**
 * @brief Everything the executor needs to know about a native contract
 *
 * The code bytes are what gets deployed and stored in the code slot; they are
 * what identifies the implementation at call time.
 */
struct NativeContract {
    std::string code;
    std::vector<uint8_t> mainContractMetadata;
    std::vector<NativeContractMethod> methods;

    std::vector<uint8_t> CodeBytes() const { return std::vector<uint8_t>(code.begin(), code.end()); }
};

/**
 * @brief Caller side argument table
 *
 * Slots contribute a pointer to the address, inputs a data pointer and a
 * pointer to the size, outputs a data pointer, a pointer to the size (written
 * by the callee) and a pointer to the capacity. Env and tmp arguments have no
 * external representation. Referenced memory must outlive the call.
 */
class ExternalArgs {
public:
    ExternalArgs& Slot(const Address* address);
    ExternalArgs& Input(const void* data, const uint32_t* size);
    ExternalArgs& Output(void* data, uint32_t* size, const uint32_t* capacity);

    void** Data() { return ptrs.data(); }
    size_t Size() const { return ptrs.size(); }

private:
    std::vector<void*> ptrs;
};

/**
 * @brief Read-only bytes handed to a native method
 */
struct ReadOnlyBytes {
    const uint8_t* data = nullptr;
    uint32_t size = 0;

    /** Copy out a trivially copyable value, requires an exact size match */
    template <typename T>
    bool Read(T& out) const {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
        if (size != sizeof(T) || data == nullptr) {
            return false;
        }
        std::memcpy(&out, data, sizeof(T));
        return true;
    }
};

/**
 * @brief Read-write bytes handed to a native method
 *
 * The data pointer lives in the internal arguments table; a method may point
 * it at different memory that stays valid until it returns, and the executor
 * then copies size bytes from there.
 */
struct ReadWriteBytes {
    void** dataSlot = nullptr;
    uint32_t* size = nullptr;
    const uint32_t* capacity = nullptr;

    uint8_t* Data() const { return static_cast<uint8_t*>(*dataSlot); }
    uint32_t Size() const { return *size; }
    uint32_t Capacity() const { return *capacity; }

    ReadOnlyBytes AsReadOnly() const { return ReadOnlyBytes{Data(), *size}; }

    /** Replace contents, fails if they don't fit the capacity */
    bool Assign(const void* src, uint32_t len) {
        if (len > *capacity) {
            return false;
        }
        if (len > 0) {
            std::memcpy(Data(), src, len);
        }
        *size = len;
        return true;
    }

    template <typename T>
    bool Write(const T& value) {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
        return Assign(&value, sizeof(T));
    }

    template <typename T>
    bool Read(T& out) const { return AsReadOnly().Read(out); }
};

/**
 * @brief Callee side cursor over the internal arguments table
 *
 * Arguments must be taken in metadata order, starting with the state for
 * stateful methods.
 */
class InternalArgs {
public:
    explicit InternalArgs(void** argsIn) : args(argsIn) {}

    Env& NextEnv() { return *static_cast<Env*>(args[pos++]); }
    const Address& NextAddress() { return *static_cast<const Address*>(args[pos++]); }

    /** State ro, tmp ro, slot ro (after its address) and inputs */
    ReadOnlyBytes NextRo() {
        ReadOnlyBytes bytes;
        bytes.data = static_cast<const uint8_t*>(args[pos++]);
        bytes.size = *static_cast<const uint32_t*>(args[pos++]);
        return bytes;
    }

    /** State rw, tmp rw, slot rw (after its address) and outputs */
    ReadWriteBytes NextRw() {
        ReadWriteBytes bytes;
        bytes.dataSlot = &args[pos++];
        bytes.size = static_cast<uint32_t*>(args[pos++]);
        bytes.capacity = static_cast<const uint32_t*>(args[pos++]);
        return bytes;
    }

private:
    void** args;
    size_t pos = 0;
};

} // namespace ABVM

#endif // ABVM_CONTRACTS_METHOD_H
