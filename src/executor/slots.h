// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ABVM_EXECUTOR_SLOTS_H
#define ABVM_EXECUTOR_SLOTS_H

#include <contracts/address.h>
#include <executor/aligned_buffer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace ABVM {

/**
 * @brief Identifies one slot: owner address and the contract (namespace)
 *
 * The NULL namespace holds tmp storage, SYSTEM_CODE holds deployed code and
 * SYSTEM_STATE holds contract state.
 */
struct SlotKey {
    Address owner;
    Address contract;

    bool operator==(const SlotKey& other) const { return owner == other.owner && contract == other.contract; }
    bool operator!=(const SlotKey& other) const { return !(*this == other); }
};

/** Position of a slot in the table, stable for the lifetime of the table */
using SlotIndex = size_t;

/**
 * @brief Transactional slot storage
 *
 * A Slots object is a view over a shared table. The root view (created with
 * New()) owns the table; nested views borrow it and must be destroyed before
 * their parent is used again.
 *
 * A nested read-write view records every slot it touches in an access
 * ledger. Destroying it commits those accesses: new values become the
 * slots' current values. Reset() rolls them back instead, restoring the
 * values that were there when the slot was first written in the view. Every
 * slot has at most one writer and no readers while it is being written.
 *
 * Writes committed by a view nested in another read-write view are
 * journaled, so resetting any enclosing view still undoes them. The journal
 * is dropped once the outermost read-write view commits.
 *
 * Slots can only be created for tmp storage (NULL namespace) or for
 * contracts registered with AddNewContract(). Slots created in a view that
 * is reset are removed again. Violations are logged and reported as
 * nullptr, false or nothing.
 *
 * Registrations committed by the outermost view stay for the life of the
 * table, so that later transactions can create slots for deployed
 * contracts. Every registered contract also owns a code slot, so the list
 * never outgrows the slot table.
 */
class Slots {
public:
    using Entries = std::vector<std::pair<SlotKey, SharedAlignedBuffer>>;

    /** Root view over a new table; tmp entries (NULL namespace) are dropped */
    static Slots New(const Entries& entries);

    Slots(Slots&& other) noexcept;
    Slots& operator=(Slots&& other) = delete;
    Slots(const Slots&) = delete;
    Slots& operator=(const Slots&) = delete;

    /** Commits a read-write view that was not reset */
    ~Slots();

    bool IsReadOnly() const { return kind == Kind::READ_ONLY; }

    /** Nested read-write view; nothing if this view is read-only */
    std::optional<Slots> NewNestedRw();
    /** Nested read-only view */
    Slots NewNestedRo();

    /**
     * Allow creation of slots owned by or namespaced to the address. Fails
     * for read-only views and for already registered addresses.
     */
    bool AddNewContract(const Address& contract);

    /** Code of a contract, without recording access; nothing if missing or being written */
    std::optional<SharedAlignedBuffer> GetCode(const Address& owner) const;

    /** Shared read access, recorded in the ledger of a read-write view */
    std::optional<SharedAlignedBuffer> UseRo(const SlotKey& key);

    /**
     * Exclusive write access. The returned buffer starts as a copy of the
     * current value with at least the given capacity. The pointer is only
     * valid until the table is modified again; use AccessUsedRw() with the
     * returned index to get it back.
     */
    OwnedAlignedBuffer* UseRw(const SlotKey& key, uint32_t capacity, SlotIndex& slotIndex);

    /** Buffer of a slot previously returned by UseRw() and still being written */
    OwnedAlignedBuffer* AccessUsedRw(SlotIndex slotIndex);

    /** Roll back everything done in this read-write view and close it */
    void Reset();

    /** Current value of a slot regardless of access state, for inspection */
    std::optional<SharedAlignedBuffer> Get(const SlotKey& key) const;

    /** Drop all tmp slots; root view only, with no accesses outstanding */
    bool ClearTmp();

    size_t NumSlots() const;

private:
    enum class Kind { ORIGINAL, READ_WRITE, READ_ONLY };

    struct Inner;

    Slots(Kind kindIn, Inner* innerIn);

    bool Usable(const char* operation) const;
    void Close(bool commit);

    Kind kind;
    std::unique_ptr<Inner> owned;
    Inner* inner;
    size_t ledgerWatermark = 0;
    size_t slotsWatermark = 0;
    size_t newContractsWatermark = 0;
    size_t journalWatermark = 0;
    /** Read-write view opened directly on the root */
    bool outermost = false;
    bool closed = false;
};

} // namespace ABVM

#endif // ABVM_EXECUTOR_SLOTS_H
