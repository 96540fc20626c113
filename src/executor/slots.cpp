// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <executor/slots.h>
#include <util.h>

#include <algorithm>

namespace ABVM {

namespace {

enum class SlotState {
    /** Original value, not accessed */
    ORIGINAL,
    /** Original value, read in an open view */
    ORIGINAL_ACCESSED,
    /** Value written by a committed view, not accessed */
    MODIFIED,
    /** Value written by a committed view, read in an open view */
    MODIFIED_ACCESSED,
    /** Being written, previous value was original */
    READ_WRITE_ORIGINAL,
    /** Being written, previous value was modified */
    READ_WRITE_MODIFIED,
};

struct Slot {
    SlotState state = SlotState::ORIGINAL;
    /** Current value, or the value before writing started in READ_WRITE_* states */
    SharedAlignedBuffer buffer;
    /** Value being written, only used in READ_WRITE_* states */
    OwnedAlignedBuffer writeBuffer;

    bool IsReadWrite() const {
        return state == SlotState::READ_WRITE_ORIGINAL || state == SlotState::READ_WRITE_MODIFIED;
    }
    bool IsAccessed() const {
        return state == SlotState::ORIGINAL_ACCESSED || state == SlotState::MODIFIED_ACCESSED;
    }
};

struct SlotAccess {
    SlotIndex slotIndex;
    bool readWrite;
};

/** Value of a slot before a nested view committed a write to it */
struct SlotUndo {
    SlotIndex slotIndex;
    SharedAlignedBuffer buffer;
    bool wasModified;
};

} // namespace

struct Slots::Inner {
    std::vector<std::pair<SlotKey, Slot>> slots;
    /** Accesses of all open views, oldest first */
    std::vector<SlotAccess> ledger;
    /** Contracts for which slots may be created */
    std::vector<Address> newContracts;
    /** Writes committed by nested views while an enclosing view is still open, oldest first */
    std::vector<SlotUndo> journal;

    std::optional<SlotIndex> Find(const SlotKey& key) const {
        for (SlotIndex i = 0; i < slots.size(); ++i) {
            if (slots[i].first == key) {
                return i;
            }
        }
        return std::nullopt;
    }

    /** Access recorded in the ledger for the slot, if any */
    std::optional<bool> LedgerAccess(SlotIndex slotIndex) const {
        for (const SlotAccess& access : ledger) {
            if (access.slotIndex == slotIndex) {
                return access.readWrite;
            }
        }
        return std::nullopt;
    }

    /** Whether a slot that doesn't exist yet may be created */
    bool CanCreate(const SlotKey& key) const {
        // Tmp storage is ephemeral and usable by anyone
        if (key.contract.IsNull()) {
            return true;
        }
        return std::any_of(newContracts.begin(), newContracts.end(), [&key](const Address& candidate) {
            return candidate == key.owner || candidate == key.contract;
        });
    }
};

Slots::Slots(Kind kindIn, Inner* innerIn)
    : kind(kindIn), inner(innerIn)
{
    if (kind == Kind::READ_WRITE) {
        ledgerWatermark = inner->ledger.size();
        slotsWatermark = inner->slots.size();
        newContractsWatermark = inner->newContracts.size();
        journalWatermark = inner->journal.size();
    }
}

Slots Slots::New(const Entries& entries)
{
    auto root = std::make_unique<Inner>();
    for (const auto& entry : entries) {
        if (entry.first.contract.IsNull()) {
            continue;
        }
        Slot slot;
        slot.buffer = entry.second;
        root->slots.emplace_back(entry.first, std::move(slot));
    }

    Inner* innerPtr = root.get();
    Slots slots(Kind::ORIGINAL, innerPtr);
    slots.owned = std::move(root);
    return slots;
}

Slots::Slots(Slots&& other) noexcept
    : kind(other.kind),
      owned(std::move(other.owned)),
      inner(other.inner),
      ledgerWatermark(other.ledgerWatermark),
      slotsWatermark(other.slotsWatermark),
      newContractsWatermark(other.newContractsWatermark),
      journalWatermark(other.journalWatermark),
      outermost(other.outermost),
      closed(other.closed)
{
    other.inner = nullptr;
    other.closed = true;
}

Slots::~Slots()
{
    if (kind == Kind::READ_WRITE && !closed && inner != nullptr) {
        Close(true);
    }
}

bool Slots::Usable(const char* operation) const
{
    if (closed || inner == nullptr) {
        LogPrint(BCLog::SLOTS, "Slots: %s on a closed view\n", operation);
        return false;
    }
    return true;
}

std::optional<Slots> Slots::NewNestedRw()
{
    if (!Usable("NewNestedRw")) {
        return std::nullopt;
    }
    if (kind == Kind::READ_ONLY) {
        LogPrint(BCLog::SLOTS, "Slots: read-write view requested from a read-only view\n");
        return std::nullopt;
    }
    Slots nested(Kind::READ_WRITE, inner);
    nested.outermost = kind == Kind::ORIGINAL;
    return nested;
}

Slots Slots::NewNestedRo()
{
    Slots nested(Kind::READ_ONLY, inner);
    nested.closed = closed || inner == nullptr;
    return nested;
}

bool Slots::AddNewContract(const Address& contract)
{
    if (!Usable("AddNewContract")) {
        return false;
    }
    if (kind != Kind::READ_WRITE) {
        LogPrint(BCLog::SLOTS, "Slots: can't add new contract %s outside of a read-write view\n", contract.ToString());
        return false;
    }
    if (std::find(inner->newContracts.begin(), inner->newContracts.end(), contract) != inner->newContracts.end()) {
        LogPrint(BCLog::SLOTS, "Slots: contract %s was already added\n", contract.ToString());
        return false;
    }
    inner->newContracts.push_back(contract);
    return true;
}

std::optional<SharedAlignedBuffer> Slots::GetCode(const Address& owner) const
{
    if (!Usable("GetCode")) {
        return std::nullopt;
    }
    std::optional<SlotIndex> slotIndex = inner->Find(SlotKey{owner, ADDRESS_SYSTEM_CODE});
    if (!slotIndex) {
        return std::nullopt;
    }
    const Slot& slot = inner->slots[*slotIndex].second;
    if (slot.IsReadWrite()) {
        LogPrint(BCLog::SLOTS, "Slots: code of %s is being written\n", owner.ToString());
        return std::nullopt;
    }
    return slot.buffer;
}

std::optional<SharedAlignedBuffer> Slots::UseRo(const SlotKey& key)
{
    if (!Usable("UseRo")) {
        return std::nullopt;
    }
    if (kind == Kind::ORIGINAL) {
        LogPrint(BCLog::SLOTS, "Slots: slot access requires a nested view\n");
        return std::nullopt;
    }

    std::optional<SlotIndex> slotIndex = inner->Find(key);
    if (slotIndex) {
        // The slot that is currently being written to is not allowed for read access
        std::optional<bool> access = inner->LedgerAccess(*slotIndex);
        Slot& slot = inner->slots[*slotIndex].second;
        if ((access && *access) || slot.IsReadWrite()) {
            LogPrint(BCLog::SLOTS, "Slots: read of slot %s/%s denied, it is being written\n",
                key.owner.ToString(), key.contract.ToString());
            return std::nullopt;
        }

        if (kind == Kind::READ_ONLY) {
            return slot.buffer;
        }

        if (slot.state == SlotState::ORIGINAL || slot.state == SlotState::MODIFIED) {
            slot.state = slot.state == SlotState::ORIGINAL ? SlotState::ORIGINAL_ACCESSED : SlotState::MODIFIED_ACCESSED;
            inner->ledger.push_back(SlotAccess{*slotIndex, false});
        }
        return slot.buffer;
    }

    if (!inner->CanCreate(key)) {
        LogPrint(BCLog::SLOTS, "Slots: slot %s/%s doesn't exist and can't be created\n",
            key.owner.ToString(), key.contract.ToString());
        return std::nullopt;
    }

    if (kind == Kind::READ_ONLY) {
        // Nothing is recorded for read-only views, a missing slot reads as empty
        return SharedAlignedBuffer();
    }

    Slot slot;
    slot.state = SlotState::ORIGINAL_ACCESSED;
    inner->ledger.push_back(SlotAccess{inner->slots.size(), false});
    inner->slots.emplace_back(key, std::move(slot));
    return SharedAlignedBuffer();
}

OwnedAlignedBuffer* Slots::UseRw(const SlotKey& key, uint32_t capacity, SlotIndex& slotIndexOut)
{
    if (!Usable("UseRw")) {
        return nullptr;
    }
    if (kind != Kind::READ_WRITE) {
        LogPrint(BCLog::SLOTS, "Slots: write of slot %s/%s requires a read-write view\n",
            key.owner.ToString(), key.contract.ToString());
        return nullptr;
    }

    std::optional<SlotIndex> slotIndex = inner->Find(key);
    if (slotIndex) {
        // Only one writer and no readers at a time
        if (inner->LedgerAccess(*slotIndex)) {
            LogPrint(BCLog::SLOTS, "Slots: write of slot %s/%s denied, it is already in use\n",
                key.owner.ToString(), key.contract.ToString());
            return nullptr;
        }

        Slot& slot = inner->slots[*slotIndex].second;
        switch (slot.state) {
            case SlotState::ORIGINAL:
            case SlotState::MODIFIED:
                slot.writeBuffer = slot.buffer.ToOwned(capacity);
                slot.state = slot.state == SlotState::ORIGINAL ? SlotState::READ_WRITE_ORIGINAL : SlotState::READ_WRITE_MODIFIED;
                inner->ledger.push_back(SlotAccess{*slotIndex, true});
                break;
            case SlotState::ORIGINAL_ACCESSED:
            case SlotState::MODIFIED_ACCESSED:
                LogPrint(BCLog::SLOTS, "Slots: write of slot %s/%s denied, it is being read\n",
                    key.owner.ToString(), key.contract.ToString());
                return nullptr;
            case SlotState::READ_WRITE_ORIGINAL:
            case SlotState::READ_WRITE_MODIFIED:
                slot.writeBuffer.EnsureCapacity(capacity);
                break;
        }

        slotIndexOut = *slotIndex;
        return &slot.writeBuffer;
    }

    if (!inner->CanCreate(key)) {
        LogPrint(BCLog::SLOTS, "Slots: slot %s/%s doesn't exist and can't be created\n",
            key.owner.ToString(), key.contract.ToString());
        return nullptr;
    }

    Slot slot;
    slot.state = SlotState::READ_WRITE_ORIGINAL;
    slot.writeBuffer = OwnedAlignedBuffer::WithCapacity(capacity);
    slotIndexOut = inner->slots.size();
    inner->ledger.push_back(SlotAccess{slotIndexOut, true});
    inner->slots.emplace_back(key, std::move(slot));
    return &inner->slots.back().second.writeBuffer;
}

OwnedAlignedBuffer* Slots::AccessUsedRw(SlotIndex slotIndex)
{
    if (!Usable("AccessUsedRw") || kind != Kind::READ_WRITE) {
        return nullptr;
    }
    if (slotIndex >= inner->slots.size()) {
        LogPrint(BCLog::SLOTS, "Slots: slot index %u out of range\n", slotIndex);
        return nullptr;
    }
    Slot& slot = inner->slots[slotIndex].second;
    if (!slot.IsReadWrite()) {
        LogPrint(BCLog::SLOTS, "Slots: slot index %u is not being written\n", slotIndex);
        return nullptr;
    }
    return &slot.writeBuffer;
}

void Slots::Reset()
{
    if (kind != Kind::READ_WRITE || closed || inner == nullptr) {
        return;
    }
    Close(false);
}

void Slots::Close(bool commit)
{
    for (size_t i = ledgerWatermark; i < inner->ledger.size(); ++i) {
        Slot& slot = inner->slots[inner->ledger[i].slotIndex].second;
        switch (slot.state) {
            case SlotState::ORIGINAL_ACCESSED:
                slot.state = SlotState::ORIGINAL;
                break;
            case SlotState::MODIFIED_ACCESSED:
                slot.state = SlotState::MODIFIED;
                break;
            case SlotState::READ_WRITE_ORIGINAL:
            case SlotState::READ_WRITE_MODIFIED:
                if (commit) {
                    if (!outermost) {
                        inner->journal.push_back(SlotUndo{inner->ledger[i].slotIndex, slot.buffer,
                                                          slot.state == SlotState::READ_WRITE_MODIFIED});
                    }
                    slot.buffer = std::move(slot.writeBuffer).IntoShared();
                    slot.state = SlotState::MODIFIED;
                } else {
                    // Buffer still holds the value from before the write
                    slot.state = slot.state == SlotState::READ_WRITE_ORIGINAL ? SlotState::ORIGINAL : SlotState::MODIFIED;
                }
                slot.writeBuffer = OwnedAlignedBuffer();
                break;
            case SlotState::ORIGINAL:
            case SlotState::MODIFIED:
                break;
        }
    }
    inner->ledger.resize(ledgerWatermark);

    if (!commit) {
        // Undo writes of nested views that committed, newest first
        for (size_t i = inner->journal.size(); i > journalWatermark; --i) {
            SlotUndo& undo = inner->journal[i - 1];
            Slot& slot = inner->slots[undo.slotIndex].second;
            slot.buffer = std::move(undo.buffer);
            slot.state = undo.wasModified ? SlotState::MODIFIED : SlotState::ORIGINAL;
        }
        inner->newContracts.resize(newContractsWatermark);
        // Slots created in this view; nothing in the ledger or journal refers to them anymore
        if (inner->slots.size() > slotsWatermark) {
            inner->slots.erase(inner->slots.begin() + slotsWatermark, inner->slots.end());
        }
    }
    if (!commit || outermost) {
        inner->journal.resize(journalWatermark);
    }

    closed = true;
}

std::optional<SharedAlignedBuffer> Slots::Get(const SlotKey& key) const
{
    if (inner == nullptr) {
        return std::nullopt;
    }
    std::optional<SlotIndex> slotIndex = inner->Find(key);
    if (!slotIndex) {
        return std::nullopt;
    }
    return inner->slots[*slotIndex].second.buffer;
}

bool Slots::ClearTmp()
{
    if (kind != Kind::ORIGINAL || inner == nullptr) {
        return false;
    }
    if (!inner->ledger.empty()) {
        return error("Slots: can't clear tmp storage while %u accesses are outstanding", inner->ledger.size());
    }
    auto& slots = inner->slots;
    slots.erase(std::remove_if(slots.begin(), slots.end(), [](const std::pair<SlotKey, Slot>& entry) {
        return entry.first.contract.IsNull();
    }), slots.end());
    return true;
}

size_t Slots::NumSlots() const
{
    return inner == nullptr ? 0 : inner->slots.size();
}

} // namespace ABVM
