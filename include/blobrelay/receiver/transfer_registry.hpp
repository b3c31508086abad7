#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "blobrelay/receiver/transfer_state.hpp"
#include "blobrelay/utils/time.hpp"

namespace blobrelay::receiver {

// In-flight transfers keyed by transfer id.
//
// Each entry carries its own mutex. The registry mutex is held only to
// find, insert or erase an entry, never while an entry is locked by the
// same thread's lookup, so work on one transfer does not block another.
// Lock order is entry -> registry (remove() is called with the entry held).
class TransferRegistry {
public:
    struct Entry {
        std::mutex mutex;
        TransferState state;
        bool removed{false};  // Guarded by mutex
    };

    // Exclusive access to one entry for as long as the handle lives
    class LockedTransfer {
    public:
        LockedTransfer() = default;
        LockedTransfer(std::shared_ptr<Entry> entry, std::unique_lock<std::mutex> lock,
                       bool created);

        LockedTransfer(LockedTransfer&&) = default;
        LockedTransfer& operator=(LockedTransfer&&) = default;

        explicit operator bool() const { return entry_ != nullptr && lock_.owns_lock(); }

        [[nodiscard]] TransferState& state() { return entry_->state; }
        [[nodiscard]] const TransferState& state() const { return entry_->state; }

        // True when this lookup inserted the entry
        [[nodiscard]] bool created() const { return created_; }

        // Release the entry lock early
        void unlock();

    private:
        friend class TransferRegistry;
        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::mutex> lock_;
        bool created_{false};
    };

    explicit TransferRegistry(size_t max_transfers = 256);

    // Disable copy
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // Lock the entry for `transfer_id`, inserting a fresh COLLECTING state
    // stamped with `now` when missing and `create` is set. Returns an empty
    // handle when absent, or when full (`at_capacity` is then set).
    LockedTransfer acquire(const std::string& transfer_id, bool create,
                           utils::TimePoint now, bool* at_capacity = nullptr);

    // Lock an existing entry
    LockedTransfer find(const std::string& transfer_id);

    // Erase a locked entry. The handle stays locked but is detached.
    void remove(LockedTransfer& handle);

    // Visit every entry under its own lock. Entries inserted during the
    // walk may be skipped.
    void for_each(const std::function<void(LockedTransfer&)>& fn);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return max_transfers_; }

private:
    size_t max_transfers_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace blobrelay::receiver
