#include "blobrelay/receiver/transfer_registry.hpp"

namespace blobrelay::receiver {

TransferRegistry::LockedTransfer::LockedTransfer(std::shared_ptr<Entry> entry,
                                                 std::unique_lock<std::mutex> lock,
                                                 bool created)
    : entry_(std::move(entry)),
      lock_(std::move(lock)),
      created_(created) {
}

void TransferRegistry::LockedTransfer::unlock() {
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

TransferRegistry::TransferRegistry(size_t max_transfers)
    : max_transfers_(max_transfers) {
}

TransferRegistry::LockedTransfer TransferRegistry::acquire(const std::string& transfer_id,
                                                           bool create,
                                                           utils::TimePoint now,
                                                           bool* at_capacity) {
    if (at_capacity) *at_capacity = false;

    for (;;) {
        std::shared_ptr<Entry> entry;
        bool created = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(transfer_id);
            if (it != entries_.end()) {
                entry = it->second;
            } else {
                if (!create) {
                    return {};
                }
                if (entries_.size() >= max_transfers_) {
                    if (at_capacity) *at_capacity = true;
                    return {};
                }
                entry = std::make_shared<Entry>();
                entry->state.transfer_id = transfer_id;
                entry->state.first_seen_at = now;
                entry->state.last_activity_at = now;
                entries_.emplace(transfer_id, entry);
                created = true;
            }
        }

        std::unique_lock<std::mutex> entry_lock(entry->mutex);
        if (entry->removed) {
            // Lost a race with remove(); look again
            continue;
        }
        return LockedTransfer(std::move(entry), std::move(entry_lock), created);
    }
}

TransferRegistry::LockedTransfer TransferRegistry::find(const std::string& transfer_id) {
    return acquire(transfer_id, false, utils::TimePoint{});
}

void TransferRegistry::remove(LockedTransfer& handle) {
    if (!handle) {
        return;
    }
    handle.entry_->removed = true;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle.entry_->state.transfer_id);
    if (it != entries_.end() && it->second == handle.entry_) {
        entries_.erase(it);
    }
}

void TransferRegistry::for_each(const std::function<void(LockedTransfer&)>& fn) {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    for (auto& entry : snapshot) {
        std::unique_lock<std::mutex> entry_lock(entry->mutex);
        if (entry->removed) {
            continue;
        }
        LockedTransfer handle(entry, std::move(entry_lock), false);
        fn(handle);
    }
}

size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace blobrelay::receiver
