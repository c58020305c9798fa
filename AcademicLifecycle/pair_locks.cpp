#include "pair_locks.hpp"

PairLockTable::Guard::Guard(PairLockTable& table, Key key)
    : table_(table), key_(std::move(key)), mutex_(table_.checkout(key_)) {
    mutex_->lock();
}

PairLockTable::Guard::~Guard() {
    mutex_->unlock();
    table_.checkin(key_);
}

std::shared_ptr<std::mutex> PairLockTable::checkout(const Key& key) {
    std::lock_guard<std::mutex> lock(mu_);
    Entry& e = entries_[key];
    ++e.users;
    return e.mutex;
}

void PairLockTable::checkin(const Key& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    if (--it->second.users == 0) entries_.erase(it);
}

size_t PairLockTable::active() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}
