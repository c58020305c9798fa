#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/*
-------------------------------------------------------------------------------
 pair_locks.hpp — One mutex per (student, course) pair
-------------------------------------------------------------------------------
Every engine operation on a pair holds that pair's lock for its whole unit
of work, so operations on one pair are linearizable while different pairs
run in parallel. Entries exist only while someone holds or waits for them.

Lock order inside the engine: pair lock, then pooled connection, then
transaction. A thread never holds two pair locks.
-------------------------------------------------------------------------------
*/

class PairLockTable {
public:
    using Key = std::pair<std::string, std::string>;

    class Guard {
    public:
        Guard(PairLockTable& table, Key key);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        PairLockTable& table_;
        Key key_;
        std::shared_ptr<std::mutex> mutex_;
    };

    Guard lock(const std::string& student_id, const std::string& course_id) {
        return Guard(*this, Key(student_id, course_id));
    }

    /// Pairs currently locked or waited on.
    size_t active() const;

private:
    struct Entry {
        std::shared_ptr<std::mutex> mutex = std::make_shared<std::mutex>();
        int users = 0;
    };

    std::shared_ptr<std::mutex> checkout(const Key& key);
    void checkin(const Key& key);

    mutable std::mutex mu_;
    std::map<Key, Entry> entries_;
};
