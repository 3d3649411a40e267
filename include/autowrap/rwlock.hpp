#ifndef AUTOWRAP_RWLOCK_HPP
#define AUTOWRAP_RWLOCK_HPP

#include <mutex>
#include <shared_mutex>
#include <utility>
#include "option.hpp"
#include "poison.hpp"
#include "result.hpp"
#include "unsafe_cell.hpp"

namespace autowrap {

// RwLock - many concurrent readers or one writer
//
// read() and write() block until the lock is available. A write guard
// dropped by an exception poisons the lock; read guards never do, since a
// reader cannot leave the data half-written.
template<typename T>
class RwLock {
private:
    UnsafeCell<std::shared_mutex> mtx_;
    mutable detail::PoisonFlag poison_;
    UnsafeCell<T> data_;

public:
    // ReadGuard - shared lock, read-only access
    class ReadGuard {
    private:
        std::shared_lock<std::shared_mutex> lock_;
        const T* data_;

        friend class RwLock;

        ReadGuard(std::shared_lock<std::shared_mutex>&& lock, const T* data)
            : lock_(std::move(lock)), data_(data) {}

    public:
        const T& operator*() const { return *data_; }
        const T* operator->() const { return data_; }
        const T* get() const { return data_; }

        ReadGuard(ReadGuard&&) = default;
        ReadGuard(const ReadGuard&) = delete;
        ReadGuard& operator=(const ReadGuard&) = delete;
        ReadGuard& operator=(ReadGuard&&) = delete;
    };

    // WriteGuard - exclusive lock, read-write access
    class WriteGuard {
    private:
        std::unique_lock<std::shared_mutex> lock_;
        T* data_;
        detail::PoisonOnUnwind poison_;  // destroyed before lock_

        friend class RwLock;

        WriteGuard(std::unique_lock<std::shared_mutex>&& lock, T* data, detail::PoisonFlag* flag)
            : lock_(std::move(lock)), data_(data), poison_(flag) {}

    public:
        T& operator*() const { return *data_; }
        T* operator->() const { return data_; }
        T* get() const { return data_; }

        T into_inner() && {
            return std::move(*data_);
        }

        WriteGuard(WriteGuard&&) = default;
        WriteGuard(const WriteGuard&) = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;
        WriteGuard& operator=(WriteGuard&&) = delete;

        ~WriteGuard() {
            poison_.done();
        }
    };

    explicit RwLock(T value) : data_(std::move(value)) {}

    template<typename... Args>
    explicit RwLock(std::in_place_t, Args&&... args) : data_(std::forward<Args>(args)...) {}

    [[nodiscard]] LockResult<ReadGuard> read() const {
        return detail::lock_result(
            poison_, ReadGuard(std::shared_lock<std::shared_mutex>(*mtx_.get()), data_.get()));
    }

    [[nodiscard]] TryLockResult<ReadGuard> try_read() const {
        std::shared_lock<std::shared_mutex> lock(*mtx_.get(), std::try_to_lock);
        if (!lock.owns_lock()) {
            return detail::try_lock_result<ReadGuard>(poison_, None);
        }
        return detail::try_lock_result(poison_, Some(ReadGuard(std::move(lock), data_.get())));
    }

    [[nodiscard]] LockResult<WriteGuard> write() const {
        return detail::lock_result(
            poison_, WriteGuard(std::unique_lock<std::shared_mutex>(*mtx_.get()), data_.get(), &poison_));
    }

    [[nodiscard]] TryLockResult<WriteGuard> try_write() const {
        std::unique_lock<std::shared_mutex> lock(*mtx_.get(), std::try_to_lock);
        if (!lock.owns_lock()) {
            return detail::try_lock_result<WriteGuard>(poison_, None);
        }
        return detail::try_lock_result(
            poison_, Some(WriteGuard(std::move(lock), data_.get(), &poison_)));
    }

    bool is_poisoned() const {
        return poison_.get();
    }

    void clear_poison() const {
        poison_.clear();
    }

    T& get_mut() {
        return data_.get_mut();
    }

    RwLock(const RwLock&) = delete;
    RwLock& operator=(const RwLock&) = delete;
    RwLock(RwLock&&) = delete;
    RwLock& operator=(RwLock&&) = delete;
};

} // namespace autowrap

#endif // AUTOWRAP_RWLOCK_HPP
