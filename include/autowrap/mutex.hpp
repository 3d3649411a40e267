#ifndef AUTOWRAP_MUTEX_HPP
#define AUTOWRAP_MUTEX_HPP

#include <mutex>
#include <utility>
#include "option.hpp"
#include "poison.hpp"
#include "result.hpp"
#include "unsafe_cell.hpp"

namespace autowrap {

template<typename T> class Mutex;

// MutexGuard - RAII lock guard for Mutex<T>
//
// Dropping the guard while an exception propagates poisons the mutex.
template<typename T>
class MutexGuard {
private:
    std::unique_lock<std::mutex> lock_;
    T* data_;
    detail::PoisonOnUnwind poison_;  // destroyed before lock_

    friend class Mutex<T>;

    MutexGuard(std::unique_lock<std::mutex>&& lock, T* data, detail::PoisonFlag* flag)
        : lock_(std::move(lock)), data_(data), poison_(flag) {}

public:
    T& operator*() const { return *data_; }
    T* operator->() const { return data_; }

    T* get() const { return data_; }

    // Move the protected value out; the mutex keeps a moved-from T
    T into_inner() && {
        return std::move(*data_);
    }

    MutexGuard(MutexGuard&&) = default;
    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;
    MutexGuard& operator=(MutexGuard&&) = delete;

    ~MutexGuard() {
        poison_.done();
    }
};

// Mutex<T> - mutual exclusion around a value
//
// Usage:
//   Mutex<int> counter(0);
//   {
//       auto guard = counter.lock().unwrap();
//       *guard += 1;
//   }  // Lock released here
//
// lock() blocks until the mutex is free and returns Err(PoisonError) if a
// previous holder left by an exception; the error still carries the guard.
template<typename T>
class Mutex {
private:
    UnsafeCell<std::mutex> mtx_;
    mutable detail::PoisonFlag poison_;
    UnsafeCell<T> data_;

    MutexGuard<T> make_guard(std::unique_lock<std::mutex>&& lock) const {
        return MutexGuard<T>(std::move(lock), data_.get(), &poison_);
    }

public:
    using Guard = MutexGuard<T>;

    explicit Mutex(T value) : data_(std::move(value)) {}

    template<typename... Args>
    explicit Mutex(std::in_place_t, Args&&... args) : data_(std::forward<Args>(args)...) {}

    [[nodiscard]] LockResult<Guard> lock() const {
        return detail::lock_result(poison_, make_guard(std::unique_lock<std::mutex>(*mtx_.get())));
    }

    // Never blocks; Err(WouldBlock) if another guard is live
    [[nodiscard]] TryLockResult<Guard> try_lock() const {
        std::unique_lock<std::mutex> lk(*mtx_.get(), std::try_to_lock);
        if (!lk.owns_lock()) {
            return detail::try_lock_result<Guard>(poison_, None);
        }
        return detail::try_lock_result(poison_, Some(make_guard(std::move(lk))));
    }

    bool is_poisoned() const {
        return poison_.get();
    }

    // Mark the data as repaired
    void clear_poison() const {
        poison_.clear();
    }

    // Exclusive access to the Mutex itself needs no locking
    T& get_mut() {
        return data_.get_mut();
    }

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;
    Mutex(Mutex&&) = delete;
    Mutex& operator=(Mutex&&) = delete;
};

} // namespace autowrap

#endif // AUTOWRAP_MUTEX_HPP
