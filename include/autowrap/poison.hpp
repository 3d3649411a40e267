#ifndef AUTOWRAP_POISON_HPP
#define AUTOWRAP_POISON_HPP

#include <atomic>
#include <exception>
#include <utility>
#include "option.hpp"
#include "result.hpp"

// Lock poisoning shared by Mutex and RwLock
//
// A lock is poisoned when a thread leaves its critical section by an
// exception: the guard notices on destruction that more exceptions are in
// flight than when it was acquired. The data may then be half-updated, so
// every later acquisition reports Err(PoisonError) while still handing
// out the guard for callers that know how to repair the data.

namespace autowrap {

namespace detail {

class PoisonFlag {
private:
    std::atomic<bool> failed_{false};

public:
    bool get() const {
        return failed_.load(std::memory_order_relaxed);
    }

    void set() {
        failed_.store(true, std::memory_order_relaxed);
    }

    void clear() {
        failed_.store(false, std::memory_order_relaxed);
    }
};

// Captured when a guard is created, checked when it is dropped
class PoisonOnUnwind {
private:
    PoisonFlag* flag_;
    int exceptions_on_entry_;

public:
    explicit PoisonOnUnwind(PoisonFlag* flag)
        : flag_(flag), exceptions_on_entry_(std::uncaught_exceptions()) {}

    PoisonOnUnwind(PoisonOnUnwind&& other) noexcept
        : flag_(other.flag_), exceptions_on_entry_(other.exceptions_on_entry_) {
        other.flag_ = nullptr;
    }

    PoisonOnUnwind(const PoisonOnUnwind&) = delete;
    PoisonOnUnwind& operator=(const PoisonOnUnwind&) = delete;
    PoisonOnUnwind& operator=(PoisonOnUnwind&&) = delete;

    // Must run before the lock is released
    void done() {
        if (flag_ && std::uncaught_exceptions() > exceptions_on_entry_) {
            flag_->set();
        }
        flag_ = nullptr;
    }

    ~PoisonOnUnwind() {
        done();
    }
};

} // namespace detail

// PoisonError<Guard> - the lock was acquired, but a previous holder
// failed while holding it
template<typename Guard>
class PoisonError {
private:
    Guard guard_;

public:
    explicit PoisonError(Guard guard) : guard_(std::move(guard)) {}

    PoisonError(PoisonError&&) = default;
    PoisonError(const PoisonError&) = delete;
    PoisonError& operator=(const PoisonError&) = delete;

    // Recover the guard and access the data anyway
    Guard into_inner() && {
        return std::move(guard_);
    }

    Guard& get_ref() { return guard_; }
    const Guard& get_ref() const { return guard_; }

    const char* what() const {
        return "poisoned lock: another task failed inside";
    }
};

enum class TryLockErrorKind {
    Poisoned,
    WouldBlock,
};

// TryLockError<Guard> - a non-blocking acquisition failed
template<typename Guard>
class TryLockError {
private:
    TryLockErrorKind kind_;
    Option<Guard> guard_;  // set only for Poisoned

    TryLockError(TryLockErrorKind kind, Option<Guard> guard)
        : kind_(kind), guard_(std::move(guard)) {}

public:
    static TryLockError would_block() {
        return TryLockError(TryLockErrorKind::WouldBlock, None);
    }

    static TryLockError poisoned(Guard guard) {
        return TryLockError(TryLockErrorKind::Poisoned, Some(std::move(guard)));
    }

    TryLockError(TryLockError&&) = default;
    TryLockError(const TryLockError&) = delete;
    TryLockError& operator=(const TryLockError&) = delete;

    TryLockErrorKind kind() const { return kind_; }
    bool is_would_block() const { return kind_ == TryLockErrorKind::WouldBlock; }
    bool is_poisoned() const { return kind_ == TryLockErrorKind::Poisoned; }

    // Recover the guard of a poisoned lock (throws for WouldBlock)
    Guard into_inner() && {
        return guard_.expect("TryLockError: lock would block, no guard held");
    }

    const char* what() const {
        return is_poisoned() ? "poisoned lock: another task failed inside"
                             : "try_lock failed because the operation would block";
    }
};

template<typename Guard>
using LockResult = Result<Guard, PoisonError<Guard>>;

template<typename Guard>
using TryLockResult = Result<Guard, TryLockError<Guard>>;

namespace detail {

template<typename Guard>
LockResult<Guard> lock_result(const PoisonFlag& flag, Guard guard) {
    if (flag.get()) {
        return LockResult<Guard>::Err(PoisonError<Guard>(std::move(guard)));
    }
    return LockResult<Guard>::Ok(std::move(guard));
}

template<typename Guard>
TryLockResult<Guard> try_lock_result(const PoisonFlag& flag, Option<Guard> guard) {
    if (guard.is_none()) {
        return TryLockResult<Guard>::Err(TryLockError<Guard>::would_block());
    }
    if (flag.get()) {
        return TryLockResult<Guard>::Err(TryLockError<Guard>::poisoned(guard.unwrap()));
    }
    return TryLockResult<Guard>::Ok(guard.unwrap());
}

} // namespace detail

} // namespace autowrap

#endif // AUTOWRAP_POISON_HPP
