#ifndef AUTOWRAP_ATOMIC_HPP
#define AUTOWRAP_ATOMIC_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "option.hpp"
#include "result.hpp"

namespace autowrap {

// Memory ordering for a single atomic access
enum class Ordering {
    Relaxed,
    Release,
    Acquire,
    AcqRel,
    SeqCst,
};

namespace detail {

inline std::memory_order to_std(Ordering order) {
    switch (order) {
        case Ordering::Relaxed: return std::memory_order_relaxed;
        case Ordering::Release: return std::memory_order_release;
        case Ordering::Acquire: return std::memory_order_acquire;
        case Ordering::AcqRel:  return std::memory_order_acq_rel;
        case Ordering::SeqCst:  return std::memory_order_seq_cst;
    }
    throw std::invalid_argument("unknown Ordering");
}

inline std::memory_order load_order(Ordering order) {
    if (order == Ordering::Release) {
        throw std::invalid_argument("there is no such thing as a release load");
    }
    if (order == Ordering::AcqRel) {
        throw std::invalid_argument("there is no such thing as an acquire-release load");
    }
    return to_std(order);
}

inline std::memory_order store_order(Ordering order) {
    if (order == Ordering::Acquire) {
        throw std::invalid_argument("there is no such thing as an acquire store");
    }
    if (order == Ordering::AcqRel) {
        throw std::invalid_argument("there is no such thing as an acquire-release store");
    }
    return to_std(order);
}

// The failure half of a compare-exchange is a load
inline std::memory_order failure_order(Ordering order) {
    if (order == Ordering::Release) {
        throw std::invalid_argument("there is no such thing as a release failure ordering");
    }
    if (order == Ordering::AcqRel) {
        throw std::invalid_argument("there is no such thing as an acquire-release failure ordering");
    }
    return to_std(order);
}

} // namespace detail

// Atomic<T> - an integer (or bool) with indivisible read-modify-write
// operations
//
// Every access names its Ordering. Orderings that make no sense for the
// access (a Release load, an Acquire store) throw std::invalid_argument
// before the atomic is touched.
template<typename T>
class Atomic {
    static_assert(std::is_integral_v<T>, "Atomic<T> requires an integral type");

private:
    std::atomic<T> value_;

    template<typename U = T>
    using arithmetic = std::enable_if_t<!std::is_same_v<U, bool>, T>;

public:
    using value_type = T;

    Atomic() : value_(T{}) {}
    explicit Atomic(T value) : value_(value) {}

    T load(Ordering order) const {
        return value_.load(detail::load_order(order));
    }

    void store(T value, Ordering order) {
        value_.store(value, detail::store_order(order));
    }

    // Store and return the previous value
    T swap(T value, Ordering order) {
        return value_.exchange(value, detail::to_std(order));
    }

    // Ok(previous) if the value was `current` and is now `next`,
    // Err(actual) otherwise
    Result<T, T> compare_exchange(T current, T next, Ordering success, Ordering failure) {
        std::memory_order fail = detail::failure_order(failure);
        if (value_.compare_exchange_strong(current, next, detail::to_std(success), fail)) {
            return Result<T, T>::Ok(current);
        }
        return Result<T, T>::Err(current);
    }

    // May fail spuriously; use in a loop
    Result<T, T> compare_exchange_weak(T current, T next, Ordering success, Ordering failure) {
        std::memory_order fail = detail::failure_order(failure);
        if (value_.compare_exchange_weak(current, next, detail::to_std(success), fail)) {
            return Result<T, T>::Ok(current);
        }
        return Result<T, T>::Err(current);
    }

    template<typename U = T>
    arithmetic<U> fetch_add(T delta, Ordering order) {
        return value_.fetch_add(delta, detail::to_std(order));
    }

    template<typename U = T>
    arithmetic<U> fetch_sub(T delta, Ordering order) {
        return value_.fetch_sub(delta, detail::to_std(order));
    }

    template<typename U = T>
    arithmetic<U> fetch_and(T bits, Ordering order) {
        return value_.fetch_and(bits, detail::to_std(order));
    }

    template<typename U = T>
    arithmetic<U> fetch_or(T bits, Ordering order) {
        return value_.fetch_or(bits, detail::to_std(order));
    }

    template<typename U = T>
    arithmetic<U> fetch_xor(T bits, Ordering order) {
        return value_.fetch_xor(bits, detail::to_std(order));
    }

    // Apply f until the update lands. f returns None to give up, in which
    // case the result is Err(last seen value).
    template<typename F>
    Result<T, T> fetch_update(Ordering set_order, Ordering fetch_order, F f) {
        std::memory_order fail = detail::failure_order(fetch_order);
        std::memory_order success = detail::to_std(set_order);
        T prev = value_.load(fail);
        for (;;) {
            Option<T> next = f(prev);
            if (next.is_none()) {
                return Result<T, T>::Err(prev);
            }
            if (value_.compare_exchange_weak(prev, next.unwrap(), success, fail)) {
                return Result<T, T>::Ok(prev);
            }
        }
    }

    // Final value once no other thread can reach the atomic
    T into_inner() const {
        return value_.load(std::memory_order_relaxed);
    }

    Atomic(const Atomic&) = delete;
    Atomic& operator=(const Atomic&) = delete;
    Atomic(Atomic&&) = delete;
    Atomic& operator=(Atomic&&) = delete;
};

using AtomicBool = Atomic<bool>;
using AtomicU8 = Atomic<std::uint8_t>;
using AtomicU16 = Atomic<std::uint16_t>;
using AtomicU32 = Atomic<std::uint32_t>;
using AtomicU64 = Atomic<std::uint64_t>;
using AtomicUsize = Atomic<std::size_t>;
using AtomicI8 = Atomic<std::int8_t>;
using AtomicI16 = Atomic<std::int16_t>;
using AtomicI32 = Atomic<std::int32_t>;
using AtomicI64 = Atomic<std::int64_t>;
using AtomicIsize = Atomic<std::ptrdiff_t>;

} // namespace autowrap

#endif // AUTOWRAP_ATOMIC_HPP
