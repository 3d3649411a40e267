#ifndef AUTOWRAP_WRAP_HPP
#define AUTOWRAP_WRAP_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include "config.hpp"
#include "cell.hpp"

#if AUTOWRAP_FEATURE_STD
#include "once_cell.hpp"
#include "rc.hpp"
#include "refcell.hpp"
#endif

#if AUTOWRAP_FEATURE_SYNC
#include "arc.hpp"
#include "atomic.hpp"
#include "mutex.hpp"
#include "rwlock.hpp"
#endif

// One-call constructors for the ownership and concurrency primitives
//
//   auto hits   = autowrap::cell(0u);                 // Cell<unsigned>
//   auto shared = autowrap::rc_refcell(std::vector<int>{});
//   auto state  = autowrap::arc_mutex(State{});       // Arc<Mutex<State>>
//   auto flags  = autowrap::atomic_u8(0x1ff);         // AtomicU8, holds 0xff
//
// or, reading left to right:
//
//   auto state = autowrap::wrap(State{}).arc_mutex();
//
// Each function consumes its argument and returns the primitive by value;
// nothing here locks, blocks or fails. Non-movable primitives (Cell,
// RefCell, OnceCell, Atomic) rely on guaranteed copy elision, so bind the
// result directly: `auto c = autowrap::cell(1);`.

namespace autowrap {

namespace detail {

template<typename From, typename To>
using enable_integral_conversion =
    std::enable_if_t<std::is_integral_v<std::decay_t<From>> && std::is_integral_v<To>, int>;

} // namespace detail

template<typename T>
inline Cell<T> cell(T value) {
    return Cell<T>(value);
}

#if AUTOWRAP_FEATURE_STD

template<typename T>
inline RefCell<std::decay_t<T>> refcell(T&& value) {
    return RefCell<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
inline Rc<std::decay_t<T>> rc(T&& value) {
    return Rc<std::decay_t<T>>::make(std::forward<T>(value));
}

template<typename T>
inline Rc<RefCell<std::decay_t<T>>> rc_refcell(T&& value) {
    return Rc<RefCell<std::decay_t<T>>>::make(std::forward<T>(value));
}

// Already initialized; a later set() returns Err
template<typename T>
inline OnceCell<std::decay_t<T>> once_cell(T&& value) {
    return OnceCell<std::decay_t<T>>(std::forward<T>(value));
}

#endif // AUTOWRAP_FEATURE_STD

#if AUTOWRAP_FEATURE_SYNC

template<typename T>
inline Arc<std::decay_t<T>> arc(T&& value) {
    return Arc<std::decay_t<T>>::make(std::forward<T>(value));
}

template<typename T>
inline Arc<Mutex<std::decay_t<T>>> arc_mutex(T&& value) {
    return Arc<Mutex<std::decay_t<T>>>::make(std::forward<T>(value));
}

template<typename T>
inline Arc<RwLock<std::decay_t<T>>> arc_rwlock(T&& value) {
    return Arc<RwLock<std::decay_t<T>>>::make(std::forward<T>(value));
}

template<typename T>
inline Atomic<T> atomic(T value) {
    return Atomic<T>(value);
}

// Integral conversion to U: wraps modulo 2^N for narrower targets,
// sign- or zero-extends for wider ones
template<typename U, typename T, detail::enable_integral_conversion<T, U> = 0>
inline Atomic<U> atomic_as(T value) {
    return Atomic<U>(static_cast<U>(value));
}

template<typename T>
inline AtomicU8 atomic_u8(T value) { return atomic_as<std::uint8_t>(value); }

template<typename T>
inline AtomicU16 atomic_u16(T value) { return atomic_as<std::uint16_t>(value); }

template<typename T>
inline AtomicU32 atomic_u32(T value) { return atomic_as<std::uint32_t>(value); }

template<typename T>
inline AtomicU64 atomic_u64(T value) { return atomic_as<std::uint64_t>(value); }

template<typename T>
inline AtomicUsize atomic_usize(T value) { return atomic_as<std::size_t>(value); }

template<typename T>
inline AtomicI8 atomic_i8(T value) { return atomic_as<std::int8_t>(value); }

template<typename T>
inline AtomicI16 atomic_i16(T value) { return atomic_as<std::int16_t>(value); }

template<typename T>
inline AtomicI32 atomic_i32(T value) { return atomic_as<std::int32_t>(value); }

template<typename T>
inline AtomicI64 atomic_i64(T value) { return atomic_as<std::int64_t>(value); }

template<typename T>
inline AtomicIsize atomic_isize(T value) { return atomic_as<std::ptrdiff_t>(value); }

#endif // AUTOWRAP_FEATURE_SYNC

// Wrap<T> - method-call spelling of the functions above
//
//   autowrap::wrap(42).rc()  ==  autowrap::rc(42)
//
// All conversions are rvalue-qualified: the adapter is used up by the call.
template<typename T>
class Wrap {
private:
    T value_;

public:
    explicit Wrap(T value) : value_(std::move(value)) {}

    Cell<T> cell() && {
        return autowrap::cell(value_);
    }

#if AUTOWRAP_FEATURE_STD
    RefCell<T> refcell() && {
        return autowrap::refcell(std::move(value_));
    }

    Rc<T> rc() && {
        return autowrap::rc(std::move(value_));
    }

    Rc<RefCell<T>> rc_refcell() && {
        return autowrap::rc_refcell(std::move(value_));
    }

    OnceCell<T> once_cell() && {
        return autowrap::once_cell(std::move(value_));
    }
#endif

#if AUTOWRAP_FEATURE_SYNC
    Arc<T> arc() && {
        return autowrap::arc(std::move(value_));
    }

    Arc<Mutex<T>> arc_mutex() && {
        return autowrap::arc_mutex(std::move(value_));
    }

    Arc<RwLock<T>> arc_rwlock() && {
        return autowrap::arc_rwlock(std::move(value_));
    }

    Atomic<T> atomic() && {
        return autowrap::atomic(value_);
    }

    template<typename U>
    Atomic<U> atomic_as() && {
        return autowrap::atomic_as<U>(value_);
    }
#endif
};

template<typename T>
inline Wrap<std::decay_t<T>> wrap(T&& value) {
    return Wrap<std::decay_t<T>>(std::forward<T>(value));
}

} // namespace autowrap

#endif // AUTOWRAP_WRAP_HPP
