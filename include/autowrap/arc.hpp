#ifndef AUTOWRAP_ARC_HPP
#define AUTOWRAP_ARC_HPP

#include <atomic>
#include <cassert>
#include <cstddef>
#include <limits>
#include <new>
#include <thread>
#include <utility>
#include "option.hpp"

// Arc<T> - atomically reference counted pointer
//
// Guarantees:
// - Thread-safe reference counting
// - Shared ownership across threads
// - The value is destroyed exactly once, by whichever thread drops the
//   last Arc
// - Immutable access only (use Mutex/RwLock for mutation)

namespace autowrap {

template<typename T> class Arc;
template<typename T> class ArcWeak;

namespace detail {

// weak_count holds this value while Arc::get_mut checks for uniqueness
constexpr size_t kWeakLocked = std::numeric_limits<size_t>::max();

template<typename T>
struct ArcInner {
    std::atomic<size_t> strong_count;
    std::atomic<size_t> weak_count;
    alignas(T) unsigned char storage[sizeof(T)];

    template<typename... Args>
    explicit ArcInner(Args&&... args) : strong_count(1), weak_count(1) {
        new (storage) T(std::forward<Args>(args)...);
    }

    T* value() {
        return std::launder(reinterpret_cast<T*>(storage));
    }
};

} // namespace detail

template<typename T>
class Arc {
private:
    friend class ArcWeak<T>;

    detail::ArcInner<T>* inner_;

    explicit Arc(detail::ArcInner<T>* inner) : inner_(inner) {}

    static void release_weak(detail::ArcInner<T>* inner) {
        if (inner->weak_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete inner;
        }
    }

    void release() {
        if (!inner_) {
            return;
        }
        detail::ArcInner<T>* inner = inner_;
        inner_ = nullptr;
        if (inner->strong_count.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            inner->value()->~T();
            release_weak(inner);
        }
    }

public:
    Arc() = delete;

    // Construct the value in place
    template<typename... Args>
    static Arc<T> make(Args&&... args) {
        return Arc<T>(new detail::ArcInner<T>(std::forward<Args>(args)...));
    }

    Arc(const Arc& other) : inner_(other.inner_) {
        if (inner_) {
            inner_->strong_count.fetch_add(1, std::memory_order_relaxed);
        }
    }

    Arc(Arc&& other) noexcept : inner_(other.inner_) {
        other.inner_ = nullptr;
    }

    Arc& operator=(const Arc& other) {
        if (this != &other) {
            Arc copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Arc& operator=(Arc&& other) noexcept {
        if (this != &other) {
            release();
            inner_ = other.inner_;
            other.inner_ = nullptr;
        }
        return *this;
    }

    ~Arc() {
        release();
    }

    const T& operator*() const {
        assert(inner_ != nullptr);
        return *inner_->value();
    }

    const T* operator->() const {
        assert(inner_ != nullptr);
        return inner_->value();
    }

    const T* get() const {
        return inner_ ? inner_->value() : nullptr;
    }

    bool is_valid() const {
        return inner_ != nullptr;
    }

    explicit operator bool() const {
        return is_valid();
    }

    Arc clone() const {
        return Arc(*this);
    }

    // Snapshot; other threads may change it immediately
    size_t strong_count() const {
        return inner_ ? inner_->strong_count.load(std::memory_order_acquire) : 0;
    }

    size_t weak_count() const {
        if (!inner_) {
            return 0;
        }
        size_t count = inner_->weak_count.load(std::memory_order_acquire);
        return count == detail::kWeakLocked ? 0 : count - 1;
    }

    // Mutable access when no other Arc or ArcWeak exists
    //
    // Locking the weak count first keeps an ArcWeak from upgrading and then
    // disappearing between the two checks.
    T* get_mut() {
        if (!inner_) {
            return nullptr;
        }
        size_t expected = 1;
        if (!inner_->weak_count.compare_exchange_strong(
                expected, detail::kWeakLocked,
                std::memory_order_acquire,
                std::memory_order_relaxed)) {
            return nullptr;
        }
        bool unique = inner_->strong_count.load(std::memory_order_acquire) == 1;
        inner_->weak_count.store(1, std::memory_order_release);
        return unique ? inner_->value() : nullptr;
    }

    bool ptr_eq(const Arc& other) const {
        return inner_ == other.inner_;
    }

    ArcWeak<T> downgrade() const;
};

// ArcWeak<T> - non-owning handle to an Arc allocation
template<typename T>
class ArcWeak {
private:
    friend class Arc<T>;

    detail::ArcInner<T>* inner_;

    explicit ArcWeak(detail::ArcInner<T>* inner) : inner_(inner) {
        if (inner_) {
            inner_->weak_count.fetch_add(1, std::memory_order_relaxed);
        }
    }

public:
    ArcWeak() : inner_(nullptr) {}

    ArcWeak(const ArcWeak& other) : ArcWeak(other.inner_) {}

    ArcWeak(ArcWeak&& other) noexcept : inner_(other.inner_) {
        other.inner_ = nullptr;
    }

    ArcWeak& operator=(ArcWeak other) noexcept {
        std::swap(inner_, other.inner_);
        return *this;
    }

    ~ArcWeak() {
        if (inner_) {
            Arc<T>::release_weak(inner_);
        }
    }

    // Succeeds only while some Arc still holds the value
    Option<Arc<T>> upgrade() const {
        if (!inner_) {
            return None;
        }
        size_t count = inner_->strong_count.load(std::memory_order_relaxed);
        while (count != 0) {
            if (inner_->strong_count.compare_exchange_weak(
                    count, count + 1,
                    std::memory_order_acquire,
                    std::memory_order_relaxed)) {
                return Some(Arc<T>(inner_));
            }
        }
        return None;
    }

    size_t strong_count() const {
        return inner_ ? inner_->strong_count.load(std::memory_order_acquire) : 0;
    }

    bool expired() const {
        return strong_count() == 0;
    }
};

// Waits out a concurrent get_mut() on another clone of this Arc
template<typename T>
ArcWeak<T> Arc<T>::downgrade() const {
    ArcWeak<T> weak;
    if (!inner_) {
        return weak;
    }
    size_t count = inner_->weak_count.load(std::memory_order_relaxed);
    for (;;) {
        if (count == detail::kWeakLocked) {
            std::this_thread::yield();
            count = inner_->weak_count.load(std::memory_order_relaxed);
            continue;
        }
        if (inner_->weak_count.compare_exchange_weak(
                count, count + 1,
                std::memory_order_acquire,
                std::memory_order_relaxed)) {
            weak.inner_ = inner_;
            return weak;
        }
    }
}

template<typename T>
bool operator==(const Arc<T>& lhs, const Arc<T>& rhs) {
    return lhs.get() == rhs.get();
}

template<typename T>
bool operator!=(const Arc<T>& lhs, const Arc<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace autowrap

#endif // AUTOWRAP_ARC_HPP
