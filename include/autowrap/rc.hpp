#ifndef AUTOWRAP_RC_HPP
#define AUTOWRAP_RC_HPP

#include <cassert>
#include <cstddef>
#include <new>
#include <utility>
#include "option.hpp"

// Rc<T> - reference counted pointer (single-threaded)
//
// Guarantees:
// - Non-atomic strong and weak counts in one allocation with the value
// - The value is destroyed exactly once, when the last Rc is dropped
// - The allocation is freed when the last Rc or RcWeak is dropped
// - Shared access only; wrap the value in a RefCell or Cell to mutate
//
// WARNING: Not thread-safe! Use Arc for multi-threaded scenarios

namespace autowrap {

template<typename T> class Rc;
template<typename T> class RcWeak;

namespace detail {

// Strong owners collectively hold one weak count, released together
// with the value.
template<typename T>
struct RcBox {
    size_t strong_count;
    size_t weak_count;
    alignas(T) unsigned char storage[sizeof(T)];

    template<typename... Args>
    explicit RcBox(Args&&... args) : strong_count(1), weak_count(1) {
        new (storage) T(std::forward<Args>(args)...);
    }

    T* value() {
        return std::launder(reinterpret_cast<T*>(storage));
    }

    void destroy_value() {
        value()->~T();
    }
};

} // namespace detail

template<typename T>
class Rc {
private:
    friend class RcWeak<T>;

    detail::RcBox<T>* box_;

    explicit Rc(detail::RcBox<T>* box) : box_(box) {}

    static void release_weak(detail::RcBox<T>* box) {
        if (--box->weak_count == 0) {
            delete box;
        }
    }

    void release() {
        if (!box_) {
            return;
        }
        detail::RcBox<T>* box = box_;
        box_ = nullptr;
        if (--box->strong_count == 0) {
            box->destroy_value();
            release_weak(box);
        }
    }

public:
    // Always owns a value; use Option<Rc<T>> for a nullable handle
    Rc() = delete;

    // Construct the value in place
    template<typename... Args>
    static Rc<T> make(Args&&... args) {
        return Rc<T>(new detail::RcBox<T>(std::forward<Args>(args)...));
    }

    Rc(const Rc& other) : box_(other.box_) {
        if (box_) {
            ++box_->strong_count;
        }
    }

    Rc(Rc&& other) noexcept : box_(other.box_) {
        other.box_ = nullptr;
    }

    Rc& operator=(const Rc& other) {
        if (this != &other) {
            Rc copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Rc& operator=(Rc&& other) noexcept {
        if (this != &other) {
            release();
            box_ = other.box_;
            other.box_ = nullptr;
        }
        return *this;
    }

    ~Rc() {
        release();
    }

    const T& operator*() const {
        assert(box_ != nullptr);
        return *box_->value();
    }

    const T* operator->() const {
        assert(box_ != nullptr);
        return box_->value();
    }

    const T* get() const {
        return box_ ? box_->value() : nullptr;
    }

    // False only for a moved-from handle
    bool is_valid() const {
        return box_ != nullptr;
    }

    explicit operator bool() const {
        return is_valid();
    }

    Rc clone() const {
        return Rc(*this);
    }

    size_t strong_count() const {
        return box_ ? box_->strong_count : 0;
    }

    // Weak handles only, not the one held on behalf of the strong owners
    size_t weak_count() const {
        return box_ ? box_->weak_count - 1 : 0;
    }

    // Mutable access when this is the only handle, strong or weak
    T* get_mut() {
        if (box_ && box_->strong_count == 1 && box_->weak_count == 1) {
            return box_->value();
        }
        return nullptr;
    }

    bool ptr_eq(const Rc& other) const {
        return box_ == other.box_;
    }

    RcWeak<T> downgrade() const;
};

// RcWeak<T> - non-owning handle to an Rc allocation
template<typename T>
class RcWeak {
private:
    friend class Rc<T>;

    detail::RcBox<T>* box_;

    explicit RcWeak(detail::RcBox<T>* box) : box_(box) {
        if (box_) {
            ++box_->weak_count;
        }
    }

    void release() {
        if (box_) {
            Rc<T>::release_weak(box_);
            box_ = nullptr;
        }
    }

public:
    // Dangling weak handle; upgrade() always fails
    RcWeak() : box_(nullptr) {}

    RcWeak(const RcWeak& other) : RcWeak(other.box_) {}

    RcWeak(RcWeak&& other) noexcept : box_(other.box_) {
        other.box_ = nullptr;
    }

    RcWeak& operator=(RcWeak other) noexcept {
        std::swap(box_, other.box_);
        return *this;
    }

    ~RcWeak() {
        release();
    }

    Option<Rc<T>> upgrade() const {
        if (!box_ || box_->strong_count == 0) {
            return None;
        }
        ++box_->strong_count;
        return Some(Rc<T>(box_));
    }

    size_t strong_count() const {
        return box_ ? box_->strong_count : 0;
    }

    bool expired() const {
        return strong_count() == 0;
    }
};

template<typename T>
RcWeak<T> Rc<T>::downgrade() const {
    return RcWeak<T>(box_);
}

template<typename T>
bool operator==(const Rc<T>& lhs, const Rc<T>& rhs) {
    return lhs.get() == rhs.get();
}

template<typename T>
bool operator!=(const Rc<T>& lhs, const Rc<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace autowrap

#endif // AUTOWRAP_RC_HPP
