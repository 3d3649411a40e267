#ifndef AUTOWRAP_ONCE_CELL_HPP
#define AUTOWRAP_ONCE_CELL_HPP

#include <atomic>
#include <mutex>
#include <new>
#include <utility>
#include "option.hpp"
#include "result.hpp"

namespace autowrap {

// OnceCell - a cell which can be written to only once
//
// Usage:
//   OnceCell<int> cell;
//   cell.set(42);                 // Ok
//   cell.set(100);                // Err(100), value unchanged
//   int v = cell.get().unwrap();  // 42
//
//   OnceCell<int> ready(42);      // constructed already initialized
//
// Concurrent set()/get_or_init() calls are serialized; exactly one
// initializer runs.
template<typename T>
class OnceCell {
private:
    std::once_flag flag_;
    std::atomic<bool> initialized_{false};
    alignas(T) unsigned char storage_[sizeof(T)];

    T* as_ptr() { return std::launder(reinterpret_cast<T*>(storage_)); }
    const T* as_ptr() const { return std::launder(reinterpret_cast<const T*>(storage_)); }

    template<typename... Args>
    void emplace(Args&&... args) {
        new (storage_) T(std::forward<Args>(args)...);
        initialized_.store(true, std::memory_order_release);
    }

public:
    OnceCell() = default;

    explicit OnceCell(T value) {
        std::call_once(flag_, [this, &value]() { emplace(std::move(value)); });
    }

    // Err(value) hands the rejected value back if the cell was already set
    Result<void, T> set(T value) {
        bool stored = false;
        std::call_once(flag_, [this, &value, &stored]() {
            emplace(std::move(value));
            stored = true;
        });
        if (stored) {
            return Result<void, T>::Ok();
        }
        return Result<void, T>::Err(std::move(value));
    }

    Option<const T&> get() const {
        if (initialized_.load(std::memory_order_acquire)) {
            return Option<const T&>(*as_ptr());
        }
        return None;
    }

    Option<T&> get_mut() {
        if (initialized_.load(std::memory_order_acquire)) {
            return Option<T&>(*as_ptr());
        }
        return None;
    }

    // If f throws, the cell stays empty and a later call may retry
    template<typename F>
    const T& get_or_init(F&& f) {
        std::call_once(flag_, [this, &f]() { emplace(f()); });
        return *as_ptr();
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;
    OnceCell(OnceCell&&) = delete;
    OnceCell& operator=(OnceCell&&) = delete;

    ~OnceCell() {
        if (initialized_.load(std::memory_order_acquire)) {
            as_ptr()->~T();
        }
    }
};

} // namespace autowrap

#endif // AUTOWRAP_ONCE_CELL_HPP
