#ifndef AUTOWRAP_CELL_HPP
#define AUTOWRAP_CELL_HPP

#include <type_traits>
#include <utility>
#include "unsafe_cell.hpp"

// Cell<T> - interior mutability for copyable values
//
// Guarantees:
// - Single-threaded only (not thread-safe)
// - No borrow tracking; values are copied in and out
// - Only for trivially copyable types
// - Same size as T

namespace autowrap {

template<typename T>
class Cell {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Cell<T> requires T to be trivially copyable");
private:
    UnsafeCell<T> value;

public:
    Cell() : value() {}
    explicit Cell(T val) : value(val) {}

    T get() const {
        return *value.get();
    }

    void set(T val) const {
        *value.get() = val;
    }

    // Store a new value and return the previous one
    T replace(T val) const {
        T old = *value.get();
        *value.get() = val;
        return old;
    }

    // Take the value, leaving T{} in its place
    template<typename U = T>
    std::enable_if_t<std::is_default_constructible_v<U>, T> take() const {
        return replace(T{});
    }

    void swap(const Cell& other) const {
        if (this == &other) {
            return;
        }
        T temp = *value.get();
        *value.get() = *other.value.get();
        *other.value.get() = temp;
    }

    template<typename F>
    T update(F f) const {
        T* ptr = value.get();
        *ptr = f(*ptr);
        return *ptr;
    }

    // Exclusive access needs no copy
    T& get_mut() {
        return value.get_mut();
    }

    Cell(const Cell&) = delete;
    Cell& operator=(const Cell&) = delete;
    Cell(Cell&&) = delete;
    Cell& operator=(Cell&&) = delete;
};

} // namespace autowrap

#endif // AUTOWRAP_CELL_HPP
