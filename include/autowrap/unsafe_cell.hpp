#ifndef AUTOWRAP_UNSAFE_CELL_HPP
#define AUTOWRAP_UNSAFE_CELL_HPP

#include <utility>

// UnsafeCell<T> - the raw building block for interior mutability
//
// Hands out a mutable pointer through a const reference and checks
// nothing. Cell, Mutex and RwLock keep their mutable state in one.
// The caller must rule out data races and aliased mutable access.

namespace autowrap {

template<typename T>
class UnsafeCell {
private:
    T value;

public:
    UnsafeCell() : value() {}

    template<typename... Args>
    explicit UnsafeCell(Args&&... args) : value(std::forward<Args>(args)...) {}

    // Mutable pointer through shared access
    T* get() const {
        return const_cast<T*>(&value);
    }

    // Exclusive access needs no cast
    T& get_mut() {
        return value;
    }

    const T& get_mut() const {
        return value;
    }

    UnsafeCell(const UnsafeCell&) = delete;
    UnsafeCell& operator=(const UnsafeCell&) = delete;
    UnsafeCell(UnsafeCell&&) = delete;
    UnsafeCell& operator=(UnsafeCell&&) = delete;
};

} // namespace autowrap

#endif // AUTOWRAP_UNSAFE_CELL_HPP
