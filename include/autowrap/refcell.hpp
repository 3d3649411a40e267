#ifndef AUTOWRAP_REFCELL_HPP
#define AUTOWRAP_REFCELL_HPP

#include <cassert>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "option.hpp"

// RefCell<T> - interior mutability with run-time borrow checking
//
// Guarantees:
// - Single-threaded only (not thread-safe)
// - Many shared borrows OR one exclusive borrow at a time
// - Borrows are held by RAII guards (Ref, RefMut)
// - A conflicting borrow() / borrow_mut() throws; try_borrow() and
//   try_borrow_mut() return None instead

namespace autowrap {

template<typename T> class Ref;
template<typename T> class RefMut;

// Shared borrow requested while exclusively borrowed
class BorrowError : public std::runtime_error {
public:
    BorrowError() : std::runtime_error("RefCell<T>: already mutably borrowed") {}
};

// Exclusive borrow requested while any borrow is live
class BorrowMutError : public std::runtime_error {
public:
    explicit BorrowMutError(const char* what) : std::runtime_error(what) {}
};

template<typename T>
class RefCell {
private:
    mutable T value;
    mutable int borrow_state;  // 0 = unborrowed, >0 = # readers, -1 = writing

    friend class Ref<T>;
    friend class RefMut<T>;

    void remove_reader() const {
        assert(borrow_state > 0);
        borrow_state--;
    }

    void remove_writer() const {
        assert(borrow_state == -1);
        borrow_state = 0;
    }

    void require_unborrowed(const char* what) const {
        if (borrow_state != 0) {
            throw BorrowMutError(what);
        }
    }

public:
    RefCell() : value(), borrow_state(0) {}
    explicit RefCell(T val) : value(std::move(val)), borrow_state(0) {}

    // In-place construction of the value
    template<typename... Args>
    explicit RefCell(std::in_place_t, Args&&... args)
        : value(std::forward<Args>(args)...), borrow_state(0) {}

    ~RefCell() {
        assert(borrow_state == 0 && "RefCell<T> dropped while borrowed");
    }

    Ref<T> borrow() const {
        if (borrow_state < 0) {
            throw BorrowError();
        }
        borrow_state++;
        return Ref<T>(*this);
    }

    RefMut<T> borrow_mut() const {
        if (borrow_state > 0) {
            throw BorrowMutError("RefCell<T>: already immutably borrowed");
        }
        if (borrow_state < 0) {
            throw BorrowMutError("RefCell<T>: already mutably borrowed");
        }
        borrow_state = -1;
        return RefMut<T>(*this);
    }

    Option<Ref<T>> try_borrow() const {
        if (borrow_state < 0) {
            return None;
        }
        borrow_state++;
        return Some(Ref<T>(*this));
    }

    Option<RefMut<T>> try_borrow_mut() const {
        if (borrow_state != 0) {
            return None;
        }
        borrow_state = -1;
        return Some(RefMut<T>(*this));
    }

    bool is_borrowed() const {
        return borrow_state != 0;
    }

    bool is_mutably_borrowed() const {
        return borrow_state < 0;
    }

    // Exclusive access to the cell bypasses run-time tracking
    T& get_mut() {
        return value;
    }

    T replace(T new_value) const {
        require_unborrowed("RefCell<T>: cannot replace while borrowed");
        T old = std::move(value);
        value = std::move(new_value);
        return old;
    }

    // The cell stays mutably borrowed while f runs
    template<typename F>
    T replace_with(F f) const {
        require_unborrowed("RefCell<T>: cannot replace while borrowed");
        RefMut<T> guard = borrow_mut();
        T next = f(*guard);
        T old = std::move(*guard);
        *guard = std::move(next);
        return old;
    }

    void swap(const RefCell& other) const {
        if (this == &other) {
            return;
        }
        require_unborrowed("RefCell<T>: cannot swap while borrowed");
        other.require_unborrowed("RefCell<T>: cannot swap while borrowed");
        using std::swap;
        swap(value, other.value);
    }

    template<typename U = T>
    std::enable_if_t<std::is_default_constructible_v<U>, T> take() const {
        return replace(T{});
    }

    // Copy of the value (takes a shared borrow for the duration)
    template<typename U = T>
    std::enable_if_t<std::is_copy_constructible_v<U>, T> get() const {
        return *borrow();
    }

    RefCell(const RefCell&) = delete;
    RefCell& operator=(const RefCell&) = delete;
    RefCell(RefCell&&) = delete;
    RefCell& operator=(RefCell&&) = delete;
};

// Ref<T> - shared borrow guard
template<typename T>
class Ref {
private:
    const RefCell<T>* cell;

    friend class RefCell<T>;
    explicit Ref(const RefCell<T>& c) : cell(&c) {}

public:
    ~Ref() {
        if (cell) {
            cell->remove_reader();
        }
    }

    Ref(Ref&& other) noexcept : cell(other.cell) {
        other.cell = nullptr;
    }

    Ref(const Ref&) = delete;
    Ref& operator=(const Ref&) = delete;
    Ref& operator=(Ref&&) = delete;

    const T& operator*() const {
        return cell->value;
    }

    const T* operator->() const {
        return &cell->value;
    }
};

// RefMut<T> - exclusive borrow guard
template<typename T>
class RefMut {
private:
    const RefCell<T>* cell;

    friend class RefCell<T>;
    explicit RefMut(const RefCell<T>& c) : cell(&c) {}

public:
    ~RefMut() {
        if (cell) {
            cell->remove_writer();
        }
    }

    RefMut(RefMut&& other) noexcept : cell(other.cell) {
        other.cell = nullptr;
    }

    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;
    RefMut& operator=(RefMut&&) = delete;

    T& operator*() const {
        return cell->value;
    }

    T* operator->() const {
        return &cell->value;
    }
};

} // namespace autowrap

#endif // AUTOWRAP_REFCELL_HPP
