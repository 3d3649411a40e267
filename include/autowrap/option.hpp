#ifndef AUTOWRAP_OPTION_HPP
#define AUTOWRAP_OPTION_HPP

#include <new>
#include <stdexcept>
#include <utility>

// Option<T> - an optional value
//
// Used by the primitives for outcomes that are expected to be absent
// sometimes: try_borrow(), try_read(), Weak::upgrade(), OnceCell::get().
// unwrap()/expect() on None throw std::runtime_error.

namespace autowrap {

struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;
    };

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    Option() : has_value(false), dummy(0) {}

    Option(None_t) : has_value(false), dummy(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    Option(Option&& other) noexcept : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(other.value);
                has_value = true;
            }
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(std::move(other.value));
                has_value = true;
                other.reset();
            }
        }
        return *this;
    }

    ~Option() {
        reset();
    }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // Move the value out (throws if None)
    T unwrap() {
        if (!has_value) {
            throw std::runtime_error("called unwrap on None");
        }
        T result = std::move(value);
        reset();
        return result;
    }

    T expect(const char* msg) {
        if (!has_value) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    T unwrap_or(T default_value) {
        if (has_value) {
            return unwrap();
        }
        return default_value;
    }

    // Take the value out, leaving None
    Option<T> take() {
        Option<T> result = std::move(*this);
        reset();
        return result;
    }

    // Borrow the contained value without consuming it
    const T& peek() const {
        if (!has_value) {
            throw std::runtime_error("called peek on None");
        }
        return value;
    }

    T& peek() {
        if (!has_value) {
            throw std::runtime_error("called peek on None");
        }
        return value;
    }
};

// Option over a const reference, stored as a pointer
template<typename T>
class Option<const T&> {
private:
    const T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(const T& ref) : ptr(&ref) {}

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }

    explicit operator bool() const { return ptr != nullptr; }

    const T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("called unwrap on None");
        }
        return *ptr;
    }

    const T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    const T& unwrap_or(const T& default_ref) const {
        return ptr ? *ptr : default_ref;
    }
};

// Option over a mutable reference, stored as a pointer
template<typename T>
class Option<T&> {
private:
    T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(T& ref) : ptr(&ref) {}

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }

    explicit operator bool() const { return ptr != nullptr; }

    T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("called unwrap on None");
        }
        return *ptr;
    }

    T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }
};

template<typename T>
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() || rhs.is_none()) {
        return lhs.is_none() && rhs.is_none();
    }
    return lhs.peek() == rhs.peek();
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace autowrap

#endif // AUTOWRAP_OPTION_HPP
