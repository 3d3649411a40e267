#ifndef AUTOWRAP_RESULT_HPP
#define AUTOWRAP_RESULT_HPP

#include <new>
#include <stdexcept>
#include <utility>

// Result<T, E> - either success (Ok) or failure (Err)
//
// Lock acquisition, OnceCell::set and Atomic::compare_exchange report
// their outcome through Result. unwrap() on Err and unwrap_err() on Ok
// throw std::runtime_error.

namespace autowrap {

template<typename T, typename E>
class Result {
private:
    struct ok_tag {};
    struct err_tag {};

    bool is_ok_value;
    union {
        T ok_value;
        E err_value;
    };

    Result(ok_tag, T value) : is_ok_value(true), ok_value(std::move(value)) {}
    Result(err_tag, E error) : is_ok_value(false), err_value(std::move(error)) {}

    void destroy() {
        if (is_ok_value) {
            ok_value.~T();
        } else {
            err_value.~E();
        }
    }

public:
    static Result Ok(T value) {
        return Result(ok_tag{}, std::move(value));
    }

    static Result Err(E error) {
        return Result(err_tag{}, std::move(error));
    }

    Result(const Result& other) : is_ok_value(other.is_ok_value) {
        if (is_ok_value) {
            new (&ok_value) T(other.ok_value);
        } else {
            new (&err_value) E(other.err_value);
        }
    }

    Result(Result&& other) noexcept : is_ok_value(other.is_ok_value) {
        if (is_ok_value) {
            new (&ok_value) T(std::move(other.ok_value));
        } else {
            new (&err_value) E(std::move(other.err_value));
        }
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            is_ok_value = other.is_ok_value;
            if (is_ok_value) {
                new (&ok_value) T(std::move(other.ok_value));
            } else {
                new (&err_value) E(std::move(other.err_value));
            }
        }
        return *this;
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            Result copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    ~Result() {
        destroy();
    }

    bool is_ok() const { return is_ok_value; }
    bool is_err() const { return !is_ok_value; }

    explicit operator bool() const { return is_ok_value; }

    // Move the Ok value out (throws if Err)
    T unwrap() {
        if (!is_ok_value) {
            throw std::runtime_error("called unwrap on an Err value");
        }
        return std::move(ok_value);
    }

    T expect(const char* msg) {
        if (!is_ok_value) {
            throw std::runtime_error(msg);
        }
        return std::move(ok_value);
    }

    // Move the Err value out (throws if Ok)
    E unwrap_err() {
        if (is_ok_value) {
            throw std::runtime_error("called unwrap_err on an Ok value");
        }
        return std::move(err_value);
    }

    T unwrap_or(T default_value) {
        if (is_ok_value) {
            return std::move(ok_value);
        }
        return default_value;
    }
};

// Result<void, E> - success carries no value
template<typename E>
class Result<void, E> {
private:
    bool is_ok_value;
    union {
        E err_value;
        char dummy;
    };

    Result() : is_ok_value(true), dummy(0) {}
    explicit Result(E error) : is_ok_value(false), err_value(std::move(error)) {}

public:
    static Result Ok() {
        return Result();
    }

    static Result Err(E error) {
        return Result(std::move(error));
    }

    Result(Result&& other) noexcept : is_ok_value(other.is_ok_value), dummy(0) {
        if (!is_ok_value) {
            new (&err_value) E(std::move(other.err_value));
        }
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;
    Result& operator=(Result&&) = delete;

    ~Result() {
        if (!is_ok_value) {
            err_value.~E();
        }
    }

    bool is_ok() const { return is_ok_value; }
    bool is_err() const { return !is_ok_value; }

    explicit operator bool() const { return is_ok_value; }

    void unwrap() const {
        if (!is_ok_value) {
            throw std::runtime_error("called unwrap on an Err value");
        }
    }

    void expect(const char* msg) const {
        if (!is_ok_value) {
            throw std::runtime_error(msg);
        }
    }

    E unwrap_err() {
        if (is_ok_value) {
            throw std::runtime_error("called unwrap_err on an Ok value");
        }
        return std::move(err_value);
    }
};

} // namespace autowrap

#endif // AUTOWRAP_RESULT_HPP
