#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace dsync {

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

struct OkVoid {};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

/**
 * @brief Value-or-error return type used across the sync core
 *
 * Success and failure are constructed through Ok()/Err(); both wrappers
 * convert to any Result whose T (resp. E) is constructible from the
 * wrapped value, so `return Ok(x);` works regardless of the error type.
 */
template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    template<typename U>
    Result(OkValue<U> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template<typename U>
    Result(ErrValue<U> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(OkVoid) : error_(std::nullopt) {}

    template<typename U>
    Result(ErrValue<U> err) : error_(E(std::move(err.error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<T> Ok(T value) { return OkValue<T>(std::move(value)); }

inline OkVoid Ok() { return OkVoid{}; }

template<typename E>
ErrValue<E> Err(E error) { return ErrValue<E>(std::move(error)); }

inline ErrValue<std::string> Err(const char* message) { return ErrValue<std::string>(std::string(message)); }

} // namespace dsync
