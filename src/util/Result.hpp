/**
 * @file Result.hpp
 * @brief Value-or-error return type.
 *
 * Result<T> carries either a value or an Error with a human readable
 * message. Used at module boundaries (file I/O, parsing, configuration)
 * in place of exceptions.
 */

#pragma once
#include <string>
#include <utility>
#include <variant>

namespace ks {

struct Error {
    std::string message;
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(std::string message) {
        return Result(std::in_place_index<1>, Error{std::move(message)});
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<0>(data_);
    }
    const T& value() const& {
        return std::get<0>(data_);
    }
    T&& value() && {
        return std::get<0>(std::move(data_));
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<1>(data_);
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        Result r;
        r.error_ = Error{std::move(message)};
        r.ok_ = false;
        return r;
    }

    bool isOk() const {
        return ok_;
    }
    bool isErr() const {
        return !ok_;
    }
    explicit operator bool() const {
        return ok_;
    }

    const Error& error() const {
        return error_;
    }

private:
    Result() = default;

    bool ok_{true};
    Error error_;
};

} // namespace ks
