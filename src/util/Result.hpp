/**
 * @file Result.hpp
 * @brief Value-or-error return type.
 *
 * Every fallible operation in the library returns a Result instead of
 * throwing. An Error carries a human readable message and a kind that callers
 * can branch on.
 */

#pragma once
#include <string>
#include <utility>
#include <variant>

namespace cl {

enum class ErrorKind {
    Generic,
    NotFound,
    NoDefaultProvided,
    Decode,
    Encode,
    Io,
};

struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Generic};
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result err(std::string message,
                      ErrorKind kind = ErrorKind::Generic) {
        return Result(std::in_place_index<1>,
                      Error{std::move(message), kind});
    }
    static Result err(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isOk() const {
        return data_.index() == 0;
    }
    bool isErr() const {
        return data_.index() == 1;
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
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message,
                      ErrorKind kind = ErrorKind::Generic) {
        return Result(Error{std::move(message), kind});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return !failed_;
    }
    bool isErr() const {
        return failed_;
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)), failed_(true) {}

    Error error_;
    bool failed_{false};
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic:
        return "generic";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::NoDefaultProvided:
        return "no default provided";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::Encode:
        return "encode";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

} // namespace cl
