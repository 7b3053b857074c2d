#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

struct Error {
    std::string code;
    std::string message;

    std::string ToString() const {
        return "[" + code + "] " + message;
    }
};

template <typename T>
class Result {
public:
    static Result Success(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    static Result Failure(std::string code, std::string message) {
        Result result;
        result.error_ = Error{std::move(code), std::move(message)};
        return result;
    }

    static Result Failure(Error error) {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    bool IsSuccess() const {
        return value_.has_value();
    }

    const T& Value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.ToString());
        }
        return *value_;
    }

    T& Value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.ToString());
        }
        return *value_;
    }

    const Error& GetError() const {
        return error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    Error error_;
};
