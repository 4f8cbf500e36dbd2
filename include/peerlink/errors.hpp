/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_ERRORS_HPP
#define PEERLINK_ERRORS_HPP

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace peerlink {

    struct Ok {};

/**
 * @brief Error taxonomy shared by every module.
 *
 * Only TransportError past its retry budget and EncodeError past the pipeline failure threshold are
 * surfaced to the user; everything else is handled where it happens and shows up in logs.
 */
    enum class ErrorKind {
        TransportError,
        EncodeError,
        PermissionDenied,
        ProtocolError,
        ConfigError,
        InvalidTransition,
        Timeout,
        NotFound
    };

    const char *errorKindName(ErrorKind k);

    struct Error {
        ErrorKind kind;
        std::string message;

        std::string describe() const { return std::string(errorKindName(kind)) + ": " + message; }
    };

    inline Error makeError(ErrorKind kind, std::string message) {
        return Error{kind, std::move(message)};
    }

/**
 * @brief Value-or-error result. Result<Ok> (alias Status) is used for operations without a value.
 */
    template <typename T = Ok>
    class Result {
        std::variant<T, Error> value_;

    public:
        Result(T v) : value_(std::move(v)) {}
        Result(Error e) : value_(std::move(e)) {}

        static Result<T> ok(T v) { return Result(std::move(v)); }
        static Result<T> err(ErrorKind kind, std::string msg) { return Result(Error{kind, std::move(msg)}); }

        bool isOk() const { return std::holds_alternative<T>(value_); }
        bool isErr() const { return std::holds_alternative<Error>(value_); }
        explicit operator bool() const { return isOk(); }

        const T &value() const {
            if (isErr()) throw std::runtime_error("Result::value on error: " + std::get<Error>(value_).message);
            return std::get<T>(value_);
        }

        T &value() {
            if (isErr()) throw std::runtime_error("Result::value on error: " + std::get<Error>(value_).message);
            return std::get<T>(value_);
        }

        T takeValue() { return std::move(value()); }

        const Error &error() const {
            if (isOk()) throw std::logic_error("Result::error called on success value");
            return std::get<Error>(value_);
        }
    };

    using Status = Result<Ok>;

    inline Status success() { return Status(Ok{}); }

} // namespace peerlink

#endif // PEERLINK_ERRORS_HPP
