#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tablex {

/// Every failure the library reports, one enumerator per distinguishable cause.
enum class ErrorKind : std::uint8_t {
    // Schema strings
    ParseError,

    // Construction-time invariant violations
    DuplicateField,
    UnknownColumn,
    NonBooleanPredicate,
    NonReducingApply,
    JoinKeyMismatch,
    MismatchedSourceTable,
    InvalidArgument,
    TypeMismatch,

    // Schema queried on a node that was never given one
    UndefinedShape,

    // Optimizer
    UnknownField,
    NoCommonAncestor,
    InternalConsistency,
};

enum class ErrorCategory : std::uint8_t {
    Parse,
    Construction,
    SchemaInference,
    Optimizer,
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto category(ErrorKind kind) noexcept -> ErrorCategory;
[[nodiscard]] auto kind_name(ErrorKind kind) noexcept -> std::string_view;

/// Shorthand for `std::unexpected(Error{...})` at failure sites.
[[nodiscard]] inline auto fail(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

/// Thrown by the `tablex::ops` convenience layer, which has no expected-based
/// return channel.
class Exception : public std::runtime_error {
   public:
    explicit Exception(Error error)
        : std::runtime_error(error.format()), error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }
    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return error_.kind; }

   private:
    Error error_;
};

}  // namespace tablex
