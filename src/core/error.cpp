#include <tablex/core/error.hpp>

#include <fmt/core.h>

namespace tablex {

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", kind_name(kind), message);
}

auto category(ErrorKind kind) noexcept -> ErrorCategory {
    switch (kind) {
        case ErrorKind::ParseError:
            return ErrorCategory::Parse;
        case ErrorKind::DuplicateField:
        case ErrorKind::UnknownColumn:
        case ErrorKind::NonBooleanPredicate:
        case ErrorKind::NonReducingApply:
        case ErrorKind::JoinKeyMismatch:
        case ErrorKind::MismatchedSourceTable:
        case ErrorKind::InvalidArgument:
        case ErrorKind::TypeMismatch:
            return ErrorCategory::Construction;
        case ErrorKind::UndefinedShape:
            return ErrorCategory::SchemaInference;
        case ErrorKind::UnknownField:
        case ErrorKind::NoCommonAncestor:
        case ErrorKind::InternalConsistency:
            return ErrorCategory::Optimizer;
    }
    return ErrorCategory::Construction;
}

auto kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::ParseError:
            return "parse error";
        case ErrorKind::DuplicateField:
            return "duplicate field";
        case ErrorKind::UnknownColumn:
            return "unknown column";
        case ErrorKind::NonBooleanPredicate:
            return "non-boolean predicate";
        case ErrorKind::NonReducingApply:
            return "non-reducing apply";
        case ErrorKind::JoinKeyMismatch:
            return "join key mismatch";
        case ErrorKind::MismatchedSourceTable:
            return "mismatched source table";
        case ErrorKind::InvalidArgument:
            return "invalid argument";
        case ErrorKind::TypeMismatch:
            return "type mismatch";
        case ErrorKind::UndefinedShape:
            return "undefined shape";
        case ErrorKind::UnknownField:
            return "unknown field";
        case ErrorKind::NoCommonAncestor:
            return "no common ancestor";
        case ErrorKind::InternalConsistency:
            return "internal consistency";
    }
    return "error";
}

}  // namespace tablex
