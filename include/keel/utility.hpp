#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace keel {

enum class ErrorKind {
    Cycle,
    DuplicateTarget,
    NotFound,
    UnresolvedDependency,
    TypeConstraint,
    IO,
    StepExecution,
    Parse,
    InvalidState,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T> using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

constexpr std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Cycle:
        return "CycleError";
    case ErrorKind::DuplicateTarget:
        return "DuplicateTargetError";
    case ErrorKind::NotFound:
        return "NotFoundError";
    case ErrorKind::UnresolvedDependency:
        return "UnresolvedDependencyError";
    case ErrorKind::TypeConstraint:
        return "TypeConstraintError";
    case ErrorKind::IO:
        return "IOError";
    case ErrorKind::StepExecution:
        return "StepExecutionError";
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::InvalidState:
        return "InvalidStateError";
    }
    return "Error";
}

inline std::string to_string(const Error &err) {
    return std::string(error_kind_name(err.kind)) + ": " + err.message;
}

} // namespace keel
