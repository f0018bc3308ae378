// result.hpp
#pragma once
#include <string>
#include <utility>

// error taxonomy shared by the engine and both collaborators
enum class ErrorKind {
    None,
    InvalidConfiguration,
    NotFound,
    AccessDenied,
    SourceReadFailure,
    SinkWriteFailure,
    ConnectionFailure,
    ProtocolError,
    Cancelled
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AccessDenied: return "AccessDenied";
        case ErrorKind::SourceReadFailure: return "SourceReadFailure";
        case ErrorKind::SinkWriteFailure: return "SinkWriteFailure";
        case ErrorKind::ConnectionFailure: return "ConnectionFailure";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

template<typename T>
struct Result {
    bool success;
    ErrorKind kind;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, ErrorKind::None, "", std::move(data)};
    }

    static Result<T> Error(ErrorKind kind, const std::string& msg) {
        return {false, kind, msg, T{}};
    }

    // forwards the failure of another result, whatever its payload type
    template<typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, other.kind, other.message, T{}};
    }

    std::string describe() const {
        return std::string(errorKindName(kind)) + ": " + message;
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorKind kind;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorKind::None, ""};
    }

    static Result<void> Error(ErrorKind kind, const std::string& msg) {
        return {false, kind, msg};
    }

    template<typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.kind, other.message};
    }

    std::string describe() const {
        return std::string(errorKindName(kind)) + ": " + message;
    }
};
