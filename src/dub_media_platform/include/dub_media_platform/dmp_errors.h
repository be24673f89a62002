#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace dmp {

// DMP-owned error codes (no FFmpeg codes escape)
enum class ErrorCode {
    Ok,
    InvalidArg,
    FileNotFound,
    Unsupported,
    DecodeFailed,
    EncodeFailed,
    ResourceExhausted,
    CollaboratorFailure,
    MissingVoiceAssignment,
    Internal
};

// Convert error code to string (CLI output, logs)
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                     return "Ok";
        case ErrorCode::InvalidArg:             return "InvalidArg";
        case ErrorCode::FileNotFound:           return "FileNotFound";
        case ErrorCode::Unsupported:            return "Unsupported";
        case ErrorCode::DecodeFailed:           return "DecodeFailed";
        case ErrorCode::EncodeFailed:           return "EncodeFailed";
        case ErrorCode::ResourceExhausted:      return "ResourceExhausted";
        case ErrorCode::CollaboratorFailure:    return "CollaboratorFailure";
        case ErrorCode::MissingVoiceAssignment: return "MissingVoiceAssignment";
        case ErrorCode::Internal:               return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error file_not_found(const std::string& path) {
        return {ErrorCode::FileNotFound, "File not found: " + path};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error decode_failed(const std::string& detail) {
        return {ErrorCode::DecodeFailed, detail};
    }
    static Error encode_failed(const std::string& detail) {
        return {ErrorCode::EncodeFailed, detail};
    }
    static Error resource_exhausted(const std::string& detail) {
        return {ErrorCode::ResourceExhausted, detail};
    }
    // Collaborator messages are surfaced verbatim
    static Error collaborator_failure(const std::string& message) {
        return {ErrorCode::CollaboratorFailure, message};
    }
    static Error missing_voice(const std::string& speaker) {
        return {ErrorCode::MissingVoiceAssignment,
                "No voice selected for " + speaker + ". Please select a voice."};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    // Access value (throws std::bad_variant_access if error)
    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    // Access error (throws std::bad_variant_access if ok)
    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace dmp
