#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

enum class ErrorCode : uint8_t
{
    AlgorithmNegotiationFailed,
    ProtocolOrderViolation,
    HandshakeNotFound,
    TranscriptIntegrityFailure,
    DecapsulationFailed,
    SessionNotFound,
    SessionExpired,
    SessionInvalidated,
    DuplicateSession,
    UnsupportedAlgorithm,
    InvalidPassphrase,
    CorruptBackup,
    KeyGenerationFailed,
    NoActiveKey,
    StorageBackendUnavailable,
    CryptoFailure,
    InvalidArgument,
};

struct Error
{
    ErrorCode code;
    std::string detail;
};

template<class T>
using Result = std::expected<T, Error>;

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::AlgorithmNegotiationFailed: return "AlgorithmNegotiationFailed";
        case ErrorCode::ProtocolOrderViolation:     return "ProtocolOrderViolation";
        case ErrorCode::HandshakeNotFound:          return "HandshakeNotFound";
        case ErrorCode::TranscriptIntegrityFailure: return "TranscriptIntegrityFailure";
        case ErrorCode::DecapsulationFailed:        return "DecapsulationFailed";
        case ErrorCode::SessionNotFound:            return "SessionNotFound";
        case ErrorCode::SessionExpired:             return "SessionExpired";
        case ErrorCode::SessionInvalidated:         return "SessionInvalidated";
        case ErrorCode::DuplicateSession:           return "DuplicateSession";
        case ErrorCode::UnsupportedAlgorithm:       return "UnsupportedAlgorithm";
        case ErrorCode::InvalidPassphrase:          return "InvalidPassphrase";
        case ErrorCode::CorruptBackup:              return "CorruptBackup";
        case ErrorCode::KeyGenerationFailed:        return "KeyGenerationFailed";
        case ErrorCode::NoActiveKey:                return "NoActiveKey";
        case ErrorCode::StorageBackendUnavailable:  return "StorageBackendUnavailable";
        case ErrorCode::CryptoFailure:              return "CryptoFailure";
        case ErrorCode::InvalidArgument:            return "InvalidArgument";
    }
    return "Unknown";
}

// Shorthand for `return fail(ErrorCode::X, "...")` inside Result-returning functions.
[[nodiscard]] inline std::unexpected<Error> fail(ErrorCode code, std::string detail = {})
{
    return std::unexpected(Error{code, std::move(detail)});
}

template<>
struct std::formatter<ErrorCode>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(ErrorCode code, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "{}", to_string(code));
    }
};

template<>
struct std::formatter<Error>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const Error& err, std::format_context& fc) const
    {
        if (err.detail.empty())
        {
            return std::format_to(fc.out(), "{}", err.code);
        }
        return std::format_to(fc.out(), "{}: {}", err.code, err.detail);
    }
};
