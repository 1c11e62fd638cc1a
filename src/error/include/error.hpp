#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <utility>

namespace txgate
{
    struct GatewayError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            INVALID_CONFIG,
            INVALID_INPUT,
            NOT_READY,

            REMOTE_UNAVAILABLE,
            RPC_ERROR,
            RPC_MALFORMED,
            SUBMISSION_FAILED,

            NONCE_CONFLICT,

            SUBSCRIPTION_LOST,
            SUBSCRIPTION_ERROR,
            NOT_CONNECTED,

            NOT_FOUND,
            STORAGE_ERROR
        }
        kind = Kind::UNKNOWN;

        std::string message = "";

        // set when the failing operation may already have reached the remote node
        bool submission_attempted = false;
    };

    template<class T>
    using Result = std::expected<T, GatewayError>;

    inline std::unexpected<GatewayError> makeError(GatewayError::Kind kind, std::string message, bool submission_attempted = false)
    {
        return std::unexpected(GatewayError{
            .kind = kind,
            .message = std::move(message),
            .submission_attempted = submission_attempted
        });
    }
}

template <>
struct std::formatter<txgate::GatewayError::Kind> : std::formatter<std::string>
{
    auto format(const txgate::GatewayError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case txgate::GatewayError::Kind::INVALID_CONFIG:
                return formatter<string>::format("Invalid config", ctx);
            case txgate::GatewayError::Kind::INVALID_INPUT:
                return formatter<string>::format("Invalid input", ctx);
            case txgate::GatewayError::Kind::NOT_READY:
                return formatter<string>::format("Not ready", ctx);
            case txgate::GatewayError::Kind::REMOTE_UNAVAILABLE:
                return formatter<string>::format("Remote unavailable", ctx);
            case txgate::GatewayError::Kind::RPC_ERROR:
                return formatter<string>::format("RPC error", ctx);
            case txgate::GatewayError::Kind::RPC_MALFORMED:
                return formatter<string>::format("Malformed RPC response", ctx);
            case txgate::GatewayError::Kind::SUBMISSION_FAILED:
                return formatter<string>::format("Submission failed", ctx);
            case txgate::GatewayError::Kind::NONCE_CONFLICT:
                return formatter<string>::format("Nonce conflict", ctx);
            case txgate::GatewayError::Kind::SUBSCRIPTION_LOST:
                return formatter<string>::format("Subscription lost", ctx);
            case txgate::GatewayError::Kind::SUBSCRIPTION_ERROR:
                return formatter<string>::format("Subscription error", ctx);
            case txgate::GatewayError::Kind::NOT_CONNECTED:
                return formatter<string>::format("Not connected", ctx);
            case txgate::GatewayError::Kind::NOT_FOUND:
                return formatter<string>::format("Not found", ctx);
            case txgate::GatewayError::Kind::STORAGE_ERROR:
                return formatter<string>::format("Storage error", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};

template <>
struct std::formatter<txgate::GatewayError> : std::formatter<std::string>
{
    auto format(const txgate::GatewayError & err, format_context & ctx) const
    {
        return formatter<string>::format(std::format("{}: {}", err.kind, err.message), ctx);
    }
};
