#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quorumsig
{

    /**
     * Error categories for combiner operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ProtocolMismatch,
        SignerError,
        MalformedResponse,
        InvalidInput,
        CombinationUnavailable
    };

    std::string_view error_code_name(ErrorCode code);

    /**
     * Combiner error with code and message
     */
    class QuorumSigError : public std::runtime_error
    {
    public:
        ErrorCode code;

        QuorumSigError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static QuorumSigError config(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::ConfigError, msg);
        }

        static QuorumSigError crypto(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::CryptoError, msg);
        }

        static QuorumSigError protocol_mismatch(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::ProtocolMismatch, msg);
        }

        static QuorumSigError signer(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::SignerError, msg);
        }

        static QuorumSigError malformed(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::MalformedResponse, msg);
        }

        static QuorumSigError invalid_input(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::InvalidInput, msg);
        }

        static QuorumSigError combination_unavailable(const std::string &msg)
        {
            return QuorumSigError(ErrorCode::CombinationUnavailable, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, QuorumSigError>;

    /** Header carrying the key epoch version, both inbound and to/from signers. */
    inline constexpr std::string_view KEY_VERSION_HEADER = "keyVersion";

    /**
     * Parse a key version as declared in a header. Anything that is not a plain
     * unsigned decimal number yields nullopt.
     */
    std::optional<std::uint32_t> parse_key_version(std::string_view text);

    /** Service version reported to clients unless overridden by configuration. */
    std::string_view service_version();

} // namespace quorumsig
