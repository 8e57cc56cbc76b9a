#include "quorumsig/types.hpp"
#include <charconv>

#ifndef QUORUMSIG_VERSION
#define QUORUMSIG_VERSION "0.0.0"
#endif

namespace quorumsig
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::ProtocolMismatch:
            return "ProtocolMismatch";
        case ErrorCode::SignerError:
            return "SignerError";
        case ErrorCode::MalformedResponse:
            return "MalformedResponse";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::CombinationUnavailable:
            return "CombinationUnavailable";
        }
        return "Unknown";
    }

    std::optional<std::uint32_t> parse_key_version(std::string_view text)
    {
        if (text.empty())
            return std::nullopt;

        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

    std::string_view service_version()
    {
        return QUORUMSIG_VERSION;
    }

} // namespace quorumsig
