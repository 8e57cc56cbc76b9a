#pragma once

#include "cancellation.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quorumsig
{
    /** A signer node: base URL and its index within the key's share set (1-based) */
    struct SignerEndpoint
    {
        std::string url;
        std::uint32_t index{0};
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /** Request sent to every signer; path is appended to the signer's base URL */
    struct OutboundRequest
    {
        std::string path;
        std::string body;
        HeaderList headers;
    };

    /** An HTTP response received from a signer */
    struct SignerReply
    {
        SignerEndpoint endpoint;
        unsigned status{0};
        std::optional<std::string> key_version; // value of the keyVersion response header
        std::string body;
    };

    enum class CallStatus
    {
        Responded,
        TransportError,
        Cancelled
    };

    /** Terminal outcome of one outbound call; reply is set only when Responded */
    struct SignerCallResult
    {
        CallStatus status{CallStatus::TransportError};
        std::optional<SignerReply> reply;
        std::string error;

        static SignerCallResult responded(SignerReply reply)
        {
            return SignerCallResult{CallStatus::Responded, std::move(reply), {}};
        }

        static SignerCallResult transport_error(std::string why)
        {
            return SignerCallResult{CallStatus::TransportError, std::nullopt, std::move(why)};
        }

        static SignerCallResult cancelled()
        {
            return SignerCallResult{CallStatus::Cancelled, std::nullopt, "cancelled"};
        }
    };

    /**
     * Transport used to reach signer nodes. Implementations must invoke the
     * completion exactly once per send(), from any thread, and abort the call
     * when the token fires.
     */
    class SignerClient
    {
    public:
        using Completion = std::function<void(SignerCallResult)>;

        virtual ~SignerClient() = default;

        virtual void send(const SignerEndpoint &endpoint,
                          const OutboundRequest &request,
                          std::shared_ptr<CancellationToken> token,
                          Completion done) = 0;
    };
}
