#pragma once

#include "signer_client.hpp"
#include "threshold_crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quorumsig
{
    /** Every signer response, valid or not, kept for discrepancy analysis and error tallying */
    struct ResponseRecord
    {
        std::string url;
        unsigned status{0};
        std::string raw_body;
        nlohmann::json body; // null when the body is not JSON
    };

    inline bool is_success_status(unsigned status)
    {
        return status >= 200 && status < 300;
    }

    /**
     * Acceptance gate for a single signer response: status, key version
     * agreement, then signature extraction through the protocol's parser.
     */
    class ResponseValidator
    {
    public:
        using SignatureParser = std::optional<std::string> (*)(const nlohmann::json &body);

        ResponseValidator(std::uint32_t key_version, SignatureParser parse_signature);

        /**
         * Record the reply in the log, then validate it.
         * @return the share on success; ProtocolMismatch, SignerError or
         *         MalformedResponse otherwise
         */
        Result<PartialSignatureShare> accept(const SignerReply &reply,
                                             std::vector<ResponseRecord> &log) const;

    private:
        std::uint32_t key_version_;
        SignatureParser parse_signature_;
    };
}
