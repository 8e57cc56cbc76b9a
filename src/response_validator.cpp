#include "quorumsig/response_validator.hpp"
#include <spdlog/spdlog.h>

namespace quorumsig
{
    ResponseValidator::ResponseValidator(std::uint32_t key_version, SignatureParser parse_signature)
        : key_version_(key_version), parse_signature_(parse_signature)
    {
    }

    Result<PartialSignatureShare> ResponseValidator::accept(const SignerReply &reply,
                                                            std::vector<ResponseRecord> &log) const
    {
        const auto &url = reply.endpoint.url;

        ResponseRecord record{url, reply.status, reply.body, nlohmann::json::parse(reply.body, nullptr, false)};
        if (record.body.is_discarded())
            record.body = nullptr;
        log.push_back(record);

        if (!is_success_status(reply.status))
        {
            return std::unexpected(QuorumSigError::signer(
                std::format("Signer {} responded with status {}", url, reply.status)));
        }

        auto declared = reply.key_version ? parse_key_version(*reply.key_version) : std::nullopt;
        spdlog::debug("Signer {} responded with key version {}", url, reply.key_version.value_or("<none>"));
        if (!declared || *declared != key_version_)
        {
            return std::unexpected(QuorumSigError::protocol_mismatch(
                std::format("Incorrect key version received from signer {}", url)));
        }

        if (!record.body.is_object())
        {
            return std::unexpected(QuorumSigError::malformed(
                std::format("Unparseable response body from signer {}", url)));
        }

        auto signature = parse_signature_(record.body);
        if (!signature)
        {
            return std::unexpected(QuorumSigError::malformed(
                std::format("Signature is missing from signer {}", url)));
        }

        return PartialSignatureShare{url, reply.endpoint.index, std::move(*signature)};
    }

} // namespace quorumsig
