#pragma once

#include "event_log.hpp"
#include "response_validator.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quorumsig
{
    /*
     * Signing protocols plugged into QuorumCombiner. Each supplies:
     *   name, combiner_path, signer_path
     *   validate_request(body)            -> Result<void>
     *   blinded_message(body)             -> std::string (only after validation)
     *   parse_signature(signer_body)      -> std::optional<std::string>
     *   log_response_discrepancies(records, log)
     */

    /** Blinded phone-number query signing */
    struct PnpSignProtocol
    {
        static constexpr std::string_view name = "pnp";
        static constexpr std::string_view combiner_path = "/getBlindedMessageSig";
        static constexpr std::string_view signer_path = "/getBlindedMessagePartialSig";

        static Result<void> validate_request(const nlohmann::json &body);
        static std::string blinded_message(const nlohmann::json &body);
        static std::optional<std::string> parse_signature(const nlohmann::json &body);
        static void log_response_discrepancies(const std::vector<ResponseRecord> &records, const EventLogger &log);
    };

    /** Domain-restricted signing */
    struct DomainSignProtocol
    {
        static constexpr std::string_view name = "domain";
        static constexpr std::string_view combiner_path = "/domain/sign";
        static constexpr std::string_view signer_path = "/domain/sign";

        static Result<void> validate_request(const nlohmann::json &body);
        static std::string blinded_message(const nlohmann::json &body);
        static std::optional<std::string> parse_signature(const nlohmann::json &body);
        static void log_response_discrepancies(const std::vector<ResponseRecord> &records, const EventLogger &log);
    };

    /**
     * Values of a field (JSON pointer) that differ between successful signer
     * responses, keyed by signer URL. Empty when all agree or nobody reported it.
     */
    nlohmann::json field_discrepancies(const std::vector<ResponseRecord> &records, const std::string &pointer);
}
