#include "quorumsig/sign_protocol.hpp"
#include "quorumsig/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <set>

namespace quorumsig
{
    namespace
    {
        constexpr std::size_t BLINDED_MESSAGE_BYTES = 32;

        Result<void> require_blinded(const nlohmann::json &body, const char *field)
        {
            auto it = body.find(field);
            if (it == body.end() || !it->is_string())
                return std::unexpected(QuorumSigError::invalid_input(std::format("Missing {}", field)));

            auto decoded = crypto::Base64::decode(it->get<std::string>());
            if (!decoded || decoded->size() != BLINDED_MESSAGE_BYTES)
                return std::unexpected(QuorumSigError::invalid_input(std::format("Malformed {}", field)));
            return {};
        }

        bool is_address(const std::string &s)
        {
            if (s.size() != 42 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
                return false;
            return std::all_of(s.begin() + 2, s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
        }

        std::optional<std::string> signature_field(const nlohmann::json &body)
        {
            auto it = body.find("signature");
            if (it == body.end() || !it->is_string())
                return std::nullopt;
            auto sig = it->get<std::string>();
            if (sig.empty())
                return std::nullopt;
            return sig;
        }

        void warn_discrepancies(const std::vector<ResponseRecord> &records,
                                std::initializer_list<const char *> pointers,
                                const EventLogger &log)
        {
            nlohmann::json found = nlohmann::json::object();
            for (const char *pointer : pointers)
            {
                auto diff = field_discrepancies(records, pointer);
                if (!diff.empty())
                    found[pointer] = std::move(diff);
            }
            if (!found.empty())
                log.warn("signer_response_discrepancies", found);
        }
    } // namespace

    nlohmann::json field_discrepancies(const std::vector<ResponseRecord> &records, const std::string &pointer)
    {
        const nlohmann::json::json_pointer ptr(pointer);
        nlohmann::json by_signer = nlohmann::json::object();
        std::set<std::string> distinct;
        for (const auto &record : records)
        {
            if (!is_success_status(record.status) || !record.body.is_object() || !record.body.contains(ptr))
                continue;
            const auto &value = record.body.at(ptr);
            by_signer[record.url] = value;
            distinct.insert(value.dump());
        }
        if (distinct.size() <= 1)
            return nlohmann::json::object();
        return by_signer;
    }

    // ============================================================================
    // PnpSignProtocol
    // ============================================================================

    Result<void> PnpSignProtocol::validate_request(const nlohmann::json &body)
    {
        if (!body.is_object())
            return std::unexpected(QuorumSigError::invalid_input("Request body must be a JSON object"));

        auto account = body.find("account");
        if (account == body.end() || !account->is_string() || !is_address(account->get<std::string>()))
            return std::unexpected(QuorumSigError::invalid_input("Missing or malformed account"));

        return require_blinded(body, "blindedQueryPhoneNumber");
    }

    std::string PnpSignProtocol::blinded_message(const nlohmann::json &body)
    {
        return body.at("blindedQueryPhoneNumber").get<std::string>();
    }

    std::optional<std::string> PnpSignProtocol::parse_signature(const nlohmann::json &body)
    {
        return signature_field(body);
    }

    void PnpSignProtocol::log_response_discrepancies(const std::vector<ResponseRecord> &records, const EventLogger &log)
    {
        warn_discrepancies(records, {"/performedQueryCount", "/totalQuota", "/blockNumber"}, log);
    }

    // ============================================================================
    // DomainSignProtocol
    // ============================================================================

    Result<void> DomainSignProtocol::validate_request(const nlohmann::json &body)
    {
        if (!body.is_object())
            return std::unexpected(QuorumSigError::invalid_input("Request body must be a JSON object"));

        auto domain = body.find("domain");
        if (domain == body.end() || !domain->is_object())
            return std::unexpected(QuorumSigError::invalid_input("Missing domain"));

        auto domain_name = domain->find("name");
        if (domain_name == domain->end() || !domain_name->is_string())
            return std::unexpected(QuorumSigError::invalid_input("Domain has no name"));

        return require_blinded(body, "blindedMessage");
    }

    std::string DomainSignProtocol::blinded_message(const nlohmann::json &body)
    {
        return body.at("blindedMessage").get<std::string>();
    }

    std::optional<std::string> DomainSignProtocol::parse_signature(const nlohmann::json &body)
    {
        return signature_field(body);
    }

    void DomainSignProtocol::log_response_discrepancies(const std::vector<ResponseRecord> &records, const EventLogger &log)
    {
        warn_discrepancies(records, {"/status/counter", "/status/timer", "/status/disabled"}, log);
    }

} // namespace quorumsig
