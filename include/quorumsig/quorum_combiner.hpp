#pragma once

#include "sign_protocol.hpp"
#include "signer_fanout.hpp"
#include "threshold_crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quorumsig
{
    /** A client's blind-signature request as received by the combiner */
    struct SigningRequest
    {
        std::string raw_body;                     // forwarded verbatim to signers
        nlohmann::json body;                      // parsed raw_body
        std::optional<std::string> key_version;   // inbound keyVersion header
        std::optional<std::string> authorization; // forwarded to signers

        /** Parse raw_body; an unparseable body yields InvalidInput */
        static Result<SigningRequest> parse(std::string raw_body,
                                            std::optional<std::string> key_version = std::nullopt,
                                            std::optional<std::string> authorization = std::nullopt);

        std::string session_id() const;
    };

    enum class CombinerState
    {
        Rejected, // refused before fan-out
        Collecting,
        Combining,
        Succeeded,
        FallbackFailed
    };

    std::string_view state_name(CombinerState state);

    /** Terminal result of one request */
    struct CombineOutcome
    {
        CombinerState state{CombinerState::Rejected};
        unsigned status{500};
        std::optional<std::string> combined_signature;
        std::string error;

        bool ok() const { return state == CombinerState::Succeeded; }

        /** Body sent to the client */
        nlohmann::json to_json(std::string_view version) const;

        static CombineOutcome success(std::string combined_signature);
        static CombineOutcome failure(CombinerState state, unsigned status, std::string error);
    };

    struct CombinerSettings
    {
        std::uint32_t key_version{0};
        std::string version{std::string(service_version())};
    };

    /**
     * Quorum-based signature combiner, generic over the signing protocol.
     *
     * Each request fans out to every signer. Responses are validated and fed to
     * the threshold crypto module under a per-request lock; the response that
     * brings the accepted count to the threshold moves the request to
     * combining, cancels the calls still in flight and performs the single
     * combination attempt. When quorum is never reached, or combination fails,
     * the client error is derived from the majority signer status.
     */
    template <typename Protocol>
    class QuorumCombiner
    {
    public:
        using Completion = std::function<void(CombineOutcome)>;

        QuorumCombiner(CombinerSettings settings,
                       std::shared_ptr<const SignerFanout> fanout,
                       std::shared_ptr<const ThresholdCryptoFactory> crypto);

        /** Start serving a request. done runs exactly once, possibly before handle() returns. */
        void handle(SigningRequest request, Completion done) const;

        /** Blocking form of handle() */
        CombineOutcome handle_sync(SigningRequest request) const;

        const CombinerSettings &settings() const { return settings_; }

    private:
        class Session;

        CombinerSettings settings_;
        std::shared_ptr<const SignerFanout> fanout_;
        std::shared_ptr<const ThresholdCryptoFactory> crypto_;
    };

    extern template class QuorumCombiner<PnpSignProtocol>;
    extern template class QuorumCombiner<DomainSignProtocol>;

    using PnpCombiner = QuorumCombiner<PnpSignProtocol>;
    using DomainCombiner = QuorumCombiner<DomainSignProtocol>;

} // namespace quorumsig
