#pragma once

#include "quorumsig/signer_client.hpp"
#include "quorumsig/threshold_crypto.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quorumsig::testing
{
    /**
     * In-memory SignerClient. Each signer URL has a scripted outcome. In
     * automatic mode scripted calls complete inside send(); in manual mode
     * they wait for deliver(). A Never script only completes when its token
     * fires, which records the URL as cancelled. A Held script ignores the
     * token and waits for deliver(), like a response already on the wire.
     */
    class FakeSignerClient : public SignerClient
    {
    public:
        enum class Mode
        {
            Respond,
            TransportError,
            Never,
            Held
        };

        struct Script
        {
            Mode mode{Mode::Respond};
            unsigned status{200};
            std::optional<std::string> key_version;
            std::string body;
        };

        static Script reply(unsigned status, std::optional<std::string> key_version, std::string body);
        static Script transport_error();
        static Script never();
        static Script held(unsigned status, std::optional<std::string> key_version, std::string body);

        void script(const std::string &url, Script script);

        void set_manual(bool manual) { manual_ = manual; }

        void send(const SignerEndpoint &endpoint,
                  const OutboundRequest &request,
                  std::shared_ptr<CancellationToken> token,
                  Completion done) override;

        /** Complete the pending call to url with its script. False if nothing is pending for url. */
        bool deliver(const std::string &url);

        std::vector<std::string> sent() const;
        std::vector<std::string> cancelled() const;
        std::vector<OutboundRequest> requests() const;
        std::size_t pending() const;

    private:
        struct Pending
        {
            SignerEndpoint endpoint;
            std::shared_ptr<CancellationToken> token;
            Completion done;
            CancellationToken::SubscriptionId subscription{0};
        };

        SignerCallResult outcome_for(const SignerEndpoint &endpoint, const Script &script) const;
        Script script_for(const std::string &url) const;
        void cancel_pending(std::size_t id);

        mutable std::mutex mutex_;
        std::atomic<bool> manual_{false};
        std::map<std::string, Script> scripts_;
        std::map<std::size_t, Pending> pending_;
        std::size_t next_id_{1};
        std::vector<std::string> sent_;
        std::vector<std::string> cancelled_;
        std::vector<OutboundRequest> requests_;
    };

    /**
     * Scripted ThresholdCrypto: a share is valid iff its signature starts with
     * "valid". Counts combine() calls across every instance of its factory.
     * combine() can be made to return an error or to throw.
     */
    class FakeThresholdCryptoFactory : public ThresholdCryptoFactory
    {
    public:
        explicit FakeThresholdCryptoFactory(std::size_t threshold);

        Result<std::unique_ptr<ThresholdCrypto>> create(const std::string &blinded_message) const override;

        void fail_combination(bool fail) { fail_combination_ = fail; }
        void throw_on_combine(bool raise) { throw_on_combine_ = raise; }

        std::size_t combine_calls() const { return combine_calls_->load(); }
        std::size_t created() const { return created_->load(); }

    private:
        std::size_t threshold_;
        bool fail_combination_{false};
        bool throw_on_combine_{false};
        std::shared_ptr<std::atomic<std::size_t>> combine_calls_;
        std::shared_ptr<std::atomic<std::size_t>> created_;
    };

    /** JSON body of a successful signer response carrying signature */
    std::string signer_body(const std::string &signature);
}
