#include "quorumsig/quorum_combiner.hpp"
#include "quorumsig/error_aggregator.hpp"
#include "quorumsig/event_log.hpp"
#include "quorumsig/response_validator.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <mutex>
#include <vector>

namespace quorumsig
{

    // ============================================================================
    // SigningRequest / CombineOutcome
    // ============================================================================

    Result<SigningRequest> SigningRequest::parse(std::string raw_body,
                                                 std::optional<std::string> key_version,
                                                 std::optional<std::string> authorization)
    {
        auto body = nlohmann::json::parse(raw_body, nullptr, false);
        if (body.is_discarded())
            return std::unexpected(QuorumSigError::invalid_input("Request body is not valid JSON"));
        return SigningRequest{std::move(raw_body), std::move(body), std::move(key_version), std::move(authorization)};
    }

    std::string SigningRequest::session_id() const
    {
        if (body.is_object())
        {
            auto it = body.find("sessionID");
            if (it != body.end() && it->is_string())
                return it->get<std::string>();
        }
        return {};
    }

    std::string_view state_name(CombinerState state)
    {
        switch (state)
        {
        case CombinerState::Rejected:
            return "REJECTED";
        case CombinerState::Collecting:
            return "COLLECTING";
        case CombinerState::Combining:
            return "COMBINING";
        case CombinerState::Succeeded:
            return "SUCCEEDED";
        case CombinerState::FallbackFailed:
            return "FALLBACK_FAILED";
        }
        return "UNKNOWN";
    }

    nlohmann::json CombineOutcome::to_json(std::string_view version) const
    {
        if (ok())
        {
            return nlohmann::json{{"success", true},
                                  {"combinedSignature", *combined_signature},
                                  {"version", version}};
        }
        return nlohmann::json{{"success", false}, {"error", error}, {"version", version}};
    }

    CombineOutcome CombineOutcome::success(std::string combined_signature)
    {
        return CombineOutcome{CombinerState::Succeeded, 200, std::move(combined_signature), {}};
    }

    CombineOutcome CombineOutcome::failure(CombinerState state, unsigned status, std::string error)
    {
        return CombineOutcome{state, status, std::nullopt, std::move(error)};
    }

    // ============================================================================
    // Session: one request's state machine
    // ============================================================================

    template <typename Protocol>
    class QuorumCombiner<Protocol>::Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(const CombinerSettings &settings,
                std::shared_ptr<const SignerFanout> fanout,
                SigningRequest request,
                std::unique_ptr<ThresholdCrypto> crypto,
                Completion done)
            : fanout_(std::move(fanout)),
              request_(std::move(request)),
              crypto_(std::move(crypto)),
              done_(std::move(done)),
              validator_(settings.key_version, &Protocol::parse_signature),
              token_(std::make_shared<CancellationToken>()),
              log_(std::string(Protocol::name), request_.session_id())
        {
        }

        void start()
        {
            OutboundRequest outbound{std::string(Protocol::signer_path), request_.raw_body, {}};
            if (request_.authorization)
                outbound.headers.emplace_back("Authorization", *request_.authorization);

            log_.info("fanout_started", {{"signers", fanout_->endpoints().size()},
                                         {"threshold", crypto_->threshold()}});

            auto self = this->shared_from_this();
            fanout_->dispatch(
                outbound,
                token_,
                [self](const SignerReply &reply) { self->on_response(reply); },
                [self](const FanoutSummary &summary) { self->on_fanout_complete(summary); });
        }

    private:
        void on_response(const SignerReply &reply)
        {
            bool crossed = false;
            {
                std::lock_guard lock(mutex_);
                if (state_ != CombinerState::Collecting)
                {
                    spdlog::debug("Ignoring late response from {} in state {}", reply.endpoint.url, state_name(state_));
                    return;
                }

                auto share = validator_.accept(reply, records_);
                if (!share)
                {
                    log_.warn("signer_response_rejected", {{"signer", reply.endpoint.url},
                                                           {"status", reply.status},
                                                           {"code", error_code_name(share.error().code)},
                                                           {"reason", share.error().what()}});
                    return;
                }

                auto started = std::chrono::steady_clock::now();
                bool accepted = crypto_->add_share(*share);
                auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - started);

                log_.info("added_signature", {{"signer", share->url},
                                              {"accepted", accepted},
                                              {"acceptedShares", crypto_->accepted_count()},
                                              {"threshold", crypto_->threshold()},
                                              {"hasSufficientSignatures", crypto_->has_quorum()},
                                              {"additionLatencyUs", latency.count()}});

                if (crypto_->has_quorum())
                {
                    state_ = CombinerState::Combining;
                    crossed = true;
                }
            }

            if (crossed)
                combine();
        }

        void on_fanout_complete(const FanoutSummary &summary)
        {
            std::optional<CombineOutcome> outcome;
            {
                std::lock_guard lock(mutex_);
                log_.info("fanout_complete", {{"responded", summary.responded},
                                              {"failed", summary.failed},
                                              {"cancelled", summary.cancelled},
                                              {"state", state_name(state_)}});
                if (state_ == CombinerState::Collecting)
                {
                    state_ = CombinerState::FallbackFailed;
                    outcome = fallback_locked();
                }
            }
            if (outcome)
                finish(std::move(*outcome));
        }

        // Runs once, on the thread whose response reached quorum. The state is
        // already COMBINING, so no other thread touches crypto_ or records_.
        void combine()
        {
            token_->cancel();
            log_.info("quorum_reached", {{"acceptedShares", crypto_->accepted_count()}});

            Result<std::string> combined = std::unexpected(QuorumSigError::combination_unavailable("not attempted"));
            try
            {
                combined = crypto_->combine();
            }
            catch (const std::exception &e)
            {
                combined = std::unexpected(QuorumSigError::combination_unavailable(e.what()));
            }

            CombineOutcome outcome;
            {
                std::lock_guard lock(mutex_);
                if (combined)
                {
                    state_ = CombinerState::Succeeded;
                    outcome = CombineOutcome::success(std::move(*combined));
                }
                else
                {
                    log_.error("combination_failed", {{"reason", combined.error().what()}});
                    state_ = CombinerState::FallbackFailed;
                    outcome = fallback_locked();
                }
            }
            finish(std::move(outcome));
        }

        CombineOutcome fallback_locked()
        {
            auto majority = ErrorAggregator::majority_error_code(records_);
            auto error = ErrorAggregator::missing_signatures_error(majority);
            log_.warn("not_enough_signatures", {{"responses", records_.size()},
                                                {"acceptedShares", crypto_->accepted_count()},
                                                {"threshold", crypto_->threshold()},
                                                {"majorityErrorCode", majority ? nlohmann::json(*majority) : nlohmann::json(nullptr)}});
            return CombineOutcome::failure(CombinerState::FallbackFailed, error.status, std::move(error.message));
        }

        // records_ is frozen once the state has left COLLECTING
        void finish(CombineOutcome outcome)
        {
            Protocol::log_response_discrepancies(records_, log_);
            log_.info("request_complete", {{"state", state_name(outcome.state)}, {"status", outcome.status}});

            auto done = std::move(done_);
            done_ = nullptr;
            done(std::move(outcome));
        }

        std::shared_ptr<const SignerFanout> fanout_;
        SigningRequest request_;
        std::unique_ptr<ThresholdCrypto> crypto_;
        Completion done_;
        ResponseValidator validator_;
        std::shared_ptr<CancellationToken> token_;
        EventLogger log_;

        std::mutex mutex_;
        CombinerState state_{CombinerState::Collecting};
        std::vector<ResponseRecord> records_;
    };

    // ============================================================================
    // QuorumCombiner
    // ============================================================================

    template <typename Protocol>
    QuorumCombiner<Protocol>::QuorumCombiner(CombinerSettings settings,
                                             std::shared_ptr<const SignerFanout> fanout,
                                             std::shared_ptr<const ThresholdCryptoFactory> crypto)
        : settings_(std::move(settings)), fanout_(std::move(fanout)), crypto_(std::move(crypto))
    {
    }

    template <typename Protocol>
    void QuorumCombiner<Protocol>::handle(SigningRequest request, Completion done) const
    {
        EventLogger log(std::string(Protocol::name), request.session_id());

        if (request.key_version && !request.key_version->empty())
        {
            auto declared = parse_key_version(*request.key_version);
            if (!declared || *declared != settings_.key_version)
            {
                log.warn("invalid_key_header", {{"declared", *request.key_version},
                                                {"expected", settings_.key_version}});
                done(CombineOutcome::failure(CombinerState::Rejected, 400,
                                             std::string(client_error::INVALID_KEY_HEADER)));
                return;
            }
        }

        if (auto valid = Protocol::validate_request(request.body); !valid)
        {
            log.warn("invalid_input", {{"reason", valid.error().what()}});
            done(CombineOutcome::failure(CombinerState::Rejected, 400, std::string(client_error::INVALID_INPUT)));
            return;
        }

        auto crypto = crypto_->create(Protocol::blinded_message(request.body));
        if (!crypto)
        {
            log.warn("invalid_input", {{"reason", crypto.error().what()}});
            done(CombineOutcome::failure(CombinerState::Rejected, 400, std::string(client_error::INVALID_INPUT)));
            return;
        }

        auto session = std::make_shared<Session>(settings_, fanout_, std::move(request), std::move(*crypto), std::move(done));
        session->start();
    }

    template <typename Protocol>
    CombineOutcome QuorumCombiner<Protocol>::handle_sync(SigningRequest request) const
    {
        auto promise = std::make_shared<std::promise<CombineOutcome>>();
        auto future = promise->get_future();
        handle(std::move(request), [promise](CombineOutcome outcome) { promise->set_value(std::move(outcome)); });
        return future.get();
    }

    template class QuorumCombiner<PnpSignProtocol>;
    template class QuorumCombiner<DomainSignProtocol>;

} // namespace quorumsig
