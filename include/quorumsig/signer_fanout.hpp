#pragma once

#include "signer_client.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace quorumsig
{
    struct FanoutSummary
    {
        std::size_t responded{0};
        std::size_t failed{0};
        std::size_t cancelled{0};
    };

    /** Bookkeeping for one dispatch: the shared cancellation control and outstanding calls */
    class FanoutHandle
    {
    public:
        FanoutHandle(std::shared_ptr<CancellationToken> token, std::size_t total);

        /** Abort every call that has not completed yet */
        void cancel();

        bool cancelled() const;

        std::size_t outstanding() const;

        FanoutSummary summary() const;

        /** Count a finished call. Returns true for the call that finishes the fan-out. */
        bool settle(CallStatus status);

    private:
        std::shared_ptr<CancellationToken> token_;
        mutable std::mutex mutex_;
        std::size_t outstanding_;
        FanoutSummary summary_{};
    };

    /**
     * Issues one request per signer concurrently. Responses are handed to the
     * caller in arrival order; the completion handler runs once after the last
     * call has finished and every response handler has returned.
     */
    class SignerFanout
    {
    public:
        using ResponseHandler = std::function<void(const SignerReply &)>;
        using CompletionHandler = std::function<void(const FanoutSummary &)>;

        SignerFanout(std::shared_ptr<SignerClient> client,
                     std::vector<SignerEndpoint> endpoints,
                     std::uint32_t key_version);

        const std::vector<SignerEndpoint> &endpoints() const { return endpoints_; }

        std::shared_ptr<FanoutHandle> dispatch(const OutboundRequest &request,
                                               std::shared_ptr<CancellationToken> token,
                                               ResponseHandler on_response,
                                               CompletionHandler on_complete) const;

    private:
        std::shared_ptr<SignerClient> client_;
        std::vector<SignerEndpoint> endpoints_;
        std::uint32_t key_version_;
    };
}
