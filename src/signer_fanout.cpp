#include "quorumsig/signer_fanout.hpp"
#include "quorumsig/types.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace quorumsig
{
    FanoutHandle::FanoutHandle(std::shared_ptr<CancellationToken> token, std::size_t total)
        : token_(std::move(token)), outstanding_(total)
    {
    }

    void FanoutHandle::cancel()
    {
        token_->cancel();
    }

    bool FanoutHandle::cancelled() const
    {
        return token_->cancelled();
    }

    std::size_t FanoutHandle::outstanding() const
    {
        std::lock_guard lock(mutex_);
        return outstanding_;
    }

    FanoutSummary FanoutHandle::summary() const
    {
        std::lock_guard lock(mutex_);
        return summary_;
    }

    bool FanoutHandle::settle(CallStatus status)
    {
        std::lock_guard lock(mutex_);
        switch (status)
        {
        case CallStatus::Responded:
            ++summary_.responded;
            break;
        case CallStatus::TransportError:
            ++summary_.failed;
            break;
        case CallStatus::Cancelled:
            ++summary_.cancelled;
            break;
        }
        if (outstanding_ == 0)
            return false;
        return --outstanding_ == 0;
    }

    SignerFanout::SignerFanout(std::shared_ptr<SignerClient> client,
                               std::vector<SignerEndpoint> endpoints,
                               std::uint32_t key_version)
        : client_(std::move(client)), endpoints_(std::move(endpoints)), key_version_(key_version)
    {
    }

    std::shared_ptr<FanoutHandle> SignerFanout::dispatch(const OutboundRequest &request,
                                                         std::shared_ptr<CancellationToken> token,
                                                         ResponseHandler on_response,
                                                         CompletionHandler on_complete) const
    {
        struct Context
        {
            std::shared_ptr<FanoutHandle> handle;
            ResponseHandler on_response;
            CompletionHandler on_complete;
        };

        auto handle = std::make_shared<FanoutHandle>(token, endpoints_.size());
        auto ctx = std::make_shared<Context>(Context{handle, std::move(on_response), std::move(on_complete)});

        if (endpoints_.empty())
        {
            ctx->on_complete(handle->summary());
            return handle;
        }

        OutboundRequest outbound = request;
        outbound.headers.emplace_back(std::string(KEY_VERSION_HEADER), std::to_string(key_version_));

        auto finish = [ctx](const SignerEndpoint &endpoint, SignerCallResult result) {
            switch (result.status)
            {
            case CallStatus::Responded:
                ctx->on_response(*result.reply);
                break;
            case CallStatus::TransportError:
                spdlog::warn("Signer request to {} failed: {}", endpoint.url, result.error);
                break;
            case CallStatus::Cancelled:
                spdlog::debug("Signer request to {} cancelled", endpoint.url);
                break;
            }
            if (ctx->handle->settle(result.status))
                ctx->on_complete(ctx->handle->summary());
        };

        for (const auto &endpoint : endpoints_)
        {
            if (token->cancelled())
            {
                finish(endpoint, SignerCallResult::cancelled());
                continue;
            }
            client_->send(endpoint, outbound, token,
                          [finish, endpoint](SignerCallResult result) { finish(endpoint, std::move(result)); });
        }
        return handle;
    }

} // namespace quorumsig
