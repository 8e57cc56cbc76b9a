#pragma once

#include "signer_client.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace quorumsig
{
    /** host/port/path split of a signer base URL */
    struct HttpTarget
    {
        std::string host;
        std::string port{"80"};
        std::string base_path; // without trailing slash
    };

    /** Parse an http:// URL. Other schemes are rejected. */
    Result<HttpTarget> parse_http_url(std::string_view url);

    struct HttpSignerClientConfig
    {
        std::chrono::milliseconds timeout{5000};
        std::size_t threads{2};
    };

    /**
     * SignerClient over HTTP/1.1 using Boost.Beast. Each call runs on its own
     * strand of an internal io_context; firing the token closes the socket and
     * the call completes as Cancelled. Calls exceeding the timeout complete as
     * TransportError.
     */
    class HttpSignerClient : public SignerClient
    {
    public:
        explicit HttpSignerClient(HttpSignerClientConfig cfg = HttpSignerClientConfig{});

        /** May run on a worker thread when a completion handler held the last reference. */
        ~HttpSignerClient() override;

        HttpSignerClient(const HttpSignerClient &) = delete;
        HttpSignerClient &operator=(const HttpSignerClient &) = delete;

        void send(const SignerEndpoint &endpoint,
                  const OutboundRequest &request,
                  std::shared_ptr<CancellationToken> token,
                  Completion done) override;

        /** Stop the worker threads. Calls still in flight never complete. Safe from a completion handler. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
