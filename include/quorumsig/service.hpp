#pragma once

#include "config.hpp"
#include "http_signer_client.hpp"
#include "quorum_combiner.hpp"
#include "web_server.hpp"
#include <memory>

namespace quorumsig
{
    /**
     * The combiners, transport and key material of one running process, wired
     * from a validated configuration.
     */
    struct Service
    {
        std::shared_ptr<SignerClient> client;
        std::shared_ptr<const SignerFanout> fanout;
        std::shared_ptr<const ThresholdCryptoFactory> crypto;
        std::shared_ptr<const PnpCombiner> pnp;       // null when disabled
        std::shared_ptr<const DomainCombiner> domain; // null when disabled

        /** Build over the HTTP transport */
        static Result<Service> create(const CombinerConfig &cfg);

        /** Build over a caller-supplied transport */
        static Result<Service> create(const CombinerConfig &cfg, std::shared_ptr<SignerClient> client);

        WebServerConfig web_server_config(const CombinerConfig &cfg) const;
    };
}
