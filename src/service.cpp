#include "quorumsig/service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace quorumsig
{
    Result<Service> Service::create(const CombinerConfig &cfg)
    {
        HttpSignerClientConfig client_cfg{std::chrono::milliseconds(cfg.transport.timeout_ms), cfg.transport.threads};
        return create(cfg, std::make_shared<HttpSignerClient>(client_cfg));
    }

    Result<Service> Service::create(const CombinerConfig &cfg, std::shared_ptr<SignerClient> client)
    {
        auto keys = RistrettoKeyMaterial::load(cfg.key_epoch(), cfg.quorum.threshold);
        if (!keys)
            return std::unexpected(keys.error());

        Service service;
        service.client = std::move(client);
        service.fanout = std::make_shared<SignerFanout>(service.client, cfg.signer_endpoints(), cfg.keys.version);
        service.crypto = std::make_shared<RistrettoThresholdCryptoFactory>(std::move(*keys), cfg.quorum.threshold);

        CombinerSettings settings{cfg.keys.version, cfg.server.version};
        if (cfg.protocols.pnp)
            service.pnp = std::make_shared<PnpCombiner>(settings, service.fanout, service.crypto);
        if (cfg.protocols.domain)
            service.domain = std::make_shared<DomainCombiner>(settings, service.fanout, service.crypto);

        spdlog::info("Combiner ready: {} signers, threshold {}, key version {}",
                     cfg.signers.size(), cfg.quorum.threshold, cfg.keys.version);
        return service;
    }

    WebServerConfig Service::web_server_config(const CombinerConfig &cfg) const
    {
        WebServerConfig wsc;
        wsc.port = cfg.server.port;
        wsc.threads = cfg.server.threads;
        wsc.version = cfg.server.version;
        wsc.pnp = pnp;
        wsc.domain = domain;
        return wsc;
    }
}
