#include <catch2/catch_test_macros.hpp>
#include "quorumsig/service.hpp"
#include "support/fake_signer_client.hpp"
#include "support/threshold_dealer.hpp"

using namespace quorumsig;
using quorumsig::testing::FakeSignerClient;
using quorumsig::testing::signer_body;
using quorumsig::testing::ThresholdDealer;

namespace
{
    CombinerConfig config_for(const ThresholdDealer &dealer, std::uint32_t version)
    {
        CombinerConfig cfg;
        auto epoch = dealer.epoch(version);
        cfg.keys = KeysConfig{epoch.public_key, epoch.version, epoch.polynomial};
        cfg.quorum.threshold = dealer.threshold();
        cfg.server.version = "3.1.0";
        for (std::size_t i = 1; i <= dealer.signers(); ++i)
            cfg.signers.push_back(SignerConfig{"http://signer" + std::to_string(i), std::nullopt});
        return cfg;
    }
}

TEST_CASE("Service wires combiners from configuration", "[service]")
{
    ThresholdDealer dealer(2, 3);
    auto cfg = config_for(dealer, 4);
    REQUIRE(ConfigLoader::validate(cfg).has_value());

    auto client = std::make_shared<FakeSignerClient>();
    auto blinded = ThresholdDealer::random_blinded();
    for (std::uint32_t i = 1; i <= 3; ++i)
        client->script("http://signer" + std::to_string(i),
                       FakeSignerClient::reply(200, "4", signer_body(dealer.partial_sign(i, blinded))));

    auto service = Service::create(cfg, client);
    REQUIRE(service.has_value());
    REQUIRE(service->pnp != nullptr);
    REQUIRE(service->domain != nullptr);
    REQUIRE(service->pnp->settings().key_version == 4);
    REQUIRE(service->pnp->settings().version == "3.1.0");

    nlohmann::json body{{"account", "0x" + std::string(40, 'a')},
                        {"blindedQueryPhoneNumber", crypto::Ristretto::point_to_base64(blinded)}};
    auto outcome = service->pnp->handle_sync(SigningRequest::parse(body.dump(), "4").value());
    REQUIRE(outcome.ok());
    REQUIRE(outcome.combined_signature == dealer.expected_signature(blinded));

    auto wsc = service->web_server_config(cfg);
    REQUIRE(wsc.version == "3.1.0");
    REQUIRE(wsc.pnp == service->pnp);
}

TEST_CASE("Service honours disabled protocols", "[service]")
{
    ThresholdDealer dealer(1, 1);
    auto cfg = config_for(dealer, 1);
    cfg.protocols.pnp = false;

    auto service = Service::create(cfg, std::make_shared<FakeSignerClient>());
    REQUIRE(service.has_value());
    REQUIRE(service->pnp == nullptr);
    REQUIRE(service->domain != nullptr);
}

TEST_CASE("Service rejects key material that does not match the threshold", "[service]")
{
    ThresholdDealer dealer(2, 3);
    auto cfg = config_for(dealer, 1);
    cfg.quorum.threshold = 3;

    auto service = Service::create(cfg, std::make_shared<FakeSignerClient>());
    REQUIRE_FALSE(service.has_value());
    REQUIRE(service.error().code == ErrorCode::ConfigError);
}
