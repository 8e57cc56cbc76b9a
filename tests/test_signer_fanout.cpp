#include <catch2/catch_test_macros.hpp>
#include "quorumsig/signer_fanout.hpp"
#include "support/fake_signer_client.hpp"
#include <algorithm>

using namespace quorumsig;
using quorumsig::testing::FakeSignerClient;
using quorumsig::testing::signer_body;

namespace
{
    std::vector<SignerEndpoint> endpoints(std::size_t n)
    {
        std::vector<SignerEndpoint> out;
        for (std::size_t i = 1; i <= n; ++i)
            out.push_back(SignerEndpoint{"http://signer" + std::to_string(i), static_cast<std::uint32_t>(i)});
        return out;
    }

    bool has_header(const OutboundRequest &req, const std::string &name, const std::string &value)
    {
        return std::any_of(req.headers.begin(), req.headers.end(),
                           [&](const auto &h) { return h.first == name && h.second == value; });
    }
}

TEST_CASE("Fanout reaches every signer with the key version header", "[fanout]")
{
    auto client = std::make_shared<FakeSignerClient>();
    for (const auto &e : endpoints(3))
        client->script(e.url, FakeSignerClient::reply(200, "7", signer_body("sig")));

    SignerFanout fanout(client, endpoints(3), 7);
    std::vector<std::string> responded;
    std::optional<FanoutSummary> summary;

    OutboundRequest req{"/getBlindedMessagePartialSig", "{}", {{"Authorization", "Bearer abc"}}};
    auto handle = fanout.dispatch(
        req, std::make_shared<CancellationToken>(),
        [&](const SignerReply &r) { responded.push_back(r.endpoint.url); },
        [&](const FanoutSummary &s) { summary = s; });

    REQUIRE(responded.size() == 3);
    REQUIRE(summary.has_value());
    REQUIRE(summary->responded == 3);
    REQUIRE(handle->outstanding() == 0);

    for (const auto &sent : client->requests())
    {
        REQUIRE(sent.path == "/getBlindedMessagePartialSig");
        REQUIRE(has_header(sent, "keyVersion", "7"));
        REQUIRE(has_header(sent, "Authorization", "Bearer abc"));
    }
}

TEST_CASE("Transport errors produce no response", "[fanout]")
{
    auto client = std::make_shared<FakeSignerClient>();
    client->script("http://signer1", FakeSignerClient::reply(500, "1", "{}"));
    client->script("http://signer2", FakeSignerClient::transport_error());

    SignerFanout fanout(client, endpoints(2), 1);
    std::vector<unsigned> statuses;
    std::optional<FanoutSummary> summary;
    fanout.dispatch(
        OutboundRequest{"/domain/sign", "{}", {}}, std::make_shared<CancellationToken>(),
        [&](const SignerReply &r) { statuses.push_back(r.status); },
        [&](const FanoutSummary &s) { summary = s; });

    REQUIRE(statuses == std::vector<unsigned>{500});
    REQUIRE(summary->responded == 1);
    REQUIRE(summary->failed == 1);
}

TEST_CASE("Cancelling aborts outstanding calls", "[fanout]")
{
    auto client = std::make_shared<FakeSignerClient>();
    client->set_manual(true);
    for (const auto &e : endpoints(3))
        client->script(e.url, FakeSignerClient::reply(200, "1", signer_body("sig")));

    SignerFanout fanout(client, endpoints(3), 1);
    auto token = std::make_shared<CancellationToken>();
    std::size_t responses = 0;
    int completions = 0;
    std::optional<FanoutSummary> summary;

    auto handle = fanout.dispatch(
        OutboundRequest{"/domain/sign", "{}", {}}, token,
        [&](const SignerReply &) { ++responses; },
        [&](const FanoutSummary &s) { ++completions; summary = s; });

    REQUIRE(handle->outstanding() == 3);
    REQUIRE(client->deliver("http://signer2"));
    REQUIRE(handle->outstanding() == 2);

    handle->cancel();
    REQUIRE(handle->cancelled());
    REQUIRE(handle->outstanding() == 0);
    REQUIRE(client->cancelled() == std::vector<std::string>{"http://signer1", "http://signer3"});
    REQUIRE(completions == 1);
    REQUIRE(summary->responded == 1);
    REQUIRE(summary->cancelled == 2);

    // Nothing left to deliver
    REQUIRE_FALSE(client->deliver("http://signer1"));
    REQUIRE(responses == 1);
}

TEST_CASE("Calls are not started once the token has fired", "[fanout]")
{
    auto client = std::make_shared<FakeSignerClient>();
    client->script("http://signer1", FakeSignerClient::reply(200, "1", signer_body("sig")));
    client->script("http://signer2", FakeSignerClient::reply(200, "1", signer_body("sig")));

    SignerFanout fanout(client, endpoints(2), 1);
    auto token = std::make_shared<CancellationToken>();
    std::optional<FanoutSummary> summary;

    // The first response fires the token before the second call is issued
    fanout.dispatch(
        OutboundRequest{"/domain/sign", "{}", {}}, token,
        [&](const SignerReply &) { token->cancel(); },
        [&](const FanoutSummary &s) { summary = s; });

    REQUIRE(client->sent() == std::vector<std::string>{"http://signer1"});
    REQUIRE(summary->responded == 1);
    REQUIRE(summary->cancelled == 1);
}

TEST_CASE("Fanout over no signers completes immediately", "[fanout]")
{
    auto client = std::make_shared<FakeSignerClient>();
    SignerFanout fanout(client, {}, 1);
    bool completed = false;
    fanout.dispatch(
        OutboundRequest{"/domain/sign", "{}", {}}, std::make_shared<CancellationToken>(),
        [](const SignerReply &) {},
        [&](const FanoutSummary &s) { completed = s.responded == 0; });
    REQUIRE(completed);
}
