#include <catch2/catch_test_macros.hpp>
#include "quorumsig/http_signer_client.hpp"
#include "quorumsig/signer_fanout.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace quorumsig;

namespace
{
    /** Single-connection blocking HTTP signer on the loopback interface */
    class LoopbackSigner
    {
    public:
        enum class Behaviour
        {
            Respond,
            Hang
        };

        explicit LoopbackSigner(Behaviour behaviour)
            : acceptor_(ioc_, tcp::endpoint(net::ip::address_v4::loopback(), 0))
        {
            thread_ = std::thread([this, behaviour] { serve(behaviour); });
        }

        ~LoopbackSigner()
        {
            if (thread_.joinable())
                thread_.join();
        }

        std::string url(const std::string &prefix = "") const
        {
            return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + prefix;
        }

        /** The request as received, once it has been read */
        http::request<http::string_body> received()
        {
            return received_.get_future().get();
        }

        std::future<http::request<http::string_body>> received_future()
        {
            return received_.get_future();
        }

    private:
        void serve(Behaviour behaviour)
        {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec)
                return;

            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(socket, buffer, req, ec);
            if (ec)
                return;
            received_.set_value(req);

            if (behaviour == Behaviour::Respond)
            {
                http::response<http::string_body> res{http::status::ok, 11};
                res.set(http::field::content_type, "application/json");
                res.set("keyVersion", "3");
                res.body() = R"({"success":true,"signature":"c2ln"})";
                res.prepare_payload();
                http::write(socket, res, ec);
                socket.shutdown(tcp::socket::shutdown_send, ec);
                return;
            }

            // Hold the connection until the client gives up on it
            char byte;
            while (!ec)
                socket.read_some(net::buffer(&byte, 1), ec);
        }

        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::promise<http::request<http::string_body>> received_;
        std::thread thread_;
    };

    std::future<SignerCallResult> send(HttpSignerClient &client,
                                       const std::string &url,
                                       std::shared_ptr<CancellationToken> token,
                                       HeaderList headers = {})
    {
        auto promise = std::make_shared<std::promise<SignerCallResult>>();
        auto future = promise->get_future();
        client.send(SignerEndpoint{url, 1},
                    OutboundRequest{"/domain/sign", R"({"blindedMessage":"abc"})", std::move(headers)},
                    std::move(token),
                    [promise](SignerCallResult result) { promise->set_value(std::move(result)); });
        return future;
    }
}

TEST_CASE("Signer URL parsing", "[http]")
{
    auto plain = parse_http_url("http://signer.example");
    REQUIRE(plain.has_value());
    REQUIRE(plain->host == "signer.example");
    REQUIRE(plain->port == "80");
    REQUIRE(plain->base_path.empty());

    auto full = parse_http_url("http://10.0.0.1:8080/odis/");
    REQUIRE(full.has_value());
    REQUIRE(full->host == "10.0.0.1");
    REQUIRE(full->port == "8080");
    REQUIRE(full->base_path == "/odis");

    REQUIRE_FALSE(parse_http_url("https://signer.example").has_value());
    REQUIRE_FALSE(parse_http_url("http://").has_value());
    REQUIRE_FALSE(parse_http_url("http://host:port").has_value());
    REQUIRE_FALSE(parse_http_url("signer.example:80").has_value());
}

TEST_CASE("HTTP client delivers a signer response", "[http]")
{
    LoopbackSigner signer(LoopbackSigner::Behaviour::Respond);
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(5000), 1});

    auto future = send(client, signer.url("/v1"), std::make_shared<CancellationToken>(),
                       {{"keyVersion", "3"}, {"Authorization", "Bearer xyz"}});
    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);

    auto result = future.get();
    REQUIRE(result.status == CallStatus::Responded);
    REQUIRE(result.reply->status == 200);
    REQUIRE(result.reply->key_version == std::optional<std::string>("3"));
    REQUIRE(result.reply->body == R"({"success":true,"signature":"c2ln"})");
    REQUIRE(result.reply->endpoint.index == 1);

    auto req = signer.received();
    REQUIRE(req.method() == http::verb::post);
    REQUIRE(req.target() == "/v1/domain/sign");
    REQUIRE(req["keyVersion"] == "3");
    REQUIRE(req[http::field::authorization] == "Bearer xyz");
    REQUIRE(req[http::field::content_type] == "application/json");
    REQUIRE(req.body() == R"({"blindedMessage":"abc"})");
}

TEST_CASE("HTTP client aborts a call when cancelled", "[http]")
{
    LoopbackSigner signer(LoopbackSigner::Behaviour::Hang);
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(30000), 1});

    auto received = signer.received_future();
    auto token = std::make_shared<CancellationToken>();
    auto future = send(client, signer.url(), token);

    // Wait until the request is on the wire, then give up on it
    REQUIRE(received.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    token->cancel();

    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.status == CallStatus::Cancelled);
    REQUIRE_FALSE(result.reply.has_value());
}

TEST_CASE("HTTP client reports a timeout as a transport error", "[http]")
{
    LoopbackSigner signer(LoopbackSigner::Behaviour::Hang);
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(200), 1});

    auto future = send(client, signer.url(), std::make_shared<CancellationToken>());
    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.status == CallStatus::TransportError);
    REQUIRE(result.error.find("timed out") != std::string::npos);
}

TEST_CASE("HTTP client completes immediately for a fired token", "[http]")
{
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(1000), 1});
    auto token = std::make_shared<CancellationToken>();
    token->cancel();

    auto future = send(client, "http://127.0.0.1:9", token);
    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    REQUIRE(future.get().status == CallStatus::Cancelled);
}

TEST_CASE("HTTP client rejects unsupported URLs", "[http]")
{
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(1000), 1});
    auto future = send(client, "https://signer.example", std::make_shared<CancellationToken>());
    REQUIRE(future.wait_for(std::chrono::seconds(1)) == std::future_status::ready);
    REQUIRE(future.get().status == CallStatus::TransportError);
}

TEST_CASE("HTTP client released by its last completion handler", "[http]")
{
    // The fan-out callbacks are the only owners of the client, so the cancelled
    // call's completion drops the last reference on a client worker thread.
    LoopbackSigner signer(LoopbackSigner::Behaviour::Hang);
    auto received = signer.received_future();
    auto token = std::make_shared<CancellationToken>();
    auto completed = std::make_shared<std::promise<FanoutSummary>>();
    auto completed_future = completed->get_future();
    std::weak_ptr<HttpSignerClient> weak_client;

    {
        auto client = std::make_shared<HttpSignerClient>(HttpSignerClientConfig{std::chrono::milliseconds(30000), 1});
        weak_client = client;
        auto fanout = std::make_shared<SignerFanout>(client, std::vector<SignerEndpoint>{{signer.url(), 1}}, 3);
        fanout->dispatch(OutboundRequest{"/domain/sign", "{}", {}},
                         token,
                         [fanout](const SignerReply &) {},
                         [fanout, completed](const FanoutSummary &summary) { completed->set_value(summary); });
    }

    REQUIRE(received.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    token->cancel();

    REQUIRE(completed_future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    REQUIRE(completed_future.get().cancelled == 1);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!weak_client.expired() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(weak_client.expired());
}

TEST_CASE("HTTP client can be stopped from a completion handler", "[http]")
{
    HttpSignerClient client(HttpSignerClientConfig{std::chrono::milliseconds(1000), 1});
    auto stopped = std::make_shared<std::promise<void>>();
    auto stopped_future = stopped->get_future();

    // Nothing listens on the discard port, so the call fails on a worker
    client.send(SignerEndpoint{"http://127.0.0.1:9", 1},
                OutboundRequest{"/domain/sign", "{}", {}},
                std::make_shared<CancellationToken>(),
                [&client, stopped](SignerCallResult) {
                    client.stop();
                    stopped->set_value();
                });

    REQUIRE(stopped_future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    client.stop();
}
