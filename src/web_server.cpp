#include "quorumsig/web_server.hpp"
#include "quorumsig/error_aggregator.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace quorumsig
{
    namespace
    {
        http::response<http::string_body> json_response(http::status status, const nlohmann::json &j)
        {
            http::response<http::string_body> res{status, 11};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = j.dump();
            res.prepare_payload();
            return res;
        }

        http::response<http::string_body> not_found()
        {
            return json_response(http::status::not_found, {{"error", "not found"}});
        }

        http::response<http::string_body> method_not_allowed()
        {
            return json_response(http::status::method_not_allowed, {{"error", "method not allowed"}});
        }

        template <class Body, class Allocator>
        std::optional<std::string> header(const http::request<Body, http::basic_fields<Allocator>> &req,
                                          std::string_view name)
        {
            if (auto it = req.find(beast::string_view(name.data(), name.size())); it != req.end())
                return std::string(it->value());
            return std::nullopt;
        }

        std::string_view route_of(beast::string_view target)
        {
            std::string_view t(target.data(), target.size());
            return t.substr(0, t.find('?'));
        }
    } // namespace

    class WebServer::Impl
    {
    public:
        explicit Impl(WebServerConfig cfg)
            : cfg_(std::move(cfg)),
              ioc_(static_cast<int>(cfg_.threads)),
              acceptor_(ioc_)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{tcp::v4(), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("Listening on port {} (pnp={}, domain={})", cfg_.port,
                         cfg_.pnp != nullptr, cfg_.domain != nullptr);
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), cfg_)->run();
            }
            else if (ec == net::error::operation_aborted)
            {
                return;
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, const WebServerConfig &cfg)
                : stream_(std::move(socket)),
                  buffer_(),
                  cfg_(cfg)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }
                handle_request();
            }

            void handle_request()
            {
                auto route = route_of(req_.target());

                if (route == "/health")
                {
                    if (req_.method() != http::verb::get)
                        return reply(method_not_allowed());
                    return reply(json_response(http::status::ok, {{"status", "ok"}, {"version", cfg_.version}}));
                }

                if (cfg_.pnp && route == PnpSignProtocol::combiner_path)
                    return serve_signing(*cfg_.pnp);

                if (cfg_.domain && route == DomainSignProtocol::combiner_path)
                    return serve_signing(*cfg_.domain);

                reply(not_found());
            }

            template <typename Combiner>
            void serve_signing(const Combiner &combiner)
            {
                if (req_.method() != http::verb::post)
                    return reply(method_not_allowed());

                auto request = SigningRequest::parse(req_.body(),
                                                     header(req_, KEY_VERSION_HEADER),
                                                     header(req_, "Authorization"));
                if (!request)
                {
                    auto outcome = CombineOutcome::failure(CombinerState::Rejected, 400,
                                                           std::string(client_error::INVALID_INPUT));
                    return reply(outcome_response(outcome));
                }

                // The write is posted back onto this connection's strand; the
                // combiner completes on a transport thread.
                auto self = shared_from_this();
                combiner.handle(std::move(*request), [self](CombineOutcome outcome) {
                    auto res = self->outcome_response(outcome);
                    net::post(self->stream_.get_executor(), [self, res = std::move(res)]() mutable {
                        self->reply(std::move(res));
                    });
                });
            }

            http::response<http::string_body> outcome_response(const CombineOutcome &outcome) const
            {
                return json_response(static_cast<http::status>(outcome.status), outcome.to_json(cfg_.version));
            }

            void reply(http::response<http::string_body> res)
            {
                res_ = std::move(res);
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;
            const WebServerConfig &cfg_;
        };

        WebServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
    };

    WebServer::WebServer(const WebServerConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace quorumsig
