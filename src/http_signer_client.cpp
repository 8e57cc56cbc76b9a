#include "quorumsig/http_signer_client.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace quorumsig
{
    Result<HttpTarget> parse_http_url(std::string_view url)
    {
        constexpr std::string_view scheme = "http://";
        if (!url.starts_with(scheme))
            return std::unexpected(QuorumSigError::config(std::format("Unsupported signer URL: {}", url)));

        auto rest = url.substr(scheme.size());
        auto slash = rest.find('/');
        auto authority = rest.substr(0, slash);
        std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
        while (!path.empty() && path.back() == '/')
            path.remove_suffix(1);

        if (authority.empty())
            return std::unexpected(QuorumSigError::config(std::format("Signer URL has no host: {}", url)));

        HttpTarget target;
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos)
        {
            target.host = std::string(authority);
        }
        else
        {
            target.host = std::string(authority.substr(0, colon));
            target.port = std::string(authority.substr(colon + 1));
            if (target.host.empty() || target.port.empty() ||
                target.port.find_first_not_of("0123456789") != std::string::npos)
                return std::unexpected(QuorumSigError::config(std::format("Malformed signer URL: {}", url)));
        }
        target.base_path = std::string(path);
        return target;
    }

    namespace
    {
        class HttpCall : public std::enable_shared_from_this<HttpCall>
        {
        public:
            HttpCall(net::io_context &ioc,
                     SignerEndpoint endpoint,
                     HttpTarget target,
                     const OutboundRequest &request,
                     std::shared_ptr<CancellationToken> token,
                     std::chrono::milliseconds timeout,
                     SignerClient::Completion done)
                : strand_(net::make_strand(ioc)),
                  resolver_(strand_),
                  stream_(strand_),
                  endpoint_(std::move(endpoint)),
                  target_(std::move(target)),
                  token_(std::move(token)),
                  timeout_(timeout),
                  done_(std::move(done))
            {
                req_.method(http::verb::post);
                req_.target(target_.base_path + request.path);
                req_.version(11);
                req_.set(http::field::host, target_.host);
                req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
                req_.set(http::field::content_type, "application/json");
                for (const auto &[name, value] : request.headers)
                    req_.set(name, value);
                req_.body() = request.body;
                req_.prepare_payload();
            }

            void start()
            {
                auto self = shared_from_this();
                subscription_ = token_->subscribe([self] {
                    net::post(self->strand_, [self] { self->abort(); });
                });
                net::dispatch(strand_, [self] { self->do_resolve(); });
            }

        private:
            void abort()
            {
                aborted_ = true;
                resolver_.cancel();
                stream_.close();
            }

            void do_resolve()
            {
                if (aborted_)
                    return finish(SignerCallResult::cancelled());
                resolver_.async_resolve(target_.host, target_.port,
                                        beast::bind_front_handler(&HttpCall::on_resolve, shared_from_this()));
            }

            void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                if (aborted_)
                    return finish(SignerCallResult::cancelled());
                if (ec)
                    return fail("resolve", ec);

                stream_.expires_after(timeout_);
                stream_.async_connect(results,
                                      beast::bind_front_handler(&HttpCall::on_connect, shared_from_this()));
            }

            void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (aborted_)
                    return finish(SignerCallResult::cancelled());
                if (ec)
                    return fail("connect", ec);

                http::async_write(stream_, req_,
                                  beast::bind_front_handler(&HttpCall::on_write, shared_from_this()));
            }

            void on_write(beast::error_code ec, std::size_t)
            {
                if (aborted_)
                    return finish(SignerCallResult::cancelled());
                if (ec)
                    return fail("write", ec);

                http::async_read(stream_, buffer_, res_,
                                 beast::bind_front_handler(&HttpCall::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (aborted_)
                    return finish(SignerCallResult::cancelled());
                if (ec)
                    return fail("read", ec);

                SignerReply reply;
                reply.endpoint = endpoint_;
                reply.status = res_.result_int();
                if (auto it = res_.find(beast::string_view(KEY_VERSION_HEADER.data(), KEY_VERSION_HEADER.size())); it != res_.end())
                    reply.key_version = std::string(it->value());
                reply.body = std::move(res_.body());

                beast::error_code ignored;
                stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
                finish(SignerCallResult::responded(std::move(reply)));
            }

            void fail(const char *what, beast::error_code ec)
            {
                if (ec == beast::error::timeout)
                    return finish(SignerCallResult::transport_error(std::format("{} timed out", what)));
                finish(SignerCallResult::transport_error(std::format("{}: {}", what, ec.message())));
            }

            void finish(SignerCallResult result)
            {
                if (finished_)
                    return;
                finished_ = true;
                token_->unsubscribe(subscription_);
                auto done = std::move(done_);
                done(std::move(result));
            }

            net::strand<net::io_context::executor_type> strand_;
            tcp::resolver resolver_;
            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> req_;
            http::response<http::string_body> res_;

            SignerEndpoint endpoint_;
            HttpTarget target_;
            std::shared_ptr<CancellationToken> token_;
            CancellationToken::SubscriptionId subscription_{0};
            std::chrono::milliseconds timeout_;
            SignerClient::Completion done_;
            bool aborted_{false};
            bool finished_{false};
        };
    } // namespace

    class HttpSignerClient::Impl
    {
    public:
        explicit Impl(HttpSignerClientConfig cfg)
            : cfg_(cfg),
              ioc_(static_cast<int>(cfg.threads)),
              work_(net::make_work_guard(ioc_))
        {
            threads_.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads_.emplace_back([this] { ioc_.run(); });
            }
        }

        ~Impl()
        {
            stop();
        }

        void send(const SignerEndpoint &endpoint,
                  const OutboundRequest &request,
                  std::shared_ptr<CancellationToken> token,
                  Completion done)
        {
            auto target = parse_http_url(endpoint.url);
            if (!target)
            {
                done(SignerCallResult::transport_error(target.error().what()));
                return;
            }
            std::make_shared<HttpCall>(ioc_, endpoint, std::move(*target), request, std::move(token),
                                       cfg_.timeout, std::move(done))
                ->start();
        }

        void stop()
        {
            if (!stopped_.exchange(true))
            {
                work_.reset();
                ioc_.stop();
            }

            // A worker calling stop() from a handler leaves run() on its own
            std::lock_guard lock(join_mutex_);
            const auto self = std::this_thread::get_id();
            for (auto &t : threads_)
            {
                if (t.joinable() && t.get_id() != self)
                    t.join();
            }
        }

        bool on_worker_thread() const
        {
            const auto self = std::this_thread::get_id();
            return std::any_of(threads_.begin(), threads_.end(),
                               [self](const std::thread &t) { return t.get_id() == self; });
        }

    private:
        HttpSignerClientConfig cfg_;
        net::io_context ioc_;
        net::executor_work_guard<net::io_context::executor_type> work_;
        std::vector<std::thread> threads_;
        std::atomic<bool> stopped_{false};
        std::mutex join_mutex_;
    };

    HttpSignerClient::HttpSignerClient(HttpSignerClientConfig cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    HttpSignerClient::~HttpSignerClient()
    {
        // The last owner can be a completion handler running on a worker.
        // That worker cannot join itself, so the join happens on a helper thread.
        if (impl_ && impl_->on_worker_thread())
            std::thread([impl = std::move(impl_)] { impl->stop(); }).detach();
    }

    void HttpSignerClient::send(const SignerEndpoint &endpoint,
                                const OutboundRequest &request,
                                std::shared_ptr<CancellationToken> token,
                                Completion done)
    {
        impl_->send(endpoint, request, std::move(token), std::move(done));
    }

    void HttpSignerClient::stop() { impl_->stop(); }

} // namespace quorumsig
