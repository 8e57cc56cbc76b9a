#pragma once

#include "quorum_combiner.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace quorumsig
{
    struct WebServerConfig
    {
        std::uint16_t port{8081};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
        std::string version{std::string(service_version())};
        std::shared_ptr<const PnpCombiner> pnp;       // optional, enables /getBlindedMessageSig
        std::shared_ptr<const DomainCombiner> domain; // optional, enables /domain/sign
    };

    /**
     * HTTP front end using Boost.Beast. Exposes health and one signing route
     * per enabled protocol; signing requests are answered once their combiner
     * completes, without blocking an I/O thread.
     */
    class WebServer
    {
    public:
        explicit WebServer(const WebServerConfig &cfg = WebServerConfig{});
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; active connections complete gracefully. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
