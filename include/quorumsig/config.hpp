#pragma once

#include "signer_client.hpp"
#include "threshold_crypto.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quorumsig
{

    struct ServerConfig
    {
        std::uint16_t port{8081};
        std::size_t threads{4};
        std::string version{std::string(service_version())};
    };

    struct KeysConfig
    {
        std::string public_key;
        std::uint32_t version{0};
        std::string polynomial;
    };

    struct QuorumConfig
    {
        std::size_t threshold{1};
    };

    struct TransportConfig
    {
        std::uint64_t timeout_ms{5000};
        std::size_t threads{2};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct ProtocolsConfig
    {
        bool pnp{true};
        bool domain{true};
    };

    struct SignerConfig
    {
        std::string url;
        std::optional<std::uint32_t> index; // defaults to position, 1-based
    };

    struct CombinerConfig
    {
        ServerConfig server{};
        KeysConfig keys{};
        QuorumConfig quorum{};
        TransportConfig transport{};
        LoggingConfig logging{};
        ProtocolsConfig protocols{};
        std::vector<SignerConfig> signers;

        KeyEpoch key_epoch() const;

        /** Signers with their effective share index */
        std::vector<SignerEndpoint> signer_endpoints() const;
    };

    /**
     * ConfigLoader loads TOML configs, applies QUORUMSIG_* environment
     * overrides and validates the result.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<CombinerConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<CombinerConfig> from_string(const std::string &toml_content);

        /** Check the invariants a running combiner depends on */
        static Result<void> validate(const CombinerConfig &cfg);

        /** Serialize config to JSON for inspection */
        static nlohmann::json to_json(const CombinerConfig &cfg);

    private:
        static Result<void> apply_env_overrides(CombinerConfig &cfg);
    };

} // namespace quorumsig
