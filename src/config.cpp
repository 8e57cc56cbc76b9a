#include "quorumsig/config.hpp"
#include "quorumsig/event_log.hpp"
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <toml++/toml.h>

namespace quorumsig
{
    namespace
    {
        template <typename T>
        Result<T> parse_unsigned(const char *name, std::string_view text)
        {
            T value{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::unexpected(QuorumSigError::config(std::format("Invalid value for {}: {}", name, text)));
            return value;
        }

        template <typename T>
        Result<T> table_unsigned(const toml::table &tbl, const char *key, T fallback)
        {
            auto node = tbl[key];
            if (!node)
                return fallback;
            auto v = node.value<int64_t>();
            if (!v || *v < 0 || static_cast<std::uint64_t>(*v) > std::numeric_limits<T>::max())
                return std::unexpected(QuorumSigError::config(std::format("Invalid value for {}", key)));
            return static_cast<T>(*v);
        }

        Result<CombinerConfig> parse_toml(const toml::table &tbl)
        {
            CombinerConfig cfg{};

            if (auto server = tbl["server"].as_table())
            {
                auto port = table_unsigned<std::uint16_t>(*server, "port", cfg.server.port);
                if (!port)
                    return std::unexpected(port.error());
                cfg.server.port = *port;
                auto threads = table_unsigned<std::size_t>(*server, "threads", cfg.server.threads);
                if (!threads)
                    return std::unexpected(threads.error());
                cfg.server.threads = *threads;
                if (auto version = (*server)["version"].value<std::string>())
                    cfg.server.version = *version;
            }

            if (auto keys = tbl["keys"].as_table())
            {
                if (auto pk = (*keys)["public_key"].value<std::string>())
                    cfg.keys.public_key = *pk;
                if (auto poly = (*keys)["polynomial"].value<std::string>())
                    cfg.keys.polynomial = *poly;
                auto version = table_unsigned<std::uint32_t>(*keys, "version", cfg.keys.version);
                if (!version)
                    return std::unexpected(version.error());
                cfg.keys.version = *version;
            }

            if (auto quorum = tbl["quorum"].as_table())
            {
                auto thr = table_unsigned<std::size_t>(*quorum, "threshold", cfg.quorum.threshold);
                if (!thr)
                    return std::unexpected(thr.error());
                cfg.quorum.threshold = *thr;
            }

            if (auto transport = tbl["transport"].as_table())
            {
                auto timeout = table_unsigned<std::uint64_t>(*transport, "timeout_ms", cfg.transport.timeout_ms);
                if (!timeout)
                    return std::unexpected(timeout.error());
                cfg.transport.timeout_ms = *timeout;
                auto threads = table_unsigned<std::size_t>(*transport, "threads", cfg.transport.threads);
                if (!threads)
                    return std::unexpected(threads.error());
                cfg.transport.threads = *threads;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            if (auto protocols = tbl["protocols"].as_table())
            {
                if (auto pnp = (*protocols)["pnp"].value<bool>())
                    cfg.protocols.pnp = *pnp;
                if (auto domain = (*protocols)["domain"].value<bool>())
                    cfg.protocols.domain = *domain;
            }

            if (auto signers = tbl["signers"].as_array())
            {
                for (const auto &node : *signers)
                {
                    auto entry = node.as_table();
                    if (!entry)
                        return std::unexpected(QuorumSigError::config("Each [[signers]] entry must be a table"));
                    SignerConfig signer;
                    auto url = (*entry)["url"].value<std::string>();
                    if (!url)
                        return std::unexpected(QuorumSigError::config("Signer entry is missing url"));
                    signer.url = *url;
                    if ((*entry)["index"])
                    {
                        auto index = table_unsigned<std::uint32_t>(*entry, "index", 0);
                        if (!index)
                            return std::unexpected(index.error());
                        signer.index = *index;
                    }
                    cfg.signers.push_back(std::move(signer));
                }
            }

            return cfg;
        }

    } // namespace

    KeyEpoch CombinerConfig::key_epoch() const
    {
        return KeyEpoch{keys.public_key, keys.version, keys.polynomial};
    }

    std::vector<SignerEndpoint> CombinerConfig::signer_endpoints() const
    {
        std::vector<SignerEndpoint> out;
        out.reserve(signers.size());
        for (std::size_t i = 0; i < signers.size(); ++i)
        {
            auto index = signers[i].index.value_or(static_cast<std::uint32_t>(i + 1));
            out.push_back(SignerEndpoint{signers[i].url, index});
        }
        return out;
    }

    Result<CombinerConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(QuorumSigError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<CombinerConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        Result<CombinerConfig> cfg = std::unexpected(QuorumSigError::config("empty"));
        try
        {
            auto tbl = toml::parse(toml_content);
            cfg = parse_toml(tbl);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(QuorumSigError::config(std::string("Failed to parse TOML: ") + e.what()));
        }
        if (!cfg)
            return cfg;

        if (auto env = apply_env_overrides(*cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(*cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(CombinerConfig &cfg)
    {
        if (const char *port = std::getenv("QUORUMSIG_PORT"))
        {
            auto v = parse_unsigned<std::uint16_t>("QUORUMSIG_PORT", port);
            if (!v)
                return std::unexpected(v.error());
            cfg.server.port = *v;
        }
        if (const char *threads = std::getenv("QUORUMSIG_THREADS"))
        {
            auto v = parse_unsigned<std::size_t>("QUORUMSIG_THREADS", threads);
            if (!v)
                return std::unexpected(v.error());
            cfg.server.threads = *v;
        }
        if (const char *version = std::getenv("QUORUMSIG_KEY_VERSION"))
        {
            auto v = parse_unsigned<std::uint32_t>("QUORUMSIG_KEY_VERSION", version);
            if (!v)
                return std::unexpected(v.error());
            cfg.keys.version = *v;
        }
        if (const char *pk = std::getenv("QUORUMSIG_PUBLIC_KEY"))
            cfg.keys.public_key = pk;
        if (const char *poly = std::getenv("QUORUMSIG_POLYNOMIAL"))
            cfg.keys.polynomial = poly;
        if (const char *q = std::getenv("QUORUMSIG_THRESHOLD"))
        {
            auto v = parse_unsigned<std::size_t>("QUORUMSIG_THRESHOLD", q);
            if (!v)
                return std::unexpected(v.error());
            cfg.quorum.threshold = *v;
        }
        if (const char *timeout = std::getenv("QUORUMSIG_TIMEOUT_MS"))
        {
            auto v = parse_unsigned<std::uint64_t>("QUORUMSIG_TIMEOUT_MS", timeout);
            if (!v)
                return std::unexpected(v.error());
            cfg.transport.timeout_ms = *v;
        }
        if (const char *level = std::getenv("QUORUMSIG_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    Result<void> ConfigLoader::validate(const CombinerConfig &cfg)
    {
        const auto n = cfg.signers.size();
        if (n == 0)
            return std::unexpected(QuorumSigError::config("At least one signer must be configured"));
        if (cfg.quorum.threshold < 1 || cfg.quorum.threshold > n)
            return std::unexpected(QuorumSigError::config(
                std::format("Threshold {} is outside [1, {}]", cfg.quorum.threshold, n)));

        std::set<std::uint32_t> seen;
        for (const auto &endpoint : cfg.signer_endpoints())
        {
            if (endpoint.url.empty())
                return std::unexpected(QuorumSigError::config("Signer url must not be empty"));
            if (endpoint.index < 1 || endpoint.index > n)
                return std::unexpected(QuorumSigError::config(
                    std::format("Signer index {} for {} is outside [1, {}]", endpoint.index, endpoint.url, n)));
            if (!seen.insert(endpoint.index).second)
                return std::unexpected(QuorumSigError::config(std::format("Duplicate signer index {}", endpoint.index)));
        }

        if (cfg.keys.public_key.empty() || cfg.keys.polynomial.empty())
            return std::unexpected(QuorumSigError::config("Key material (public_key, polynomial) is required"));
        if (!cfg.protocols.pnp && !cfg.protocols.domain)
            return std::unexpected(QuorumSigError::config("At least one protocol must be enabled"));
        if (cfg.server.threads == 0 || cfg.transport.threads == 0)
            return std::unexpected(QuorumSigError::config("Thread counts must be positive"));
        if (auto level = logging::parse_level(cfg.logging.level); !level)
            return std::unexpected(level.error());
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const CombinerConfig &cfg)
    {
        nlohmann::json j;
        j["server"] = {{"port", cfg.server.port}, {"threads", cfg.server.threads}, {"version", cfg.server.version}};
        j["keys"] = {{"public_key", cfg.keys.public_key}, {"version", cfg.keys.version}};
        j["quorum"] = {{"threshold", cfg.quorum.threshold}};
        j["transport"] = {{"timeout_ms", cfg.transport.timeout_ms}, {"threads", cfg.transport.threads}};
        j["logging"] = {{"level", cfg.logging.level}};
        j["protocols"] = {{"pnp", cfg.protocols.pnp}, {"domain", cfg.protocols.domain}};
        j["signers"] = nlohmann::json::array();
        for (const auto &endpoint : cfg.signer_endpoints())
            j["signers"].push_back({{"url", endpoint.url}, {"index", endpoint.index}});
        return j;
    }

} // namespace quorumsig
