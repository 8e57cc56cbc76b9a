#include "quorumsig/cli.hpp"
#include "quorumsig/config.hpp"
#include "quorumsig/error_aggregator.hpp"
#include "quorumsig/event_log.hpp"
#include "quorumsig/service.hpp"
#include "quorumsig/web_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace quorumsig::cli
{
	namespace
	{
		Result<CombinerConfig> load_config(const std::string &path)
		{
			auto cfg = ConfigLoader::load(path);
			if (!cfg)
				return cfg;
			if (auto logged = logging::configure(cfg->logging.level); !logged)
				return std::unexpected(logged.error());
			return cfg;
		}
	}

	int run(int argc, char *argv[])
	{
		CLI::App app{"quorumsig threshold signature combiner"};
		app.require_subcommand(1);

		std::string config_path;

		auto serve_cmd = app.add_subcommand("serve", "Run the combiner HTTP server");
		serve_cmd->add_option("--config", config_path, "Path to config TOML")->required();

		auto cfg_cmd = app.add_subcommand("config-print", "Load, validate and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		std::string request_path;
		bool domain{false};
		std::string key_version;
		auto combine_cmd = app.add_subcommand("combine", "Run one combination against the configured signers");
		combine_cmd->add_option("--config", config_path, "Path to config TOML")->required();
		combine_cmd->add_option("--request", request_path, "Path to the client request JSON")->required();
		combine_cmd->add_flag("--domain", domain, "Use the domain signing protocol instead of PNP");
		combine_cmd->add_option("--key-version", key_version, "keyVersion header to send with the request");

		CLI11_PARSE(app, argc, argv);

		if (*cfg_cmd)
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			auto cfg = load_config(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}
			auto service = Service::create(*cfg);
			if (!service)
			{
				std::cerr << service.error().what() << std::endl;
				return 1;
			}
			WebServer server(service->web_server_config(*cfg));
			try
			{
				server.run();
			}
			catch (const std::exception &e)
			{
				spdlog::critical("Server failed: {}", e.what());
				return 1;
			}
			return 0;
		}

		if (*combine_cmd)
		{
			auto cfg = load_config(config_path);
			if (!cfg)
			{
				std::cerr << cfg.error().what() << std::endl;
				return 1;
			}

			std::ifstream f(request_path);
			if (!f.is_open())
			{
				std::cerr << "Unable to open request file" << std::endl;
				return 1;
			}
			std::stringstream body;
			body << f.rdbuf();

			auto service = Service::create(*cfg);
			if (!service)
			{
				std::cerr << service.error().what() << std::endl;
				return 1;
			}

			std::optional<std::string> declared;
			if (!key_version.empty())
				declared = key_version;

			CombineOutcome outcome;
			auto request = SigningRequest::parse(body.str(), declared);
			if (!request)
			{
				outcome = CombineOutcome::failure(CombinerState::Rejected, 400, std::string(client_error::INVALID_INPUT));
			}
			else if (domain)
			{
				if (!service->domain)
				{
					std::cerr << "Domain protocol is disabled" << std::endl;
					return 1;
				}
				outcome = service->domain->handle_sync(std::move(*request));
			}
			else
			{
				if (!service->pnp)
				{
					std::cerr << "PNP protocol is disabled" << std::endl;
					return 1;
				}
				outcome = service->pnp->handle_sync(std::move(*request));
			}

			std::cout << outcome.to_json(cfg->server.version).dump(2) << std::endl;
			return outcome.ok() ? 0 : 2;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace quorumsig::cli
