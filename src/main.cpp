#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>
#include <dlpoll/config.hpp>
#include <dlpoll/job_runner.hpp>
#include <dlpoll/progress_state.hpp>
#include <dlpoll/status_endpoint.hpp>
#include <dlpoll/ytdlp_engine.hpp>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "server/api_handler.hpp"
#include "server/http_server.hpp"

namespace asio = boost::asio;

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

		auto cmdline = dlpoll::parse_command_line(argc, argv);
		if (cmdline.has_error()) {
			fmt::print(stderr, "{}\n", dlpoll::usage());
			return 2;
		}
		if (cmdline.value().show_help) {
			std::cout << dlpoll::usage() << "\n";
			return 0;
		}

		const auto &cfg = cmdline.value().config;
		spdlog::set_level(cfg.log_level);
		if (cmdline.value().config_file) {
			spdlog::info("Loaded {}", *cmdline.value().config_file);
		}

		// The background execution unit: one thread hosts the job strand and
		// the engine's pipe I/O.
		asio::thread_pool job_pool{1};

		auto state = std::make_shared<dlpoll::ProgressState>();
		auto engine = std::make_shared<dlpoll::YtDlpEngine>(
			job_pool.get_executor(), cfg.engine);

		dlpoll::JobRunnerOptions runner_opts;
		runner_opts.on_busy = cfg.on_busy;
		runner_opts.output = cfg.output;
		auto runner = std::make_shared<dlpoll::JobRunner>(
			job_pool.get_executor(), engine, state, runner_opts);

		auto api = std::make_shared<dlpoll::server::ApiHandler>(
			runner, dlpoll::StatusEndpoint(state));

		asio::io_context ioc{cfg.threads};
		auto address = asio::ip::make_address(cfg.listen);
		dlpoll::server::HttpServer server(
			ioc, dlpoll::server::tcp::endpoint(address, cfg.port), api);
		server.run();

		spdlog::info("dlpoll listening on http://{}:{} (yt-dlp: {}, on-busy: {})",
					 cfg.listen, cfg.port, cfg.engine.executable,
					 dlpoll::to_string(cfg.on_busy));
		spdlog::info("Video -> {}, audio -> {}",
					 dlpoll::destination_for(dlpoll::DownloadKind::video,
											 cfg.output)
						 .string(),
					 dlpoll::destination_for(dlpoll::DownloadKind::audio,
											 cfg.output)
						 .string());

		// Setup signal handling using asio::signal_set
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				spdlog::info("Received signal {}, shutting down", sig);
				server.stop();
				runner->async_cancel([](dlpoll::Result<void> res) {
					if (res) spdlog::info("Running download cancelled");
				});
				ioc.stop();
			}
		});

		std::vector<std::thread> workers;
		workers.reserve(cfg.threads - 1);
		for (int i = 1; i < cfg.threads; ++i) {
			workers.emplace_back([&ioc] { ioc.run(); });
		}
		ioc.run();
		for (auto &t : workers) t.join();

		// Abandon a metadata fetch still in flight; child processes are
		// terminated with their sessions.
		job_pool.stop();
		job_pool.join();
		return 0;

	} catch (const std::exception &e) {
		spdlog::error("{}", e.what());
		return 1;
	}
}
