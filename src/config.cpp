#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <dlpoll/config.hpp>
#include <fstream>
#include <sstream>
#include <vector>

namespace po = boost::program_options;

namespace dlpoll {

namespace {

po::options_description make_description() {
	ServiceConfig defaults;

	po::options_description generic("General");
	// clang-format off
	generic.add_options()
		("help,h", "Print help message")
		("config,c", po::value<std::string>(),
		 "Read options from an INI file (command line wins)")
		("verbose,v", "Shorthand for --log-level debug");

	po::options_description service("Service");
	service.add_options()
		("listen", po::value<std::string>()->default_value(defaults.listen),
		 "Address to listen on")
		("port,p", po::value<unsigned short>()->default_value(defaults.port),
		 "TCP port")
		("threads", po::value<int>()->default_value(defaults.threads),
		 "HTTP worker threads")
		("on-busy", po::value<std::string>()->default_value("reject"),
		 "Submission while a job runs: reject or supersede")
		("log-level", po::value<std::string>()->default_value("info"),
		 "trace, debug, info, warn, error, critical or off");

	po::options_description output("Output");
	output.add_options()
		("video-dir", po::value<std::string>()->default_value(
			 defaults.output.video_dir),
		 "Destination for video downloads")
		("audio-dir", po::value<std::string>()->default_value(
			 defaults.output.audio_dir),
		 "Destination for audio downloads")
		("file-template", po::value<std::string>()->default_value(
			 defaults.output.file_template),
		 "Engine output template inside the destination directory");

	po::options_description engine("Engine");
	engine.add_options()
		("ytdlp", po::value<std::string>()->default_value(
			 defaults.engine.executable),
		 "yt-dlp executable (name on PATH or path)")
		("engine-arg", po::value<std::vector<std::string>>()->composing(),
		 "Extra argument passed to yt-dlp (repeatable)")
		("socket-timeout", po::value<int>()->default_value(
			 defaults.engine.socket_timeout),
		 "Engine socket timeout in seconds");
	// clang-format on

	po::options_description all("Options");
	all.add(generic).add(service).add(output).add(engine);
	return all;
}

Result<ServiceConfig> to_config(const po::variables_map &vm) {
	ServiceConfig cfg;
	cfg.listen = vm["listen"].as<std::string>();
	cfg.port = vm["port"].as<unsigned short>();
	cfg.threads = vm["threads"].as<int>();
	cfg.output.video_dir = vm["video-dir"].as<std::string>();
	cfg.output.audio_dir = vm["audio-dir"].as<std::string>();
	cfg.output.file_template = vm["file-template"].as<std::string>();
	cfg.engine.executable = vm["ytdlp"].as<std::string>();
	cfg.engine.socket_timeout = vm["socket-timeout"].as<int>();
	if (vm.count("engine-arg")) {
		cfg.engine.extra_args = vm["engine-arg"].as<std::vector<std::string>>();
	}

	if (cfg.port == 0) {
		spdlog::error("port must be between 1 and 65535");
		return outcome::failure(errc::invalid_config);
	}
	if (cfg.threads < 1) {
		spdlog::error("threads must be at least 1");
		return outcome::failure(errc::invalid_config);
	}
	if (cfg.engine.socket_timeout < 1) {
		spdlog::error("socket-timeout must be at least 1 second");
		return outcome::failure(errc::invalid_config);
	}
	if (cfg.engine.executable.empty()) {
		spdlog::error("ytdlp must not be empty");
		return outcome::failure(errc::invalid_config);
	}
	if (cfg.output.file_template.empty()) {
		spdlog::error("file-template must not be empty");
		return outcome::failure(errc::invalid_config);
	}

	auto policy = parse_busy_policy(vm["on-busy"].as<std::string>());
	if (!policy) {
		spdlog::error("on-busy must be 'reject' or 'supersede', got '{}'",
					  vm["on-busy"].as<std::string>());
		return outcome::failure(errc::invalid_config);
	}
	cfg.on_busy = *policy;

	auto level = parse_log_level(vm["log-level"].as<std::string>());
	if (!level) {
		spdlog::error("Unknown log-level '{}'",
					  vm["log-level"].as<std::string>());
		return outcome::failure(errc::invalid_config);
	}
	cfg.log_level = *level;
	if (vm.count("verbose") && cfg.log_level > spdlog::level::debug) {
		cfg.log_level = spdlog::level::debug;
	}
	return cfg;
}

}  // namespace

std::optional<spdlog::level::level_enum> parse_log_level(
	std::string_view token) {
	if (token == "trace") return spdlog::level::trace;
	if (token == "debug") return spdlog::level::debug;
	if (token == "info") return spdlog::level::info;
	if (token == "warn" || token == "warning") return spdlog::level::warn;
	if (token == "error") return spdlog::level::err;
	if (token == "critical") return spdlog::level::critical;
	if (token == "off") return spdlog::level::off;
	return std::nullopt;
}

std::string usage() {
	std::ostringstream out;
	out << "Usage: dlpoll-server [options]\n" << make_description();
	return out.str();
}

Result<CommandLine> parse_command_line(int argc, const char *const argv[]) {
	auto desc = make_description();
	CommandLine result;

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);

		if (vm.count("config")) {
			auto path = vm["config"].as<std::string>();
			std::ifstream ifs(path);
			if (!ifs) {
				spdlog::error("Cannot open config file '{}'", path);
				return outcome::failure(errc::invalid_config);
			}
			// Values already stored from the command line are kept
			po::store(po::parse_config_file(ifs, desc), vm);
			result.config_file = path;
		}
		po::notify(vm);
	} catch (const po::error &e) {
		spdlog::error("{}", e.what());
		return outcome::failure(errc::invalid_config);
	}

	if (vm.count("help")) {
		result.show_help = true;
		return result;
	}

	auto cfg = to_config(vm);
	if (cfg.has_error()) return outcome::failure(cfg.error());
	result.config = std::move(cfg).value();
	return result;
}

}  // namespace dlpoll
