#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <chrono>
#include <dlpoll/job_runner.hpp>
#include <dlpoll/status_endpoint.hpp>
#include <dlpoll/ytdlp_engine.hpp>
#include <functional>
#include <iomanip>
#include <iostream>

using namespace dlpoll;

// Runs one job in-process and polls it the way an HTTP client would.
int main(int argc, char *argv[]) {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("dlpoll", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::info);

	JobRequest request;
	request.url = argc > 1 ? argv[1]
						   : "https://www.youtube.com/watch?v=F0tYP4OQ0-k";
	if (argc > 2) {
		auto kind = parse_download_kind(argv[2]);
		if (!kind) {
			std::cerr << "Usage: poll_download <url> [video|audio]\n";
			return 1;
		}
		request.kind = *kind;
	}
	request.quality = default_quality(request.kind);

	boost::asio::io_context ioc;
	auto work_guard = boost::asio::make_work_guard(ioc);
	boost::asio::thread_pool job_pool{1};

	// Components
	auto state = std::make_shared<ProgressState>();
	auto engine = std::make_shared<YtDlpEngine>(job_pool.get_executor());
	JobRunner runner(job_pool.get_executor(), engine, state);
	StatusEndpoint status(state);

	boost::asio::steady_timer timer(ioc);
	std::function<void()> poll = [&]() {
		timer.expires_after(std::chrono::milliseconds(500));
		timer.async_wait([&](boost::system::error_code ec) {
			if (ec) return;
			auto snap = runner.status();
			std::cout << "\r" << to_string(snap.status) << ": " << std::fixed
					  << std::setprecision(1) << snap.percent << "% ("
					  << snap.current << "/" << snap.total << ") "
					  << snap.title.value_or("") << "   " << std::flush;
			if (is_terminal(snap.status)) {
				std::cout << "\n" << status.poll().dump(2) << "\n";
				work_guard.reset();
				return;
			}
			poll();
		});
	};

	std::cout << "Submitting " << request.url << "...\n";
	runner.async_submit(
		request, boost::asio::bind_executor(ioc, [&](Result<JobTicket> res) {
			if (res.has_error()) {
				std::cerr << "Submission failed: " << res.error().message()
						  << "\n";
				work_guard.reset();
				return;
			}
			std::cout << "Job " << res.value().job_id << " started with "
					  << res.value().items_total << " item(s)\n";
			poll();
		}));

	ioc.run();
	job_pool.join();
	return 0;
}
