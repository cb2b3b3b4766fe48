#pragma once

#include <dlpoll/dlpoll_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <cstdint>
#include <dlpoll/engine.hpp>
#include <dlpoll/output_template.hpp>
#include <dlpoll/progress_state.hpp>
#include <dlpoll/result.hpp>
#include <dlpoll/types.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace dlpoll {

namespace asio = boost::asio;

/// What to do with a submission while another job is still running.
enum class BusyPolicy : std::uint8_t {
	reject,		// fail with errc::job_in_progress
	supersede,	// cancel the running job; its final state is lost
};

DLPOLL_EXPORT std::optional<BusyPolicy> parse_busy_policy(
	std::string_view token);
DLPOLL_EXPORT std::string_view to_string(BusyPolicy policy);

struct DLPOLL_EXPORT JobRunnerOptions {
	BusyPolicy on_busy = BusyPolicy::reject;
	OutputConfig output;
};

/// JobRunner - owns the lifecycle of the single job slot.
///
/// State machine:
///   idle -> fetching_metadata -> downloading <-> postprocessing -> finished
/// with error reachable from every active state and cancelled reachable
/// through async_cancel() or a superseding submission.
///
/// All job state lives on an internal strand. Engine ticks are posted to that
/// strand, so the engine never waits on a lock and the strand is the only
/// writer of the ProgressState. Readers go through status() and never wait on
/// the job.
///
/// Example:
///   runner.async_submit(request, [](Result<JobTicket> r) {
///       if (r) spdlog::info("job {} started", r.value().job_id);
///   });
///   // later, from any thread
///   auto snap = runner.status();
class DLPOLL_EXPORT JobRunner {
   public:
	JobRunner(const JobRunner &) = delete;
	JobRunner &operator=(const JobRunner &) = delete;
	JobRunner(JobRunner &&) noexcept;
	JobRunner &operator=(JobRunner &&) noexcept;
	~JobRunner();

	JobRunner(asio::any_io_executor ex, std::shared_ptr<Engine> engine,
			  std::shared_ptr<ProgressState> state,
			  JobRunnerOptions options = {});

	[[nodiscard]] asio::any_io_executor get_executor() const;

	using CompletionExecutor = asio::any_completion_executor;

	/// Validate, fetch metadata and spawn the download. Completes as soon as
	/// the download has been started, never when it ends.
	/// Signature: void(Result<JobTicket>)
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<JobTicket>))
				  CompletionToken>
	auto async_submit(JobRequest request, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<JobTicket>)>(
			[this, ex, request = std::move(request)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<JobTicket>)>{
						std::forward<decltype(handler)>(handler)};

				async_submit_impl(std::move(request), std::move(any_handler),
								  std::move(handler_ex));
			},
			token);
	}

	/// Cancel the running job.
	/// Signature: void(Result<void>)
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<void>))
				  CompletionToken>
	auto async_cancel(CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<void>)>(
			[this, ex](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<void>)>{
						std::forward<decltype(handler)>(handler)};

				async_cancel_impl(std::move(any_handler),
								  std::move(handler_ex));
			},
			token);
	}

	/// Latest snapshot. Never blocks on the running job.
	[[nodiscard]] ProgressSnapshot status() const;

	[[nodiscard]] std::shared_ptr<const ProgressState> state() const;

   private:
	struct Impl;

	void async_submit_impl(
		JobRequest request,
		asio::any_completion_handler<void(Result<JobTicket>)> handler,
		CompletionExecutor handler_ex);

	void async_cancel_impl(
		asio::any_completion_handler<void(Result<void>)> handler,
		CompletionExecutor handler_ex);

	std::shared_ptr<Impl> m_impl;
};

}  // namespace dlpoll
