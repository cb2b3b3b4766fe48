#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/url/parse.hpp>
#include <dlpoll/event_normalizer.hpp>
#include <dlpoll/job_runner.hpp>
#include <dlpoll/playlist_aggregator.hpp>
#include <exception>
#include <system_error>
#include <utility>

namespace dlpoll {

std::optional<BusyPolicy> parse_busy_policy(std::string_view token) {
	if (token == "reject") return BusyPolicy::reject;
	if (token == "supersede") return BusyPolicy::supersede;
	return std::nullopt;
}

std::string_view to_string(BusyPolicy policy) {
	return policy == BusyPolicy::supersede ? "supersede" : "reject";
}

namespace {

Result<void> validate(const JobRequest &request) {
	if (request.url.empty()) return outcome::failure(errc::invalid_url);

	auto parsed = boost::urls::parse_uri(request.url);
	if (parsed.has_error()) return outcome::failure(errc::invalid_url);

	auto scheme = parsed.value().scheme_id();
	if (scheme != boost::urls::scheme::http &&
		scheme != boost::urls::scheme::https) {
		return outcome::failure(errc::invalid_url);
	}
	if (parsed.value().encoded_host().empty()) {
		return outcome::failure(errc::invalid_url);
	}

	if (!is_valid_quality(request.kind, request.quality)) {
		return outcome::failure(errc::invalid_quality);
	}
	return outcome::success();
}

template <typename T>
void complete(asio::any_completion_handler<void(Result<T>)> handler,
			  Engine::CompletionExecutor handler_ex, Result<T> res) {
	asio::dispatch(handler_ex, [handler = std::move(handler),
								res = std::move(res)]() mutable {
		handler(std::move(res));
	});
}

}  // namespace

// One submitted download. Only touched on the runner's strand.
struct Job {
	std::uint64_t id = 0;
	JobRequest request;
	JobStatus status = JobStatus::fetching_metadata;
	PlaylistAggregator aggregator;
	std::optional<std::string> title;
	std::optional<std::string> message;
	bool running = true;  // false once terminal; late ticks are dropped
};

struct JobRunner::Impl : std::enable_shared_from_this<JobRunner::Impl> {
	asio::strand<asio::any_io_executor> strand;
	std::shared_ptr<Engine> engine;
	std::shared_ptr<ProgressState> state;
	JobRunnerOptions options;
	EventNormalizer normalizer;

	std::unique_ptr<Job> job;
	std::uint64_t next_id{1};

	Impl(asio::any_io_executor ex, std::shared_ptr<Engine> e,
		 std::shared_ptr<ProgressState> s, JobRunnerOptions o)
		: strand(asio::make_strand(std::move(ex))),
		  engine(std::move(e)),
		  state(std::move(s)),
		  options(std::move(o)) {}

	[[nodiscard]] bool is_current(std::uint64_t id) const {
		return job && job->id == id && job->running;
	}

	void publish() {
		if (!job) return;
		auto p = job->aggregator.progress();

		ProgressSnapshot snap;
		snap.percent = p.percent;
		snap.current = p.current;
		snap.total = p.total;
		snap.title = job->title;
		snap.status = job->status;
		snap.message = job->message;
		snap.job_id = job->id;

		spdlog::trace("job {}: {} {:.1f}% ({}/{})", snap.job_id,
					  to_string(snap.status), snap.percent, snap.current,
					  snap.total);
		state->write(std::move(snap));
	}

	void finish(JobStatus status, std::optional<std::string> message) {
		job->running = false;
		job->status = status;
		job->message = std::move(message);
		publish();
	}

	// ---- submission ---------------------------------------------------------

	void submit(JobRequest request,
				asio::any_completion_handler<void(Result<JobTicket>)> handler,
				CompletionExecutor handler_ex) {
		if (auto valid = validate(request); valid.has_error()) {
			spdlog::warn("Rejected submission for '{}': {}", request.url,
						 valid.error().message());
			return complete<JobTicket>(std::move(handler),
									   std::move(handler_ex),
									   outcome::failure(valid.error()));
		}

		if (job && job->running) {
			if (options.on_busy == BusyPolicy::reject) {
				spdlog::info("Job {} still running, rejecting submission",
							 job->id);
				return complete<JobTicket>(
					std::move(handler), std::move(handler_ex),
					outcome::failure(errc::job_in_progress));
			}
			spdlog::info("Job {} superseded by a new submission", job->id);
			finish(JobStatus::cancelled, "Superseded by a new download");
			engine->cancel();
		}

		job = std::make_unique<Job>();
		job->id = next_id++;
		job->request = std::move(request);
		job->aggregator.start(1);
		publish();

		spdlog::info("Job {}: fetching info for {} ({} {})", job->id,
					 job->request.url, to_string(job->request.kind),
					 job->request.quality);

		auto id = job->id;
		engine->async_fetch_metadata(
			job->request.url,
			asio::bind_executor(
				strand, [self = shared_from_this(), id,
						 handler = std::move(handler),
						 handler_ex = std::move(handler_ex)](
							Result<MediaMetadata> res) mutable {
					self->on_metadata(id, std::move(res), std::move(handler),
									  std::move(handler_ex));
				}));
	}

	void on_metadata(
		std::uint64_t id, Result<MediaMetadata> res,
		asio::any_completion_handler<void(Result<JobTicket>)> handler,
		CompletionExecutor handler_ex) {
		if (!is_current(id)) {
			spdlog::debug("Job {}: metadata arrived after cancellation", id);
			return complete<JobTicket>(
				std::move(handler), std::move(handler_ex),
				outcome::failure(
					std::make_error_code(std::errc::operation_canceled)));
		}

		Result<JobTicket> outcome_res = outcome::failure(errc::unknown);
		try {
			outcome_res = start_download(std::move(res));
		} catch (const std::exception &e) {
			spdlog::error("Job {}: failed to start: {}", id, e.what());
			finish(JobStatus::error, fmt::format("Error: {}", e.what()));
			outcome_res = outcome::failure(errc::engine_failed);
		}
		complete<JobTicket>(std::move(handler), std::move(handler_ex),
							std::move(outcome_res));
	}

	Result<JobTicket> start_download(Result<MediaMetadata> res) {
		if (res.has_error()) {
			spdlog::warn("Job {}: could not fetch info: {}", job->id,
						 res.error().message());
			finish(JobStatus::error, fmt::format("Could not fetch info: {}",
												 res.error().message()));
			if (is_metadata_error(res.error())) {
				return outcome::failure(res.error());
			}
			return outcome::failure(errc::metadata_failed);
		}

		auto &meta = res.value();
		if (meta.item_count == 0) {
			finish(JobStatus::error, "Could not fetch info: no items found");
			return outcome::failure(errc::no_items);
		}

		job->aggregator.start(meta.item_count, std::move(meta.item_titles));
		job->title.reset();
		job->status = JobStatus::downloading;
		publish();

		DownloadRequest dl;
		dl.url = job->request.url;
		dl.kind = job->request.kind;
		dl.quality = job->request.quality;
		dl.output_template =
			output_template_for(job->request.kind, options.output);

		spdlog::info("Job {}: downloading {} item(s) of '{}' to {}", job->id,
					 job->aggregator.items_total(), meta.title,
					 dl.output_template);

		auto id = job->id;
		std::weak_ptr<Impl> weak = shared_from_this();
		auto sink = [weak, id](RawProgressEvent ev) {
			if (auto self = weak.lock()) {
				asio::post(self->strand, [self, id, ev = std::move(ev)]() {
					self->on_tick(id, ev);
				});
			}
		};

		engine->async_download(
			std::move(dl), std::move(sink),
			asio::bind_executor(strand,
								[self = shared_from_this(), id](Result<void> r) {
									self->on_download_done(id, r);
								}));

		return JobTicket{id, job->aggregator.items_total()};
	}

	// ---- background unit ----------------------------------------------------

	void on_tick(std::uint64_t id, const RawProgressEvent &ev) {
		if (!is_current(id)) return;

		try {
			apply_tick(ev);
		} catch (const std::exception &e) {
			spdlog::error("Job {}: progress handling failed: {}", id,
						  e.what());
			finish(JobStatus::error, fmt::format("Error: {}", e.what()));
		}
	}

	void apply_tick(const RawProgressEvent &ev) {
		auto norm = normalizer.normalize(ev);

		if (ev.title) {
			job->title = ev.title;
		} else if (auto t = job->aggregator.title_for(ev.item)) {
			job->title = std::move(t);
		}

		if (ev.postprocessor) {
			// Postprocessor ticks carry no byte counts; keep the item percent.
			if (norm.status == JobStatus::postprocessing) {
				if (job->status != JobStatus::postprocessing) {
					spdlog::debug("Job {}: postprocessing ({})", job->id,
								  *ev.postprocessor);
				}
				job->status = JobStatus::postprocessing;
			} else if (norm.status == JobStatus::finished) {
				job->status = JobStatus::downloading;
			}
			return publish();
		}

		switch (norm.status.value_or(job->status)) {
			case JobStatus::finished:
				job->aggregator.update_percent(norm.percent);
				if (job->aggregator.finish_item(ev.item)) {
					spdlog::info("Job {}: item {}/{} done{}", job->id,
								 job->aggregator.items_completed(),
								 job->aggregator.items_total(),
								 job->title ? ": " + *job->title : "");
				}
				// The job itself only finishes when the engine exits.
				job->status = JobStatus::downloading;
				job->message.reset();
				break;
			case JobStatus::error:
				spdlog::warn("Job {}: engine reported an error", job->id);
				job->status = JobStatus::error;
				job->message = "Download error reported by engine";
				break;
			default:
				job->aggregator.update_percent(norm.percent);
				job->status = JobStatus::downloading;
				job->message.reset();
				break;
		}
		publish();
	}

	void on_download_done(std::uint64_t id, const Result<void> &res) {
		if (!is_current(id)) {
			spdlog::debug("Job {}: engine finished after cancellation", id);
			return;
		}

		try {
			if (res) {
				job->aggregator.complete();
				spdlog::info("Job {}: download complete ({} item(s))", id,
							 job->aggregator.items_total());
				finish(JobStatus::finished, std::nullopt);
			} else if (res.error() == std::errc::operation_canceled) {
				spdlog::info("Job {}: aborted by engine", id);
				finish(JobStatus::cancelled, "Cancelled");
			} else {
				spdlog::error("Job {}: download failed: {}", id,
							  res.error().message());
				finish(JobStatus::error, fmt::format("Download failed: {}",
													 res.error().message()));
			}
		} catch (const std::exception &e) {
			spdlog::error("Job {}: completion handling failed: {}", id,
						  e.what());
			finish(JobStatus::error, fmt::format("Error: {}", e.what()));
		}
	}

	// ---- cancellation -------------------------------------------------------

	void cancel(asio::any_completion_handler<void(Result<void>)> handler,
				CompletionExecutor handler_ex) {
		if (!job || !job->running) {
			return complete<void>(std::move(handler), std::move(handler_ex),
								  outcome::failure(errc::no_active_job));
		}

		spdlog::info("Job {}: cancelled by request", job->id);
		finish(JobStatus::cancelled, "Cancelled");
		engine->cancel();
		complete<void>(std::move(handler), std::move(handler_ex),
					   outcome::success());
	}
};

JobRunner::JobRunner(asio::any_io_executor ex, std::shared_ptr<Engine> engine,
					 std::shared_ptr<ProgressState> state,
					 JobRunnerOptions options)
	: m_impl(std::make_shared<Impl>(std::move(ex), std::move(engine),
									std::move(state), std::move(options))) {}

JobRunner::~JobRunner() {
	if (m_impl) m_impl->engine->cancel();
}

JobRunner::JobRunner(JobRunner &&) noexcept = default;
JobRunner &JobRunner::operator=(JobRunner &&) noexcept = default;

asio::any_io_executor JobRunner::get_executor() const {
	return m_impl->strand.get_inner_executor();
}

ProgressSnapshot JobRunner::status() const { return m_impl->state->read(); }

std::shared_ptr<const ProgressState> JobRunner::state() const {
	return m_impl->state;
}

void JobRunner::async_submit_impl(
	JobRequest request,
	asio::any_completion_handler<void(Result<JobTicket>)> handler,
	CompletionExecutor handler_ex) {
	asio::post(m_impl->strand,
			   [impl = m_impl, request = std::move(request),
				handler = std::move(handler),
				handler_ex = std::move(handler_ex)]() mutable {
				   impl->submit(std::move(request), std::move(handler),
								std::move(handler_ex));
			   });
}

void JobRunner::async_cancel_impl(
	asio::any_completion_handler<void(Result<void>)> handler,
	CompletionExecutor handler_ex) {
	asio::post(m_impl->strand,
			   [impl = m_impl, handler = std::move(handler),
				handler_ex = std::move(handler_ex)]() mutable {
				   impl->cancel(std::move(handler), std::move(handler_ex));
			   });
}

}  // namespace dlpoll
