#include <spdlog/spdlog.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <deque>
#include <dlpoll/ytdlp_engine.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

#include "engine/ytdlp_command.hpp"

namespace bp = boost::process::v2;

namespace dlpoll {

namespace {

constexpr std::size_t kStderrTailLines = 20;

struct ProcessOutcome {
	int exit_code = 0;
	bool cancelled = false;
	std::string captured_stdout;
	std::deque<std::string> stderr_tail;
};

// Session class for one yt-dlp child process: owns the process and both pipes
// and finishes once the process exited and both pipes hit EOF.
class ProcessSession : public std::enable_shared_from_this<ProcessSession> {
   public:
	using LineHandler = std::function<void(RawProgressEvent)>;
	using DoneHandler = std::function<void(Result<ProcessOutcome>)>;

	ProcessSession(asio::any_io_executor ex, bool capture_stdout,
				   LineHandler on_line, DoneHandler on_done)
		: ex_(ex),
		  out_(ex),
		  err_(ex),
		  capture_stdout_(capture_stdout),
		  on_line_(std::move(on_line)),
		  on_done_(std::move(on_done)) {}

	void start(const std::string &executable,
			   const std::vector<std::string> &args) {
		if (cancelled_) {
			ProcessOutcome res;
			res.cancelled = true;
			return finish(std::move(res));
		}

		auto exe = resolve(executable);
		if (exe.empty()) {
			spdlog::error("yt-dlp executable '{}' not found", executable);
			return finish(outcome::failure(errc::engine_unavailable));
		}

		spdlog::debug("Running: {}", ytdlp::join_command(exe.string(), args));

		try {
			proc_.emplace(ex_, exe, args, bp::process_stdio{nullptr, out_, err_});
		} catch (const boost::system::system_error &e) {
			spdlog::error("Failed to start {}: {}", exe.string(), e.what());
			return finish(outcome::failure(errc::engine_unavailable));
		}

		pending_ = 3;
		read_stdout();
		read_stderr();
		proc_->async_wait([self = shared_from_this()](
							  boost::system::error_code ec, int exit_code) {
			if (ec) {
				spdlog::debug("wait for yt-dlp failed: {}", ec.message());
				self->exit_code_ = -1;
			} else {
				self->exit_code_ = exit_code;
			}
			self->on_part_done();
		});
	}

	/// Terminate the child. Thread-safe.
	void cancel() {
		asio::post(ex_, [self = shared_from_this()]() {
			if (self->done_ || self->cancelled_) return;
			self->cancelled_ = true;

			boost::system::error_code ec;
			if (self->proc_ && self->proc_->running(ec)) {
				spdlog::info("Terminating yt-dlp (pid {})", self->proc_->id());
				self->proc_->terminate(ec);
				if (ec) {
					spdlog::warn("terminate failed: {}", ec.message());
				}
			}
			// Grandchildren (ffmpeg) may keep the pipes open
			self->out_.close(ec);
			self->err_.close(ec);
		});
	}

   private:
	static bp::filesystem::path resolve(const std::string &executable) {
		if (executable.find('/') != std::string::npos) {
			return bp::filesystem::path(executable);
		}
		return bp::environment::find_executable(executable);
	}

	void read_stdout() {
		asio::async_read_until(
			out_, asio::dynamic_buffer(out_buf_), '\n',
			[self = shared_from_this()](boost::system::error_code ec,
										std::size_t n) {
				if (ec) {
					self->flush_partial(self->out_buf_, false);
					return self->on_part_done();
				}
				std::string line = self->out_buf_.substr(0, n);
				self->out_buf_.erase(0, n);
				self->handle_line(line, false);
				self->read_stdout();
			});
	}

	void read_stderr() {
		asio::async_read_until(
			err_, asio::dynamic_buffer(err_buf_), '\n',
			[self = shared_from_this()](boost::system::error_code ec,
										std::size_t n) {
				if (ec) {
					self->flush_partial(self->err_buf_, true);
					return self->on_part_done();
				}
				std::string line = self->err_buf_.substr(0, n);
				self->err_buf_.erase(0, n);
				self->handle_line(line, true);
				self->read_stderr();
			});
	}

	void flush_partial(std::string &buf, bool from_stderr) {
		if (!buf.empty()) handle_line(buf, from_stderr);
		buf.clear();
	}

	// yt-dlp prints progress on stderr when --quiet is set, so both streams
	// are offered to the line handler first.
	void handle_line(std::string_view line, bool from_stderr) {
		if (!from_stderr && capture_stdout_) {
			captured_.append(line);
			return;
		}
		if (on_line_) {
			if (auto ev = ytdlp::parse_progress_line(line)) {
				on_line_(std::move(*ev));
				return;
			}
		}

		while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
			line.remove_suffix(1);
		}
		if (line.empty()) return;
		spdlog::trace("yt-dlp: {}", line);
		if (from_stderr) {
			stderr_tail_.emplace_back(line);
			if (stderr_tail_.size() > kStderrTailLines) {
				stderr_tail_.pop_front();
			}
		}
	}

	void on_part_done() {
		if (--pending_ > 0) return;

		ProcessOutcome res;
		res.exit_code = exit_code_;
		res.cancelled = cancelled_;
		res.captured_stdout = std::move(captured_);
		res.stderr_tail = std::move(stderr_tail_);
		finish(std::move(res));
	}

	void finish(Result<ProcessOutcome> res) {
		done_ = true;
		if (on_done_) {
			auto cb = std::move(on_done_);
			cb(std::move(res));
		}
	}

	asio::any_io_executor ex_;
	asio::readable_pipe out_;
	asio::readable_pipe err_;
	std::optional<bp::process> proc_;
	bool capture_stdout_;
	LineHandler on_line_;
	DoneHandler on_done_;

	std::string out_buf_;
	std::string err_buf_;
	std::string captured_;
	std::deque<std::string> stderr_tail_;
	int pending_ = 0;
	int exit_code_ = 0;
	bool cancelled_ = false;
	bool done_ = false;
};

void log_stderr_tail(const std::deque<std::string> &tail) {
	for (const auto &line : tail) spdlog::warn("yt-dlp: {}", line);
}

}  // namespace

struct YtDlpEngine::Impl {
	asio::any_io_executor ex;
	YtDlpOptions options;

	// The live child, metadata dump or download. A new run replaces it.
	std::mutex mutex;
	std::weak_ptr<ProcessSession> active;

	Impl(asio::any_io_executor e, YtDlpOptions o)
		: ex(std::move(e)), options(std::move(o)) {}

	void track(const std::shared_ptr<ProcessSession> &session) {
		std::lock_guard<std::mutex> lock(mutex);
		active = session;
	}
};

YtDlpEngine::YtDlpEngine(asio::any_io_executor ex, YtDlpOptions options)
	: m_impl(std::make_shared<Impl>(std::move(ex), std::move(options))) {}

YtDlpEngine::~YtDlpEngine() { cancel(); }

asio::any_io_executor YtDlpEngine::get_executor() const { return m_impl->ex; }

const YtDlpOptions &YtDlpEngine::options() const { return m_impl->options; }

void YtDlpEngine::cancel() {
	std::shared_ptr<ProcessSession> session;
	{
		std::lock_guard<std::mutex> lock(m_impl->mutex);
		session = m_impl->active.lock();
	}
	if (session) session->cancel();
}

void YtDlpEngine::async_fetch_metadata_impl(
	std::string url,
	asio::any_completion_handler<void(Result<MediaMetadata>)> handler,
	CompletionExecutor handler_ex) {
	auto on_done = [url, handler = std::make_shared<decltype(handler)>(
							 std::move(handler)),
					handler_ex](Result<ProcessOutcome> res) mutable {
		auto post_result = [&](Result<MediaMetadata> r) {
			asio::dispatch(handler_ex, [h = std::move(*handler),
										r = std::move(r)]() mutable {
				h(std::move(r));
			});
		};

		if (res.has_error()) return post_result(outcome::failure(res.error()));

		auto &out = res.value();
		if (out.cancelled) {
			return post_result(outcome::failure(
				std::make_error_code(std::errc::operation_canceled)));
		}
		if (out.exit_code != 0) {
			spdlog::warn("yt-dlp could not resolve {} (exit code {})", url,
						 out.exit_code);
			log_stderr_tail(out.stderr_tail);
			return post_result(outcome::failure(errc::metadata_failed));
		}
		post_result(ytdlp::parse_metadata(out.captured_stdout));
	};

	auto session = std::make_shared<ProcessSession>(
		m_impl->ex, true, nullptr, std::move(on_done));
	m_impl->track(session);

	asio::post(m_impl->ex, [session, exe = m_impl->options.executable,
							args = ytdlp::metadata_args(
								url, m_impl->options)]() {
		session->start(exe, args);
	});
}

void YtDlpEngine::async_download_impl(
	DownloadRequest request, ProgressSink sink,
	asio::any_completion_handler<void(Result<void>)> handler,
	CompletionExecutor handler_ex) {
	auto on_line = [sink = std::move(sink)](RawProgressEvent ev) {
		if (sink) sink(std::move(ev));
	};

	auto on_done = [handler = std::make_shared<decltype(handler)>(
						std::move(handler)),
					handler_ex](Result<ProcessOutcome> res) mutable {
		auto post_result = [&](Result<void> r) {
			asio::dispatch(handler_ex, [h = std::move(*handler),
										r = std::move(r)]() mutable {
				h(std::move(r));
			});
		};

		if (res.has_error()) return post_result(outcome::failure(res.error()));

		auto &out = res.value();
		if (out.cancelled) {
			return post_result(outcome::failure(
				std::make_error_code(std::errc::operation_canceled)));
		}
		if (out.exit_code != 0) {
			spdlog::warn("yt-dlp exited with code {}", out.exit_code);
			log_stderr_tail(out.stderr_tail);
			return post_result(outcome::failure(errc::engine_failed));
		}
		post_result(outcome::success());
	};

	auto session = std::make_shared<ProcessSession>(
		m_impl->ex, false, std::move(on_line), std::move(on_done));
	m_impl->track(session);

	spdlog::info("Starting yt-dlp for {}", request.url);
	asio::post(m_impl->ex, [session, exe = m_impl->options.executable,
							args = ytdlp::download_args(request,
														m_impl->options)]() {
		session->start(exe, args);
	});
}

}  // namespace dlpoll
