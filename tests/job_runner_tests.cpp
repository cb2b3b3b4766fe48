#include <boost/asio/io_context.hpp>
#include <catch2/catch_all.hpp>
#include <dlpoll/job_runner.hpp>
#include <optional>

#include "fake_engine.hpp"

using namespace dlpoll;
using dlpoll::testing::FakeEngine;
using Catch::Approx;

namespace {

RawProgressEvent tick(std::string status, std::optional<std::string> percent,
					  std::optional<std::size_t> index = std::nullopt,
					  std::optional<std::string> title = std::nullopt) {
	RawProgressEvent ev;
	ev.status = std::move(status);
	ev.percent_str = std::move(percent);
	ev.item.playlist_index = index;
	ev.title = std::move(title);
	return ev;
}

RawProgressEvent pp_tick(std::string status, std::size_t index = 1) {
	RawProgressEvent ev;
	ev.status = std::move(status);
	ev.postprocessor = "FFmpegExtractAudio";
	ev.item.playlist_index = index;
	return ev;
}

JobRequest video(std::string url = "https://www.youtube.com/watch?v=abc") {
	JobRequest req;
	req.url = std::move(url);
	req.kind = DownloadKind::video;
	req.quality = 720;
	return req;
}

struct RunnerFixture {
	boost::asio::io_context ioc;
	std::shared_ptr<FakeEngine> engine =
		std::make_shared<FakeEngine>(ioc.get_executor());
	std::shared_ptr<ProgressState> state = std::make_shared<ProgressState>();
	std::optional<JobRunner> runner;

	explicit RunnerFixture(JobRunnerOptions opts = {}) {
		runner.emplace(ioc.get_executor(), engine, state, std::move(opts));
	}

	void drain() {
		ioc.restart();
		ioc.run();
	}

	Result<JobTicket> submit(JobRequest req) {
		std::optional<Result<JobTicket>> out;
		runner->async_submit(std::move(req),
							 [&](Result<JobTicket> r) { out.emplace(std::move(r)); });
		drain();
		REQUIRE(out.has_value());
		return std::move(*out);
	}

	Result<void> cancel() {
		std::optional<Result<void>> out;
		runner->async_cancel([&](Result<void> r) { out.emplace(std::move(r)); });
		drain();
		REQUIRE(out.has_value());
		return std::move(*out);
	}

	void emit(RawProgressEvent ev) {
		engine->emit(std::move(ev));
		drain();
	}

	void finish(Result<void> res = outcome::success()) {
		engine->finish_download(std::move(res));
		drain();
	}

	ProgressSnapshot snap() const { return runner->status(); }
};

}  // namespace

TEST_CASE("JobRunner single video", "[runner]") {
	JobRunnerOptions opts;
	opts.output.video_dir = "/srv/media/video";
	RunnerFixture f(opts);

	CHECK(f.snap().status == JobStatus::idle);

	auto ticket = f.submit(video());
	REQUIRE(ticket.has_value());
	CHECK(ticket.value().job_id == 1);
	CHECK(ticket.value().items_total == 1);

	REQUIRE(f.engine->downloads.size() == 1);
	CHECK(f.engine->downloads[0].output_template ==
		  "/srv/media/video/%(title)s.%(ext)s");
	CHECK(f.engine->downloads[0].quality == 720);

	auto s = f.snap();
	CHECK(s.status == JobStatus::downloading);
	CHECK(s.current == 0);
	CHECK(s.total == 1);
	CHECK(s.percent == 0.0);

	for (const char *p : {"10.0%", "50.0%", "100.0%"}) {
		f.emit(tick("downloading", std::string(p), std::nullopt, "Clip"));
		CHECK(f.snap().status == JobStatus::downloading);
	}
	CHECK(f.snap().percent == Approx(100.0));
	CHECK(f.snap().title == "Clip");

	f.emit(tick("finished", std::nullopt));
	s = f.snap();
	CHECK(s.current == 1);
	CHECK(s.status == JobStatus::downloading);

	f.finish();
	s = f.snap();
	CHECK(s.status == JobStatus::finished);
	CHECK(s.percent == 100.0);
	CHECK(s.current == 1);
	CHECK(s.total == 1);
	CHECK(s.job_id == 1);
	CHECK_FALSE(s.message.has_value());
}

TEST_CASE("JobRunner publishes fetching_metadata on submit", "[runner]") {
	RunnerFixture f;
	std::optional<Result<JobTicket>> out;
	f.runner->async_submit(video(),
						   [&](Result<JobTicket> r) { out.emplace(std::move(r)); });

	// Run only the submission itself; the metadata answer is still queued
	f.ioc.restart();
	f.ioc.run_one();

	auto s = f.snap();
	CHECK(s.status == JobStatus::fetching_metadata);
	CHECK(s.percent == 0.0);
	CHECK(s.current == 0);
	CHECK(s.total == 1);
	CHECK_FALSE(s.title.has_value());
	CHECK_FALSE(out.has_value());

	f.drain();
	REQUIRE(out.has_value());
	CHECK(out->has_value());
}

TEST_CASE("JobRunner playlist of three items", "[runner]") {
	RunnerFixture f;
	f.engine->metadata =
		MediaMetadata{"Mix", true, 3, {"Alpha", "Beta", "Gamma"}};

	auto ticket = f.submit(video("https://www.youtube.com/playlist?list=PL1"));
	REQUIRE(ticket.has_value());
	CHECK(ticket.value().items_total == 3);

	f.emit(tick("downloading", "50.0%", 1));
	auto s = f.snap();
	CHECK(s.current == 0);
	CHECK(s.total == 3);
	CHECK(s.percent == Approx(50.0));
	CHECK(s.title == "Alpha");

	f.emit(tick("finished", std::nullopt, 1));
	CHECK(f.snap().current == 1);

	// Per-item percent, not a blended figure
	f.emit(tick("downloading", "30.0%", 2));
	s = f.snap();
	CHECK(s.current == 1);
	CHECK(s.total == 3);
	CHECK(s.percent == Approx(30.0));
	CHECK(s.title == "Beta");

	f.emit(tick("finished", std::nullopt, 2));
	f.emit(tick("downloading", "75.0%", 3));
	f.emit(tick("finished", std::nullopt, 3));
	s = f.snap();
	CHECK(s.current == 3);
	CHECK(s.status == JobStatus::downloading);

	f.finish();
	s = f.snap();
	CHECK(s.status == JobStatus::finished);
	CHECK(s.current == 3);
	CHECK(s.total == 3);
	CHECK(s.percent == 100.0);
}

TEST_CASE("JobRunner counts duplicate finished ticks once", "[runner]") {
	RunnerFixture f;
	f.engine->metadata = MediaMetadata{"Mix", true, 2, {}};
	REQUIRE(f.submit(video()).has_value());

	// Merged formats report one finished tick per stream
	f.emit(tick("finished", std::nullopt, 1));
	f.emit(tick("finished", std::nullopt, 1));
	CHECK(f.snap().current == 1);
}

TEST_CASE("JobRunner reconciles missing finished ticks", "[runner]") {
	RunnerFixture f;
	f.engine->metadata = MediaMetadata{"Mix", true, 3, {}};
	REQUIRE(f.submit(video()).has_value());

	f.emit(tick("finished", std::nullopt, 1));
	f.finish();

	auto s = f.snap();
	CHECK(s.status == JobStatus::finished);
	CHECK(s.current == 3);
}

TEST_CASE("JobRunner postprocessing", "[runner]") {
	RunnerFixture f;
	JobRequest req = video();
	req.kind = DownloadKind::audio;
	req.quality = 320;
	REQUIRE(f.submit(req).has_value());

	f.emit(tick("downloading", "100%"));
	f.emit(tick("finished", std::nullopt));
	f.emit(pp_tick("started"));
	auto s = f.snap();
	CHECK(s.status == JobStatus::postprocessing);
	CHECK(s.percent == 100.0);

	f.emit(pp_tick("processing"));
	CHECK(f.snap().status == JobStatus::postprocessing);

	f.emit(pp_tick("finished"));
	CHECK(f.snap().status == JobStatus::downloading);

	f.finish();
	CHECK(f.snap().status == JobStatus::finished);
}

TEST_CASE("JobRunner fatal engine error", "[runner]") {
	RunnerFixture f;
	auto ticket = f.submit(video());
	REQUIRE(ticket.has_value());

	f.emit(tick("downloading", "12.0%"));
	f.finish(outcome::failure(errc::engine_failed));

	auto s = f.snap();
	CHECK(s.status == JobStatus::error);
	REQUIRE(s.message.has_value());
	CHECK(s.message->find("Download failed") != std::string::npos);

	// Stays in error; late ticks are dropped
	f.emit(tick("downloading", "99.0%"));
	CHECK(f.snap() == s);
	CHECK(f.snap() == s);
}

TEST_CASE("JobRunner error tick does not end the job", "[runner]") {
	RunnerFixture f;
	REQUIRE(f.submit(video()).has_value());

	f.emit(tick("error", std::nullopt));
	CHECK(f.snap().status == JobStatus::error);
	CHECK(f.snap().message.has_value());

	f.emit(tick("downloading", "40%"));
	CHECK(f.snap().status == JobStatus::downloading);
	CHECK_FALSE(f.snap().message.has_value());

	f.finish();
	CHECK(f.snap().status == JobStatus::finished);
}

TEST_CASE("JobRunner metadata failures", "[runner]") {
	RunnerFixture f;

	SECTION("Engine cannot resolve the URL") {
		f.engine->metadata = outcome::failure(errc::metadata_failed);
		auto ticket = f.submit(video());
		REQUIRE(ticket.has_error());
		CHECK(ticket.error() == errc::metadata_failed);
		CHECK(is_metadata_error(ticket.error()));

		auto s = f.snap();
		CHECK(s.status == JobStatus::error);
		REQUIRE(s.message.has_value());
		CHECK(s.message->rfind("Could not fetch info: ", 0) == 0);
		CHECK(f.engine->downloads.empty());
	}

	SECTION("Engine unavailable") {
		f.engine->metadata = outcome::failure(errc::engine_unavailable);
		auto ticket = f.submit(video());
		REQUIRE(ticket.has_error());
		CHECK(ticket.error() == errc::metadata_failed);
		CHECK(f.snap().status == JobStatus::error);
	}

	SECTION("Playlist without entries") {
		f.engine->metadata = MediaMetadata{"Empty", true, 0, {}};
		auto ticket = f.submit(video());
		REQUIRE(ticket.has_error());
		CHECK(ticket.error() == errc::no_items);
		CHECK(f.snap().status == JobStatus::error);
	}

	SECTION("A new submission recovers") {
		f.engine->metadata = outcome::failure(errc::metadata_failed);
		REQUIRE(f.submit(video()).has_error());
		f.engine->metadata = MediaMetadata{"Video", false, 1, {}};
		auto ticket = f.submit(video());
		REQUIRE(ticket.has_value());
		CHECK(ticket.value().job_id == 2);
		CHECK(f.snap().status == JobStatus::downloading);
	}
}

TEST_CASE("JobRunner request validation", "[runner]") {
	RunnerFixture f;

	SECTION("Bad URLs") {
		for (const char *url : {"", "not a url", "ftp://example.com/file",
								"https://", "/relative/path"}) {
			auto ticket = f.submit(video(url));
			REQUIRE(ticket.has_error());
			CHECK(ticket.error() == errc::invalid_url);
		}
	}

	SECTION("Bad quality") {
		JobRequest req = video();
		req.quality = 480;
		CHECK(f.submit(req).error() == errc::invalid_quality);

		req.kind = DownloadKind::audio;
		req.quality = 720;
		CHECK(f.submit(req).error() == errc::invalid_quality);
	}

	// Rejected before any state change
	CHECK(f.state->generation() == 0);
	CHECK(f.snap().status == JobStatus::idle);
	CHECK(f.engine->metadata_urls.empty());
}

TEST_CASE("JobRunner busy policy", "[runner]") {
	SECTION("Reject") {
		RunnerFixture f;
		REQUIRE(f.submit(video()).has_value());
		f.emit(tick("downloading", "20%"));

		auto second = f.submit(video("https://example.com/other"));
		REQUIRE(second.has_error());
		CHECK(second.error() == errc::job_in_progress);

		auto s = f.snap();
		CHECK(s.job_id == 1);
		CHECK(s.percent == Approx(20.0));
		CHECK(f.engine->cancel_calls == 0);

		// Once finished the slot is free again
		f.finish();
		auto third = f.submit(video());
		REQUIRE(third.has_value());
		CHECK(third.value().job_id == 2);
	}

	SECTION("Supersede") {
		JobRunnerOptions opts;
		opts.on_busy = BusyPolicy::supersede;
		RunnerFixture f(opts);

		REQUIRE(f.submit(video()).has_value());
		ProgressSink old_sink = f.engine->sink();
		f.emit(tick("downloading", "20%"));

		auto second = f.submit(video("https://example.com/other"));
		REQUIRE(second.has_value());
		CHECK(second.value().job_id == 2);
		CHECK(f.engine->cancel_calls == 1);

		// Ticks from the superseded job never reach the new snapshot
		f.engine->emit_with(old_sink, tick("downloading", "90%"));
		f.drain();
		auto s = f.snap();
		CHECK(s.job_id == 2);
		CHECK(s.percent == 0.0);
		CHECK(s.status == JobStatus::downloading);
	}
}

TEST_CASE("JobRunner cancel", "[runner]") {
	RunnerFixture f;

	SECTION("Nothing running") {
		auto res = f.cancel();
		REQUIRE(res.has_error());
		CHECK(res.error() == errc::no_active_job);
	}

	SECTION("Running download") {
		REQUIRE(f.submit(video()).has_value());
		f.emit(tick("downloading", "40%"));

		REQUIRE(f.cancel().has_value());
		CHECK(f.engine->cancel_calls == 1);

		auto s = f.snap();
		CHECK(s.status == JobStatus::cancelled);
		CHECK(s.message == "Cancelled");
		CHECK(s.percent == Approx(40.0));

		f.emit(tick("downloading", "80%"));
		CHECK(f.snap() == s);

		CHECK(f.cancel().error() == errc::no_active_job);
	}

	SECTION("Finished job") {
		REQUIRE(f.submit(video()).has_value());
		f.finish();
		CHECK(f.cancel().error() == errc::no_active_job);
		CHECK(f.snap().status == JobStatus::finished);
	}
}

TEST_CASE("JobRunner cancel reaches a pending metadata fetch", "[runner]") {
	RunnerFixture f;
	f.engine->hold_metadata = true;

	std::optional<Result<JobTicket>> out;
	f.runner->async_submit(video(),
						   [&](Result<JobTicket> r) { out.emplace(std::move(r)); });
	f.drain();
	REQUIRE(f.engine->metadata_pending());
	CHECK_FALSE(out.has_value());
	CHECK(f.snap().status == JobStatus::fetching_metadata);

	REQUIRE(f.cancel().has_value());
	CHECK(f.engine->cancel_calls == 1);
	CHECK_FALSE(f.engine->metadata_pending());

	REQUIRE(out.has_value());
	REQUIRE(out->has_error());
	CHECK(out->error() == std::errc::operation_canceled);
	CHECK(f.engine->downloads.empty());
	CHECK(f.snap().status == JobStatus::cancelled);
}

TEST_CASE("JobRunner supersede during metadata fetch", "[runner]") {
	JobRunnerOptions opts;
	opts.on_busy = BusyPolicy::supersede;
	RunnerFixture f(opts);
	f.engine->hold_metadata = true;

	std::optional<Result<JobTicket>> first;
	f.runner->async_submit(video(), [&](Result<JobTicket> r) {
		first.emplace(std::move(r));
	});
	f.drain();
	REQUIRE(f.engine->metadata_pending());

	std::optional<Result<JobTicket>> second;
	f.runner->async_submit(video("https://example.com/other"),
						   [&](Result<JobTicket> r) {
							   second.emplace(std::move(r));
						   });
	f.drain();
	CHECK(f.engine->cancel_calls == 1);
	REQUIRE(first.has_value());
	CHECK(first->error() == std::errc::operation_canceled);

	// The replacement's own fetch is the one still pending
	REQUIRE(f.engine->metadata_pending());
	f.engine->finish_metadata();
	f.drain();
	REQUIRE(second.has_value());
	REQUIRE(second->has_value());
	CHECK(second->value().job_id == 2);
	CHECK(f.engine->metadata_urls.size() == 2);
}

TEST_CASE("JobRunner engine-side abort reads as cancelled", "[runner]") {
	RunnerFixture f;
	REQUIRE(f.submit(video()).has_value());
	f.finish(outcome::failure(
		std::make_error_code(std::errc::operation_canceled)));
	CHECK(f.snap().status == JobStatus::cancelled);
}

TEST_CASE("JobRunner status reads are idempotent", "[runner]") {
	RunnerFixture f;
	REQUIRE(f.submit(video()).has_value());
	f.emit(tick("downloading", "33.3%", std::nullopt, "Clip"));

	auto generation = f.state->generation();
	auto a = f.snap();
	auto b = f.snap();
	CHECK(a == b);
	CHECK(f.state->generation() == generation);
}

TEST_CASE("BusyPolicy tokens", "[runner]") {
	CHECK(parse_busy_policy("reject") == BusyPolicy::reject);
	CHECK(parse_busy_policy("supersede") == BusyPolicy::supersede);
	CHECK_FALSE(parse_busy_policy("queue").has_value());
	CHECK(to_string(BusyPolicy::supersede) == "supersede");
}
