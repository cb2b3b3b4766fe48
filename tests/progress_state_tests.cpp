#include <catch2/catch_all.hpp>
#include <dlpoll/progress_state.hpp>
#include <limits>
#include <thread>
#include <vector>

using namespace dlpoll;

TEST_CASE("ProgressState initial snapshot", "[state]") {
	ProgressState state;
	auto snap = state.read();
	CHECK(snap.status == JobStatus::idle);
	CHECK(snap.percent == 0.0);
	CHECK(snap.current == 0);
	CHECK(snap.total == 0);
	CHECK_FALSE(snap.title.has_value());
	CHECK(state.generation() == 0);
}

TEST_CASE("ProgressState::write", "[state]") {
	ProgressState state;

	SECTION("Replaces the whole snapshot") {
		ProgressSnapshot s;
		s.percent = 42.0;
		s.current = 1;
		s.total = 3;
		s.title = "Song";
		s.status = JobStatus::downloading;
		s.job_id = 7;
		state.write(s);

		CHECK(state.read() == s);
		CHECK(state.generation() == 1);

		ProgressSnapshot next;
		next.status = JobStatus::fetching_metadata;
		next.total = 1;
		state.write(next);
		CHECK_FALSE(state.read().title.has_value());
		CHECK(state.read().job_id == 0);
	}

	SECTION("Invariants are enforced") {
		ProgressSnapshot s;
		s.percent = 130.0;
		s.current = 5;
		s.total = 2;
		state.write(s);
		auto snap = state.read();
		CHECK(snap.percent == 100.0);
		CHECK(snap.current == 2);

		s.percent = std::numeric_limits<double>::quiet_NaN();
		state.write(s);
		CHECK(state.read().percent == 0.0);

		s.percent = -3.0;
		state.write(s);
		CHECK(state.read().percent == 0.0);
	}

	SECTION("Reads are idempotent") {
		ProgressSnapshot s;
		s.percent = 12.5;
		s.total = 1;
		s.status = JobStatus::downloading;
		state.write(s);
		CHECK(state.read() == state.read());
		CHECK(state.generation() == 1);
	}
}

TEST_CASE("ProgressState readers never see a torn snapshot", "[state]") {
	ProgressState state;
	constexpr int kWrites = 2000;

	// Every written snapshot has current == total == percent, so a mix of
	// two writes would show up as a mismatch.
	std::thread writer([&] {
		for (int i = 1; i <= kWrites; ++i) {
			ProgressSnapshot s;
			s.current = static_cast<std::size_t>(i % 100);
			s.total = s.current;
			s.percent = static_cast<double>(s.current);
			s.title = std::to_string(s.current);
			state.write(s);
		}
	});

	bool consistent = true;
	for (int i = 0; i < kWrites; ++i) {
		auto snap = state.read();
		if (snap.current != snap.total ||
			snap.percent != static_cast<double>(snap.current) ||
			(snap.title && *snap.title != std::to_string(snap.current))) {
			consistent = false;
		}
	}
	writer.join();

	CHECK(consistent);
	CHECK(state.generation() == kWrites);
}
