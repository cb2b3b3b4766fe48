#include <algorithm>
#include <catch2/catch_all.hpp>

#include "engine/ytdlp_command.hpp"

using namespace dlpoll;

namespace {

bool contains_sequence(const std::vector<std::string> &args,
					   std::initializer_list<std::string> seq) {
	return std::search(args.begin(), args.end(), seq.begin(), seq.end()) !=
		   args.end();
}

}  // namespace

TEST_CASE("ytdlp::parse_progress_line download ticks", "[ytdlp]") {
	SECTION("Full line") {
		auto ev = ytdlp::parse_progress_line(
			"dlpoll|downloading|\x1b[0;94m 42.0%\x1b[0m|4200|10000|NA|2|abc123|"
			"Some Title\n");
		REQUIRE(ev.has_value());
		CHECK(ev->status == "downloading");
		REQUIRE(ev->percent_str.has_value());
		CHECK(ev->percent_str->find("42.0%") != std::string::npos);
		CHECK(ev->downloaded_bytes == 4200);
		CHECK(ev->total_bytes == 10000);
		CHECK_FALSE(ev->total_bytes_estimate.has_value());
		CHECK(ev->item.playlist_index == 2u);
		CHECK(ev->item.id == "abc123");
		CHECK(ev->title == "Some Title");
		CHECK_FALSE(ev->postprocessor.has_value());
	}

	SECTION("Titles may contain the separator") {
		auto ev = ytdlp::parse_progress_line(
			"dlpoll|finished|100%|10|10|NA|NA|xyz|Artist | Song | Live");
		REQUIRE(ev.has_value());
		CHECK(ev->title == "Artist | Song | Live");
		CHECK_FALSE(ev->item.playlist_index.has_value());
	}

	SECTION("Float estimates and missing values") {
		auto ev = ytdlp::parse_progress_line(
			"dlpoll|downloading|NA|1024|NA|4096.5|NA|NA|NA");
		REQUIRE(ev.has_value());
		CHECK_FALSE(ev->percent_str.has_value());
		CHECK(ev->total_bytes_estimate == 4096);
		CHECK_FALSE(ev->title.has_value());
		CHECK(ev->item.id.empty());
	}

	SECTION("Foreign lines are ignored") {
		CHECK_FALSE(ytdlp::parse_progress_line("").has_value());
		CHECK_FALSE(
			ytdlp::parse_progress_line("[Merger] Merging formats into x.mp4")
				.has_value());
		CHECK_FALSE(
			ytdlp::parse_progress_line("other|downloading|1%").has_value());
		CHECK_FALSE(
			ytdlp::parse_progress_line("dlpoll|downloading|1%").has_value());
	}
}

TEST_CASE("ytdlp::parse_progress_line postprocess ticks", "[ytdlp]") {
	auto ev = ytdlp::parse_progress_line(
		"dlpoll-pp|started|FFmpegExtractAudio|3|id3|Track Three\r\n");
	REQUIRE(ev.has_value());
	CHECK(ev->status == "started");
	CHECK(ev->postprocessor == "FFmpegExtractAudio");
	CHECK(ev->item.playlist_index == 3u);
	CHECK(ev->title == "Track Three");
	CHECK_FALSE(ev->percent_str.has_value());
}

TEST_CASE("ytdlp::parse_metadata", "[ytdlp]") {
	SECTION("Single video") {
		auto meta = ytdlp::parse_metadata(
			R"({"_type":"video","id":"a","title":"One Video"})");
		REQUIRE(meta.has_value());
		CHECK(meta.value().title == "One Video");
		CHECK_FALSE(meta.value().is_playlist);
		CHECK(meta.value().item_count == 1);
	}

	SECTION("Flat playlist") {
		auto meta = ytdlp::parse_metadata(R"({
			"_type": "playlist",
			"title": "Mix",
			"entries": [
				{"_type": "url", "id": "a", "title": "First"},
				{"_type": "url", "id": "b", "title": null},
				{"_type": "url", "id": "c", "title": "Third"}
			]
		})");
		REQUIRE(meta.has_value());
		CHECK(meta.value().is_playlist);
		CHECK(meta.value().item_count == 3);
		REQUIRE(meta.value().item_titles.size() == 3);
		CHECK(meta.value().item_titles[0] == "First");
		CHECK(meta.value().item_titles[1].empty());
		CHECK(meta.value().item_titles[2] == "Third");
	}

	SECTION("Empty playlist has no items") {
		auto meta = ytdlp::parse_metadata(
			R"({"_type":"playlist","title":"Empty","entries":[]})");
		REQUIRE(meta.has_value());
		CHECK(meta.value().item_count == 0);
	}

	SECTION("Invalid output") {
		CHECK(ytdlp::parse_metadata("not json").error() ==
			  errc::metadata_failed);
		CHECK(ytdlp::parse_metadata("[1,2]").error() == errc::metadata_failed);
		CHECK(ytdlp::parse_metadata("").error() == errc::metadata_failed);
	}
}

TEST_CASE("ytdlp command lines", "[ytdlp]") {
	YtDlpOptions opts;
	opts.socket_timeout = 15;
	opts.extra_args = {"--cookies", "/tmp/c.txt"};

	SECTION("Metadata") {
		auto args = ytdlp::metadata_args("https://example.com/v", opts);
		CHECK(contains_sequence(args, {"--flat-playlist", "--dump-single-json"}));
		CHECK(contains_sequence(args, {"--socket-timeout", "15"}));
		CHECK(contains_sequence(
			args, {"--cookies", "/tmp/c.txt", "--", "https://example.com/v"}));
		CHECK(args.back() == "https://example.com/v");

		auto plain = ytdlp::metadata_args("https://example.com/v", YtDlpOptions{});
		CHECK(contains_sequence(plain, {"--socket-timeout", "30"}));
		CHECK(contains_sequence(plain, {"--no-warnings", "--socket-timeout"}));
	}

	SECTION("Video") {
		DownloadRequest req;
		req.url = "https://example.com/v";
		req.kind = DownloadKind::video;
		req.quality = 1080;
		req.output_template = "/home/u/Music/%(title)s.%(ext)s";

		auto args = ytdlp::download_args(req, opts);
		CHECK(contains_sequence(
			args, {"-f", "bestvideo[height<=1080]+bestaudio/best[height<=1080]"}));
		CHECK(contains_sequence(args, {"--merge-output-format", "mp4"}));
		CHECK(contains_sequence(args, {"-o", "/home/u/Music/%(title)s.%(ext)s"}));
		CHECK(contains_sequence(args, {"--socket-timeout", "15"}));
		CHECK(contains_sequence(args, {"--cookies", "/tmp/c.txt"}));
		CHECK(std::count(args.begin(), args.end(), "--progress-template") == 2);
		CHECK(std::find(args.begin(), args.end(), "-x") == args.end());
		REQUIRE(args.size() >= 2);
		CHECK(args[args.size() - 2] == "--");
		CHECK(args.back() == req.url);
	}

	SECTION("Audio") {
		DownloadRequest req;
		req.url = "https://example.com/a";
		req.kind = DownloadKind::audio;
		req.quality = 256;
		req.output_template = "/tmp/%(title)s.%(ext)s";

		auto args = ytdlp::download_args(req, opts);
		CHECK(contains_sequence(args, {"-f", "bestaudio"}));
		CHECK(contains_sequence(
			args, {"-x", "--audio-format", "mp3", "--audio-quality", "256K"}));
		CHECK(std::find(args.begin(), args.end(), "--merge-output-format") ==
			  args.end());
	}
}

TEST_CASE("ytdlp::join_command quotes arguments with spaces", "[ytdlp]") {
	CHECK(ytdlp::join_command("yt-dlp", {"-o", "/a b/%(title)s"}) ==
		  "yt-dlp -o '/a b/%(title)s'");
}
