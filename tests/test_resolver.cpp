#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <exception>
#include <optional>

#include "download_context.hpp"
#include "manifest/resolver.hpp"
#include "support/fake_transport.hpp"
#include "support/temp_dir.hpp"

namespace hlsget::manifest {
namespace {

namespace asio = boost::asio;
using testing::FakeTransport;
using testing::TempDir;

constexpr const char *kMaster = "http://cdn.test/show/master.m3u8";

std::string media_playlist(const std::vector<std::string> &uris,
						   bool closed = true, const char *target = "4") {
	std::string body = "#EXTM3U\n#EXT-X-TARGETDURATION:";
	body += target;
	body += "\n";
	for (const auto &uri : uris) body += "#EXTINF:4.0,\n" + uri + "\n";
	if (closed) body += "#EXT-X-ENDLIST\n";
	return body;
}

std::string master_playlist(
	const std::vector<std::pair<int, std::string>> &variants) {
	std::string body = "#EXTM3U\n";
	for (const auto &[bw, uri] : variants) {
		body += "#EXT-X-STREAM-INF:BANDWIDTH=" + std::to_string(bw) + "\n" +
				uri + "\n";
	}
	return body;
}

void rethrow(std::exception_ptr e) {
	if (e) std::rethrow_exception(e);
}

class ResolverTest : public ::testing::Test {
   protected:
	struct Outcome {
		Result<void> result;
		std::vector<SegmentDescriptor> emitted;
		boost::system::error_code terminal;
	};

	DownloadOptions options() {
		DownloadOptions o;
		o.manifest_url = kMaster;
		o.output_dir = (dir_.path() / "out").string();
		o.manifest_retry_delay = std::chrono::milliseconds(10);
		return o;
	}

	// Runs the resolver against a consumer that records every descriptor
	Outcome run(DownloadContext &ctx,
				std::function<void(ManifestResolver &)> on_start = {}) {
		std::filesystem::create_directories(ctx.output_dir);

		SegmentChannel queue(ioc_.get_executor(), ctx.options.queue_capacity);
		ManifestResolver resolver(ctx, queue);
		std::optional<Result<void>> result;
		std::vector<SegmentDescriptor> emitted;
		boost::system::error_code terminal;

		asio::spawn(
			ioc_, [&](asio::yield_context y) { result = resolver.run(y); },
			rethrow);
		asio::spawn(
			ioc_,
			[&](asio::yield_context y) {
				for (;;) {
					boost::system::error_code ec;
					auto seg = queue.async_receive(y[ec]);
					if (ec) {
						terminal = ec;
						break;
					}
					emitted.push_back(std::move(seg));
				}
			},
			rethrow);
		if (on_start) on_start(resolver);

		ioc_.run();
		ioc_.restart();
		return Outcome{*result, std::move(emitted), terminal};
	}

	static std::vector<std::string> names(
		const std::vector<SegmentDescriptor> &segs) {
		std::vector<std::string> out;
		for (const auto &s : segs) out.push_back(s.name);
		return out;
	}

	TempDir dir_;
	asio::io_context ioc_;
	FakeTransport transport_{ioc_};
};

TEST_F(ResolverTest, FollowsHighestBandwidthRendition) {
	transport_.add_playlist(
		kMaster, master_playlist({{500, "low/index.m3u8"},
								  {2000, "high/index.m3u8"},
								  {1200, "mid/index.m3u8"}}));
	transport_.add_playlist("http://cdn.test/show/high/index.m3u8",
							media_playlist({"h1.ts", "h2.ts"}));

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(out.terminal, asio::error::eof);
	EXPECT_EQ(names(out.emitted), (std::vector<std::string>{"h1.ts", "h2.ts"}));
	EXPECT_EQ(out.emitted[0].uri, "http://cdn.test/show/high/h1.ts");
	EXPECT_EQ(transport_.get_count("http://cdn.test/show/low/index.m3u8"), 0u);
	EXPECT_EQ(transport_.get_count("http://cdn.test/show/mid/index.m3u8"), 0u);
}

TEST_F(ResolverTest, BandwidthTieGoesToFirstListed) {
	transport_.add_playlist(kMaster, master_playlist({{800, "a/index.m3u8"},
													  {800, "b/index.m3u8"}}));
	transport_.add_playlist(
		"http://cdn.test/show/a/index.m3u8", media_playlist({"a1.ts"}));

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(names(out.emitted), (std::vector<std::string>{"a1.ts"}));
}

TEST_F(ResolverTest, RegistersAndPersistsSegmentOrder) {
	transport_.add_playlist(
		kMaster, media_playlist({"seg-0.ts", "sub/seg-1.ts", "seg-2.ts"}));

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(ctx.state.base_path(), "http://cdn.test/show/");
	EXPECT_EQ(ctx.state.order(),
			  (std::vector<std::string>{"seg-0.ts", "seg-1.ts", "seg-2.ts"}));
	EXPECT_EQ(ctx.state.status("seg-1.ts"), false);
	EXPECT_EQ(out.emitted[1].uri, "http://cdn.test/show/sub/seg-1.ts");
	EXPECT_TRUE(std::filesystem::exists(ctx.checkpoint_file()));
}

TEST_F(ResolverTest, NestedMastersWithinLimitResolve) {
	// master -> m1 -> m2 -> m3 -> m4 -> media: five hops
	transport_.add_playlist(kMaster, master_playlist({{1, "m1.m3u8"}}));
	for (int i = 1; i < 5; ++i) {
		transport_.add_playlist(
			"http://cdn.test/show/m" + std::to_string(i) + ".m3u8",
			master_playlist({{1, "m" + std::to_string(i + 1) + ".m3u8"}}));
	}
	transport_.add_playlist(
		"http://cdn.test/show/m5.m3u8", media_playlist({"x.ts"}));

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(names(out.emitted), (std::vector<std::string>{"x.ts"}));
}

TEST_F(ResolverTest, NestedMastersBeyondLimitFail) {
	// Every playlist points at the next master, forever
	transport_.add_playlist(kMaster, master_playlist({{1, "m1.m3u8"}}));
	for (int i = 1; i < 10; ++i) {
		transport_.add_playlist(
			"http://cdn.test/show/m" + std::to_string(i) + ".m3u8",
			master_playlist({{1, "m" + std::to_string(i + 1) + ".m3u8"}}));
	}

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_error());
	EXPECT_EQ(out.result.error(), errc::rendition_depth_exceeded);
	EXPECT_TRUE(out.emitted.empty());
	EXPECT_NE(out.terminal, asio::error::eof);
	EXPECT_TRUE(out.terminal.failed());
	EXPECT_EQ(transport_.total_gets(), 6u);
}

TEST_F(ResolverTest, MasterWithoutRenditionsFails) {
	transport_.add_playlist(kMaster, "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\n");

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_error());
	EXPECT_EQ(out.result.error(), errc::no_renditions);
}

TEST_F(ResolverTest, LivePlaylistEnqueuesOnlyNewSegments) {
	transport_.add_playlist(
		kMaster,
		{{200, media_playlist({"s1.ts", "s2.ts"}, false, "0.02")},
		 {200, media_playlist({"s1.ts", "s2.ts", "s3.ts"}, false, "0.02")},
		 {200, media_playlist({"s1.ts", "s2.ts", "s3.ts"}, true, "0.02")}});

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(names(out.emitted),
			  (std::vector<std::string>{"s1.ts", "s2.ts", "s3.ts"}));
	EXPECT_EQ(transport_.get_count(kMaster), 3u);
	EXPECT_EQ(ctx.state.order(),
			  (std::vector<std::string>{"s1.ts", "s2.ts", "s3.ts"}));
}

TEST_F(ResolverTest, StopEndsLivePolling) {
	transport_.add_playlist(kMaster, media_playlist({"s1.ts"}, false, "30"));

	DownloadContext ctx(options(), transport_);
	asio::steady_timer stopper(ioc_);
	auto out = run(ctx, [&](ManifestResolver &resolver) {
		stopper.expires_after(std::chrono::milliseconds(20));
		stopper.async_wait([&](boost::system::error_code) {
			ctx.stop_requested = true;
			resolver.stop();
		});
	});

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(names(out.emitted), (std::vector<std::string>{"s1.ts"}));
	EXPECT_EQ(transport_.get_count(kMaster), 1u);
}

TEST_F(ResolverTest, RetriesOnceThenContinuesWithBody) {
	transport_.add_playlist(
		kMaster, {{503, "busy"}, {200, media_playlist({"a.ts"})}});

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(transport_.get_count(kMaster), 2u);
	EXPECT_EQ(names(out.emitted), (std::vector<std::string>{"a.ts"}));
}

TEST_F(ResolverTest, SecondFailureSurfacesAsDecodeError) {
	transport_.add_playlist(kMaster, {{500, "<html>oops</html>"}});

	DownloadContext ctx(options(), transport_);
	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_error());
	EXPECT_EQ(out.result.error(), errc::manifest_decode_failed);
	EXPECT_EQ(transport_.get_count(kMaster), 2u);
}

TEST_F(ResolverTest, ResumeEmitsIncompleteSegmentsWithoutNetwork) {
	DownloadContext ctx(options(), transport_);
	ctx.state.register_segments("http://cdn.test/show/", {"a.ts", "b.ts", "c.ts"});
	ctx.state.mark("b.ts", true);

	auto out = run(ctx);

	ASSERT_TRUE(out.result.has_value());
	EXPECT_EQ(transport_.total_gets(), 0u);
	ASSERT_EQ(out.emitted.size(), 2u);
	EXPECT_EQ(out.emitted[0].uri, "http://cdn.test/show/a.ts");
	EXPECT_EQ(out.emitted[1].uri, "http://cdn.test/show/c.ts");
	EXPECT_EQ(out.terminal, asio::error::eof);
}

}  // namespace
}  // namespace hlsget::manifest
