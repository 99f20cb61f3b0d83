#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <hlsget/types.hpp>
#include <string>

#include "cache/lru_set.hpp"
#include "download_context.hpp"
#include "segment_channel.hpp"

namespace hlsget::manifest {

namespace asio = boost::asio;

// Produces the segments of one run: either the incomplete entries of a
// loaded checkpoint, or the segments of the configured manifest URL
// (following master playlists and polling live playlists).
class ManifestResolver {
   public:
	ManifestResolver(DownloadContext &ctx, SegmentChannel &out);

	/// Resume or resolve depending on the checkpoint, then end the stream.
	Result<void> run(asio::yield_context yield);

	/// Wake any pending retry or live-poll wait. Call on the executor the
	/// resolver runs on, after setting the context's stop flag.
	void stop();

   private:
	Result<void> resume(asio::yield_context yield);
	Result<void> resolve(asio::yield_context yield);
	Result<void> follow_playlist(const std::string &url, SegmentManifest pl,
								 asio::yield_context yield);
	Result<void> enqueue_pass(const std::string &url, const SegmentManifest &pl,
							  asio::yield_context yield);

	std::string fetch_playlist(const std::string &url,
							   asio::yield_context yield);
	bool emit(SegmentDescriptor seg, asio::yield_context yield);
	bool wait_for(std::chrono::steady_clock::duration d,
				  asio::yield_context yield);
	void finish(const Result<void> &res, asio::yield_context yield);

	DownloadContext &ctx_;
	SegmentChannel &out_;
	cache::LruSet seen_;
	asio::steady_timer timer_;
};

}  // namespace hlsget::manifest
