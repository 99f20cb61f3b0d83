#pragma once

#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <hlsget/types.hpp>

#include "download_context.hpp"
#include "segment_channel.hpp"

namespace hlsget::fetch {

namespace asio = boost::asio;

// Drains the segment queue, downloading at most `concurrency` segments at a
// time into the output directory and recording each outcome in the
// checkpoint. Segment failures are logged and left incomplete.
class FetchPool {
   public:
	FetchPool(DownloadContext &ctx, ProgressCallback progress_cb = {});

	/// Create the output directory.
	Result<void> prepare();

	/// Consume `in` until end of stream, a stop request or a fatal error
	/// from the producer, then wait for every spawned task. Returns the
	/// producer's fatal error, if any.
	Result<void> run(SegmentChannel &in, asio::yield_context yield);

	[[nodiscard]] size_t active() const { return active_; }
	[[nodiscard]] size_t peak_active() const { return peak_active_; }
	[[nodiscard]] DownloadProgress progress() const;

   private:
	using SlotChannel =
		asio::experimental::channel<void(boost::system::error_code)>;

	void fetch_segment(const SegmentDescriptor &seg, asio::yield_context yield);
	void release_slot();
	void report();

	DownloadContext &ctx_;
	ProgressCallback progress_cb_;

	// One buffered message per busy slot
	SlotChannel slots_;
	asio::steady_timer idle_;

	size_t in_flight_ = 0;
	size_t active_ = 0;
	size_t peak_active_ = 0;
	size_t completed_ = 0;
	size_t failed_ = 0;
	std::uint64_t downloaded_bytes_ = 0;
};

}  // namespace hlsget::fetch
