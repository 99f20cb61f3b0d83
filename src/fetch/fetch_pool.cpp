#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/scope_exit.hpp>
#include <exception>
#include <filesystem>

#include "fetch/fetch_pool.hpp"

namespace hlsget::fetch {

namespace fs = std::filesystem;

FetchPool::FetchPool(DownloadContext &ctx, ProgressCallback progress_cb)
	: ctx_(ctx),
	  progress_cb_(std::move(progress_cb)),
	  slots_(ctx.transport.get_executor(),
			 std::max<size_t>(ctx.options.concurrency, 1)),
	  idle_(ctx.transport.get_executor()) {}

Result<void> FetchPool::prepare() {
	std::error_code ec;
	fs::create_directories(ctx_.output_dir, ec);
	if (ec || !fs::is_directory(ctx_.output_dir)) {
		spdlog::error("Cannot create output directory {}: {}",
					  ctx_.output_dir.string(), ec.message());
		return outcome::failure(errc::directory_create_failed);
	}
	return outcome::success();
}

Result<void> FetchPool::run(SegmentChannel &in, asio::yield_context yield) {
	completed_ = ctx_.state.completed_count();
	report();

	Result<void> res = outcome::success();

	for (;;) {
		boost::system::error_code ec;
		SegmentDescriptor seg = in.async_receive(yield[ec]);
		if (ec) {
			if (ec != asio::error::eof &&
				ec != asio::experimental::error::channel_closed &&
				ec != asio::experimental::error::channel_cancelled) {
				res = outcome::failure(std::error_code(ec));
			}
			break;
		}
		if (ctx_.stopping()) break;

		// Wait for a free slot; this is where the queue stops being drained
		slots_.async_send(boost::system::error_code{}, yield[ec]);
		if (ec) break;
		if (ctx_.stopping()) {
			slots_.try_receive([](boost::system::error_code) {});
			break;
		}

		++in_flight_;
		asio::spawn(
			yield.get_executor(),
			[this, seg = std::move(seg)](asio::yield_context task_yield) {
				BOOST_SCOPE_EXIT_ALL(&) { release_slot(); };
				fetch_segment(seg, task_yield);
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});
	}

	// In-flight transfers always run to completion
	while (in_flight_ > 0) {
		idle_.expires_at(asio::steady_timer::time_point::max());
		boost::system::error_code ec;
		idle_.async_wait(yield[ec]);
	}

	return res;
}

DownloadProgress FetchPool::progress() const {
	DownloadProgress p;
	p.completed_segments = completed_;
	p.failed_segments = failed_;
	p.total_segments = ctx_.state.size();
	p.downloaded_bytes = downloaded_bytes_;
	return p;
}

void FetchPool::fetch_segment(const SegmentDescriptor &seg,
							  asio::yield_context yield) {
	if (auto done = ctx_.state.status(seg.name); done && *done) {
		spdlog::debug("Skipping {}, already downloaded", seg.name);
		return;
	}

	++active_;
	peak_active_ = std::max(peak_active_, active_);

	auto path = ctx_.output_dir / seg.name;
	auto res = ctx_.transport.async_download_file(seg.uri, path.string(), yield);

	--active_;

	if (res.has_error()) {
		if (is_transient(res.error())) {
			spdlog::warn("Failed to download {}: {}", seg.uri,
						 res.error().message());
		} else {
			spdlog::error("Failed to download {}: {}", seg.uri,
						  res.error().message());
		}
		ctx_.state.mark(seg.name, false);

		std::error_code ec;
		fs::remove(path, ec);
		++failed_;
	} else {
		ctx_.state.mark(seg.name, true);
		++completed_;
		downloaded_bytes_ += res.value();
	}

	report();
}

void FetchPool::release_slot() {
	slots_.try_receive([](boost::system::error_code) {});
	--in_flight_;
	idle_.cancel();
}

void FetchPool::report() {
	if (progress_cb_) progress_cb_(progress());
}

}  // namespace hlsget::fetch
