#pragma once

#include <atomic>
#include <filesystem>
#include <hlsget/download_state.hpp>
#include <hlsget/options.hpp>
#include <hlsget/transport.hpp>
#include <utility>

namespace hlsget {

// Everything one download run shares between the resolver, the fetch pool
// and the controller. Owned by the controller; components hold references.
struct DownloadContext {
	DownloadContext(DownloadOptions opts, net::Transport &t)
		: options(std::move(opts)),
		  transport(t),
		  output_dir(options.output_dir) {}

	DownloadContext(const DownloadContext &) = delete;
	DownloadContext &operator=(const DownloadContext &) = delete;

	const DownloadOptions options;
	net::Transport &transport;
	const std::filesystem::path output_dir;

	DownloadState state;
	std::atomic<bool> stop_requested{false};

	[[nodiscard]] bool stopping() const { return stop_requested.load(); }

	[[nodiscard]] std::filesystem::path checkpoint_file() const {
		return DownloadState::checkpoint_path(output_dir);
	}

	Result<void> persist() const {
		std::error_code ec;
		if (!std::filesystem::is_directory(output_dir, ec)) {
			// Nothing to write into yet
			return outcome::success();
		}
		return state.save(checkpoint_file());
	}
};

}  // namespace hlsget
