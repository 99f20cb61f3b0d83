#pragma once

#include <hlsget/hlsget_export.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace hlsget {

inline constexpr const char *kDefaultUserAgent = "hlsget/1.0";

struct HLSGET_EXPORT DownloadOptions {
	std::string manifest_url;
	std::string output_dir;

	std::size_t concurrency = 10;
	std::string user_agent = kDefaultUserAgent;
	std::string container_extension = "ts";

	// Bounded producer/consumer queue between resolver and fetch pool
	std::size_t queue_capacity = 1024;
	// URIs remembered while polling a live playlist
	std::size_t dedup_capacity = 1024;
	// Master playlists pointing at master playlists
	int max_rendition_depth = 5;
	std::chrono::steady_clock::duration manifest_retry_delay =
		std::chrono::seconds(3);
};

}  // namespace hlsget
