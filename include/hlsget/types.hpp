#pragma once

#include <hlsget/hlsget_export.h>

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace hlsget {

// One media segment queued for download. `name` is the last path component
// of `uri` and doubles as the on-disk filename and the checkpoint key.
struct HLSGET_EXPORT SegmentDescriptor {
	std::string uri;
	std::string name;
};

struct HLSGET_EXPORT DownloadProgress {
	std::size_t completed_segments = 0;
	std::size_t failed_segments = 0;
	std::size_t total_segments = 0;
	std::uint64_t downloaded_bytes = 0;
};

using ProgressCallback = std::function<void(const DownloadProgress &progress)>;

// =============================================================================
// Decoded manifest shapes
// =============================================================================

struct HLSGET_EXPORT Rendition {
	std::uint64_t bandwidth = 0;
	std::string uri;
	std::string resolution;	 // e.g., "1280x720"
	std::string codecs;
};

struct HLSGET_EXPORT SegmentEntry {
	std::string uri;
	double duration = 0.0;
};

// Master playlist: alternative renditions of the same content
struct HLSGET_EXPORT SelectorManifest {
	std::vector<Rendition> renditions;
};

// Media playlist: ordered segments
struct HLSGET_EXPORT SegmentManifest {
	std::vector<SegmentEntry> segments;
	bool closed = false;  // #EXT-X-ENDLIST seen
	double target_duration = 0.0;
	std::uint64_t media_sequence = 0;
};

using Manifest = std::variant<SelectorManifest, SegmentManifest>;

}  // namespace hlsget
