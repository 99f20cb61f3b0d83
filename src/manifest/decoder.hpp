#pragma once

#include <hlsget/result.hpp>
#include <hlsget/types.hpp>
#include <string_view>

namespace hlsget::manifest {

// Decode an m3u8 playlist. A playlist carrying #EXT-X-STREAM-INF entries is
// a SelectorManifest; one carrying #EXTINF or #EXT-X-TARGETDURATION is a
// SegmentManifest. Anything else, including a body without the #EXTM3U
// header, is errc::manifest_decode_failed.
Result<Manifest> decode_manifest(std::string_view body);

}  // namespace hlsget::manifest
