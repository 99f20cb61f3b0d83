#pragma once

#include <hlsget/result.hpp>
#include <string>
#include <string_view>

namespace hlsget::manifest {

/// Turn a playlist reference into the absolute URI it is fetched from.
/// References that do not start with "http" are resolved against
/// `manifest_url`; the result is then percent-decoded once.
Result<std::string> absolute_uri(std::string_view manifest_url,
								 std::string_view reference);

/// Last path component; used as the on-disk filename and checkpoint key.
std::string segment_name(std::string_view uri);

/// Everything up to and including the last '/'.
std::string directory_prefix(std::string_view uri);

}  // namespace hlsget::manifest
