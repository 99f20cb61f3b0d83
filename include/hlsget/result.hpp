#pragma once

#include <boost/outcome.hpp>
#include <system_error>

namespace hlsget {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Non-200 status

	// Manifest errors
	manifest_fetch_failed = 20,
	manifest_decode_failed,
	invalid_url,
	no_renditions,
	rendition_depth_exceeded,

	// I/O
	directory_create_failed = 40,
	file_open_failed,
	file_write_failed,
	checkpoint_read_failed,
	checkpoint_parse_failed,
	checkpoint_write_failed,

	// Merge
	segment_missing = 60,
	segments_incomplete,
	merge_failed,

	// Lifecycle
	interrupted = 80,

	// Conversion and input
	invalid_number_format = 90,
	invalid_options,

	unknown = 100
};

std::error_code make_error_code(errc e);

// Per-segment failures that are recovered locally (log, leave incomplete).
bool is_transient(const std::error_code &ec);

}  // namespace hlsget

namespace std {
template <>
struct is_error_code_enum<hlsget::errc> : true_type {};
}  // namespace std

namespace hlsget {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace hlsget
