#include <hlsget/result.hpp>
#include <string>

namespace hlsget {

struct hlsget_error_category : std::error_category {
	const char *name() const noexcept override { return "hlsget"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "HTTP error";
			case errc::manifest_fetch_failed: return "Manifest fetch failed";
			case errc::manifest_decode_failed:
				return "Not a valid m3u8 playlist";
			case errc::invalid_url: return "Invalid URL";
			case errc::no_renditions: return "Master playlist has no variants";
			case errc::rendition_depth_exceeded:
				return "Too many nested master playlists";
			case errc::directory_create_failed:
				return "Cannot create output directory";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::checkpoint_read_failed:
				return "Checkpoint read failed";
			case errc::checkpoint_parse_failed:
				return "Checkpoint is not valid JSON";
			case errc::checkpoint_write_failed:
				return "Checkpoint write failed";
			case errc::segment_missing: return "Segment file missing";
			case errc::segments_incomplete:
				return "Some segments are not downloaded yet";
			case errc::merge_failed: return "Merge failed";
			case errc::interrupted: return "Interrupted";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::invalid_options: return "Invalid command line options";
			default: return "Unknown error";
		}
	}
};

const std::error_category &hlsget_category() {
	static hlsget_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), hlsget_category()};
}

bool is_transient(const std::error_code &ec) {
	return ec == errc::request_failed || ec == errc::http_error;
}

}  // namespace hlsget
