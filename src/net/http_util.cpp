#include <spdlog/spdlog.h>
#include <zlib.h>

#include <boost/url.hpp>

#include "net/http_util.hpp"

namespace hlsget::net {

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================
// Playlists are text and commonly served compressed. Segment bodies are
// never requested with an Accept-Encoding, so this only runs on manifests.
// =============================================================================

std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib");
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		size_t have = kChunkSize - zs.avail_out;
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			spdlog::debug("Decompressed gzip: {} -> {} bytes", body.size(),
						  result->size());
			return *result;
		}
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers send gzip as deflate
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) return *result;
		if (auto result = inflate_body(body, -MAX_WBITS)) return *result;
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

// =============================================================================
// URLS
// =============================================================================

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

std::optional<boost::urls::url> redirect_target(boost::urls::url_view from,
												std::string_view location) {
	auto ref = boost::urls::parse_uri_reference(location);
	if (ref.has_error()) return std::nullopt;

	boost::urls::url dest;
	auto r = boost::urls::resolve(from, ref.value(), dest);
	if (r.has_error()) return std::nullopt;
	return dest;
}

Result<boost::urls::url> url_from_decoded(std::string_view decoded) {
	auto authority = decoded.find("://");
	if (authority == std::string_view::npos) {
		return outcome::failure(errc::invalid_url);
	}

	auto path_start = decoded.find_first_of("/?", authority + 3);
	auto origin = boost::urls::parse_uri(decoded.substr(0, path_start));
	if (origin.has_error()) {
		spdlog::debug("Invalid origin in {}", decoded);
		return outcome::failure(errc::invalid_url);
	}

	boost::urls::url u(origin.value());
	if (path_start == std::string_view::npos) return u;

	auto rest = decoded.substr(path_start);
	auto query = rest.find('?');
	u.set_path(rest.substr(0, query));
	if (query != std::string_view::npos) u.set_query(rest.substr(query + 1));
	return u;
}

std::string request_target(boost::urls::url_view u) {
	std::string target(u.encoded_path());
	if (target.empty()) target = "/";
	if (u.has_query()) {
		target += "?";
		target += u.encoded_query();
	}
	return target;
}

}  // namespace hlsget::net
