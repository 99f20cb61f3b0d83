#pragma once

#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>
#include <hlsget/result.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace hlsget::net {

constexpr int kMaxRedirects = 10;

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate.
// Empty on a corrupt or truncated stream.
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits);

/// Decode a body according to its Content-Encoding. Unknown encodings and
/// bodies that fail to inflate are returned as they are.
std::string decompress_body(const std::string &body,
							const std::string &content_encoding);

bool is_redirect(int status);

/// Resolve a Location header against the URL that produced it.
std::optional<boost::urls::url> redirect_target(boost::urls::url_view from,
												std::string_view location);

/// Build a request URL from a percent-decoded one (as produced by
/// manifest::absolute_uri). Scheme and authority must be well formed; the
/// first '?' starts the query; every other character of path and query is
/// re-encoded where needed, so spaces, '%' and '#' survive the round trip.
Result<boost::urls::url> url_from_decoded(std::string_view decoded);

/// Origin-form request target: encoded path (at least "/") plus query.
std::string request_target(boost::urls::url_view u);

}  // namespace hlsget::net
