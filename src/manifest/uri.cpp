#include <spdlog/spdlog.h>

#include <boost/url.hpp>

#include "manifest/uri.hpp"

namespace hlsget::manifest {

Result<std::string> absolute_uri(std::string_view manifest_url,
								 std::string_view reference) {
	std::string resolved(reference);

	if (!reference.starts_with("http")) {
		auto base = boost::urls::parse_uri(manifest_url);
		if (base.has_error()) {
			spdlog::error("Invalid manifest URL: {}", manifest_url);
			return outcome::failure(errc::invalid_url);
		}
		auto ref = boost::urls::parse_uri_reference(reference);
		if (ref.has_error()) {
			spdlog::error("Invalid playlist reference: {}", reference);
			return outcome::failure(errc::invalid_url);
		}

		boost::urls::url dest;
		auto r = boost::urls::resolve(base.value(), ref.value(), dest);
		if (r.has_error()) {
			spdlog::error("Cannot resolve {} against {}", reference,
						  manifest_url);
			return outcome::failure(errc::invalid_url);
		}
		resolved = std::string(dest.buffer());
	}

	auto encoded = boost::urls::make_pct_string_view(resolved);
	if (encoded.has_error()) {
		spdlog::error("Malformed percent-encoding in {}", resolved);
		return outcome::failure(errc::invalid_url);
	}
	return encoded.value().decode();
}

std::string segment_name(std::string_view uri) {
	auto pos = uri.rfind('/');
	if (pos == std::string_view::npos) return std::string(uri);
	return std::string(uri.substr(pos + 1));
}

std::string directory_prefix(std::string_view uri) {
	auto pos = uri.rfind('/');
	if (pos == std::string_view::npos) return {};
	return std::string(uri.substr(0, pos + 1));
}

}  // namespace hlsget::manifest
