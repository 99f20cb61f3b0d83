#include <spdlog/spdlog.h>

#include <boost/regex.hpp>
#include <map>
#include <optional>
#include <string>

#include "manifest/decoder.hpp"
#include "utils.hpp"

namespace hlsget::manifest {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kHeader = "#EXTM3U";
constexpr std::string_view kTagStreamInf = "#EXT-X-STREAM-INF:";
constexpr std::string_view kTagExtinf = "#EXTINF:";
constexpr std::string_view kTagTargetDuration = "#EXT-X-TARGETDURATION:";
constexpr std::string_view kTagMediaSequence = "#EXT-X-MEDIA-SEQUENCE:";
constexpr std::string_view kTagEndlist = "#EXT-X-ENDLIST";

// Attribute list: KEY=VALUE pairs separated by commas, values optionally
// quoted (quoted values may contain commas, e.g. CODECS).
std::map<std::string, std::string> parse_attributes(std::string_view list) {
	static const boost::regex re(R"(([A-Z0-9-]+)=("[^"]*"|[^,]*))");

	std::map<std::string, std::string> attrs;
	boost::cregex_iterator it(list.data(), list.data() + list.size(), re);
	boost::cregex_iterator end;
	for (; it != end; ++it) {
		std::string value = (*it)[2].str();
		if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
			value = value.substr(1, value.size() - 2);
		}
		attrs[(*it)[1].str()] = std::move(value);
	}
	return attrs;
}

Rendition parse_stream_inf(std::string_view list) {
	auto attrs = parse_attributes(list);

	Rendition r;
	if (auto it = attrs.find("BANDWIDTH"); it != attrs.end()) {
		r.bandwidth = utils::to_number_default<std::uint64_t>(it->second);
	}
	if (auto it = attrs.find("RESOLUTION"); it != attrs.end()) {
		r.resolution = it->second;
	}
	if (auto it = attrs.find("CODECS"); it != attrs.end()) {
		r.codecs = it->second;
	}
	return r;
}

// #EXTINF:<duration>,[<title>]; the title is not kept
SegmentEntry parse_extinf(std::string_view value) {
	SegmentEntry seg;
	auto comma = value.find(',');
	seg.duration = utils::to_number_default<double>(
		utils::trim(value.substr(0, comma)));
	return seg;
}

}  // namespace

Result<Manifest> decode_manifest(std::string_view body) {
	if (body.starts_with(kUtf8Bom)) body.remove_prefix(kUtf8Bom.size());
	body = utils::trim(body);

	if (!body.starts_with(kHeader)) {
		spdlog::debug("Playlist does not start with {}", kHeader);
		return outcome::failure(errc::manifest_decode_failed);
	}

	SelectorManifest selector;
	SegmentManifest media;
	bool saw_stream_inf = false;
	bool saw_target_duration = false;
	std::optional<Rendition> pending_rendition;
	std::optional<SegmentEntry> pending_segment;

	size_t pos = 0;
	while (pos < body.size()) {
		auto eol = body.find('\n', pos);
		auto raw = body.substr(
			pos, eol == std::string_view::npos ? std::string_view::npos
											   : eol - pos);
		pos = (eol == std::string_view::npos) ? body.size() : eol + 1;

		auto line = utils::trim(raw);
		if (line.empty()) continue;

		if (line.front() == '#') {
			if (line.starts_with(kTagStreamInf)) {
				saw_stream_inf = true;
				pending_rendition =
					parse_stream_inf(line.substr(kTagStreamInf.size()));
			} else if (line.starts_with(kTagExtinf)) {
				pending_segment = parse_extinf(line.substr(kTagExtinf.size()));
			} else if (line.starts_with(kTagTargetDuration)) {
				auto td = utils::to_double(
					utils::trim(line.substr(kTagTargetDuration.size())));
				if (td.has_error()) {
					spdlog::debug("Bad target duration: {}", line);
					return outcome::failure(errc::manifest_decode_failed);
				}
				media.target_duration = td.value();
				saw_target_duration = true;
			} else if (line.starts_with(kTagMediaSequence)) {
				media.media_sequence = utils::to_number_default<std::uint64_t>(
					utils::trim(line.substr(kTagMediaSequence.size())));
			} else if (line == kTagEndlist) {
				media.closed = true;
			}
			// Other tags and comments are not needed for downloading
			continue;
		}

		// URI line
		if (pending_rendition) {
			pending_rendition->uri = std::string(line);
			selector.renditions.push_back(std::move(*pending_rendition));
			pending_rendition.reset();
		} else {
			SegmentEntry seg = pending_segment.value_or(SegmentEntry{});
			seg.uri = std::string(line);
			media.segments.push_back(std::move(seg));
			pending_segment.reset();
		}
	}

	if (saw_stream_inf && media.segments.empty()) {
		return Manifest{std::move(selector)};
	}
	if (saw_target_duration || !media.segments.empty()) {
		return Manifest{std::move(media)};
	}

	spdlog::debug("Playlist has neither renditions nor segments");
	return outcome::failure(errc::manifest_decode_failed);
}

}  // namespace hlsget::manifest
