#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/asio/error.hpp>
#include <variant>

#include "manifest/decoder.hpp"
#include "manifest/resolver.hpp"
#include "manifest/uri.hpp"

namespace hlsget::manifest {

namespace {

// A live playlist without a usable target duration is polled at this rate
constexpr auto kFallbackPollInterval = std::chrono::seconds(1);

const Rendition *pick_rendition(const std::vector<Rendition> &renditions) {
	const Rendition *best = nullptr;
	for (const auto &r : renditions) {
		// Strictly greater: ties go to the first one listed
		if (!best || r.bandwidth > best->bandwidth) best = &r;
	}
	return best;
}

// "2000000 bps, 1280x720, avc1.64001f,mp4a.40.2"
std::string describe(const Rendition &r) {
	std::string out = fmt::format("{} bps", r.bandwidth);
	if (!r.resolution.empty()) out += ", " + r.resolution;
	if (!r.codecs.empty()) out += ", " + r.codecs;
	return out;
}

}  // namespace

ManifestResolver::ManifestResolver(DownloadContext &ctx, SegmentChannel &out)
	: ctx_(ctx),
	  out_(out),
	  seen_(ctx.options.dedup_capacity),
	  timer_(out.get_executor()) {}

Result<void> ManifestResolver::run(asio::yield_context yield) {
	Result<void> res = outcome::success();
	if (!ctx_.state.empty()) {
		res = resume(yield);
	} else {
		res = resolve(yield);
	}
	finish(res, yield);
	return res;
}

void ManifestResolver::stop() { timer_.cancel(); }

// =============================================================================
// RESUME
// =============================================================================
// The checkpoint already knows every segment; nothing is fetched.
// =============================================================================

Result<void> ManifestResolver::resume(asio::yield_context yield) {
	auto base = ctx_.state.base_path();
	auto pending = ctx_.state.incomplete();

	spdlog::info("Resuming: {} of {} segments already downloaded",
				 ctx_.state.completed_count(), ctx_.state.size());

	for (auto &name : pending) {
		if (ctx_.stopping()) break;
		if (!emit(SegmentDescriptor{base + name, name}, yield)) break;
	}
	return outcome::success();
}

// =============================================================================
// FRESH RESOLUTION
// =============================================================================

Result<void> ManifestResolver::resolve(asio::yield_context yield) {
	std::string url = ctx_.options.manifest_url;
	int hops = 0;

	while (!ctx_.stopping()) {
		auto body = fetch_playlist(url, yield);
		if (ctx_.stopping()) break;

		auto decoded = decode_manifest(body);
		if (decoded.has_error()) {
			spdlog::error("Not a valid playlist: {}", url);
			return outcome::failure(decoded.error());
		}

		if (auto *media = std::get_if<SegmentManifest>(&decoded.value())) {
			return follow_playlist(url, std::move(*media), yield);
		}

		const auto &master = std::get<SelectorManifest>(decoded.value());
		const Rendition *best = pick_rendition(master.renditions);
		if (!best) {
			spdlog::error("Master playlist {} lists no renditions", url);
			return outcome::failure(errc::no_renditions);
		}
		if (++hops > ctx_.options.max_rendition_depth) {
			spdlog::error("Master playlists nested deeper than {} levels",
						  ctx_.options.max_rendition_depth);
			return outcome::failure(errc::rendition_depth_exceeded);
		}

		auto next = absolute_uri(url, best->uri);
		if (next.has_error()) return outcome::failure(next.error());

		spdlog::info("Selected rendition ({}): {}", describe(*best),
					 next.value());
		url = std::move(next.value());
	}
	return outcome::success();
}

// Enqueue the playlist and, while it stays open, keep polling it for new
// segments every target duration.
Result<void> ManifestResolver::follow_playlist(const std::string &url,
											   SegmentManifest pl,
											   asio::yield_context yield) {
	for (;;) {
		auto pass = enqueue_pass(url, pl, yield);
		if (pass.has_error()) return pass;

		if (pl.closed || ctx_.stopping()) return outcome::success();

		std::chrono::steady_clock::duration interval = kFallbackPollInterval;
		if (pl.target_duration > 0) {
			interval = std::chrono::duration_cast<
				std::chrono::steady_clock::duration>(
				std::chrono::duration<double>(pl.target_duration));
		}
		spdlog::debug(
			"Live playlist at media sequence {}, polling again in {:.3f}s",
			pl.media_sequence, std::chrono::duration<double>(interval).count());
		if (!wait_for(interval, yield)) return outcome::success();

		auto body = fetch_playlist(url, yield);
		if (ctx_.stopping()) return outcome::success();

		auto decoded = decode_manifest(body);
		if (decoded.has_error()) {
			spdlog::error("Not a valid playlist: {}", url);
			return outcome::failure(decoded.error());
		}
		auto *media = std::get_if<SegmentManifest>(&decoded.value());
		if (!media) {
			spdlog::error("Live playlist {} turned into a master playlist",
						  url);
			return outcome::failure(errc::manifest_decode_failed);
		}
		pl = std::move(*media);
	}
}

Result<void> ManifestResolver::enqueue_pass(const std::string &url,
											const SegmentManifest &pl,
											asio::yield_context yield) {
	std::vector<SegmentDescriptor> segments;
	std::vector<std::string> names;
	segments.reserve(pl.segments.size());
	names.reserve(pl.segments.size());

	for (const auto &entry : pl.segments) {
		auto abs = absolute_uri(url, entry.uri);
		if (abs.has_error()) return outcome::failure(abs.error());
		auto name = segment_name(abs.value());
		names.push_back(name);
		segments.push_back(SegmentDescriptor{std::move(abs.value()), name});
	}

	std::string base;
	if (!segments.empty()) base = directory_prefix(segments.front().uri);

	ctx_.state.register_segments(base, names);
	if (auto saved = ctx_.persist(); saved.has_error()) {
		spdlog::warn("Checkpoint not saved: {}", saved.error().message());
	}

	size_t queued = 0;
	double queued_seconds = 0.0;
	for (size_t i = 0; i < segments.size(); ++i) {
		if (ctx_.stopping()) break;
		auto &seg = segments[i];
		if (seen_.seen(seg.uri)) continue;
		seen_.mark(seg.uri);
		if (!emit(std::move(seg), yield)) break;
		++queued;
		queued_seconds += pl.segments[i].duration;
	}
	spdlog::debug("Queued {} new segments ({:.1f}s of media) from {}", queued,
				  queued_seconds, url);
	return outcome::success();
}

// =============================================================================
// HELPERS
// =============================================================================

// One retry after a fixed delay. Whatever body the last attempt produced is
// returned; decoding decides whether it is usable.
std::string ManifestResolver::fetch_playlist(const std::string &url,
											 asio::yield_context yield) {
	std::string body;
	for (int attempt = 0; attempt < 2; ++attempt) {
		auto res = ctx_.transport.async_get(url, yield);
		if (res.has_value()) {
			int status = res.value().status_code;
			if (status >= 200 && status < 300) {
				return std::move(res.value().body);
			}
			spdlog::warn("Received HTTP {} for {}", status, url);
			body = std::move(res.value().body);
		} else {
			spdlog::warn(
				"Failed to fetch playlist {}: {}", url, res.error().message());
			body.clear();
		}

		if (attempt == 0 &&
			!wait_for(ctx_.options.manifest_retry_delay, yield)) {
			break;
		}
	}
	return body;
}

bool ManifestResolver::emit(SegmentDescriptor seg, asio::yield_context yield) {
	boost::system::error_code ec;
	out_.async_send(boost::system::error_code{}, std::move(seg), yield[ec]);
	if (ec) {
		spdlog::debug("Segment queue closed: {}", ec.message());
		return false;
	}
	return true;
}

bool ManifestResolver::wait_for(std::chrono::steady_clock::duration d,
								asio::yield_context yield) {
	if (ctx_.stopping()) return false;
	timer_.expires_after(d);
	boost::system::error_code ec;
	timer_.async_wait(yield[ec]);
	return !ec && !ctx_.stopping();
}

void ManifestResolver::finish(const Result<void> &res,
							  asio::yield_context yield) {
	boost::system::error_code terminal = asio::error::eof;
	if (res.has_error()) terminal = boost::system::error_code(res.error());

	boost::system::error_code ec;
	out_.async_send(terminal, SegmentDescriptor{}, yield[ec]);
	if (ec) {
		// The consumer already closed the queue
		spdlog::debug("End of stream not delivered: {}", ec.message());
	}
}

}  // namespace hlsget::manifest
