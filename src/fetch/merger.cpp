#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <vector>

#include "fetch/merger.hpp"

namespace hlsget::fetch {

namespace fs = std::filesystem;

namespace {

constexpr size_t kCopyBufferSize = 256 * 1024;

std::string trim_separators(std::string dir) {
	while (dir.size() > 1 && (dir.back() == '/' || dir.back() == '\\')) {
		dir.pop_back();
	}
	return dir;
}

}  // namespace

fs::path artifact_path(const fs::path &output_dir, std::string_view extension) {
	std::string base = trim_separators(output_dir.string());
	if (extension.empty()) return fs::path(base);
	return fs::path(base + "." + std::string(extension));
}

Result<fs::path> merge_segments(const fs::path &output_dir,
								const std::vector<std::string> &order,
								std::string_view extension) {
	// Refuse before touching the artifact so a gap never yields a short file
	for (const auto &name : order) {
		std::error_code ec;
		if (!fs::is_regular_file(output_dir / name, ec)) {
			spdlog::error("Cannot merge, segment {} is missing", name);
			return outcome::failure(errc::segment_missing);
		}
	}

	auto target = artifact_path(output_dir, extension);

	std::error_code ec;
	fs::remove(target, ec);
	if (ec) {
		spdlog::error("Cannot replace {}: {}", target.string(), ec.message());
		return outcome::failure(errc::merge_failed);
	}

	std::ofstream out(target, std::ios::binary | std::ios::app);
	if (!out) {
		spdlog::error("Cannot open {} for writing", target.string());
		return outcome::failure(errc::merge_failed);
	}

	auto abort_merge = [&](const std::string &why) -> Result<fs::path> {
		spdlog::error("Merge failed: {}", why);
		out.close();
		std::error_code rm_ec;
		fs::remove(target, rm_ec);
		return outcome::failure(errc::merge_failed);
	};

	// Heap buffer: this runs on a coroutine stack
	std::vector<char> buffer(kCopyBufferSize);
	std::uint64_t total = 0;

	for (const auto &name : order) {
		std::ifstream in(output_dir / name, std::ios::binary);
		if (!in) return abort_merge("cannot open segment " + name);

		while (in) {
			in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
			auto n = in.gcount();
			if (n <= 0) break;
			out.write(buffer.data(), n);
			if (!out) return abort_merge("write error on " + target.string());
			total += static_cast<std::uint64_t>(n);
		}
		if (in.bad()) return abort_merge("read error on segment " + name);
	}

	out.close();
	if (out.fail()) return abort_merge("cannot finish " + target.string());

	spdlog::info("Merged {} segments ({} bytes) into {}", order.size(), total,
				 target.string());
	return target;
}

}  // namespace hlsget::fetch
