#pragma once

#include <filesystem>
#include <hlsget/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace hlsget::fetch {

/// `<output_dir>.<extension>`, ignoring trailing separators of output_dir.
std::filesystem::path artifact_path(const std::filesystem::path &output_dir,
									std::string_view extension);

/// Concatenate `order` from `output_dir` into the artifact. Every segment
/// file must exist; segment files are left in place.
Result<std::filesystem::path> merge_segments(
	const std::filesystem::path &output_dir,
	const std::vector<std::string> &order, std::string_view extension);

}  // namespace hlsget::fetch
