#pragma once

#include <hlsget/hlsget_export.h>

#include <cstddef>
#include <filesystem>
#include <hlsget/result.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hlsget {

// Durable per-segment completion record. The on-disk form is
//   { "Path": <base path>, "MediaStatus": {name: bool}, "MediaList": [name] }
// and its presence in the output directory is what makes a run a resume.
//
// Status updates are single-key and may come from any fetch task; saving is
// serialized separately so two concurrent saves never interleave.
class HLSGET_EXPORT DownloadState {
   public:
	DownloadState() = default;
	DownloadState(const DownloadState &) = delete;
	DownloadState &operator=(const DownloadState &) = delete;

	/// `<output_dir>/.index`
	static std::filesystem::path checkpoint_path(
		const std::filesystem::path &output_dir);

	/// Record the names of one resolution pass. The base path is only set
	/// once; known names keep their status and position.
	void register_segments(std::string_view base_path,
						   const std::vector<std::string> &names);

	void mark(const std::string &name, bool complete);

	[[nodiscard]] std::optional<bool> status(const std::string &name) const;
	[[nodiscard]] std::string base_path() const;
	[[nodiscard]] std::vector<std::string> order() const;
	[[nodiscard]] std::vector<std::string> incomplete() const;
	[[nodiscard]] size_t completed_count() const;
	[[nodiscard]] size_t size() const;
	[[nodiscard]] bool empty() const;

	/// Write to `path` via a sibling temporary file and rename.
	Result<void> save(const std::filesystem::path &path) const;

	/// Replace the in-memory state with the contents of `path`. On error
	/// the current state is left untouched.
	Result<void> load(const std::filesystem::path &path);

   private:
	mutable std::mutex status_mutex_;
	mutable std::mutex persist_mutex_;

	std::string base_path_;
	std::unordered_map<std::string, bool> status_;
	std::vector<std::string> order_;
};

}  // namespace hlsget
