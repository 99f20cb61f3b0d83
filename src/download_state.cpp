#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <hlsget/download_state.hpp>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace hlsget {

namespace fs = std::filesystem;

namespace {

constexpr const char *kCheckpointName = ".index";
constexpr const char *kKeyPath = "Path";
constexpr const char *kKeyStatus = "MediaStatus";
constexpr const char *kKeyList = "MediaList";

}  // namespace

fs::path DownloadState::checkpoint_path(const fs::path &output_dir) {
	return output_dir / kCheckpointName;
}

void DownloadState::register_segments(std::string_view base_path,
									  const std::vector<std::string> &names) {
	std::lock_guard lock(status_mutex_);
	if (base_path_.empty()) { base_path_ = std::string(base_path); }

	for (const auto &name : names) {
		auto [it, inserted] = status_.try_emplace(name, false);
		if (inserted) {
			order_.push_back(name);
		} else if (std::find(order_.begin(), order_.end(), name) ==
				   order_.end()) {
			// Known from a loaded MediaStatus but never ordered
			order_.push_back(name);
		}
	}
}

void DownloadState::mark(const std::string &name, bool complete) {
	std::lock_guard lock(status_mutex_);
	status_[name] = complete;
}

std::optional<bool> DownloadState::status(const std::string &name) const {
	std::lock_guard lock(status_mutex_);
	auto it = status_.find(name);
	if (it == status_.end()) { return std::nullopt; }
	return it->second;
}

std::string DownloadState::base_path() const {
	std::lock_guard lock(status_mutex_);
	return base_path_;
}

std::vector<std::string> DownloadState::order() const {
	std::lock_guard lock(status_mutex_);
	return order_;
}

std::vector<std::string> DownloadState::incomplete() const {
	std::lock_guard lock(status_mutex_);
	std::vector<std::string> names;
	for (const auto &name : order_) {
		auto it = status_.find(name);
		if (it == status_.end() || !it->second) { names.push_back(name); }
	}
	return names;
}

size_t DownloadState::completed_count() const {
	std::lock_guard lock(status_mutex_);
	size_t count = 0;
	for (const auto &name : order_) {
		auto it = status_.find(name);
		if (it != status_.end() && it->second) { ++count; }
	}
	return count;
}

size_t DownloadState::size() const {
	std::lock_guard lock(status_mutex_);
	return order_.size();
}

bool DownloadState::empty() const {
	std::lock_guard lock(status_mutex_);
	return order_.empty();
}

// =============================================================================
// PERSISTENCE
// =============================================================================

Result<void> DownloadState::save(const fs::path &path) const {
	// Snapshot under the persist lock so the last file renamed into place is
	// also the newest snapshot
	std::lock_guard persist_lock(persist_mutex_);

	nlohmann::json j;
	{
		std::lock_guard lock(status_mutex_);
		j[kKeyPath] = base_path_;
		j[kKeyStatus] = nlohmann::json::object();
		for (const auto &[name, done] : status_) { j[kKeyStatus][name] = done; }
		j[kKeyList] = order_;
	}

	auto tmp_path = path;
	tmp_path += ".tmp";

	{
		std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
		if (!file) {
			spdlog::error("Cannot open checkpoint {} for writing",
						  tmp_path.string());
			return outcome::failure(errc::checkpoint_write_failed);
		}
		file << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
		file.flush();
		if (!file) {
			spdlog::error("Failed to write checkpoint {}", tmp_path.string());
			return outcome::failure(errc::checkpoint_write_failed);
		}
	}

	std::error_code ec;
	fs::rename(tmp_path, path, ec);
	if (ec) {
		spdlog::error("Failed to replace checkpoint {}: {}", path.string(),
					  ec.message());
		fs::remove(tmp_path, ec);
		return outcome::failure(errc::checkpoint_write_failed);
	}

	spdlog::debug("Checkpoint saved to {}", path.string());
	return outcome::success();
}

Result<void> DownloadState::load(const fs::path &path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) { return outcome::failure(errc::checkpoint_read_failed); }

	std::string content((std::istreambuf_iterator<char>(file)),
						std::istreambuf_iterator<char>());

	auto j = nlohmann::json::parse(content, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return outcome::failure(errc::checkpoint_parse_failed);
	}

	std::string base_path;
	std::unordered_map<std::string, bool> status;
	std::vector<std::string> order;

	if (auto it = j.find(kKeyPath); it != j.end() && !it->is_null()) {
		if (!it->is_string()) {
			return outcome::failure(errc::checkpoint_parse_failed);
		}
		base_path = it->get<std::string>();
	}

	if (auto it = j.find(kKeyStatus); it != j.end() && !it->is_null()) {
		if (!it->is_object()) {
			return outcome::failure(errc::checkpoint_parse_failed);
		}
		for (const auto &item : it->items()) {
			if (!item.value().is_boolean()) {
				return outcome::failure(errc::checkpoint_parse_failed);
			}
			status[item.key()] = item.value().get<bool>();
		}
	}

	if (auto it = j.find(kKeyList); it != j.end() && !it->is_null()) {
		if (!it->is_array()) {
			return outcome::failure(errc::checkpoint_parse_failed);
		}
		std::unordered_set<std::string> listed;
		for (const auto &entry : *it) {
			if (!entry.is_string()) {
				return outcome::failure(errc::checkpoint_parse_failed);
			}
			auto name = entry.get<std::string>();
			if (!listed.insert(name).second) { continue; }
			status.try_emplace(name, false);
			order.push_back(std::move(name));
		}
	}

	std::lock_guard lock(status_mutex_);
	base_path_ = std::move(base_path);
	status_ = std::move(status);
	order_ = std::move(order);

	spdlog::debug("Checkpoint loaded from {} ({} segments)", path.string(),
				  order_.size());
	return outcome::success();
}

}  // namespace hlsget
