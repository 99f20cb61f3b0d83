#pragma once

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

namespace hlsget::cache {

// Fixed-capacity set of strings with least-recently-used eviction. Only the
// resolver touches it, so there is no locking.
class LruSet {
   public:
	static constexpr size_t kDefaultCapacity = 1024;

	explicit LruSet(size_t capacity = kDefaultCapacity)
		: capacity_(capacity == 0 ? 1 : capacity) {}

	// True if present; a hit counts as a use
	bool seen(const std::string &key) {
		auto it = index_.find(key);
		if (it == index_.end()) { return false; }
		entries_.splice(entries_.begin(), entries_, it->second);
		return true;
	}

	void mark(const std::string &key) {
		if (seen(key)) { return; }

		if (entries_.size() >= capacity_) {
			index_.erase(entries_.back());
			entries_.pop_back();
		}
		entries_.push_front(key);
		index_[key] = entries_.begin();
	}

	[[nodiscard]] size_t size() const { return entries_.size(); }
	[[nodiscard]] size_t capacity() const { return capacity_; }

   private:
	size_t capacity_;
	std::list<std::string> entries_;  // front = most recent
	std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

}  // namespace hlsget::cache
