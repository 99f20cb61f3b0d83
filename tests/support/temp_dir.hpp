#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace hlsget::testing {

// Scratch directory removed on destruction. The download output directory
// used by tests is `path() / "out"` so the merged artifact (a sibling of
// the output directory) is cleaned up as well.
class TempDir {
   public:
	TempDir() {
		static std::atomic<int> counter{0};
		path_ = std::filesystem::temp_directory_path() /
				("hlsget_test_" + std::to_string(::getpid()) + "_" +
				 std::to_string(counter++));
		std::filesystem::remove_all(path_);
		std::filesystem::create_directories(path_);
	}

	~TempDir() {
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

   private:
	std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path &p) {
	std::ifstream in(p, std::ios::binary);
	std::stringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

inline void write_file(const std::filesystem::path &p,
					   const std::string &content) {
	std::ofstream out(p, std::ios::binary | std::ios::trunc);
	out << content;
}

}  // namespace hlsget::testing
