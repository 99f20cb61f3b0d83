#pragma once

#include <hlsget/options.hpp>
#include <hlsget/result.hpp>
#include <string>

namespace hlsget::cli {

constexpr int kMaxConcurrency = 256;

struct CliOptions {
	DownloadOptions download;
	std::string config_file;
	bool help = false;
	bool version = false;
	bool quiet = false;
	bool verbose = false;
	std::string usage;	// rendered option descriptions for --help
};

/// Parse argv and, with --config, an INI-style file whose values the command
/// line overrides. Unless --help or --version is given the result is
/// validated: --url and --out are required, the URL must be http(s) and
/// --num must lie in [1, kMaxConcurrency]. Any problem is logged and
/// reported as errc::invalid_options.
Result<CliOptions> parse_command_line(int argc, const char *const argv[]);

}  // namespace hlsget::cli
