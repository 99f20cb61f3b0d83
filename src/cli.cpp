#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <sstream>

#include "cli.hpp"

namespace po = boost::program_options;

namespace hlsget::cli {

Result<CliOptions> parse_command_line(int argc, const char *const argv[]) {
	CliOptions opts;
	auto &dl = opts.download;

	// Signed so that "--num=-1" is rejected instead of wrapping around
	int num = static_cast<int>(dl.concurrency);

	// Options that may also come from the config file
	po::options_description download_opts("Download options");
	// clang-format off
	download_opts.add_options()
		("url,u", po::value<std::string>(&dl.manifest_url), "m3u8 URL to download")
		("out,o", po::value<std::string>(&dl.output_dir), "Output directory for segments; the merged file is <out>.<ext>")
		("num,n", po::value<int>(&num)->default_value(num), "Number of concurrent segment downloads (1-256)")
		("user-agent", po::value<std::string>(&dl.user_agent)->default_value(kDefaultUserAgent), "User-Agent header sent with every request")
		("ext", po::value<std::string>(&dl.container_extension)->default_value("ts"), "Extension of the merged file");
	// clang-format on

	po::options_description generic("General options");
	// clang-format off
	generic.add_options()
		("help,h", po::bool_switch(&opts.help), "Print this help message")
		("version", po::bool_switch(&opts.version), "Print version")
		("config,c", po::value<std::string>(&opts.config_file), "Read options from an INI-style file")
		("verbose,v", po::bool_switch(&opts.verbose), "Enable verbose logging")
		("quiet,q", po::bool_switch(&opts.quiet), "Only print warnings and errors");
	// clang-format on

	po::options_description cmdline;
	cmdline.add(generic).add(download_opts);

	std::ostringstream usage;
	usage << cmdline;
	opts.usage = usage.str();

	try {
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, cmdline), vm);

		// Command line wins: values already stored are not overwritten
		if (vm.count("config")) {
			auto path = vm["config"].as<std::string>();
			po::store(po::parse_config_file(path.c_str(), download_opts), vm);
		}
		po::notify(vm);
	} catch (const po::error &e) {
		spdlog::error("{}", e.what());
		return outcome::failure(errc::invalid_options);
	}

	if (opts.help || opts.version) return opts;

	if (dl.manifest_url.empty() || dl.output_dir.empty()) {
		spdlog::error(
			"Both --url and --out are required, e.g. "
			"hlsget -u https://example.com/live/index.m3u8 -o movie");
		return outcome::failure(errc::invalid_options);
	}
	if (!dl.manifest_url.starts_with("http")) {
		spdlog::error("Not an http(s) URL: {}", dl.manifest_url);
		return outcome::failure(errc::invalid_options);
	}
	if (num < 1 || num > kMaxConcurrency) {
		spdlog::error("--num must be between 1 and {}, got {}", kMaxConcurrency,
					  num);
		return outcome::failure(errc::invalid_options);
	}
	dl.concurrency = static_cast<std::size_t>(num);

	return opts;
}

}  // namespace hlsget::cli
