#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <hlsget/downloader.hpp>
#include <hlsget/http_client.hpp>
#include <hlsget/options.hpp>
#include <hlsget/types.hpp>

#include "cli.hpp"

namespace asio = boost::asio;

#ifndef HLSGET_VERSION
#define HLSGET_VERSION "1.0.0"
#endif

namespace {

constexpr int kExitInterrupted = 130;

void setup_logging(const hlsget::cli::CliOptions &opts) {
	auto logger = spdlog::stderr_color_mt("hlsget");
	logger->set_pattern("[hlsget] %v");
	spdlog::set_default_logger(logger);

	if (opts.verbose) {
		spdlog::set_level(spdlog::level::debug);
	} else if (opts.quiet) {
		spdlog::set_level(spdlog::level::warn);
	} else {
		spdlog::set_level(spdlog::level::info);
	}
}

void print_progress(const hlsget::DownloadProgress &p) {
	constexpr double MIB = 1024.0 * 1024.0;
	fmt::print(stderr, "\r[download] {}/{} segments, {} failed, {:.2f}MiB",
			   p.completed_segments, p.total_segments, p.failed_segments,
			   static_cast<double>(p.downloaded_bytes) / MIB);
}

}  // namespace

int main(int argc, char *argv[]) {
	try {
		auto parsed = hlsget::cli::parse_command_line(argc, argv);
		if (parsed.has_error()) {
			fmt::println(stderr, "Run 'hlsget --help' for usage.");
			return 1;
		}
		auto &opts = parsed.value();
		auto &dl = opts.download;

		if (opts.help) {
			std::cout << "Usage: hlsget -u <m3u8-url> -o <output-dir> [options]\n"
					  << opts.usage << "\n";
			return 0;
		}
		if (opts.version) {
			std::cout << "hlsget " << HLSGET_VERSION << "\n";
			return 0;
		}

		setup_logging(opts);

		spdlog::info("Concurrent downloads: {}", dl.concurrency);
		spdlog::info("Playlist: {}", dl.manifest_url);
		spdlog::info("Output directory: {}", dl.output_dir);

		// Setup async context
		asio::io_context ioc;
		auto http = std::make_shared<hlsget::net::HttpClient>(
			ioc.get_executor(), dl.user_agent);
		hlsget::Downloader downloader(http, dl);

		int exit_code = 1;

		// First signal: stop scheduling and let transfers finish.
		// Second signal: save and leave immediately.
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
#ifdef SIGHUP
		signals.add(SIGHUP);
#endif
#ifdef SIGQUIT
		signals.add(SIGQUIT);
#endif
		int signals_seen = 0;
		std::function<void(const boost::system::error_code &, int)> on_signal =
			[&](const boost::system::error_code &ec, int sig) {
				if (ec) return;
				if (++signals_seen == 1) {
					fmt::println(stderr,
								 "\nReceived signal {}, finishing downloads in "
								 "progress (repeat to quit now)",
								 sig);
					downloader.request_stop();
					signals.async_wait(on_signal);
					return;
				}
				fmt::println(stderr, "\nReceived signal {}, exiting now.", sig);
				if (auto r = downloader.persist(); r.has_error()) {
					spdlog::error(
						"Failed to save checkpoint: {}", r.error().message());
				}
				http->shutdown();
				exit_code = kExitInterrupted;
				ioc.stop();
			};
		signals.async_wait(on_signal);

		hlsget::ProgressCallback progress_cb;
		if (!opts.quiet) progress_cb = print_progress;

		asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				auto res = downloader.async_download(progress_cb, yield);
				if (!opts.quiet) fmt::print(stderr, "\n");

				if (res.has_value()) {
					spdlog::info("Saved to {}", res.value().string());
					exit_code = 0;
				} else if (res.error() == hlsget::errc::interrupted) {
					exit_code = kExitInterrupted;
				} else {
					spdlog::error("Download failed: {}", res.error().message());
					exit_code = 1;
				}
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});

		ioc.run();

		return exit_code;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
