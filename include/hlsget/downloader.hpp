#pragma once

#include <hlsget/hlsget_export.h>

#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <filesystem>
#include <hlsget/options.hpp>
#include <hlsget/result.hpp>
#include <hlsget/types.hpp>
#include <memory>
#include <string_view>

// Forward declarations
namespace hlsget::net {
class Transport;
}

namespace hlsget {

namespace asio = boost::asio;

// Drives one download: load the checkpoint, resolve (or resume) the segment
// list, fetch with bounded concurrency, and merge into
// `<output_dir>.<container_extension>`.
class HLSGET_EXPORT Downloader {
   public:
	enum class Stage {
		init,
		resolving,
		fetching,
		merging,
		done,
		interrupted,
		failed
	};

	Downloader(const Downloader &) = delete;
	Downloader &operator=(const Downloader &) = delete;
	Downloader(Downloader &&) noexcept;
	Downloader &operator=(Downloader &&) noexcept;
	~Downloader();

	Downloader(std::shared_ptr<net::Transport> transport,
			   DownloadOptions options);

	[[nodiscard]] asio::any_io_executor get_executor() const;

	using CompletionExecutor = asio::any_io_executor;

	// Completes with the merged artifact's path, errc::interrupted after
	// request_stop(), errc::segments_incomplete when some segment could not
	// be fetched, or the fatal error that ended the run. The checkpoint is
	// saved in every case. One run per Downloader.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(
		void(Result<std::filesystem::path>)) CompletionToken>
	auto async_download(ProgressCallback progress_cb, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::filesystem::path>)>(
			[this, ex,
			 progress_cb = std::move(progress_cb)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler = asio::any_completion_handler<void(
					Result<std::filesystem::path>)>{
					std::forward<decltype(handler)>(handler)};

				async_download_impl(std::move(progress_cb),
									std::move(any_handler),
									std::move(handler_ex));
			},
			token);
	}

	/// Stop scheduling new segments and save the checkpoint. Transfers in
	/// progress are allowed to finish.
	void request_stop();

	/// Save the checkpoint now.
	Result<void> persist();

	[[nodiscard]] Stage stage() const;

   private:
	struct Impl;

	void async_download_impl(
		ProgressCallback progress_cb,
		asio::any_completion_handler<void(Result<std::filesystem::path>)>
			handler,
		CompletionExecutor handler_ex);

	std::shared_ptr<Impl> m_impl;
};

HLSGET_EXPORT std::string_view to_string(Downloader::Stage stage);

}  // namespace hlsget
