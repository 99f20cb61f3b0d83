#pragma once

#include <hlsget/hlsget_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <cstdint>
#include <hlsget/result.hpp>
#include <string>
#include <string_view>

namespace hlsget::net {

namespace asio = boost::asio;

struct HLSGET_EXPORT HttpResponse {
	int status_code = 0;
	std::string body;
};

// "Fetch bytes from a URL". The resolver and the fetch pool only see this
// interface; HttpClient is the production implementation.
class HLSGET_EXPORT Transport {
   public:
	Transport() = default;
	Transport(const Transport &) = delete;
	Transport &operator=(const Transport &) = delete;
	virtual ~Transport() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	using CompletionExecutor = asio::any_completion_executor;

	// GET into memory. Any status code is a response; only transport
	// failures complete with an error. URLs are given percent-decoded.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<HttpResponse>))
				  CompletionToken>
	auto async_get(std::string_view url, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<HttpResponse>)>(
			[this, ex, url_s = std::string(url)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<HttpResponse>)>{
						std::forward<decltype(handler)>(handler)};

				async_get_impl(std::move(url_s), std::move(any_handler),
							   std::move(handler_ex));
			},
			token);
	}

	// GET streamed into `output_path` (truncated). Completes with the number
	// of bytes written; a non-200 status is errc::http_error.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::uint64_t>))
				  CompletionToken>
	auto async_download_file(std::string_view url, std::string_view output_path,
							 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::uint64_t>)>(
			[this, ex, url_s = std::string(url),
			 output_path_s = std::string(output_path)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<std::uint64_t>)>{
						std::forward<decltype(handler)>(handler)};

				async_download_file_impl(
					std::move(url_s), std::move(output_path_s),
					std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_get_impl(
		std::string url,
		asio::any_completion_handler<void(Result<HttpResponse>)> handler,
		CompletionExecutor handler_ex) = 0;

	virtual void async_download_file_impl(
		std::string url, std::string output_path,
		asio::any_completion_handler<void(Result<std::uint64_t>)> handler,
		CompletionExecutor handler_ex) = 0;
};

}  // namespace hlsget::net
