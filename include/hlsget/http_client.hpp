#pragma once

#include <hlsget/hlsget_export.h>

#include <boost/asio/any_io_executor.hpp>
#include <hlsget/transport.hpp>
#include <memory>
#include <string>

namespace hlsget::net {

class HLSGET_EXPORT HttpClient final : public Transport {
   public:
	HttpClient(asio::any_io_executor ex, std::string user_agent);
	~HttpClient() override;

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	/// Cancel every request still in flight. Used on forced shutdown.
	void shutdown();

	struct Impl;

   protected:
	void async_get_impl(
		std::string url,
		asio::any_completion_handler<void(Result<HttpResponse>)> handler,
		CompletionExecutor handler_ex) override;

	void async_download_file_impl(
		std::string url, std::string output_path,
		asio::any_completion_handler<void(Result<std::uint64_t>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	std::unique_ptr<Impl> m_impl;
};

}  // namespace hlsget::net
