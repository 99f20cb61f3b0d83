#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <hlsget/http_client.hpp>
#include <mutex>
#include <optional>
#include <vector>

#include "net/http_util.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace hlsget::net {

namespace {

constexpr auto kIoTimeout = std::chrono::seconds(30);
constexpr size_t kReadBufferSize = 256 * 1024;	// 256KB

struct FetchResult {
	int status_code = 0;
	std::string body;
	std::uint64_t bytes_written = 0;
};

using FetchHandler = asio::any_completion_handler<void(Result<FetchResult>)>;

class IActiveSession {
   public:
	virtual ~IActiveSession() = default;
	virtual void cancel() = 0;
};

}  // namespace

struct HttpClient::Impl {
	asio::any_io_executor ex;
	ssl::context ssl_ctx;
	std::string user_agent;

	// Active session tracking for cancellation
	std::mutex sessions_mutex_;
	std::vector<std::weak_ptr<IActiveSession>> active_sessions_;

	Impl(asio::any_io_executor e, std::string ua)
		: ex(std::move(e)),
		  ssl_ctx(ssl::context::tls_client),
		  user_agent(std::move(ua)) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	void register_session(std::weak_ptr<IActiveSession> session) {
		std::lock_guard lock(sessions_mutex_);
		active_sessions_.erase(
			std::remove_if(active_sessions_.begin(), active_sessions_.end(),
						   [](const auto &wp) { return wp.expired(); }),
			active_sessions_.end());
		active_sessions_.push_back(std::move(session));
	}

	void shutdown() {
		std::lock_guard lock(sessions_mutex_);
		for (auto &wp : active_sessions_) {
			if (auto sp = wp.lock()) { sp->cancel(); }
		}
		active_sessions_.clear();
	}
};

namespace {

// One GET over http or https, following redirects. The body goes either into
// memory (manifests) or straight into a file (segments) when output_path is
// set.
class FetchSession : public IActiveSession,
					 public std::enable_shared_from_this<FetchSession> {
   public:
	using CompletionExecutor = Transport::CompletionExecutor;

	FetchSession(HttpClient::Impl &impl, FetchHandler cb,
				 CompletionExecutor handler_ex, std::string output_path)
		: impl_(impl),
		  strand_(asio::make_strand(impl.ex)),
		  resolver_(strand_),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)),
		  output_path_(std::move(output_path)) {}

	void cancel() override {
		asio::dispatch(strand_, [self = shared_from_this()] {
			self->resolver_.cancel();
			if (self->stream_) beast::get_lowest_layer(*self->stream_).cancel();
		});
	}

	// `url` is percent-decoded; it is re-encoded for the request line
	void run(std::string url) {
		asio::dispatch(strand_, [self = shared_from_this(),
								 url = std::move(url)] {
			auto u = url_from_decoded(url);
			if (u.has_error()) {
				spdlog::warn("Cannot request {}: {}", url, u.error().message());
				return self->complete(outcome::failure(u.error()));
			}
			self->url_ = std::move(u.value());
			self->start();
		});
	}

   private:
	HttpClient::Impl &impl_;
	asio::strand<asio::any_io_executor> strand_;
	tcp::resolver resolver_;
	std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> stream_;
	FetchHandler cb_;
	CompletionExecutor handler_ex_;
	std::string output_path_;

	boost::urls::url url_;
	std::string host_, port_, target_;
	bool tls_ = false;
	int redirects_ = 0;
	bool completed_ = false;

	http::request<http::empty_body> req_;
	std::optional<http::response_parser<http::buffer_body>> parser_;
	beast::flat_buffer buffer_;
	std::vector<char> buf_{std::vector<char>(kReadBufferSize)};

	std::ofstream outfile_;
	std::string body_;
	std::uint64_t bytes_written_ = 0;

	[[nodiscard]] bool to_file() const { return !output_path_.empty(); }
	[[nodiscard]] std::string_view url_text() const { return url_.buffer(); }

	// Run an operation on the TLS stream or on the bare TCP stream
	template <typename F>
	void with_stream(F &&f) {
		if (tls_) {
			f(*stream_);
		} else {
			f(beast::get_lowest_layer(*stream_));
		}
	}

	void start() {
		boost::urls::url_view u = url_;

		if (u.scheme_id() == boost::urls::scheme::https) {
			tls_ = true;
		} else if (u.scheme_id() == boost::urls::scheme::http) {
			tls_ = false;
		} else {
			return complete(outcome::failure(errc::invalid_url));
		}

		host_ = u.host();
		port_ = u.port();
		target_ = request_target(u);
		if (port_.empty()) port_ = tls_ ? "443" : "80";

		stream_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
			strand_, impl_.ssl_ctx);
		parser_.emplace();
		parser_->body_limit(boost::none);
		buffer_.clear();

		if (tls_) {
			if (!SSL_set_tlsext_host_name(
					stream_->native_handle(), host_.c_str())) {
				return complete(
					outcome::failure(make_error_code(errc::request_failed)));
			}
			stream_->set_verify_callback(ssl::host_name_verification(host_));
		}

		resolver_.async_resolve(
			host_, port_,
			beast::bind_front_handler(
				&FetchSession::on_resolve, shared_from_this()));
	}

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		beast::get_lowest_layer(*stream_).expires_after(kIoTimeout);
		beast::get_lowest_layer(*stream_).async_connect(
			results, beast::bind_front_handler(
						 &FetchSession::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, tcp::endpoint /*unused*/) {
		if (ec) return fail(ec, "connect");

		if (!tls_) return do_write();

		stream_->async_handshake(
			ssl::stream_base::client,
			beast::bind_front_handler(
				&FetchSession::on_handshake, shared_from_this()));
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		req_ = {};
		req_.version(11);
		req_.method(http::verb::get);
		req_.target(target_);
		req_.set(http::field::host, host_);
		req_.set(http::field::user_agent, impl_.user_agent);
		req_.set(http::field::accept, "*/*");
		if (!to_file()) {
			// Request compressed playlists to save bandwidth
			req_.set(http::field::accept_encoding, "gzip, deflate");
		}

		beast::get_lowest_layer(*stream_).expires_after(kIoTimeout);
		with_stream([self = shared_from_this()](auto &s) {
			http::async_write(
				s, self->req_,
				beast::bind_front_handler(&FetchSession::on_write, self));
		});
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		with_stream([self = shared_from_this()](auto &s) {
			http::async_read_header(
				s, self->buffer_, *self->parser_,
				beast::bind_front_handler(&FetchSession::on_read_header, self));
		});
	}

	void on_read_header(beast::error_code ec, std::size_t /*unused*/) {
		if (ec) return fail(ec, "read_header");

		int status = parser_->get().result_int();

		if (is_redirect(status)) {
			auto loc_it = parser_->get().find(http::field::location);
			if (loc_it != parser_->get().end()) {
				if (++redirects_ > kMaxRedirects) {
					spdlog::warn("Too many redirects for {}", url_text());
					close_stream();
					return complete(
						outcome::failure(make_error_code(errc::request_failed)));
				}
				auto next = redirect_target(url_, loc_it->value());
				if (!next) {
					close_stream();
					return complete(outcome::failure(errc::invalid_url));
				}
				spdlog::debug(
					"Redirected {} -> {}", url_text(), std::string_view(next->buffer()));
				url_ = std::move(*next);
				close_stream();
				return start();
			}
		}

		if (to_file()) {
			if (status != 200) {
				// Nothing is written for an error response
				close_stream();
				FetchResult res;
				res.status_code = status;
				return complete(std::move(res));
			}
			outfile_.open(
				output_path_, std::ios::binary | std::ios::out | std::ios::trunc);
			if (!outfile_.is_open()) {
				close_stream();
				return complete(outcome::failure(errc::file_open_failed));
			}
		}

		read_body();
	}

	void read_body() {
		if (parser_->is_done()) { return on_body_done(); }

		beast::get_lowest_layer(*stream_).expires_after(kIoTimeout);

		parser_->get().body().data = buf_.data();
		parser_->get().body().size = buf_.size();

		with_stream([self = shared_from_this()](auto &s) {
			http::async_read(
				s, self->buffer_, *self->parser_,
				beast::bind_front_handler(&FetchSession::on_read_body, self));
		});
	}

	void on_read_body(beast::error_code ec, std::size_t) {
		if (ec == http::error::need_buffer) ec = {};
		if (ec) return fail(ec, "read_body");

		size_t bytes_read = buf_.size() - parser_->get().body().size;
		if (bytes_read > 0) {
			if (to_file()) {
				outfile_.write(buf_.data(), static_cast<std::streamsize>(bytes_read));
				if (!outfile_) {
					outfile_.close();
					close_stream();
					return complete(outcome::failure(errc::file_write_failed));
				}
			} else {
				body_.append(buf_.data(), bytes_read);
			}
			bytes_written_ += bytes_read;
		}

		read_body();
	}

	void on_body_done() {
		FetchResult res;
		res.status_code = static_cast<int>(parser_->get().result_int());
		res.bytes_written = bytes_written_;

		if (to_file()) {
			outfile_.close();
			if (outfile_.fail()) {
				close_stream();
				return complete(outcome::failure(errc::file_write_failed));
			}
		} else {
			std::string content_encoding;
			auto encoding_it = parser_->get().find(http::field::content_encoding);
			if (encoding_it != parser_->get().end()) {
				content_encoding = std::string(encoding_it->value());
			}
			res.body = decompress_body(body_, content_encoding);
		}

		close_stream();
		complete(std::move(res));
	}

	// The body is complete at this point; a failed TLS close_notify does not
	// matter, so the connection is simply torn down.
	void close_stream() {
		if (!stream_) return;
		beast::error_code ec;
		auto &lowest = beast::get_lowest_layer(*stream_);
		lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
		lowest.close();
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::debug("FetchSession error in {} for {}: {}", what,
					  url_text(), ec.message());
		if (outfile_.is_open()) outfile_.close();
		close_stream();
		complete(outcome::failure(make_error_code(errc::request_failed)));
	}

	void complete(Result<FetchResult> res) {
		if (completed_) return;
		completed_ = true;
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				std::move(cb)(std::move(res));
			});
	}
};

}  // namespace

HttpClient::HttpClient(asio::any_io_executor ex, std::string user_agent)
	: m_impl(std::make_unique<Impl>(std::move(ex), std::move(user_agent))) {}

HttpClient::~HttpClient() = default;

asio::any_io_executor HttpClient::get_executor() const { return m_impl->ex; }

void HttpClient::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

void HttpClient::async_get_impl(
	std::string url,
	asio::any_completion_handler<void(Result<HttpResponse>)> handler,
	CompletionExecutor handler_ex) {
	FetchHandler on_done = [handler = std::move(handler)](
							   Result<FetchResult> res) mutable {
		if (res.has_error()) {
			return std::move(handler)(outcome::failure(res.error()));
		}
		auto &r = res.value();
		std::move(handler)(HttpResponse{r.status_code, std::move(r.body)});
	};

	auto session = std::make_shared<FetchSession>(
		*m_impl, std::move(on_done), std::move(handler_ex), std::string{});
	m_impl->register_session(session);
	session->run(std::move(url));
}

void HttpClient::async_download_file_impl(
	std::string url, std::string output_path,
	asio::any_completion_handler<void(Result<std::uint64_t>)> handler,
	CompletionExecutor handler_ex) {
	FetchHandler on_done = [handler = std::move(handler), url](
							   Result<FetchResult> res) mutable {
		if (res.has_error()) {
			return std::move(handler)(outcome::failure(res.error()));
		}
		if (res.value().status_code != 200) {
			spdlog::debug("Received HTTP {} for {}", res.value().status_code,
						  url);
			return std::move(handler)(
				outcome::failure(make_error_code(errc::http_error)));
		}
		std::move(handler)(res.value().bytes_written);
	};

	auto session = std::make_shared<FetchSession>(
		*m_impl, std::move(on_done), std::move(handler_ex),
		std::move(output_path));
	m_impl->register_session(session);
	session->run(std::move(url));
}

}  // namespace hlsget::net
