#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <exception>
#include <filesystem>
#include <hlsget/downloader.hpp>
#include <hlsget/transport.hpp>
#include <optional>
#include <utility>

#include "download_context.hpp"
#include "fetch/fetch_pool.hpp"
#include "fetch/merger.hpp"
#include "manifest/resolver.hpp"

namespace fs = std::filesystem;

namespace hlsget {

std::string_view to_string(Downloader::Stage stage) {
	switch (stage) {
		case Downloader::Stage::init: return "init";
		case Downloader::Stage::resolving: return "resolving";
		case Downloader::Stage::fetching: return "fetching";
		case Downloader::Stage::merging: return "merging";
		case Downloader::Stage::done: return "done";
		case Downloader::Stage::interrupted: return "interrupted";
		case Downloader::Stage::failed: return "failed";
	}
	return "unknown";
}

struct Downloader::Impl : public std::enable_shared_from_this<Impl> {
	std::shared_ptr<net::Transport> transport;
	DownloadContext ctx;
	SegmentChannel queue;
	manifest::ManifestResolver resolver;
	std::atomic<Stage> stage{Stage::init};

	Impl(std::shared_ptr<net::Transport> t, DownloadOptions options)
		: transport(std::move(t)),
		  ctx(std::move(options), *transport),
		  queue(transport->get_executor(), ctx.options.queue_capacity),
		  resolver(ctx, queue) {}

	void start(ProgressCallback progress_cb,
			   asio::any_completion_handler<void(Result<fs::path>)> handler,
			   Downloader::CompletionExecutor handler_ex) {
		asio::spawn(
			transport->get_executor(),
			[self = shared_from_this(), progress_cb = std::move(progress_cb),
			 handler = std::move(handler),
			 handler_ex = std::move(handler_ex)](
				asio::yield_context yield) mutable {
				auto res = self->execute(std::move(progress_cb), yield);
				asio::dispatch(handler_ex, [h = std::move(handler),
											res = std::move(res)]() mutable {
					std::move(h)(std::move(res));
				});
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});
	}

	void stop() {
		if (ctx.stop_requested.exchange(true)) return;
		spdlog::info("Stopping, waiting for downloads in progress");
		resolver.stop();
		queue.close();
		save_checkpoint();
	}

	void set_stage(Stage s) {
		spdlog::debug("Stage: {} -> {}", to_string(stage.load()), to_string(s));
		stage = s;
	}

	void save_checkpoint() {
		if (auto r = ctx.persist(); r.has_error()) {
			spdlog::error("Failed to save checkpoint: {}", r.error().message());
		}
	}

	// A missing or unreadable checkpoint means a fresh run
	void load_checkpoint() {
		auto path = ctx.checkpoint_file();
		std::error_code ec;
		if (!fs::exists(path, ec)) return;

		if (auto r = ctx.state.load(path); r.has_error()) {
			spdlog::warn("Ignoring unreadable checkpoint {}: {}", path.string(),
						 r.error().message());
			return;
		}
		if (ctx.state.empty()) {
			spdlog::info("Checkpoint lists no segments, starting over");
		}
	}

	Result<fs::path> fail(std::error_code ec) {
		set_stage(Stage::failed);
		save_checkpoint();
		return outcome::failure(ec);
	}

	Result<fs::path> execute(ProgressCallback progress_cb,
							 asio::yield_context yield) {
		set_stage(Stage::init);
		spdlog::info("Downloading {} into {}", ctx.options.manifest_url,
					 ctx.output_dir.string());

		load_checkpoint();

		fetch::FetchPool pool(ctx, std::move(progress_cb));
		if (auto r = pool.prepare(); r.has_error()) return fail(r.error());

		if (ctx.stopping()) {
			set_stage(Stage::interrupted);
			save_checkpoint();
			return outcome::failure(errc::interrupted);
		}

		// Producer and consumer run side by side; the stage moves on to
		// fetching once the segment list is complete.
		set_stage(Stage::resolving);
		std::optional<Result<void>> resolved;
		asio::steady_timer resolver_done(
			yield.get_executor(), asio::steady_timer::time_point::max());

		asio::spawn(
			yield.get_executor(),
			[this, &resolved, &resolver_done](asio::yield_context ry) {
				resolved = resolver.run(ry);
				if (resolved->has_value() && stage == Stage::resolving) {
					set_stage(Stage::fetching);
				}
				resolver_done.cancel();
			},
			[](std::exception_ptr e) {
				if (e) std::rethrow_exception(e);
			});

		auto fetched = pool.run(queue, yield);

		while (!resolved) {
			boost::system::error_code ec;
			resolver_done.async_wait(yield[ec]);
		}

		save_checkpoint();

		if (ctx.stopping()) {
			set_stage(Stage::interrupted);
			spdlog::warn("Interrupted, progress saved to {}",
						 ctx.checkpoint_file().string());
			return outcome::failure(errc::interrupted);
		}

		if (resolved->has_error()) return fail(resolved->error());
		if (fetched.has_error()) return fail(fetched.error());

		auto missing = ctx.state.incomplete();
		if (!missing.empty()) {
			spdlog::error(
				"{} of {} segments could not be downloaded, run again to "
				"resume",
				missing.size(), ctx.state.size());
			return fail(make_error_code(errc::segments_incomplete));
		}

		set_stage(Stage::merging);
		auto merged = fetch::merge_segments(
			ctx.output_dir, ctx.state.order(), ctx.options.container_extension);
		if (merged.has_error()) return fail(merged.error());

		set_stage(Stage::done);
		return merged;
	}
};

Downloader::Downloader(std::shared_ptr<net::Transport> transport,
					   DownloadOptions options)
	: m_impl(std::make_shared<Impl>(std::move(transport), std::move(options))) {}

Downloader::Downloader(Downloader &&) noexcept = default;
Downloader &Downloader::operator=(Downloader &&) noexcept = default;
Downloader::~Downloader() = default;

asio::any_io_executor Downloader::get_executor() const {
	return m_impl->transport->get_executor();
}

void Downloader::async_download_impl(
	ProgressCallback progress_cb,
	asio::any_completion_handler<void(Result<fs::path>)> handler,
	CompletionExecutor handler_ex) {
	m_impl->start(
		std::move(progress_cb), std::move(handler), std::move(handler_ex));
}

void Downloader::request_stop() {
	asio::dispatch(
		m_impl->transport->get_executor(), [impl = m_impl] { impl->stop(); });
}

Result<void> Downloader::persist() { return m_impl->ctx.persist(); }

Downloader::Stage Downloader::stage() const { return m_impl->stage.load(); }

}  // namespace hlsget
