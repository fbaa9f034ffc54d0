#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <ytupload/config.hpp>
#include <ytupload/result.hpp>
#include <ytupload/sweeper.hpp>
#include <ytupload/types.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload::store {
class ResultStore;
}  // namespace ytupload::store

namespace ytupload {

namespace asio = boost::asio;

// Everything one run produced. `outcome` is what callers and the result
// store see; the channel errors let a caller tell "uploaded but not
// recorded" apart from "upload failed".
struct YTUPLOAD_EXPORT OrchestrationReport {
	UploadOutcome outcome;
	std::optional<std::error_code> notify_error;
	std::optional<std::error_code> store_error;
	std::optional<std::error_code> sweep_error;
	std::optional<store::SweepReport> sweep;
};

class YTUPLOAD_EXPORT Orchestrator {
   public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	/// Uses a GistResultStore when the config names one
	Orchestrator(std::shared_ptr<net::Transport> transport, Config config);

	/// Uses the given store (may be null: no store configured)
	Orchestrator(std::shared_ptr<net::Transport> transport, Config config,
				 std::shared_ptr<store::ResultStore> store);

	/// fetch -> upload -> notify / store -> sweep. Never throws.
	OrchestrationReport run(const UploadRequest &request,
							asio::yield_context yield,
							const ProgressCallback &progress_cb = {});

	void set_clock(Clock clock) { clock_ = std::move(clock); }

   private:
	UploadOutcome produce_outcome(const UploadRequest &request,
								  asio::yield_context yield,
								  const ProgressCallback &progress_cb);

	void deliver(const UploadRequest &request, OrchestrationReport &report,
				 asio::yield_context yield);

	void sweep(OrchestrationReport &report, asio::yield_context yield);

	[[nodiscard]] std::string now_iso8601() const;

	std::shared_ptr<net::Transport> transport_;
	Config config_;
	std::shared_ptr<store::ResultStore> store_;
	Clock clock_ = [] { return std::chrono::system_clock::now(); };
};

}  // namespace ytupload
