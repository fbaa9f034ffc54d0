#include <spdlog/spdlog.h>

#include <exception>
#include <fmt/format.h>
#include <string>
#include <ytupload/auth.hpp>
#include <ytupload/fetcher.hpp>
#include <ytupload/notifier.hpp>
#include <ytupload/orchestrator.hpp>
#include <ytupload/result_store.hpp>
#include <ytupload/uploader.hpp>

#include "utils.hpp"

namespace ytupload {

namespace {

std::shared_ptr<store::ResultStore> make_store(
	const std::shared_ptr<net::Transport> &transport, const Config &config) {
	if (!config.store.configured()) return nullptr;
	return std::make_shared<store::GistResultStore>(
		transport, config.store, config.endpoints.gist_api_url,
		config.request_timeout);
}

// Credential problems are reported separately from the upload itself
std::string_view upload_stage(std::error_code ec) {
	return is_auth_error(ec) ? "auth" : "upload";
}

std::string stage_error(std::string_view stage, std::error_code ec) {
	return fmt::format("{}: {}", stage, ec.message());
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<net::Transport> transport,
						   Config config)
	: transport_(std::move(transport)), config_(std::move(config)) {
	store_ = make_store(transport_, config_);
}

Orchestrator::Orchestrator(std::shared_ptr<net::Transport> transport,
						   Config config,
						   std::shared_ptr<store::ResultStore> store)
	: transport_(std::move(transport)),
	  config_(std::move(config)),
	  store_(std::move(store)) {}

std::string Orchestrator::now_iso8601() const {
	return utils::format_iso8601(clock_());
}

OrchestrationReport Orchestrator::run(const UploadRequest &request,
									  asio::yield_context yield,
									  const ProgressCallback &progress_cb) {
	OrchestrationReport report;

	try {
		report.outcome = produce_outcome(request, yield, progress_cb);
	} catch (const std::exception &e) {
		spdlog::error("Unexpected error: {}", e.what());
		report.outcome = UploadOutcome::failed(
			request, fmt::format("internal: {}", e.what()), now_iso8601());
	}

	try {
		deliver(request, report, yield);
	} catch (const std::exception &e) {
		spdlog::error("Unexpected error while delivering result: {}", e.what());
		if (request.unique_id && !report.store_error) {
			report.store_error = make_error_code(errc::unknown);
		}
	}

	try {
		sweep(report, yield);
	} catch (const std::exception &e) {
		spdlog::error("Unexpected error while sweeping: {}", e.what());
		report.sweep_error = make_error_code(errc::unknown);
	}

	return report;
}

UploadOutcome Orchestrator::produce_outcome(const UploadRequest &request,
											asio::yield_context yield,
											const ProgressCallback &progress_cb) {
	if (!config_.credentials.complete()) {
		spdlog::error("YouTube credentials are not configured");
		return UploadOutcome::failed(
			request,
			stage_error("auth", make_error_code(errc::missing_credentials)),
			now_iso8601());
	}

	Fetcher fetcher(transport_, config_.scratch_dir);
	auto fetched = fetcher.fetch(request.video_url, yield, progress_cb);
	if (fetched.has_error()) {
		return UploadOutcome::failed(
			request, stage_error("fetch", fetched.error()), now_iso8601());
	}

	youtube::OAuthTokenProvider auth(transport_, config_.credentials,
									 config_.endpoints.token_url,
									 config_.request_timeout);

	youtube::UploaderOptions options;
	options.upload_url = config_.endpoints.upload_url;
	options.chunk_size = config_.chunk_size;
	options.retry = config_.retry;
	options.request_timeout = config_.request_timeout;
	options.chunk_timeout = config_.chunk_timeout;

	youtube::ResumableUploader uploader(transport_, auth, options);
	auto uploaded = uploader.upload(fetched.value().file.path(), request, yield,
									progress_cb);

	// Scratch copy is no longer needed, whatever happened
	fetched.value().file.remove();

	if (uploaded.has_error()) {
		return UploadOutcome::failed(
			request,
			stage_error(upload_stage(uploaded.error()), uploaded.error()),
			now_iso8601());
	}

	spdlog::info("Upload successful! Video ID: {}", uploaded.value().video_id);
	return UploadOutcome::succeeded(request, uploaded.value().video_id,
									now_iso8601());
}

void Orchestrator::deliver(const UploadRequest &request,
						   OrchestrationReport &report,
						   asio::yield_context yield) {
	if (request.callback_url) {
		Notifier notifier(transport_, config_.callback_timeout);
		auto sent = notifier.notify(*request.callback_url, report.outcome, yield);
		if (sent.has_error()) report.notify_error = sent.error();
	}

	if (request.unique_id) {
		if (!store_) {
			spdlog::warn("No result store configured; {} not saved",
						 store::entry_filename(*request.unique_id));
			report.store_error = make_error_code(errc::store_not_configured);
		} else {
			auto saved = store_->put(*request.unique_id, report.outcome, yield);
			if (saved.has_error()) report.store_error = saved.error();
		}
	}
}

void Orchestrator::sweep(OrchestrationReport &report,
						 asio::yield_context yield) {
	if (!store_) {
		spdlog::debug("No result store configured; skipping sweep");
		return;
	}

	store::Sweeper sweeper(*store_, config_.retention);
	auto swept = sweeper.sweep(clock_(), yield);
	if (swept.has_error()) {
		spdlog::warn("Cleanup of old results failed: {}",
					 swept.error().message());
		report.sweep_error = swept.error();
		return;
	}
	report.sweep = swept.value();
}

}  // namespace ytupload
