#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <ytupload/auth.hpp>
#include <ytupload/http_client.hpp>
#include <ytupload/uploader.hpp>

#include "utils.hpp"
#include "video_resource.hpp"

namespace ytupload::youtube {

namespace fs = std::filesystem;

namespace {

// What a status query (or a 308) told us about the session
struct ChunkAck {
	std::optional<std::uint64_t> offset;  // next byte the server expects
};

std::optional<std::uint64_t> acknowledged_offset(
	const net::HttpResponse &resp) {
	auto range = resp.header("range");
	// No Range header: nothing has been persisted yet
	if (!range) return std::uint64_t{0};
	return VideoResource::next_offset(*range);
}

}  // namespace

std::string_view to_string(UploadState s) {
	switch (s) {
		case UploadState::init: return "INIT";
		case UploadState::session_open: return "SESSION_OPEN";
		case UploadState::chunk_send: return "CHUNK_SEND";
		case UploadState::finalize: return "FINALIZE";
		case UploadState::done: return "DONE";
		case UploadState::error:
		default: return "ERROR";
	}
}

ResumableUploader::ResumableUploader(std::shared_ptr<net::Transport> transport,
									 OAuthTokenProvider &auth,
									 UploaderOptions options)
	: transport_(std::move(transport)),
	  auth_(auth),
	  options_(std::move(options)) {}

void ResumableUploader::transition(UploadState next) {
	spdlog::debug("Upload state {} -> {}", to_string(state_), to_string(next));
	state_ = next;
}

std::error_code ResumableUploader::fail(errc e) {
	auto ec = make_error_code(e);
	spdlog::error("Upload failed in {}: {}", to_string(state_), ec.message());
	state_ = UploadState::error;
	return ec;
}

void ResumableUploader::backoff(int attempt, asio::yield_context yield) {
	auto delay = options_.retry.delay_for(attempt, rng_);
	if (delay.count() <= 0) return;

	spdlog::info("Retrying in {} ms (attempt {}/{})", delay.count(),
				 attempt + 1, options_.retry.max_attempts);
	asio::steady_timer timer(yield.get_executor());
	timer.expires_after(delay);
	boost::system::error_code ec;
	timer.async_wait(yield[ec]);
}

Result<std::string> ResumableUploader::open_session(
	const std::string &token, std::uint64_t total,
	const UploadRequest &request, asio::yield_context yield) {
	const std::string url =
		options_.upload_url + "?uploadType=resumable&part=snippet,status";
	const std::string body = VideoResource::build(request).dump();

	for (int attempt = 1;; ++attempt) {
		net::HttpRequest req;
		req.method = net::Method::post;
		req.url = url;
		req.headers =
			VideoResource::session_headers(token, total, options_.content_type);
		req.body = body;
		req.timeout = options_.request_timeout;

		auto res = transport_->async_send(std::move(req), yield);
		if (res.has_value()) {
			const auto &resp = res.value();
			if (resp.ok()) {
				auto location = resp.header("location");
				if (!location || location->empty()) {
					spdlog::error("Session response carries no Location");
					return fail(errc::session_failed);
				}
				return *location;
			}

			auto reason = VideoResource::error_reason(resp.body);
			spdlog::warn("Session initiation returned HTTP {} {} {}",
						 resp.status_code, reason,
						 VideoResource::error_message(resp.body));
			switch (VideoResource::classify(resp.status_code, resp.body)) {
				case ApiFailure::unauthorized:
					return fail(errc::session_unauthorized);
				case ApiFailure::quota: return fail(errc::quota_exceeded);
				case ApiFailure::forbidden:
				case ApiFailure::gone:
				case ApiFailure::rejected: return fail(errc::session_rejected);
				case ApiFailure::transient: break;
			}
		} else if (!is_transient(res.error())) {
			return fail(errc::session_failed);
		} else {
			spdlog::warn("Session initiation failed: {}",
						 res.error().message());
		}

		if (attempt >= options_.retry.max_attempts) {
			return fail(errc::session_failed);
		}
		backoff(attempt, yield);
	}
}

Result<UploadedVideo> ResumableUploader::finalize(const std::string &body) {
	transition(UploadState::finalize);

	auto j = nlohmann::json::parse(body, nullptr, false);
	if (j.is_discarded()) return fail(errc::upload_response_invalid);

	auto id = utils::traverse_obj<std::string>(j, {"id"});
	if (!id || id->empty()) return fail(errc::upload_response_invalid);

	transition(UploadState::done);
	return UploadedVideo{*id, watch_url(*id)};
}

Result<UploadedVideo> ResumableUploader::upload(
	const fs::path &file, const UploadRequest &request,
	asio::yield_context yield, const ProgressCallback &progress_cb) {
	state_ = UploadState::init;
	bytes_transmitted_ = 0;

	std::error_code fs_ec;
	const std::uint64_t total = fs::file_size(file, fs_ec);
	if (fs_ec || total == 0) return fail(errc::file_read_failed);

	std::ifstream in(file, std::ios::binary);
	if (!in.is_open()) return fail(errc::file_open_failed);

	auto token = auth_.access_token(yield);
	if (token.has_error()) {
		state_ = UploadState::error;
		return token.error();
	}

	spdlog::info("Uploading video to YouTube...");
	spdlog::info("  Title: {}", request.title);
	spdlog::info("  Privacy: {}", to_string(request.privacy));

	transition(UploadState::session_open);
	auto session = open_session(token.value(), total, request, yield);
	if (session.has_error()) return session.error();
	const std::string session_url = std::move(session).value();

	transition(UploadState::chunk_send);

	auto report = [&](std::uint64_t done) {
		if (!progress_cb) return;
		TransferProgress p;
		p.bytes_done = done;
		p.bytes_total = total;
		p.percentage =
			static_cast<double>(done) / static_cast<double>(total) * 100.0;
		progress_cb("uploading", p);
	};

	std::uint64_t offset = 0;
	int failures = 0;
	std::string chunk;

	while (true) {
		if (offset == total) {
			// Every byte is acknowledged but the resource was not returned:
			// only a status query can finalize the session
			if (++failures > options_.retry.max_attempts) {
				return fail(errc::upload_retries_exhausted);
			}
			if (failures > 1) backoff(failures - 1, yield);
		} else {
			const std::uint64_t len =
				std::min(options_.chunk_size, total - offset);
			chunk.resize(len);
			in.clear();
			in.seekg(static_cast<std::streamoff>(offset));
			in.read(chunk.data(), static_cast<std::streamsize>(len));
			if (!in) return fail(errc::file_read_failed);

			net::HttpRequest req;
			req.method = net::Method::put;
			req.url = session_url;
			req.headers = {
				{"Content-Type", options_.content_type},
				{"Content-Range", fmt::format("bytes {}-{}/{}", offset,
											  offset + len - 1, total)}};
			req.body = chunk;
			req.timeout = options_.chunk_timeout;

			spdlog::debug("Sending bytes {}-{}/{}", offset, offset + len - 1,
						  total);
			bytes_transmitted_ += len;
			auto res = transport_->async_send(std::move(req), yield);

			ChunkAck ack;
			if (res.has_value()) {
				const auto &resp = res.value();
				if (resp.status_code == 200 || resp.status_code == 201) {
					report(total);
					return finalize(resp.body);
				}
				if (resp.status_code == 308) {
					ack.offset = acknowledged_offset(resp);
				} else {
					spdlog::warn("Chunk upload returned HTTP {} {}",
								 resp.status_code,
								 VideoResource::error_message(resp.body));
					switch (
						VideoResource::classify(resp.status_code, resp.body)) {
						case ApiFailure::unauthorized:
							return fail(errc::session_unauthorized);
						case ApiFailure::quota:
							return fail(errc::quota_exceeded);
						case ApiFailure::forbidden:
						case ApiFailure::gone:
						case ApiFailure::rejected:
							return fail(errc::upload_rejected);
						case ApiFailure::transient: break;
					}
				}
			} else if (!is_transient(res.error())) {
				return fail(errc::upload_rejected);
			} else {
				spdlog::warn("Chunk upload failed: {}", res.error().message());
			}

			if (ack.offset && *ack.offset > total) {
				spdlog::error("Server acknowledged {} of {} bytes",
							  *ack.offset, total);
				return fail(errc::upload_response_invalid);
			}

			// Resume from whatever the server reports as durably received
			if (ack.offset && *ack.offset > offset) {
				offset = *ack.offset;
				failures = 0;
				report(offset);
				continue;
			}
			if (ack.offset) {
				spdlog::warn("Server acknowledged no new bytes (offset {})",
							 *ack.offset);
				offset = *ack.offset;
			}

			if (++failures >= options_.retry.max_attempts) {
				return fail(errc::upload_retries_exhausted);
			}
			backoff(failures, yield);
		}

		// Ask the server how much it has before sending again
		net::HttpRequest status_req;
		status_req.method = net::Method::put;
		status_req.url = session_url;
		status_req.headers = {
			{"Content-Range", fmt::format("bytes */{}", total)}};
		status_req.timeout = options_.request_timeout;

		auto status = transport_->async_send(std::move(status_req), yield);
		if (status.has_error()) {
			spdlog::warn("Session status query failed: {}",
						 status.error().message());
			continue;
		}

		const auto &sresp = status.value();
		if (sresp.status_code == 200 || sresp.status_code == 201) {
			report(total);
			return finalize(sresp.body);
		}
		if (sresp.status_code == 308) {
			auto acked = acknowledged_offset(sresp);
			if (acked && *acked <= total) {
				if (*acked != offset) {
					spdlog::info("Resuming upload at byte {}", *acked);
				}
				if (*acked > offset) failures = 0;
				offset = *acked;
				report(offset);
			}
			continue;
		}

		switch (VideoResource::classify(sresp.status_code, sresp.body)) {
			case ApiFailure::unauthorized:
				return fail(errc::session_unauthorized);
			case ApiFailure::quota: return fail(errc::quota_exceeded);
			case ApiFailure::forbidden:
			case ApiFailure::gone:
			case ApiFailure::rejected: return fail(errc::upload_rejected);
			case ApiFailure::transient: break;
		}
	}
}

}  // namespace ytupload::youtube
