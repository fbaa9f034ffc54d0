#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <ytupload/result.hpp>
#include <ytupload/retry_policy.hpp>
#include <ytupload/types.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload::youtube {

namespace asio = boost::asio;

class OAuthTokenProvider;

enum class UploadState { init, session_open, chunk_send, finalize, done, error };

YTUPLOAD_EXPORT std::string_view to_string(UploadState s);

struct YTUPLOAD_EXPORT UploadedVideo {
	std::string video_id;
	std::string video_url;
};

struct YTUPLOAD_EXPORT UploaderOptions {
	std::string upload_url;
	std::uint64_t chunk_size = 1024 * 1024;	 // multiple of 256 KiB
	RetryPolicy retry;
	std::chrono::seconds request_timeout{60};
	std::chrono::seconds chunk_timeout{300};
	std::string content_type = "video/*";
};

// Drives the YouTube resumable upload protocol:
//
//   INIT -> SESSION_OPEN -> CHUNK_SEND* -> FINALIZE -> DONE
//
// with ERROR reachable from every step. Chunks are read from disk at the
// offset the server last acknowledged, so at most one chunk is held in
// memory and acknowledged bytes are never sent twice.
class YTUPLOAD_EXPORT ResumableUploader {
   public:
	ResumableUploader(std::shared_ptr<net::Transport> transport,
					  OAuthTokenProvider &auth, UploaderOptions options);

	Result<UploadedVideo> upload(const std::filesystem::path &file,
								 const UploadRequest &request,
								 asio::yield_context yield,
								 const ProgressCallback &progress_cb = {});

	[[nodiscard]] UploadState state() const { return state_; }

	/// Payload bytes put on the wire, retransmissions included
	[[nodiscard]] std::uint64_t bytes_transmitted() const {
		return bytes_transmitted_;
	}

   private:
	Result<std::string> open_session(const std::string &token,
									 std::uint64_t total,
									 const UploadRequest &request,
									 asio::yield_context yield);

	Result<UploadedVideo> finalize(const std::string &body);

	void backoff(int attempt, asio::yield_context yield);
	void transition(UploadState next);
	std::error_code fail(errc e);

	std::shared_ptr<net::Transport> transport_;
	OAuthTokenProvider &auth_;
	UploaderOptions options_;
	std::mt19937 rng_{std::random_device{}()};

	UploadState state_ = UploadState::init;
	std::uint64_t bytes_transmitted_ = 0;
};

}  // namespace ytupload::youtube
