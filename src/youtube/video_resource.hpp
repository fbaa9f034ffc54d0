#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <ytupload/types.hpp>

namespace ytupload::youtube {

enum class ApiFailure {
	transient,		// 5xx, 429: try again
	unauthorized,	// 401
	quota,			// 403 quota / rate limit reasons
	forbidden,		// other 403
	gone,			// 404, 410: upload session no longer exists
	rejected		// any other 4xx
};

class VideoResource {
   public:
	/// videos.insert body: snippet + status parts
	static nlohmann::json build(const UploadRequest &req);

	/// Headers for the resumable session initiation request
	static std::map<std::string, std::string> session_headers(
		const std::string &access_token, std::uint64_t content_length,
		std::string_view content_type);

	/// First "reason" of a Google API error body, e.g. "quotaExceeded"
	static std::string error_reason(const std::string &body);

	/// Human readable error message from a Google API error body
	static std::string error_message(const std::string &body);

	static ApiFailure classify(int status_code, const std::string &body);

	/// "bytes=0-1048575" -> 1048576 (next offset to send). nullopt when the
	/// header is malformed.
	static std::optional<std::uint64_t> next_offset(std::string_view range);
};

}  // namespace ytupload::youtube
