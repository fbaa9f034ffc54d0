#include <string>
#include <ytupload/result.hpp>

namespace ytupload {

struct ytupload_error_category : std::error_category {
	const char *name() const noexcept override { return "ytupload"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::missing_video_url: return "video_url is required";
			case errc::missing_title: return "title is required";
			case errc::invalid_video_url:
				return "video_url is not a valid http(s) URL";
			case errc::invalid_category: return "Unknown YouTube category id";
			case errc::invalid_privacy:
				return "privacy must be one of private, public, unlisted";
			case errc::invalid_payload: return "Malformed trigger payload";
			case errc::request_failed: return "Request failed";
			case errc::timed_out: return "Request timed out";
			case errc::invalid_url: return "Invalid URL";
			case errc::json_parse_error: return "JSON parse error";
			case errc::fetch_failed: return "Source video is unreachable";
			case errc::source_not_found:
				return "Source video not found (HTTP 404)";
			case errc::source_http_error:
				return "Source server returned an HTTP error";
			case errc::fetch_interrupted:
				return "Source transfer was interrupted";
			case errc::missing_credentials:
				return "YouTube OAuth credentials are not configured";
			case errc::credential_rejected:
				return "OAuth client credentials were rejected";
			case errc::credential_expired:
				return "Refresh token expired or revoked, obtain a new one";
			case errc::token_exchange_failed:
				return "Access token exchange failed";
			case errc::session_unauthorized:
				return "YouTube API rejected the access token";
			case errc::quota_exceeded: return "YouTube API quota exceeded";
			case errc::session_rejected:
				return "YouTube API rejected the upload session";
			case errc::session_failed:
				return "Could not open an upload session";
			case errc::upload_rejected:
				return "YouTube API rejected the uploaded data";
			case errc::upload_retries_exhausted:
				return "Upload retries exhausted";
			case errc::upload_response_invalid:
				return "Upload finished without a video id";
			case errc::store_not_configured:
				return "Result store is not configured";
			case errc::store_read_failed: return "Result store read failed";
			case errc::store_write_failed: return "Result store write failed";
			case errc::store_entry_not_found:
				return "Result store entry not found";
			case errc::notify_failed: return "Callback delivery failed";
			case errc::file_open_failed: return "File open failed";
			case errc::file_read_failed: return "File read failed";
			case errc::file_write_failed: return "File write failed";
			case errc::invalid_number_format: return "Invalid number format";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ytupload_category() {
	static ytupload_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ytupload_category()};
}

bool is_transient(std::error_code ec) {
	return ec == errc::request_failed || ec == errc::timed_out;
}

bool is_auth_error(std::error_code ec) {
	return ec == errc::missing_credentials ||
		   ec == errc::credential_rejected ||
		   ec == errc::credential_expired ||
		   ec == errc::token_exchange_failed ||
		   ec == errc::session_unauthorized;
}

}  // namespace ytupload
