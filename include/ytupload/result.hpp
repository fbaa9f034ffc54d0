#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace ytupload {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Request validation
	missing_video_url = 1,
	missing_title,
	invalid_video_url,
	invalid_category,
	invalid_privacy,
	invalid_payload,

	// HTTP/Net errors
	request_failed = 10,
	timed_out,
	invalid_url,
	json_parse_error,

	// Source fetch
	fetch_failed = 20,
	source_not_found,
	source_http_error,
	fetch_interrupted,

	// OAuth token exchange
	missing_credentials = 30,
	credential_rejected,
	credential_expired,
	token_exchange_failed,

	// Upload session
	session_unauthorized = 40,
	quota_exceeded,
	session_rejected,
	session_failed,

	// Chunk transfer
	upload_rejected = 50,
	upload_retries_exhausted,
	upload_response_invalid,

	// Result store
	store_not_configured = 60,
	store_read_failed,
	store_write_failed,
	store_entry_not_found,

	// Callback
	notify_failed = 70,

	// I/O
	file_open_failed = 80,
	file_read_failed,
	file_write_failed,

	// Conversion
	invalid_number_format = 90,

	unknown = 100
};

YTUPLOAD_EXPORT std::error_code make_error_code(errc e);
YTUPLOAD_EXPORT const std::error_category &ytupload_category();

// Transport-level failures worth another attempt
YTUPLOAD_EXPORT bool is_transient(std::error_code ec);

// Credential problems an operator has to fix by rotating secrets
YTUPLOAD_EXPORT bool is_auth_error(std::error_code ec);

}  // namespace ytupload

namespace std {
template <>
struct is_error_code_enum<ytupload::errc> : true_type {};
}  // namespace std

namespace ytupload {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ytupload
