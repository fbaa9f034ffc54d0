#pragma once

#include <ytupload/ytupload_export.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytupload/result.hpp>
#include <ytupload/types.hpp>

namespace ytupload {

// Raw trigger fields before validation. Empty strings mean "not given".
struct YTUPLOAD_EXPORT TriggerPayload {
	std::string video_url;
	std::string title;
	std::string description;
	std::vector<std::string> tags;	// trimmed, empty entries dropped later
	std::string category_id;
	std::string privacy;
	std::string unique_id;
	std::string callback_url;
};

/// Parse a workflow trigger payload. `tags` may be either a comma separated
/// string or an array of strings; array entries are never split.
YTUPLOAD_EXPORT Result<TriggerPayload> parse_trigger_payload(
	std::string_view json_text);

/// Validate raw fields and build the immutable request.
/// Fails before any network traffic when a required field is missing.
YTUPLOAD_EXPORT Result<UploadRequest> make_upload_request(
	const TriggerPayload &payload);

/// "a, b,,c " -> {"a", "b", "c"}
YTUPLOAD_EXPORT std::vector<std::string> parse_tags(std::string_view csv);

YTUPLOAD_EXPORT bool is_known_category(std::string_view category_id);

/// Absolute http/https URL with a host
YTUPLOAD_EXPORT bool is_http_url(std::string_view url);

// JSON Serialization
YTUPLOAD_EXPORT void to_json(nlohmann::json &j, const UploadOutcome &o);
YTUPLOAD_EXPORT Result<UploadOutcome> outcome_from_json(
	const nlohmann::json &j);

}  // namespace ytupload
