#include "video_resource.hpp"

#include <array>

#include "utils.hpp"

namespace ytupload::youtube {

namespace {

// 403 reasons that mean "come back tomorrow" rather than "not allowed"
constexpr std::array<std::string_view, 5> kQuotaReasons = {
	"quotaExceeded", "uploadLimitExceeded", "dailyLimitExceeded",
	"rateLimitExceeded", "userRateLimitExceeded"};

}  // namespace

nlohmann::json VideoResource::build(const UploadRequest &req) {
	nlohmann::json body = {
		{"snippet",
		 {{"title", req.title},
		  {"description", req.description},
		  {"tags", req.tags},
		  {"categoryId", req.category_id}}},
		{"status",
		 {{"privacyStatus", std::string(to_string(req.privacy))},
		  {"selfDeclaredMadeForKids", false}}}};
	return body;
}

std::map<std::string, std::string> VideoResource::session_headers(
	const std::string &access_token, std::uint64_t content_length,
	std::string_view content_type) {
	return {{"Authorization", "Bearer " + access_token},
			{"Content-Type", "application/json; charset=UTF-8"},
			{"X-Upload-Content-Length", std::to_string(content_length)},
			{"X-Upload-Content-Type", std::string(content_type)}};
}

std::string VideoResource::error_reason(const std::string &body) {
	auto j = nlohmann::json::parse(body, nullptr, false);
	if (j.is_discarded()) return {};
	return utils::traverse_obj_default<std::string>(
		j, {"error", "errors", 0, "reason"}, "");
}

std::string VideoResource::error_message(const std::string &body) {
	auto j = nlohmann::json::parse(body, nullptr, false);
	if (j.is_discarded()) return {};
	return utils::traverse_obj_default<std::string>(
		j, {"error", "message"}, "");
}

ApiFailure VideoResource::classify(int status_code, const std::string &body) {
	if (status_code == 429 || status_code >= 500) return ApiFailure::transient;
	if (status_code == 401) return ApiFailure::unauthorized;
	if (status_code == 403) {
		auto reason = error_reason(body);
		for (auto q : kQuotaReasons) {
			if (reason == q) return ApiFailure::quota;
		}
		return ApiFailure::forbidden;
	}
	if (status_code == 404 || status_code == 410) return ApiFailure::gone;
	return ApiFailure::rejected;
}

std::optional<std::uint64_t> VideoResource::next_offset(
	std::string_view range) {
	range = utils::trim(range);
	constexpr std::string_view kPrefix = "bytes=";
	if (range.substr(0, kPrefix.size()) == kPrefix) {
		range.remove_prefix(kPrefix.size());
	}
	auto dash = range.find('-');
	if (dash == std::string_view::npos) return std::nullopt;

	auto first = utils::to_u64(range.substr(0, dash));
	auto last = utils::to_u64(range.substr(dash + 1));
	if (!first || !last || first.value() != 0 || last.value() < first.value()) {
		return std::nullopt;
	}
	return last.value() + 1;
}

}  // namespace ytupload::youtube
