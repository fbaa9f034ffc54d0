#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <boost/url/parse.hpp>
#include <ytupload/request.hpp>

#include "utils.hpp"

namespace ytupload {

namespace {

// Category ids accepted by the YouTube Data API for videos.insert
constexpr std::array<std::string_view, 32> kCategoryIds = {
	"1",  "2",	"10", "15", "17", "18", "19", "20", "21", "22", "23",
	"24", "25", "26", "27", "28", "29", "30", "31", "32", "33", "34",
	"35", "36", "37", "38", "39", "40", "41", "42", "43", "44"};

std::string string_field(const nlohmann::json &j, const char *key) {
	auto it = j.find(key);
	if (it == j.end() || it->is_null()) return {};
	if (it->is_string()) return it->get<std::string>();
	if (it->is_number_integer()) return std::to_string(it->get<long long>());
	return {};
}

std::optional<std::string> non_empty(std::string_view sv) {
	auto t = utils::trim(sv);
	if (t.empty()) return std::nullopt;
	return std::string(t);
}

}  // namespace

std::string_view to_string(Privacy p) {
	switch (p) {
		case Privacy::public_: return "public";
		case Privacy::unlisted: return "unlisted";
		case Privacy::private_:
		default: return "private";
	}
}

std::optional<Privacy> parse_privacy(std::string_view s) {
	auto v = utils::to_lower(utils::trim(s));
	if (v == "private") return Privacy::private_;
	if (v == "public") return Privacy::public_;
	if (v == "unlisted") return Privacy::unlisted;
	return std::nullopt;
}

std::string watch_url(std::string_view video_id) {
	std::string url(kWatchUrlBase);
	url += video_id;
	return url;
}

UploadOutcome UploadOutcome::succeeded(const UploadRequest &req,
									   std::string video_id,
									   std::string timestamp) {
	UploadOutcome o;
	o.success = true;
	o.video_url = watch_url(video_id);
	o.video_id = std::move(video_id);
	o.title = req.title;
	o.unique_id = req.unique_id;
	o.timestamp = std::move(timestamp);
	return o;
}

UploadOutcome UploadOutcome::failed(const UploadRequest &req,
									std::string error, std::string timestamp) {
	UploadOutcome o;
	o.success = false;
	o.error = std::move(error);
	o.title = req.title;
	o.unique_id = req.unique_id;
	o.timestamp = std::move(timestamp);
	return o;
}

std::vector<std::string> parse_tags(std::string_view csv) {
	std::vector<std::string> tags;
	for (const auto &part : utils::split(csv, ',')) {
		auto t = utils::trim(part);
		if (!t.empty()) tags.emplace_back(t);
	}
	return tags;
}

bool is_known_category(std::string_view category_id) {
	return std::find(kCategoryIds.begin(), kCategoryIds.end(), category_id) !=
		   kCategoryIds.end();
}

bool is_http_url(std::string_view url) {
	auto u = boost::urls::parse_absolute_uri(url);
	if (u.has_error()) return false;
	auto scheme = utils::to_lower(u->scheme());
	return (scheme == "http" || scheme == "https") && !u->host().empty();
}

Result<TriggerPayload> parse_trigger_payload(std::string_view json_text) {
	auto j = nlohmann::json::parse(
		json_text.begin(), json_text.end(), nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		spdlog::error("Trigger payload is not a JSON object");
		return outcome::failure(errc::invalid_payload);
	}

	// Some triggers nest the inputs under "inputs" or "client_payload"
	for (const char *wrapper : {"inputs", "client_payload"}) {
		auto it = j.find(wrapper);
		if (it != j.end() && it->is_object()) {
			nlohmann::json inner = *it;
			j = std::move(inner);
			break;
		}
	}

	TriggerPayload p;
	p.video_url = string_field(j, "video_url");
	p.title = string_field(j, "title");
	p.description = string_field(j, "description");
	p.category_id = string_field(j, "category_id");
	p.privacy = string_field(j, "privacy");
	p.unique_id = string_field(j, "unique_id");
	p.callback_url = string_field(j, "callback_url");

	auto tags_it = j.find("tags");
	if (tags_it != j.end() && tags_it->is_array()) {
		// Array entries are whole tags, commas included
		for (const auto &t : *tags_it) {
			if (t.is_string()) p.tags.push_back(t.get<std::string>());
		}
	} else {
		p.tags = parse_tags(string_field(j, "tags"));
	}
	return p;
}

Result<UploadRequest> make_upload_request(const TriggerPayload &payload) {
	UploadRequest req;

	auto video_url = non_empty(payload.video_url);
	if (!video_url) return outcome::failure(errc::missing_video_url);
	if (!is_http_url(*video_url)) {
		return outcome::failure(errc::invalid_video_url);
	}
	req.video_url = std::move(*video_url);

	auto title = non_empty(payload.title);
	if (!title) return outcome::failure(errc::missing_title);
	req.title = std::move(*title);

	req.description = payload.description;
	for (const auto &tag : payload.tags) {
		auto t = utils::trim(tag);
		if (!t.empty()) req.tags.emplace_back(t);
	}

	if (auto category = non_empty(payload.category_id)) {
		if (!is_known_category(*category)) {
			return outcome::failure(errc::invalid_category);
		}
		req.category_id = std::move(*category);
	}

	if (non_empty(payload.privacy)) {
		auto privacy = parse_privacy(payload.privacy);
		if (!privacy) return outcome::failure(errc::invalid_privacy);
		req.privacy = *privacy;
	}

	req.unique_id = non_empty(payload.unique_id);

	if (auto callback = non_empty(payload.callback_url)) {
		if (!is_http_url(*callback)) {
			return outcome::failure(errc::invalid_url);
		}
		req.callback_url = std::move(callback);
	}

	return req;
}

void to_json(nlohmann::json &j, const UploadOutcome &o) {
	j = nlohmann::json::object();
	j["success"] = o.success;
	if (o.video_id) j["video_id"] = *o.video_id;
	if (o.video_url) j["video_url"] = *o.video_url;
	if (o.error) j["error"] = *o.error;
	j["title"] = o.title;
	if (o.unique_id) j["unique_id"] = *o.unique_id;
	j["timestamp"] = o.timestamp;
}

Result<UploadOutcome> outcome_from_json(const nlohmann::json &j) {
	if (!j.is_object()) return outcome::failure(errc::json_parse_error);

	auto success = utils::traverse_obj<bool>(j, {"success"});
	auto timestamp = utils::traverse_obj<std::string>(j, {"timestamp"});
	if (!success || !timestamp) {
		return outcome::failure(errc::json_parse_error);
	}

	UploadOutcome o;
	o.success = *success;
	o.video_id = utils::traverse_obj<std::string>(j, {"video_id"});
	o.video_url = utils::traverse_obj<std::string>(j, {"video_url"});
	o.error = utils::traverse_obj<std::string>(j, {"error"});
	o.title = utils::traverse_obj_default<std::string>(j, {"title"}, "");
	o.unique_id = utils::traverse_obj<std::string>(j, {"unique_id"});
	o.timestamp = std::move(*timestamp);
	return o;
}

}  // namespace ytupload
