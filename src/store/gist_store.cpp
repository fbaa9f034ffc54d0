#include <spdlog/spdlog.h>

#include <ytupload/http_client.hpp>
#include <ytupload/request.hpp>
#include <ytupload/result_store.hpp>

#include "utils.hpp"

namespace ytupload::store {

namespace {

constexpr const char *kGistDescription = "YouTube Upload Results Storage";

constexpr const char *kReadmeContent =
	"# YouTube Upload Results\n\n"
	"This Gist stores the results of YouTube video uploads.\n\n"
	"Files are managed automatically:\n"
	"- New results are added as `youtube-upload-{unique_id}.json`\n"
	"- Results older than 24 hours are deleted\n\n"
	"Do not manually edit or delete this Gist.";

net::HttpRequest api_request(net::Method method, std::string url,
							 const std::string &token,
							 std::chrono::seconds timeout) {
	net::HttpRequest req;
	req.method = method;
	req.url = std::move(url);
	req.headers = {{"Authorization", "Bearer " + token},
				   {"Accept", "application/vnd.github+json"},
				   {"X-GitHub-Api-Version", "2022-11-28"}};
	if (method != net::Method::get) {
		req.headers["Content-Type"] = "application/json";
	}
	req.timeout = timeout;
	return req;
}

std::string trim_slash(std::string url) {
	while (!url.empty() && url.back() == '/') url.pop_back();
	return url;
}

}  // namespace

std::string entry_filename(std::string_view unique_id) {
	std::string name(kEntryPrefix);
	name += unique_id;
	name += kEntrySuffix;
	return name;
}

GistResultStore::GistResultStore(std::shared_ptr<net::Transport> transport,
								 StoreSettings settings, std::string api_url,
								 std::chrono::seconds timeout)
	: transport_(std::move(transport)),
	  settings_(std::move(settings)),
	  gist_url_(trim_slash(std::move(api_url)) + "/gists/" + settings_.gist_id),
	  timeout_(timeout) {}

// =============================================================================
// Document access
// =============================================================================

Result<GistResultStore::FileMap> GistResultStore::read_files(
	asio::yield_context yield) {
	auto res = transport_->async_send(
		api_request(net::Method::get, gist_url_, settings_.token, timeout_),
		yield);
	if (res.has_error()) {
		spdlog::error("Failed to read result gist: {}", res.error().message());
		return outcome::failure(errc::store_read_failed);
	}

	const auto &resp = res.value();
	if (!resp.ok()) {
		spdlog::error("Failed to read result gist: HTTP {}", resp.status_code);
		return outcome::failure(errc::store_read_failed);
	}

	auto j = nlohmann::json::parse(resp.body, nullptr, false);
	if (j.is_discarded() || !j.contains("files") || !j["files"].is_object()) {
		spdlog::error("Result gist response has no file map");
		return outcome::failure(errc::store_read_failed);
	}

	FileMap files;
	for (const auto &[name, entry] : j["files"].items()) {
		if (!entry.is_object()) continue;
		GistFile f;
		f.content = utils::traverse_obj_default<std::string>(entry, {"content"},
															 "");
		f.truncated =
			utils::traverse_obj_default<bool>(entry, {"truncated"}, false);
		f.raw_url =
			utils::traverse_obj_default<std::string>(entry, {"raw_url"}, "");
		files.emplace(name, std::move(f));
	}
	spdlog::debug("Result gist holds {} files", files.size());
	return files;
}

Result<void> GistResultStore::write_files(const nlohmann::json &files,
										  asio::yield_context yield) {
	auto req =
		api_request(net::Method::patch, gist_url_, settings_.token, timeout_);
	req.body = nlohmann::json{{"files", files}}.dump();

	auto res = transport_->async_send(std::move(req), yield);
	if (res.has_error()) {
		spdlog::error("Failed to write result gist: {}", res.error().message());
		return outcome::failure(errc::store_write_failed);
	}
	if (!res.value().ok()) {
		spdlog::error("Failed to write result gist: HTTP {}",
					  res.value().status_code);
		return outcome::failure(errc::store_write_failed);
	}
	return outcome::success();
}

Result<std::string> GistResultStore::full_content(const GistFile &file,
												  asio::yield_context yield) {
	if (!file.truncated) return file.content;
	if (file.raw_url.empty()) return outcome::failure(errc::store_read_failed);

	auto res = transport_->async_send(
		api_request(net::Method::get, file.raw_url, settings_.token, timeout_),
		yield);
	if (res.has_error() || !res.value().ok()) {
		spdlog::warn("Failed to fetch truncated gist file {}", file.raw_url);
		return outcome::failure(errc::store_read_failed);
	}
	return std::move(res).value().body;
}

// =============================================================================
// ResultStore
// =============================================================================

Result<void> GistResultStore::put(const std::string &unique_id,
								  const UploadOutcome &result,
								  asio::yield_context yield) {
	auto files = read_files(yield);
	if (files.has_error()) return files.error();

	const std::string filename = entry_filename(unique_id);

	// Full map minus truncated files, whose content we never saw in full
	nlohmann::json map = nlohmann::json::object();
	for (const auto &[name, file] : files.value()) {
		if (file.truncated || name == filename) continue;
		map[name] = {{"content", file.content}};
	}

	nlohmann::json entry = result;
	map[filename] = {{"content", entry.dump(2)}};

	auto written = write_files(map, yield);
	if (written.has_error()) return written.error();

	spdlog::info("Saved result as {}", filename);
	return outcome::success();
}

Result<UploadOutcome> GistResultStore::get(const std::string &unique_id,
										   asio::yield_context yield) {
	auto files = read_files(yield);
	if (files.has_error()) return files.error();

	const std::string filename = entry_filename(unique_id);
	auto it = files.value().find(filename);
	if (it == files.value().end()) {
		return outcome::failure(errc::store_entry_not_found);
	}

	auto content = full_content(it->second, yield);
	if (content.has_error()) return content.error();

	auto j = nlohmann::json::parse(content.value(), nullptr, false);
	if (j.is_discarded()) {
		spdlog::error("Stored entry {} is not valid JSON", filename);
		return outcome::failure(errc::json_parse_error);
	}
	return outcome_from_json(j);
}

Result<std::vector<EntryAge>> GistResultStore::list_ages(
	asio::yield_context yield) {
	auto files = read_files(yield);
	if (files.has_error()) return files.error();

	std::vector<EntryAge> ages;
	for (const auto &[name, file] : files.value()) {
		if (name == kReadmeFile) continue;

		EntryAge age;
		age.filename = name;

		auto content = full_content(file, yield);
		if (content.has_value()) {
			auto j = nlohmann::json::parse(content.value(), nullptr, false);
			if (!j.is_discarded()) {
				if (auto ts = utils::traverse_obj<std::string>(j, {"timestamp"})) {
					age.created = utils::parse_iso8601(*ts);
				}
			}
		}
		ages.push_back(std::move(age));
	}
	return ages;
}

Result<std::size_t> GistResultStore::remove(
	const std::vector<std::string> &filenames, asio::yield_context yield) {
	if (filenames.empty()) return std::size_t{0};

	auto files = read_files(yield);
	if (files.has_error()) return files.error();

	nlohmann::json map = nlohmann::json::object();
	for (const auto &name : filenames) {
		if (name == kReadmeFile) continue;
		if (!files.value().contains(name)) {
			spdlog::debug("{} already deleted", name);
			continue;
		}
		map[name] = nullptr;
	}

	if (map.empty()) return std::size_t{0};

	auto written = write_files(map, yield);
	if (written.has_error()) return written.error();
	return map.size();
}

Result<std::string> GistResultStore::create(net::Transport &transport,
											const std::string &token,
											const std::string &api_url,
											asio::yield_context yield,
											std::chrono::seconds timeout) {
	auto req = api_request(net::Method::post, trim_slash(api_url) + "/gists",
						   token, timeout);
	req.body = nlohmann::json{
		{"description", kGistDescription},
		{"public", false},
		{"files",
		 {{std::string(kReadmeFile), {{"content", kReadmeContent}}}}}}.dump();

	auto res = transport.async_send(std::move(req), yield);
	if (res.has_error()) {
		spdlog::error("Failed to create result gist: {}",
					  res.error().message());
		return outcome::failure(errc::store_write_failed);
	}

	const auto &resp = res.value();
	auto j = nlohmann::json::parse(resp.body, nullptr, false);
	if (!resp.ok() || j.is_discarded()) {
		spdlog::error("Failed to create result gist: HTTP {}",
					  resp.status_code);
		return outcome::failure(errc::store_write_failed);
	}

	auto id = utils::traverse_obj<std::string>(j, {"id"});
	if (!id || id->empty()) return outcome::failure(errc::store_write_failed);

	spdlog::info("Created result gist {}", *id);
	return *id;
}

}  // namespace ytupload::store
