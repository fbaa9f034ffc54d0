#pragma once

#include <ytupload/ytupload_export.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ytupload {

enum class Privacy { private_, public_, unlisted };

YTUPLOAD_EXPORT std::string_view to_string(Privacy p);
YTUPLOAD_EXPORT std::optional<Privacy> parse_privacy(std::string_view s);

inline constexpr std::string_view kDefaultCategoryId = "22";  // People & Blogs
inline constexpr std::string_view kWatchUrlBase =
	"https://www.youtube.com/watch?v=";

struct YTUPLOAD_EXPORT TransferProgress {
	std::uint64_t bytes_done = 0;
	std::uint64_t bytes_total = 0;	// 0 when unknown
	double percentage = 0.0;
};

using ProgressCallback = std::function<void(
	const std::string &status, const TransferProgress &progress)>;

// One upload job as received from the trigger. Built once via
// make_upload_request() and never modified afterwards.
struct YTUPLOAD_EXPORT UploadRequest {
	std::string video_url;
	std::string title;
	std::string description;
	std::vector<std::string> tags;
	std::string category_id{kDefaultCategoryId};
	Privacy privacy = Privacy::private_;
	std::optional<std::string> unique_id;	  // Result store key
	std::optional<std::string> callback_url;  // Webhook target
};

// Terminal record of one orchestration run
struct YTUPLOAD_EXPORT UploadOutcome {
	bool success = false;
	std::optional<std::string> video_id;
	std::optional<std::string> video_url;
	std::optional<std::string> error;
	std::string title;
	std::optional<std::string> unique_id;
	std::string timestamp;	// ISO-8601 UTC

	static UploadOutcome succeeded(const UploadRequest &req,
								   std::string video_id,
								   std::string timestamp);
	static UploadOutcome failed(const UploadRequest &req, std::string error,
								std::string timestamp);
};

YTUPLOAD_EXPORT std::string watch_url(std::string_view video_id);

}  // namespace ytupload
