#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/program_options.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <ytupload/result.hpp>
#include <ytupload/retry_policy.hpp>

namespace ytupload {

// Long-lived OAuth client secrets. Loaded once at start, never modified.
struct YTUPLOAD_EXPORT Credentials {
	std::string client_id;
	std::string client_secret;
	std::string refresh_token;

	[[nodiscard]] bool complete() const {
		return !client_id.empty() && !client_secret.empty() &&
			   !refresh_token.empty();
	}
};

struct YTUPLOAD_EXPORT Endpoints {
	std::string token_url = "https://oauth2.googleapis.com/token";
	std::string upload_url =
		"https://www.googleapis.com/upload/youtube/v3/videos";
	std::string gist_api_url = "https://api.github.com";
};

struct YTUPLOAD_EXPORT StoreSettings {
	std::string gist_id;
	std::string token;	// GitHub token with the gist scope

	[[nodiscard]] bool configured() const {
		return !gist_id.empty() && !token.empty();
	}
};

struct YTUPLOAD_EXPORT Config {
	static constexpr std::uint64_t kChunkGranularity = 256 * 1024;

	Credentials credentials;
	StoreSettings store;
	Endpoints endpoints;
	RetryPolicy retry;

	std::uint64_t chunk_size = 4 * kChunkGranularity;  // 1 MiB
	std::chrono::seconds request_timeout{60};
	std::chrono::seconds chunk_timeout{300};
	std::chrono::seconds callback_timeout{10};
	std::chrono::seconds retention{std::chrono::hours(24)};
	std::filesystem::path scratch_dir;
};

namespace po = boost::program_options;

/// Options that can also come from the environment
/// (YOUTUBE_CLIENT_ID, RESULTS_GIST_ID, ...)
YTUPLOAD_EXPORT po::options_description config_options();

/// Map an environment variable name to its option name, or "" to ignore it
YTUPLOAD_EXPORT std::string environment_option_name(const std::string &var);

/// Build the process configuration from parsed options. The chunk size is
/// rounded down to a multiple of 256 KiB as required by the upload API.
YTUPLOAD_EXPORT Result<Config> config_from(const po::variables_map &vm);

}  // namespace ytupload
