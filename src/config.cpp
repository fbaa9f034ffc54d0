#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <ytupload/config.hpp>

namespace ytupload {

po::options_description config_options() {
	po::options_description desc("Configuration");
	// clang-format off
	desc.add_options()
		("client-id", po::value<std::string>(),
		 "OAuth client id (env YOUTUBE_CLIENT_ID)")
		("client-secret", po::value<std::string>(),
		 "OAuth client secret (env YOUTUBE_CLIENT_SECRET)")
		("refresh-token", po::value<std::string>(),
		 "OAuth refresh token (env YOUTUBE_REFRESH_TOKEN)")
		("gist-id", po::value<std::string>(),
		 "Result store gist id (env RESULTS_GIST_ID)")
		("gist-token", po::value<std::string>(),
		 "GitHub token with gist scope (env GIST_TOKEN)")
		("github-token", po::value<std::string>(),
		 "Used when no gist token is given (env GITHUB_TOKEN)")
		("chunk-size", po::value<std::uint64_t>(),
		 "Upload chunk size in bytes (multiple of 256 KiB)")
		("max-attempts", po::value<int>(),
		 "Attempts per chunk before giving up")
		("retry-base-ms", po::value<long long>(),
		 "Initial backoff delay in milliseconds")
		("retry-max-ms", po::value<long long>(),
		 "Backoff delay ceiling in milliseconds")
		("timeout", po::value<long long>(),
		 "Timeout for API requests in seconds")
		("retention-hours", po::value<long long>(),
		 "Age after which stored results are swept")
		("scratch-dir", po::value<std::string>(),
		 "Directory for the downloaded video (env YTUPLOAD_SCRATCH_DIR)")
		("token-url", po::value<std::string>(), "OAuth token endpoint")
		("upload-url", po::value<std::string>(), "Video upload endpoint")
		("gist-api-url", po::value<std::string>(), "GitHub API base URL");
	// clang-format on
	return desc;
}

std::string environment_option_name(const std::string &var) {
	static const std::map<std::string, std::string> kNames = {
		{"YOUTUBE_CLIENT_ID", "client-id"},
		{"YOUTUBE_CLIENT_SECRET", "client-secret"},
		{"YOUTUBE_REFRESH_TOKEN", "refresh-token"},
		{"RESULTS_GIST_ID", "gist-id"},
		{"GIST_TOKEN", "gist-token"},
		{"GITHUB_TOKEN", "github-token"},
		{"YTUPLOAD_SCRATCH_DIR", "scratch-dir"},
	};
	auto it = kNames.find(var);
	return it == kNames.end() ? std::string{} : it->second;
}

Result<Config> config_from(const po::variables_map &vm) {
	Config cfg;

	auto str = [&vm](const char *name) -> std::string {
		return vm.count(name) ? vm[name].as<std::string>() : std::string{};
	};

	cfg.credentials.client_id = str("client-id");
	cfg.credentials.client_secret = str("client-secret");
	cfg.credentials.refresh_token = str("refresh-token");
	cfg.store.gist_id = str("gist-id");
	cfg.store.token = str("gist-token");
	if (cfg.store.token.empty()) cfg.store.token = str("github-token");

	if (vm.count("token-url")) cfg.endpoints.token_url = str("token-url");
	if (vm.count("upload-url")) cfg.endpoints.upload_url = str("upload-url");
	if (vm.count("gist-api-url")) {
		cfg.endpoints.gist_api_url = str("gist-api-url");
	}
	while (!cfg.endpoints.gist_api_url.empty() &&
		   cfg.endpoints.gist_api_url.back() == '/') {
		cfg.endpoints.gist_api_url.pop_back();
	}
	if (vm.count("scratch-dir")) cfg.scratch_dir = str("scratch-dir");

	if (vm.count("chunk-size")) {
		auto requested = vm["chunk-size"].as<std::uint64_t>();
		auto rounded = std::max(
			Config::kChunkGranularity,
			requested / Config::kChunkGranularity * Config::kChunkGranularity);
		if (rounded != requested) {
			spdlog::warn("Chunk size {} rounded to {}", requested, rounded);
		}
		cfg.chunk_size = rounded;
	}

	if (vm.count("max-attempts")) {
		int attempts = vm["max-attempts"].as<int>();
		if (attempts < 1) {
			spdlog::error("--max-attempts must be at least 1");
			return outcome::failure(errc::invalid_number_format);
		}
		cfg.retry.max_attempts = attempts;
	}
	if (vm.count("retry-base-ms")) {
		cfg.retry.base_delay =
			std::chrono::milliseconds(vm["retry-base-ms"].as<long long>());
	}
	if (vm.count("retry-max-ms")) {
		cfg.retry.max_delay =
			std::chrono::milliseconds(vm["retry-max-ms"].as<long long>());
	}
	if (cfg.retry.base_delay.count() < 0 || cfg.retry.max_delay.count() < 0) {
		spdlog::error("Retry delays must not be negative");
		return outcome::failure(errc::invalid_number_format);
	}

	if (vm.count("timeout")) {
		auto secs = vm["timeout"].as<long long>();
		if (secs <= 0) {
			spdlog::error("--timeout must be positive");
			return outcome::failure(errc::invalid_number_format);
		}
		cfg.request_timeout = std::chrono::seconds(secs);
	}

	if (vm.count("retention-hours")) {
		auto hours = vm["retention-hours"].as<long long>();
		if (hours <= 0) {
			spdlog::error("--retention-hours must be positive");
			return outcome::failure(errc::invalid_number_format);
		}
		cfg.retention = std::chrono::hours(hours);
	}

	return cfg;
}

}  // namespace ytupload
